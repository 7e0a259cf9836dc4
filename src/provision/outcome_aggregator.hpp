#pragma once

#include <cstddef>
#include <string>
#include <unordered_set>

#include "common/models.hpp"

namespace hostprep {

// OutcomeAggregator owns the run's ledger. Entries are appended in call
// order and never revised. Single-threaded by design; a parallel pipeline
// would need to serialize record() here.
class OutcomeAggregator
{
public:
    // One call per package per run. A second call for the same package name
    // is a caller defect and throws std::logic_error.
    void record(const PackageSpec &spec, const PackageOutcome &outcome);

    void addErrorDetail(const std::string &detail);

    LedgerSummary summary() const;

    bool hasFailures() const { return m_failed > 0; }
    std::size_t size() const { return m_ledger.entries.size(); }

private:
    Ledger m_ledger;
    std::unordered_set<std::string> m_recorded;
    std::size_t m_installed = 0;
    std::size_t m_skipped = 0;
    std::size_t m_failed = 0;
};

} // namespace hostprep
