#include "provision/outcome_aggregator.hpp"

#include <stdexcept>

namespace hostprep {

void OutcomeAggregator::record(const PackageSpec &spec, const PackageOutcome &outcome)
{
    if (!m_recorded.insert(spec.name).second) {
        throw std::logic_error("outcome for package '" + spec.name + "' recorded twice");
    }

    m_ledger.entries.push_back(LedgerEntry{spec, outcome});

    switch (outcome.kind) {
    case OutcomeKind::Installed:
        ++m_installed;
        break;
    case OutcomeKind::Skipped:
        ++m_skipped;
        break;
    case OutcomeKind::Failed:
        ++m_failed;
        if (!outcome.lastError.empty()) {
            addErrorDetail(spec.name + ": " + outcome.lastError);
        } else {
            addErrorDetail(spec.name + ": no diagnostic output ("
                           + std::to_string(outcome.attempts) + " attempt(s))");
        }
        break;
    }
}

void OutcomeAggregator::addErrorDetail(const std::string &detail)
{
    m_ledger.errorDetails.push_back(detail);
}

LedgerSummary OutcomeAggregator::summary() const
{
    LedgerSummary summary;
    summary.installed = m_installed;
    summary.skipped = m_skipped;
    summary.failed = m_failed;
    summary.ledger = m_ledger;
    return summary;
}

} // namespace hostprep
