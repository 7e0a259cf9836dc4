#pragma once

#include <functional>
#include <optional>

#include "common/models.hpp"

namespace hostprep {

/**
 * Scoped guarantee that a run which got past profile resolution leaves a
 * report behind. finalize() builds, renders and persists the report once;
 * if the owning scope unwinds before anyone called it, the destructor does
 * it and logs a persistence failure instead of throwing.
 */
class ReportFinalizer
{
public:
    using ReportBuilder = std::function<ProvisioningReport()>;

    explicit ReportFinalizer(ReportBuilder builder);
    ~ReportFinalizer();

    ReportFinalizer(const ReportFinalizer &) = delete;
    ReportFinalizer &operator=(const ReportFinalizer &) = delete;

    // Throws ReportWriteError if the report cannot be persisted. Later calls
    // return the first report without writing again.
    const ProvisioningReport &finalize();

    bool isFinalized() const { return m_report.has_value(); }

private:
    ReportBuilder m_builder;
    std::optional<ProvisioningReport> m_report;
    bool m_attempted = false;
};

} // namespace hostprep
