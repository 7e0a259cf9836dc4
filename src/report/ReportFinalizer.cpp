#include "report/ReportFinalizer.hpp"

#include <iostream>
#include <utility>

#include <nlohmann/json.hpp>

#include "common/errors.hpp"
#include "common/logging.hpp"
#include "report/ReportGenerator.hpp"

namespace hostprep {

ReportFinalizer::ReportFinalizer(ReportBuilder builder)
    : m_builder(std::move(builder))
{
}

ReportFinalizer::~ReportFinalizer()
{
    if (m_attempted) {
        return;
    }

    try {
        finalize();
    } catch (const std::exception &ex) {
        std::cerr << "[ERROR] Failed to write provisioning report: " << ex.what() << std::endl;
        HPLOG_ERROR(QStringLiteral("ReportFinalizer"),
                    QStringLiteral("~ReportFinalizer"),
                    QStringLiteral("report_write_failed"),
                    QStringLiteral("scope_unwind"),
                    QStringLiteral("deferred_finalize"),
                    logging::defaultWho(),
                    QString(),
                    (nlohmann::json{{"error", ex.what()}}));
    }
}

const ProvisioningReport &ReportFinalizer::finalize()
{
    if (m_report.has_value()) {
        return *m_report;
    }
    if (m_attempted) {
        throw ReportWriteError("report persistence already failed for this run");
    }
    m_attempted = true;

    ProvisioningReport report = m_builder();
    const ReportDocument document = renderReport(report);
    writeReport(document, report.artifacts);
    m_report = std::move(report);

    HPLOG_INFO(QStringLiteral("ReportFinalizer"),
               QStringLiteral("finalize"),
               QStringLiteral("report_written"),
               QStringLiteral("run_end"),
               QStringLiteral("markdown_and_json"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"report", m_report->artifacts.reportPath},
                               {"jsonReport", m_report->artifacts.jsonReportPath},
                               {"failed", m_report->summary.failed}}));
    return *m_report;
}

} // namespace hostprep
