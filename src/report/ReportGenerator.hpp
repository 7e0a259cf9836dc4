#pragma once

#include <string>
#include <vector>

#include <QCoreApplication>
#include <QDateTime>
#include <QString>

#include <nlohmann/json.hpp>

#include "common/models.hpp"

namespace hostprep {

// Everything besides the ledger that the report is derived from.
struct ReportContext {
    RunStatus status = RunStatus::Completed;
    HostMetadata host;
    RunTiming timing;
    DistroProfile profile;
    ArtifactPaths artifacts;
    std::string dotfilesRepository;
};

struct ReportDocument {
    std::string markdown;
    nlohmann::json json;
};

// Log and report file names for one run. The stamp (UTC start time to the
// millisecond plus the process id) keeps runs apart.
ArtifactPaths artifactPathsFor(const QString &outputDir, const QDateTime &runStart,
                              qint64 processId = QCoreApplication::applicationPid());

// Remediation commands for the failed entries. Empty when nothing failed.
std::vector<std::string> troubleshootingHints(const LedgerSummary &summary,
                                              const ReportContext &context);

ProvisioningReport buildReport(const LedgerSummary &summary, const ReportContext &context);

/**
 * Render the report. Sections, always in this order:
 * execution summary, system information, failed, skipped, successful,
 * error details, troubleshooting, output files.
 *
 * Pure: the same report always renders to the same document.
 */
ReportDocument renderReport(const ProvisioningReport &report);

// Persist markdown and JSON atomically. Throws ReportWriteError.
void writeReport(const ReportDocument &document, const ArtifactPaths &paths);

} // namespace hostprep
