#include "report/ReportGenerator.hpp"

#include <chrono>
#include <sstream>

#include <QDir>
#include <QFileInfo>
#include <QSaveFile>

#include "common/errors.hpp"
#include "common/json_utils.hpp"
#include "common/process_utils.hpp"

namespace hostprep {

namespace {

const char *const kDotfilesEntry = "dotfiles";

// Multi-line tool output stays readable inside a markdown list item.
void appendListItem(std::ostringstream &out, const std::string &text,
                    const std::string &indent = "")
{
    std::istringstream lines(text);
    std::string line;
    bool first = true;
    while (std::getline(lines, line)) {
        out << (first ? indent + "- " : indent + "  ") << line << "\n";
        first = false;
    }
    if (first) {
        out << indent << "- (empty)\n";
    }
}

std::string joinRepairCommands(const DistroProfile &profile)
{
    std::string text;
    for (const auto &step : profile.repairCommands) {
        if (!text.empty()) {
            text += " && ";
        }
        text += describeCommand(step);
    }
    return text;
}

void renderEntries(std::ostringstream &out, const std::vector<LedgerEntry> &entries,
                   OutcomeKind kind)
{
    bool any = false;
    for (const auto &entry : entries) {
        if (entry.outcome.kind != kind) {
            continue;
        }
        any = true;
        const std::string &name = entry.spec.name;
        switch (kind) {
        case OutcomeKind::Failed:
            out << "- " << name << " (attempts: " << entry.outcome.attempts
                << ", attempts exhausted: "
                << (entry.outcome.attemptsExhausted ? "yes" : "no") << ")\n";
            if (!entry.outcome.lastError.empty()) {
                appendListItem(out, "last error: " + entry.outcome.lastError, "  ");
            }
            break;
        case OutcomeKind::Skipped:
            out << "- " << name << ": " << entry.outcome.reason << "\n";
            break;
        case OutcomeKind::Installed:
            out << "- " << name;
            if (!entry.outcome.concreteName.empty() && entry.outcome.concreteName != name) {
                out << " (as " << entry.outcome.concreteName << ")";
            }
            out << "\n";
            break;
        }
    }
    if (!any) {
        out << "None\n";
    }
}

} // namespace

ArtifactPaths artifactPathsFor(const QString &outputDir, const QDateTime &runStart,
                              qint64 processId)
{
    // UTC with milliseconds and the pid: local time repeats an hour at DST
    // fall-back, and two runs can start within the same second.
    const QString stamp = QStringLiteral("%1-%2")
                              .arg(runStart.toUTC().toString(QStringLiteral("yyyyMMdd-HHmmss-zzz")))
                              .arg(processId);
    const QDir dir(outputDir);

    ArtifactPaths paths;
    paths.logPath = dir.filePath(QStringLiteral("hostprep-%1.log").arg(stamp)).toStdString();
    paths.reportPath =
        dir.filePath(QStringLiteral("hostprep-report-%1.md").arg(stamp)).toStdString();
    paths.jsonReportPath =
        dir.filePath(QStringLiteral("hostprep-report-%1.json").arg(stamp)).toStdString();
    return paths;
}

std::vector<std::string> troubleshootingHints(const LedgerSummary &summary,
                                              const ReportContext &context)
{
    std::vector<std::string> hints;
    if (summary.failed == 0) {
        return hints;
    }

    const DistroProfile &profile = context.profile;
    hints.push_back("Refresh the package index: `" + describeCommand(profile.updateCommand) + "`");
    if (!profile.repairCommands.empty()) {
        hints.push_back("Repair the package manager state: `" + joinRepairCommands(profile) + "`");
    }
    if (profile.needsEpel) {
        hints.push_back("Make sure the EPEL repository is enabled: `"
                        + describeCommand(profile.installCommandPrefix, {"epel-release"}) + "`");
    }

    for (const auto &entry : summary.ledger.entries) {
        if (entry.outcome.kind != OutcomeKind::Failed) {
            continue;
        }
        if (entry.spec.name == kDotfilesEntry) {
            hints.push_back("Clone the dotfiles manually as the target user: `yadm clone "
                            + context.dotfilesRepository + "`");
            continue;
        }
        const std::string concrete = entry.outcome.concreteName.empty()
            ? entry.spec.name
            : entry.outcome.concreteName;
        hints.push_back("Retry " + entry.spec.name + " manually: `"
                        + describeCommand(profile.installCommandPrefix, {concrete}) + "`");
    }

    hints.push_back("Review the full log for package manager output: "
                    + context.artifacts.logPath);
    return hints;
}

ProvisioningReport buildReport(const LedgerSummary &summary, const ReportContext &context)
{
    ProvisioningReport report;
    report.status = context.status;
    report.host = context.host;
    report.timing = context.timing;
    report.distroId = context.profile.distroId;
    report.packageManager = context.profile.packageManager;
    report.summary = summary;
    report.troubleshooting = troubleshootingHints(summary, context);
    report.artifacts = context.artifacts;
    return report;
}

ReportDocument renderReport(const ProvisioningReport &report)
{
    std::ostringstream out;
    const auto durationSeconds = std::chrono::duration_cast<std::chrono::seconds>(
                                     report.timing.end - report.timing.start)
                                     .count();

    out << "# hostprep Provisioning Report\n\n";

    out << "## Execution Summary\n\n";
    out << "- Status: " << toRunStatusString(report.status) << "\n";
    out << "- Started: " << toIso8601Utc(report.timing.start) << "\n";
    out << "- Finished: " << toIso8601Utc(report.timing.end) << "\n";
    out << "- Duration: " << durationSeconds << "s\n";
    out << "- Installed: " << report.summary.installed << "\n";
    out << "- Skipped: " << report.summary.skipped << "\n";
    out << "- Failed: " << report.summary.failed << "\n";
    out << "- Total processed: " << report.summary.total() << "\n\n";

    out << "## System Information\n\n";
    out << "- OS: " << report.host.osName << "\n";
    out << "- Distribution ID: " << report.distroId << "\n";
    out << "- Package manager: " << report.packageManager << "\n";
    out << "- Kernel: " << report.host.kernel << "\n";
    out << "- Architecture: " << report.host.architecture << "\n";
    out << "- Hostname: " << report.host.hostname << "\n\n";

    const auto &entries = report.summary.ledger.entries;
    out << "## Failed Packages\n\n";
    renderEntries(out, entries, OutcomeKind::Failed);
    out << "\n## Skipped Packages\n\n";
    renderEntries(out, entries, OutcomeKind::Skipped);
    out << "\n## Successful Packages\n\n";
    renderEntries(out, entries, OutcomeKind::Installed);

    out << "\n## Error Details\n\n";
    if (report.summary.ledger.errorDetails.empty()) {
        out << "No specific errors recorded\n";
    } else {
        for (const auto &detail : report.summary.ledger.errorDetails) {
            appendListItem(out, detail);
        }
    }

    out << "\n## Troubleshooting Suggestions\n\n";
    if (report.troubleshooting.empty()) {
        out << "None needed, no packages failed.\n";
    } else {
        for (const auto &hint : report.troubleshooting) {
            out << "- " << hint << "\n";
        }
    }

    out << "\n## Output Files\n\n";
    out << "- Log: " << report.artifacts.logPath << "\n";
    out << "- Report: " << report.artifacts.reportPath << "\n";
    out << "- JSON report: " << report.artifacts.jsonReportPath << "\n";

    ReportDocument document;
    document.markdown = out.str();
    document.json = report;
    return document;
}

void writeReport(const ReportDocument &document, const ArtifactPaths &paths)
{
    auto writeFile = [](const std::string &path, const std::string &content) {
        const QString qPath = QString::fromStdString(path);
        if (!QDir().mkpath(QFileInfo(qPath).absolutePath())) {
            throw ReportWriteError("cannot create directory for " + path);
        }
        QSaveFile file(qPath);
        if (!file.open(QIODevice::WriteOnly | QIODevice::Text)) {
            throw ReportWriteError("cannot open " + path + ": "
                                   + file.errorString().toStdString());
        }
        const QByteArray bytes = QByteArray::fromStdString(content);
        if (file.write(bytes) != bytes.size() || !file.commit()) {
            throw ReportWriteError("cannot write " + path + ": "
                                   + file.errorString().toStdString());
        }
    };

    writeFile(paths.reportPath, document.markdown);
    writeFile(paths.jsonReportPath,
              document.json.dump(2, ' ', false, nlohmann::json::error_handler_t::replace)
                  + "\n");
}

} // namespace hostprep
