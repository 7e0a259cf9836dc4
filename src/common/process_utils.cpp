#include "common/process_utils.hpp"

#include <QProcess>
#include <QProcessEnvironment>
#include <QStandardPaths>

#include "common/interrupt.hpp"
#include "common/logging.hpp"
#include <nlohmann/json.hpp>

namespace hostprep {

namespace {

constexpr int kPollSliceMs = 200;
constexpr int kTerminateGraceMs = 3000;
constexpr int kMaxDiagnosticLines = 20;

std::string trimmed(const QByteArray &bytes)
{
    return QString::fromUtf8(bytes).trimmed().toStdString();
}

// Tool output can be long; the ledger only needs the tail.
std::string tailLines(const std::string &text)
{
    if (text.empty()) {
        return text;
    }
    int newlines = 0;
    for (std::size_t i = text.size(); i > 0; --i) {
        if (text[i - 1] == '\n' && ++newlines == kMaxDiagnosticLines) {
            return text.substr(i);
        }
    }
    return text;
}

void stopProcess(QProcess &process)
{
    process.terminate();
    if (!process.waitForFinished(kTerminateGraceMs)) {
        process.kill();
        process.waitForFinished();
    }
}

} // namespace

std::string ProcessResult::errorText() const
{
    if (!started) {
        return startError;
    }
    if (interrupted) {
        return "interrupted by signal";
    }
    if (timedOut) {
        return "timed out" + (standardError.empty() ? std::string() : ": " + tailLines(standardError));
    }
    if (!standardError.empty()) {
        return tailLines(standardError);
    }
    if (!standardOutput.empty()) {
        return tailLines(standardOutput);
    }
    if (!normalExit) {
        return "terminated abnormally";
    }
    return {};
}

ProcessResult QProcessRunner::run(const ProcessRequest &request)
{
    ProcessResult result;

    QProcess process;
    if (!request.workingDirectory.isEmpty()) {
        process.setWorkingDirectory(request.workingDirectory);
    }
    if (!request.environment.isEmpty()) {
        QProcessEnvironment env = QProcessEnvironment::systemEnvironment();
        for (const QString &entry : request.environment) {
            const int eq = entry.indexOf(QChar('='));
            if (eq > 0) {
                env.insert(entry.left(eq), entry.mid(eq + 1));
            }
        }
        process.setProcessEnvironment(env);
    }

    HPLOG_DEBUG(QStringLiteral("ProcessRunner"),
                QStringLiteral("run"),
                QStringLiteral("process_start"),
                QStringLiteral("command_requested"),
                QStringLiteral("qprocess"),
                logging::defaultWho(),
                QString(),
                (nlohmann::json{{"program", request.program.toStdString()},
                                {"args", request.arguments.join(QChar(' ')).toStdString()},
                                {"timeoutMs", request.timeout.count()}}));

    process.start(request.program, request.arguments);
    if (!process.waitForStarted()) {
        result.startError = "failed to start " + request.program.toStdString()
            + ": " + process.errorString().toStdString();
        return result;
    }
    result.started = true;

    process.closeWriteChannel();

    const auto begin = std::chrono::steady_clock::now();
    while (!process.waitForFinished(kPollSliceMs)) {
        if (process.state() == QProcess::NotRunning) {
            break;
        }
        if (interruptRequested()) {
            result.interrupted = true;
            stopProcess(process);
            break;
        }
        if (request.timeout.count() > 0
            && std::chrono::steady_clock::now() - begin >= request.timeout) {
            result.timedOut = true;
            stopProcess(process);
            break;
        }
    }

    result.normalExit = process.exitStatus() == QProcess::NormalExit;
    result.exitCode = process.exitCode();
    result.standardOutput = trimmed(process.readAllStandardOutput());
    result.standardError = trimmed(process.readAllStandardError());

    HPLOG_DEBUG(QStringLiteral("ProcessRunner"),
                QStringLiteral("run"),
                QStringLiteral("process_finished"),
                QStringLiteral("command_requested"),
                QStringLiteral("qprocess"),
                logging::defaultWho(),
                QString(),
                (nlohmann::json{{"program", request.program.toStdString()},
                                {"exitCode", result.exitCode},
                                {"normalExit", result.normalExit},
                                {"timedOut", result.timedOut},
                                {"interrupted", result.interrupted},
                                {"stdout", tailLines(result.standardOutput)},
                                {"stderr", tailLines(result.standardError)}}));

    return result;
}

ProcessRequest requestFor(const CommandTemplate &command,
                          const std::vector<std::string> &extraArguments,
                          std::chrono::milliseconds timeout)
{
    ProcessRequest request;
    request.program = QString::fromStdString(command.program);
    for (const auto &arg : command.arguments) {
        request.arguments << QString::fromStdString(arg);
    }
    for (const auto &arg : extraArguments) {
        request.arguments << QString::fromStdString(arg);
    }
    request.timeout = timeout;
    return request;
}

std::string describeCommand(const CommandTemplate &command,
                            const std::vector<std::string> &extraArguments)
{
    std::string text = command.program;
    for (const auto &arg : command.arguments) {
        text += " " + arg;
    }
    for (const auto &arg : extraArguments) {
        text += " " + arg;
    }
    return text;
}

bool isProgramAvailable(const std::string &program)
{
    return !QStandardPaths::findExecutable(QString::fromStdString(program)).isEmpty();
}

} // namespace hostprep
