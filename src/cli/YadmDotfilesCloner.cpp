#include "cli/YadmDotfilesCloner.hpp"

#include <pwd.h>
#include <unistd.h>

#include <QtGlobal>

#include <nlohmann/json.hpp>

#include "common/logging.hpp"
#include "common/status.hpp"

namespace hostprep {

namespace {

QString component()
{
    return QStringLiteral("YadmDotfilesCloner");
}

std::optional<TargetUser> lookupUser(const std::string &name)
{
    const passwd *entry = getpwnam(name.c_str());
    if (entry == nullptr || entry->pw_dir == nullptr) {
        return std::nullopt;
    }
    return TargetUser{name, entry->pw_dir};
}

} // namespace

std::string invokingUserName()
{
    const passwd *entry = getpwuid(geteuid());
    if (entry == nullptr || entry->pw_name == nullptr) {
        return {};
    }
    return entry->pw_name;
}

std::optional<TargetUser> resolveTargetUser()
{
    const std::string sudoUser = qEnvironmentVariable("SUDO_USER").toStdString();
    if (!sudoUser.empty() && sudoUser != "root") {
        return lookupUser(sudoUser);
    }

    const std::string self = invokingUserName();
    if (self.empty()) {
        return std::nullopt;
    }
    return lookupUser(self);
}

YadmDotfilesCloner::YadmDotfilesCloner(ProcessRunner &runner,
                                       std::chrono::milliseconds timeout)
    : m_runner(runner)
    , m_timeout(timeout)
{
}

DotfilesResult YadmDotfilesCloner::cloneDotfiles(const std::string &repositoryUrl)
{
    DotfilesResult outcome;

    if (!m_hasProgram("yadm")) {
        outcome.diagnostic = "yadm is not available. Cannot clone dotfiles.";
        return outcome;
    }

    const std::optional<TargetUser> user = m_targetUser ? m_targetUser : resolveTargetUser();
    if (!user.has_value()) {
        outcome.diagnostic = "cannot determine the target user or home directory";
        return outcome;
    }
    const std::string invoking = m_invokingUser ? *m_invokingUser : invokingUserName();

    printStatus(Status::Info, component(), QStringLiteral("cloneDotfiles"),
                QStringLiteral("dotfiles_target"),
                "Target user: " + user->name + ", home: " + user->home);

    CommandTemplate clone{"yadm", {"clone", "-f", repositoryUrl}};
    if (user->name != invoking) {
        clone = CommandTemplate{"sudo", {"-u", user->name, "-H", "yadm", "clone", "-f",
                                         repositoryUrl}};
    } else if (user->name == "root") {
        printStatus(Status::Warning, component(), QStringLiteral("cloneDotfiles"),
                    QStringLiteral("dotfiles_as_root"),
                    "Running as root user. Cloning dotfiles to root home directory...");
    }

    ProcessRequest request = requestFor(clone, {}, m_timeout);
    request.workingDirectory = QString::fromStdString(user->home);

    const ProcessResult result = m_runner.run(request);
    outcome.success = result.succeeded();
    if (!outcome.success) {
        outcome.diagnostic = result.errorText();
    }

    HPLOG_INFO(component(),
               QStringLiteral("cloneDotfiles"),
               outcome.success ? QStringLiteral("dotfiles_cloned")
                               : QStringLiteral("dotfiles_clone_failed"),
               QStringLiteral("pipeline_step"),
               QStringLiteral("yadm_clone"),
               logging::defaultWho(),
               QString(),
               (nlohmann::json{{"user", user->name},
                               {"home", user->home},
                               {"command", describeCommand(clone)},
                               {"exitCode", result.exitCode}}));
    return outcome;
}

} // namespace hostprep
