#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <utility>

#include "common/process_utils.hpp"
#include "provision/collaborators.hpp"
#include "provision/distro_profile.hpp"

namespace hostprep {

struct TargetUser {
    std::string name;
    std::string home;
};

// SUDO_USER when the tool was started through sudo by someone other than
// root, otherwise the invoking user. Empty when the password database has
// no entry for the user.
std::optional<TargetUser> resolveTargetUser();

std::string invokingUserName();

/**
 * Runs `yadm clone -f URL` in the target user's home directory. When the
 * target user differs from the invoking one the clone goes through
 * `sudo -u USER -H` so the files end up owned by that user.
 */
class YadmDotfilesCloner : public DotfilesCloner
{
public:
    explicit YadmDotfilesCloner(ProcessRunner &runner,
                                std::chrono::milliseconds timeout = std::chrono::milliseconds(0));

    DotfilesResult cloneDotfiles(const std::string &repositoryUrl) override;

    void setTargetUser(const TargetUser &user) { m_targetUser = user; }
    void setInvokingUser(const std::string &name) { m_invokingUser = name; }
    void setProgramLookup(ProgramLookup lookup) { m_hasProgram = std::move(lookup); }

private:
    ProcessRunner &m_runner;
    std::chrono::milliseconds m_timeout;
    std::optional<TargetUser> m_targetUser;
    std::optional<std::string> m_invokingUser;
    ProgramLookup m_hasProgram = isProgramAvailable;
};

} // namespace hostprep
