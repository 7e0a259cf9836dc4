#pragma once

#include <string>

namespace hostprep {

// Synchronous yes/no question to the operator.
class Prompter
{
public:
    virtual ~Prompter() = default;
    virtual bool askYesNo(const std::string &question) = 0;
};

struct DotfilesResult {
    bool success = false;
    std::string diagnostic;
};

// Clones the dotfiles repository for the unprivileged target user.
class DotfilesCloner
{
public:
    virtual ~DotfilesCloner() = default;
    virtual DotfilesResult cloneDotfiles(const std::string &repositoryUrl) = 0;
};

} // namespace hostprep
