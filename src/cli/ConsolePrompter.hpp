#pragma once

#include <iostream>
#include <string>

#include "provision/collaborators.hpp"

namespace hostprep {

// Asks on the console until it gets y/yes/n/no (any case).
// End of input counts as "no" so unattended runs cannot spin forever.
// A read cut short by an interrupt throws RunInterrupted instead.
class ConsolePrompter : public Prompter
{
public:
    explicit ConsolePrompter(std::istream &in = std::cin, std::ostream &out = std::cout);

    bool askYesNo(const std::string &question) override;

private:
    std::istream &m_in;
    std::ostream &m_out;
};

} // namespace hostprep
