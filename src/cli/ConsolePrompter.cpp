#include "cli/ConsolePrompter.hpp"

#include <cctype>

#include "common/interrupt.hpp"
#include "common/status.hpp"

namespace hostprep {

namespace {

std::string normalizeAnswer(const std::string &raw)
{
    std::string answer;
    for (char ch : raw) {
        if (!std::isspace(static_cast<unsigned char>(ch))) {
            answer += static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
        }
    }
    return answer;
}

} // namespace

ConsolePrompter::ConsolePrompter(std::istream &in, std::ostream &out)
    : m_in(in)
    , m_out(out)
{
}

bool ConsolePrompter::askYesNo(const std::string &question)
{
    while (true) {
        m_out << question << std::flush;

        std::string line;
        if (!std::getline(m_in, line)) {
            m_out << std::endl;
            // SIGINT at the prompt fails the read with EINTR; that is not a "no".
            throwIfInterrupted();
            printStatus(Status::Warning, QStringLiteral("ConsolePrompter"),
                        QStringLiteral("askYesNo"), QStringLiteral("prompt_eof"),
                        "No answer on input, treating as no");
            return false;
        }

        const std::string answer = normalizeAnswer(line);
        if (answer == "y" || answer == "yes") {
            return true;
        }
        if (answer == "n" || answer == "no") {
            return false;
        }
        printStatus(Status::Warning, QStringLiteral("ConsolePrompter"),
                    QStringLiteral("askYesNo"), QStringLiteral("prompt_invalid_answer"),
                    "Please answer yes (y/Y) or no (n/N)");
    }
}

} // namespace hostprep
