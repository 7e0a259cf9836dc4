#pragma once

#include <chrono>
#include <functional>
#include <map>
#include <string>
#include <vector>

#include "common/process_utils.hpp"
#include "provision/collaborators.hpp"

namespace hostprep::testing {

inline std::string commandLine(const ProcessRequest &request)
{
    std::string line = request.program.toStdString();
    for (const QString &arg : request.arguments) {
        line += " " + arg.toStdString();
    }
    return line;
}

// Answers every command with success unless a rule says otherwise.
// Rules match the full command line, e.g. "apt install -y git".
class ScriptedProcessRunner : public ProcessRunner
{
public:
    void failAlways(const std::string &command, const std::string &stderrText = std::string())
    {
        m_rules[command] = Rule{-1, stderrText, false};
    }

    void failTimes(const std::string &command, int times,
                   const std::string &stderrText = std::string())
    {
        m_rules[command] = Rule{times, stderrText, false};
    }

    void interruptOn(const std::string &command)
    {
        m_rules[command] = Rule{-1, std::string(), true};
    }

    ProcessResult run(const ProcessRequest &request) override
    {
        const std::string line = commandLine(request);
        requests.push_back(line);
        workingDirectories.push_back(request.workingDirectory.toStdString());
        timeouts.push_back(request.timeout);

        ProcessResult result;
        result.started = true;
        result.normalExit = true;
        result.exitCode = 0;

        auto it = m_rules.find(line);
        if (it == m_rules.end()) {
            return result;
        }
        Rule &rule = it->second;
        if (rule.interrupt) {
            result.interrupted = true;
            result.exitCode = -1;
            return result;
        }
        if (rule.failuresLeft == 0) {
            return result;
        }
        if (rule.failuresLeft > 0) {
            --rule.failuresLeft;
        }
        result.exitCode = 100;
        result.standardError = rule.stderrText;
        return result;
    }

    int count(const std::string &command) const
    {
        int n = 0;
        for (const auto &line : requests) {
            if (line == command) {
                ++n;
            }
        }
        return n;
    }

    int countPrefix(const std::string &prefix) const
    {
        int n = 0;
        for (const auto &line : requests) {
            if (line.rfind(prefix, 0) == 0) {
                ++n;
            }
        }
        return n;
    }

    std::vector<std::string> requests;
    std::vector<std::string> workingDirectories;
    std::vector<std::chrono::milliseconds> timeouts;

private:
    struct Rule {
        int failuresLeft = -1;
        std::string stderrText;
        bool interrupt = false;
    };

    std::map<std::string, Rule> m_rules;
};

class ScriptedPrompter : public Prompter
{
public:
    explicit ScriptedPrompter(bool defaultAnswer = true)
        : m_defaultAnswer(defaultAnswer)
    {
    }

    bool askYesNo(const std::string &question) override
    {
        questions.push_back(question);
        if (onAsk) {
            onAsk(question);
        }
        for (const auto &entry : answers) {
            if (question.find(entry.first) != std::string::npos) {
                return entry.second;
            }
        }
        return m_defaultAnswer;
    }

    bool wasAskedAbout(const std::string &needle) const
    {
        for (const auto &question : questions) {
            if (question.find(needle) != std::string::npos) {
                return true;
            }
        }
        return false;
    }

    // Substring of the question -> answer.
    std::map<std::string, bool> answers;
    std::vector<std::string> questions;
    std::function<void(const std::string &)> onAsk;

private:
    bool m_defaultAnswer;
};

class FakeDotfilesCloner : public DotfilesCloner
{
public:
    DotfilesResult cloneDotfiles(const std::string &repositoryUrl) override
    {
        repositories.push_back(repositoryUrl);
        return result;
    }

    DotfilesResult result{true, std::string()};
    std::vector<std::string> repositories;
};

} // namespace hostprep::testing
