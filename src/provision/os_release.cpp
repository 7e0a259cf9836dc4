#include "provision/os_release.hpp"

#include <cctype>
#include <sstream>

#include <QFile>
#include <QSysInfo>

#include "common/errors.hpp"

namespace hostprep {

namespace {

std::string trim(const std::string &value)
{
    size_t start = 0;
    while (start < value.size()
           && std::isspace(static_cast<unsigned char>(value[start]))) {
        ++start;
    }
    size_t end = value.size();
    while (end > start
           && std::isspace(static_cast<unsigned char>(value[end - 1]))) {
        --end;
    }
    return value.substr(start, end - start);
}

// Shell-style value: 'single' is literal, "double" honours backslash escapes.
std::string unquote(const std::string &raw)
{
    if (raw.size() >= 2 && raw.front() == '\'' && raw.back() == '\'') {
        return raw.substr(1, raw.size() - 2);
    }
    if (raw.size() >= 2 && raw.front() == '"' && raw.back() == '"') {
        std::string out;
        const std::string inner = raw.substr(1, raw.size() - 2);
        for (size_t i = 0; i < inner.size(); ++i) {
            if (inner[i] == '\\' && i + 1 < inner.size()) {
                out += inner[++i];
            } else {
                out += inner[i];
            }
        }
        return out;
    }
    return raw;
}

std::vector<std::string> splitWords(const std::string &value)
{
    std::vector<std::string> words;
    std::istringstream in(value);
    std::string word;
    while (in >> word) {
        words.push_back(word);
    }
    return words;
}

} // namespace

OsRelease parseOsRelease(const std::string &text)
{
    OsRelease release;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        line = trim(line);
        if (line.empty() || line.front() == '#') {
            continue;
        }

        const size_t eq = line.find('=');
        if (eq == std::string::npos || eq == 0) {
            continue;
        }

        const std::string key = trim(line.substr(0, eq));
        const std::string value = unquote(trim(line.substr(eq + 1)));

        if (key == "ID") {
            release.id = value;
        } else if (key == "ID_LIKE") {
            release.idLike = splitWords(value);
        } else if (key == "NAME") {
            release.name = value;
        } else if (key == "PRETTY_NAME") {
            release.prettyName = value;
        } else if (key == "VERSION_ID") {
            release.versionId = value;
        }
    }
    return release;
}

OsRelease readOsRelease(const std::string &path)
{
    QFile file(QString::fromStdString(path));
    if (!file.exists()) {
        throw HostIdentityError("Cannot detect distribution - " + path + " not found");
    }
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        throw HostIdentityError("Cannot read " + path + ": "
                                + file.errorString().toStdString());
    }

    OsRelease release = parseOsRelease(file.readAll().toStdString());
    if (release.id.empty()) {
        throw HostIdentityError("No ID entry in " + path);
    }
    return release;
}

HostMetadata collectHostMetadata(const OsRelease &release)
{
    HostMetadata host;
    if (!release.prettyName.empty()) {
        host.osName = release.prettyName;
    } else if (!release.name.empty()) {
        host.osName = release.name;
    } else {
        host.osName = release.id;
    }
    host.kernel = QSysInfo::kernelVersion().toStdString();
    host.architecture = QSysInfo::currentCpuArchitecture().toStdString();
    host.hostname = QSysInfo::machineHostName().toStdString();
    return host;
}

} // namespace hostprep
