#include "alternatives/Alternatives.hpp"
#include "logging/LogRegistry.hpp"

#include <cerrno>
#include <cstring>
#include <sstream>
#include <string_view>

#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>
#include <fmt/core.h>

using namespace dd::alternatives;
using namespace dd::logging;

namespace {

constexpr std::string_view prefixName        = "Name: ";
constexpr std::string_view prefixLink        = "Link: ";
constexpr std::string_view prefixStatus      = "Status: ";
constexpr std::string_view prefixBest        = "Best: ";
constexpr std::string_view prefixValue       = "Value: ";
constexpr std::string_view prefixAlternative = "Alternative: ";
constexpr std::string_view prefixPriority    = "Priority: ";
constexpr std::string_view exactSlaves       = "Slaves:";

std::vector<std::string> splitLines(const std::string& output) {
    std::vector<std::string> lines;
    std::istringstream in(output);
    std::string line;
    while (std::getline(in, line)) lines.push_back(line);
    return lines;
}

std::string_view after(const std::string_view line, const std::string_view prefix) {
    return line.substr(prefix.size());
}

class QueryParser {
public:
    explicit QueryParser(const std::string& output) : lines_(splitLines(output)) {}

    QueryResult parse() {
        QueryResult qr;
        parseHeader(qr);
        return qr;
    }

private:
    std::vector<std::string> lines_;
    size_t pos_ = 0;

    [[nodiscard]] bool done() const { return pos_ >= lines_.size(); }

    // Consumes " <name> <path>" lines. Stops before the first line that is not indented.
    void parseSlaves(std::map<std::string, std::string>& target) {
        while (!done() && !lines_[pos_].empty() && lines_[pos_].front() == ' ') {
            const std::string_view data = std::string_view(lines_[pos_]).substr(1);
            const auto sep = data.find(' ');
            if (sep == std::string_view::npos)
                throw ParseError(fmt::format("error parsing slave line: \"{}\"", lines_[pos_]));
            target[std::string(data.substr(0, sep))] = std::string(data.substr(sep + 1));
            ++pos_;
        }
    }

    void parseHeader(QueryResult& qr) {
        while (!done()) {
            const std::string_view data = lines_[pos_++];

            if (data == exactSlaves) {
                parseSlaves(qr.slaves);
                continue;
            }

            if (data.empty()) {
                parseAlternatives(qr);
                return;
            }

            if (data.starts_with(prefixName)) qr.name = after(data, prefixName);
            else if (data.starts_with(prefixLink)) qr.link = after(data, prefixLink);
            else if (data.starts_with(prefixStatus)) qr.status = after(data, prefixStatus);
            else if (data.starts_with(prefixBest)) qr.best = after(data, prefixBest);
            else if (data.starts_with(prefixValue)) qr.value = after(data, prefixValue);
            else throw ParseError(fmt::format("error parsing query result: \"{}\"", data));
        }
    }

    void parseAlternatives(QueryResult& qr) {
        QueryResultAlternative alt;
        bool pending = false;

        while (!done()) {
            const std::string_view data = lines_[pos_++];

            if (data == exactSlaves) {
                parseSlaves(alt.slaves);
                pending = true;
                continue;
            }

            if (data.empty()) {
                if (pending) qr.alternatives.push_back(std::move(alt));
                alt = {};
                pending = false;
                continue;
            }

            if (data.starts_with(prefixAlternative)) alt.alternative = after(data, prefixAlternative);
            else if (data.starts_with(prefixPriority)) alt.priority = after(data, prefixPriority);
            else throw ParseError(fmt::format("error parsing query alternative: \"{}\"", data));
            pending = true;
        }

        // output may end without the closing blank line
        if (pending) qr.alternatives.push_back(std::move(alt));
    }
};

}

std::vector<std::string> dd::alternatives::parseSelections(const std::string& output) {
    std::vector<std::string> names;
    for (const auto& line : splitLines(output)) {
        const auto start = line.find_first_not_of(" \t");
        if (start == std::string::npos) continue;
        const auto end = line.find_first_of(" \t", start);
        names.push_back(line.substr(start, end == std::string::npos ? std::string::npos : end - start));
    }
    return names;
}

QueryResult dd::alternatives::parseQuery(const std::string& output) {
    return QueryParser(output).parse();
}

std::vector<std::string> dd::alternatives::managedPaths(const QueryResult& result) {
    std::vector<std::string> paths;
    const std::string adminDir = ADMIN_DIR;

    if (!result.link.empty()) paths.push_back(result.link);
    if (!result.name.empty()) paths.push_back(adminDir + "/" + result.name);

    for (const auto& [slave, link] : result.slaves) {
        paths.push_back(link);
        paths.push_back(adminDir + "/" + slave);
    }

    return paths;
}

std::string dd::alternatives::runCommand(const std::vector<std::string>& argv) {
    if (argv.empty()) throw std::runtime_error("runCommand: empty argument list");

    int pipefd[2];
    if (pipe2(pipefd, O_CLOEXEC) != 0)
        throw std::runtime_error(std::string("pipe2 failed: ") + std::strerror(errno));

    const pid_t pid = fork();
    if (pid < 0) {
        close(pipefd[0]); close(pipefd[1]);
        throw std::runtime_error(std::string("fork failed: ") + std::strerror(errno));
    }

    if (pid == 0) {
        // Child: stdout and stderr both go to the pipe
        dup2(pipefd[1], STDOUT_FILENO);
        dup2(pipefd[1], STDERR_FILENO);

        std::vector<char*> args;
        args.reserve(argv.size() + 1);
        for (const auto& a : argv) args.push_back(const_cast<char*>(a.c_str()));
        args.push_back(nullptr);

        execvp(args[0], args.data());
        _exit(127); // exec failed
    }

    close(pipefd[1]);
    std::string out;
    char buf[4096];
    ssize_t n;
    while ((n = ::read(pipefd[0], buf, sizeof(buf))) > 0 || (n < 0 && errno == EINTR))
        if (n > 0) out.append(buf, buf + n);
    close(pipefd[0]);

    int status = 0;
    if (waitpid(pid, &status, 0) < 0)
        throw std::runtime_error(std::string("waitpid failed: ") + std::strerror(errno));
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0)
        throw std::runtime_error(fmt::format("{} exited with status {}: {}",
                                             argv.front(), WIFEXITED(status) ? WEXITSTATUS(status) : -1, out));
    return out;
}

std::vector<std::string> dd::alternatives::getSelections() {
    try {
        return parseSelections(runCommand({"update-alternatives", "--get-selections"}));
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("error getting selections: ") + e.what());
    }
}

QueryResult dd::alternatives::query(const std::string& name) {
    std::string output;
    try {
        output = runCommand({"update-alternatives", "--query", name});
    } catch (const std::exception& e) {
        throw std::runtime_error(fmt::format("error querying for \"{}\": {}", name, e.what()));
    }

    try {
        return parseQuery(output);
    } catch (const ParseError& e) {
        throw ParseError(fmt::format("error parsing query result for \"{}\": {}", name, e.what()));
    }
}

std::vector<std::string> dd::alternatives::collectManagedPaths() {
    std::vector<std::string> paths;
    const auto names = getSelections();

    for (const auto& name : names) {
        const auto links = managedPaths(query(name));
        paths.insert(paths.end(), links.begin(), links.end());
    }

    LogRegistry::alternatives()->info("[Alternatives] {} link paths from {} groups", paths.size(), names.size());
    return paths;
}
