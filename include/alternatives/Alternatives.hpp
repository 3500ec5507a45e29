#pragma once

#include <map>
#include <stdexcept>
#include <string>
#include <vector>

namespace dd::alternatives {

inline constexpr const char* ADMIN_DIR = "/etc/alternatives";

struct ParseError : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// One "Alternative:" block of a query result.
struct QueryResultAlternative {
    std::string alternative;
    std::string priority;
    std::map<std::string, std::string> slaves;
};

// Parsed output of `update-alternatives --query <name>`.
struct QueryResult {
    std::string name;
    std::string link;
    std::map<std::string, std::string> slaves;   // slave name -> link path
    std::string status;
    std::string best;
    std::string value;
    std::vector<QueryResultAlternative> alternatives;
};

// Master names from `update-alternatives --get-selections` output.
std::vector<std::string> parseSelections(const std::string& output);

// Throws ParseError naming the offending line.
QueryResult parseQuery(const std::string& output);

// Link paths the alternatives system creates for a group: the master and
// slave links plus their entries under /etc/alternatives.
std::vector<std::string> managedPaths(const QueryResult& result);

// Runs argv[0] with PATH lookup and returns stdout and stderr combined.
// Throws std::runtime_error on spawn failure or a non-zero exit.
std::string runCommand(const std::vector<std::string>& argv);

std::vector<std::string> getSelections();
QueryResult query(const std::string& name);

// managedPaths() over every installed group.
std::vector<std::string> collectManagedPaths();

}
