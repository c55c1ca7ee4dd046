#pragma once
#include <json/json.h>
#include <stdexcept>
#include <string>
#include <vector>
#include "PathGuard.hpp"
#include "ServerConfig.hpp"
#include "ToolResult.hpp"

// Raised when a tool call's arguments have the wrong shape (missing or non-string
// required argument). The only fault that leaves ToolRouter::invoke.
class InvalidArgumentsError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

struct ToolDescriptor {
    std::string name;
    std::string description;
    Json::Value inputSchema;
};

class ToolRouter {
public:
    // Keeps its own copy of the policy.
    explicit ToolRouter(ServerPolicy policy);

    Json::Value createResponse(const Json::Value& id, const Json::Value& result) const;
    Json::Value createError(const Json::Value& id, int code, const std::string& message) const;

    // Fixed order: list_files, read_file, write_file, create_directory, delete_file.
    std::vector<ToolDescriptor> toolDescriptors() const;
    // { "tools": [...] } for tools/list
    Json::Value listTools() const;

    // Runs one tool. Every outcome, including unexpected I/O faults, comes back as a
    // ToolResult; only InvalidArgumentsError propagates.
    ToolResult invoke(const std::string& name, const Json::Value& arguments) const;

    // Takes the params of tools/call ({name, arguments}) and returns a CallToolResult.
    // Malformed arguments yield an object carrying "__error__" instead.
    Json::Value callTool(const Json::Value& params) const;

    const ServerPolicy& policy() const { return policy_; }

private:
    ToolResult listFiles(const std::string& requested, const ValidatedPath& target) const;
    ToolResult readFile(const std::string& requested, const ValidatedPath& target) const;
    ToolResult writeFile(const std::string& requested, const ValidatedPath& target, const std::string& content) const;
    ToolResult createDirectory(const std::string& requested, const ValidatedPath& target) const;
    ToolResult deleteFile(const std::string& requested, const ValidatedPath& target) const;

    const ServerPolicy policy_;
};
