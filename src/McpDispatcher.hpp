#pragma once
#include <json/json.h>
#include <optional>
#include <string>
#include "ServerConfig.hpp"
#include "ToolRouter.hpp"

// JSON-RPC 2.0 method routing shared by the stdio and HTTP transports.
class McpDispatcher {
public:
    McpDispatcher(const ServerConfig& config, const ToolRouter& router);

    // Returns the reply for a request, or nothing for a notification (no "id").
    std::optional<Json::Value> handleRequest(const Json::Value& request) const;

    // Parses one message first; unparsable input gets a -32700 reply with a null id.
    std::optional<Json::Value> handleText(const std::string& text) const;

    // Compact single-line encoding, as the stdio framing requires.
    static std::string serialize(const Json::Value& message);

private:
    Json::Value handleInitialize(const Json::Value& id) const;
    Json::Value handleCallTool(const Json::Value& id, const Json::Value& params) const;

    const ServerConfig& config_;
    const ToolRouter& router_;
};
