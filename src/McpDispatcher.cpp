#include "McpDispatcher.hpp"
#include <iostream>
#include <sstream>

McpDispatcher::McpDispatcher(const ServerConfig& config, const ToolRouter& router)
    : config_(config), router_(router) {
}

std::string McpDispatcher::serialize(const Json::Value& message) {
    Json::StreamWriterBuilder writer;
    writer["indentation"] = "";  // Compact output
    return Json::writeString(writer, message);
}

Json::Value McpDispatcher::handleInitialize(const Json::Value& id) const {
    Json::Value result;
    result["protocolVersion"] = "2024-11-05";
    result["capabilities"]["tools"] = Json::objectValue;
    result["serverInfo"]["name"] = config_.name;
    result["serverInfo"]["version"] = config_.version;
    result["instructions"] = config_.description;
    return router_.createResponse(id, result);
}

Json::Value McpDispatcher::handleCallTool(const Json::Value& id, const Json::Value& params) const {
    Json::Value result = router_.callTool(params);
    if (result.isMember("__error__")) {
        return router_.createError(id, -32602, result["__error__"].asString());
    }
    return router_.createResponse(id, result);
}

std::optional<Json::Value> McpDispatcher::handleRequest(const Json::Value& request) const {
    if (!request.isObject() || !request["method"].isString()) {
        Json::Value id = request.isObject() ? request["id"] : Json::Value::null;
        return router_.createError(id, -32600, "Invalid Request");
    }

    std::string method = request["method"].asString();
    if (!request.isMember("id")) {
        // Notifications (notifications/initialized, cancellations, ...) get no reply.
        return std::nullopt;
    }
    Json::Value id = request["id"];
    Json::Value params = request["params"];

    if (method == "initialize") {
        return handleInitialize(id);
    } else if (method == "tools/list") {
        return router_.createResponse(id, router_.listTools());
    } else if (method == "tools/call") {
        return handleCallTool(id, params);
    } else if (method == "ping") {
        return router_.createResponse(id, Json::Value(Json::objectValue));
    }
    return router_.createError(id, -32601, "Method not found: " + method);
}

std::optional<Json::Value> McpDispatcher::handleText(const std::string& text) const {
    Json::CharReaderBuilder builder;
    Json::Value request;
    std::string errs;

    std::istringstream iss(text);
    if (!Json::parseFromStream(builder, iss, &request, &errs)) {
        std::cerr << "JSON parse error: " << errs << std::endl;
        return router_.createError(Json::Value::null, -32700, "Parse error");
    }
    return handleRequest(request);
}
