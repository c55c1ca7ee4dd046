#include "ToolResult.hpp"
#include <utility>

const char* toString(ToolErrorKind kind) {
    switch (kind) {
        case ToolErrorKind::UnknownTool: return "unknown_tool";
        case ToolErrorKind::PathEscape: return "path_escape";
        case ToolErrorKind::PolicyViolation: return "policy_violation";
        case ToolErrorKind::NotFound: return "not_found";
        case ToolErrorKind::WrongKind: return "wrong_kind";
        case ToolErrorKind::Encoding: return "encoding";
        case ToolErrorKind::IoError: return "io_error";
    }
    return "unknown";
}

ToolResult ToolResult::ok(std::string text) {
    ToolResult result;
    result.segments_.push_back(std::move(text));
    return result;
}

ToolResult ToolResult::ok(std::vector<std::string> segments) {
    ToolResult result;
    result.segments_ = std::move(segments);
    if (result.segments_.empty()) {
        result.segments_.emplace_back();
    }
    return result;
}

ToolResult ToolResult::fail(ToolErrorKind kind, std::string message) {
    ToolResult result;
    result.segments_.push_back(std::move(message));
    result.errorKind_ = kind;
    return result;
}

std::string ToolResult::text() const {
    std::string joined;
    for (const auto& segment : segments_) {
        joined += segment;
    }
    return joined;
}

Json::Value ToolResult::toJson() const {
    Json::Value result;
    result["content"] = Json::Value(Json::arrayValue);
    for (const auto& segment : segments_) {
        Json::Value item;
        item["type"] = "text";
        item["text"] = segment;
        result["content"].append(item);
    }
    result["isError"] = isError();
    return result;
}
