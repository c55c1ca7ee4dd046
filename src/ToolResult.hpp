#pragma once
#include <json/json.h>
#include <optional>
#include <string>
#include <vector>

enum class ToolErrorKind {
    UnknownTool,
    PathEscape,
    PolicyViolation,
    NotFound,
    WrongKind,
    Encoding,
    IoError
};

const char* toString(ToolErrorKind kind);

// Outcome of one tool call: either text segments or a tagged failure message.
class ToolResult {
public:
    static ToolResult ok(std::string text);
    static ToolResult ok(std::vector<std::string> segments);
    static ToolResult fail(ToolErrorKind kind, std::string message);

    bool isError() const { return errorKind_.has_value(); }
    std::optional<ToolErrorKind> errorKind() const { return errorKind_; }
    const std::vector<std::string>& segments() const { return segments_; }

    // All segments concatenated; convenient for single-segment results.
    std::string text() const;

    // MCP CallToolResult: { "content": [{"type":"text","text":...}], "isError": bool }
    Json::Value toJson() const;

private:
    ToolResult() = default;

    std::vector<std::string> segments_;
    std::optional<ToolErrorKind> errorKind_;
};
