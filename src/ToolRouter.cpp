#include "ToolRouter.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <system_error>
#include <utility>
#include "FileUtils.hpp"
#include "Utf8Utils.hpp"

namespace fs = std::filesystem;

namespace {

const char* const kListFiles = "list_files";
const char* const kReadFile = "read_file";
const char* const kWriteFile = "write_file";
const char* const kCreateDirectory = "create_directory";
const char* const kDeleteFile = "delete_file";

Json::Value stringProperty(const std::string& description) {
    Json::Value property;
    property["type"] = "string";
    property["description"] = description;
    return property;
}

ToolDescriptor pathTool(const std::string& name, const std::string& description, const std::string& pathDescription) {
    ToolDescriptor tool;
    tool.name = name;
    tool.description = description;
    tool.inputSchema["type"] = "object";
    tool.inputSchema["properties"]["path"] = stringProperty(pathDescription);
    tool.inputSchema["required"].append("path");
    return tool;
}

std::string requireStringArgument(const Json::Value& arguments, const char* key) {
    if (!arguments.isMember(key)) {
        throw InvalidArgumentsError(std::string("Missing required argument: ") + key);
    }
    if (!arguments[key].isString()) {
        throw InvalidArgumentsError(std::string("Argument must be a string: ") + key);
    }
    return arguments[key].asString();
}

// Not-found comes back as file_type::not_found; any other stat failure is an I/O fault.
fs::file_status statPath(const fs::path& path) {
    std::error_code ec;
    fs::file_status st = fs::status(path, ec);
    if (ec && st.type() != fs::file_type::not_found) {
        throw fs::filesystem_error("cannot stat path", path, ec);
    }
    return st;
}

std::string sizeLimitText(const char* what, std::uint64_t limit) {
    return std::string(what) + " too large (max " + std::to_string(limit) + " bytes)";
}

} // namespace

ToolRouter::ToolRouter(ServerPolicy policy) : policy_(std::move(policy)) {
}

Json::Value ToolRouter::createResponse(const Json::Value& id, const Json::Value& result) const {
    Json::Value response;
    response["jsonrpc"] = "2.0";
    response["id"] = id;
    response["result"] = result;
    return response;
}

Json::Value ToolRouter::createError(const Json::Value& id, int code, const std::string& message) const {
    Json::Value response;
    response["jsonrpc"] = "2.0";
    response["id"] = id;
    response["error"]["code"] = code;
    response["error"]["message"] = message;
    return response;
}

std::vector<ToolDescriptor> ToolRouter::toolDescriptors() const {
    std::vector<ToolDescriptor> tools;
    tools.push_back(pathTool(kListFiles, "List files and directories in a given path",
                             "Directory path to list (relative to sandbox)"));
    tools.push_back(pathTool(kReadFile, "Read the contents of a file",
                             "File path to read (relative to sandbox)"));

    ToolDescriptor write = pathTool(kWriteFile, "Write content to a file",
                                    "File path to write (relative to sandbox)");
    write.inputSchema["properties"]["content"] = stringProperty("Content to write to the file");
    write.inputSchema["required"].append("content");
    tools.push_back(write);

    tools.push_back(pathTool(kCreateDirectory, "Create a new directory",
                             "Directory path to create (relative to sandbox)"));
    tools.push_back(pathTool(kDeleteFile, "Delete a file or directory",
                             "File or directory path to delete (relative to sandbox)"));
    return tools;
}

Json::Value ToolRouter::listTools() const {
    Json::Value tools(Json::arrayValue);
    for (const auto& descriptor : toolDescriptors()) {
        Json::Value tool;
        tool["name"] = descriptor.name;
        tool["description"] = descriptor.description;
        tool["inputSchema"] = descriptor.inputSchema;
        tools.append(tool);
    }
    Json::Value result;
    result["tools"] = tools;
    return result;
}

ToolResult ToolRouter::invoke(const std::string& name, const Json::Value& arguments) const {
    if (name != kListFiles && name != kReadFile && name != kWriteFile &&
        name != kCreateDirectory && name != kDeleteFile) {
        std::cerr << "Unknown tool requested: " << name << std::endl;
        return ToolResult::fail(ToolErrorKind::UnknownTool, "Unknown tool: " + name);
    }

    if (!arguments.isNull() && !arguments.isObject()) {
        throw InvalidArgumentsError("Tool arguments must be an object");
    }
    Json::Value args = arguments.isNull() ? Json::Value(Json::objectValue) : arguments;
    std::string path = requireStringArgument(args, "path");
    std::string content;
    if (name == kWriteFile) {
        content = requireStringArgument(args, "content");
    }

    ToolResult result = ToolResult::fail(ToolErrorKind::IoError, "Error: no result");
    try {
        PathResolution resolved = PathGuard::resolve(policy_.sandboxRoot, path);
        if (const auto* escape = std::get_if<PathEscapeError>(&resolved)) {
            result = ToolResult::fail(ToolErrorKind::PathEscape, escape->message());
        } else {
            const ValidatedPath& target = std::get<ValidatedPath>(resolved);
            if (name == kListFiles) {
                result = listFiles(path, target);
            } else if (name == kReadFile) {
                result = readFile(path, target);
            } else if (name == kWriteFile) {
                result = writeFile(path, target, content);
            } else if (name == kCreateDirectory) {
                result = createDirectory(path, target);
            } else {
                result = deleteFile(path, target);
            }
        }
    } catch (const std::exception& e) {
        result = ToolResult::fail(ToolErrorKind::IoError, std::string("Error: ") + e.what());
    }

    if (result.isError()) {
        std::cerr << "Tool " << name << " failed (" << toString(*result.errorKind()) << "): "
                  << result.text() << std::endl;
    }
    return result;
}

Json::Value ToolRouter::callTool(const Json::Value& params) const {
    Json::Value result;
    if (!params.isObject() || !params["name"].isString()) {
        result["__error__"] = "Invalid params: tool name must be a string";
        return result;
    }
    std::string toolName = params["name"].asString();
    try {
        return invoke(toolName, params["arguments"]).toJson();
    } catch (const InvalidArgumentsError& e) {
        result["__error__"] = std::string("Invalid params: ") + e.what();
        return result;
    }
}

ToolResult ToolRouter::listFiles(const std::string& requested, const ValidatedPath& target) const {
    const fs::path& dir = target.path();
    fs::file_status st = statPath(dir);
    if (!fs::exists(st)) {
        return ToolResult::fail(ToolErrorKind::NotFound, "Path does not exist: " + requested);
    }
    if (!fs::is_directory(st)) {
        return ToolResult::fail(ToolErrorKind::WrongKind, "Path is not a directory: " + requested);
    }

    std::vector<fs::directory_entry> entries;
    for (const auto& entry : fs::directory_iterator(dir)) {
        entries.push_back(entry);
    }
    std::sort(entries.begin(), entries.end(), [](const fs::directory_entry& a, const fs::directory_entry& b) {
        return a.path().filename().string() < b.path().filename().string();
    });

    std::ostringstream out;
    out << "Contents of " << requested << ":\n";
    bool first = true;
    for (const auto& entry : entries) {
        // Entries may vanish or be dangling links; report what can still be seen.
        std::error_code ec;
        bool isDir = entry.is_directory(ec);
        bool isFile = !isDir && entry.is_regular_file(ec);
        std::string size = "-";
        if (isFile) {
            std::uintmax_t bytes = entry.file_size(ec);
            if (!ec) {
                size = std::to_string(bytes);
            }
        }
        if (!first) {
            out << "\n";
        }
        first = false;
        out << std::left << std::setw(4) << (isDir ? "dir" : "file") << " "
            << std::right << std::setw(10) << size << " "
            << entry.path().filename().string();
    }
    return ToolResult::ok(out.str());
}

ToolResult ToolRouter::readFile(const std::string& requested, const ValidatedPath& target) const {
    fs::file_status st = statPath(target.path());
    if (!fs::exists(st)) {
        return ToolResult::fail(ToolErrorKind::NotFound, "File does not exist: " + requested);
    }
    if (!fs::is_regular_file(st)) {
        return ToolResult::fail(ToolErrorKind::WrongKind, "Path is not a file: " + requested);
    }
    if (fs::file_size(target.path()) > policy_.maxFileSize) {
        return ToolResult::fail(ToolErrorKind::PolicyViolation, sizeLimitText("File", policy_.maxFileSize));
    }

    std::string content;
    if (!read_bounded(target.path(), policy_.maxFileSize, content)) {
        if (!fs::exists(statPath(target.path()))) {
            return ToolResult::fail(ToolErrorKind::NotFound, "File does not exist: " + requested);
        }
        return ToolResult::fail(ToolErrorKind::IoError, "Error: Cannot open file for reading: " + requested);
    }
    // The file may have grown since the size check.
    if (content.size() > policy_.maxFileSize) {
        return ToolResult::fail(ToolErrorKind::PolicyViolation, sizeLimitText("File", policy_.maxFileSize));
    }
    if (!is_valid_utf8(content.data(), content.size())) {
        return ToolResult::fail(ToolErrorKind::Encoding, "Error: File contains non-UTF-8 content");
    }
    return ToolResult::ok(std::move(content));
}

ToolResult ToolRouter::writeFile(const std::string& requested, const ValidatedPath& target, const std::string& content) const {
    if (policy_.readOnly) {
        return ToolResult::fail(ToolErrorKind::PolicyViolation, "Server is in read-only mode");
    }

    // Names without an extension (including dot-files) are exempt from the allow-list.
    std::string extension = target.path().extension().string();
    if (extension == ".") {
        extension.clear();
    }
    if (!extension.empty() && !policy_.isExtensionAllowed(extension)) {
        return ToolResult::fail(ToolErrorKind::PolicyViolation, "File extension not allowed: " + extension);
    }
    if (content.size() > policy_.maxFileSize) {
        return ToolResult::fail(ToolErrorKind::PolicyViolation, sizeLimitText("Content", policy_.maxFileSize));
    }
    if (fs::is_directory(statPath(target.path()))) {
        return ToolResult::fail(ToolErrorKind::WrongKind, "Path is a directory: " + requested);
    }

    fs::create_directories(target.path().parent_path());

    std::ofstream out(target.path(), std::ios::binary | std::ios::trunc);
    if (!out) {
        return ToolResult::fail(ToolErrorKind::IoError, "Error: Cannot open file for writing: " + requested);
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.close();
    if (!out) {
        return ToolResult::fail(ToolErrorKind::IoError, "Error: Failed to write file: " + requested);
    }
    return ToolResult::ok("File written successfully: " + requested);
}

ToolResult ToolRouter::createDirectory(const std::string& requested, const ValidatedPath& target) const {
    if (policy_.readOnly) {
        return ToolResult::fail(ToolErrorKind::PolicyViolation, "Server is in read-only mode");
    }
    if (fs::exists(statPath(target.path()))) {
        return ToolResult::fail(ToolErrorKind::PolicyViolation, "Path already exists: " + requested);
    }
    fs::create_directories(target.path());
    return ToolResult::ok("Directory created successfully: " + requested);
}

ToolResult ToolRouter::deleteFile(const std::string& requested, const ValidatedPath& target) const {
    if (policy_.readOnly) {
        return ToolResult::fail(ToolErrorKind::PolicyViolation, "Server is in read-only mode");
    }
    const fs::path& path = target.path();
    fs::file_status st = statPath(path);
    if (!fs::exists(st)) {
        return ToolResult::fail(ToolErrorKind::NotFound, "Path does not exist: " + requested);
    }
    if (path == policy_.sandboxRoot) {
        return ToolResult::fail(ToolErrorKind::PolicyViolation, "Cannot delete the sandbox root");
    }

    if (fs::is_regular_file(st)) {
        if (!fs::remove(path)) {
            return ToolResult::fail(ToolErrorKind::NotFound, "Path does not exist: " + requested);
        }
        return ToolResult::ok("File deleted successfully: " + requested);
    }
    if (fs::is_directory(st)) {
        // Only empty directories; no recursive removal.
        std::error_code ec;
        bool removed = fs::remove(path, ec);
        if (ec == std::errc::directory_not_empty || ec == std::errc::file_exists) {
            return ToolResult::fail(ToolErrorKind::PolicyViolation, "Directory not empty: " + requested);
        }
        if (ec) {
            throw fs::filesystem_error("cannot remove directory", path, ec);
        }
        if (!removed) {
            return ToolResult::fail(ToolErrorKind::NotFound, "Path does not exist: " + requested);
        }
        return ToolResult::ok("Directory deleted successfully: " + requested);
    }
    return ToolResult::fail(ToolErrorKind::WrongKind, "Unknown path type: " + requested);
}
