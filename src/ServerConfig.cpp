#include "ServerConfig.hpp"
#include <fstream>
#include <system_error>

namespace fs = std::filesystem;

namespace {

const Json::Value& requireMember(const Json::Value& root, const char* key) {
    if (!root.isMember(key)) {
        throw ConfigError(std::string("Missing config field: ") + key);
    }
    return root[key];
}

std::string requireString(const Json::Value& root, const char* key) {
    const Json::Value& value = requireMember(root, key);
    if (!value.isString()) {
        throw ConfigError(std::string("Config field must be a string: ") + key);
    }
    return value.asString();
}

} // namespace

bool ServerPolicy::isExtensionAllowed(const std::string& extension) const {
    return allowedExtensions.count(extension) > 0;
}

ServerConfig ServerConfig::fromJson(const Json::Value& root) {
    if (!root.isObject()) {
        throw ConfigError("Config root must be a JSON object");
    }

    ServerConfig config;
    config.name = requireString(root, "name");
    config.version = requireString(root, "version");
    config.description = requireString(root, "description");

    std::string sandboxPath = requireString(root, "sandbox_path");
    if (sandboxPath.empty()) {
        throw ConfigError("Config field must not be empty: sandbox_path");
    }

    const Json::Value& maxSize = requireMember(root, "max_file_size");
    if (!maxSize.isIntegral() || !maxSize.isUInt64() || maxSize.asUInt64() == 0) {
        throw ConfigError("Config field must be a positive integer: max_file_size");
    }
    config.policy.maxFileSize = maxSize.asUInt64();

    const Json::Value& extensions = requireMember(root, "allowed_extensions");
    if (!extensions.isArray()) {
        throw ConfigError("Config field must be an array of strings: allowed_extensions");
    }
    for (const auto& ext : extensions) {
        if (!ext.isString()) {
            throw ConfigError("Config field must be an array of strings: allowed_extensions");
        }
        std::string value = ext.asString();
        if (value.size() < 2 || value[0] != '.') {
            throw ConfigError("Allowed extension must start with '.': " + value);
        }
        config.policy.allowedExtensions.insert(value);
    }

    const Json::Value& readOnly = requireMember(root, "read_only");
    if (!readOnly.isBool()) {
        throw ConfigError("Config field must be a boolean: read_only");
    }
    config.policy.readOnly = readOnly.asBool();

    if (root.isMember("http")) {
        const Json::Value& http = root["http"];
        if (!http.isObject()) {
            throw ConfigError("Config field must be an object: http");
        }
        if (http.isMember("host")) {
            if (!http["host"].isString()) {
                throw ConfigError("Config field must be a string: http.host");
            }
            config.httpHost = http["host"].asString();
        }
        if (http.isMember("port")) {
            const Json::Value& port = http["port"];
            if (!port.isIntegral() || !port.isInt64() || port.asInt64() < 1 || port.asInt64() > 65535) {
                throw ConfigError("Config field must be a port number: http.port");
            }
            config.httpPort = static_cast<std::uint16_t>(port.asInt());
        }
    }

    std::error_code ec;
    fs::create_directories(sandboxPath, ec);
    if (ec) {
        throw ConfigError("Cannot create sandbox directory " + sandboxPath + ": " + ec.message());
    }
    fs::path canonicalRoot = fs::canonical(sandboxPath, ec);
    if (ec) {
        throw ConfigError("Cannot resolve sandbox directory " + sandboxPath + ": " + ec.message());
    }
    if (!fs::is_directory(canonicalRoot)) {
        throw ConfigError("Sandbox path is not a directory: " + sandboxPath);
    }
    config.policy.sandboxRoot = canonicalRoot;
    return config;
}

ServerConfig ServerConfig::loadFromFile(const std::string& path) {
    std::ifstream configFile(path);
    if (!configFile) {
        throw ConfigError("Cannot open config file: " + path);
    }
    Json::Value root;
    Json::CharReaderBuilder builder;
    std::string errs;
    if (!Json::parseFromStream(builder, configFile, &root, &errs)) {
        throw ConfigError("Failed to parse " + path + ": " + errs);
    }
    return fromJson(root);
}
