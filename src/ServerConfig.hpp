#pragma once
#include <json/json.h>
#include <cstdint>
#include <filesystem>
#include <set>
#include <stdexcept>
#include <string>

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Rules shared read-only by every tool call. Never mutated after load.
struct ServerPolicy {
    std::filesystem::path sandboxRoot; // absolute and canonical
    std::uint64_t maxFileSize = 0;
    std::set<std::string> allowedExtensions; // each with its leading '.'
    bool readOnly = false;

    bool isExtensionAllowed(const std::string& extension) const;
};

struct ServerConfig {
    std::string name;
    std::string version;
    std::string description;
    ServerPolicy policy;

    // Optional listener for the HTTP transport.
    std::string httpHost = "127.0.0.1";
    std::uint16_t httpPort = 8080;

    // Both throw ConfigError on a missing or malformed field. The sandbox directory
    // is created (with parents) if absent and then canonicalized.
    static ServerConfig loadFromFile(const std::string& path);
    static ServerConfig fromJson(const Json::Value& root);
};
