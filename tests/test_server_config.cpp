#include <iostream>
#include <filesystem>
#include <fstream>
#include <string>
#include <json/json.h>
#include "../src/ServerConfig.hpp"

#define ASSERT_TRUE(cond) if(!(cond)) { std::cerr << "Assertion failed: " << #cond << " at " << __FILE__ << ":" << __LINE__ << std::endl; return 1; }

namespace fs = std::filesystem;

static bool rejects(const Json::Value& root) {
    try {
        ServerConfig::fromJson(root);
    } catch (const ConfigError& e) {
        std::cout << "  rejected: " << e.what() << std::endl;
        return true;
    }
    return false;
}

int main() {
    try {
        auto base = fs::temp_directory_path() / "mcp_sandboxfs_config";
        fs::remove_all(base);
        fs::create_directories(base);

        Json::Value valid;
        valid["name"] = "sandboxfs";
        valid["version"] = "1.0.0";
        valid["description"] = "Sandboxed file operations";
        valid["sandbox_path"] = (base / "nested" / "sandbox").string();
        valid["max_file_size"] = 1048576;
        valid["allowed_extensions"].append(".txt");
        valid["allowed_extensions"].append(".md");
        valid["read_only"] = false;

        // Loads and creates the sandbox with its parents
        ServerConfig config = ServerConfig::fromJson(valid);
        ASSERT_TRUE(config.name == "sandboxfs");
        ASSERT_TRUE(config.version == "1.0.0");
        ASSERT_TRUE(config.description == "Sandboxed file operations");
        ASSERT_TRUE(config.policy.maxFileSize == 1048576);
        ASSERT_TRUE(config.policy.allowedExtensions.size() == 2);
        ASSERT_TRUE(config.policy.isExtensionAllowed(".md"));
        ASSERT_TRUE(!config.policy.isExtensionAllowed(".bin"));
        ASSERT_TRUE(!config.policy.readOnly);
        ASSERT_TRUE(fs::is_directory(base / "nested" / "sandbox"));
        ASSERT_TRUE(config.policy.sandboxRoot == fs::canonical(base / "nested" / "sandbox"));
        ASSERT_TRUE(config.httpHost == "127.0.0.1");
        ASSERT_TRUE(config.httpPort == 8080);

        // Loading again with an existing sandbox is fine
        ASSERT_TRUE(ServerConfig::fromJson(valid).policy.sandboxRoot == config.policy.sandboxRoot);

        // Missing fields
        const char* required[] = {"name", "version", "description", "sandbox_path",
                                  "max_file_size", "allowed_extensions", "read_only"};
        for (const char* key : required) {
            Json::Value missing = valid;
            missing.removeMember(key);
            ASSERT_TRUE(rejects(missing));
        }

        // Malformed fields
        Json::Value bad = valid;
        bad["name"] = 7;
        ASSERT_TRUE(rejects(bad));
        bad = valid;
        bad["max_file_size"] = 0;
        ASSERT_TRUE(rejects(bad));
        bad["max_file_size"] = -5;
        ASSERT_TRUE(rejects(bad));
        bad["max_file_size"] = "10";
        ASSERT_TRUE(rejects(bad));
        bad["max_file_size"] = 1.5;
        ASSERT_TRUE(rejects(bad));
        bad = valid;
        bad["allowed_extensions"] = ".txt";
        ASSERT_TRUE(rejects(bad));
        bad["allowed_extensions"] = Json::Value(Json::arrayValue);
        bad["allowed_extensions"].append("txt");
        ASSERT_TRUE(rejects(bad));
        bad["allowed_extensions"] = Json::Value(Json::arrayValue);
        bad["allowed_extensions"].append(".txt");
        bad["allowed_extensions"].append(3);
        ASSERT_TRUE(rejects(bad));
        bad = valid;
        bad["read_only"] = "false";
        ASSERT_TRUE(rejects(bad));
        bad = valid;
        bad["sandbox_path"] = "";
        ASSERT_TRUE(rejects(bad));
        ASSERT_TRUE(rejects(Json::Value(Json::arrayValue)));

        // Sandbox path that is a regular file
        {
            std::ofstream blocker(base / "blocker");
            blocker << "x";
        }
        bad = valid;
        bad["sandbox_path"] = (base / "blocker").string();
        ASSERT_TRUE(rejects(bad));

        // Empty allow-list is valid: only extensionless names can be written
        Json::Value noExt = valid;
        noExt["allowed_extensions"] = Json::Value(Json::arrayValue);
        ASSERT_TRUE(ServerConfig::fromJson(noExt).policy.allowedExtensions.empty());

        // Optional HTTP listener
        Json::Value http = valid;
        http["http"]["host"] = "0.0.0.0";
        http["http"]["port"] = 9000;
        ServerConfig httpConfig = ServerConfig::fromJson(http);
        ASSERT_TRUE(httpConfig.httpHost == "0.0.0.0");
        ASSERT_TRUE(httpConfig.httpPort == 9000);
        http["http"]["port"] = 70000;
        ASSERT_TRUE(rejects(http));
        http["http"]["port"] = 0;
        ASSERT_TRUE(rejects(http));
        http["http"]["port"] = Json::UInt64(18446744073709551615ULL);
        ASSERT_TRUE(rejects(http));
        http["http"]["port"] = 8080.5;
        ASSERT_TRUE(rejects(http));
        http["http"]["port"] = "8080";
        ASSERT_TRUE(rejects(http));
        http["http"] = "localhost:9000";
        ASSERT_TRUE(rejects(http));

        // From disk
        auto configPath = base / "config.json";
        {
            std::ofstream ofs(configPath);
            ofs << Json::writeString(Json::StreamWriterBuilder(), valid);
        }
        ServerConfig fromFile = ServerConfig::loadFromFile(configPath.string());
        ASSERT_TRUE(fromFile.policy.sandboxRoot == config.policy.sandboxRoot);

        bool threw = false;
        try {
            ServerConfig::loadFromFile((base / "does_not_exist.json").string());
        } catch (const ConfigError&) {
            threw = true;
        }
        ASSERT_TRUE(threw);

        {
            std::ofstream ofs(base / "broken.json");
            ofs << "{ \"name\": ";
        }
        threw = false;
        try {
            ServerConfig::loadFromFile((base / "broken.json").string());
        } catch (const ConfigError&) {
            threw = true;
        }
        ASSERT_TRUE(threw);

        fs::remove_all(base);
    } catch (const std::exception& e) {
        std::cerr << "Exception in test: " << e.what() << std::endl;
        return 1;
    }
    std::cout << "All ServerConfig tests passed" << std::endl;
    return 0;
}
