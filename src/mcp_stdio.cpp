#include <iostream>
#include <string>
#include <json/json.h>
#include "McpDispatcher.hpp"
#include "ServerConfig.hpp"
#include "ToolRouter.hpp"

int main(int argc, char* argv[]) {
    std::string configPath = argc > 1 ? argv[1] : "config.json";

    ServerConfig config;
    try {
        config = ServerConfig::loadFromFile(configPath);
    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    }

    std::cerr << "MCP stdio server " << config.name << " " << config.version << " started" << std::endl;
    std::cerr << "  sandbox: " << config.policy.sandboxRoot.string() << std::endl;
    std::cerr << "  max file size: " << config.policy.maxFileSize << " bytes" << std::endl;
    std::cerr << "  read-only: " << (config.policy.readOnly ? "yes" : "no") << std::endl;

    ToolRouter router(config.policy);
    McpDispatcher dispatcher(config, router);

    std::string line;
    while (std::getline(std::cin, line)) {
        if (line.empty()) {
            continue;
        }
        auto reply = dispatcher.handleText(line);
        if (reply) {
            std::cout << McpDispatcher::serialize(*reply) << std::endl;
        }
    }

    std::cerr << "MCP stdio server stopped (stdin closed)" << std::endl;
    return 0;
}
