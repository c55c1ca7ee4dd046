#include <drogon/drogon.h>
#include <json/json.h>
#include <iostream>
#include <string>
#include "McpDispatcher.hpp"
#include "ServerConfig.hpp"
#include "ToolRouter.hpp"

// Main HTTP handler for MCP JSON-RPC requests
void handleMcpRequest(const McpDispatcher& dispatcher,
                      const drogon::HttpRequestPtr& req,
                      std::function<void(const drogon::HttpResponsePtr&)>&& callback) {
    auto reply = dispatcher.handleText(std::string(req->body()));
    if (!reply) {
        // Notifications get no body
        auto resp = drogon::HttpResponse::newHttpResponse();
        resp->setStatusCode(drogon::HttpStatusCode::k202Accepted);
        callback(resp);
        return;
    }
    auto resp = drogon::HttpResponse::newHttpJsonResponse(*reply);
    if (reply->isMember("error") && (*reply)["error"]["code"].asInt() == -32700) {
        resp->setStatusCode(drogon::HttpStatusCode::k400BadRequest);
    }
    callback(resp);
}

int main(int argc, char* argv[]) {
    using namespace drogon;

    std::string configPath = argc > 1 ? argv[1] : "config.json";

    ServerConfig config;
    try {
        config = ServerConfig::loadFromFile(configPath);
    } catch (const ConfigError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        return 1;
    }

    // Both outlive app().run(); handlers on the I/O threads only read them.
    const ToolRouter router(config.policy);
    const McpDispatcher dispatcher(config, router);

    app().registerHandler("/mcp",
        [&dispatcher](const HttpRequestPtr& req, std::function<void(const HttpResponsePtr&)>&& callback) {
            handleMcpRequest(dispatcher, req, std::move(callback));
        },
        {Post});

    // CORS support
    app().registerPreHandlingAdvice([](const HttpRequestPtr& req) -> HttpResponsePtr {
        if (req->method() == Options) {
            auto resp = HttpResponse::newHttpResponse();
            resp->addHeader("Access-Control-Allow-Origin", "*");
            resp->addHeader("Access-Control-Allow-Methods", "POST, OPTIONS");
            resp->addHeader("Access-Control-Allow-Headers", "Content-Type");
            return resp;
        }
        return nullptr;
    });

    app().registerPostHandlingAdvice([](const HttpRequestPtr&, const HttpResponsePtr& resp) {
        resp->addHeader("Access-Control-Allow-Origin", "*");
    });

    app().addListener(config.httpHost, config.httpPort);

    std::cerr << "MCP HTTP server " << config.name << " " << config.version << " starting" << std::endl;
    std::cerr << "  endpoint: http://" << config.httpHost << ":" << config.httpPort << "/mcp" << std::endl;
    std::cerr << "  sandbox: " << config.policy.sandboxRoot.string() << std::endl;
    std::cerr << "  read-only: " << (config.policy.readOnly ? "yes" : "no") << std::endl;
    app().run();

    return 0;
}
