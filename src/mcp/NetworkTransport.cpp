#include "mcp/NetworkTransport.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <stdexcept>

namespace secure_fs {

using json = nlohmann::json;

NetworkTransport::NetworkTransport(NetworkOptions options, IpFilter filter)
    : options_(std::move(options)), filter_(std::move(filter)) {}

void NetworkTransport::setup_routes(const MessageHandler& handler) {
    // --- IP ALLOW-LIST ---
    server_.set_pre_routing_handler([this](const httplib::Request& req, httplib::Response& res) {
        if (filter_.allows(req.remote_addr)) {
            return httplib::Server::HandlerResponse::Unhandled;
        }
        spdlog::warn("🚫 Connection rejected from {} - not in whitelist", req.remote_addr);
        res.status = 403;
        res.set_content(json{{"error", "Forbidden"}}.dump(), "application/json");
        return httplib::Server::HandlerResponse::Handled;
    });

    auto rpc_route = [handler](const httplib::Request& req, httplib::Response& res) {
        try {
            auto response = handler(req.body);
            if (!response) {
                res.status = 202;
                return;
            }
            res.set_content(*response, "application/json");
        } catch (const std::exception& e) {
            spdlog::error("🔥 Request from {} failed: {}", req.remote_addr, e.what());
            res.status = 500;
            res.set_content(json{{"jsonrpc", "2.0"}, {"id", nullptr},
                                 {"error", {{"code", -32603}, {"message", e.what()}}}}.dump(),
                            "application/json");
        }
    };
    server_.Post("/mcp", rpc_route);
    server_.Post("/", rpc_route);

    server_.Get("/health", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(R"({"status":"ok"})", "application/json");
    });
}

void NetworkTransport::run(const MessageHandler& handler) {
    setup_routes(handler);

    spdlog::info("🚀 MCP Network Transport listening on {}:{}", options_.host, options_.port);
    if (filter_.empty()) {
        spdlog::warn("⚠️ No IP restrictions configured - all connections allowed");
    } else {
        spdlog::info("🛡️ IP whitelist enabled: {}", filter_.describe());
    }

    bool ok = server_.listen(options_.host.c_str(), options_.port);
    if (!ok && !stopping_) {
        throw std::runtime_error("failed to listen on " + options_.host + ":" + std::to_string(options_.port));
    }
}

void NetworkTransport::stop() {
    stopping_ = true;
    server_.stop();
}

}
