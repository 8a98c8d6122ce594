#pragma once
#include <atomic>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>
#include "tools/ToolRegistry.hpp"

namespace secure_fs {

// JSON-RPC 2.0 error codes
namespace rpc {
constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;
constexpr int kInternalError = -32603;
constexpr int kServerNotInitialized = -32002;
}

constexpr const char* kServerName = "secure-filesystem-server";
constexpr const char* kDefaultProtocolVersion = "2024-11-05";

class RpcError : public std::runtime_error {
public:
    RpcError(int code, const std::string& message) : std::runtime_error(message), code_(code) {}
    int code() const noexcept { return code_; }

private:
    int code_;
};

// Dispatches one JSON-RPC message at a time. Safe to call from several
// transport workers at once: the registry is internally locked and the
// initialized flag is atomic (and shared by every client).
class McpServer {
public:
    McpServer(std::shared_ptr<ToolRegistry> registry, std::string version);

    // Returns the serialized response, or nothing for notifications.
    std::optional<std::string> handle_request(const std::string& message);

    bool initialized() const { return initialized_.load(); }

private:
    nlohmann::json dispatch(const std::string& method, const nlohmann::json& params);

    nlohmann::json handle_initialize(const nlohmann::json& params);
    nlohmann::json handle_list_tools() const;
    nlohmann::json handle_call_tool(const nlohmann::json& params) const;

    static std::string make_error(const nlohmann::json& id, int code, const std::string& message);

    std::shared_ptr<ToolRegistry> registry_;
    std::string version_;
    std::atomic<bool> initialized_{false};
};

}
