#include "mcp/McpServer.hpp"
#include <spdlog/spdlog.h>

namespace secure_fs {

using json = nlohmann::json;

McpServer::McpServer(std::shared_ptr<ToolRegistry> registry, std::string version)
    : registry_(std::move(registry)), version_(std::move(version)) {}

std::string McpServer::make_error(const json& id, int code, const std::string& message) {
    return json{{"jsonrpc", "2.0"}, {"id", id}, {"error", {{"code", code}, {"message", message}}}}.dump();
}

std::optional<std::string> McpServer::handle_request(const std::string& message) {
    json request = json::parse(message, nullptr, false);
    if (request.is_discarded()) {
        spdlog::warn("⚠️ Unparseable message dropped ({} bytes)", message.size());
        return make_error(nullptr, rpc::kParseError, "Parse error");
    }
    if (!request.is_object() || !request.contains("method") || !request["method"].is_string()) {
        json id = request.is_object() && request.contains("id") ? request["id"] : json();
        return make_error(id, rpc::kInvalidRequest, "Invalid Request");
    }

    std::string method = request["method"].get<std::string>();
    bool is_notification = !request.contains("id");
    json id = is_notification ? json() : request["id"];
    json params = request.contains("params") && !request["params"].is_null() ? request["params"] : json::object();

    spdlog::debug("➡️ {} (id {})", method, id.dump());

    if (method == "notifications/initialized" || method == "initialized") {
        initialized_ = true;
        spdlog::info("🤝 Client initialized");
        return std::nullopt;
    }

    if (method != "initialize" && method != "ping" && !initialized_) {
        spdlog::warn("Rejecting {} before initialization", method);
        if (is_notification) return std::nullopt;
        return make_error(id, rpc::kServerNotInitialized, "Server not initialized");
    }

    try {
        json result = dispatch(method, params);
        if (is_notification) return std::nullopt;
        return json{{"jsonrpc", "2.0"}, {"id", id}, {"result", result}}.dump();
    } catch (const RpcError& e) {
        if (is_notification) return std::nullopt;
        return make_error(id, e.code(), e.what());
    } catch (const std::exception& e) {
        spdlog::error("🔥 Handler for {} threw: {}", method, e.what());
        if (is_notification) return std::nullopt;
        return make_error(id, rpc::kInternalError, e.what());
    }
}

json McpServer::dispatch(const std::string& method, const json& params) {
    if (method == "initialize") return handle_initialize(params);
    if (method == "ping") return json::object();
    if (method == "tools/list" || method == "list_tools") return handle_list_tools();
    if (method == "tools/call" || method == "call_tool") return handle_call_tool(params);
    throw RpcError(rpc::kMethodNotFound, "Method not supported: " + method);
}

json McpServer::handle_initialize(const json& params) {
    if (!params.is_object()) {
        throw RpcError(rpc::kInvalidParams, "Invalid initialize parameters");
    }
    std::string protocol = kDefaultProtocolVersion;
    if (params.contains("protocolVersion") && params["protocolVersion"].is_string() &&
        !params["protocolVersion"].get<std::string>().empty()) {
        protocol = params["protocolVersion"].get<std::string>();
    }

    if (params.contains("clientInfo") && params["clientInfo"].is_object()) {
        const json& client = params["clientInfo"];
        spdlog::info("🔌 Client: {} {} (protocol {})", client.value("name", "unknown"),
                     client.value("version", "?"), protocol);
    }

    initialized_ = true;
    return {
        {"protocolVersion", protocol},
        {"serverInfo", {{"name", kServerName}, {"version", version_}}},
        {"capabilities", {{"tools", {{"list", true}, {"call", true}}}}}
    };
}

json McpServer::handle_list_tools() const {
    json tools = json::array();
    for (const auto& meta : registry_->list_tools()) {
        json schema = json::parse(meta.input_schema, nullptr, false);
        if (schema.is_discarded() || !schema.is_object()) schema = json{{"type", "object"}};
        tools.push_back({{"name", meta.name}, {"description", meta.description}, {"inputSchema", schema}});
    }
    return {{"tools", tools}};
}

json McpServer::handle_call_tool(const json& params) const {
    if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
        throw RpcError(rpc::kInvalidParams, "Invalid tool call parameters: name is required");
    }
    std::string name = params["name"].get<std::string>();
    json args = params.contains("arguments") ? params["arguments"] : json::object();
    if (!args.is_object() && !args.is_null()) {
        throw RpcError(rpc::kInvalidParams, "Invalid tool call parameters: arguments must be an object");
    }

    spdlog::debug("🛠️ Calling tool {}", name);
    ToolResult result = registry_->execute_tool(name, args);

    json out = {{"content", json::array({{{"type", "text"}, {"text", result.text}}})}};
    if (result.is_error) out["isError"] = true;
    return out;
}

}
