#pragma once
#include <functional>
#include <map>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include "core/FsError.hpp"

namespace secure_fs {

struct ToolMetadata {
    std::string name;
    std::string description;
    std::string input_schema; // JSON Schema, serialized
};

struct ToolResult {
    std::string text;
    bool is_error = false;

    static ToolResult ok(const std::string& text) { return {text, false}; }
    static ToolResult error(const std::string& message) { return {"Error: " + message, true}; }
};

class ITool {
public:
    virtual ~ITool() = default;
    virtual ToolMetadata get_metadata() = 0;
    virtual ToolResult execute(const nlohmann::json& args) = 0;
};

// Wraps a lambda as a tool, for tools with no state of their own.
class GenericTool : public ITool {
public:
    GenericTool(std::string name, std::string description, std::string schema,
                std::function<ToolResult(const nlohmann::json&)> fn)
        : meta_{std::move(name), std::move(description), std::move(schema)}, fn_(std::move(fn)) {}

    ToolMetadata get_metadata() override { return meta_; }
    ToolResult execute(const nlohmann::json& args) override { return fn_(args); }

private:
    ToolMetadata meta_;
    std::function<ToolResult(const nlohmann::json&)> fn_;
};

// --- Argument decoding helpers ---

inline std::string require_string(const nlohmann::json& args, const std::string& key) {
    if (!args.is_object() || !args.contains(key) || !args[key].is_string()) {
        throw FsError(ErrorKind::InvalidArgument, key + " parameter is required");
    }
    std::string value = args[key].get<std::string>();
    if (value.empty()) {
        throw FsError(ErrorKind::InvalidArgument, key + " parameter is required");
    }
    return value;
}

inline std::string optional_string(const nlohmann::json& args, const std::string& key) {
    if (!args.is_object() || !args.contains(key) || args[key].is_null()) return "";
    if (!args[key].is_string()) {
        throw FsError(ErrorKind::InvalidArgument, key + " must be a string");
    }
    return args[key].get<std::string>();
}

class ToolRegistry {
public:
    void register_tool(std::unique_ptr<ITool> tool) {
        std::unique_lock lock(mutex_);
        std::string name = tool->get_metadata().name;
        tools_[name] = std::move(tool);
    }

    ITool* get_tool(const std::string& name) const {
        std::shared_lock lock(mutex_);
        auto it = tools_.find(name);
        return it == tools_.end() ? nullptr : it->second.get();
    }

    std::vector<ToolMetadata> list_tools() const {
        std::shared_lock lock(mutex_);
        std::vector<ToolMetadata> out;
        for (const auto& entry : tools_) out.push_back(entry.second->get_metadata());
        return out;
    }

    // Never throws: every failure becomes an error result for the caller.
    ToolResult execute_tool(const std::string& name, const nlohmann::json& args) const {
        ITool* tool = get_tool(name);
        if (!tool) return ToolResult::error("Unknown tool: " + name);

        try {
            return tool->execute(args.is_null() ? nlohmann::json::object() : args);
        } catch (const FsError& e) {
            if (e.kind() == ErrorKind::Io) {
                spdlog::error("💥 {} failed: {}", name, e.what());
            } else {
                spdlog::debug("{} rejected ({}): {}", name, error_kind_name(e.kind()), e.what());
            }
            return ToolResult::error(e.what());
        } catch (const nlohmann::json::exception& e) {
            return ToolResult::error(std::string("invalid arguments for ") + name + ": " + e.what());
        } catch (const std::exception& e) {
            spdlog::error("🔥 Tool Exception in {}: {}", name, e.what());
            return ToolResult::error(e.what());
        }
    }

private:
    std::map<std::string, std::unique_ptr<ITool>> tools_;
    mutable std::shared_mutex mutex_;
};

}
