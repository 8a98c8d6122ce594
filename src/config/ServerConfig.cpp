#include "config/ServerConfig.hpp"
#include "mcp/IpFilter.hpp"
#include "security/PathValidator.hpp"
#include "core/FsError.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>

namespace secure_fs {

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

const std::vector<std::string> kLogLevels = {"trace", "debug", "info", "warn", "error", "critical", "off"};

std::vector<std::string> string_list(const json& j, const std::string& key) {
    std::vector<std::string> out;
    if (!j.contains(key) || j[key].is_null()) return out;
    if (!j[key].is_array()) throw ConfigError(key + " must be an array of strings");
    for (const auto& item : j[key]) {
        if (!item.is_string()) throw ConfigError(key + " must be an array of strings");
        out.push_back(item.get<std::string>());
    }
    return out;
}

std::string absolute_of(const std::string& dir) {
    std::string expanded;
    try {
        expanded = PathValidator::expand_home(dir);
    } catch (const FsError& e) {
        throw ConfigError("error resolving path " + dir + ": " + e.what());
    }
    std::error_code ec;
    fs::path abs = fs::absolute(expanded, ec);
    if (ec) throw ConfigError("error resolving path " + dir + ": " + ec.message());
    fs::path normal = abs.lexically_normal();
    if (normal.has_relative_path() && !normal.has_filename()) normal = normal.parent_path();
    return normal.string();
}

}

ServerConfig ServerConfig::from_json(const json& j) {
    if (!j.is_object()) throw ConfigError("config must be a JSON object");

    ServerConfig cfg;
    try {
        for (const auto& dir : string_list(j, "allowedDirectories")) {
            std::string abs = absolute_of(dir);
            std::error_code ec;
            if (!fs::exists(abs, ec)) throw ConfigError("error accessing directory " + abs + ": no such directory");
            if (!fs::is_directory(abs, ec)) throw ConfigError("error: " + abs + " is not a directory");
            cfg.allowed_directories.push_back(abs);
        }
        if (cfg.allowed_directories.empty()) {
            throw ConfigError("at least one allowed directory must be specified in config.json");
        }

        std::string backup = j.value("backupDirectory", "");
        cfg.backup_directory = backup.empty() ? "" : absolute_of(backup);
        cfg.case_insensitive_paths = j.value("caseInsensitivePaths", false);

        cfg.log_level = j.value("logLevel", "info");
        std::transform(cfg.log_level.begin(), cfg.log_level.end(), cfg.log_level.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (std::find(kLogLevels.begin(), kLogLevels.end(), cfg.log_level) == kLogLevels.end()) {
            throw ConfigError("invalid logLevel: " + cfg.log_level);
        }

        if (j.contains("network") && j["network"].is_object()) {
            const json& n = j["network"];
            cfg.network.enabled = n.value("enabled", false);
            cfg.network.host = n.value("host", "");
            cfg.network.port = n.value("port", 0);
            cfg.network.allowed_ips = string_list(n, "allowedIPs");
            cfg.network.allowed_subnets = string_list(n, "allowedSubnets");
        }
    } catch (const json::exception& e) {
        throw ConfigError(std::string("invalid config value: ") + e.what());
    }

    if (cfg.network.host.empty()) cfg.network.host = "localhost";
    if (cfg.network.port == 0) cfg.network.port = 3002;
    if (cfg.network.port < 0 || cfg.network.port > 65535) {
        throw ConfigError("invalid network port " + std::to_string(cfg.network.port));
    }

    try {
        IpFilter probe(cfg.network.allowed_ips, cfg.network.allowed_subnets);
    } catch (const std::invalid_argument& e) {
        throw ConfigError(e.what());
    }
    return cfg;
}

ServerConfig ServerConfig::load_file(const std::string& path) {
    std::ifstream f(path);
    if (!f.is_open()) throw ConfigError("failed to read config file: " + path);

    json j = json::parse(f, nullptr, false);
    if (j.is_discarded()) throw ConfigError("failed to parse config file: " + path);

    ServerConfig cfg = from_json(j);
    cfg.source_path = path;
    return cfg;
}

json ServerConfig::default_json(const std::string& allowed_dir) {
    return {
        {"allowedDirectories", json::array({allowed_dir})},
        {"backupDirectory", ""},
        {"caseInsensitivePaths", false},
        {"logLevel", "info"},
        {"network", {
            {"enabled", false},
            {"host", "localhost"},
            {"port", 3002},
            {"allowedIPs", json::array()},
            {"allowedSubnets", json::array()}
        }}
    };
}

std::string ServerConfig::executable_dir() {
    std::error_code ec;
    fs::path exe = fs::read_symlink("/proc/self/exe", ec);
    if (ec) return "";
    return exe.parent_path().string();
}

ServerConfig ServerConfig::load(const std::optional<std::string>& explicit_path) {
    if (explicit_path) {
        spdlog::info("📄 Reading config from {}", *explicit_path);
        return load_file(*explicit_path);
    }

    std::vector<fs::path> candidates;
    std::string exe_dir = executable_dir();
    if (!exe_dir.empty()) candidates.push_back(fs::path(exe_dir) / kFileName);

    std::error_code ec;
    fs::path cwd = fs::current_path(ec);
    bool have_cwd = !ec;
    if (have_cwd) candidates.push_back(cwd / kFileName);

    for (const auto& candidate : candidates) {
        spdlog::debug("Looking for config file at: {}", candidate.string());
        if (fs::is_regular_file(candidate, ec)) {
            spdlog::info("📄 Reading config from {}", candidate.string());
            return load_file(candidate.string());
        }
    }

    fs::path target = exe_dir.empty() ? fs::path(kFileName) : fs::path(exe_dir) / kFileName;
    std::ofstream out(target);
    if (!out.is_open()) {
        throw ConfigError("no config file found and failed to write a default one at " + target.string());
    }
    out << default_json(have_cwd ? cwd.string() : "/path/to/allowed/directory").dump(2) << "\n";
    out.close();
    throw ConfigError("created default config file at " + target.string() +
                      ". Please edit this file to add your allowed directories");
}

}
