#pragma once
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace secure_fs {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct NetworkConfig {
    bool enabled = false;
    std::string host = "localhost";
    int port = 3002;
    std::vector<std::string> allowed_ips;
    std::vector<std::string> allowed_subnets;
};

struct ServerConfig {
    static constexpr const char* kFileName = "config.json";

    std::vector<std::string> allowed_directories; // absolute, existing directories
    std::string backup_directory;                 // empty = EditManager default
    bool case_insensitive_paths = false;
    std::string log_level = "info";
    NetworkConfig network;

    std::string source_path; // file the config was read from

    // Parses and validates. Throws ConfigError.
    static ServerConfig from_json(const nlohmann::json& j);
    static ServerConfig load_file(const std::string& path);

    // Lookup order: explicit path, config.json beside the executable,
    // config.json in the working directory. When nothing is found a default
    // file is written beside the executable and ConfigError is thrown.
    static ServerConfig load(const std::optional<std::string>& explicit_path);

    static nlohmann::json default_json(const std::string& allowed_dir);
    static std::string executable_dir();
};

}
