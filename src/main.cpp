#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <signal.h>

#include "config/ServerConfig.hpp"
#include "mcp/McpServer.hpp"
#include "mcp/NetworkTransport.hpp"
#include "mcp/StdioTransport.hpp"
#include "security/PathValidator.hpp"
#include "tools/EditManager.hpp"
#include "tools/ToolCatalog.hpp"
#include "tools/ToolRegistry.hpp"

#ifndef SECURE_FS_VERSION
#define SECURE_FS_VERSION "dev"
#endif

secure_fs::Transport* global_transport_ptr = nullptr;

void signal_handler(int signum) {
    spdlog::info("🛑 Interrupt signal ({}) received. Shutting down...", signum);
    if (global_transport_ptr) {
        global_transport_ptr->stop();
    }
}

class SecureFilesystemServer {
public:
    explicit SecureFilesystemServer(const secure_fs::ServerConfig& config) : config_(config) {
        auto policy = config_.case_insensitive_paths ? secure_fs::CaseSensitivity::Insensitive
                                                     : secure_fs::CaseSensitivity::Sensitive;
        validator_ = std::make_shared<const secure_fs::PathValidator>(config_.allowed_directories, policy);
        edit_manager_ = std::make_shared<secure_fs::EditManager>(config_.backup_directory);
        tool_registry_ = std::make_shared<secure_fs::ToolRegistry>();

        secure_fs::register_all_tools(*tool_registry_, validator_, edit_manager_);
        server_ = std::make_unique<secure_fs::McpServer>(tool_registry_, SECURE_FS_VERSION);

        if (config_.network.enabled) {
            secure_fs::NetworkOptions options{config_.network.host, config_.network.port};
            secure_fs::IpFilter filter(config_.network.allowed_ips, config_.network.allowed_subnets);
            transport_ = std::make_unique<secure_fs::NetworkTransport>(options, filter);
        } else {
            transport_ = std::make_unique<secure_fs::StdioTransport>();
        }
    }

    void run() {
        spdlog::info("🚀 Secure MCP Filesystem Server v{} starting in {} mode", SECURE_FS_VERSION,
                     config_.network.enabled ? "NETWORK" : "STDIO");
        for (const auto& dir : validator_->allowed_roots()) {
            spdlog::info("📂 Allowed directory: {}", dir);
        }
        spdlog::info("🗄️ Edit backup directory: {}", edit_manager_->backup_dir());

        global_transport_ptr = transport_.get();
        transport_->run([this](const std::string& message) { return server_->handle_request(message); });
        global_transport_ptr = nullptr;
    }

private:
    secure_fs::ServerConfig config_;
    std::shared_ptr<const secure_fs::PathValidator> validator_;
    std::shared_ptr<secure_fs::EditManager> edit_manager_;
    std::shared_ptr<secure_fs::ToolRegistry> tool_registry_;
    std::unique_ptr<secure_fs::McpServer> server_;
    std::unique_ptr<secure_fs::Transport> transport_;
};

void print_usage() {
    std::cout << "Usage: secure_fs_server [--config <path>] [--version] [--help]\n\n"
              << "Secure MCP Filesystem Server\n"
              << "Provides sandboxed filesystem access via Model Context Protocol\n\n"
              << "Options:\n"
              << "  --config <path>  Read configuration from <path>\n"
              << "  --version        Show version information\n"
              << "  --help           Show this help message\n";
}

void setup_logging() {
    // stdout belongs to the stdio transport
    auto logger = spdlog::stderr_color_mt("secure_fs");
    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");
}

int main(int argc, char** argv) {
    std::optional<std::string> config_path;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--version") {
            std::cout << "secure_fs_server version " << SECURE_FS_VERSION << "\n";
            return 0;
        }
        if (arg == "--help") {
            print_usage();
            return 0;
        }
        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
            continue;
        }
        std::cerr << "Unknown argument: " << arg << "\n";
        print_usage();
        return 2;
    }

    setup_logging();

    // No SA_RESTART, so a blocking read on stdin is interrupted too.
    struct sigaction sa {};
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    try {
        secure_fs::ServerConfig config = secure_fs::ServerConfig::load(config_path);
        spdlog::set_level(spdlog::level::from_str(config.log_level));

        SecureFilesystemServer app(config);
        app.run(); // This blocks
    } catch (const secure_fs::ConfigError& e) {
        spdlog::critical("🚨 Error loading configuration: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::critical("💥 Fatal: {}", e.what());
        return 1;
    }

    spdlog::info("👋 Server stopped");
    return 0;
}
