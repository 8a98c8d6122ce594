#include "mcp/StdioTransport.hpp"
#include <spdlog/spdlog.h>
#include <string>

namespace secure_fs {

void StdioTransport::run(const MessageHandler& handler) {
    running_ = true;
    spdlog::info("📡 Listening on stdio");

    std::string line;
    while (running_ && std::getline(in_, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.find_first_not_of(" \t") == std::string::npos) continue;

        spdlog::debug("Received message ({} bytes)", line.size());
        std::optional<std::string> response = handler(line);
        if (!response) continue;

        out_ << *response << '\n';
        out_.flush();
        if (!out_) {
            spdlog::error("💥 Failed to write response to stdout");
            break;
        }
    }

    if (in_.eof()) {
        spdlog::info("🛑 stdin closed, shutting down");
    }
    running_ = false;
}

}
