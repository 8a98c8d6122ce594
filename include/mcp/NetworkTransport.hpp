#pragma once
#include <atomic>
#include <string>
#include <httplib.h>
#include "mcp/IpFilter.hpp"
#include "mcp/Transport.hpp"

namespace secure_fs {

struct NetworkOptions {
    std::string host = "localhost";
    int port = 3002;
};

// 🌐 JSON-RPC over HTTP: one message per POST body on /mcp (or /).
// Clients outside the IpFilter get 403 before any route runs.
class NetworkTransport : public Transport {
public:
    NetworkTransport(NetworkOptions options, IpFilter filter);

    // Throws std::runtime_error when the listener cannot bind.
    void run(const MessageHandler& handler) override;
    void stop() override;

private:
    void setup_routes(const MessageHandler& handler);

    NetworkOptions options_;
    IpFilter filter_;
    httplib::Server server_;
    std::atomic<bool> stopping_{false};
};

}
