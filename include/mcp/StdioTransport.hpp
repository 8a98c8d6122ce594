#pragma once
#include <atomic>
#include <iostream>
#include "mcp/Transport.hpp"

namespace secure_fs {

// Newline-delimited JSON over a pair of streams (stdin/stdout by default).
// stdout carries protocol traffic only; logging goes to stderr.
class StdioTransport : public Transport {
public:
    StdioTransport(std::istream& in = std::cin, std::ostream& out = std::cout) : in_(in), out_(out) {}

    void run(const MessageHandler& handler) override;
    void stop() override { running_ = false; }

private:
    std::istream& in_;
    std::ostream& out_;
    std::atomic<bool> running_{false};
};

}
