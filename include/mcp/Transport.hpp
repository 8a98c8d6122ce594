#pragma once
#include <functional>
#include <optional>
#include <string>

namespace secure_fs {

// One message in, an optional response out (none for notifications).
using MessageHandler = std::function<std::optional<std::string>(const std::string&)>;

class Transport {
public:
    virtual ~Transport() = default;

    // Blocks until the peer goes away or stop() is called.
    virtual void run(const MessageHandler& handler) = 0;
    virtual void stop() = 0;
};

}
