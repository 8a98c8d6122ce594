#include <gtest/gtest.h>
#include <sstream>
#include <vector>
#include "mcp/StdioTransport.hpp"

using namespace secure_fs;

TEST(StdioTransportTest, OneResponseLinePerRequest) {
    std::istringstream in("first\n\n   \r\nsecond\r\nquiet\nthird");
    std::ostringstream out;
    std::vector<std::string> seen;

    StdioTransport transport(in, out);
    transport.run([&](const std::string& msg) -> std::optional<std::string> {
        seen.push_back(msg);
        if (msg == "quiet") return std::nullopt;
        return "echo:" + msg;
    });

    EXPECT_EQ(seen, (std::vector<std::string>{"first", "second", "quiet", "third"}));
    EXPECT_EQ(out.str(), "echo:first\necho:second\necho:third\n");
}

TEST(StdioTransportTest, StopEndsTheLoop) {
    std::istringstream in("a\nb\nc\n");
    std::ostringstream out;
    StdioTransport transport(in, out);

    int handled = 0;
    transport.run([&](const std::string&) -> std::optional<std::string> {
        if (++handled == 2) transport.stop();
        return std::string("ok");
    });

    EXPECT_EQ(handled, 2);
    EXPECT_EQ(out.str(), "ok\nok\n");
}
