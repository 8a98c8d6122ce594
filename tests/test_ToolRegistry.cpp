#include <gtest/gtest.h>
#include "core/FsError.hpp"
#include "tools/ToolRegistry.hpp"

using namespace secure_fs;
using json = nlohmann::json;

namespace {

std::unique_ptr<ITool> make_tool(const std::string& name, std::function<ToolResult(const json&)> fn) {
    return std::make_unique<GenericTool>(name, "test tool", "{}", std::move(fn));
}

}

TEST(ToolRegistryTest, UnknownToolIsAnErrorResult) {
    ToolRegistry registry;
    auto result = registry.execute_tool("nope", json::object());
    EXPECT_TRUE(result.is_error);
    EXPECT_EQ(result.text, "Error: Unknown tool: nope");
}

TEST(ToolRegistryTest, ListsRegisteredToolsByName) {
    ToolRegistry registry;
    registry.register_tool(make_tool("b", [](const json&) { return ToolResult::ok("b"); }));
    registry.register_tool(make_tool("a", [](const json&) { return ToolResult::ok("a"); }));

    auto tools = registry.list_tools();
    ASSERT_EQ(tools.size(), 2u);
    EXPECT_EQ(tools[0].name, "a");
    EXPECT_EQ(tools[1].name, "b");
    EXPECT_NE(registry.get_tool("a"), nullptr);
    EXPECT_EQ(registry.get_tool("c"), nullptr);
}

TEST(ToolRegistryTest, FsErrorBecomesErrorResult) {
    ToolRegistry registry;
    registry.register_tool(make_tool("deny", [](const json&) -> ToolResult {
        throw FsError(ErrorKind::AccessDenied, "access denied - path outside allowed directories: /etc");
    }));
    auto result = registry.execute_tool("deny", json::object());
    EXPECT_TRUE(result.is_error);
    EXPECT_EQ(result.text, "Error: access denied - path outside allowed directories: /etc");
}

TEST(ToolRegistryTest, StdExceptionBecomesErrorResult) {
    ToolRegistry registry;
    registry.register_tool(make_tool("boom", [](const json&) -> ToolResult {
        throw std::runtime_error("boom");
    }));
    EXPECT_EQ(registry.execute_tool("boom", json::object()).text, "Error: boom");
}

TEST(ToolRegistryTest, NullArgumentsArePassedAsEmptyObject) {
    ToolRegistry registry;
    registry.register_tool(make_tool("echo", [](const json& args) {
        return ToolResult::ok(args.is_object() ? "object" : "other");
    }));
    EXPECT_EQ(registry.execute_tool("echo", nullptr).text, "object");
}

TEST(ArgumentHelpersTest, RequireAndOptionalString) {
    json args = {{"path", "/x"}, {"empty", ""}, {"num", 3}};
    EXPECT_EQ(require_string(args, "path"), "/x");
    EXPECT_THROW(require_string(args, "empty"), FsError);
    EXPECT_THROW(require_string(args, "num"), FsError);
    EXPECT_THROW(require_string(args, "missing"), FsError);

    EXPECT_EQ(optional_string(args, "missing"), "");
    EXPECT_EQ(optional_string(args, "empty"), "");
    EXPECT_THROW(optional_string(args, "num"), FsError);
}
