#include "tools/ToolCatalog.hpp"
#include "tools/EditorTools.hpp"
#include "tools/FileSystemTools.hpp"
#include <spdlog/spdlog.h>

namespace secure_fs {

void register_all_tools(ToolRegistry& registry,
                        std::shared_ptr<const PathValidator> validator,
                        std::shared_ptr<EditManager> editor) {
    registry.register_tool(std::make_unique<ReadFileTool>(validator));
    registry.register_tool(std::make_unique<ReadMultipleFilesTool>(validator));
    registry.register_tool(std::make_unique<WriteFileTool>(validator));
    registry.register_tool(std::make_unique<CreateDirectoryTool>(validator));
    registry.register_tool(std::make_unique<ListDirectoryTool>(validator));
    registry.register_tool(std::make_unique<MoveFileTool>(validator));
    registry.register_tool(std::make_unique<SearchFilesTool>(validator));
    registry.register_tool(std::make_unique<GetFileInfoTool>(validator));

    registry.register_tool(std::make_unique<StrReplaceTool>(validator, editor));
    registry.register_tool(std::make_unique<InsertTool>(validator, editor));
    registry.register_tool(std::make_unique<UndoEditTool>(validator, editor));

    registry.register_tool(std::make_unique<GenericTool>(
        "list_allowed_directories",
        "Returns the list of directories this server is allowed to access.",
        "{\"type\":\"object\",\"properties\":{},\"required\":[]}",
        [validator](const nlohmann::json&) {
            std::string text = "Allowed directories:";
            for (const auto& root : validator->allowed_roots()) text += "\n" + root;
            return ToolResult::ok(text);
        }
    ));

    spdlog::debug("Registered {} tools", registry.list_tools().size());
}

}
