#pragma once
#include <memory>
#include "security/PathValidator.hpp"
#include "tools/EditManager.hpp"
#include "tools/ToolRegistry.hpp"

namespace secure_fs {

// Registers every caller-visible tool: the plain filesystem tools, the
// journaled editor tools and list_allowed_directories.
void register_all_tools(ToolRegistry& registry,
                        std::shared_ptr<const PathValidator> validator,
                        std::shared_ptr<EditManager> editor);

}
