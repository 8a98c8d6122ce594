#pragma once
#include <memory>
#include <nlohmann/json.hpp>
#include "tools/EditManager.hpp"
#include "tools/FileSystemTools.hpp"
#include "tools/ToolRegistry.hpp"

namespace secure_fs {

// line_number is either an integer (-1 appends) or a keyword:
// start/begin/beginning, end/append/bottom. Case-insensitive.
InsertPosition decode_insert_position(const nlohmann::json& value);

class EditorTool : public SandboxedTool {
public:
    EditorTool(std::shared_ptr<const PathValidator> validator, std::shared_ptr<EditManager> editor)
        : SandboxedTool(std::move(validator)), editor_(std::move(editor)) {}

protected:
    std::shared_ptr<EditManager> editor_;
};

class StrReplaceTool : public EditorTool {
public:
    using EditorTool::EditorTool;
    ToolMetadata get_metadata() override {
        return {"str_replace",
                "Replace an exact string in a file with another string. old_str must appear exactly once "
                "in the file. A backup is taken before the edit so it can be undone with undo_edit. "
                "Only works within allowed directories.",
                "{\"type\":\"object\",\"properties\":{"
                "\"path\":{\"type\":\"string\",\"description\":\"Path to the file to edit\"},"
                "\"old_str\":{\"type\":\"string\",\"description\":\"The exact string to replace (must appear exactly once)\"},"
                "\"new_str\":{\"type\":\"string\",\"description\":\"Replacement text (empty to delete)\"}},"
                "\"required\":[\"path\",\"old_str\"]}"};
    }
    ToolResult execute(const nlohmann::json& args) override;
};

class InsertTool : public EditorTool {
public:
    using EditorTool::EditorTool;
    ToolMetadata get_metadata() override {
        return {"insert",
                "Insert text as a new line at a zero-based line number (0 = beginning, -1 or 'end' = append). "
                "Keywords 'start'/'beginning' and 'end'/'append' are accepted. A missing file is created "
                "(with parent directories) only for start or end positions. Only works within allowed directories.",
                "{\"type\":\"object\",\"properties\":{"
                "\"path\":{\"type\":\"string\",\"description\":\"Path to the file to edit\"},"
                "\"line_number\":{\"oneOf\":[{\"type\":\"integer\"},"
                "{\"type\":\"string\",\"enum\":[\"start\",\"beginning\",\"end\",\"append\"]}]},"
                "\"text\":{\"type\":\"string\",\"description\":\"Text to insert\"}},"
                "\"required\":[\"path\",\"line_number\",\"text\"]}"};
    }
    ToolResult execute(const nlohmann::json& args) override;
};

class UndoEditTool : public EditorTool {
public:
    using EditorTool::EditorTool;
    ToolMetadata get_metadata() override {
        return {"undo_edit",
                "Undo the last str_replace or insert made to a file. Can be called repeatedly to walk "
                "further back. Only works within allowed directories.",
                "{\"type\":\"object\",\"properties\":{"
                "\"path\":{\"type\":\"string\",\"description\":\"Path to the file to undo edits for\"}},"
                "\"required\":[\"path\"]}"};
    }
    ToolResult execute(const nlohmann::json& args) override;
};

}
