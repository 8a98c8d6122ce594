#pragma once
#include <cstdint>
#include <ctime>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "tools/ToolRegistry.hpp"
#include "security/PathValidator.hpp"

namespace secure_fs {

struct FileMetadata {
    bool exists = false;
    std::uintmax_t size = 0;
    std::time_t modified = 0;
    std::time_t accessed = 0;
    bool is_directory = false;
    bool is_file = false;
    unsigned permissions = 0; // st_mode & 07777
    std::optional<std::size_t> line_count; // text files only
};

// Plain, non-journaled operations. Paths are canonical unless a validator is
// passed in, in which case the function validates each path itself.
class FileSystemTools {
public:
    static std::string read_file(const std::filesystem::path& path);

    // Per-path failures are reported inline and never abort the batch.
    static std::string read_multiple_files(const PathValidator& validator, const std::vector<std::string>& paths);

    static void write_file(const std::filesystem::path& path, const std::string& content);
    static void create_directory(const std::filesystem::path& path);

    // "[DIR] name" / "[FILE] name", sorted by name.
    static std::string list_directory(const std::filesystem::path& path);

    static void move_file(const std::filesystem::path& source, const std::filesystem::path& destination);

    // Case-insensitive substring match on entry names below root.
    static std::vector<std::string> search_files(const PathValidator& validator,
                                                 const std::filesystem::path& root,
                                                 const std::string& pattern);

    static FileMetadata read_metadata(const std::filesystem::path& path);
    static std::string format_metadata(const FileMetadata& meta);
};

class SandboxedTool : public ITool {
public:
    explicit SandboxedTool(std::shared_ptr<const PathValidator> validator)
        : validator_(std::move(validator)) {}

protected:
    std::shared_ptr<const PathValidator> validator_;
};

// 🔧 Tool Registry Wrappers
class ReadFileTool : public SandboxedTool {
public:
    using SandboxedTool::SandboxedTool;
    ToolMetadata get_metadata() override {
        return {"read_file",
                "Read the complete contents of a file. Only works within allowed directories.",
                "{\"type\":\"object\",\"properties\":{\"path\":{\"type\":\"string\"}},\"required\":[\"path\"]}"};
    }
    ToolResult execute(const nlohmann::json& args) override;
};

class ReadMultipleFilesTool : public SandboxedTool {
public:
    using SandboxedTool::SandboxedTool;
    ToolMetadata get_metadata() override {
        return {"read_multiple_files",
                "Read several files at once. Each file's content is prefixed with its path; "
                "a failed read does not stop the others. Only works within allowed directories.",
                "{\"type\":\"object\",\"properties\":{\"paths\":{\"type\":\"array\",\"items\":{\"type\":\"string\"}}},\"required\":[\"paths\"]}"};
    }
    ToolResult execute(const nlohmann::json& args) override;
};

class WriteFileTool : public SandboxedTool {
public:
    using SandboxedTool::SandboxedTool;
    ToolMetadata get_metadata() override {
        return {"write_file",
                "Create a new file or overwrite an existing one. Not undoable; prefer str_replace "
                "or insert for edits. Only works within allowed directories.",
                "{\"type\":\"object\",\"properties\":{\"path\":{\"type\":\"string\"},\"content\":{\"type\":\"string\"}},\"required\":[\"path\",\"content\"]}"};
    }
    ToolResult execute(const nlohmann::json& args) override;
};

class CreateDirectoryTool : public SandboxedTool {
public:
    using SandboxedTool::SandboxedTool;
    ToolMetadata get_metadata() override {
        return {"create_directory",
                "Create a directory, including missing parents. Succeeds silently if it already exists.",
                "{\"type\":\"object\",\"properties\":{\"path\":{\"type\":\"string\"}},\"required\":[\"path\"]}"};
    }
    ToolResult execute(const nlohmann::json& args) override;
};

class ListDirectoryTool : public SandboxedTool {
public:
    using SandboxedTool::SandboxedTool;
    ToolMetadata get_metadata() override {
        return {"list_directory",
                "List a directory. Entries are prefixed with [DIR] or [FILE].",
                "{\"type\":\"object\",\"properties\":{\"path\":{\"type\":\"string\"}},\"required\":[\"path\"]}"};
    }
    ToolResult execute(const nlohmann::json& args) override;
};

class MoveFileTool : public SandboxedTool {
public:
    using SandboxedTool::SandboxedTool;
    ToolMetadata get_metadata() override {
        return {"move_file",
                "Move or rename a file or directory. Fails if the destination exists. "
                "Both paths must be within allowed directories.",
                "{\"type\":\"object\",\"properties\":{\"source\":{\"type\":\"string\"},\"destination\":{\"type\":\"string\"}},\"required\":[\"source\",\"destination\"]}"};
    }
    ToolResult execute(const nlohmann::json& args) override;
};

class SearchFilesTool : public SandboxedTool {
public:
    using SandboxedTool::SandboxedTool;
    ToolMetadata get_metadata() override {
        return {"search_files",
                "Recursively search for files and directories whose name contains pattern "
                "(case-insensitive). Returns full paths.",
                "{\"type\":\"object\",\"properties\":{\"path\":{\"type\":\"string\"},\"pattern\":{\"type\":\"string\"}},\"required\":[\"path\",\"pattern\"]}"};
    }
    ToolResult execute(const nlohmann::json& args) override;
};

class GetFileInfoTool : public SandboxedTool {
public:
    using SandboxedTool::SandboxedTool;
    ToolMetadata get_metadata() override {
        return {"get_file_info",
                "Size, timestamps, type, permissions and (for text files) line count of a path.",
                "{\"type\":\"object\",\"properties\":{\"path\":{\"type\":\"string\"}},\"required\":[\"path\"]}"};
    }
    ToolResult execute(const nlohmann::json& args) override;
};

}
