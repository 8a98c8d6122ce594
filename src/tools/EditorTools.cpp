#include "tools/EditorTools.hpp"
#include "core/FsError.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <spdlog/spdlog.h>

namespace secure_fs {

namespace fs = std::filesystem;

InsertPosition decode_insert_position(const nlohmann::json& value) {
    if (value.is_number_float()) {
        double d = value.get<double>();
        if (!std::isfinite(d) || std::floor(d) != d) {
            throw FsError(ErrorKind::InvalidArgument, "line_number must be a whole number, got " + value.dump());
        }
        if (std::fabs(d) > 1e15) {
            throw FsError(ErrorKind::OutOfRange, "invalid line number " + value.dump());
        }
    }

    if (value.is_number()) {
        long long n = value.get<long long>();
        if (n == -1) return EndOfFile{};
        if (n < 0) {
            throw FsError(ErrorKind::OutOfRange,
                          "invalid line number " + std::to_string(n) + " (use 0 for beginning, -1 to append)");
        }
        return LineIndex{static_cast<std::size_t>(n)};
    }

    if (value.is_string()) {
        std::string keyword = value.get<std::string>();
        std::transform(keyword.begin(), keyword.end(), keyword.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (keyword == "start" || keyword == "begin" || keyword == "beginning") return StartOfFile{};
        if (keyword == "end" || keyword == "append" || keyword == "bottom") return EndOfFile{};
        throw FsError(ErrorKind::InvalidArgument,
                      "invalid line_number keyword: \"" + value.get<std::string>() +
                      "\" (use 'start', 'end', 'append', or integer)");
    }

    throw FsError(ErrorKind::InvalidArgument, "line_number must be an integer or keyword ('start'/'end'/'append')");
}

ToolResult StrReplaceTool::execute(const nlohmann::json& args) {
    std::string requested = require_string(args, "path");
    std::string old_str = require_string(args, "old_str");
    std::string new_str = optional_string(args, "new_str");

    fs::path path = validator_->validate(requested);
    editor_->replace(path.string(), old_str, new_str);
    return ToolResult::ok("Successfully replaced text in " + requested);
}

ToolResult InsertTool::execute(const nlohmann::json& args) {
    std::string requested = require_string(args, "path");
    std::string text = require_string(args, "text");
    if (!args.contains("line_number")) {
        throw FsError(ErrorKind::InvalidArgument, "line_number parameter is required");
    }
    InsertPosition position = decode_insert_position(args["line_number"]);

    fs::path path = validator_->validate(requested);
    std::size_t line = editor_->insert(path.string(), position, text);
    return ToolResult::ok("Successfully inserted text at line " + std::to_string(line) + " in " + requested);
}

ToolResult UndoEditTool::execute(const nlohmann::json& args) {
    std::string requested = require_string(args, "path");
    fs::path path = validator_->validate(requested);
    editor_->undo(path.string());
    return ToolResult::ok("Successfully undid last edit to " + requested);
}

}
