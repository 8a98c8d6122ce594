#include "tools/FileSystemTools.hpp"
#include "core/FsError.hpp"
#include "utils/FileIO.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <sstream>
#include <sys/stat.h>

namespace secure_fs {

namespace fs = std::filesystem;

namespace {

// A NUL byte in the first block marks the file as binary.
constexpr std::size_t kTextProbeBytes = 8192;

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string format_time(std::time_t t) {
    struct tm tm_utc;
    gmtime_r(&t, &tm_utc);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm_utc);
    return buf;
}

std::optional<std::size_t> count_text_lines(const fs::path& path) {
    std::ifstream f(path, std::ios::in | std::ios::binary);
    if (!f.is_open()) return std::nullopt;

    std::vector<char> buffer(kTextProbeBytes);
    std::size_t newlines = 0;
    char last = '\n';
    bool probed = false;
    bool empty = true;

    while (f) {
        f.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        std::streamsize got = f.gcount();
        if (got <= 0) break;
        if (!probed) {
            if (std::find(buffer.begin(), buffer.begin() + got, '\0') != buffer.begin() + got) {
                return std::nullopt;
            }
            probed = true;
        }
        empty = false;
        newlines += static_cast<std::size_t>(std::count(buffer.begin(), buffer.begin() + got, '\n'));
        last = buffer[static_cast<std::size_t>(got) - 1];
    }
    if (f.bad()) return std::nullopt;
    if (empty) return 0;
    // Same convention as the editor: a trailing newline does not open a line.
    return last == '\n' ? newlines : newlines + 1;
}

}

std::string FileSystemTools::read_file(const fs::path& path) {
    return read_file_bytes(path);
}

std::string FileSystemTools::read_multiple_files(const PathValidator& validator, const std::vector<std::string>& paths) {
    std::stringstream ss;
    for (std::size_t i = 0; i < paths.size(); ++i) {
        if (i > 0) ss << "\n---\n";
        try {
            fs::path valid = validator.validate(paths[i]);
            ss << paths[i] << ":\n" << read_file_bytes(valid);
        } catch (const FsError& e) {
            ss << paths[i] << ": Error - " << e.what();
        }
    }
    return ss.str();
}

void FileSystemTools::write_file(const fs::path& path, const std::string& content) {
    write_file_bytes(path, content);
    spdlog::info("💾 Wrote {} bytes to {}", content.size(), path.string());
}

void FileSystemTools::create_directory(const fs::path& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) {
        throw FsError(ErrorKind::Io, "failed to create directory: " + ec.message());
    }
    if (!fs::is_directory(path, ec)) {
        throw FsError(ErrorKind::Io, "failed to create directory: " + path.string() + " exists and is not a directory");
    }
}

std::string FileSystemTools::list_directory(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        throw FsError(ErrorKind::NotFound, "directory not found: " + path.string());
    }

    std::vector<std::pair<std::string, bool>> entries;
    fs::directory_iterator it(path, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        throw FsError(ErrorKind::Io, "failed to read directory: " + ec.message());
    }
    for (const auto& entry : it) {
        std::error_code type_ec;
        entries.emplace_back(entry.path().filename().string(), entry.is_directory(type_ec));
    }
    std::sort(entries.begin(), entries.end());

    std::stringstream ss;
    for (std::size_t i = 0; i < entries.size(); ++i) {
        if (i > 0) ss << "\n";
        ss << (entries[i].second ? "[DIR] " : "[FILE] ") << entries[i].first;
    }
    return ss.str();
}

void FileSystemTools::move_file(const fs::path& source, const fs::path& destination) {
    std::error_code ec;
    if (!fs::exists(fs::symlink_status(source, ec))) {
        throw FsError(ErrorKind::NotFound, "source not found: " + source.string());
    }
    if (fs::exists(fs::symlink_status(destination, ec))) {
        throw FsError(ErrorKind::Io, "failed to move file: destination already exists: " + destination.string());
    }
    fs::rename(source, destination, ec);
    if (ec) {
        throw FsError(ErrorKind::Io, "failed to move file: " + ec.message());
    }
    spdlog::info("🚚 Moved {} -> {}", source.string(), destination.string());
}

std::vector<std::string> FileSystemTools::search_files(const PathValidator& validator,
                                                       const fs::path& root,
                                                       const std::string& pattern) {
    std::vector<std::string> results;
    std::string needle = to_lower(pattern);

    std::error_code ec;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        throw FsError(ErrorKind::Io, "failed to search " + root.string() + ": " + ec.message());
    }

    for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            // Unreadable entry; keep walking
            ec.clear();
            continue;
        }
        const fs::path& current = it->path();

        try {
            validator.validate(current.string());
        } catch (const FsError&) {
            std::error_code type_ec;
            if (it->is_directory(type_ec)) it.disable_recursion_pending();
            continue;
        }

        if (to_lower(current.filename().string()).find(needle) != std::string::npos) {
            results.push_back(current.string());
        }
    }
    return results;
}

FileMetadata FileSystemTools::read_metadata(const fs::path& path) {
    FileMetadata meta;
    struct stat st;
    if (::stat(path.c_str(), &st) != 0) {
        if (errno == ENOENT || errno == ENOTDIR) return meta;
        throw FsError(ErrorKind::Io, "failed to get file info: " + path.string() + ": " + std::strerror(errno));
    }

    meta.exists = true;
    meta.size = static_cast<std::uintmax_t>(st.st_size);
    meta.modified = st.st_mtime;
    meta.accessed = st.st_atime;
    meta.is_directory = S_ISDIR(st.st_mode);
    meta.is_file = S_ISREG(st.st_mode);
    meta.permissions = static_cast<unsigned>(st.st_mode & 07777);
    if (meta.is_file) meta.line_count = count_text_lines(path);
    return meta;
}

std::string FileSystemTools::format_metadata(const FileMetadata& meta) {
    if (!meta.exists) return "exists: false";

    char perms[8];
    std::snprintf(perms, sizeof(perms), "%o", meta.permissions);

    std::stringstream ss;
    ss << "exists: true\n"
       << "size: " << meta.size << "\n"
       << "modified: " << format_time(meta.modified) << "\n"
       << "accessed: " << format_time(meta.accessed) << "\n"
       << "isDirectory: " << (meta.is_directory ? "true" : "false") << "\n"
       << "isFile: " << (meta.is_file ? "true" : "false") << "\n"
       << "permissions: " << perms;
    if (meta.line_count) ss << "\nlines: " << *meta.line_count;
    return ss.str();
}

// 🔧 Wrapper Updates
ToolResult ReadFileTool::execute(const nlohmann::json& args) {
    fs::path path = validator_->validate(require_string(args, "path"));
    return ToolResult::ok(FileSystemTools::read_file(path));
}

ToolResult ReadMultipleFilesTool::execute(const nlohmann::json& args) {
    if (!args.contains("paths") || !args["paths"].is_array() || args["paths"].empty()) {
        throw FsError(ErrorKind::InvalidArgument, "paths parameter is required and must not be empty");
    }
    std::vector<std::string> paths;
    for (const auto& p : args["paths"]) {
        if (!p.is_string()) throw FsError(ErrorKind::InvalidArgument, "paths must be an array of strings");
        paths.push_back(p.get<std::string>());
    }
    return ToolResult::ok(FileSystemTools::read_multiple_files(*validator_, paths));
}

ToolResult WriteFileTool::execute(const nlohmann::json& args) {
    std::string requested = require_string(args, "path");
    std::string content = optional_string(args, "content");
    FileSystemTools::write_file(validator_->validate(requested), content);
    return ToolResult::ok("Successfully wrote to " + requested);
}

ToolResult CreateDirectoryTool::execute(const nlohmann::json& args) {
    std::string requested = require_string(args, "path");
    FileSystemTools::create_directory(validator_->validate(requested));
    return ToolResult::ok("Successfully created directory " + requested);
}

ToolResult ListDirectoryTool::execute(const nlohmann::json& args) {
    fs::path path = validator_->validate(require_string(args, "path"));
    return ToolResult::ok(FileSystemTools::list_directory(path));
}

ToolResult MoveFileTool::execute(const nlohmann::json& args) {
    std::string source = require_string(args, "source");
    std::string destination = require_string(args, "destination");
    FileSystemTools::move_file(validator_->validate(source), validator_->validate(destination));
    return ToolResult::ok("Successfully moved " + source + " to " + destination);
}

ToolResult SearchFilesTool::execute(const nlohmann::json& args) {
    fs::path root = validator_->validate(require_string(args, "path"));
    std::string pattern = require_string(args, "pattern");

    auto results = FileSystemTools::search_files(*validator_, root, pattern);
    if (results.empty()) return ToolResult::ok("No matches found");

    std::stringstream ss;
    ss << results.size() << " matches found:";
    for (const auto& r : results) ss << "\n" << r;
    return ToolResult::ok(ss.str());
}

ToolResult GetFileInfoTool::execute(const nlohmann::json& args) {
    fs::path path = validator_->validate(require_string(args, "path"));
    return ToolResult::ok(FileSystemTools::format_metadata(FileSystemTools::read_metadata(path)));
}

}
