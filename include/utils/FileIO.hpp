#pragma once
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include "core/FsError.hpp"

namespace secure_fs {

// Whole-file read. NotFound when nothing exists at path, Io for the rest.
inline std::string read_file_bytes(const std::filesystem::path& path) {
    std::error_code ec;
    auto status = std::filesystem::status(path, ec);
    if (!std::filesystem::exists(status)) {
        throw FsError(ErrorKind::NotFound, "file not found: " + path.string());
    }
    if (std::filesystem::is_directory(status)) {
        throw FsError(ErrorKind::Io, "failed to read file: " + path.string() + " is a directory");
    }

    std::ifstream f(path, std::ios::in | std::ios::binary);
    if (!f.is_open()) {
        throw FsError(ErrorKind::Io, "failed to read file: " + path.string() + ": " + std::strerror(errno));
    }
    std::stringstream buffer;
    buffer << f.rdbuf();
    if (f.bad()) {
        throw FsError(ErrorKind::Io, "failed to read file: " + path.string());
    }
    return buffer.str();
}

// Create or truncate. Existing permission bits are kept.
inline void write_file_bytes(const std::filesystem::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw FsError(ErrorKind::Io, "failed to write file: " + path.string() + ": " + std::strerror(errno));
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    out.flush();
    if (!out) {
        throw FsError(ErrorKind::Io, "failed to write file: " + path.string());
    }
}

}
