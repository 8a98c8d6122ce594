#include "security/PathValidator.hpp"
#include "core/FsError.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <pwd.h>
#include <unistd.h>

namespace secure_fs {

namespace fs = std::filesystem;

namespace {

// Upper bound on dangling links followed while resolving a missing suffix.
constexpr int kMaxSymlinkHops = 40;

bool is_same_or_descendant(const std::string& root, const std::string& candidate) {
    if (root.empty() || candidate.size() < root.size()) return false;
    if (candidate.compare(0, root.size(), root) != 0) return false;
    if (candidate.size() == root.size()) return true;
    // "/allowed" must not match "/allowed-2"
    return root.back() == '/' || candidate[root.size()] == '/';
}

std::string home_directory() {
    const char* home = std::getenv("HOME");
    if (home && home[0] != '\0') return std::string(home);

    struct passwd pwd;
    struct passwd* result = nullptr;
    char buffer[4096];
    if (getpwuid_r(getuid(), &pwd, buffer, sizeof(buffer), &result) == 0 && result && result->pw_dir) {
        return std::string(result->pw_dir);
    }
    throw FsError(ErrorKind::InvalidPath, "couldn't get home directory");
}

}

PathValidator::PathValidator(const std::vector<std::string>& allowed_dirs, CaseSensitivity policy)
    : policy_(policy) {
    for (const auto& dir : allowed_dirs) {
        if (dir.empty()) continue;

        fs::path root = clean(fs::absolute(fs::path(expand_home(dir))));
        roots_.push_back(root.string());
        root_keys_.push_back(normalize(root));

        std::error_code ec;
        fs::path real = fs::canonical(root, ec);
        if (!ec && real != root) {
            spdlog::debug("Allowed root {} resolves to {}", root.string(), real.string());
            root_keys_.push_back(normalize(real));
        }

        if (policy_ == CaseSensitivity::Insensitive &&
            detect_case_sensitivity(root) == CaseSensitivity::Sensitive) {
            spdlog::warn("⚠️ caseInsensitivePaths is set but {} is on a case-sensitive filesystem; "
                         "differently-cased paths may resolve outside it", root.string());
        }
    }
}

std::optional<CaseSensitivity> PathValidator::detect_case_sensitivity(const fs::path& dir) {
    std::string name = dir.filename().string();
    std::string flipped = name;
    bool changed = false;
    for (auto& c : flipped) {
        unsigned char u = static_cast<unsigned char>(c);
        if (std::islower(u)) {
            c = static_cast<char>(std::toupper(u));
            changed = true;
        } else if (std::isupper(u)) {
            c = static_cast<char>(std::tolower(u));
            changed = true;
        }
    }
    if (!changed) return std::nullopt;

    std::error_code ec;
    fs::path other = dir.parent_path() / flipped;
    if (fs::exists(other, ec) && fs::equivalent(dir, other, ec) && !ec) {
        return CaseSensitivity::Insensitive;
    }
    return CaseSensitivity::Sensitive;
}

fs::path PathValidator::clean(const fs::path& p) {
    fs::path normal = p.lexically_normal();
    if (normal.has_relative_path() && !normal.has_filename()) {
        normal = normal.parent_path();
    }
    return normal;
}

std::string PathValidator::expand_home(const std::string& path) {
    if (path.empty() || path[0] != '~') return path;
    // "~user" forms are left alone
    if (path.size() > 1 && path[1] != '/') return path;

    std::string home = home_directory();
    if (path.size() == 1) return home;
    return (fs::path(home) / path.substr(2)).string();
}

std::string PathValidator::normalize(const fs::path& p) const {
    std::string key = clean(p).string();
    if (policy_ == CaseSensitivity::Insensitive) {
        std::transform(key.begin(), key.end(), key.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    }
    return key;
}

bool PathValidator::is_within_allowed(const fs::path& absolute_path) const {
    std::string key = normalize(absolute_path);
    for (const auto& root : root_keys_) {
        if (is_same_or_descendant(root, key)) return true;
    }
    return false;
}

fs::path PathValidator::resolve_real(const fs::path& absolute) const {
    fs::path ancestor = absolute;
    fs::path suffix;
    int hops = 0;

    while (true) {
        std::error_code ec;
        fs::path real = fs::canonical(ancestor, ec);
        if (!ec) {
            return suffix.empty() ? real : clean(real / suffix);
        }
        if (ec != std::errc::no_such_file_or_directory) {
            // ELOOP, EACCES, ENOTDIR ...
            throw FsError(ErrorKind::InvalidPath,
                          "cannot resolve " + absolute.string() + ": " + ec.message());
        }

        std::error_code link_ec;
        if (fs::is_symlink(fs::symlink_status(ancestor, link_ec))) {
            // Dangling link inside the missing part: continue from its target.
            if (++hops > kMaxSymlinkHops) {
                throw FsError(ErrorKind::InvalidPath,
                              "too many levels of symbolic links: " + absolute.string());
            }
            fs::path target = fs::read_symlink(ancestor, link_ec);
            if (link_ec) {
                throw FsError(ErrorKind::InvalidPath,
                              "cannot read symlink " + ancestor.string() + ": " + link_ec.message());
            }
            if (target.is_relative()) {
                fs::path base = fs::canonical(ancestor.parent_path(), link_ec);
                if (link_ec) {
                    throw FsError(ErrorKind::InvalidPath,
                                  "cannot resolve " + ancestor.parent_path().string() + ": " + link_ec.message());
                }
                target = base / target;
            }
            ancestor = clean(target);
            continue;
        }

        if (!ancestor.has_relative_path()) {
            throw FsError(ErrorKind::InvalidPath, "no existing parent directory for " + absolute.string());
        }
        suffix = suffix.empty() ? ancestor.filename() : ancestor.filename() / suffix;
        ancestor = ancestor.parent_path();
    }
}

fs::path PathValidator::validate(const std::string& requested_path) const {
    if (requested_path.empty()) {
        throw FsError(ErrorKind::InvalidPath, "path must not be empty");
    }

    fs::path absolute(expand_home(requested_path));
    if (!absolute.is_absolute()) {
        std::error_code ec;
        fs::path cwd = fs::current_path(ec);
        if (ec) {
            throw FsError(ErrorKind::InvalidPath, "failed to get current working directory: " + ec.message());
        }
        absolute = cwd / absolute;
    }
    absolute = clean(absolute);

    // Cheap lexical check first
    if (!is_within_allowed(absolute)) {
        spdlog::warn("🚨 SECURITY ALERT: Path escape blocked! Target: {}", absolute.string());
        throw FsError(ErrorKind::AccessDenied,
                      "access denied - path outside allowed directories: " + absolute.string());
    }

    fs::path real = resolve_real(absolute);
    if (!is_within_allowed(real)) {
        spdlog::warn("🚨 SECURITY ALERT: Symlink escape blocked! {} -> {}", absolute.string(), real.string());
        throw FsError(ErrorKind::AccessDenied,
                      "access denied - symlink target outside allowed directories: " + absolute.string());
    }

    spdlog::debug("Validated {} -> {}", requested_path, real.string());
    return real;
}

}
