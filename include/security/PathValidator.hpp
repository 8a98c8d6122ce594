#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace secure_fs {

// Case folding is a configuration choice, never derived from the build target.
enum class CaseSensitivity {
    Sensitive,
    Insensitive
};

// 🛡️ SECURITY SANDBOX
// Decides whether a requested path is confined to one of the allowed roots.
// Immutable after construction, so validate() is safe from any thread.
class PathValidator {
public:
    explicit PathValidator(const std::vector<std::string>& allowed_dirs,
                           CaseSensitivity policy = CaseSensitivity::Sensitive);

    // Returns the canonical path for requested_path.
    // Throws FsError(AccessDenied) when it escapes every allowed root and
    // FsError(InvalidPath) when it cannot be resolved at all.
    std::filesystem::path validate(const std::string& requested_path) const;

    // Segment-wise containment test of an absolute, cleaned path.
    bool is_within_allowed(const std::filesystem::path& absolute_path) const;

    const std::vector<std::string>& allowed_roots() const { return roots_; }
    CaseSensitivity case_policy() const { return policy_; }

    static std::string expand_home(const std::string& path);

    // Looks up an existing directory under its case-flipped name. Nullopt when
    // the name has no letters to flip.
    static std::optional<CaseSensitivity> detect_case_sensitivity(const std::filesystem::path& dir);

    // lexically_normal() without the trailing separator it keeps for "a/b/".
    static std::filesystem::path clean(const std::filesystem::path& p);

private:
    std::string normalize(const std::filesystem::path& p) const;
    std::filesystem::path resolve_real(const std::filesystem::path& absolute) const;

    std::vector<std::string> roots_;
    // Normalized comparison keys: the configured form of every root plus its
    // symlink-resolved form when the two differ.
    std::vector<std::string> root_keys_;
    CaseSensitivity policy_;
};

}
