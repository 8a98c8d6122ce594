#pragma once
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <variant>
#include <vector>

namespace secure_fs {

struct EditRecord {
    std::string file_path;
    std::string backup_path;
    std::chrono::system_clock::time_point timestamp;
    std::uint64_t sequence = 0;
};

// Insert positions, decoded once from the caller's arguments.
struct LineIndex {
    std::size_t value = 0;
};
struct StartOfFile {};
struct EndOfFile {};
using InsertPosition = std::variant<LineIndex, StartOfFile, EndOfFile>;

std::string describe_position(const InsertPosition& position);

// 🛡️ Surgical edits with a journaled pre-image.
// Every replace/insert on an existing file writes a full backup first and
// appends an EditRecord; undo() walks a file's records newest first.
// Paths passed in are expected to be canonical (PathValidator::validate).
class EditManager {
public:
    static constexpr std::size_t kMaxHistory = 100;

    // Empty backup_dir selects <temp>/secure-fs-backups.
    explicit EditManager(const std::string& backup_dir = "");

    EditManager(const EditManager&) = delete;
    EditManager& operator=(const EditManager&) = delete;

    void replace(const std::string& path, const std::string& old_text, const std::string& new_text);

    // Returns the zero-based line the text was placed at.
    std::size_t insert(const std::string& path, const InsertPosition& position, const std::string& text);

    void undo(const std::string& path);

    // Live records for path, oldest first.
    std::vector<EditRecord> history(const std::string& path) const;
    std::size_t history_size() const;

    const std::string& backup_dir() const { return backup_dir_; }

    static std::string default_backup_dir();

private:
    std::string create_backup(const std::string& path, const std::string& content, std::uint64_t sequence);
    void record_edit(const std::string& path, const std::string& backup_path, std::uint64_t sequence);
    void rollback(const std::string& path, const std::string& backup_path);
    std::shared_ptr<std::mutex> lock_for(const std::string& path);

    std::string backup_dir_;

    std::deque<EditRecord> history_;
    mutable std::mutex history_mutex_;

    // Per-path serialization of read-backup-write. Lock order: path, then history.
    std::unordered_map<std::string, std::shared_ptr<std::mutex>> path_locks_;
    std::mutex path_locks_mutex_;

    std::atomic<std::uint64_t> next_sequence_{1};
};

}
