#include "tools/EditManager.hpp"
#include "core/FsError.hpp"
#include "utils/FileIO.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <filesystem>
#include <iterator>

namespace secure_fs {

namespace fs = std::filesystem;

namespace {

// Unused per-path mutexes are swept once the table grows past this.
constexpr std::size_t kPathLockSweepThreshold = 256;

std::size_t count_occurrences(const std::string& haystack, const std::string& needle) {
    std::size_t count = 0;
    for (std::size_t pos = haystack.find(needle); pos != std::string::npos;
         pos = haystack.find(needle, pos + needle.size())) {
        ++count;
    }
    return count;
}

// A trailing '\n' ends the last line instead of opening an empty one.
std::vector<std::string> split_lines(const std::string& content) {
    std::vector<std::string> lines;
    std::size_t start = 0;
    while (start < content.size()) {
        std::size_t nl = content.find('\n', start);
        if (nl == std::string::npos) {
            lines.push_back(content.substr(start));
            break;
        }
        lines.push_back(content.substr(start, nl - start));
        start = nl + 1;
    }
    return lines;
}

// No delimiter after the last line.
std::string join_lines(const std::vector<std::string>& lines) {
    std::string out;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) out += '\n';
        out += lines[i];
    }
    return out;
}

bool creates_at_edge(const InsertPosition& position) {
    if (std::holds_alternative<LineIndex>(position)) {
        return std::get<LineIndex>(position).value == 0;
    }
    return true;
}

}

std::string describe_position(const InsertPosition& position) {
    if (std::holds_alternative<StartOfFile>(position)) return "start";
    if (std::holds_alternative<EndOfFile>(position)) return "end";
    return "line " + std::to_string(std::get<LineIndex>(position).value);
}

std::string EditManager::default_backup_dir() {
    std::error_code ec;
    fs::path tmp = fs::temp_directory_path(ec);
    if (ec) tmp = "/tmp";
    return (tmp / "secure-fs-backups").string();
}

EditManager::EditManager(const std::string& backup_dir)
    : backup_dir_(backup_dir.empty() ? default_backup_dir() : backup_dir) {
    std::error_code ec;
    fs::create_directories(backup_dir_, ec);
    if (ec) {
        throw FsError(ErrorKind::Io, "failed to create backup directory " + backup_dir_ + ": " + ec.message());
    }
}

std::shared_ptr<std::mutex> EditManager::lock_for(const std::string& path) {
    std::lock_guard<std::mutex> lock(path_locks_mutex_);
    if (path_locks_.size() > kPathLockSweepThreshold) {
        for (auto it = path_locks_.begin(); it != path_locks_.end();) {
            if (it->second.use_count() == 1) {
                it = path_locks_.erase(it);
            } else {
                ++it;
            }
        }
    }
    auto& slot = path_locks_[path];
    if (!slot) slot = std::make_shared<std::mutex>();
    return slot;
}

// 🛡️ Creates a backup of the file before surgery
std::string EditManager::create_backup(const std::string& path, const std::string& content, std::uint64_t sequence) {
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    std::string name = fs::path(path).filename().string() + "_" + std::to_string(nanos) + "_" +
                       std::to_string(sequence) + ".bak";
    fs::path backup_path = fs::path(backup_dir_) / name;

    try {
        write_file_bytes(backup_path, content);
    } catch (const FsError& e) {
        std::error_code ec;
        fs::remove(backup_path, ec);
        spdlog::error("🚨 Journal Backup Failed: {}", e.what());
        throw FsError(ErrorKind::Io, std::string("failed to write backup: ") + e.what());
    }
    return backup_path.string();
}

// 🔄 Restores the file to the state before the failed surgery
void EditManager::rollback(const std::string& path, const std::string& backup_path) {
    std::error_code ec;
    fs::copy_file(backup_path, path, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        spdlog::critical("💥 ROLLBACK FAILED for {}: {}. Backup kept at {}", path, ec.message(), backup_path);
        return;
    }
    fs::remove(backup_path, ec);
    spdlog::warn("🔄 Rollback triggered for: {}", path);
}

void EditManager::record_edit(const std::string& path, const std::string& backup_path, std::uint64_t sequence) {
    std::lock_guard<std::mutex> lock(history_mutex_);
    history_.push_back({path, backup_path, std::chrono::system_clock::now(), sequence});

    if (history_.size() > kMaxHistory) {
        const EditRecord& oldest = history_.front();
        std::error_code ec;
        fs::remove(oldest.backup_path, ec);
        if (ec) {
            spdlog::warn("⚠️ Failed to remove old backup {}: {}", oldest.backup_path, ec.message());
        }
        spdlog::debug("Evicted edit #{} for {}", oldest.sequence, oldest.file_path);
        history_.pop_front();
    }
}

void EditManager::replace(const std::string& path, const std::string& old_text, const std::string& new_text) {
    if (old_text.empty()) {
        throw FsError(ErrorKind::InvalidArgument, "old_str must not be empty");
    }

    auto path_lock = lock_for(path);
    std::lock_guard<std::mutex> guard(*path_lock);

    std::string content = read_file_bytes(path);

    std::size_t count = count_occurrences(content, old_text);
    if (count == 0) {
        throw FsError(ErrorKind::NotFound, "string not found in file: \"" + old_text + "\"");
    }
    if (count > 1) {
        throw FsError(ErrorKind::AmbiguousMatch,
                      "string appears " + std::to_string(count) +
                      " times in file; it must appear exactly once for str_replace");
    }

    std::uint64_t sequence = next_sequence_++;
    std::string backup_path = create_backup(path, content, sequence);

    std::string updated = content;
    updated.replace(content.find(old_text), old_text.size(), new_text);

    try {
        write_file_bytes(path, updated);
    } catch (const FsError&) {
        rollback(path, backup_path);
        throw;
    }

    record_edit(path, backup_path, sequence);
    spdlog::info("🏗️ Surgery Successful (str_replace): {}", path);
}

std::size_t EditManager::insert(const std::string& path, const InsertPosition& position, const std::string& text) {
    auto path_lock = lock_for(path);
    std::lock_guard<std::mutex> guard(*path_lock);

    std::error_code ec;
    bool exists = fs::exists(path, ec);
    if (ec) {
        throw FsError(ErrorKind::Io, "failed to access " + path + ": " + ec.message());
    }

    if (!exists) {
        if (!creates_at_edge(position)) {
            throw FsError(ErrorKind::NotFound,
                          "file doesn't exist; use line_number=0 or 'start' to create at beginning, "
                          "or 'end'/'append' to create: " + path);
        }
        fs::path parent = fs::path(path).parent_path();
        if (!parent.empty()) {
            fs::create_directories(parent, ec);
            if (ec) {
                throw FsError(ErrorKind::Io, "failed to create parent directory: " + ec.message());
            }
        }
        write_file_bytes(path, text);
        spdlog::info("📄 Created {} via insert", path);
        return 0;
    }

    std::string content = read_file_bytes(path);
    std::vector<std::string> lines = split_lines(content);

    std::size_t index = 0;
    if (std::holds_alternative<EndOfFile>(position)) {
        index = lines.size();
    } else if (std::holds_alternative<LineIndex>(position)) {
        index = std::get<LineIndex>(position).value;
        if (index > lines.size()) {
            throw FsError(ErrorKind::OutOfRange,
                          "invalid line number " + std::to_string(index) + "; file has " +
                          std::to_string(lines.size()) + " lines (use 0 to insert at beginning, " +
                          std::to_string(lines.size()) + " to append)");
        }
    }

    std::uint64_t sequence = next_sequence_++;
    std::string backup_path = create_backup(path, content, sequence);

    lines.insert(lines.begin() + static_cast<std::ptrdiff_t>(index), text);

    try {
        write_file_bytes(path, join_lines(lines));
    } catch (const FsError&) {
        rollback(path, backup_path);
        throw;
    }

    record_edit(path, backup_path, sequence);
    spdlog::info("🏗️ Surgery Successful (insert at {}): {}", describe_position(position), path);
    return index;
}

void EditManager::undo(const std::string& path) {
    auto path_lock = lock_for(path);
    std::lock_guard<std::mutex> guard(*path_lock);

    // Held across scan, restore and removal so eviction cannot pull the record away.
    std::lock_guard<std::mutex> lock(history_mutex_);

    auto it = std::find_if(history_.rbegin(), history_.rend(),
                           [&](const EditRecord& r) { return r.file_path == path; });
    if (it == history_.rend()) {
        throw FsError(ErrorKind::NoHistory, "no edit history found for file: " + path);
    }

    std::error_code ec;
    if (!fs::exists(it->backup_path, ec) && !ec) {
        std::string missing = it->backup_path;
        history_.erase(std::next(it).base());
        spdlog::warn("⚠️ Backup {} for {} is gone, dropping its edit record", missing, path);
        throw FsError(ErrorKind::Io, "backup file missing, edit record dropped: " + missing);
    }

    std::string content;
    try {
        content = read_file_bytes(it->backup_path);
    } catch (const FsError& e) {
        throw FsError(ErrorKind::Io, std::string("failed to read backup file: ") + e.what());
    }

    fs::path parent = fs::path(path).parent_path();
    if (!parent.empty()) fs::create_directories(parent, ec);

    try {
        write_file_bytes(path, content);
    } catch (const FsError& e) {
        throw FsError(ErrorKind::Io, std::string("failed to restore file: ") + e.what());
    }

    fs::remove(it->backup_path, ec);
    if (ec) {
        spdlog::warn("⚠️ Failed to remove backup file {}: {}", it->backup_path, ec.message());
    }

    history_.erase(std::next(it).base());
    spdlog::info("↩️ Undo applied to {} ({} edits in history)", path, history_.size());
}

std::vector<EditRecord> EditManager::history(const std::string& path) const {
    std::lock_guard<std::mutex> lock(history_mutex_);
    std::vector<EditRecord> out;
    for (const auto& record : history_) {
        if (record.file_path == path) out.push_back(record);
    }
    return out;
}

std::size_t EditManager::history_size() const {
    std::lock_guard<std::mutex> lock(history_mutex_);
    return history_.size();
}

}
