/**
 * @file offset_tracker.cpp
 * @brief Committed offsets table, rewritten by temp file and rename
 */

#include "offset_tracker.h"
#include "logging.h"

#include <fcntl.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace brook {

namespace {

std::string errno_text(const char* op, const std::string& path, int err) {
    return std::string(op) + " " + path + ": " + std::strerror(err);
}

} // namespace

OffsetTracker::OffsetTracker(const std::string& data_dir, bool fsync)
    : dir_path_(data_dir + "/" + OFFSETS_DIR)
    , file_path_(dir_path_ + "/" + OFFSETS_FILE)
    , fsync_(fsync) {

    std::error_code ec;
    fs::create_directories(dir_path_, ec);
    if (ec) {
        load_status_ = Status::error(ErrorCode::STORAGE_IO_ERROR,
                                     "create " + dir_path_ + ": " + ec.message());
        logger()->error("Offset tracker unavailable: {}", load_status_.to_string());
        return;
    }

    load_status_ = load();
}

Status OffsetTracker::load() {
    if (!fs::exists(file_path_)) {
        return Status::OK();
    }

    std::ifstream file(file_path_);
    if (!file) {
        return Status::error(ErrorCode::STORAGE_IO_ERROR, "cannot read " + file_path_);
    }

    size_t entries = 0;
    size_t skipped = 0;
    std::string line;
    while (std::getline(file, line)) {
        if (line.empty()) continue;

        std::istringstream fields(line);
        std::string topic, group;
        uint32_t partition;
        uint64_t offset;
        if (!(fields >> topic >> group >> partition >> offset)) {
            ++skipped;
            continue;
        }

        uint64_t& stored = committed_[topic][group][partition];
        stored = std::max(stored, offset);
        ++entries;
    }

    if (skipped > 0) {
        logger()->warn("Ignored {} malformed lines in {}", skipped, file_path_);
    }
    logger()->info("Loaded {} committed offsets from {}", entries, file_path_);
    return Status::OK();
}

Status OffsetTracker::persist_locked() const {
    std::ostringstream table;
    for (const auto& [topic, groups] : committed_) {
        for (const auto& [group, partitions] : groups) {
            for (const auto& [partition, offset] : partitions) {
                table << topic << " " << group << " " << partition << " " << offset << "\n";
            }
        }
    }
    const std::string contents = table.str();

    const std::string tmp = file_path_ + ".tmp";
    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        return Status::error(ErrorCode::STORAGE_IO_ERROR, errno_text("create", tmp, errno));
    }

    const char* data = contents.data();
    size_t remaining = contents.size();
    while (remaining > 0) {
        ssize_t n = ::write(fd, data, remaining);
        if (n < 0) {
            if (errno == EINTR) continue;
            Status s = Status::error(ErrorCode::STORAGE_IO_ERROR, errno_text("write", tmp, errno));
            ::close(fd);
            return s;
        }
        data += n;
        remaining -= static_cast<size_t>(n);
    }

    // The new table must be on disk before it replaces the old one
    if (fsync_ && ::fdatasync(fd) != 0) {
        Status s = Status::error(ErrorCode::STORAGE_IO_ERROR, errno_text("fdatasync", tmp, errno));
        ::close(fd);
        return s;
    }
    if (::close(fd) != 0) {
        return Status::error(ErrorCode::STORAGE_IO_ERROR, errno_text("close", tmp, errno));
    }

    if (::rename(tmp.c_str(), file_path_.c_str()) != 0) {
        return Status::error(ErrorCode::STORAGE_IO_ERROR, errno_text("rename", tmp, errno));
    }

    if (fsync_) {
        int dir_fd = ::open(dir_path_.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
        if (dir_fd < 0) {
            return Status::error(ErrorCode::STORAGE_IO_ERROR, errno_text("open", dir_path_, errno));
        }
        int rc = ::fsync(dir_fd);
        int err = errno;
        ::close(dir_fd);
        if (rc != 0) {
            return Status::error(ErrorCode::STORAGE_IO_ERROR, errno_text("fsync", dir_path_, err));
        }
    }
    return Status::OK();
}

Status OffsetTracker::commit(const std::string& topic, const std::string& group,
                             uint32_t partition, uint64_t offset) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto& partitions = committed_[topic][group];
    auto it = partitions.find(partition);
    if (it != partitions.end() && offset <= it->second) {
        return Status::OK();
    }
    partitions[partition] = offset;

    Status s = persist_locked();
    if (!s.ok()) {
        logger()->error("Commit of {}/{}/{} at {} not persisted: {}",
                        topic, group, partition, offset, s.to_string());
        return s.with_context("commit " + topic + "/" + group);
    }
    return Status::OK();
}

std::optional<uint64_t> OffsetTracker::fetch_committed(const std::string& topic,
                                                       const std::string& group,
                                                       uint32_t partition) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto topic_it = committed_.find(topic);
    if (topic_it == committed_.end()) return std::nullopt;

    auto group_it = topic_it->second.find(group);
    if (group_it == topic_it->second.end()) return std::nullopt;

    auto part_it = group_it->second.find(partition);
    if (part_it == group_it->second.end()) return std::nullopt;

    return part_it->second;
}

Status OffsetTracker::remove_group(const std::string& topic, const std::string& group) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto topic_it = committed_.find(topic);
    if (topic_it == committed_.end() || topic_it->second.erase(group) == 0) {
        return Status::OK();
    }
    if (topic_it->second.empty()) {
        committed_.erase(topic_it);
    }
    return persist_locked();
}

Status OffsetTracker::remove_topic(const std::string& topic) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (committed_.erase(topic) == 0) {
        return Status::OK();
    }
    return persist_locked();
}

} // namespace brook
