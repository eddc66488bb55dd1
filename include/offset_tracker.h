#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>

#include "errors.h"

namespace brook {

// =============================================================================
// OffsetTracker - durable committed offsets per (topic, group, partition)
// =============================================================================
// A committed offset is the highest offset the group has finished
// processing; consumption resumes one past it. Commits resolve races by
// monotonic max, so a stale commit is a successful no-op.

class OffsetTracker {
public:
    static constexpr const char* OFFSETS_DIR = "offsets";
    static constexpr const char* OFFSETS_FILE = "committed.dat";

    // Reloads <data_dir>/offsets/committed.dat when it exists. With `fsync`
    // every rewrite is fdatasync'd and so is the directory after the rename.
    explicit OffsetTracker(const std::string& data_dir, bool fsync = false);

    OffsetTracker(const OffsetTracker&) = delete;
    OffsetTracker& operator=(const OffsetTracker&) = delete;

    // Result of reloading the persisted table
    const Status& load_status() const { return load_status_; }

    /**
     * @brief Record that `group` processed `partition` of `topic` up to `offset`
     *
     * STORAGE_IO_ERROR if the table could not be persisted. The in-memory
     * value stays advanced; after a restart the records since the last
     * persisted commit are delivered again.
     */
    Status commit(const std::string& topic, const std::string& group,
                  uint32_t partition, uint64_t offset);

    // Nothing when the group never committed on this partition
    std::optional<uint64_t> fetch_committed(const std::string& topic, const std::string& group,
                                            uint32_t partition) const;

    Status remove_group(const std::string& topic, const std::string& group);
    Status remove_topic(const std::string& topic);

    const std::string& path() const { return file_path_; }

private:
    Status load();
    Status persist_locked() const;

    std::string dir_path_;
    std::string file_path_;
    bool fsync_;
    Status load_status_;

    // topic -> group -> partition -> offset
    mutable std::mutex mutex_;
    std::map<std::string, std::map<std::string, std::map<uint32_t, uint64_t>>> committed_;
};

} // namespace brook
