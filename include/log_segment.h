#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <vector>

#include "clock.h"
#include "errors.h"
#include "message.h"
#include "retention.h"

namespace brook {

struct AppendResult {
    Status status;
    uint64_t offset{0};

    bool ok() const { return status.ok(); }
};

struct ReadResult {
    Status status;
    MessagePtr message;

    bool ok() const { return status.ok(); }
};

/**
 * @brief Append-only log segment with a sparse offset index
 *
 * A segment is a pair of files named after the first offset they hold:
 *
 *   00000000000000001000.log    records
 *   00000000000000001000.index  sparse index
 *
 * Record format (.log, little-endian, no file header):
 * [4 bytes: payload_length][4 bytes: crc32(payload)][payload]
 * where payload is Message::serialize().
 *
 * Index format (.index): fixed 16-byte entries
 * [8 bytes: offset][8 bytes: byte position of the record in .log]
 * The first record is always indexed, then every index_interval-th.
 *
 * Thread safety:
 * - One writer at a time (write_mutex_)
 * - Reads use pread and may run concurrently with appends
 *
 * Recovery on open:
 * - Index entries that are partial or point past the end of .log are dropped
 * - Records after the last index entry are re-validated (length, checksum,
 *   offset continuity); the first invalid record and everything after it
 *   are truncated from both files
 */
class LogSegment {
public:
    struct Options {
        uint32_t index_interval{32};            // records between index entries
        bool fsync{false};                      // fdatasync on flush
        size_t write_buffer_bytes{64 * 1024};   // write-out threshold
    };

    static constexpr size_t RECORD_HEADER_SIZE = 8;
    static constexpr size_t INDEX_ENTRY_SIZE = 16;
    static constexpr uint32_t MAX_RECORD_BYTES = 64 * 1024 * 1024;

    /**
     * @brief Create an empty segment, truncating any files at `path`
     *
     * @return Segment, or nullptr with `status` set on failure
     */
    static std::unique_ptr<LogSegment> create(const std::string& path,
                                              uint64_t base_offset,
                                              const Options& options,
                                              Status& status);

    /**
     * @brief Open an existing segment and recover its tail
     *
     * The base offset is parsed from the file name.
     * @return Segment, or nullptr with `status` set on failure
     */
    static std::unique_ptr<LogSegment> open(const std::string& path,
                                            const Options& options,
                                            Status& status);

    static std::string index_path_for(const std::string& log_path);

    // Parse the 20-digit base offset from a segment file name
    static bool parse_base_offset(const std::string& path, uint64_t& base_offset);

    ~LogSegment();

    LogSegment(const LogSegment&) = delete;
    LogSegment& operator=(const LogSegment&) = delete;

    /**
     * @brief Append a record, assigning msg.offset
     *
     * Fails on a sealed segment. The record is buffered; it is readable
     * immediately and durable after flush().
     */
    AppendResult append(Message& msg);

    ReadResult read(uint64_t offset);

    /**
     * @brief Read consecutive records starting at start_offset
     *
     * Stops early at the end of the segment or at the first error,
     * which is reported through `status` when given.
     */
    std::vector<MessagePtr> read_batch(uint64_t start_offset,
                                       size_t max_messages,
                                       Status* status = nullptr);

    /**
     * @brief Write buffered records and index entries; fdatasync when
     * Options::fsync is set
     *
     * Reports a write failure from an earlier append that rolled back
     * buffered records.
     */
    Status flush();

    /**
     * @brief Flush and seal. Later appends fail; reads keep working.
     *
     * When the flush fails the segment is not sealed: records that did not
     * reach the file are rolled back and appends resume at next_offset().
     */
    Status close();

    /**
     * @brief Unlink both files. Open descriptors stay readable.
     */
    Status remove_files();

    bool contains_offset(uint64_t offset) const {
        return offset >= base_offset_ && offset < next_offset();
    }

    const std::string& path() const { return path_; }
    const std::string& index_path() const { return index_path_; }
    uint64_t base_offset() const { return base_offset_; }
    uint64_t next_offset() const { return next_offset_.load(std::memory_order_acquire); }
    uint64_t message_count() const { return next_offset() - base_offset_; }
    size_t size_bytes() const { return size_bytes_.load(std::memory_order_acquire); }
    uint64_t max_timestamp_ms() const { return max_timestamp_ms_.load(std::memory_order_acquire); }
    size_t index_entries() const;
    bool is_sealed() const { return sealed_.load(std::memory_order_acquire); }

    TimePoint created_at() const { return created_at_; }
    void set_created_at(TimePoint t) { created_at_ = t; }

    /**
     * @brief Size or record-count limit reached (0 disables a limit)
     */
    bool should_rotate(size_t max_segment_bytes, uint64_t max_segment_messages) const {
        if (is_sealed()) return true;
        if (max_segment_bytes > 0 && size_bytes() >= max_segment_bytes) return true;
        if (max_segment_messages > 0 && message_count() >= max_segment_messages) return true;
        return false;
    }

    SegmentInfo info() const {
        return SegmentInfo{base_offset_, next_offset(), size_bytes(), max_timestamp_ms()};
    }

private:
    LogSegment() = default;

    struct IndexEntry {
        uint64_t offset;
        uint64_t position;
    };

    Status recover();
    Status load_index(uint64_t log_size, bool& changed);
    Status rewrite_index();

    // Write the record buffer to the file; rolls back on failure
    Status write_out_locked();
    Status write_index_locked();
    Status flush_locked();

    // Make every appended record visible to pread
    Status ensure_readable();

    // Position of the record holding `offset` (floor index entry + scan)
    Status locate(uint64_t offset, uint64_t& position) const;

    // Read and validate one record at `position`
    Status read_record(uint64_t position, uint64_t expected_offset,
                       MessagePtr& out, uint64_t& next_position) const;

    std::string path_;
    std::string index_path_;
    uint64_t base_offset_{0};
    Options options_;
    TimePoint created_at_{};

    int fd_{-1};
    int index_fd_{-1};

    std::atomic<uint64_t> next_offset_{0};
    std::atomic<size_t> size_bytes_{0};       // includes buffered records
    std::atomic<size_t> written_bytes_{0};    // on file via pwrite
    std::atomic<uint64_t> max_timestamp_ms_{0};
    std::atomic<bool> sealed_{false};

    mutable std::mutex write_mutex_;
    std::vector<uint8_t> write_buffer_;
    uint64_t buffer_base_offset_{0};          // first offset in write_buffer_
    uint32_t records_since_index_{0};
    size_t index_written_{0};                 // entries persisted to .index
    Status pending_error_;

    mutable std::shared_mutex index_mutex_;
    std::vector<IndexEntry> index_;
};

/**
 * @brief Ordered set of segments forming one partition log
 *
 * Handles:
 * - Segment rotation by size, record count or age
 * - Finding the segment for an offset (binary search on base offset)
 * - Retention: deleting a prefix of sealed segments
 * - Startup recovery and continuity checks across segments
 *
 * The segment list lock is held only while choosing or rotating the
 * active segment; record I/O runs outside it.
 */
class LogManager {
public:
    struct Config {
        std::string base_path;
        size_t max_segment_bytes{1024 * 1024 * 1024};
        uint64_t max_segment_messages{0};     // 0 = unlimited
        uint64_t max_segment_age_ms{0};       // 0 = unlimited
        LogSegment::Options segment_options;
    };

    explicit LogManager(const Config& config, std::shared_ptr<Clock> clock = nullptr);
    ~LogManager();

    LogManager(const LogManager&) = delete;
    LogManager& operator=(const LogManager&) = delete;

    /**
     * @brief Error found while loading segments at construction, if any
     *
     * When not OK, appends are refused; loaded segments stay readable.
     */
    const Status& load_status() const { return load_status_; }

    AppendResult append(Message& msg);

    ReadResult read(uint64_t offset) const;

    std::vector<MessagePtr> read_batch(uint64_t start_offset,
                                       size_t max_messages,
                                       Status* status = nullptr) const;

    Status flush();

    // Earliest retained offset
    uint64_t start_offset() const;

    // Next offset to be assigned
    uint64_t end_offset() const;

    size_t segment_count() const;
    size_t size_bytes() const;

    /**
     * @brief Delete the sealed prefix the policy selects
     * @return Number of segments deleted
     */
    size_t apply_retention(const RetentionPolicy& policy);

    /**
     * @brief Seal the active segment and unlink every file
     */
    Status remove_all();

    std::string segment_filename(uint64_t base_offset) const;

private:
    Status load_segments();
    Status roll_locked();
    bool needs_roll_locked() const;
    std::shared_ptr<LogSegment> find_segment(uint64_t offset) const;

    Config config_;
    std::shared_ptr<Clock> clock_;
    std::vector<std::shared_ptr<LogSegment>> segments_;
    std::shared_ptr<LogSegment> active_segment_;
    mutable std::shared_mutex mutex_;
    Status load_status_;
    bool removed_{false};
};

} // namespace brook
