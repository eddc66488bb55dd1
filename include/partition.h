#pragma once

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "clock.h"
#include "errors.h"
#include "flow_controller.h"
#include "log_segment.h"
#include "message.h"
#include "replication.h"
#include "retention.h"

namespace brook {

// =============================================================================
// AppendNotifier - wakes long-polling readers when a topic gets new data
// =============================================================================

class AppendNotifier {
public:
    uint64_t generation() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return generation_;
    }

    void notify() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++generation_;
        }
        cv_.notify_all();
    }

    // True if notify() was called since `seen` was read, false on timeout
    bool wait_for_change(uint64_t seen, TimePoint until) const {
        std::unique_lock<std::mutex> lock(mutex_);
        return cv_.wait_until(lock, until, [&] { return generation_ != seen; });
    }

private:
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    uint64_t generation_{0};
};

// =============================================================================
// Partition - A single ordered message stream
// =============================================================================
// Each partition is an independent, ordered sequence of messages backed
// by a LogManager. Publishes go through a FlowController; its ingestion
// thread appends a batch, flushes it, replicates it when a transport is
// configured, and only then advances the high-water mark that readers
// see.

class Partition {
public:
    struct Config {
        std::string topic_name;
        uint32_t partition_id = 0;
        std::string base_path;                          // Topic directory

        // Storage settings
        size_t segment_max_bytes = 100 * 1024 * 1024;   // 100MB per segment
        uint64_t segment_max_messages = 0;              // 0 = unlimited
        uint64_t segment_max_age_ms = 0;                // 0 = unlimited
        uint32_t index_interval = 32;
        bool fsync = false;

        FlowController::Config flow;
        uint32_t replication_timeout_ms = 5000;
    };

    Partition(const Config& config,
              std::shared_ptr<Clock> clock,
              std::shared_ptr<ReplicationTransport> replication,
              std::shared_ptr<AppendNotifier> notifier);
    ~Partition();

    Partition(const Partition&) = delete;
    Partition& operator=(const Partition&) = delete;

    // Result of recovering the log at construction
    const Status& status() const { return log_manager_->load_status(); }

    // --- Write Operations ---

    /**
     * @brief Publish one record through the ingress buffer
     *
     * Blocks for buffer space and, for LEADER and ALL, for the record's
     * batch to complete, all bounded by `deadline`.
     */
    PublishOutcome publish(Message msg, AckLevel ack, TimePoint deadline,
                           const CancellationToken* cancel = nullptr);

    /**
     * @brief Publish records in order; one outcome per record
     *
     * Once a record is rejected by the ingress buffer the remaining ones
     * are not submitted and report the same error.
     */
    std::vector<PublishOutcome> publish_batch(std::vector<Message> messages, AckLevel ack,
                                              TimePoint deadline,
                                              const CancellationToken* cancel = nullptr);

    /**
     * @brief Append and flush synchronously, bypassing the ingress buffer
     */
    AppendResult append(Message& msg);

    // --- Read Operations ---

    // Only offsets below the high-water mark are readable
    ReadResult read(uint64_t offset) const;

    std::vector<MessagePtr> read_batch(uint64_t start_offset, size_t max_messages,
                                       Status* status = nullptr) const;

    /**
     * @brief Read from start_offset, waiting for data until the deadline
     *
     * Reports TIMEOUT or CANCELLED through `status` when nothing arrived.
     */
    std::vector<MessagePtr> poll(uint64_t start_offset, size_t max_messages,
                                 TimePoint deadline,
                                 const CancellationToken* cancel = nullptr,
                                 Status* status = nullptr) const;

    // --- Offset Management ---

    // Oldest retained offset
    uint64_t start_offset() const;

    // One past the last offset visible to consumers
    uint64_t high_watermark() const { return high_watermark_.load(std::memory_order_acquire); }

    // Next offset the log will assign (may be ahead of the high-water mark)
    uint64_t log_end_offset() const;

    bool is_valid_offset(uint64_t offset) const {
        return offset >= start_offset() && offset < high_watermark();
    }

    // --- Metadata ---

    const std::string& topic_name() const { return config_.topic_name; }
    uint32_t partition_id() const { return config_.partition_id; }
    const std::string& path() const { return path_; }
    size_t segment_count() const { return log_manager_->segment_count(); }
    size_t size_bytes() const { return log_manager_->size_bytes(); }
    size_t buffered() const { return flow_->buffered(); }

    // --- Maintenance ---

    size_t apply_retention(const RetentionPolicy& policy);
    Status flush();

    // Stop ingestion after draining accepted records
    void close();

    // Delete the partition's files (after close)
    Status remove_files();

private:
    void ingest(std::vector<IngressRecord>& batch);
    void advance_high_watermark(uint64_t offset);
    void stamp(MessagePtr& msg) const;

    Config config_;
    std::string path_;
    std::string name_;
    std::shared_ptr<Clock> clock_;
    std::shared_ptr<ReplicationTransport> replication_;
    std::shared_ptr<AppendNotifier> notifier_;

    std::unique_ptr<LogManager> log_manager_;
    std::atomic<uint64_t> high_watermark_{0};
    std::unique_ptr<FlowController> flow_;
};

} // namespace brook
