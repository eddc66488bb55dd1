#pragma once

#include "clock.h"
#include "config.h"
#include "consumer_group.h"
#include "errors.h"
#include "message.h"
#include "offset_tracker.h"
#include "replication.h"
#include "topic.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace brook {

// ==================== Publish Result (Broker level) ====================

struct PublishResult {
    ErrorCode code{ErrorCode::NONE};
    std::string error;
    std::string topic;
    uint32_t partition{0};
    uint64_t offset{UNASSIGNED_OFFSET};     // Unassigned for AckLevel::NONE
    uint64_t timestamp_ms{0};

    bool success() const { return code == ErrorCode::NONE; }
    ErrorKind kind() const { return classify(code); }
};

struct PublishRecord {
    std::string key;        // Empty for no key
    std::string value;
};

class Subscription;

struct SubscribeResult {
    Status status;
    std::unique_ptr<Subscription> subscription;

    bool ok() const { return status.ok(); }
};

// ==================== Broker ====================

/**
 * Central broker: owns the topic registry, the committed offsets and the
 * consumer groups, and enforces acknowledgment levels on publish.
 * Thread-safe for concurrent access.
 */
class Broker {
public:
    /**
     * @throws std::invalid_argument if config.validate() reports an error
     */
    explicit Broker(const BrokerConfig& config,
                    std::shared_ptr<ReplicationTransport> replication = nullptr,
                    std::shared_ptr<Clock> clock = nullptr);

    // Process-wide defaults from ConfigManager, stored under data_dir
    explicit Broker(const std::filesystem::path& data_dir);

    ~Broker();

    // Disable copy
    Broker(const Broker&) = delete;
    Broker& operator=(const Broker&) = delete;

    // Topic management
    // Idempotent when the topic exists with the same settings
    Status create_topic(const std::string& name, uint32_t num_partitions = 0);
    Status create_topic(const Topic::Config& config);
    Status delete_topic(const std::string& name);
    bool topic_exists(const std::string& name) const;
    std::vector<std::string> list_topics() const;

    // Publish
    PublishResult publish(const std::string& topic_name,
                          const std::string& key,
                          const std::string& value,
                          AckLevel ack,
                          TimePoint deadline,
                          const CancellationToken* cancel = nullptr);

    // Waits at most default_timeout_ms
    PublishResult publish(const std::string& topic_name,
                          const std::string& key,
                          const std::string& value,
                          AckLevel ack = AckLevel::LEADER);

    // Ack level as 0, 1 or 2
    PublishResult publish(const std::string& topic_name,
                          const std::string& key,
                          const std::string& value,
                          int ack_level);

    std::vector<PublishResult> publish_batch(const std::string& topic_name,
                                             const std::vector<PublishRecord>& records,
                                             AckLevel ack,
                                             TimePoint deadline,
                                             const CancellationToken* cancel = nullptr);

    std::vector<PublishResult> publish_batch(const std::string& topic_name,
                                             const std::vector<PublishRecord>& records,
                                             AckLevel ack = AckLevel::LEADER);

    // Subscribe: join `group` on `topic` as `consumer_id`
    SubscribeResult subscribe(const std::string& topic_name,
                              const std::string& group_id,
                              const std::string& consumer_id,
                              TimePoint deadline);

    SubscribeResult subscribe(const std::string& topic_name,
                              const std::string& group_id,
                              const std::string& consumer_id);

    // Consumer group offset management
    // `offset` is the highest processed record; it must be below the high-water mark
    Status commit(const std::string& topic_name, const std::string& group_id, uint64_t offset);
    Status commit(const std::string& topic_name, const std::string& group_id,
                  uint32_t partition, uint64_t offset);

    std::optional<uint64_t> fetch_committed(const std::string& topic_name,
                                            const std::string& group_id,
                                            uint32_t partition = 0) const;

    // Offsets (0 for unknown topics or partitions)
    uint64_t high_watermark(const std::string& topic_name, uint32_t partition = 0) const;
    uint64_t start_offset(const std::string& topic_name, uint32_t partition = 0) const;
    uint32_t partition_count(const std::string& topic_name) const;

    // Groups
    Status delete_group(const std::string& topic_name, const std::string& group_id);
    Status heartbeat(const std::string& topic_name, const std::string& group_id,
                     const std::string& consumer_id);
    std::shared_ptr<ConsumerGroup> group(const std::string& topic_name,
                                         const std::string& group_id) const;

    // Retention and group expiry; also run by the maintenance thread
    size_t run_maintenance();

    // Lifecycle
    Status flush();
    void shutdown();
    bool is_running() const { return running_.load(); }

    const BrokerConfig& config() const { return config_; }

private:
    std::shared_ptr<Topic> resolve_topic(const std::string& name, Status& status);
    TimePoint default_deadline() const;
    void maintenance_loop();

    BrokerConfig config_;
    std::shared_ptr<Clock> clock_;
    std::shared_ptr<ReplicationTransport> replication_;

    OffsetTracker offsets_;
    TopicManager topic_manager_;
    GroupCoordinator coordinator_;

    std::atomic<bool> running_;
    std::mutex maintenance_mutex_;
    std::condition_variable maintenance_cv_;
    std::thread maintenance_thread_;
};

// ==================== Subscription ====================

/**
 * Stream handle for one consumer instance of a group. Leaves the group
 * when closed or destroyed. Must not outlive its Broker.
 */
class Subscription {
public:
    Subscription(Broker& broker, std::shared_ptr<ConsumerGroup> group, std::string consumer_id);
    ~Subscription();

    // Disable copy
    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    // Poll for messages, in order per partition
    FetchResult poll(size_t max_messages, TimePoint deadline,
                     const CancellationToken* cancel = nullptr);
    FetchResult poll(size_t max_messages, std::chrono::milliseconds timeout);

    // Offset management
    Status commit(uint64_t offset);                         // Partition 0
    Status commit(uint32_t partition, uint64_t offset);
    Status commit();                                        // Everything polled so far
    Status seek(uint32_t partition, uint64_t offset);

    Status heartbeat();
    std::vector<uint32_t> assignment() const;

    Status close();
    bool is_closed() const { return closed_; }

    const std::string& topic() const { return group_->topic()->name(); }
    const std::string& group_id() const { return group_->group_id(); }
    const std::string& consumer_id() const { return consumer_id_; }

private:
    Broker& broker_;
    std::shared_ptr<ConsumerGroup> group_;
    std::string consumer_id_;

    std::map<uint32_t, uint64_t> delivered_;   // Highest offset polled per partition
    bool closed_{false};
};

// ==================== Producer ====================

using PublishCallback = std::function<void(const PublishResult&)>;

/**
 * High-level producer client for sending messages to a topic.
 * Supports sync, async, and batched sends.
 */
class Producer {
public:
    Producer(std::shared_ptr<Broker> broker, const std::string& topic,
             AckLevel ack = AckLevel::LEADER);
    ~Producer();

    // Disable copy
    Producer(const Producer&) = delete;
    Producer& operator=(const Producer&) = delete;

    // Synchronous send
    PublishResult send(const std::string& key, const std::string& value);

    // Batch send
    std::vector<PublishResult> send_batch(
        const std::vector<std::pair<std::string, std::string>>& messages);

    static constexpr size_t DEFAULT_BUFFER_CAPACITY = 10000;

    /**
     * @brief Buffer a record for the flush thread, which runs the callback
     *
     * Blocks while the buffer holds buffer_capacity records. If no space
     * frees up within the send timeout (default_timeout_ms of the broker by
     * default) the record is dropped and the callback runs on the calling
     * thread with BACKPRESSURE_TIMEOUT.
     */
    void send_async(const std::string& key, const std::string& value,
                    PublishCallback callback);

    // Send everything buffered by send_async
    void flush();

    // Configuration
    void set_batch_size(size_t size);
    void set_linger_ms(uint32_t ms);
    void set_buffer_capacity(size_t capacity);
    void set_send_timeout_ms(uint32_t ms);

private:
    std::shared_ptr<Broker> broker_;
    std::string topic_;
    AckLevel ack_;

    // Batching
    struct PendingMessage {
        PublishRecord record;
        PublishCallback callback;
    };

    std::mutex send_mutex_;             // Keeps async batches in order
    std::mutex buffer_mutex_;
    std::condition_variable buffer_cv_;
    std::vector<PendingMessage> buffer_;
    std::atomic<size_t> batch_size_;
    std::atomic<uint32_t> linger_ms_;
    std::atomic<size_t> buffer_capacity_;
    std::atomic<uint32_t> send_timeout_ms_;

    std::thread flush_thread_;
    std::atomic<bool> running_;

    void flush_loop();
};

} // namespace brook
