#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "clock.h"
#include "errors.h"
#include "flow_controller.h"
#include "hash.h"
#include "partition.h"
#include "replication.h"
#include "retention.h"

namespace brook {

/**
 * @brief Topic and group names: 1-249 characters of [A-Za-z0-9._-],
 * not "." or ".."
 */
bool is_valid_name(const std::string& name);

// =============================================================================
// Topic - A named collection of partitions
// =============================================================================
// Messages are distributed across partitions by key hash, or round-robin
// when they have no key. Each partition keeps its own order; there is no
// ordering across partitions.

class Topic {
public:
    struct Config {
        std::string name;
        uint32_t num_partitions = 1;
        std::string base_path;                          // Topic directory

        // Storage settings, fixed at creation and persisted in topic.meta
        size_t segment_max_bytes = 100 * 1024 * 1024;
        uint64_t segment_max_messages = 0;
        uint64_t segment_max_age_ms = 0;
        uint32_t index_interval = 32;
        uint64_t retention_bytes = 0;                   // 0 = no size limit
        uint64_t retention_ms = 7 * 24 * 3600 * 1000ULL; // 0 = keep forever

        // Runtime settings, taken from the broker on every start
        bool fsync = false;
        FlowController::Config flow;
        uint32_t replication_timeout_ms = 5000;

        // Same partition count and storage settings
        bool compatible_with(const Config& other) const;
    };

    // Result of a produce operation
    struct ProduceResult {
        Status status;
        uint32_t partition_id = 0;
        uint64_t offset = UNASSIGNED_OFFSET;
        uint64_t timestamp_ms = 0;
    };

    Topic(const Config& config,
          std::shared_ptr<Clock> clock,
          std::shared_ptr<ReplicationTransport> replication);
    ~Topic();

    Topic(const Topic&) = delete;
    Topic& operator=(const Topic&) = delete;

    // First partition recovery error, if any
    Status status() const;

    // --- Produce Operations ---

    // Partition is selected by key (or round-robin if the key is empty)
    ProduceResult produce(Message msg, AckLevel ack, TimePoint deadline,
                          const CancellationToken* cancel = nullptr);

    ProduceResult produce(Message msg, uint32_t partition_id, AckLevel ack, TimePoint deadline,
                          const CancellationToken* cancel = nullptr);

    // One result per message, in input order
    std::vector<ProduceResult> produce_batch(std::vector<Message> messages, AckLevel ack,
                                             TimePoint deadline,
                                             const CancellationToken* cancel = nullptr);

    // --- Partition Management ---

    uint32_t num_partitions() const { return static_cast<uint32_t>(partitions_.size()); }

    Partition* partition(uint32_t id);
    const Partition* partition(uint32_t id) const;

    uint32_t partition_for_key(const std::string& key) const;

    // --- Metadata ---

    const std::string& name() const { return config_.name; }
    const std::string& path() const { return config_.base_path; }
    const Config& config() const { return config_; }

    // Signalled whenever any partition's high-water mark advances
    const std::shared_ptr<AppendNotifier>& notifier() const { return notifier_; }

    std::unordered_map<uint32_t, uint64_t> start_offsets() const;
    std::unordered_map<uint32_t, uint64_t> high_watermarks() const;

    // --- Maintenance ---

    // Apply the topic's retention settings to every partition
    size_t apply_retention();

    Status flush();

    // Stop ingestion on every partition
    void close();

    // Delete every partition and the topic directory (after close)
    Status remove_files();

private:
    uint32_t select_partition(const Message& msg) const;

    Config config_;
    std::shared_ptr<AppendNotifier> notifier_;
    std::shared_ptr<RetentionPolicy> retention_;
    std::vector<std::unique_ptr<Partition>> partitions_;

    // Round-robin counter for messages without keys
    mutable std::atomic<uint32_t> round_robin_counter_{0};
};

// =============================================================================
// TopicManager - Registry of topics
// =============================================================================
// Lookups share the registry lock; inserts and deletes take it exclusively.
// A topic is constructed outside the lock, exactly once per name, through a
// per-name once_flag slot, so concurrent first publishes to a new name
// create it once.

class TopicManager {
public:
    struct Config {
        std::string base_path;          // Directory holding one directory per topic
        Topic::Config defaults;         // Settings for auto-created topics
    };

    static constexpr const char* META_FILE = "topic.meta";

    TopicManager(const Config& config,
                 std::shared_ptr<Clock> clock,
                 std::shared_ptr<ReplicationTransport> replication);
    ~TopicManager();

    TopicManager(const TopicManager&) = delete;
    TopicManager& operator=(const TopicManager&) = delete;

    // --- Topic Management ---

    /**
     * @brief Create a topic, or return the existing one when its settings match
     *
     * TOPIC_CONFIG_CONFLICT when a topic of that name exists with different
     * settings. Only name and storage settings of `config` are used.
     */
    std::shared_ptr<Topic> create_topic(const Topic::Config& config, Status& status);

    // Create with default settings and the given partition count (0 = default)
    std::shared_ptr<Topic> create_topic(const std::string& name, uint32_t num_partitions, Status& status);

    // Existing topic, or a new one with default settings
    std::shared_ptr<Topic> get_or_create_topic(const std::string& name, Status& status);

    std::shared_ptr<Topic> get_topic(const std::string& name) const;

    bool topic_exists(const std::string& name) const;

    // Close the topic and remove its files
    Status delete_topic(const std::string& name);

    std::vector<std::string> list_topics() const;

    // Settings a topic named `name` gets when created implicitly
    Topic::Config default_config(const std::string& name) const;

    // --- Maintenance ---

    Status flush_all();

    size_t apply_retention();

    // Reopen every topic that has a topic.meta under base_path
    Status load_topics();

    void close_all();

private:
    struct TopicSlot {
        std::once_flag once;
        std::shared_ptr<Topic> topic;
        Status status;
        std::atomic<bool> ready{false};
    };

    std::shared_ptr<Topic> open_topic(const Topic::Config& config, bool check_conflict, Status& status);
    std::shared_ptr<Topic> build_topic(const Topic::Config& config, Status& status);
    std::vector<std::shared_ptr<Topic>> ready_topics() const;
    std::string topic_path(const std::string& name) const;

    Config config_;
    std::shared_ptr<Clock> clock_;
    std::shared_ptr<ReplicationTransport> replication_;

    std::unordered_map<std::string, std::shared_ptr<TopicSlot>> topics_;
    mutable std::shared_mutex mutex_;
};

} // namespace brook
