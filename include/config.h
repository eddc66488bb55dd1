#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>

namespace brook {

/**
 * @brief Where a consumer group with no committed offset starts reading
 */
enum class OffsetResetPolicy : uint8_t {
    EARLIEST = 0,   // oldest retained record
    LATEST = 1      // only records published after the group first joins
};

/**
 * @brief What a group does when its cursor was evicted by retention
 */
enum class OutOfRangePolicy : uint8_t {
    RESET_EARLIEST = 0,   // skip ahead to the oldest retained record
    FAIL = 1              // fetch reports OFFSET_OUT_OF_RANGE
};

/**
 * @brief Broker-wide configuration
 *
 * Plain values with defaults. Topic-level storage settings here are the
 * defaults for auto-created topics; create_topic can override them.
 */
struct BrokerConfig {
    // Storage location
    std::string data_dir{"./brook-data"};

    // Topic management
    bool auto_create_topics{true};                    // Dynamic topic creation
    uint32_t default_partition_count{1};              // Partitions per new topic

    // Storage configuration
    uint64_t log_segment_bytes{1ULL * 1024 * 1024 * 1024}; // 1GB per segment
    uint64_t log_segment_messages{0};                 // 0 = no record limit
    uint64_t log_segment_ms{0};                       // 0 = no age limit
    uint32_t log_index_interval{32};                  // Records per index entry
    bool log_fsync{false};                            // fdatasync on every flush
    uint64_t log_retention_bytes{0};                  // 0 = no size limit
    uint64_t log_retention_ms{7 * 24 * 3600 * 1000ULL}; // 7 days, 0 = keep forever

    // Ingestion (trade-off: latency vs throughput)
    uint32_t ingress_buffer_capacity{10000};          // Records buffered per partition
    uint32_t max_batch_size{100};                     // Records per append batch
    uint32_t batch_linger_ms{0};                      // Max wait for a batch to fill

    // Delivery
    uint32_t replication_timeout_ms{5000};
    uint32_t default_timeout_ms{30000};               // Deadline when the caller gives none

    // Consumer groups
    uint32_t session_timeout_ms{10000};               // Heartbeat expiry
    uint32_t ack_timeout_ms{30000};                   // In-flight redelivery
    OffsetResetPolicy offset_reset{OffsetResetPolicy::EARLIEST};
    OutOfRangePolicy out_of_range{OutOfRangePolicy::RESET_EARLIEST};
    std::string assignment_strategy{"range"};         // range | roundrobin | hash

    // Background work
    uint32_t maintenance_interval_ms{1000};           // 0 = no maintenance thread
    std::string log_level{"info"};

    std::string to_string() const {
        return "BrokerConfig{data_dir=" + data_dir +
               ", auto_create_topics=" + (auto_create_topics ? "true" : "false") +
               ", default_partition_count=" + std::to_string(default_partition_count) +
               ", log_segment_bytes=" + std::to_string(log_segment_bytes) +
               ", log_retention_ms=" + std::to_string(log_retention_ms) +
               ", ingress_buffer_capacity=" + std::to_string(ingress_buffer_capacity) +
               ", assignment_strategy=" + assignment_strategy +
               ", ...}";
    }

    /**
     * @brief Validate configuration values
     * Returns error message if invalid, empty string if valid
     */
    std::string validate() const {
        if (data_dir.empty()) return "data_dir cannot be empty";
        if (default_partition_count == 0) return "default_partition_count cannot be 0";
        if (log_segment_bytes == 0) return "log_segment_bytes cannot be 0";
        if (log_index_interval == 0) return "log_index_interval cannot be 0";
        if (ingress_buffer_capacity == 0) return "ingress_buffer_capacity cannot be 0";
        if (max_batch_size == 0) return "max_batch_size cannot be 0";
        if (session_timeout_ms == 0) return "session_timeout_ms cannot be 0";
        if (ack_timeout_ms == 0) return "ack_timeout_ms cannot be 0";
        if (default_timeout_ms == 0) return "default_timeout_ms cannot be 0";
        if (assignment_strategy != "range" && assignment_strategy != "roundrobin" &&
            assignment_strategy != "hash") {
            return "assignment_strategy must be one of range, roundrobin, hash";
        }
        return "";
    }
};

/**
 * @brief Process-wide default configuration
 *
 * Reader-writer locked: readers take a copy, writers get exclusive access.
 *
 *   auto config = ConfigManager::instance().get_config();
 *
 *   ConfigManager::instance().update([](BrokerConfig& cfg) {
 *       cfg.default_partition_count = 4;
 *   });
 */
class ConfigManager {
public:
    static ConfigManager& instance() {
        static ConfigManager instance;
        return instance;
    }

    BrokerConfig get_config() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return config_;
    }

    /**
     * @brief Apply a modifier; an invalid result is rolled back
     * @return Empty string on success, otherwise the validation error
     */
    template<typename Func>
    std::string update(Func modifier) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        BrokerConfig candidate = config_;
        modifier(candidate);

        std::string error = candidate.validate();
        if (error.empty()) {
            config_ = std::move(candidate);
        }
        return error;
    }

    std::string set_config(const BrokerConfig& new_config) {
        std::string error = new_config.validate();
        if (!error.empty()) {
            return error;
        }

        std::unique_lock<std::shared_mutex> lock(mutex_);
        config_ = new_config;
        return "";
    }

    ConfigManager(const ConfigManager&) = delete;
    ConfigManager& operator=(const ConfigManager&) = delete;

private:
    ConfigManager() = default;

    BrokerConfig config_;
    mutable std::shared_mutex mutex_;
};

/**
 * @brief RAII helper for temporary config changes (useful for testing)
 *
 *   {
 *       ConfigScope scope([](BrokerConfig& cfg) { cfg.auto_create_topics = false; });
 *       // ... test with modified config ...
 *   } // Original config restored here
 */
class ConfigScope {
public:
    template<typename Func>
    explicit ConfigScope(Func modifier)
        : original_(ConfigManager::instance().get_config()) {
        error_ = ConfigManager::instance().update(modifier);
    }

    ~ConfigScope() {
        ConfigManager::instance().set_config(original_);
    }

    ConfigScope(const ConfigScope&) = delete;
    ConfigScope& operator=(const ConfigScope&) = delete;

    // Validation error of the modification, empty if it was applied
    const std::string& error() const { return error_; }

private:
    BrokerConfig original_;
    std::string error_;
};

} // namespace brook
