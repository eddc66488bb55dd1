/**
 * @file broker.cpp
 * @brief Broker facade: topics, publish with ack levels, groups and maintenance
 */

#include "broker.h"
#include "logging.h"

#include <stdexcept>

namespace fs = std::filesystem;

namespace brook {

namespace {

const BrokerConfig& validated(const BrokerConfig& config) {
    std::string error = config.validate();
    if (!error.empty()) {
        throw std::invalid_argument("invalid broker config: " + error);
    }
    return config;
}

TopicManager::Config topic_manager_config(const BrokerConfig& config) {
    TopicManager::Config tm;
    tm.base_path = config.data_dir + "/topics";

    Topic::Config& defaults = tm.defaults;
    defaults.num_partitions = config.default_partition_count;
    defaults.segment_max_bytes = config.log_segment_bytes;
    defaults.segment_max_messages = config.log_segment_messages;
    defaults.segment_max_age_ms = config.log_segment_ms;
    defaults.index_interval = config.log_index_interval;
    defaults.retention_bytes = config.log_retention_bytes;
    defaults.retention_ms = config.log_retention_ms;
    defaults.fsync = config.log_fsync;
    defaults.flow.capacity = config.ingress_buffer_capacity;
    defaults.flow.max_batch_size = config.max_batch_size;
    defaults.flow.linger_ms = config.batch_linger_ms;
    defaults.replication_timeout_ms = config.replication_timeout_ms;
    return tm;
}

GroupCoordinator::Config coordinator_config(const BrokerConfig& config) {
    GroupCoordinator::Config gc;
    gc.group.session_timeout_ms = config.session_timeout_ms;
    gc.group.ack_timeout_ms = config.ack_timeout_ms;
    gc.group.offset_reset = config.offset_reset;
    gc.group.out_of_range = config.out_of_range;
    gc.assignment_strategy = config.assignment_strategy;
    return gc;
}

BrokerConfig config_for_dir(const fs::path& data_dir) {
    BrokerConfig config = ConfigManager::instance().get_config();
    config.data_dir = data_dir.string();
    return config;
}

PublishResult failed(PublishResult result, const Status& status) {
    result.code = status.code;
    result.error = status.message;
    return result;
}

} // anonymous namespace

// ==================== Broker Implementation ====================

Broker::Broker(const BrokerConfig& config,
               std::shared_ptr<ReplicationTransport> replication,
               std::shared_ptr<Clock> clock)
    : config_(validated(config))
    , clock_(clock ? std::move(clock) : system_clock())
    , replication_(std::move(replication))
    , offsets_(config_.data_dir, config_.log_fsync)
    , topic_manager_(topic_manager_config(config_), clock_, replication_)
    , coordinator_(coordinator_config(config_), clock_, offsets_)
    , running_(true) {

    if (!set_log_level(config_.log_level)) {
        logger()->warn("Unknown log level '{}', keeping {}", config_.log_level,
                       spdlog::level::to_string_view(logger()->level()));
    }

    if (!offsets_.load_status().ok()) {
        logger()->error("Committed offsets not loaded: {}", offsets_.load_status().to_string());
    }

    // Load existing topics
    Status loaded = topic_manager_.load_topics();
    if (!loaded.ok()) {
        logger()->error("Some topics failed to load: {}", loaded.to_string());
    }

    logger()->info("Broker started in {} with {} topics", config_.data_dir,
                   topic_manager_.list_topics().size());
    logger()->debug("{}", config_.to_string());

    if (config_.maintenance_interval_ms > 0) {
        maintenance_thread_ = std::thread(&Broker::maintenance_loop, this);
    }
}

Broker::Broker(const std::filesystem::path& data_dir)
    : Broker(config_for_dir(data_dir)) {}

Broker::~Broker() {
    shutdown();
}

void Broker::shutdown() {
    if (!running_.exchange(false)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(maintenance_mutex_);
    }
    maintenance_cv_.notify_all();
    if (maintenance_thread_.joinable()) {
        maintenance_thread_.join();
    }

    // Drains every ingress buffer before the final flush
    topic_manager_.close_all();
    Status flushed = topic_manager_.flush_all();
    if (!flushed.ok()) {
        logger()->error("Final flush failed: {}", flushed.to_string());
    }
    logger()->info("Broker in {} shut down", config_.data_dir);
}

std::shared_ptr<Topic> Broker::resolve_topic(const std::string& name, Status& status) {
    if (!is_valid_name(name)) {
        status = Status::error(ErrorCode::INVALID_TOPIC_NAME, "invalid topic name '" + name + "'");
        return nullptr;
    }

    if (auto topic = topic_manager_.get_topic(name)) {
        status = Status::OK();
        return topic;
    }

    if (!config_.auto_create_topics) {
        status = Status::error(ErrorCode::UNKNOWN_TOPIC, "unknown topic '" + name + "'");
        return nullptr;
    }
    return topic_manager_.get_or_create_topic(name, status);
}

TimePoint Broker::default_deadline() const {
    return deadline_after(std::chrono::milliseconds(config_.default_timeout_ms));
}

Status Broker::create_topic(const std::string& name, uint32_t num_partitions) {
    Status status;
    topic_manager_.create_topic(name, num_partitions, status);
    return status;
}

Status Broker::create_topic(const Topic::Config& config) {
    Status status;
    topic_manager_.create_topic(config, status);
    return status;
}

Status Broker::delete_topic(const std::string& name) {
    Status status = topic_manager_.delete_topic(name);
    if (status.code == ErrorCode::UNKNOWN_TOPIC) {
        return status;
    }

    coordinator_.remove_topic(name);
    Status offsets = offsets_.remove_topic(name);
    if (!offsets.ok()) {
        logger()->warn("Committed offsets of deleted topic {} not removed: {}", name, offsets.to_string());
    }
    return status.ok() ? offsets : status;
}

bool Broker::topic_exists(const std::string& name) const {
    return topic_manager_.topic_exists(name);
}

std::vector<std::string> Broker::list_topics() const {
    return topic_manager_.list_topics();
}

PublishResult Broker::publish(const std::string& topic_name,
                              const std::string& key,
                              const std::string& value,
                              AckLevel ack,
                              TimePoint deadline,
                              const CancellationToken* cancel) {
    PublishResult result;
    result.topic = topic_name;

    if (!running_) {
        return failed(result, Status::error(ErrorCode::SHUTTING_DOWN, "broker is shut down"));
    }

    Status status;
    auto topic = resolve_topic(topic_name, status);
    if (!topic) {
        return failed(result, status);
    }

    auto produced = topic->produce(Message(key, value), ack, deadline, cancel);
    result.partition = produced.partition_id;
    result.offset = produced.offset;
    result.timestamp_ms = produced.timestamp_ms;

    if (!produced.status.ok()) {
        Status s = produced.status.with_context(topic_name);
        if (s.retryable()) {
            logger()->warn("Publish to {} failed ({}): {}", topic_name, to_string(s.kind()), s.to_string());
        } else {
            logger()->error("Publish to {} failed ({}): {}", topic_name, to_string(s.kind()), s.to_string());
        }
        return failed(result, s);
    }
    return result;
}

PublishResult Broker::publish(const std::string& topic_name,
                              const std::string& key,
                              const std::string& value,
                              AckLevel ack) {
    return publish(topic_name, key, value, ack, default_deadline());
}

PublishResult Broker::publish(const std::string& topic_name,
                              const std::string& key,
                              const std::string& value,
                              int ack_level) {
    AckLevel ack;
    Status status = parse_ack_level(ack_level, ack);
    if (!status.ok()) {
        PublishResult result;
        result.topic = topic_name;
        return failed(result, status);
    }
    return publish(topic_name, key, value, ack, default_deadline());
}

std::vector<PublishResult> Broker::publish_batch(const std::string& topic_name,
                                                 const std::vector<PublishRecord>& records,
                                                 AckLevel ack,
                                                 TimePoint deadline,
                                                 const CancellationToken* cancel) {
    std::vector<PublishResult> results(records.size());
    for (auto& result : results) {
        result.topic = topic_name;
    }

    Status status = running_ ? Status::OK()
                             : Status::error(ErrorCode::SHUTTING_DOWN, "broker is shut down");
    std::shared_ptr<Topic> topic;
    if (status.ok()) {
        topic = resolve_topic(topic_name, status);
    }
    if (!topic) {
        for (auto& result : results) {
            result = failed(result, status);
        }
        return results;
    }

    std::vector<Message> messages;
    messages.reserve(records.size());
    for (const auto& record : records) {
        messages.emplace_back(record.key, record.value);
    }

    auto produced = topic->produce_batch(std::move(messages), ack, deadline, cancel);

    size_t failures = 0;
    Status first_failure;
    for (size_t i = 0; i < produced.size(); i++) {
        results[i].partition = produced[i].partition_id;
        results[i].offset = produced[i].offset;
        results[i].timestamp_ms = produced[i].timestamp_ms;
        if (!produced[i].status.ok()) {
            Status s = produced[i].status.with_context(topic_name);
            if (failures++ == 0) first_failure = s;
            results[i] = failed(results[i], s);
        }
    }
    if (failures > 0) {
        logger()->warn("{} of {} records published to {} failed, first: {}",
                       failures, records.size(), topic_name, first_failure.to_string());
    }
    return results;
}

std::vector<PublishResult> Broker::publish_batch(const std::string& topic_name,
                                                 const std::vector<PublishRecord>& records,
                                                 AckLevel ack) {
    return publish_batch(topic_name, records, ack, default_deadline());
}

SubscribeResult Broker::subscribe(const std::string& topic_name,
                                  const std::string& group_id,
                                  const std::string& consumer_id,
                                  TimePoint deadline) {
    SubscribeResult result;

    if (!running_) {
        result.status = Status::error(ErrorCode::SHUTTING_DOWN, "broker is shut down");
        return result;
    }
    if (!is_valid_name(group_id)) {
        result.status = Status::error(ErrorCode::INVALID_GROUP_NAME, "invalid group name '" + group_id + "'");
        return result;
    }
    if (consumer_id.empty()) {
        result.status = Status::error(ErrorCode::UNKNOWN_MEMBER, "consumer id cannot be empty");
        return result;
    }

    auto topic = resolve_topic(topic_name, result.status);
    if (!topic) {
        return result;
    }
    if (std::chrono::steady_clock::now() >= deadline) {
        result.status = Status::error(ErrorCode::TIMEOUT, "subscribe to " + topic_name + " timed out");
        return result;
    }

    auto group = coordinator_.get_or_create(topic, group_id);
    result.status = group->join(consumer_id);
    if (!result.status.ok()) {
        return result;
    }

    result.subscription = std::make_unique<Subscription>(*this, std::move(group), consumer_id);
    return result;
}

SubscribeResult Broker::subscribe(const std::string& topic_name,
                                  const std::string& group_id,
                                  const std::string& consumer_id) {
    return subscribe(topic_name, group_id, consumer_id, default_deadline());
}

Status Broker::commit(const std::string& topic_name, const std::string& group_id, uint64_t offset) {
    return commit(topic_name, group_id, 0, offset);
}

Status Broker::commit(const std::string& topic_name, const std::string& group_id,
                      uint32_t partition, uint64_t offset) {
    if (!is_valid_name(topic_name)) {
        return Status::error(ErrorCode::INVALID_TOPIC_NAME, "invalid topic name '" + topic_name + "'");
    }
    if (!is_valid_name(group_id)) {
        return Status::error(ErrorCode::INVALID_GROUP_NAME, "invalid group name '" + group_id + "'");
    }

    auto topic = topic_manager_.get_topic(topic_name);
    if (!topic) {
        return Status::error(ErrorCode::UNKNOWN_TOPIC, "unknown topic '" + topic_name + "'");
    }

    const Partition* part = topic->partition(partition);
    if (!part) {
        return Status::error(ErrorCode::INVALID_PARTITION,
                             topic_name + " has no partition " + std::to_string(partition));
    }
    if (offset >= part->high_watermark()) {
        return Status::error(ErrorCode::INVALID_OFFSET,
                             "cannot commit offset " + std::to_string(offset) + " on " + topic_name + "-" +
                             std::to_string(partition) + ", high-water mark is " +
                             std::to_string(part->high_watermark()));
    }

    Status persisted = offsets_.commit(topic_name, group_id, partition, offset);

    // In-flight state is released even when persisting failed
    if (auto group = coordinator_.find(topic_name, group_id)) {
        group->acknowledge(partition, offset);
    }
    return persisted;
}

std::optional<uint64_t> Broker::fetch_committed(const std::string& topic_name,
                                                const std::string& group_id,
                                                uint32_t partition) const {
    return offsets_.fetch_committed(topic_name, group_id, partition);
}

uint64_t Broker::high_watermark(const std::string& topic_name, uint32_t partition) const {
    auto topic = topic_manager_.get_topic(topic_name);
    if (!topic) return 0;
    const Partition* part = topic->partition(partition);
    return part ? part->high_watermark() : 0;
}

uint64_t Broker::start_offset(const std::string& topic_name, uint32_t partition) const {
    auto topic = topic_manager_.get_topic(topic_name);
    if (!topic) return 0;
    const Partition* part = topic->partition(partition);
    return part ? part->start_offset() : 0;
}

uint32_t Broker::partition_count(const std::string& topic_name) const {
    auto topic = topic_manager_.get_topic(topic_name);
    if (!topic) return 0;
    return topic->num_partitions();
}

Status Broker::delete_group(const std::string& topic_name, const std::string& group_id) {
    if (!is_valid_name(group_id)) {
        return Status::error(ErrorCode::INVALID_GROUP_NAME, "invalid group name '" + group_id + "'");
    }

    bool removed = coordinator_.remove_group(topic_name, group_id);
    Status s = offsets_.remove_group(topic_name, group_id);
    if (removed) {
        logger()->info("Deleted group {} on {}", group_id, topic_name);
    }
    return s;
}

Status Broker::heartbeat(const std::string& topic_name, const std::string& group_id,
                         const std::string& consumer_id) {
    auto group = coordinator_.find(topic_name, group_id);
    if (!group) {
        return Status::error(ErrorCode::UNKNOWN_MEMBER,
                             "no group " + group_id + " on topic " + topic_name);
    }
    return group->heartbeat(consumer_id);
}

std::shared_ptr<ConsumerGroup> Broker::group(const std::string& topic_name,
                                             const std::string& group_id) const {
    return coordinator_.find(topic_name, group_id);
}

size_t Broker::run_maintenance() {
    size_t removed = topic_manager_.apply_retention();
    coordinator_.tick();
    return removed;
}

Status Broker::flush() {
    return topic_manager_.flush_all();
}

void Broker::maintenance_loop() {
    const auto interval = std::chrono::milliseconds(config_.maintenance_interval_ms);

    while (true) {
        {
            std::unique_lock<std::mutex> lock(maintenance_mutex_);
            maintenance_cv_.wait_for(lock, interval, [this] { return !running_.load(); });
        }
        if (!running_) {
            break;
        }
        run_maintenance();
    }
}

} // namespace brook
