/**
 * @file topic.cpp
 * @brief Topic routing and the topic registry
 */

#include "topic.h"
#include "logging.h"

#include <algorithm>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace brook {

bool is_valid_name(const std::string& name) {
    if (name.empty() || name.size() > 249 || name == "." || name == "..") {
        return false;
    }
    return std::all_of(name.begin(), name.end(), [](char c) {
        return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
               (c >= '0' && c <= '9') || c == '.' || c == '_' || c == '-';
    });
}

namespace {

Status write_meta(const std::string& path, const Topic::Config& config) {
    std::string tmp = path + ".tmp";
    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out) {
            return Status::error(ErrorCode::STORAGE_IO_ERROR, "cannot write " + tmp);
        }
        out << "name=" << config.name << "\n"
            << "num_partitions=" << config.num_partitions << "\n"
            << "segment_max_bytes=" << config.segment_max_bytes << "\n"
            << "segment_max_messages=" << config.segment_max_messages << "\n"
            << "segment_max_age_ms=" << config.segment_max_age_ms << "\n"
            << "index_interval=" << config.index_interval << "\n"
            << "retention_bytes=" << config.retention_bytes << "\n"
            << "retention_ms=" << config.retention_ms << "\n";
        out.flush();
        if (!out) {
            return Status::error(ErrorCode::STORAGE_IO_ERROR, "short write to " + tmp);
        }
    }

    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        return Status::error(ErrorCode::STORAGE_IO_ERROR, "rename " + tmp + ": " + ec.message());
    }
    return Status::OK();
}

// Storage settings from topic.meta; runtime settings stay as given
Status read_meta(const std::string& path, Topic::Config& config) {
    std::ifstream in(path);
    if (!in) {
        return Status::error(ErrorCode::STORAGE_IO_ERROR, "cannot read " + path);
    }

    std::string line;
    try {
        while (std::getline(in, line)) {
            auto eq = line.find('=');
            if (eq == std::string::npos) {
                continue;
            }
            std::string key = line.substr(0, eq);
            std::string value = line.substr(eq + 1);

            if (key == "name") config.name = value;
            else if (key == "num_partitions") config.num_partitions = static_cast<uint32_t>(std::stoul(value));
            else if (key == "segment_max_bytes") config.segment_max_bytes = std::stoull(value);
            else if (key == "segment_max_messages") config.segment_max_messages = std::stoull(value);
            else if (key == "segment_max_age_ms") config.segment_max_age_ms = std::stoull(value);
            else if (key == "index_interval") config.index_interval = static_cast<uint32_t>(std::stoul(value));
            else if (key == "retention_bytes") config.retention_bytes = std::stoull(value);
            else if (key == "retention_ms") config.retention_ms = std::stoull(value);
        }
    } catch (const std::exception& e) {
        return Status::error(ErrorCode::SEGMENT_CORRUPTED,
                             path + ": bad line '" + line + "' (" + e.what() + ")");
    }

    if (config.num_partitions == 0 || config.index_interval == 0) {
        return Status::error(ErrorCode::SEGMENT_CORRUPTED, path + ": invalid topic settings");
    }
    return Status::OK();
}

} // anonymous namespace

// =============================================================================
// Topic Implementation
// =============================================================================

bool Topic::Config::compatible_with(const Config& other) const {
    return num_partitions == other.num_partitions &&
           segment_max_bytes == other.segment_max_bytes &&
           segment_max_messages == other.segment_max_messages &&
           segment_max_age_ms == other.segment_max_age_ms &&
           index_interval == other.index_interval &&
           retention_bytes == other.retention_bytes &&
           retention_ms == other.retention_ms;
}

Topic::Topic(const Config& config,
             std::shared_ptr<Clock> clock,
             std::shared_ptr<ReplicationTransport> replication)
    : config_(config)
    , notifier_(std::make_shared<AppendNotifier>())
    , retention_(make_retention_policy(config.retention_bytes, config.retention_ms)) {

    partitions_.reserve(config_.num_partitions);

    for (uint32_t i = 0; i < config_.num_partitions; i++) {
        Partition::Config part_config;
        part_config.topic_name = config_.name;
        part_config.partition_id = i;
        part_config.base_path = config_.base_path;
        part_config.segment_max_bytes = config_.segment_max_bytes;
        part_config.segment_max_messages = config_.segment_max_messages;
        part_config.segment_max_age_ms = config_.segment_max_age_ms;
        part_config.index_interval = config_.index_interval;
        part_config.fsync = config_.fsync;
        part_config.flow = config_.flow;
        part_config.replication_timeout_ms = config_.replication_timeout_ms;

        partitions_.push_back(std::make_unique<Partition>(part_config, clock, replication, notifier_));
    }
}

Topic::~Topic() {
    close();
}

Status Topic::status() const {
    for (const auto& partition : partitions_) {
        if (!partition->status().ok()) {
            return partition->status();
        }
    }
    return Status::OK();
}

Topic::ProduceResult Topic::produce(Message msg, AckLevel ack, TimePoint deadline,
                                    const CancellationToken* cancel) {
    uint32_t partition_id = select_partition(msg);
    return produce(std::move(msg), partition_id, ack, deadline, cancel);
}

Topic::ProduceResult Topic::produce(Message msg, uint32_t partition_id, AckLevel ack,
                                    TimePoint deadline, const CancellationToken* cancel) {
    ProduceResult result;
    result.partition_id = partition_id;

    if (partition_id >= partitions_.size()) {
        result.status = Status::error(ErrorCode::INVALID_PARTITION,
                                      config_.name + ": invalid partition " + std::to_string(partition_id));
        return result;
    }

    msg.topic = config_.name;
    msg.partition = partition_id;

    PublishOutcome outcome = partitions_[partition_id]->publish(std::move(msg), ack, deadline, cancel);
    result.status = outcome.status;
    result.offset = outcome.offset;
    result.timestamp_ms = outcome.timestamp_ms;
    return result;
}

std::vector<Topic::ProduceResult> Topic::produce_batch(std::vector<Message> messages, AckLevel ack,
                                                       TimePoint deadline,
                                                       const CancellationToken* cancel) {
    std::vector<ProduceResult> results(messages.size());

    // Group by partition, keeping input order within each partition
    std::unordered_map<uint32_t, std::vector<size_t>> partition_indices;
    std::vector<uint32_t> partition_order;

    for (size_t i = 0; i < messages.size(); i++) {
        uint32_t partition_id = select_partition(messages[i]);
        messages[i].topic = config_.name;
        messages[i].partition = partition_id;
        auto& indices = partition_indices[partition_id];
        if (indices.empty()) {
            partition_order.push_back(partition_id);
        }
        indices.push_back(i);
    }

    for (uint32_t partition_id : partition_order) {
        const auto& indices = partition_indices[partition_id];

        std::vector<Message> group;
        group.reserve(indices.size());
        for (size_t idx : indices) {
            group.push_back(std::move(messages[idx]));
        }

        auto outcomes = partitions_[partition_id]->publish_batch(std::move(group), ack, deadline, cancel);
        for (size_t j = 0; j < indices.size(); j++) {
            ProduceResult& result = results[indices[j]];
            result.partition_id = partition_id;
            result.status = outcomes[j].status;
            result.offset = outcomes[j].offset;
            result.timestamp_ms = outcomes[j].timestamp_ms;
        }
    }

    return results;
}

Partition* Topic::partition(uint32_t id) {
    if (id >= partitions_.size()) return nullptr;
    return partitions_[id].get();
}

const Partition* Topic::partition(uint32_t id) const {
    if (id >= partitions_.size()) return nullptr;
    return partitions_[id].get();
}

uint32_t Topic::partition_for_key(const std::string& key) const {
    return Hasher::partition_for_key(key, static_cast<uint32_t>(partitions_.size()));
}

std::unordered_map<uint32_t, uint64_t> Topic::start_offsets() const {
    std::unordered_map<uint32_t, uint64_t> offsets;
    for (uint32_t i = 0; i < partitions_.size(); i++) {
        offsets[i] = partitions_[i]->start_offset();
    }
    return offsets;
}

std::unordered_map<uint32_t, uint64_t> Topic::high_watermarks() const {
    std::unordered_map<uint32_t, uint64_t> offsets;
    for (uint32_t i = 0; i < partitions_.size(); i++) {
        offsets[i] = partitions_[i]->high_watermark();
    }
    return offsets;
}

size_t Topic::apply_retention() {
    size_t removed = 0;
    for (auto& partition : partitions_) {
        removed += partition->apply_retention(*retention_);
    }
    return removed;
}

Status Topic::flush() {
    Status first;
    for (auto& partition : partitions_) {
        Status s = partition->flush();
        if (!s.ok() && first.ok()) {
            first = s;
        }
    }
    return first;
}

void Topic::close() {
    for (auto& partition : partitions_) {
        partition->close();
    }
}

Status Topic::remove_files() {
    Status first;
    for (auto& partition : partitions_) {
        Status s = partition->remove_files();
        if (!s.ok() && first.ok()) {
            first = s;
        }
    }

    std::error_code ec;
    fs::remove_all(config_.base_path, ec);
    if (ec && first.ok()) {
        first = Status::error(ErrorCode::STORAGE_IO_ERROR,
                              "remove " + config_.base_path + ": " + ec.message());
    }
    return first;
}

uint32_t Topic::select_partition(const Message& msg) const {
    if (msg.has_key()) {
        return Hasher::partition_for_key(msg.key, static_cast<uint32_t>(partitions_.size()));
    }

    // Round-robin for messages without keys
    uint32_t idx = round_robin_counter_.fetch_add(1, std::memory_order_relaxed);
    return idx % static_cast<uint32_t>(partitions_.size());
}

// =============================================================================
// TopicManager Implementation
// =============================================================================

TopicManager::TopicManager(const Config& config,
                           std::shared_ptr<Clock> clock,
                           std::shared_ptr<ReplicationTransport> replication)
    : config_(config)
    , clock_(clock ? std::move(clock) : system_clock())
    , replication_(std::move(replication)) {

    std::error_code ec;
    fs::create_directories(config_.base_path, ec);
    if (ec) {
        logger()->error("Cannot create topic directory {}: {}", config_.base_path, ec.message());
    }
}

TopicManager::~TopicManager() {
    close_all();
}

Topic::Config TopicManager::default_config(const std::string& name) const {
    Topic::Config config = config_.defaults;
    config.name = name;
    config.base_path = topic_path(name);
    return config;
}

std::shared_ptr<Topic> TopicManager::create_topic(const Topic::Config& config, Status& status) {
    Topic::Config requested = default_config(config.name);
    requested.num_partitions = config.num_partitions;
    requested.segment_max_bytes = config.segment_max_bytes;
    requested.segment_max_messages = config.segment_max_messages;
    requested.segment_max_age_ms = config.segment_max_age_ms;
    requested.index_interval = config.index_interval;
    requested.retention_bytes = config.retention_bytes;
    requested.retention_ms = config.retention_ms;
    return open_topic(requested, true, status);
}

std::shared_ptr<Topic> TopicManager::create_topic(const std::string& name, uint32_t num_partitions,
                                                  Status& status) {
    Topic::Config config = default_config(name);
    if (num_partitions > 0) {
        config.num_partitions = num_partitions;
    }
    return open_topic(config, true, status);
}

std::shared_ptr<Topic> TopicManager::get_or_create_topic(const std::string& name, Status& status) {
    if (auto topic = get_topic(name)) {
        status = Status::OK();
        return topic;
    }
    return open_topic(default_config(name), false, status);
}

std::shared_ptr<Topic> TopicManager::open_topic(const Topic::Config& config, bool check_conflict,
                                                Status& status) {
    if (!is_valid_name(config.name)) {
        status = Status::error(ErrorCode::INVALID_TOPIC_NAME, "invalid topic name '" + config.name + "'");
        return nullptr;
    }
    if (config.num_partitions == 0) {
        status = Status::error(ErrorCode::TOPIC_CONFIG_CONFLICT,
                               config.name + ": a topic needs at least one partition");
        return nullptr;
    }

    std::shared_ptr<TopicSlot> slot;
    {
        std::shared_lock lock(mutex_);
        auto it = topics_.find(config.name);
        if (it != topics_.end()) {
            slot = it->second;
        }
    }
    if (!slot) {
        std::unique_lock lock(mutex_);
        auto& entry = topics_[config.name];
        if (!entry) {
            entry = std::make_shared<TopicSlot>();
        }
        slot = entry;
    }

    // Construction runs outside the registry lock, once per slot
    std::call_once(slot->once, [&] {
        slot->topic = build_topic(config, slot->status);
        slot->ready.store(true, std::memory_order_release);
    });

    if (!slot->status.ok()) {
        status = slot->status;
        std::unique_lock lock(mutex_);
        auto it = topics_.find(config.name);
        if (it != topics_.end() && it->second == slot) {
            topics_.erase(it);
        }
        return nullptr;
    }

    if (check_conflict && !slot->topic->config().compatible_with(config)) {
        status = Status::error(ErrorCode::TOPIC_CONFIG_CONFLICT,
                               "topic " + config.name + " exists with " +
                               std::to_string(slot->topic->num_partitions()) +
                               " partitions and different settings");
        return nullptr;
    }

    status = Status::OK();
    return slot->topic;
}

std::shared_ptr<Topic> TopicManager::build_topic(const Topic::Config& config, Status& status) {
    std::error_code ec;
    fs::create_directories(config.base_path, ec);
    if (ec) {
        status = Status::error(ErrorCode::STORAGE_IO_ERROR,
                               "create " + config.base_path + ": " + ec.message());
        return nullptr;
    }

    std::string meta_path = config.base_path + "/" + META_FILE;
    if (!fs::exists(meta_path)) {
        status = write_meta(meta_path, config);
        if (!status.ok()) {
            return nullptr;
        }
    }

    auto topic = std::make_shared<Topic>(config, clock_, replication_);
    status = topic->status();
    if (!status.ok()) {
        logger()->error("Topic {} failed to open: {}", config.name, status.to_string());
        topic->close();
        return nullptr;
    }

    logger()->info("Opened topic {} with {} partitions", config.name, config.num_partitions);
    return topic;
}

std::shared_ptr<Topic> TopicManager::get_topic(const std::string& name) const {
    std::shared_lock lock(mutex_);

    auto it = topics_.find(name);
    if (it == topics_.end() || !it->second->ready.load(std::memory_order_acquire)) {
        return nullptr;
    }
    return it->second->topic;
}

bool TopicManager::topic_exists(const std::string& name) const {
    return get_topic(name) != nullptr;
}

Status TopicManager::delete_topic(const std::string& name) {
    std::shared_ptr<Topic> topic;
    {
        std::unique_lock lock(mutex_);
        auto it = topics_.find(name);
        if (it == topics_.end() || !it->second->ready.load(std::memory_order_acquire) ||
            !it->second->topic) {
            return Status::error(ErrorCode::UNKNOWN_TOPIC, "unknown topic '" + name + "'");
        }
        topic = it->second->topic;
        topics_.erase(it);
    }

    topic->close();
    Status s = topic->remove_files();
    if (!s.ok()) {
        logger()->warn("Deleted topic {} but files remain: {}", name, s.to_string());
        return s;
    }
    logger()->info("Deleted topic {}", name);
    return Status::OK();
}

std::vector<std::shared_ptr<Topic>> TopicManager::ready_topics() const {
    std::shared_lock lock(mutex_);

    std::vector<std::shared_ptr<Topic>> topics;
    topics.reserve(topics_.size());
    for (const auto& [_, slot] : topics_) {
        if (slot->ready.load(std::memory_order_acquire) && slot->topic) {
            topics.push_back(slot->topic);
        }
    }
    return topics;
}

std::vector<std::string> TopicManager::list_topics() const {
    std::vector<std::string> names;
    for (const auto& topic : ready_topics()) {
        names.push_back(topic->name());
    }
    std::sort(names.begin(), names.end());
    return names;
}

Status TopicManager::flush_all() {
    Status first;
    for (auto& topic : ready_topics()) {
        Status s = topic->flush();
        if (!s.ok() && first.ok()) {
            first = s;
        }
    }
    return first;
}

size_t TopicManager::apply_retention() {
    size_t removed = 0;
    for (auto& topic : ready_topics()) {
        removed += topic->apply_retention();
    }
    return removed;
}

Status TopicManager::load_topics() {
    std::error_code ec;
    if (!fs::exists(config_.base_path, ec)) {
        return Status::OK();
    }

    Status first;
    for (const auto& entry : fs::directory_iterator(config_.base_path, ec)) {
        if (!entry.is_directory()) continue;

        std::string meta_path = (entry.path() / META_FILE).string();
        if (!fs::exists(meta_path)) continue;

        Topic::Config config = default_config(entry.path().filename().string());
        Status s = read_meta(meta_path, config);
        if (s.ok()) {
            // The directory name wins over a stale name line
            config.name = entry.path().filename().string();
            open_topic(config, false, s);
        }
        if (!s.ok()) {
            logger()->error("Skipping topic in {}: {}", entry.path().string(), s.to_string());
            if (first.ok()) first = s;
        }
    }
    if (ec) {
        return Status::error(ErrorCode::STORAGE_IO_ERROR,
                             "scan " + config_.base_path + ": " + ec.message());
    }
    return first;
}

void TopicManager::close_all() {
    for (auto& topic : ready_topics()) {
        topic->close();
    }
}

std::string TopicManager::topic_path(const std::string& name) const {
    return config_.base_path + "/" + name;
}

} // namespace brook
