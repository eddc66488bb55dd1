/**
 * @file partition.cpp
 * @brief Partition write path, acknowledgments, high-water mark and long-poll reads
 */

#include "partition.h"
#include "logging.h"

#include <algorithm>
#include <future>

namespace brook {

namespace {

PublishOutcome await_completion(std::future<PublishOutcome>& done,
                                 AckLevel ack,
                                 TimePoint deadline,
                                 const CancellationToken* cancel) {
    while (true) {
        if (done.wait_until(next_wakeup(deadline)) == std::future_status::ready) {
            return done.get();
        }
        if (cancelled(cancel)) {
            PublishOutcome outcome;
            outcome.status = Status::error(ErrorCode::CANCELLED,
                                           "stopped waiting for acknowledgment; the record may still be appended");
            return outcome;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            PublishOutcome outcome;
            outcome.status = ack == AckLevel::ALL
                ? Status::error(ErrorCode::REPLICATION_TIMEOUT, "replicas did not acknowledge before the deadline")
                : Status::error(ErrorCode::TIMEOUT, "append was not flushed before the deadline");
            return outcome;
        }
    }
}

} // anonymous namespace

// =============================================================================
// Partition Implementation
// =============================================================================

Partition::Partition(const Config& config,
                     std::shared_ptr<Clock> clock,
                     std::shared_ptr<ReplicationTransport> replication,
                     std::shared_ptr<AppendNotifier> notifier)
    : config_(config)
    , clock_(clock ? std::move(clock) : system_clock())
    , replication_(std::move(replication))
    , notifier_(notifier ? std::move(notifier) : std::make_shared<AppendNotifier>()) {

    // Build partition path: base_path/topic-partition/
    path_ = config_.base_path + "/" + config_.topic_name + "-" + std::to_string(config_.partition_id);
    name_ = config_.topic_name + "-" + std::to_string(config_.partition_id);

    LogManager::Config log_config;
    log_config.base_path = path_;
    log_config.max_segment_bytes = config_.segment_max_bytes;
    log_config.max_segment_messages = config_.segment_max_messages;
    log_config.max_segment_age_ms = config_.segment_max_age_ms;
    log_config.segment_options.index_interval = config_.index_interval;
    log_config.segment_options.fsync = config_.fsync;

    log_manager_ = std::make_unique<LogManager>(log_config, clock_);

    // Everything recovered from disk was durable before the restart
    high_watermark_.store(log_manager_->end_offset());

    flow_ = std::make_unique<FlowController>(
        config_.flow,
        [this](std::vector<IngressRecord>& batch) { ingest(batch); },
        name_);
}

Partition::~Partition() {
    close();
}

void Partition::close() {
    flow_->close();
}

// =============================================================================
// Write Path
// =============================================================================

PublishOutcome Partition::publish(Message msg, AckLevel ack, TimePoint deadline,
                                  const CancellationToken* cancel) {
    if (msg.timestamp_ms == 0) {
        msg.timestamp_ms = clock_->wall_time_ms();
    }

    IngressRecord record;
    record.message = std::move(msg);
    record.ack = ack;

    std::future<PublishOutcome> done;
    if (ack != AckLevel::NONE) {
        record.completion = std::make_shared<std::promise<PublishOutcome>>();
        done = record.completion->get_future();
    }

    const uint64_t timestamp = record.message.timestamp_ms;
    Status accepted = flow_->submit(record, deadline, cancel);
    if (!accepted.ok()) {
        PublishOutcome outcome;
        outcome.status = accepted;
        return outcome;
    }

    switch (ack) {
        case AckLevel::NONE: {
            PublishOutcome outcome;
            outcome.timestamp_ms = timestamp;
            return outcome;
        }
        case AckLevel::LEADER:
        case AckLevel::ALL:
            return await_completion(done, ack, deadline, cancel);
    }
    PublishOutcome outcome;
    outcome.status = Status::error(ErrorCode::INVALID_ACK_LEVEL, "unknown ack level");
    return outcome;
}

std::vector<PublishOutcome> Partition::publish_batch(std::vector<Message> messages, AckLevel ack,
                                                     TimePoint deadline,
                                                     const CancellationToken* cancel) {
    std::vector<IngressRecord> records(messages.size());
    std::vector<std::future<PublishOutcome>> pending(messages.size());
    const uint64_t now_ms = clock_->wall_time_ms();

    for (size_t i = 0; i < messages.size(); ++i) {
        if (messages[i].timestamp_ms == 0) {
            messages[i].timestamp_ms = now_ms;
        }
        records[i].message = std::move(messages[i]);
        records[i].ack = ack;
        if (ack != AckLevel::NONE) {
            records[i].completion = std::make_shared<std::promise<PublishOutcome>>();
            pending[i] = records[i].completion->get_future();
        }
    }

    std::vector<uint64_t> timestamps;
    timestamps.reserve(records.size());
    for (const auto& record : records) {
        timestamps.push_back(record.message.timestamp_ms);
    }

    Status rejected;
    size_t accepted = flow_->submit_batch(records, deadline, cancel, rejected);

    std::vector<PublishOutcome> outcomes(records.size());
    for (size_t i = 0; i < records.size(); ++i) {
        if (i >= accepted) {
            outcomes[i].status = rejected;
            continue;
        }
        switch (ack) {
            case AckLevel::NONE:
                outcomes[i].timestamp_ms = timestamps[i];
                break;
            case AckLevel::LEADER:
            case AckLevel::ALL:
                outcomes[i] = await_completion(pending[i], ack, deadline, cancel);
                break;
        }
    }
    return outcomes;
}

AppendResult Partition::append(Message& msg) {
    if (msg.timestamp_ms == 0) {
        msg.timestamp_ms = clock_->wall_time_ms();
    }

    AppendResult result = log_manager_->append(msg);
    if (!result.ok()) {
        result.status = result.status.with_context(name_);
        return result;
    }

    Status flushed = log_manager_->flush();
    if (!flushed.ok()) {
        return {flushed.with_context(name_), 0};
    }

    advance_high_watermark(result.offset + 1);
    return result;
}

void Partition::ingest(std::vector<IngressRecord>& batch) {
    std::vector<PublishOutcome> outcomes(batch.size());
    Status append_failure;

    for (size_t i = 0; i < batch.size(); ++i) {
        Message& msg = batch[i].message;
        outcomes[i].timestamp_ms = msg.timestamp_ms;

        // After a failed write the log is rolled back; appending more would
        // hand the rolled-back offsets to later records of this batch
        if (!append_failure.ok()) {
            outcomes[i].status = append_failure;
            continue;
        }

        AppendResult result = log_manager_->append(msg);
        if (!result.ok()) {
            append_failure = result.status.with_context(name_);
            outcomes[i].status = append_failure;
            logger()->error("Append to {} failed, {} records of the batch rejected: {}",
                            name_, batch.size() - i, append_failure.to_string());
            continue;
        }
        outcomes[i].offset = result.offset;
    }

    Status flushed = log_manager_->flush();
    if (!flushed.ok()) {
        flushed = flushed.with_context(name_);
        logger()->error("Flush of {} failed, batch of {} records rejected: {}",
                        name_, batch.size(), flushed.to_string());
    }

    // Only records below the log end made it to the file
    const uint64_t written_end = log_manager_->end_offset();
    for (auto& outcome : outcomes) {
        if (!outcome.status.ok()) {
            continue;
        }
        if (!flushed.ok()) {
            outcome.status = flushed;
            outcome.offset = UNASSIGNED_OFFSET;
        } else if (outcome.offset >= written_end) {
            outcome.status = Status::error(ErrorCode::STORAGE_IO_ERROR,
                                           name_ + ": offset " + std::to_string(outcome.offset) +
                                           " was rolled back after a write failure");
            outcome.offset = UNASSIGNED_OFFSET;
        }
    }

    std::vector<MessagePtr> appended;
    uint64_t last_offset = 0;
    bool any_appended = false;
    for (size_t i = 0; i < batch.size(); ++i) {
        if (!outcomes[i].status.ok()) {
            continue;
        }
        last_offset = std::max(last_offset, outcomes[i].offset);
        any_appended = true;
        if (replication_) {
            appended.push_back(std::make_shared<Message>(batch[i].message));
        }
    }

    // Leaders are acknowledged as soon as the batch is flushed
    for (size_t i = 0; i < batch.size(); ++i) {
        if (batch[i].ack == AckLevel::LEADER && batch[i].completion) {
            batch[i].completion->set_value(outcomes[i]);
        } else if (batch[i].ack == AckLevel::NONE && !outcomes[i].status.ok()) {
            logger()->warn("Unacknowledged record to {} lost: {}", name_, outcomes[i].status.message);
        }
    }

    Status replicated;
    if (replication_ && !appended.empty()) {
        auto deadline = std::chrono::steady_clock::now() +
                        std::chrono::milliseconds(config_.replication_timeout_ms);
        replicated = replication_->replicate(config_.topic_name, config_.partition_id, appended, deadline);
        if (!replicated.ok()) {
            replicated = replicated.with_context(name_);
            logger()->warn("Replication of {} records on {} failed: {}",
                           appended.size(), name_, replicated.to_string());
        }
    }

    if (any_appended) {
        advance_high_watermark(last_offset + 1);
    }

    for (size_t i = 0; i < batch.size(); ++i) {
        if (batch[i].ack != AckLevel::ALL || !batch[i].completion) {
            continue;
        }
        if (outcomes[i].status.ok() && !replicated.ok()) {
            outcomes[i].status = replicated;
        }
        batch[i].completion->set_value(outcomes[i]);
    }
}

void Partition::advance_high_watermark(uint64_t offset) {
    uint64_t current = high_watermark_.load(std::memory_order_acquire);
    while (offset > current &&
           !high_watermark_.compare_exchange_weak(current, offset, std::memory_order_acq_rel)) {
    }
    notifier_->notify();
}

// =============================================================================
// Read Path
// =============================================================================

void Partition::stamp(MessagePtr& msg) const {
    msg->topic = config_.topic_name;
    msg->partition = config_.partition_id;
}

ReadResult Partition::read(uint64_t offset) const {
    if (offset >= high_watermark()) {
        return {Status::error(ErrorCode::OFFSET_OUT_OF_RANGE,
                              name_ + ": offset " + std::to_string(offset) +
                              " is at or beyond the high-water mark " + std::to_string(high_watermark())),
                nullptr};
    }

    ReadResult result = log_manager_->read(offset);
    if (!result.ok()) {
        result.status = result.status.with_context(name_);
        return result;
    }
    stamp(result.message);
    return result;
}

std::vector<MessagePtr> Partition::read_batch(uint64_t start_offset, size_t max_messages,
                                              Status* status) const {
    const uint64_t visible = high_watermark();
    if (status) {
        *status = Status::OK();
    }
    if (start_offset >= visible || max_messages == 0) {
        return {};
    }

    size_t limit = static_cast<size_t>(std::min<uint64_t>(max_messages, visible - start_offset));
    Status s;
    auto messages = log_manager_->read_batch(start_offset, limit, &s);
    if (!s.ok() && status) {
        *status = s.with_context(name_);
    }
    for (auto& msg : messages) {
        stamp(msg);
    }
    return messages;
}

std::vector<MessagePtr> Partition::poll(uint64_t start_offset, size_t max_messages,
                                        TimePoint deadline,
                                        const CancellationToken* cancel,
                                        Status* status) const {
    while (true) {
        uint64_t seen = notifier_->generation();
        if (start_offset < high_watermark()) {
            return read_batch(start_offset, max_messages, status);
        }
        if (cancelled(cancel)) {
            if (status) *status = Status::error(ErrorCode::CANCELLED, name_ + ": poll cancelled");
            return {};
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            if (status) *status = Status::error(ErrorCode::TIMEOUT, name_ + ": no new records before the deadline");
            return {};
        }
        notifier_->wait_for_change(seen, next_wakeup(deadline));
    }
}

uint64_t Partition::start_offset() const {
    return log_manager_->start_offset();
}

uint64_t Partition::log_end_offset() const {
    return log_manager_->end_offset();
}

// =============================================================================
// Maintenance
// =============================================================================

size_t Partition::apply_retention(const RetentionPolicy& policy) {
    return log_manager_->apply_retention(policy);
}

Status Partition::flush() {
    Status s = log_manager_->flush();
    return s.ok() ? s : s.with_context(name_);
}

Status Partition::remove_files() {
    Status s = log_manager_->remove_all();
    return s.ok() ? s : s.with_context(name_);
}

} // namespace brook
