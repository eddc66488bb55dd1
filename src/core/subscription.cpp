/**
 * @file subscription.cpp
 * @brief Subscription handle over a consumer group member
 */

#include "broker.h"
#include "logging.h"

namespace brook {

// ==================== Subscription Implementation ====================

Subscription::Subscription(Broker& broker, std::shared_ptr<ConsumerGroup> group, std::string consumer_id)
    : broker_(broker)
    , group_(std::move(group))
    , consumer_id_(std::move(consumer_id)) {}

Subscription::~Subscription() {
    if (!closed_) {
        Status s = close();
        if (!s.ok()) {
            logger()->debug("Subscription {} closed after leaving: {}", consumer_id_, s.to_string());
        }
    }
}

FetchResult Subscription::poll(size_t max_messages, TimePoint deadline, const CancellationToken* cancel) {
    if (closed_) {
        FetchResult result;
        result.status = Status::error(ErrorCode::UNKNOWN_MEMBER, "subscription " + consumer_id_ + " is closed");
        return result;
    }

    FetchResult result = group_->fetch(consumer_id_, max_messages, deadline, cancel);
    for (const auto& msg : result.messages) {
        auto& highest = delivered_[msg->partition];
        if (msg->offset + 1 > highest) {
            highest = msg->offset + 1;
        }
    }
    return result;
}

FetchResult Subscription::poll(size_t max_messages, std::chrono::milliseconds timeout) {
    return poll(max_messages, deadline_after(timeout));
}

Status Subscription::commit(uint64_t offset) {
    return commit(0, offset);
}

Status Subscription::commit(uint32_t partition, uint64_t offset) {
    return broker_.commit(topic(), group_id(), partition, offset);
}

Status Subscription::commit() {
    Status first;
    for (const auto& [partition, next] : delivered_) {
        Status s = commit(partition, next - 1);
        if (!s.ok() && first.ok()) {
            first = s;
        }
    }
    return first;
}

Status Subscription::seek(uint32_t partition, uint64_t offset) {
    Status s = group_->seek(consumer_id_, partition, offset);
    if (s.ok()) {
        delivered_.erase(partition);
    }
    return s;
}

Status Subscription::heartbeat() {
    return group_->heartbeat(consumer_id_);
}

std::vector<uint32_t> Subscription::assignment() const {
    return group_->assignment(consumer_id_);
}

Status Subscription::close() {
    if (closed_) {
        return Status::OK();
    }
    closed_ = true;
    return group_->leave(consumer_id_);
}

} // namespace brook
