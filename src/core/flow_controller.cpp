/**
 * @file flow_controller.cpp
 * @brief Bounded ingress buffer and drain thread of a partition
 */

#include "flow_controller.h"
#include "logging.h"

namespace brook {

// =============================================================================
// AckLevel
// =============================================================================

const char* to_string(AckLevel level) {
    switch (level) {
        case AckLevel::NONE:   return "none";
        case AckLevel::LEADER: return "leader";
        case AckLevel::ALL:    return "all";
    }
    return "unknown";
}

Status parse_ack_level(int value, AckLevel& level) {
    switch (value) {
        case 0: level = AckLevel::NONE;   return Status::OK();
        case 1: level = AckLevel::LEADER; return Status::OK();
        case 2: level = AckLevel::ALL;    return Status::OK();
        default:
            return Status::error(ErrorCode::INVALID_ACK_LEVEL,
                                 "ack level must be 0, 1 or 2, got " + std::to_string(value));
    }
}

// =============================================================================
// FlowController Implementation
// =============================================================================

FlowController::FlowController(const Config& config, BatchHandler handler, std::string name)
    : config_(config)
    , handler_(std::move(handler))
    , name_(std::move(name))
    , queue_(config.capacity) {
    drain_thread_ = std::thread(&FlowController::drain_loop, this);
}

FlowController::~FlowController() {
    close();
}

Status FlowController::rejection(QueueStatus status) const {
    switch (status) {
        case QueueStatus::OK:
            return Status::OK();
        case QueueStatus::TIMED_OUT:
            return Status::error(ErrorCode::BACKPRESSURE_TIMEOUT,
                                 "ingress buffer for " + name_ + " full (" +
                                 std::to_string(queue_.capacity()) + " records)");
        case QueueStatus::CANCELLED:
            return Status::error(ErrorCode::CANCELLED, "publish to " + name_ + " cancelled");
        case QueueStatus::CLOSED:
            return Status::error(ErrorCode::SHUTTING_DOWN, name_ + " is closed");
    }
    return Status::error(ErrorCode::SHUTTING_DOWN, name_ + " is closed");
}

Status FlowController::submit(IngressRecord& record, TimePoint deadline, const CancellationToken* cancel) {
    return rejection(queue_.enqueue_until(record, deadline, cancel));
}

size_t FlowController::submit_batch(std::vector<IngressRecord>& records,
                                    TimePoint deadline,
                                    const CancellationToken* cancel,
                                    Status& status) {
    status = Status::OK();
    size_t accepted = 0;
    for (auto& record : records) {
        status = submit(record, deadline, cancel);
        if (!status.ok()) {
            break;
        }
        ++accepted;
    }
    return accepted;
}

void FlowController::close() {
    std::lock_guard<std::mutex> lock(close_mutex_);
    queue_.close();
    if (drain_thread_.joinable()) {
        drain_thread_.join();
    }
}

void FlowController::drain_loop() {
    std::vector<IngressRecord> batch;
    batch.reserve(config_.max_batch_size);

    while (true) {
        batch.clear();
        size_t taken = queue_.dequeue_batch(batch, config_.max_batch_size,
                                            std::chrono::milliseconds(config_.linger_ms));
        if (taken == 0) {
            break;  // closed and drained
        }

        handler_(batch);
        batches_drained_.fetch_add(1, std::memory_order_relaxed);
        records_drained_.fetch_add(taken, std::memory_order_relaxed);
    }

    logger()->debug("Ingestion for {} stopped after {} batches", name_, batches_drained());
}

} // namespace brook
