/**
 * @file producer.cpp
 * @brief Producer client with synchronous sends and a bounded async batch buffer
 */

#include "broker.h"
#include "logging.h"

#include <algorithm>

namespace brook {

// ==================== Producer Implementation ====================

Producer::Producer(std::shared_ptr<Broker> broker, const std::string& topic, AckLevel ack)
    : broker_(std::move(broker))
    , topic_(topic)
    , ack_(ack)
    , batch_size_(100)
    , linger_ms_(5)
    , buffer_capacity_(DEFAULT_BUFFER_CAPACITY)
    , send_timeout_ms_(broker_->config().default_timeout_ms)
    , running_(true) {

    // Start background flush thread
    flush_thread_ = std::thread(&Producer::flush_loop, this);
}

Producer::~Producer() {
    {
        std::lock_guard<std::mutex> lock(buffer_mutex_);
        running_ = false;
    }
    buffer_cv_.notify_all();
    if (flush_thread_.joinable()) {
        flush_thread_.join();
    }
    flush();
}

PublishResult Producer::send(const std::string& key, const std::string& value) {
    return broker_->publish(topic_, key, value, ack_);
}

std::vector<PublishResult> Producer::send_batch(
    const std::vector<std::pair<std::string, std::string>>& messages) {

    std::vector<PublishRecord> batch;
    batch.reserve(messages.size());

    for (const auto& [key, value] : messages) {
        batch.push_back({key, value});
    }

    return broker_->publish_batch(topic_, batch, ack_);
}

void Producer::send_async(const std::string& key, const std::string& value,
                          PublishCallback callback) {
    {
        std::unique_lock<std::mutex> lock(buffer_mutex_);
        auto deadline = deadline_after(std::chrono::milliseconds(send_timeout_ms_.load()));
        bool has_space = buffer_cv_.wait_until(lock, deadline, [this] {
            return buffer_.size() < buffer_capacity_.load();
        });
        if (has_space) {
            buffer_.push_back({{key, value}, std::move(callback)});
            buffer_cv_.notify_all();
            return;
        }
    }

    logger()->warn("Producer buffer for {} stayed full for {} ms, record rejected",
                   topic_, send_timeout_ms_.load());
    if (callback) {
        PublishResult result;
        result.code = ErrorCode::BACKPRESSURE_TIMEOUT;
        result.error = "producer buffer for " + topic_ + " is full";
        result.topic = topic_;
        callback(result);
    }
}

void Producer::flush() {
    std::lock_guard<std::mutex> send_lock(send_mutex_);

    std::vector<PendingMessage> to_send;
    {
        std::lock_guard<std::mutex> lock(buffer_mutex_);
        to_send.swap(buffer_);
    }
    buffer_cv_.notify_all();
    if (to_send.empty()) {
        return;
    }

    std::vector<PublishRecord> records;
    records.reserve(to_send.size());
    for (const auto& msg : to_send) {
        records.push_back(msg.record);
    }

    auto results = broker_->publish_batch(topic_, records, ack_);
    for (size_t i = 0; i < to_send.size(); i++) {
        if (to_send[i].callback) {
            to_send[i].callback(results[i]);
        }
    }
}

void Producer::set_batch_size(size_t size) {
    batch_size_ = size > 0 ? size : 1;
}

void Producer::set_linger_ms(uint32_t ms) {
    linger_ms_ = ms;
}

void Producer::set_buffer_capacity(size_t capacity) {
    buffer_capacity_ = capacity > 0 ? capacity : 1;
    buffer_cv_.notify_all();
}

void Producer::set_send_timeout_ms(uint32_t ms) {
    send_timeout_ms_ = ms;
}

void Producer::flush_loop() {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(buffer_mutex_);
            buffer_cv_.wait(lock, [this] { return !running_ || !buffer_.empty(); });
            if (!running_) {
                break;
            }

            // Linger for a full batch; a full buffer goes out at once
            buffer_cv_.wait_for(lock, std::chrono::milliseconds(linger_ms_.load()), [this] {
                return !running_ ||
                       buffer_.size() >= std::min(batch_size_.load(), buffer_capacity_.load());
            });
            if (!running_) {
                break;
            }
        }
        flush();
    }
}

} // namespace brook
