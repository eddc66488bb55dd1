#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "clock.h"
#include "errors.h"
#include "message.h"
#include "replication.h"
#include "thread_safe_queue.h"

namespace brook {

/**
 * @brief What a publisher learns about one record
 */
struct PublishOutcome {
    Status status;
    uint64_t offset{UNASSIGNED_OFFSET};
    uint64_t timestamp_ms{0};
};

/**
 * @brief A record accepted for ingestion but not yet appended
 *
 * completion is set for ack levels that wait; the ingestion thread
 * fulfils it once the record's batch is durable (or failed).
 */
struct IngressRecord {
    Message message;
    AckLevel ack{AckLevel::LEADER};
    std::shared_ptr<std::promise<PublishOutcome>> completion;
};

// =============================================================================
// FlowController - bounded ingress buffer with a batching drain thread
// =============================================================================
// Sits between "accepted" and "durably appended" for one partition.
// Publishers block while the buffer is full, up to their deadline.
// One thread drains batches into the handler in submission order.

class FlowController {
public:
    struct Config {
        size_t capacity{10000};        // Records buffered before backpressure
        size_t max_batch_size{100};    // Records handed to the handler at once
        uint32_t linger_ms{0};         // Wait for a batch to fill
    };

    using BatchHandler = std::function<void(std::vector<IngressRecord>&)>;

    FlowController(const Config& config, BatchHandler handler, std::string name);
    ~FlowController();

    FlowController(const FlowController&) = delete;
    FlowController& operator=(const FlowController&) = delete;

    /**
     * @brief Accept one record, waiting for space until the deadline
     *
     * BACKPRESSURE_TIMEOUT when the buffer stays full, CANCELLED when the
     * token fires, SHUTTING_DOWN after close(). A rejected record was not
     * enqueued.
     */
    Status submit(IngressRecord& record, TimePoint deadline, const CancellationToken* cancel = nullptr);

    /**
     * @brief Accept records in order until one is rejected
     *
     * @return Number of leading records accepted; `status` explains why
     * the next one was not
     */
    size_t submit_batch(std::vector<IngressRecord>& records,
                        TimePoint deadline,
                        const CancellationToken* cancel,
                        Status& status);

    /**
     * @brief Stop accepting, drain what was accepted, join the thread
     */
    void close();

    bool is_closed() const { return queue_.is_closed(); }
    size_t buffered() const { return queue_.size(); }
    size_t capacity() const { return queue_.capacity(); }
    uint64_t batches_drained() const { return batches_drained_.load(std::memory_order_relaxed); }
    uint64_t records_drained() const { return records_drained_.load(std::memory_order_relaxed); }

private:
    void drain_loop();
    Status rejection(QueueStatus status) const;

    Config config_;
    BatchHandler handler_;
    std::string name_;

    ThreadSafeQueue<IngressRecord> queue_;
    std::thread drain_thread_;
    std::mutex close_mutex_;

    std::atomic<uint64_t> batches_drained_{0};
    std::atomic<uint64_t> records_drained_{0};
};

} // namespace brook
