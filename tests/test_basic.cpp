/**
 * @file test_basic.cpp
 * @brief Basic tests for the broker's building blocks
 *
 * Run with: ./test_basic
 *
 * These tests verify the core components work correctly:
 * - Message creation and payload encoding
 * - CRC-32 and key hashing
 * - Bounded queue operations, deadlines and cancellation
 * - Configuration management
 * - Error codes and ack levels
 */

#include <iostream>
#include <thread>
#include <vector>
#include <chrono>
#include <atomic>
#include <set>
#include <stdexcept>

#include "config.h"
#include "errors.h"
#include "hash.h"
#include "message.h"
#include "replication.h"
#include "thread_safe_queue.h"

using namespace brook;
using namespace std::chrono_literals;

// Simple test framework
#define TEST(name) void test_##name()
#define RUN_TEST(name) do { \
    std::cout << "Running " #name "... "; \
    try { \
        test_##name(); \
        std::cout << "PASSED" << std::endl; \
    } catch (const std::exception& e) { \
        std::cout << "FAILED: " << e.what() << std::endl; \
        failures++; \
    } \
} while(0)

#define ASSERT(condition) do { \
    if (!(condition)) { \
        throw std::runtime_error("Assertion failed: " #condition); \
    } \
} while(0)

#define ASSERT_EQ(a, b) do { \
    if ((a) != (b)) { \
        throw std::runtime_error("Assertion failed: " #a " == " #b); \
    } \
} while(0)

int failures = 0;

// =============================================================================
// Message Tests
// =============================================================================

TEST(message_creation) {
    auto msg = make_message("test-key", "test-value");

    ASSERT(msg != nullptr);
    ASSERT(msg->key == "test-key");
    ASSERT(msg->value == "test-value");
    ASSERT(msg->has_key());
    ASSERT(msg->total_size() == 18); // "test-key" + "test-value"
    ASSERT(Message::current_time_ms() > 0);
}

TEST(message_empty_key_means_no_key) {
    Message msg("", "payload");
    ASSERT(!msg.has_key());
}

TEST(message_payload_layout) {
    Message msg("ab", "xyz");
    msg.offset = 0x0102030405060708ULL;
    msg.timestamp_ms = 42;

    auto bytes = msg.serialize();
    ASSERT_EQ(bytes.size(), Message::PAYLOAD_FIXED_SIZE + 5);
    ASSERT_EQ(bytes.size(), msg.serialized_size());

    // Little-endian offset first
    ASSERT_EQ(bytes[0], 0x08);
    ASSERT_EQ(bytes[7], 0x01);
    // Then the timestamp
    ASSERT_EQ(bytes[8], 42);
    // Key length and key
    ASSERT_EQ(bytes[16], 2);
    ASSERT_EQ(bytes[20], 'a');
    ASSERT_EQ(bytes[21], 'b');
    // Value length and value
    ASSERT_EQ(bytes[22], 3);
    ASSERT_EQ(bytes[26], 'x');

    auto decoded = Message::deserialize(bytes.data(), bytes.size());
    ASSERT(decoded != nullptr);
    ASSERT_EQ(decoded->offset, msg.offset);
    ASSERT_EQ(decoded->timestamp_ms, 42u);
    ASSERT(decoded->key == "ab");
    ASSERT(decoded->value == "xyz");
}

TEST(message_deserialize_rejects_bad_sizes) {
    Message msg("key", "value");
    auto bytes = msg.serialize();

    ASSERT(Message::deserialize(bytes.data(), bytes.size() - 1) == nullptr);
    ASSERT(Message::deserialize(bytes.data(), 10) == nullptr);

    bytes.push_back(0);
    ASSERT(Message::deserialize(bytes.data(), bytes.size()) == nullptr);
}

TEST(message_serialize_to_appends) {
    Message msg("k", "v");
    std::vector<uint8_t> out = {0xAA};
    msg.serialize_to(out);
    ASSERT_EQ(out.size(), 1 + msg.serialized_size());
    ASSERT_EQ(out[0], 0xAA);
}

// =============================================================================
// Checksum and Hash Tests
// =============================================================================

TEST(crc32_check_value) {
    const char* data = "123456789";
    ASSERT_EQ(crc32(data, 9), 0xCBF43926u);
    ASSERT_EQ(crc32(data, 0), 0u);
}

TEST(crc32_incremental) {
    const char* data = "123456789";
    uint32_t partial = crc32(data, 4);
    ASSERT_EQ(crc32_update(partial, data + 4, 5), 0xCBF43926u);
}

TEST(hash_partition_is_stable) {
    uint32_t p1 = Hasher::partition_for_key("user-42", 8);
    uint32_t p2 = Hasher::partition_for_key("user-42", 8);
    ASSERT_EQ(p1, p2);
    ASSERT(p1 < 8);
    ASSERT_EQ(Hasher::partition_for_key("anything", 0), 0u);
}

TEST(hash_spreads_keys) {
    std::set<uint32_t> used;
    for (int i = 0; i < 200; i++) {
        used.insert(Hasher::partition_for_key("key-" + std::to_string(i), 4));
    }
    ASSERT_EQ(used.size(), 4u);
}

TEST(consistent_hash_ring) {
    ConsistentHashRing ring(50);
    ASSERT(ring.empty());
    ASSERT(ring.get_node("x").empty());

    ring.add_node("a");
    ring.add_node("b");
    std::string owner = ring.get_node("some-key");
    ASSERT(owner == "a" || owner == "b");

    ring.remove_node("a");
    ASSERT(ring.get_node("some-key") == "b");
}

// =============================================================================
// Queue Tests
// =============================================================================

// Enqueue without waiting for space
QueueStatus offer(ThreadSafeQueue<int>& queue, int value) {
    return queue.enqueue_until(value, deadline_after(0ms));
}

TEST(queue_basic_operations) {
    ThreadSafeQueue<int> queue(10);

    ASSERT_EQ(queue.size(), 0u);
    ASSERT(offer(queue, 42) == QueueStatus::OK);
    ASSERT_EQ(queue.size(), 1u);

    std::vector<int> out;
    ASSERT_EQ(queue.dequeue_batch(out, 1), 1u);
    ASSERT_EQ(out[0], 42);
    ASSERT_EQ(queue.size(), 0u);
}

TEST(queue_capacity) {
    ThreadSafeQueue<int> queue(3);
    ASSERT_EQ(queue.capacity(), 3u);

    ASSERT(offer(queue, 1) == QueueStatus::OK);
    ASSERT(offer(queue, 2) == QueueStatus::OK);
    ASSERT(offer(queue, 3) == QueueStatus::OK);
    ASSERT(offer(queue, 4) == QueueStatus::TIMED_OUT); // Queue full

    std::vector<int> out;
    ASSERT_EQ(queue.dequeue_batch(out, 1), 1u);
    ASSERT(offer(queue, 4) == QueueStatus::OK); // Now has space
}

TEST(queue_enqueue_until_times_out) {
    ThreadSafeQueue<int> queue(1);
    ASSERT(offer(queue, 1) == QueueStatus::OK);

    int item = 2;
    auto start = std::chrono::steady_clock::now();
    auto status = queue.enqueue_until(item, deadline_after(30ms));
    auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT(status == QueueStatus::TIMED_OUT);
    ASSERT(elapsed >= 30ms);
    ASSERT_EQ(queue.size(), 1u);
}

TEST(queue_enqueue_until_cancelled) {
    ThreadSafeQueue<int> queue(1);
    ASSERT(offer(queue, 1) == QueueStatus::OK);

    CancellationToken token;
    std::thread canceller([&] {
        std::this_thread::sleep_for(20ms);
        token.cancel();
    });

    int item = 2;
    auto status = queue.enqueue_until(item, deadline_after(5s), &token);
    canceller.join();

    ASSERT(status == QueueStatus::CANCELLED);
    ASSERT_EQ(queue.size(), 1u);
}

TEST(queue_enqueue_until_waits_for_space) {
    ThreadSafeQueue<int> queue(1);
    ASSERT(offer(queue, 1) == QueueStatus::OK);

    std::thread consumer([&] {
        std::this_thread::sleep_for(20ms);
        std::vector<int> out;
        queue.dequeue_batch(out, 1);
    });

    int item = 2;
    auto status = queue.enqueue_until(item, deadline_after(5s));
    consumer.join();

    ASSERT(status == QueueStatus::OK);
    std::vector<int> out;
    ASSERT_EQ(queue.dequeue_batch(out, 1), 1u);
    ASSERT_EQ(out[0], 2);
}

TEST(queue_closed_rejects) {
    ThreadSafeQueue<int> queue(4);
    queue.close();
    ASSERT(queue.is_closed());

    int item = 1;
    ASSERT(queue.enqueue_until(item, deadline_after(1s)) == QueueStatus::CLOSED);
    ASSERT(offer(queue, 2) == QueueStatus::CLOSED);
}

TEST(queue_dequeue_batch) {
    ThreadSafeQueue<int> queue(100);
    for (int i = 0; i < 10; i++) {
        ASSERT(offer(queue, i) == QueueStatus::OK);
    }

    std::vector<int> batch;
    ASSERT_EQ(queue.dequeue_batch(batch, 4), 4u);
    ASSERT_EQ(batch.size(), 4u);
    ASSERT_EQ(batch[0], 0);
    ASSERT_EQ(batch[3], 3);

    batch.clear();
    ASSERT_EQ(queue.dequeue_batch(batch, 100, 5ms), 6u);
    ASSERT_EQ(batch.front(), 4);

    queue.close();
    batch.clear();
    ASSERT_EQ(queue.dequeue_batch(batch, 10), 0u);
}

TEST(queue_multithreaded) {
    ThreadSafeQueue<int> queue(16);
    const int num_items = 1000;
    std::atomic<int> sum{0};

    std::thread producer([&]() {
        for (int i = 1; i <= num_items; ++i) {
            int item = i;
            queue.enqueue_until(item, deadline_after(10s));
        }
        queue.close();
    });

    std::thread consumer([&]() {
        std::vector<int> batch;
        while (queue.dequeue_batch(batch, 8) > 0) {
            for (int value : batch) {
                sum += value;
            }
            batch.clear();
        }
    });

    producer.join();
    consumer.join();

    ASSERT_EQ(sum.load(), num_items * (num_items + 1) / 2);
}

// =============================================================================
// Config Tests
// =============================================================================

TEST(config_defaults_are_valid) {
    BrokerConfig config;
    ASSERT(config.validate().empty());
    ASSERT(config.auto_create_topics);
    ASSERT_EQ(config.log_index_interval, 32u);
    ASSERT(config.assignment_strategy == "range");
}

TEST(config_validation) {
    BrokerConfig config;
    config.default_partition_count = 0;
    ASSERT(!config.validate().empty());

    config = BrokerConfig{};
    config.assignment_strategy = "sticky";
    ASSERT(!config.validate().empty());

    config = BrokerConfig{};
    config.ingress_buffer_capacity = 0;
    ASSERT(!config.validate().empty());
}

TEST(config_manager_rejects_invalid_update) {
    auto before = ConfigManager::instance().get_config();

    std::string error = ConfigManager::instance().update([](BrokerConfig& cfg) {
        cfg.max_batch_size = 0;
    });
    ASSERT(!error.empty());
    ASSERT_EQ(ConfigManager::instance().get_config().max_batch_size, before.max_batch_size);
}

TEST(config_scope_restores) {
    auto before = ConfigManager::instance().get_config();
    {
        ConfigScope scope([](BrokerConfig& cfg) { cfg.default_partition_count = 7; });
        ASSERT(scope.error().empty());
        ASSERT_EQ(ConfigManager::instance().get_config().default_partition_count, 7u);
    }
    ASSERT_EQ(ConfigManager::instance().get_config().default_partition_count,
              before.default_partition_count);
}

// =============================================================================
// Error and Ack Level Tests
// =============================================================================

TEST(error_taxonomy) {
    ASSERT(classify(ErrorCode::BACKPRESSURE_TIMEOUT) == ErrorKind::TRANSIENT);
    ASSERT(classify(ErrorCode::REPLICATION_TIMEOUT) == ErrorKind::TRANSIENT);
    ASSERT(classify(ErrorCode::STORAGE_IO_ERROR) == ErrorKind::TRANSIENT);
    ASSERT(classify(ErrorCode::SEGMENT_CORRUPTED) == ErrorKind::PERMANENT);
    ASSERT(classify(ErrorCode::OFFSET_OUT_OF_RANGE) == ErrorKind::PERMANENT);
    ASSERT(classify(ErrorCode::TOPIC_CONFIG_CONFLICT) == ErrorKind::PERMANENT);
    ASSERT(classify(ErrorCode::INVALID_TOPIC_NAME) == ErrorKind::CALLER);
    ASSERT(classify(ErrorCode::INVALID_ACK_LEVEL) == ErrorKind::CALLER);
    ASSERT(classify(ErrorCode::INVALID_OFFSET) == ErrorKind::CALLER);
    ASSERT(classify(ErrorCode::NONE) == ErrorKind::NONE);
}

TEST(status_context) {
    Status ok = Status::OK();
    ASSERT(ok.ok());
    ASSERT(ok.with_context("ignored").ok());
    ASSERT(ok.to_string() == "OK");

    Status s = Status::error(ErrorCode::STORAGE_IO_ERROR, "pwrite failed");
    Status wrapped = s.with_context("orders-0").with_context("orders");
    ASSERT(wrapped.code == ErrorCode::STORAGE_IO_ERROR);
    ASSERT(wrapped.message == "orders: orders-0: pwrite failed");
    ASSERT(wrapped.retryable());
    ASSERT(wrapped.to_string() == "STORAGE_IO_ERROR: orders: orders-0: pwrite failed");
}

TEST(ack_level_parsing) {
    AckLevel level = AckLevel::NONE;
    ASSERT(parse_ack_level(0, level).ok() && level == AckLevel::NONE);
    ASSERT(parse_ack_level(1, level).ok() && level == AckLevel::LEADER);
    ASSERT(parse_ack_level(2, level).ok() && level == AckLevel::ALL);

    Status bad = parse_ack_level(3, level);
    ASSERT(bad.code == ErrorCode::INVALID_ACK_LEVEL);
    ASSERT(parse_ack_level(-1, level).code == ErrorCode::INVALID_ACK_LEVEL);
    ASSERT(std::string(to_string(AckLevel::ALL)) == "all");
}

// =============================================================================
// Main
// =============================================================================

int main() {
    std::cout << "\n=== Basic Tests ===\n" << std::endl;

    std::cout << "--- Message Tests ---" << std::endl;
    RUN_TEST(message_creation);
    RUN_TEST(message_empty_key_means_no_key);
    RUN_TEST(message_payload_layout);
    RUN_TEST(message_deserialize_rejects_bad_sizes);
    RUN_TEST(message_serialize_to_appends);

    std::cout << "\n--- Checksum and Hash Tests ---" << std::endl;
    RUN_TEST(crc32_check_value);
    RUN_TEST(crc32_incremental);
    RUN_TEST(hash_partition_is_stable);
    RUN_TEST(hash_spreads_keys);
    RUN_TEST(consistent_hash_ring);

    std::cout << "\n--- Queue Tests ---" << std::endl;
    RUN_TEST(queue_basic_operations);
    RUN_TEST(queue_capacity);
    RUN_TEST(queue_enqueue_until_times_out);
    RUN_TEST(queue_enqueue_until_cancelled);
    RUN_TEST(queue_enqueue_until_waits_for_space);
    RUN_TEST(queue_closed_rejects);
    RUN_TEST(queue_dequeue_batch);
    RUN_TEST(queue_multithreaded);

    std::cout << "\n--- Config Tests ---" << std::endl;
    RUN_TEST(config_defaults_are_valid);
    RUN_TEST(config_validation);
    RUN_TEST(config_manager_rejects_invalid_update);
    RUN_TEST(config_scope_restores);

    std::cout << "\n--- Error Tests ---" << std::endl;
    RUN_TEST(error_taxonomy);
    RUN_TEST(status_context);
    RUN_TEST(ack_level_parsing);

    std::cout << "\n=== Results ===" << std::endl;
    if (failures == 0) {
        std::cout << "All tests PASSED!" << std::endl;
        return 0;
    } else {
        std::cout << failures << " test(s) FAILED" << std::endl;
        return 1;
    }
}
