/**
 * @file test_consumer_group.cpp
 * @brief Tests for partition assignment, group membership and delivery
 */

#include <iostream>
#include <filesystem>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <map>
#include <set>
#include <stdexcept>
#include <thread>
#include <vector>

#include "assignment.h"
#include "consumer_group.h"
#include "offset_tracker.h"
#include "topic.h"

namespace fs = std::filesystem;
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

const std::string TEST_DIR = "/tmp/brook_test_groups";

struct TestGuard {
    TestGuard() {
        std::error_code ec;
        fs::remove_all(TEST_DIR, ec);
        fs::create_directories(TEST_DIR);
    }
    ~TestGuard() {
        std::error_code ec;
        fs::remove_all(TEST_DIR, ec);
    }
};

// Clock the test moves by hand
class ManualClock : public Clock {
public:
    TimePoint now() const override {
        return TimePoint(std::chrono::milliseconds(steady_ms_.load()));
    }
    uint64_t wall_time_ms() const override { return wall_ms_.load(); }

    void advance(std::chrono::milliseconds d) {
        steady_ms_ += d.count();
        wall_ms_ += static_cast<uint64_t>(d.count());
    }

private:
    std::atomic<int64_t> steady_ms_{1000000};
    std::atomic<uint64_t> wall_ms_{1700000000000ULL};
};

// Topic, offsets and clock shared by a test
struct Fixture {
    explicit Fixture(uint32_t partitions, uint64_t retention_bytes = 0)
        : clock(std::make_shared<ManualClock>())
        , offsets(TEST_DIR) {
        Topic::Config config;
        config.name = "orders";
        config.num_partitions = partitions;
        config.base_path = TEST_DIR + "/topics/orders";
        config.segment_max_messages = 10;
        config.retention_bytes = retention_bytes;
        topic = std::make_shared<Topic>(config, clock, nullptr);
    }

    void produce(uint32_t partition, int count) {
        for (int i = 0; i < count; i++) {
            auto result = topic->produce(Message("", "p" + std::to_string(partition) + "-" + std::to_string(i)),
                                         partition, AckLevel::LEADER, deadline_after(5000ms));
            if (!result.status.ok()) {
                throw std::runtime_error("produce failed: " + result.status.to_string());
            }
        }
    }

    std::shared_ptr<ConsumerGroup> group(const std::string& id, ConsumerGroup::Config config = {},
                                         std::shared_ptr<AssignmentStrategy> strategy = nullptr) {
        return std::make_shared<ConsumerGroup>(id, topic, config, strategy, clock, offsets);
    }

    std::shared_ptr<ManualClock> clock;
    OffsetTracker offsets;
    std::shared_ptr<Topic> topic;
};

FetchResult fetch_now(ConsumerGroup& group, const std::string& member, size_t max) {
    return group.fetch(member, max, deadline_after(0ms));
}

std::vector<uint64_t> offsets_of(const FetchResult& result) {
    std::vector<uint64_t> offsets;
    for (const auto& msg : result.messages) {
        offsets.push_back(msg->offset);
    }
    return offsets;
}

// =============================================================================
// Assignment Strategy Tests
// =============================================================================

TEST(range_assignor) {
    RangeAssignor range;
    auto assignment = range.assign({"a", "b"}, 5);

    ASSERT(assignment["a"] == std::vector<uint32_t>({0, 1, 2}));
    ASSERT(assignment["b"] == std::vector<uint32_t>({3, 4}));

    // More members than partitions: the rest get nothing
    assignment = range.assign({"a", "b", "c"}, 2);
    ASSERT_EQ(assignment.size(), 3u);
    ASSERT(assignment["a"] == std::vector<uint32_t>({0}));
    ASSERT(assignment["b"] == std::vector<uint32_t>({1}));
    ASSERT(assignment["c"].empty());

    ASSERT(range.assign({}, 4).empty());
}

TEST(round_robin_assignor) {
    RoundRobinAssignor round_robin;
    auto assignment = round_robin.assign({"a", "b"}, 5);

    ASSERT(assignment["a"] == std::vector<uint32_t>({0, 2, 4}));
    ASSERT(assignment["b"] == std::vector<uint32_t>({1, 3}));
}

TEST(hash_assignor) {
    ConsistentHashAssignor hash;
    std::vector<std::string> members = {"a", "b", "c"};
    auto assignment = hash.assign(members, 12);

    ASSERT_EQ(assignment.size(), 3u);
    std::set<uint32_t> owned;
    for (const auto& [member, partitions] : assignment) {
        for (uint32_t p : partitions) {
            ASSERT(owned.insert(p).second);
        }
    }
    ASSERT_EQ(owned.size(), 12u);

    // Deterministic for equal inputs
    ASSERT(hash.assign(members, 12) == assignment);
}

TEST(assignment_strategy_factory) {
    ASSERT(std::string(make_assignment_strategy("range")->name()) == "range");
    ASSERT(std::string(make_assignment_strategy("roundrobin")->name()) == "roundrobin");
    ASSERT(std::string(make_assignment_strategy("hash")->name()) == "hash");
    ASSERT(make_assignment_strategy("sticky") == nullptr);
}

// =============================================================================
// Membership Tests
// =============================================================================

TEST(member_lifecycle) {
    TestGuard guard;
    Fixture f(2);
    auto group = f.group("billing");

    ASSERT(!group->member_state("a").has_value());
    ASSERT(group->join("a").ok());
    ASSERT(group->member_state("a") == MemberState::ACTIVE);
    ASSERT_EQ(group->generation(), 1u);
    ASSERT_EQ(group->assignment("a").size(), 2u);

    // Joining again while active changes nothing
    ASSERT(group->join("a").ok());
    ASSERT_EQ(group->generation(), 1u);

    ASSERT(group->leave("a").ok());
    ASSERT(!group->member_state("a").has_value());
    ASSERT(group->assignment("a").empty());
    ASSERT_EQ(group->generation(), 2u);

    ASSERT(group->leave("a").code == ErrorCode::UNKNOWN_MEMBER);
    ASSERT(group->heartbeat("a").code == ErrorCode::UNKNOWN_MEMBER);
    ASSERT(fetch_now(*group, "a", 10).status.code == ErrorCode::UNKNOWN_MEMBER);

    // A departed member may come back
    ASSERT(group->join("a").ok());
    ASSERT(group->member_state("a") == MemberState::ACTIVE);
    ASSERT_EQ(group->generation(), 3u);
}

TEST(rebalance_on_join_and_leave) {
    TestGuard guard;
    Fixture f(4);
    auto group = f.group("billing");

    group->join("a");
    ASSERT_EQ(group->assignment("a").size(), 4u);

    group->join("b");
    ASSERT(group->assignment("a") == std::vector<uint32_t>({0, 1}));
    ASSERT(group->assignment("b") == std::vector<uint32_t>({2, 3}));
    ASSERT_EQ(group->active_members().size(), 2u);

    group->leave("a");
    ASSERT_EQ(group->assignment("b").size(), 4u);
    ASSERT_EQ(group->active_members().size(), 1u);
}

TEST(departed_members_are_forgotten) {
    TestGuard guard;
    Fixture f(2);
    ConsumerGroup::Config config;
    config.session_timeout_ms = 1000;
    auto group = f.group("billing", config);

    group->join("stable");
    for (int i = 0; i < 1000; i++) {
        std::string id = "transient-" + std::to_string(i);
        ASSERT(group->join(id).ok());
        ASSERT(group->leave(id).ok());
        ASSERT(!group->member_state(id).has_value());
    }
    ASSERT_EQ(group->member_count(), 1u);
    ASSERT_EQ(group->assignment("stable").size(), 2u);

    group->join("silent");
    f.clock->advance(1500ms);
    group->heartbeat("stable");
    ASSERT_EQ(group->tick(), 1u);
    ASSERT(!group->member_state("silent").has_value());
    ASSERT_EQ(group->member_count(), 1u);

    // An expired id may join again as a new member
    ASSERT(group->join("silent").ok());
    ASSERT(group->member_state("silent") == MemberState::ACTIVE);
    ASSERT_EQ(group->assignment("silent").size(), 1u);
}

TEST(strategy_is_pluggable) {
    TestGuard guard;
    Fixture f(4);
    auto group = f.group("billing", {}, std::make_shared<RoundRobinAssignor>());

    group->join("a");
    group->join("b");
    ASSERT(group->assignment("a") == std::vector<uint32_t>({0, 2}));
    ASSERT(group->assignment("b") == std::vector<uint32_t>({1, 3}));
}

TEST(heartbeat_expiry) {
    TestGuard guard;
    Fixture f(2);
    ConsumerGroup::Config config;
    config.session_timeout_ms = 1000;
    auto group = f.group("billing", config);

    group->join("a");
    group->join("b");
    ASSERT_EQ(group->assignment("a").size(), 1u);

    f.clock->advance(600ms);
    ASSERT(group->heartbeat("a").ok());
    ASSERT_EQ(group->tick(), 0u);

    f.clock->advance(600ms);
    ASSERT_EQ(group->tick(), 1u);
    ASSERT(!group->member_state("b").has_value());
    ASSERT(group->member_state("a") == MemberState::ACTIVE);
    ASSERT_EQ(group->assignment("a").size(), 2u);

    ASSERT(fetch_now(*group, "b", 10).status.code == ErrorCode::UNKNOWN_MEMBER);
    ASSERT(group->heartbeat("b").code == ErrorCode::UNKNOWN_MEMBER);
}

TEST(fetch_counts_as_heartbeat) {
    TestGuard guard;
    Fixture f(1);
    ConsumerGroup::Config config;
    config.session_timeout_ms = 1000;
    auto group = f.group("billing", config);

    group->join("a");
    for (int i = 0; i < 5; i++) {
        f.clock->advance(600ms);
        fetch_now(*group, "a", 10);
        ASSERT_EQ(group->tick(), 0u);
    }
    ASSERT(group->member_state("a") == MemberState::ACTIVE);
}

// =============================================================================
// Delivery Tests
// =============================================================================

TEST(fetch_in_order) {
    TestGuard guard;
    Fixture f(1);
    f.produce(0, 25);
    auto group = f.group("billing");
    group->join("a");

    auto first = fetch_now(*group, "a", 10);
    ASSERT(first.ok());
    ASSERT_EQ(first.messages.size(), 10u);
    for (size_t i = 0; i < 10; i++) {
        ASSERT_EQ(first.messages[i]->offset, i);
        ASSERT(first.messages[i]->topic == "orders");
    }

    auto second = fetch_now(*group, "a", 100);
    ASSERT_EQ(second.messages.size(), 15u);
    ASSERT_EQ(second.messages.front()->offset, 10u);
    ASSERT_EQ(group->position(0), 25u);

    auto empty = fetch_now(*group, "a", 10);
    ASSERT(empty.status.code == ErrorCode::TIMEOUT);
    ASSERT(empty.messages.empty());
}

TEST(distribute_within_group) {
    TestGuard guard;
    Fixture f(4);
    for (uint32_t p = 0; p < 4; p++) {
        f.produce(p, 10);
    }
    auto group = f.group("billing");
    group->join("a");
    group->join("b");

    std::set<std::pair<uint32_t, uint64_t>> seen;
    for (const std::string member : {"a", "b"}) {
        auto owned = group->assignment(member);
        while (true) {
            auto result = fetch_now(*group, member, 7);
            if (result.messages.empty()) break;
            for (const auto& msg : result.messages) {
                ASSERT(std::find(owned.begin(), owned.end(), msg->partition) != owned.end());
                ASSERT(seen.insert({msg->partition, msg->offset}).second);
            }
        }
    }
    ASSERT_EQ(seen.size(), 40u);
}

TEST(broadcast_across_groups) {
    TestGuard guard;
    Fixture f(2);
    f.produce(0, 10);
    f.produce(1, 10);

    auto billing = f.group("billing");
    auto audit = f.group("audit");
    billing->join("a");
    audit->join("x");

    ASSERT_EQ(fetch_now(*billing, "a", 100).messages.size(), 20u);
    ASSERT_EQ(fetch_now(*audit, "x", 100).messages.size(), 20u);
}

TEST(fetch_rotates_partitions) {
    TestGuard guard;
    Fixture f(2);
    f.produce(0, 5);
    f.produce(1, 5);
    auto group = f.group("billing");
    group->join("a");

    auto first = fetch_now(*group, "a", 1);
    auto second = fetch_now(*group, "a", 1);
    ASSERT_EQ(first.messages.size(), 1u);
    ASSERT_EQ(second.messages.size(), 1u);
    ASSERT(first.messages[0]->partition != second.messages[0]->partition);
}

TEST(shared_queue) {
    TestGuard guard;
    Fixture f(1);
    f.produce(0, 20);
    auto group = f.group("workers");
    ASSERT(group->is_shared_queue());

    group->join("a");
    group->join("b");
    ASSERT(group->assignment("a") == std::vector<uint32_t>({0}));
    ASSERT(group->assignment("b") == std::vector<uint32_t>({0}));

    auto from_a = fetch_now(*group, "a", 5);
    auto from_b = fetch_now(*group, "b", 5);
    ASSERT(offsets_of(from_a) == std::vector<uint64_t>({0, 1, 2, 3, 4}));
    ASSERT(offsets_of(from_b) == std::vector<uint64_t>({5, 6, 7, 8, 9}));
    ASSERT_EQ(group->in_flight(), 10u);
}

TEST(acknowledge_clears_in_flight) {
    TestGuard guard;
    Fixture f(1);
    f.produce(0, 10);
    ConsumerGroup::Config config;
    config.ack_timeout_ms = 1000;
    auto group = f.group("billing", config);
    group->join("a");

    fetch_now(*group, "a", 5);
    ASSERT_EQ(group->in_flight(), 5u);
    group->acknowledge(0, 4);
    ASSERT_EQ(group->in_flight(), 0u);

    // Nothing comes back after the ack timeout
    f.clock->advance(1500ms);
    group->heartbeat("a");
    group->tick();
    auto next = fetch_now(*group, "a", 1);
    ASSERT_EQ(next.messages[0]->offset, 5u);
}

TEST(redelivery_after_ack_timeout) {
    TestGuard guard;
    Fixture f(1);
    f.produce(0, 10);
    ConsumerGroup::Config config;
    config.ack_timeout_ms = 1000;
    config.session_timeout_ms = 60000;
    auto group = f.group("billing", config);
    group->join("a");

    auto first = fetch_now(*group, "a", 3);
    ASSERT(offsets_of(first) == std::vector<uint64_t>({0, 1, 2}));
    group->acknowledge(0, 0);

    f.clock->advance(1000ms);
    group->tick();

    // Records 1 and 2 come back ahead of new ones
    auto again = fetch_now(*group, "a", 4);
    ASSERT(offsets_of(again) == std::vector<uint64_t>({1, 2, 3, 4}));
}

TEST(redelivery_to_surviving_member) {
    TestGuard guard;
    Fixture f(1);
    f.produce(0, 10);
    ConsumerGroup::Config config;
    config.session_timeout_ms = 1000;
    config.ack_timeout_ms = 2000;
    auto group = f.group("workers", config);
    group->join("a");
    group->join("b");

    auto taken = fetch_now(*group, "a", 5);
    ASSERT_EQ(taken.messages.size(), 5u);

    // a goes silent
    f.clock->advance(1500ms);
    group->heartbeat("b");
    ASSERT_EQ(group->tick(), 1u);
    ASSERT(!group->member_state("a").has_value());

    f.clock->advance(600ms);
    group->tick();

    auto recovered = fetch_now(*group, "b", 10);
    ASSERT(offsets_of(recovered) == std::vector<uint64_t>({0, 1, 2, 3, 4, 5, 6, 7, 8, 9}));
}

TEST(start_from_committed) {
    TestGuard guard;
    Fixture f(1);
    f.produce(0, 10);
    ASSERT(f.offsets.commit("orders", "billing", 0, 6).ok());

    auto group = f.group("billing");
    ASSERT_EQ(group->position(0), 7u);
    group->join("a");
    auto result = fetch_now(*group, "a", 10);
    ASSERT(offsets_of(result) == std::vector<uint64_t>({7, 8, 9}));
}

TEST(offset_reset_policies) {
    TestGuard guard;
    Fixture f(1);
    f.produce(0, 10);

    auto earliest = f.group("from-start");
    ASSERT_EQ(earliest->position(0), 0u);

    ConsumerGroup::Config config;
    config.offset_reset = OffsetResetPolicy::LATEST;
    auto latest = f.group("from-now", config);
    ASSERT_EQ(latest->position(0), 10u);

    latest->join("a");
    ASSERT(fetch_now(*latest, "a", 10).status.code == ErrorCode::TIMEOUT);

    f.produce(0, 1);
    auto result = fetch_now(*latest, "a", 10);
    ASSERT(offsets_of(result) == std::vector<uint64_t>({10}));
}

TEST(out_of_range_reset) {
    TestGuard guard;
    Fixture f(1, 1);
    f.produce(0, 35);
    auto group = f.group("billing");
    group->join("a");

    ASSERT_EQ(f.topic->apply_retention(), 3u);
    ASSERT_EQ(f.topic->partition(0)->start_offset(), 30u);

    auto result = fetch_now(*group, "a", 100);
    ASSERT(result.ok());
    ASSERT_EQ(result.messages.size(), 5u);
    ASSERT_EQ(result.messages.front()->offset, 30u);
}

TEST(out_of_range_fail) {
    TestGuard guard;
    Fixture f(1, 1);
    f.produce(0, 35);
    ConsumerGroup::Config config;
    config.out_of_range = OutOfRangePolicy::FAIL;
    auto group = f.group("billing", config);
    group->join("a");

    f.topic->apply_retention();

    auto result = fetch_now(*group, "a", 100);
    ASSERT(result.status.code == ErrorCode::OFFSET_OUT_OF_RANGE);
    ASSERT(result.messages.empty());
}

TEST(seek) {
    TestGuard guard;
    Fixture f(2);
    f.produce(0, 10);
    f.produce(1, 10);
    auto group = f.group("billing");
    group->join("a");
    group->join("b");

    fetch_now(*group, "a", 10);
    ASSERT(group->seek("a", 0, 2).ok());
    ASSERT_EQ(group->in_flight(), 0u);
    auto replay = fetch_now(*group, "a", 3);
    ASSERT(offsets_of(replay) == std::vector<uint64_t>({2, 3, 4}));

    ASSERT(group->seek("a", 0, 11).code == ErrorCode::INVALID_OFFSET);
    ASSERT(group->seek("a", 0, 10).ok());
    ASSERT(group->seek("a", 1, 0).code == ErrorCode::INVALID_PARTITION);
    ASSERT(group->seek("nobody", 0, 0).code == ErrorCode::UNKNOWN_MEMBER);
}

TEST(fetch_long_poll) {
    TestGuard guard;
    Fixture f(1);
    auto group = f.group("billing");
    group->join("a");

    std::thread producer([&] {
        std::this_thread::sleep_for(50ms);
        f.produce(0, 1);
    });

    auto result = group->fetch("a", 10, deadline_after(5000ms));
    producer.join();

    ASSERT(result.ok());
    ASSERT_EQ(result.messages.size(), 1u);
}

TEST(fetch_cancelled) {
    TestGuard guard;
    Fixture f(1);
    auto group = f.group("billing");
    group->join("a");

    CancellationToken token;
    std::thread canceller([&] {
        std::this_thread::sleep_for(30ms);
        token.cancel();
    });

    auto result = group->fetch("a", 10, deadline_after(5000ms), &token);
    canceller.join();

    ASSERT(result.status.code == ErrorCode::CANCELLED);
}

// =============================================================================
// GroupCoordinator Tests
// =============================================================================

TEST(coordinator_groups) {
    TestGuard guard;
    Fixture f(2);

    GroupCoordinator::Config config;
    GroupCoordinator coordinator(config, f.clock, f.offsets);
    ASSERT(std::string(coordinator.strategy().name()) == "range");

    auto billing = coordinator.get_or_create(f.topic, "billing");
    ASSERT(coordinator.get_or_create(f.topic, "billing") == billing);
    ASSERT(coordinator.find("orders", "billing") == billing);
    ASSERT(coordinator.find("orders", "audit") == nullptr);

    coordinator.get_or_create(f.topic, "audit");
    ASSERT_EQ(coordinator.group_count(), 2u);

    ASSERT(coordinator.remove_group("orders", "audit"));
    ASSERT(!coordinator.remove_group("orders", "audit"));

    coordinator.remove_topic("orders");
    ASSERT_EQ(coordinator.group_count(), 0u);
}

TEST(coordinator_unknown_strategy) {
    TestGuard guard;
    Fixture f(2);

    GroupCoordinator::Config config;
    config.assignment_strategy = "sticky";
    GroupCoordinator coordinator(config, f.clock, f.offsets);
    ASSERT(std::string(coordinator.strategy().name()) == "range");

    config.assignment_strategy = "roundrobin";
    GroupCoordinator round_robin(config, f.clock, f.offsets);
    ASSERT(std::string(round_robin.strategy().name()) == "roundrobin");
}

TEST(coordinator_replaces_stale_topic) {
    TestGuard guard;
    Fixture f(2);
    GroupCoordinator coordinator(GroupCoordinator::Config{}, f.clock, f.offsets);

    auto old_group = coordinator.get_or_create(f.topic, "billing");

    Topic::Config config = f.topic->config();
    f.topic->close();
    auto recreated = std::make_shared<Topic>(config, f.clock, nullptr);

    auto new_group = coordinator.get_or_create(recreated, "billing");
    ASSERT(new_group != old_group);
    ASSERT(new_group->topic() == recreated);
}

TEST(coordinator_tick) {
    TestGuard guard;
    Fixture f(1);
    GroupCoordinator::Config config;
    config.group.session_timeout_ms = 1000;
    GroupCoordinator coordinator(config, f.clock, f.offsets);

    auto group = coordinator.get_or_create(f.topic, "billing");
    group->join("a");

    f.clock->advance(1500ms);
    coordinator.tick();
    ASSERT(!group->member_state("a").has_value());
}

// =============================================================================
// Main
// =============================================================================

int main() {
    std::cout << "\n=== Consumer Group Tests ===\n" << std::endl;

    std::cout << "--- Assignment Tests ---" << std::endl;
    RUN_TEST(range_assignor);
    RUN_TEST(round_robin_assignor);
    RUN_TEST(hash_assignor);
    RUN_TEST(assignment_strategy_factory);

    std::cout << "\n--- Membership Tests ---" << std::endl;
    RUN_TEST(member_lifecycle);
    RUN_TEST(rebalance_on_join_and_leave);
    RUN_TEST(departed_members_are_forgotten);
    RUN_TEST(strategy_is_pluggable);
    RUN_TEST(heartbeat_expiry);
    RUN_TEST(fetch_counts_as_heartbeat);

    std::cout << "\n--- Delivery Tests ---" << std::endl;
    RUN_TEST(fetch_in_order);
    RUN_TEST(distribute_within_group);
    RUN_TEST(broadcast_across_groups);
    RUN_TEST(fetch_rotates_partitions);
    RUN_TEST(shared_queue);
    RUN_TEST(acknowledge_clears_in_flight);
    RUN_TEST(redelivery_after_ack_timeout);
    RUN_TEST(redelivery_to_surviving_member);
    RUN_TEST(start_from_committed);
    RUN_TEST(offset_reset_policies);
    RUN_TEST(out_of_range_reset);
    RUN_TEST(out_of_range_fail);
    RUN_TEST(seek);
    RUN_TEST(fetch_long_poll);
    RUN_TEST(fetch_cancelled);

    std::cout << "\n--- Coordinator Tests ---" << std::endl;
    RUN_TEST(coordinator_groups);
    RUN_TEST(coordinator_unknown_strategy);
    RUN_TEST(coordinator_replaces_stale_topic);
    RUN_TEST(coordinator_tick);

    std::cout << "\n=== Results ===" << std::endl;
    if (failures == 0) {
        std::cout << "All tests PASSED!" << std::endl;
        return 0;
    } else {
        std::cout << failures << " test(s) FAILED" << std::endl;
        return 1;
    }
}
