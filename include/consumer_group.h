#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

#include "assignment.h"
#include "clock.h"
#include "config.h"
#include "errors.h"
#include "message.h"
#include "offset_tracker.h"
#include "topic.h"

namespace brook {

enum class MemberState : uint8_t {
    JOINING,
    ACTIVE,
    LEAVING,    // left voluntarily; dropped by the rebalance that follows
    FAILED      // missed its heartbeat deadline; dropped likewise
};

const char* to_string(MemberState state);

/**
 * @brief Records handed to one consumer instance by a fetch
 */
struct FetchResult {
    Status status;
    std::vector<MessagePtr> messages;

    bool ok() const { return status.ok(); }
};

// =============================================================================
// ConsumerGroup - membership and delivery state of one group on one topic
// =============================================================================
// Partitions are distributed over the active members by an
// AssignmentStrategy. A one-partition topic is a shared queue instead:
// every active member takes the next undelivered records. Either way each
// record is handed to one member at a time; records left unacknowledged
// past the ack timeout go back to the pool and are delivered again.

class ConsumerGroup {
public:
    struct Config {
        uint32_t session_timeout_ms = 10000;
        uint32_t ack_timeout_ms = 30000;
        OffsetResetPolicy offset_reset = OffsetResetPolicy::EARLIEST;
        OutOfRangePolicy out_of_range = OutOfRangePolicy::RESET_EARLIEST;
    };

    ConsumerGroup(std::string group_id,
                  std::shared_ptr<Topic> topic,
                  const Config& config,
                  std::shared_ptr<AssignmentStrategy> strategy,
                  std::shared_ptr<Clock> clock,
                  const OffsetTracker& offsets);

    ConsumerGroup(const ConsumerGroup&) = delete;
    ConsumerGroup& operator=(const ConsumerGroup&) = delete;

    // --- Membership ---

    // Register a member and rebalance; joining again while active is a heartbeat
    Status join(const std::string& consumer_id);

    Status leave(const std::string& consumer_id);

    Status heartbeat(const std::string& consumer_id);

    // --- Delivery ---

    /**
     * @brief Next records for a member, waiting for new data until the deadline
     *
     * Records due for redelivery come first, lowest offset first. Counts as
     * a heartbeat. TIMEOUT or CANCELLED with no records when nothing
     * arrived; UNKNOWN_MEMBER if the member is not active.
     */
    FetchResult fetch(const std::string& consumer_id, size_t max_messages,
                      TimePoint deadline, const CancellationToken* cancel = nullptr);

    // Everything at or below `offset` on the partition is processed
    void acknowledge(uint32_t partition, uint64_t offset);

    // Move the member's position on a partition it owns
    Status seek(const std::string& consumer_id, uint32_t partition, uint64_t offset);

    /**
     * @brief Expire silent members and overdue in-flight records
     * @return Number of members marked FAILED
     */
    size_t tick();

    // --- Introspection ---

    // nullopt once the member has left or expired
    std::optional<MemberState> member_state(const std::string& consumer_id) const;
    std::vector<uint32_t> assignment(const std::string& consumer_id) const;
    std::vector<std::string> active_members() const;
    size_t member_count() const;
    uint64_t generation() const;
    size_t in_flight() const;

    // Next offset the group will hand out on a partition
    uint64_t position(uint32_t partition) const;

    bool is_shared_queue() const { return topic_->num_partitions() == 1; }
    const std::string& group_id() const { return group_id_; }
    const std::shared_ptr<Topic>& topic() const { return topic_; }

private:
    struct Member {
        MemberState state = MemberState::JOINING;
        TimePoint last_heartbeat;
        std::vector<uint32_t> partitions;
        size_t next_unit = 0;       // Rotates the partition served first
    };

    struct InFlight {
        std::string member;
        TimePoint delivered_at;
    };

    struct Cursor {
        uint64_t next_offset = 0;
        std::map<uint64_t, InFlight> in_flight;
        std::set<uint64_t> redeliver;
    };

    static bool is_live(MemberState state) {
        return state == MemberState::JOINING || state == MemberState::ACTIVE;
    }

    void rebalance_locked(const char* reason);
    Status collect_locked(const std::string& consumer_id, Member& member,
                          size_t max_messages, std::vector<MessagePtr>& out);
    bool owns_locked(const Member& member, uint32_t partition) const;

    const std::string group_id_;
    std::shared_ptr<Topic> topic_;
    Config config_;
    std::shared_ptr<AssignmentStrategy> strategy_;
    std::shared_ptr<Clock> clock_;

    mutable std::mutex mutex_;
    std::map<std::string, Member> members_;
    std::vector<Cursor> cursors_;               // One per partition
    uint64_t generation_ = 0;
};

// =============================================================================
// GroupCoordinator - one ConsumerGroup per (topic, group)
// =============================================================================

class GroupCoordinator {
public:
    struct Config {
        ConsumerGroup::Config group;
        std::string assignment_strategy = "range";
    };

    GroupCoordinator(const Config& config,
                     std::shared_ptr<Clock> clock,
                     const OffsetTracker& offsets);

    GroupCoordinator(const GroupCoordinator&) = delete;
    GroupCoordinator& operator=(const GroupCoordinator&) = delete;

    // A group bound to a deleted incarnation of the topic is replaced
    std::shared_ptr<ConsumerGroup> get_or_create(const std::shared_ptr<Topic>& topic,
                                                 const std::string& group_id);

    std::shared_ptr<ConsumerGroup> find(const std::string& topic, const std::string& group_id) const;

    bool remove_group(const std::string& topic, const std::string& group_id);
    void remove_topic(const std::string& topic);

    // Heartbeat and in-flight expiry for every group
    void tick();

    size_t group_count() const;

    const AssignmentStrategy& strategy() const { return *strategy_; }

private:
    using GroupKey = std::pair<std::string, std::string>;   // topic, group

    Config config_;
    std::shared_ptr<Clock> clock_;
    const OffsetTracker& offsets_;
    std::shared_ptr<AssignmentStrategy> strategy_;

    mutable std::shared_mutex mutex_;
    std::map<GroupKey, std::shared_ptr<ConsumerGroup>> groups_;
};

} // namespace brook
