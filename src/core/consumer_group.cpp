/**
 * @file consumer_group.cpp
 * @brief Consumer group membership, rebalancing, delivery and the group coordinator
 */

#include "consumer_group.h"
#include "logging.h"

#include <algorithm>

namespace brook {

const char* to_string(MemberState state) {
    switch (state) {
        case MemberState::JOINING: return "joining";
        case MemberState::ACTIVE:  return "active";
        case MemberState::LEAVING: return "leaving";
        case MemberState::FAILED:  return "failed";
    }
    return "unknown";
}

// =============================================================================
// ConsumerGroup Implementation
// =============================================================================

ConsumerGroup::ConsumerGroup(std::string group_id,
                             std::shared_ptr<Topic> topic,
                             const Config& config,
                             std::shared_ptr<AssignmentStrategy> strategy,
                             std::shared_ptr<Clock> clock,
                             const OffsetTracker& offsets)
    : group_id_(std::move(group_id))
    , topic_(std::move(topic))
    , config_(config)
    , strategy_(strategy ? std::move(strategy) : std::make_shared<RangeAssignor>())
    , clock_(clock ? std::move(clock) : system_clock())
    , cursors_(topic_->num_partitions()) {

    // Start positions are fixed when the group first forms
    for (uint32_t p = 0; p < topic_->num_partitions(); p++) {
        const Partition* partition = topic_->partition(p);
        auto committed = offsets.fetch_committed(topic_->name(), group_id_, p);
        if (committed) {
            cursors_[p].next_offset = *committed + 1;
        } else if (config_.offset_reset == OffsetResetPolicy::LATEST) {
            cursors_[p].next_offset = partition->high_watermark();
        } else {
            cursors_[p].next_offset = partition->start_offset();
        }
    }
}

Status ConsumerGroup::join(const std::string& consumer_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = members_.find(consumer_id);
    if (it != members_.end() && is_live(it->second.state)) {
        it->second.last_heartbeat = clock_->now();
        return Status::OK();
    }

    Member& member = members_[consumer_id];
    member = Member{};
    member.last_heartbeat = clock_->now();

    logger()->info("Consumer {} joining group {} on {}", consumer_id, group_id_, topic_->name());
    rebalance_locked("join");
    return Status::OK();
}

Status ConsumerGroup::leave(const std::string& consumer_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = members_.find(consumer_id);
    if (it == members_.end() || !is_live(it->second.state)) {
        return Status::error(ErrorCode::UNKNOWN_MEMBER,
                             "consumer " + consumer_id + " is not a member of group " + group_id_);
    }

    it->second.state = MemberState::LEAVING;
    it->second.partitions.clear();

    logger()->info("Consumer {} left group {} on {}", consumer_id, group_id_, topic_->name());
    rebalance_locked("leave");
    return Status::OK();
}

Status ConsumerGroup::heartbeat(const std::string& consumer_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = members_.find(consumer_id);
    if (it == members_.end() || !is_live(it->second.state)) {
        return Status::error(ErrorCode::UNKNOWN_MEMBER,
                             "consumer " + consumer_id + " is not a member of group " + group_id_);
    }
    it->second.last_heartbeat = clock_->now();
    return Status::OK();
}

void ConsumerGroup::rebalance_locked(const char* reason) {
    std::vector<std::string> active;
    size_t departed = 0;
    for (auto it = members_.begin(); it != members_.end();) {
        Member& member = it->second;
        if (!is_live(member.state)) {
            it = members_.erase(it);
            ++departed;
            continue;
        }
        if (member.state == MemberState::JOINING) {
            member.state = MemberState::ACTIVE;
        }
        member.partitions.clear();
        member.next_unit = 0;
        active.push_back(it->first);   // std::map keeps ids sorted
        ++it;
    }

    if (is_shared_queue()) {
        for (const auto& id : active) {
            members_[id].partitions.push_back(0);
        }
    } else {
        Assignment assignment = strategy_->assign(active, topic_->num_partitions());
        for (auto& [id, partitions] : assignment) {
            members_[id].partitions = std::move(partitions);
        }
    }

    ++generation_;
    logger()->info("Group {} on {} rebalanced after {}: generation {}, {} active members, {} removed",
                   group_id_, topic_->name(), reason, generation_, active.size(), departed);

    if (logger()->should_log(spdlog::level::debug)) {
        for (const auto& id : active) {
            std::string owned;
            for (uint32_t p : members_[id].partitions) {
                owned += (owned.empty() ? "" : ",") + std::to_string(p);
            }
            logger()->debug("  {} -> [{}]", id, owned);
        }
    }
}

bool ConsumerGroup::owns_locked(const Member& member, uint32_t partition) const {
    return std::find(member.partitions.begin(), member.partitions.end(), partition) !=
           member.partitions.end();
}

Status ConsumerGroup::collect_locked(const std::string& consumer_id, Member& member,
                                     size_t max_messages, std::vector<MessagePtr>& out) {
    const auto& units = member.partitions;
    if (units.empty()) {
        return Status::OK();
    }

    const TimePoint now = clock_->now();
    const size_t first = member.next_unit++ % units.size();

    for (size_t n = 0; n < units.size() && out.size() < max_messages; n++) {
        uint32_t p = units[(first + n) % units.size()];
        const Partition* partition = topic_->partition(p);
        Cursor& cursor = cursors_[p];

        // Records returned to the pool go out first
        while (!cursor.redeliver.empty() && out.size() < max_messages) {
            uint64_t offset = *cursor.redeliver.begin();
            cursor.redeliver.erase(cursor.redeliver.begin());

            ReadResult result = partition->read(offset);
            if (!result.ok()) {
                if (result.status.code == ErrorCode::OFFSET_OUT_OF_RANGE) {
                    continue;   // evicted while waiting
                }
                cursor.redeliver.insert(offset);
                return result.status;
            }
            cursor.in_flight[offset] = InFlight{consumer_id, now};
            out.push_back(result.message);
        }

        uint64_t start = partition->start_offset();
        if (cursor.next_offset < start) {
            if (config_.out_of_range == OutOfRangePolicy::FAIL) {
                return Status::error(ErrorCode::OFFSET_OUT_OF_RANGE,
                                     "group " + group_id_ + " position " +
                                     std::to_string(cursor.next_offset) + " on " + topic_->name() +
                                     "-" + std::to_string(p) + " was removed by retention (start offset " +
                                     std::to_string(start) + ")");
            }
            logger()->warn("Group {} position {} on {}-{} removed by retention, resetting to {}",
                           group_id_, cursor.next_offset, topic_->name(), p, start);
            cursor.next_offset = start;
        }

        if (out.size() >= max_messages) {
            break;
        }

        Status s;
        auto messages = partition->read_batch(cursor.next_offset, max_messages - out.size(), &s);
        for (auto& msg : messages) {
            cursor.in_flight[msg->offset] = InFlight{consumer_id, now};
            cursor.next_offset = msg->offset + 1;
            out.push_back(std::move(msg));
        }
        if (!s.ok() && out.empty()) {
            return s;
        }
    }

    return Status::OK();
}

FetchResult ConsumerGroup::fetch(const std::string& consumer_id, size_t max_messages,
                                 TimePoint deadline, const CancellationToken* cancel) {
    FetchResult result;
    const auto& notifier = topic_->notifier();

    while (true) {
        uint64_t seen = notifier->generation();
        {
            std::lock_guard<std::mutex> lock(mutex_);

            auto it = members_.find(consumer_id);
            if (it == members_.end() || it->second.state != MemberState::ACTIVE) {
                result.status = Status::error(ErrorCode::UNKNOWN_MEMBER,
                                              "consumer " + consumer_id +
                                              " is not an active member of group " + group_id_);
                return result;
            }
            it->second.last_heartbeat = clock_->now();

            if (max_messages == 0) {
                return result;
            }

            result.status = collect_locked(consumer_id, it->second, max_messages, result.messages);
            if (!result.status.ok() || !result.messages.empty()) {
                return result;
            }
        }

        if (cancelled(cancel)) {
            result.status = Status::error(ErrorCode::CANCELLED, "fetch cancelled");
            return result;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            result.status = Status::error(ErrorCode::TIMEOUT,
                                          "no records for " + consumer_id + " before the deadline");
            return result;
        }
        notifier->wait_for_change(seen, next_wakeup(deadline));
    }
}

void ConsumerGroup::acknowledge(uint32_t partition, uint64_t offset) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (partition >= cursors_.size()) return;
    Cursor& cursor = cursors_[partition];

    cursor.in_flight.erase(cursor.in_flight.begin(), cursor.in_flight.upper_bound(offset));
    cursor.redeliver.erase(cursor.redeliver.begin(), cursor.redeliver.upper_bound(offset));
    cursor.next_offset = std::max(cursor.next_offset, offset + 1);
}

Status ConsumerGroup::seek(const std::string& consumer_id, uint32_t partition, uint64_t offset) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = members_.find(consumer_id);
    if (it == members_.end() || it->second.state != MemberState::ACTIVE) {
        return Status::error(ErrorCode::UNKNOWN_MEMBER,
                             "consumer " + consumer_id + " is not an active member of group " + group_id_);
    }
    if (!owns_locked(it->second, partition)) {
        return Status::error(ErrorCode::INVALID_PARTITION,
                             "partition " + std::to_string(partition) + " of " + topic_->name() +
                             " is not assigned to " + consumer_id);
    }

    uint64_t hwm = topic_->partition(partition)->high_watermark();
    if (offset > hwm) {
        return Status::error(ErrorCode::INVALID_OFFSET,
                             "offset " + std::to_string(offset) + " is beyond the high-water mark " +
                             std::to_string(hwm));
    }

    Cursor& cursor = cursors_[partition];
    cursor.next_offset = offset;
    cursor.in_flight.clear();
    cursor.redeliver.clear();
    return Status::OK();
}

size_t ConsumerGroup::tick() {
    std::lock_guard<std::mutex> lock(mutex_);

    const TimePoint now = clock_->now();
    const auto session_timeout = std::chrono::milliseconds(config_.session_timeout_ms);
    const auto ack_timeout = std::chrono::milliseconds(config_.ack_timeout_ms);

    size_t expired = 0;
    for (auto& [id, member] : members_) {
        if (is_live(member.state) && now - member.last_heartbeat > session_timeout) {
            member.state = MemberState::FAILED;
            member.partitions.clear();
            ++expired;
            logger()->warn("Consumer {} in group {} on {} missed its heartbeat deadline, removing",
                           id, group_id_, topic_->name());
        }
    }
    if (expired > 0) {
        rebalance_locked("heartbeat expiry");
    }

    size_t returned = 0;
    for (auto& cursor : cursors_) {
        for (auto it = cursor.in_flight.begin(); it != cursor.in_flight.end();) {
            if (now - it->second.delivered_at >= ack_timeout) {
                cursor.redeliver.insert(it->first);
                it = cursor.in_flight.erase(it);
                ++returned;
            } else {
                ++it;
            }
        }
    }
    if (returned > 0) {
        logger()->warn("Group {} on {}: {} unacknowledged records returned for redelivery",
                       group_id_, topic_->name(), returned);
    }

    return expired;
}

std::optional<MemberState> ConsumerGroup::member_state(const std::string& consumer_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = members_.find(consumer_id);
    if (it == members_.end()) return std::nullopt;
    return it->second.state;
}

std::vector<uint32_t> ConsumerGroup::assignment(const std::string& consumer_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = members_.find(consumer_id);
    if (it == members_.end()) return {};
    return it->second.partitions;
}

std::vector<std::string> ConsumerGroup::active_members() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> active;
    for (const auto& [id, member] : members_) {
        if (member.state == MemberState::ACTIVE) {
            active.push_back(id);
        }
    }
    return active;
}

size_t ConsumerGroup::member_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return members_.size();
}

uint64_t ConsumerGroup::generation() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return generation_;
}

size_t ConsumerGroup::in_flight() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (const auto& cursor : cursors_) {
        count += cursor.in_flight.size() + cursor.redeliver.size();
    }
    return count;
}

uint64_t ConsumerGroup::position(uint32_t partition) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (partition >= cursors_.size()) return 0;
    return cursors_[partition].next_offset;
}

// =============================================================================
// GroupCoordinator Implementation
// =============================================================================

GroupCoordinator::GroupCoordinator(const Config& config,
                                   std::shared_ptr<Clock> clock,
                                   const OffsetTracker& offsets)
    : config_(config)
    , clock_(clock ? std::move(clock) : system_clock())
    , offsets_(offsets)
    , strategy_(make_assignment_strategy(config.assignment_strategy)) {

    if (!strategy_) {
        logger()->warn("Unknown assignment strategy '{}', using range", config.assignment_strategy);
        strategy_ = std::make_shared<RangeAssignor>();
    }
}

std::shared_ptr<ConsumerGroup> GroupCoordinator::get_or_create(const std::shared_ptr<Topic>& topic,
                                                               const std::string& group_id) {
    GroupKey key{topic->name(), group_id};
    {
        std::shared_lock lock(mutex_);
        auto it = groups_.find(key);
        if (it != groups_.end() && it->second->topic() == topic) {
            return it->second;
        }
    }

    std::unique_lock lock(mutex_);
    auto& slot = groups_[key];
    if (!slot || slot->topic() != topic) {
        slot = std::make_shared<ConsumerGroup>(group_id, topic, config_.group, strategy_, clock_, offsets_);
        logger()->info("Created group {} on {} ({} assignment)", group_id, topic->name(), strategy_->name());
    }
    return slot;
}

std::shared_ptr<ConsumerGroup> GroupCoordinator::find(const std::string& topic,
                                                      const std::string& group_id) const {
    std::shared_lock lock(mutex_);
    auto it = groups_.find(GroupKey{topic, group_id});
    if (it == groups_.end()) return nullptr;
    return it->second;
}

bool GroupCoordinator::remove_group(const std::string& topic, const std::string& group_id) {
    std::unique_lock lock(mutex_);
    return groups_.erase(GroupKey{topic, group_id}) > 0;
}

void GroupCoordinator::remove_topic(const std::string& topic) {
    std::unique_lock lock(mutex_);
    for (auto it = groups_.begin(); it != groups_.end();) {
        if (it->first.first == topic) {
            it = groups_.erase(it);
        } else {
            ++it;
        }
    }
}

void GroupCoordinator::tick() {
    std::vector<std::shared_ptr<ConsumerGroup>> groups;
    {
        std::shared_lock lock(mutex_);
        groups.reserve(groups_.size());
        for (const auto& [_, group] : groups_) {
            groups.push_back(group);
        }
    }
    for (auto& group : groups) {
        group->tick();
    }
}

size_t GroupCoordinator::group_count() const {
    std::shared_lock lock(mutex_);
    return groups_.size();
}

} // namespace brook
