#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace brook {

// member id -> partitions it owns
using Assignment = std::map<std::string, std::vector<uint32_t>>;

/**
 * @brief Maps the partitions of a topic onto the active members of a group
 *
 * Every member appears in the result, possibly with no partitions, and
 * every partition is owned by exactly one member. Members arrive sorted so
 * that equal inputs give equal assignments.
 */
class AssignmentStrategy {
public:
    virtual ~AssignmentStrategy() = default;

    virtual const char* name() const = 0;

    virtual Assignment assign(const std::vector<std::string>& members,
                              uint32_t num_partitions) const = 0;
};

// Contiguous ranges; the first (partitions % members) members get one extra
class RangeAssignor : public AssignmentStrategy {
public:
    const char* name() const override { return "range"; }
    Assignment assign(const std::vector<std::string>& members,
                      uint32_t num_partitions) const override;
};

// Partition i goes to member i % members
class RoundRobinAssignor : public AssignmentStrategy {
public:
    const char* name() const override { return "roundrobin"; }
    Assignment assign(const std::vector<std::string>& members,
                      uint32_t num_partitions) const override;
};

// Members on a consistent-hash ring; few partitions move when membership changes
class ConsistentHashAssignor : public AssignmentStrategy {
public:
    explicit ConsistentHashAssignor(uint32_t virtual_nodes = 150) : virtual_nodes_(virtual_nodes) {}

    const char* name() const override { return "hash"; }
    Assignment assign(const std::vector<std::string>& members,
                      uint32_t num_partitions) const override;

private:
    uint32_t virtual_nodes_;
};

// "range", "roundrobin" or "hash"; nullptr for anything else
std::shared_ptr<AssignmentStrategy> make_assignment_strategy(const std::string& name);

} // namespace brook
