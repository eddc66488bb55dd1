/**
 * @file assignment.cpp
 * @brief Partition assignment strategies for consumer groups
 */

#include "assignment.h"
#include "hash.h"

namespace brook {

Assignment RangeAssignor::assign(const std::vector<std::string>& members,
                                 uint32_t num_partitions) const {
    Assignment assignment;
    for (const auto& member : members) {
        assignment[member];
    }
    if (members.empty()) return assignment;

    size_t num_consumers = members.size();
    size_t partitions_per_consumer = num_partitions / num_consumers;
    size_t extra = num_partitions % num_consumers;

    uint32_t current_partition = 0;

    for (size_t i = 0; i < num_consumers && current_partition < num_partitions; i++) {
        size_t count = partitions_per_consumer + (i < extra ? 1 : 0);

        auto& assigned = assignment[members[i]];
        for (size_t j = 0; j < count && current_partition < num_partitions; j++) {
            assigned.push_back(current_partition++);
        }
    }

    return assignment;
}

Assignment RoundRobinAssignor::assign(const std::vector<std::string>& members,
                                      uint32_t num_partitions) const {
    Assignment assignment;
    for (const auto& member : members) {
        assignment[member];
    }
    if (members.empty()) return assignment;

    for (uint32_t p = 0; p < num_partitions; p++) {
        assignment[members[p % members.size()]].push_back(p);
    }
    return assignment;
}

Assignment ConsistentHashAssignor::assign(const std::vector<std::string>& members,
                                          uint32_t num_partitions) const {
    Assignment assignment;
    ConsistentHashRing ring(virtual_nodes_);
    for (const auto& member : members) {
        assignment[member];
        ring.add_node(member);
    }
    if (ring.empty()) return assignment;

    for (uint32_t p = 0; p < num_partitions; p++) {
        assignment[ring.get_node("partition-" + std::to_string(p))].push_back(p);
    }
    return assignment;
}

std::shared_ptr<AssignmentStrategy> make_assignment_strategy(const std::string& name) {
    if (name == "range") return std::make_shared<RangeAssignor>();
    if (name == "roundrobin") return std::make_shared<RoundRobinAssignor>();
    if (name == "hash") return std::make_shared<ConsistentHashAssignor>();
    return nullptr;
}

} // namespace brook
