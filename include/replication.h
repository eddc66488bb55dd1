#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "clock.h"
#include "errors.h"
#include "message.h"

namespace brook {

/**
 * @brief How much confirmation a publisher waits for
 *
 * NONE:   returns once the record is accepted into the ingress buffer
 * LEADER: returns once the record's batch is appended and flushed
 * ALL:    additionally waits for every replica to acknowledge
 */
enum class AckLevel : uint8_t {
    NONE = 0,
    LEADER = 1,
    ALL = 2
};

const char* to_string(AckLevel level);

/**
 * @brief Map an integer ack level (0, 1, 2) onto AckLevel
 * @return INVALID_ACK_LEVEL for anything else
 */
Status parse_ack_level(int value, AckLevel& level);

/**
 * @brief Ships appended records to replicas
 *
 * The replica topology is owned by the implementation. replicate() blocks
 * until all replicas acknowledged the records or the deadline passes,
 * in which case it returns REPLICATION_TIMEOUT.
 */
class ReplicationTransport {
public:
    virtual ~ReplicationTransport() = default;

    virtual Status replicate(const std::string& topic,
                             uint32_t partition,
                             const std::vector<MessagePtr>& records,
                             TimePoint deadline) = 0;
};

} // namespace brook
