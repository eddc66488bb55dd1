#pragma once

#include <cstdint>
#include <string>

namespace brook {

/**
 * @brief Typed error codes surfaced by every layer of the broker
 *
 * Grouped by the taxonomy returned from classify():
 * - Transient: the caller may retry the same operation
 * - Permanent: retrying will not help without operator action
 * - Caller: the request itself was invalid
 */
enum class ErrorCode : uint8_t {
    NONE = 0,

    // Transient / retryable
    BACKPRESSURE_TIMEOUT,   // ingress buffer stayed full until the deadline
    REPLICATION_TIMEOUT,    // replicas did not acknowledge before the deadline
    TIMEOUT,                // deadline passed waiting for flush or data
    STORAGE_IO_ERROR,       // read/write/fsync on the storage backend failed
    CANCELLED,              // caller cancelled the operation
    SHUTTING_DOWN,          // component is closing

    // Permanent
    SEGMENT_CORRUPTED,      // corruption beyond the last valid record boundary
    OFFSET_OUT_OF_RANGE,    // offset evicted by retention or not yet written
    TOPIC_CONFIG_CONFLICT,  // topic exists with a different configuration
    UNKNOWN_TOPIC,          // topic missing and auto-creation disabled

    // Caller errors
    INVALID_TOPIC_NAME,
    INVALID_GROUP_NAME,
    INVALID_ACK_LEVEL,
    INVALID_OFFSET,
    INVALID_PARTITION,
    UNKNOWN_MEMBER
};

enum class ErrorKind : uint8_t {
    NONE = 0,
    TRANSIENT,
    PERMANENT,
    CALLER
};

ErrorKind classify(ErrorCode code);
const char* to_string(ErrorCode code);
const char* to_string(ErrorKind kind);

/**
 * @brief Result of an operation that produces no value
 *
 * Carries the error code plus a message that accumulates context
 * (segment file, offset, partition, topic) as it propagates upward.
 */
struct Status {
    ErrorCode code{ErrorCode::NONE};
    std::string message;

    bool ok() const { return code == ErrorCode::NONE; }
    ErrorKind kind() const { return classify(code); }
    bool retryable() const { return kind() == ErrorKind::TRANSIENT; }

    static Status OK() { return Status{}; }

    static Status error(ErrorCode code, std::string message) {
        Status s;
        s.code = code;
        s.message = std::move(message);
        return s;
    }

    // Prefix the message with context, keeping the code
    Status with_context(const std::string& context) const;

    // "CODE: message"
    std::string to_string() const;
};

} // namespace brook
