/**
 * @file errors.cpp
 * @brief Error codes, their kinds and Status formatting
 */

#include "errors.h"

namespace brook {

ErrorKind classify(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE:
            return ErrorKind::NONE;

        case ErrorCode::BACKPRESSURE_TIMEOUT:
        case ErrorCode::REPLICATION_TIMEOUT:
        case ErrorCode::TIMEOUT:
        case ErrorCode::STORAGE_IO_ERROR:
        case ErrorCode::CANCELLED:
        case ErrorCode::SHUTTING_DOWN:
            return ErrorKind::TRANSIENT;

        case ErrorCode::SEGMENT_CORRUPTED:
        case ErrorCode::OFFSET_OUT_OF_RANGE:
        case ErrorCode::TOPIC_CONFIG_CONFLICT:
        case ErrorCode::UNKNOWN_TOPIC:
            return ErrorKind::PERMANENT;

        case ErrorCode::INVALID_TOPIC_NAME:
        case ErrorCode::INVALID_GROUP_NAME:
        case ErrorCode::INVALID_ACK_LEVEL:
        case ErrorCode::INVALID_OFFSET:
        case ErrorCode::INVALID_PARTITION:
        case ErrorCode::UNKNOWN_MEMBER:
            return ErrorKind::CALLER;
    }
    return ErrorKind::PERMANENT;
}

const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE:                  return "NONE";
        case ErrorCode::BACKPRESSURE_TIMEOUT:  return "BACKPRESSURE_TIMEOUT";
        case ErrorCode::REPLICATION_TIMEOUT:   return "REPLICATION_TIMEOUT";
        case ErrorCode::TIMEOUT:               return "TIMEOUT";
        case ErrorCode::STORAGE_IO_ERROR:      return "STORAGE_IO_ERROR";
        case ErrorCode::CANCELLED:             return "CANCELLED";
        case ErrorCode::SHUTTING_DOWN:         return "SHUTTING_DOWN";
        case ErrorCode::SEGMENT_CORRUPTED:     return "SEGMENT_CORRUPTED";
        case ErrorCode::OFFSET_OUT_OF_RANGE:   return "OFFSET_OUT_OF_RANGE";
        case ErrorCode::TOPIC_CONFIG_CONFLICT: return "TOPIC_CONFIG_CONFLICT";
        case ErrorCode::UNKNOWN_TOPIC:         return "UNKNOWN_TOPIC";
        case ErrorCode::INVALID_TOPIC_NAME:    return "INVALID_TOPIC_NAME";
        case ErrorCode::INVALID_GROUP_NAME:    return "INVALID_GROUP_NAME";
        case ErrorCode::INVALID_ACK_LEVEL:     return "INVALID_ACK_LEVEL";
        case ErrorCode::INVALID_OFFSET:        return "INVALID_OFFSET";
        case ErrorCode::INVALID_PARTITION:     return "INVALID_PARTITION";
        case ErrorCode::UNKNOWN_MEMBER:        return "UNKNOWN_MEMBER";
    }
    return "UNKNOWN";
}

const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE:      return "none";
        case ErrorKind::TRANSIENT: return "transient";
        case ErrorKind::PERMANENT: return "permanent";
        case ErrorKind::CALLER:    return "caller";
    }
    return "unknown";
}

Status Status::with_context(const std::string& context) const {
    if (ok()) {
        return *this;
    }
    return Status::error(code, message.empty() ? context : context + ": " + message);
}

std::string Status::to_string() const {
    if (ok()) {
        return "OK";
    }
    return std::string(brook::to_string(code)) + ": " + message;
}

} // namespace brook
