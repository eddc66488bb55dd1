#pragma once

#include <cstdint>
#include <limits>
#include <memory>
#include <string>
#include <vector>

namespace brook {

// Offset reported for records published without acknowledgment
constexpr uint64_t UNASSIGNED_OFFSET = std::numeric_limits<uint64_t>::max();

/**
 * @brief A single record in a partition log
 *
 * offset and timestamp_ms are assigned by the broker. topic and partition
 * are filled in on the read path and are not persisted with the record.
 * An empty key means the record has no key.
 */
struct Message {
    uint64_t offset{0};
    uint64_t timestamp_ms{0};
    uint32_t partition{0};
    std::string topic;

    std::string key;
    std::string value;

    Message() = default;

    Message(std::string k, std::string v)
        : key(std::move(k))
        , value(std::move(v)) {}

    bool has_key() const { return !key.empty(); }

    size_t total_size() const {
        return key.size() + value.size();
    }

    static uint64_t current_time_ms();

    /**
     * @brief Fixed part of the persisted payload
     *
     * Payload format (little-endian):
     * [8 bytes: offset][8 bytes: timestamp_ms]
     * [4 bytes: key_size][N bytes: key]
     * [4 bytes: value_size][M bytes: value]
     */
    static constexpr size_t PAYLOAD_FIXED_SIZE = 8 + 8 + 4 + 4;

    size_t serialized_size() const {
        return PAYLOAD_FIXED_SIZE + key.size() + value.size();
    }

    std::vector<uint8_t> serialize() const;

    /**
     * @brief Append the payload to an existing buffer
     */
    void serialize_to(std::vector<uint8_t>& out) const;

    /**
     * @brief Parse a payload. Returns nullptr if the sizes do not add up
     * to exactly `size` bytes.
     */
    static std::shared_ptr<Message> deserialize(const uint8_t* data, size_t size);
};

using MessagePtr = std::shared_ptr<Message>;

template<typename... Args>
MessagePtr make_message(Args&&... args) {
    return std::make_shared<Message>(std::forward<Args>(args)...);
}

/**
 * @brief CRC-32 (IEEE 802.3, reflected polynomial 0xEDB88320)
 */
uint32_t crc32(const void* data, size_t length);

/**
 * @brief Continue a CRC-32 computed by crc32() over more data
 */
uint32_t crc32_update(uint32_t crc, const void* data, size_t length);

} // namespace brook
