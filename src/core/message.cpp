/**
 * @file message.cpp
 * @brief Record payload encoding and CRC-32
 */

#include "message.h"
#include "byte_order.h"

#include <array>
#include <chrono>
#include <cstring>

namespace brook {

// =============================================================================
// CRC32 Implementation
// =============================================================================

namespace {

constexpr std::array<uint32_t, 256> make_crc32_table() {
    std::array<uint32_t, 256> table{};
    for (uint32_t i = 0; i < 256; ++i) {
        uint32_t c = i;
        for (int bit = 0; bit < 8; ++bit) {
            c = (c & 1) ? (0xEDB88320u ^ (c >> 1)) : (c >> 1);
        }
        table[i] = c;
    }
    return table;
}

constexpr std::array<uint32_t, 256> crc32_table = make_crc32_table();

} // anonymous namespace

uint32_t crc32(const void* data, size_t length) {
    return crc32_update(0, data, length);
}

uint32_t crc32_update(uint32_t crc, const void* data, size_t length) {
    const uint8_t* bytes = static_cast<const uint8_t*>(data);
    crc = ~crc;
    for (size_t i = 0; i < length; ++i) {
        crc = crc32_table[(crc ^ bytes[i]) & 0xFF] ^ (crc >> 8);
    }
    return ~crc;
}

// =============================================================================
// Message Implementation
// =============================================================================

uint64_t Message::current_time_ms() {
    auto now = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
}

std::vector<uint8_t> Message::serialize() const {
    std::vector<uint8_t> buffer;
    buffer.reserve(serialized_size());
    serialize_to(buffer);
    return buffer;
}

void Message::serialize_to(std::vector<uint8_t>& out) const {
    append_le(out, offset);
    append_le(out, timestamp_ms);

    append_le(out, static_cast<uint32_t>(key.size()));
    out.insert(out.end(), key.begin(), key.end());

    append_le(out, static_cast<uint32_t>(value.size()));
    out.insert(out.end(), value.begin(), value.end());
}

std::shared_ptr<Message> Message::deserialize(const uint8_t* data, size_t size) {
    if (data == nullptr || size < PAYLOAD_FIXED_SIZE) {
        return nullptr;
    }

    const uint8_t* ptr = data;
    const uint8_t* end = data + size;

    auto msg = std::make_shared<Message>();
    msg->offset = read_le<uint64_t>(ptr);
    msg->timestamp_ms = read_le<uint64_t>(ptr);

    uint32_t key_size = read_le<uint32_t>(ptr);
    // Leave room for the value size field
    if (static_cast<size_t>(end - ptr) < static_cast<size_t>(key_size) + sizeof(uint32_t)) {
        return nullptr;
    }
    msg->key.assign(reinterpret_cast<const char*>(ptr), key_size);
    ptr += key_size;

    uint32_t value_size = read_le<uint32_t>(ptr);
    if (static_cast<size_t>(end - ptr) != value_size) {
        return nullptr;
    }
    msg->value.assign(reinterpret_cast<const char*>(ptr), value_size);

    return msg;
}

} // namespace brook
