#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace brook {

/**
 * @brief Little-endian encoding helpers shared by the record and index
 * formats. Independent of host byte order.
 */

template<typename T>
void write_le(uint8_t*& ptr, T value) {
    for (size_t i = 0; i < sizeof(T); ++i) {
        *ptr++ = static_cast<uint8_t>(value >> (i * 8));
    }
}

template<typename T>
void append_le(std::vector<uint8_t>& out, T value) {
    for (size_t i = 0; i < sizeof(T); ++i) {
        out.push_back(static_cast<uint8_t>(value >> (i * 8)));
    }
}

template<typename T>
T read_le(const uint8_t*& ptr) {
    T value = 0;
    for (size_t i = 0; i < sizeof(T); ++i) {
        value |= static_cast<T>(*ptr++) << (i * 8);
    }
    return value;
}

template<typename T>
T load_le(const uint8_t* ptr) {
    return read_le<T>(ptr);
}

} // namespace brook
