#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <map>
#include <string>
#include <string_view>

namespace brook {

// =============================================================================
// MurmurHash3 - key routing to partitions
// =============================================================================
// Based on MurmurHash3 by Austin Appleby (public domain), 32-bit variant

class Hasher {
public:
    static uint32_t hash(const void* data, size_t len, uint32_t seed = 0) {
        const uint8_t* bytes = static_cast<const uint8_t*>(data);
        const size_t nblocks = len / 4;

        uint32_t h1 = seed;

        constexpr uint32_t c1 = 0xcc9e2d51;
        constexpr uint32_t c2 = 0x1b873593;

        for (size_t i = 0; i < nblocks; i++) {
            uint32_t k1;
            std::memcpy(&k1, bytes + i * 4, sizeof(k1));

            k1 *= c1;
            k1 = rotl32(k1, 15);
            k1 *= c2;

            h1 ^= k1;
            h1 = rotl32(h1, 13);
            h1 = h1 * 5 + 0xe6546b64;
        }

        const uint8_t* tail = bytes + nblocks * 4;
        uint32_t k1 = 0;

        switch (len & 3) {
            case 3: k1 ^= static_cast<uint32_t>(tail[2]) << 16; [[fallthrough]];
            case 2: k1 ^= static_cast<uint32_t>(tail[1]) << 8;  [[fallthrough]];
            case 1: k1 ^= tail[0];
                    k1 *= c1;
                    k1 = rotl32(k1, 15);
                    k1 *= c2;
                    h1 ^= k1;
        }

        h1 ^= static_cast<uint32_t>(len);
        return fmix32(h1);
    }

    static uint32_t hash(std::string_view key, uint32_t seed = 0) {
        return hash(key.data(), key.size(), seed);
    }

    // Partition for a non-empty key; keyless records are spread round-robin by Topic
    static uint32_t partition_for_key(std::string_view key, uint32_t num_partitions) {
        if (num_partitions == 0) return 0;
        return hash(key) % num_partitions;
    }

private:
    static constexpr uint32_t rotl32(uint32_t x, int8_t r) {
        return (x << r) | (x >> (32 - r));
    }

    static constexpr uint32_t fmix32(uint32_t h) {
        h ^= h >> 16;
        h *= 0x85ebca6b;
        h ^= h >> 13;
        h *= 0xc2b2ae35;
        h ^= h >> 16;
        return h;
    }
};

// =============================================================================
// Consistent Hashing - stable partition ownership across membership changes
// =============================================================================

class ConsistentHashRing {
public:
    explicit ConsistentHashRing(uint32_t virtual_nodes = 150)
        : virtual_nodes_(virtual_nodes) {}

    void add_node(const std::string& node) {
        for (uint32_t i = 0; i < virtual_nodes_; i++) {
            ring_[hash_node(node, i)] = node;
        }
    }

    void remove_node(const std::string& node) {
        for (uint32_t i = 0; i < virtual_nodes_; i++) {
            auto it = ring_.find(hash_node(node, i));
            if (it != ring_.end() && it->second == node) {
                ring_.erase(it);
            }
        }
    }

    // Owner of a key; empty string when the ring is empty
    std::string get_node(std::string_view key) const {
        if (ring_.empty()) return {};

        auto it = ring_.lower_bound(Hasher::hash(key));
        if (it == ring_.end()) {
            it = ring_.begin();  // Wrap around
        }
        return it->second;
    }

    bool empty() const { return ring_.empty(); }

private:
    static uint32_t hash_node(const std::string& node, uint32_t replica) {
        return Hasher::hash(node + "#" + std::to_string(replica));
    }

    uint32_t virtual_nodes_;
    std::map<uint32_t, std::string> ring_;  // hash -> node
};

} // namespace brook
