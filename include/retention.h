#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace brook {

/**
 * @brief What a retention policy sees of one sealed segment
 */
struct SegmentInfo {
    uint64_t base_offset{0};
    uint64_t next_offset{0};
    size_t size_bytes{0};
    uint64_t max_timestamp_ms{0};
};

/**
 * @brief Decides which sealed segments of a partition log may be deleted
 *
 * Deletion always takes a prefix of the log: the policy returns how many
 * of the oldest sealed segments to drop. The active segment is never
 * offered.
 */
class RetentionPolicy {
public:
    virtual ~RetentionPolicy() = default;

    /**
     * @param sealed     Sealed segments, oldest first
     * @param total_bytes Size of the whole log including the active segment
     * @param now_ms     Wall-clock time in milliseconds
     * @return Number of leading segments to delete
     */
    virtual size_t segments_to_delete(const std::vector<SegmentInfo>& sealed,
                                      size_t total_bytes,
                                      uint64_t now_ms) const = 0;
};

class NoRetention : public RetentionPolicy {
public:
    size_t segments_to_delete(const std::vector<SegmentInfo>&, size_t, uint64_t) const override {
        return 0;
    }
};

// Deletes the oldest segments while the log exceeds max_bytes
class SizeRetentionPolicy : public RetentionPolicy {
public:
    explicit SizeRetentionPolicy(uint64_t max_bytes) : max_bytes_(max_bytes) {}

    size_t segments_to_delete(const std::vector<SegmentInfo>& sealed,
                              size_t total_bytes,
                              uint64_t now_ms) const override;

private:
    uint64_t max_bytes_;
};

// Deletes segments whose newest record is older than max_age_ms
class TimeRetentionPolicy : public RetentionPolicy {
public:
    explicit TimeRetentionPolicy(uint64_t max_age_ms) : max_age_ms_(max_age_ms) {}

    size_t segments_to_delete(const std::vector<SegmentInfo>& sealed,
                              size_t total_bytes,
                              uint64_t now_ms) const override;

private:
    uint64_t max_age_ms_;
};

// Deletes the longest prefix any member policy asks for
class CompositeRetentionPolicy : public RetentionPolicy {
public:
    explicit CompositeRetentionPolicy(std::vector<std::shared_ptr<RetentionPolicy>> policies)
        : policies_(std::move(policies)) {}

    size_t segments_to_delete(const std::vector<SegmentInfo>& sealed,
                              size_t total_bytes,
                              uint64_t now_ms) const override;

private:
    std::vector<std::shared_ptr<RetentionPolicy>> policies_;
};

/**
 * @brief Build the policy for a topic's retention settings
 *
 * A zero limit disables that dimension; both zero yields NoRetention.
 */
std::shared_ptr<RetentionPolicy> make_retention_policy(uint64_t retention_bytes,
                                                       uint64_t retention_ms);

} // namespace brook
