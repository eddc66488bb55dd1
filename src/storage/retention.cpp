/**
 * @file retention.cpp
 * @brief Size, time and composite retention policies
 */

#include "retention.h"

#include <algorithm>

namespace brook {

size_t SizeRetentionPolicy::segments_to_delete(const std::vector<SegmentInfo>& sealed,
                                               size_t total_bytes,
                                               uint64_t /*now_ms*/) const {
    size_t count = 0;
    uint64_t remaining = total_bytes;
    while (count < sealed.size() && remaining > max_bytes_) {
        remaining -= std::min<uint64_t>(remaining, sealed[count].size_bytes);
        ++count;
    }
    return count;
}

size_t TimeRetentionPolicy::segments_to_delete(const std::vector<SegmentInfo>& sealed,
                                               size_t /*total_bytes*/,
                                               uint64_t now_ms) const {
    size_t count = 0;
    while (count < sealed.size()) {
        uint64_t newest = sealed[count].max_timestamp_ms;
        if (now_ms < newest || now_ms - newest <= max_age_ms_) {
            break;
        }
        ++count;
    }
    return count;
}

size_t CompositeRetentionPolicy::segments_to_delete(const std::vector<SegmentInfo>& sealed,
                                                    size_t total_bytes,
                                                    uint64_t now_ms) const {
    size_t count = 0;
    for (const auto& policy : policies_) {
        count = std::max(count, policy->segments_to_delete(sealed, total_bytes, now_ms));
    }
    return count;
}

std::shared_ptr<RetentionPolicy> make_retention_policy(uint64_t retention_bytes,
                                                       uint64_t retention_ms) {
    std::vector<std::shared_ptr<RetentionPolicy>> policies;
    if (retention_bytes > 0) {
        policies.push_back(std::make_shared<SizeRetentionPolicy>(retention_bytes));
    }
    if (retention_ms > 0) {
        policies.push_back(std::make_shared<TimeRetentionPolicy>(retention_ms));
    }

    if (policies.empty()) {
        return std::make_shared<NoRetention>();
    }
    if (policies.size() == 1) {
        return policies.front();
    }
    return std::make_shared<CompositeRetentionPolicy>(std::move(policies));
}

} // namespace brook
