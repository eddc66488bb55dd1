/**
 * @file log_manager.cpp
 * @brief Segment rotation, lookup, retention and startup recovery
 */

#include "log_segment.h"
#include "logging.h"

#include <algorithm>
#include <cstdio>
#include <filesystem>

namespace fs = std::filesystem;

namespace brook {

LogManager::LogManager(const Config& config, std::shared_ptr<Clock> clock)
    : config_(config)
    , clock_(clock ? std::move(clock) : system_clock()) {
    std::error_code ec;
    fs::create_directories(config_.base_path, ec);
    if (ec) {
        load_status_ = Status::error(ErrorCode::STORAGE_IO_ERROR,
                                     "create directory " + config_.base_path + ": " + ec.message());
        logger()->error("Cannot open log at {}: {}", config_.base_path, load_status_.message);
        return;
    }

    load_status_ = load_segments();
    if (!load_status_.ok()) {
        logger()->error("Log at {} failed to load: {}", config_.base_path, load_status_.to_string());
        return;
    }

    if (segments_.empty()) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        load_status_ = roll_locked();
    }
}

LogManager::~LogManager() {
    Status s = flush();
    if (!s.ok()) {
        logger()->error("Failed to flush log {} on close: {}", config_.base_path, s.to_string());
    }
}

std::string LogManager::segment_filename(uint64_t base_offset) const {
    char filename[64];
    std::snprintf(filename, sizeof(filename), "%020llu.log",
                  static_cast<unsigned long long>(base_offset));
    return (fs::path(config_.base_path) / filename).string();
}

Status LogManager::load_segments() {
    std::vector<std::pair<uint64_t, std::string>> files;

    std::error_code ec;
    for (fs::directory_iterator it(config_.base_path, ec), end; !ec && it != end; it.increment(ec)) {
        const fs::path& file = it->path();
        if (file.extension() != ".log") {
            continue;
        }
        uint64_t base_offset = 0;
        if (!LogSegment::parse_base_offset(file.string(), base_offset)) {
            logger()->warn("Ignoring unrecognized file {}", file.string());
            continue;
        }
        files.emplace_back(base_offset, file.string());
    }
    if (ec) {
        return Status::error(ErrorCode::STORAGE_IO_ERROR,
                             "list " + config_.base_path + ": " + ec.message());
    }

    std::sort(files.begin(), files.end());

    std::unique_lock<std::shared_mutex> lock(mutex_);
    Status result;
    for (const auto& [base_offset, path] : files) {
        Status s;
        auto segment = LogSegment::open(path, config_.segment_options, s);
        if (!segment) {
            result = s;
            break;
        }

        if (!segments_.empty() && segments_.back()->next_offset() != base_offset) {
            result = Status::error(ErrorCode::SEGMENT_CORRUPTED,
                                   "gap in log: " + segments_.back()->path() + " ends at offset " +
                                   std::to_string(segments_.back()->next_offset()) + " but " + path +
                                   " starts at " + std::to_string(base_offset));
            break;
        }

        segment->set_created_at(clock_->now());
        segments_.push_back(std::shared_ptr<LogSegment>(std::move(segment)));
    }

    // Every segment but the newest is sealed
    for (size_t i = 0; i + 1 < segments_.size(); ++i) {
        Status s = segments_[i]->close();
        if (!s.ok() && result.ok()) {
            result = s;
        }
    }

    if (!segments_.empty()) {
        active_segment_ = segments_.back();
        logger()->debug("Loaded {} segments from {}, offsets [{}, {})",
                        segments_.size(), config_.base_path,
                        segments_.front()->base_offset(), active_segment_->next_offset());
    }
    return result;
}

bool LogManager::needs_roll_locked() const {
    if (!active_segment_) {
        return true;
    }
    if (active_segment_->should_rotate(config_.max_segment_bytes, config_.max_segment_messages)) {
        return true;
    }
    if (config_.max_segment_age_ms > 0 && active_segment_->message_count() > 0) {
        auto age = clock_->now() - active_segment_->created_at();
        return age >= std::chrono::milliseconds(config_.max_segment_age_ms);
    }
    return false;
}

Status LogManager::roll_locked() {
    if (removed_) {
        return Status::error(ErrorCode::SHUTTING_DOWN, "log " + config_.base_path + " was removed");
    }

    uint64_t base_offset = 0;
    if (active_segment_) {
        // On failure the segment stays active and writable
        Status s = active_segment_->close();
        if (!s.ok()) {
            return s.with_context("seal " + active_segment_->path());
        }
        base_offset = active_segment_->next_offset();

        // An empty sealed segment is replaced rather than kept
        if (active_segment_->message_count() == 0 && !segments_.empty() &&
            segments_.back() == active_segment_) {
            segments_.pop_back();
        }
    } else if (!segments_.empty()) {
        base_offset = segments_.back()->next_offset();
    }

    Status s;
    auto segment = LogSegment::create(segment_filename(base_offset), base_offset,
                                      config_.segment_options, s);
    if (!segment) {
        return s;
    }
    segment->set_created_at(clock_->now());

    active_segment_ = std::shared_ptr<LogSegment>(std::move(segment));
    segments_.push_back(active_segment_);
    logger()->debug("Rolled new segment {}", active_segment_->path());
    return Status::OK();
}

AppendResult LogManager::append(Message& msg) {
    if (!load_status_.ok()) {
        return {load_status_, 0};
    }

    // A concurrent roll may seal the segment we picked; retry once on the new one
    for (int attempt = 0; attempt < 2; ++attempt) {
        std::shared_ptr<LogSegment> segment;
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            if (!needs_roll_locked()) {
                segment = active_segment_;
            }
        }
        if (!segment) {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            if (needs_roll_locked()) {
                Status s = roll_locked();
                if (!s.ok()) {
                    return {s, 0};
                }
            }
            segment = active_segment_;
        }

        AppendResult result = segment->append(msg);
        if (result.ok() || !segment->is_sealed()) {
            return result;
        }
    }
    return {Status::error(ErrorCode::STORAGE_IO_ERROR, "active segment sealed during append"), 0};
}

std::shared_ptr<LogSegment> LogManager::find_segment(uint64_t offset) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = std::upper_bound(segments_.begin(), segments_.end(), offset,
        [](uint64_t off, const std::shared_ptr<LogSegment>& segment) {
            return off < segment->base_offset();
        });
    if (it == segments_.begin()) {
        return nullptr;
    }
    --it;
    return (*it)->contains_offset(offset) ? *it : nullptr;
}

ReadResult LogManager::read(uint64_t offset) const {
    auto segment = find_segment(offset);
    if (!segment) {
        uint64_t start = start_offset();
        if (offset < start) {
            return {Status::error(ErrorCode::OFFSET_OUT_OF_RANGE,
                                  "offset " + std::to_string(offset) +
                                  " was removed by retention, log starts at " + std::to_string(start)),
                    nullptr};
        }
        return {Status::error(ErrorCode::OFFSET_OUT_OF_RANGE,
                              "offset " + std::to_string(offset) +
                              " is beyond log end " + std::to_string(end_offset())),
                nullptr};
    }
    return segment->read(offset);
}

std::vector<MessagePtr> LogManager::read_batch(uint64_t start_offset,
                                               size_t max_messages,
                                               Status* status) const {
    std::vector<MessagePtr> messages;
    if (status) {
        *status = Status::OK();
    }

    uint64_t current = start_offset;
    while (messages.size() < max_messages) {
        auto segment = find_segment(current);
        if (!segment) {
            if (messages.empty() && status && current < this->start_offset()) {
                *status = Status::error(ErrorCode::OFFSET_OUT_OF_RANGE,
                                        "offset " + std::to_string(current) +
                                        " was removed by retention");
            }
            break;
        }

        Status s;
        auto batch = segment->read_batch(current, max_messages - messages.size(), &s);
        for (auto& msg : batch) {
            messages.push_back(std::move(msg));
        }
        if (!s.ok()) {
            if (status) {
                *status = s;
            }
            break;
        }
        if (batch.empty()) {
            break;
        }
        current = messages.back()->offset + 1;
    }

    return messages;
}

Status LogManager::flush() {
    std::shared_ptr<LogSegment> active;
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        active = active_segment_;
    }
    if (!active) {
        return Status::OK();
    }
    return active->flush();
}

uint64_t LogManager::start_offset() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return segments_.empty() ? 0 : segments_.front()->base_offset();
}

uint64_t LogManager::end_offset() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    if (active_segment_) {
        return active_segment_->next_offset();
    }
    return segments_.empty() ? 0 : segments_.back()->next_offset();
}

size_t LogManager::segment_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return segments_.size();
}

size_t LogManager::size_bytes() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    size_t total = 0;
    for (const auto& segment : segments_) {
        total += segment->size_bytes();
    }
    return total;
}

size_t LogManager::apply_retention(const RetentionPolicy& policy) {
    std::vector<std::shared_ptr<LogSegment>> doomed;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (segments_.size() <= 1) {
            return 0;
        }

        std::vector<SegmentInfo> sealed;
        size_t total_bytes = 0;
        for (const auto& segment : segments_) {
            total_bytes += segment->size_bytes();
            if (segment != active_segment_) {
                sealed.push_back(segment->info());
            }
        }

        size_t count = std::min(policy.segments_to_delete(sealed, total_bytes, clock_->wall_time_ms()),
                                sealed.size());
        doomed.assign(segments_.begin(), segments_.begin() + static_cast<std::ptrdiff_t>(count));
        segments_.erase(segments_.begin(), segments_.begin() + static_cast<std::ptrdiff_t>(count));
    }

    // Readers holding a segment keep their descriptors until they finish
    for (const auto& segment : doomed) {
        Status s = segment->remove_files();
        if (!s.ok()) {
            logger()->warn("Retention could not remove {}: {}", segment->path(), s.message);
        } else {
            logger()->info("Retention removed {} (offsets [{}, {}))",
                           segment->path(), segment->base_offset(), segment->next_offset());
        }
    }
    return doomed.size();
}

Status LogManager::remove_all() {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    Status result;
    for (const auto& segment : segments_) {
        Status s = segment->close();
        if (!s.ok()) {
            logger()->warn("Removing {} with unwritten records: {}", segment->path(), s.message);
        }
        s = segment->remove_files();
        if (!s.ok() && result.ok()) {
            result = s;
        }
    }
    segments_.clear();
    active_segment_.reset();

    std::error_code ec;
    fs::remove_all(config_.base_path, ec);
    if (ec && result.ok()) {
        result = Status::error(ErrorCode::STORAGE_IO_ERROR,
                               "remove " + config_.base_path + ": " + ec.message());
    }
    removed_ = true;
    return result;
}

} // namespace brook
