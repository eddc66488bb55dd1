/**
 * @file log_segment.cpp
 * @brief Append-only log segment with sparse index and tail recovery
 */

#include "log_segment.h"
#include "byte_order.h"
#include "logging.h"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <filesystem>

namespace fs = std::filesystem;

namespace brook {

// =============================================================================
// Helper Functions
// =============================================================================

namespace {

std::string errno_text(const char* op, const std::string& path, int err) {
    return std::string(op) + " " + path + ": " + std::strerror(err);
}

bool pwrite_full(int fd, const uint8_t* data, size_t size, uint64_t position) {
    while (size > 0) {
        ssize_t n = ::pwrite(fd, data, size, static_cast<off_t>(position));
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        data += n;
        size -= static_cast<size_t>(n);
        position += static_cast<uint64_t>(n);
    }
    return true;
}

/**
 * @brief Read exactly `size` bytes or report why not
 *
 * STORAGE_IO_ERROR when the read fails, SEGMENT_CORRUPTED when the file
 * ends first.
 */
Status read_exact(int fd, uint8_t* data, size_t size, uint64_t position, const std::string& path) {
    while (size > 0) {
        ssize_t n = ::pread(fd, data, size, static_cast<off_t>(position));
        if (n < 0) {
            if (errno == EINTR) continue;
            return Status::error(ErrorCode::STORAGE_IO_ERROR, errno_text("read", path, errno));
        }
        if (n == 0) {
            return Status::error(ErrorCode::SEGMENT_CORRUPTED,
                                 "unexpected end of file at position " + std::to_string(position));
        }
        data += n;
        size -= static_cast<size_t>(n);
        position += static_cast<uint64_t>(n);
    }
    return Status::OK();
}

Status file_size(int fd, const std::string& path, uint64_t& size) {
    struct stat st;
    if (::fstat(fd, &st) != 0) {
        return Status::error(ErrorCode::STORAGE_IO_ERROR, errno_text("stat", path, errno));
    }
    size = static_cast<uint64_t>(st.st_size);
    return Status::OK();
}

int open_file(const std::string& path, int flags) {
    int fd;
    do {
        fd = ::open(path.c_str(), flags | O_CLOEXEC, 0644);
    } while (fd < 0 && errno == EINTR);
    return fd;
}

} // anonymous namespace

// =============================================================================
// LogSegment Implementation
// =============================================================================

std::string LogSegment::index_path_for(const std::string& log_path) {
    return fs::path(log_path).replace_extension(".index").string();
}

bool LogSegment::parse_base_offset(const std::string& path, uint64_t& base_offset) {
    std::string stem = fs::path(path).stem().string();
    if (stem.size() != 20) {
        return false;
    }
    for (char c : stem) {
        if (!std::isdigit(static_cast<unsigned char>(c))) {
            return false;
        }
    }
    base_offset = std::stoull(stem);
    return true;
}

std::unique_ptr<LogSegment> LogSegment::create(const std::string& path,
                                               uint64_t base_offset,
                                               const Options& options,
                                               Status& status) {
    auto segment = std::unique_ptr<LogSegment>(new LogSegment());
    segment->path_ = path;
    segment->index_path_ = index_path_for(path);
    segment->base_offset_ = base_offset;
    segment->options_ = options;
    segment->created_at_ = std::chrono::steady_clock::now();
    segment->next_offset_.store(base_offset);
    segment->buffer_base_offset_ = base_offset;

    fs::path file_path(path);
    if (file_path.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(file_path.parent_path(), ec);
        if (ec) {
            status = Status::error(ErrorCode::STORAGE_IO_ERROR,
                                   "create directory " + file_path.parent_path().string() + ": " + ec.message());
            return nullptr;
        }
    }

    segment->fd_ = open_file(path, O_RDWR | O_CREAT | O_TRUNC);
    if (segment->fd_ < 0) {
        status = Status::error(ErrorCode::STORAGE_IO_ERROR, errno_text("create", path, errno));
        return nullptr;
    }

    segment->index_fd_ = open_file(segment->index_path_, O_RDWR | O_CREAT | O_TRUNC);
    if (segment->index_fd_ < 0) {
        status = Status::error(ErrorCode::STORAGE_IO_ERROR,
                               errno_text("create", segment->index_path_, errno));
        return nullptr;
    }

    status = Status::OK();
    return segment;
}

std::unique_ptr<LogSegment> LogSegment::open(const std::string& path,
                                             const Options& options,
                                             Status& status) {
    uint64_t base_offset = 0;
    if (!parse_base_offset(path, base_offset)) {
        status = Status::error(ErrorCode::SEGMENT_CORRUPTED, "unrecognized segment file name " + path);
        return nullptr;
    }

    auto segment = std::unique_ptr<LogSegment>(new LogSegment());
    segment->path_ = path;
    segment->index_path_ = index_path_for(path);
    segment->base_offset_ = base_offset;
    segment->options_ = options;
    segment->created_at_ = std::chrono::steady_clock::now();

    segment->fd_ = open_file(path, O_RDWR);
    if (segment->fd_ < 0) {
        status = Status::error(ErrorCode::STORAGE_IO_ERROR, errno_text("open", path, errno));
        return nullptr;
    }

    // A missing index is rebuilt from the records
    segment->index_fd_ = open_file(segment->index_path_, O_RDWR | O_CREAT);
    if (segment->index_fd_ < 0) {
        status = Status::error(ErrorCode::STORAGE_IO_ERROR,
                               errno_text("open", segment->index_path_, errno));
        return nullptr;
    }

    status = segment->recover();
    if (!status.ok()) {
        status = status.with_context("recover " + path);
        return nullptr;
    }
    return segment;
}

LogSegment::~LogSegment() {
    {
        std::lock_guard<std::mutex> lock(write_mutex_);
        if (!sealed_.load() && fd_ >= 0 && index_fd_ >= 0) {
            Status s = flush_locked();
            if (!s.ok()) {
                logger()->error("Failed to flush segment {} on close: {}", path_, s.to_string());
            }
        }
    }
    if (fd_ >= 0) {
        ::close(fd_);
    }
    if (index_fd_ >= 0) {
        ::close(index_fd_);
    }
}

// =============================================================================
// Recovery
// =============================================================================

Status LogSegment::load_index(uint64_t log_size, bool& changed) {
    uint64_t index_size = 0;
    Status s = file_size(index_fd_, index_path_, index_size);
    if (!s.ok()) {
        return s;
    }

    size_t count = static_cast<size_t>(index_size / INDEX_ENTRY_SIZE);
    changed = (index_size % INDEX_ENTRY_SIZE) != 0;

    std::vector<uint8_t> buffer(count * INDEX_ENTRY_SIZE);
    if (!buffer.empty()) {
        s = read_exact(index_fd_, buffer.data(), buffer.size(), 0, index_path_);
        if (!s.ok()) {
            return s;
        }
    }

    index_.clear();
    index_.reserve(count);
    const uint8_t* ptr = buffer.data();
    for (size_t i = 0; i < count; ++i) {
        IndexEntry entry;
        entry.offset = read_le<uint64_t>(ptr);
        entry.position = read_le<uint64_t>(ptr);

        bool valid = entry.offset >= base_offset_ && entry.position < log_size;
        if (valid && !index_.empty()) {
            valid = entry.offset > index_.back().offset && entry.position > index_.back().position;
        }
        if (!valid) {
            changed = true;
            break;
        }
        index_.push_back(entry);
    }
    return Status::OK();
}

Status LogSegment::rewrite_index() {
    std::vector<uint8_t> buffer;
    buffer.reserve(index_.size() * INDEX_ENTRY_SIZE);
    for (const auto& entry : index_) {
        append_le(buffer, entry.offset);
        append_le(buffer, entry.position);
    }

    if (::ftruncate(index_fd_, 0) != 0) {
        return Status::error(ErrorCode::STORAGE_IO_ERROR, errno_text("truncate", index_path_, errno));
    }
    if (!buffer.empty() && !pwrite_full(index_fd_, buffer.data(), buffer.size(), 0)) {
        return Status::error(ErrorCode::STORAGE_IO_ERROR, errno_text("write", index_path_, errno));
    }
    return Status::OK();
}

Status LogSegment::recover() {
    uint64_t log_size = 0;
    Status s = file_size(fd_, path_, log_size);
    if (!s.ok()) {
        return s;
    }

    bool index_changed = false;
    s = load_index(log_size, index_changed);
    if (!s.ok()) {
        return s;
    }

    // Resume from the newest index entry whose record still validates
    uint64_t position = 0;
    uint64_t expected = base_offset_;
    bool at_indexed = false;
    while (!index_.empty()) {
        const IndexEntry& last = index_.back();
        MessagePtr msg;
        uint64_t next_position = 0;
        if (read_record(last.position, last.offset, msg, next_position).ok()) {
            position = last.position;
            expected = last.offset;
            at_indexed = true;
            break;
        }
        index_.pop_back();
        index_changed = true;
    }

    uint64_t max_timestamp = 0;
    uint32_t since_index = 0;
    std::string stop_reason;
    while (position < log_size) {
        MessagePtr msg;
        uint64_t next_position = 0;
        Status rs = read_record(position, expected, msg, next_position);
        if (!rs.ok()) {
            if (rs.code == ErrorCode::STORAGE_IO_ERROR) {
                return rs;
            }
            stop_reason = rs.message;
            break;
        }

        if (at_indexed) {
            at_indexed = false;
            since_index = 1;
        } else {
            if (index_.empty() || since_index >= options_.index_interval) {
                index_.push_back(IndexEntry{expected, position});
                index_changed = true;
                since_index = 0;
            }
            ++since_index;
        }

        max_timestamp = std::max(max_timestamp, msg->timestamp_ms);
        position = next_position;
        ++expected;
    }

    if (position < log_size) {
        if (::ftruncate(fd_, static_cast<off_t>(position)) != 0) {
            return Status::error(ErrorCode::STORAGE_IO_ERROR, errno_text("truncate", path_, errno));
        }
        logger()->info("Recovered segment {}: truncated {} bytes at position {} ({})",
                       path_, log_size - position, position, stop_reason);
    }

    if (index_changed) {
        s = rewrite_index();
        if (!s.ok()) {
            return s;
        }
    } else {
        uint64_t index_size = 0;
        s = file_size(index_fd_, index_path_, index_size);
        if (!s.ok()) {
            return s;
        }
        if (index_size != index_.size() * INDEX_ENTRY_SIZE) {
            s = rewrite_index();
            if (!s.ok()) {
                return s;
            }
        }
    }

    next_offset_.store(expected);
    buffer_base_offset_ = expected;
    size_bytes_.store(static_cast<size_t>(position));
    written_bytes_.store(static_cast<size_t>(position));
    max_timestamp_ms_.store(max_timestamp);
    records_since_index_ = since_index;
    index_written_ = index_.size();
    return Status::OK();
}

// =============================================================================
// Write Path
// =============================================================================

AppendResult LogSegment::append(Message& msg) {
    std::lock_guard<std::mutex> lock(write_mutex_);

    if (sealed_.load()) {
        return {Status::error(ErrorCode::STORAGE_IO_ERROR, "segment " + path_ + " is sealed"), 0};
    }

    const size_t payload_size = msg.serialized_size();
    if (payload_size > MAX_RECORD_BYTES) {
        return {Status::error(ErrorCode::STORAGE_IO_ERROR,
                              "record of " + std::to_string(payload_size) + " bytes exceeds the " +
                              std::to_string(MAX_RECORD_BYTES) + " byte limit"), 0};
    }

    const uint64_t offset = next_offset_.load();
    const size_t position = size_bytes_.load();
    msg.offset = offset;

    // [length][crc] is filled in once the payload is in place
    const size_t header_at = write_buffer_.size();
    write_buffer_.resize(header_at + RECORD_HEADER_SIZE);
    msg.serialize_to(write_buffer_);

    uint32_t checksum = crc32(write_buffer_.data() + header_at + RECORD_HEADER_SIZE, payload_size);
    uint8_t* header = write_buffer_.data() + header_at;
    write_le(header, static_cast<uint32_t>(payload_size));
    write_le(header, checksum);

    if (index_.empty() || records_since_index_ >= options_.index_interval) {
        std::unique_lock<std::shared_mutex> index_lock(index_mutex_);
        index_.push_back(IndexEntry{offset, position});
        records_since_index_ = 0;
    }
    ++records_since_index_;

    if (msg.timestamp_ms > max_timestamp_ms_.load()) {
        max_timestamp_ms_.store(msg.timestamp_ms);
    }

    size_bytes_.store(position + RECORD_HEADER_SIZE + payload_size);
    next_offset_.store(offset + 1, std::memory_order_release);

    if (write_buffer_.size() >= options_.write_buffer_bytes) {
        Status s = write_out_locked();
        if (!s.ok()) {
            return {s, 0};
        }
    }

    return {Status::OK(), offset};
}

Status LogSegment::write_out_locked() {
    if (write_buffer_.empty()) {
        return Status::OK();
    }

    const size_t at = written_bytes_.load();
    if (!pwrite_full(fd_, write_buffer_.data(), write_buffer_.size(), at)) {
        Status s = Status::error(ErrorCode::STORAGE_IO_ERROR, errno_text("write", path_, errno));

        // Drop everything buffered so no partial record survives
        if (::ftruncate(fd_, static_cast<off_t>(at)) != 0) {
            logger()->error("Failed to truncate {} after write error: {}", path_, std::strerror(errno));
        }
        {
            std::unique_lock<std::shared_mutex> index_lock(index_mutex_);
            while (!index_.empty() && index_.back().position >= at) {
                index_.pop_back();
            }
            index_written_ = std::min(index_written_, index_.size());
            records_since_index_ = index_.empty()
                ? 0 : static_cast<uint32_t>(buffer_base_offset_ - index_.back().offset);
        }
        logger()->error("Rolled back offsets [{}, {}) in {}: {}",
                        buffer_base_offset_, next_offset_.load(), path_, s.message);
        next_offset_.store(buffer_base_offset_);
        size_bytes_.store(at);
        write_buffer_.clear();

        pending_error_ = s;
        return s;
    }

    written_bytes_.store(at + write_buffer_.size(), std::memory_order_release);
    write_buffer_.clear();
    buffer_base_offset_ = next_offset_.load();
    return Status::OK();
}

Status LogSegment::write_index_locked() {
    std::vector<uint8_t> buffer;
    size_t first = 0;
    {
        std::shared_lock<std::shared_mutex> index_lock(index_mutex_);
        first = index_written_;
        for (size_t i = first; i < index_.size(); ++i) {
            append_le(buffer, index_[i].offset);
            append_le(buffer, index_[i].position);
        }
    }
    if (buffer.empty()) {
        return Status::OK();
    }

    if (!pwrite_full(index_fd_, buffer.data(), buffer.size(), first * INDEX_ENTRY_SIZE)) {
        return Status::error(ErrorCode::STORAGE_IO_ERROR, errno_text("write", index_path_, errno));
    }
    index_written_ = first + buffer.size() / INDEX_ENTRY_SIZE;
    return Status::OK();
}

Status LogSegment::flush_locked() {
    Status s = write_out_locked();
    if (!pending_error_.ok()) {
        Status pending = pending_error_;
        pending_error_ = Status::OK();
        return pending;
    }
    if (!s.ok()) {
        return s;
    }

    s = write_index_locked();
    if (!s.ok()) {
        return s;
    }

    if (options_.fsync) {
        if (::fdatasync(fd_) != 0) {
            return Status::error(ErrorCode::STORAGE_IO_ERROR, errno_text("fdatasync", path_, errno));
        }
        if (::fdatasync(index_fd_) != 0) {
            return Status::error(ErrorCode::STORAGE_IO_ERROR, errno_text("fdatasync", index_path_, errno));
        }
    }
    return Status::OK();
}

Status LogSegment::flush() {
    std::lock_guard<std::mutex> lock(write_mutex_);
    return flush_locked();
}

Status LogSegment::close() {
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (sealed_.load()) {
        return Status::OK();
    }
    // A segment whose tail did not reach the file stays writable, so the
    // next offset continues from the last record that did
    Status s = flush_locked();
    if (!s.ok()) {
        return s;
    }
    sealed_.store(true, std::memory_order_release);
    return Status::OK();
}

Status LogSegment::remove_files() {
    Status result;
    for (const std::string* file : {&path_, &index_path_}) {
        if (::unlink(file->c_str()) != 0 && errno != ENOENT) {
            result = Status::error(ErrorCode::STORAGE_IO_ERROR, errno_text("unlink", *file, errno));
        }
    }
    return result;
}

// =============================================================================
// Read Path
// =============================================================================

size_t LogSegment::index_entries() const {
    std::shared_lock<std::shared_mutex> lock(index_mutex_);
    return index_.size();
}

Status LogSegment::ensure_readable() {
    if (written_bytes_.load(std::memory_order_acquire) >= size_bytes_.load(std::memory_order_acquire)) {
        return Status::OK();
    }
    std::lock_guard<std::mutex> lock(write_mutex_);
    return write_out_locked();
}

Status LogSegment::locate(uint64_t offset, uint64_t& position) const {
    uint64_t pos = 0;
    uint64_t current = 0;
    {
        std::shared_lock<std::shared_mutex> lock(index_mutex_);
        auto it = std::upper_bound(index_.begin(), index_.end(), offset,
            [](uint64_t off, const IndexEntry& entry) {
                return off < entry.offset;
            });
        if (it == index_.begin()) {
            return Status::error(ErrorCode::SEGMENT_CORRUPTED,
                                 "no index entry at or below offset " + std::to_string(offset));
        }
        --it;
        pos = it->position;
        current = it->offset;
    }

    // Skip forward record by record, checking each header's offset
    uint8_t header[RECORD_HEADER_SIZE + sizeof(uint64_t)];
    while (current < offset) {
        Status s = read_exact(fd_, header, sizeof(header), pos, path_);
        if (!s.ok()) {
            return s;
        }
        uint32_t length = load_le<uint32_t>(header);
        uint64_t found = load_le<uint64_t>(header + RECORD_HEADER_SIZE);
        if (found != current || length < Message::PAYLOAD_FIXED_SIZE || length > MAX_RECORD_BYTES) {
            return Status::error(ErrorCode::SEGMENT_CORRUPTED,
                                 "bad record header at position " + std::to_string(pos));
        }
        pos += RECORD_HEADER_SIZE + length;
        ++current;
    }

    position = pos;
    return Status::OK();
}

Status LogSegment::read_record(uint64_t position, uint64_t expected_offset,
                               MessagePtr& out, uint64_t& next_position) const {
    uint8_t header[RECORD_HEADER_SIZE];
    Status s = read_exact(fd_, header, sizeof(header), position, path_);
    if (!s.ok()) {
        return s;
    }

    uint32_t length = load_le<uint32_t>(header);
    uint32_t checksum = load_le<uint32_t>(header + 4);
    if (length < Message::PAYLOAD_FIXED_SIZE || length > MAX_RECORD_BYTES) {
        return Status::error(ErrorCode::SEGMENT_CORRUPTED,
                             "invalid record length " + std::to_string(length) +
                             " at position " + std::to_string(position));
    }

    std::vector<uint8_t> payload(length);
    s = read_exact(fd_, payload.data(), payload.size(), position + RECORD_HEADER_SIZE, path_);
    if (!s.ok()) {
        return s;
    }

    if (crc32(payload.data(), payload.size()) != checksum) {
        return Status::error(ErrorCode::SEGMENT_CORRUPTED,
                             "checksum mismatch at position " + std::to_string(position));
    }

    auto msg = Message::deserialize(payload.data(), payload.size());
    if (!msg) {
        return Status::error(ErrorCode::SEGMENT_CORRUPTED,
                             "malformed record at position " + std::to_string(position));
    }
    if (msg->offset != expected_offset) {
        return Status::error(ErrorCode::SEGMENT_CORRUPTED,
                             "expected offset " + std::to_string(expected_offset) +
                             " but found " + std::to_string(msg->offset));
    }

    out = std::move(msg);
    next_position = position + RECORD_HEADER_SIZE + length;
    return Status::OK();
}

ReadResult LogSegment::read(uint64_t offset) {
    if (!contains_offset(offset)) {
        return {Status::error(ErrorCode::OFFSET_OUT_OF_RANGE,
                              "offset " + std::to_string(offset) + " not in segment " + path_), nullptr};
    }

    Status s = ensure_readable();
    if (!s.ok()) {
        return {s, nullptr};
    }

    uint64_t position = 0;
    s = locate(offset, position);
    if (!s.ok()) {
        return {s.with_context(path_), nullptr};
    }

    MessagePtr msg;
    uint64_t next_position = 0;
    s = read_record(position, offset, msg, next_position);
    if (!s.ok()) {
        return {s.with_context(path_), nullptr};
    }
    return {Status::OK(), std::move(msg)};
}

std::vector<MessagePtr> LogSegment::read_batch(uint64_t start_offset,
                                               size_t max_messages,
                                               Status* status) {
    std::vector<MessagePtr> messages;
    if (status) {
        *status = Status::OK();
    }
    if (max_messages == 0) {
        return messages;
    }

    const uint64_t end = next_offset();
    if (start_offset < base_offset_ || start_offset >= end) {
        if (status) {
            *status = Status::error(ErrorCode::OFFSET_OUT_OF_RANGE,
                                    "offset " + std::to_string(start_offset) + " not in segment " + path_);
        }
        return messages;
    }

    Status s = ensure_readable();
    uint64_t position = 0;
    if (s.ok()) {
        s = locate(start_offset, position);
    }

    uint64_t current = start_offset;
    while (s.ok() && messages.size() < max_messages && current < end) {
        MessagePtr msg;
        uint64_t next_position = 0;
        s = read_record(position, current, msg, next_position);
        if (s.ok()) {
            messages.push_back(std::move(msg));
            position = next_position;
            ++current;
        }
    }

    if (!s.ok() && status) {
        *status = s.with_context(path_);
    }
    return messages;
}

} // namespace brook
