#include "headers/LogBuffer.h"
#include <algorithm>

namespace debug {
    LogBuffer::LogBuffer(size_t capacity, LogContext defaultContext)
        : capacity_(std::max<size_t>(capacity, 1)),
          head_(0),
          count_(0),
          total_appended_(0),
          defaultContext_(defaultContext) {
        buffer_.reserve(capacity_);
    }

    void LogBuffer::append(const std::string &message, LogContext context) {
        std::lock_guard<std::mutex> lock(mutex_);

        if (count_ == capacity_) { // Buffer full, overwriting oldest
            buffer_[head_] = LogEntry(message, context);
        } else {
            buffer_.emplace_back(message, context);
            count_++;
        }
        head_ = (head_ + 1) % capacity_;
        total_appended_++;
    }

    void LogBuffer::append(const std::string &message) {
        append(message, getDefaultContext());
    }

    std::vector<LogEntry> LogBuffer::readAll() const {
        std::lock_guard<std::mutex> lock(mutex_);

        std::vector<LogEntry> result;
        result.reserve(count_);

        // Oldest entry sits right behind the write position once the buffer has wrapped
        size_t start = (head_ + capacity_ - count_) % capacity_;
        for (size_t i = 0; i < count_; ++i) {
            result.push_back(buffer_[(start + i) % capacity_]);
        }
        return result;
    }

    std::vector<LogEntry> LogBuffer::readRecent(size_t count, std::optional<LogContext> contextFilter) const {
        std::lock_guard<std::mutex> lock(mutex_);

        std::vector<LogEntry> result;
        result.reserve(std::min(count, count_));

        size_t current = (head_ + capacity_ - 1) % capacity_;
        for (size_t visited = 0; visited < count_ && result.size() < count; ++visited) {
            if (!contextFilter.has_value() || buffer_[current].context == contextFilter.value()) {
                result.push_back(buffer_[current]);
            }
            current = (current + capacity_ - 1) % capacity_;
        }
        return result;
    }

    void LogBuffer::clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        buffer_.clear();
        buffer_.reserve(capacity_); // Keep the vector's capacity for future appends
        head_ = 0;
        count_ = 0;
    }

    size_t LogBuffer::size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return count_;
    }

    size_t LogBuffer::capacity() const {
        // Capacity doesn't change, no need for lock
        return capacity_;
    }

    size_t LogBuffer::totalAppended() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return total_appended_;
    }

    void LogBuffer::setDefaultContext(LogContext context) {
        std::lock_guard<std::mutex> lock(mutex_);
        defaultContext_ = context;
    }

    LogContext LogBuffer::getDefaultContext() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return defaultContext_;
    }
}
