#include "headers/LogBufferManager.h"
#include <stdexcept>

namespace debug {

LogBufferManager& LogBufferManager::getInstance() {
    static LogBufferManager instance;
    return instance;
}

LogBufferManager::~LogBufferManager() {
    shutdown();
}

LogBuffer& LogBufferManager::getOrCreate(const std::string& name, size_t capacity, LogContext defaultContext) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return getOrCreateInternal(name, capacity, defaultContext);
}

LogBuffer& LogBufferManager::getOrCreateInternal(const std::string& name, size_t capacity, LogContext defaultContext) {
    // Caller holds mutex_
    auto it = buffers_.find(name);
    if (it != buffers_.end()) {
        return *it->second;
    }

    auto buffer = std::make_unique<LogBuffer>(capacity, defaultContext);
    LogBuffer& bufferRef = *buffer;
    buffers_[name] = std::move(buffer);
    return bufferRef;
}

void LogBufferManager::appendTo(const std::string& name, const std::string& message,
                                std::optional<LogContext> context) {
    if (shutting_down_.load(std::memory_order_relaxed)) {
        return; // Do not operate if shutting down
    }

    std::lock_guard<std::recursive_mutex> lock(mutex_);
    LogBuffer& buffer = getOrCreateInternal(name, DEFAULT_CAPACITY, LogContext::Info);
    LogContext effective = context.value_or(buffer.getDefaultContext());
    buffer.append(message, effective);

    if (listener_) {
        listener_(name, LogEntry(message, effective));
    }
}

std::vector<LogEntry> LogBufferManager::readFrom(const std::string& name) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    auto it = buffers_.find(name);
    if (it == buffers_.end()) {
        throw std::out_of_range("LogBuffer '" + name + "' not found");
    }
    return it->second->readAll();
}

std::vector<LogEntry> LogBufferManager::readRecentFrom(const std::string& name, size_t count,
                                                       std::optional<LogContext> contextFilter) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    auto it = buffers_.find(name);
    if (it == buffers_.end()) {
        throw std::out_of_range("LogBuffer '" + name + "' not found");
    }
    return it->second->readRecent(count, contextFilter);
}

bool LogBufferManager::exists(const std::string& name) const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return buffers_.find(name) != buffers_.end();
}

bool LogBufferManager::remove(const std::string& name) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    return buffers_.erase(name) > 0;
}

bool LogBufferManager::clear(const std::string& name) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    auto it = buffers_.find(name);
    if (it == buffers_.end()) {
        return false;
    }
    it->second->clear();
    return true;
}

std::vector<std::string> LogBufferManager::getBufferNames() const {
    std::lock_guard<std::recursive_mutex> lock(mutex_);

    std::vector<std::string> names;
    names.reserve(buffers_.size());
    for (const auto& pair : buffers_) {
        names.push_back(pair.first);
    }
    return names;
}

void LogBufferManager::setListener(Listener listener) {
    std::lock_guard<std::recursive_mutex> lock(mutex_);
    listener_ = std::move(listener);
}

void LogBufferManager::shutdown() {
    if (shutting_down_.exchange(true, std::memory_order_acq_rel)) {
        return; // Shutdown already in progress or completed
    }

    std::lock_guard<std::recursive_mutex> lock(mutex_);
    buffers_.clear();
    listener_ = nullptr;
}

void LogBufferManager::restart() {
    shutting_down_.store(false, std::memory_order_release);
}

} // namespace debug
