#ifndef LOG_BUFFER_MANAGER_H
#define LOG_BUFFER_MANAGER_H

#include <string>
#include <unordered_map>
#include <memory>
#include <mutex>
#include <optional>
#include <atomic>
#include <functional>
#include "LogBuffer.h"

namespace debug {

/**
 * @brief Centralized manager for named LogBuffer instances
 * 
 * Provides a registry for creating, accessing, and operating on multiple LogBuffer
 * instances by name. Thread-safe for concurrent access from multiple threads.
 */
class LogBufferManager {
public:
    /**
     * @brief Observer invoked for every appended entry (buffer name, entry)
     */
    using Listener = std::function<void(const std::string &, const LogEntry &)>;

    /**
     * @brief Get the singleton instance of LogBufferManager
     * 
     * @return Reference to the singleton instance
     */
    static LogBufferManager& getInstance();

    /**
     * @brief Get or create a log buffer with the specified name and capacity
     * 
     * @param name Name of the log buffer
     * @param capacity Maximum number of entries (default: 100)
     * @param defaultContext Default context for new entries (default: Info)
     * @return Reference to the LogBuffer instance
     */
    LogBuffer& getOrCreate(const std::string& name, size_t capacity = DEFAULT_CAPACITY,
                           LogContext defaultContext = LogContext::Info);
    
    /**
     * @brief Append a message to a named buffer
     * 
     * If the named buffer doesn't exist, it will be created with default settings.
     * 
     * @param name Name of the buffer to append to
     * @param message Message to append
     * @param context Optional context for the message
     */
    void appendTo(const std::string& name, const std::string& message, 
                  std::optional<LogContext> context = std::nullopt);
    
    /**
     * @brief Read all entries from a named buffer
     * 
     * @param name Name of the buffer to read from
     * @return Vector of all log entries, from oldest to newest
     * @throws std::out_of_range if the named buffer doesn't exist
     */
    std::vector<LogEntry> readFrom(const std::string& name) const;
    
    /**
     * @brief Read recent entries from a named buffer
     * 
     * @param name Name of the buffer to read from
     * @param count Maximum number of entries to read
     * @param contextFilter Optional context to filter entries by
     * @return Vector of recent log entries, from newest to oldest
     * @throws std::out_of_range if the named buffer doesn't exist
     */
    std::vector<LogEntry> readRecentFrom(const std::string& name, size_t count,
                                         std::optional<LogContext> contextFilter = std::nullopt) const;
    
    bool exists(const std::string& name) const;
    
    /**
     * @brief Remove a buffer from the manager
     * 
     * @return true if the buffer was removed, false if it didn't exist
     */
    bool remove(const std::string& name);
    
    /**
     * @brief Clear all entries from a named buffer
     * 
     * @return true if the buffer was cleared, false if it didn't exist
     */
    bool clear(const std::string& name);
    
    std::vector<std::string> getBufferNames() const;

    /**
     * @brief Install (or remove, with an empty function) the append observer
     */
    void setListener(Listener listener);
    
    /**
     * @brief Drop all buffers and reject further appends
     */
    void shutdown();

    /**
     * @brief Accept appends again after shutdown (used between runs in one process)
     */
    void restart();

private:
    LogBufferManager() = default;
    ~LogBufferManager();
    
    LogBufferManager(const LogBufferManager&) = delete;
    LogBufferManager& operator=(const LogBufferManager&) = delete;
    LogBufferManager(LogBufferManager&&) = delete;
    LogBufferManager& operator=(LogBufferManager&&) = delete;
    
    std::unordered_map<std::string, std::unique_ptr<LogBuffer>> buffers_;
    
    // Recursive so listeners may log again from inside a callback
    mutable std::recursive_mutex mutex_;

    std::atomic<bool> shutting_down_{false};

    Listener listener_;
    
    static constexpr size_t DEFAULT_CAPACITY = 100;
    
    LogBuffer& getOrCreateInternal(const std::string& name, size_t capacity, LogContext defaultContext);
};

} // namespace debug

#endif // LOG_BUFFER_MANAGER_H
