#ifndef LOG_BUFFER_H
#define LOG_BUFFER_H

#include <string>
#include <vector>
#include <mutex>
#include <chrono>
#include <optional>

namespace debug {

/**
 * @brief Represents the context of a log entry
 * 
 * Used to categorize log entries for filtering and organization
 */
enum class LogContext {
    Debug,
    Info,
    Warning,
    Error,
    Processing,
    Memory
};

/**
 * @brief Converts LogContext enum to string representation
 * 
 * @param context The context to convert
 * @return String representation of the context
 */
inline std::string logContextToString(LogContext context) {
    switch (context) {
        case LogContext::Debug:       return "Debug";
        case LogContext::Info:        return "Info";
        case LogContext::Warning:     return "Warning";
        case LogContext::Error:       return "Error";
        case LogContext::Processing:  return "Processing";
        case LogContext::Memory:      return "Memory";
        default:                      return "Unknown";
    }
}

/**
 * @brief Represents a single log entry with timestamp and context
 */
struct LogEntry {
    std::chrono::system_clock::time_point timestamp;
    std::string message;
    LogContext context;
    
    LogEntry(std::string msg, LogContext ctx)
        : timestamp(std::chrono::system_clock::now()),
          message(std::move(msg)),
          context(ctx) {}
};

/**
 * @brief Fixed-size, thread-safe log buffer with context support
 * 
 * Keeps the most recent entries of one category in a circular buffer.
 * When the buffer is full, the oldest entry is overwritten.
 */
class LogBuffer {
public:
    /**
     * @brief Construct a new LogBuffer with the specified capacity
     * 
     * @param capacity Maximum number of log entries to store
     * @param defaultContext Default context for entries without specified context
     */
    explicit LogBuffer(size_t capacity, LogContext defaultContext = LogContext::Info);
    
    /**
     * @brief Append a log entry to the buffer
     * 
     * @param message The log message to append
     * @param context The context of the log entry
     */
    void append(const std::string& message, LogContext context);

    /**
     * @brief Append a log entry using the buffer's default context
     */
    void append(const std::string& message);
    
    /**
     * @brief Read all log entries in the buffer
     * 
     * @return Vector of all log entries, from oldest to newest
     */
    std::vector<LogEntry> readAll() const;
    
    /**
     * @brief Read the most recent log entries
     * 
     * @param count Maximum number of entries to read
     * @param contextFilter Optional context to filter entries by
     * @return Vector of recent log entries, from newest to oldest
     */
    std::vector<LogEntry> readRecent(size_t count, std::optional<LogContext> contextFilter = std::nullopt) const;
    
    void clear();
    
    size_t size() const;
    
    size_t capacity() const;

    /**
     * @brief Total number of entries ever appended, including overwritten ones
     */
    size_t totalAppended() const;
    
    void setDefaultContext(LogContext context);
    
    LogContext getDefaultContext() const;

private:
    std::vector<LogEntry> buffer_;
    size_t capacity_;
    size_t head_; // Position to write next entry
    size_t count_; // Number of valid entries
    size_t total_appended_;
    LogContext defaultContext_;
    
    mutable std::mutex mutex_;
};

} // namespace debug

#endif // LOG_BUFFER_H
