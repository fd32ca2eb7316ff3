#ifndef PROGRESS_TRACKER_H
#define PROGRESS_TRACKER_H

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>

/**
 * @brief Counts processed pixels and prints a throttled percentage line.
 *
 * A line is emitted only when the integer percentage has advanced AND the
 * elapsed whole second differs from the one of the previous line. Both gates
 * must pass before either is advanced. Safe to call from several threads.
 */
class ProgressTracker {
public:
    using ElapsedSource = std::function<std::chrono::milliseconds()>;
    using LineSink = std::function<void(const std::string &)>;

    /**
     * @param total_pixels Pixels in the whole conversion (0 is treated as already complete).
     * @param elapsed Elapsed-time source; defaults to a steady clock started here.
     * @param output Receives each progress line; defaults to printStatus().
     */
    explicit ProgressTracker(uint64_t total_pixels, ElapsedSource elapsed = {}, LineSink output = {});

    /**
     * @brief Add increment processed pixels and emit a line if both gates pass.
     * @return True when a line was emitted.
     */
    bool report(uint64_t increment);

    [[nodiscard]] uint64_t processed() const { return processed_.load(std::memory_order_relaxed); }

    [[nodiscard]] uint64_t total() const { return total_pixels_; }

    /**
     * @brief Percentage of the last emitted line (0 before the first one).
     */
    [[nodiscard]] int lastReportedPercentage() const { return previous_percentage_.load(); }

    [[nodiscard]] size_t linesEmitted() const { return lines_emitted_.load(); }

    [[nodiscard]] std::chrono::milliseconds elapsed() const { return elapsed_(); }

    /**
     * @brief "\tConverting: %<p> (elapsed: <m>m <s>s)"
     */
    static std::string formatLine(int percentage, std::chrono::milliseconds elapsed);

private:
    const uint64_t total_pixels_;
    ElapsedSource elapsed_;
    LineSink output_;

    std::atomic<uint64_t> processed_{0};
    std::atomic<int> previous_percentage_{0};
    std::atomic<int64_t> last_report_second_{-1};
    std::atomic<size_t> lines_emitted_{0};
    std::mutex emit_mutex_;
};

#endif // PROGRESS_TRACKER_H
