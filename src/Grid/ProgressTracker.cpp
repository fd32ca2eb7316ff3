#include "headers/ProgressTracker.h"
#include <algorithm>
#include <utility>
#include "../Debug/headers/Debug.h"

ProgressTracker::ProgressTracker(uint64_t total_pixels, ElapsedSource elapsed, LineSink output)
    : total_pixels_(total_pixels), elapsed_(std::move(elapsed)), output_(std::move(output)) {
    if (!elapsed_) {
        const auto start = std::chrono::steady_clock::now();
        elapsed_ = [start]() {
            return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
        };
    }
    if (!output_) {
        output_ = [](const std::string &line) { printStatus(line); };
    }
}

bool ProgressTracker::report(uint64_t increment) {
    const uint64_t done = processed_.fetch_add(increment, std::memory_order_relaxed) + increment;
    const int percentage = total_pixels_ == 0
                               ? 100
                               : static_cast<int>(std::min<uint64_t>(100, done * 100 / total_pixels_));

    // Cheap pre-check outside the lock; most rows do not move the percentage
    if (percentage <= previous_percentage_.load()) {
        return false;
    }

    std::lock_guard<std::mutex> lock(emit_mutex_);
    const std::chrono::milliseconds now = elapsed_();
    const int64_t second = std::chrono::duration_cast<std::chrono::seconds>(now).count();
    if (percentage <= previous_percentage_.load() || second == last_report_second_.load()) {
        return false;
    }

    previous_percentage_.store(percentage);
    last_report_second_.store(second);
    lines_emitted_++;
    output_(formatLine(percentage, now));
    return true;
}

std::string ProgressTracker::formatLine(int percentage, std::chrono::milliseconds elapsed) {
    const auto total_seconds = std::chrono::duration_cast<std::chrono::seconds>(elapsed).count();
    return "\tConverting: %" + std::to_string(percentage) + " (elapsed: " + std::to_string(total_seconds / 60) +
           "m " + std::to_string(total_seconds % 60) + "s)";
}
