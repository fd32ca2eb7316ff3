#include "headers/ResourceReclaimer.h"
#include <stdexcept>
#include <string>
#include <utility>
#include "../Debug/headers/LogMacros.h"
#include "../Threading/headers/ResourceManager.h"

ResourceReclaimer::ResourceReclaimer(CellSink &sink, uint64_t threshold, CollectFn collect)
    : sink_(sink), threshold_(threshold), collect_(std::move(collect)) {
    if (threshold_ == 0) {
        throw std::invalid_argument("Reclamation threshold must be positive");
    }
    if (!collect_) {
        collect_ = []() { return ResourceManager::getInstance().collect(); };
    }
}

bool ResourceReclaimer::rowCompleted(uint32_t row, uint64_t writes) {
    {
        std::lock_guard<std::mutex> lock(rows_mutex_);
        if (row == completed_through_ + 1) {
            completed_through_ = row;
            auto it = finished_ahead_.begin();
            while (it != finished_ahead_.end() && *it == completed_through_ + 1) {
                completed_through_ = *it;
                it = finished_ahead_.erase(it);
            }
        } else if (row > completed_through_) {
            finished_ahead_.insert(row);
        }
    }

    const uint64_t pending = writes_since_reclaim_.fetch_add(writes) + writes;
    if (pending <= threshold_) {
        return false;
    }
    reclaim();
    return true;
}

void ResourceReclaimer::reclaim() {
    uint32_t first = 0;
    uint32_t last = 0;
    {
        std::lock_guard<std::mutex> lock(rows_mutex_);
        if (completed_through_ > last_cleared_) {
            first = last_cleared_ + 1;
            last = completed_through_;
            last_cleared_ = completed_through_;
        }
    }

    if (last != 0) {
        sink_.clearFormatting(first, last);
    }
    const size_t released = collect_();
    bytes_released_ += released;
    const uint64_t writes = writes_since_reclaim_.exchange(0);
    reclamations_++;

    LOG_MEM("ResourceReclaimer", "Reclamation #" + std::to_string(reclamations_.load()) + " after " +
            std::to_string(writes) + " writes" +
            (last != 0 ? ", cleared rows " + std::to_string(first) + "-" + std::to_string(last)
                       : std::string(", no fully written rows to clear")) +
            ", released " + std::to_string(released) + " bytes");
}

uint32_t ResourceReclaimer::completedThrough() const {
    std::lock_guard<std::mutex> lock(rows_mutex_);
    return completed_through_;
}

uint32_t ResourceReclaimer::lastClearedRow() const {
    std::lock_guard<std::mutex> lock(rows_mutex_);
    return last_cleared_;
}
