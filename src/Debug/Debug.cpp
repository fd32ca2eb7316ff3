// Minimal debug implementation
#include "headers/Debug.h"
#include <iomanip>
#include <sstream>

// Global debug mode flag as atomic for thread safety - explicitly initialized
std::atomic<bool> gDebugMode{false};

// Global mutex for thread-safe printing
std::mutex gConsoleMutex;

std::string formatDataSize(size_t bytes) {
    std::stringstream ss;
    ss << std::fixed << std::setprecision(2);
    
    if (bytes < 1024) {
        ss << bytes << " bytes";
    } else if (bytes < 1024 * 1024) {
        ss << (bytes / 1024.0) << " KB";
    } else if (bytes < 1024 * 1024 * 1024) {
        ss << (bytes / (1024.0 * 1024.0)) << " MB";
    } else {
        ss << (bytes / (1024.0 * 1024.0 * 1024.0)) << " GB";
    }
    
    return ss.str();
}
