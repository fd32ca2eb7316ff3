#ifndef DEBUG_H
#define DEBUG_H

#include <string>
#include <iostream>
#include <mutex>
#include <atomic>

// Global debug mode flag - set to false by default for clean output
extern std::atomic<bool> gDebugMode;

// Mutex for synchronized console output
extern std::mutex gConsoleMutex;

/**
 * ANSI escape sequences used for colored console output
 */
namespace ANSIColorConst {
    inline constexpr const char *RESET = "\033[0m";
    inline constexpr const char *RED = "\033[31m";
    inline constexpr const char *GREEN = "\033[32m";
    inline constexpr const char *YELLOW = "\033[33m";
    inline constexpr const char *CYAN = "\033[36m";
    inline constexpr const char *BRIGHT_RED = "\033[91m";
    inline constexpr const char *BRIGHT_YELLOW = "\033[93m";
    inline constexpr const char *BRIGHT_CYAN = "\033[96m";
}

/**
 * String utility function to safely convert const char* to std::string
 * 
 * @param textPtr Pointer to the text to convert
 * @return Safe string representation
 */
inline std::string makeSafeString(const char* textPtr) {
    return textPtr ? std::string(textPtr) : std::string("(null)");
}

/**
 * Format a data size in human-readable format (KB, MB, etc.)
 *
 * @param bytes Number of bytes
 * @return Size with a unit suffix, two decimals above one KB
 */
std::string formatDataSize(size_t bytes);

/**
 * Print a message to the console only if debug mode is enabled
 * If force is true, print regardless of debug mode
 * 
 * @param messageText The message to print
 * @param forceOutput Whether to force printing even if debug mode is disabled
 */
inline void debugPrint(const std::string& messageText, bool forceOutput = false) {
    if (gDebugMode.load(std::memory_order_relaxed) || forceOutput) {
        std::lock_guard<std::mutex> lock(gConsoleMutex);
        std::cout << messageText << std::endl;
    }
}

/**
 * Set debug mode on or off
 * 
 * @param isEnabled Whether to enable debug mode
 */
inline void setDebugMode(bool isEnabled) {
    gDebugMode.store(isEnabled, std::memory_order_relaxed);
}

/**
 * Print function for debug messages (only prints in debug mode)
 * 
 * @param messageText The message to print
 */
inline void printMessage(const std::string& messageText) {
    debugPrint(messageText, false);
}

/**
 * Print function for error messages (always shown)
 * 
 * @param errorText The error message to print
 */
inline void printError(const std::string& errorText) {
    debugPrint("Error: " + errorText, true);
}

/**
 * Print function for important status messages (always shown)
 * 
 * @param statusText The status message to print
 */
inline void printStatus(const std::string& statusText) {
    debugPrint(statusText, true);
}

/**
 * Print function for warnings (always shown)
 * 
 * @param warningText The warning message to print
 */
inline void printWarning(const std::string& warningText) {
    debugPrint("WARNING: " + warningText, true);
}

#endif // DEBUG_H
