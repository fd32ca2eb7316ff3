#ifndef LOGMACROS_H
#define LOGMACROS_H

#include "LogLevel.h"
#include "LogBufferManager.h"

// Severity numeric levels match GRIDPAINTER_LOG_LEVEL in LogLevel.h

/**
 * @def LOG_IMPL(LevelConst, Ctx, Category, Message)
 * @brief Append Message to the Category buffer when LevelConst passes the compile-time threshold.
 */
#define LOG_IMPL(LevelConst, Ctx, Category, Message)             \
    do {                                                        \
        if constexpr (debug::CurrentLogLevel >= LevelConst) {   \
            debug::LogBufferManager::getInstance().appendTo(    \
                Category, Message, Ctx);                        \
        }                                                       \
    } while (false)

#define LOG_ERR(Category, Message)  LOG_IMPL(1, debug::LogContext::Error,   Category, Message)
#define LOG_WARN(Category, Message) LOG_IMPL(2, debug::LogContext::Warning, Category, Message)
#define LOG_INF(Category, Message)  LOG_IMPL(3, debug::LogContext::Info,    Category, Message)
#define LOG_DBG(Category, Message)  LOG_IMPL(4, debug::LogContext::Debug,   Category, Message)

/**
 * @def LOG_MEM(Category, Message)
 * @brief Info-level message tagged with the Memory context (reclamation, pool trims).
 */
#define LOG_MEM(Category, Message)  LOG_IMPL(3, debug::LogContext::Memory,  Category, Message)

#endif // LOGMACROS_H
