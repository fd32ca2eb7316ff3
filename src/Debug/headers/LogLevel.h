#ifndef LOG_LEVEL_H
#define LOG_LEVEL_H

// Compile-time log threshold: 0 = off, 1 = error, 2 = warning, 3 = info, 4 = debug
#ifndef GRIDPAINTER_LOG_LEVEL
#define GRIDPAINTER_LOG_LEVEL 3
#endif

namespace debug {
    inline constexpr int CurrentLogLevel = GRIDPAINTER_LOG_LEVEL;
}

#endif // LOG_LEVEL_H
