#ifndef LOGSCAN_COMMON_LOGGING_H
#define LOGSCAN_COMMON_LOGGING_H

#include <logscan/common/config.h>

#include <chrono>
#include <cstdio>
#include <ctime>
#include <string>

namespace logscan {
inline std::string logscan_macro_get_time() {
    auto logscan_ts_millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch())
            .count() %
        1000;
    auto logscan_ts_t = std::time(nullptr);
    std::tm now{};
    localtime_r(&logscan_ts_t, &now);
    char logscan_ts_time_str[64];
    std::snprintf(logscan_ts_time_str, sizeof(logscan_ts_time_str),
                  "%04d-%02d-%02d %02d:%02d:%02d.%03lld", now.tm_year + 1900,
                  now.tm_mon + 1, now.tm_mday, now.tm_hour, now.tm_min,
                  now.tm_sec, static_cast<long long>(logscan_ts_millis));
    return logscan_ts_time_str;
}
}  // namespace logscan

#if defined(LOGSCAN_LOGGER_CPP_LOGGER) && (LOGSCAN_LOGGER_CPP_LOGGER == 1)
#include <cpp-logger/clogger.h>

#define LOGSCAN_LOGGER_NAME "LOGSCAN"

#define LOGSCAN_INTERNAL_TRACE_FORMAT(file, line, function, logger_level, \
                                      format, ...)                       \
    cpp_logger_clog(logger_level, LOGSCAN_LOGGER_NAME,                   \
                    "[%s] %s " format " [%s:%d]",                        \
                    logscan::logscan_macro_get_time().c_str(), function, \
                    ##__VA_ARGS__, file, line)

#if defined(LOGSCAN_LOGGER_LEVEL_TRACE) && (LOGSCAN_LOGGER_LEVEL_TRACE == 1)
#define LOGSCAN_LOGGER_INIT() \
    cpp_logger_clog_level(CPP_LOGGER_TRACE, LOGSCAN_LOGGER_NAME);
#define LOGSCAN_LOGGER_TRACE_ENABLED 1
#define LOGSCAN_LOGGER_DEBUG_ENABLED 1
#define LOGSCAN_LOGGER_INFO_ENABLED 1
#define LOGSCAN_LOGGER_WARN_ENABLED 1
#elif defined(LOGSCAN_LOGGER_LEVEL_DEBUG) && (LOGSCAN_LOGGER_LEVEL_DEBUG == 1)
#define LOGSCAN_LOGGER_INIT() \
    cpp_logger_clog_level(CPP_LOGGER_DEBUG, LOGSCAN_LOGGER_NAME);
#define LOGSCAN_LOGGER_TRACE_ENABLED 0
#define LOGSCAN_LOGGER_DEBUG_ENABLED 1
#define LOGSCAN_LOGGER_INFO_ENABLED 1
#define LOGSCAN_LOGGER_WARN_ENABLED 1
#elif defined(LOGSCAN_LOGGER_LEVEL_INFO) && (LOGSCAN_LOGGER_LEVEL_INFO == 1)
#define LOGSCAN_LOGGER_INIT() \
    cpp_logger_clog_level(CPP_LOGGER_INFO, LOGSCAN_LOGGER_NAME);
#define LOGSCAN_LOGGER_TRACE_ENABLED 0
#define LOGSCAN_LOGGER_DEBUG_ENABLED 0
#define LOGSCAN_LOGGER_INFO_ENABLED 1
#define LOGSCAN_LOGGER_WARN_ENABLED 1
#elif defined(LOGSCAN_LOGGER_LEVEL_WARN) && (LOGSCAN_LOGGER_LEVEL_WARN == 1)
#define LOGSCAN_LOGGER_INIT() \
    cpp_logger_clog_level(CPP_LOGGER_WARN, LOGSCAN_LOGGER_NAME);
#define LOGSCAN_LOGGER_TRACE_ENABLED 0
#define LOGSCAN_LOGGER_DEBUG_ENABLED 0
#define LOGSCAN_LOGGER_INFO_ENABLED 0
#define LOGSCAN_LOGGER_WARN_ENABLED 1
#else
#define LOGSCAN_LOGGER_INIT() \
    cpp_logger_clog_level(CPP_LOGGER_ERROR, LOGSCAN_LOGGER_NAME);
#define LOGSCAN_LOGGER_TRACE_ENABLED 0
#define LOGSCAN_LOGGER_DEBUG_ENABLED 0
#define LOGSCAN_LOGGER_INFO_ENABLED 0
#define LOGSCAN_LOGGER_WARN_ENABLED 0
#endif
#define LOGSCAN_LOGGER_ERROR_ENABLED 1

#define LOGSCAN_LOGGER_LEVEL(level) \
    cpp_logger_clog_level(level, LOGSCAN_LOGGER_NAME);

#if LOGSCAN_LOGGER_TRACE_ENABLED
#define LOGSCAN_LOG_TRACE(format, ...)                                   \
    LOGSCAN_INTERNAL_TRACE_FORMAT(__FILE__, __LINE__, __FUNCTION__,      \
                                  CPP_LOGGER_TRACE, format, ##__VA_ARGS__)
#else
#define LOGSCAN_LOG_TRACE(...)
#endif

#if LOGSCAN_LOGGER_DEBUG_ENABLED
#define LOGSCAN_LOG_DEBUG(format, ...)                                   \
    LOGSCAN_INTERNAL_TRACE_FORMAT(__FILE__, __LINE__, __FUNCTION__,      \
                                  CPP_LOGGER_DEBUG, format, ##__VA_ARGS__)
#else
#define LOGSCAN_LOG_DEBUG(...)
#endif

#if LOGSCAN_LOGGER_INFO_ENABLED
#define LOGSCAN_LOG_INFO(format, ...)                                    \
    LOGSCAN_INTERNAL_TRACE_FORMAT(__FILE__, __LINE__, __FUNCTION__,      \
                                  CPP_LOGGER_INFO, format, ##__VA_ARGS__)
#else
#define LOGSCAN_LOG_INFO(...)
#endif

#if LOGSCAN_LOGGER_WARN_ENABLED
#define LOGSCAN_LOG_WARN(format, ...)                                    \
    LOGSCAN_INTERNAL_TRACE_FORMAT(__FILE__, __LINE__, __FUNCTION__,      \
                                  CPP_LOGGER_WARN, format, ##__VA_ARGS__)
#else
#define LOGSCAN_LOG_WARN(...)
#endif

#define LOGSCAN_LOG_ERROR(format, ...)                                   \
    LOGSCAN_INTERNAL_TRACE_FORMAT(__FILE__, __LINE__, __FUNCTION__,      \
                                  CPP_LOGGER_ERROR, format, ##__VA_ARGS__)

#define LOGSCAN_LOG_PRINT(format, ...)                                   \
    LOGSCAN_INTERNAL_TRACE_FORMAT(__FILE__, __LINE__, __FUNCTION__,      \
                                  CPP_LOGGER_PRINT, format, ##__VA_ARGS__)

#else
// Non-cpp-logger fallback
#define LOGSCAN_LOGGER_INIT()
#define LOGSCAN_LOGGER_LEVEL(level)

#define LOGSCAN_LOG_PRINT(format, ...) std::fprintf(stdout, format, ##__VA_ARGS__)
#define LOGSCAN_LOG_ERROR(format, ...) \
    std::fprintf(stderr, "[LOGSCAN ERROR] " format "\n", ##__VA_ARGS__)

#define LOGSCAN_LOGGER_TRACE_ENABLED 0
#define LOGSCAN_LOGGER_DEBUG_ENABLED 0
#define LOGSCAN_LOGGER_INFO_ENABLED 0
#define LOGSCAN_LOGGER_WARN_ENABLED 0
#define LOGSCAN_LOGGER_ERROR_ENABLED 1

#define LOGSCAN_LOG_WARN(...)
#define LOGSCAN_LOG_INFO(...)
#define LOGSCAN_LOG_DEBUG(...)
#define LOGSCAN_LOG_TRACE(...)
#endif  // LOGSCAN_LOGGER_CPP_LOGGER

#endif  // LOGSCAN_COMMON_LOGGING_H
