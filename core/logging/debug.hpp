#ifndef __DEBUG_HPP_
#define __DEBUG_HPP_

#include "logger.hpp"

class DebugLogger {
public:
	static inline Logger *console_log = nullptr;
	static inline Logger *file_log = nullptr;
};

#define DEBUG_LOG_TO_SINKS(method, fmt, ...) \
	do { \
		if (DebugLogger::console_log) DebugLogger::console_log->method(fmt, ##__VA_ARGS__); \
		if (DebugLogger::file_log && DebugLogger::file_log->is_ready()) DebugLogger::file_log->method(fmt, ##__VA_ARGS__); \
	} while (0)

#ifdef DEBUG_ENABLE

#if (DEBUG_LEVEL >= 1)
#define DEBUG_ERROR(fmt, ...) DEBUG_LOG_TO_SINKS(error, fmt, ##__VA_ARGS__)
#else
#define DEBUG_ERROR(fmt, ...)
#endif

#if (DEBUG_LEVEL >= 2)
#define DEBUG_WARN(fmt, ...) DEBUG_LOG_TO_SINKS(warn, fmt, ##__VA_ARGS__)
#else
#define DEBUG_WARN(fmt, ...)
#endif

#if (DEBUG_LEVEL >= 3)
#define DEBUG_INFO(fmt, ...) DEBUG_LOG_TO_SINKS(info, fmt, ##__VA_ARGS__)
#else
#define DEBUG_INFO(fmt, ...)
#endif

// NOTE: Image streaming calls DEBUG_TRACE once per chunk
#if (DEBUG_LEVEL >= 4)
#define DEBUG_TRACE(fmt, ...) DEBUG_LOG_TO_SINKS(trace, fmt, ##__VA_ARGS__)
#else
#define DEBUG_TRACE(fmt, ...)
#endif

#else

#define DEBUG_ERROR(fmt, ...)
#define DEBUG_WARN(fmt, ...)
#define DEBUG_INFO(fmt, ...)
#define DEBUG_TRACE(fmt, ...)

#endif

#endif // __DEBUG_HPP_
