#ifndef __MESSAGES_HPP_
#define __MESSAGES_HPP_

#include <stdint.h>
#include "dfu_state.hpp"

#define MAX_LOG_PAYLOAD    120

static constexpr const char *log_type_name[] = {
	"STATE",
	"PROGRESS",
	"ERROR",
	"WARN",
	"INFO",
	"TRACE"
};

enum LogType : uint8_t {
	LOG_STATE,
	LOG_PROGRESS,
	LOG_ERROR,
	LOG_WARN,
	LOG_INFO,
	LOG_TRACE
};

// Wall clock time of day, HH:MM:SS.mmm
struct __attribute__((packed)) LogHeader {
	uint8_t  hours;
	uint8_t  minutes;
	uint8_t  seconds;
	uint16_t milliseconds;
	LogType  log_type;
	uint8_t  payload_size;
};

struct LogEntry {
	LogHeader header;
	union {
		uint8_t data[MAX_LOG_PAYLOAD];
	};
};

struct __attribute__((packed)) StateChangeLogEntry {
	LogHeader header;
	union {
		struct {
			DFUStateId from;
			DFUStateId to;
		};
		uint8_t data[MAX_LOG_PAYLOAD];
	};
};

struct __attribute__((packed)) ProgressLogEntry {
	LogHeader header;
	union {
		struct {
			uint32_t bytes_sent;
			uint32_t total_bytes;
		};
		uint8_t data[MAX_LOG_PAYLOAD];
	};
};

#endif // __MESSAGES_HPP_
