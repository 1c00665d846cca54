#pragma once

#include <string>
#include <stdio.h>
#include "logger.hpp"


// One CSV line per entry: time,level,message
class DFULogFormatter : public LogFormatter {
public:
	const std::string header() override {
		return "log_time,log_level,message\n";
	}
	const std::string log_entry(const LogEntry& e) override {
		char entry[256], t[16], msg[160];

		snprintf(t, sizeof(t), "%02u:%02u:%02u.%03u", e.header.hours, e.header.minutes, e.header.seconds, e.header.milliseconds);

		if (e.header.log_type == LOG_STATE) {
			const StateChangeLogEntry *s = reinterpret_cast<const StateChangeLogEntry *>(&e);
			snprintf(msg, sizeof(msg), "%s -> %s", dfu_state_str(s->from), dfu_state_str(s->to));
		} else if (e.header.log_type == LOG_PROGRESS) {
			const ProgressLogEntry *p = reinterpret_cast<const ProgressLogEntry *>(&e);
			snprintf(msg, sizeof(msg), "%u/%u bytes", p->bytes_sent, p->total_bytes);
		} else {
			snprintf(msg, sizeof(msg), "%.*s", (int)e.header.payload_size, reinterpret_cast<const char *>(e.data));
		}

		snprintf(entry, sizeof(entry), "%s,%s,%s\n", t, log_level_str(e.header.log_type), msg);
		return std::string(entry);
	}
};
