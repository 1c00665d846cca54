#ifndef __CONSOLE_LOG_HPP_
#define __CONSOLE_LOG_HPP_

#include <stdio.h>
#include <mutex>
#include "logger.hpp"
#include "messages.hpp"


class ConsoleLog : public Logger {

public:
	ConsoleLog() : Logger("Console"), m_progress_pending(false) {}

private:
	bool m_progress_pending;
	std::mutex m_mtx;

	// A progress line is redrawn in place until anything else is printed
	void end_progress_line() {
		if (m_progress_pending) {
			printf("\n");
			m_progress_pending = false;
		}
	}

	void debug_formatter(const char *level, const LogHeader *header, const char *msg) {
		end_progress_line();
		printf("%02u:%02u:%02u.%03u [%s]\t%s\n", header->hours, header->minutes, header->seconds, header->milliseconds, level, msg);
	}

	void state_formatter(const StateChangeLogEntry *entry) {
		end_progress_line();
		printf("%02u:%02u:%02u.%03u [%s]\t%s -> %s\n", entry->header.hours, entry->header.minutes, entry->header.seconds,
				entry->header.milliseconds, log_type_name[entry->header.log_type], dfu_state_str(entry->from), dfu_state_str(entry->to));
	}

	void progress_formatter(const ProgressLogEntry *entry) {
		unsigned int pct = entry->total_bytes ? (100ULL * entry->bytes_sent) / entry->total_bytes : 100;
		printf("\rUploading: %3u%% (%u/%u bytes)", pct, entry->bytes_sent, entry->total_bytes);
		fflush(stdout);
		m_progress_pending = true;
		if (entry->bytes_sent >= entry->total_bytes)
			end_progress_line();
	}

public:
	void create() override {}
	void truncate() override {}
	bool is_ready() override { return true; }
	unsigned int num_entries() override { return 0; }
	void read(void *, int) override { }
	void write(void *entry) override {
		std::lock_guard<std::mutex> lock(m_mtx);
		LogEntry *p = (LogEntry *)entry;
		switch (p->header.log_type) {
		case LOG_ERROR:
		case LOG_WARN:
		case LOG_INFO:
		case LOG_TRACE:
			debug_formatter(LogFormatter::log_level_str(p->header.log_type), &p->header, (const char *)p->data);
			break;
		case LOG_STATE:
			state_formatter((const StateChangeLogEntry *)entry);
			break;
		case LOG_PROGRESS:
			progress_formatter((const ProgressLogEntry *)entry);
			break;
		default:
			// Not yet supported
			break;
		}
	}
};

#endif // __CONSOLE_LOG_HPP_
