#pragma once

#include <string>
#include <mutex>
#include <stdio.h>
#include "logger.hpp"

// Append-only text log; entries are rendered by the attached LogFormatter
class FileLog : public Logger {
private:
	std::string m_path;
	FILE *m_file;
	unsigned int m_num_entries;
	// Entries arrive from the session and the transport threads
	std::mutex m_mtx;

	void open();

public:
	FileLog(const std::string& path, const char *name = "File");
	~FileLog();

	void create() override;
	void truncate() override;
	bool is_ready() override;
	unsigned int num_entries() override;
	void read(void *, int index = 0) override;
	void write(void *entry) override;
};
