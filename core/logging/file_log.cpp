#include "file_log.hpp"
#include "error.hpp"

FileLog::FileLog(const std::string& path, const char *name) : Logger(name), m_path(path), m_file(nullptr), m_num_entries(0) {}

FileLog::~FileLog() {
	if (m_file)
		fclose(m_file);
}

void FileLog::create() {
	std::lock_guard<std::mutex> lock(m_mtx);
	open();
}

void FileLog::open() {
	if (m_file)
		return;

	m_file = fopen(m_path.c_str(), "a");
	if (!m_file)
		throw ErrorCode::CLI_BAD_ARGUMENT;

	// Only a fresh file gets the formatter header
	fseek(m_file, 0, SEEK_END);
	if (ftell(m_file) == 0 && get_log_formatter()) {
		fputs(get_log_formatter()->header().c_str(), m_file);
		fflush(m_file);
	}
}

void FileLog::truncate() {
	std::lock_guard<std::mutex> lock(m_mtx);
	if (m_file)
		fclose(m_file);
	m_file = nullptr;
	m_num_entries = 0;

	FILE *f = fopen(m_path.c_str(), "w");
	if (f)
		fclose(f);
	open();
}

bool FileLog::is_ready() {
	std::lock_guard<std::mutex> lock(m_mtx);
	return m_file != nullptr;
}

unsigned int FileLog::num_entries() {
	std::lock_guard<std::mutex> lock(m_mtx);
	return m_num_entries;
}

void FileLog::read(void *, int) {
}

void FileLog::write(void *entry) {
	std::lock_guard<std::mutex> lock(m_mtx);
	if (!m_file)
		return;

	const LogEntry *p = static_cast<const LogEntry *>(entry);
	if (get_log_formatter())
		fputs(get_log_formatter()->log_entry(*p).c_str(), m_file);
	else
		fprintf(m_file, "%s\t%.*s\n", LogFormatter::log_level_str(p->header.log_type), (int)p->header.payload_size, reinterpret_cast<const char *>(p->data));
	fflush(m_file);
	m_num_entries++;
}
