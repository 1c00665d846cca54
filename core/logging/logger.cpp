#include <chrono>
#include <ctime>

#include "logger.hpp"


const char *LogFormatter::log_level_str(LogType t) {
	switch (t) {
	case LogType::LOG_ERROR:
		return "ERROR";
	case LogType::LOG_WARN:
		return "WARN";
	case LogType::LOG_INFO:
		return "INFO";
	case LogType::LOG_TRACE:
		return "DEBUG";
	case LogType::LOG_STATE:
		return "STATE";
	case LogType::LOG_PROGRESS:
		return "PROGRESS";
	default:
		return "UNKNOWN";
	}
}

void Logger::sync_datetime(LogHeader &header) {
	auto now = std::chrono::system_clock::now();
	std::time_t t = std::chrono::system_clock::to_time_t(now);
	auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
	std::tm tm;
	localtime_r(&t, &tm);
	header.hours = tm.tm_hour;
	header.minutes = tm.tm_min;
	header.seconds = tm.tm_sec;
	header.milliseconds = static_cast<uint16_t>(ms);
}

Logger::Logger(const char *name) {
	m_log_formatter = nullptr;
	m_unique_id = LoggerManager::add(*this);
	m_name = name;
}

Logger::~Logger() {
	LoggerManager::remove(*this);
}

void Logger::set_log_level(int level) {
	m_log_level = level;
}

int Logger::get_log_level() {
	return m_log_level;
}

void Logger::set_log_formatter(LogFormatter* formatter) {
	m_log_formatter = formatter;
}

LogFormatter* Logger::get_log_formatter() {
	return m_log_formatter;
}

void Logger::log(LogType type, const char *msg, va_list args) {
	LogEntry buffer;
	vsnprintf(reinterpret_cast<char*>(buffer.data), sizeof(buffer.data), msg, args);
	buffer.header.log_type = type;
	buffer.header.payload_size = std::strlen(reinterpret_cast<char*>(buffer.data));
	sync_datetime(buffer.header);
	write(&buffer);
}

void Logger::warn(const char *msg, ...) {
	if (m_log_level >= LOG_LEVEL_WARN) {
		va_list args;
		va_start(args, msg);
		log(LOG_WARN, msg, args);
		va_end(args);
	}
}

void Logger::error(const char *msg, ...) {
	if (m_log_level >= LOG_LEVEL_ERROR) {
		va_list args;
		va_start(args, msg);
		log(LOG_ERROR, msg, args);
		va_end(args);
	}
}

void Logger::info(const char *msg, ...) {
	if (m_log_level >= LOG_LEVEL_INFO) {
		va_list args;
		va_start(args, msg);
		log(LOG_INFO, msg, args);
		va_end(args);
	}
}

void Logger::trace(const char *msg, ...) {
	if (m_log_level >= LOG_LEVEL_DEBUG) {
		va_list args;
		va_start(args, msg);
		log(LOG_TRACE, msg, args);
		va_end(args);
	}
}

void Logger::state(DFUStateId from, DFUStateId to) {
	if (m_log_level >= LOG_LEVEL_INFO) {
		StateChangeLogEntry entry;
		entry.header.log_type = LOG_STATE;
		entry.header.payload_size = 2;
		entry.from = from;
		entry.to = to;
		sync_datetime(entry.header);
		write(&entry);
	}
}

void Logger::progress(uint32_t bytes_sent, uint32_t total_bytes) {
	if (m_log_level >= LOG_LEVEL_INFO) {
		ProgressLogEntry entry;
		entry.header.log_type = LOG_PROGRESS;
		entry.header.payload_size = 8;
		entry.bytes_sent = bytes_sent;
		entry.total_bytes = total_bytes;
		sync_datetime(entry.header);
		write(&entry);
	}
}

unsigned int Logger::get_unique_id() {
	return m_unique_id;
}

const char *Logger::get_name() {
	return m_name;
}

unsigned int LoggerManager::add(Logger& s) {
	m_map.insert({m_unique_identifier, s});
	return m_unique_identifier++;
}

void LoggerManager::remove(Logger& s) {
	m_map.erase(s.get_unique_id());
}

void LoggerManager::create() {
	for (auto const &s : m_map)
		s.second.create();
}

void LoggerManager::set_log_level(int level)
{
	for (auto const &s : m_map)
		s.second.set_log_level(level);
}

Logger *LoggerManager::find_by_name(const char *name) {
	for (auto const &s : m_map) {
		if (std::string(name) == std::string(s.second.get_name()))
			return &s.second;
	}

	return nullptr;
}
