#include <cstdio>
#include <fstream>
#include <sstream>
#include <thread>

#include "file_log.hpp"
#include "dfu_log.hpp"
#include "error.hpp"

#include "fake_logger.hpp"

#include "CppUTest/TestHarness.h"


#define TEST_LOG_PATH  "/tmp/legacy_dfu_logger_test.log"


TEST_GROUP(Logger)
{
	void setup() {
		std::remove(TEST_LOG_PATH);
	}

	void teardown() {
		std::remove(TEST_LOG_PATH);
	}

	std::string read_log() {
		std::ifstream f(TEST_LOG_PATH);
		std::stringstream ss;
		ss << f.rdbuf();
		return ss.str();
	}

	unsigned int count_lines(const std::string& s) {
		unsigned int n = 0;
		for (auto c : s)
			if (c == '\n')
				n++;
		return n;
	}
};


TEST(Logger, MessagesAreFormattedIntoEntries)
{
	FakeLog log;

	log.info("sent %u of %u", 20u, 40u);
	log.error("failed: %s", "TIMEOUT");

	CHECK_EQUAL(2, log.num_entries());
	STRCMP_EQUAL("sent 20 of 40", log.message(0).c_str());
	STRCMP_EQUAL("failed: TIMEOUT", log.message(1).c_str());
}

TEST(Logger, LevelFiltersLowerSeverities)
{
	FakeLog log;
	log.set_log_level(LOG_LEVEL_WARN);

	log.trace("trace");
	log.info("info");
	log.state(DFUStateId::IDLE, DFUStateId::APP_CONNECTED);
	log.progress(1, 2);
	log.warn("warn");
	log.error("error");

	CHECK_EQUAL(2, log.num_entries());
}

TEST(Logger, ManagerAppliesLevelToAllLoggers)
{
	FakeLog a("A");
	FakeLog b("B");

	LoggerManager::set_log_level(LOG_LEVEL_ERROR);
	CHECK_EQUAL(LOG_LEVEL_ERROR, a.get_log_level());
	CHECK_EQUAL(LOG_LEVEL_ERROR, b.get_log_level());

	CHECK_TRUE(LoggerManager::find_by_name("B") == &b);
	CHECK_TRUE(LoggerManager::find_by_name("Nope") == nullptr);
}

TEST(Logger, FileLogWritesHeaderOnceAndAppends)
{
	DFULogFormatter formatter;
	{
		FileLog log(TEST_LOG_PATH);
		log.set_log_formatter(&formatter);
		log.create();
		CHECK_TRUE(log.is_ready());
		log.info("first");
		log.state(DFUStateId::IDLE, DFUStateId::APP_CONNECTED);
		CHECK_EQUAL(2, log.num_entries());
	}
	{
		FileLog log(TEST_LOG_PATH);
		log.set_log_formatter(&formatter);
		log.create();
		log.progress(40, 40);
	}

	std::string content = read_log();
	CHECK_EQUAL(4, count_lines(content));
	CHECK_TRUE(content.find("log_time,log_level,message\n") == 0);
	CHECK_TRUE(content.find(",INFO,first\n") != std::string::npos);
	CHECK_TRUE(content.find(",STATE,Idle -> AppConnected\n") != std::string::npos);
	CHECK_TRUE(content.find(",PROGRESS,40/40 bytes\n") != std::string::npos);
}

TEST(Logger, FileLogTruncateStartsAgain)
{
	DFULogFormatter formatter;
	FileLog log(TEST_LOG_PATH);
	log.set_log_formatter(&formatter);
	log.create();
	log.warn("old");

	log.truncate();
	log.warn("new");

	std::string content = read_log();
	CHECK_EQUAL(2, count_lines(content));
	CHECK_TRUE(content.find("old") == std::string::npos);
	CHECK_EQUAL(1, log.num_entries());
}

TEST(Logger, FileLogInUnwritableDirectoryFails)
{
	FileLog log("/nonexistent-dir/dfu.log");

	CHECK_THROWS(ErrorCode, log.create());
	CHECK_FALSE(log.is_ready());
}

TEST(Logger, FileLogTakesEntriesFromSeveralThreads)
{
	DFULogFormatter formatter;
	FileLog log(TEST_LOG_PATH);
	log.set_log_formatter(&formatter);
	log.create();

	auto writer = [&log](const char *who) {
		for (unsigned int i = 0; i < 500; i++)
			log.info("%s %u", who, i);
	};
	std::thread transport(writer, "transport");
	writer("session");
	transport.join();

	CHECK_EQUAL(1000, log.num_entries());
	std::string content = read_log();
	CHECK_EQUAL(1001, count_lines(content));
	CHECK_TRUE(content.find(",INFO,transport 499\n") != std::string::npos);
	CHECK_TRUE(content.find(",INFO,session 499\n") != std::string::npos);
}

TEST(Logger, ManagerCreatesEveryLogger)
{
	FileLog log(TEST_LOG_PATH);
	CHECK_FALSE(log.is_ready());

	LoggerManager::create();

	CHECK_TRUE(log.is_ready());
}
