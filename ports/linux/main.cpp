#include <signal.h>
#include <pthread.h>
#include <stdio.h>
#include <thread>
#include <memory>

#include "linux_timer.hpp"
#include "host_transport.hpp"
#include "console_log.hpp"
#include "file_log.hpp"
#include "dfu_log.hpp"
#include "dfu_session.hpp"
#include "dfu_reporter.hpp"
#include "dfu_command_line.hpp"
#include "firmware_package.hpp"
#include "debug.hpp"

static constexpr int EXIT_DFU_ERROR = 1;
static constexpr int EXIT_BAD_ARGUMENT = 2;

int main(int argc, char **argv) {
	ConsoleLog con_log;
	con_log.set_log_level(LOG_LEVEL_INFO);
	DebugLogger::console_log = &con_log;

	DFUCommandLineOptions options;
	try {
		options = DFUCommandLine::parse(argc, argv);
	} catch (ErrorCode) {
		fputs(DFUCommandLine::usage(argv[0]).c_str(), stderr);
		return EXIT_BAD_ARGUMENT;
	}

	if (options.help) {
		fputs(DFUCommandLine::usage(argv[0]).c_str(), stdout);
		return 0;
	}

	std::unique_ptr<FileLog> file_log;
	DFULogFormatter log_formatter;
	if (!options.log_file.empty()) {
		file_log = std::make_unique<FileLog>(options.log_file);
		file_log->set_log_formatter(&log_formatter);
		try {
			LoggerManager::create();
		} catch (ErrorCode) {
			DEBUG_ERROR("can't open log file %s", options.log_file.c_str());
			return EXIT_BAD_ARGUMENT;
		}
		DebugLogger::file_log = file_log.get();
	}

	LoggerManager::set_log_level(options.verbose ? LOG_LEVEL_DEBUG : LOG_LEVEL_INFO);

	FirmwarePackage package;
	try {
		package = FirmwarePackageLoader::load(options.package_path);
	} catch (ErrorCode e) {
		DEBUG_ERROR("firmware package %s: %s", options.package_path.c_str(), error_code_name[e]);
		return EXIT_DFU_ERROR;
	}

	std::unique_ptr<BLECentral> central;
	try {
		central = HostTransport::create(options);
	} catch (ErrorCode) {
		return EXIT_DFU_ERROR;
	}

	// Signals are taken by a dedicated thread so cancellation is not run in a handler
	sigset_t signals;
	sigemptyset(&signals);
	sigaddset(&signals, SIGINT);
	sigaddset(&signals, SIGTERM);
	sigaddset(&signals, SIGUSR1);
	pthread_sigmask(SIG_BLOCK, &signals, nullptr);

	LinuxTimer timer;
	timer.start();

	DFUReporter reporter(options.config);
	DFUSession session(*central, timer, options.config, package);
	session.subscribe(reporter);

	std::thread signal_thread([&session, &signals]() {
		int sig = 0;
		sigwait(&signals, &sig);
		if (sig != SIGUSR1) {
			DEBUG_WARN("interrupted, aborting update");
			session.cancel();
		}
	});

	DFUSessionResult result = session.run();

	// Release the signal thread if nothing was received
	pthread_kill(signal_thread.native_handle(), SIGUSR1);
	signal_thread.join();
	timer.stop();

	if (!result.success)
		return EXIT_DFU_ERROR;

	DEBUG_INFO("DFU complete");
	return 0;
}
