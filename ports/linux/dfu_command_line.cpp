#include <getopt.h>
#include <cstdlib>
#include <cmath>
#include <cerrno>

#include "dfu_command_line.hpp"
#include "error.hpp"
#include "debug.hpp"

enum {
	OPT_SCAN = 256,
	OPT_PRN,
	OPT_DELAY,
	OPT_ADAPTER,
	OPT_WAIT,
	OPT_PACKET_DELAY,
	OPT_PACKET_SIZE,
	OPT_ALIAS,
	OPT_LOG_FILE,
	OPT_SIMULATE
};

static const struct option long_options[] = {
	{ "scan",         no_argument,       nullptr, OPT_SCAN },
	{ "prn",          required_argument, nullptr, OPT_PRN },
	{ "delay",        required_argument, nullptr, OPT_DELAY },
	{ "verbose",      no_argument,       nullptr, 'v' },
	{ "adapter",      required_argument, nullptr, OPT_ADAPTER },
	{ "wait",         no_argument,       nullptr, OPT_WAIT },
	{ "packet-delay", required_argument, nullptr, OPT_PACKET_DELAY },
	{ "packet-size",  required_argument, nullptr, OPT_PACKET_SIZE },
	{ "alias",        required_argument, nullptr, OPT_ALIAS },
	{ "log-file",     required_argument, nullptr, OPT_LOG_FILE },
	{ "simulate",     no_argument,       nullptr, OPT_SIMULATE },
	{ "help",         no_argument,       nullptr, 'h' },
	{ nullptr,        0,                 nullptr, 0 }
};

static unsigned int parse_unsigned(const char *name, const char *value) {
	char *end;
	errno = 0;
	unsigned long v = std::strtoul(value, &end, 10);
	if (*value == '\0' || *value == '-' || *end != '\0' || errno || v > 0xFFFFFFFFUL) {
		DEBUG_ERROR("--%s: invalid value '%s'", name, value);
		throw ErrorCode::CLI_BAD_ARGUMENT;
	}
	return static_cast<unsigned int>(v);
}

static unsigned int parse_seconds_as_ms(const char *name, const char *value) {
	char *end;
	double v = std::strtod(value, &end);
	if (*value == '\0' || *end != '\0' || !std::isfinite(v) || v < 0 || v > 3600) {
		DEBUG_ERROR("--%s: invalid value '%s'", name, value);
		throw ErrorCode::CLI_BAD_ARGUMENT;
	}
	return static_cast<unsigned int>(std::lround(v * 1000));
}

std::string DFUCommandLine::usage(const char *program) {
	return std::string("usage: ") + program + " [options] file device [device ...]\n"
		"\n"
		"Update a Nordic legacy DFU device over BLE using the buttonless jump.\n"
		"\n"
		"  file                 DFU .zip, unpacked package directory or .bin with sibling .dat\n"
		"  device               address (AA:BB:CC:DD:EE:FF) or advertised name\n"
		"\n"
		"  --scan               always scan, even when given an address\n"
		"  --prn N              packets between receipt notifications, 0 disables (default 8)\n"
		"  --delay SECONDS      pause between start and size packet (default 0.4)\n"
		"  --packet-delay MS    pause between image packets (default 0)\n"
		"  --packet-size N      largest packet written (default 20)\n"
		"  --alias NAME         extra name the bootloader may advertise (repeatable)\n"
		"  --adapter NAME       BLE adapter to use\n"
		"  --wait               keep scanning until the device appears\n"
		"  --log-file PATH      append log output to PATH\n"
		"  --simulate           update a simulated device instead of a real one\n"
		"  -v, --verbose        debug output\n"
		"  -h, --help           show this message\n";
}

DFUCommandLineOptions DFUCommandLine::parse(int argc, char **argv) {
	DFUCommandLineOptions options;
	int c;

	// Rescan from the start on every call
	optind = 0;
	opterr = 0;

	while ((c = getopt_long(argc, argv, "vh", long_options, nullptr)) != -1) {
		switch (c) {
		case OPT_SCAN:
			options.config.force_scan = true;
			break;
		case OPT_PRN:
			options.config.transfer.prn_interval = parse_unsigned("prn", optarg);
			break;
		case OPT_DELAY:
			options.config.transfer.start_delay_ms = parse_seconds_as_ms("delay", optarg);
			break;
		case 'v':
			options.verbose = true;
			break;
		case OPT_ADAPTER:
			options.config.adapter = optarg;
			break;
		case OPT_WAIT:
			options.config.wait_for_device = true;
			break;
		case OPT_PACKET_DELAY:
			options.config.transfer.inter_packet_delay_ms = parse_unsigned("packet-delay", optarg);
			break;
		case OPT_PACKET_SIZE:
			options.config.transfer.packet_size = parse_unsigned("packet-size", optarg);
			break;
		case OPT_ALIAS:
			options.config.aliases.names.push_back(optarg);
			break;
		case OPT_LOG_FILE:
			options.log_file = optarg;
			break;
		case OPT_SIMULATE:
			options.simulate = true;
			break;
		case 'h':
			options.help = true;
			return options;
		default:
			DEBUG_ERROR("unknown or incomplete option '%s'", argv[optind - 1]);
			throw ErrorCode::CLI_BAD_ARGUMENT;
		}
	}

	if (argc - optind < 2) {
		DEBUG_ERROR("a firmware file and at least one device are required");
		throw ErrorCode::CLI_BAD_ARGUMENT;
	}

	options.package_path = argv[optind++];
	while (optind < argc)
		options.config.identifiers.push_back(argv[optind++]);

	try {
		options.config.validate();
	} catch (ErrorCode) {
		throw ErrorCode::CLI_BAD_ARGUMENT;
	}

	return options;
}
