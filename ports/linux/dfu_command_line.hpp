#pragma once

#include <string>
#include "dfu_config.hpp"

struct DFUCommandLineOptions {
	DFUConfig config;
	std::string package_path;
	std::string log_file;
	bool verbose = false;
	bool simulate = false;
	bool help = false;
};

class DFUCommandLine {
public:
	// Throws CLI_BAD_ARGUMENT
	static DFUCommandLineOptions parse(int argc, char **argv);
	static std::string usage(const char *program);
};
