#pragma once

#include <memory>
#include "ble_central.hpp"
#include "dfu_command_line.hpp"

// This port carries no BLE stack. A simulated device named after the first
// target is only provided when asked for with --simulate.
class HostTransport {
public:
	// Throws DFU_TRANSPORT_ERROR when no transport is available
	static std::unique_ptr<BLECentral> create(const DFUCommandLineOptions& options);
};
