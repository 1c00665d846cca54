#include "host_transport.hpp"
#include "sim_ble_central.hpp"
#include "ble_address.hpp"
#include "error.hpp"
#include "debug.hpp"

std::unique_ptr<BLECentral> HostTransport::create(const DFUCommandLineOptions& options) {
	if (!options.simulate) {
		DEBUG_ERROR("no BLE transport on this port, use --simulate to update a simulated device");
		throw ErrorCode::DFU_TRANSPORT_ERROR;
	}

	const std::string& target = options.config.identifiers.at(0);
	auto central = std::make_unique<SimBLECentral>(options.config.adapter);
	if (BLEAddress::is_valid(target))
		central->add_peripheral(std::make_shared<SimDFUPeripheral>("Sim", target));
	else
		central->add_peripheral(std::make_shared<SimDFUPeripheral>(target, "C0:FF:EE:00:00:01"));

	DEBUG_WARN("simulating %s, no real device will be updated", target.c_str());
	return central;
}
