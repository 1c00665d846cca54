#include "dfu_config.hpp"
#include "error.hpp"
#include "debug.hpp"

static constexpr unsigned int MAX_PRN_INTERVAL = 0xFFFF;
static constexpr unsigned int MAX_PACKET_SIZE = 512;
static constexpr unsigned int MAX_START_DELAY_MS = 60000;

void DFUConfig::validate() const {
	if (identifiers.empty()) {
		DEBUG_ERROR("DFUConfig: no target device given");
		throw ErrorCode::CONFIG_VALUE_OUT_OF_RANGE;
	}
	if (transfer.prn_interval > MAX_PRN_INTERVAL) {
		DEBUG_ERROR("DFUConfig: PRN interval %u exceeds %u", transfer.prn_interval, MAX_PRN_INTERVAL);
		throw ErrorCode::CONFIG_VALUE_OUT_OF_RANGE;
	}
	if (transfer.packet_size == 0 || transfer.packet_size > MAX_PACKET_SIZE) {
		DEBUG_ERROR("DFUConfig: packet size %u outside 1..%u", transfer.packet_size, MAX_PACKET_SIZE);
		throw ErrorCode::CONFIG_VALUE_OUT_OF_RANGE;
	}
	if (transfer.start_delay_ms > MAX_START_DELAY_MS) {
		DEBUG_ERROR("DFUConfig: start delay %u ms exceeds %u ms", transfer.start_delay_ms, MAX_START_DELAY_MS);
		throw ErrorCode::CONFIG_VALUE_OUT_OF_RANGE;
	}
}
