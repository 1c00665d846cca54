#include <stdio.h>

#include "dfu_reporter.hpp"
#include "debug.hpp"

void DFUReporter::react(DFUEventStateChanged const& e) {
	if (DebugLogger::console_log)
		DebugLogger::console_log->state(e.from, e.to);
	if (DebugLogger::file_log && DebugLogger::file_log->is_ready())
		DebugLogger::file_log->state(e.from, e.to);
}

void DFUReporter::react(DFUEventDeviceFound const& e) {
	DEBUG_INFO("Found %s %s (%s)", e.bootloader ? "bootloader" : "device",
			e.device.name.empty() ? "<unnamed>" : e.device.name.c_str(), e.device.address.c_str());
}

void DFUReporter::react(DFUEventProgress const& e) {
	if (DebugLogger::console_log)
		DebugLogger::console_log->progress(e.bytes_sent, e.total_bytes);
	if (DebugLogger::file_log && DebugLogger::file_log->is_ready() && e.bytes_sent == e.total_bytes)
		DebugLogger::file_log->progress(e.bytes_sent, e.total_bytes);
}

void DFUReporter::react(DFUEventPacketReceipt const& e) {
	DEBUG_TRACE("Receipt: device has %u of %u bytes", e.bytes_reported, e.bytes_sent);
}

void DFUReporter::react(DFUEventFailed const& e) {
	DEBUG_ERROR("%s", describe_failure(e).c_str());
	if (e.error == ErrorCode::DFU_TIMEOUT || e.error == ErrorCode::DFU_CRC_OR_COUNT_MISMATCH ||
		e.error == ErrorCode::DFU_DEVICE_REJECTED || e.error == ErrorCode::DFU_PROTOCOL_ERROR)
		DEBUG_ERROR("%s", remediation(m_config).c_str());
}

std::string DFUReporter::describe_failure(DFUEventFailed const& e) {
	char buffer[256];
	int n = snprintf(buffer, sizeof(buffer), "DFU failed in %s: %s", dfu_state_str(e.state), error_code_name[e.error]);

	const DFUErrorDetail& d = e.detail;
	if (d.opcode.has_value() && n < (int)sizeof(buffer))
		n += snprintf(buffer + n, sizeof(buffer) - n, " (opcode %s", dfu_opcode_str(*d.opcode));
	else
		return std::string(buffer);

	if (d.received_opcode.has_value() && n < (int)sizeof(buffer))
		n += snprintf(buffer + n, sizeof(buffer) - n, ", got response for %s", dfu_opcode_str(*d.received_opcode));
	if (d.result.has_value() && n < (int)sizeof(buffer))
		n += snprintf(buffer + n, sizeof(buffer) - n, ", result %s", dfu_result_str(*d.result));
	if (e.error == ErrorCode::DFU_CRC_OR_COUNT_MISMATCH && !d.result.has_value() && n < (int)sizeof(buffer))
		n += snprintf(buffer + n, sizeof(buffer) - n, ", sent %u bytes, device reported %u", d.expected_bytes, d.reported_bytes);
	if (n < (int)sizeof(buffer))
		snprintf(buffer + n, sizeof(buffer) - n, ")");

	return std::string(buffer);
}

std::string DFUReporter::remediation(const DFUConfig& config) {
	char buffer[160];
	snprintf(buffer, sizeof(buffer), "Try a longer --delay (now %.1f s) or a lower --prn (now %u)",
			config.transfer.start_delay_ms / 1000.0, config.transfer.prn_interval);
	return std::string(buffer);
}
