#pragma once

#include <cstdint>
#include <optional>

#include "ble_central.hpp"
#include "dfu_config.hpp"
#include "dfu_events.hpp"
#include "response_waiter.hpp"
#include "firmware_package.hpp"

// Bootloader side of a legacy DFU: each public step is one state transition
// and must be called in declaration order on the same connection.
class TransferEngine {
private:
	ResponseWaiter& m_waiter;
	DFUEventNotifier& m_notifier;
	const DFUTransferConfig& m_config;
	const DFUTimeoutConfig& m_timeouts;
	uint32_t m_bytes_sent;
	unsigned int m_receipts;
	unsigned int m_last_progress_pct;

	unsigned int frame_size(BLEConnection& connection) const;
	void write_control(BLEConnection& connection, const ByteArray& request);
	void write_packet(BLEConnection& connection, const ByteSlice& chunk);
	void check_receipt(uint32_t bytes_reported);
	void early_response(uint32_t total_bytes);
	void report_progress(uint32_t total_bytes);
	void reset_device(BLEConnection& connection);

public:
	TransferEngine(ResponseWaiter& waiter, DFUEventNotifier& notifier, const DFUTransferConfig& config, const DFUTimeoutConfig& timeouts);

	void start_dfu(BLEConnection& connection);
	void send_image_sizes(BLEConnection& connection, const FirmwarePackage& package);
	void send_init_packet(BLEConnection& connection, const FirmwarePackage& package);
	void start_image_transfer(BLEConnection& connection);
	void stream_image(BLEConnection& connection, const FirmwarePackage& package);
	void await_image_complete();
	void validate(BLEConnection& connection);
	void activate(BLEConnection& connection);

	uint32_t bytes_sent() const { return m_bytes_sent; }
	unsigned int receipts() const { return m_receipts; }
};
