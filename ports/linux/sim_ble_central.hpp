#pragma once

#include <chrono>
#include <memory>
#include <vector>
#include <string>

#include "ble_central.hpp"
#include "legacy_dfu_protocol.hpp"

struct SimDFUFaults {
	// Application reboots without answering the jump
	bool silent_jump = false;
	// Bootloader refuses the image size
	bool reject_size = false;
	// Packet receipts report one byte fewer than received
	bool miscount_receipts = false;
};

// A device with a buttonless application and a Nordic legacy bootloader.
// After the jump the bootloader advertises as <name>DfuTarg at address + 1.
class SimDFUPeripheral {
public:
	enum class Mode { APPLICATION, REBOOTING, BOOTLOADER };

private:
	enum class DFUState { IDLE, WAIT_SIZES, READY, INIT, INIT_COMPLETE, RECEIVING, RECEIVED, VALIDATED };

	static constexpr uint32_t MAX_IMAGE_SIZE = 1024 * 1024;

	std::string m_name;
	std::string m_address;
	unsigned int m_reboot_ms;
	SimDFUFaults m_faults;
	Mode m_mode;
	Mode m_next_mode;
	std::chrono::steady_clock::time_point m_ready_at;
	bool m_connected;

	DFUState m_state;
	uint32_t m_image_size;
	uint16_t m_prn_interval;
	unsigned int m_packets_since_receipt;
	ByteArray m_init_data;
	ByteArray m_image;
	ByteArray m_installed_image;
	unsigned int m_num_updates;

	BLENotificationHandler m_notify;
	std::function<void()> m_drop_link;

	void notify(const ByteArray& data);
	void respond(DFUOpcode op, DFUResultCode result);
	void reboot(Mode next);
	void application_control(const ByteArray& data);
	void bootloader_control(const ByteArray& data);
	void bootloader_packet(const ByteArray& data);

public:
	SimDFUPeripheral(const std::string& name, const std::string& address, unsigned int reboot_ms = 500, SimDFUFaults faults = SimDFUFaults());

	Mode mode();
	bool is_connected() const { return m_connected; }
	BLEDevice advertisement() const;
	void connect(BLENotificationHandler notify, std::function<void()> drop_link);
	void disconnect();
	void write(const std::string& characteristic, const ByteArray& data);

	const ByteArray& installed_image() const { return m_installed_image; }
	const ByteArray& received_init_data() const { return m_init_data; }
	unsigned int num_updates() const { return m_num_updates; }
};

class SimBLECentral : public BLECentral {
private:
	std::vector<std::shared_ptr<SimDFUPeripheral>> m_peripherals;
	unsigned int m_att_mtu;
	std::shared_ptr<SimDFUPeripheral> find_advertising(const BLEScanFilter& filter, BLEDevice& adv);

public:
	SimBLECentral(const std::string& adapter = std::string(), unsigned int att_mtu = 23);

	void add_peripheral(std::shared_ptr<SimDFUPeripheral> peripheral);

	std::optional<BLEDevice> scan(const BLEScanFilter& filter, unsigned int timeout_ms) override;
	std::unique_ptr<BLEConnection> connect(const BLEDevice& device, unsigned int timeout_ms) override;
};
