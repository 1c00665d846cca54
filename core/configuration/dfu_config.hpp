#pragma once

#include <string>
#include <vector>

struct DFUTransferConfig {
	// Chunks between packet receipt notifications, 0 disables them
	unsigned int prn_interval = 8;
	// Pause between START_DFU and the size packet
	unsigned int start_delay_ms = 400;
	unsigned int inter_packet_delay_ms = 0;
	unsigned int packet_size = 20;
};

struct DFUTimeoutConfig {
	unsigned int scan_ms = 5000;
	unsigned int connect_ms = 20000;
	unsigned int jump_ms = 2000;
	unsigned int reboot_delay_ms = 1000;
	unsigned int reconnect_ms = 20000;
	unsigned int response_ms = 30000;
	// The bootloader erases the application bank before answering the sizes
	unsigned int size_response_ms = 60000;
	unsigned int receipt_ms = 5000;
	unsigned int activate_ms = 2000;
};

// Identities a device may take once it is running its bootloader
struct BootloaderAliasConfig {
	std::vector<std::string> name_suffixes = { "DfuTarg", "_DFU" };
	std::vector<std::string> names = { "DfuTarg" };
	bool match_service_uuid = true;
	bool match_incremented_address = true;
};

struct DFUConfig {
	std::vector<std::string> identifiers;
	bool force_scan = false;
	bool wait_for_device = false;
	std::string adapter;
	DFUTransferConfig transfer;
	DFUTimeoutConfig timeouts;
	BootloaderAliasConfig aliases;

	void validate() const;
};
