#pragma once

#include <atomic>

#include "timer.hpp"
#include "ble_central.hpp"
#include "dfu_config.hpp"

// Finds a device again after it has rebooted into its bootloader, when it may
// advertise under a different name or address
class ReconnectionManager {
private:
	BLECentral& m_central;
	Timer& m_timer;
	const BootloaderAliasConfig& m_aliases;
	unsigned int m_scan_timeout_ms;
	std::atomic<bool> m_cancelled;

public:
	ReconnectionManager(BLECentral& central, Timer& timer, const BootloaderAliasConfig& aliases, unsigned int scan_timeout_ms) :
		m_central(central), m_timer(timer), m_aliases(aliases), m_scan_timeout_ms(scan_timeout_ms), m_cancelled(false) {}

	bool is_bootloader_of(const BLEDevice& original, const BLEDevice& candidate) const;
	BLEDevice await_bootloader(const BLEDevice& original, unsigned int timeout_ms);
	void cancel();
};
