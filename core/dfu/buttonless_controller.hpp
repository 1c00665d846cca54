#pragma once

#include "ble_central.hpp"
#include "response_waiter.hpp"

// Asks an application-mode device to reboot into its bootloader
class ButtonlessController {
private:
	ResponseWaiter& m_waiter;
	unsigned int m_timeout_ms;

public:
	ButtonlessController(ResponseWaiter& waiter, unsigned int jump_timeout_ms) :
		m_waiter(waiter), m_timeout_ms(jump_timeout_ms) {}

	// A success response or a link loss both mean the jump was taken
	void jump_to_bootloader(BLEConnection& connection);
};
