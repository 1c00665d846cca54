#include "buttonless_controller.hpp"
#include "debug.hpp"

void ButtonlessController::jump_to_bootloader(BLEConnection& connection) {
	DEBUG_INFO("ButtonlessController: requesting bootloader on %s", connection.device().address.c_str());

	m_waiter.attach(connection);
	m_waiter.expect_response(DFU_ENTER_BOOTLOADER, m_timeout_ms);

	try {
		connection.write(LegacyDFUCharacteristic::CONTROL_POINT, LegacyDFUEncoder::enter_bootloader(), true);
	} catch (ErrorCode e) {
		m_waiter.abandon();
		if (e == ErrorCode::DFU_TRANSPORT_ERROR && !connection.is_connected()) {
			DEBUG_INFO("ButtonlessController: device dropped the link while taking the jump");
			return;
		}
		throw;
	}

	try {
		DFUResponse response = m_waiter.await_response();
		m_waiter.check(response);
		DEBUG_INFO("ButtonlessController: jump accepted");
	} catch (ErrorCode e) {
		if (e != ErrorCode::DFU_TRANSPORT_ERROR)
			throw;
		DEBUG_INFO("ButtonlessController: device disconnected without a response");
	}
}
