#include "dfu_session.hpp"
#include "dfu_fsm.hpp"
#include "ble_address.hpp"
#include "pmu.hpp"
#include "debug.hpp"

DFUSession::DFUSession(BLECentral& central, Timer& timer, const DFUConfig& config, const FirmwarePackage& package) :
	m_central(central),
	m_config(config),
	m_package(package),
	m_waiter(timer, *this),
	m_buttonless(m_waiter, config.timeouts.jump_ms),
	m_reconnection(central, timer, config.aliases, config.timeouts.scan_ms),
	m_engine(m_waiter, *this, config.transfer, config.timeouts),
	m_cancelled(false),
	m_state(DFUStateId::IDLE) {}

DFUSession::~DFUSession() {
	release_connection();
}

DFUSessionResult DFUSession::run() {
	if (DFUStateMachine::session) {
		DEBUG_ERROR("DFUSession: another session is running");
		throw ErrorCode::DFU_COMMAND_PENDING;
	}

	DFUStateMachine::session = this;
	m_state = DFUStateId::IDLE;
	m_result = DFUSessionResult();

	DFUStateMachine::start();
	while (!DFUStateMachine::is_finished()) {
		if (m_cancelled)
			DFUStateMachine::dispatch(DFUCancelEvent());
		else
			DFUStateMachine::dispatch(DFUStepEvent());
	}

	release_connection();
	DFUStateMachine::session = nullptr;

	return m_result;
}

void DFUSession::cancel() {
	DEBUG_WARN("DFUSession: cancel requested");
	m_cancelled = true;
	m_waiter.cancel();
	m_reconnection.cancel();
}

BLEConnection& DFUSession::connection() {
	if (!m_connection)
		throw ErrorCode::DFU_TRANSPORT_ERROR;
	return *m_connection;
}

bool DFUSession::is_target(const BLEDevice& device) const {
	for (auto const &id : m_config.identifiers) {
		if (BLEAddress::is_valid(id) ? BLEAddress::equal(id, device.address) : id == device.name)
			return true;
	}
	return false;
}

BLEDevice DFUSession::find_application() {
	// A lone address can be connected to without seeing an advertisement first
	if (!m_config.force_scan && m_config.identifiers.size() == 1 && BLEAddress::is_valid(m_config.identifiers[0])) {
		BLEDevice device;
		device.address = BLEAddress::normalise(m_config.identifiers[0]);
		return device;
	}

	do {
		DEBUG_INFO("DFUSession: scanning for %zu target(s)", m_config.identifiers.size());
		auto found = m_central.scan([this](const BLEDevice& d) { return is_target(d); }, m_config.timeouts.scan_ms);
		if (found.has_value())
			return *found;
	} while (m_config.wait_for_device && !m_cancelled);

	if (m_cancelled)
		throw ErrorCode::DFU_CANCELLED;

	DEBUG_ERROR("DFUSession: no target device found");
	throw ErrorCode::DFU_DEVICE_NOT_FOUND;
}

void DFUSession::connect_application() {
	if (m_package.image.empty()) {
		DEBUG_ERROR("DFUSession: firmware image is empty");
		throw ErrorCode::FIRMWARE_PACKAGE_INVALID;
	}

	m_app_device = find_application();
	notify(DFUEventDeviceFound { m_app_device, false });

	DEBUG_INFO("DFUSession: connecting to %s (%s)", m_app_device.name.c_str(), m_app_device.address.c_str());
	m_connection = m_central.connect(m_app_device, m_config.timeouts.connect_ms);

	// The connection may know the name when only the address was given
	if (m_app_device.name.empty())
		m_app_device.name = m_connection->device().name;
}

void DFUSession::enter_bootloader() {
	m_buttonless.jump_to_bootloader(connection());
}

void DFUSession::await_reboot() {
	release_connection();
	DEBUG_INFO("DFUSession: waiting %u ms for reboot", m_config.timeouts.reboot_delay_ms);
	PMU::delay_ms(m_config.timeouts.reboot_delay_ms);
}

void DFUSession::connect_bootloader() {
	BLEDevice bootloader = m_reconnection.await_bootloader(m_app_device, m_config.timeouts.reconnect_ms);
	notify(DFUEventDeviceFound { bootloader, true });

	DEBUG_INFO("DFUSession: connecting to bootloader %s (%s)", bootloader.name.c_str(), bootloader.address.c_str());
	m_connection = m_central.connect(bootloader, m_config.timeouts.connect_ms);
}

void DFUSession::release_connection() {
	if (m_connection) {
		m_connection->set_disconnect_handler(nullptr);
		m_connection.reset();
	}
}

void DFUSession::enter_state(DFUStateId state) {
	if (state == m_state)
		return;
	DFUStateId from = m_state;
	m_state = state;
	if (state != DFUStateId::FAILED)
		m_waiter.record_detail(DFUErrorDetail());
	notify(DFUEventStateChanged { from, state });
}

void DFUSession::record_failure(DFUStateId state, ErrorCode error) {
	m_result.success = false;
	m_result.failed_state = state;
	m_result.error = error;
	m_result.detail = m_waiter.error_detail();

	DEBUG_ERROR("DFUSession: %s failed: %s", dfu_state_str(state), error_code_name[error]);
	release_connection();
	notify(DFUEventFailed { state, error, m_result.detail });
}

void DFUSession::record_success() {
	m_result.success = true;
	DEBUG_INFO("DFUSession: update complete");
}
