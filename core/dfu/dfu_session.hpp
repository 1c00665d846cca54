#pragma once

#include <atomic>
#include <memory>

#include "timer.hpp"
#include "error.hpp"
#include "dfu_state.hpp"
#include "dfu_config.hpp"
#include "dfu_events.hpp"
#include "ble_central.hpp"
#include "firmware_package.hpp"
#include "response_waiter.hpp"
#include "buttonless_controller.hpp"
#include "reconnection_manager.hpp"
#include "transfer_engine.hpp"

struct DFUSessionResult {
	bool success = false;
	DFUStateId failed_state = DFUStateId::IDLE;
	ErrorCode error = ErrorCode::DFU_CANCELLED;
	DFUErrorDetail detail;
};

// One update of one device, from application connection to activation.
// Steps are driven by DFUStateMachine; only one session may run at a time.
class DFUSession : public DFUEventNotifier {
private:
	BLECentral& m_central;
	const DFUConfig& m_config;
	const FirmwarePackage& m_package;
	ResponseWaiter m_waiter;
	ButtonlessController m_buttonless;
	ReconnectionManager m_reconnection;
	TransferEngine m_engine;
	BLEDevice m_app_device;
	std::unique_ptr<BLEConnection> m_connection;
	std::atomic<bool> m_cancelled;
	DFUStateId m_state;
	DFUSessionResult m_result;

	BLEDevice find_application();
	bool is_target(const BLEDevice& device) const;

public:
	DFUSession(BLECentral& central, Timer& timer, const DFUConfig& config, const FirmwarePackage& package);
	~DFUSession();

	DFUSessionResult run();
	// Safe to call from any thread
	void cancel();
	bool is_cancelled() const { return m_cancelled; }
	DFUStateId state() const { return m_state; }

	void connect_application();
	void enter_bootloader();
	void await_reboot();
	void connect_bootloader();
	void release_connection();

	TransferEngine& engine() { return m_engine; }
	BLEConnection& connection();
	const FirmwarePackage& package() const { return m_package; }

	void enter_state(DFUStateId state);
	void record_failure(DFUStateId state, ErrorCode error);
	void record_success();
};
