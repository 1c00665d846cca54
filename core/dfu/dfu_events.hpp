#pragma once

#include <list>
#include <optional>
#include <cstdint>

#include "error.hpp"
#include "dfu_state.hpp"
#include "ble_central.hpp"
#include "legacy_dfu_protocol.hpp"

// What was on the wire when an ErrorCode was raised
struct DFUErrorDetail {
	std::optional<DFUOpcode> opcode;
	std::optional<DFUOpcode> received_opcode;
	std::optional<DFUResultCode> result;
	uint32_t expected_bytes = 0;
	uint32_t reported_bytes = 0;
};

struct DFUEventStateChanged {
	DFUStateId from;
	DFUStateId to;
};
struct DFUEventDeviceFound {
	BLEDevice device;
	bool bootloader;
};
struct DFUEventProgress {
	uint32_t bytes_sent;
	uint32_t total_bytes;
};
struct DFUEventPacketReceipt {
	uint32_t bytes_sent;
	uint32_t bytes_reported;
};
struct DFUEventStrayNotification {
	ByteArray data;
};
struct DFUEventFailed {
	DFUStateId state;
	ErrorCode error;
	DFUErrorDetail detail;
};

class DFUEventListener {
public:
	virtual ~DFUEventListener() {}
	virtual void react(DFUEventStateChanged const& ) {}
	virtual void react(DFUEventDeviceFound const& ) {}
	virtual void react(DFUEventProgress const& ) {}
	virtual void react(DFUEventPacketReceipt const& ) {}
	virtual void react(DFUEventStrayNotification const& ) {}
	virtual void react(DFUEventFailed const& ) {}
};

class DFUEventNotifier {
private:
	std::list<DFUEventListener*> m_listeners;

public:
	void subscribe(DFUEventListener& m) {
		m_listeners.push_back(&m);
	}
	void unsubscribe(DFUEventListener& m) {
		m_listeners.remove(&m);
	}
	template<typename E> void notify(E const& e) {
		for (auto m : m_listeners) {
			m->react(e);
		}
	}
};
