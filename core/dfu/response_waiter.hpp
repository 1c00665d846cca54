#pragma once

#include <mutex>
#include <memory>
#include <optional>
#include <condition_variable>

#include "timer.hpp"
#include "error.hpp"
#include "ble_central.hpp"
#include "dfu_events.hpp"
#include "legacy_dfu_protocol.hpp"

// Bridges control point notifications (transport context) into blocking waits
// (session context). At most one response and one packet receipt can be
// armed at a time; each is armed before the write that provokes it so
// notifications delivered during the write are never missed.
class ResponseWaiter {
private:
	enum class SlotId : unsigned int { RESPONSE, RECEIPT, DISCONNECT, NUM_SLOTS };

	struct Slot {
		bool armed = false;
		bool resolved = false;
		std::optional<ErrorCode> error;
		DFUOpcode expected = DFUOpcode::RESPONSE;
		DFUResponse response = {};
		uint32_t bytes_received = 0;
		unsigned int generation = 0;
		Timer::TimerHandle timeout;
	};

	struct State {
		std::mutex mtx;
		std::condition_variable cv;
		Slot slots[static_cast<unsigned int>(SlotId::NUM_SLOTS)];
		bool cancelled = false;
		bool disconnected = false;
		DFUErrorDetail detail;

		Slot& slot(SlotId id) { return slots[static_cast<unsigned int>(id)]; }
		bool response_ready() { return slot(SlotId::RESPONSE).armed && slot(SlotId::RESPONSE).resolved; }
	};

	Timer& m_timer;
	DFUEventNotifier& m_notifier;
	std::shared_ptr<State> m_state;

	void arm(SlotId id, DFUOpcode expected, std::optional<unsigned int> timeout_ms);
	void schedule_timeout(SlotId id, unsigned int timeout_ms);
	Slot wait(SlotId id, bool wake_on_response = false);
	void disarm(SlotId id);
	void stray(const ByteArray& data);
	static void on_timeout(std::shared_ptr<State> state, SlotId id, unsigned int generation);

public:
	ResponseWaiter(Timer& timer, DFUEventNotifier& notifier);
	~ResponseWaiter();

	// Subscribes to the control point and link loss of a new connection.
	// The connection must be released before this waiter.
	void attach(BLEConnection& connection);

	DFUResponse send_and_await(BLEConnection& connection, const std::string& characteristic,
			const ByteArray& request, DFUOpcode expected, unsigned int timeout_ms);

	// Without a timeout the response may be awaited across a long transfer;
	// start_response_timeout() bounds the final wait
	void expect_response(DFUOpcode expected, std::optional<unsigned int> timeout_ms);
	void start_response_timeout(unsigned int timeout_ms);
	bool has_response();
	DFUResponse await_response();
	void expect_receipt(unsigned int timeout_ms);
	// Empty when an armed response arrives first and ends the wait
	std::optional<uint32_t> await_receipt();
	void abandon();

	// Returns false if the link is still up after timeout_ms
	bool await_disconnect(unsigned int timeout_ms);

	// Throws DFU_CRC_OR_COUNT_MISMATCH or DFU_DEVICE_REJECTED for a failed result
	void check(const DFUResponse& response);

	void on_notification(const ByteArray& data);
	void on_disconnect();
	void cancel();
	bool is_cancelled();
	bool is_disconnected();

	DFUErrorDetail error_detail();
	void record_detail(const DFUErrorDetail& detail);
};
