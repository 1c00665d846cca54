#include "response_waiter.hpp"
#include "binascii.hpp"
#include "debug.hpp"

ResponseWaiter::ResponseWaiter(Timer& timer, DFUEventNotifier& notifier) :
	m_timer(timer), m_notifier(notifier), m_state(std::make_shared<State>()) {}

ResponseWaiter::~ResponseWaiter() {
	for (unsigned int i = 0; i < static_cast<unsigned int>(SlotId::NUM_SLOTS); i++)
		disarm(static_cast<SlotId>(i));
}

void ResponseWaiter::attach(BLEConnection& connection) {
	{
		std::lock_guard<std::mutex> lock(m_state->mtx);
		m_state->disconnected = false;
	}
	connection.set_disconnect_handler([this]() { on_disconnect(); });
	connection.subscribe(LegacyDFUCharacteristic::CONTROL_POINT, [this](const ByteArray& data) { on_notification(data); });
}

void ResponseWaiter::on_timeout(std::shared_ptr<State> state, SlotId id, unsigned int generation) {
	std::lock_guard<std::mutex> lock(state->mtx);
	Slot& s = state->slot(id);
	if (s.armed && !s.resolved && s.generation == generation) {
		s.resolved = true;
		s.error = ErrorCode::DFU_TIMEOUT;
		state->cv.notify_all();
	}
}

void ResponseWaiter::arm(SlotId id, DFUOpcode expected, std::optional<unsigned int> timeout_ms) {
	{
		std::lock_guard<std::mutex> lock(m_state->mtx);
		if (m_state->cancelled)
			throw ErrorCode::DFU_CANCELLED;

		Slot& s = m_state->slot(id);
		if (s.armed) {
			DEBUG_ERROR("ResponseWaiter: %s armed while another is outstanding", dfu_opcode_str(expected));
			throw ErrorCode::DFU_COMMAND_PENDING;
		}

		unsigned int generation = s.generation + 1;
		s = Slot();
		s.armed = true;
		s.expected = expected;
		s.generation = generation;
		if (id == SlotId::DISCONNECT && m_state->disconnected)
			s.resolved = true;
	}

	if (timeout_ms.has_value())
		schedule_timeout(id, *timeout_ms);
}

void ResponseWaiter::schedule_timeout(SlotId id, unsigned int timeout_ms) {
	unsigned int generation;
	Timer::TimerHandle previous;
	{
		std::lock_guard<std::mutex> lock(m_state->mtx);
		Slot& s = m_state->slot(id);
		if (!s.armed)
			return;
		generation = s.generation;
		previous = s.timeout;
		s.timeout.reset();
	}
	m_timer.cancel_schedule(previous);

	auto state = m_state;
	Timer::TimerHandle handle = m_timer.add_schedule([state, id, generation]() {
		on_timeout(state, id, generation);
	}, m_timer.get_counter() + timeout_ms);

	std::lock_guard<std::mutex> lock(m_state->mtx);
	Slot& s = m_state->slot(id);
	if (s.armed && s.generation == generation)
		s.timeout = handle;
}

void ResponseWaiter::disarm(SlotId id) {
	Timer::TimerHandle handle;
	{
		std::lock_guard<std::mutex> lock(m_state->mtx);
		Slot& s = m_state->slot(id);
		handle = s.timeout;
		s.timeout.reset();
		s.armed = false;
		s.resolved = false;
		s.error.reset();
	}
	m_timer.cancel_schedule(handle);
}

ResponseWaiter::Slot ResponseWaiter::wait(SlotId id, bool wake_on_response) {
	Slot result;
	bool cancelled;
	bool response_first;
	{
		std::unique_lock<std::mutex> lock(m_state->mtx);
		m_state->cv.wait(lock, [this, id, wake_on_response]() {
			return m_state->slot(id).resolved || m_state->cancelled ||
				(id != SlotId::DISCONNECT && m_state->disconnected) ||
				(wake_on_response && m_state->response_ready());
		});
		result = m_state->slot(id);
		cancelled = m_state->cancelled;
		response_first = wake_on_response && !result.resolved && !cancelled && m_state->response_ready();
	}
	disarm(id);

	if (response_first)
		return result;

	std::optional<ErrorCode> error = result.error;
	if (!result.resolved)
		error = cancelled ? ErrorCode::DFU_CANCELLED : ErrorCode::DFU_TRANSPORT_ERROR;

	if (error.has_value()) {
		if (id != SlotId::DISCONNECT) {
			DFUErrorDetail detail;
			detail.opcode = result.expected;
			if (*error == ErrorCode::DFU_PROTOCOL_ERROR)
				detail.received_opcode = result.response.request_opcode;
			record_detail(detail);
		}
		throw *error;
	}

	return result;
}

DFUResponse ResponseWaiter::send_and_await(BLEConnection& connection, const std::string& characteristic,
		const ByteArray& request, DFUOpcode expected, unsigned int timeout_ms) {
	expect_response(expected, timeout_ms);
	DEBUG_TRACE("ResponseWaiter: TX %s", Binascii::hexlify(request).c_str());
	try {
		// Only the control point is written with response
		connection.write(characteristic, request, characteristic == LegacyDFUCharacteristic::CONTROL_POINT);
	} catch (ErrorCode) {
		disarm(SlotId::RESPONSE);
		DFUErrorDetail detail;
		detail.opcode = expected;
		record_detail(detail);
		throw;
	}
	return await_response();
}

void ResponseWaiter::expect_response(DFUOpcode expected, std::optional<unsigned int> timeout_ms) {
	arm(SlotId::RESPONSE, expected, timeout_ms);
}

void ResponseWaiter::start_response_timeout(unsigned int timeout_ms) {
	schedule_timeout(SlotId::RESPONSE, timeout_ms);
}

bool ResponseWaiter::has_response() {
	std::lock_guard<std::mutex> lock(m_state->mtx);
	return m_state->response_ready();
}

DFUResponse ResponseWaiter::await_response() {
	Slot s = wait(SlotId::RESPONSE);
	DEBUG_TRACE("ResponseWaiter: RX response %s %s", dfu_opcode_str(s.response.request_opcode), dfu_result_str(s.response.result));
	return s.response;
}

void ResponseWaiter::expect_receipt(unsigned int timeout_ms) {
	arm(SlotId::RECEIPT, DFUOpcode::PACKET_RECEIPT_NOTIFICATION, timeout_ms);
}

std::optional<uint32_t> ResponseWaiter::await_receipt() {
	Slot s = wait(SlotId::RECEIPT, true);
	if (!s.resolved) {
		DEBUG_TRACE("ResponseWaiter: response arrived ahead of receipt");
		return std::nullopt;
	}
	DEBUG_TRACE("ResponseWaiter: RX receipt %u bytes", s.bytes_received);
	return s.bytes_received;
}

void ResponseWaiter::abandon() {
	disarm(SlotId::RESPONSE);
	disarm(SlotId::RECEIPT);
}

bool ResponseWaiter::await_disconnect(unsigned int timeout_ms) {
	arm(SlotId::DISCONNECT, DFUOpcode::ACTIVATE_AND_RESET, timeout_ms);
	try {
		wait(SlotId::DISCONNECT);
	} catch (ErrorCode e) {
		if (e == ErrorCode::DFU_TIMEOUT)
			return false;
		throw;
	}
	return true;
}

void ResponseWaiter::check(const DFUResponse& response) {
	if (response.result == DFUResultCode::SUCCESS)
		return;

	DFUErrorDetail detail;
	detail.opcode = response.request_opcode;
	detail.result = response.result;
	record_detail(detail);

	DEBUG_ERROR("ResponseWaiter: %s failed with %s", dfu_opcode_str(response.request_opcode), dfu_result_str(response.result));

	if (response.result == DFUResultCode::CRC_ERROR)
		throw ErrorCode::DFU_CRC_OR_COUNT_MISMATCH;
	throw ErrorCode::DFU_DEVICE_REJECTED;
}

void ResponseWaiter::stray(const ByteArray& data) {
	DEBUG_WARN("ResponseWaiter: discarding unsolicited notification %s", Binascii::hexlify(data).c_str());
	m_notifier.notify(DFUEventStrayNotification { data });
}

void ResponseWaiter::on_notification(const ByteArray& data) {
	DFUNotification notification;

	try {
		notification = LegacyDFUDecoder::decode(data);
	} catch (ErrorCode) {
		stray(data);
		return;
	}

	bool is_stray = false;
	{
		std::lock_guard<std::mutex> lock(m_state->mtx);
		if (notification.type == DFUNotificationType::RESPONSE) {
			Slot& s = m_state->slot(SlotId::RESPONSE);
			if (s.armed && !s.resolved) {
				s.resolved = true;
				s.response = notification.response;
				if (notification.response.request_opcode != s.expected)
					s.error = ErrorCode::DFU_PROTOCOL_ERROR;
			} else {
				is_stray = true;
			}
		} else {
			Slot& s = m_state->slot(SlotId::RECEIPT);
			if (s.armed && !s.resolved) {
				s.resolved = true;
				s.bytes_received = notification.bytes_received;
			} else {
				is_stray = true;
			}
		}
		if (!is_stray)
			m_state->cv.notify_all();
	}

	if (is_stray)
		stray(data);
}

void ResponseWaiter::on_disconnect() {
	DEBUG_INFO("ResponseWaiter: link lost");
	std::lock_guard<std::mutex> lock(m_state->mtx);
	m_state->disconnected = true;
	Slot& s = m_state->slot(SlotId::DISCONNECT);
	if (s.armed && !s.resolved)
		s.resolved = true;
	m_state->cv.notify_all();
}

void ResponseWaiter::cancel() {
	std::lock_guard<std::mutex> lock(m_state->mtx);
	m_state->cancelled = true;
	m_state->cv.notify_all();
}

bool ResponseWaiter::is_cancelled() {
	std::lock_guard<std::mutex> lock(m_state->mtx);
	return m_state->cancelled;
}

bool ResponseWaiter::is_disconnected() {
	std::lock_guard<std::mutex> lock(m_state->mtx);
	return m_state->disconnected;
}

DFUErrorDetail ResponseWaiter::error_detail() {
	std::lock_guard<std::mutex> lock(m_state->mtx);
	return m_state->detail;
}

void ResponseWaiter::record_detail(const DFUErrorDetail& detail) {
	std::lock_guard<std::mutex> lock(m_state->mtx);
	m_state->detail = detail;
}
