#include <algorithm>

#include "transfer_engine.hpp"
#include "chunker.hpp"
#include "binascii.hpp"
#include "pmu.hpp"
#include "debug.hpp"

TransferEngine::TransferEngine(ResponseWaiter& waiter, DFUEventNotifier& notifier, const DFUTransferConfig& config, const DFUTimeoutConfig& timeouts) :
	m_waiter(waiter), m_notifier(notifier), m_config(config), m_timeouts(timeouts),
	m_bytes_sent(0), m_receipts(0), m_last_progress_pct(0) {}

unsigned int TransferEngine::frame_size(BLEConnection& connection) const {
	return std::min(m_config.packet_size, connection.max_write_length());
}

void TransferEngine::write_control(BLEConnection& connection, const ByteArray& request) {
	DEBUG_TRACE("TransferEngine: TX control %s", Binascii::hexlify(request).c_str());
	connection.write(LegacyDFUCharacteristic::CONTROL_POINT, request, true);
}

void TransferEngine::write_packet(BLEConnection& connection, const ByteSlice& chunk) {
	connection.write(LegacyDFUCharacteristic::PACKET, chunk.to_bytes(), false);
}

void TransferEngine::reset_device(BLEConnection& connection) {
	DEBUG_WARN("TransferEngine: resetting device after failed start");
	try {
		write_control(connection, LegacyDFUEncoder::system_reset());
	} catch (ErrorCode e) {
		DEBUG_WARN("TransferEngine: reset not delivered (%s)", error_code_name[e]);
	}
}

void TransferEngine::start_dfu(BLEConnection& connection) {
	m_bytes_sent = 0;
	m_receipts = 0;
	m_last_progress_pct = 0;

	m_waiter.attach(connection);

	DEBUG_INFO("TransferEngine: starting application update");
	write_control(connection, LegacyDFUEncoder::start_dfu(DFUUploadMode::APPLICATION));

	// Bootloaders that are still setting up drop the size packet
	if (m_config.start_delay_ms) {
		DEBUG_TRACE("TransferEngine: waiting %u ms before size packet", m_config.start_delay_ms);
		PMU::delay_ms(m_config.start_delay_ms);
	}
}

void TransferEngine::send_image_sizes(BLEConnection& connection, const FirmwarePackage& package) {
	DEBUG_INFO("TransferEngine: sending size %zu bytes", package.image.size());

	try {
		DFUResponse response = m_waiter.send_and_await(connection, LegacyDFUCharacteristic::PACKET,
				LegacyDFUEncoder::image_sizes(0, 0, package.image.size()), DFUOpcode::START_DFU, m_timeouts.size_response_ms);
		m_waiter.check(response);
	} catch (ErrorCode e) {
		if (e != ErrorCode::DFU_TRANSPORT_ERROR && e != ErrorCode::DFU_CANCELLED)
			reset_device(connection);
		throw;
	}
}

void TransferEngine::send_init_packet(BLEConnection& connection, const FirmwarePackage& package) {
	DEBUG_INFO("TransferEngine: sending init packet %zu bytes", package.init_data.size());

	write_control(connection, LegacyDFUEncoder::init_params(DFUInitPacketControl::RECEIVE));

	Chunker chunks(package.init_data, frame_size(connection));
	for (auto chunk : chunks)
		write_packet(connection, chunk);

	DFUResponse response = m_waiter.send_and_await(connection, LegacyDFUCharacteristic::CONTROL_POINT,
			LegacyDFUEncoder::init_params(DFUInitPacketControl::COMPLETE), DFUOpcode::INIT_DFU_PARAMS, m_timeouts.response_ms);
	m_waiter.check(response);
}

void TransferEngine::start_image_transfer(BLEConnection& connection) {
	if (m_config.prn_interval) {
		DEBUG_INFO("TransferEngine: packet receipt every %u packets", m_config.prn_interval);
		write_control(connection, LegacyDFUEncoder::packet_receipt_request(m_config.prn_interval));
	}

	// The image response is outstanding from here until the last chunk has
	// been written; its timeout only starts once streaming is over
	m_waiter.expect_response(DFUOpcode::RECEIVE_FIRMWARE_IMAGE, std::nullopt);
	try {
		write_control(connection, LegacyDFUEncoder::receive_firmware_image());
	} catch (ErrorCode) {
		m_waiter.abandon();
		throw;
	}
}

void TransferEngine::check_receipt(uint32_t bytes_reported) {
	m_receipts++;
	m_notifier.notify(DFUEventPacketReceipt { m_bytes_sent, bytes_reported });

	if (bytes_reported != m_bytes_sent) {
		DFUErrorDetail detail;
		detail.opcode = DFUOpcode::PACKET_RECEIPT_NOTIFICATION;
		detail.expected_bytes = m_bytes_sent;
		detail.reported_bytes = bytes_reported;
		m_waiter.record_detail(detail);
		DEBUG_ERROR("TransferEngine: device received %u bytes, sent %u", bytes_reported, m_bytes_sent);
		throw ErrorCode::DFU_CRC_OR_COUNT_MISMATCH;
	}
}

void TransferEngine::report_progress(uint32_t total_bytes) {
	unsigned int pct = (100ULL * m_bytes_sent) / total_bytes;
	if (pct != m_last_progress_pct || m_bytes_sent == total_bytes) {
		m_last_progress_pct = pct;
		m_notifier.notify(DFUEventProgress { m_bytes_sent, total_bytes });
	}
}

// An image response before the last packet can only be a rejection
void TransferEngine::early_response(uint32_t total_bytes) {
	DFUResponse response = m_waiter.await_response();
	m_waiter.check(response);
	DFUErrorDetail detail;
	detail.opcode = DFUOpcode::RECEIVE_FIRMWARE_IMAGE;
	detail.expected_bytes = total_bytes;
	detail.reported_bytes = m_bytes_sent;
	m_waiter.record_detail(detail);
	DEBUG_ERROR("TransferEngine: image accepted after %u of %u bytes", m_bytes_sent, total_bytes);
	throw ErrorCode::DFU_PROTOCOL_ERROR;
}

void TransferEngine::stream_image(BLEConnection& connection, const FirmwarePackage& package) {
	Chunker chunks(package.image, frame_size(connection));
	unsigned int since_receipt = 0;
	unsigned int remaining = chunks.num_chunks();

	DEBUG_INFO("TransferEngine: uploading %zu bytes in %u packets of %u bytes",
			package.image.size(), remaining, chunks.frame_size());

	try {
		for (auto chunk : chunks) {
			if (m_waiter.has_response())
				early_response(package.image.size());

			bool receipt_due = m_config.prn_interval && (since_receipt + 1) >= m_config.prn_interval;
			if (receipt_due)
				m_waiter.expect_receipt(m_timeouts.receipt_ms);

			write_packet(connection, chunk);
			m_bytes_sent += chunk.length;
			since_receipt++;
			remaining--;
			DEBUG_TRACE("TransferEngine: TX packet %u bytes, total %u", chunk.length, m_bytes_sent);

			if (receipt_due) {
				std::optional<uint32_t> reported = m_waiter.await_receipt();
				if (reported.has_value())
					check_receipt(*reported);
				else if (remaining)
					early_response(package.image.size());
				since_receipt = 0;
			}

			report_progress(package.image.size());

			if (remaining && m_config.inter_packet_delay_ms)
				PMU::delay_ms(m_config.inter_packet_delay_ms);
		}
	} catch (ErrorCode) {
		m_waiter.abandon();
		throw;
	}
}

void TransferEngine::await_image_complete() {
	DEBUG_INFO("TransferEngine: waiting for image confirmation");
	m_waiter.start_response_timeout(m_timeouts.response_ms);
	DFUResponse response = m_waiter.await_response();
	m_waiter.check(response);
}

void TransferEngine::validate(BLEConnection& connection) {
	DEBUG_INFO("TransferEngine: validating");
	DFUResponse response = m_waiter.send_and_await(connection, LegacyDFUCharacteristic::CONTROL_POINT,
			LegacyDFUEncoder::validate(), DFUOpcode::VALIDATE, m_timeouts.response_ms);
	m_waiter.check(response);
}

void TransferEngine::activate(BLEConnection& connection) {
	DEBUG_INFO("TransferEngine: activating and resetting");

	try {
		write_control(connection, LegacyDFUEncoder::activate_and_reset());
	} catch (ErrorCode e) {
		if (e != ErrorCode::DFU_TRANSPORT_ERROR)
			throw;
		DEBUG_INFO("TransferEngine: link dropped during activation");
		return;
	}

	if (!m_waiter.await_disconnect(m_timeouts.activate_ms))
		DEBUG_WARN("TransferEngine: device still connected %u ms after activation", m_timeouts.activate_ms);
}
