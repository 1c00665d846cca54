#pragma once

#include <string>
#include <cstdint>
#include "base_types.hpp"
#include "error.hpp"

// GATT identifiers of the Nordic legacy (unsigned) DFU service
class LegacyDFUCharacteristic {
public:
	static inline const std::string SERVICE       = "00001530-1212-efde-1523-785feabcd123";
	static inline const std::string CONTROL_POINT = "00001531-1212-efde-1523-785feabcd123";
	static inline const std::string PACKET        = "00001532-1212-efde-1523-785feabcd123";
	static inline const std::string VERSION       = "00001534-1212-efde-1523-785feabcd123";
};

enum class DFUOpcode : uint8_t {
	START_DFU = 0x01,
	INIT_DFU_PARAMS = 0x02,
	RECEIVE_FIRMWARE_IMAGE = 0x03,
	VALIDATE = 0x04,
	ACTIVATE_AND_RESET = 0x05,
	SYSTEM_RESET = 0x06,
	PACKET_RECEIPT_NOTIFICATION_REQUEST = 0x08,
	RESPONSE = 0x10,
	PACKET_RECEIPT_NOTIFICATION = 0x11
};

// The application's buttonless service reuses START_DFU as its jump opcode
static constexpr DFUOpcode DFU_ENTER_BOOTLOADER = DFUOpcode::START_DFU;

enum class DFUResultCode : uint8_t {
	SUCCESS = 0x01,
	INVALID_STATE = 0x02,
	NOT_SUPPORTED = 0x03,
	DATA_SIZE_EXCEEDS_LIMIT = 0x04,
	CRC_ERROR = 0x05,
	OPERATION_FAILED = 0x06
};

enum class DFUUploadMode : uint8_t {
	SOFTDEVICE = 0x01,
	BOOTLOADER = 0x02,
	APPLICATION = 0x04
};

enum class DFUInitPacketControl : uint8_t {
	RECEIVE = 0x00,
	COMPLETE = 0x01
};

struct DFUResponse {
	DFUOpcode request_opcode;
	DFUResultCode result;
};

enum class DFUNotificationType {
	RESPONSE,
	PACKET_RECEIPT
};

struct DFUNotification {
	DFUNotificationType type;
	DFUResponse response;
	uint32_t bytes_received;
};

static inline const char *dfu_opcode_str(DFUOpcode op) {
	switch (op) {
	case DFUOpcode::START_DFU: return "START_DFU";
	case DFUOpcode::INIT_DFU_PARAMS: return "INIT_DFU_PARAMS";
	case DFUOpcode::RECEIVE_FIRMWARE_IMAGE: return "RECEIVE_FIRMWARE_IMAGE";
	case DFUOpcode::VALIDATE: return "VALIDATE";
	case DFUOpcode::ACTIVATE_AND_RESET: return "ACTIVATE_AND_RESET";
	case DFUOpcode::SYSTEM_RESET: return "SYSTEM_RESET";
	case DFUOpcode::PACKET_RECEIPT_NOTIFICATION_REQUEST: return "PACKET_RECEIPT_NOTIFICATION_REQUEST";
	case DFUOpcode::RESPONSE: return "RESPONSE";
	case DFUOpcode::PACKET_RECEIPT_NOTIFICATION: return "PACKET_RECEIPT_NOTIFICATION";
	default: return "UNKNOWN";
	}
}

static inline const char *dfu_result_str(DFUResultCode result) {
	switch (result) {
	case DFUResultCode::SUCCESS: return "Success";
	case DFUResultCode::INVALID_STATE: return "InvalidState";
	case DFUResultCode::NOT_SUPPORTED: return "NotSupported";
	case DFUResultCode::DATA_SIZE_EXCEEDS_LIMIT: return "DataSizeExceedsLimit";
	case DFUResultCode::CRC_ERROR: return "CrcError";
	case DFUResultCode::OPERATION_FAILED: return "OperationFailed";
	default: return "Unknown";
	}
}


class LegacyDFUEncoder {
private:
	static inline void append_u16(ByteArray& output, uint16_t value) {
		output.push_back(value & 0xFF);
		output.push_back((value >> 8) & 0xFF);
	}
	static inline void append_u32(ByteArray& output, uint32_t value) {
		for (unsigned int i = 0; i < 4; i++)
			output.push_back((value >> (8 * i)) & 0xFF);
	}
	static inline ByteArray opcode(DFUOpcode op) {
		return ByteArray { static_cast<uint8_t>(op) };
	}

public:
	static inline ByteArray enter_bootloader() {
		return opcode(DFU_ENTER_BOOTLOADER);
	}
	static inline ByteArray start_dfu(DFUUploadMode mode = DFUUploadMode::APPLICATION) {
		ByteArray output = opcode(DFUOpcode::START_DFU);
		output.push_back(static_cast<uint8_t>(mode));
		return output;
	}
	// Packet characteristic payload following START_DFU
	static inline ByteArray image_sizes(uint32_t softdevice_size, uint32_t bootloader_size, uint32_t application_size) {
		ByteArray output;
		append_u32(output, softdevice_size);
		append_u32(output, bootloader_size);
		append_u32(output, application_size);
		return output;
	}
	static inline ByteArray init_params(DFUInitPacketControl control) {
		ByteArray output = opcode(DFUOpcode::INIT_DFU_PARAMS);
		output.push_back(static_cast<uint8_t>(control));
		return output;
	}
	static inline ByteArray packet_receipt_request(uint16_t interval) {
		ByteArray output = opcode(DFUOpcode::PACKET_RECEIPT_NOTIFICATION_REQUEST);
		append_u16(output, interval);
		return output;
	}
	static inline ByteArray receive_firmware_image() {
		return opcode(DFUOpcode::RECEIVE_FIRMWARE_IMAGE);
	}
	static inline ByteArray validate() {
		return opcode(DFUOpcode::VALIDATE);
	}
	static inline ByteArray activate_and_reset() {
		return opcode(DFUOpcode::ACTIVATE_AND_RESET);
	}
	static inline ByteArray system_reset() {
		return opcode(DFUOpcode::SYSTEM_RESET);
	}
};


class LegacyDFUDecoder {
public:
	static inline DFUNotification decode(const ByteArray& data) {
		DFUNotification notification = {};

		if (data.empty())
			throw ErrorCode::DFU_PROTOCOL_ERROR;

		if (data[0] == static_cast<uint8_t>(DFUOpcode::RESPONSE)) {
			if (data.size() < 3)
				throw ErrorCode::DFU_PROTOCOL_ERROR;
			notification.type = DFUNotificationType::RESPONSE;
			notification.response.request_opcode = static_cast<DFUOpcode>(data[1]);
			notification.response.result = static_cast<DFUResultCode>(data[2]);
		} else if (data[0] == static_cast<uint8_t>(DFUOpcode::PACKET_RECEIPT_NOTIFICATION)) {
			if (data.size() < 5)
				throw ErrorCode::DFU_PROTOCOL_ERROR;
			notification.type = DFUNotificationType::PACKET_RECEIPT;
			notification.bytes_received = (uint32_t)data[1] | ((uint32_t)data[2] << 8) |
										  ((uint32_t)data[3] << 16) | ((uint32_t)data[4] << 24);
		} else {
			throw ErrorCode::DFU_PROTOCOL_ERROR;
		}

		return notification;
	}
};
