#pragma once

enum ErrorCode {
	DFU_DEVICE_NOT_FOUND,
	DFU_TIMEOUT,
	DFU_PROTOCOL_ERROR,
	DFU_CRC_OR_COUNT_MISMATCH,
	DFU_DEVICE_REJECTED,
	DFU_TRANSPORT_ERROR,
	DFU_CANCELLED,
	DFU_COMMAND_PENDING,
	DFU_INVALID_FRAME_SIZE,
	FIRMWARE_PACKAGE_NOT_FOUND,
	FIRMWARE_PACKAGE_INVALID,
	CONFIG_VALUE_OUT_OF_RANGE,
	CLI_BAD_ARGUMENT
};

static constexpr const char *error_code_name[] = {
	"DEVICE_NOT_FOUND",
	"TIMEOUT",
	"PROTOCOL_ERROR",
	"CRC_OR_COUNT_MISMATCH",
	"DEVICE_REJECTED",
	"TRANSPORT_ERROR",
	"CANCELLED",
	"COMMAND_PENDING",
	"INVALID_FRAME_SIZE",
	"FIRMWARE_PACKAGE_NOT_FOUND",
	"FIRMWARE_PACKAGE_INVALID",
	"CONFIG_VALUE_OUT_OF_RANGE",
	"BAD_ARGUMENT"
};
