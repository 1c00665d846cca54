#pragma once

#include <cstdint>

enum class DFUStateId : uint8_t {
	IDLE,
	APP_CONNECTED,
	BOOTLOADER_JUMP_SENT,
	WAITING_REBOOT,
	BOOTLOADER_CONNECTED,
	DFU_STARTED,
	SIZE_SENT,
	INIT_SENT,
	IMAGE_STREAMING,
	IMAGE_COMPLETE,
	VALIDATED,
	ACTIVATED,
	FAILED
};

static constexpr const char *dfu_state_name[] = {
	"Idle",
	"AppConnected",
	"BootloaderJumpSent",
	"WaitingReboot",
	"BootloaderConnected",
	"DfuStarted",
	"SizeSent",
	"InitSent",
	"ImageStreaming",
	"ImageComplete",
	"Validated",
	"Activated",
	"Failed"
};

static inline const char *dfu_state_str(DFUStateId state) {
	return dfu_state_name[static_cast<unsigned int>(state)];
}
