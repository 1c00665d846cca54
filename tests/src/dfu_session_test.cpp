#include <vector>

#include "dfu_session.hpp"

#include "fake_timer.hpp"
#include "fake_ble_central.hpp"
#include "fake_dfu_bootloader.hpp"
#include "fake_dfu_listener.hpp"

#include "CppUTest/TestHarness.h"
#include "CppUTestExt/MockSupport.h"


// Cancels the session on reaching a given state
class CancellingListener : public DFUEventListener {
public:
	DFUSession *session = nullptr;
	DFUStateId cancel_in = DFUStateId::IMAGE_STREAMING;
	void react(DFUEventStateChanged const& e) override {
		if (e.to == cancel_in)
			session->cancel();
	}
};

// Tries to start a second session while the first is running
class ReentrantListener : public DFUEventListener {
public:
	DFUSession *other = nullptr;
	bool rejected = false;
	void react(DFUEventStateChanged const& e) override {
		if (e.to != DFUStateId::APP_CONNECTED)
			return;
		try {
			other->run();
		} catch (ErrorCode error) {
			rejected = (error == ErrorCode::DFU_COMMAND_PENDING);
		}
	}
};


TEST_GROUP(DFUSession)
{
	FakeTimer *timer;
	FakeBLECentral *central;
	FakeDFUBootloader *bootloader;
	FakeDFUListener *listener;
	DFUConfig config;
	FirmwarePackage package;
	BLEDevice app_adv;
	BLEDevice bootloader_adv;
	bool bootloader_appears;

	void setup() {
		mock().ignoreOtherCalls();

		timer = new FakeTimer;
		timer->start();
		central = new FakeBLECentral(timer);
		bootloader = new FakeDFUBootloader;
		bootloader->timer = timer;
		listener = new FakeDFUListener;
		bootloader_appears = true;

		config = DFUConfig();
		config.identifiers = { "MyDevice" };
		config.transfer.prn_interval = 2;

		package.image.clear();
		for (unsigned int i = 0; i < 100; i++)
			package.image.push_back(i);
		package.init_data = ByteArray(14, 0x55);

		app_adv.name = "MyDevice";
		app_adv.address = "AA:BB:CC:DD:EE:01";
		bootloader_adv.name = "MyDeviceDfuTarg";
		bootloader_adv.address = "AA:BB:CC:DD:EE:02";
		central->advertising = { app_adv };

		central->on_connect = [this](FakeBLEConnection& c) {
			if (c.device().address == bootloader_adv.address)
				bootloader->install(c);
			else
				install_application(c);
		};
	}

	void teardown() {
		delete listener;
		delete bootloader;
		delete central;
		delete timer;
		mock().checkExpectations();
		mock().clear();
	}

	// Acknowledges the jump, then reboots into the bootloader
	void install_application(FakeBLEConnection& conn) {
		conn.on_write = [this](FakeBLEConnection& c, const std::string& characteristic, const ByteArray& data) {
			if (characteristic != LegacyDFUCharacteristic::CONTROL_POINT || data[0] != 0x01)
				return;
			c.notify(LegacyDFUCharacteristic::CONTROL_POINT, { 0x10, 0x01, 0x01 });
			central->advertising.clear();
			if (bootloader_appears)
				central->advertising.push_back(bootloader_adv);
			c.drop_link();
		};
	}

	DFUSessionResult run() {
		DFUSession session(*central, *timer, config, package);
		session.subscribe(*listener);
		return session.run();
	}
};


TEST(DFUSession, UpdatesDeviceFoundByName)
{
	mock().expectOneCall("delay_ms").withParameter("ms", 1000u);
	mock().expectOneCall("delay_ms").withParameter("ms", 400u);

	DFUSessionResult result = run();

	CHECK_TRUE(result.success);
	std::vector<DFUStateId> expected = {
		DFUStateId::APP_CONNECTED,
		DFUStateId::BOOTLOADER_JUMP_SENT,
		DFUStateId::WAITING_REBOOT,
		DFUStateId::BOOTLOADER_CONNECTED,
		DFUStateId::DFU_STARTED,
		DFUStateId::SIZE_SENT,
		DFUStateId::INIT_SENT,
		DFUStateId::IMAGE_STREAMING,
		DFUStateId::IMAGE_COMPLETE,
		DFUStateId::VALIDATED,
		DFUStateId::ACTIVATED
	};
	CHECK_TRUE(listener->visited() == expected);
	CHECK_EQUAL(2, central->connected_to.size());
	STRCMP_EQUAL("MyDevice", central->connected_to[0].name.c_str());
	STRCMP_EQUAL("MyDeviceDfuTarg", central->connected_to[1].name.c_str());
	CHECK_EQUAL(2, listener->devices.size());
	CHECK_FALSE(listener->devices[0].bootloader);
	CHECK_TRUE(listener->devices[1].bootloader);
	CHECK_TRUE(bootloader->image == package.image);
	CHECK_TRUE(bootloader->init_data == package.init_data);
	CHECK_TRUE(bootloader->activated);
	CHECK_EQUAL(0, listener->failures.size());
	CHECK_EQUAL(0, timer->num_schedules());
}

TEST(DFUSession, ConnectsToAddressWithoutScanning)
{
	config.identifiers = { "aa:bb:cc:dd:ee:01" };

	DFUSessionResult result = run();

	CHECK_TRUE(result.success);
	STRCMP_EQUAL("AA:BB:CC:DD:EE:01", central->connected_to[0].address.c_str());
	// Only the bootloader was scanned for
	CHECK_EQUAL(1, central->scan_windows.size());
}

TEST(DFUSession, ScanCanBeForcedForAddress)
{
	config.identifiers = { "AA:BB:CC:DD:EE:01" };
	config.force_scan = true;

	DFUSessionResult result = run();

	CHECK_TRUE(result.success);
	CHECK_EQUAL(2, central->scan_windows.size());
}

TEST(DFUSession, AnyOfSeveralTargetsIsAccepted)
{
	config.identifiers = { "Absent", "MyDevice" };

	DFUSessionResult result = run();

	CHECK_TRUE(result.success);
}

TEST(DFUSession, MissingDeviceFailsInIdle)
{
	central->advertising.clear();

	DFUSessionResult result = run();

	CHECK_FALSE(result.success);
	CHECK_TRUE(result.failed_state == DFUStateId::IDLE);
	CHECK_EQUAL(ErrorCode::DFU_DEVICE_NOT_FOUND, result.error);
	CHECK_EQUAL(0, central->connected_to.size());
	CHECK_EQUAL(1, listener->failures.size());
	CHECK_TRUE(listener->visited().back() == DFUStateId::FAILED);
}

TEST(DFUSession, WaitModeKeepsScanningUntilDeviceAppears)
{
	config.wait_for_device = true;
	central->advertising.clear();
	timer->add_schedule([this]() { central->advertising.push_back(app_adv); },
		3 * config.timeouts.scan_ms);

	DFUSessionResult result = run();

	CHECK_TRUE(result.success);
	// Three empty windows, the one that finds the device and the bootloader scan
	CHECK_EQUAL(5, central->scan_windows.size());
	STRCMP_EQUAL("MyDevice", central->connected_to[0].name.c_str());
}

TEST(DFUSession, EmptyImageFailsBeforeConnecting)
{
	package.image.clear();

	DFUSessionResult result = run();

	CHECK_FALSE(result.success);
	CHECK_EQUAL(ErrorCode::FIRMWARE_PACKAGE_INVALID, result.error);
	CHECK_EQUAL(0, central->scan_windows.size());
}

TEST(DFUSession, BootloaderThatNeverAdvertisesFailsAfterReboot)
{
	bootloader_appears = false;

	DFUSessionResult result = run();

	CHECK_FALSE(result.success);
	CHECK_TRUE(result.failed_state == DFUStateId::WAITING_REBOOT);
	CHECK_EQUAL(ErrorCode::DFU_DEVICE_NOT_FOUND, result.error);
	// One scan for the application, then the reconnect window in scan sized slices
	CHECK_EQUAL(5, central->scan_windows.size());
}

TEST(DFUSession, RejectedSizeFailsWithDetail)
{
	bootloader->size_result = DFUResultCode::DATA_SIZE_EXCEEDS_LIMIT;

	DFUSessionResult result = run();

	CHECK_FALSE(result.success);
	CHECK_TRUE(result.failed_state == DFUStateId::DFU_STARTED);
	CHECK_EQUAL(ErrorCode::DFU_DEVICE_REJECTED, result.error);
	CHECK_TRUE(result.detail.opcode == DFUOpcode::START_DFU);
	CHECK_TRUE(result.detail.result == DFUResultCode::DATA_SIZE_EXCEEDS_LIMIT);
	CHECK_EQUAL(1, bootloader->resets);
	CHECK_EQUAL(1, listener->failures.size());
	CHECK_TRUE(listener->failures[0].state == DFUStateId::DFU_STARTED);
}

TEST(DFUSession, ReceiptMismatchFailsWhileStreaming)
{
	bootloader->receipt_error = 2;

	DFUSessionResult result = run();

	CHECK_FALSE(result.success);
	CHECK_TRUE(result.failed_state == DFUStateId::IMAGE_STREAMING);
	CHECK_EQUAL(ErrorCode::DFU_CRC_OR_COUNT_MISMATCH, result.error);
	CHECK_EQUAL(40, result.detail.expected_bytes);
	CHECK_EQUAL(42, result.detail.reported_bytes);
	CHECK_FALSE(bootloader->activated);
}

TEST(DFUSession, CancelBeforeRunFailsImmediately)
{
	DFUSession session(*central, *timer, config, package);
	session.subscribe(*listener);
	session.cancel();

	DFUSessionResult result = session.run();

	CHECK_FALSE(result.success);
	CHECK_TRUE(result.failed_state == DFUStateId::IDLE);
	CHECK_EQUAL(ErrorCode::DFU_CANCELLED, result.error);
	CHECK_EQUAL(0, central->connected_to.size());
}

TEST(DFUSession, CancelDuringUpdateStopsBeforeImage)
{
	DFUSession session(*central, *timer, config, package);
	CancellingListener canceller;
	canceller.session = &session;
	session.subscribe(canceller);

	DFUSessionResult result = session.run();

	CHECK_FALSE(result.success);
	CHECK_TRUE(result.failed_state == DFUStateId::IMAGE_STREAMING);
	CHECK_EQUAL(ErrorCode::DFU_CANCELLED, result.error);
	CHECK_EQUAL(0, bootloader->image.size());
}

TEST(DFUSession, OnlyOneSessionRunsAtATime)
{
	DFUSession first(*central, *timer, config, package);
	DFUSession second(*central, *timer, config, package);
	ReentrantListener reentrant;
	reentrant.other = &second;
	first.subscribe(reentrant);

	DFUSessionResult result = first.run();

	CHECK_TRUE(reentrant.rejected);
	CHECK_TRUE(result.success);
}
