#include <cctype>
#include <functional>

#include "reconnection_manager.hpp"
#include "legacy_dfu_protocol.hpp"

#include "fake_timer.hpp"
#include "fake_ble_central.hpp"

#include "CppUTest/TestHarness.h"


TEST_GROUP(Reconnection)
{
	FakeTimer *timer;
	FakeBLECentral *central;
	BootloaderAliasConfig aliases;
	ReconnectionManager *reconnection;
	BLEDevice app;
	ErrorCode caught;

	void setup() {
		timer = new FakeTimer;
		timer->start();
		central = new FakeBLECentral(timer);
		aliases = BootloaderAliasConfig();
		reconnection = new ReconnectionManager(*central, *timer, aliases, 5000);
		app.name = "MyDevice";
		app.address = "AA:BB:CC:DD:EE:01";
	}

	void teardown() {
		delete reconnection;
		delete central;
		delete timer;
	}

	bool raised(std::function<void()> f) {
		try {
			f();
		} catch (ErrorCode e) {
			caught = e;
			return true;
		}
		return false;
	}

	BLEDevice device(const std::string& name, const std::string& address) {
		BLEDevice d;
		d.name = name;
		d.address = address;
		return d;
	}
};


TEST(Reconnection, FindsBootloaderBySuffixedName)
{
	central->advertising.push_back(device("Other", "11:22:33:44:55:66"));
	central->advertising.push_back(device("MyDeviceDfuTarg", "11:22:33:44:55:77"));

	BLEDevice found = reconnection->await_bootloader(app, 20000);

	STRCMP_EQUAL("MyDeviceDfuTarg", found.name.c_str());
	CHECK_EQUAL(1, central->scan_windows.size());
}

TEST(Reconnection, FindsBootloaderAtIncrementedAddress)
{
	central->advertising.push_back(device("", "AA:BB:CC:DD:EE:02"));

	BLEDevice found = reconnection->await_bootloader(app, 20000);

	STRCMP_EQUAL("AA:BB:CC:DD:EE:02", found.address.c_str());
}

TEST(Reconnection, IncrementedAddressWrapsLastOctet)
{
	app.address = "aa:bb:cc:dd:ee:ff";

	CHECK_TRUE(reconnection->is_bootloader_of(app, device("", "AA:BB:CC:DD:EE:00")));
	CHECK_FALSE(reconnection->is_bootloader_of(app, device("", "AA:BB:CC:DD:EF:00")));
}

TEST(Reconnection, MatchesUnchangedIdentityAndKnownAliases)
{
	CHECK_TRUE(reconnection->is_bootloader_of(app, device("", "aa:bb:cc:dd:ee:01")));
	CHECK_TRUE(reconnection->is_bootloader_of(app, device("MyDevice", "11:22:33:44:55:66")));
	CHECK_TRUE(reconnection->is_bootloader_of(app, device("MyDevice_DFU", "11:22:33:44:55:66")));
	CHECK_TRUE(reconnection->is_bootloader_of(app, device("DfuTarg", "11:22:33:44:55:66")));
	CHECK_FALSE(reconnection->is_bootloader_of(app, device("Other", "11:22:33:44:55:66")));
}

TEST(Reconnection, MatchesLegacyDfuServiceWhenEnabled)
{
	BLEDevice bootloader = device("", "11:22:33:44:55:66");
	bootloader.service_uuids.push_back(LegacyDFUCharacteristic::SERVICE);

	CHECK_TRUE(reconnection->is_bootloader_of(app, bootloader));

	aliases.match_service_uuid = false;
	CHECK_FALSE(reconnection->is_bootloader_of(app, bootloader));
}

TEST(Reconnection, ServiceUuidMatchIgnoresCase)
{
	aliases.match_incremented_address = false;
	std::string upper(LegacyDFUCharacteristic::SERVICE);
	for (auto &c : upper)
		c = std::toupper(static_cast<unsigned char>(c));
	BLEDevice bootloader = device("", "11:22:33:44:55:66");
	bootloader.service_uuids.push_back(upper);

	CHECK_TRUE(reconnection->is_bootloader_of(app, bootloader));
}

TEST(Reconnection, ExtraAliasNameIsMatched)
{
	aliases.names.push_back("Bootloader");

	CHECK_TRUE(reconnection->is_bootloader_of(app, device("Bootloader", "11:22:33:44:55:66")));
}

TEST(Reconnection, RescansUntilTimeoutThenGivesUp)
{
	CHECK_TRUE(raised([&]() { reconnection->await_bootloader(app, 12000); }));

	CHECK_EQUAL(ErrorCode::DFU_DEVICE_NOT_FOUND, caught);
	CHECK_EQUAL(3, central->scan_windows.size());
	CHECK_EQUAL(5000, central->scan_windows[0]);
	CHECK_EQUAL(5000, central->scan_windows[1]);
	CHECK_EQUAL(2000, central->scan_windows[2]);
}

TEST(Reconnection, CancelStopsScanning)
{
	reconnection->cancel();

	CHECK_TRUE(raised([&]() { reconnection->await_bootloader(app, 20000); }));
	CHECK_EQUAL(ErrorCode::DFU_CANCELLED, caught);
	CHECK_EQUAL(0, central->scan_windows.size());
}
