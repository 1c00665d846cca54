#include <functional>

#include "transfer_engine.hpp"

#include "fake_timer.hpp"
#include "fake_ble_central.hpp"
#include "fake_dfu_bootloader.hpp"
#include "fake_dfu_listener.hpp"

#include "CppUTest/TestHarness.h"
#include "CppUTestExt/MockSupport.h"


TEST_GROUP(TransferEngine)
{
	FakeTimer *timer;
	DFUEventNotifier *notifier;
	FakeDFUListener *listener;
	ResponseWaiter *waiter;
	DFUConfig config;
	TransferEngine *engine;
	FakeBLEConnection *conn;
	FakeDFUBootloader bootloader;
	FirmwarePackage package;
	ErrorCode caught;

	void setup() {
		timer = new FakeTimer;
		timer->start();
		notifier = new DFUEventNotifier;
		listener = new FakeDFUListener;
		notifier->subscribe(*listener);
		waiter = new ResponseWaiter(*timer, *notifier);
		config = DFUConfig();
		config.transfer.start_delay_ms = 0;
		engine = new TransferEngine(*waiter, *notifier, config.transfer, config.timeouts);
		conn = new FakeBLEConnection;
		bootloader = FakeDFUBootloader();
		bootloader.timer = timer;
		bootloader.install(*conn);
		package.init_data = ByteArray(14, 0xAA);
	}

	void teardown() {
		delete conn;
		delete engine;
		delete waiter;
		delete listener;
		delete notifier;
		delete timer;
		mock().checkExpectations();
		mock().clear();
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

	void make_image(unsigned int n) {
		package.image.clear();
		for (unsigned int i = 0; i < n; i++)
			package.image.push_back(i & 0xFF);
	}

	void start_and_prepare() {
		engine->start_dfu(*conn);
		engine->send_image_sizes(*conn, package);
		engine->send_init_packet(*conn, package);
		engine->start_image_transfer(*conn);
	}

	void run_transfer() {
		start_and_prepare();
		engine->stream_image(*conn, package);
		engine->await_image_complete();
		engine->validate(*conn);
		engine->activate(*conn);
	}

	void check_write(unsigned int i, const std::string& characteristic, const ByteArray& data) {
		CHECK_TRUE(i < conn->writes.size());
		CHECK_TRUE(conn->writes[i].characteristic == characteristic);
		CHECK_TRUE(conn->writes[i].data == data);
	}

	unsigned int image_writes() const {
		// Size and init packets precede the image on the packet characteristic
		return conn->count_writes(LegacyDFUCharacteristic::PACKET) - 2;
	}
};


TEST(TransferEngine, FullTransferWithoutReceipts)
{
	config.transfer.prn_interval = 0;
	make_image(40);

	run_transfer();

	const std::string& CP = LegacyDFUCharacteristic::CONTROL_POINT;
	const std::string& PKT = LegacyDFUCharacteristic::PACKET;
	CHECK_EQUAL(10, conn->writes.size());
	check_write(0, CP, { 0x01, 0x04 });
	check_write(1, PKT, { 0, 0, 0, 0, 0, 0, 0, 0, 40, 0, 0, 0 });
	check_write(2, CP, { 0x02, 0x00 });
	check_write(3, PKT, package.init_data);
	check_write(4, CP, { 0x02, 0x01 });
	check_write(5, CP, { 0x03 });
	check_write(6, PKT, ByteArray(package.image.begin(), package.image.begin() + 20));
	check_write(7, PKT, ByteArray(package.image.begin() + 20, package.image.end()));
	check_write(8, CP, { 0x04 });
	check_write(9, CP, { 0x05 });

	CHECK_TRUE(bootloader.image == package.image);
	CHECK_TRUE(bootloader.activated);
	CHECK_EQUAL(40, engine->bytes_sent());
	CHECK_EQUAL(0, engine->receipts());
	CHECK_EQUAL(0, timer->num_schedules());
}

TEST(TransferEngine, FullTransferWithReceipts)
{
	config.transfer.prn_interval = 2;
	make_image(100);

	run_transfer();

	check_write(5, LegacyDFUCharacteristic::CONTROL_POINT, { 0x08, 0x02, 0x00 });
	check_write(6, LegacyDFUCharacteristic::CONTROL_POINT, { 0x03 });
	CHECK_EQUAL(5, image_writes());
	CHECK_EQUAL(2, engine->receipts());
	CHECK_EQUAL(2, listener->receipts.size());
	CHECK_EQUAL(40, listener->receipts[0].bytes_reported);
	CHECK_EQUAL(80, listener->receipts[1].bytes_reported);
	CHECK_EQUAL(2, bootloader.prn_interval);
	CHECK_TRUE(bootloader.image == package.image);
}

TEST(TransferEngine, ReceiptOnFinalChunkIsConsumed)
{
	config.transfer.prn_interval = 2;
	make_image(80);

	run_transfer();

	CHECK_EQUAL(2, engine->receipts());
	CHECK_EQUAL(0, listener->strays.size());
}

TEST(TransferEngine, StartDelayIsAppliedBeforeSizes)
{
	config.transfer.start_delay_ms = 400;
	mock().expectOneCall("delay_ms").withParameter("ms", 400u);
	make_image(20);

	engine->start_dfu(*conn);

	CHECK_EQUAL(1, conn->writes.size());
}

TEST(TransferEngine, InterPacketDelaySkipsLastChunk)
{
	config.transfer.prn_interval = 0;
	config.transfer.inter_packet_delay_ms = 5;
	mock().expectNCalls(2, "delay_ms").withParameter("ms", 5u);
	make_image(60);

	run_transfer();
}

TEST(TransferEngine, FrameSizeIsLimitedByLink)
{
	config.transfer.prn_interval = 0;
	conn->m_max_write_length = 10;
	package.init_data = ByteArray(10, 0xAA);
	make_image(40);

	run_transfer();

	CHECK_EQUAL(4, image_writes());
	CHECK_TRUE(bootloader.image == package.image);
}

TEST(TransferEngine, ProgressReportedPerPercent)
{
	config.transfer.prn_interval = 0;
	make_image(40);

	run_transfer();

	CHECK_EQUAL(2, listener->progress.size());
	CHECK_EQUAL(20, listener->progress[0].bytes_sent);
	CHECK_EQUAL(40, listener->progress[1].bytes_sent);
	CHECK_EQUAL(40, listener->progress[1].total_bytes);
}

TEST(TransferEngine, ReceiptCountMismatchStopsTransfer)
{
	config.transfer.prn_interval = 2;
	bootloader.receipt_error = -1;
	make_image(100);

	start_and_prepare();
	CHECK_TRUE(raised([&]() { engine->stream_image(*conn, package); }));

	CHECK_EQUAL(ErrorCode::DFU_CRC_OR_COUNT_MISMATCH, caught);
	CHECK_EQUAL(2, image_writes());
	DFUErrorDetail detail = waiter->error_detail();
	CHECK_EQUAL(40, detail.expected_bytes);
	CHECK_EQUAL(39, detail.reported_bytes);
	CHECK_EQUAL(0, timer->num_schedules());
}

TEST(TransferEngine, MissingReceiptTimesOut)
{
	config.transfer.prn_interval = 2;
	bootloader.silent_receipt_ms = config.timeouts.receipt_ms;
	make_image(100);

	start_and_prepare();
	CHECK_TRUE(raised([&]() { engine->stream_image(*conn, package); }));

	CHECK_EQUAL(ErrorCode::DFU_TIMEOUT, caught);
	CHECK_EQUAL(2, image_writes());
}

TEST(TransferEngine, RejectedSizeResetsDevice)
{
	bootloader.size_result = DFUResultCode::DATA_SIZE_EXCEEDS_LIMIT;
	make_image(40);

	engine->start_dfu(*conn);
	CHECK_TRUE(raised([&]() { engine->send_image_sizes(*conn, package); }));

	CHECK_EQUAL(ErrorCode::DFU_DEVICE_REJECTED, caught);
	CHECK_TRUE(waiter->error_detail().result == DFUResultCode::DATA_SIZE_EXCEEDS_LIMIT);
	CHECK_EQUAL(1, bootloader.resets);
	check_write(conn->writes.size() - 1, LegacyDFUCharacteristic::CONTROL_POINT, { 0x06 });
}

TEST(TransferEngine, UnansweredSizeTimesOutAndResetsDevice)
{
	bootloader.silent_size_ms = config.timeouts.size_response_ms;
	make_image(40);

	engine->start_dfu(*conn);
	CHECK_TRUE(raised([&]() { engine->send_image_sizes(*conn, package); }));

	CHECK_EQUAL(ErrorCode::DFU_TIMEOUT, caught);
	CHECK_EQUAL(1, bootloader.resets);
}

TEST(TransferEngine, RejectedInitPacketFails)
{
	bootloader.init_result = DFUResultCode::OPERATION_FAILED;
	make_image(40);

	engine->start_dfu(*conn);
	engine->send_image_sizes(*conn, package);
	CHECK_TRUE(raised([&]() { engine->send_init_packet(*conn, package); }));

	CHECK_EQUAL(ErrorCode::DFU_DEVICE_REJECTED, caught);
	CHECK_EQUAL(0, bootloader.resets);
}

TEST(TransferEngine, ImageRejectedAtStartSendsNoPackets)
{
	config.transfer.prn_interval = 0;
	bootloader.image_start_result = DFUResultCode::INVALID_STATE;
	make_image(40);

	start_and_prepare();
	CHECK_TRUE(raised([&]() { engine->stream_image(*conn, package); }));

	CHECK_EQUAL(ErrorCode::DFU_DEVICE_REJECTED, caught);
	CHECK_EQUAL(0, image_writes());
	CHECK_TRUE(waiter->error_detail().opcode == DFUOpcode::RECEIVE_FIRMWARE_IMAGE);
}

TEST(TransferEngine, RejectionInPlaceOfReceiptFailsAtOnce)
{
	config.transfer.prn_interval = 2;
	bootloader.reject_at_packet = 2;
	make_image(100);

	start_and_prepare();
	CHECK_TRUE(raised([&]() { engine->stream_image(*conn, package); }));

	CHECK_EQUAL(ErrorCode::DFU_DEVICE_REJECTED, caught);
	CHECK_EQUAL(2, image_writes());
	CHECK_TRUE(waiter->error_detail().result == DFUResultCode::DATA_SIZE_EXCEEDS_LIMIT);
	CHECK_EQUAL(0, timer->num_schedules());
}

TEST(TransferEngine, CrcErrorOnValidateIsMismatch)
{
	config.transfer.prn_interval = 0;
	bootloader.validate_result = DFUResultCode::CRC_ERROR;
	make_image(40);

	start_and_prepare();
	engine->stream_image(*conn, package);
	engine->await_image_complete();
	CHECK_TRUE(raised([&]() { engine->validate(*conn); }));

	CHECK_EQUAL(ErrorCode::DFU_CRC_OR_COUNT_MISMATCH, caught);
	CHECK_TRUE(waiter->error_detail().result == DFUResultCode::CRC_ERROR);
}

TEST(TransferEngine, LinkLostDuringActivateWriteIsSuccess)
{
	config.transfer.prn_interval = 0;
	make_image(40);

	start_and_prepare();
	engine->stream_image(*conn, package);
	engine->await_image_complete();
	engine->validate(*conn);

	conn->on_write = [](FakeBLEConnection& c, const std::string&, const ByteArray&) {
		c.drop_link();
		throw ErrorCode::DFU_TRANSPORT_ERROR;
	};
	engine->activate(*conn);
}

TEST(TransferEngine, LinkLossDuringStreamingIsTransportError)
{
	config.transfer.prn_interval = 0;
	make_image(100);

	start_and_prepare();
	unsigned int n = 0;
	conn->on_write = [&n](FakeBLEConnection& c, const std::string&, const ByteArray&) {
		if (++n == 3)
			c.drop_link();
	};
	CHECK_TRUE(raised([&]() { engine->stream_image(*conn, package); }));

	CHECK_EQUAL(ErrorCode::DFU_TRANSPORT_ERROR, caught);
	CHECK_EQUAL(3, engine->bytes_sent() / 20);
}
