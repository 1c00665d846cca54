#include <thread>

#include "sim_ble_central.hpp"
#include "ble_address.hpp"
#include "crc16.hpp"
#include "error.hpp"
#include "debug.hpp"

static constexpr unsigned int SIM_POLL_MS = 20;

SimDFUPeripheral::SimDFUPeripheral(const std::string& name, const std::string& address, unsigned int reboot_ms, SimDFUFaults faults) :
	m_name(name), m_address(BLEAddress::normalise(address)), m_reboot_ms(reboot_ms), m_faults(faults),
	m_mode(Mode::APPLICATION), m_next_mode(Mode::APPLICATION), m_connected(false),
	m_state(DFUState::IDLE), m_image_size(0), m_prn_interval(0), m_packets_since_receipt(0), m_num_updates(0) {}

SimDFUPeripheral::Mode SimDFUPeripheral::mode() {
	if (m_mode == Mode::REBOOTING && std::chrono::steady_clock::now() >= m_ready_at)
		m_mode = m_next_mode;
	return m_mode;
}

BLEDevice SimDFUPeripheral::advertisement() const {
	BLEDevice device;
	if (m_mode == Mode::BOOTLOADER) {
		device.name = m_name + "DfuTarg";
		device.address = BLEAddress::increment(m_address);
		device.service_uuids.push_back(LegacyDFUCharacteristic::SERVICE);
	} else {
		device.name = m_name;
		device.address = m_address;
	}
	device.rssi = -50;
	return device;
}

void SimDFUPeripheral::connect(BLENotificationHandler notify, std::function<void()> drop_link) {
	m_notify = notify;
	m_drop_link = drop_link;
	m_connected = true;
	m_state = DFUState::IDLE;
}

void SimDFUPeripheral::disconnect() {
	m_notify = nullptr;
	m_drop_link = nullptr;
	m_connected = false;
}

void SimDFUPeripheral::notify(const ByteArray& data) {
	if (m_notify)
		m_notify(data);
}

void SimDFUPeripheral::respond(DFUOpcode op, DFUResultCode result) {
	notify(ByteArray { static_cast<uint8_t>(DFUOpcode::RESPONSE), static_cast<uint8_t>(op), static_cast<uint8_t>(result) });
}

void SimDFUPeripheral::reboot(Mode next) {
	auto drop_link = m_drop_link;
	disconnect();
	m_mode = Mode::REBOOTING;
	m_next_mode = next;
	m_ready_at = std::chrono::steady_clock::now() + std::chrono::milliseconds(m_reboot_ms);
	DEBUG_TRACE("SimDFUPeripheral: %s rebooting", m_name.c_str());
	if (drop_link)
		drop_link();
}

void SimDFUPeripheral::write(const std::string& characteristic, const ByteArray& data) {
	if (data.empty())
		return;

	if (m_mode == Mode::APPLICATION) {
		if (characteristic == LegacyDFUCharacteristic::CONTROL_POINT)
			application_control(data);
	} else if (m_mode == Mode::BOOTLOADER) {
		if (characteristic == LegacyDFUCharacteristic::CONTROL_POINT)
			bootloader_control(data);
		else if (characteristic == LegacyDFUCharacteristic::PACKET)
			bootloader_packet(data);
	}
}

void SimDFUPeripheral::application_control(const ByteArray& data) {
	if (data[0] != static_cast<uint8_t>(DFU_ENTER_BOOTLOADER)) {
		respond(static_cast<DFUOpcode>(data[0]), DFUResultCode::NOT_SUPPORTED);
		return;
	}
	if (!m_faults.silent_jump)
		respond(DFU_ENTER_BOOTLOADER, DFUResultCode::SUCCESS);
	reboot(Mode::BOOTLOADER);
}

void SimDFUPeripheral::bootloader_control(const ByteArray& data) {
	DFUOpcode op = static_cast<DFUOpcode>(data[0]);

	switch (op) {
	case DFUOpcode::START_DFU:
		if (m_state != DFUState::IDLE)
			respond(op, DFUResultCode::INVALID_STATE);
		else if (data.size() < 2 || data[1] != static_cast<uint8_t>(DFUUploadMode::APPLICATION))
			respond(op, DFUResultCode::NOT_SUPPORTED);
		else
			m_state = DFUState::WAIT_SIZES;
		break;

	case DFUOpcode::INIT_DFU_PARAMS:
		if (data.size() >= 2 && data[1] == static_cast<uint8_t>(DFUInitPacketControl::RECEIVE) && m_state == DFUState::READY) {
			m_init_data.clear();
			m_state = DFUState::INIT;
		} else if (data.size() >= 2 && data[1] == static_cast<uint8_t>(DFUInitPacketControl::COMPLETE) && m_state == DFUState::INIT) {
			m_state = DFUState::INIT_COMPLETE;
			respond(op, DFUResultCode::SUCCESS);
		} else {
			respond(op, DFUResultCode::INVALID_STATE);
		}
		break;

	case DFUOpcode::PACKET_RECEIPT_NOTIFICATION_REQUEST:
		if (data.size() >= 3)
			m_prn_interval = data[1] | (data[2] << 8);
		break;

	case DFUOpcode::RECEIVE_FIRMWARE_IMAGE:
		if (m_state != DFUState::INIT_COMPLETE) {
			respond(op, DFUResultCode::INVALID_STATE);
		} else {
			m_image.clear();
			m_packets_since_receipt = 0;
			m_state = DFUState::RECEIVING;
		}
		break;

	case DFUOpcode::VALIDATE:
		if (m_state != DFUState::RECEIVED) {
			respond(op, DFUResultCode::INVALID_STATE);
		} else {
			// The legacy init packet ends with the CRC16 of the image
			unsigned int n = m_init_data.size();
			if (n >= 2 && CRC16::checksum(m_image) != (m_init_data[n-2] | (m_init_data[n-1] << 8))) {
				respond(op, DFUResultCode::CRC_ERROR);
			} else {
				m_state = DFUState::VALIDATED;
				respond(op, DFUResultCode::SUCCESS);
			}
		}
		break;

	case DFUOpcode::ACTIVATE_AND_RESET:
		if (m_state != DFUState::VALIDATED) {
			respond(op, DFUResultCode::INVALID_STATE);
		} else {
			m_installed_image = m_image;
			m_num_updates++;
			reboot(Mode::APPLICATION);
		}
		break;

	case DFUOpcode::SYSTEM_RESET:
		reboot(Mode::APPLICATION);
		break;

	default:
		respond(op, DFUResultCode::NOT_SUPPORTED);
		break;
	}
}

void SimDFUPeripheral::bootloader_packet(const ByteArray& data) {
	switch (m_state) {
	case DFUState::WAIT_SIZES:
		if (data.size() != 12) {
			respond(DFUOpcode::START_DFU, DFUResultCode::OPERATION_FAILED);
			m_state = DFUState::IDLE;
			break;
		}
		m_image_size = data[8] | (data[9] << 8) | (data[10] << 16) | ((uint32_t)data[11] << 24);
		if (m_faults.reject_size || m_image_size == 0 || m_image_size > MAX_IMAGE_SIZE) {
			respond(DFUOpcode::START_DFU, DFUResultCode::DATA_SIZE_EXCEEDS_LIMIT);
			m_state = DFUState::IDLE;
		} else {
			m_state = DFUState::READY;
			respond(DFUOpcode::START_DFU, DFUResultCode::SUCCESS);
		}
		break;

	case DFUState::INIT:
		m_init_data.insert(m_init_data.end(), data.begin(), data.end());
		break;

	case DFUState::RECEIVING:
		m_image.insert(m_image.end(), data.begin(), data.end());
		m_packets_since_receipt++;

		if (m_prn_interval && m_packets_since_receipt >= m_prn_interval) {
			uint32_t count = m_image.size() - (m_faults.miscount_receipts ? 1 : 0);
			m_packets_since_receipt = 0;
			notify(ByteArray { static_cast<uint8_t>(DFUOpcode::PACKET_RECEIPT_NOTIFICATION),
				(uint8_t)count, (uint8_t)(count >> 8), (uint8_t)(count >> 16), (uint8_t)(count >> 24) });
		}

		if (m_image.size() > m_image_size) {
			m_state = DFUState::IDLE;
			respond(DFUOpcode::RECEIVE_FIRMWARE_IMAGE, DFUResultCode::DATA_SIZE_EXCEEDS_LIMIT);
		} else if (m_image.size() == m_image_size) {
			m_state = DFUState::RECEIVED;
			respond(DFUOpcode::RECEIVE_FIRMWARE_IMAGE, DFUResultCode::SUCCESS);
		}
		break;

	default:
		break;
	}
}


class SimBLEConnection : public BLEConnection {
private:
	std::shared_ptr<SimDFUPeripheral> m_peripheral;
	BLEDevice m_device;
	unsigned int m_max_write_length;
	bool m_connected;
	BLENotificationHandler m_on_notify;
	BLEDisconnectHandler m_on_disconnect;

	void on_link_lost() {
		m_connected = false;
		if (m_on_disconnect)
			m_on_disconnect();
	}

public:
	SimBLEConnection(std::shared_ptr<SimDFUPeripheral> peripheral, const BLEDevice& device, unsigned int max_write_length) :
		m_peripheral(peripheral), m_device(device), m_max_write_length(max_write_length), m_connected(true) {
		m_peripheral->connect([this](const ByteArray& data) {
			if (m_on_notify)
				m_on_notify(data);
		}, [this]() { on_link_lost(); });
	}

	~SimBLEConnection() {
		disconnect();
	}

	const BLEDevice& device() const override {
		return m_device;
	}

	void write(const std::string& characteristic, const ByteArray& data, bool) override {
		if (!m_connected)
			throw ErrorCode::DFU_TRANSPORT_ERROR;
		m_peripheral->write(characteristic, data);
	}

	void subscribe(const std::string& characteristic, BLENotificationHandler on_notify) override {
		if (characteristic == LegacyDFUCharacteristic::CONTROL_POINT)
			m_on_notify = on_notify;
	}

	void set_disconnect_handler(BLEDisconnectHandler on_disconnect) override {
		m_on_disconnect = on_disconnect;
	}

	bool is_connected() override {
		return m_connected;
	}

	unsigned int max_write_length() override {
		return m_max_write_length;
	}

	void disconnect() override {
		if (m_connected) {
			m_connected = false;
			m_peripheral->disconnect();
		}
	}
};


SimBLECentral::SimBLECentral(const std::string& adapter, unsigned int att_mtu) : m_att_mtu(att_mtu) {
	DEBUG_INFO("SimBLECentral: simulated radio%s%s", adapter.empty() ? "" : " on ", adapter.c_str());
}

void SimBLECentral::add_peripheral(std::shared_ptr<SimDFUPeripheral> peripheral) {
	m_peripherals.push_back(peripheral);
}

std::shared_ptr<SimDFUPeripheral> SimBLECentral::find_advertising(const BLEScanFilter& filter, BLEDevice& adv) {
	for (auto &p : m_peripherals) {
		if (p->mode() == SimDFUPeripheral::Mode::REBOOTING || p->is_connected())
			continue;
		adv = p->advertisement();
		if (filter(adv))
			return p;
	}
	return nullptr;
}

std::optional<BLEDevice> SimBLECentral::scan(const BLEScanFilter& filter, unsigned int timeout_ms) {
	auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);

	while (true) {
		BLEDevice adv;
		if (find_advertising(filter, adv))
			return adv;
		if (std::chrono::steady_clock::now() >= deadline)
			return std::nullopt;
		std::this_thread::sleep_for(std::chrono::milliseconds(SIM_POLL_MS));
	}
}

std::unique_ptr<BLEConnection> SimBLECentral::connect(const BLEDevice& device, unsigned int timeout_ms) {
	auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
	BLEScanFilter by_address = [&device](const BLEDevice& d) { return BLEAddress::equal(d.address, device.address); };

	while (true) {
		BLEDevice adv;
		auto peripheral = find_advertising(by_address, adv);
		if (peripheral)
			return std::make_unique<SimBLEConnection>(peripheral, adv, m_att_mtu - 3);
		if (std::chrono::steady_clock::now() >= deadline)
			break;
		std::this_thread::sleep_for(std::chrono::milliseconds(SIM_POLL_MS));
	}

	DEBUG_ERROR("SimBLECentral: can't connect to %s", device.address.c_str());
	throw ErrorCode::DFU_TRANSPORT_ERROR;
}
