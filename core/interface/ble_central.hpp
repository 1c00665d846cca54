#pragma once

#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <functional>
#include <algorithm>
#include <cctype>

#include "base_types.hpp"

struct BLEDevice {
	std::string address;
	std::string name;
	std::vector<std::string> service_uuids;
	int rssi = 0;

	// UUID text compares without regard to case
	bool advertises_service(const std::string& uuid) const {
		return std::any_of(service_uuids.begin(), service_uuids.end(), [&uuid](const std::string& s) {
			return s.size() == uuid.size() && std::equal(s.begin(), s.end(), uuid.begin(), [](char a, char b) {
				return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
			});
		});
	}
};

using BLEScanFilter = std::function<bool(const BLEDevice&)>;
using BLENotificationHandler = std::function<void(const ByteArray&)>;
using BLEDisconnectHandler = std::function<void()>;

// A live link to one peripheral. Implementations disconnect on destruction
// and report every transport failure as ErrorCode::DFU_TRANSPORT_ERROR.
class BLEConnection {
public:
	virtual ~BLEConnection() {}
	virtual const BLEDevice& device() const = 0;
	virtual void write(const std::string& characteristic, const ByteArray& data, bool with_response) = 0;
	virtual void subscribe(const std::string& characteristic, BLENotificationHandler on_notify) = 0;
	virtual void set_disconnect_handler(BLEDisconnectHandler on_disconnect) = 0;
	virtual bool is_connected() = 0;
	// Largest payload of a single write (ATT MTU less the 3 byte header)
	virtual unsigned int max_write_length() = 0;
	virtual void disconnect() = 0;
};

class BLECentral {
public:
	virtual ~BLECentral() {}
	virtual std::optional<BLEDevice> scan(const BLEScanFilter& filter, unsigned int timeout_ms) = 0;
	virtual std::unique_ptr<BLEConnection> connect(const BLEDevice& device, unsigned int timeout_ms) = 0;
};
