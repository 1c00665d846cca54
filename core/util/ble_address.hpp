#pragma once

#include <string>
#include <cctype>
#include <cstdio>

class BLEAddress {
public:
	// Accepts AA:BB:CC:DD:EE:FF in either case
	static bool is_valid(const std::string& address) {
		if (address.size() != 17)
			return false;
		for (unsigned int i = 0; i < address.size(); i++) {
			if (i % 3 == 2) {
				if (address[i] != ':')
					return false;
			} else if (!std::isxdigit(static_cast<unsigned char>(address[i]))) {
				return false;
			}
		}
		return true;
	}

	static std::string normalise(const std::string& address) {
		std::string output(address);
		for (auto &c : output)
			c = std::toupper(static_cast<unsigned char>(c));
		return output;
	}

	static bool equal(const std::string& a, const std::string& b) {
		return normalise(a) == normalise(b);
	}

	// Nordic bootloaders advertise at the application address plus one (last octet, wrapping)
	static std::string increment(const std::string& address) {
		if (!is_valid(address))
			return std::string();
		unsigned int last = std::stoul(address.substr(15, 2), nullptr, 16);
		char octet[3];
		snprintf(octet, sizeof(octet), "%02X", (last + 1) & 0xFF);
		return normalise(address.substr(0, 15)) + octet;
	}
};
