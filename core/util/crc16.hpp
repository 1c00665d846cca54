#pragma once

#include <cstdint>
#include "base_types.hpp"

// CRC-16/CCITT (poly 0x1021) as used by the Nordic legacy init packet
class CRC16 {
public:
	static uint16_t checksum(const uint8_t *data, unsigned int length, uint16_t crc = 0xFFFF) {
		unsigned int value = crc;
		for (unsigned int idx = 0; idx < length; idx++) {
			value = value ^ (data[idx] << 8);
			for (int i = 0; i < 8; i++) {
				value <<= 1;
				if (value & 0x10000)
					value = (value ^ 0x1021) & 0xFFFF;
			}
		}
		return (uint16_t)(value & 0xFFFF);
	}

	static uint16_t checksum(const ByteArray& data, uint16_t crc = 0xFFFF) {
		return checksum(data.data(), data.size(), crc);
	}
};
