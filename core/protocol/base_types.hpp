#pragma once

#include <cstdint>
#include <vector>

using ByteArray = std::vector<uint8_t>;

// Non-owning view into a ByteArray
struct ByteSlice {
	const uint8_t *data;
	unsigned int length;

	ByteArray to_bytes() const {
		return ByteArray(data, data + length);
	}
};
