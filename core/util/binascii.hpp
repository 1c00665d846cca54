#pragma once

#include <string>
#include "base_types.hpp"

class Binascii {
public:
	static std::string hexlify(const uint8_t *input, unsigned int length) {
	    static const char hex_digits[] = "0123456789abcdef";

	    std::string output;
	    output.reserve(length * 2);
	    for (unsigned int i = 0; i < length; i++)
	    {
	        output.push_back(hex_digits[input[i] >> 4]);
	        output.push_back(hex_digits[input[i] & 0xF]);
	    }
	    return output;
	}

	static std::string hexlify(const ByteArray& input) {
		return hexlify(input.data(), input.size());
	}
};
