#include "CppUTest/TestHarness.h"

#include "crc16.hpp"


TEST_GROUP(CRC16)
{
};

TEST(CRC16, StandardCheckValue)
{
	ByteArray data = { '1', '2', '3', '4', '5', '6', '7', '8', '9' };
	CHECK_EQUAL(0x29B1, CRC16::checksum(data));
}

TEST(CRC16, EmptyBufferReturnsSeed)
{
	ByteArray data;
	CHECK_EQUAL(0xFFFF, CRC16::checksum(data));
	CHECK_EQUAL(0x1234, CRC16::checksum(data, 0x1234));
}

TEST(CRC16, ChecksumCanBeChained)
{
	ByteArray data = { '1', '2', '3', '4', '5', '6', '7', '8', '9' };
	ByteArray head(data.begin(), data.begin() + 4);
	ByteArray tail(data.begin() + 4, data.end());
	CHECK_EQUAL(CRC16::checksum(data), CRC16::checksum(tail, CRC16::checksum(head)));
}
