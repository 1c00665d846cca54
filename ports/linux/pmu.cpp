#include <thread>
#include <chrono>

#include "pmu.hpp"

void PMU::delay_ms(unsigned ms) {
	std::this_thread::sleep_for(std::chrono::milliseconds(ms));
}
