#pragma once

class PMU {
public:
	static void delay_ms(unsigned ms);
};
