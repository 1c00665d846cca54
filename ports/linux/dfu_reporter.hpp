#pragma once

#include <string>
#include "dfu_events.hpp"
#include "dfu_config.hpp"

// Renders session events on the console and file loggers
class DFUReporter : public DFUEventListener {
private:
	const DFUConfig& m_config;

public:
	DFUReporter(const DFUConfig& config) : m_config(config) {}

	void react(DFUEventStateChanged const& e) override;
	void react(DFUEventDeviceFound const& e) override;
	void react(DFUEventProgress const& e) override;
	void react(DFUEventPacketReceipt const& e) override;
	void react(DFUEventFailed const& e) override;

	static std::string describe_failure(DFUEventFailed const& e);
	static std::string remediation(const DFUConfig& config);
};
