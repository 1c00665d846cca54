#include <algorithm>

#include "reconnection_manager.hpp"
#include "legacy_dfu_protocol.hpp"
#include "ble_address.hpp"
#include "error.hpp"
#include "debug.hpp"

bool ReconnectionManager::is_bootloader_of(const BLEDevice& original, const BLEDevice& candidate) const {
	if (!original.address.empty() && BLEAddress::equal(candidate.address, original.address))
		return true;

	if (!candidate.name.empty()) {
		if (!original.name.empty()) {
			if (candidate.name == original.name)
				return true;
			for (auto const &suffix : m_aliases.name_suffixes)
				if (candidate.name == original.name + suffix)
					return true;
		}
		if (std::find(m_aliases.names.begin(), m_aliases.names.end(), candidate.name) != m_aliases.names.end())
			return true;
	}

	if (m_aliases.match_service_uuid && candidate.advertises_service(LegacyDFUCharacteristic::SERVICE))
		return true;

	if (m_aliases.match_incremented_address && BLEAddress::is_valid(original.address) &&
		BLEAddress::equal(candidate.address, BLEAddress::increment(original.address)))
		return true;

	return false;
}

BLEDevice ReconnectionManager::await_bootloader(const BLEDevice& original, unsigned int timeout_ms) {
	uint64_t start = m_timer.get_counter();
	unsigned int attempt = 0;

	DEBUG_INFO("ReconnectionManager: looking for bootloader of %s (%s)", original.name.c_str(), original.address.c_str());

	while (!m_cancelled) {
		uint64_t elapsed = m_timer.get_counter() - start;
		if (elapsed >= timeout_ms)
			break;

		unsigned int window = std::min<uint64_t>(m_scan_timeout_ms, timeout_ms - elapsed);
		attempt++;
		DEBUG_TRACE("ReconnectionManager: scan attempt %u for %u ms", attempt, window);

		auto found = m_central.scan([this, &original](const BLEDevice& candidate) {
			return is_bootloader_of(original, candidate);
		}, window);

		if (found.has_value()) {
			DEBUG_INFO("ReconnectionManager: found %s (%s)", found->name.c_str(), found->address.c_str());
			return *found;
		}
	}

	if (m_cancelled)
		throw ErrorCode::DFU_CANCELLED;

	DEBUG_ERROR("ReconnectionManager: no bootloader seen after %u scans", attempt);
	throw ErrorCode::DFU_DEVICE_NOT_FOUND;
}

void ReconnectionManager::cancel() {
	m_cancelled = true;
}
