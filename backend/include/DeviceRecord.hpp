#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "core/Timestamp.hpp"
#include "protocol/DeviceDescriptor.hpp"

namespace ipscout {

struct IpHistoryEntry {
    std::string ip;
    TimePoint timestamp;
    std::optional<std::string> previous_ip;  // empty for the first discovery
};

/**
 * @brief Everything known about one device, keyed by hardware address.
 *
 * Descriptor fields hold the values from the most recent discovery.
 * Invariant once discovered: ip_history.back().ip == descriptor.ip_address.
 */
struct DeviceRecord {
    protocol::DeviceDescriptor descriptor;
    TimePoint first_seen;
    TimePoint last_seen;
    std::vector<IpHistoryEntry> ip_history;
    int64_t total_discoveries = 0;

    const std::string& hardware_address() const { return descriptor.hardware_address; }
    const std::string& current_ip() const { return descriptor.ip_address; }
};

// Unit of persistence. Membership of the most recent scan is kept beside the
// records so that reconciling a batch never touches absent records.
struct RegistrySnapshot {
    std::map<std::string, DeviceRecord> records;
    std::set<std::string> latest_scan;
};

nlohmann::json record_to_json(const DeviceRecord& r, bool seen_in_last_discovery);
// Throws nlohmann::json::exception or Error(InvalidAddress) on bad input.
DeviceRecord record_from_json(const nlohmann::json& j, bool* seen_in_last_discovery = nullptr);

nlohmann::json snapshot_to_json(const RegistrySnapshot& snapshot);
RegistrySnapshot snapshot_from_json(const nlohmann::json& j);

} // namespace ipscout
