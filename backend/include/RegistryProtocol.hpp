#pragma once
#include <nlohmann/json.hpp>
#include <string>

#include "DeviceRegistry.hpp"

namespace ipscout {

struct ScanOutcome;
class ScanCoordinator;

// JSON views of the registry for the control channel and the CLI.
class RegistryProtocol {
public:
    RegistryProtocol(DeviceRegistry& reg, ScanCoordinator& scans);

    nlohmann::json build_device_list(SortKey key, TimePoint now);
    // null json when the address is unknown
    nlohmann::json build_device_detail(const std::string& mac, TimePoint now);
    nlohmann::json build_history(const std::string& mac);
    nlohmann::json build_stats(TimePoint now, bool auto_scan_enabled, int auto_scan_interval_s);
    nlohmann::json build_conflicts();
    nlohmann::json build_export(TimePoint now);
    nlohmann::json build_scan_complete(const ScanOutcome& outcome);

    static nlohmann::json record_view(const RecordView& v);

private:
    DeviceRegistry& registry;
    ScanCoordinator& scans;
};

} // namespace ipscout
