#include "RegistryProtocol.hpp"
#include "ScanCoordinator.hpp"
#include "core/BuildInfo.hpp"

using json = nlohmann::json;

namespace ipscout {

RegistryProtocol::RegistryProtocol(DeviceRegistry& reg, ScanCoordinator& sc)
: registry(reg), scans(sc) {}

json RegistryProtocol::record_view(const RecordView& v) {
    json j = record_to_json(v.record, v.status != DeviceStatus::Offline && v.status != DeviceStatus::Missing);
    j["status"] = status_name(v.status);
    j["ip_changes"] = v.record.ip_history.empty() ? 0 : static_cast<int>(v.record.ip_history.size()) - 1;
    j["first_seen_formatted"] = format_local(v.record.first_seen);
    j["last_seen_formatted"] = format_local(v.record.last_seen);
    return j;
}

static json last_scan_json(const ScanCoordinator& scans) {
    auto t = scans.last_scan_time();
    return t ? json(format_iso8601(*t)) : json(nullptr);
}

json RegistryProtocol::build_device_list(SortKey key, TimePoint now) {
    json devices = json::array();
    for (const auto& v : registry.list_records(key, now)) devices.push_back(record_view(v));
    return {
        {"type", "devices"},
        {"count", devices.size()},
        {"devices", devices},
        {"last_scan", last_scan_json(scans)},
        {"scan_in_progress", scans.in_progress()}
    };
}

json RegistryProtocol::build_device_detail(const std::string& mac, TimePoint now) {
    auto rec = registry.get_record(mac);
    if (!rec) return nullptr;
    auto status = registry.status_of(mac, now);
    return record_view({*rec, status.value_or(DeviceStatus::Offline)});
}

json RegistryProtocol::build_history(const std::string& mac) {
    auto rec = registry.get_record(mac);
    if (!rec) return nullptr;
    json entries = json::array();
    for (const auto& h : rec->ip_history) {
        entries.push_back({
            {"ip", h.ip},
            {"timestamp", format_iso8601(h.timestamp)},
            {"previous_ip", h.previous_ip ? json(*h.previous_ip) : json(nullptr)}
        });
    }
    return {
        {"mac_address", rec->hardware_address()},
        {"device_name", rec->descriptor.device_name},
        {"current_ip", rec->current_ip()},
        {"first_seen", format_iso8601(rec->first_seen)},
        {"last_seen", format_iso8601(rec->last_seen)},
        {"total_discoveries", rec->total_discoveries},
        {"ip_history", entries}
    };
}

json RegistryProtocol::build_stats(TimePoint now, bool auto_scan_enabled, int auto_scan_interval_s) {
    json j = to_json(registry.stats(now));
    j["type"] = "stats";
    j["missing_hours"] = static_cast<double>(registry.missing_threshold().count()) / 3600.0;
    j["last_scan"] = last_scan_json(scans);
    j["scan_in_progress"] = scans.in_progress();
    j["auto_scan_enabled"] = auto_scan_enabled;
    j["auto_scan_interval"] = auto_scan_interval_s;
    return j;
}

json RegistryProtocol::build_conflicts() {
    json out = json::array();
    for (const auto& c : registry.ip_conflicts()) {
        out.push_back({{"ip", c.ip}, {"devices", c.hardware_addresses}});
    }
    return {{"type", "conflicts"}, {"conflicts", out}};
}

json RegistryProtocol::build_export(TimePoint now) {
    return {
        {"type", "ipscout_export"},
        {"schema_version", 1},
        {"exported_at", format_iso8601(now)},
        {"build", {
            {"version", buildinfo::version()},
            {"git_commit", buildinfo::git_commit()},
            {"build_time", buildinfo::build_time_utc_approx()}
        }},
        {"devices", snapshot_to_json(registry.snapshot())}
    };
}

json RegistryProtocol::build_scan_complete(const ScanOutcome& outcome) {
    json j = {{"type", "scan_complete"}, {"ok", outcome.result.has_value()}};
    if (outcome.result) {
        j["result"] = to_json(*outcome.result);
    } else {
        j["error"] = {{"code", outcome.error_code}, {"message", outcome.error}};
    }
    return j;
}

} // namespace ipscout
