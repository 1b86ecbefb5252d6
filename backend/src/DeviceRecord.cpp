#include "DeviceRecord.hpp"
#include "core/ErrorCatalog.hpp"

#include <iostream>

using json = nlohmann::json;

namespace ipscout {

static TimePoint timestamp_from_json(const json& j, const char* key) {
    auto text = j.at(key).get<std::string>();
    auto tp = parse_iso8601(text);
    if (!tp) throw Error(ErrorKind::InvalidArgument, std::string("bad timestamp in '") + key + "': " + text);
    return *tp;
}

json record_to_json(const DeviceRecord& r, bool seen_in_last_discovery) {
    const auto& d = r.descriptor;
    json history = json::array();
    for (const auto& h : r.ip_history) {
        history.push_back({
            {"ip", h.ip},
            {"timestamp", format_iso8601(h.timestamp)},
            {"previous_ip", h.previous_ip ? json(*h.previous_ip) : json(nullptr)}
        });
    }

    json j = {
        {"mac_address", d.hardware_address},
        {"serial_number", d.serial_number},
        {"model_name", d.model_name},
        {"device_name", d.device_name},
        {"firmware_version", d.firmware_version},
        {"device_type", protocol::kind_name(d.kind)},
        {"current_ip", d.ip_address},
        {"current_subnet", d.subnet_mask},
        {"current_gateway", d.gateway},
        {"current_port", d.http_port},
        {"current_network_mode", protocol::network_mode_name(d.network_mode)},
        {"first_seen", format_iso8601(r.first_seen)},
        {"last_seen", format_iso8601(r.last_seen)},
        {"ip_history", history},
        {"total_discoveries", r.total_discoveries},
        {"seen_in_last_discovery", seen_in_last_discovery}
    };
    if (auto rec = std::get_if<protocol::RecorderInfo>(&d.kind)) {
        j["channel_count"] = rec->channel_count ? json(*rec->channel_count) : json(nullptr);
        j["storage_capacity"] = rec->storage_capacity ? json(*rec->storage_capacity) : json(nullptr);
    }
    if (d.device_type_code) j["device_type_code"] = *d.device_type_code;
    return j;
}

DeviceRecord record_from_json(const json& j, bool* seen_in_last_discovery) {
    DeviceRecord r;
    auto& d = r.descriptor;
    d.hardware_address = protocol::normalize_mac(j.at("mac_address").get<std::string>());
    d.serial_number = j.value("serial_number", "");
    d.model_name = j.value("model_name", "");
    // older databases call it camera_name
    d.device_name = j.contains("device_name") ? j.value("device_name", "") : j.value("camera_name", "");
    d.firmware_version = j.value("firmware_version", "");
    d.ip_address = j.value("current_ip", "");
    d.subnet_mask = j.value("current_subnet", "");
    d.gateway = j.value("current_gateway", "");
    d.http_port = j.value("current_port", static_cast<uint16_t>(80));
    d.network_mode = protocol::network_mode_from_name(j.value("current_network_mode", ""));

    if (j.value("device_type", std::string("camera")) == "recorder") {
        protocol::RecorderInfo rec;
        if (j.contains("channel_count") && j["channel_count"].is_number()) rec.channel_count = j["channel_count"].get<uint16_t>();
        if (j.contains("storage_capacity") && j["storage_capacity"].is_number()) rec.storage_capacity = j["storage_capacity"].get<uint16_t>();
        d.kind = rec;
    } else {
        d.kind = protocol::CameraInfo{};
    }
    if (j.contains("device_type_code") && j["device_type_code"].is_number()) {
        d.device_type_code = j["device_type_code"].get<uint8_t>();
    }

    r.first_seen = timestamp_from_json(j, "first_seen");
    r.last_seen = timestamp_from_json(j, "last_seen");
    r.total_discoveries = j.value("total_discoveries", static_cast<int64_t>(1));
    if (seen_in_last_discovery) *seen_in_last_discovery = j.value("seen_in_last_discovery", false);

    for (const auto& h : j.value("ip_history", json::array())) {
        IpHistoryEntry e;
        e.ip = h.at("ip").get<std::string>();
        e.timestamp = timestamp_from_json(h, "timestamp");
        if (h.contains("previous_ip") && h["previous_ip"].is_string()) e.previous_ip = h["previous_ip"].get<std::string>();
        r.ip_history.push_back(std::move(e));
    }
    // repair records written without history
    if (r.ip_history.empty() || r.ip_history.back().ip != d.ip_address) {
        std::optional<std::string> prev;
        if (!r.ip_history.empty()) prev = r.ip_history.back().ip;
        r.ip_history.push_back({d.ip_address, r.last_seen, prev});
    }
    return r;
}

json snapshot_to_json(const RegistrySnapshot& snapshot) {
    json out = json::object();
    for (const auto& [mac, rec] : snapshot.records) {
        out[mac] = record_to_json(rec, snapshot.latest_scan.count(mac) != 0);
    }
    return out;
}

RegistrySnapshot snapshot_from_json(const json& j) {
    RegistrySnapshot out;
    if (!j.is_object()) {
        std::cerr << "DeviceRegistry: snapshot is not a JSON object; starting empty" << std::endl;
        return out;
    }
    for (auto it = j.begin(); it != j.end(); ++it) {
        try {
            bool seen = false;
            auto rec = record_from_json(it.value(), &seen);
            std::string key = rec.hardware_address();
            if (seen) out.latest_scan.insert(key);
            out.records[key] = std::move(rec);
        } catch (const std::exception& e) {
            std::cerr << "DeviceRegistry: skipping record '" << it.key() << "': " << e.what() << std::endl;
        }
    }
    return out;
}

} // namespace ipscout
