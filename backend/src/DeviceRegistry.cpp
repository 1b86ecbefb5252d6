#include "DeviceRegistry.hpp"
#include "core/ErrorCatalog.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <tuple>

using json = nlohmann::json;

namespace ipscout {

std::string status_name(DeviceStatus s) {
    switch (s) {
        case DeviceStatus::Active: return "Active";
        case DeviceStatus::IpChanged: return "IP Changed";
        case DeviceStatus::Offline: return "Offline";
        case DeviceStatus::Missing: return "MISSING";
    }
    return "Unknown";
}

json to_json(const ChangeSummary& s) {
    json changed = json::array();
    for (const auto& c : s.ip_changed) {
        changed.push_back({{"mac", c.hardware_address}, {"old_ip", c.old_ip}, {"new_ip", c.new_ip}});
    }
    return {
        {"timestamp", format_iso8601(s.timestamp)},
        {"new", s.new_devices},
        {"updated", s.updated},
        {"ip_changed", changed}
    };
}

json to_json(const RegistryStats& s) {
    return {
        {"total", s.total},
        {"active", s.active},
        {"offline", s.offline},
        {"missing", s.missing},
        {"ip_changed", s.ip_changed},
        {"cameras", s.cameras},
        {"recorders", s.recorders},
        {"devices_with_ip_changes", s.devices_with_ip_changes},
        {"total_discoveries", s.total_discoveries},
        {"avg_discoveries_per_device", s.avg_discoveries_per_device}
    };
}

DeviceStatus compute_status(const DeviceRecord& record, TimePoint now,
                            std::chrono::seconds missing_threshold,
                            bool was_in_latest_scan, bool ip_changed_in_latest_scan) {
    if (!was_in_latest_scan) {
        // strictly greater: exactly at the threshold is still Offline
        return (now - record.last_seen > missing_threshold) ? DeviceStatus::Missing : DeviceStatus::Offline;
    }
    return ip_changed_in_latest_scan ? DeviceStatus::IpChanged : DeviceStatus::Active;
}

SortKey sort_key_from_string(const std::string& name) {
    if (name == "first_seen") return SortKey::FirstSeen;
    if (name == "ip") return SortKey::Ip;
    if (name == "mac") return SortKey::Mac;
    if (name == "name") return SortKey::Name;
    if (name == "serial") return SortKey::Serial;
    if (name == "type") return SortKey::Type;
    return SortKey::LastSeen;
}

// (invalid, octets): unparsable addresses sort after every valid one
static std::tuple<int, protocol::Ipv4Bytes> ip_sort_key(const std::string& ip) {
    try {
        return {0, protocol::parse_ipv4(ip)};
    } catch (const Error&) {
        return {1, protocol::Ipv4Bytes{255, 255, 255, 255}};
    }
}

static std::string lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

DeviceRegistry::ScanToken& DeviceRegistry::ScanToken::operator=(ScanToken&& other) noexcept {
    if (this != &other) {
        release();
        owner_ = other.owner_;
        other.owner_ = nullptr;
    }
    return *this;
}

void DeviceRegistry::ScanToken::release() {
    if (owner_) {
        owner_->end_scan();
        owner_ = nullptr;
    }
}

DeviceRegistry::DeviceRegistry(std::shared_ptr<RegistryStore> store, std::chrono::seconds missing_threshold)
: store_(std::move(store)), missing_threshold_(missing_threshold) {}

void DeviceRegistry::load() {
    auto loaded = store_->load();

    std::map<std::string, ChangeKind> changes;
    for (const auto& mac : loaded.latest_scan) {
        auto it = loaded.records.find(mac);
        if (it == loaded.records.end() || it->second.ip_history.empty()) continue;
        const auto& r = it->second;
        const auto& last = r.ip_history.back();
        // a change appended by the latest scan carries that scan's timestamp
        bool changed = last.previous_ip.has_value() && last.timestamp == r.last_seen;
        changes[mac] = changed ? ChangeKind::IpChanged : ChangeKind::Updated;
    }

    std::lock_guard<std::mutex> lock(registry_mutex);
    state_ = std::move(loaded);
    latest_changes_ = std::move(changes);
    std::cerr << "DeviceRegistry: loaded " << state_.records.size() << " device(s) from " << store_->describe() << std::endl;
}

ChangeSummary DeviceRegistry::reconcile(const std::vector<protocol::DeviceDescriptor>& batch, TimePoint now) {
    std::lock_guard<std::mutex> lock(registry_mutex);

    // Work on a copy so a failed save leaves the registry untouched.
    RegistrySnapshot next = state_;
    next.latest_scan.clear();
    std::map<std::string, ChangeKind> changes;

    ChangeSummary summary;
    summary.timestamp = now;

    for (const auto& d : batch) {
        std::string mac;
        try {
            mac = protocol::normalize_mac(d.hardware_address);
        } catch (const Error& e) {
            std::cerr << "DeviceRegistry: ignoring descriptor: " << e.what() << std::endl;
            continue;
        }
        next.latest_scan.insert(mac);

        auto it = next.records.find(mac);
        if (it == next.records.end()) {
            DeviceRecord r;
            r.descriptor = d;
            r.descriptor.hardware_address = mac;
            r.first_seen = now;
            r.last_seen = now;
            r.total_discoveries = 1;
            r.ip_history.push_back({d.ip_address, now, std::nullopt});
            next.records.emplace(mac, std::move(r));
            changes[mac] = ChangeKind::New;
            summary.new_devices.push_back(mac);
            continue;
        }

        DeviceRecord& r = it->second;
        std::string old_ip = r.descriptor.ip_address;
        r.total_discoveries += 1;
        r.last_seen = now;
        r.descriptor = d;
        r.descriptor.hardware_address = mac;

        // a MAC repeated within one batch lands in exactly one bucket;
        // an address change outranks New and Updated
        auto prior = changes.find(mac);
        if (d.ip_address != old_ip) {
            r.ip_history.push_back({d.ip_address, now, old_ip});
            if (prior == changes.end()) {
                summary.ip_changed.push_back({mac, old_ip, d.ip_address});
            } else if (prior->second == ChangeKind::IpChanged) {
                for (auto& c : summary.ip_changed) {
                    if (c.hardware_address == mac) c.new_ip = d.ip_address;
                }
            } else {
                auto& bucket = prior->second == ChangeKind::New ? summary.new_devices : summary.updated;
                bucket.erase(std::remove(bucket.begin(), bucket.end(), mac), bucket.end());
                summary.ip_changed.push_back({mac, old_ip, d.ip_address});
            }
            changes[mac] = ChangeKind::IpChanged;
        } else if (prior == changes.end()) {
            changes.emplace(mac, ChangeKind::Updated);
            summary.updated.push_back(mac);
        }
    }

    store_->save(next);

    state_ = std::move(next);
    latest_changes_ = std::move(changes);
    return summary;
}

std::optional<DeviceRecord> DeviceRegistry::get_record(const std::string& hardware_address) const {
    std::string mac;
    try {
        mac = protocol::normalize_mac(hardware_address);
    } catch (const Error&) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(registry_mutex);
    auto it = state_.records.find(mac);
    if (it == state_.records.end()) return std::nullopt;
    return it->second;
}

std::optional<std::vector<IpHistoryEntry>> DeviceRegistry::history(const std::string& hardware_address) const {
    auto rec = get_record(hardware_address);
    if (!rec) return std::nullopt;
    return rec->ip_history;
}

std::optional<DeviceStatus> DeviceRegistry::status_of(const std::string& hardware_address, TimePoint now) const {
    std::string mac;
    try {
        mac = protocol::normalize_mac(hardware_address);
    } catch (const Error&) {
        return std::nullopt;
    }
    std::lock_guard<std::mutex> lock(registry_mutex);
    auto it = state_.records.find(mac);
    if (it == state_.records.end()) return std::nullopt;
    return status_locked(it->second, now);
}

DeviceStatus DeviceRegistry::status_locked(const DeviceRecord& r, TimePoint now) const {
    const auto& mac = r.hardware_address();
    bool in_scan = state_.latest_scan.count(mac) != 0;
    auto it = latest_changes_.find(mac);
    bool ip_changed = it != latest_changes_.end() && it->second == ChangeKind::IpChanged;
    return compute_status(r, now, missing_threshold_, in_scan, ip_changed);
}

std::vector<RecordView> DeviceRegistry::list_records(SortKey key, TimePoint now) const {
    std::vector<RecordView> out;
    {
        std::lock_guard<std::mutex> lock(registry_mutex);
        out.reserve(state_.records.size());
        for (const auto& [mac, r] : state_.records) out.push_back({r, status_locked(r, now)});
    }

    auto by = [&](auto&& cmp) { std::stable_sort(out.begin(), out.end(), cmp); };
    switch (key) {
        case SortKey::LastSeen:
            by([](const RecordView& a, const RecordView& b) { return a.record.last_seen > b.record.last_seen; });
            break;
        case SortKey::FirstSeen:
            by([](const RecordView& a, const RecordView& b) { return a.record.first_seen > b.record.first_seen; });
            break;
        case SortKey::Ip:
            by([](const RecordView& a, const RecordView& b) {
                return ip_sort_key(a.record.current_ip()) < ip_sort_key(b.record.current_ip());
            });
            break;
        case SortKey::Mac:
            // map order is already by address
            break;
        case SortKey::Name:
            by([](const RecordView& a, const RecordView& b) {
                return lower(a.record.descriptor.device_name) < lower(b.record.descriptor.device_name);
            });
            break;
        case SortKey::Serial:
            by([](const RecordView& a, const RecordView& b) {
                return a.record.descriptor.serial_number < b.record.descriptor.serial_number;
            });
            break;
        case SortKey::Type:
            by([](const RecordView& a, const RecordView& b) {
                auto ka = std::make_tuple(protocol::is_recorder(a.record.descriptor.kind), ip_sort_key(a.record.current_ip()));
                auto kb = std::make_tuple(protocol::is_recorder(b.record.descriptor.kind), ip_sort_key(b.record.current_ip()));
                return ka < kb;
            });
            break;
    }
    return out;
}

RegistryStats DeviceRegistry::stats(TimePoint now) const {
    std::lock_guard<std::mutex> lock(registry_mutex);
    RegistryStats s;
    s.total = state_.records.size();
    for (const auto& [mac, r] : state_.records) {
        switch (status_locked(r, now)) {
            case DeviceStatus::Active: s.active++; break;
            case DeviceStatus::IpChanged: s.ip_changed++; break;
            case DeviceStatus::Offline: s.offline++; break;
            case DeviceStatus::Missing: s.missing++; break;
        }
        if (protocol::is_recorder(r.descriptor.kind)) s.recorders++; else s.cameras++;
        if (r.ip_history.size() > 1) s.devices_with_ip_changes++;
        s.total_discoveries += r.total_discoveries;
    }
    if (s.total > 0) s.avg_discoveries_per_device = static_cast<double>(s.total_discoveries) / static_cast<double>(s.total);
    return s;
}

std::vector<IpConflict> DeviceRegistry::ip_conflicts() const {
    std::map<std::string, std::vector<std::string>> by_ip;
    {
        std::lock_guard<std::mutex> lock(registry_mutex);
        for (const auto& [mac, r] : state_.records) {
            if (!r.current_ip().empty()) by_ip[r.current_ip()].push_back(mac);
        }
    }
    std::vector<IpConflict> out;
    for (auto& [ip, macs] : by_ip) {
        if (macs.size() > 1) out.push_back({ip, std::move(macs)});
    }
    return out;
}

RegistrySnapshot DeviceRegistry::snapshot() const {
    std::lock_guard<std::mutex> lock(registry_mutex);
    return state_;
}

size_t DeviceRegistry::size() const {
    std::lock_guard<std::mutex> lock(registry_mutex);
    return state_.records.size();
}

DeviceRegistry::ScanToken DeviceRegistry::try_begin_scan() {
    std::lock_guard<std::mutex> lock(registry_mutex);
    if (scan_in_progress_) throw Error(ErrorKind::ScanAlreadyInProgress, "");
    scan_in_progress_ = true;
    return ScanToken(this);
}

bool DeviceRegistry::scan_in_progress() const {
    std::lock_guard<std::mutex> lock(registry_mutex);
    return scan_in_progress_;
}

void DeviceRegistry::end_scan() {
    std::lock_guard<std::mutex> lock(registry_mutex);
    scan_in_progress_ = false;
}

void DeviceRegistry::set_missing_threshold(std::chrono::seconds threshold) {
    std::lock_guard<std::mutex> lock(registry_mutex);
    missing_threshold_ = threshold;
}

std::chrono::seconds DeviceRegistry::missing_threshold() const {
    std::lock_guard<std::mutex> lock(registry_mutex);
    return missing_threshold_;
}

} // namespace ipscout
