#pragma once
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

#include "DeviceRecord.hpp"
#include "core/RegistryStore.hpp"

namespace ipscout {

enum class ChangeKind { New, Updated, IpChanged };

enum class DeviceStatus { Active, IpChanged, Offline, Missing };

std::string status_name(DeviceStatus s);

struct IpChange {
    std::string hardware_address;
    std::string old_ip;
    std::string new_ip;
};

struct ChangeSummary {
    TimePoint timestamp;
    std::vector<std::string> new_devices;
    std::vector<std::string> updated;
    std::vector<IpChange> ip_changed;
};

nlohmann::json to_json(const ChangeSummary& s);

/**
 * @brief Derived liveness of one record.
 *
 * Absent from the latest scan: Missing if now - last_seen is strictly greater
 * than missing_threshold, else Offline. Present: IpChanged if that scan
 * changed its address, else Active.
 */
DeviceStatus compute_status(const DeviceRecord& record, TimePoint now,
                            std::chrono::seconds missing_threshold,
                            bool was_in_latest_scan, bool ip_changed_in_latest_scan);

enum class SortKey { LastSeen, FirstSeen, Ip, Mac, Name, Serial, Type };

// Unknown names map to LastSeen.
SortKey sort_key_from_string(const std::string& name);

struct RecordView {
    DeviceRecord record;
    DeviceStatus status;
};

struct RegistryStats {
    size_t total = 0;
    size_t active = 0;
    size_t offline = 0;
    size_t missing = 0;
    size_t ip_changed = 0;
    size_t cameras = 0;
    size_t recorders = 0;
    size_t devices_with_ip_changes = 0;
    int64_t total_discoveries = 0;
    double avg_discoveries_per_device = 0.0;
};

nlohmann::json to_json(const RegistryStats& s);

struct IpConflict {
    std::string ip;
    std::vector<std::string> hardware_addresses;
};

/**
 * @brief Owns every DeviceRecord. Mutated only through reconcile().
 *
 * All public methods take one mutex; none of them does network I/O.
 */
class DeviceRegistry {
public:
    // Held by whoever runs a scan; releases the in-progress flag on destruction.
    class ScanToken {
    public:
        ScanToken() = default;
        explicit ScanToken(DeviceRegistry* owner) : owner_(owner) {}
        ScanToken(ScanToken&& other) noexcept : owner_(other.owner_) { other.owner_ = nullptr; }
        ScanToken& operator=(ScanToken&& other) noexcept;
        ScanToken(const ScanToken&) = delete;
        ScanToken& operator=(const ScanToken&) = delete;
        ~ScanToken() { release(); }

        void release();
        explicit operator bool() const { return owner_ != nullptr; }

    private:
        DeviceRegistry* owner_ = nullptr;
    };

    explicit DeviceRegistry(std::shared_ptr<RegistryStore> store,
                            std::chrono::seconds missing_threshold = std::chrono::hours(24));

    // Replace in-memory state with the store's snapshot.
    void load();

    // Whole batch applied and saved, or nothing changes (Error(PersistenceFailure)).
    ChangeSummary reconcile(const std::vector<protocol::DeviceDescriptor>& batch, TimePoint now);

    std::optional<DeviceRecord> get_record(const std::string& hardware_address) const;
    std::optional<std::vector<IpHistoryEntry>> history(const std::string& hardware_address) const;
    std::optional<DeviceStatus> status_of(const std::string& hardware_address, TimePoint now) const;

    std::vector<RecordView> list_records(SortKey key, TimePoint now) const;
    RegistryStats stats(TimePoint now) const;
    std::vector<IpConflict> ip_conflicts() const;

    RegistrySnapshot snapshot() const;
    size_t size() const;

    // Throws Error(ScanAlreadyInProgress) while another token is alive.
    ScanToken try_begin_scan();
    bool scan_in_progress() const;

    void set_missing_threshold(std::chrono::seconds threshold);
    std::chrono::seconds missing_threshold() const;

private:
    DeviceStatus status_locked(const DeviceRecord& r, TimePoint now) const;
    void end_scan();

    std::shared_ptr<RegistryStore> store_;
    RegistrySnapshot state_;
    // classification produced by the most recent reconcile, per address
    std::map<std::string, ChangeKind> latest_changes_;
    bool scan_in_progress_ = false;
    std::chrono::seconds missing_threshold_;
    mutable std::mutex registry_mutex;
};

} // namespace ipscout
