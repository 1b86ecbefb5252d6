#pragma once
#include <chrono>
#include <string>
#include <nlohmann/json.hpp>

namespace ipscout {

struct Config {
    std::string db_path = "camera_database.json";
    std::string interface_address = "0.0.0.0";
    double timeout_s = 3.0;
    std::chrono::seconds missing_threshold = std::chrono::hours(24);
    int port = 9001;
    int auto_scan_interval_s = 300;
    bool auto_scan_enabled = false;
    bool verbose = false;

    std::chrono::milliseconds timeout() const;
};

inline constexpr double kMaxTimeoutSeconds = 600.0;
inline constexpr double kMaxMissingHours = 24.0 * 365.0 * 10.0;
inline constexpr double kMaxIntervalSeconds = 7.0 * 24.0 * 3600.0;

// Range-checked conversions of user-supplied numbers; each throws
// Error(InvalidArgument) before anything is narrowed.
std::chrono::milliseconds timeout_from_seconds(double seconds);
std::chrono::seconds threshold_from_hours(double hours);
int port_from_number(double value);
int interval_from_seconds(double seconds);

// Overlay keys present in j onto cfg. Throws Error(InvalidArgument) on bad values.
void apply_config_json(Config& cfg, const nlohmann::json& j);
// Reads a JSON config file. Throws Error(InvalidArgument) if unreadable.
void apply_config_file(Config& cfg, const std::string& path);
// IPSCOUT_DB, IPSCOUT_INTERFACE, IPSCOUT_TIMEOUT, IPSCOUT_MISSING_HOURS, IPSCOUT_VERBOSE
void apply_config_env(Config& cfg);

nlohmann::json to_json(const Config& cfg);

} // namespace ipscout
