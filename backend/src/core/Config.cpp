#include "core/Config.hpp"
#include "core/ErrorCatalog.hpp"

#include <cmath>
#include <cstdlib>
#include <fstream>

using json = nlohmann::json;

namespace ipscout {

static void check(bool ok, const std::string& what) {
    if (!ok) throw Error(ErrorKind::InvalidArgument, "config: " + what);
}

std::chrono::milliseconds timeout_from_seconds(double seconds) {
    if (!std::isfinite(seconds) || seconds <= 0.0 || seconds > kMaxTimeoutSeconds) {
        throw Error(ErrorKind::InvalidArgument, "timeout must be in (0, " + std::to_string(static_cast<int>(kMaxTimeoutSeconds)) + "] seconds");
    }
    return std::chrono::milliseconds(static_cast<long long>(seconds * 1000.0));
}

std::chrono::seconds threshold_from_hours(double hours) {
    if (!std::isfinite(hours) || hours < 0.0 || hours > kMaxMissingHours) {
        throw Error(ErrorKind::InvalidArgument, "missing hours must be in [0, " + std::to_string(static_cast<int>(kMaxMissingHours)) + "]");
    }
    return std::chrono::seconds(static_cast<long long>(hours * 3600.0));
}

int port_from_number(double value) {
    if (!std::isfinite(value) || value < 1.0 || value > 65535.0 || value != std::floor(value)) {
        throw Error(ErrorKind::InvalidArgument, "port must be an integer in 1..65535");
    }
    return static_cast<int>(value);
}

int interval_from_seconds(double seconds) {
    if (!std::isfinite(seconds) || seconds < 1.0 || seconds > kMaxIntervalSeconds) {
        throw Error(ErrorKind::InvalidArgument, errors::D2400_BAD_INTERVAL);
    }
    return static_cast<int>(seconds);
}

std::chrono::milliseconds Config::timeout() const {
    return timeout_from_seconds(timeout_s);
}

void apply_config_json(Config& cfg, const json& j) {
    check(j.is_object(), "top level must be an object");
    try {
        if (j.contains("db_path")) cfg.db_path = j["db_path"].get<std::string>();
        if (j.contains("interface")) cfg.interface_address = j["interface"].get<std::string>();
        if (j.contains("timeout_s")) {
            double t = j["timeout_s"].get<double>();
            timeout_from_seconds(t);
            cfg.timeout_s = t;
        }
        if (j.contains("missing_hours")) {
            cfg.missing_threshold = threshold_from_hours(j["missing_hours"].get<double>());
        }
        if (j.contains("port")) {
            cfg.port = port_from_number(j["port"].get<double>());
        }
        if (j.contains("auto_scan_interval_s")) {
            cfg.auto_scan_interval_s = interval_from_seconds(j["auto_scan_interval_s"].get<double>());
        }
        if (j.contains("auto_scan_enabled")) cfg.auto_scan_enabled = j["auto_scan_enabled"].get<bool>();
        if (j.contains("verbose")) cfg.verbose = j["verbose"].get<bool>();
    } catch (const json::exception& e) {
        throw Error(ErrorKind::InvalidArgument, std::string("config: ") + e.what());
    }
}

void apply_config_file(Config& cfg, const std::string& path) {
    std::ifstream f(path);
    check(f.good(), "cannot open " + path);
    json j = json::parse(f, nullptr, false);
    check(!j.is_discarded(), "cannot parse " + path);
    apply_config_json(cfg, j);
}

void apply_config_env(Config& cfg) {
    if (const char* v = std::getenv("IPSCOUT_DB"); v && *v) cfg.db_path = v;
    if (const char* v = std::getenv("IPSCOUT_INTERFACE"); v && *v) cfg.interface_address = v;
    if (const char* v = std::getenv("IPSCOUT_TIMEOUT"); v && *v) {
        double t = 0.0;
        try {
            t = std::stod(v);
        } catch (const std::exception&) {
            check(false, "IPSCOUT_TIMEOUT is not a number");
        }
        timeout_from_seconds(t);
        cfg.timeout_s = t;
    }
    if (const char* v = std::getenv("IPSCOUT_MISSING_HOURS"); v && *v) {
        double h = 0.0;
        try {
            h = std::stod(v);
        } catch (const std::exception&) {
            check(false, "IPSCOUT_MISSING_HOURS is not a number");
        }
        cfg.missing_threshold = threshold_from_hours(h);
    }
    if (const char* v = std::getenv("IPSCOUT_VERBOSE"); v && *v) {
        std::string s(v);
        cfg.verbose = (s == "1" || s == "true" || s == "yes");
    }
}

json to_json(const Config& cfg) {
    return {
        {"db_path", cfg.db_path},
        {"interface", cfg.interface_address},
        {"timeout_s", cfg.timeout_s},
        {"missing_hours", static_cast<double>(cfg.missing_threshold.count()) / 3600.0},
        {"port", cfg.port},
        {"auto_scan_interval_s", cfg.auto_scan_interval_s},
        {"auto_scan_enabled", cfg.auto_scan_enabled},
        {"verbose", cfg.verbose}
    };
}

} // namespace ipscout
