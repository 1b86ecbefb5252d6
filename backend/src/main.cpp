#include "ControlServer.hpp"
#include "DeviceRegistry.hpp"
#include "RegistryProtocol.hpp"
#include "ScanCoordinator.hpp"
#include "core/BuildInfo.hpp"
#include "core/Config.hpp"
#include "core/ErrorCatalog.hpp"
#include "core/RegistryStore.hpp"
#include "net/DiscoverySession.hpp"
#include <algorithm>
#include <atomic>
#include <csignal>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <map>
#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace ipscout;
using json = nlohmann::json;

namespace {

std::atomic<bool> g_stop{false};

void on_signal(int) { g_stop = true; }

void print_usage(const char* prog) {
    std::cout << "Usage: " << prog << " [--db PATH] [--config PATH] [-v] <command> [options]\n"
              << "Commands:\n"
              << "  discover [--interface IP] [--timeout S] [--json] [--sort ip|mac|serial|type]\n"
              << "                     Broadcast a discovery request and print replies\n"
              << "  update [--interface IP] [--timeout S]\n"
              << "                     Discover and record results in the database\n"
              << "  list [--sort KEY] [--json] [--active-only] [--missing-hours H]\n"
              << "                     Show every recorded device with its status\n"
              << "  history --mac MAC  Show the address history of one device\n"
              << "  stats              Summary counts\n"
              << "  conflicts          Addresses claimed by more than one device\n"
              << "  export [--output PATH]\n"
              << "                     Write the database with build metadata\n"
              << "  serve [--port P] [--auto-scan S]\n"
              << "                     Run the WebSocket control channel\n"
              << "  version            Print build information\n"
              << "Global options:\n"
              << "  --db PATH          Device database (default camera_database.json)\n"
              << "  --config PATH      JSON config file\n"
              << "  -v, --verbose      Per-datagram diagnostics\n"
              << "  -h, --help         Show this help message and exit\n"
              << std::flush;
}

// Command options after the command word. Flags without a value map to "".
struct Options {
    std::map<std::string, std::string> values;

    bool has(const std::string& k) const { return values.count(k) != 0; }
    std::string get(const std::string& k, const std::string& def = {}) const {
        auto it = values.find(k);
        return it == values.end() ? def : it->second;
    }
};

bool takes_value(const std::string& flag) {
    static const std::set<std::string> with_value = {
        "--interface", "--timeout", "--sort", "--missing-hours", "--mac",
        "--output", "--port", "--auto-scan"
    };
    return with_value.count(flag) != 0;
}

Options parse_options(const std::vector<std::string>& args) {
    Options o;
    for (size_t i = 0; i < args.size(); ++i) {
        const auto& a = args[i];
        if (a.rfind("--", 0) != 0) throw Error(ErrorKind::InvalidArgument, "unexpected argument " + a);
        auto eq = a.find('=');
        if (eq != std::string::npos) {
            o.values[a.substr(0, eq)] = a.substr(eq + 1);
        } else if (takes_value(a)) {
            if (i + 1 >= args.size()) throw Error(ErrorKind::InvalidArgument, a + " needs a value");
            o.values[a] = args[++i];
        } else {
            o.values[a] = "";
        }
    }
    return o;
}

double parse_number(const std::string& flag, const std::string& text) {
    try {
        size_t used = 0;
        double v = std::stod(text, &used);
        if (used == text.size()) return v;
    } catch (const std::exception&) {
    }
    throw Error(ErrorKind::InvalidArgument, flag + " expects a number, got '" + text + "'");
}

net::DiscoveryOptions discovery_options(const Config& cfg, const Options& o) {
    net::DiscoveryOptions opts;
    opts.interface_address = o.get("--interface", cfg.interface_address);
    opts.timeout = cfg.timeout();
    if (o.has("--timeout")) {
        opts.timeout = timeout_from_seconds(parse_number("--timeout", o.get("--timeout")));
    }
    opts.verbose = cfg.verbose;
    return opts;
}

std::string pad(const std::string& s, size_t w) {
    if (s.size() >= w) return s.substr(0, w);
    return s + std::string(w - s.size(), ' ');
}

void print_descriptor_table(const std::vector<protocol::DeviceDescriptor>& devices) {
    std::cout << pad("MAC", 19) << pad("IP", 17) << pad("TYPE", 10) << pad("MODEL", 16)
              << pad("SERIAL", 14) << pad("NAME", 24) << "FIRMWARE\n";
    for (const auto& d : devices) {
        std::cout << pad(d.hardware_address, 19) << pad(d.ip_address, 17)
                  << pad(protocol::kind_name(d.kind), 10) << pad(d.model_name, 16)
                  << pad(d.serial_number, 14) << pad(d.device_name, 24) << d.firmware_version << "\n";
    }
}

void sort_descriptors(std::vector<protocol::DeviceDescriptor>& devices, const std::string& key) {
    auto ip_key = [](const std::string& ip) {
        try { return protocol::parse_ipv4(ip); } catch (const Error&) { return protocol::Ipv4Bytes{}; }
    };
    std::stable_sort(devices.begin(), devices.end(), [&](const auto& a, const auto& b) {
        if (key == "mac") return a.hardware_address < b.hardware_address;
        if (key == "serial") return a.serial_number < b.serial_number;
        if (key == "type") return std::string(protocol::kind_name(a.kind)) < protocol::kind_name(b.kind);
        return ip_key(a.ip_address) < ip_key(b.ip_address);
    });
}

void print_summary(const ChangeSummary& s) {
    std::cout << "New devices: " << s.new_devices.size() << "\n";
    for (const auto& m : s.new_devices) std::cout << "  + " << m << "\n";
    std::cout << "Updated: " << s.updated.size() << "\n";
    std::cout << "IP changes: " << s.ip_changed.size() << "\n";
    for (const auto& c : s.ip_changed) {
        std::cout << "  ~ " << c.hardware_address << " " << c.old_ip << " -> " << c.new_ip << "\n";
    }
}

// Owns everything a command needs; registry is loaded on construction.
struct App {
    Config cfg;
    std::shared_ptr<JsonFileStore> store;
    DeviceRegistry registry;
    ScanCoordinator scans;
    RegistryProtocol protocol;

    explicit App(const Config& c)
    : cfg(c),
      store(std::make_shared<JsonFileStore>(c.db_path)),
      registry(store, c.missing_threshold),
      scans(registry, std::make_shared<UdpDiscoveryRunner>()),
      protocol(registry, scans) {
        registry.load();
    }
};

int cmd_discover(const Config& cfg, const Options& o) {
    net::DiscoverySession session(discovery_options(cfg, o));
    auto result = session.run();
    sort_descriptors(result.devices, o.get("--sort", "ip"));
    if (o.has("--json")) {
        json out = json::array();
        for (const auto& d : result.devices) out.push_back(protocol::to_json(d));
        std::cout << out.dump(2) << std::endl;
    } else {
        print_descriptor_table(result.devices);
        std::cout << result.devices.size() << " device(s), " << result.error_count << " bad response(s)" << std::endl;
    }
    return 0;
}

int cmd_update(const Config& cfg, const Options& o) {
    App app(cfg);
    auto result = app.scans.scan(discovery_options(cfg, o));
    if (o.has("--json")) {
        std::cout << to_json(result).dump(2) << std::endl;
        return 0;
    }
    std::cout << "Discovered " << result.devices.size() << " device(s)" << std::endl;
    print_summary(result.summary);
    std::cout << "Database: " << app.store->path() << " (" << app.registry.size() << " device(s))" << std::endl;
    return 0;
}

int cmd_list(Config cfg, const Options& o) {
    if (o.has("--missing-hours")) {
        cfg.missing_threshold = threshold_from_hours(parse_number("--missing-hours", o.get("--missing-hours")));
    }
    App app(cfg);
    auto now = Clock::now();
    auto views = app.registry.list_records(sort_key_from_string(o.get("--sort", "last_seen")), now);
    if (o.has("--active-only")) {
        views.erase(std::remove_if(views.begin(), views.end(), [](const RecordView& v) {
            return v.status != DeviceStatus::Active && v.status != DeviceStatus::IpChanged;
        }), views.end());
    }
    if (o.has("--json")) {
        json out = json::array();
        for (const auto& v : views) out.push_back(RegistryProtocol::record_view(v));
        std::cout << out.dump(2) << std::endl;
        return 0;
    }
    std::cout << pad("STATUS", 12) << pad("MAC", 19) << pad("IP", 17) << pad("TYPE", 10)
              << pad("MODEL", 16) << pad("NAME", 24) << "LAST SEEN\n";
    for (const auto& v : views) {
        const auto& d = v.record.descriptor;
        std::cout << pad(status_name(v.status), 12) << pad(d.hardware_address, 19) << pad(d.ip_address, 17)
                  << pad(protocol::kind_name(d.kind), 10) << pad(d.model_name, 16) << pad(d.device_name, 24)
                  << format_local(v.record.last_seen) << "\n";
    }
    std::cout << views.size() << " device(s)" << std::endl;
    return 0;
}

int cmd_history(const Config& cfg, const Options& o) {
    if (!o.has("--mac")) throw Error(ErrorKind::InvalidArgument, "history needs --mac");
    App app(cfg);
    auto mac = protocol::normalize_mac(o.get("--mac"));
    json h = app.protocol.build_history(mac);
    if (h.is_null()) throw Error(ErrorKind::NotFound, mac);
    std::cout << h["mac_address"].get<std::string>() << " (" << h["device_name"].get<std::string>() << ")\n"
              << "  current ip: " << h["current_ip"].get<std::string>() << "\n"
              << "  discoveries: " << h["total_discoveries"].get<int64_t>() << "\n";
    for (const auto& e : h["ip_history"]) {
        std::cout << "  " << e["timestamp"].get<std::string>() << "  " << e["ip"].get<std::string>();
        if (!e["previous_ip"].is_null()) std::cout << "  (was " << e["previous_ip"].get<std::string>() << ")";
        std::cout << "\n";
    }
    std::cout << std::flush;
    return 0;
}

int cmd_stats(const Config& cfg) {
    App app(cfg);
    auto s = app.registry.stats(Clock::now());
    std::cout << "Total devices:      " << s.total << "\n"
              << "  Active:           " << s.active << "\n"
              << "  IP changed:       " << s.ip_changed << "\n"
              << "  Offline:          " << s.offline << "\n"
              << "  Missing:          " << s.missing << "\n"
              << "Cameras:            " << s.cameras << "\n"
              << "Recorders:          " << s.recorders << "\n"
              << "With IP changes:    " << s.devices_with_ip_changes << "\n"
              << "Total discoveries:  " << s.total_discoveries << "\n"
              << "Avg per device:     " << std::fixed << std::setprecision(1) << s.avg_discoveries_per_device
              << std::endl;
    return 0;
}

int cmd_conflicts(const Config& cfg) {
    App app(cfg);
    auto conflicts = app.registry.ip_conflicts();
    if (conflicts.empty()) {
        std::cout << "No IP conflicts" << std::endl;
        return 0;
    }
    for (const auto& c : conflicts) {
        std::cout << c.ip << ":";
        for (const auto& m : c.hardware_addresses) std::cout << " " << m;
        std::cout << "\n";
    }
    std::cout << std::flush;
    return 0;
}

int cmd_export(const Config& cfg, const Options& o) {
    App app(cfg);
    auto doc = app.protocol.build_export(Clock::now()).dump(2);
    if (!o.has("--output")) {
        std::cout << doc << std::endl;
        return 0;
    }
    auto path = o.get("--output");
    std::ofstream f(path);
    if (!f) throw Error(ErrorKind::PersistenceFailure, std::string(errors::D2500_OPEN_FAILED) + ": " + path);
    f << doc << "\n";
    if (!f) throw Error(ErrorKind::PersistenceFailure, std::string(errors::D2500_WRITE_FAILED) + ": " + path);
    std::cout << "Exported " << app.registry.size() << " device(s) to " << path << std::endl;
    return 0;
}

int cmd_serve(Config cfg, const Options& o) {
    if (o.has("--port")) cfg.port = port_from_number(parse_number("--port", o.get("--port")));
    if (o.has("--auto-scan")) {
        // 0 turns it off
        double every = parse_number("--auto-scan", o.get("--auto-scan"));
        cfg.auto_scan_enabled = every != 0.0;
        if (cfg.auto_scan_enabled) cfg.auto_scan_interval_s = interval_from_seconds(every);
    }

    App app(cfg);
    ControlServer server(cfg.port, app.registry, app.scans, discovery_options(cfg, Options{}));
    if (cfg.auto_scan_enabled) server.set_auto_scan(true, cfg.auto_scan_interval_s);
    server.start();

    std::cout << "ipscout control channel on ws://0.0.0.0:" << server.bound_port()
              << " (" << app.registry.size() << " device(s) in " << app.store->path() << ")" << std::endl;

    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);
    while (!g_stop) std::this_thread::sleep_for(std::chrono::milliseconds(200));

    std::cout << "Shutting down" << std::endl;
    server.stop();
    return 0;
}

int cmd_version() {
    std::cout << "ipscout " << buildinfo::version() << "\n"
              << "commit: " << buildinfo::git_commit() << "\n"
              << "built: " << buildinfo::build_time_utc_approx() << std::endl;
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    std::string config_path;
    std::string db_override;
    bool verbose = false;
    int i = 1;
    for (; i < argc; ++i) {
        std::string a(argv[i]);
        if (a == "-h" || a == "--help") {
            print_usage(argv[0]);
            return 0;
        }
        if (a == "-v" || a == "--verbose") { verbose = true; continue; }
        if ((a == "--db" || a == "--config") && i + 1 < argc) {
            (a == "--db" ? db_override : config_path) = argv[++i];
            continue;
        }
        if (a.rfind("--db=", 0) == 0) { db_override = a.substr(5); continue; }
        if (a.rfind("--config=", 0) == 0) { config_path = a.substr(9); continue; }
        if (a.rfind("-", 0) == 0) {
            std::cerr << "Unknown option " << a << std::endl;
            print_usage(argv[0]);
            return 2;
        }
        break;
    }
    if (i >= argc) {
        print_usage(argv[0]);
        return 2;
    }
    std::string command(argv[i]);
    std::vector<std::string> rest(argv + i + 1, argv + argc);

    try {
        Config cfg;
        if (!config_path.empty()) apply_config_file(cfg, config_path);
        apply_config_env(cfg);
        if (!db_override.empty()) cfg.db_path = db_override;
        if (verbose) cfg.verbose = true;

        auto opts = parse_options(rest);

        if (command == "discover") return cmd_discover(cfg, opts);
        if (command == "update") return cmd_update(cfg, opts);
        if (command == "list") return cmd_list(cfg, opts);
        if (command == "history") return cmd_history(cfg, opts);
        if (command == "stats") return cmd_stats(cfg);
        if (command == "conflicts") return cmd_conflicts(cfg);
        if (command == "export") return cmd_export(cfg, opts);
        if (command == "serve") return cmd_serve(cfg, opts);
        if (command == "version") return cmd_version();

        std::cerr << "Unknown command " << command << std::endl;
        print_usage(argv[0]);
        return 2;
    } catch (const Error& e) {
        std::cerr << e.what() << std::endl;
        return e.kind() == ErrorKind::InvalidArgument ? 2 : 1;
    } catch (const std::exception& e) {
        std::cerr << "ipscout: " << e.what() << std::endl;
        return 1;
    }
}
