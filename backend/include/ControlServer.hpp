#pragma once
#include <thread>
#include <atomic>
#include <cstdint>
#include <functional>
#include <string>
#include <memory>
#include <nlohmann/json.hpp>

#include "net/DiscoverySession.hpp"

namespace ipscout {

class RegistryProtocol;
class DeviceRegistry;
class ScanCoordinator;

/**
 * @brief Control channel: JSON-RPC style requests over WebSocket.
 *
 * Request:  {"type":"rpc","id":..,"method":"..","params":{..}}
 * Reply:    {"type":"rpc_result","id":..,"ok":true,"result":..}
 *           {"type":"rpc_result","id":..,"ok":false,"error":{"code":..,"message":..}}
 *
 * Completed scans are pushed to every client as {"type":"scan_complete",..}.
 * When auto-scan is on, a scan is started every interval seconds; a tick that
 * finds a scan already running is skipped.
 */
class ControlServer {
public:
    ControlServer(int port, DeviceRegistry& registry, ScanCoordinator& scans,
                    net::DiscoveryOptions scan_options);
    ~ControlServer();

    // Throws Error(SocketError) if the port cannot be bound. Port 0 picks one.
    void start();
    void stop();
    uint16_t bound_port() const;

    // Handle one control message and return the reply. Never throws.
    nlohmann::json handle_control(const nlohmann::json& msg);

    void set_auto_scan(bool enabled, int interval_s);
    bool auto_scan_enabled() const { return auto_scan_on; }
    int auto_scan_interval() const { return auto_scan_interval_s; }

    // Queue msg for every connected client.
    void broadcast(const nlohmann::json& msg);

private:
    nlohmann::json dispatch(const std::string& method, const nlohmann::json& params);
    void start_scan(const nlohmann::json& params);
    void run_event_loop();
    void auto_scan_loop();

    int port;
    std::atomic<bool> running;
    std::thread event_thread;
    std::thread auto_scan_thread;

    std::atomic<bool> auto_scan_on{false};
    std::atomic<int> auto_scan_interval_s{300};

    DeviceRegistry& registry;
    ScanCoordinator& scans;
    net::DiscoveryOptions scan_options;
    std::unique_ptr<RegistryProtocol> protocol;

    struct Impl;
    std::shared_ptr<Impl> impl;
};

} // namespace ipscout
