#pragma once
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <nlohmann/json.hpp>

#include "DeviceRegistry.hpp"
#include "net/DiscoverySession.hpp"

namespace ipscout {

// Seam between the coordinator and the network; tests substitute a fake.
class IDiscoveryRunner {
public:
    virtual ~IDiscoveryRunner() = default;
    virtual net::DiscoveryResult run(const net::DiscoveryOptions& opts) = 0;
    // May arrive before run() starts listening; the next run() honours it.
    virtual void cancel() = 0;
    // Forget a cancel that no run() has consumed.
    virtual void discard_pending_cancel() = 0;
};

// Runs a real DiscoverySession per call.
class UdpDiscoveryRunner : public IDiscoveryRunner {
public:
    net::DiscoveryResult run(const net::DiscoveryOptions& opts) override;
    void cancel() override;
    void discard_pending_cancel() override;

private:
    std::mutex m_;
    net::DiscoverySession* current_ = nullptr;
    bool cancel_pending_ = false;
};

struct ScanResult {
    ChangeSummary summary;
    std::vector<protocol::DeviceDescriptor> devices;
    int error_count = 0;
    int responses = 0;
    bool cancelled = false;
};

nlohmann::json to_json(const ScanResult& r);

struct ScanOutcome {
    std::optional<ScanResult> result;
    int error_code = 0;
    std::string error;
};

/**
 * @brief Discovery followed by reconciliation, one at a time.
 *
 * The single-flight flag lives in the registry; a second request while a scan
 * is running fails with Error(ScanAlreadyInProgress) instead of queueing.
 * No timer lives here; periodic scanning is the caller's business.
 */
class ScanCoordinator {
public:
    ScanCoordinator(DeviceRegistry& registry, std::shared_ptr<IDiscoveryRunner> runner);
    ~ScanCoordinator();

    // Blocking. Throws ScanAlreadyInProgress, SocketError or PersistenceFailure.
    ScanResult scan(const net::DiscoveryOptions& opts);

    // Claims the scan slot now (throws ScanAlreadyInProgress), then runs on a
    // worker thread and reports through done.
    void start_async(const net::DiscoveryOptions& opts, std::function<void(const ScanOutcome&)> done);

    void cancel();
    bool in_progress() const;
    std::optional<TimePoint> last_scan_time() const;

    // Join the worker of a finished async scan, if any.
    void wait();

private:
    DeviceRegistry::ScanToken claim();
    ScanResult run_locked(DeviceRegistry::ScanToken token, const net::DiscoveryOptions& opts);

    DeviceRegistry& registry_;
    std::shared_ptr<IDiscoveryRunner> runner_;
    std::thread worker_;
    std::mutex worker_m_;
    // orders cancel() against claiming the scan slot
    std::mutex cancel_m_;
    mutable std::mutex time_m_;
    std::optional<TimePoint> last_scan_;
};

} // namespace ipscout
