#include "ScanCoordinator.hpp"
#include "core/ErrorCatalog.hpp"

#include <iostream>

using json = nlohmann::json;

namespace ipscout {

net::DiscoveryResult UdpDiscoveryRunner::run(const net::DiscoveryOptions& opts) {
    net::DiscoverySession session(opts);
    {
        std::lock_guard<std::mutex> lk(m_);
        current_ = &session;
        if (cancel_pending_) session.cancel();
        cancel_pending_ = false;
    }
    struct Clear {
        UdpDiscoveryRunner* self;
        ~Clear() {
            std::lock_guard<std::mutex> lk(self->m_);
            self->current_ = nullptr;
            self->cancel_pending_ = false;
        }
    } clear{this};
    return session.run();
}

void UdpDiscoveryRunner::cancel() {
    std::lock_guard<std::mutex> lk(m_);
    // a scan claimed but not yet listening picks this up in run()
    if (current_) current_->cancel();
    else cancel_pending_ = true;
}

void UdpDiscoveryRunner::discard_pending_cancel() {
    std::lock_guard<std::mutex> lk(m_);
    cancel_pending_ = false;
}

json to_json(const ScanResult& r) {
    json devices = json::array();
    for (const auto& d : r.devices) devices.push_back(protocol::to_json(d));
    return {
        {"summary", to_json(r.summary)},
        {"devices", devices},
        {"error_count", r.error_count},
        {"responses", r.responses},
        {"cancelled", r.cancelled}
    };
}

ScanCoordinator::ScanCoordinator(DeviceRegistry& registry, std::shared_ptr<IDiscoveryRunner> runner)
: registry_(registry), runner_(std::move(runner)) {}

ScanCoordinator::~ScanCoordinator() {
    cancel();
    wait();
}

DeviceRegistry::ScanToken ScanCoordinator::claim() {
    std::lock_guard<std::mutex> lk(cancel_m_);
    auto token = registry_.try_begin_scan();
    // a cancel that reached the runner after the previous scan stopped
    // listening belongs to that scan, not this one
    runner_->discard_pending_cancel();
    return token;
}

ScanResult ScanCoordinator::run_locked(DeviceRegistry::ScanToken token, const net::DiscoveryOptions& opts) {
    auto found = runner_->run(opts);

    ScanResult out;
    out.error_count = found.error_count;
    out.responses = found.responses;
    out.cancelled = found.cancelled;

    // partial results of a cancelled run are reconciled too
    auto now = Clock::now();
    out.summary = registry_.reconcile(found.devices, now);
    out.devices = std::move(found.devices);
    {
        std::lock_guard<std::mutex> lk(time_m_);
        last_scan_ = now;
    }
    token.release();

    std::cerr << "ScanCoordinator: " << out.summary.new_devices.size() << " new, "
              << out.summary.updated.size() << " updated, "
              << out.summary.ip_changed.size() << " ip changed" << std::endl;
    return out;
}

ScanResult ScanCoordinator::scan(const net::DiscoveryOptions& opts) {
    auto token = claim();
    return run_locked(std::move(token), opts);
}

void ScanCoordinator::start_async(const net::DiscoveryOptions& opts, std::function<void(const ScanOutcome&)> done) {
    auto token = claim();

    std::lock_guard<std::mutex> lk(worker_m_);
    // previous worker has already released its token, so it is finishing up
    if (worker_.joinable()) worker_.join();

    worker_ = std::thread([this, opts, done = std::move(done), token = std::move(token)]() mutable {
        ScanOutcome outcome;
        try {
            outcome.result = run_locked(std::move(token), opts);
        } catch (const Error& e) {
            outcome.error_code = e.code();
            outcome.error = e.what();
            std::cerr << "ScanCoordinator: scan failed: " << e.what() << std::endl;
        } catch (const std::exception& e) {
            outcome.error_code = errors::E2300_SOCKET_ERROR;
            outcome.error = e.what();
            std::cerr << "ScanCoordinator: scan failed: " << e.what() << std::endl;
        }
        if (done) done(outcome);
    });
}

void ScanCoordinator::cancel() {
    std::lock_guard<std::mutex> lk(cancel_m_);
    if (registry_.scan_in_progress()) runner_->cancel();
}

bool ScanCoordinator::in_progress() const {
    return registry_.scan_in_progress();
}

std::optional<TimePoint> ScanCoordinator::last_scan_time() const {
    std::lock_guard<std::mutex> lk(time_m_);
    return last_scan_;
}

void ScanCoordinator::wait() {
    std::lock_guard<std::mutex> lk(worker_m_);
    if (worker_.joinable()) worker_.join();
}

} // namespace ipscout
