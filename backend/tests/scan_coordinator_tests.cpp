#include <gtest/gtest.h>
#include "ScanCoordinator.hpp"
#include "ControlServer.hpp"
#include "core/ErrorCatalog.hpp"
#include "core/RegistryStore.hpp"
#include "test_frames.hpp"

#include <condition_variable>
#include <future>
#include <mutex>

using namespace ipscout;
using nlohmann::json;
using test_support::make_camera;

namespace {

// Returns canned devices; optionally blocks until released or cancelled.
class FakeRunner : public IDiscoveryRunner {
public:
    std::vector<protocol::DeviceDescriptor> devices;
    bool block = false;
    bool fail = false;

    net::DiscoveryResult run(const net::DiscoveryOptions&) override {
        std::unique_lock<std::mutex> lk(m);
        runs += 1;
        entered = true;
        cv.notify_all();
        if (fail) throw Error(ErrorKind::SocketError, "bind failed: fake");
        if (block) cv.wait(lk, [this] { return released || cancelled; });
        net::DiscoveryResult r;
        r.devices = devices;
        r.responses = static_cast<int>(devices.size());
        r.cancelled = cancelled;
        return r;
    }

    void cancel() override {
        std::lock_guard<std::mutex> lk(m);
        cancelled = true;
        cv.notify_all();
    }

    void discard_pending_cancel() override {
        std::lock_guard<std::mutex> lk(m);
        cancelled = false;
    }

    void wait_entered() {
        std::unique_lock<std::mutex> lk(m);
        cv.wait(lk, [this] { return entered; });
    }

    void release() {
        std::lock_guard<std::mutex> lk(m);
        released = true;
        cv.notify_all();
    }

    int runs = 0;

private:
    std::mutex m;
    std::condition_variable cv;
    bool entered = false;
    bool released = false;
    bool cancelled = false;
};

// Holds the first save open until released, so a test can act while a
// scan is reconciling.
class GateStore : public RegistryStore {
public:
    RegistrySnapshot load() override { return {}; }

    void save(const RegistrySnapshot&) override {
        std::unique_lock<std::mutex> lk(m);
        saving = true;
        cv.notify_all();
        cv.wait(lk, [this] { return open; });
    }

    std::string describe() const override { return "gate"; }

    void wait_saving() {
        std::unique_lock<std::mutex> lk(m);
        cv.wait(lk, [this] { return saving; });
    }

    void release() {
        std::lock_guard<std::mutex> lk(m);
        open = true;
        cv.notify_all();
    }

private:
    std::mutex m;
    std::condition_variable cv;
    bool saving = false;
    bool open = false;
};

struct CoordinatorTest : public ::testing::Test {
    std::shared_ptr<MemoryStore> store = std::make_shared<MemoryStore>();
    DeviceRegistry registry{store};
    std::shared_ptr<FakeRunner> runner = std::make_shared<FakeRunner>();
    ScanCoordinator scans{registry, runner};
};

} // namespace

TEST_F(CoordinatorTest, ScanReconcilesResults) {
    runner->devices = {make_camera("d4:2d:c5:14:c5:70", "192.168.1.101")};
    auto result = scans.scan({});
    EXPECT_EQ(result.summary.new_devices.size(), 1u);
    EXPECT_EQ(result.devices.size(), 1u);
    EXPECT_EQ(registry.size(), 1u);
    EXPECT_FALSE(scans.in_progress());
    EXPECT_TRUE(scans.last_scan_time().has_value());

    auto j = to_json(result);
    EXPECT_EQ(j["summary"]["new"].size(), 1u);
    EXPECT_EQ(j["devices"][0]["device_type"], "camera");
}

TEST_F(CoordinatorTest, SecondScanWhileRunningIsRejected) {
    runner->block = true;
    std::promise<ScanOutcome> done;
    scans.start_async({}, [&](const ScanOutcome& o) { done.set_value(o); });
    runner->wait_entered();
    EXPECT_TRUE(scans.in_progress());

    try {
        scans.scan({});
        FAIL() << "expected ScanAlreadyInProgress";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::ScanAlreadyInProgress);
    }
    EXPECT_THROW(scans.start_async({}, nullptr), Error);

    runner->release();
    auto outcome = done.get_future().get();
    ASSERT_TRUE(outcome.result.has_value());
    scans.wait();
    EXPECT_FALSE(scans.in_progress());
    EXPECT_EQ(runner->runs, 1);
}

TEST_F(CoordinatorTest, CancelKeepsPartialResults) {
    runner->block = true;
    runner->devices = {make_camera("00:80:45:00:00:01", "10.0.0.1")};
    std::promise<ScanOutcome> done;
    scans.start_async({}, [&](const ScanOutcome& o) { done.set_value(o); });
    runner->wait_entered();
    scans.cancel();

    auto outcome = done.get_future().get();
    ASSERT_TRUE(outcome.result.has_value());
    EXPECT_TRUE(outcome.result->cancelled);
    EXPECT_EQ(registry.size(), 1u);
}

TEST(ScanCancel, CancelDuringReconcileDoesNotReachNextScan) {
    auto store = std::make_shared<GateStore>();
    DeviceRegistry registry{store};
    auto runner = std::make_shared<FakeRunner>();
    ScanCoordinator scans{registry, runner};
    runner->devices = {make_camera("d4:2d:c5:14:c5:70", "192.168.1.101")};

    std::promise<ScanOutcome> done;
    scans.start_async({}, [&](const ScanOutcome& o) { done.set_value(o); });
    store->wait_saving();
    // discovery already returned; the scan still holds the slot
    EXPECT_TRUE(scans.in_progress());
    scans.cancel();
    store->release();

    auto first = done.get_future().get();
    ASSERT_TRUE(first.result.has_value());
    EXPECT_FALSE(first.result->cancelled);
    scans.wait();

    auto second = scans.scan({});
    EXPECT_FALSE(second.cancelled);
    ASSERT_EQ(second.devices.size(), 1u);
    EXPECT_EQ(second.summary.updated.size(), 1u);
    EXPECT_EQ(runner->runs, 2);
}

TEST(ScanCancel, UdpRunnerForgetsDiscardedCancel) {
    net::DiscoveryOptions opts;
    opts.interface_address = "127.0.0.1";
    opts.target_address = "127.0.0.1";
    opts.target_port = 9;
    opts.bind_port = 0;
    opts.timeout = std::chrono::milliseconds(100);

    UdpDiscoveryRunner runner;
    runner.cancel();
    EXPECT_TRUE(runner.run(opts).cancelled);

    runner.cancel();
    runner.discard_pending_cancel();
    EXPECT_FALSE(runner.run(opts).cancelled);
}

TEST_F(CoordinatorTest, RunnerFailureIsReportedAndSlotFreed) {
    runner->fail = true;
    std::promise<ScanOutcome> done;
    scans.start_async({}, [&](const ScanOutcome& o) { done.set_value(o); });
    auto outcome = done.get_future().get();
    EXPECT_FALSE(outcome.result.has_value());
    EXPECT_EQ(outcome.error_code, errors::E2300_SOCKET_ERROR);
    scans.wait();
    EXPECT_FALSE(scans.in_progress());

    runner->fail = false;
    EXPECT_NO_THROW(scans.scan({}));
}

TEST_F(CoordinatorTest, PersistenceFailureSurfaces) {
    runner->devices = {make_camera("00:80:45:00:00:01", "10.0.0.1")};
    store->set_fail_saves(true);
    EXPECT_THROW(scans.scan({}), Error);
    EXPECT_EQ(registry.size(), 0u);
    EXPECT_FALSE(scans.in_progress());
}

// Control channel requests are handled without a network connection.
TEST_F(CoordinatorTest, ControlRequests) {
    runner->devices = {make_camera("d4:2d:c5:14:c5:70", "192.168.1.101"),
                       make_camera("00:80:45:00:00:02", "192.168.1.101")};
    scans.scan({});
    ControlServer server(0, registry, scans, net::DiscoveryOptions{});

    auto rpc = [&](const std::string& method, json params) {
        return server.handle_control({{"type", "rpc"}, {"id", 7}, {"method", method}, {"params", params}});
    };

    auto list = rpc("devices.list", {{"sort", "mac"}});
    ASSERT_TRUE(list["ok"].get<bool>());
    EXPECT_EQ(list["type"], "rpc_result");
    EXPECT_EQ(list["id"], 7);
    EXPECT_EQ(list["result"]["count"], 2);
    EXPECT_EQ(list["result"]["devices"][0]["mac_address"], "00:80:45:00:00:02");
    EXPECT_EQ(list["result"]["devices"][0]["status"], "Active");

    auto get = rpc("devices.get", {{"mac", "D4-2D-C5-14-C5-70"}});
    ASSERT_TRUE(get["ok"].get<bool>());
    EXPECT_EQ(get["result"]["current_ip"], "192.168.1.101");

    auto missing = rpc("devices.get", {{"mac", "00:00:00:00:00:01"}});
    EXPECT_FALSE(missing["ok"].get<bool>());
    EXPECT_EQ(missing["error"]["code"], errors::E2700_NOT_FOUND);

    auto bad_mac = rpc("devices.history", {{"mac", "xyz"}});
    EXPECT_EQ(bad_mac["error"]["code"], errors::E2100_INVALID_ADDRESS);

    auto no_mac = rpc("devices.history", json::object());
    EXPECT_EQ(no_mac["error"]["code"], errors::E2400_CONTROL_REJECTED);

    auto conflicts = rpc("conflicts", json::object());
    ASSERT_EQ(conflicts["result"]["conflicts"].size(), 1u);
    EXPECT_EQ(conflicts["result"]["conflicts"][0]["ip"], "192.168.1.101");

    auto stats = rpc("stats", json::object());
    EXPECT_EQ(stats["result"]["total"], 2);
    EXPECT_EQ(stats["result"]["auto_scan_enabled"], false);

    auto autoscan = rpc("autoscan.set", {{"enabled", true}, {"interval_s", 60}});
    ASSERT_TRUE(autoscan["ok"].get<bool>());
    EXPECT_TRUE(server.auto_scan_enabled());
    EXPECT_EQ(server.auto_scan_interval(), 60);
    auto bad_interval = rpc("autoscan.set", {{"interval_s", 0}});
    EXPECT_FALSE(bad_interval["ok"].get<bool>());
    auto huge_interval = rpc("autoscan.set", {{"interval_s", 1e300}});
    EXPECT_EQ(huge_interval["error"]["code"], errors::E2400_CONTROL_REJECTED);
    EXPECT_EQ(server.auto_scan_interval(), 60);

    auto huge_timeout = rpc("scan", {{"timeout_s", 1e300}});
    EXPECT_FALSE(huge_timeout["ok"].get<bool>());
    EXPECT_EQ(huge_timeout["error"]["code"], errors::E2400_CONTROL_REJECTED);
    EXPECT_FALSE(scans.in_progress());

    auto exported = rpc("export", json::object());
    EXPECT_EQ(exported["result"]["type"], "ipscout_export");
    EXPECT_TRUE(exported["result"]["devices"].contains("d4:2d:c5:14:c5:70"));

    auto unknown = rpc("reboot", json::object());
    EXPECT_FALSE(unknown["ok"].get<bool>());
    EXPECT_EQ(unknown["error"]["code"], errors::E2400_CONTROL_REJECTED);

    auto not_rpc = server.handle_control({{"cmd", "reload"}});
    EXPECT_FALSE(not_rpc["ok"].get<bool>());
    EXPECT_TRUE(not_rpc["id"].is_null());
}

TEST_F(CoordinatorTest, ControlScanReportsInProgress) {
    runner->block = true;
    ControlServer server(0, registry, scans, net::DiscoveryOptions{});
    auto first = server.handle_control({{"type", "rpc"}, {"id", "a"}, {"method", "scan"}});
    ASSERT_TRUE(first["ok"].get<bool>());
    runner->wait_entered();

    auto second = server.handle_control({{"type", "rpc"}, {"id", "b"}, {"method", "scan"}});
    EXPECT_FALSE(second["ok"].get<bool>());
    EXPECT_EQ(second["error"]["code"], errors::E2600_SCAN_IN_PROGRESS);

    auto cancel = server.handle_control({{"type", "rpc"}, {"id", "c"}, {"method", "scan.cancel"}});
    EXPECT_TRUE(cancel["result"]["cancelled"].get<bool>());
    scans.wait();
    EXPECT_FALSE(scans.in_progress());
}
