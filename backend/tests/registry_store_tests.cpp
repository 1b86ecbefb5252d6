#include <gtest/gtest.h>
#include "DeviceRegistry.hpp"
#include "core/ErrorCatalog.hpp"
#include "core/RegistryStore.hpp"
#include "protocol/DeviceClassifier.hpp"
#include "test_frames.hpp"
#include <nlohmann/json.hpp>
#include <filesystem>
#include <fstream>

using namespace ipscout;
using nlohmann::json;
using test_support::make_camera;
using test_support::make_recorder;

namespace fs = std::filesystem;

static fs::path temp_db(const std::string& name) {
    fs::path p = fs::temp_directory_path() / ("ipscout_" + name);
    std::error_code ec;
    fs::remove(p, ec);
    fs::remove(p.string() + ".tmp", ec);
    return p;
}

static void write_file(const fs::path& p, const std::string& body) {
    std::ofstream f(p);
    f << body;
}

TEST(JsonFileStore, MissingFileLoadsEmpty) {
    JsonFileStore store(temp_db("missing.json").string());
    auto snap = store.load();
    EXPECT_TRUE(snap.records.empty());
    EXPECT_TRUE(snap.latest_scan.empty());
}

TEST(JsonFileStore, CorruptFileLoadsEmpty) {
    auto p = temp_db("corrupt.json");
    write_file(p, "{ this is not json");
    JsonFileStore store(p.string());
    EXPECT_TRUE(store.load().records.empty());
}

TEST(JsonFileStore, RegistryRoundTripThroughFile) {
    auto p = temp_db("roundtrip.json");
    const auto t0 = Clock::from_time_t(1700000000);
    {
        DeviceRegistry reg(std::make_shared<JsonFileStore>(p.string()));
        reg.load();
        reg.reconcile({make_camera("d4:2d:c5:14:c5:70", "192.168.1.101"),
                       make_recorder("00:80:45:00:00:03", "192.168.1.3")}, t0);
        reg.reconcile({make_camera("d4:2d:c5:14:c5:70", "192.168.1.150")}, t0 + std::chrono::hours(1));
    }
    EXPECT_TRUE(fs::exists(p));
    EXPECT_FALSE(fs::exists(p.string() + ".tmp"));

    std::ifstream f(p);
    json j = json::parse(f);
    ASSERT_TRUE(j.contains("d4:2d:c5:14:c5:70"));
    const auto& cam = j["d4:2d:c5:14:c5:70"];
    EXPECT_EQ(cam["current_ip"], "192.168.1.150");
    EXPECT_EQ(cam["device_type"], "camera");
    EXPECT_EQ(cam["total_discoveries"], 2);
    EXPECT_EQ(cam["seen_in_last_discovery"], true);
    EXPECT_EQ(cam["ip_history"].size(), 2u);
    EXPECT_EQ(j["00:80:45:00:00:03"]["seen_in_last_discovery"], false);
    EXPECT_EQ(j["00:80:45:00:00:03"]["channel_count"], 16);

    DeviceRegistry again(std::make_shared<JsonFileStore>(p.string()));
    again.load();
    ASSERT_EQ(again.size(), 2u);
    auto rec = again.get_record("d4:2d:c5:14:c5:70");
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->first_seen, t0);
    EXPECT_EQ(rec->last_seen, t0 + std::chrono::hours(1));
    EXPECT_EQ(rec->descriptor.model_name, "WV-S1234");
    ASSERT_EQ(rec->ip_history.size(), 2u);
    EXPECT_EQ(rec->ip_history[1].previous_ip.value_or(""), "192.168.1.101");
    auto nvr = again.get_record("00:80:45:00:00:03");
    ASSERT_TRUE(nvr.has_value());
    ASSERT_TRUE(protocol::is_recorder(nvr->descriptor.kind));
    EXPECT_EQ(std::get<protocol::RecorderInfo>(nvr->descriptor.kind).channel_count.value_or(0), 16);
}

TEST(JsonFileStore, ReadsLegacyCameraName) {
    auto p = temp_db("legacy.json");
    write_file(p, R"({
      "D4:2D:C5:14:C5:70": {
        "mac_address": "D4:2D:C5:14:C5:70",
        "camera_name": "Front Door",
        "model_name": "WV-S1234",
        "current_ip": "192.168.1.101",
        "first_seen": "2024-01-02T03:04:05.000000",
        "last_seen": "2024-01-03T03:04:05.000000",
        "total_discoveries": 4,
        "seen_in_last_discovery": true
      },
      "broken": { "mac_address": "nope" }
    })");
    JsonFileStore store(p.string());
    auto snap = store.load();
    ASSERT_EQ(snap.records.size(), 1u);
    const auto& r = snap.records.at("d4:2d:c5:14:c5:70");
    EXPECT_EQ(r.descriptor.device_name, "Front Door");
    EXPECT_EQ(r.total_discoveries, 4);
    // history rebuilt so it ends at the current address
    ASSERT_EQ(r.ip_history.size(), 1u);
    EXPECT_EQ(r.ip_history[0].ip, "192.168.1.101");
    EXPECT_EQ(snap.latest_scan.count("d4:2d:c5:14:c5:70"), 1u);
}

TEST(JsonFileStore, UnwritableTargetThrows) {
    auto dir = temp_db("blocked_dir");
    fs::create_directories(dir);
    // the target path is a directory, so the rename cannot succeed
    JsonFileStore store(dir.string());
    try {
        store.save(RegistrySnapshot{});
        FAIL() << "expected PersistenceFailure";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::PersistenceFailure);
    }
    EXPECT_FALSE(fs::exists(dir.string() + ".tmp"));
}

TEST(JsonFileStore, NonUtf8DeviceNamePersists) {
    auto p = temp_db("latin1.json");
    auto frame = test_support::FrameBuilder("d4:2d:c5:14:c5:71")
        .ip(protocol::tags::IpAddress, "192.168.1.102")
        .str(protocol::tags::DeviceName, "Caf\xe9 \x83\x4a")
        .finish();
    auto device = protocol::classify(protocol::decode_response(frame));

    DeviceRegistry reg(std::make_shared<JsonFileStore>(p.string()));
    reg.load();
    const auto t0 = Clock::from_time_t(1700000000);
    EXPECT_NO_THROW(reg.reconcile({device}, t0));
    EXPECT_NO_THROW(reg.reconcile({device}, t0 + std::chrono::minutes(5)));
    EXPECT_EQ(reg.size(), 1u);
    EXPECT_FALSE(fs::exists(p.string() + ".tmp"));

    std::ifstream f(p);
    json j = json::parse(f);
    EXPECT_EQ(j["d4:2d:c5:14:c5:71"]["total_discoveries"], 2);
}

TEST(JsonFileStore, UnencodableRecordIsPersistenceFailure) {
    auto p = temp_db("unencodable.json");
    // bypasses the classifier, so the raw byte reaches the encoder
    auto cam = make_camera("d4:2d:c5:14:c5:72", "192.168.1.103", "Caf\xe9");
    DeviceRegistry reg(std::make_shared<JsonFileStore>(p.string()));
    reg.load();
    try {
        reg.reconcile({cam}, Clock::from_time_t(1700000000));
        FAIL() << "expected PersistenceFailure";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::PersistenceFailure);
    }
    EXPECT_EQ(reg.size(), 0u);
    EXPECT_FALSE(fs::exists(p));
    EXPECT_FALSE(fs::exists(p.string() + ".tmp"));
}

TEST(MemoryStore, CountsSavesAndCanFail) {
    MemoryStore store;
    store.save(RegistrySnapshot{});
    EXPECT_EQ(store.save_count(), 1);
    store.set_fail_saves(true);
    EXPECT_THROW(store.save(RegistrySnapshot{}), Error);
    EXPECT_EQ(store.save_count(), 1);
}
