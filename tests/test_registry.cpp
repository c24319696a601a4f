#include <gtest/gtest.h>
#include <thread>
#include <vector>
#include "registry.hpp"
#include "test_util.hpp"

using registry::Clock;

namespace {
Clock::time_point at_ms(int64_t ms) {
    return Clock::time_point(std::chrono::milliseconds(ms));
}
}

TEST(DeviceRegistry, UpsertCreatesAndUpdates) {
    testutil::TempDir dir;
    registry::DeviceRegistry devices(dir.file("devices.json"));

    devices.upsert("SN1", "10.0.0.5", "potentiostat", at_ms(1000));
    ASSERT_EQ(devices.size(), 1u);

    auto rec = devices.upsert("SN1", "10.0.0.6", "spectrometer", at_ms(2000));
    EXPECT_EQ(rec.ip, "10.0.0.6");
    EXPECT_EQ(rec.device_type, "spectrometer");
    EXPECT_EQ(rec.last_seen, at_ms(2000));
    EXPECT_EQ(devices.size(), 1u);
}

TEST(DeviceRegistry, LastSeenNeverMovesBackwards) {
    testutil::TempDir dir;
    registry::DeviceRegistry devices(dir.file("devices.json"));
    devices.upsert("SN1", "ip", "t", at_ms(5000));
    auto rec = devices.upsert("SN1", "ip2", "t", at_ms(4000));
    EXPECT_EQ(rec.last_seen, at_ms(5000));
    EXPECT_EQ(rec.ip, "ip2");
}

TEST(DeviceRegistry, LastSeenKeepsMillisecondPrecision) {
    testutil::TempDir dir;
    registry::DeviceRegistry devices(dir.file("devices.json"));
    auto now = Clock::now();
    auto rec = devices.upsert("SN1", "ip", "t", now);
    EXPECT_EQ(rec.last_seen, std::chrono::time_point_cast<std::chrono::milliseconds>(now));
}

TEST(DeviceRegistry, PersistAndReload) {
    testutil::TempDir dir;
    std::string path = dir.file("nested/devices.json");
    {
        registry::DeviceRegistry devices(path);
        devices.upsert("SN1", "10.0.0.5", "potentiostat", at_ms(1714564800250LL));
        devices.upsert("SN2", "10.0.0.7", "UNKNOWN", at_ms(1714564801000LL));
        ASSERT_TRUE(devices.persist());
    }

    auto j = nlohmann::json::parse(testutil::read_file(path));
    ASSERT_TRUE(j.contains("SN1"));
    EXPECT_EQ(j["SN1"]["ip"], "10.0.0.5");
    EXPECT_DOUBLE_EQ(j["SN1"]["last_seen"].get<double>(), 1714564800.25);

    registry::DeviceRegistry reloaded(path);
    EXPECT_EQ(reloaded.load(), 2u);
    auto rec = reloaded.find("SN1");
    ASSERT_TRUE(rec.has_value());
    EXPECT_EQ(rec->last_seen, at_ms(1714564800250LL));
    EXPECT_EQ(rec->device_type, "potentiostat");
}

TEST(DeviceRegistry, CorruptOrMissingSnapshotLoadsEmpty) {
    testutil::TempDir dir;
    registry::DeviceRegistry missing(dir.file("none.json"));
    EXPECT_EQ(missing.load(), 0u);

    testutil::write_file(dir.file("bad.json"), "{\"SN1\": ");
    registry::DeviceRegistry corrupt(dir.file("bad.json"));
    EXPECT_EQ(corrupt.load(), 0u);
}

TEST(DeviceRegistry, MalformedEntriesAreSkipped) {
    testutil::TempDir dir;
    testutil::write_file(dir.file("mixed.json"),
        R"({"SN1": {"ip": "1.2.3.4", "device_type": "x", "last_seen": 10.5}, "SN2": {"device_type": "y"}})");
    registry::DeviceRegistry devices(dir.file("mixed.json"));
    EXPECT_EQ(devices.load(), 1u);
    EXPECT_TRUE(devices.find("SN1").has_value());
    EXPECT_FALSE(devices.find("SN2").has_value());
}

TEST(DeviceRegistry, ConcurrentUpsertsAllLand) {
    testutil::TempDir dir;
    registry::DeviceRegistry devices(dir.file("devices.json"));
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; ++t) {
        threads.emplace_back([&devices, t]() {
            for (int i = 0; i < 25; ++i) {
                devices.upsert("SN" + std::to_string(t) + "_" + std::to_string(i), "ip", "t", Clock::now());
                devices.persist();
            }
        });
    }
    for (auto& th : threads) th.join();
    EXPECT_EQ(devices.size(), 200u);

    registry::DeviceRegistry reloaded(dir.file("devices.json"));
    EXPECT_EQ(reloaded.load(), 200u);
}

TEST(TelemetryStore, KeepsLatestPayloadPerSerial) {
    testutil::TempDir dir;
    registry::TelemetryStore store(dir.file("telemetry.json"));
    store.record("SN1", {{"t", 20}}, at_ms(1000));
    store.record("SN1", {{"t", 21}}, at_ms(2000));
    store.record("SN2", {{"v", 1}}, at_ms(1500));

    auto latest = store.latest("SN1");
    ASSERT_TRUE(latest.has_value());
    EXPECT_EQ(latest->payload["t"], 21);
    EXPECT_EQ(store.snapshot().size(), 2u);
    EXPECT_FALSE(store.latest("SN3").has_value());
}

TEST(TelemetryStore, PersistAndReload) {
    testutil::TempDir dir;
    std::string path = dir.file("telemetry.json");
    {
        registry::TelemetryStore store(path);
        store.record("SN1", {{"t", 20.5}}, at_ms(1714564800250LL));
        ASSERT_TRUE(store.persist());
    }
    auto j = nlohmann::json::parse(testutil::read_file(path));
    EXPECT_EQ(j["SN1"]["timestamp"], "2024-05-01T12:00:00.250Z");

    registry::TelemetryStore reloaded(path);
    EXPECT_EQ(reloaded.load(), 1u);
    EXPECT_EQ(reloaded.latest("SN1")->timestamp, at_ms(1714564800250LL));
}
