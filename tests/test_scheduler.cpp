/**
 * @file test_scheduler.cpp
 * @brief RotationScheduler decision table, failure handling and interface isolation
 *
 * Time is driven by FakeClock and tick() is called directly, except for
 * the worker tests at the end.
 */

#include <gtest/gtest.h>
#include "rotap_scheduler.hpp"
#include "test_helpers.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <thread>

using namespace rotap;
using namespace rotap::test;
using namespace std::chrono_literals;
using nlohmann::json;

static InterfaceConfig make_interface(const std::string& name) {
    InterfaceConfig ic;
    ic.name = name;
    ic.ap_ip = "192.168.4.1";
    ic.dhcp_range_start = "192.168.4.10";
    ic.dhcp_range_end = "192.168.4.100";
    ic.ap_service = "hostapd@" + name;
    ic.dhcp_service = "dnsmasq@" + name;
    ic.rotation_interval_sec = 300;
    ic.client_threshold = 5;
    ic.min_time_after_clients_sec = 120;
    return ic;
}

/// Everything one interface needs, sharing clock/monitor/services/store with its siblings.
struct Lane {
    std::unique_ptr<APConfigWriter> writer;
    std::unique_ptr<RotationScheduler> scheduler;
    std::string trigger_path;
};

class SchedulerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_FALSE(dir.path().empty());
        StatusStore::Options so;
        so.run_dir = dir.file("run");
        so.log_dir = dir.file("log");
        store = std::make_unique<StatusStore>(so);
        ASSERT_TRUE(store->prepare());

        writer_options.hostapd_conf_dir = dir.path();
        writer_options.dnsmasq_conf_dir = dir.path();
        writer_options.apply_timeout = 300ms;
        writer_options.poll_interval = 10ms;
    }

    Lane make_lane(const InterfaceConfig& ic, CredentialPolicy policy = CredentialPolicy{}) {
        Lane lane;
        lane.trigger_path = FileTriggerSource::path_for(dir.file("run"), ic.name);
        lane.writer = std::make_unique<APConfigWriter>(writer_options, services);

        auto triggers = std::make_unique<TriggerListener>(ic.name, clock, 30s);
        triggers->add_source(std::make_unique<FileTriggerSource>(lane.trigger_path));

        SchedulerOptions opts;
        opts.tick_interval = 20ms;
        opts.retry_delay = 5s;
        lane.scheduler = std::make_unique<RotationScheduler>(
            ic, policy, opts, clock, monitor, *lane.writer, *store, std::move(triggers));
        return lane;
    }

    RotationScheduler& wlan0() {
        if (!lane0.scheduler) lane0 = make_lane(make_interface("wlan0"));
        return *lane0.scheduler;
    }

    /// Advance to t seconds after start and tick once.
    void tick_at(int t, RotationScheduler& s) {
        clock.advance_to(Seconds(t));
        s.tick();
    }

    json status(const std::string& iface = "wlan0") {
        return json::parse(slurp(store->status_path(iface)));
    }

    std::vector<json> history() {
        std::vector<json> out;
        for (const auto& line : read_lines(store->history_path())) out.push_back(json::parse(line));
        return out;
    }

    TempDir dir;
    FakeClock clock;
    FakeClientMonitor monitor;
    FakeServiceManager services;
    ApWriterOptions writer_options;
    std::unique_ptr<StatusStore> store;
    Lane lane0;
};

// ─── Startup ─────────────────────────────────────────────────────────────────

TEST_F(SchedulerTest, FirstTickRotatesImmediately) {
    RotationScheduler& s = wlan0();
    EXPECT_EQ(s.state(), InterfaceState::ROTATING);
    EXPECT_FALSE(s.rotation_state().credential.has_value());

    tick_at(0, s);

    EXPECT_EQ(s.state(), InterfaceState::IDLE);
    ASSERT_TRUE(s.rotation_state().credential.has_value());
    EXPECT_EQ(s.rotation_state().sequence, 1u);

    json j = status();
    EXPECT_EQ(j["state"], "idle");
    EXPECT_EQ(j["ssid"], s.rotation_state().credential->ssid);
    EXPECT_EQ(j["password"], s.rotation_state().credential->passphrase);
    EXPECT_EQ(j["time_remaining"], 300);
    EXPECT_EQ(j["last_rotation_reason"], "startup");

    auto h = history();
    ASSERT_EQ(h.size(), 1u);
    EXPECT_EQ(h[0]["reason"], "startup");
    EXPECT_TRUE(h[0]["prior_ssid_hash"].is_null());
}

TEST_F(SchedulerTest, LeftoverTriggerIsAbsorbedByStartupRotation) {
    RotationScheduler& s = wlan0();
    touch(lane0.trigger_path);

    tick_at(0, s);
    tick_at(1, s);

    EXPECT_EQ(s.rotation_state().sequence, 1u);
    EXPECT_FALSE(fs::file_exists(lane0.trigger_path));
}

TEST_F(SchedulerTest, RepeatedTicksWithNothingDueChangeNothing) {
    RotationScheduler& s = wlan0();
    tick_at(0, s);
    const Credential first = *s.rotation_state().credential;

    for (int t = 1; t < 300; t += 7) tick_at(t, s);
    tick_at(299, s);
    tick_at(299, s);

    EXPECT_EQ(s.rotation_state().sequence, 1u);
    EXPECT_EQ(*s.rotation_state().credential, first);
    EXPECT_EQ(history().size(), 1u);
    EXPECT_EQ(status()["time_remaining"], 1);
}

// ─── Time-based rotation ─────────────────────────────────────────────────────

TEST_F(SchedulerTest, RotatesWhenIntervalElapses) {
    RotationScheduler& s = wlan0();
    tick_at(0, s);
    const std::string first_ssid = s.rotation_state().credential->ssid;

    tick_at(300, s);

    EXPECT_EQ(s.rotation_state().sequence, 2u);
    EXPECT_NE(s.rotation_state().credential->ssid, first_ssid);
    auto h = history();
    ASSERT_EQ(h.size(), 2u);
    EXPECT_EQ(h[1]["reason"], "time_elapsed");
    EXPECT_EQ(h[1]["prior_ssid_hash"], redact_ssid(first_ssid));
    EXPECT_EQ(h[1]["client_count"], 0);
}

// ─── Client pressure ─────────────────────────────────────────────────────────

TEST_F(SchedulerTest, ClientThresholdWaitsForMinimumAge) {
    RotationScheduler& s = wlan0();
    tick_at(0, s);

    monitor.set(6u);
    for (int t = 10; t < 120; t += 10) {
        tick_at(t, s);
        ASSERT_EQ(s.rotation_state().sequence, 1u) << "rotated early at t=" << t;
    }

    tick_at(120, s);
    EXPECT_EQ(s.rotation_state().sequence, 2u);
    EXPECT_EQ(history().back()["reason"], "client_threshold");
    EXPECT_EQ(history().back()["client_count"], 6);
}

TEST_F(SchedulerTest, BelowThresholdDoesNotRotate) {
    RotationScheduler& s = wlan0();
    tick_at(0, s);
    monitor.set(4u);
    tick_at(200, s);
    EXPECT_EQ(s.rotation_state().sequence, 1u);
}

TEST_F(SchedulerTest, UnknownClientCountNeverTriggersRotation) {
    RotationScheduler& s = wlan0();
    tick_at(0, s);

    monitor.set(std::nullopt);
    tick_at(200, s);
    EXPECT_EQ(s.rotation_state().sequence, 1u);
    EXPECT_TRUE(status()["client_count"].is_null());

    // Time-based rotation still happens
    tick_at(300, s);
    EXPECT_EQ(s.rotation_state().sequence, 2u);
    EXPECT_TRUE(history().back()["client_count"].is_null());
}

// ─── Manual trigger ──────────────────────────────────────────────────────────

TEST_F(SchedulerTest, ManualTriggerRotatesUnconditionally) {
    RotationScheduler& s = wlan0();
    tick_at(0, s);

    touch(lane0.trigger_path);
    tick_at(5, s);
    EXPECT_EQ(s.rotation_state().sequence, 2u);
    EXPECT_EQ(history().back()["reason"], "manual_trigger");
    EXPECT_FALSE(fs::file_exists(lane0.trigger_path));
}

TEST_F(SchedulerTest, SecondTriggerWithinCooldownIsIgnored) {
    RotationScheduler& s = wlan0();
    tick_at(0, s);

    touch(lane0.trigger_path);
    tick_at(40, s);
    touch(lane0.trigger_path);
    tick_at(50, s);
    tick_at(75, s);

    EXPECT_EQ(s.rotation_state().sequence, 2u);

    touch(lane0.trigger_path);
    tick_at(80, s);
    EXPECT_EQ(s.rotation_state().sequence, 3u);
}

TEST_F(SchedulerTest, ManualRotationRestartsInterval) {
    RotationScheduler& s = wlan0();
    tick_at(0, s);
    touch(lane0.trigger_path);
    tick_at(200, s);

    tick_at(300, s);
    EXPECT_EQ(s.rotation_state().sequence, 2u);
    tick_at(500, s);
    EXPECT_EQ(s.rotation_state().sequence, 3u);
}

// ─── Failure handling ────────────────────────────────────────────────────────

TEST_F(SchedulerTest, FailedApplyKeepsCredentialOfRecord) {
    RotationScheduler& s = wlan0();
    tick_at(0, s);
    const Credential good = *s.rotation_state().credential;
    const TimePoint created = s.rotation_state().created_at;

    services.failing.insert("hostapd@wlan0");
    tick_at(300, s);

    EXPECT_EQ(s.state(), InterfaceState::DEGRADED);
    EXPECT_EQ(*s.rotation_state().credential, good);
    EXPECT_EQ(s.rotation_state().created_at, created);
    EXPECT_EQ(s.rotation_state().sequence, 1u);
    EXPECT_EQ(s.health().consecutive_failures, 1u);
    EXPECT_FALSE(s.health().last_error.empty());

    json j = status();
    EXPECT_EQ(j["state"], "degraded");
    EXPECT_EQ(j["ssid"], good.ssid);
    EXPECT_FALSE(j["last_error"].is_null());
    EXPECT_EQ(history().size(), 1u);
}

TEST_F(SchedulerTest, DegradedRetriesAfterDelayAndRecovers) {
    RotationScheduler& s = wlan0();
    tick_at(0, s);
    services.failing.insert("hostapd@wlan0");

    tick_at(300, s);
    ASSERT_EQ(s.state(), InterfaceState::DEGRADED);
    const size_t attempts = services.restart_count("hostapd@wlan0");

    tick_at(302, s);
    EXPECT_EQ(services.restart_count("hostapd@wlan0"), attempts) << "retried before delay";

    tick_at(305, s);
    EXPECT_EQ(services.restart_count("hostapd@wlan0"), attempts + 1);
    EXPECT_EQ(s.health().consecutive_failures, 2u);

    services.failing.clear();
    tick_at(310, s);
    EXPECT_EQ(s.state(), InterfaceState::IDLE);
    EXPECT_EQ(s.rotation_state().sequence, 2u);
    EXPECT_EQ(s.health().consecutive_failures, 0u);
    EXPECT_TRUE(s.health().last_error.empty());

    auto h = history();
    ASSERT_EQ(h.size(), 2u);
    EXPECT_EQ(h[1]["reason"], "time_elapsed");
    EXPECT_TRUE(status()["last_error"].is_null());
}

TEST_F(SchedulerTest, StartupFailureIsPublished) {
    services.failing.insert("hostapd@wlan0");
    RotationScheduler& s = wlan0();
    tick_at(0, s);

    EXPECT_EQ(s.state(), InterfaceState::DEGRADED);
    EXPECT_FALSE(s.rotation_state().credential.has_value());
    json j = status();
    EXPECT_EQ(j["state"], "degraded");
    EXPECT_EQ(j["ssid"], "");
    EXPECT_EQ(j["consecutive_failures"], 1);

    services.failing.clear();
    tick_at(5, s);
    EXPECT_EQ(s.rotation_state().sequence, 1u);
    EXPECT_EQ(history().back()["reason"], "startup");
}

TEST_F(SchedulerTest, ManualTriggerOverridesRetryDelay) {
    RotationScheduler& s = wlan0();
    tick_at(0, s);
    services.failing.insert("hostapd@wlan0");
    tick_at(300, s);
    ASSERT_EQ(s.state(), InterfaceState::DEGRADED);

    services.failing.clear();
    touch(lane0.trigger_path);
    tick_at(301, s);
    EXPECT_EQ(s.state(), InterfaceState::IDLE);
    EXPECT_EQ(history().back()["reason"], "manual_trigger");
}

// ─── Scenario ────────────────────────────────────────────────────────────────

TEST_F(SchedulerTest, StartupTimeThenClientPressure) {
    RotationScheduler& s = wlan0();

    tick_at(0, s);
    ASSERT_EQ(s.rotation_state().sequence, 1u);

    for (int t = 10; t <= 300; t += 10) tick_at(t, s);
    ASSERT_EQ(s.rotation_state().sequence, 2u);

    monitor.set(6u);
    int rotated_at = -1;
    for (int t = 350; t <= 470 && rotated_at < 0; t += 10) {
        tick_at(t, s);
        if (s.rotation_state().sequence == 3u) rotated_at = t;
    }
    ASSERT_GT(rotated_at, 0) << "client pressure never rotated";
    EXPECT_GE(rotated_at, 300 + 120);

    auto h = history();
    ASSERT_EQ(h.size(), 3u);
    EXPECT_EQ(h[0]["reason"], "startup");
    EXPECT_EQ(h[1]["reason"], "time_elapsed");
    EXPECT_EQ(h[2]["reason"], "client_threshold");
    EXPECT_EQ(h[2]["sequence"], 3);
}

// ─── Dual AP isolation ───────────────────────────────────────────────────────

TEST_F(SchedulerTest, InterfacesRotateIndependently) {
    Lane a = make_lane(make_interface("wlan0"));
    InterfaceConfig ic1 = make_interface("wlan1");
    ic1.rotation_interval_sec = 600;
    Lane b = make_lane(ic1);

    tick_at(0, *a.scheduler);
    tick_at(0, *b.scheduler);

    services.failing.insert("hostapd@wlan1");
    tick_at(300, *a.scheduler);
    tick_at(300, *b.scheduler);
    EXPECT_EQ(a.scheduler->rotation_state().sequence, 2u);
    EXPECT_EQ(b.scheduler->rotation_state().sequence, 1u);
    EXPECT_EQ(b.scheduler->state(), InterfaceState::IDLE);

    tick_at(600, *a.scheduler);
    tick_at(600, *b.scheduler);
    EXPECT_EQ(a.scheduler->state(), InterfaceState::IDLE);
    EXPECT_EQ(a.scheduler->rotation_state().sequence, 3u);
    EXPECT_EQ(b.scheduler->state(), InterfaceState::DEGRADED);

    touch(a.trigger_path);
    tick_at(610, *a.scheduler);
    tick_at(610, *b.scheduler);
    EXPECT_EQ(a.scheduler->rotation_state().sequence, 4u);
    EXPECT_EQ(b.scheduler->rotation_state().sequence, 1u);

    EXPECT_EQ(status("wlan0")["state"], "idle");
    EXPECT_EQ(status("wlan1")["state"], "degraded");
    EXPECT_NE(status("wlan0")["ssid"], status("wlan1")["ssid"]);
}

// ─── Wall-clock steps ────────────────────────────────────────────────────────

TEST_F(SchedulerTest, BackwardWallClockStepDoesNotDelayRotation) {
    RotationScheduler& s = wlan0();
    tick_at(0, s);
    const int64_t first_time = history()[0]["time"];

    clock.step_wall(-3600s);

    tick_at(299, s);
    EXPECT_EQ(s.rotation_state().sequence, 1u);
    EXPECT_EQ(status()["time_remaining"], 1);

    tick_at(300, s);
    EXPECT_EQ(s.rotation_state().sequence, 2u);

    auto h = history();
    ASSERT_EQ(h.size(), 2u);
    EXPECT_EQ(h[1]["reason"], "time_elapsed");
    EXPECT_GE(h[1]["time"].get<int64_t>(), first_time);

    json j = status();
    EXPECT_EQ(j["time_remaining"], 300);
    EXPECT_EQ(j["expires_at"].get<int64_t>(), j["updated_at"].get<int64_t>() + 300);
}

TEST_F(SchedulerTest, ForwardWallClockStepDoesNotForceRotation) {
    RotationScheduler& s = wlan0();
    tick_at(0, s);

    clock.step_wall(86400s);
    tick_at(10, s);

    EXPECT_EQ(s.rotation_state().sequence, 1u);
    EXPECT_EQ(status()["time_remaining"], 290);
}

TEST_F(SchedulerTest, DegradedRetrySpacingIgnoresWallClock) {
    RotationScheduler& s = wlan0();
    tick_at(0, s);
    services.failing.insert("hostapd@wlan0");
    tick_at(300, s);
    ASSERT_EQ(s.state(), InterfaceState::DEGRADED);
    const size_t attempts = services.restart_count("hostapd@wlan0");

    clock.step_wall(-600s);
    tick_at(305, s);
    EXPECT_EQ(services.restart_count("hostapd@wlan0"), attempts + 1);
}

// ─── Worker ──────────────────────────────────────────────────────────────────

static bool wait_for(const std::function<bool()>& pred, std::chrono::milliseconds limit) {
    auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(10ms);
    }
    return pred();
}

TEST_F(SchedulerTest, WorkerPublishesAndStops) {
    RotationScheduler& s = wlan0();
    s.start();
    EXPECT_TRUE(s.is_running());
    EXPECT_TRUE(wait_for([&] { return s.snapshot().sequence == 1u; }, 3000ms));
    s.stop();
    EXPECT_FALSE(s.is_running());
    EXPECT_FALSE(s.has_failed());
    EXPECT_EQ(s.snapshot().state, InterfaceState::IDLE);
}

TEST_F(SchedulerTest, WorkerHaltsOnGenerationFailure) {
    CredentialPolicy bad;
    bad.passphrase_length = 4;
    Lane lane = make_lane(make_interface("wlan0"), bad);

    lane.scheduler->start();
    EXPECT_TRUE(wait_for([&] { return lane.scheduler->has_failed(); }, 3000ms));
    EXPECT_FALSE(lane.scheduler->failure_reason().empty());
    lane.scheduler->stop();
}
