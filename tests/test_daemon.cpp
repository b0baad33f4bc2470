/**
 * @file test_daemon.cpp
 * @brief Daemon wiring: interface selection, missing dongles, run/shutdown
 */

#include <gtest/gtest.h>
#include "rotap_daemon.hpp"
#include "rotap_errors.hpp"
#include "test_helpers.hpp"

#include <nlohmann/json.hpp>

#include <set>
#include <thread>

using namespace rotap;
using namespace rotap::test;
using namespace std::chrono_literals;
using nlohmann::json;

/// Pretends only the listed interfaces are plugged in.
class FakeInterfaceProbe : public InterfaceProbe {
public:
    explicit FakeInterfaceProbe(std::set<std::string> present) : present_(std::move(present)) {}

    bool exists(const std::string& name) const override { return present_.count(name) > 0; }
    bool is_wireless(const std::string& name) const override { return name.rfind("wlan", 0) == 0; }

private:
    std::set<std::string> present_;
};

class DaemonTest : public ::testing::Test {
protected:
    void SetUp() override { ASSERT_FALSE(dir.path().empty()); }

    DaemonConfig load(const std::vector<std::string>& ifaces, bool dual) {
        DaemonConfig cfg = parse_config_text(config_json(dir.path(), ifaces, dual));
        cfg.tick_interval_ms = 100;
        return cfg;
    }

    std::unique_ptr<Daemon> make_daemon(DaemonConfig cfg, std::set<std::string> present) {
        return std::make_unique<Daemon>(std::move(cfg),
                                        std::make_unique<FakeInterfaceProbe>(std::move(present)),
                                        std::make_unique<FakeServiceManager>(),
                                        std::make_unique<FakeClientMonitor>(),
                                        std::make_unique<FakeClock>());
    }

    json read_json(const std::string& name) {
        return json::parse(slurp(dir.path() + "/run/" + name));
    }

    TempDir dir;
};

TEST_F(DaemonTest, SingleModeRunsFirstEnabledInterface) {
    auto d = make_daemon(load({"wlan0", "wlan1"}, false), {"eth0", "wlan0", "wlan1"});
    d->initialize();
    EXPECT_EQ(d->active_interfaces(), std::vector<std::string>{"wlan0"});
}

TEST_F(DaemonTest, DualModeRunsAllInterfaces) {
    auto d = make_daemon(load({"wlan0", "wlan1"}, true), {"eth0", "wlan0", "wlan1"});
    d->initialize();
    EXPECT_EQ(d->active_interfaces(), (std::vector<std::string>{"wlan0", "wlan1"}));
}

TEST_F(DaemonTest, MissingInterfaceIsPublishedAsDisabled) {
    auto d = make_daemon(load({"wlan0", "wlan1"}, true), {"wlan0"});
    d->initialize();

    EXPECT_EQ(d->active_interfaces(), std::vector<std::string>{"wlan0"});
    json j = read_json("status-wlan1.json");
    EXPECT_EQ(j["state"], "disabled");
    EXPECT_FALSE(j["enabled"].get<bool>());
    EXPECT_EQ(j["last_error"], "Interface not found");
    EXPECT_EQ(d->statuses().size(), 2u);
}

TEST_F(DaemonTest, NoUsableInterfaceIsFatal) {
    auto d = make_daemon(load({"wlan0", "wlan1"}, true), {"eth0"});
    EXPECT_THROW(d->initialize(), FatalError);
}

TEST_F(DaemonTest, UncreatableStateDirectoryIsFatal) {
    DaemonConfig cfg = load({"wlan0"}, false);
    cfg.run_dir = "/proc/rotap-test/run";
    auto d = make_daemon(cfg, {"wlan0"});
    EXPECT_THROW(d->initialize(), FatalError);
}

TEST_F(DaemonTest, InitializeCreatesApConfigDirectories) {
    auto d = make_daemon(load({"wlan0"}, false), {"wlan0"});
    d->initialize();
    EXPECT_TRUE(fs::file_exists(dir.path() + "/hostapd"));
    EXPECT_TRUE(fs::file_exists(dir.path() + "/dnsmasq"));
}

TEST_F(DaemonTest, UncreatableApConfigDirectoryIsFatal) {
    DaemonConfig cfg = load({"wlan0"}, false);
    cfg.hostapd_conf_dir = "/proc/rotap-test/hostapd";
    auto d = make_daemon(cfg, {"wlan0"});
    EXPECT_THROW(d->initialize(), FatalError);
}

TEST_F(DaemonTest, RunRotatesAndShutsDownCleanly) {
    auto d = make_daemon(load({"wlan0", "wlan1"}, true), {"wlan0", "wlan1"});
    d->initialize();

    std::atomic<bool> running(true);
    std::atomic<bool> reopen(false);
    int exit_code = -1;
    std::thread t([&] { exit_code = d->run(running, reopen); });

    auto deadline = std::chrono::steady_clock::now() + 5s;
    bool ready = false;
    while (!ready && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(50ms);
        ready = true;
        for (const auto& s : d->statuses()) ready = ready && s.sequence == 1u;
    }
    running = false;
    t.join();

    ASSERT_TRUE(ready);
    EXPECT_EQ(exit_code, 0);

    json all = read_json("status-all.json");
    EXPECT_TRUE(all["dual_ap_mode"].get<bool>());
    EXPECT_EQ(all["active_interfaces"].size(), 2u);
    EXPECT_NE(read_json("status-wlan0.json")["ssid"], read_json("status-wlan1.json")["ssid"]);
    EXPECT_EQ(read_lines(dir.path() + "/log/rotations.jsonl").size(), 2u);
}

TEST_F(DaemonTest, SingleModeWritesNoAggregate) {
    auto d = make_daemon(load({"wlan0"}, false), {"wlan0"});
    d->initialize();

    std::atomic<bool> running(true);
    std::atomic<bool> reopen(true);
    std::thread t([&] { d->run(running, reopen); });
    std::this_thread::sleep_for(300ms);
    running = false;
    t.join();

    EXPECT_FALSE(reopen.load());
    EXPECT_TRUE(fs::file_exists(dir.path() + "/run/status-wlan0.json"));
    EXPECT_FALSE(fs::file_exists(dir.path() + "/run/status-all.json"));
}
