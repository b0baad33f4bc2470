/**
 * @file test_trigger.cpp
 * @brief Manual rotation triggers: sentinel file, button relay, cooldown
 */

#include <gtest/gtest.h>
#include "rotap_trigger.hpp"
#include "test_helpers.hpp"

using namespace rotap;
using namespace rotap::test;
using namespace std::chrono_literals;

// ─── FileTriggerSource ───────────────────────────────────────────────────────

TEST(FileTriggerTest, ConsumedExactlyOnce) {
    TempDir dir;
    const std::string path = FileTriggerSource::path_for(dir.path(), "wlan0");
    EXPECT_EQ(path, dir.path() + "/trigger-rotate-wlan0");

    FileTriggerSource src(path);
    EXPECT_FALSE(src.poll());

    touch(path);
    EXPECT_TRUE(src.poll());
    EXPECT_FALSE(fs::file_exists(path));
    EXPECT_FALSE(src.poll());
}

TEST(FileTriggerTest, MissingDirectoryIsQuiet) {
    FileTriggerSource src("/nonexistent/rotap/trigger-rotate-wlan0");
    EXPECT_FALSE(src.poll());
    EXPECT_FALSE(src.poll());
}

// ─── SignalTriggerSource ─────────────────────────────────────────────────────

TEST(SignalTriggerTest, EachSourceSeesEveryPressOnce) {
    SignalTriggerSource a;
    SignalTriggerSource b;
    EXPECT_FALSE(a.poll());

    SignalTriggerSource::notify();
    EXPECT_TRUE(a.poll());
    EXPECT_TRUE(b.poll());
    EXPECT_FALSE(a.poll());
    EXPECT_FALSE(b.poll());
}

TEST(SignalTriggerTest, PressesBetweenPollsCollapse) {
    SignalTriggerSource src;
    SignalTriggerSource::notify();
    SignalTriggerSource::notify();
    SignalTriggerSource::notify();
    EXPECT_TRUE(src.poll());
    EXPECT_FALSE(src.poll());
}

TEST(SignalTriggerTest, EarlierPressesAreNotReplayed) {
    SignalTriggerSource::notify();
    SignalTriggerSource late;
    EXPECT_FALSE(late.poll());
}

// ─── TriggerListener ─────────────────────────────────────────────────────────

class TriggerListenerTest : public ::testing::Test {
protected:
    void SetUp() override {
        ASSERT_FALSE(dir.path().empty());
        path = FileTriggerSource::path_for(dir.path(), "wlan0");
        listener = std::make_unique<TriggerListener>("wlan0", clock, 30s);
        listener->add_source(std::make_unique<FileTriggerSource>(path));
    }

    TempDir dir;
    FakeClock clock;
    std::string path;
    std::unique_ptr<TriggerListener> listener;
};

TEST_F(TriggerListenerTest, NothingPending) {
    EXPECT_FALSE(listener->consume());
    EXPECT_EQ(listener->source_count(), 1u);
}

TEST_F(TriggerListenerTest, AcceptsFirstRequest) {
    touch(path);
    EXPECT_TRUE(listener->consume());
    EXPECT_FALSE(listener->consume());
}

TEST_F(TriggerListenerTest, CooldownDropsRequestsInsteadOfDeferring) {
    touch(path);
    ASSERT_TRUE(listener->consume());

    clock.advance(10s);
    touch(path);
    EXPECT_FALSE(listener->consume());
    EXPECT_FALSE(fs::file_exists(path)) << "rejected request must still be consumed";

    clock.advance(25s);
    EXPECT_FALSE(listener->consume()) << "rejected request must not fire later";

    touch(path);
    EXPECT_TRUE(listener->consume());
}

TEST_F(TriggerListenerTest, CooldownBoundary) {
    touch(path);
    ASSERT_TRUE(listener->consume());

    clock.advance(29s);
    touch(path);
    EXPECT_FALSE(listener->consume());

    clock.advance(1s);
    touch(path);
    EXPECT_TRUE(listener->consume());
}

TEST_F(TriggerListenerTest, CooldownIgnoresWallClockSteps) {
    touch(path);
    ASSERT_TRUE(listener->consume());

    clock.step_wall(-3600s);
    clock.advance(30s);
    touch(path);
    EXPECT_TRUE(listener->consume());

    clock.step_wall(7200s);
    touch(path);
    EXPECT_FALSE(listener->consume());
}

TEST_F(TriggerListenerTest, SimultaneousSourcesCountOnce) {
    listener->add_source(std::make_unique<SignalTriggerSource>());
    touch(path);
    SignalTriggerSource::notify();

    EXPECT_TRUE(listener->consume());
    clock.advance(60s);
    EXPECT_FALSE(listener->consume());
}

TEST_F(TriggerListenerTest, DiscardDrainsWithoutStartingCooldown) {
    touch(path);
    listener->discard();
    EXPECT_FALSE(fs::file_exists(path));

    touch(path);
    EXPECT_TRUE(listener->consume());
}
