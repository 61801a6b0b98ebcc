#include <gtest/gtest.h>
#include "loop_coordinator.h"
#include "fake_clipboard.h"
#include "logger.h"

#include <thread>
#include <vector>

using std::chrono::milliseconds;

class LoopCoordinatorTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().setEchoToStderr(false);
    }

    void TearDown() override {
        Logger::instance().setEchoToStderr(true);
    }

    static WatcherConfig fastConfig() {
        WatcherConfig cfg;
        cfg.poll_interval = milliseconds(5);
        cfg.backoff_initial = milliseconds(5);
        cfg.backoff_max = milliseconds(20);
        return cfg;
    }

    /// Copy `text` as another application would and run one iteration.
    CoordinatorState copyAndProcess(ClipboardWatcher& watcher, LoopCoordinator& coordinator,
                                    const std::string& text) {
        clipboard_.externalCopy(text);
        auto event = watcher.poll();
        EXPECT_TRUE(event.has_value());
        return event ? coordinator.process(*event) : CoordinatorState::Idle;
    }

    FakeClipboard clipboard_;
};

TEST_F(LoopCoordinatorTest, DirtyUrlIsCleanedAndWritten) {
    ClipboardWatcher watcher(clipboard_, fastConfig());
    LoopCoordinator coordinator(watcher, nullptr);

    auto outcome = copyAndProcess(watcher, coordinator,
                                  "https://www.youtube.com/watch?v=dQw4w9WgXcQ&si=abc123");
    EXPECT_EQ(outcome, CoordinatorState::Writing);
    ASSERT_EQ(clipboard_.writes.size(), 1u);
    EXPECT_EQ(clipboard_.writes[0], "https://www.youtube.com/watch?v=dQw4w9WgXcQ");
    EXPECT_EQ(coordinator.lastWritten(), "https://www.youtube.com/watch?v=dQw4w9WgXcQ");
    EXPECT_EQ(coordinator.state(), CoordinatorState::Idle);
}

TEST_F(LoopCoordinatorTest, OwnWriteIsNotProcessedAgain) {
    ClipboardWatcher watcher(clipboard_, fastConfig());
    LoopCoordinator coordinator(watcher, nullptr);
    copyAndProcess(watcher, coordinator, "https://example.com/a?utm_source=news&id=1");
    ASSERT_EQ(clipboard_.writes.size(), 1u);

    // The watcher already knows the written text.
    EXPECT_FALSE(watcher.poll().has_value());

    // A backend that still reports the write (e.g. the counter moved twice)
    // is caught by the coordinator.
    std::vector<CoordinatorState> trace;
    coordinator.setTransitionCallback([&trace](CoordinatorState s) { trace.push_back(s); });
    ClipboardEvent echo{"https://example.com/a?id=1", clipboard_.counter};
    EXPECT_EQ(coordinator.process(echo), CoordinatorState::Skipping);

    EXPECT_EQ(clipboard_.writes.size(), 1u);
    ASSERT_EQ(trace.size(), 3u);
    EXPECT_EQ(trace[0], CoordinatorState::Observed);
    EXPECT_EQ(trace[1], CoordinatorState::Skipping);
    EXPECT_EQ(trace[2], CoordinatorState::Idle);
    EXPECT_EQ(coordinator.stats().self_writes_skipped, 1u);
}

TEST_F(LoopCoordinatorTest, RecopiedDirtyUrlIsCleanedAgain) {
    ClipboardWatcher watcher(clipboard_, fastConfig());
    LoopCoordinator coordinator(watcher, nullptr);
    const std::string dirty = "https://example.com/?utm_source=x";

    copyAndProcess(watcher, coordinator, dirty);
    EXPECT_EQ(copyAndProcess(watcher, coordinator, dirty), CoordinatorState::Writing);
    ASSERT_EQ(clipboard_.writes.size(), 2u);
    EXPECT_EQ(clipboard_.text, "https://example.com/");
}

TEST_F(LoopCoordinatorTest, WritingTraceVisitsEveryState) {
    ClipboardWatcher watcher(clipboard_, fastConfig());
    LoopCoordinator coordinator(watcher, nullptr);
    std::vector<CoordinatorState> trace;
    coordinator.setTransitionCallback([&trace](CoordinatorState s) { trace.push_back(s); });

    copyAndProcess(watcher, coordinator, "https://x.com/user/status/1?s=20&t=abc");

    std::vector<CoordinatorState> expected{
        CoordinatorState::Observed, CoordinatorState::Sanitizing,
        CoordinatorState::Writing, CoordinatorState::Idle};
    EXPECT_EQ(trace, expected);
}

TEST_F(LoopCoordinatorTest, CleanUrlIsLeftAlone) {
    ClipboardWatcher watcher(clipboard_, fastConfig());
    LoopCoordinator coordinator(watcher, nullptr);

    EXPECT_EQ(copyAndProcess(watcher, coordinator, "https://example.com/page?id=7"),
              CoordinatorState::Skipping);
    EXPECT_TRUE(clipboard_.writes.empty());
    EXPECT_TRUE(coordinator.lastWritten().empty());
}

TEST_F(LoopCoordinatorTest, NonUrlTextIsSkipped) {
    ClipboardWatcher watcher(clipboard_, fastConfig());
    LoopCoordinator coordinator(watcher, nullptr);
    std::vector<CoordinatorState> trace;
    coordinator.setTransitionCallback([&trace](CoordinatorState s) { trace.push_back(s); });

    EXPECT_EQ(copyAndProcess(watcher, coordinator, "remember to buy milk"),
              CoordinatorState::Skipping);
    EXPECT_TRUE(clipboard_.writes.empty());

    std::vector<CoordinatorState> expected{
        CoordinatorState::Observed, CoordinatorState::Sanitizing,
        CoordinatorState::Skipping, CoordinatorState::Idle};
    EXPECT_EQ(trace, expected);
}

TEST_F(LoopCoordinatorTest, UserCopyingSameCleanUrlAgainIsSkippedQuietly) {
    ClipboardWatcher watcher(clipboard_, fastConfig());
    LoopCoordinator coordinator(watcher, nullptr);
    copyAndProcess(watcher, coordinator, "https://example.com/?utm_medium=mail");

    // Another app copies something else, then the clean URL again.
    copyAndProcess(watcher, coordinator, "plain text");
    EXPECT_EQ(copyAndProcess(watcher, coordinator, "https://example.com/"),
              CoordinatorState::Skipping);
    EXPECT_EQ(clipboard_.writes.size(), 1u);
}

TEST_F(LoopCoordinatorTest, WriteFailureIsCountedAndLoopContinues) {
    ClipboardWatcher watcher(clipboard_, fastConfig());
    LoopCoordinator coordinator(watcher, nullptr);

    clipboard_.fail_writes = true;
    EXPECT_EQ(copyAndProcess(watcher, coordinator, "https://example.com/?utm_source=a"),
              CoordinatorState::Skipping);
    EXPECT_EQ(coordinator.state(), CoordinatorState::Idle);
    EXPECT_EQ(coordinator.stats().failures, 1u);
    EXPECT_TRUE(coordinator.lastWritten().empty());

    clipboard_.fail_writes = false;
    EXPECT_EQ(copyAndProcess(watcher, coordinator, "https://example.com/?utm_source=b"),
              CoordinatorState::Writing);
    EXPECT_EQ(coordinator.lastWritten(), "https://example.com/");
}

TEST_F(LoopCoordinatorTest, StatsCountEachOutcome) {
    ClipboardWatcher watcher(clipboard_, fastConfig());
    LoopCoordinator coordinator(watcher, nullptr);

    copyAndProcess(watcher, coordinator, "https://open.spotify.com/track/1?si=xyz");
    coordinator.process(ClipboardEvent{"https://open.spotify.com/track/1", clipboard_.counter});
    copyAndProcess(watcher, coordinator, "not a url");

    CoordinatorStats stats = coordinator.stats();
    EXPECT_EQ(stats.observed, 3u);
    EXPECT_EQ(stats.cleaned, 1u);
    EXPECT_EQ(stats.self_writes_skipped, 1u);
    EXPECT_EQ(stats.unchanged, 1u);
    EXPECT_EQ(stats.failures, 0u);
}

TEST_F(LoopCoordinatorTest, RuleSetCanBeSwapped) {
    ClipboardWatcher watcher(clipboard_, fastConfig());
    LoopCoordinator coordinator(watcher, nullptr);

    EXPECT_EQ(copyAndProcess(watcher, coordinator, "https://shop.example/item?ref=abc"),
              CoordinatorState::Skipping);

    RuleEntry shop;
    shop.id = "shop";
    shop.domains = {"shop.example"};
    shop.strip_params = {"ref"};
    RuleConfig user;
    user.rules = {shop};
    coordinator.setRuleSet(std::make_shared<const RuleSet>(
        RuleSet::build(RuleSet::defaultConfig(), user)));
    ASSERT_NE(coordinator.ruleSet()->findRule("shop"), nullptr);

    EXPECT_EQ(copyAndProcess(watcher, coordinator, "https://shop.example/item?ref=def"),
              CoordinatorState::Writing);
    EXPECT_EQ(clipboard_.writes.back(), "https://shop.example/item");

    // A null rule set is ignored.
    coordinator.setRuleSet(nullptr);
    EXPECT_NE(coordinator.ruleSet(), nullptr);
}

TEST_F(LoopCoordinatorTest, IndependentCoordinatorsKeepTheirOwnState) {
    FakeClipboard other;
    ClipboardWatcher watcher_a(clipboard_, fastConfig());
    ClipboardWatcher watcher_b(other, fastConfig());
    LoopCoordinator a(watcher_a, nullptr);
    LoopCoordinator b(watcher_b, nullptr);

    copyAndProcess(watcher_a, a, "https://example.com/?utm_source=x");
    EXPECT_EQ(a.lastWritten(), "https://example.com/");
    EXPECT_TRUE(b.lastWritten().empty());
    EXPECT_EQ(b.stats().observed, 0u);
    EXPECT_TRUE(other.writes.empty());
}

TEST_F(LoopCoordinatorTest, RunProcessesUntilWatcherStops) {
    clipboard_.externalCopy("https://www.instagram.com/p/abc/?igsh=zzz");
    ClipboardWatcher watcher(clipboard_, fastConfig());
    LoopCoordinator coordinator(watcher, nullptr);

    std::thread stopper([&watcher]() {
        std::this_thread::sleep_for(milliseconds(100));
        watcher.stop();
    });
    coordinator.run();
    stopper.join();

    ASSERT_EQ(clipboard_.writes.size(), 1u);
    EXPECT_EQ(clipboard_.writes[0], "https://www.instagram.com/p/abc/");
    CoordinatorStats stats = coordinator.stats();
    EXPECT_EQ(stats.observed, 1u);
    EXPECT_EQ(stats.cleaned, 1u);
    EXPECT_EQ(coordinator.state(), CoordinatorState::Idle);
}

TEST_F(LoopCoordinatorTest, SummaryReportsCountersAndRuleCount) {
    ClipboardWatcher watcher(clipboard_, fastConfig());
    LoopCoordinator coordinator(watcher, nullptr);
    copyAndProcess(watcher, coordinator, "https://example.com/?utm_source=x");

    std::string expected_rules = "rules=" + std::to_string(RuleSet().rules().size());
    std::string summary = coordinator.summary();
    EXPECT_NE(summary.find("observed=1"), std::string::npos) << summary;
    EXPECT_NE(summary.find("cleaned=1"), std::string::npos) << summary;
    EXPECT_NE(summary.find(expected_rules), std::string::npos) << summary;

    RuleEntry shop;
    shop.id = "shop";
    shop.domains = {"shop.example"};
    RuleConfig user;
    user.rules = {shop};
    coordinator.setRuleSet(std::make_shared<const RuleSet>(
        RuleSet::build(RuleSet::defaultConfig(), user)));
    expected_rules = "rules=" + std::to_string(RuleSet().rules().size() + 1);
    EXPECT_NE(coordinator.summary().find(expected_rules), std::string::npos);
}

TEST_F(LoopCoordinatorTest, StateNames) {
    EXPECT_STREQ(coordinatorStateName(CoordinatorState::Idle), "Idle");
    EXPECT_STREQ(coordinatorStateName(CoordinatorState::Writing), "Writing");
    EXPECT_STREQ(coordinatorStateName(CoordinatorState::Skipping), "Skipping");
}
