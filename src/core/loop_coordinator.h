#pragma once
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

#include "clipboard_watcher.h"
#include "rule_set.h"
#include "url_sanitizer.h"

enum class CoordinatorState {
    Idle,
    Observed,
    Sanitizing,
    Writing,
    Skipping,
};

const char* coordinatorStateName(CoordinatorState state);

struct CoordinatorStats {
    uint64_t observed = 0;             // events handed to process()
    uint64_t cleaned = 0;              // URLs rewritten and written back
    uint64_t self_writes_skipped = 0;  // events that were our own write
    uint64_t unchanged = 0;            // nothing to strip / not a URL
    uint64_t failures = 0;             // sanitizer or write errors
};

/// Called on every state transition (after the state changed).
using TransitionCallback = std::function<void(CoordinatorState state)>;

/// Drives Idle -> Observed -> Sanitizing -> (Writing | Skipping) -> Idle for
/// each clipboard event, strictly one event at a time.
///
/// Holds the only loop state: the last value this instance wrote to the
/// clipboard. An event carrying exactly that value is our own write echoing
/// back and is skipped without touching the clipboard.
class LoopCoordinator {
public:
    LoopCoordinator(ClipboardWatcher& watcher, std::shared_ptr<const RuleSet> rules);

    LoopCoordinator(const LoopCoordinator&) = delete;
    LoopCoordinator& operator=(const LoopCoordinator&) = delete;

    /// Run one iteration for `event`. Returns Writing or Skipping; the
    /// coordinator is back in Idle afterwards. Never throws.
    CoordinatorState process(const ClipboardEvent& event);

    /// Pull events from the watcher until it is stopped.
    void run();

    /// Replace the rule set used by subsequent iterations.
    void setRuleSet(std::shared_ptr<const RuleSet> rules);
    std::shared_ptr<const RuleSet> ruleSet() const;

    void setTransitionCallback(TransitionCallback cb);

    CoordinatorState state() const { return state_; }
    const std::string& lastWritten() const { return last_written_; }
    CoordinatorStats stats() const { return stats_; }

    /// "observed=N cleaned=N self-writes=N unchanged=N failures=N rules=N",
    /// where rules counts the active domain rules.
    std::string summary() const;

private:
    void transition(CoordinatorState next);

    ClipboardWatcher& watcher_;

    mutable std::mutex rules_mutex_;
    std::shared_ptr<const RuleSet> rules_;

    CoordinatorState state_ = CoordinatorState::Idle;
    std::string last_written_;
    CoordinatorStats stats_;
    TransitionCallback on_transition_;
};
