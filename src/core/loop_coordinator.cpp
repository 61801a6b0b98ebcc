#include "loop_coordinator.h"
#include "logger.h"

#include <exception>
#include <utility>

const char* coordinatorStateName(CoordinatorState state) {
    switch (state) {
        case CoordinatorState::Idle:       return "Idle";
        case CoordinatorState::Observed:   return "Observed";
        case CoordinatorState::Sanitizing: return "Sanitizing";
        case CoordinatorState::Writing:    return "Writing";
        case CoordinatorState::Skipping:   return "Skipping";
    }
    return "Unknown";
}

LoopCoordinator::LoopCoordinator(ClipboardWatcher& watcher, std::shared_ptr<const RuleSet> rules)
    : watcher_(watcher),
      rules_(rules ? std::move(rules) : std::make_shared<const RuleSet>())
{
}

CoordinatorState LoopCoordinator::process(const ClipboardEvent& event) {
    ++stats_.observed;
    transition(CoordinatorState::Observed);

    CoordinatorState outcome = CoordinatorState::Skipping;

    if (!last_written_.empty() && event.text == last_written_) {
        Logger::instance().debug("Ignoring our own clipboard write (sequence " +
                                 std::to_string(event.sequence) + ")");
        ++stats_.self_writes_skipped;
        transition(CoordinatorState::Skipping);
        transition(CoordinatorState::Idle);
        return outcome;
    }

    transition(CoordinatorState::Sanitizing);
    auto rules = ruleSet();

    try {
        SanitizationResult result = sanitize(event.text, *rules);
        if (!result.changed) {
            if (result.skip != SkipReason::None) {
                Logger::instance().debug(std::string("Clipboard content skipped: ") +
                                         skipReasonName(result.skip));
            }
            ++stats_.unchanged;
            transition(CoordinatorState::Skipping);
        } else {
            transition(CoordinatorState::Writing);
            watcher_.write(result.cleaned);
            last_written_ = result.cleaned;
            ++stats_.cleaned;
            Logger::instance().info("Stripped tracking from URL: " + result.cleaned);
            outcome = CoordinatorState::Writing;
        }
    } catch (const ClipboardUnavailable& e) {
        ++stats_.failures;
        Logger::instance().error(std::string("Failed to set clipboard: ") + e.what());
    } catch (const std::exception& e) {
        ++stats_.failures;
        Logger::instance().error(std::string("Failed to sanitize clipboard content: ") + e.what());
    }

    transition(CoordinatorState::Idle);
    return outcome;
}

void LoopCoordinator::run() {
    Logger::instance().info("Watching clipboard (poll interval " +
                            std::to_string(watcher_.pollInterval().count()) + " ms)");
    while (auto event = watcher_.next()) {
        process(*event);
    }
    Logger::instance().info("Clipboard watcher stopped");
}

void LoopCoordinator::setRuleSet(std::shared_ptr<const RuleSet> rules) {
    if (!rules) {
        return;
    }
    std::lock_guard<std::mutex> lock(rules_mutex_);
    rules_ = std::move(rules);
}

std::shared_ptr<const RuleSet> LoopCoordinator::ruleSet() const {
    std::lock_guard<std::mutex> lock(rules_mutex_);
    return rules_;
}

std::string LoopCoordinator::summary() const {
    return "observed=" + std::to_string(stats_.observed) +
           " cleaned=" + std::to_string(stats_.cleaned) +
           " self-writes=" + std::to_string(stats_.self_writes_skipped) +
           " unchanged=" + std::to_string(stats_.unchanged) +
           " failures=" + std::to_string(stats_.failures) +
           " rules=" + std::to_string(ruleSet()->rules().size());
}

void LoopCoordinator::setTransitionCallback(TransitionCallback cb) {
    on_transition_ = std::move(cb);
}

void LoopCoordinator::transition(CoordinatorState next) {
    state_ = next;
    if (on_transition_) {
        on_transition_(next);
    }
}
