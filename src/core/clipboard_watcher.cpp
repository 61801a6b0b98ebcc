#include "clipboard_watcher.h"
#include "logger.h"

#include <algorithm>
#include <functional>

ClipboardWatcher::ClipboardWatcher(ClipboardBackend& backend, WatcherConfig config)
    : backend_(backend),
      config_(config),
      backoff_(config.backoff_initial, config.backoff_max),
      delay_(config.poll_interval)
{
}

std::optional<ClipboardEvent> ClipboardWatcher::poll() {
    uint64_t count = 0;
    std::string text;
    try {
        count = backend_.changeCount();
        if (primed_ && count == last_count_) {
            recordSuccess();
            return std::nullopt;
        }
        text = backend_.readText();
    } catch (const ClipboardUnavailable& e) {
        recordFailure(e);
        return std::nullopt;
    }
    recordSuccess();

    primed_ = true;
    last_count_ = count;

    size_t hash = std::hash<std::string>{}(text);
    if (has_hash_ && hash == last_hash_) {
        Logger::instance().debug("Clipboard counter advanced to " + std::to_string(count) +
                                 " with identical content");
        return std::nullopt;
    }
    has_hash_ = true;
    last_hash_ = hash;

    if (text.empty()) {
        return std::nullopt;
    }

    Logger::instance().debug("Clipboard changed (sequence " + std::to_string(count) + ")");
    return ClipboardEvent{std::move(text), count};
}

std::optional<ClipboardEvent> ClipboardWatcher::next() {
    while (!stopped_.load()) {
        auto event = poll();
        if (event) {
            return event;
        }

        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, delay_, [this] { return stopped_.load(); });
    }
    return std::nullopt;
}

void ClipboardWatcher::write(const std::string& text) {
    backend_.writeText(text);
    // Our own write is the content last seen, so copying the previous text
    // again still counts as a change.
    has_hash_ = true;
    last_hash_ = std::hash<std::string>{}(text);
}

void ClipboardWatcher::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopped_.store(true);
    }
    cv_.notify_all();
}

void ClipboardWatcher::setPollInterval(std::chrono::milliseconds interval) {
    config_.poll_interval = std::max(interval, std::chrono::milliseconds(1));
    if (backoff_.failures() == 0) {
        delay_ = config_.poll_interval;
    }
}

void ClipboardWatcher::recordFailure(const ClipboardUnavailable& e) {
    delay_ = backoff_.nextDelay();
    if (!e.isRetryable()) {
        delay_ = backoff_.maxDelay();
    }
    std::string msg = std::string("Clipboard unavailable: ") + e.what() +
                      " (retrying in " + std::to_string(delay_.count()) + " ms)";
    if (backoff_.failures() == 1) {
        Logger::instance().warn(msg);
    } else {
        Logger::instance().debug(msg);
    }
}

void ClipboardWatcher::recordSuccess() {
    if (backoff_.failures() > 0) {
        Logger::instance().info("Clipboard available again after " +
                                std::to_string(backoff_.failures()) + " failed attempt(s)");
        backoff_.reset();
    }
    delay_ = config_.poll_interval;
}
