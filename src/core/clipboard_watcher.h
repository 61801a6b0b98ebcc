#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

#include "clipboard_backend.h"
#include "retry_backoff.h"

/// One observed change of the clipboard's text content.
struct ClipboardEvent {
    std::string text;
    uint64_t sequence = 0;   // backend change counter when observed
};

struct WatcherConfig {
    std::chrono::milliseconds poll_interval{250};
    std::chrono::milliseconds backoff_initial{250};
    std::chrono::milliseconds backoff_max{5000};
};

/// Turns a ClipboardBackend into a sequence of ClipboardEvents.
///
/// A change is reported when the backend's change counter advanced AND the
/// text differs from the last observed text, so spurious notifications and
/// re-reads of identical content never produce events. Empty text is not
/// reported. ClipboardUnavailable is absorbed here: it is logged and polling
/// slows down following an exponential backoff until access works again
/// (straight to the maximum delay when the failure is not retryable).
/// Text passed to write() becomes the last observed content, so the echo of
/// our own write produces no event.
///
/// poll()/next()/write() belong to one thread; stop() may be called from any.
class ClipboardWatcher {
public:
    explicit ClipboardWatcher(ClipboardBackend& backend, WatcherConfig config = {});

    ClipboardWatcher(const ClipboardWatcher&) = delete;
    ClipboardWatcher& operator=(const ClipboardWatcher&) = delete;

    /// One non-blocking observation step.
    std::optional<ClipboardEvent> poll();

    /// Block until the next event. Returns nullopt once stop() was called.
    std::optional<ClipboardEvent> next();

    /// Set the clipboard text and remember it as observed. Throws
    /// ClipboardUnavailable.
    void write(const std::string& text);

    /// Wake and end next(). Safe to call from another thread.
    void stop();
    bool isStopped() const { return stopped_.load(); }

    /// Delay before the next poll: the poll interval, or the backoff delay
    /// while the clipboard is unavailable.
    std::chrono::milliseconds currentDelay() const { return delay_; }

    void setPollInterval(std::chrono::milliseconds interval);
    std::chrono::milliseconds pollInterval() const { return config_.poll_interval; }

    /// Consecutive ClipboardUnavailable failures.
    int failureStreak() const { return backoff_.failures(); }

private:
    void recordFailure(const ClipboardUnavailable& e);
    void recordSuccess();

    ClipboardBackend& backend_;
    WatcherConfig config_;
    RetryBackoff backoff_;
    std::chrono::milliseconds delay_;

    bool primed_ = false;
    uint64_t last_count_ = 0;
    bool has_hash_ = false;
    size_t last_hash_ = 0;

    std::mutex mutex_;
    std::condition_variable cv_;
    std::atomic<bool> stopped_{false};
};
