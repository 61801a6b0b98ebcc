#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

/// Exception thrown when the OS clipboard cannot be accessed right now
/// (another process holds it, no display/session, ...).
class ClipboardUnavailable : public std::runtime_error {
public:
    explicit ClipboardUnavailable(const std::string& what, bool retryable = true)
        : std::runtime_error(what), retryable_(retryable) {}

    bool isRetryable() const noexcept { return retryable_; }

private:
    bool retryable_;
};

/// Platform clipboard primitives. One implementation per platform; the
/// watcher and coordinator only see this interface.
/// All methods may throw ClipboardUnavailable.
class ClipboardBackend {
public:
    virtual ~ClipboardBackend() = default;

    /// Monotonic counter, advanced on every clipboard content change
    /// (including this process's own writes, exactly once per write).
    virtual uint64_t changeCount() = 0;

    /// Current text content; empty when the clipboard holds no text.
    virtual std::string readText() = 0;

    /// Replace the clipboard content with `text`.
    virtual void writeText(const std::string& text) = 0;
};
