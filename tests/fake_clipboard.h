// fake_clipboard.h
#pragma once
#include "clipboard_backend.h"

#include <cstdint>
#include <string>
#include <vector>

/// In-memory clipboard for driving the watcher and coordinator in tests.
class FakeClipboard : public ClipboardBackend {
public:
    uint64_t changeCount() override {
        ++queries;
        failIfRequested();
        return counter;
    }

    std::string readText() override {
        ++reads;
        failIfRequested();
        if (fail_reads > 0) {
            --fail_reads;
            throw ClipboardUnavailable("clipboard owner did not answer");
        }
        return text;
    }

    void writeText(const std::string& value) override {
        if (fail_writes) {
            throw ClipboardUnavailable("clipboard is locked by another process");
        }
        text = value;
        ++counter;
        writes.push_back(value);
    }

    /// Simulate another application copying `value`.
    void externalCopy(const std::string& value) {
        text = value;
        ++counter;
    }

    /// Bump the counter without changing the content (spurious notification).
    void touch() { ++counter; }

    std::string text;
    uint64_t counter = 0;
    int queries = 0;
    int reads = 0;
    int fail_next = 0;          // number of upcoming calls that throw
    int fail_reads = 0;         // number of upcoming readText() calls that throw
    bool fail_retryable = true; // retryable flag of the fail_next errors
    bool fail_writes = false;
    std::vector<std::string> writes;

private:
    void failIfRequested() {
        if (fail_next > 0) {
            --fail_next;
            throw ClipboardUnavailable("cannot open display", fail_retryable);
        }
    }
};
