#pragma once

#include <QObject>
#include <QTimer>
#include <QString>

#include "../core/clipboard_watcher.h"
#include "../core/loop_coordinator.h"

class QtClipboardBackend;

/// Drives the watcher and coordinator from the Qt event loop: a poll timer
/// plus an immediate poll whenever the clipboard reports a change. All
/// iterations run on the GUI thread, one after another.
class ClipboardMonitor : public QObject {
    Q_OBJECT

public:
    ClipboardMonitor(QtClipboardBackend* backend,
                     ClipboardWatcher* watcher,
                     LoopCoordinator* coordinator,
                     QObject* parent = nullptr);

    void start();

    void setEnabled(bool enabled);
    bool isEnabled() const { return enabled_; }

    /// Human-readable status line (used by the "status" control command).
    QString statusLine() const;

private slots:
    void onPollTimeout();
    void onClipboardChanged();

private:
    void pollOnce();
    void scheduleNextPoll();

    ClipboardWatcher* watcher_;
    LoopCoordinator* coordinator_;
    QTimer poll_timer_;
    bool enabled_ = true;
    bool poll_queued_ = false;
};
