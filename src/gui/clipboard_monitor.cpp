#include "clipboard_monitor.h"
#include "qt_clipboard_backend.h"
#include "../core/logger.h"

ClipboardMonitor::ClipboardMonitor(QtClipboardBackend* backend,
                                   ClipboardWatcher* watcher,
                                   LoopCoordinator* coordinator,
                                   QObject* parent)
    : QObject(parent),
      watcher_(watcher),
      coordinator_(coordinator)
{
    poll_timer_.setSingleShot(true);
    connect(&poll_timer_, &QTimer::timeout,
            this, &ClipboardMonitor::onPollTimeout);
    connect(backend, &QtClipboardBackend::changed,
            this, &ClipboardMonitor::onClipboardChanged);
}

void ClipboardMonitor::start()
{
    Logger::instance().info("Watching clipboard (poll interval " +
                            std::to_string(watcher_->pollInterval().count()) + " ms)");
    pollOnce();
}

void ClipboardMonitor::setEnabled(bool enabled)
{
    if (enabled_ == enabled) return;
    enabled_ = enabled;
    Logger::instance().info(enabled ? "Sanitizing resumed" : "Sanitizing paused");
}

QString ClipboardMonitor::statusLine() const
{
    return QString("%1; %2")
        .arg(enabled_ ? "running" : "paused")
        .arg(QString::fromStdString(coordinator_->summary()));
}

void ClipboardMonitor::onPollTimeout()
{
    pollOnce();
}

void ClipboardMonitor::onClipboardChanged()
{
    // Coalesce bursts of notifications into one poll on the next loop turn.
    if (poll_queued_) return;
    poll_queued_ = true;
    QTimer::singleShot(0, this, [this]() {
        poll_queued_ = false;
        pollOnce();
    });
}

void ClipboardMonitor::pollOnce()
{
    auto event = watcher_->poll();
    // While paused the watcher keeps tracking content so that resuming does
    // not rewrite whatever was copied in the meantime.
    if (event && enabled_) {
        coordinator_->process(*event);
    }
    scheduleNextPoll();
}

void ClipboardMonitor::scheduleNextPoll()
{
    poll_timer_.start(static_cast<int>(watcher_->currentDelay().count()));
}
