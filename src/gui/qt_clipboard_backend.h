#pragma once

#include <QObject>
#include <QClipboard>

#include "../core/clipboard_backend.h"

/// ClipboardBackend over QClipboard. Must live on, and be called from, the
/// thread running the Qt event loop.
///
/// The change counter follows QClipboard::dataChanged where the platform
/// reports every change (X11, Windows). Elsewhere (Wayland, macOS) the
/// notification only arrives while the application has focus, so the counter
/// advances on every query and the watcher falls back to content hashing.
class QtClipboardBackend : public QObject, public ClipboardBackend {
    Q_OBJECT

public:
    explicit QtClipboardBackend(QObject* parent = nullptr);

    uint64_t changeCount() override;
    std::string readText() override;
    void writeText(const std::string& text) override;

    bool usesChangeNotifications() const { return trust_notifications_; }

signals:
    /// Re-emitted QClipboard::dataChanged.
    void changed();

private slots:
    void onClipboardChanged();

private:
    QClipboard* clipboardOrThrow() const;

    uint64_t counter_ = 0;
    bool trust_notifications_ = false;
};
