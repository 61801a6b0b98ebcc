#include "qt_clipboard_backend.h"

#include <QGuiApplication>
#include <QMimeData>
#include <QString>

QtClipboardBackend::QtClipboardBackend(QObject* parent)
    : QObject(parent)
{
    const QString platform = QGuiApplication::platformName();
    trust_notifications_ = (platform == "xcb" || platform == "windows");

    auto* clipboard = QGuiApplication::clipboard();
    if (clipboard) {
        connect(clipboard, &QClipboard::dataChanged,
                this, &QtClipboardBackend::onClipboardChanged);
    }
}

void QtClipboardBackend::onClipboardChanged()
{
    ++counter_;
    emit changed();
}

uint64_t QtClipboardBackend::changeCount()
{
    clipboardOrThrow();
    if (!trust_notifications_) {
        ++counter_;
    }
    return counter_;
}

std::string QtClipboardBackend::readText()
{
    QClipboard* clipboard = clipboardOrThrow();
    const QMimeData* data = clipboard->mimeData(QClipboard::Clipboard);
    if (!data) {
        throw ClipboardUnavailable("clipboard contents could not be retrieved");
    }
    // Images, files and other non-text payloads are not our business.
    if (!data->hasText()) {
        return {};
    }
    return data->text().toStdString();
}

void QtClipboardBackend::writeText(const std::string& text)
{
    QClipboard* clipboard = clipboardOrThrow();
    clipboard->setText(QString::fromStdString(text), QClipboard::Clipboard);
}

QClipboard* QtClipboardBackend::clipboardOrThrow() const
{
    auto* clipboard = QGuiApplication::clipboard();
    if (!clipboard) {
        throw ClipboardUnavailable("no clipboard (is a display session available?)",
                                   /*retryable=*/false);
    }
    return clipboard;
}
