#include <QGuiApplication>
#include <QSettings>
#include <QStandardPaths>
#include <QDir>
#include <QFileInfo>
#include <QFileSystemWatcher>
#include <QLocalServer>
#include <QLocalSocket>
#include <QTimer>

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <memory>

#include "core/logger.h"
#include "core/rule_set.h"
#include "core/rules_file.h"
#include "core/url_sanitizer.h"
#include "core/clipboard_watcher.h"
#include "core/loop_coordinator.h"
#include "gui/qt_clipboard_backend.h"
#include "gui/clipboard_monitor.h"

#ifndef CLIPBOARD_SANITIZER_VERSION
#define CLIPBOARD_SANITIZER_VERSION "0.0.0"
#endif

static const char* kLocalServerName = "ClipboardSanitizerSingleInstance";
static constexpr int kDefaultPollIntervalMs = 250;
static constexpr int kMinPollIntervalMs = 50;
static constexpr int kMaxPollIntervalMs = 10000;

/// Route Qt's own diagnostics into the process logger.
static void messageHandler(QtMsgType type, const QMessageLogContext&, const QString& msg) {
    Logger& logger = Logger::instance();
    std::string text = "Qt: " + msg.toStdString();
    switch (type) {
        case QtDebugMsg:    logger.debug(text); break;
        case QtInfoMsg:     logger.info(text);  break;
        case QtWarningMsg:  logger.warn(text);  break;
        case QtCriticalMsg: logger.error(text); break;
        case QtFatalMsg:
            logger.error(text);
            abort();
    }
}

struct CliOptions {
    QString log_level;
    QString log_file;
    QString rules_file;
    int poll_interval_ms = 0;        // 0 = from settings
    QString check_text;
    bool check = false;
    bool init_config = false;
    QString control_command;         // reload | pause | resume | status
    bool help = false;
    bool version = false;
};

static void printUsage() {
    std::cout <<
        "Usage: clipboard-sanitizer [options]\n"
        "\n"
        "Watches the clipboard and strips tracking parameters from copied URLs.\n"
        "\n"
        "Options:\n"
        "  -v, --verbose <level>   log level: debug, info, warn, error (default: info)\n"
        "  -c, --config <path>     rules file (default: <config dir>/rules.json)\n"
        "  -i, --interval <ms>     clipboard poll interval, 50..10000 (default: 250)\n"
        "  -l, --log-file <path>   also append log lines to this file\n"
        "      --check <text>      print the sanitized form of <text> and exit\n"
        "      --init-config       write the built-in rules to the rules file and exit\n"
        "      --reload            ask the running instance to reload its rules\n"
        "      --pause, --resume   pause or resume the running instance\n"
        "      --status            print the running instance's counters\n"
        "  -h, --help              show this help\n"
        "      --version           show the version\n";
}

static bool parseArgs(int argc, char* argv[], CliOptions& opts, QString& error) {
    for (int i = 1; i < argc; ++i) {
        QString arg = QString::fromLocal8Bit(argv[i]);

        auto takeValue = [&](QString& out) {
            if (i + 1 >= argc) {
                error = arg + " needs a value";
                return false;
            }
            out = QString::fromLocal8Bit(argv[++i]);
            return true;
        };

        if (arg == "-v" || arg == "--verbose") {
            if (!takeValue(opts.log_level)) return false;
        } else if (arg == "-c" || arg == "--config") {
            if (!takeValue(opts.rules_file)) return false;
        } else if (arg == "-l" || arg == "--log-file") {
            if (!takeValue(opts.log_file)) return false;
        } else if (arg == "-i" || arg == "--interval") {
            QString value;
            if (!takeValue(value)) return false;
            bool ok = false;
            int ms = value.toInt(&ok);
            if (!ok || ms < kMinPollIntervalMs || ms > kMaxPollIntervalMs) {
                error = "--interval must be between 50 and 10000";
                return false;
            }
            opts.poll_interval_ms = ms;
        } else if (arg == "--check") {
            if (!takeValue(opts.check_text)) return false;
            opts.check = true;
        } else if (arg == "--init-config") {
            opts.init_config = true;
        } else if (arg == "--reload" || arg == "--pause" || arg == "--resume" || arg == "--status") {
            opts.control_command = arg.mid(2);
        } else if (arg == "-h" || arg == "--help") {
            opts.help = true;
        } else if (arg == "--version") {
            opts.version = true;
        } else {
            error = "unknown option " + arg;
            return false;
        }
    }
    return true;
}

static QString defaultRulesPath() {
    return QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation)
           + "/rules.json";
}

/// Send one command to a running instance. Returns false if none is running.
static bool sendToRunningInstance(const QString& command, QString* reply) {
    QLocalSocket socket;
    socket.connectToServer(kLocalServerName);
    if (!socket.waitForConnected(1000)) {
        return false;
    }
    socket.write(command.toUtf8());
    socket.waitForBytesWritten(2000);
    if (reply && socket.waitForReadyRead(2000)) {
        *reply = QString::fromUtf8(socket.readAll()).trimmed();
    }
    socket.disconnectFromServer();
    return true;
}

int main(int argc, char* argv[])
{
    QCoreApplication::setOrganizationName("ClipboardSanitizer");
    QCoreApplication::setApplicationName("clipboard-sanitizer");
    QCoreApplication::setApplicationVersion(CLIPBOARD_SANITIZER_VERSION);

    CliOptions opts;
    QString argError;
    if (!parseArgs(argc, argv, opts, argError)) {
        std::cerr << "clipboard-sanitizer: " << argError.toStdString() << "\n\n";
        printUsage();
        return 2;
    }
    if (opts.help) {
        printUsage();
        return 0;
    }
    if (opts.version) {
        std::cout << "clipboard-sanitizer " << CLIPBOARD_SANITIZER_VERSION << "\n";
        return 0;
    }

    qInstallMessageHandler(messageHandler);

    // --- Settings (command line wins) ---
    QSettings settings;
    Logger& logger = Logger::instance();

    QString levelName = !opts.log_level.isEmpty()
        ? opts.log_level
        : settings.value("settings/log_level", "info").toString();
    LogLevel level = LogLevel::LVL_INFO;
    if (!Logger::parseLevel(levelName.toStdString(), level)) {
        std::cerr << "clipboard-sanitizer: unknown log level '" << levelName.toStdString()
                  << "', using info\n";
    }
    logger.setLevel(level);

    QString logFile = !opts.log_file.isEmpty()
        ? opts.log_file
        : settings.value("settings/log_file").toString();
    if (!logFile.isEmpty()) {
        QString logDir = QFileInfo(logFile).absolutePath();
        if (!logDir.isEmpty()) QDir().mkpath(logDir);
        logger.setLogFile(logFile.toStdString());
    }

    QString rulesPath = !opts.rules_file.isEmpty()
        ? opts.rules_file
        : settings.value("settings/rules_file", defaultRulesPath()).toString();

    if (opts.init_config) {
        if (QFileInfo::exists(rulesPath)) {
            std::cerr << "clipboard-sanitizer: " << rulesPath.toStdString() << " already exists\n";
            return 1;
        }
        if (!RulesFile::save(rulesPath.toStdString(), RuleSet::defaultConfig())) {
            std::cerr << "clipboard-sanitizer: cannot write " << rulesPath.toStdString() << "\n";
            return 1;
        }
        std::cout << "Wrote built-in rules to " << rulesPath.toStdString() << "\n";
        return 0;
    }

    if (opts.check) {
        auto rules = loadRuleSet(rulesPath.toStdString());
        SanitizationResult result = sanitize(opts.check_text.toStdString(), *rules);
        std::cout << result.cleaned << "\n";
        return 0;
    }

    QGuiApplication app(argc, argv);
    app.setQuitOnLastWindowClosed(false);

    if (!opts.control_command.isEmpty()) {
        QString reply;
        if (!sendToRunningInstance(opts.control_command, &reply)) {
            std::cerr << "clipboard-sanitizer: no running instance\n";
            return 1;
        }
        if (!reply.isEmpty()) std::cout << reply.toStdString() << "\n";
        return 0;
    }

    // Single-instance check: a second start makes the running one reload.
    if (sendToRunningInstance("reload", nullptr)) {
        logger.info("Already running; asked the running instance to reload its rules");
        return 0;
    }

    // Remove any stale server (e.g. after crash)
    QLocalServer::removeServer(kLocalServerName);
    QLocalServer localServer;
    if (!localServer.listen(kLocalServerName)) {
        logger.warn("Single-instance server unavailable: " + localServer.errorString().toStdString());
    }

    int intervalMs = opts.poll_interval_ms > 0
        ? opts.poll_interval_ms
        : settings.value("settings/poll_interval_ms", kDefaultPollIntervalMs).toInt();
    intervalMs = qBound(kMinPollIntervalMs, intervalMs, kMaxPollIntervalMs);

    QtClipboardBackend backend;
    if (!backend.usesChangeNotifications()) {
        logger.info("Platform '" + QGuiApplication::platformName().toStdString() +
                    "' does not report every clipboard change; comparing content on each poll");
    }

    WatcherConfig watcherConfig;
    watcherConfig.poll_interval = std::chrono::milliseconds(intervalMs);
    ClipboardWatcher watcher(backend, watcherConfig);

    const std::string rulesPathStd = rulesPath.toStdString();
    LoopCoordinator coordinator(watcher, loadRuleSet(rulesPathStd));

    ClipboardMonitor monitor(&backend, &watcher, &coordinator);

    // --- Rules hot reload ---
    QFileSystemWatcher rulesWatcher;
    auto watchRules = [&rulesWatcher, rulesPath]() {
        if (QFileInfo::exists(rulesPath) && !rulesWatcher.files().contains(rulesPath))
            rulesWatcher.addPath(rulesPath);
        QString dir = QFileInfo(rulesPath).absolutePath();
        if (QFileInfo::exists(dir) && !rulesWatcher.directories().contains(dir))
            rulesWatcher.addPath(dir);
    };
    watchRules();

    QTimer reloadDebounce;
    reloadDebounce.setSingleShot(true);
    reloadDebounce.setInterval(200);
    auto reloadRules = [&coordinator, &logger, &watchRules, rulesPathStd]() {
        logger.info("Reloading rules from " + rulesPathStd);
        coordinator.setRuleSet(loadRuleSet(rulesPathStd));
        // Editors often replace the file, which drops it from the watch list.
        watchRules();
    };
    QObject::connect(&reloadDebounce, &QTimer::timeout, reloadRules);
    QObject::connect(&rulesWatcher, &QFileSystemWatcher::fileChanged,
                     &reloadDebounce, [&reloadDebounce]() { reloadDebounce.start(); });
    QObject::connect(&rulesWatcher, &QFileSystemWatcher::directoryChanged,
                     &reloadDebounce, [&reloadDebounce, &rulesWatcher, rulesPath]() {
        // Only react to the rules file appearing or being replaced.
        if (QFileInfo::exists(rulesPath) != rulesWatcher.files().contains(rulesPath))
            reloadDebounce.start();
    });

    // --- Control commands from other instances ---
    QObject::connect(&localServer, &QLocalServer::newConnection, [&]() {
        while (localServer.hasPendingConnections()) {
            QLocalSocket* client = localServer.nextPendingConnection();
            if (!client) continue;

            QObject::connect(client, &QLocalSocket::readyRead,
                             [&monitor, &reloadRules, client]() {
                QString msg = QString::fromUtf8(client->readAll()).trimmed();
                QString reply;

                if (msg == "reload") {
                    reloadRules();
                    reply = "reloaded";
                } else if (msg == "pause") {
                    monitor.setEnabled(false);
                    reply = "paused";
                } else if (msg == "resume") {
                    monitor.setEnabled(true);
                    reply = "resumed";
                } else if (msg == "status") {
                    reply = monitor.statusLine();
                } else {
                    reply = "unknown command";
                }

                client->write(reply.toUtf8());
                client->flush();
                client->disconnectFromServer();
                client->deleteLater();
            });
        }
    });

    monitor.start();
    return app.exec();
}
