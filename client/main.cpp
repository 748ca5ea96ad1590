#include <QCoreApplication>
#include <QTextStream>
#include <QTimer>
#include <csignal>
#include "relaypoller.h"

static volatile std::sig_atomic_t stopRequested = 0;

static void onStopSignal(int) {
    stopRequested = 1;
}

static QString envOr(const char* name, const QString& fallback) {
    QString v = qEnvironmentVariable(name);
    return v.isEmpty() ? fallback : v;
}

// BASE_URL=http://127.0.0.1:8010 LASTFILE=/tmp/last TARGET=proj-x INTERVAL=20 relay_poller
int main(int argc, char** argv) {
    QCoreApplication app(argc, argv);
    QTextStream err(stderr);

    PollerSettings settings;
    settings.baseUrl = QUrl(envOr("BASE_URL", QString()));
    settings.lastFile = envOr("LASTFILE", QString());
    settings.target = envOr("TARGET", settings.target);
    bool ok = false;
    int interval = envOr("INTERVAL", QStringLiteral("20")).toInt(&ok);
    settings.intervalSeconds = (ok && interval > 0) ? interval : 20;

    if (!settings.baseUrl.isValid() || settings.baseUrl.isEmpty()) {
        err << "BASE_URL not set" << Qt::endl;
        return 2;
    }
    if (settings.lastFile.isEmpty()) {
        err << "LASTFILE not set" << Qt::endl;
        return 2;
    }

    RelayPoller poller(settings);
    std::signal(SIGINT, onStopSignal);
    std::signal(SIGTERM, onStopSignal);
    // the handler only sets a flag; the event loop notices it here
    QTimer signalCheck;
    signalCheck.setInterval(250);
    QObject::connect(&signalCheck, &QTimer::timeout, &app, [&poller, &app]() {
        if (!stopRequested) return;
        poller.stop();
        app.quit();
    });
    signalCheck.start();

    poller.start();
    return app.exec();
}
