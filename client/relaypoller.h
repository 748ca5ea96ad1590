#pragma once
#include <QObject>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QTimer>
#include <QUrl>
#include <QString>

struct PollerSettings {
    QUrl baseUrl;
    QString target = QStringLiteral("proj-x");
    int intervalSeconds = 20;
    QString lastFile;
};

// Polls /api/messages for one channel and prints messages newer than the last
// id it has seen. The last id survives restarts through settings.lastFile.
class RelayPoller : public QObject {
    Q_OBJECT
public:
    explicit RelayPoller(const PollerSettings& settings, QObject* parent = nullptr);
    void start();
    // Stops polling and prints the closing line.
    void stop();
    qulonglong lastId() const { return lastId_; }

private slots:
    void poll();
    void onReplyFinished(QNetworkReply* reply);

private:
    void loadLastId();
    void saveLastId();
    static QString now();

    PollerSettings settings_;
    QNetworkAccessManager network_;
    QTimer pollTimer_;
    qulonglong lastId_ = 0;
    quint64 iteration_ = 0;
    bool inFlight_ = false;
};
