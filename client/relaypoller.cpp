#include "relaypoller.h"
#include "pollreply.h"
#include <QCoreApplication>
#include <QDateTime>
#include <QFile>
#include <QNetworkRequest>
#include <QTextStream>
#include <QUrlQuery>

static QTextStream& out() {
    static QTextStream stream(stdout);
    return stream;
}

RelayPoller::RelayPoller(const PollerSettings& settings, QObject* parent)
    : QObject(parent), settings_(settings) {
    connect(&network_, &QNetworkAccessManager::finished, this, &RelayPoller::onReplyFinished);
    pollTimer_.setInterval(settings_.intervalSeconds * 1000);
    connect(&pollTimer_, &QTimer::timeout, this, &RelayPoller::poll);
}

QString RelayPoller::now() {
    return QDateTime::currentDateTime().toString(Qt::ISODate);
}

void RelayPoller::start() {
    loadLastId();
    out() << now() << " poller_start pid=" << QCoreApplication::applicationPid()
          << " interval=" << settings_.intervalSeconds << "s base=" << settings_.baseUrl.toString()
          << " target=" << settings_.target << " last=" << lastId_ << Qt::endl;
    poll();
    pollTimer_.start();
}

void RelayPoller::stop() {
    pollTimer_.stop();
    out() << now() << " poller_term last=" << lastId_ << Qt::endl;
}

void RelayPoller::loadLastId() {
    QFile file(settings_.lastFile);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) return;
    bool ok = false;
    qulonglong v = QString::fromUtf8(file.readAll()).trimmed().toULongLong(&ok);
    lastId_ = ok ? v : 0;
}

void RelayPoller::saveLastId() {
    QFile file(settings_.lastFile);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate | QIODevice::Text)) {
        out() << now() << " cannot write " << settings_.lastFile << ": " << file.errorString() << Qt::endl;
        return;
    }
    file.write(QByteArray::number(lastId_) + "\n");
}

void RelayPoller::poll() {
    // a slow server must not pile up requests
    if (inFlight_) return;

    QUrl url = settings_.baseUrl;
    QString basePath = url.path();
    while (basePath.endsWith('/')) basePath.chop(1);
    url.setPath(basePath + QStringLiteral("/api/messages"));
    QUrlQuery query;
    query.addQueryItem(QStringLiteral("target"), settings_.target);
    query.addQueryItem(QStringLiteral("since_id"), QString::number(lastId_));
    query.addQueryItem(QStringLiteral("limit"), QStringLiteral("200"));
    url.setQuery(query);

    QNetworkRequest request(url);
    request.setTransferTimeout(10000);
    inFlight_ = true;
    network_.get(request);
}

void RelayPoller::onReplyFinished(QNetworkReply* reply) {
    reply->deleteLater();
    inFlight_ = false;
    const QString stamp = now();

    if (reply->error() != QNetworkReply::NoError) {
        out() << stamp << " poll_failed " << reply->errorString() << Qt::endl;
    } else {
        PollBatch batch = parsePollReply(reply->readAll(), lastId_);
        if (!batch.valid) {
            out() << stamp << " poll_failed unexpected reply body" << Qt::endl;
        } else if (!batch.lines.isEmpty()) {
            out() << stamp << " new_messages" << Qt::endl;
            for (const QString& line : batch.lines) out() << line << Qt::endl;
        }
        if (batch.lastId > lastId_) {
            lastId_ = batch.lastId;
            saveLastId();
        }
    }

    ++iteration_;
    if (iteration_ % 3 == 0) out() << stamp << " heartbeat last=" << lastId_ << Qt::endl;
}
