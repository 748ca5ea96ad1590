#include "pollreply.h"
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QVariant>

PollBatch parsePollReply(const QByteArray& body, qulonglong lastId) {
    PollBatch batch;
    batch.lastId = lastId;

    QJsonParseError parseError;
    QJsonDocument jsonDocument = QJsonDocument::fromJson(body, &parseError);
    if (parseError.error != QJsonParseError::NoError || !jsonDocument.isObject()) return batch;
    QJsonValue messagesValue = jsonDocument.object().value(QStringLiteral("messages"));
    if (!messagesValue.isArray()) return batch;
    batch.valid = true;

    for (const QJsonValue& v : messagesValue.toArray()) {
        QJsonObject m = v.toObject();
        qulonglong id = m.value(QStringLiteral("id")).toVariant().toULongLong();
        if (id <= lastId) continue;
        QString firstLine = m.value(QStringLiteral("text")).toString().section('\n', 0, 0);
        batch.lines << QStringLiteral("#%1 [%2] %3").arg(id).arg(m.value(QStringLiteral("sender")).toString(), firstLine);
        if (id > batch.lastId) batch.lastId = id;
    }
    return batch;
}
