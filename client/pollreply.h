#pragma once
#include <QByteArray>
#include <QString>
#include <QStringList>

// What one /api/messages reply means for the poller: the lines to print for
// messages it has not seen, and the id to resume from.
struct PollBatch {
    bool valid = false;
    QStringList lines;
    qulonglong lastId = 0;
};

// Lines are "#<id> [<sender>] <first line of text>". Messages at or below
// lastId are skipped. A body that is not a JSON object with a "messages"
// array yields valid == false and keeps lastId.
PollBatch parsePollReply(const QByteArray& body, qulonglong lastId);
