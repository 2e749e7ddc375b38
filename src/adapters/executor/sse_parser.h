#pragma once
#include <QByteArray>
#include <QList>
#include <QString>

struct SseEvent {
    QString type;
    QByteArray data;
    QString id;
};

// Incremental Server-Sent-Events decoder. Blocks are delimited by a blank
// line; "data: [DONE]" ends the stream and later bytes are ignored.
class SseParser {
public:
    QList<SseEvent> feed(const QByteArray& bytes);
    QList<SseEvent> finish();

    bool isDone() const { return m_done; }

    static QList<SseEvent> parseAll(const QByteArray& body);

private:
    QByteArray m_buffer;
    bool m_done = false;

    void drainBlocks(QList<SseEvent>& out);
    void parseBlock(const QByteArray& block, QList<SseEvent>& out);
};
