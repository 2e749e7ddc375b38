#include "sse_parser.h"

QList<SseEvent> SseParser::feed(const QByteArray& bytes)
{
    QList<SseEvent> out;
    if (m_done)
        return out;
    m_buffer.append(bytes);
    drainBlocks(out);
    return out;
}

QList<SseEvent> SseParser::finish()
{
    QList<SseEvent> out;
    if (!m_done && !m_buffer.isEmpty()) {
        // Flush a trailing block that was not terminated by a blank line.
        m_buffer.append("\n\n");
        drainBlocks(out);
    }
    m_buffer.clear();
    return out;
}

QList<SseEvent> SseParser::parseAll(const QByteArray& body)
{
    SseParser parser;
    QList<SseEvent> events = parser.feed(body);
    events.append(parser.finish());
    return events;
}

void SseParser::drainBlocks(QList<SseEvent>& out)
{
    while (!m_done) {
        // "\r\n\r\n" is checked first so a CRLF stream is not cut mid-delimiter.
        qsizetype delimPos = -1;
        qsizetype delimLen = 0;

        const qsizetype crlfPos = m_buffer.indexOf("\r\n\r\n");
        const qsizetype lfPos = m_buffer.indexOf("\n\n");

        if (crlfPos >= 0 && (lfPos < 0 || crlfPos <= lfPos)) {
            delimPos = crlfPos;
            delimLen = 4;
        } else if (lfPos >= 0) {
            delimPos = lfPos;
            delimLen = 2;
        }

        if (delimPos < 0)
            break;

        const QByteArray block = m_buffer.left(delimPos);
        m_buffer.remove(0, delimPos + delimLen);
        parseBlock(block, out);
    }
    if (m_done)
        m_buffer.clear();
}

void SseParser::parseBlock(const QByteArray& block, QList<SseEvent>& out)
{
    SseEvent event;
    QList<QByteArray> dataLines;

    const QList<QByteArray> lines = block.split('\n');
    for (const QByteArray& rawLine : lines) {
        QByteArray line = rawLine;
        if (line.endsWith('\r'))
            line.chop(1);

        if (line.isEmpty() || line.startsWith(':'))
            continue;

        if (line.startsWith("event:")) {
            event.type = QString::fromUtf8(line.mid(6).trimmed());
        } else if (line.startsWith("data:")) {
            QByteArray value = line.mid(5);
            if (value.startsWith(' '))
                value.remove(0, 1);
            dataLines.append(value);
        } else if (line.startsWith("id:")) {
            event.id = QString::fromUtf8(line.mid(3).trimmed());
        }
        // retry: and unknown fields are ignored
    }

    if (dataLines.isEmpty())
        return;

    event.data = dataLines.join('\n');
    if (event.data.trimmed() == "[DONE]") {
        m_done = true;
        return;
    }
    if (event.data.isEmpty())
        return;
    out.append(event);
}
