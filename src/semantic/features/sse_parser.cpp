#include "sse_parser.h"

namespace {

// `name:value` or a bare `name`; the name is a plain token.
bool hasFieldShape(const QByteArray& line)
{
    const int colon = line.indexOf(':');
    const QByteArray name = colon < 0 ? line : line.left(colon);
    if (name.isEmpty())
        return false;
    for (const char c : name) {
        const bool token = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z')
                           || (c >= '0' && c <= '9') || c == '-' || c == '_';
        if (!token)
            return false;
    }
    return true;
}

} // namespace

QList<SseEvent> SseParser::feed(const QByteArray& bytes)
{
    m_buffer.append(bytes);
    return drain();
}

QList<SseEvent> SseParser::flush()
{
    QList<SseEvent> events = drain();
    if (m_buffer.trimmed().isEmpty()) {
        m_buffer.clear();
        return events;
    }

    SseEvent event;
    if (parseBlock(m_buffer, event))
        events.append(event);
    m_buffer.clear();
    return events;
}

void SseParser::reset()
{
    m_buffer.clear();
}

QList<SseEvent> SseParser::drain()
{
    QList<SseEvent> events;

    while (true) {
        // Records end at a blank line; take whichever terminator comes first.
        int delimPos = -1;
        int delimLen = 0;

        const int crlfPos = m_buffer.indexOf("\r\n\r\n");
        const int lfPos = m_buffer.indexOf("\n\n");

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

        SseEvent event;
        if (parseBlock(block, event))
            events.append(event);
    }

    return events;
}

bool SseParser::parseBlock(const QByteArray& block, SseEvent& out)
{
    QList<QByteArray> dataLines;
    bool sawField = false;

    if (block.trimmed().startsWith('<')) {
        out.data = block.trimmed();
        out.foreign = true;
        return true;
    }

    const QList<QByteArray> lines = block.split('\n');
    for (QByteArray line : lines) {
        if (line.endsWith('\r'))
            line.chop(1);

        if (line.isEmpty() || line.startsWith(':'))
            continue;

        if (line.startsWith("event:")) {
            out.type = QString::fromUtf8(line.mid(6).trimmed());
            sawField = true;
        } else if (line.startsWith("data:")) {
            QByteArray value = line.mid(5);
            if (value.startsWith(' '))
                value.remove(0, 1);
            dataLines.append(value);
            sawField = true;
        } else if (hasFieldShape(line)) {
            // id, retry and unknown fields carry nothing we use.
            sawField = true;
        } else {
            out.type.clear();
            out.data = block.trimmed();
            out.foreign = true;
            return true;
        }
    }

    if (!sawField || (dataLines.isEmpty() && out.type.isEmpty()))
        return false;

    out.data = dataLines.join('\n');
    return true;
}
