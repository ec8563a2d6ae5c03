#pragma once
#include <QByteArray>
#include <QList>
#include <QString>

// One complete SSE record. `foreign` marks a block that is markup or carries
// lines without a field shape (an HTML page served in place of the event
// stream); `data` then holds the raw block. Unknown field names are skipped.
struct SseEvent {
    QString type;
    QByteArray data;
    bool foreign = false;
};

class SseParser {
public:
    // Appends bytes and returns every record completed by them. Trailing
    // partial bytes stay buffered for the next call.
    QList<SseEvent> feed(const QByteArray& bytes);

    // Terminates the buffered remainder as if a blank line had arrived.
    QList<SseEvent> flush();

    void reset();
    bool hasPendingBytes() const { return !m_buffer.isEmpty(); }

private:
    QByteArray m_buffer;

    QList<SseEvent> drain();
    static bool parseBlock(const QByteArray& block, SseEvent& out);
};
