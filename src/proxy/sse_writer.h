#pragma once
#include <QTcpSocket>
#include <QByteArray>

// Writes one chat-completion event stream onto a client socket as a chunked
// HTTP body. The status line goes out together with the first event, so a
// stream that fails before producing anything can still be answered with a
// plain HTTP error.
class SseWriter {
public:
    explicit SseWriter(QTcpSocket* socket = nullptr) : m_socket(socket) {}

    bool started() const { return m_started; }

    void writeEvent(const QByteArray& payload);

    // Ends the chunked body. A failed stream closes without [DONE].
    void close(bool withDoneSentinel);

    // `data: <payload>` record wrapped in one HTTP chunk.
    static QByteArray encodeEvent(const QByteArray& payload);

private:
    QTcpSocket* m_socket;
    bool m_started = false;

    bool writable() const;
};
