#include "sse_writer.h"
#include "core/log_manager.h"

namespace {

const QByteArray kStreamHeader =
    "HTTP/1.1 200 OK\r\n"
    "Content-Type: text/event-stream\r\n"
    "Cache-Control: no-cache\r\n"
    "Connection: keep-alive\r\n"
    "Access-Control-Allow-Origin: *\r\n"
    "Transfer-Encoding: chunked\r\n"
    "\r\n";

const QByteArray kLastChunk = "0\r\n\r\n";

}

QByteArray SseWriter::encodeEvent(const QByteArray& payload)
{
    const QByteArray record = "data: " + payload + "\n\n";
    return QByteArray::number(record.size(), 16) + "\r\n" + record + "\r\n";
}

bool SseWriter::writable() const
{
    return m_socket && m_socket->state() == QAbstractSocket::ConnectedState;
}

void SseWriter::writeEvent(const QByteArray& payload)
{
    if (!writable()) {
        LOG_DEBUG(QStringLiteral("SseWriter: client gone, dropping event"));
        return;
    }

    QByteArray out;
    if (!m_started) {
        out = kStreamHeader;
        m_started = true;
    }
    out.append(encodeEvent(payload));
    m_socket->write(out);
    m_socket->flush();
}

void SseWriter::close(bool withDoneSentinel)
{
    if (!writable() || (!m_started && !withDoneSentinel))
        return;

    QByteArray out;
    if (!m_started) {
        out = kStreamHeader;
        m_started = true;
    }
    if (withDoneSentinel)
        out.append(encodeEvent("[DONE]"));
    out.append(kLastChunk);
    m_socket->write(out);
    m_socket->flush();
}
