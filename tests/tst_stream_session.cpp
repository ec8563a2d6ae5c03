#include <QTest>
#include <QIODevice>
#include <cstring>
#include "semantic/stream_session.h"
#include "adapters/outbound/codex.h"

// In-memory upstream body; the test pushes bytes and ends the stream.
class FakeUpstream : public QIODevice {
    Q_OBJECT
public:
    FakeUpstream() { open(QIODevice::ReadOnly); }

    void push(const QByteArray& bytes) {
        m_data.append(bytes);
        emit readyRead();
    }
    void finish() { emit readChannelFinished(); }

    bool isSequential() const override { return true; }
    qint64 bytesAvailable() const override {
        return m_data.size() + QIODevice::bytesAvailable();
    }

protected:
    qint64 readData(char* data, qint64 maxSize) override {
        const qint64 n = qMin<qint64>(maxSize, m_data.size());
        memcpy(data, m_data.constData(), n);
        m_data.remove(0, n);
        return n;
    }
    qint64 writeData(const char*, qint64) override { return -1; }

private:
    QByteArray m_data;
};

struct SessionProbe {
    QList<StreamFrame> frames;
    QList<DomainFailure> errors;
    int finished = 0;

    void attach(StreamSession* session) {
        QObject::connect(session, &StreamSession::frameReady, session,
                         [this](const StreamFrame& f) { frames.append(f); });
        QObject::connect(session, &StreamSession::error, session,
                         [this](const DomainFailure& f) { errors.append(f); });
        QObject::connect(session, &StreamSession::finished, session,
                         [this]() { ++finished; });
    }
};

class TestStreamSession : public QObject {
    Q_OBJECT

private slots:
    void testFramesAndDoneSentinel() {
        CodexOutbound outbound;
        auto* upstream = new FakeUpstream;
        StreamSession session(upstream, &outbound);
        SessionProbe probe;
        probe.attach(&session);

        upstream->push("event: response.created\n"
                       "data: {\"type\":\"response.created\",\"response\":{\"id\":\"r\"}}\n\n"
                       "data: {\"type\":\"response.output_text.delta\",\"delta\":\"Hi\"}\n\n");
        QCOMPARE(probe.frames.size(), 2);
        QCOMPARE(probe.frames[0].type, FrameType::Started);
        QCOMPARE(probe.frames[1].text(), QStringLiteral("Hi"));

        upstream->push("data: [DONE]\n\n");
        QCOMPARE(probe.finished, 1);

        upstream->push("data: {\"type\":\"response.output_text.delta\",\"delta\":\"late\"}\n\n");
        upstream->finish();
        QCOMPARE(probe.frames.size(), 2);
        QCOMPARE(probe.finished, 1);
        QVERIFY(probe.errors.isEmpty());
    }

    void testEndOfStreamFlushesRemainder() {
        CodexOutbound outbound;
        auto* upstream = new FakeUpstream;
        StreamSession session(upstream, &outbound);
        SessionProbe probe;
        probe.attach(&session);

        upstream->push("data: {\"type\":\"response.completed\",\"response\":{}}");
        QVERIFY(probe.frames.isEmpty());

        upstream->finish();
        QCOMPARE(probe.frames.size(), 1);
        QCOMPARE(probe.frames[0].type, FrameType::Finished);
        QCOMPARE(probe.finished, 1);
    }

    void testTruncatedTrailingRecordDropped() {
        CodexOutbound outbound;
        auto* upstream = new FakeUpstream;
        StreamSession session(upstream, &outbound);
        SessionProbe probe;
        probe.attach(&session);

        upstream->push("data: {\"type\":\"response.output_text.delta\",\"delta\":\"Hel\"}\n\n"
                       "data: {\"type\":\"response.output_text.delta\",\"delta\":\"lo\"}\n\n"
                       "data: {\"type\":\"response.comp");
        QCOMPARE(probe.frames.size(), 2);

        upstream->finish();
        QCOMPARE(probe.frames.size(), 2);
        QCOMPARE(probe.frames[1].text(), QStringLiteral("lo"));
        QCOMPARE(probe.finished, 1);
        QVERIFY(probe.errors.isEmpty());
    }

    void testTrailingHtmlStillFails() {
        CodexOutbound outbound;
        auto* upstream = new FakeUpstream;
        StreamSession session(upstream, &outbound);
        SessionProbe probe;
        probe.attach(&session);

        upstream->push("<html><body>Just a moment...</body></html>");
        QVERIFY(probe.errors.isEmpty());

        upstream->finish();
        QCOMPARE(probe.errors.size(), 1);
        QCOMPARE(probe.errors[0].code, QStringLiteral("malformed_upstream"));
        QCOMPARE(probe.finished, 0);
    }

    void testForeignPayloadFails() {
        CodexOutbound outbound;
        auto* upstream = new FakeUpstream;
        StreamSession session(upstream, &outbound);
        SessionProbe probe;
        probe.attach(&session);

        upstream->push("<html><body>Access denied</body></html>\n\n");
        QCOMPARE(probe.errors.size(), 1);
        QCOMPARE(probe.errors[0].code, QStringLiteral("malformed_upstream"));

        upstream->finish();
        QCOMPARE(probe.finished, 0);
        QCOMPARE(probe.errors.size(), 1);
    }

    void testUndecodableEventFails() {
        CodexOutbound outbound;
        auto* upstream = new FakeUpstream;
        StreamSession session(upstream, &outbound);
        SessionProbe probe;
        probe.attach(&session);

        upstream->push("data: {truncated\n\n");
        QCOMPARE(probe.errors.size(), 1);
        QCOMPARE(probe.errors[0].code, QStringLiteral("malformed_upstream"));
    }

    void testPauseHoldsBytesUntilResume() {
        CodexOutbound outbound;
        auto* upstream = new FakeUpstream;
        StreamSession session(upstream, &outbound);
        SessionProbe probe;
        probe.attach(&session);

        session.pause();
        QVERIFY(session.isPaused());
        upstream->push("data: {\"type\":\"response.output_text.delta\",\"delta\":\"a\"}\n\n");
        upstream->finish();
        QVERIFY(probe.frames.isEmpty());
        QCOMPARE(probe.finished, 0);

        session.resume();
        QVERIFY(!session.isPaused());
        QCOMPARE(probe.frames.size(), 1);
        QCOMPARE(probe.frames[0].text(), QStringLiteral("a"));
        QCOMPARE(probe.finished, 1);
    }

    void testAbortSilencesSession() {
        CodexOutbound outbound;
        auto* upstream = new FakeUpstream;
        StreamSession session(upstream, &outbound);
        SessionProbe probe;
        probe.attach(&session);

        session.abort();
        upstream->push("data: {\"type\":\"response.output_text.delta\",\"delta\":\"a\"}\n\n");
        upstream->finish();
        QVERIFY(probe.frames.isEmpty());
        QCOMPARE(probe.finished, 0);
        QVERIFY(probe.errors.isEmpty());
    }
};

QTEST_MAIN(TestStreamSession)
#include "tst_stream_session.moc"
