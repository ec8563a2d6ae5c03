#include <QTest>
#include "semantic/stream_state.h"
#include "semantic/features/stream_aggregator.h"
#include "adapters/outbound/codex.h"

class TestStreamState : public QObject {
    Q_OBJECT

private:
    static StreamFrame upstream(FrameType type, const QString& text = QString()) {
        StreamFrame frame;
        frame.type = type;
        if (!text.isEmpty())
            frame.deltaSegments.append(Segment::fromText(text));
        if (type == FrameType::Finished)
            frame.isFinal = true;
        return frame;
    }

    static QList<StreamFrame> runAll(ChatStreamState& state, const QList<StreamFrame>& in) {
        QList<StreamFrame> out;
        for (const StreamFrame& frame : in)
            out.append(state.apply(frame));
        return out;
    }

private slots:
    void testThreeEventStream() {
        ChatStreamState state(QStringLiteral("chatcmpl-x"), QStringLiteral("gpt-5-high"));
        const QList<StreamFrame> out = runAll(state, {
            upstream(FrameType::Started),
            upstream(FrameType::Delta, QStringLiteral("Hello")),
            upstream(FrameType::Finished)});

        QCOMPARE(out.size(), 3);
        QCOMPARE(out[0].type, FrameType::Started);
        QCOMPARE(out[1].type, FrameType::Delta);
        QCOMPARE(out[1].text(), QStringLiteral("Hello"));
        QCOMPARE(out[2].type, FrameType::Finished);
        QVERIFY(out[2].isFinal);

        for (const StreamFrame& frame : out) {
            QCOMPARE(frame.responseId, QStringLiteral("chatcmpl-x"));
            QCOMPARE(frame.model, QStringLiteral("gpt-5-high"));
        }

        QCOMPARE(state.phase(), ChatStreamState::Phase::Completed);
        QCOMPARE(state.finishReason(), FinishReason::Stop);
        QCOMPARE(state.accumulatedText(), QStringLiteral("Hello"));
        QVERIFY(state.isTerminated());
    }

    void testRoleEmittedOnFirstEventOfAnyType() {
        ChatStreamState state(QStringLiteral("id"), QStringLiteral("gpt-5"));
        const QList<StreamFrame> first = state.apply(upstream(FrameType::Ignored));
        QCOMPARE(first.size(), 1);
        QCOMPARE(first[0].type, FrameType::Started);
        QCOMPARE(state.phase(), ChatStreamState::Phase::Streaming);

        const QList<StreamFrame> second = state.apply(upstream(FrameType::Started));
        QVERIFY(second.isEmpty());
    }

    void testDeltaBeforeCreatedStillOpensRole() {
        ChatStreamState state(QStringLiteral("id"), QStringLiteral("gpt-5"));
        const QList<StreamFrame> out = state.apply(upstream(FrameType::Delta, QStringLiteral("a")));
        QCOMPARE(out.size(), 2);
        QCOMPARE(out[0].type, FrameType::Started);
        QCOMPARE(out[1].text(), QStringLiteral("a"));
    }

    void testUnknownEventsProduceNothing() {
        ChatStreamState state(QStringLiteral("id"), QStringLiteral("gpt-5"));
        state.apply(upstream(FrameType::Started));
        QVERIFY(state.apply(upstream(FrameType::Ignored)).isEmpty());
        QVERIFY(state.apply(upstream(FrameType::Delta)).isEmpty());
        QCOMPARE(state.phase(), ChatStreamState::Phase::Streaming);
    }

    void testItemTextUsedWhenNoDeltas() {
        ChatStreamState state(QStringLiteral("id"), QStringLiteral("gpt-5"));
        const QList<StreamFrame> out = runAll(state, {
            upstream(FrameType::Started),
            upstream(FrameType::ItemCompleted, QStringLiteral("From item")),
            upstream(FrameType::Finished)});

        QCOMPARE(out.size(), 3);
        QCOMPARE(out[1].type, FrameType::Delta);
        QCOMPARE(out[1].text(), QStringLiteral("From item"));
        QCOMPARE(out[2].type, FrameType::Finished);
        QCOMPARE(state.accumulatedText(), QStringLiteral("From item"));
    }

    void testItemTextIgnoredAfterDeltas() {
        ChatStreamState state(QStringLiteral("id"), QStringLiteral("gpt-5"));
        const QList<StreamFrame> out = runAll(state, {
            upstream(FrameType::Delta, QStringLiteral("Hi")),
            upstream(FrameType::ItemCompleted, QStringLiteral("Hi")),
            upstream(FrameType::Finished)});

        int deltas = 0;
        for (const StreamFrame& frame : out) {
            if (frame.type == FrameType::Delta)
                ++deltas;
        }
        QCOMPARE(deltas, 1);
        QCOMPARE(state.accumulatedText(), QStringLiteral("Hi"));
    }

    void testLengthFinishReason() {
        ChatStreamState state(QStringLiteral("id"), QStringLiteral("gpt-5"));
        StreamFrame finished = upstream(FrameType::Finished);
        finished.stopCause = StopCause::Length;
        finished.usage = UsageEntry{4, 5, 9};

        const QList<StreamFrame> out = runAll(state, {
            upstream(FrameType::Delta, QStringLiteral("x")), finished});
        QCOMPARE(out.last().stopCause, StopCause::Length);
        QVERIFY(out.last().usage.has_value());
        QCOMPARE(out.last().usage->totalTokens, 9);
        QCOMPARE(state.finishReason(), FinishReason::Length);
    }

    void testUpstreamFailure() {
        ChatStreamState state(QStringLiteral("id"), QStringLiteral("gpt-5"));
        state.apply(upstream(FrameType::Delta, QStringLiteral("partial")));

        StreamFrame failed = upstream(FrameType::Failed);
        failed.failure = DomainFailure::upstreamFailed(QStringLiteral("boom"));
        const QList<StreamFrame> out = state.apply(failed);

        QCOMPARE(out.size(), 1);
        QCOMPARE(out[0].type, FrameType::Failed);
        QVERIFY(out[0].isFinal);
        QCOMPARE(out[0].failure.message, QStringLiteral("boom"));
        QCOMPARE(state.phase(), ChatStreamState::Phase::Failed);
        QCOMPARE(state.finishReason(), FinishReason::Error);
    }

    void testNothingAfterTermination() {
        ChatStreamState state(QStringLiteral("id"), QStringLiteral("gpt-5"));
        runAll(state, {upstream(FrameType::Delta, QStringLiteral("a")),
                       upstream(FrameType::Finished)});

        QVERIFY(state.apply(upstream(FrameType::Delta, QStringLiteral("late"))).isEmpty());
        QVERIFY(state.finishUpstream().isEmpty());
        QVERIFY(state.fail(DomainFailure::timeout(QStringLiteral("late"))).isEmpty());
        QCOMPARE(state.phase(), ChatStreamState::Phase::Completed);
        QCOMPARE(state.accumulatedText(), QStringLiteral("a"));
    }

    void testUpstreamEndWithoutEventsFails() {
        ChatStreamState state(QStringLiteral("id"), QStringLiteral("gpt-5"));
        const QList<StreamFrame> out = state.finishUpstream();
        QCOMPARE(out.size(), 1);
        QCOMPARE(out[0].type, FrameType::Failed);
        QCOMPARE(out[0].failure.code, QStringLiteral("malformed_upstream"));
        QCOMPARE(state.phase(), ChatStreamState::Phase::Failed);
    }

    void testUpstreamEndAfterOutputCompletes() {
        ChatStreamState state(QStringLiteral("id"), QStringLiteral("gpt-5"));
        state.apply(upstream(FrameType::Delta, QStringLiteral("ok")));
        const QList<StreamFrame> out = state.finishUpstream();
        QCOMPARE(out.size(), 1);
        QCOMPARE(out[0].type, FrameType::Finished);
        QCOMPARE(state.finishReason(), FinishReason::Stop);
    }

    void testMatchesAggregatedText_data() {
        QTest::addColumn<bool>("withDeltas");
        QTest::newRow("deltas") << true;
        QTest::newRow("item only") << false;
    }

    void testMatchesAggregatedText() {
        QFETCH(bool, withDeltas);

        QList<StreamFrame> frames{upstream(FrameType::Started), upstream(FrameType::Ignored)};
        if (withDeltas) {
            frames.append(upstream(FrameType::Delta, QStringLiteral("Hel")));
            frames.append(upstream(FrameType::Delta, QStringLiteral("lo")));
        }
        frames.append(upstream(FrameType::ItemCompleted, QStringLiteral("Hello")));
        frames.append(upstream(FrameType::Finished));

        ChatStreamState state(QStringLiteral("id"), QStringLiteral("gpt-5"));
        QString streamed;
        for (const StreamFrame& frame : runAll(state, frames)) {
            if (frame.type == FrameType::Delta)
                streamed += frame.text();
        }

        StreamAggregator aggregator;
        auto resp = aggregator.aggregate(frames);
        QVERIFY(resp.has_value());
        QCOMPARE(resp->candidates.first().output.first().text, streamed);
        QCOMPARE(streamed, QStringLiteral("Hello"));
    }

    void testMatchesSingleShotConversion_data() {
        QTest::addColumn<bool>("withDeltas");
        QTest::newRow("deltas") << true;
        QTest::newRow("item only") << false;
    }

    void testMatchesSingleShotConversion() {
        QFETCH(bool, withDeltas);

        QList<QByteArray> events{
            R"({"type":"response.created","response":{"id":"r1","model":"gpt-5"}})"};
        if (withDeltas) {
            events.append(R"({"type":"response.output_text.delta","delta":"Hel"})");
            events.append(R"({"type":"response.output_text.delta","delta":"lo"})");
        }
        events.append(R"({"type":"response.output_item.done","item":{"type":"message",)"
                      R"("content":[{"type":"output_text","text":"Hello"}]}})");
        events.append(R"({"type":"response.completed","response":{"id":"r1","status":"completed"}})");

        CodexOutbound outbound;
        ChatStreamState state(QStringLiteral("id"), QStringLiteral("gpt-5"));
        QString streamed;
        for (const QByteArray& data : events) {
            auto frame = outbound.parseChunk(ProviderChunk{QString(), data});
            QVERIFY(frame.has_value());
            for (const StreamFrame& out : state.apply(*frame)) {
                if (out.type == FrameType::Delta)
                    streamed += out.text();
            }
        }
        QCOMPARE(state.finishReason(), FinishReason::Stop);

        ProviderResponse json;
        json.statusCode = 200;
        json.body = R"({"id":"r1","model":"gpt-5","status":"completed","output":[)"
                    R"({"type":"message","role":"assistant",)"
                    R"("content":[{"type":"output_text","text":"Hello"}]}]})";
        auto single = outbound.parseResponse(json);
        QVERIFY(single.has_value());
        QCOMPARE(single->candidates.first().output.first().text, streamed);
        QCOMPARE(single->candidates.first().stopCause, StopCause::Completed);

        ProviderResponse sse;
        sse.statusCode = 200;
        for (const QByteArray& data : events)
            sse.body += "data: " + data + "\n\n";
        auto fromEvents = outbound.parseResponse(sse);
        QVERIFY(fromEvents.has_value());
        QCOMPARE(fromEvents->candidates.first().output.first().text, streamed);
    }
};

QTEST_MAIN(TestStreamState)
#include "tst_stream_state.moc"
