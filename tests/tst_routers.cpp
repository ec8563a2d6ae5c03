#include <QTest>

#include "proxy/request_router.h"
#include "proxy/sse_writer.h"

class TestRouters : public QObject {
    Q_OBJECT

private slots:
    void requestRouter_methodNormalized();
    void requestRouter_chatCompletionAliases();
    void requestRouter_queryAndTrailingSlash();
    void requestRouter_preflightAnyPath();
    void requestRouter_unknownRoute();
    void requestRouter_customRoute();
    void sseWriter_encodeEvent();
    void sseWriter_disconnectedSocketNeverStarts();
};

void TestRouters::requestRouter_methodNormalized()
{
    RequestRouter router;
    router.registerDefaults();

    const auto route = router.match(QStringLiteral("get"), QStringLiteral("/v1/models"));
    QVERIFY(route.has_value());
    QCOMPARE(route->kind, RouteKind::Models);

    const auto health = router.match(QStringLiteral(" GET "), QStringLiteral("/health"));
    QVERIFY(health.has_value());
    QCOMPARE(health->kind, RouteKind::Health);
}

void TestRouters::requestRouter_chatCompletionAliases()
{
    RequestRouter router;
    router.registerDefaults();

    const auto v1 = router.match(QStringLiteral("POST"), QStringLiteral("/v1/chat/completions"));
    const auto bare = router.match(QStringLiteral("POST"), QStringLiteral("/chat/completions"));
    QVERIFY(v1.has_value());
    QVERIFY(bare.has_value());
    QCOMPARE(v1->kind, RouteKind::ChatCompletions);
    QCOMPARE(bare->kind, RouteKind::ChatCompletions);

    QVERIFY(!router.match(QStringLiteral("GET"), QStringLiteral("/v1/chat/completions")));
}

void TestRouters::requestRouter_queryAndTrailingSlash()
{
    RequestRouter router;
    router.registerDefaults();

    const auto route = router.match(QStringLiteral("POST"),
                                    QStringLiteral("/v1/chat/completions/?trace=1"));
    QVERIFY(route.has_value());
    QCOMPARE(route->kind, RouteKind::ChatCompletions);
    QCOMPARE(RequestRouter::stripQuery(QStringLiteral("/models?x=1&y=2")),
             QStringLiteral("/models"));
    QCOMPARE(RequestRouter::stripQuery(QStringLiteral("/models")), QStringLiteral("/models"));
}

void TestRouters::requestRouter_preflightAnyPath()
{
    RequestRouter router;
    router.registerDefaults();

    const auto route = router.match(QStringLiteral("OPTIONS"),
                                    QStringLiteral("/v1/chat/completions"));
    QVERIFY(route.has_value());
    QCOMPARE(route->kind, RouteKind::Preflight);
}

void TestRouters::requestRouter_unknownRoute()
{
    RequestRouter router;
    router.registerDefaults();

    QVERIFY(!router.match(QStringLiteral("POST"), QStringLiteral("/v1/responses")));
    QVERIFY(!router.match(QStringLiteral("DELETE"), QStringLiteral("/health")));
}

void TestRouters::requestRouter_customRoute()
{
    RequestRouter router;
    router.addRoute(QStringLiteral("*"), {QStringLiteral("/status/*"), RouteKind::Health});

    const auto route = router.match(QStringLiteral("PUT"), QStringLiteral("/status/live"));
    QVERIFY(route.has_value());
    QCOMPARE(route->kind, RouteKind::Health);
    QVERIFY(!router.match(QStringLiteral("GET"), QStringLiteral("/health")));
}

void TestRouters::sseWriter_encodeEvent()
{
    QCOMPARE(SseWriter::encodeEvent(QByteArrayLiteral("{\"a\":1}")),
             QByteArrayLiteral("f\r\ndata: {\"a\":1}\n\n\r\n"));
    QCOMPARE(SseWriter::encodeEvent(QByteArrayLiteral("[DONE]")),
             QByteArrayLiteral("e\r\ndata: [DONE]\n\n\r\n"));
}

void TestRouters::sseWriter_disconnectedSocketNeverStarts()
{
    SseWriter detached;
    detached.writeEvent(QByteArrayLiteral("{}"));
    detached.close(true);
    QVERIFY(!detached.started());

    QTcpSocket socket;
    SseWriter unconnected(&socket);
    unconnected.writeEvent(QByteArrayLiteral("{}"));
    QVERIFY(!unconnected.started());
    QCOMPARE(socket.bytesToWrite(), qint64(0));
}

QTEST_MAIN(TestRouters)
#include "tst_routers.moc"
