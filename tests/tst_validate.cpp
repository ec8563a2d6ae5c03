#include <QTest>
#include "semantic/validate.h"
#include "semantic/request.h"
#include "semantic/failure.h"

class TestValidate : public QObject {
    Q_OBJECT

private:
    static SemanticRequest userRequest(const QString& model) {
        SemanticRequest req;
        req.requestId = QStringLiteral("req-001");
        req.target.logicalModel = model;

        InteractionItem item;
        item.role = QStringLiteral("user");
        item.content.append(Segment::fromText(QStringLiteral("Hello")));
        req.messages.append(item);
        return req;
    }

private slots:
    void testValidRequest() {
        auto result = Validate::request(userRequest(QStringLiteral("gpt-5")));
        QVERIFY(result.has_value());
    }

    void testEmptyMessagesInvalid() {
        SemanticRequest req;
        req.target.logicalModel = QStringLiteral("gpt-5");

        auto result = Validate::request(req);
        QVERIFY(!result.has_value());
        QCOMPARE(result.error().kind, ErrorKind::InvalidInput);
        QCOMPARE(result.error().code, QStringLiteral("empty_messages"));
    }

    void testEmptyModelInvalid() {
        auto result = Validate::request(userRequest(QString()));
        QVERIFY(!result.has_value());
        QCOMPARE(result.error().code, QStringLiteral("empty_model"));
        QCOMPARE(result.error().param, QStringLiteral("model"));
    }

    void testUnknownRoleInvalid() {
        SemanticRequest req = userRequest(QStringLiteral("gpt-5"));
        req.messages.first().role = QStringLiteral("narrator");

        auto result = Validate::request(req);
        QVERIFY(!result.has_value());
        QCOMPARE(result.error().code, QStringLiteral("invalid_role"));
    }

    void testKnownRoles() {
        QVERIFY(Validate::isKnownRole(QStringLiteral("system")));
        QVERIFY(Validate::isKnownRole(QStringLiteral("user")));
        QVERIFY(Validate::isKnownRole(QStringLiteral("assistant")));
        QVERIFY(Validate::isKnownRole(QStringLiteral("tool")));
        QVERIFY(!Validate::isKnownRole(QStringLiteral("developer ")));
    }

    void testFailureJsonShape() {
        const DomainFailure failure = DomainFailure::invalidInput(
            QStringLiteral("empty_model"), QStringLiteral("Request must name a model"),
            QStringLiteral("model"));
        const QJsonObject err = failure.toJson()[QStringLiteral("error")].toObject();
        QCOMPARE(err[QStringLiteral("message")].toString(),
                 QStringLiteral("Request must name a model"));
        QCOMPARE(err[QStringLiteral("type")].toString(), QStringLiteral("invalid_request_error"));
        QCOMPARE(err[QStringLiteral("param")].toString(), QStringLiteral("model"));
        QCOMPARE(err[QStringLiteral("code")].toString(), QStringLiteral("empty_model"));
    }

    void testFailureStatusMapping() {
        QCOMPARE(DomainFailure::malformedUpstream(QString()).httpStatus(), 502);
        QCOMPARE(DomainFailure::upstreamFailed(QString()).httpStatus(), 502);
        QCOMPARE(DomainFailure::upstreamAuthRejected(401, QString()).httpStatus(), 401);
        QCOMPARE(DomainFailure::upstreamAuthRejected(403, QString()).httpStatus(), 403);
        QCOMPARE(DomainFailure::rateLimited(QString()).httpStatus(), 429);
        QCOMPARE(DomainFailure::timeout(QString()).httpStatus(), 504);
        QCOMPARE(DomainFailure::unavailable(QString()).httpStatus(), 503);
        QCOMPARE(DomainFailure::internal(QString()).httpStatus(), 500);
        QVERIFY(!DomainFailure::internal(QString()).toJson()[QStringLiteral("error")]
                     .toObject().contains(QStringLiteral("param")));
    }
};

QTEST_MAIN(TestValidate)
#include "tst_validate.moc"
