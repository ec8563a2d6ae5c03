#include <QTest>
#include <QTemporaryDir>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include "config/credential_store.h"

class TestCredentialStore : public QObject {
    Q_OBJECT

private slots:
    void testTokensLayout() {
        const QJsonObject root = QJsonDocument::fromJson(R"({
            "OPENAI_API_KEY": null,
            "tokens": {"access_token": "eyJ.token.value", "account_id": "acct-123",
                       "refresh_token": "rt-1"}
        })").object();

        auto creds = CredentialStore::parse(root);
        QVERIFY(creds.has_value());
        QVERIFY(creds->usesAccessToken());
        QCOMPARE(creds->accountId, QStringLiteral("acct-123"));
        QCOMPARE(creds->refreshToken, QStringLiteral("rt-1"));

        const QMap<QString, QString> headers = creds->authHeaders();
        QCOMPARE(headers.value(QStringLiteral("Authorization")),
                 QStringLiteral("Bearer eyJ.token.value"));
        QCOMPARE(headers.value(QStringLiteral("chatgpt-account-id")), QStringLiteral("acct-123"));
    }

    void testFlatLayout() {
        const QJsonObject root = QJsonDocument::fromJson(
            R"({"access_token": "tok", "account_id": "acct"})").object();
        auto creds = CredentialStore::parse(root);
        QVERIFY(creds.has_value());
        QCOMPARE(creds->accessToken, QStringLiteral("tok"));
        QCOMPARE(creds->accountId, QStringLiteral("acct"));
    }

    void testApiKeyOnly() {
        const QJsonObject root = QJsonDocument::fromJson(
            R"({"OPENAI_API_KEY": "sk-abcdef123456"})").object();
        auto creds = CredentialStore::parse(root);
        QVERIFY(creds.has_value());
        QVERIFY(!creds->usesAccessToken());

        const QMap<QString, QString> headers = creds->authHeaders();
        QCOMPARE(headers.value(QStringLiteral("Authorization")),
                 QStringLiteral("Bearer sk-abcdef123456"));
        QVERIFY(!headers.contains(QStringLiteral("chatgpt-account-id")));
    }

    void testMissingCredentials() {
        auto creds = CredentialStore::parse(QJsonObject());
        QVERIFY(!creds.has_value());
        QCOMPARE(creds.error().code, QStringLiteral("credentials_missing"));
        QCOMPARE(creds.error().httpStatus(), 401);
    }

    void testLoadFromFile() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString path = dir.path() + QStringLiteral("/auth.json");
        QFile file(path);
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.write(R"({"tokens": {"access_token": "abc", "account_id": "x"}})");
        file.close();

        auto creds = CredentialStore::load(path);
        QVERIFY(creds.has_value());
        QCOMPARE(creds->accessToken, QStringLiteral("abc"));
    }

    void testLoadMissingFile() {
        QTemporaryDir dir;
        auto creds = CredentialStore::load(dir.path() + QStringLiteral("/nope.json"));
        QVERIFY(!creds.has_value());
        QCOMPARE(creds.error().code, QStringLiteral("credentials_unreadable"));
    }

    void testLoadInvalidFile() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString path = dir.path() + QStringLiteral("/auth.json");
        QFile file(path);
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.write("not json");
        file.close();

        auto creds = CredentialStore::load(path);
        QVERIFY(!creds.has_value());
        QCOMPARE(creds.error().code, QStringLiteral("credentials_invalid"));
    }

    void testRedact() {
        QCOMPARE(CredentialStore::redact(QStringLiteral("short")), QStringLiteral("***"));
        QCOMPARE(CredentialStore::redact(QStringLiteral("sk-1234567890abcd")),
                 QStringLiteral("sk-1...abcd"));
    }
};

QTEST_MAIN(TestCredentialStore)
#include "tst_credential_store.moc"
