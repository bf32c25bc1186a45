#include <QTest>
#include <QSslConfiguration>
#include "adapters/executor/qt_executor.h"

class TestQtExecutor : public QObject {
    Q_OBJECT

private slots:
    void testTargetUrlJoinsBaseAndTarget() {
        QtExecutor executor(QUrl(QStringLiteral("https://api.anthropic.com")),
                            QSslConfiguration::defaultConfiguration());
        QCOMPARE(executor.targetUrl(QStringLiteral("/v1/messages?beta=true")).toString(),
                 QStringLiteral("https://api.anthropic.com/v1/messages?beta=true"));

        QtExecutor withPath(QUrl(QStringLiteral("http://127.0.0.1:9000/base/")),
                            QSslConfiguration::defaultConfiguration());
        QCOMPARE(withPath.targetUrl(QStringLiteral("/v1/models")).toString(),
                 QStringLiteral("http://127.0.0.1:9000/base/v1/models"));
    }

    void testHopByHopHeaders() {
        QVERIFY(QtExecutor::isHopByHopHeader("Connection"));
        QVERIFY(QtExecutor::isHopByHopHeader("keep-alive"));
        QVERIFY(QtExecutor::isHopByHopHeader("Transfer-Encoding"));
        QVERIFY(QtExecutor::isHopByHopHeader("Upgrade"));
        QVERIFY(!QtExecutor::isHopByHopHeader("x-api-key"));
        QVERIFY(!QtExecutor::isHopByHopHeader("anthropic-version"));
        QVERIFY(!QtExecutor::isHopByHopHeader("Content-Type"));
    }

    void testHttpStatusErrorClassification() {
        // Qt reports these statuses through codes that sit in its
        // network and proxy ranges; they are still real responses.
        QVERIFY(QtExecutor::isHttpStatusError(QNetworkReply::ProtocolInvalidOperationError, 400));
        QVERIFY(QtExecutor::isHttpStatusError(QNetworkReply::ProtocolInvalidOperationError, 418));
        QVERIFY(QtExecutor::isHttpStatusError(QNetworkReply::ProxyAuthenticationRequiredError, 407));
        QVERIFY(QtExecutor::isHttpStatusError(QNetworkReply::UnknownContentError, 429));
        QVERIFY(QtExecutor::isHttpStatusError(QNetworkReply::ContentNotFoundError, 404));
        QVERIFY(QtExecutor::isHttpStatusError(QNetworkReply::InternalServerError, 500));
        QVERIFY(QtExecutor::isHttpStatusError(QNetworkReply::UnknownServerError, 529));

        // No status line, or a connection failure after one arrived.
        QVERIFY(!QtExecutor::isHttpStatusError(QNetworkReply::ProtocolInvalidOperationError, 0));
        QVERIFY(!QtExecutor::isHttpStatusError(QNetworkReply::ConnectionRefusedError, 0));
        QVERIFY(!QtExecutor::isHttpStatusError(QNetworkReply::RemoteHostClosedError, 400));
        QVERIFY(!QtExecutor::isHttpStatusError(QNetworkReply::TimeoutError, 200));
        QVERIFY(!QtExecutor::isHttpStatusError(QNetworkReply::UnknownContentError, 200));
    }

    void testTransportFailureWithoutReply() {
        QVERIFY(!QtExecutor::isTransportFailure(nullptr));
    }

    void testRepeatedRequestHeadersAreFolded() {
        QtExecutor executor(QUrl(QStringLiteral("http://127.0.0.1:9000")),
                            QSslConfiguration::defaultConfiguration());
        ProxyRequest req;
        req.method = QStringLiteral("POST");
        req.target = QStringLiteral("/v1/messages");
        req.headers.append({"anthropic-beta", "tools-2024-04-04"});
        req.headers.append({"x-api-key", "sk-test"});
        req.headers.append({"Anthropic-Beta", "prompt-caching-2024-07-31"});

        const QNetworkRequest built = executor.buildQtRequest(req);
        QCOMPARE(built.rawHeader("anthropic-beta"),
                 QByteArray("tools-2024-04-04, prompt-caching-2024-07-31"));
        QCOMPARE(built.rawHeader("x-api-key"), QByteArray("sk-test"));
    }

    void testBuildRequestFiltersHeaders() {
        QtExecutor executor(QUrl(QStringLiteral("http://127.0.0.1:9000")),
                            QSslConfiguration::defaultConfiguration());
        executor.setRequestTimeout(1234);

        ProxyRequest req;
        req.method = QStringLiteral("POST");
        req.target = QStringLiteral("/v1/messages");
        req.headers.append({"Host", "127.0.0.1:8080"});
        req.headers.append({"Content-Length", "99"});
        req.headers.append({"Connection", "keep-alive, X-Private"});
        req.headers.append({"X-Private", "drop me"});
        req.headers.append({"Keep-Alive", "timeout=5"});
        req.headers.append({"x-api-key", "sk-test"});
        req.headers.append({"anthropic-version", "2023-06-01"});
        req.body = "{}";

        const QNetworkRequest built = executor.buildQtRequest(req);
        QCOMPARE(built.url().toString(), QStringLiteral("http://127.0.0.1:9000/v1/messages"));
        QCOMPARE(built.rawHeader("x-api-key"), QByteArray("sk-test"));
        QCOMPARE(built.rawHeader("anthropic-version"), QByteArray("2023-06-01"));
        QVERIFY(!built.hasRawHeader("Host"));
        QVERIFY(!built.hasRawHeader("Content-Length"));
        QVERIFY(!built.hasRawHeader("Connection"));
        QVERIFY(!built.hasRawHeader("X-Private"));
        QVERIFY(!built.hasRawHeader("Keep-Alive"));
        QCOMPARE(built.rawHeader("Accept-Encoding"), QByteArray("identity"));
        QCOMPARE(built.transferTimeout(), 1234);
    }

    void testClientAcceptEncodingKept() {
        QtExecutor executor(QUrl(QStringLiteral("http://127.0.0.1:9000")),
                            QSslConfiguration::defaultConfiguration());
        ProxyRequest req;
        req.method = QStringLiteral("GET");
        req.target = QStringLiteral("/");
        req.headers.append({"Accept-Encoding", "gzip"});

        const QNetworkRequest built = executor.buildQtRequest(req);
        QCOMPARE(built.rawHeader("Accept-Encoding"), QByteArray("gzip"));
    }
};

QTEST_MAIN(TestQtExecutor)
#include "tst_qt_executor.moc"
