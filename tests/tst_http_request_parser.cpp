#include <QTest>
#include "proxy/http_request_parser.h"

using State = HttpRequestParser::State;

class TestHttpRequestParser : public QObject {
    Q_OBJECT

private slots:
    void testSimplePost() {
        HttpRequestParser parser;
        const QByteArray raw =
            "POST /v1/messages?beta=true HTTP/1.1\r\n"
            "Host: 127.0.0.1:8080\r\n"
            "x-api-key: sk-test\r\n"
            "Content-Type: application/json\r\n"
            "Content-Length: 11\r\n"
            "\r\n"
            "{\"a\":true}\n";
        QCOMPARE(parser.feed(raw), State::Complete);

        const ProxyRequest& req = parser.request();
        QCOMPARE(req.method, QStringLiteral("POST"));
        QCOMPARE(req.target, QStringLiteral("/v1/messages?beta=true"));
        QCOMPARE(req.httpVersion, QStringLiteral("HTTP/1.1"));
        QCOMPARE(req.header("X-API-KEY"), QByteArray("sk-test"));
        QCOMPARE(req.headers.size(), 4);
        QCOMPARE(req.headers[1].first, QByteArray("x-api-key"));
        QCOMPARE(req.body, QByteArray("{\"a\":true}\n"));
    }

    void testIncrementalFeed() {
        HttpRequestParser parser;
        const QByteArray raw =
            "POST /v1/messages HTTP/1.1\r\nContent-Length: 5\r\n\r\nhello";
        for (int i = 0; i < raw.size() - 1; ++i) {
            QCOMPARE(parser.feed(raw.mid(i, 1)), State::Incomplete);
        }
        QVERIFY(parser.headersComplete());
        QCOMPARE(parser.feed(raw.right(1)), State::Complete);
        QCOMPARE(parser.request().body, QByteArray("hello"));
    }

    void testGetWithoutBody() {
        HttpRequestParser parser;
        QCOMPARE(parser.feed("GET /v1/models HTTP/1.0\r\nAccept: */*\r\n\r\n"), State::Complete);
        QCOMPARE(parser.request().httpVersion, QStringLiteral("HTTP/1.0"));
        QVERIFY(parser.request().body.isEmpty());
    }

    void testChunkedBody() {
        HttpRequestParser parser;
        QCOMPARE(parser.feed("POST /x HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\n4\r\nWiki\r\n"),
                 State::Incomplete);
        QCOMPARE(parser.feed("5;ext=1\r\npedia\r\n"), State::Incomplete);
        QCOMPARE(parser.feed("0\r\n\r\n"), State::Complete);

        ProxyRequest req = parser.takeRequest();
        QCOMPARE(req.body, QByteArray("Wikipedia"));
        QVERIFY(!req.hasHeader("transfer-encoding"));
    }

    void testChunkedWithTrailer() {
        HttpRequestParser parser;
        QCOMPARE(parser.feed("POST /x HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\n"
                             "3\r\nabc\r\n0\r\nX-Trailer: 1\r\n\r\n"),
                 State::Complete);
        QCOMPARE(parser.request().body, QByteArray("abc"));
    }

    void testAbsoluteFormTarget() {
        HttpRequestParser parser;
        QCOMPARE(parser.feed("GET http://localhost:8080/v1/models?limit=2 HTTP/1.1\r\n\r\n"),
                 State::Complete);
        QCOMPARE(parser.request().target, QStringLiteral("/v1/models?limit=2"));
    }

    void testExpectContinue() {
        HttpRequestParser parser;
        QCOMPARE(parser.feed("POST /x HTTP/1.1\r\nExpect: 100-continue\r\nContent-Length: 3\r\n\r\n"),
                 State::Incomplete);
        QVERIFY(parser.expectsContinue());
        QCOMPARE(parser.feed("abc"), State::Complete);
    }

    void testMalformed_data() {
        QTest::addColumn<QByteArray>("raw");
        QTest::addColumn<QString>("code");
        QTest::newRow("garbage") << QByteArray("this is not http\r\n\r\n")
                                 << QStringLiteral("bad_request_line");
        QTest::newRow("version") << QByteArray("GET / HTTP/2.0\r\n\r\n")
                                 << QStringLiteral("unsupported_version");
        QTest::newRow("target") << QByteArray("GET * HTTP/1.1\r\n\r\n")
                                << QStringLiteral("bad_request_target");
        QTest::newRow("header") << QByteArray("GET / HTTP/1.1\r\nNoColonHere\r\n\r\n")
                                << QStringLiteral("bad_header");
        QTest::newRow("folded") << QByteArray("GET / HTTP/1.1\r\nA: b\r\n  c\r\n\r\n")
                                << QStringLiteral("bad_header");
        QTest::newRow("content-length") << QByteArray("POST / HTTP/1.1\r\nContent-Length: 1x\r\n\r\n")
                                        << QStringLiteral("bad_content_length");
        QTest::newRow("conflicting-length")
            << QByteArray("POST / HTTP/1.1\r\nContent-Length: 1\r\nContent-Length: 2\r\n\r\n")
            << QStringLiteral("bad_content_length");
        QTest::newRow("transfer-encoding")
            << QByteArray("POST / HTTP/1.1\r\nTransfer-Encoding: gzip\r\n\r\n")
            << QStringLiteral("bad_transfer_encoding");
        QTest::newRow("chunk-size")
            << QByteArray("POST / HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\nzz\r\n")
            << QStringLiteral("bad_chunk");
    }

    void testMalformed() {
        QFETCH(QByteArray, raw);
        QFETCH(QString, code);

        HttpRequestParser parser;
        QCOMPARE(parser.feed(raw), State::Error);
        QCOMPARE(parser.failure().kind, ErrorKind::MalformedRequest);
        QCOMPARE(parser.failure().code, code);
        QCOMPARE(parser.failure().httpStatus(), 400);
        // Further input is ignored once failed.
        QCOMPARE(parser.feed("GET / HTTP/1.1\r\n\r\n"), State::Error);
    }

    void testHeaderTooLarge() {
        HttpRequestParser parser(128);
        QCOMPARE(parser.feed("GET / HTTP/1.1\r\nX-Big: " + QByteArray(200, 'a')), State::Error);
        QCOMPARE(parser.failure().code, QStringLiteral("header_too_large"));
    }

    void testDeclaredBodyOverLimit() {
        HttpRequestParser parser(64 * 1024, 16);
        QCOMPARE(parser.feed("POST /v1/messages HTTP/1.1\r\nContent-Length: 17\r\n\r\n"),
                 State::Error);
        QCOMPARE(parser.failure().kind, ErrorKind::RequestTooLarge);
        QCOMPARE(parser.failure().httpStatus(), 413);
    }

    void testBodyAtLimitAccepted() {
        HttpRequestParser parser(64 * 1024, 16);
        QCOMPARE(parser.feed("POST /v1/messages HTTP/1.1\r\nContent-Length: 16\r\n\r\n"
                             + QByteArray(16, 'x')),
                 State::Complete);
    }

    void testChunkedBodyOverLimit() {
        HttpRequestParser parser(64 * 1024, 16);
        QCOMPARE(parser.feed("POST /x HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\n"
                             "a\r\n0123456789\r\n"),
                 State::Incomplete);
        QCOMPARE(parser.feed("a\r\n"), State::Error);
        QCOMPARE(parser.failure().httpStatus(), 413);
    }

    void testUnterminatedChunkHeader() {
        HttpRequestParser parser;
        QCOMPARE(parser.feed("POST /x HTTP/1.1\r\nTransfer-Encoding: chunked\r\n\r\n"),
                 State::Incomplete);
        QCOMPARE(parser.feed(QByteArray(5000, 'f')), State::Error);
        QCOMPARE(parser.failure().code, QStringLiteral("bad_chunk"));
    }
};

QTEST_MAIN(TestHttpRequestParser)
#include "tst_http_request_parser.moc"
