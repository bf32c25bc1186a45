#include "http_request_parser.h"
#include <QUrl>
#include <algorithm>
#include <limits>

namespace {

// "<hex-size>[;extensions]"; anything longer is not a sane chunk header.
constexpr qsizetype kMaxChunkLineBytes = 4096;

bool isToken(const QByteArray& value)
{
    if (value.isEmpty())
        return false;
    static const QByteArray specials = QByteArrayLiteral("!#$%&'*+-.^_`|~");
    for (char c : value) {
        const bool alnum = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9');
        if (!alnum && !specials.contains(c))
            return false;
    }
    return true;
}

// Absolute-form targets ("http://host/path?q") are reduced to origin-form.
QString originFormTarget(const QByteArray& rawTarget)
{
    if (rawTarget.startsWith('/'))
        return QString::fromLatin1(rawTarget);

    const QUrl url = QUrl::fromEncoded(rawTarget, QUrl::StrictMode);
    const QString scheme = url.scheme().toLower();
    if (!url.isValid() || (scheme != QStringLiteral("http") && scheme != QStringLiteral("https")))
        return QString();

    QByteArray target = url.path(QUrl::FullyEncoded).toLatin1();
    if (target.isEmpty())
        target = "/";
    if (url.hasQuery())
        target += '?' + url.query(QUrl::FullyEncoded).toLatin1();
    return QString::fromLatin1(target);
}

}

HttpRequestParser::HttpRequestParser(int maxHeaderBytes, qint64 maxBodyBytes)
    : m_maxHeaderBytes(maxHeaderBytes)
    , m_maxBodyBytes(maxBodyBytes)
{
}

bool HttpRequestParser::expectsContinue() const {
    return m_headersComplete
           && m_request.header("expect").trimmed().compare("100-continue", Qt::CaseInsensitive) == 0;
}

HttpRequestParser::State HttpRequestParser::feed(const QByteArray& data) {
    if (m_state != State::Incomplete)
        return m_state;

    m_buffer.append(data);

    if (!m_headersComplete) {
        const State head = parseHead();
        if (head != State::Complete)
            return head;
    }
    return parseBody();
}

HttpRequestParser::State HttpRequestParser::fail(const QString& code, const QString& msg) {
    m_failure = DomainFailure::malformedRequest(code, msg);
    m_state = State::Error;
    m_buffer.clear();
    return m_state;
}

HttpRequestParser::State HttpRequestParser::failTooLarge() {
    m_failure = DomainFailure::requestTooLarge(
        QStringLiteral("request body exceeds %1 bytes").arg(m_maxBodyBytes));
    m_state = State::Error;
    m_buffer.clear();
    return m_state;
}

HttpRequestParser::State HttpRequestParser::parseHead() {
    const qsizetype headerEnd = m_buffer.indexOf("\r\n\r\n");
    if (headerEnd < 0) {
        if (m_buffer.size() > m_maxHeaderBytes)
            return fail(QStringLiteral("header_too_large"),
                        QStringLiteral("request header exceeds %1 bytes").arg(m_maxHeaderBytes));
        return State::Incomplete;
    }
    if (headerEnd > m_maxHeaderBytes)
        return fail(QStringLiteral("header_too_large"),
                    QStringLiteral("request header exceeds %1 bytes").arg(m_maxHeaderBytes));

    const QList<QByteArray> lines = m_buffer.left(headerEnd).split('\n');
    m_buffer.remove(0, headerEnd + 4);

    // Request line: "METHOD TARGET HTTP/1.x"
    QByteArray requestLine = lines.first();
    if (requestLine.endsWith('\r'))
        requestLine.chop(1);
    const QList<QByteArray> parts = requestLine.split(' ');
    if (parts.size() != 3 || !isToken(parts[0]) || parts[1].isEmpty())
        return fail(QStringLiteral("bad_request_line"),
                    QStringLiteral("malformed request line"));
    if (parts[2] != "HTTP/1.1" && parts[2] != "HTTP/1.0")
        return fail(QStringLiteral("unsupported_version"),
                    QStringLiteral("unsupported HTTP version: %1").arg(QString::fromLatin1(parts[2])));

    m_request.method = QString::fromLatin1(parts[0]);
    m_request.target = originFormTarget(parts[1]);
    m_request.httpVersion = QString::fromLatin1(parts[2]);
    if (m_request.target.isEmpty())
        return fail(QStringLiteral("bad_request_target"),
                    QStringLiteral("unsupported request target"));

    // Headers
    for (int i = 1; i < lines.size(); ++i) {
        QByteArray line = lines[i];
        if (line.endsWith('\r'))
            line.chop(1);
        const qsizetype colon = line.indexOf(':');
        if (colon <= 0 || line.startsWith(' ') || line.startsWith('\t'))
            return fail(QStringLiteral("bad_header"),
                        QStringLiteral("malformed header line %1").arg(i));
        const QByteArray name = line.left(colon);
        if (!isToken(name))
            return fail(QStringLiteral("bad_header"),
                        QStringLiteral("malformed header name on line %1").arg(i));
        m_request.headers.append({name, line.mid(colon + 1).trimmed()});
    }

    // Body framing
    const QByteArray transferEncoding = m_request.header("transfer-encoding").trimmed().toLower();
    if (!transferEncoding.isEmpty()) {
        if (!transferEncoding.endsWith("chunked"))
            return fail(QStringLiteral("bad_transfer_encoding"),
                        QStringLiteral("unsupported transfer-encoding: %1")
                            .arg(QString::fromLatin1(transferEncoding)));
        m_chunked = true;
        m_request.removeHeader("transfer-encoding");
        m_request.removeHeader("content-length");
    } else {
        QByteArray lengthValue;
        for (const RawHeader& h : m_request.headers) {
            if (h.first.compare("content-length", Qt::CaseInsensitive) != 0)
                continue;
            if (!lengthValue.isNull() && lengthValue != h.second)
                return fail(QStringLiteral("bad_content_length"),
                            QStringLiteral("conflicting content-length headers"));
            lengthValue = h.second;
        }
        if (!lengthValue.isNull()) {
            bool ok = false;
            m_contentLength = lengthValue.toLongLong(&ok);
            const bool digitsOnly = !lengthValue.isEmpty()
                                    && std::all_of(lengthValue.cbegin(), lengthValue.cend(),
                                                   [](char c) { return c >= '0' && c <= '9'; });
            if (!ok || !digitsOnly || m_contentLength < 0)
                return fail(QStringLiteral("bad_content_length"),
                            QStringLiteral("invalid content-length: %1")
                                .arg(QString::fromLatin1(lengthValue)));
            if (m_contentLength > m_maxBodyBytes)
                return failTooLarge();
        }
    }

    m_headersComplete = true;
    return State::Complete;
}

HttpRequestParser::State HttpRequestParser::parseBody() {
    if (m_chunked)
        return parseChunkedBody();

    if (m_buffer.size() < m_contentLength)
        return State::Incomplete;

    // Bytes past the declared length (a pipelined request) are ignored;
    // the connection is closed after one exchange.
    m_request.body = m_buffer.left(m_contentLength);
    m_buffer.clear();
    m_state = State::Complete;
    return m_state;
}

HttpRequestParser::State HttpRequestParser::parseChunkedBody() {
    // Chunks are consumed from the front of the buffer as they complete.
    while (true) {
        const qsizetype lineEnd = m_buffer.indexOf("\r\n");
        if (lineEnd < 0) {
            if (m_buffer.size() > kMaxChunkLineBytes)
                return fail(QStringLiteral("bad_chunk"),
                            QStringLiteral("chunk header exceeds %1 bytes").arg(kMaxChunkLineBytes));
            return State::Incomplete;
        }
        if (lineEnd > kMaxChunkLineBytes)
            return fail(QStringLiteral("bad_chunk"),
                        QStringLiteral("chunk header exceeds %1 bytes").arg(kMaxChunkLineBytes));

        QByteArray sizeField = m_buffer.left(lineEnd);
        const qsizetype ext = sizeField.indexOf(';');
        if (ext >= 0)
            sizeField.truncate(ext);
        sizeField = sizeField.trimmed();

        bool ok = false;
        const qint64 chunkSize = sizeField.toLongLong(&ok, 16);
        if (!ok || chunkSize < 0 || chunkSize > std::numeric_limits<int>::max())
            return fail(QStringLiteral("bad_chunk"),
                        QStringLiteral("invalid chunk size: %1").arg(QString::fromLatin1(sizeField)));

        if (m_request.body.size() + chunkSize > m_maxBodyBytes)
            return failTooLarge();

        if (chunkSize == 0) {
            // Skip trailer fields up to the terminating empty line.
            const qsizetype trailerStart = lineEnd + 2;
            if (m_buffer.mid(trailerStart, 2) == "\r\n") {
                m_buffer.clear();
                m_state = State::Complete;
                return m_state;
            }
            const qsizetype trailerEnd = m_buffer.indexOf("\r\n\r\n", trailerStart);
            if (trailerEnd < 0) {
                if (m_buffer.size() > m_maxHeaderBytes)
                    return fail(QStringLiteral("header_too_large"),
                                QStringLiteral("chunked trailer exceeds %1 bytes").arg(m_maxHeaderBytes));
                return State::Incomplete;
            }
            m_buffer.clear();
            m_state = State::Complete;
            return m_state;
        }

        const qint64 needed = lineEnd + 2 + chunkSize + 2;
        if (m_buffer.size() < needed)
            return State::Incomplete;
        if (m_buffer.mid(lineEnd + 2 + chunkSize, 2) != "\r\n")
            return fail(QStringLiteral("bad_chunk"),
                        QStringLiteral("chunk data not terminated by CRLF"));

        m_request.body.append(m_buffer.mid(lineEnd + 2, chunkSize));
        m_buffer.remove(0, needed);
    }
}
