#include "proxy_session.h"
#include "response_writer.h"
#include "adapters/executor/qt_executor.h"
#include "pipeline/pipeline.h"
#include "core/log_manager.h"

namespace {

// Upstream reads pause while this much is still queued for the client.
constexpr qint64 kClientHighWater = 1024 * 1024;
constexpr qint64 kRelayChunkSize = 64 * 1024;
constexpr qint64 kUpstreamReadBuffer = 256 * 1024;

}

ProxySession::ProxySession(QTcpSocket* socket,
                           const Pipeline* pipeline,
                           IExecutor* executor,
                           const RuntimeOptions& options,
                           QObject* parent)
    : QObject(parent)
    , m_socket(socket)
    , m_pipeline(pipeline)
    , m_executor(executor)
    , m_options(options)
{
    Q_ASSERT(m_socket);
    m_socket->setParent(this);
}

ProxySession::~ProxySession()
{
    releaseReply();
}

void ProxySession::start()
{
    m_timer.start();
    connect(m_socket, &QTcpSocket::readyRead,
            this, &ProxySession::onSocketReadyRead);
    connect(m_socket, &QTcpSocket::bytesWritten,
            this, &ProxySession::onSocketBytesWritten);
    connect(m_socket, &QTcpSocket::disconnected,
            this, &ProxySession::onSocketDisconnected);

    LOG_DEBUG(QStringLiteral("ProxySession: new connection from %1:%2")
                  .arg(m_socket->peerAddress().toString())
                  .arg(m_socket->peerPort()));

    // Bytes may already be buffered before the signals were connected.
    if (m_socket->bytesAvailable() > 0)
        onSocketReadyRead();
}

void ProxySession::abort()
{
    releaseReply();
    m_finishing = true;
    m_socket->abort();
    emitClosed();
}

// ========================================================================
// Inbound side
// ========================================================================

void ProxySession::onSocketReadyRead()
{
    const QByteArray data = m_socket->readAll();
    if (m_dispatched || m_finishing)
        return;

    switch (m_parser.feed(data)) {
    case HttpRequestParser::State::Incomplete:
        if (m_parser.expectsContinue() && !m_continueSent) {
            m_continueSent = true;
            ResponseWriter::writeContinue(m_socket);
        }
        return;

    case HttpRequestParser::State::Error:
        LOG_WARNING(QStringLiteral("ProxySession: malformed request from %1: %2")
                        .arg(m_socket->peerAddress().toString(), m_parser.failure().message));
        failRequest(m_parser.failure());
        return;

    case HttpRequestParser::State::Complete:
        m_dispatched = true;
        dispatch(m_parser.takeRequest());
        return;
    }
}

void ProxySession::dispatch(ProxyRequest request)
{
    m_method = request.method;
    m_target = request.target;
    m_http10 = request.httpVersion == QStringLiteral("HTTP/1.0");
    LOG_INFO(QStringLiteral("%1 %2").arg(m_method, m_target));

    if (m_options.answerPreflight && m_method == QStringLiteral("OPTIONS")) {
        ResponseWriter::writePreflight(m_socket);
        m_status = 200;
        finish();
        return;
    }

    const ProxyRequest outbound = m_pipeline ? m_pipeline->process(std::move(request))
                                             : std::move(request);

    auto reply = m_executor->send(outbound);
    if (!reply) {
        LOG_ERROR(QStringLiteral("ProxySession: %1 %2 could not be forwarded: %3")
                      .arg(m_method, m_target, reply.error().message));
        failRequest(reply.error());
        return;
    }

    m_reply = *reply;
    m_reply->setParent(this);
    m_reply->setReadBufferSize(kUpstreamReadBuffer);
    connect(m_reply, &QNetworkReply::metaDataChanged,
            this, &ProxySession::onUpstreamMetaDataChanged);
    connect(m_reply, &QNetworkReply::readyRead,
            this, &ProxySession::onUpstreamReadyRead);
    connect(m_reply, &QNetworkReply::finished,
            this, &ProxySession::onUpstreamFinished);
}

// ========================================================================
// Upstream side
// ========================================================================

bool ProxySession::writeResponseHead()
{
    if (m_headSent)
        return true;
    if (!m_reply)
        return false;

    const QVariant statusAttr = m_reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
    if (!statusAttr.isValid())
        return false;

    m_status = statusAttr.toInt();
    const QByteArray reason =
        m_reply->attribute(QNetworkRequest::HttpReasonPhraseAttribute).toByteArray();

    m_bodyAllowed = m_method != QStringLiteral("HEAD")
                    && m_status >= 200 && m_status != 204 && m_status != 304;
    // HTTP/1.0 clients read the body until the connection closes.
    m_chunked = m_bodyAllowed && !m_http10;

    QList<RawHeader> headers;
    for (const QNetworkReply::RawHeaderPair& pair : m_reply->rawHeaderPairs()) {
        if (QtExecutor::isHopByHopHeader(pair.first))
            continue;
        // Relayed bodies are re-framed with chunked encoding.
        if (m_chunked && pair.first.compare("content-length", Qt::CaseInsensitive) == 0)
            continue;
        // Qt joins repeated Set-Cookie fields with '\n'; each goes out on
        // its own line.
        for (const QByteArray& value : pair.second.split('\n'))
            headers.append({pair.first, value});
    }

    ResponseWriter::writeHead(m_socket, m_status, reason, headers, m_chunked);
    m_headSent = true;
    return true;
}

void ProxySession::onUpstreamMetaDataChanged()
{
    if (!m_reply || m_finishing)
        return;
    // Status and headers go out as soon as they arrive, ahead of the body.
    writeResponseHead();
}

void ProxySession::onUpstreamReadyRead()
{
    drainUpstream();
}

void ProxySession::drainUpstream()
{
    if (!m_reply || m_finishing)
        return;
    if (!writeResponseHead())
        return;

    while (m_reply->bytesAvailable() > 0 && m_socket->bytesToWrite() < kClientHighWater) {
        const QByteArray data = m_reply->read(kRelayChunkSize);
        if (data.isEmpty())
            break;
        m_relayedBytes += data.size();
        if (m_chunked)
            ResponseWriter::writeChunk(m_socket, data);
        else if (m_bodyAllowed)
            m_socket->write(data);
    }
}

void ProxySession::onSocketBytesWritten()
{
    if (!m_reply)
        return;
    drainUpstream();
    if (m_upstreamFinished)
        completeIfDrained();
}

void ProxySession::onUpstreamFinished()
{
    if (!m_reply || m_finishing)
        return;
    m_upstreamFinished = true;

    // 4xx/5xx replies also carry an error code; only failures without a
    // complete response are reported as gateway errors.
    if (QtExecutor::isTransportFailure(m_reply)) {
        const DomainFailure failure = QtExecutor::mapTransportError(m_reply);
        LOG_ERROR(QStringLiteral("ProxySession: %1 %2 upstream failure: %3")
                      .arg(m_method, m_target, failure.message));
        failRequest(failure);
        return;
    }

    if (!writeResponseHead()) {
        failRequest(DomainFailure::unavailable(
            QStringLiteral("upstream closed without a response")));
        return;
    }

    drainUpstream();
    completeIfDrained();
}

void ProxySession::completeIfDrained()
{
    if (!m_reply || m_finishing || m_reply->bytesAvailable() > 0)
        return;

    if (m_chunked)
        ResponseWriter::writeTerminator(m_socket);
    releaseReply();
    finish();
}

// ========================================================================
// Teardown
// ========================================================================

void ProxySession::failRequest(const DomainFailure& failure)
{
    releaseReply();
    if (m_headSent) {
        // The status line is gone; cutting the connection is the only way
        // left to tell the client the body is incomplete.
        m_finishing = true;
        m_socket->abort();
        emitClosed();
        return;
    }

    m_status = failure.httpStatus();
    ResponseWriter::writeJson(m_socket, m_status, failure.toJsonBytes());
    m_headSent = true;
    finish();
}

void ProxySession::finish()
{
    if (m_finishing)
        return;
    m_finishing = true;

    LOG_INFO(QStringLiteral("%1 %2 -> %3 (%4 bytes, %5 ms)")
                 .arg(m_method.isEmpty() ? QStringLiteral("-") : m_method,
                      m_target.isEmpty() ? QStringLiteral("-") : m_target)
                 .arg(m_status)
                 .arg(m_relayedBytes)
                 .arg(m_timer.elapsed()));

    if (m_socket->state() == QAbstractSocket::UnconnectedState) {
        emitClosed();
        return;
    }
    // Pending writes are flushed before the socket closes.
    m_socket->disconnectFromHost();
}

void ProxySession::onSocketDisconnected()
{
    if (m_reply) {
        LOG_INFO(QStringLiteral("%1 %2: client disconnected, aborting upstream request")
                     .arg(m_method, m_target));
    }
    releaseReply();
    m_finishing = true;
    emitClosed();
}

void ProxySession::releaseReply()
{
    if (!m_reply)
        return;
    QNetworkReply* reply = m_reply;
    m_reply = nullptr;
    reply->disconnect(this);
    if (reply->isRunning())
        reply->abort();
    reply->deleteLater();
}

void ProxySession::emitClosed()
{
    if (m_closedEmitted)
        return;
    m_closedEmitted = true;
    emit closed(this);
}
