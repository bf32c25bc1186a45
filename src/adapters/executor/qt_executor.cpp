#include "qt_executor.h"
#include "core/log_manager.h"
#include <QNetworkProxy>
#include <QSet>
#include <algorithm>

QtExecutor::QtExecutor(const QUrl& upstreamUrl, const QSslConfiguration& sslConfig)
    : m_upstreamUrl(upstreamUrl)
    , m_sslConfig(sslConfig)
{
    m_nam.setRedirectPolicy(QNetworkRequest::ManualRedirectPolicy);
    // The upstream origin is always dialed directly, never through an
    // environment-configured proxy.
    m_nam.setProxy(QNetworkProxy::NoProxy);
}

bool QtExecutor::isHopByHopHeader(const QByteArray& name) {
    static const QSet<QByteArray> hopByHop = {
        "connection", "keep-alive", "proxy-connection", "transfer-encoding",
        "te", "upgrade", "trailer", "expect"
    };
    return hopByHop.contains(name.toLower());
}

bool QtExecutor::isHttpStatusError(QNetworkReply::NetworkError code, int httpStatus) {
    if (httpStatus < 400)
        return false;
    // Codes QNetworkReply assigns from a 4xx/5xx status line.
    switch (code) {
    case QNetworkReply::ProtocolInvalidOperationError:
    case QNetworkReply::ProxyAuthenticationRequiredError:
    case QNetworkReply::ContentAccessDenied:
    case QNetworkReply::ContentOperationNotPermittedError:
    case QNetworkReply::ContentNotFoundError:
    case QNetworkReply::AuthenticationRequiredError:
    case QNetworkReply::ContentConflictError:
    case QNetworkReply::ContentGoneError:
    case QNetworkReply::UnknownContentError:
    case QNetworkReply::InternalServerError:
    case QNetworkReply::OperationNotImplementedError:
    case QNetworkReply::ServiceUnavailableError:
    case QNetworkReply::UnknownServerError:
        return true;
    default:
        return false;
    }
}

bool QtExecutor::isTransportFailure(QNetworkReply* reply) {
    if (!reply || reply->error() == QNetworkReply::NoError)
        return false;
    const QVariant status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
    if (!status.isValid())
        return true;
    return !isHttpStatusError(reply->error(), status.toInt());
}

DomainFailure QtExecutor::mapTransportError(QNetworkReply* reply) {
    if (!reply) return DomainFailure::internal("null reply");

    const QString detail = QStringLiteral("upstream request failed: %1").arg(reply->errorString());
    switch (reply->error()) {
    case QNetworkReply::TimeoutError:
    case QNetworkReply::OperationCanceledError:
        return DomainFailure::timeout(detail);
    default:
        return DomainFailure::unavailable(detail);
    }
}

QUrl QtExecutor::targetUrl(const QString& target) const {
    QByteArray base = m_upstreamUrl.toEncoded(QUrl::RemoveQuery | QUrl::RemoveFragment);
    while (base.endsWith('/'))
        base.chop(1);
    return QUrl::fromEncoded(base + target.toLatin1(), QUrl::TolerantMode);
}

QNetworkRequest QtExecutor::buildQtRequest(const ProxyRequest& request) const {
    QNetworkRequest req{targetUrl(request.target)};
    if (m_upstreamUrl.scheme().compare(QStringLiteral("https"), Qt::CaseInsensitive) == 0)
        req.setSslConfiguration(m_sslConfig);

    // Headers named in Connection are connection-scoped as well.
    QSet<QByteArray> dropped;
    for (const QByteArray& token : request.header("connection").split(','))
        dropped.insert(token.trimmed().toLower());

    // setRawHeader replaces, so repeated fields are folded into one
    // comma-separated value first.
    QList<RawHeader> merged;
    for (const RawHeader& h : request.headers) {
        const QByteArray lower = h.first.toLower();
        // Host and Content-Length are derived from the URL and the body.
        if (lower == "host" || lower == "content-length")
            continue;
        if (isHopByHopHeader(lower) || dropped.contains(lower))
            continue;
        auto existing = std::find_if(merged.begin(), merged.end(), [&lower](const RawHeader& m) {
            return m.first.toLower() == lower;
        });
        if (existing != merged.end())
            existing->second += ", " + h.second;
        else
            merged.append(h);
    }
    for (const RawHeader& h : merged)
        req.setRawHeader(h.first, h.second);

    // Without an explicit Accept-Encoding Qt would negotiate and decode
    // compression itself, which breaks a byte-for-byte relay.
    if (!request.hasHeader("accept-encoding"))
        req.setRawHeader("Accept-Encoding", "identity");

    req.setAttribute(QNetworkRequest::CookieLoadControlAttribute, QNetworkRequest::Manual);
    req.setAttribute(QNetworkRequest::CookieSaveControlAttribute, QNetworkRequest::Manual);
    req.setAttribute(QNetworkRequest::CacheLoadControlAttribute, QNetworkRequest::AlwaysNetwork);
    req.setAttribute(QNetworkRequest::CacheSaveControlAttribute, false);
    req.setTransferTimeout(m_requestTimeout);
    return req;
}

Result<QNetworkReply*> QtExecutor::send(const ProxyRequest& request) {
    QNetworkRequest req = buildQtRequest(request);
    if (!req.url().isValid()) {
        return std::unexpected(DomainFailure::malformedRequest(
            QStringLiteral("bad_request_target"),
            QStringLiteral("cannot build upstream URL for target %1").arg(request.target)));
    }

    const QByteArray method = request.method.toLatin1();
    QNetworkReply* reply = nullptr;
    if (method == "POST")
        reply = m_nam.post(req, request.body);
    else if (method == "PUT")
        reply = m_nam.put(req, request.body);
    else if (method == "GET" && request.body.isEmpty())
        reply = m_nam.get(req);
    else if (method == "HEAD" && request.body.isEmpty())
        reply = m_nam.head(req);
    else if (method == "DELETE" && request.body.isEmpty())
        reply = m_nam.deleteResource(req);
    else
        reply = m_nam.sendCustomRequest(req, method, request.body);

    if (!reply)
        return std::unexpected(DomainFailure::internal("network access manager returned no reply"));

    LOG_DEBUG(QStringLiteral("QtExecutor: %1 %2 (%3 body bytes)")
                  .arg(request.method, req.url().toString(QUrl::RemoveQuery))
                  .arg(request.body.size()));
    return reply;
}
