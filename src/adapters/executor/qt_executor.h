#pragma once
#include "semantic/ports.h"
#include <QNetworkAccessManager>
#include <QNetworkRequest>
#include <QSslConfiguration>
#include <QUrl>

// Sends each proxied request to the fixed upstream origin through one
// shared QNetworkAccessManager, which pools upstream connections.
class QtExecutor : public IExecutor {
public:
    QtExecutor(const QUrl& upstreamUrl, const QSslConfiguration& sslConfig);

    Result<QNetworkReply*> send(const ProxyRequest& request) override;

    void setRequestTimeout(int ms) { m_requestTimeout = ms; }

    QUrl targetUrl(const QString& target) const;
    QNetworkRequest buildQtRequest(const ProxyRequest& request) const;

    // Connection-scoped headers that never cross the proxy.
    static bool isHopByHopHeader(const QByteArray& name);
    // True when Qt derived the error from the HTTP status itself, i.e. the
    // reply is a complete upstream response that must be relayed.
    static bool isHttpStatusError(QNetworkReply::NetworkError code, int httpStatus);
    // True for failures where no complete HTTP response was received.
    static bool isTransportFailure(QNetworkReply* reply);
    static DomainFailure mapTransportError(QNetworkReply* reply);

private:
    QUrl m_upstreamUrl;
    QSslConfiguration m_sslConfig;
    int m_requestTimeout = 600000;
    QNetworkAccessManager m_nam;
};
