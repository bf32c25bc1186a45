#include "proxy_server.h"
#include "proxy_session.h"
#include "adapters/executor/qt_executor.h"
#include "core/log_manager.h"
#include <QHostAddress>
#include <QSslConfiguration>
#include <QTcpSocket>

// ========================================================================
// Construction / destruction
// ========================================================================

ProxyServer::ProxyServer(QObject* parent)
    : QObject(parent)
{
}

ProxyServer::~ProxyServer()
{
    stop();
    // Sessions own their upstream replies, which must go before the
    // executor's network access manager.
    qDeleteAll(findChildren<ProxySession*>(Qt::FindDirectChildrenOnly));
}

void ProxyServer::setPipeline(const Pipeline* pipeline)
{
    m_pipeline = pipeline;
}

void ProxyServer::setExecutor(std::unique_ptr<IExecutor> executor)
{
    m_executor = std::move(executor);
}

// ========================================================================
// start
// ========================================================================

VoidResult ProxyServer::start(const ProxyConfig& config)
{
    if (m_server) {
        stop();
    }

    m_config = config;

    QHostAddress address;
    if (config.runtime.listenHost.compare(QStringLiteral("localhost"), Qt::CaseInsensitive) == 0) {
        address = QHostAddress(QHostAddress::LocalHost);
    } else if (!address.setAddress(config.runtime.listenHost)) {
        return std::unexpected(DomainFailure::startupConfig(
            QStringLiteral("bad_listen_address"),
            QStringLiteral("invalid listen address: %1").arg(config.runtime.listenHost)));
    }

    if (!m_executor) {
        auto executor = std::make_unique<QtExecutor>(config.runtime.upstreamUrl,
                                                     QSslConfiguration::defaultConfiguration());
        executor->setRequestTimeout(config.runtime.requestTimeout);
        m_executor = std::move(executor);
    }

    // ---- Create and start server ----
    const quint16 port = static_cast<quint16>(config.runtime.proxyPort);
    m_server = new QTcpServer(this);
    connect(m_server, &QTcpServer::newConnection,
            this, &ProxyServer::onNewConnection);

    if (!m_server->listen(address, port)) {
        const QString reason = m_server->errorString();
        delete m_server;
        m_server = nullptr;
        return std::unexpected(DomainFailure::startupConfig(
            QStringLiteral("listen_failed"),
            QStringLiteral("failed to listen on %1:%2 - %3")
                .arg(config.runtime.listenHost)
                .arg(port)
                .arg(reason)));
    }

    LOG_INFO(QStringLiteral("ProxyServer: listening on http://%1:%2")
                 .arg(config.runtime.listenHost)
                 .arg(m_server->serverPort()));
    emit statusChanged(true);
    return {};
}

// ========================================================================
// stop
// ========================================================================

void ProxyServer::stop()
{
    if (!m_server) {
        return;
    }

    // Abort every in-flight exchange; closed() removes each from the set.
    const QSet<ProxySession*> sessions = m_sessions;
    for (ProxySession* session : sessions) {
        session->abort();
    }
    m_sessions.clear();

    m_server->close();
    delete m_server;
    m_server = nullptr;

    LOG_INFO(QStringLiteral("ProxyServer: proxy server stopped"));
    emit statusChanged(false);
}

bool ProxyServer::isRunning() const
{
    return m_server && m_server->isListening();
}

quint16 ProxyServer::serverPort() const
{
    return m_server ? m_server->serverPort() : 0;
}

// ========================================================================
// onNewConnection
// ========================================================================

void ProxyServer::onNewConnection()
{
    while (m_server->hasPendingConnections()) {
        QTcpSocket* socket = m_server->nextPendingConnection();
        if (!socket) {
            continue;
        }

        auto* session = new ProxySession(socket, m_pipeline, m_executor.get(),
                                         m_config.runtime, this);
        m_sessions.insert(session);
        connect(session, &ProxySession::closed,
                this, &ProxyServer::onSessionClosed);
        session->start();
    }
}

void ProxyServer::onSessionClosed(ProxySession* session)
{
    m_sessions.remove(session);
    session->deleteLater();
}
