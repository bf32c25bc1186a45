#pragma once
#include "config/config_types.h"
#include "semantic/ports.h"
#include <QObject>
#include <QSet>
#include <QTcpServer>
#include <memory>

class Pipeline;
class ProxySession;

class ProxyServer : public QObject {
    Q_OBJECT
public:
    explicit ProxyServer(QObject* parent = nullptr);
    ~ProxyServer() override;

    // Bind failures are returned as StartupConfig failures.
    VoidResult start(const ProxyConfig& config);
    void stop();
    bool isRunning() const;
    quint16 serverPort() const;
    int activeSessionCount() const { return m_sessions.size(); }

    void setPipeline(const Pipeline* pipeline);
    // Replaces the upstream executor built by start(); used by tests.
    void setExecutor(std::unique_ptr<IExecutor> executor);

signals:
    void statusChanged(bool running);

private slots:
    void onNewConnection();
    void onSessionClosed(ProxySession* session);

private:
    QTcpServer* m_server = nullptr;
    const Pipeline* m_pipeline = nullptr;
    std::unique_ptr<IExecutor> m_executor;
    ProxyConfig m_config;
    QSet<ProxySession*> m_sessions;
};
