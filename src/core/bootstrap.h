#pragma once
#include "config/command_line.h"
#include "config/config_types.h"
#include "pipeline/pipeline.h"
#include "semantic/ports.h"
#include <QObject>
#include <memory>

class ProxyServer;

// Wires config loading, parameter resolution, the pipeline and the proxy
// server together, in that order.
class Bootstrap : public QObject {
    Q_OBJECT

public:
    explicit Bootstrap(QObject* parent = nullptr);
    ~Bootstrap() override;

    VoidResult startAll(const CommandLineOptions& options);
    void stopAll();

    quint16 proxyPort() const;

private:
    void logBanner() const;

    ProxyConfig m_config;
    std::unique_ptr<Pipeline> m_pipeline;
    ProxyServer* m_proxy = nullptr;
};
