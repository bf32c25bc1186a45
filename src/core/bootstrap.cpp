#include "bootstrap.h"
#include "log_manager.h"
#include "config/config_store.h"
#include "config/parameter_resolver.h"
#include "pipeline/middlewares/debug_middleware.h"
#include "pipeline/middlewares/sampling_middleware.h"
#include "proxy/proxy_server.h"
#include <optional>

Bootstrap::Bootstrap(QObject* parent)
    : QObject(parent)
{
}

Bootstrap::~Bootstrap()
{
    stopAll();
}

quint16 Bootstrap::proxyPort() const
{
    return m_proxy ? m_proxy->serverPort() : 0;
}

VoidResult Bootstrap::startAll(const CommandLineOptions& options)
{
    // [1/3] config file
    std::optional<SamplingOverrides> fileOverrides;
    if (!options.configPath.isEmpty()) {
        ConfigStore store;
        auto loaded = store.load(options.configPath);
        if (!loaded) {
            return std::unexpected(loaded.error());
        }
        fileOverrides = *loaded;
        LOG_INFO(QStringLiteral("Loaded config from %1").arg(store.filePath()));
    }

    // [2/3] resolve against the command line
    const ResolvedConfig sampling = parameter_resolver::resolve(options.sampling, fileOverrides);
    if (auto valid = parameter_resolver::validateSamplingDomain(sampling); !valid) {
        return std::unexpected(valid.error());
    }

    m_config.runtime = options.runtime;
    m_config.sampling = sampling;

    m_pipeline = std::make_unique<Pipeline>();
    m_pipeline->addMiddleware(std::make_unique<DebugMiddleware>(m_config.runtime.debugMode));
    m_pipeline->addMiddleware(std::make_unique<SamplingMiddleware>(m_config.sampling));

    // [3/3] proxy server
    if (!m_proxy)
        m_proxy = new ProxyServer(this);
    m_proxy->setPipeline(m_pipeline.get());

    auto started = m_proxy->start(m_config);
    if (!started) {
        return std::unexpected(started.error());
    }

    logBanner();
    return {};
}

void Bootstrap::stopAll()
{
    if (m_proxy && m_proxy->isRunning()) {
        m_proxy->stop();
    }
}

void Bootstrap::logBanner() const
{
    const QString listen = QStringLiteral("http://%1:%2")
                               .arg(m_config.runtime.listenHost)
                               .arg(proxyPort());

    LOG_INFO(QStringLiteral("Sampling proxy ready"));
    LOG_INFO(QStringLiteral("  Sampling: %1").arg(m_config.sampling.describe()));
    if (m_config.sampling.isEmpty()) {
        LOG_INFO(QStringLiteral("  No sampling parameters set, requests are forwarded unchanged"));
    }
    LOG_INFO(QStringLiteral("  Listening: %1").arg(listen));
    LOG_INFO(QStringLiteral("  Upstream: %1").arg(m_config.runtime.upstreamUrl.toString()));
    LOG_INFO(QStringLiteral("  Point clients at the proxy with: ANTHROPIC_BASE_URL=%1").arg(listen));
}
