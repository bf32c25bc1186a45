#pragma once
#include "pipeline/middleware.h"
#include "config/config_types.h"

// Inserts or overwrites the top-level temperature / top_p / top_k keys of a
// JSON object body. Bodies that are empty or not a JSON object are
// forwarded untouched.
class SamplingMiddleware : public IPipelineMiddleware {
public:
    explicit SamplingMiddleware(const ResolvedConfig& config) : m_config(config) {}
    QString name() const override { return "sampling"; }
    Result<ProxyRequest> onRequest(ProxyRequest request) override;

    const ResolvedConfig& config() const { return m_config; }

private:
    const ResolvedConfig m_config;
};
