#pragma once
#include "pipeline/middleware.h"

// Dumps the top-level keys of JSON request bodies at debug level.
class DebugMiddleware : public IPipelineMiddleware {
public:
    explicit DebugMiddleware(bool enabled = false) : m_enabled(enabled) {}
    QString name() const override { return "debug"; }
    Result<ProxyRequest> onRequest(ProxyRequest request) override;

    static QString truncate(const QString& value, int maxLength = kMaxLogLength);

private:
    static constexpr int kMaxLogLength = 200;
    bool m_enabled;
};
