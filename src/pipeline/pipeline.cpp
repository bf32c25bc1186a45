#include "pipeline.h"
#include "core/log_manager.h"

void Pipeline::addMiddleware(std::unique_ptr<IPipelineMiddleware> mw) {
    m_middlewares.push_back(std::move(mw));
}

ProxyRequest Pipeline::process(ProxyRequest request) const {
    for (const auto& mw : m_middlewares) {
        auto r = mw->onRequest(request);
        if (!r) {
            LOG_WARNING(QStringLiteral("Pipeline: middleware %1 failed, passing request through: %2")
                            .arg(mw->name(), r.error().message));
            continue;
        }
        request = std::move(*r);
    }
    return request;
}
