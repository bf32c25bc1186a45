#pragma once
#include "middleware.h"
#include <memory>
#include <vector>

// Runs every inbound request through the registered middlewares, in
// registration order, before it is forwarded upstream.
class Pipeline {
public:
    void addMiddleware(std::unique_ptr<IPipelineMiddleware> mw);
    int middlewareCount() const { return static_cast<int>(m_middlewares.size()); }

    // A failing middleware is skipped: the request continues with the
    // value it had before that middleware ran.
    ProxyRequest process(ProxyRequest request) const;

private:
    std::vector<std::unique_ptr<IPipelineMiddleware>> m_middlewares;
};
