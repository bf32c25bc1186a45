#pragma once
#include "semantic/ports.h"

class IPipelineMiddleware {
public:
    virtual ~IPipelineMiddleware() = default;
    virtual QString name() const = 0;

    virtual Result<ProxyRequest> onRequest(ProxyRequest request) {
        return request;
    }
};
