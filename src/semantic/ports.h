#pragma once
#include "request.h"
#include "failure.h"
#include <expected>
#include <QNetworkReply>

template<typename T>
using Result = std::expected<T, DomainFailure>;

using VoidResult = std::expected<void, DomainFailure>;

class IExecutor {
public:
    virtual ~IExecutor() = default;
    // Starts the outbound request. The caller owns the returned reply.
    virtual Result<QNetworkReply*> send(const ProxyRequest& request) = 0;
};
