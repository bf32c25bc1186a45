#include "failure.h"
#include <QJsonDocument>

int DomainFailure::httpStatus() const {
    switch (kind) {
    case ErrorKind::MalformedRequest:    return 400;
    case ErrorKind::RequestTooLarge:     return 413;
    case ErrorKind::UpstreamUnavailable: return 502;
    case ErrorKind::UpstreamTimeout:     return 502;
    case ErrorKind::StartupConfig:
    case ErrorKind::Internal:
    default:                             return 500;
    }
}

QJsonObject DomainFailure::toJson() const {
    static const char* kindNames[] = {
        "startup_config", "malformed_request", "request_too_large", "upstream_unavailable",
        "upstream_timeout", "internal"
    };
    QJsonObject err;
    err["code"] = code;
    err["message"] = message;
    err["type"] = QString::fromLatin1(kindNames[static_cast<int>(kind)]);
    QJsonObject root;
    root["error"] = err;
    return root;
}

QByteArray DomainFailure::toJsonBytes() const {
    return QJsonDocument(toJson()).toJson(QJsonDocument::Compact);
}

DomainFailure DomainFailure::startupConfig(const QString& code, const QString& msg) {
    return {ErrorKind::StartupConfig, code, msg};
}

DomainFailure DomainFailure::malformedRequest(const QString& code, const QString& msg) {
    return {ErrorKind::MalformedRequest, code, msg};
}

DomainFailure DomainFailure::requestTooLarge(const QString& msg) {
    return {ErrorKind::RequestTooLarge, "body_too_large", msg};
}

DomainFailure DomainFailure::unavailable(const QString& msg) {
    return {ErrorKind::UpstreamUnavailable, "upstream_unavailable", msg};
}

DomainFailure DomainFailure::timeout(const QString& msg) {
    return {ErrorKind::UpstreamTimeout, "upstream_timeout", msg};
}

DomainFailure DomainFailure::internal(const QString& msg) {
    return {ErrorKind::Internal, "internal", msg};
}
