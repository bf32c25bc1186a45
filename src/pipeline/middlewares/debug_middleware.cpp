#include "debug_middleware.h"
#include "core/log_manager.h"
#include <QJsonDocument>
#include <QJsonObject>

namespace {

QString renderValue(const QJsonValue& value)
{
    switch (value.type()) {
    case QJsonValue::Null:   return QStringLiteral("null");
    case QJsonValue::Bool:   return value.toBool() ? QStringLiteral("true") : QStringLiteral("false");
    case QJsonValue::Double: return QString::number(value.toDouble());
    case QJsonValue::String: return value.toString();
    case QJsonValue::Array:
        return QString::fromUtf8(QJsonDocument(value.toArray()).toJson(QJsonDocument::Compact));
    case QJsonValue::Object:
        return QString::fromUtf8(QJsonDocument(value.toObject()).toJson(QJsonDocument::Compact));
    default:
        return QString();
    }
}

}

QString DebugMiddleware::truncate(const QString& value, int maxLength) {
    if (value.size() <= maxLength)
        return value;
    return QStringLiteral("%1... (%2 chars)").arg(value.left(maxLength)).arg(value.size());
}

Result<ProxyRequest> DebugMiddleware::onRequest(ProxyRequest request) {
    if (!m_enabled || request.body.isEmpty()
        || !LogManager::instance().isEnabled(LogManager::Debug)) {
        return request;
    }

    const QJsonDocument doc = QJsonDocument::fromJson(request.body);
    if (!doc.isObject())
        return request;

    const QJsonObject obj = doc.object();
    LOG_DEBUG(QStringLiteral("[Debug] Request parameters (%1 %2):").arg(request.method, request.target));
    for (auto it = obj.constBegin(); it != obj.constEnd(); ++it) {
        LOG_DEBUG(QStringLiteral("[Debug]   %1: %2").arg(it.key(), truncate(renderValue(it.value()))));
    }
    return request;
}
