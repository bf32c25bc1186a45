#include "sampling_middleware.h"
#include "core/log_manager.h"
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonValue>

namespace {

QString describeValue(const QJsonValue& value)
{
    if (value.isUndefined())
        return QStringLiteral("absent");
    if (value.isNull())
        return QStringLiteral("null");
    if (value.isDouble())
        return QString::number(value.toDouble());
    if (value.isString())
        return QStringLiteral("\"%1\"").arg(value.toString());
    if (value.isBool())
        return value.toBool() ? QStringLiteral("true") : QStringLiteral("false");
    return QStringLiteral("<%1>").arg(value.isArray() ? QStringLiteral("array")
                                                      : QStringLiteral("object"));
}

}

Result<ProxyRequest> SamplingMiddleware::onRequest(ProxyRequest request) {
    if (m_config.isEmpty() || request.body.isEmpty())
        return request;

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(request.body, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_DEBUG(QStringLiteral("SamplingMiddleware: %1 %2 body is not a JSON object, forwarding as-is")
                      .arg(request.method, request.target));
        return request;
    }

    QJsonObject root = doc.object();
    bool modified = false;

    auto apply = [&](const QString& key, const QJsonValue& value) {
        const QJsonValue previous = root.value(key);
        if (previous == value)
            return;
        root.insert(key, value);
        modified = true;
        LOG_INFO(QStringLiteral("Injected %1: %2 -> %3")
                     .arg(key, describeValue(previous), describeValue(value)));
    };

    if (m_config.temperature)
        apply(QStringLiteral("temperature"), *m_config.temperature);
    if (m_config.topP)
        apply(QStringLiteral("top_p"), *m_config.topP);
    if (m_config.topK)
        apply(QStringLiteral("top_k"), *m_config.topK);

    // Untouched bodies keep their exact bytes.
    if (modified)
        request.body = QJsonDocument(root).toJson(QJsonDocument::Compact);
    return request;
}
