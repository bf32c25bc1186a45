#include "config_store.h"
#include <QDir>
#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonValue>
#include <cmath>
#include <limits>

namespace {

// Primary key wins when it carries a value; the "preferred_" alias is
// consulted otherwise.
QJsonValue jsonValueEither(const QJsonObject& obj, const char* key, const char* aliasKey)
{
    const QJsonValue primary = obj.value(QString::fromUtf8(key));
    if (!primary.isUndefined() && !primary.isNull())
        return primary;
    const QJsonValue alias = obj.value(QString::fromUtf8(aliasKey));
    if (!alias.isUndefined() && !alias.isNull())
        return alias;
    if (primary.isNull() || alias.isNull())
        return QJsonValue(QJsonValue::Null);
    return QJsonValue(QJsonValue::Undefined);
}

DomainFailure typeError(const char* key, const QString& expected)
{
    return DomainFailure::startupConfig(
        QStringLiteral("config_type_error"),
        QStringLiteral("config key '%1' must be %2").arg(QString::fromUtf8(key), expected));
}

Result<ConfigValue<double>> readDouble(const QJsonObject& obj, const char* key, const char* aliasKey)
{
    const QJsonValue value = jsonValueEither(obj, key, aliasKey);
    if (value.isUndefined())
        return ConfigValue<double>::unmentioned();
    if (value.isNull())
        return ConfigValue<double>::null();
    if (!value.isDouble())
        return std::unexpected(typeError(key, QStringLiteral("a number or null")));
    return ConfigValue<double>::of(value.toDouble());
}

Result<ConfigValue<int>> readInt(const QJsonObject& obj, const char* key, const char* aliasKey)
{
    const QJsonValue value = jsonValueEither(obj, key, aliasKey);
    if (value.isUndefined())
        return ConfigValue<int>::unmentioned();
    if (value.isNull())
        return ConfigValue<int>::null();
    if (!value.isDouble())
        return std::unexpected(typeError(key, QStringLiteral("an integer or null")));

    const double number = value.toDouble();
    if (std::trunc(number) != number
        || number < std::numeric_limits<int>::min()
        || number > std::numeric_limits<int>::max()) {
        return std::unexpected(typeError(key, QStringLiteral("an integer or null")));
    }
    return ConfigValue<int>::of(static_cast<int>(number));
}

}

Result<SamplingOverrides> ConfigStore::load(const QString& path) {
    m_filePath = expandUserPath(path);

    QFile file(m_filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        return std::unexpected(DomainFailure::startupConfig(
            QStringLiteral("config_unreadable"),
            QStringLiteral("could not open config file %1: %2")
                .arg(m_filePath, file.errorString())));
    }

    auto parsed = parseSamplingJson(file.readAll());
    if (!parsed) {
        DomainFailure failure = parsed.error();
        failure.message = QStringLiteral("%1: %2").arg(m_filePath, failure.message);
        return std::unexpected(failure);
    }

    m_overrides = *parsed;
    return m_overrides;
}

Result<SamplingOverrides> ConfigStore::parseSamplingJson(const QByteArray& json) {
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(json, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        return std::unexpected(DomainFailure::startupConfig(
            QStringLiteral("config_invalid_json"),
            QStringLiteral("invalid JSON at offset %1: %2")
                .arg(parseError.offset)
                .arg(parseError.errorString())));
    }
    if (!doc.isObject()) {
        return std::unexpected(DomainFailure::startupConfig(
            QStringLiteral("config_not_object"),
            QStringLiteral("config file must contain a JSON object")));
    }

    const QJsonObject root = doc.object();

    auto temperature = readDouble(root, "temperature", "preferred_temperature");
    if (!temperature) return std::unexpected(temperature.error());
    auto topP = readDouble(root, "top_p", "preferred_top_p");
    if (!topP) return std::unexpected(topP.error());
    auto topK = readInt(root, "top_k", "preferred_top_k");
    if (!topK) return std::unexpected(topK.error());

    SamplingOverrides overrides;
    overrides.temperature = *temperature;
    overrides.topP = *topP;
    overrides.topK = *topK;
    return overrides;
}

QString ConfigStore::expandUserPath(const QString& path) {
    if (path == QStringLiteral("~"))
        return QDir::homePath();
    if (path.startsWith(QStringLiteral("~/")))
        return QDir::homePath() + path.mid(1);
    return path;
}
