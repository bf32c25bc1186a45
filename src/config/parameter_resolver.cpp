#include "parameter_resolver.h"
#include <QStringList>

namespace {

template<typename T>
std::optional<T> pick(const std::optional<SamplingOverrides>& cli,
                      const std::optional<SamplingOverrides>& file,
                      ConfigValue<T> SamplingOverrides::*field)
{
    if (cli && ((*cli).*field).isSet())
        return ((*cli).*field).value();
    if (file && ((*file).*field).isSet())
        return ((*file).*field).value();
    return std::nullopt;
}

bool inUnitInterval(double value)
{
    // NaN fails both comparisons
    return value >= 0.0 && value <= 1.0;
}

}

namespace parameter_resolver {

ResolvedConfig resolve(const std::optional<SamplingOverrides>& cliOverrides,
                       const std::optional<SamplingOverrides>& fileOverrides)
{
    ResolvedConfig resolved;
    resolved.temperature = pick(cliOverrides, fileOverrides, &SamplingOverrides::temperature);
    resolved.topP = pick(cliOverrides, fileOverrides, &SamplingOverrides::topP);
    resolved.topK = pick(cliOverrides, fileOverrides, &SamplingOverrides::topK);
    return resolved;
}

VoidResult validateSamplingDomain(const ResolvedConfig& config)
{
    if (config.temperature && !inUnitInterval(*config.temperature)) {
        return std::unexpected(DomainFailure::startupConfig(
            QStringLiteral("temperature_out_of_range"),
            QStringLiteral("temperature must be between 0.0 and 1.0, got %1")
                .arg(*config.temperature)));
    }
    if (config.topP && !inUnitInterval(*config.topP)) {
        return std::unexpected(DomainFailure::startupConfig(
            QStringLiteral("top_p_out_of_range"),
            QStringLiteral("top_p must be between 0.0 and 1.0, got %1")
                .arg(*config.topP)));
    }
    if (config.topK && *config.topK < 1) {
        return std::unexpected(DomainFailure::startupConfig(
            QStringLiteral("top_k_out_of_range"),
            QStringLiteral("top_k must be an integer >= 1, got %1")
                .arg(*config.topK)));
    }
    return {};
}

} // namespace parameter_resolver

QString ResolvedConfig::describe() const
{
    const QString unset = QStringLiteral("unset");
    QStringList parts;
    parts << QStringLiteral("temperature=%1").arg(temperature ? QString::number(*temperature) : unset);
    parts << QStringLiteral("top_p=%1").arg(topP ? QString::number(*topP) : unset);
    parts << QStringLiteral("top_k=%1").arg(topK ? QString::number(*topK) : unset);
    return parts.join(QStringLiteral(", "));
}
