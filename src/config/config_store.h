#pragma once
#include "config_types.h"
#include "semantic/ports.h"

// Loads the sampling config file: a JSON object with optional
// temperature / top_p / top_k keys (number or null).
class ConfigStore {
public:
    Result<SamplingOverrides> load(const QString& path);

    const SamplingOverrides& samplingOverrides() const { return m_overrides; }
    QString filePath() const { return m_filePath; }

    static Result<SamplingOverrides> parseSamplingJson(const QByteArray& json);
    static QString expandUserPath(const QString& path);

private:
    SamplingOverrides m_overrides;
    QString m_filePath;
};
