#pragma once
#include "semantic/types.h"
#include <QString>
#include <QUrl>
#include <optional>

template<typename T>
class ConfigValue {
public:
    ConfigValue() = default;

    static ConfigValue unmentioned() { return ConfigValue(); }
    static ConfigValue null() {
        ConfigValue v;
        v.m_presence = ValuePresence::Null;
        return v;
    }
    static ConfigValue of(T value) {
        ConfigValue v;
        v.m_presence = ValuePresence::Value;
        v.m_value = value;
        return v;
    }

    bool isSet() const { return m_presence == ValuePresence::Value; }
    bool isNull() const { return m_presence == ValuePresence::Null; }
    bool isUnmentioned() const { return m_presence == ValuePresence::Unmentioned; }

    // Only meaningful when isSet().
    T value() const { return m_value; }

    bool operator==(const ConfigValue& other) const {
        return m_presence == other.m_presence
               && (m_presence != ValuePresence::Value || m_value == other.m_value);
    }

private:
    ValuePresence m_presence = ValuePresence::Unmentioned;
    T m_value{};
};

struct SamplingOverrides {
    ConfigValue<double> temperature;
    ConfigValue<double> topP;
    ConfigValue<int> topK;

    bool hasAnySet() const {
        return temperature.isSet() || topP.isSet() || topK.isSet();
    }
};

// Final sampling parameters, built once at startup and never mutated.
struct ResolvedConfig {
    std::optional<double> temperature;
    std::optional<double> topP;
    std::optional<int> topK;

    bool isEmpty() const { return !temperature && !topP && !topK; }
    QString describe() const;
};

struct RuntimeOptions {
    QString listenHost = QStringLiteral("127.0.0.1");
    int proxyPort = 8080;
    QUrl upstreamUrl = QUrl(QStringLiteral("https://api.anthropic.com"));
    int requestTimeout = 600000;   // ms of upstream inactivity, 0 = none
    bool answerPreflight = false;
    bool debugMode = false;
};

struct ProxyConfig {
    RuntimeOptions runtime;
    ResolvedConfig sampling;
};
