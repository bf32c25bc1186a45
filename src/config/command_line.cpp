#include "command_line.h"
#include <QHostAddress>

namespace {

DomainFailure badArgument(const QString& msg)
{
    return DomainFailure::startupConfig(QStringLiteral("bad_argument"), msg);
}

}

CommandLine::CommandLine()
    : m_temperature({QStringLiteral("t"), QStringLiteral("temperature")},
                    QStringLiteral("Temperature (0.0-1.0)."), QStringLiteral("value"))
    , m_topP({QStringLiteral("p"), QStringLiteral("top-p")},
             QStringLiteral("Top-p / nucleus sampling (0.0-1.0)."), QStringLiteral("value"))
    , m_topK({QStringLiteral("k"), QStringLiteral("top-k")},
             QStringLiteral("Top-k sampling (1-100+)."), QStringLiteral("value"))
    , m_config({QStringLiteral("c"), QStringLiteral("config")},
               QStringLiteral("Path to JSON config file."), QStringLiteral("path"))
    , m_port(QStringLiteral("port"),
             QStringLiteral("Port to listen on (default: 8080)."), QStringLiteral("port"),
             QStringLiteral("8080"))
    , m_host(QStringLiteral("host"),
             QStringLiteral("Host to bind to (default: 127.0.0.1)."), QStringLiteral("address"),
             QStringLiteral("127.0.0.1"))
    , m_upstream(QStringLiteral("upstream"),
                 QStringLiteral("Upstream API origin (default: https://api.anthropic.com)."),
                 QStringLiteral("url"), QStringLiteral("https://api.anthropic.com"))
    , m_timeout(QStringLiteral("timeout"),
                QStringLiteral("Upstream inactivity timeout in ms, 0 disables (default: 600000)."),
                QStringLiteral("ms"), QStringLiteral("600000"))
    , m_logFile(QStringLiteral("log-file"),
                QStringLiteral("Also append log lines to this file."), QStringLiteral("path"))
    , m_verbose(QStringLiteral("verbose"),
                QStringLiteral("Log request parameters and other debug output."))
    , m_cors(QStringLiteral("cors"),
             QStringLiteral("Answer OPTIONS preflight requests locally."))
    , m_help({QStringLiteral("h"), QStringLiteral("help")},
             QStringLiteral("Display this help."))
    , m_version(QStringLiteral("version"),
                QStringLiteral("Display version information."))
{
    m_parser.setApplicationDescription(QStringLiteral(
        "Sampling proxy: injects temperature/top_p/top_k into API requests.\n\n"
        "Examples:\n"
        "  sampling-proxy -t 0.7\n"
        "  sampling-proxy -t 0.7 -p 0.95 -k 40\n"
        "  sampling-proxy --config ~/.claude/sampling.json\n"
        "  sampling-proxy --config config.json -t 0.5   # CLI overrides file"));
    m_parser.addOptions({m_temperature, m_topP, m_topK, m_config, m_port, m_host,
                         m_upstream, m_timeout, m_logFile, m_verbose, m_cors,
                         m_help, m_version});
}

Result<CommandLineOptions> CommandLine::parse(const QStringList& arguments)
{
    if (!m_parser.parse(arguments))
        return std::unexpected(badArgument(m_parser.errorText()));

    if (!m_parser.positionalArguments().isEmpty()) {
        return std::unexpected(badArgument(
            QStringLiteral("unexpected argument: %1").arg(m_parser.positionalArguments().first())));
    }

    CommandLineOptions options;
    options.showHelp = m_parser.isSet(m_help);
    options.showVersion = m_parser.isSet(m_version);
    if (options.showHelp || options.showVersion)
        return options;

    bool ok = false;
    if (m_parser.isSet(m_temperature)) {
        const double value = m_parser.value(m_temperature).toDouble(&ok);
        if (!ok) {
            return std::unexpected(badArgument(
                QStringLiteral("invalid --temperature value: %1").arg(m_parser.value(m_temperature))));
        }
        options.sampling.temperature = ConfigValue<double>::of(value);
    }
    if (m_parser.isSet(m_topP)) {
        const double value = m_parser.value(m_topP).toDouble(&ok);
        if (!ok) {
            return std::unexpected(badArgument(
                QStringLiteral("invalid --top-p value: %1").arg(m_parser.value(m_topP))));
        }
        options.sampling.topP = ConfigValue<double>::of(value);
    }
    if (m_parser.isSet(m_topK)) {
        const int value = m_parser.value(m_topK).toInt(&ok);
        if (!ok) {
            return std::unexpected(badArgument(
                QStringLiteral("invalid --top-k value: %1").arg(m_parser.value(m_topK))));
        }
        options.sampling.topK = ConfigValue<int>::of(value);
    }

    options.configPath = m_parser.value(m_config);
    options.logFile = m_parser.value(m_logFile);

    const int port = m_parser.value(m_port).toInt(&ok);
    if (!ok || port < 1 || port > 65535) {
        return std::unexpected(badArgument(
            QStringLiteral("invalid --port value: %1").arg(m_parser.value(m_port))));
    }
    options.runtime.proxyPort = port;

    const QString host = m_parser.value(m_host).trimmed();
    if (host.compare(QStringLiteral("localhost"), Qt::CaseInsensitive) != 0
        && QHostAddress(host).isNull()) {
        return std::unexpected(badArgument(
            QStringLiteral("invalid --host address: %1").arg(host)));
    }
    options.runtime.listenHost = host;

    const QUrl upstream(m_parser.value(m_upstream), QUrl::StrictMode);
    const QString scheme = upstream.scheme().toLower();
    if (!upstream.isValid() || upstream.host().isEmpty()
        || (scheme != QStringLiteral("http") && scheme != QStringLiteral("https"))) {
        return std::unexpected(badArgument(
            QStringLiteral("invalid --upstream URL (need http:// or https://): %1")
                .arg(m_parser.value(m_upstream))));
    }
    options.runtime.upstreamUrl = upstream;

    const int timeout = m_parser.value(m_timeout).toInt(&ok);
    if (!ok || timeout < 0) {
        return std::unexpected(badArgument(
            QStringLiteral("invalid --timeout value: %1").arg(m_parser.value(m_timeout))));
    }
    options.runtime.requestTimeout = timeout;

    options.runtime.debugMode = m_parser.isSet(m_verbose);
    options.runtime.answerPreflight = m_parser.isSet(m_cors);
    return options;
}
