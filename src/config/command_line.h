#pragma once
#include "config_types.h"
#include "semantic/ports.h"
#include <QCommandLineParser>
#include <QStringList>

struct CommandLineOptions {
    SamplingOverrides sampling;    // only Unmentioned or Value
    QString configPath;
    RuntimeOptions runtime;
    QString logFile;
    bool showHelp = false;
    bool showVersion = false;
};

class CommandLine {
public:
    CommandLine();

    // arguments[0] is the program name, as in QCoreApplication::arguments().
    Result<CommandLineOptions> parse(const QStringList& arguments);
    QString helpText() const { return m_parser.helpText(); }

private:
    QCommandLineParser m_parser;
    QCommandLineOption m_temperature;
    QCommandLineOption m_topP;
    QCommandLineOption m_topK;
    QCommandLineOption m_config;
    QCommandLineOption m_port;
    QCommandLineOption m_host;
    QCommandLineOption m_upstream;
    QCommandLineOption m_timeout;
    QCommandLineOption m_logFile;
    QCommandLineOption m_verbose;
    QCommandLineOption m_cors;
    QCommandLineOption m_help;
    QCommandLineOption m_version;
};
