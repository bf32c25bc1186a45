#include <QTest>
#include <QFile>
#include <QRegularExpression>
#include <QTemporaryDir>
#include "core/log_manager.h"

class TestLogManager : public QObject {
    Q_OBJECT

private slots:
    void cleanup() {
        LogManager::instance().initialize(QString());
        LogManager::instance().setMinimumLevel(LogManager::Info);
    }

    void testFormatMessage() {
        const QString line = LogManager::formatMessage(LogManager::Warning, QStringLiteral("proxy"),
                                                       QStringLiteral("hello"));
        const QRegularExpression pattern(QStringLiteral(
            R"(^\[\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2}\.\d{3}\] \[WARN\] \[proxy\] hello$)"));
        QVERIFY2(pattern.match(line).hasMatch(), qPrintable(line));
    }

    void testMinimumLevel() {
        LogManager& log = LogManager::instance();
        QVERIFY(!log.isEnabled(LogManager::Debug));
        QVERIFY(log.isEnabled(LogManager::Info));
        log.setMinimumLevel(LogManager::Debug);
        QVERIFY(log.isEnabled(LogManager::Debug));
        QCOMPARE(log.minimumLevel(), LogManager::Debug);
    }

    void testWritesToFile() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        const QString path = dir.path() + QStringLiteral("/logs/proxy.log");

        LogManager::instance().initialize(path);
        LOG_INFO(QStringLiteral("Injected temperature: absent -> 0.7"));
        LOG_DEBUG(QStringLiteral("filtered out"));
        LogManager::instance().initialize(QString());

        QFile file(path);
        QVERIFY(file.open(QIODevice::ReadOnly));
        const QByteArray content = file.readAll();
        QVERIFY(content.contains("[INFO] [proxy] Injected temperature: absent -> 0.7"));
        QVERIFY(!content.contains("filtered out"));
    }
};

QTEST_MAIN(TestLogManager)
#include "tst_log_manager.moc"
