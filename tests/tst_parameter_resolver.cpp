#include <QTest>
#include <cmath>
#include <limits>
#include "config/parameter_resolver.h"

class TestParameterResolver : public QObject {
    Q_OBJECT

private slots:
    void testCliOverridesFile() {
        SamplingOverrides cli;
        cli.temperature = ConfigValue<double>::of(0.5);

        SamplingOverrides file;
        file.temperature = ConfigValue<double>::of(0.7);
        file.topK = ConfigValue<int>::of(40);

        const ResolvedConfig r = parameter_resolver::resolve(cli, file);
        QVERIFY(r.temperature.has_value());
        QCOMPARE(*r.temperature, 0.5);
        QVERIFY(!r.topP.has_value());
        QVERIFY(r.topK.has_value());
        QCOMPARE(*r.topK, 40);
    }

    void testFileOnly() {
        SamplingOverrides file;
        file.topP = ConfigValue<double>::of(0.95);

        const ResolvedConfig r = parameter_resolver::resolve(std::nullopt, file);
        QVERIFY(!r.temperature.has_value());
        QVERIFY(r.topP.has_value());
        QCOMPARE(*r.topP, 0.95);
        QVERIFY(!r.topK.has_value());
    }

    void testNullInFileMeansUnset() {
        SamplingOverrides file;
        file.temperature = ConfigValue<double>::null();
        file.topK = ConfigValue<int>::null();

        const ResolvedConfig r = parameter_resolver::resolve(SamplingOverrides{}, file);
        QVERIFY(r.isEmpty());
    }

    void testNullInFileDoesNotMaskCli() {
        SamplingOverrides cli;
        cli.topK = ConfigValue<int>::of(10);
        SamplingOverrides file;
        file.topK = ConfigValue<int>::null();

        const ResolvedConfig r = parameter_resolver::resolve(cli, file);
        QCOMPARE(r.topK.value_or(-1), 10);
    }

    void testNothingGiven() {
        const ResolvedConfig r = parameter_resolver::resolve(std::nullopt, std::nullopt);
        QVERIFY(r.isEmpty());
        QCOMPARE(r.describe(), QStringLiteral("temperature=unset, top_p=unset, top_k=unset"));
    }

    void testDescribe() {
        ResolvedConfig r;
        r.temperature = 0.7;
        r.topK = 40;
        QCOMPARE(r.describe(), QStringLiteral("temperature=0.7, top_p=unset, top_k=40"));
    }

    void testValidateAcceptsBounds() {
        ResolvedConfig r;
        r.temperature = 0.0;
        r.topP = 1.0;
        r.topK = 1;
        QVERIFY(parameter_resolver::validateSamplingDomain(r).has_value());

        r.temperature = 1.0;
        r.topP = 0.0;
        r.topK = 500;
        QVERIFY(parameter_resolver::validateSamplingDomain(r).has_value());

        QVERIFY(parameter_resolver::validateSamplingDomain(ResolvedConfig{}).has_value());
    }

    void testValidateRejectsTemperature() {
        ResolvedConfig r;
        r.temperature = 1.5;
        auto result = parameter_resolver::validateSamplingDomain(r);
        QVERIFY(!result.has_value());
        QCOMPARE(result.error().kind, ErrorKind::StartupConfig);
        QCOMPARE(result.error().code, QStringLiteral("temperature_out_of_range"));
    }

    void testValidateRejectsTopP() {
        ResolvedConfig r;
        r.topP = -0.1;
        auto result = parameter_resolver::validateSamplingDomain(r);
        QVERIFY(!result.has_value());
        QCOMPARE(result.error().code, QStringLiteral("top_p_out_of_range"));
    }

    void testValidateRejectsTopK() {
        ResolvedConfig r;
        r.topK = 0;
        auto result = parameter_resolver::validateSamplingDomain(r);
        QVERIFY(!result.has_value());
        QCOMPARE(result.error().code, QStringLiteral("top_k_out_of_range"));
    }

    void testValidateRejectsNaN() {
        ResolvedConfig r;
        r.temperature = std::numeric_limits<double>::quiet_NaN();
        QVERIFY(!parameter_resolver::validateSamplingDomain(r).has_value());
    }
};

QTEST_MAIN(TestParameterResolver)
#include "tst_parameter_resolver.moc"
