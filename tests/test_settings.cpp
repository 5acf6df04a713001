#include <QtTest/QtTest>

#include "common/settings.hpp"

class SettingsTests : public QObject
{
    Q_OBJECT
private slots:
    void init();
    void testDefaults();
    void testEnvironmentOverridesDefaults();
    void testCommandLineOverridesEnvironment();
    void testInvalidParallelFallsBackToOne();
    void testTlsFromEnvironment();
};

void SettingsTests::init()
{
    for (const char *name : {"CLUSTERSTAT_HOSTS", "CLUSTERSTAT_PORTS", "CLUSTERSTAT_PARALLEL",
                             "CLUSTERSTAT_SNAPSHOT_ROOT", "CLUSTERSTAT_TIMEOUT_MS",
                             "CLUSTERSTAT_TLS"}) {
        qunsetenv(name);
    }
}

void SettingsTests::testDefaults()
{
    const auto resolution = clusterstat::resolveSettings({});
    QCOMPARE(QString::fromStdString(resolution.settings.hosts),
             QStringLiteral("192.168.66.80,192.168.66.81,192.168.66.82"));
    QCOMPARE(QString::fromStdString(resolution.settings.ports),
             QStringLiteral("7000,9000,12000,13000,9300"));
    QCOMPARE(resolution.settings.parallel, 1);
    QCOMPARE(resolution.settings.requestTimeoutMs, 10000);
    QVERIFY(!resolution.settings.useTls);
    QVERIFY(resolution.changedOptions.empty());
    QVERIFY(resolution.warnings.empty());
}

void SettingsTests::testEnvironmentOverridesDefaults()
{
    qputenv("CLUSTERSTAT_HOSTS", "db1,db2");
    qputenv("CLUSTERSTAT_PARALLEL", "4");
    qputenv("CLUSTERSTAT_TIMEOUT_MS", "2500");

    const auto resolution = clusterstat::resolveSettings({});
    QCOMPARE(QString::fromStdString(resolution.settings.hosts), QStringLiteral("db1,db2"));
    QCOMPARE(resolution.settings.parallel, 4);
    QCOMPARE(resolution.settings.requestTimeoutMs, 2500);
    // Environment values are not command line overrides.
    QVERIFY(resolution.changedOptions.empty());
}

void SettingsTests::testCommandLineOverridesEnvironment()
{
    qputenv("CLUSTERSTAT_HOSTS", "db1,db2");

    clusterstat::SettingsOverrides overrides;
    overrides.hosts = "db9";
    overrides.snapshotRoot = "/tmp/snaps";
    const auto resolution = clusterstat::resolveSettings(overrides);

    QCOMPARE(QString::fromStdString(resolution.settings.hosts), QStringLiteral("db9"));
    QCOMPARE(QString::fromStdString(resolution.settings.snapshotRoot), QStringLiteral("/tmp/snaps"));
    QCOMPARE(resolution.changedOptions.size(), size_t(2));
    QCOMPARE(QString::fromStdString(resolution.changedOptions.at("CLUSTERSTAT_HOSTS")),
             QStringLiteral("db9"));
}

void SettingsTests::testInvalidParallelFallsBackToOne()
{
    clusterstat::SettingsOverrides overrides;
    overrides.parallel = "zero";
    auto resolution = clusterstat::resolveSettings(overrides);
    QCOMPARE(resolution.settings.parallel, 1);
    QCOMPARE(resolution.warnings.size(), size_t(1));

    overrides.parallel = "0";
    resolution = clusterstat::resolveSettings(overrides);
    QCOMPARE(resolution.settings.parallel, 1);
    QCOMPARE(resolution.warnings.size(), size_t(1));
}

void SettingsTests::testTlsFromEnvironment()
{
    qputenv("CLUSTERSTAT_TLS", "1");
    QVERIFY(clusterstat::resolveSettings({}).settings.useTls);
}

QTEST_MAIN(SettingsTests)
#include "test_settings.moc"
