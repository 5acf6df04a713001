#include <QtTest/QtTest>

#include <algorithm>
#include <set>

#include "common/kind_registry.hpp"

class KindRegistryTests : public QObject
{
    Q_OBJECT
private slots:
    void testTwentyDistinctKinds();
    void testKindNamesRoundTrip();
    void testMetricKindsShareColumns();
    void testKeyColumnsAreColumns();
    void testVersionsSchema();
};

void KindRegistryTests::testTwentyDistinctKinds()
{
    const auto &schemas = clusterstat::allKindSchemas();
    QCOMPARE(schemas.size(), size_t(20));

    std::set<std::string> names;
    for (const auto &schema : schemas) {
        QVERIFY(!schema.path.empty());
        QVERIFY(!schema.columns.empty());
        names.insert(schema.name);
    }
    QCOMPARE(names.size(), size_t(20));
}

void KindRegistryTests::testKindNamesRoundTrip()
{
    for (const auto kind : clusterstat::allKinds()) {
        const auto parsed = clusterstat::parseKindString(clusterstat::toKindString(kind));
        QVERIFY(parsed.has_value());
        QVERIFY(*parsed == kind);
    }
    QVERIFY(!clusterstat::parseKindString("no-such-kind").has_value());
    QCOMPARE(QString::fromStdString(clusterstat::toKindString(clusterstat::EndpointKind::TabletServers)),
             QStringLiteral("tablet-servers"));
}

void KindRegistryTests::testMetricKindsShareColumns()
{
    int metricKinds = 0;
    for (const auto &schema : clusterstat::allKindSchemas()) {
        if (schema.shape != clusterstat::RecordShape::Metric) {
            continue;
        }
        ++metricKinds;
        QVERIFY(schema.columns == clusterstat::kMetricColumns);
    }
    QCOMPARE(metricKinds, 3);
}

void KindRegistryTests::testKeyColumnsAreColumns()
{
    for (const auto &schema : clusterstat::allKindSchemas()) {
        for (const auto &key : schema.keyColumns) {
            QVERIFY2(std::find(schema.columns.begin(), schema.columns.end(), key)
                         != schema.columns.end(),
                     schema.name.c_str());
        }
    }
}

void KindRegistryTests::testVersionsSchema()
{
    const auto &schema = clusterstat::schemaFor(clusterstat::EndpointKind::Versions);
    QCOMPARE(QString::fromStdString(schema.path), QStringLiteral("/api/v1/version"));
    QVERIFY(schema.format == clusterstat::PayloadFormat::JsonObject);
    QVERIFY(schema.keyColumns.empty());
    QVERIFY(std::find(schema.columns.begin(), schema.columns.end(), "version_number")
            != schema.columns.end());
}

QTEST_MAIN(KindRegistryTests)
#include "test_kind_registry.moc"
