#include <QtTest/QtTest>

#include <QDir>
#include <QTemporaryDir>

#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/clusterstat_version.hpp"
#include "report/StatsCli.hpp"
#include "store/snapshot_store.hpp"

using clusterstat::StatsCli;

namespace {

int runCli(StatsCli &cli, std::vector<std::string> args)
{
    args.insert(args.begin(), "clusterstat");
    std::vector<char *> argv;
    argv.reserve(args.size());
    for (auto &arg : args) {
        argv.push_back(arg.data());
    }
    return cli.run(static_cast<int>(argv.size()), argv.data());
}

} // namespace

class StatsCliTests : public QObject
{
    Q_OBJECT
private slots:
    void init();
    void cleanup();
    void testVersion();
    void testUsageError();
    void testListEmpty();
    void testUnknownKind();
    void testInvalidFormat();
    void testInvalidRegex();
    void testDiffRejectsReversedRange();
    void testDiffMissingSnapshot();
    void testSnapshotListAndDiff();
    void testPrintStoredSnapshot();
    void testAdhocDiffWaitsForOperator();
    void testHostnameFilterMatchingNothing();

private:
    std::unique_ptr<QTemporaryDir> m_tempDir;
    std::string root() const
    {
        return (m_tempDir->path() + QStringLiteral("/snapshots")).toStdString();
    }
};

void StatsCliTests::init()
{
    m_tempDir = std::make_unique<QTemporaryDir>();
    QVERIFY(m_tempDir->isValid());
    qputenv("CLUSTERSTAT_LOG_DIR", m_tempDir->path().toUtf8());
    qunsetenv("CLUSTERSTAT_HOSTS");
    qunsetenv("CLUSTERSTAT_PORTS");
    qunsetenv("CLUSTERSTAT_PARALLEL");
    qunsetenv("CLUSTERSTAT_SNAPSHOT_ROOT");
    qunsetenv("CLUSTERSTAT_TIMEOUT_MS");
    qunsetenv("CLUSTERSTAT_TLS");
}

void StatsCliTests::cleanup()
{
    m_tempDir.reset();
}

void StatsCliTests::testVersion()
{
    std::ostringstream out;
    std::ostringstream err;
    StatsCli cli(out, err);
    QCOMPARE(runCli(cli, {"version"}), 0);
    QCOMPARE(QString::fromStdString(out.str()),
             QStringLiteral("clusterstat %1\n").arg(QString::fromUtf8(CLUSTERSTAT_VERSION)));
}

void StatsCliTests::testUsageError()
{
    std::ostringstream out;
    std::ostringstream err;
    StatsCli cli(out, err);
    QCOMPARE(runCli(cli, {}), 1);
    QVERIFY(err.str().find("Usage:") != std::string::npos);

    std::ostringstream err2;
    StatsCli other(out, err2);
    QCOMPARE(runCli(other, {"frobnicate", "--snapshot-root", root()}), 1);
    QVERIFY(err2.str().find("Usage:") != std::string::npos);
}

void StatsCliTests::testListEmpty()
{
    std::ostringstream out;
    std::ostringstream err;
    StatsCli cli(out, err);
    QCOMPARE(runCli(cli, {"list", "--snapshot-root", root()}), 0);
    QCOMPARE(QString::fromStdString(out.str()), QStringLiteral("No snapshots.\n"));
}

void StatsCliTests::testUnknownKind()
{
    std::ostringstream out;
    std::ostringstream err;
    StatsCli cli(out, err);
    QCOMPARE(runCli(cli, {"diff", "--begin", "1", "--end", "2", "--kinds", "metrics,bogus",
                          "--snapshot-root", root()}),
             1);
    QVERIFY(err.str().find("Unknown kind: bogus") != std::string::npos);

    std::ostringstream printErr;
    StatsCli printer(out, printErr);
    QCOMPARE(runCli(printer, {"print", "bogus", "--snapshot", "1", "--snapshot-root", root()}), 1);
    QVERIFY(printErr.str().find("Unknown kind: bogus") != std::string::npos);
}

void StatsCliTests::testInvalidFormat()
{
    std::ostringstream out;
    std::ostringstream err;
    StatsCli cli(out, err);
    QCOMPARE(runCli(cli, {"list", "--format", "xml", "--snapshot-root", root()}), 1);
    QVERIFY(err.str().find("Invalid format. Use table or json.") != std::string::npos);
}

void StatsCliTests::testInvalidRegex()
{
    std::ostringstream out;
    std::ostringstream err;
    StatsCli cli(out, err);
    QCOMPARE(runCli(cli, {"list", "--stat-name-match", "(unclosed", "--snapshot-root", root()}), 1);
    QVERIFY(err.str().find("Invalid regular expression") != std::string::npos);
}

void StatsCliTests::testDiffRejectsReversedRange()
{
    clusterstat::SnapshotStore store(root());
    store.beginSnapshot("one");
    store.beginSnapshot("two");

    std::ostringstream out;
    std::ostringstream err;
    StatsCli cli(out, err);
    QCOMPARE(runCli(cli, {"diff", "--begin", "2", "--end", "1", "--snapshot-root", root()}), 1);
    QVERIFY(err.str().rfind("Fatal: ", 0) == 0);
    QVERIFY(out.str().empty());
}

void StatsCliTests::testDiffMissingSnapshot()
{
    clusterstat::SnapshotStore store(root());
    store.beginSnapshot("one");

    std::ostringstream out;
    std::ostringstream err;
    StatsCli cli(out, err);
    QCOMPARE(runCli(cli, {"diff", "--begin", "1", "--end", "9", "--snapshot-root", root()}), 1);
    QVERIFY(err.str().rfind("Fatal: ", 0) == 0);
}

void StatsCliTests::testSnapshotListAndDiff()
{
    const std::vector<std::string> capture = {"--kinds", "versions", "--hosts", "127.0.0.1",
                                              "--ports", "7000", "--silent",
                                              "--snapshot-root", root()};

    std::ostringstream out;
    std::ostringstream err;
    StatsCli cli(out, err);

    std::vector<std::string> first = {"snapshot", "--comment", "before"};
    first.insert(first.end(), capture.begin(), capture.end());
    QCOMPARE(runCli(cli, first), 0);
    QVERIFY(out.str().rfind("Snapshot 1 created at ", 0) == 0);

    std::vector<std::string> second = {"snapshot", "--comment", "after"};
    second.insert(second.end(), capture.begin(), capture.end());
    QCOMPARE(runCli(cli, second), 0);

    clusterstat::SnapshotStore store(root());
    const auto loaded = store.load(1, clusterstat::EndpointKind::Versions);
    QCOMPARE(loaded.records.size(), size_t(1));
    QCOMPARE(QString::fromStdString(loaded.records.front().hostnamePort),
             QStringLiteral("127.0.0.1:7000"));
    // Only the requested kind was captured.
    QCOMPARE(store.availableKinds(1).size(), size_t(1));

    std::ostringstream listed;
    StatsCli lister(listed, err);
    QCOMPARE(runCli(lister, {"list", "--format", "json", "--snapshot-root", root()}), 0);
    const auto catalog = nlohmann::json::parse(listed.str());
    QCOMPARE(catalog["snapshots"].size(), size_t(2));
    QCOMPARE(catalog["snapshots"][0]["comment"].get<std::string>(), std::string("before"));

    std::ostringstream diffed;
    StatsCli differ(diffed, err);
    QCOMPARE(runCli(differ, {"diff", "--begin", "1", "--end", "2", "--format", "json",
                             "--snapshot-root", root()}),
             0);
    const auto report = nlohmann::json::parse(diffed.str());
    QCOMPARE(report["diffs"].size(), size_t(1));
    QCOMPARE(report["diffs"][0]["kind"].get<std::string>(), std::string("versions"));
    // Identical captures of the same host.
    QVERIFY(report["diffs"][0]["rows"].empty());
}

void StatsCliTests::testPrintStoredSnapshot()
{
    clusterstat::SnapshotStore store(root());
    const auto entry = store.beginSnapshot("");

    clusterstat::RecordSet set;
    set.kind = clusterstat::EndpointKind::Gflags;
    set.timestamp = entry.timestamp;
    clusterstat::StoredRecord record;
    record.hostnamePort = "yb-1:7000";
    record.timestamp = entry.timestamp;
    record.fields = {{"name", "--max_log_size"}, {"value", "256"}};
    set.records.push_back(record);
    record.fields = {{"name", "--v"}, {"value", "0"}};
    set.records.push_back(record);
    store.writeKind(entry.number, set);

    std::ostringstream out;
    std::ostringstream err;
    StatsCli cli(out, err);
    QCOMPARE(runCli(cli, {"print", "gflags", "--snapshot", "1", "--stat-name-match", "log",
                          "--snapshot-root", root()}),
             0);
    QVERIFY(out.str().find("--max_log_size") != std::string::npos);
    QVERIFY(out.str().find("--v ") == std::string::npos);

    std::ostringstream missing;
    StatsCli other(out, missing);
    QCOMPARE(runCli(other, {"print", "versions", "--snapshot", "1", "--snapshot-root", root()}), 1);
    QVERIFY(missing.str().rfind("Fatal: ", 0) == 0);
}

void StatsCliTests::testAdhocDiffWaitsForOperator()
{
    int waits = 0;
    std::ostringstream out;
    std::ostringstream err;
    StatsCli cli(out, err, [&waits]() { ++waits; });

    QCOMPARE(runCli(cli, {"adhoc-diff", "--kinds", "versions", "--hosts", "127.0.0.1",
                          "--ports", "7000", "--silent", "--snapshot-root", root()}),
             0);
    QCOMPARE(waits, 1);
    QVERIFY(out.str().rfind("== versions: ", 0) == 0);
    // Nothing is stored by an adhoc diff.
    QVERIFY(!QDir(QString::fromStdString(root())).exists());
}

void StatsCliTests::testHostnameFilterMatchingNothing()
{
    std::ostringstream out;
    std::ostringstream err;
    StatsCli cli(out, err);
    QCOMPARE(runCli(cli, {"print", "versions", "--hosts", "127.0.0.1", "--ports", "7000",
                          "--hostname-match", "^nowhere$", "--snapshot-root", root()}),
             0);
    QVERIFY(out.str().find("No records.") != std::string::npos);
    QVERIFY(err.str().empty());
}

QTEST_MAIN(StatsCliTests)
#include "test_stats_cli.moc"
