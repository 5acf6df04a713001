#include <QtTest/QtTest>

#include <QRegularExpression>
#include <QSet>
#include <QTcpServer>
#include <QTcpSocket>
#include <QTemporaryDir>
#include <QTimer>

#include <algorithm>
#include <map>

#include "collector/collector.hpp"

using clusterstat::Collector;
using clusterstat::CollectorOptions;
using clusterstat::Endpoint;
using clusterstat::EndpointKind;

namespace {

struct CannedResponse {
    int status = 200;
    QByteArray body;
    // Accept the request but never answer it.
    bool hang = false;
    // Hold the answer back this long.
    int delayMs = 0;
};

// Minimal HTTP/1.1 responder keyed by request path.
class CannedHttpServer : public QObject
{
    Q_OBJECT
public:
    explicit CannedHttpServer(QObject *parent = nullptr)
        : QObject(parent)
    {
        connect(&m_server, &QTcpServer::newConnection, this, &CannedHttpServer::onNewConnection);
    }

    bool listen() { return m_server.listen(QHostAddress::LocalHost); }
    int port() const { return m_server.serverPort(); }

    void setResponse(const QByteArray &path, CannedResponse response)
    {
        m_responses[path] = std::move(response);
    }

    int requestCount() const { return m_requests; }

    // Most requests that were received and not yet answered at one time.
    int peakOutstanding() const { return m_peakOutstanding; }
    void resetPeakOutstanding() { m_peakOutstanding = 0; }

private slots:
    void onNewConnection()
    {
        while (QTcpSocket *socket = m_server.nextPendingConnection()) {
            connect(socket, &QTcpSocket::readyRead, this, [this, socket]() { onReadyRead(socket); });
            connect(socket, &QTcpSocket::disconnected, this,
                    [this, socket]() { m_outstanding.remove(socket); });
            connect(socket, &QTcpSocket::disconnected, socket, &QObject::deleteLater);
        }
    }

private:
    void onReadyRead(QTcpSocket *socket)
    {
        QByteArray &buffer = m_buffers[socket];
        buffer += socket->readAll();
        if (!buffer.contains("\r\n\r\n")) {
            return;
        }
        ++m_requests;
        m_outstanding.insert(socket);
        m_peakOutstanding = std::max(m_peakOutstanding, int(m_outstanding.size()));

        const QList<QByteArray> requestLine = buffer.left(buffer.indexOf("\r\n")).split(' ');
        const QByteArray path = requestLine.size() > 1 ? requestLine.at(1) : QByteArray();
        m_buffers.remove(socket);

        const auto it = m_responses.find(path);
        const CannedResponse response = it != m_responses.end()
            ? it->second
            : CannedResponse{404, QByteArray("not found"), false};
        if (response.hang) {
            return;
        }
        if (response.delayMs > 0) {
            QTimer::singleShot(response.delayMs, socket,
                               [this, socket, response]() { writeResponse(socket, response); });
            return;
        }
        writeResponse(socket, response);
    }

    void writeResponse(QTcpSocket *socket, const CannedResponse &response)
    {
        m_outstanding.remove(socket);
        QByteArray reply = "HTTP/1.1 " + QByteArray::number(response.status)
            + (response.status == 200 ? " OK" : " Error") + "\r\n";
        reply += "Content-Length: " + QByteArray::number(response.body.size()) + "\r\n";
        reply += "Connection: close\r\n\r\n";
        reply += response.body;
        socket->write(reply);
        socket->disconnectFromHost();
    }

    QTcpServer m_server;
    std::map<QByteArray, CannedResponse> m_responses;
    QHash<QTcpSocket *, QByteArray> m_buffers;
    QSet<QTcpSocket *> m_outstanding;
    int m_requests = 0;
    int m_peakOutstanding = 0;
};

const clusterstat::StoredRecord *recordFor(const clusterstat::RecordSet &set,
                                           const std::string &hostnamePort)
{
    for (const auto &record : set.records) {
        if (record.hostnamePort == hostnamePort) {
            return &record;
        }
    }
    return nullptr;
}

} // namespace

class CollectorTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void testVersionsEndToEnd();
    void testUnreachableHostYieldsSyntheticRecord();
    void testUnparsablePayloadYieldsSyntheticRecord();
    void testHttpErrorYieldsSyntheticRecord();
    void testRequestTimeout();
    void testParallelPassSharesTimestamp();
    void testInFlightFetchesBoundedByParallel();
    void testEmptyWorkList();
    void testDuplicateKeysDropped();

private:
    QTemporaryDir m_tempDir;
    CannedHttpServer m_http;

    CollectorOptions options(int parallel = 1) const;
    Endpoint local() const;
};

void CollectorTests::initTestCase()
{
    QVERIFY(m_tempDir.isValid());
    qputenv("CLUSTERSTAT_LOG_DIR", m_tempDir.path().toUtf8());
    QVERIFY(m_http.listen());

    m_http.setResponse("/api/v1/version",
                       {200, R"({"git_hash":"abc","version_number":"2.11.2.0","build_number":"89"})"});
    m_http.setResponse("/api/v1/masters", {200, "<html>this is not json</html>"});
    m_http.setResponse("/api/v1/varz", {500, "boom"});
    m_http.setResponse("/api/v1/cluster-config", {200, {}, true});
    m_http.setResponse("/varz?raw", {200, "--v=0\n--enable_ysql=true\n", false, 150});
}

CollectorOptions CollectorTests::options(int parallel) const
{
    CollectorOptions options;
    options.parallel = parallel;
    options.fetch.probeTimeoutMs = 1000;
    options.fetch.requestTimeoutMs = 2000;
    return options;
}

Endpoint CollectorTests::local() const
{
    return Endpoint{"127.0.0.1", m_http.port()};
}

void CollectorTests::testVersionsEndToEnd()
{
    Collector collector(options());
    const auto set = collector.collect(EndpointKind::Versions, {local()});

    QVERIFY(set.kind == EndpointKind::Versions);
    QCOMPARE(set.records.size(), size_t(1));
    const auto &record = set.records.front();
    QCOMPARE(QString::fromStdString(record.hostnamePort),
             QStringLiteral("127.0.0.1:%1").arg(m_http.port()));
    QVERIFY(!record.synthetic);
    QCOMPARE(QString::fromStdString(clusterstat::fieldValue(record, "version_number")),
             QStringLiteral("2.11.2.0"));
    QCOMPARE(QString::fromStdString(clusterstat::fieldValue(record, "build_number")),
             QStringLiteral("89"));
    QCOMPARE(QString::fromStdString(clusterstat::fieldValue(record, "git_hash")),
             QStringLiteral("abc"));
    QVERIFY(record.timestamp == set.timestamp);
}

void CollectorTests::testUnreachableHostYieldsSyntheticRecord()
{
    QTest::ignoreMessage(QtWarningMsg, QRegularExpression(QStringLiteral("^versions: 127\\.0\\.0\\.1:1: unreachable")));

    Collector collector(options());
    const auto set = collector.collect(EndpointKind::Versions, {Endpoint{"127.0.0.1", 1}});

    QCOMPARE(set.records.size(), size_t(1));
    const auto &record = set.records.front();
    QVERIFY(record.synthetic);
    QCOMPARE(QString::fromStdString(record.hostnamePort), QStringLiteral("127.0.0.1:1"));
    QVERIFY(record.fields.empty());
    QCOMPARE(QString::fromStdString(clusterstat::fieldValue(record, "version_number")), QString());
}

void CollectorTests::testUnparsablePayloadYieldsSyntheticRecord()
{
    CollectorOptions silent = options();
    silent.silent = true;
    Collector collector(silent);
    const auto set = collector.collect(EndpointKind::Masters, {local()});

    QCOMPARE(set.records.size(), size_t(1));
    QVERIFY(set.records.front().synthetic);
}

void CollectorTests::testHttpErrorYieldsSyntheticRecord()
{
    CollectorOptions silent = options();
    silent.silent = true;
    Collector collector(silent);
    const auto set = collector.collect(EndpointKind::Vars, {local()});

    QCOMPARE(set.records.size(), size_t(1));
    QVERIFY(set.records.front().synthetic);
}

void CollectorTests::testRequestTimeout()
{
    CollectorOptions quick = options();
    quick.silent = true;
    quick.fetch.requestTimeoutMs = 300;
    Collector collector(quick);

    QElapsedTimer timer;
    timer.start();
    const auto set = collector.collect(EndpointKind::ClusterConfig, {local()});

    QCOMPARE(set.records.size(), size_t(1));
    QVERIFY(set.records.front().synthetic);
    QVERIFY(timer.elapsed() < 5000);
}

void CollectorTests::testParallelPassSharesTimestamp()
{
    CollectorOptions parallel = options(2);
    parallel.silent = true;
    Collector collector(parallel);

    const std::vector<Endpoint> workList = {local(), Endpoint{"127.0.0.1", 1}, local()};
    const int requestsBefore = m_http.requestCount();
    const auto set = collector.collect(EndpointKind::Versions, workList);

    QCOMPARE(set.records.size(), size_t(3));
    QCOMPARE(m_http.requestCount() - requestsBefore, 2);
    for (const auto &record : set.records) {
        QVERIFY(record.timestamp == set.timestamp);
    }

    const auto *unreachable = recordFor(set, "127.0.0.1:1");
    QVERIFY(unreachable);
    QVERIFY(unreachable->synthetic);
    const auto reachable = std::count_if(set.records.begin(), set.records.end(),
                                         [](const auto &record) { return !record.synthetic; });
    QCOMPARE(int(reachable), 2);
}

void CollectorTests::testInFlightFetchesBoundedByParallel()
{
    const std::vector<Endpoint> workList(5, local());

    for (const int parallel : {1, 2}) {
        m_http.resetPeakOutstanding();
        const int requestsBefore = m_http.requestCount();

        Collector collector(options(parallel));
        const auto set = collector.collect(EndpointKind::Gflags, workList);

        QCOMPARE(m_http.requestCount() - requestsBefore, 5);
        QVERIFY(std::none_of(set.records.begin(), set.records.end(),
                             [](const auto &record) { return record.synthetic; }));
        QVERIFY2(m_http.peakOutstanding() <= parallel,
                 qPrintable(QStringLiteral("parallel %1, peak %2")
                                .arg(parallel)
                                .arg(m_http.peakOutstanding())));
        // Answers are held back long enough for the gate to fill up.
        QCOMPARE(m_http.peakOutstanding(), parallel);
    }
}

void CollectorTests::testEmptyWorkList()
{
    Collector collector(options());
    const auto set = collector.collect(EndpointKind::Metrics, {});
    QVERIFY(set.records.empty());
}

void CollectorTests::testDuplicateKeysDropped()
{
    const auto &schema = clusterstat::schemaFor(EndpointKind::Vars);
    const std::vector<clusterstat::PayloadRow> rows = {
        {{"name", "a"}, {"value", "1"}},
        {{"name", "b"}, {"value", "2"}},
        {{"name", "a"}, {"value", "3"}},
    };
    const auto records = clusterstat::toStoredRecords(schema, "h:7000",
                                                      std::chrono::system_clock::now(), rows);
    QCOMPARE(records.size(), size_t(2));
    QCOMPARE(QString::fromStdString(clusterstat::fieldValue(records[0], "value")), QStringLiteral("1"));
    QCOMPARE(QString::fromStdString(clusterstat::fieldValue(records[1], "type")), QString());
}

QTEST_MAIN(CollectorTests)
#include "test_collector.moc"
