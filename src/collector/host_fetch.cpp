#include "collector/host_fetch.hpp"

#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QUrl>

#if QT_CONFIG(ssl)
#include <QSslConfiguration>
#include <QSslSocket>
#endif

#include <nlohmann/json.hpp>

#include "common/logging.hpp"

namespace clusterstat {

HostFetch::HostFetch(QNetworkAccessManager &network,
                     Endpoint endpoint,
                     std::string path,
                     FetchOptions options,
                     QObject *parent)
    : QObject(parent)
    , m_network(network)
    , m_endpoint(std::move(endpoint))
    , m_path(std::move(path))
    , m_options(options)
{
    m_probeTimer.setSingleShot(true);
    connect(&m_probeTimer, &QTimer::timeout, this, &HostFetch::onProbeFailed);
    m_requestTimer.setSingleShot(true);
    connect(&m_requestTimer, &QTimer::timeout, this, &HostFetch::onRequestTimeout);
    connect(&m_probe, &QTcpSocket::connected, this, &HostFetch::onProbeConnected);
    connect(&m_probe, &QTcpSocket::errorOccurred, this,
            [this](QAbstractSocket::SocketError) { onProbeFailed(); });
}

HostFetch::~HostFetch()
{
    m_done = true;
    if (m_reply) {
        m_reply->disconnect(this);
        m_reply->abort();
        m_reply->deleteLater();
    }
}

void HostFetch::start()
{
    CLOG_DEBUG(QStringLiteral("HostFetch"),
               QStringLiteral("start"),
               QStringLiteral("probe_host"),
               QStringLiteral("collect_pass"),
               QStringLiteral("tcp_connect"),
               logging::defaultWho(),
               logging::currentCorrelationId(),
               (nlohmann::json{{"endpoint", m_endpoint.hostnamePort()}}));

    m_probeTimer.start(m_options.probeTimeoutMs);
    m_probe.connectToHost(QString::fromStdString(m_endpoint.host),
                          static_cast<quint16>(m_endpoint.port));
}

void HostFetch::onProbeConnected()
{
    if (m_done || m_reply) {
        return;
    }
    m_probeTimer.stop();
    m_probe.disconnect(this);
    m_probe.abort();
    sendRequest();
}

void HostFetch::onProbeFailed()
{
    // Late socket errors after a successful probe belong to the aborted probe.
    if (m_done || m_reply) {
        return;
    }
    m_probeTimer.stop();
    const std::string reason = m_probe.state() == QAbstractSocket::UnconnectedState
                                   && m_probe.error() != QAbstractSocket::UnknownSocketError
        ? m_probe.errorString().toStdString()
        : std::string("probe timed out");
    m_probe.abort();
    finish(false, {}, "unreachable: " + reason);
}

void HostFetch::sendRequest()
{
    const QString url = QStringLiteral("%1://%2:%3%4")
                            .arg(m_options.useTls ? QStringLiteral("https")
                                                  : QStringLiteral("http"),
                                 QString::fromStdString(m_endpoint.host),
                                 QString::number(m_endpoint.port),
                                 QString::fromStdString(m_path));

    QNetworkRequest request{QUrl(url)};
    request.setTransferTimeout(m_options.requestTimeoutMs);
#if QT_CONFIG(ssl)
    if (m_options.useTls) {
        // Cluster nodes commonly run with self-signed certificates.
        QSslConfiguration ssl = QSslConfiguration::defaultConfiguration();
        ssl.setPeerVerifyMode(QSslSocket::VerifyNone);
        request.setSslConfiguration(ssl);
    }
#endif

    m_reply = m_network.get(request);
    m_requestTimer.start(m_options.requestTimeoutMs);
    connect(m_reply, &QNetworkReply::finished, this, &HostFetch::onReplyFinished);
#if QT_CONFIG(ssl)
    connect(m_reply, &QNetworkReply::sslErrors, m_reply,
            [reply = m_reply.data()](const QList<QSslError> &) { reply->ignoreSslErrors(); });
#endif
}

void HostFetch::onReplyFinished()
{
    QNetworkReply *reply = m_reply.data();
    if (!reply || m_done) {
        return;
    }
    m_requestTimer.stop();
    reply->deleteLater();

    if (reply->error() != QNetworkReply::NoError) {
        const std::string reason = reply->error() == QNetworkReply::OperationCanceledError
            ? std::string("request timed out")
            : reply->errorString().toStdString();
        finish(false, {}, reason);
        return;
    }

    const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    if (status >= 400) {
        finish(false, {}, "http status " + std::to_string(status));
        return;
    }

    finish(true, reply->readAll().toStdString(), {});
}

void HostFetch::onRequestTimeout()
{
    // The transfer timeout only covers idle periods; this bounds the whole request.
    if (m_reply && !m_done) {
        m_reply->abort();
    }
}

void HostFetch::finish(bool ok, std::string body, std::string error)
{
    if (m_done) {
        return;
    }
    m_done = true;

    FetchResult result;
    result.endpoint = m_endpoint;
    result.ok = ok;
    result.body = std::move(body);
    result.error = std::move(error);
    emit finished(result);
}

} // namespace clusterstat
