#pragma once

#include <string>

#include <QObject>
#include <QPointer>
#include <QTcpSocket>
#include <QTimer>

#include "common/models.hpp"

class QNetworkAccessManager;
class QNetworkReply;

namespace clusterstat {

struct FetchResult {
    Endpoint endpoint;
    bool ok = false;
    std::string body;
    // Why the host did not answer; empty when ok.
    std::string error;
};

struct FetchOptions {
    int probeTimeoutMs = 1000;
    int requestTimeoutMs = 10000;
    bool useTls = false;
};

/**
 * HostFetch retrieves one endpoint path from one host: a TCP probe bounded
 * by the probe timeout, then a GET bounded by the request timeout.
 * finished() is emitted exactly once.
 */
class HostFetch : public QObject
{
    Q_OBJECT
public:
    HostFetch(QNetworkAccessManager &network,
              Endpoint endpoint,
              std::string path,
              FetchOptions options,
              QObject *parent = nullptr);
    ~HostFetch() override;

    void start();

    const Endpoint &endpoint() const { return m_endpoint; }

signals:
    void finished(const clusterstat::FetchResult &result);

private slots:
    void onProbeConnected();
    void onProbeFailed();
    void onReplyFinished();
    void onRequestTimeout();

private:
    void sendRequest();
    void finish(bool ok, std::string body, std::string error);

    QNetworkAccessManager &m_network;
    Endpoint m_endpoint;
    std::string m_path;
    FetchOptions m_options;
    QTcpSocket m_probe;
    QTimer m_probeTimer;
    QTimer m_requestTimer;
    QPointer<QNetworkReply> m_reply;
    bool m_done = false;
};

} // namespace clusterstat
