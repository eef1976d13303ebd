#include "BackendProbe.hpp"

#include <QLoggingCategory>
#include <QNetworkProxy>
#include <QNetworkRequest>

#include <utility>

Q_LOGGING_CATEGORY(lcBackendProbe, "horus.shell.backend.probe")

BackendProbe::BackendProbe(QObject* parent)
    : QObject(parent)
    , m_endpoint(endpointFor(QStringLiteral("127.0.0.1"), 5000, QStringLiteral("/api/market/price/BTC")))
{
    // The backend only ever listens on loopback.
    m_network.setProxy(QNetworkProxy::NoProxy);
}

BackendProbe::~BackendProbe()
{
    const auto pending = m_network.findChildren<QNetworkReply*>();
    for (QNetworkReply* reply : pending) {
        disconnect(reply, nullptr, this, nullptr);
        reply->abort();
    }
}

void BackendProbe::setEndpoint(const QUrl& url)
{
    if (!url.isValid()) {
        qCWarning(lcBackendProbe) << "Ignoring invalid probe endpoint" << url;
        return;
    }
    m_endpoint = url;
}

void BackendProbe::setTimeoutMs(int timeoutMs)
{
    m_timeoutMs = qMax(100, timeoutMs);
}

void BackendProbe::probe(Callback done)
{
    QNetworkRequest request(m_endpoint);
    request.setTransferTimeout(m_timeoutMs);
    request.setAttribute(QNetworkRequest::RedirectPolicyAttribute, QNetworkRequest::ManualRedirectPolicy);
    request.setAttribute(QNetworkRequest::CacheLoadControlAttribute, QNetworkRequest::AlwaysNetwork);
    request.setRawHeader(QByteArrayLiteral("Accept"), QByteArrayLiteral("application/json"));

    QNetworkReply* reply = m_network.get(request);
    const QUrl target = m_endpoint;
    connect(reply, &QNetworkReply::finished, this, [reply, target, done = std::move(done)]() {
        reply->deleteLater();
        const BackendProbeResult result = classify(reply->error(),
                                                   reply->attribute(QNetworkRequest::HttpStatusCodeAttribute),
                                                   reply->errorString());
        switch (result.outcome) {
        case BackendProbeResult::Outcome::Reachable:
            qCDebug(lcBackendProbe) << "Probe" << target << "answered with HTTP" << result.httpStatus;
            break;
        case BackendProbeResult::Outcome::Unreachable:
            qCDebug(lcBackendProbe) << "Probe" << target << "unreachable:" << result.detail;
            break;
        case BackendProbeResult::Outcome::Ambiguous:
            qCWarning(lcBackendProbe) << "Probe" << target << "returned an ambiguous answer:" << result.detail;
            break;
        }
        if (done)
            done(result);
    });
}

QUrl BackendProbe::endpointFor(const QString& host, int port, const QString& path)
{
    QUrl url;
    url.setScheme(QStringLiteral("http"));
    url.setHost(host.trimmed().isEmpty() ? QStringLiteral("127.0.0.1") : host.trimmed());
    url.setPort(port);
    QString normalizedPath = path.trimmed();
    if (!normalizedPath.startsWith(QLatin1Char('/')))
        normalizedPath.prepend(QLatin1Char('/'));
    url.setPath(normalizedPath);
    return url;
}

BackendProbeResult BackendProbe::classify(QNetworkReply::NetworkError error,
                                          const QVariant& httpStatus,
                                          const QString& errorString)
{
    BackendProbeResult result;

    // Any status line proves a server is listening, including 404 for a route it does not know yet.
    bool hasStatus = false;
    const int status = httpStatus.toInt(&hasStatus);
    if (httpStatus.isValid() && hasStatus && status > 0) {
        result.outcome = BackendProbeResult::Outcome::Reachable;
        result.httpStatus = status;
        return result;
    }

    result.detail = errorString;
    switch (error) {
    case QNetworkReply::ConnectionRefusedError:
    case QNetworkReply::RemoteHostClosedError:
    case QNetworkReply::HostNotFoundError:
    case QNetworkReply::TimeoutError:
    case QNetworkReply::OperationCanceledError:
    case QNetworkReply::TemporaryNetworkFailureError:
    case QNetworkReply::NetworkSessionFailedError:
    case QNetworkReply::ProxyConnectionRefusedError:
    case QNetworkReply::ProxyNotFoundError:
    case QNetworkReply::ProxyTimeoutError:
        result.outcome = BackendProbeResult::Outcome::Unreachable;
        break;
    default:
        result.outcome = BackendProbeResult::Outcome::Ambiguous;
        if (result.detail.isEmpty())
            result.detail = QStringLiteral("network error %1").arg(static_cast<int>(error));
        break;
    }
    return result;
}

QString backendProbeOutcomeName(BackendProbeResult::Outcome outcome)
{
    switch (outcome) {
    case BackendProbeResult::Outcome::Reachable:
        return QStringLiteral("reachable");
    case BackendProbeResult::Outcome::Unreachable:
        return QStringLiteral("unreachable");
    case BackendProbeResult::Outcome::Ambiguous:
        return QStringLiteral("ambiguous");
    }
    return QStringLiteral("ambiguous");
}
