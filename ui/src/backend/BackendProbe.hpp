#pragma once

#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QObject>
#include <QString>
#include <QUrl>
#include <QVariant>

#include <functional>

struct BackendProbeResult {
    enum class Outcome {
        Reachable,
        Unreachable,
        Ambiguous,
    };

    Outcome outcome = Outcome::Unreachable;
    int     httpStatus = 0;
    QString detail;

    bool reachable() const { return outcome == Outcome::Reachable; }
};

class BackendProbeInterface {
public:
    using Callback = std::function<void(const BackendProbeResult&)>;

    virtual ~BackendProbeInterface() = default;

    virtual void setEndpoint(const QUrl& url) = 0;
    virtual void setTimeoutMs(int timeoutMs) = 0;

    //! Issues one liveness request; the callback runs on the caller's event loop.
    virtual void probe(Callback done) = 0;
};

class BackendProbe final : public QObject, public BackendProbeInterface {
    Q_OBJECT

public:
    explicit BackendProbe(QObject* parent = nullptr);
    ~BackendProbe() override;

    void setEndpoint(const QUrl& url) override;
    void setTimeoutMs(int timeoutMs) override;
    void probe(Callback done) override;

    QUrl endpoint() const { return m_endpoint; }
    int timeoutMs() const { return m_timeoutMs; }

    static QUrl endpointFor(const QString& host, int port, const QString& path);
    static BackendProbeResult classify(QNetworkReply::NetworkError error,
                                       const QVariant& httpStatus,
                                       const QString& errorString = QString());

private:
    QNetworkAccessManager m_network;
    QUrl                  m_endpoint;
    int                   m_timeoutMs = 2000;
};

QString backendProbeOutcomeName(BackendProbeResult::Outcome outcome);
