#pragma once

#include <QObject>
#include <QPointer>
#include <QString>
#include <QStringList>
#include <QVariantMap>
#include <QtGlobal>

#include <functional>
#include <map>

#include "backend/BackendTypes.hpp"

class BackendSupervisor;
class BackendStatusController;

//! Move-only registration of a status listener; detaches on unsubscribe() or destruction.
class BackendSubscription {
public:
    BackendSubscription() = default;
    BackendSubscription(BackendStatusController* controller, quint64 id);
    ~BackendSubscription();

    BackendSubscription(BackendSubscription&& other) noexcept;
    BackendSubscription& operator=(BackendSubscription&& other) noexcept;
    BackendSubscription(const BackendSubscription&) = delete;
    BackendSubscription& operator=(const BackendSubscription&) = delete;

    bool isActive() const;
    void unsubscribe();

private:
    QPointer<BackendStatusController> m_controller;
    quint64                           m_id = 0;
};

class BackendStatusController : public QObject {
    Q_OBJECT
    Q_PROPERTY(QString status READ status NOTIFY statusChanged)
    Q_PROPERTY(QString message READ message NOTIFY statusChanged)
    Q_PROPERTY(qint64 timestamp READ timestamp NOTIFY statusChanged)
    Q_PROPERTY(QString errorKind READ errorKind NOTIFY statusChanged)
    Q_PROPERTY(bool busy READ busy NOTIFY statusChanged)
    Q_PROPERTY(bool canStart READ canStart NOTIFY statusChanged)
    Q_PROPERTY(bool canStop READ canStop NOTIFY canStopChanged)
    Q_PROPERTY(QVariantMap lastEvent READ lastEvent NOTIFY statusChanged)
    Q_PROPERTY(QStringList outputTail READ outputTail NOTIFY outputTailChanged)

public:
    using Listener = std::function<void(const BackendStatusEvent&)>;

    explicit BackendStatusController(BackendSupervisor* supervisor, QObject* parent = nullptr);
    ~BackendStatusController() override;

    QString status() const;
    QString message() const { return m_event.message(); }
    qint64 timestamp() const { return m_event.timestampMs(); }
    QString errorKind() const;
    bool busy() const;
    bool canStart() const;
    bool canStop() const { return m_canStop; }
    QVariantMap lastEvent() const { return m_event.toVariantMap(); }
    QStringList outputTail() const { return m_outputTail; }
    BackendStatusEvent currentEvent() const { return m_event; }

    Q_INVOKABLE void check();
    Q_INVOKABLE void start();
    Q_INVOKABLE void stop();

    //! Listener runs on the controller's thread for every event, in emission order.
    [[nodiscard]] BackendSubscription subscribe(Listener listener);
    //! Listener runs on context's thread; the registration ends with context as well.
    [[nodiscard]] BackendSubscription subscribe(QObject* context, Listener listener);

    int subscriberCount() const { return static_cast<int>(m_listeners.size()); }

signals:
    void statusChanged();
    void canStopChanged();
    void outputTailChanged();

private:
    friend class BackendSubscription;

    struct Registration {
        QPointer<QObject> context;
        bool              hasContext = false;
        Listener          listener;
    };

    void handleStatusEvent(const BackendStatusEvent& event);
    void handleOwnershipChanged(bool ownsProcess);
    void handleOutputLine(const QString& line);
    void removeListener(quint64 id);
    void dispatch(const BackendStatusEvent& event);

    QPointer<BackendSupervisor>      m_supervisor;
    BackendStatusEvent               m_event;
    bool                             m_canStop = false;
    bool                             m_idle = false;
    QStringList                      m_outputTail;
    std::map<quint64, Registration>  m_listeners;
    quint64                          m_nextId = 1;
};
