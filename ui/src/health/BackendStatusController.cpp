#include "BackendStatusController.hpp"

#include <QLoggingCategory>
#include <QMetaObject>

#include <utility>
#include <vector>

#include "backend/BackendSupervisor.hpp"

Q_LOGGING_CATEGORY(lcBackendStatus, "horus.shell.backend.status")

namespace {
constexpr int kMaxOutputTail = 50;
} // namespace

BackendSubscription::BackendSubscription(BackendStatusController* controller, quint64 id)
    : m_controller(controller)
    , m_id(id)
{
}

BackendSubscription::~BackendSubscription()
{
    unsubscribe();
}

BackendSubscription::BackendSubscription(BackendSubscription&& other) noexcept
    : m_controller(std::move(other.m_controller))
    , m_id(std::exchange(other.m_id, 0))
{
    other.m_controller.clear();
}

BackendSubscription& BackendSubscription::operator=(BackendSubscription&& other) noexcept
{
    if (this != &other) {
        unsubscribe();
        m_controller = std::move(other.m_controller);
        m_id = std::exchange(other.m_id, 0);
        other.m_controller.clear();
    }
    return *this;
}

bool BackendSubscription::isActive() const
{
    return m_controller && m_id != 0 && m_controller->m_listeners.count(m_id) > 0;
}

void BackendSubscription::unsubscribe()
{
    if (m_controller && m_id != 0)
        m_controller->removeListener(m_id);
    m_controller.clear();
    m_id = 0;
}

BackendStatusController::BackendStatusController(BackendSupervisor* supervisor, QObject* parent)
    : QObject(parent)
    , m_supervisor(supervisor)
{
    if (!supervisor) {
        qCWarning(lcBackendStatus) << "Backend status controller created without a supervisor";
        return;
    }

    m_event = supervisor->lastEvent();
    m_idle = !supervisor->hasChecked();
    m_canStop = supervisor->ownsProcess();
    const QStringList tail = supervisor->outputTail();
    m_outputTail = tail.mid(qMax(0, tail.size() - kMaxOutputTail));

    connect(supervisor, &BackendSupervisor::statusChanged, this, &BackendStatusController::handleStatusEvent);
    connect(supervisor, &BackendSupervisor::ownershipChanged, this, &BackendStatusController::handleOwnershipChanged);
    connect(supervisor, &BackendSupervisor::outputLine, this,
            [this](const QString& line, bool) { handleOutputLine(line); });
}

BackendStatusController::~BackendStatusController() = default;

QString BackendStatusController::status() const
{
    return backendStateName(m_event.state());
}

QString BackendStatusController::errorKind() const
{
    return backendErrorKindName(m_event.errorKind());
}

bool BackendStatusController::busy() const
{
    if (m_idle)
        return false;
    return m_event.state() == BackendState::Checking || m_event.state() == BackendState::Starting;
}

bool BackendStatusController::canStart() const
{
    return m_idle || m_event.state() == BackendState::Error || m_event.state() == BackendState::Stopped;
}

void BackendStatusController::check()
{
    if (!m_supervisor)
        return;
    qCDebug(lcBackendStatus) << "check-backend requested";
    QMetaObject::invokeMethod(m_supervisor.data(), "check", Qt::QueuedConnection);
}

void BackendStatusController::start()
{
    if (!m_supervisor)
        return;
    qCDebug(lcBackendStatus) << "start-backend requested";
    QMetaObject::invokeMethod(m_supervisor.data(), "start", Qt::QueuedConnection);
}

void BackendStatusController::stop()
{
    if (!m_supervisor)
        return;
    qCDebug(lcBackendStatus) << "stop-backend requested";
    QMetaObject::invokeMethod(m_supervisor.data(), "stop", Qt::QueuedConnection);
}

BackendSubscription BackendStatusController::subscribe(Listener listener)
{
    if (!listener)
        return {};
    const quint64 id = m_nextId++;
    m_listeners.emplace(id, Registration{nullptr, false, std::move(listener)});
    return BackendSubscription(this, id);
}

BackendSubscription BackendStatusController::subscribe(QObject* context, Listener listener)
{
    if (!context || !listener)
        return {};
    const quint64 id = m_nextId++;
    m_listeners.emplace(id, Registration{context, true, std::move(listener)});
    connect(context, &QObject::destroyed, this, [this, id]() { removeListener(id); });
    return BackendSubscription(this, id);
}

void BackendStatusController::removeListener(quint64 id)
{
    m_listeners.erase(id);
}

void BackendStatusController::handleStatusEvent(const BackendStatusEvent& event)
{
    m_event = event;
    m_idle = false;
    emit statusChanged();
    dispatch(event);
}

void BackendStatusController::handleOwnershipChanged(bool ownsProcess)
{
    if (m_canStop == ownsProcess)
        return;
    m_canStop = ownsProcess;
    emit canStopChanged();
}

void BackendStatusController::handleOutputLine(const QString& line)
{
    m_outputTail.append(line);
    while (m_outputTail.size() > kMaxOutputTail)
        m_outputTail.removeFirst();
    emit outputTailChanged();
}

void BackendStatusController::dispatch(const BackendStatusEvent& event)
{
    // Listeners may unsubscribe while being notified.
    std::vector<quint64> ids;
    ids.reserve(m_listeners.size());
    for (const auto& entry : m_listeners)
        ids.push_back(entry.first);

    for (quint64 id : ids) {
        const auto it = m_listeners.find(id);
        if (it == m_listeners.end())
            continue;
        const Registration& registration = it->second;
        if (!registration.hasContext) {
            Listener listener = registration.listener;
            listener(event);
            continue;
        }
        if (!registration.context) {
            m_listeners.erase(it);
            continue;
        }
        // Queued onto the context's thread when it differs; posted events keep their order.
        QMetaObject::invokeMethod(registration.context.data(), [listener = registration.listener, event]() {
            listener(event);
        }, Qt::AutoConnection);
    }
}
