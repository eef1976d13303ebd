#include "BackendTypes.hpp"

#include <utility>

BackendStatusEvent::BackendStatusEvent(BackendState state,
                                       BackendErrorKind errorKind,
                                       QString message,
                                       bool ownsProcess,
                                       QDateTime timestampUtc)
    : m_state(state)
    , m_errorKind(errorKind)
    , m_message(std::move(message))
    , m_timestampUtc(std::move(timestampUtc))
    , m_ownsProcess(ownsProcess)
{
}

QVariantMap BackendStatusEvent::toVariantMap() const
{
    QVariantMap payload;
    payload.insert(QStringLiteral("status"), backendStateName(m_state));
    payload.insert(QStringLiteral("message"), m_message);
    payload.insert(QStringLiteral("timestamp"), timestampMs());
    payload.insert(QStringLiteral("errorKind"), backendErrorKindName(m_errorKind));
    payload.insert(QStringLiteral("ownsProcess"), m_ownsProcess);
    return payload;
}

QString backendStateName(BackendState state)
{
    switch (state) {
    case BackendState::Checking:
        return QStringLiteral("checking");
    case BackendState::Starting:
        return QStringLiteral("starting");
    case BackendState::Running:
        return QStringLiteral("running");
    case BackendState::Stopped:
        return QStringLiteral("stopped");
    case BackendState::Error:
        return QStringLiteral("error");
    }
    return QStringLiteral("error");
}

QString backendErrorKindName(BackendErrorKind kind)
{
    switch (kind) {
    case BackendErrorKind::None:
        return QString();
    case BackendErrorKind::NotFound:
        return QStringLiteral("not-found");
    case BackendErrorKind::Filesystem:
        return QStringLiteral("filesystem");
    case BackendErrorKind::Spawn:
        return QStringLiteral("spawn");
    case BackendErrorKind::Unreachable:
        return QStringLiteral("unreachable");
    case BackendErrorKind::UnexpectedExit:
        return QStringLiteral("unexpected-exit");
    }
    return QString();
}
