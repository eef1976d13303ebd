#pragma once

#include <QDateTime>
#include <QMetaType>
#include <QString>
#include <QVariantMap>

enum class BackendState {
    Checking,
    Starting,
    Running,
    Stopped,
    Error,
};

enum class BackendErrorKind {
    None,
    NotFound,
    Filesystem,
    Spawn,
    Unreachable,
    UnexpectedExit,
};

//! Immutable record emitted on every supervisor state change.
class BackendStatusEvent {
public:
    BackendStatusEvent() = default;
    BackendStatusEvent(BackendState state,
                       BackendErrorKind errorKind,
                       QString message,
                       bool ownsProcess,
                       QDateTime timestampUtc = QDateTime::currentDateTimeUtc());

    BackendState state() const { return m_state; }
    BackendErrorKind errorKind() const { return m_errorKind; }
    QString message() const { return m_message; }
    QDateTime timestampUtc() const { return m_timestampUtc; }
    qint64 timestampMs() const { return m_timestampUtc.toMSecsSinceEpoch(); }
    bool ownsProcess() const { return m_ownsProcess; }

    //! Payload for the presentation layer: {status, message, timestamp, errorKind, ownsProcess}.
    QVariantMap toVariantMap() const;

private:
    BackendState m_state = BackendState::Checking;
    BackendErrorKind m_errorKind = BackendErrorKind::None;
    QString m_message;
    QDateTime m_timestampUtc;
    bool m_ownsProcess = false;
};

QString backendStateName(BackendState state);
QString backendErrorKindName(BackendErrorKind kind);

Q_DECLARE_METATYPE(BackendStatusEvent)
