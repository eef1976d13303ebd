#pragma once

#include <QList>
#include <QObject>
#include <QPointer>
#include <QString>
#include <QStringList>
#include <QTimer>

#include <memory>

#include "backend/BackendLauncher.hpp"
#include "backend/BackendPathResolver.hpp"
#include "backend/BackendProbe.hpp"
#include "backend/BackendSupervisorConfig.hpp"
#include "backend/BackendTypes.hpp"

/**
 * @brief Keeps the local companion service reachable for the shell.
 *
 * Probes the service, launches it from the first installation the resolver finds when
 * nothing answers, verifies the launch with a delayed re-probe and keeps probing while
 * it runs. Every change of state is published as a BackendStatusEvent through
 * statusChanged(). Transitions are serialized on the owning thread's event loop; while
 * a launch is in flight check() and start() are ignored, so at most one child process
 * is ever owned.
 */
class BackendSupervisor : public QObject {
    Q_OBJECT

public:
    explicit BackendSupervisor(const BackendSupervisorConfig& config = {}, QObject* parent = nullptr);
    ~BackendSupervisor() override;

    BackendState state() const { return m_state; }
    BackendStatusEvent lastEvent() const { return m_lastEvent; }
    BackendSupervisorConfig config() const { return m_config; }
    bool ownsProcess() const { return m_handle != nullptr; }
    //! False until the first check() or start(); the initial Checking state has no probe behind it.
    bool hasChecked() const { return m_hasChecked; }
    qint64 processId() const;
    QStringList outputTail() const { return m_outputTail; }
    QStringList candidates() const;

    void setConfig(const BackendSupervisorConfig& config);

    void setProbeForTesting(const std::shared_ptr<BackendProbeInterface>& probe);
    void setLauncherForTesting(const std::shared_ptr<BackendLauncherInterface>& launcher);
    void setCandidatesForTesting(const QStringList& candidates);
    bool isMonitorActiveForTesting() const { return m_monitorTimer.isActive(); }
    bool isSettleTimerActiveForTesting() const { return m_settleTimer.isActive(); }

public slots:
    void check();
    void start();
    void stop();
    //! Blocking variant of stop() for application quit: waits for the owned child, then kills it.
    void shutdown();

signals:
    void statusChanged(const BackendStatusEvent& event);
    void ownershipChanged(bool ownsProcess);
    void outputLine(const QString& line, bool fromStderr);

private:
    enum class ProbePurpose {
        Discover,
        VerifyLaunch,
        Monitor,
    };

    void enterChecking();
    void runProbe(ProbePurpose purpose);
    void handleProbeResult(ProbePurpose purpose, const BackendProbeResult& result);
    void resolveAndLaunch();
    void handleLaunchResult(LaunchResult result);
    void adoptHandle(std::unique_ptr<ServiceHandle> handle);
    void releaseHandle(bool terminate);
    bool hasRetiringHandles();
    void handleRetiredExit();
    void handleProcessExited(int exitCode, bool crashed);
    void handleReadiness();
    void handleSettleTimeout();
    void handleMonitorTick();
    void appendOutput(const QString& line, bool fromStderr);
    void transition(BackendState state,
                    BackendErrorKind errorKind = BackendErrorKind::None,
                    const QString& message = QString());
    void applyConfigToCollaborators();

    BackendSupervisorConfig                   m_config;
    BackendPathResolver                       m_resolver;
    QStringList                               m_candidateOverride;
    std::shared_ptr<BackendProbeInterface>    m_probe;
    std::shared_ptr<BackendLauncherInterface> m_launcher;
    std::unique_ptr<ServiceHandle>            m_handle;
    QList<QPointer<ServiceHandle>>            m_retiring;

    BackendState       m_state = BackendState::Checking;
    BackendStatusEvent m_lastEvent;
    QTimer             m_settleTimer;
    QTimer             m_monitorTimer;
    QStringList        m_outputTail;
    quint64            m_generation = 0;
    bool               m_probeInFlight = false;
    bool               m_launchInFlight = false;
    bool               m_stopRequested = false;
    bool               m_hasChecked = false;
    bool               m_awaitingRetired = false;
};
