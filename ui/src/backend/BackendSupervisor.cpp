#include "BackendSupervisor.hpp"

#include <QLoggingCategory>

#include <algorithm>
#include <utility>

Q_LOGGING_CATEGORY(lcBackendSupervisor, "horus.shell.backend.supervisor")
Q_LOGGING_CATEGORY(lcBackendOutput, "horus.shell.backend.output")

namespace {
constexpr int kMaxOutputLines = 200;
} // namespace

BackendSupervisor::BackendSupervisor(const BackendSupervisorConfig& config, QObject* parent)
    : QObject(parent)
    , m_config(config)
    , m_resolver(config.entryPoint)
    , m_probe(std::make_shared<BackendProbe>())
    , m_launcher(std::make_shared<BackendLauncher>())
    , m_lastEvent(BackendState::Checking, BackendErrorKind::None, QString(), false)
{
    qRegisterMetaType<BackendStatusEvent>("BackendStatusEvent");

    m_settleTimer.setSingleShot(true);
    connect(&m_settleTimer, &QTimer::timeout, this, &BackendSupervisor::handleSettleTimeout);
    connect(&m_monitorTimer, &QTimer::timeout, this, &BackendSupervisor::handleMonitorTick);

    applyConfigToCollaborators();
}

BackendSupervisor::~BackendSupervisor()
{
    m_settleTimer.stop();
    m_monitorTimer.stop();
    ++m_generation;
    if (m_handle) {
        disconnect(m_handle.get(), nullptr, this, nullptr);
        qCInfo(lcBackendSupervisor) << "Shutting down owned backend process" << m_handle->processId();
        m_handle->terminateAndWait(m_config.stopGraceMs);
        m_handle.reset();
    }
}

void BackendSupervisor::shutdown()
{
    m_stopRequested = m_launchInFlight;
    if (!m_handle) {
        m_settleTimer.stop();
        m_monitorTimer.stop();
        m_awaitingRetired = false;
        ++m_generation;
        return;
    }

    std::unique_ptr<ServiceHandle> handle = std::move(m_handle);
    disconnect(handle.get(), nullptr, this, nullptr);
    qCInfo(lcBackendSupervisor) << "Shutting down owned backend process" << handle->processId();
    handle->terminateAndWait(m_config.stopGraceMs);
    handle.reset();
    emit ownershipChanged(false);
    transition(BackendState::Stopped, BackendErrorKind::None, tr("Backend stopped on shutdown"));
}

qint64 BackendSupervisor::processId() const
{
    return m_handle ? m_handle->processId() : 0;
}

QStringList BackendSupervisor::candidates() const
{
    if (!m_candidateOverride.isEmpty())
        return m_candidateOverride;
    return BackendPathResolver::defaultCandidates(m_config.backendDirOverride);
}

void BackendSupervisor::setConfig(const BackendSupervisorConfig& config)
{
    m_config = config;
    m_resolver = BackendPathResolver(config.entryPoint);
    applyConfigToCollaborators();
    if (m_state == BackendState::Running) {
        if (m_config.monitorIntervalMs > 0)
            m_monitorTimer.start(m_config.monitorIntervalMs);
        else
            m_monitorTimer.stop();
    }
}

void BackendSupervisor::setProbeForTesting(const std::shared_ptr<BackendProbeInterface>& probe)
{
    if (!probe)
        return;
    m_probe = probe;
    applyConfigToCollaborators();
}

void BackendSupervisor::setLauncherForTesting(const std::shared_ptr<BackendLauncherInterface>& launcher)
{
    if (!launcher)
        return;
    m_launcher = launcher;
    applyConfigToCollaborators();
}

void BackendSupervisor::setCandidatesForTesting(const QStringList& candidates)
{
    m_candidateOverride = candidates;
}

void BackendSupervisor::applyConfigToCollaborators()
{
    if (m_probe) {
        m_probe->setEndpoint(BackendProbe::endpointFor(m_config.host, m_config.port, m_config.probePath));
        m_probe->setTimeoutMs(m_config.probeTimeoutMs);
    }
    if (m_launcher) {
        m_launcher->setPythonExecutable(m_config.pythonExecutable);
        m_launcher->setReadinessMarkers(m_config.readinessMarkers);
        m_launcher->setPort(m_config.port);
    }
}

void BackendSupervisor::check()
{
    switch (m_state) {
    case BackendState::Starting:
        qCDebug(lcBackendSupervisor) << "check ignored, a launch is in progress";
        return;
    case BackendState::Running:
        if (!m_probeInFlight)
            runProbe(ProbePurpose::Monitor);
        return;
    case BackendState::Checking:
        if (m_probeInFlight || m_awaitingRetired)
            return;
        break;
    case BackendState::Stopped:
    case BackendState::Error:
        break;
    }
    enterChecking();
}

void BackendSupervisor::start()
{
    switch (m_state) {
    case BackendState::Starting:
        qCDebug(lcBackendSupervisor) << "start ignored, a launch is in progress";
        return;
    case BackendState::Running:
        qCDebug(lcBackendSupervisor) << "start ignored, backend already running";
        return;
    case BackendState::Checking:
        if (m_probeInFlight || m_awaitingRetired)
            return;
        break;
    case BackendState::Stopped:
    case BackendState::Error:
        break;
    }
    enterChecking();
}

void BackendSupervisor::stop()
{
    switch (m_state) {
    case BackendState::Starting:
        if (!m_handle) {
            qCInfo(lcBackendSupervisor) << "stop requested during spawn, honouring it once the spawn resolves";
            m_stopRequested = true;
            return;
        }
        m_settleTimer.stop();
        releaseHandle(true);
        transition(BackendState::Stopped);
        return;
    case BackendState::Running:
    case BackendState::Error:
    case BackendState::Checking:
        if (!m_handle) {
            if (m_state == BackendState::Running)
                qCInfo(lcBackendSupervisor) << "stop ignored, the running backend was not started by this shell";
            return;
        }
        releaseHandle(true);
        transition(BackendState::Stopped);
        return;
    case BackendState::Stopped:
        return;
    }
}

void BackendSupervisor::enterChecking()
{
    m_stopRequested = false;
    m_hasChecked = true;
    transition(BackendState::Checking);
    if (hasRetiringHandles()) {
        // A stopped child may still answer on the port until it is gone.
        qCInfo(lcBackendSupervisor) << "Waiting for the previous backend process to exit before probing";
        m_awaitingRetired = true;
        return;
    }
    runProbe(ProbePurpose::Discover);
}

void BackendSupervisor::runProbe(ProbePurpose purpose)
{
    if (!m_probe)
        return;
    m_probeInFlight = true;
    const quint64 generation = m_generation;
    QPointer<BackendSupervisor> guard(this);
    m_probe->probe([guard, generation, purpose](const BackendProbeResult& result) {
        if (!guard || guard->m_generation != generation)
            return;
        guard->m_probeInFlight = false;
        guard->handleProbeResult(purpose, result);
    });
}

void BackendSupervisor::handleProbeResult(ProbePurpose purpose, const BackendProbeResult& result)
{
    if (result.outcome == BackendProbeResult::Outcome::Ambiguous)
        qCWarning(lcBackendSupervisor) << "Ambiguous probe answer treated as unreachable:" << result.detail;

    switch (purpose) {
    case ProbePurpose::Discover:
        if (m_state != BackendState::Checking)
            return;
        if (result.reachable()) {
            transition(BackendState::Running);
            return;
        }
        if (m_handle && m_handle->isRunning()) {
            // A process from an earlier launch is still alive: give it another window instead of spawning a second one.
            transition(BackendState::Starting, BackendErrorKind::None,
                       tr("Waiting for the backend process started earlier"));
            m_settleTimer.start(m_config.startupDelayMs);
            return;
        }
        if (m_handle)
            releaseHandle(false);
        resolveAndLaunch();
        return;

    case ProbePurpose::VerifyLaunch:
        if (m_state != BackendState::Starting)
            return;
        if (result.reachable()) {
            transition(BackendState::Running);
            return;
        }
        transition(BackendState::Error, BackendErrorKind::Unreachable,
                   tr("Backend started but not responding"));
        return;

    case ProbePurpose::Monitor:
        if (m_state != BackendState::Running)
            return;
        if (result.reachable()) {
            transition(BackendState::Running);
            return;
        }
        transition(BackendState::Error, BackendErrorKind::UnexpectedExit,
                   result.detail.isEmpty() ? tr("Backend stopped responding")
                                           : tr("Backend stopped responding (%1)").arg(result.detail));
        return;
    }
}

void BackendSupervisor::resolveAndLaunch()
{
    m_resolver.setCandidates(candidates());
    const BackendResolveResult resolved = m_resolver.resolve();

    switch (resolved.status) {
    case BackendResolveResult::Status::NotFound:
        transition(BackendState::Error, BackendErrorKind::NotFound,
                   tr("Backend not found. Install the companion service (%1) into one of: %2")
                       .arg(m_resolver.entryPointName(), resolved.searched.join(QStringLiteral(", "))));
        return;
    case BackendResolveResult::Status::Failed:
        transition(BackendState::Error, BackendErrorKind::Filesystem,
                   tr("Backend installation could not be inspected: %1").arg(resolved.errorMessage));
        return;
    case BackendResolveResult::Status::Found:
        break;
    }

    if (!m_launcher) {
        transition(BackendState::Error, BackendErrorKind::Spawn, tr("No launcher available"));
        return;
    }

    m_outputTail.clear();
    transition(BackendState::Starting, BackendErrorKind::None,
               tr("Starting backend from %1").arg(resolved.installation.directory));

    m_launchInFlight = true;
    QPointer<BackendSupervisor> guard(this);
    m_launcher->launch(resolved.installation, [guard](LaunchResult result) {
        if (!guard)
            return;
        guard->handleLaunchResult(std::move(result));
    });
}

void BackendSupervisor::handleLaunchResult(LaunchResult result)
{
    m_launchInFlight = false;

    if (!result.ok()) {
        if (m_stopRequested) {
            m_stopRequested = false;
            transition(BackendState::Stopped);
            return;
        }
        transition(BackendState::Error, BackendErrorKind::Spawn,
                   tr("Failed to start backend: %1").arg(result.errorMessage));
        return;
    }

    adoptHandle(std::move(result.handle));

    if (m_stopRequested) {
        m_stopRequested = false;
        releaseHandle(true);
        transition(BackendState::Stopped);
        return;
    }

    if (m_state != BackendState::Starting)
        return;
    qCInfo(lcBackendSupervisor) << "Backend spawned, verifying in" << m_config.startupDelayMs << "ms";
    if (m_handle->readinessSeen())
        handleReadiness();
    else
        m_settleTimer.start(m_config.startupDelayMs);
}

void BackendSupervisor::adoptHandle(std::unique_ptr<ServiceHandle> handle)
{
    m_handle = std::move(handle);
    m_handle->setParent(nullptr);
    connect(m_handle.get(), &ServiceHandle::exited, this, &BackendSupervisor::handleProcessExited);
    connect(m_handle.get(), &ServiceHandle::readinessSignalled, this, &BackendSupervisor::handleReadiness);
    connect(m_handle.get(), &ServiceHandle::outputLine, this, &BackendSupervisor::appendOutput);
    emit ownershipChanged(true);
}

void BackendSupervisor::releaseHandle(bool terminate)
{
    if (!m_handle)
        return;

    ServiceHandle* retiring = m_handle.release();
    disconnect(retiring, nullptr, this, nullptr);

    if (terminate && retiring->isRunning()) {
        // Parented so that shutdown still reaps it if it outlives the grace period.
        retiring->setParent(this);
        m_retiring.append(retiring);
        connect(retiring, &ServiceHandle::exited, retiring, &QObject::deleteLater);
        connect(retiring, &ServiceHandle::exited, this, &BackendSupervisor::handleRetiredExit, Qt::QueuedConnection);
        retiring->terminate(m_config.stopGraceMs);
    } else {
        retiring->deleteLater();
    }
    emit ownershipChanged(false);
}

bool BackendSupervisor::hasRetiringHandles()
{
    m_retiring.erase(std::remove_if(m_retiring.begin(), m_retiring.end(),
                                    [](const QPointer<ServiceHandle>& handle) {
                                        return !handle || !handle->isRunning();
                                    }),
                     m_retiring.end());
    return !m_retiring.isEmpty();
}

void BackendSupervisor::handleRetiredExit()
{
    if (!m_awaitingRetired || hasRetiringHandles())
        return;
    m_awaitingRetired = false;
    if (m_state == BackendState::Checking)
        runProbe(ProbePurpose::Discover);
}

void BackendSupervisor::handleProcessExited(int exitCode, bool crashed)
{
    const QString detail = m_handle ? m_handle->lastErrorLines() : QString();
    releaseHandle(false);

    if (m_state != BackendState::Running && m_state != BackendState::Starting) {
        qCInfo(lcBackendSupervisor) << "Owned backend process exited with code" << exitCode
                                    << "in state" << backendStateName(m_state);
        return;
    }

    m_settleTimer.stop();
    QString message = crashed ? tr("Backend crashed (exit code %1)").arg(exitCode)
                              : tr("Backend exited with code %1").arg(exitCode);
    if (!detail.isEmpty())
        message += QStringLiteral(" • %1").arg(detail);
    transition(BackendState::Error, BackendErrorKind::UnexpectedExit, message);
}

void BackendSupervisor::handleReadiness()
{
    if (m_state != BackendState::Starting || m_probeInFlight)
        return;
    qCInfo(lcBackendSupervisor) << "Backend reported readiness, verifying now";
    m_settleTimer.stop();
    runProbe(ProbePurpose::VerifyLaunch);
}

void BackendSupervisor::handleSettleTimeout()
{
    if (m_state != BackendState::Starting || m_probeInFlight)
        return;
    runProbe(ProbePurpose::VerifyLaunch);
}

void BackendSupervisor::handleMonitorTick()
{
    if (m_state != BackendState::Running || m_probeInFlight)
        return;
    runProbe(ProbePurpose::Monitor);
}

void BackendSupervisor::appendOutput(const QString& line, bool fromStderr)
{
    qCInfo(lcBackendOutput).noquote() << (fromStderr ? "[stderr]" : "[stdout]") << line;
    m_outputTail.append(line);
    while (m_outputTail.size() > kMaxOutputLines)
        m_outputTail.removeFirst();
    emit outputLine(line, fromStderr);
}

void BackendSupervisor::transition(BackendState state, BackendErrorKind errorKind, const QString& message)
{
    if (state == BackendState::Running && m_state == BackendState::Running)
        return;

    m_state = state;
    ++m_generation;
    m_probeInFlight = false;
    m_awaitingRetired = false;
    m_lastEvent = BackendStatusEvent(state, errorKind, message, m_handle != nullptr);

    if (state != BackendState::Starting)
        m_settleTimer.stop();
    if (state == BackendState::Running && m_config.monitorIntervalMs > 0)
        m_monitorTimer.start(m_config.monitorIntervalMs);
    else
        m_monitorTimer.stop();

    if (state == BackendState::Error)
        qCWarning(lcBackendSupervisor).noquote() << "Backend status: error -" << message;
    else
        qCInfo(lcBackendSupervisor).noquote() << "Backend status:" << backendStateName(state)
                                              << (message.isEmpty() ? QString() : QStringLiteral("- ") + message);

    emit statusChanged(m_lastEvent);
}
