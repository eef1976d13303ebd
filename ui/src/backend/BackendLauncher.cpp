#include "BackendLauncher.hpp"

#include <QDir>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QStandardPaths>
#include <QTimer>

#include <utility>

Q_LOGGING_CATEGORY(lcBackendLauncher, "horus.shell.backend.launcher")

namespace {

QStringList isolatedInterpreterPaths()
{
#ifdef Q_OS_WIN
    return {QStringLiteral("venv/Scripts/python.exe"), QStringLiteral(".venv/Scripts/python.exe")};
#else
    return {QStringLiteral("venv/bin/python3"), QStringLiteral("venv/bin/python"),
            QStringLiteral(".venv/bin/python3"), QStringLiteral(".venv/bin/python")};
#endif
}

QString defaultPythonExecutable()
{
#ifdef Q_OS_WIN
    return QStringLiteral("python");
#else
    return QStringLiteral("python3");
#endif
}

} // namespace

LaunchResult LaunchResult::success(std::unique_ptr<ServiceHandle> handle)
{
    LaunchResult result;
    result.handle = std::move(handle);
    return result;
}

LaunchResult LaunchResult::failure(const QString& message)
{
    LaunchResult result;
    result.errorMessage = message;
    return result;
}

BackendLauncher::BackendLauncher(QObject* parent)
    : QObject(parent)
    , m_pythonExecutable(defaultPythonExecutable())
{
}

BackendLauncher::~BackendLauncher() = default;

void BackendLauncher::setPythonExecutable(const QString& executable)
{
    if (!executable.trimmed().isEmpty())
        m_pythonExecutable = executable.trimmed();
}

void BackendLauncher::setReadinessMarkers(const QStringList& markers)
{
    m_readinessMarkers = markers;
}

void BackendLauncher::setPort(int port)
{
    m_port = port;
}

QString BackendLauncher::locateInterpreter(const QString& installationDir,
                                           const QString& fallback,
                                           bool* isolated,
                                           QString* errorMessage)
{
    if (isolated)
        *isolated = false;

    const QDir dir(installationDir);
    for (const QString& relative : isolatedInterpreterPaths()) {
        const QFileInfo info(dir.filePath(relative));
        if (info.exists() && info.isFile() && info.isExecutable()) {
            if (isolated)
                *isolated = true;
            return info.absoluteFilePath();
        }
    }

    const QString program = fallback.trimmed().isEmpty() ? defaultPythonExecutable() : fallback.trimmed();
    const QFileInfo programInfo(program);
    if (programInfo.isAbsolute()) {
        if (programInfo.exists() && programInfo.isExecutable())
            return programInfo.absoluteFilePath();
        if (errorMessage)
            *errorMessage = QObject::tr("Python interpreter %1 is missing or not executable").arg(program);
        return {};
    }

    const QString found = QStandardPaths::findExecutable(program);
    if (found.isEmpty() && errorMessage)
        *errorMessage = QObject::tr("Python interpreter '%1' was not found on PATH").arg(program);
    return found;
}

BackendLauncher::LaunchPlan BackendLauncher::planLaunch(const BackendInstallation& installation) const
{
    LaunchPlan plan;
    if (!installation.isValid()) {
        plan.errorMessage = tr("No backend installation to launch");
        return plan;
    }

    plan.workingDirectory = installation.directory;
    plan.program = locateInterpreter(installation.directory, m_pythonExecutable,
                                     &plan.isolatedRuntime, &plan.errorMessage);
    if (plan.program.isEmpty())
        return plan;

    const QString entryPoint = installation.entryPoint.isEmpty()
        ? QStringLiteral("app.py")
        : QFileInfo(installation.entryPoint).fileName();
    plan.arguments << entryPoint;

    plan.environment = QProcessEnvironment::systemEnvironment();
    plan.environment.insert(QStringLiteral("PYTHONUNBUFFERED"), QStringLiteral("1"));
    if (m_port > 0)
        plan.environment.insert(QStringLiteral("FLASK_PORT"), QString::number(m_port));
    return plan;
}

void BackendLauncher::launch(const BackendInstallation& installation, Callback done)
{
    if (m_pending) {
        failLater(std::move(done), tr("A backend launch is already in progress"));
        return;
    }

    const LaunchPlan plan = planLaunch(installation);
    if (!plan.isValid()) {
        qCWarning(lcBackendLauncher) << "Cannot launch backend:" << plan.errorMessage;
        failLater(std::move(done), plan.errorMessage);
        return;
    }

    qCInfo(lcBackendLauncher) << "Launching backend with"
                              << (plan.isolatedRuntime ? "isolated runtime" : "system interpreter")
                              << plan.program;

    ProcessServiceHandle::Options options;
    options.program = plan.program;
    options.arguments = plan.arguments;
    options.workingDirectory = plan.workingDirectory;
    options.environment = plan.environment;
    options.readinessMarkers = m_readinessMarkers;

    m_pending = std::make_unique<ProcessServiceHandle>(std::move(options));
    m_pendingCallback = std::move(done);
    connect(m_pending.get(), &ProcessServiceHandle::spawned, this, [this]() {
        completePending(true, QString());
    });
    connect(m_pending.get(), &ProcessServiceHandle::spawnFailed, this, [this](const QString& message) {
        completePending(false, message);
    });
    m_pending->start();
}

void BackendLauncher::completePending(bool spawned, const QString& errorMessage)
{
    if (!m_pending)
        return;

    Callback done = std::move(m_pendingCallback);
    m_pendingCallback = nullptr;
    disconnect(m_pending.get(), nullptr, this, nullptr);

    if (spawned) {
        qCInfo(lcBackendLauncher) << "Backend process spawned with pid" << m_pending->processId();
        std::unique_ptr<ServiceHandle> handle(m_pending.release());
        if (done)
            done(LaunchResult::success(std::move(handle)));
        return;
    }

    // Still inside the handle's own signal emission.
    m_pending.release()->deleteLater();
    if (done)
        done(LaunchResult::failure(errorMessage));
}

void BackendLauncher::failLater(Callback done, const QString& message)
{
    QTimer::singleShot(0, this, [done = std::move(done), message]() {
        if (done)
            done(LaunchResult::failure(message));
    });
}
