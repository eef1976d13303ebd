#include "ServiceHandle.hpp"

#include <QLoggingCategory>

#include <utility>

Q_LOGGING_CATEGORY(lcServiceHandle, "horus.shell.backend.launcher")

namespace {
constexpr int kMaxStderrLines = 20;
} // namespace

ServiceHandle::ServiceHandle(QObject* parent)
    : QObject(parent)
{
}

ServiceHandle::~ServiceHandle() = default;

void ServiceHandle::setReadinessMarkers(const QStringList& markers)
{
    m_readinessMarkers.clear();
    for (const QString& marker : markers) {
        if (!marker.trimmed().isEmpty())
            m_readinessMarkers.append(marker.trimmed());
    }
}

QString ServiceHandle::lastErrorLines(int maxLines) const
{
    if (m_stderrTail.isEmpty() || maxLines <= 0)
        return {};
    return m_stderrTail.mid(qMax(0, m_stderrTail.size() - maxLines)).join(QStringLiteral(" | "));
}

void ServiceHandle::recordLine(const QString& line, bool fromStderr)
{
    if (line.isEmpty())
        return;

    if (fromStderr) {
        m_stderrTail.append(line);
        if (m_stderrTail.size() > kMaxStderrLines)
            m_stderrTail.removeFirst();
    }

    emit outputLine(line, fromStderr);

    if (m_readinessSeen)
        return;
    for (const QString& marker : std::as_const(m_readinessMarkers)) {
        if (line.contains(marker, Qt::CaseInsensitive)) {
            m_readinessSeen = true;
            emit readinessSignalled();
            return;
        }
    }
}

ProcessServiceHandle::ProcessServiceHandle(Options options, QObject* parent)
    : ServiceHandle(parent)
    , m_options(std::move(options))
{
    setReadinessMarkers(m_options.readinessMarkers);

    m_process.setProgram(m_options.program);
    m_process.setArguments(m_options.arguments);
    m_process.setWorkingDirectory(m_options.workingDirectory);
    m_process.setProcessEnvironment(m_options.environment);
    m_process.setProcessChannelMode(QProcess::SeparateChannels);

    connect(&m_process, &QProcess::started, this, &ProcessServiceHandle::spawned);
    connect(&m_process, &QProcess::errorOccurred, this, &ProcessServiceHandle::handleErrorOccurred);
    connect(&m_process, &QProcess::finished, this, &ProcessServiceHandle::handleFinished);
    connect(&m_process, &QProcess::readyReadStandardOutput, this, [this]() {
        drainChannel(QProcess::StandardOutput);
    });
    connect(&m_process, &QProcess::readyReadStandardError, this, [this]() {
        drainChannel(QProcess::StandardError);
    });

    m_killTimer.setSingleShot(true);
    connect(&m_killTimer, &QTimer::timeout, this, [this]() {
        if (m_process.state() == QProcess::NotRunning)
            return;
        qCWarning(lcServiceHandle) << "Backend process" << processId()
                                   << "ignored the termination request, killing it";
        m_process.kill();
    });
}

ProcessServiceHandle::~ProcessServiceHandle()
{
    disconnect(&m_process, nullptr, this, nullptr);
    m_killTimer.stop();
    if (m_process.state() != QProcess::NotRunning)
        terminateAndWait(2000);
}

void ProcessServiceHandle::start()
{
    qCInfo(lcServiceHandle) << "Spawning" << m_options.program << m_options.arguments
                            << "in" << m_options.workingDirectory;
    m_process.start(QIODevice::ReadOnly);
}

qint64 ProcessServiceHandle::processId() const
{
    return m_process.processId();
}

bool ProcessServiceHandle::isRunning() const
{
    return m_process.state() != QProcess::NotRunning;
}

void ProcessServiceHandle::terminate(int graceMs)
{
    if (m_process.state() == QProcess::NotRunning)
        return;
    qCInfo(lcServiceHandle) << "Terminating backend process" << processId();
    m_process.terminate();
    m_killTimer.start(qMax(0, graceMs));
}

void ProcessServiceHandle::terminateAndWait(int timeoutMs)
{
    if (m_process.state() == QProcess::NotRunning)
        return;
    m_killTimer.stop();
    m_process.terminate();
    if (!m_process.waitForFinished(timeoutMs)) {
        m_process.kill();
        m_process.waitForFinished(timeoutMs);
    }
}

void ProcessServiceHandle::handleErrorOccurred(QProcess::ProcessError error)
{
    if (error != QProcess::FailedToStart) {
        qCDebug(lcServiceHandle) << "Backend process error" << error << m_process.errorString();
        return;
    }
    const QString message = m_process.errorString().trimmed();
    qCWarning(lcServiceHandle) << "Backend process failed to start:" << message;
    emit spawnFailed(message.isEmpty() ? tr("%1 could not be started").arg(m_options.program) : message);
}

void ProcessServiceHandle::handleFinished(int exitCode, QProcess::ExitStatus status)
{
    m_killTimer.stop();
    drainChannel(QProcess::StandardOutput, true);
    drainChannel(QProcess::StandardError, true);
    if (m_exitReported)
        return;
    m_exitReported = true;
    qCInfo(lcServiceHandle) << "Backend process finished with code" << exitCode
                            << (status == QProcess::CrashExit ? "(crashed)" : "");
    emit exited(exitCode, status == QProcess::CrashExit);
}

void ProcessServiceHandle::drainChannel(QProcess::ProcessChannel channel, bool flush)
{
    const bool fromStderr = channel == QProcess::StandardError;
    QByteArray& buffer = fromStderr ? m_stderrBuffer : m_stdoutBuffer;
    buffer += fromStderr ? m_process.readAllStandardError() : m_process.readAllStandardOutput();

    while (true) {
        const int newline = buffer.indexOf('\n');
        if (newline < 0)
            break;
        const QByteArray line = buffer.left(newline).trimmed();
        buffer.remove(0, newline + 1);
        recordLine(QString::fromUtf8(line), fromStderr);
    }

    if (flush && !buffer.isEmpty()) {
        const QByteArray rest = buffer.trimmed();
        buffer.clear();
        recordLine(QString::fromUtf8(rest), fromStderr);
    }
}
