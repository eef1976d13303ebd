#include "RuntimeUtils.hpp"

#include "PathUtils.hpp"

#include <QByteArray>
#include <QDir>
#include <QFileInfo>
#include <QObject>
#include <QStandardPaths>

#include <utility>

namespace horus::shell::utils {

namespace {

QString runtimeDirectory()
{
    const QByteArray overrideDir = qgetenv("HORUS_SHELL_RUNTIME_DIR");
    if (!overrideDir.isEmpty())
        return expandPath(QString::fromUtf8(overrideDir));

    QString location = QStandardPaths::writableLocation(QStandardPaths::RuntimeLocation);
    if (location.isEmpty())
        location = QStandardPaths::writableLocation(QStandardPaths::TempLocation);
    return QDir(location).filePath(QStringLiteral("horus_shell"));
}

} // namespace

QString runtimeLockFilePath()
{
    const QByteArray overridePath = qgetenv("HORUS_SHELL_LOCK_FILE");
    if (!overridePath.isEmpty())
        return expandPath(QString::fromUtf8(overridePath));

    const QDir dir(runtimeDirectory());
    return dir.filePath(QStringLiteral("horus_shell.lock"));
}

bool ensureLockFileDirectory(const QString& lockPath, QString* errorMessage)
{
    const QFileInfo info(lockPath);
    QDir directory = info.dir();
    if (directory.exists())
        return true;
    if (directory.mkpath(QStringLiteral(".")))
        return true;
    if (errorMessage) {
        *errorMessage = QObject::tr("Could not create the instance lock directory (%1).")
                            .arg(directory.absolutePath());
    }
    return false;
}

SingleInstanceGuard::SingleInstanceGuard(QString lockFilePath)
    : m_lockFile(std::move(lockFilePath))
{
    m_lockFile.setStaleLockTime(0);
}

SingleInstanceGuard::~SingleInstanceGuard() = default;

bool SingleInstanceGuard::tryAcquire(int timeoutMs)
{
    m_error.clear();
    m_conflict = {};
    m_locked = false;
    m_lastError = QLockFile::NoError;

    if (m_lockFile.tryLock(timeoutMs)) {
        m_locked = true;
        return true;
    }

    m_lastError = m_lockFile.error();

    if (m_lastError == QLockFile::LockFailedError) {
        if (m_lockFile.removeStaleLockFile() && m_lockFile.tryLock(timeoutMs)) {
            m_locked = true;
            m_lastError = QLockFile::NoError;
            return true;
        }
        m_error = QObject::tr("Another shell is already supervising the backend.");
        m_lockFile.getLockInfo(&m_conflict.pid, &m_conflict.hostname, &m_conflict.applicationId);
        return false;
    }

    if (m_lastError == QLockFile::PermissionError)
        m_error = QObject::tr("No permission to create the instance lock.");
    else
        m_error = QObject::tr("Unexpected instance lock error.");
    return false;
}

bool SingleInstanceGuard::isHeld() const
{
    return m_locked;
}

QString SingleInstanceGuard::errorString() const
{
    return m_error;
}

LockConflictInfo SingleInstanceGuard::conflictInfo() const
{
    return m_conflict;
}

QString SingleInstanceGuard::lockFilePath() const
{
    return m_lockFile.fileName();
}

bool SingleInstanceGuard::hasConflict() const
{
    return m_lastError == QLockFile::LockFailedError;
}

QLockFile::LockError SingleInstanceGuard::lastError() const
{
    return m_lastError;
}

} // namespace horus::shell::utils
