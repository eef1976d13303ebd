#pragma once

#include <QLockFile>
#include <QString>

namespace horus::shell::utils {

struct LockConflictInfo {
    qint64 pid = 0;
    QString hostname;
    QString applicationId;
};

//! HORUS_SHELL_LOCK_FILE when set, otherwise horus_shell.lock in the runtime directory.
QString runtimeLockFilePath();

bool ensureLockFileDirectory(const QString& lockPath, QString* errorMessage = nullptr);

class SingleInstanceGuard {
public:
    explicit SingleInstanceGuard(QString lockFilePath);
    SingleInstanceGuard(const SingleInstanceGuard&) = delete;
    SingleInstanceGuard& operator=(const SingleInstanceGuard&) = delete;
    ~SingleInstanceGuard();

    bool tryAcquire(int timeoutMs = 0);
    bool isHeld() const;
    QString errorString() const;
    LockConflictInfo conflictInfo() const;
    QString lockFilePath() const;
    bool hasConflict() const;
    QLockFile::LockError lastError() const;

private:
    QLockFile m_lockFile;
    QString m_error;
    LockConflictInfo m_conflict;
    bool m_locked = false;
    QLockFile::LockError m_lastError = QLockFile::NoError;
};

} // namespace horus::shell::utils
