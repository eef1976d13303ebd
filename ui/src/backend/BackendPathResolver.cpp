#include "BackendPathResolver.hpp"

#include <QCoreApplication>
#include <QDir>
#include <QFileInfo>
#include <QLoggingCategory>
#include <QObject>
#include <QSet>
#include <QStandardPaths>

#include <utility>

#include "utils/PathUtils.hpp"

Q_LOGGING_CATEGORY(lcBackendResolver, "horus.shell.backend.resolver")

using horus::shell::utils::expandPath;

BackendPathResolver::BackendPathResolver(QString entryPointName)
    : m_entryPointName(std::move(entryPointName))
{
    if (m_entryPointName.trimmed().isEmpty())
        m_entryPointName = QStringLiteral("app.py");
}

void BackendPathResolver::setCandidates(const QStringList& candidates)
{
    m_candidates = candidates;
}

BackendResolveResult BackendPathResolver::resolve() const
{
    BackendResolveResult result;
    QStringList failures;
    QSet<QString> seen;

    for (const QString& raw : m_candidates) {
        const QString candidate = expandPath(raw);
        if (candidate.isEmpty() || seen.contains(candidate))
            continue;
        seen.insert(candidate);
        result.searched.append(candidate);

        const QFileInfo dirInfo(candidate);
        if (!dirInfo.exists() || !dirInfo.isDir()) {
            qCDebug(lcBackendResolver) << "Candidate missing" << candidate;
            continue;
        }
        if (!dirInfo.isReadable() || !dirInfo.isExecutable()) {
            failures.append(QObject::tr("Cannot access %1: permission denied").arg(candidate));
            qCWarning(lcBackendResolver) << "Candidate not accessible" << candidate;
            continue;
        }

        const QFileInfo entryInfo(QDir(candidate).filePath(m_entryPointName));
        if (!entryInfo.exists() || !entryInfo.isFile()) {
            qCDebug(lcBackendResolver) << "No" << m_entryPointName << "in" << candidate;
            continue;
        }
        if (!entryInfo.isReadable()) {
            failures.append(QObject::tr("Cannot read %1: permission denied").arg(entryInfo.absoluteFilePath()));
            qCWarning(lcBackendResolver) << "Entry point not readable" << entryInfo.absoluteFilePath();
            continue;
        }

        result.status = BackendResolveResult::Status::Found;
        result.installation.directory = QDir::cleanPath(dirInfo.absoluteFilePath());
        result.installation.entryPoint = QDir::cleanPath(entryInfo.absoluteFilePath());
        qCInfo(lcBackendResolver) << "Backend installation found in" << result.installation.directory;
        return result;
    }

    if (!failures.isEmpty()) {
        result.status = BackendResolveResult::Status::Failed;
        result.errorMessage = failures.join(QStringLiteral("; "));
    } else {
        result.status = BackendResolveResult::Status::NotFound;
    }
    return result;
}

QStringList BackendPathResolver::defaultCandidates(const QString& overrideDir)
{
    QStringList candidates;
    if (!overrideDir.trimmed().isEmpty())
        candidates.append(overrideDir.trimmed());

    const QString downloads = QStandardPaths::writableLocation(QStandardPaths::DownloadLocation);
    if (!downloads.isEmpty())
        candidates.append(QDir(downloads).filePath(QStringLiteral("backend")));

    candidates.append(QDir(QDir::homePath()).filePath(QStringLiteral("backend")));

    if (QCoreApplication::instance()) {
        const QDir appDir(QCoreApplication::applicationDirPath());
#ifdef Q_OS_MACOS
        candidates.append(QDir::cleanPath(appDir.filePath(QStringLiteral("../Resources/backend"))));
#else
        candidates.append(appDir.filePath(QStringLiteral("resources/backend")));
#endif
        candidates.append(QDir::cleanPath(appDir.filePath(QStringLiteral("../backend"))));
    }

    const QString appData = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    if (!appData.isEmpty())
        candidates.append(QDir(appData).filePath(QStringLiteral("backend")));

    return candidates;
}
