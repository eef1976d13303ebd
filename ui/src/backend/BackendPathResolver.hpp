#pragma once

#include <QString>
#include <QStringList>

struct BackendInstallation {
    QString directory;
    QString entryPoint;

    bool isValid() const { return !directory.isEmpty(); }
};

struct BackendResolveResult {
    enum class Status {
        Found,
        NotFound,
        Failed,
    };

    Status              status = Status::NotFound;
    BackendInstallation installation;
    QStringList         searched;
    QString             errorMessage;
};

class BackendPathResolver {
public:
    explicit BackendPathResolver(QString entryPointName = QStringLiteral("app.py"));

    void setCandidates(const QStringList& candidates);
    QStringList candidates() const { return m_candidates; }
    QString entryPointName() const { return m_entryPointName; }

    //! First candidate containing the entry point; I/O errors are reported only when nothing matches.
    BackendResolveResult resolve() const;

    //! Platform search order: override, downloads, home, bundled resources, dev checkout, app data.
    static QStringList defaultCandidates(const QString& overrideDir = QString());

private:
    QString     m_entryPointName;
    QStringList m_candidates;
};
