#pragma once

#include <QObject>
#include <QProcessEnvironment>
#include <QString>
#include <QStringList>

#include <functional>
#include <memory>

#include "backend/BackendPathResolver.hpp"
#include "backend/ServiceHandle.hpp"

struct LaunchResult {
    std::unique_ptr<ServiceHandle> handle;
    QString                        errorMessage;

    bool ok() const { return handle != nullptr; }

    static LaunchResult success(std::unique_ptr<ServiceHandle> handle);
    static LaunchResult failure(const QString& message);
};

class BackendLauncherInterface {
public:
    using Callback = std::function<void(LaunchResult)>;

    virtual ~BackendLauncherInterface() = default;

    virtual void setPythonExecutable(const QString& executable) = 0;
    virtual void setReadinessMarkers(const QStringList& markers) = 0;
    virtual void setPort(int port) = 0;

    //! Spawns the entry point of installation. The callback runs exactly once.
    virtual void launch(const BackendInstallation& installation, Callback done) = 0;
};

class BackendLauncher final : public QObject, public BackendLauncherInterface {
    Q_OBJECT

public:
    struct LaunchPlan {
        QString             program;
        QStringList         arguments;
        QString             workingDirectory;
        QProcessEnvironment environment;
        bool                isolatedRuntime = false;
        QString             errorMessage;

        bool isValid() const { return errorMessage.isEmpty() && !program.isEmpty(); }
    };

    explicit BackendLauncher(QObject* parent = nullptr);
    ~BackendLauncher() override;

    void setPythonExecutable(const QString& executable) override;
    void setReadinessMarkers(const QStringList& markers) override;
    void setPort(int port) override;
    void launch(const BackendInstallation& installation, Callback done) override;

    QString pythonExecutable() const { return m_pythonExecutable; }
    bool isLaunchPending() const { return m_pending != nullptr; }

    LaunchPlan planLaunch(const BackendInstallation& installation) const;

    //! Interpreter inside venv/ or .venv/ when present, otherwise fallback resolved on PATH.
    static QString locateInterpreter(const QString& installationDir,
                                     const QString& fallback,
                                     bool* isolated = nullptr,
                                     QString* errorMessage = nullptr);

private:
    void completePending(bool spawned, const QString& errorMessage);
    void failLater(Callback done, const QString& message);

    QString     m_pythonExecutable;
    QStringList m_readinessMarkers{QStringLiteral("Running on")};
    int         m_port = 5000;

    std::unique_ptr<ProcessServiceHandle> m_pending;
    Callback                              m_pendingCallback;
};
