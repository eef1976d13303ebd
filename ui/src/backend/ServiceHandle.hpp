#pragma once

#include <QByteArray>
#include <QObject>
#include <QProcess>
#include <QProcessEnvironment>
#include <QString>
#include <QStringList>
#include <QTimer>

//! Exclusive reference to a companion-service process spawned by the shell.
class ServiceHandle : public QObject {
    Q_OBJECT

public:
    explicit ServiceHandle(QObject* parent = nullptr);
    ~ServiceHandle() override;

    virtual qint64 processId() const = 0;
    virtual bool isRunning() const = 0;
    virtual QString workingDirectory() const = 0;

    //! Requests termination and escalates to a kill after graceMs. Does not block.
    virtual void terminate(int graceMs) = 0;

    //! Blocking variant reserved for application shutdown.
    virtual void terminateAndWait(int timeoutMs) = 0;

    void setReadinessMarkers(const QStringList& markers);
    bool readinessSeen() const { return m_readinessSeen; }

    //! Last stderr lines joined with " | ", used to enrich exit diagnostics.
    QString lastErrorLines(int maxLines = 3) const;

signals:
    void outputLine(const QString& line, bool fromStderr);
    void readinessSignalled();
    void exited(int exitCode, bool crashed);

protected:
    void recordLine(const QString& line, bool fromStderr);

private:
    QStringList m_readinessMarkers;
    QStringList m_stderrTail;
    bool        m_readinessSeen = false;
};

class ProcessServiceHandle final : public ServiceHandle {
    Q_OBJECT

public:
    struct Options {
        QString             program;
        QStringList         arguments;
        QString             workingDirectory;
        QProcessEnvironment environment = QProcessEnvironment::systemEnvironment();
        QStringList         readinessMarkers;
    };

    explicit ProcessServiceHandle(Options options, QObject* parent = nullptr);
    ~ProcessServiceHandle() override;

    //! Spawns asynchronously; reports through spawned() or spawnFailed().
    void start();

    qint64 processId() const override;
    bool isRunning() const override;
    QString workingDirectory() const override { return m_options.workingDirectory; }
    void terminate(int graceMs) override;
    void terminateAndWait(int timeoutMs) override;

    QString program() const { return m_options.program; }
    QStringList arguments() const { return m_options.arguments; }

signals:
    void spawned();
    void spawnFailed(const QString& message);

private:
    void handleErrorOccurred(QProcess::ProcessError error);
    void handleFinished(int exitCode, QProcess::ExitStatus status);
    void drainChannel(QProcess::ProcessChannel channel, bool flush = false);

    Options    m_options;
    QProcess   m_process;
    QTimer     m_killTimer;
    QByteArray m_stdoutBuffer;
    QByteArray m_stderrBuffer;
    bool       m_exitReported = false;
};
