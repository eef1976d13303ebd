#pragma once

#include <QCommandLineParser>
#include <QObject>
#include <QQmlApplicationEngine>
#include <QString>

#include <memory>

#include "backend/BackendSupervisorConfig.hpp"

class BackendSupervisor;
class BackendStatusController;

/**
 * @brief Wires the backend supervisor into the shell.
 *
 * Reads the supervisor configuration from the command line (with HORUS_SHELL_* environment
 * fallbacks), publishes the control surface to QML as "backendStatus" and drives the
 * initial check and the shutdown of an owned backend.
 */
class ShellApplication : public QObject {
    Q_OBJECT
    Q_PROPERTY(QObject* backendStatus READ backendStatus CONSTANT)

public:
    explicit ShellApplication(QQmlApplicationEngine& engine, QObject* parent = nullptr);
    ~ShellApplication() override;

    void configureParser(QCommandLineParser& parser) const;
    //! Applies options and environment fallbacks; returns false when a value had to be replaced by its default.
    bool applyParser(const QCommandLineParser& parser);

    BackendSupervisorConfig supervisorConfig() const { return m_config; }
    bool autostartEnabled() const { return m_autostart; }
    QString logRules() const { return m_logRules; }

    BackendSupervisor* supervisor() const { return m_supervisor.get(); }
    BackendStatusController* statusController() const { return m_statusController.get(); }
    QObject* backendStatus() const;

public slots:
    void start();
    void stop();

private:
    QQmlApplicationEngine&                   m_engine;
    BackendSupervisorConfig                  m_config;
    std::unique_ptr<BackendSupervisor>       m_supervisor;
    std::unique_ptr<BackendStatusController> m_statusController;
    bool                                     m_autostart = true;
    QString                                  m_logRules;
    bool                                     m_started = false;
};
