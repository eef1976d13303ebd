#include "ShellApplication.hpp"

#include <QLoggingCategory>
#include <QQmlContext>
#include <QStringList>

#include <optional>

#include "backend/BackendSupervisor.hpp"
#include "health/BackendStatusController.hpp"
#include "utils/PathUtils.hpp"

Q_LOGGING_CATEGORY(lcShellApp, "horus.shell.app")

namespace {

using horus::shell::utils::expandPath;

constexpr char kBackendDirEnv[] = "HORUS_BACKEND_DIR";
constexpr char kBackendEntryEnv[] = "HORUS_SHELL_BACKEND_ENTRY";
constexpr char kPythonEnv[] = "HORUS_SHELL_PYTHON";
constexpr char kBackendPortEnv[] = "HORUS_SHELL_BACKEND_PORT";
constexpr char kProbePathEnv[] = "HORUS_SHELL_PROBE_PATH";
constexpr char kProbeTimeoutEnv[] = "HORUS_SHELL_PROBE_TIMEOUT_MS";
constexpr char kStartupDelayEnv[] = "HORUS_SHELL_STARTUP_DELAY_MS";
constexpr char kMonitorIntervalEnv[] = "HORUS_SHELL_MONITOR_INTERVAL_MS";
constexpr char kStopGraceEnv[] = "HORUS_SHELL_STOP_GRACE_MS";
constexpr char kReadyMarkerEnv[] = "HORUS_SHELL_READY_MARKER";
constexpr char kNoAutostartEnv[] = "HORUS_SHELL_NO_AUTOSTART";
constexpr char kLogRulesEnv[] = "HORUS_SHELL_LOG_RULES";

std::optional<QString> envValue(const QByteArray& key)
{
    if (!qEnvironmentVariableIsSet(key.constData()))
        return std::nullopt;
    return qEnvironmentVariable(key.constData());
}

std::optional<bool> envBool(const QByteArray& key)
{
    const auto valueOpt = envValue(key);
    if (!valueOpt.has_value())
        return std::nullopt;
    const QString normalized = valueOpt->trimmed().toLower();
    if (normalized.isEmpty())
        return std::nullopt;
    if (normalized == QStringLiteral("1") || normalized == QStringLiteral("true") ||
        normalized == QStringLiteral("yes") || normalized == QStringLiteral("on"))
        return true;
    if (normalized == QStringLiteral("0") || normalized == QStringLiteral("false") ||
        normalized == QStringLiteral("no") || normalized == QStringLiteral("off"))
        return false;
    qCWarning(lcShellApp) << "Invalid value" << *valueOpt << "in" << QString::fromUtf8(key)
                          << "- expected a boolean (true/false)";
    return std::nullopt;
}

std::optional<QString> optionOrEnv(const QCommandLineParser& parser, const QString& option, const QByteArray& envKey)
{
    if (parser.isSet(option))
        return parser.value(option).trimmed();
    if (const auto value = envValue(envKey); value.has_value() && !value->trimmed().isEmpty())
        return value->trimmed();
    return std::nullopt;
}

// Returns fallback (and clears ok) when the option or variable holds something other than an integer >= minimum.
int integerSetting(const QCommandLineParser& parser,
                   const QString& option,
                   const QByteArray& envKey,
                   int fallback,
                   int minimum,
                   bool* ok)
{
    const auto raw = optionOrEnv(parser, option, envKey);
    if (!raw.has_value())
        return fallback;
    bool parsed = false;
    const int value = raw->toInt(&parsed);
    if (parsed && value >= minimum)
        return value;
    qCWarning(lcShellApp) << "Invalid value" << *raw << "for" << option
                          << "- expected an integer >=" << minimum << ", using" << fallback;
    if (ok)
        *ok = false;
    return fallback;
}

} // namespace

ShellApplication::ShellApplication(QQmlApplicationEngine& engine, QObject* parent)
    : QObject(parent)
    , m_engine(engine)
    , m_supervisor(std::make_unique<BackendSupervisor>(m_config))
    , m_statusController(std::make_unique<BackendStatusController>(m_supervisor.get()))
{
    m_engine.rootContext()->setContextProperty(QStringLiteral("shellController"), this);
    m_engine.rootContext()->setContextProperty(QStringLiteral("backendStatus"), m_statusController.get());
}

ShellApplication::~ShellApplication()
{
    // The controller observes the supervisor and must go first.
    m_statusController.reset();
    m_supervisor.reset();
}

QObject* ShellApplication::backendStatus() const
{
    return m_statusController.get();
}

void ShellApplication::configureParser(QCommandLineParser& parser) const
{
    const BackendSupervisorConfig defaults;
    parser.addHelpOption();
    parser.addVersionOption();
    parser.addOption({"backend-dir", tr("Backend installation directory, searched before the default locations"),
                      tr("path")});
    parser.addOption({"backend-entry", tr("Entry point file of the backend"), tr("file"), defaults.entryPoint});
    parser.addOption({"python", tr("Python interpreter used when the installation ships no virtual environment"),
                      tr("program")});
    parser.addOption({"backend-port", tr("Port the backend listens on"), tr("port"),
                      QString::number(defaults.port)});
    parser.addOption({"probe-path", tr("HTTP path requested by the liveness probe"), tr("path"),
                      defaults.probePath});
    parser.addOption({"probe-timeout-ms", tr("Liveness probe timeout"), tr("ms"),
                      QString::number(defaults.probeTimeoutMs)});
    parser.addOption({"startup-delay-ms", tr("Delay before a freshly started backend is verified"), tr("ms"),
                      QString::number(defaults.startupDelayMs)});
    parser.addOption({"monitor-interval-ms", tr("Re-probe interval while running (0 disables)"), tr("ms"),
                      QString::number(defaults.monitorIntervalMs)});
    parser.addOption({"stop-grace-ms", tr("Time the backend gets to exit before it is killed"), tr("ms"),
                      QString::number(defaults.stopGraceMs)});
    parser.addOption({"ready-marker", tr("Output text announcing that the backend is listening (repeatable)"),
                      tr("text")});
    parser.addOption({"no-autostart", tr("Do not check or start the backend on launch")});
    parser.addOption({"log-rules", tr("Logging filter rules, e.g. horus.shell.backend.*.debug=true"),
                      tr("rules")});
}

bool ShellApplication::applyParser(const QCommandLineParser& parser)
{
    BackendSupervisorConfig config;
    bool ok = true;

    if (const auto dir = optionOrEnv(parser, QStringLiteral("backend-dir"), kBackendDirEnv); dir.has_value())
        config.backendDirOverride = expandPath(*dir);
    if (const auto entry = optionOrEnv(parser, QStringLiteral("backend-entry"), kBackendEntryEnv);
        entry.has_value() && !entry->isEmpty())
        config.entryPoint = *entry;
    if (const auto python = optionOrEnv(parser, QStringLiteral("python"), kPythonEnv);
        python.has_value() && !python->isEmpty())
        config.pythonExecutable = python->contains(QLatin1Char('/')) ? expandPath(*python) : *python;
    if (const auto probePath = optionOrEnv(parser, QStringLiteral("probe-path"), kProbePathEnv);
        probePath.has_value() && !probePath->isEmpty())
        config.probePath = probePath->startsWith(QLatin1Char('/')) ? *probePath : QLatin1Char('/') + *probePath;

    config.port = integerSetting(parser, QStringLiteral("backend-port"), kBackendPortEnv, config.port, 1, &ok);
    if (config.port > 65535) {
        qCWarning(lcShellApp) << "Backend port" << config.port << "is out of range, using 5000";
        config.port = BackendSupervisorConfig{}.port;
        ok = false;
    }
    config.probeTimeoutMs = integerSetting(parser, QStringLiteral("probe-timeout-ms"), kProbeTimeoutEnv,
                                           config.probeTimeoutMs, 1, &ok);
    config.startupDelayMs = integerSetting(parser, QStringLiteral("startup-delay-ms"), kStartupDelayEnv,
                                           config.startupDelayMs, 0, &ok);
    config.monitorIntervalMs = integerSetting(parser, QStringLiteral("monitor-interval-ms"), kMonitorIntervalEnv,
                                              config.monitorIntervalMs, 0, &ok);
    config.stopGraceMs = integerSetting(parser, QStringLiteral("stop-grace-ms"), kStopGraceEnv,
                                        config.stopGraceMs, 0, &ok);

    QStringList markers = parser.values(QStringLiteral("ready-marker"));
    if (markers.isEmpty()) {
        if (const auto envMarkers = envValue(kReadyMarkerEnv); envMarkers.has_value())
            markers = envMarkers->split(QLatin1Char(';'), Qt::SkipEmptyParts);
    }
    markers.removeAll(QString());
    if (!markers.isEmpty())
        config.readinessMarkers = markers;

    m_autostart = !parser.isSet(QStringLiteral("no-autostart"));
    if (m_autostart) {
        if (const auto disabled = envBool(kNoAutostartEnv); disabled.has_value())
            m_autostart = !disabled.value();
    }

    m_logRules.clear();
    if (const auto rules = optionOrEnv(parser, QStringLiteral("log-rules"), kLogRulesEnv); rules.has_value())
        m_logRules = *rules;
    if (!m_logRules.isEmpty()) {
        QString filterRules = m_logRules;
        filterRules.replace(QLatin1Char(';'), QLatin1Char('\n'));
        QLoggingCategory::setFilterRules(filterRules);
    }

    m_config = config;
    m_supervisor->setConfig(m_config);

    qCInfo(lcShellApp) << "Backend supervisor configured: port" << m_config.port
                       << "probe" << m_config.probePath
                       << "override" << (m_config.backendDirOverride.isEmpty() ? QStringLiteral("<none>")
                                                                                : m_config.backendDirOverride);
    return ok;
}

void ShellApplication::start()
{
    if (m_started)
        return;
    m_started = true;
    if (!m_autostart) {
        qCInfo(lcShellApp) << "Autostart disabled, waiting for an explicit check";
        return;
    }
    m_supervisor->check();
}

void ShellApplication::stop()
{
    if (!m_supervisor)
        return;
    m_supervisor->shutdown();
}
