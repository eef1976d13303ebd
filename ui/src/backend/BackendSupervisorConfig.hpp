#pragma once

#include <QString>
#include <QStringList>

struct BackendSupervisorConfig {
    // Path resolution
    QString      backendDirOverride;
    QString      entryPoint = QStringLiteral("app.py");

    // Launch
#ifdef Q_OS_WIN
    QString      pythonExecutable = QStringLiteral("python");
#else
    QString      pythonExecutable = QStringLiteral("python3");
#endif
    QStringList  readinessMarkers{QStringLiteral("Running on")};
    int          stopGraceMs = 3000;

    // Liveness probe
    QString      host = QStringLiteral("127.0.0.1");
    int          port = 5000;
    QString      probePath = QStringLiteral("/api/market/price/BTC");
    int          probeTimeoutMs = 2000;

    // Scheduling
    int          startupDelayMs = 3000;
    int          monitorIntervalMs = 5000;   // 0 disables periodic re-probing
};
