#include <QApplication>
#include <QCommandLineParser>
#include <QGuiApplication>
#include <QMessageBox>
#include <QObject>
#include <QQmlApplicationEngine>
#include <QStringList>
#include <QTextStream>

#include "app/ShellApplication.hpp"
#include "utils/RuntimeUtils.hpp"

int main(int argc, char* argv[]) {
    QApplication app(argc, argv);
    QGuiApplication::setOrganizationName(QStringLiteral("horus"));
    QGuiApplication::setApplicationName(QStringLiteral("Horus Shell"));
    QGuiApplication::setApplicationVersion(QStringLiteral("0.1.0"));

    const QString platform = QGuiApplication::platformName();
    const bool showDialog = platform.compare(QStringLiteral("offscreen"), Qt::CaseInsensitive) != 0;

    QQmlApplicationEngine engine;
    ShellApplication controller(engine);

    QCommandLineParser parser;
    parser.setApplicationDescription(QObject::tr("Desktop shell supervising the local Horus backend"));
    controller.configureParser(parser);
    parser.process(app);
    controller.applyParser(parser);

    const QString lockPath = horus::shell::utils::runtimeLockFilePath();
    QString directoryError;
    if (!horus::shell::utils::ensureLockFileDirectory(lockPath, &directoryError)) {
        const QString message = directoryError.isEmpty()
            ? QObject::tr("Could not prepare the instance lock directory.")
            : directoryError;
        QTextStream(stderr) << message << Qt::endl;
        if (showDialog)
            QMessageBox::critical(nullptr, QObject::tr("Horus Shell"), message);
        return EXIT_FAILURE;
    }

    horus::shell::utils::SingleInstanceGuard guard(lockPath);
    if (!guard.tryAcquire()) {
        QString message;
        if (guard.hasConflict()) {
            const auto conflict = guard.conflictInfo();
            QStringList parts;
            if (conflict.pid > 0)
                parts << QObject::tr("PID %1").arg(conflict.pid);
            if (!conflict.hostname.isEmpty())
                parts << QObject::tr("host %1").arg(conflict.hostname);
            if (!conflict.applicationId.isEmpty())
                parts << QObject::tr("application %1").arg(conflict.applicationId);

            const QString suffix = parts.isEmpty() ? QString() : QStringLiteral(" (%1)").arg(parts.join(QStringLiteral(", ")));
            message = QObject::tr("Horus Shell is already running%1.").arg(suffix);
        } else {
            message = guard.errorString().isEmpty()
                ? QObject::tr("Could not acquire the instance lock (error code %1).").arg(guard.lastError())
                : guard.errorString();
        }
        QTextStream(stderr) << message << Qt::endl;
        if (showDialog)
            QMessageBox::critical(nullptr, QObject::tr("Horus Shell"), message);
        return EXIT_FAILURE;
    }

    engine.load(QUrl(QStringLiteral("qrc:/qml/main.qml")));
    if (engine.rootObjects().isEmpty()) {
        return -1;
    }

    QMetaObject::invokeMethod(&controller, &ShellApplication::start, Qt::QueuedConnection);
    const int exitCode = app.exec();
    controller.stop();
    return exitCode;
}
