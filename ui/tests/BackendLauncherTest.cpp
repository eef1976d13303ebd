#include <QtTest/QtTest>

#include <QDir>
#include <QFile>
#include <QTemporaryDir>

#include <memory>
#include <optional>

#include "backend/BackendLauncher.hpp"

namespace {

bool writeScript(const QString& path, const QByteArray& body)
{
    QFile file(path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate))
        return false;
    if (file.write(body) != body.size())
        return false;
    file.close();
    return file.setPermissions(QFileDevice::ReadOwner | QFileDevice::WriteOwner | QFileDevice::ExeOwner);
}

// Backend installation whose venv interpreter is a shell script standing in for python.
BackendInstallation makeInstallation(const QTemporaryDir& tmp, const QByteArray& interpreterBody)
{
    QDir root(tmp.path());
    root.mkpath(QStringLiteral("venv/bin"));
    QFile entry(root.filePath(QStringLiteral("app.py")));
    if (entry.open(QIODevice::WriteOnly))
        entry.write("print('backend')\n");
    entry.close();
    writeScript(root.filePath(QStringLiteral("venv/bin/python3")), interpreterBody);

    BackendInstallation installation;
    installation.directory = tmp.path();
    installation.entryPoint = root.filePath(QStringLiteral("app.py"));
    return installation;
}

struct LaunchCapture {
    std::optional<bool>            ok;
    QString                        error;
    std::unique_ptr<ServiceHandle> handle;
    int                            callbacks = 0;
    bool                           exited = false;
    int                            exitCode = -1;
};

BackendLauncher::Callback captureInto(LaunchCapture& capture)
{
    return [&capture](LaunchResult result) {
        ++capture.callbacks;
        capture.ok = result.ok();
        capture.error = result.errorMessage;
        if (result.handle) {
            // Connected inside the callback so a fast exit cannot be missed.
            QObject::connect(result.handle.get(), &ServiceHandle::exited, [&capture](int exitCode, bool) {
                capture.exited = true;
                capture.exitCode = exitCode;
            });
            capture.handle = std::move(result.handle);
        }
    };
}

} // namespace

class BackendLauncherTest : public QObject {
    Q_OBJECT

private slots:
    void initTestCase();
    void locatesVirtualEnvironmentInterpreter();
    void fallsBackToConfiguredInterpreter();
    void reportsMissingInterpreter();
    void planCarriesEntryPointAndEnvironment();
    void launchSpawnsAndDetectsReadiness();
    void exitIsReportedWithStderrTail();
    void terminateStopsTheChild();
    void badInterpreterFailsToSpawn();
    void missingInterpreterFailsAsynchronously();
    void secondLaunchWhilePendingIsRejected();
};

void BackendLauncherTest::initTestCase()
{
#if !defined(Q_OS_UNIX)
    QSKIP("Launcher tests use /bin/sh scripts as a stand-in interpreter.");
#endif
}

void BackendLauncherTest::locatesVirtualEnvironmentInterpreter()
{
    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());
    makeInstallation(tmp, QByteArrayLiteral("#!/bin/sh\nexit 0\n"));

    bool isolated = false;
    QString error;
    const QString interpreter = BackendLauncher::locateInterpreter(tmp.path(), QStringLiteral("python3"),
                                                                   &isolated, &error);
    QCOMPARE(interpreter, QDir(tmp.path()).filePath(QStringLiteral("venv/bin/python3")));
    QVERIFY(isolated);
    QVERIFY(error.isEmpty());
}

void BackendLauncherTest::fallsBackToConfiguredInterpreter()
{
    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());

    bool isolated = true;
    const QString interpreter = BackendLauncher::locateInterpreter(tmp.path(), QStringLiteral("/bin/sh"), &isolated);
    QCOMPARE(interpreter, QStringLiteral("/bin/sh"));
    QVERIFY(!isolated);

    const QString onPath = BackendLauncher::locateInterpreter(tmp.path(), QStringLiteral("sh"));
    QVERIFY(!onPath.isEmpty());
    QVERIFY(onPath.endsWith(QStringLiteral("/sh")));
}

void BackendLauncherTest::reportsMissingInterpreter()
{
    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());

    QString error;
    QVERIFY(BackendLauncher::locateInterpreter(tmp.path(), QStringLiteral("/nonexistent/python3"), nullptr, &error)
                .isEmpty());
    QVERIFY(error.contains(QStringLiteral("/nonexistent/python3")));

    error.clear();
    QVERIFY(BackendLauncher::locateInterpreter(tmp.path(), QStringLiteral("horus-no-such-python"), nullptr, &error)
                .isEmpty());
    QVERIFY(error.contains(QStringLiteral("PATH")));
}

void BackendLauncherTest::planCarriesEntryPointAndEnvironment()
{
    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());
    const BackendInstallation installation = makeInstallation(tmp, QByteArrayLiteral("#!/bin/sh\nexit 0\n"));

    BackendLauncher launcher;
    launcher.setPort(5123);
    const BackendLauncher::LaunchPlan plan = launcher.planLaunch(installation);

    QVERIFY(plan.isValid());
    QVERIFY(plan.isolatedRuntime);
    QCOMPARE(plan.arguments, QStringList{QStringLiteral("app.py")});
    QCOMPARE(plan.workingDirectory, tmp.path());
    QCOMPARE(plan.environment.value(QStringLiteral("PYTHONUNBUFFERED")), QStringLiteral("1"));
    QCOMPARE(plan.environment.value(QStringLiteral("FLASK_PORT")), QStringLiteral("5123"));

    const BackendLauncher::LaunchPlan invalid = launcher.planLaunch(BackendInstallation{});
    QVERIFY(!invalid.isValid());
    QVERIFY(!invalid.errorMessage.isEmpty());
}

void BackendLauncherTest::launchSpawnsAndDetectsReadiness()
{
    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());
    const BackendInstallation installation = makeInstallation(
        tmp,
        QByteArrayLiteral("#!/bin/sh\n"
                          "echo \"entry $1 port $FLASK_PORT\"\n"
                          "echo ' * Running on http://127.0.0.1:5000' 1>&2\n"
                          "exec sleep 30\n"));

    BackendLauncher launcher;
    launcher.setPort(5099);
    LaunchCapture capture;
    launcher.launch(installation, captureInto(capture));

    QTRY_VERIFY_WITH_TIMEOUT(capture.ok.has_value(), 5000);
    QVERIFY2(capture.ok.value(), qPrintable(capture.error));
    QVERIFY(capture.handle);
    QVERIFY(!launcher.isLaunchPending());
    QVERIFY(capture.handle->processId() > 0);
    QCOMPARE(capture.handle->workingDirectory(), tmp.path());

    QTRY_VERIFY_WITH_TIMEOUT(capture.handle->readinessSeen(), 5000);
    QVERIFY(capture.handle->lastErrorLines().contains(QStringLiteral("Running on")));
    QVERIFY(capture.handle->isRunning());

    capture.handle->terminate(1000);
    QTRY_VERIFY_WITH_TIMEOUT(capture.exited, 5000);
    QVERIFY(!capture.handle->isRunning());
}

void BackendLauncherTest::exitIsReportedWithStderrTail()
{
    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());
    const BackendInstallation installation = makeInstallation(
        tmp,
        QByteArrayLiteral("#!/bin/sh\n"
                          "echo 'Traceback (most recent call last):' 1>&2\n"
                          "echo 'ModuleNotFoundError: No module named flask' 1>&2\n"
                          "exit 3\n"));

    BackendLauncher launcher;
    LaunchCapture capture;
    launcher.launch(installation, captureInto(capture));

    QTRY_VERIFY_WITH_TIMEOUT(capture.ok.has_value(), 5000);
    QVERIFY(capture.ok.value());
    QTRY_VERIFY_WITH_TIMEOUT(capture.exited, 5000);
    QCOMPARE(capture.exitCode, 3);
    QVERIFY(capture.handle->lastErrorLines().contains(QStringLiteral("No module named flask")));
    QVERIFY(!capture.handle->readinessSeen());
}

void BackendLauncherTest::terminateStopsTheChild()
{
    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());
    // Ignores SIGTERM so that the grace period has to escalate to a kill.
    const BackendInstallation installation = makeInstallation(
        tmp, QByteArrayLiteral("#!/bin/sh\ntrap '' TERM\nwhile true; do sleep 1; done\n"));

    BackendLauncher launcher;
    LaunchCapture capture;
    launcher.launch(installation, captureInto(capture));

    QTRY_VERIFY_WITH_TIMEOUT(capture.ok.has_value(), 5000);
    QVERIFY(capture.ok.value());
    QVERIFY(capture.handle->isRunning());

    capture.handle->terminate(200);
    QTRY_VERIFY_WITH_TIMEOUT(capture.exited, 5000);
    QVERIFY(!capture.handle->isRunning());
}

void BackendLauncherTest::badInterpreterFailsToSpawn()
{
    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());
    const BackendInstallation installation = makeInstallation(
        tmp, QByteArrayLiteral("#!/nonexistent/interpreter\nprint('never')\n"));

    BackendLauncher launcher;
    LaunchCapture capture;
    launcher.launch(installation, captureInto(capture));

    QTRY_VERIFY_WITH_TIMEOUT(capture.ok.has_value(), 5000);
    QVERIFY(!capture.ok.value());
    QVERIFY(!capture.error.isEmpty());
    QVERIFY(!capture.handle);
    QCOMPARE(capture.callbacks, 1);
    QVERIFY(!launcher.isLaunchPending());
}

void BackendLauncherTest::missingInterpreterFailsAsynchronously()
{
    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());
    BackendInstallation installation;
    installation.directory = tmp.path();
    installation.entryPoint = QDir(tmp.path()).filePath(QStringLiteral("app.py"));

    BackendLauncher launcher;
    launcher.setPythonExecutable(QStringLiteral("/nonexistent/python3"));
    LaunchCapture capture;
    launcher.launch(installation, captureInto(capture));

    QCOMPARE(capture.callbacks, 0);
    QTRY_COMPARE_WITH_TIMEOUT(capture.callbacks, 1, 2000);
    QVERIFY(!capture.ok.value());
    QVERIFY(capture.error.contains(QStringLiteral("/nonexistent/python3")));
}

void BackendLauncherTest::secondLaunchWhilePendingIsRejected()
{
    QTemporaryDir tmp;
    QVERIFY(tmp.isValid());
    const BackendInstallation installation = makeInstallation(tmp, QByteArrayLiteral("#!/bin/sh\nexec sleep 30\n"));

    BackendLauncher launcher;
    LaunchCapture first;
    LaunchCapture second;
    launcher.launch(installation, captureInto(first));
    QVERIFY(launcher.isLaunchPending());
    launcher.launch(installation, captureInto(second));

    QTRY_VERIFY_WITH_TIMEOUT(first.ok.has_value() && second.ok.has_value(), 5000);
    QVERIFY(first.ok.value());
    QVERIFY(!second.ok.value());
    QVERIFY(second.error.contains(QStringLiteral("already in progress")));
    QCOMPARE(first.callbacks, 1);
    QCOMPARE(second.callbacks, 1);
}

QTEST_MAIN(BackendLauncherTest)
#include "BackendLauncherTest.moc"
