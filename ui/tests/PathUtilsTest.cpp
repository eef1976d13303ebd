#include <QtTest>

#include <QByteArray>
#include <QDir>
#include <QTemporaryDir>
#include <QUrl>

#include "utils/PathUtils.hpp"

using horus::shell::utils::expandEnvironmentPlaceholders;
using horus::shell::utils::expandPath;

class PathUtilsTest : public QObject
{
    Q_OBJECT

private Q_SLOTS:
    void expandPath_resolvesHome()
    {
        const QString home = QDir::homePath();
        QCOMPARE(expandPath(QStringLiteral("~")), QDir::cleanPath(home));
        QCOMPARE(expandPath(QStringLiteral("~/backend")), QDir::cleanPath(home + QStringLiteral("/backend")));
    }

    void expandPath_resolvesEnvironment()
    {
        const QByteArray varName = QByteArrayLiteral("HORUS_PATH_UTILS_TEST");
        const QString value = QDir::homePath() + QStringLiteral("/env-test");
        QVERIFY(qputenv(varName.constData(), value.toUtf8()));

        const QString expanded = expandPath(QStringLiteral("$HORUS_PATH_UTILS_TEST/backend"));
        QCOMPARE(expanded, QDir::cleanPath(value + QStringLiteral("/backend")));

        const QString braced = expandPath(QStringLiteral("${HORUS_PATH_UTILS_TEST}/venv"));
        QCOMPARE(braced, QDir::cleanPath(value + QStringLiteral("/venv")));
    }

    void expandPath_resolvesWindowsStyle()
    {
        const QByteArray varName = QByteArrayLiteral("HORUS_PATH_UTILS_WIN");
        const QString value = QDir::homePath() + QStringLiteral("/win-test");
        QVERIFY(qputenv(varName.constData(), value.toUtf8()));

        const QString expanded = expandPath(QStringLiteral("%HORUS_PATH_UTILS_WIN%/logs"));
        QCOMPARE(expanded, QDir::cleanPath(value + QStringLiteral("/logs")));
    }

    void expandPath_normalizesWindowsDrivePrefixes()
    {
        QCOMPARE(expandPath(QStringLiteral("C:/Program Files/Horus/backend")),
                 QStringLiteral("C:/Program Files/Horus/backend"));
        QCOMPARE(expandPath(QStringLiteral("D:\\Apps\\horus\\backend")), QStringLiteral("D:/Apps/horus/backend"));
    }

    void expandPath_resolvesFileUrl()
    {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());

        const QUrl url = QUrl::fromLocalFile(dir.path());
        QCOMPARE(expandPath(url.toString(QUrl::PreferLocalFile)), QDir::cleanPath(dir.path()));

        const QString explicitUrl = QStringLiteral("file://%1/backend").arg(dir.path());
        QCOMPARE(expandPath(explicitUrl), QDir::cleanPath(dir.path() + QStringLiteral("/backend")));
    }

#if defined(Q_OS_UNIX)
    void expandPath_resolvesUserHome()
    {
        const QByteArray userEnv = qgetenv("USER");
        if (userEnv.isEmpty())
            QSKIP("USER is not set, skipping the ~user case.");

        const QString username = QString::fromLocal8Bit(userEnv);
        const QString path = expandPath(QStringLiteral("~%1/.config").arg(username));
        const QString expected = QDir::cleanPath(QDir::homePath() + QStringLiteral("/.config"));
        QCOMPARE(path, expected);
    }
#endif

    void expandPath_keepsUnknownVariables()
    {
        const QString original = QStringLiteral("$HORUS_PATH_UTILS_UNKNOWN/data");
        QCOMPARE(expandPath(original), QDir::cleanPath(QDir::current().absoluteFilePath(original)));
    }

    void expandPath_emptyStaysEmpty()
    {
        QVERIFY(expandPath(QString()).isEmpty());
        QVERIFY(expandPath(QStringLiteral("   ")).isEmpty());
    }

    void expandEnvironmentPlaceholders_leavesLoneMarkers()
    {
        QCOMPARE(expandEnvironmentPlaceholders(QStringLiteral("100% $ ${}")), QStringLiteral("100% $ ${}"));
    }
};

QTEST_MAIN(PathUtilsTest)
#include "PathUtilsTest.moc"
