#include "PathUtils.hpp"

#include <QByteArray>
#include <QDir>
#include <QFileInfo>
#include <QUrl>
#include <QtGlobal>

#include <optional>

#if defined(Q_OS_UNIX)
#    include <algorithm>
#    include <limits>
#    include <pwd.h>
#    include <sys/types.h>
#    include <unistd.h>
#endif

namespace {

std::optional<QString> lookupVariable(const QString& name)
{
    if (name.isEmpty())
        return std::nullopt;
    const QByteArray key = name.toUtf8();
    if (!qEnvironmentVariableIsSet(key.constData()))
        return std::nullopt;
    return qEnvironmentVariable(key.constData());
}

bool isVariableChar(QChar ch)
{
    return ch.isLetterOrNumber() || ch == QLatin1Char('_');
}

#if defined(Q_OS_UNIX)
QString homeDirectoryOf(const QString& user)
{
    const QByteArray name = user.trimmed().toUtf8();
    if (name.isEmpty())
        return {};

    long bufSize = sysconf(_SC_GETPW_R_SIZE_MAX);
    if (bufSize < 0)
        bufSize = 16384;
    QByteArray buffer;
    buffer.resize(static_cast<int>(std::min<long>(bufSize, std::numeric_limits<int>::max())));

    struct passwd pwd;
    struct passwd* found = nullptr;
    const int rc = getpwnam_r(name.constData(), &pwd, buffer.data(), static_cast<size_t>(buffer.size()), &found);
    if (rc != 0 || !found || !found->pw_dir)
        return {};
    return QString::fromLocal8Bit(found->pw_dir);
}
#else
QString homeDirectoryOf(const QString& user)
{
    Q_UNUSED(user);
    return {};
}
#endif

QString expandHome(const QString& path)
{
    if (path == QStringLiteral("~"))
        return QDir::homePath();
    if (path.startsWith(QStringLiteral("~/")))
        return QDir::homePath() + path.mid(1);
    if (!path.startsWith(QLatin1Char('~')))
        return path;

    const int slash = path.indexOf(QLatin1Char('/'), 1);
    const QString user = slash < 0 ? path.mid(1) : path.mid(1, slash - 1);
    const QString home = homeDirectoryOf(user);
    if (home.isEmpty())
        return path;
    return slash < 0 ? home : home + path.mid(slash);
}

QString localFileFromUrl(const QString& path)
{
    if (!path.startsWith(QStringLiteral("file:"), Qt::CaseInsensitive))
        return path;
    const QUrl url = QUrl::fromUserInput(path);
    if (!url.isValid() || !url.isLocalFile())
        return path;
    const QString local = url.toLocalFile();
    return local.isEmpty() ? url.path() : local;
}

bool isWindowsAbsolute(const QString& path)
{
    if (path.startsWith(QStringLiteral("\\\\")))
        return true;
    if (path.size() < 2 || path.at(1) != QLatin1Char(':'))
        return false;
    const QChar drive = path.at(0).toLower();
    return drive >= QLatin1Char('a') && drive <= QLatin1Char('z');
}

} // namespace

namespace horus::shell::utils {

QString expandEnvironmentPlaceholders(const QString& text)
{
    QString result;
    result.reserve(text.size());

    int index = 0;
    while (index < text.size()) {
        const QChar ch = text.at(index);

        if (ch == QLatin1Char('$') && index + 1 < text.size() && text.at(index + 1) == QLatin1Char('{')) {
            const int end = text.indexOf(QLatin1Char('}'), index + 2);
            if (end > index + 2) {
                const auto value = lookupVariable(text.mid(index + 2, end - index - 2));
                result.append(value ? *value : text.mid(index, end - index + 1));
                index = end + 1;
                continue;
            }
        } else if (ch == QLatin1Char('$')) {
            int end = index + 1;
            while (end < text.size() && isVariableChar(text.at(end)))
                ++end;
            if (end > index + 1) {
                const auto value = lookupVariable(text.mid(index + 1, end - index - 1));
                result.append(value ? *value : text.mid(index, end - index));
                index = end;
                continue;
            }
        } else if (ch == QLatin1Char('%')) {
            const int end = text.indexOf(QLatin1Char('%'), index + 1);
            if (end > index + 1) {
                const auto value = lookupVariable(text.mid(index + 1, end - index - 1));
                if (value) {
                    result.append(*value);
                    index = end + 1;
                    continue;
                }
            }
        }

        result.append(ch);
        ++index;
    }
    return result;
}

QString expandPath(const QString& path)
{
    const QString trimmed = path.trimmed();
    if (trimmed.isEmpty())
        return {};

    QString expanded = expandHome(localFileFromUrl(expandEnvironmentPlaceholders(trimmed)));

    if (isWindowsAbsolute(expanded)) {
        expanded.replace(QLatin1Char('\\'), QLatin1Char('/'));
        if (expanded.size() == 2)
            expanded.append(QLatin1Char('/'));
        return QDir::cleanPath(expanded);
    }

    if (QFileInfo(expanded).isRelative())
        expanded = QDir::current().absoluteFilePath(expanded);
    return QDir::cleanPath(expanded);
}

} // namespace horus::shell::utils
