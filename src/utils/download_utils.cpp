module;
#include <QByteArray>
#include <QByteArrayView>
#include <QCryptographicHash>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QRegularExpression>
#include <QUrl>
#include <QtGlobal>

module nava.utils.download_utils;

namespace nava::utils {

QString normalizeFilePath(const QString& path)
{
    QString local = path.trimmed();
    if (local.isEmpty()) return QString();
    if (local.startsWith("file://")) {
        QUrl url(local);
        if (url.isValid() && url.isLocalFile()) {
            local = url.toLocalFile();
        }
    }
    if (local == QStringLiteral("~")) {
        local = QDir::homePath();
    } else if (local.startsWith(QStringLiteral("~/"))) {
        local = QDir::homePath() + local.mid(1);
    }
    return QDir::cleanPath(QFileInfo(local).absoluteFilePath());
}

QString sanitizeFileName(const QString& value)
{
    static const QString unsafe = QStringLiteral("\\/:*?'<>\"");
    QString out;
    out.reserve(value.size());
    for (const QChar c : value) {
        if (unsafe.contains(c)) continue;
        out.append(c == QLatin1Char('|') ? QLatin1Char('-') : c);
    }
    out = out.trimmed();
    if (out == QStringLiteral(".") || out == QStringLiteral("..")) return QStringLiteral("_");
    return out;
}

QString partPathFor(const QString& targetPath)
{
    return targetPath + ".part";
}

QString transcodePathFor(const QString& targetPath)
{
    return targetPath + ".transcode";
}

QString coverPathFor(const QString& targetPath)
{
    return targetPath + ".cover";
}

QString expandPlaceholders(const QString& text, const QHash<QString, QString>& values)
{
    static const QRegularExpression placeholder(QStringLiteral("\\{(\\w+)\\}"));
    QString out;
    out.reserve(text.size());
    qsizetype last = 0;
    QRegularExpressionMatchIterator it = placeholder.globalMatch(text);
    while (it.hasNext()) {
        const QRegularExpressionMatch match = it.next();
        const auto value = values.constFind(match.captured(1));
        if (value == values.constEnd()) continue;
        out.append(QStringView(text).mid(last, match.capturedStart() - last));
        out.append(value.value());
        last = match.capturedEnd();
    }
    out.append(QStringView(text).mid(last));
    return out;
}

QString fileSha256(const QString& path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) return QString();
    QCryptographicHash hash(QCryptographicHash::Sha256);
    QByteArray buffer;
    buffer.resize(1024 * 1024);
    while (!file.atEnd()) {
        const qint64 readBytes = file.read(buffer.data(), buffer.size());
        if (readBytes < 0) return QString();
        if (readBytes == 0) break;
        hash.addData(QByteArrayView(buffer.constData(), static_cast<qsizetype>(readBytes)));
    }
    file.close();
    return QString::fromLatin1(hash.result().toHex());
}

QString normalizeChecksum(const QString& value)
{
    QString out = value.trimmed().toLower();
    out.remove(' ');
    return out;
}

bool isDiskFullError(QFileDevice::FileError error)
{
    return error == QFileDevice::ResourceError;
}

bool removeIfExists(const QString& path)
{
    if (path.isEmpty() || !QFile::exists(path)) return true;
    return QFile::remove(path);
}

bool replaceFile(const QString& source, const QString& target)
{
    const QString backup = target + ".old";
    const bool hadTarget = QFile::exists(target);
    if (hadTarget) {
        if (!removeIfExists(backup) || !QFile::rename(target, backup)) return false;
    }
    if (!QFile::rename(source, target)) {
        if (hadTarget && !QFile::rename(backup, target)) {
            qWarning() << "[Utils] cannot restore" << target << "from" << backup;
        }
        return false;
    }
    if (hadTarget && !QFile::remove(backup)) {
        qWarning() << "[Utils] cannot remove" << backup;
    }
    return true;
}

} // namespace nava::utils
