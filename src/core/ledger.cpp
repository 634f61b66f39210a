module;
#include <QByteArray>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QSaveFile>

module nava.core.ledger;

import nava.core.pipeline_error;
import nava.utils.download_utils;

namespace utils = nava::utils;

QJsonObject LedgerEntry::toJson() const
{
    QJsonObject obj;
    obj.insert("trackId", trackId);
    obj.insert("targetPath", targetPath);
    obj.insert("completedAt", completedAt.toUTC().toString(Qt::ISODateWithMs));
    obj.insert("size", static_cast<double>(size));
    obj.insert("checksum", checksum);
    return obj;
}

LedgerEntry LedgerEntry::fromJson(const QJsonObject& obj)
{
    LedgerEntry entry;
    entry.trackId = obj.value("trackId").toString();
    entry.targetPath = utils::normalizeFilePath(obj.value("targetPath").toString());
    entry.completedAt = QDateTime::fromString(obj.value("completedAt").toString(), Qt::ISODateWithMs);
    entry.size = static_cast<qint64>(obj.value("size").toDouble(-1));
    entry.checksum = utils::normalizeChecksum(obj.value("checksum").toString());
    if (entry.size < 0) return LedgerEntry();
    return entry;
}

CompletionLedger::CompletionLedger(const QString& storePath)
    : m_storePath(utils::normalizeFilePath(storePath))
{
}

void CompletionLedger::warn(const QString& message)
{
    m_warnings.append(message);
    qWarning().noquote() << "[Ledger]" << message;
}

bool CompletionLedger::load()
{
    // Without a backing store the in-memory set is authoritative.
    if (m_storePath.isEmpty()) return true;

    m_entries.clear();
    m_order.clear();
    m_warnings.clear();
    m_needsNewline = false;

    QFile file(m_storePath);
    if (!file.exists()) return true;
    if (!file.open(QIODevice::ReadOnly)) {
        warn(QStringLiteral("Cannot open ledger %1: %2; starting empty").arg(m_storePath, file.errorString()));
        return false;
    }

    const QByteArray raw = file.readAll();
    file.close();
    m_needsNewline = !raw.isEmpty() && !raw.endsWith('\n');

    int lineNumber = 0;
    int skipped = 0;
    for (const QByteArray& rawLine : raw.split('\n')) {
        ++lineNumber;
        const QByteArray line = rawLine.trimmed();
        if (line.isEmpty()) continue;
        QJsonParseError parseError;
        const QJsonDocument doc = QJsonDocument::fromJson(line, &parseError);
        if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
            ++skipped;
            continue;
        }
        const LedgerEntry entry = LedgerEntry::fromJson(doc.object());
        if (!entry.isValid()) {
            ++skipped;
            continue;
        }
        if (!m_entries.contains(entry.targetPath)) m_order.append(entry.targetPath);
        m_entries.insert(entry.targetPath, entry);
    }

    if (skipped > 0) {
        warn(QStringLiteral("Skipped %1 corrupt line(s) of %2 in %3")
                 .arg(skipped).arg(lineNumber).arg(m_storePath));
    }
    qDebug() << "[Ledger] loaded" << m_entries.size() << "entries from" << m_storePath;
    return true;
}

bool CompletionLedger::persist(PipelineError* error)
{
    if (m_storePath.isEmpty()) return true;
    const QFileInfo info(m_storePath);
    if (!QDir().mkpath(info.absolutePath())) {
        if (error) *error = PipelineError::storage(ErrorKind::PermissionDenied,
                                   QStringLiteral("Cannot create %1").arg(info.absolutePath()));
        return false;
    }

    QSaveFile file(m_storePath);
    if (!file.open(QIODevice::WriteOnly)) {
        if (error) *error = PipelineError::storage(ErrorKind::PermissionDenied,
                                   QStringLiteral("Cannot write ledger %1: %2").arg(m_storePath, file.errorString()));
        return false;
    }
    for (const QString& key : m_order) {
        const auto it = m_entries.constFind(key);
        if (it == m_entries.constEnd()) continue;
        file.write(QJsonDocument(it->toJson()).toJson(QJsonDocument::Compact));
        file.write("\n");
    }
    if (!file.commit()) {
        const ErrorKind kind = utils::isDiskFullError(file.error()) ? ErrorKind::DiskFull
                                                                    : ErrorKind::PermissionDenied;
        if (error) *error = PipelineError::storage(kind,
                                   QStringLiteral("Cannot commit ledger %1: %2").arg(m_storePath, file.errorString()));
        return false;
    }
    m_needsNewline = false;
    return true;
}

const LedgerEntry* CompletionLedger::candidate(const QString& targetPath, const QString& trackId) const
{
    const LedgerEntry* stored = entry(targetPath);
    if (!stored) return nullptr;
    if (!trackId.isEmpty() && stored->trackId != trackId) return nullptr;

    const QFileInfo info(stored->targetPath);
    if (!info.exists() || !info.isFile()) return nullptr;
    if (info.size() != stored->size) {
        qDebug() << "[Ledger] size mismatch for" << stored->targetPath;
        return nullptr;
    }
    return stored;
}

bool CompletionLedger::has(const QString& targetPath, const QString& trackId) const
{
    const LedgerEntry* stored = candidate(targetPath, trackId);
    if (!stored) return false;
    const QString actual = utils::fileSha256(stored->targetPath);
    if (actual.isEmpty() || actual != stored->checksum) {
        qDebug() << "[Ledger] checksum mismatch for" << stored->targetPath;
        return false;
    }
    return true;
}

bool CompletionLedger::record(const LedgerEntry& entry, PipelineError* error)
{
    LedgerEntry normalized = entry;
    normalized.targetPath = utils::normalizeFilePath(entry.targetPath);
    normalized.checksum = utils::normalizeChecksum(entry.checksum);
    if (!normalized.completedAt.isValid()) normalized.completedAt = QDateTime::currentDateTimeUtc();
    if (!normalized.isValid()) {
        if (error) *error = PipelineError::storage(ErrorKind::CorruptLedger,
                                   QStringLiteral("Refusing to record incomplete ledger entry"));
        return false;
    }

    if (!m_storePath.isEmpty()) {
        QDir().mkpath(QFileInfo(m_storePath).absolutePath());
        QFile file(m_storePath);
        if (!file.open(QIODevice::WriteOnly | QIODevice::Append)) {
            if (error) *error = PipelineError::storage(ErrorKind::PermissionDenied,
                                       QStringLiteral("Cannot append to ledger %1: %2").arg(m_storePath, file.errorString()));
            return false;
        }
        QByteArray line;
        if (m_needsNewline) line.append('\n');
        line.append(QJsonDocument(normalized.toJson()).toJson(QJsonDocument::Compact));
        line.append('\n');
        const qint64 written = file.write(line);
        const bool flushed = written == line.size() && file.flush();
        if (!flushed) {
            const ErrorKind kind = utils::isDiskFullError(file.error()) ? ErrorKind::DiskFull
                                                                        : ErrorKind::PermissionDenied;
            if (error) *error = PipelineError::storage(kind,
                                       QStringLiteral("Cannot append to ledger %1: %2").arg(m_storePath, file.errorString()));
            return false;
        }
        m_needsNewline = false;
    }

    if (!m_entries.contains(normalized.targetPath)) m_order.append(normalized.targetPath);
    m_entries.insert(normalized.targetPath, normalized);
    return true;
}

bool CompletionLedger::forget(const QString& targetPath)
{
    const QString key = utils::normalizeFilePath(targetPath);
    if (m_entries.remove(key) == 0) return false;
    m_order.removeAll(key);
    return true;
}

const LedgerEntry* CompletionLedger::entry(const QString& targetPath) const
{
    const auto it = m_entries.constFind(utils::normalizeFilePath(targetPath));
    if (it == m_entries.constEnd()) return nullptr;
    return &it.value();
}

QVector<LedgerEntry> CompletionLedger::entries() const
{
    QVector<LedgerEntry> out;
    out.reserve(m_order.size());
    for (const QString& key : m_order) {
        const auto it = m_entries.constFind(key);
        if (it != m_entries.constEnd()) out.append(it.value());
    }
    return out;
}
