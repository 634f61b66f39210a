module;
#include <QDebug>
#include <QHash>
#include <QString>
#include <QTextStream>

module nava.core.progress_reporter;

import nava.core.job;

static bool isTerminalKind(ProgressEvent::Kind kind)
{
    switch (kind) {
    case ProgressEvent::Kind::Succeeded:
    case ProgressEvent::Kind::Failed:
    case ProgressEvent::Kind::Skipped:
    case ProgressEvent::Kind::Canceled:
        return true;
    default:
        return false;
    }
}

ConsoleProgressReporter::ConsoleProgressReporter(QTextStream* stream)
    : m_stream(stream)
{
}

void ConsoleProgressReporter::setTotal(int total)
{
    m_total = qMax(0, total);
    m_done = 0;
}

QString ConsoleProgressReporter::counterPrefix() const
{
    if (m_total <= 0) return QString();
    return QStringLiteral("[%1/%2] ").arg(m_done).arg(m_total);
}

void ConsoleProgressReporter::onEvent(const ProgressEvent& event)
{
    if (!m_stream) return;
    QString line;
    switch (event.kind) {
    case ProgressEvent::Kind::Started:
        line = QStringLiteral("Downloading %1").arg(event.displayName);
        break;
    case ProgressEvent::Kind::BytesWritten:
        return;
    case ProgressEvent::Kind::Retrying:
        line = QStringLiteral("Retrying %1 (attempt %2): %3")
                   .arg(event.displayName)
                   .arg(event.attempt)
                   .arg(event.reason);
        break;
    case ProgressEvent::Kind::Succeeded:
        ++m_done;
        line = QStringLiteral("Saved %1 -> %2").arg(event.displayName, event.targetPath);
        break;
    case ProgressEvent::Kind::Failed:
        ++m_done;
        line = QStringLiteral("Failed %1: %2").arg(event.displayName, event.reason);
        break;
    case ProgressEvent::Kind::Skipped:
        ++m_done;
        line = QStringLiteral("Skipping %1 (already downloaded)").arg(event.displayName);
        break;
    case ProgressEvent::Kind::Canceled:
        ++m_done;
        line = QStringLiteral("Canceled %1").arg(event.displayName);
        break;
    }
    *m_stream << counterPrefix() << line << Qt::endl;
}

LogProgressReporter::LogProgressReporter(qint64 bytesInterval)
    : m_bytesInterval(qMax<qint64>(1, bytesInterval))
{
}

void LogProgressReporter::onEvent(const ProgressEvent& event)
{
    if (event.kind == ProgressEvent::Kind::BytesWritten) {
        const qint64 last = m_lastLogged.value(event.jobId, 0);
        if (event.bytes - last < m_bytesInterval) return;
        m_lastLogged.insert(event.jobId, event.bytes);
        qDebug() << "[Progress] job" << event.jobId << "bytes" << event.bytes;
        return;
    }
    if (isTerminalKind(event.kind)) {
        m_lastLogged.remove(event.jobId);
    }
    qDebug().noquote() << "[Progress] job" << event.jobId
                       << progressEventKindName(event.kind)
                       << event.displayName
                       << (event.reason.isEmpty() ? QString() : event.reason);
}
