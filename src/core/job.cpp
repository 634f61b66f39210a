module;
#include <QString>

module nava.core.job;

QString jobStatusString(JobStatus status)
{
    switch (status) {
    case JobStatus::Pending: return QStringLiteral("pending");
    case JobStatus::Active: return QStringLiteral("active");
    case JobStatus::Succeeded: return QStringLiteral("succeeded");
    case JobStatus::Failed: return QStringLiteral("failed");
    case JobStatus::Skipped: return QStringLiteral("skipped");
    case JobStatus::Canceled: return QStringLiteral("canceled");
    }
    return QStringLiteral("unknown");
}

bool isTerminalStatus(JobStatus status)
{
    return status != JobStatus::Pending && status != JobStatus::Active;
}

QString progressEventKindName(ProgressEvent::Kind kind)
{
    switch (kind) {
    case ProgressEvent::Kind::Started: return QStringLiteral("started");
    case ProgressEvent::Kind::BytesWritten: return QStringLiteral("bytesWritten");
    case ProgressEvent::Kind::Retrying: return QStringLiteral("retrying");
    case ProgressEvent::Kind::Succeeded: return QStringLiteral("succeeded");
    case ProgressEvent::Kind::Failed: return QStringLiteral("failed");
    case ProgressEvent::Kind::Skipped: return QStringLiteral("skipped");
    case ProgressEvent::Kind::Canceled: return QStringLiteral("canceled");
    }
    return QStringLiteral("unknown");
}
