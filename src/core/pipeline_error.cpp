module;
#include <QString>

module nava.core.pipeline_error;

static bool transientByDefault(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::Transient:
    case ErrorKind::ProcessFailed:
    case ErrorKind::Truncated:
        return true;
    default:
        return false;
    }
}

PipelineError::PipelineError(ErrorDomain domain, ErrorKind kind, const QString& message)
    : m_domain(domain),
    m_kind(kind),
    m_message(message),
    m_transient(transientByDefault(kind))
{
}

PipelineError PipelineError::resolution(ErrorKind kind, const QString& message)
{
    return PipelineError(ErrorDomain::Resolution, kind, message);
}

PipelineError PipelineError::fetch(ErrorKind kind, const QString& message)
{
    return PipelineError(ErrorDomain::Fetch, kind, message);
}

PipelineError PipelineError::transcode(ErrorKind kind, const QString& message)
{
    return PipelineError(ErrorDomain::Transcode, kind, message);
}

PipelineError PipelineError::storage(ErrorKind kind, const QString& message)
{
    return PipelineError(ErrorDomain::Storage, kind, message);
}

PipelineError PipelineError::canceled(const QString& message)
{
    return PipelineError(ErrorDomain::Canceled, ErrorKind::Canceled,
                         message.isEmpty() ? QStringLiteral("Canceled") : message);
}

PipelineError PipelineError::withTransient(bool transient) const
{
    PipelineError copy = *this;
    copy.m_transient = transient;
    return copy;
}

QString PipelineError::toString() const
{
    if (!isError()) return QStringLiteral("OK");
    const QString head = QStringLiteral("%1.%2").arg(errorDomainName(m_domain), errorKindName(m_kind));
    if (m_message.isEmpty()) return head;
    return QStringLiteral("%1: %2").arg(head, m_message);
}

QString errorDomainName(ErrorDomain domain)
{
    switch (domain) {
    case ErrorDomain::None: return QStringLiteral("None");
    case ErrorDomain::Resolution: return QStringLiteral("ResolutionError");
    case ErrorDomain::Fetch: return QStringLiteral("FetchError");
    case ErrorDomain::Transcode: return QStringLiteral("TranscodeError");
    case ErrorDomain::Storage: return QStringLiteral("StorageError");
    case ErrorDomain::Canceled: return QStringLiteral("Canceled");
    }
    return QStringLiteral("Unknown");
}

QString errorKindName(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::None: return QStringLiteral("None");
    case ErrorKind::NotFound: return QStringLiteral("NotFound");
    case ErrorKind::Unauthorized: return QStringLiteral("Unauthorized");
    case ErrorKind::Transient: return QStringLiteral("Transient");
    case ErrorKind::ProcessFailed: return QStringLiteral("ProcessFailed");
    case ErrorKind::Truncated: return QStringLiteral("Truncated");
    case ErrorKind::DiskFull: return QStringLiteral("DiskFull");
    case ErrorKind::PermissionDenied: return QStringLiteral("PermissionDenied");
    case ErrorKind::CorruptLedger: return QStringLiteral("CorruptLedger");
    case ErrorKind::Canceled: return QStringLiteral("Canceled");
    }
    return QStringLiteral("Unknown");
}
