module;
#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QNetworkReply>
#include <QUrl>
#include <QtConcurrent>

module nava.core.worker;

import nava.core.track;
import nava.core.job;
import nava.core.ledger;
import nava.core.pipeline_error;
import nava.services.session;
import nava.services.catalog_client;
import nava.services.audio_source;
import nava.services.transcoder;
import nava.utils.download_utils;

namespace utils = nava::utils;

DownloadWorker::DownloadWorker(const Session& session,
                               AudioSource* source,
                               const TranscoderSettings& transcoder,
                               const WorkerOptions& options,
                               QObject* parent)
    : QObject(parent),
    m_session(session),
    m_source(source),
    m_transcoderSettings(transcoder),
    m_options(options)
{
    m_options.maxAttempts = qMax(1, m_options.maxAttempts);
    m_retryTimer.setSingleShot(true);
    connect(&m_retryTimer, &QTimer::timeout, this, &DownloadWorker::startAttempt);
}

DownloadWorker::~DownloadWorker()
{
    if (isRunning()) {
        m_canceled = true;
        releaseStream();
        releaseTranscoder();
        releaseChecksum();
        releaseCover();
        if (m_partFile.isOpen()) m_partFile.close();
        cleanupTemporaries();
    }
}

int DownloadWorker::backoffDelayMs(int attempt, const WorkerOptions& options)
{
    const int base = qMax(0, options.retryBaseDelayMs);
    const int cap = qMax(base, options.retryMaxDelayMs);
    qint64 delay = base;
    for (int i = 1; i < attempt && delay < cap; ++i) delay *= 2;
    return static_cast<int>(qMin<qint64>(delay, cap));
}

void DownloadWorker::execute(const DownloadJob& job)
{
    if (m_stage != Stage::Idle) {
        qWarning() << "[Worker] execute ignored, worker already used for job" << m_job.id;
        return;
    }
    m_job = job;
    m_targetPath = utils::normalizeFilePath(job.descriptor.targetPath);
    m_partPath = utils::partPathFor(m_targetPath);
    m_transcodePath = utils::transcodePathFor(m_targetPath);
    m_coverPath = utils::coverPathFor(m_targetPath);
    m_attempt = job.attempt;
    m_stage = Stage::Waiting;
    QTimer::singleShot(0, this, &DownloadWorker::startAttempt);
}

void DownloadWorker::startAttempt()
{
    if (m_stage != Stage::Waiting || m_canceled) return;
    ++m_attempt;
    m_bytes = 0;
    m_stage = Stage::Fetching;
    emit attemptStarted(m_attempt);

    if (!m_source) {
        complete(PipelineError::fetch(ErrorKind::ProcessFailed, QStringLiteral("No audio source configured"))
                     .withTransient(false));
        return;
    }

    const QString dir = QFileInfo(m_targetPath).absolutePath();
    if (!QDir().mkpath(dir)) {
        complete(PipelineError::storage(ErrorKind::PermissionDenied,
                                        QStringLiteral("Cannot create directory %1").arg(dir)));
        return;
    }

    cleanupTemporaries();
    m_partFile.setFileName(m_partPath);
    if (!m_partFile.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
        const ErrorKind kind = utils::isDiskFullError(m_partFile.error()) ? ErrorKind::DiskFull
                                                                          : ErrorKind::PermissionDenied;
        complete(PipelineError::storage(kind, QStringLiteral("Cannot open %1: %2")
                                                  .arg(m_partPath, m_partFile.errorString())));
        return;
    }

    qDebug() << "[Worker] job" << m_job.id << "attempt" << m_attempt << "fetching" << m_job.descriptor.id;
    AudioStream* stream = m_source->open(m_session, m_job.descriptor, this);
    m_stream = stream;
    connect(stream, &AudioStream::dataAvailable, this, &DownloadWorker::onStreamData);
    connect(stream, &AudioStream::finished, this, &DownloadWorker::onStreamFinished);
    stream->start();
}

void DownloadWorker::onStreamData(const QByteArray& chunk)
{
    if (m_stage != Stage::Fetching || m_canceled) return;
    const qint64 written = m_partFile.write(chunk);
    if (written != chunk.size()) {
        const ErrorKind kind = utils::isDiskFullError(m_partFile.error()) ? ErrorKind::DiskFull
                                                                          : ErrorKind::PermissionDenied;
        const PipelineError error = PipelineError::storage(kind, QStringLiteral("Write to %1 failed: %2")
                                                                     .arg(m_partPath, m_partFile.errorString()));
        m_partFile.close();
        releaseStream();
        attemptFailed(error);
        return;
    }
    m_bytes += written;
    emit bytesWritten(m_bytes);
}

void DownloadWorker::onStreamFinished(const PipelineError& error)
{
    if (m_stage != Stage::Fetching) return;
    releaseStream();

    if (m_canceled) {
        m_partFile.close();
        complete(PipelineError::canceled());
        return;
    }

    const bool flushed = m_partFile.flush();
    const QFileDevice::FileError fileError = m_partFile.error();
    m_partFile.close();

    if (error.isError()) {
        attemptFailed(error);
        return;
    }
    if (!flushed) {
        const ErrorKind kind = utils::isDiskFullError(fileError) ? ErrorKind::DiskFull : ErrorKind::PermissionDenied;
        attemptFailed(PipelineError::storage(kind, QStringLiteral("Cannot flush %1").arg(m_partPath)));
        return;
    }
    if (m_bytes == 0) {
        attemptFailed(PipelineError::fetch(ErrorKind::Transient, QStringLiteral("Audio stream was empty")));
        return;
    }

    m_result.bytesFetched = m_bytes;
    if (wantsCover()) {
        startCover();
        return;
    }
    startTranscode(QString());
}

bool DownloadWorker::wantsCover() const
{
    return m_covers && m_transcoderSettings.embedsCover()
        && m_job.descriptor.format == AudioFormat::Mp3
        && !m_job.descriptor.imageUrl.isEmpty();
}

void DownloadWorker::startCover()
{
    m_stage = Stage::Cover;
    qDebug() << "[Worker] job" << m_job.id << "fetching cover";
    QPointer<DownloadWorker> self(this);
    m_coverReply = m_covers->getBytes(QUrl(m_job.descriptor.imageUrl),
                                      [self](const QByteArray& image, const PipelineError& error) {
        if (self) self->onCoverReady(image, error);
    });
}

void DownloadWorker::onCoverReady(const QByteArray& image, const PipelineError& error)
{
    if (m_stage != Stage::Cover || !m_coverReply) return;
    m_coverReply = nullptr;

    if (m_canceled) {
        complete(PipelineError::canceled());
        return;
    }
    if (error.isError() || image.isEmpty()) {
        qWarning().noquote() << "[Worker] job" << m_job.id << "cover art unavailable, encoding without it:"
                             << (error.isError() ? error.toString() : QStringLiteral("empty image"));
        startTranscode(QString());
        return;
    }
    QFile file(m_coverPath);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate) || file.write(image) != image.size()) {
        qWarning() << "[Worker] job" << m_job.id << "cannot write cover" << m_coverPath << file.errorString();
        file.close();
        utils::removeIfExists(m_coverPath);
        startTranscode(QString());
        return;
    }
    file.close();
    startTranscode(m_coverPath);
}

void DownloadWorker::startTranscode(const QString& coverPath)
{
    m_stage = Stage::Transcoding;
    auto* transcoder = new Transcoder(m_transcoderSettings, this);
    m_transcoder = transcoder;
    connect(transcoder, &Transcoder::finished, this, &DownloadWorker::onTranscodeFinished);
    transcoder->start(m_partPath, m_transcodePath, m_job.descriptor, m_session.quality(), coverPath);
}

void DownloadWorker::onTranscodeFinished(const PipelineError& error)
{
    if (m_stage != Stage::Transcoding) return;
    releaseTranscoder();

    if (m_canceled) {
        complete(PipelineError::canceled());
        return;
    }
    if (error.isError()) {
        attemptFailed(error);
        return;
    }

    m_stage = Stage::Verifying;
    const QString path = m_transcodePath;
    auto* watcher = new QFutureWatcher<QString>(this);
    m_checksumWatcher = watcher;
    connect(watcher, &QFutureWatcher<QString>::finished, this, &DownloadWorker::onChecksumReady);
    watcher->setFuture(QtConcurrent::run([path]() -> QString {
        return utils::fileSha256(path);
    }));
}

void DownloadWorker::onChecksumReady()
{
    if (m_stage != Stage::Verifying || !m_checksumWatcher) return;
    const QString checksum = m_checksumWatcher->result();
    releaseChecksum();

    if (m_canceled) {
        complete(PipelineError::canceled());
        return;
    }

    const QFileInfo info(m_transcodePath);
    if (checksum.isEmpty() || !info.exists()) {
        attemptFailed(PipelineError::storage(ErrorKind::PermissionDenied,
                                             QStringLiteral("Cannot read %1 for verification").arg(m_transcodePath)));
        return;
    }
    const qint64 size = info.size();
    if (size <= 0) {
        attemptFailed(PipelineError::transcode(ErrorKind::Truncated, QStringLiteral("Transcoder produced no output")));
        return;
    }

    if (!utils::replaceFile(m_transcodePath, m_targetPath)) {
        complete(PipelineError::storage(ErrorKind::PermissionDenied,
                                        QStringLiteral("Cannot move output to %1").arg(m_targetPath)));
        return;
    }

    LedgerEntry entry;
    entry.trackId = m_job.descriptor.id;
    entry.targetPath = m_targetPath;
    entry.completedAt = QDateTime::currentDateTimeUtc();
    entry.size = size;
    entry.checksum = checksum;
    m_result.entry = entry;
    complete(PipelineError());
}

void DownloadWorker::attemptFailed(const PipelineError& error)
{
    if (m_canceled) {
        complete(PipelineError::canceled());
        return;
    }
    if (!error.isTransient() || m_attempt >= m_options.maxAttempts) {
        complete(error);
        return;
    }
    cleanupTemporaries();
    const int delay = backoffDelayMs(m_attempt, m_options);
    qWarning().noquote() << "[Worker] job" << m_job.id << "attempt" << m_attempt << "failed:"
                         << error.toString() << "- retrying in" << delay << "ms";
    m_stage = Stage::Waiting;
    emit retrying(m_attempt + 1, error);
    m_retryTimer.start(delay);
}

void DownloadWorker::abort()
{
    if (!isRunning() || m_canceled) return;
    m_canceled = true;
    m_retryTimer.stop();
    qDebug() << "[Worker] job" << m_job.id << "canceling";

    switch (m_stage) {
    case Stage::Fetching:
        if (m_stream) {
            m_stream->abort(m_options.cancelGraceMs);
            return;
        }
        break;
    case Stage::Cover:
        if (m_coverReply) {
            m_coverReply->abort();
            return;
        }
        break;
    case Stage::Transcoding:
        if (m_transcoder) {
            m_transcoder->abort(m_options.cancelGraceMs);
            return;
        }
        break;
    case Stage::Verifying:
        releaseChecksum();
        break;
    default:
        break;
    }
    if (m_partFile.isOpen()) m_partFile.close();
    complete(PipelineError::canceled());
}

void DownloadWorker::complete(const PipelineError& error)
{
    if (m_stage == Stage::Done) return;
    m_stage = Stage::Done;
    m_retryTimer.stop();
    releaseStream();
    releaseTranscoder();
    releaseChecksum();
    releaseCover();
    if (m_partFile.isOpen()) m_partFile.close();
    cleanupTemporaries();

    m_result.error = error;
    m_result.attempts = m_attempt;
    if (!error.isError()) {
        qDebug() << "[Worker] job" << m_job.id << "saved" << m_targetPath;
    } else if (!error.isCanceled()) {
        qWarning().noquote() << "[Worker] job" << m_job.id << "failed after" << m_attempt
                             << "attempt(s):" << error.toString();
    }
    emit finished();
}

void DownloadWorker::releaseStream()
{
    if (!m_stream) return;
    AudioStream* stream = m_stream;
    m_stream = nullptr;
    stream->disconnect(this);
    stream->abort(0);
    stream->deleteLater();
}

void DownloadWorker::releaseTranscoder()
{
    if (!m_transcoder) return;
    Transcoder* transcoder = m_transcoder;
    m_transcoder = nullptr;
    transcoder->disconnect(this);
    transcoder->abort(0);
    transcoder->deleteLater();
}

void DownloadWorker::releaseChecksum()
{
    if (!m_checksumWatcher) return;
    QFutureWatcher<QString>* watcher = m_checksumWatcher;
    m_checksumWatcher = nullptr;
    watcher->disconnect(this);
    watcher->deleteLater();
}

void DownloadWorker::releaseCover()
{
    if (!m_coverReply) return;
    QNetworkReply* reply = m_coverReply;
    m_coverReply = nullptr;
    reply->abort();
}

void DownloadWorker::cleanupTemporaries()
{
    if (!utils::removeIfExists(m_partPath)) {
        qWarning() << "[Worker] cannot remove" << m_partPath;
    }
    if (!utils::removeIfExists(m_transcodePath)) {
        qWarning() << "[Worker] cannot remove" << m_transcodePath;
    }
    if (!utils::removeIfExists(m_coverPath)) {
        qWarning() << "[Worker] cannot remove" << m_coverPath;
    }
}
