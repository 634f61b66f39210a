/*!
 * @file        worker.cppm
 * @brief       Fetch-and-transcode execution of a single job.
 * @details     DownloadWorker runs one job to completion: it streams the
 *              encoded audio into <target>.part, fetches the cover image
 *              into <target>.cover when cover art is enabled, runs the
 *              transcoder into <target>.transcode, verifies the output and
 *              its checksum, and finally renames the result onto the target
 *              path. Temporary files are removed on success, failure and
 *              cancellation, so a partial file is never visible at the
 *              target path. A missing cover never fails the job.
 *
 *              Transient failures are retried with bounded exponential
 *              backoff. Not found, unauthorized, disk full, permission and
 *              missing-transcoder failures end the job immediately.
 *
 *              A worker never touches the ledger; the scheduler records the
 *              LedgerEntry carried by a successful result.
 *
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     See LICENSE.md in the project root.
 */

module;
#include <QObject>
#include <QByteArray>
#include <QFile>
#include <QFutureWatcher>
#include <QNetworkReply>
#include <QPointer>
#include <QString>
#include <QTimer>

#ifndef Q_MOC_RUN
export module nava.core.worker;
import nava.core.track;
import nava.core.job;
import nava.core.ledger;
import nava.core.pipeline_error;
import nava.services.session;
import nava.services.catalog_client;
import nava.services.audio_source;
import nava.services.transcoder;
#endif

#ifdef Q_MOC_RUN
#define NAVA_MODULE_EXPORT
#else
#define NAVA_MODULE_EXPORT export
#endif

/**
 * @brief Retry and cancellation policy of a worker.
 */
NAVA_MODULE_EXPORT struct WorkerOptions {
    int maxAttempts = 3;            //!< Attempts per job, at least 1.
    int retryBaseDelayMs = 1000;    //!< Delay before the second attempt.
    int retryMaxDelayMs = 8000;     //!< Upper bound of the backoff delay.
    int cancelGraceMs = 3000;       //!< Terminate-to-kill grace period for child processes.
};

/**
 * @brief Outcome of one execute() call.
 */
NAVA_MODULE_EXPORT struct WorkerResult {
    PipelineError error;        //!< Default value on success.
    LedgerEntry entry;          //!< Filled on success only.
    int attempts = 0;           //!< Attempts made.
    qint64 bytesFetched = 0;    //!< Encoded bytes fetched by the last attempt.

    bool succeeded() const { return !error.isError(); }
};

/**
 * @brief Executes one DownloadJob.
 *
 * A worker is single use: execute() once, then wait for finished(). All
 * work happens on the event loop; the checksum runs on the Qt Concurrent
 * thread pool.
 */
NAVA_MODULE_EXPORT class DownloadWorker : public QObject {

    Q_OBJECT

public:
    /**
     * @brief Construct a worker.
     * @param session Session authorizing the fetch.
     * @param source Audio source. Not owned; must outlive the worker.
     * @param transcoder Encoder program and argument template.
     * @param options Retry and cancellation policy.
     * @param parent Parent QObject.
     */
    DownloadWorker(const Session& session,
                   AudioSource* source,
                   const TranscoderSettings& transcoder,
                   const WorkerOptions& options,
                   QObject* parent = nullptr);
    ~DownloadWorker() override;

    /**
     * @brief Start executing @p job.
     *
     * Returns immediately; the first attempt starts on the next event loop
     * iteration. finished() is emitted exactly once.
     */
    void execute(const DownloadJob& job);

    /**
     * @brief Cancel the job.
     *
     * Child processes get the configured grace period before being killed.
     * Temporaries are removed and finished() reports Canceled.
     */
    void abort();

    /**
     * @brief Enable cover art download through @p client. Not owned.
     *
     * Covers are fetched for mp3 output with an image URL, and only when the
     * transcoder settings carry a cover template.
     */
    void setCoverClient(CatalogClient* client) { m_covers = client; }

    const DownloadJob& job() const { return m_job; }
    WorkerResult result() const { return m_result; }
    bool isRunning() const { return m_stage != Stage::Idle && m_stage != Stage::Done; }
    int attempts() const { return m_attempt; }

    //!< @brief Backoff before the attempt following failed attempt @p attempt (1-based).
    static int backoffDelayMs(int attempt, const WorkerOptions& options);

signals:
    void attemptStarted(int attempt);
    void bytesWritten(qint64 total);
    void retrying(int nextAttempt, const PipelineError& error);
    void finished();

private:
    enum class Stage { Idle, Fetching, Cover, Transcoding, Verifying, Waiting, Done };

    void startAttempt();
    void onStreamData(const QByteArray& chunk);
    void onStreamFinished(const PipelineError& error);
    bool wantsCover() const;
    void startCover();
    void onCoverReady(const QByteArray& image, const PipelineError& error);
    void startTranscode(const QString& coverPath);
    void onTranscodeFinished(const PipelineError& error);
    void onChecksumReady();
    void attemptFailed(const PipelineError& error);
    void complete(const PipelineError& error);
    void releaseStream();
    void releaseTranscoder();
    void releaseChecksum();
    void releaseCover();
    void cleanupTemporaries();

    Session m_session;
    AudioSource* m_source = nullptr;
    TranscoderSettings m_transcoderSettings;
    WorkerOptions m_options;

    DownloadJob m_job;
    WorkerResult m_result;
    Stage m_stage = Stage::Idle;
    int m_attempt = 0;
    bool m_canceled = false;

    QString m_targetPath;                           //!< Normalized target.
    QString m_partPath;                             //!< Raw fetched audio.
    QString m_transcodePath;                        //!< Encoder output.
    QString m_coverPath;                            //!< Downloaded cover image.
    QFile m_partFile;
    qint64 m_bytes = 0;

    QPointer<AudioStream> m_stream;
    QPointer<Transcoder> m_transcoder;
    QPointer<QFutureWatcher<QString>> m_checksumWatcher;
    QPointer<CatalogClient> m_covers;
    QPointer<QNetworkReply> m_coverReply;
    QTimer m_retryTimer;
};

#include "worker.moc"
