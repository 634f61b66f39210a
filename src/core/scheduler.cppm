/*!
 * @file        scheduler.cppm
 * @brief       Concurrency-bounded download scheduling.
 * @details     DownloadScheduler owns the jobs of a run. It admits pending
 *              jobs while fewer than the configured number are active, never
 *              runs two jobs for the same target path at once, skips jobs
 *              whose target already holds a verified file, and is the only
 *              component that writes to the ledger.
 *
 *              The skip check hashes the existing file on the Qt Concurrent
 *              thread pool. A job being verified holds an admission slot and
 *              its target path until the checksum is known; it is then
 *              skipped or admitted.
 *
 *              Failures are isolated: a failed job is listed in the run
 *              summary and the remaining jobs keep running. cancel() stops
 *              admission, cancels waiting jobs and aborts active workers; the
 *              run finishes once every worker has reported back.
 *
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     See LICENSE.md in the project root.
 */

module;
#include <QObject>
#include <QFutureWatcher>
#include <QHash>
#include <QSet>
#include <QString>
#include <QVector>

#include <functional>

#ifndef Q_MOC_RUN
export module nava.core.scheduler;
import nava.core.track;
import nava.core.job;
import nava.core.ledger;
import nava.core.pipeline_error;
import nava.core.progress_reporter;
import nava.core.worker;
#endif

#ifdef Q_MOC_RUN
#define NAVA_MODULE_EXPORT
#else
#define NAVA_MODULE_EXPORT export
#endif

/**
 * @brief Per-run scheduling policy.
 */
NAVA_MODULE_EXPORT struct SchedulerOptions {
    int concurrency = 3;        //!< Maximum active jobs, must be positive.
    bool skipExisting = true;   //!< Skip jobs with a verified ledger entry.
};

/**
 * @brief Creates a fresh worker for one job.
 *
 * The scheduler takes ownership of the returned worker.
 */
NAVA_MODULE_EXPORT using WorkerFactory = std::function<DownloadWorker*(QObject* parent)>;

/**
 * @brief Admits jobs to workers and aggregates the run outcome.
 *
 * All state lives on the event loop thread, so admission and ledger writes
 * need no locking.
 */
NAVA_MODULE_EXPORT class DownloadScheduler : public QObject {

    Q_OBJECT

public:
    /**
     * @brief Construct a scheduler.
     * @param ledger Completion ledger. Not owned; may be null to disable skipping.
     * @param factory Worker factory.
     * @param parent Parent QObject.
     */
    DownloadScheduler(CompletionLedger* ledger, WorkerFactory factory, QObject* parent = nullptr);
    ~DownloadScheduler() override;

    //!< @brief Register a reporter. Not owned.
    void addReporter(ProgressReporter* reporter);
    void removeReporter(ProgressReporter* reporter);

    //!< @brief Wrap descriptors into pending jobs with ids 1..n.
    static JobList makeJobs(const TrackList& tracks);

    /**
     * @brief Start a run.
     *
     * Loads the ledger, then admits jobs from the next event loop iteration
     * on. runFinished() is emitted once every job reached a terminal state.
     *
     * @param jobs Jobs in submission order.
     * @param options Concurrency bound and skip policy.
     * @return false if a run is already active or the concurrency is not positive.
     */
    bool run(const JobList& jobs, const SchedulerOptions& options);

    //!< @brief Cancel the active run.
    void cancel();

    bool isRunning() const { return m_running; }
    bool isCanceled() const { return m_canceled; }

    RunSummary summary() const { return m_summary; }
    JobList jobs() const { return m_jobs; }
    int activeCount() const { return static_cast<int>(m_workers.size()); }

    //!< @brief Highest number of simultaneously active jobs seen in the current run.
    int peakActiveCount() const { return m_peakActive; }

    //!< @brief Jobs whose existing file is being checksummed.
    int verifyingCount() const { return static_cast<int>(m_verifying.size()); }

signals:
    void jobStatusChanged(quint64 jobId, JobStatus status);
    void runFinished(const RunSummary& summary);

private:
    struct Verification {
        int index = -1;
        QString path;           //!< Normalized target.
        QString checksum;       //!< Recorded digest.
    };

    void scheduleAdmission();
    void startQueued();
    void verify(int index, const QString& path, const QString& checksum);
    void onVerified(QFutureWatcher<QString>* watcher);
    void dropVerifications();
    void skip(int index);
    void admit(int index);
    void onWorkerFinished();
    void finishRun();
    void setStatus(int index, JobStatus status);
    void publish(const DownloadJob& job, ProgressEvent::Kind kind,
                 qint64 bytes = 0, int attempt = 0, const QString& reason = QString());

    CompletionLedger* m_ledger = nullptr;
    WorkerFactory m_factory;
    QVector<ProgressReporter*> m_reporters;

    JobList m_jobs;
    SchedulerOptions m_options;
    RunSummary m_summary;
    QHash<DownloadWorker*, int> m_workers;  //!< Active worker -> job index.
    QHash<QFutureWatcher<QString>*, Verification> m_verifying;  //!< Pending skip checks.
    QSet<QString> m_activePaths;            //!< Normalized targets of active jobs.
    int m_peakActive = 0;
    bool m_running = false;
    bool m_canceled = false;
    bool m_admissionScheduled = false;
};

#include "scheduler.moc"
