/*!
 * @file        job.cppm
 * @brief       Download jobs, progress events and run summaries.
 * @details     A DownloadJob wraps an immutable TrackDescriptor with the
 *              mutable run-time state owned by the scheduler. Progress events
 *              are the fixed set of notifications delivered to reporters, and
 *              RunSummary is the aggregate outcome of one scheduler run.
 *
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     See LICENSE.md in the project root.
 */

module;
#include <QString>
#include <QVector>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module nava.core.job;
import nava.core.track;
import nava.core.pipeline_error;
#endif

#ifdef Q_MOC_RUN
#define NAVA_MODULE_EXPORT
#else
#define NAVA_MODULE_EXPORT export
#endif

/**
 * @brief Lifecycle state of a job.
 *
 * Pending -> Active -> Succeeded | Failed, or Pending -> Skipped when the
 * ledger already holds a verified file. Canceled is reachable from Pending
 * and Active once the run is canceled.
 */
NAVA_MODULE_EXPORT enum class JobStatus {
    Pending,
    Active,
    Succeeded,
    Failed,
    Skipped,
    Canceled
};

//!< @brief Lowercase status name ("pending", "active", ...).
NAVA_MODULE_EXPORT QString jobStatusString(JobStatus status);

//!< @brief True for Succeeded, Failed, Skipped and Canceled.
NAVA_MODULE_EXPORT bool isTerminalStatus(JobStatus status);

/**
 * @brief A descriptor plus mutable run-time status.
 */
NAVA_MODULE_EXPORT struct DownloadJob {
    quint64 id = 0;                         //!< Unique within a run.
    TrackDescriptor descriptor;
    JobStatus status = JobStatus::Pending;
    int attempt = 0;                        //!< Attempts made so far.
    PipelineError lastError;
};

NAVA_MODULE_EXPORT using JobList = QVector<DownloadJob>;

/**
 * @brief Notification delivered to progress reporters.
 */
NAVA_MODULE_EXPORT struct ProgressEvent {
    enum class Kind {
        Started,        //!< Job admitted and running its first attempt.
        BytesWritten,   //!< @c bytes holds the running total of fetched bytes.
        Retrying,       //!< @c attempt holds the attempt about to start.
        Succeeded,
        Failed,         //!< @c reason holds the error text.
        Skipped,
        Canceled
    };

    quint64 jobId = 0;
    Kind kind = Kind::Started;
    QString displayName;
    QString targetPath;
    qint64 bytes = 0;
    int attempt = 0;
    QString reason;
};

//!< @brief Lowercase event name ("started", "bytesWritten", ...).
NAVA_MODULE_EXPORT QString progressEventKindName(ProgressEvent::Kind kind);

/**
 * @brief One failed item of a run.
 */
NAVA_MODULE_EXPORT struct JobFailure {
    TrackDescriptor descriptor;
    PipelineError error;
};

/**
 * @brief Aggregate outcome of a scheduler run.
 */
NAVA_MODULE_EXPORT struct RunSummary {
    int succeeded = 0;
    int failed = 0;
    int skipped = 0;
    int canceled = 0;
    QVector<JobFailure> errors;

    bool hasFailures() const { return failed > 0; }
    int total() const { return succeeded + failed + skipped + canceled; }
};
