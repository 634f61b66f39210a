module;
#include <QDebug>
#include <QTimer>
#include <QtConcurrent>

module nava.core.scheduler;

import nava.core.track;
import nava.core.job;
import nava.core.ledger;
import nava.core.pipeline_error;
import nava.core.progress_reporter;
import nava.core.worker;
import nava.utils.download_utils;

namespace utils = nava::utils;

DownloadScheduler::DownloadScheduler(CompletionLedger* ledger, WorkerFactory factory, QObject* parent)
    : QObject(parent),
    m_ledger(ledger),
    m_factory(std::move(factory))
{
}

DownloadScheduler::~DownloadScheduler()
{
    dropVerifications();
    const QList<DownloadWorker*> workers = m_workers.keys();
    m_workers.clear();
    for (DownloadWorker* worker : workers) {
        worker->disconnect(this);
        delete worker;
    }
}

void DownloadScheduler::addReporter(ProgressReporter* reporter)
{
    if (!reporter || m_reporters.contains(reporter)) return;
    m_reporters.append(reporter);
}

void DownloadScheduler::removeReporter(ProgressReporter* reporter)
{
    m_reporters.removeAll(reporter);
}

JobList DownloadScheduler::makeJobs(const TrackList& tracks)
{
    JobList jobs;
    jobs.reserve(tracks.size());
    quint64 nextId = 1;
    for (const TrackDescriptor& track : tracks) {
        DownloadJob job;
        job.id = nextId++;
        job.descriptor = track;
        jobs.append(job);
    }
    return jobs;
}

bool DownloadScheduler::run(const JobList& jobs, const SchedulerOptions& options)
{
    if (m_running) {
        qWarning() << "[Scheduler] run ignored, a run is already active";
        return false;
    }
    if (options.concurrency <= 0) {
        qWarning() << "[Scheduler] concurrency must be positive, got" << options.concurrency;
        return false;
    }
    if (!m_factory) {
        qWarning() << "[Scheduler] no worker factory";
        return false;
    }

    m_jobs = jobs;
    for (DownloadJob& job : m_jobs) {
        job.status = JobStatus::Pending;
        job.attempt = 0;
        job.lastError = PipelineError();
    }
    m_options = options;
    m_summary = RunSummary();
    m_activePaths.clear();
    m_peakActive = 0;
    m_canceled = false;
    m_running = true;

    if (m_ledger) m_ledger->load();

    qInfo() << "[Scheduler] run of" << m_jobs.size() << "job(s), concurrency" << m_options.concurrency
            << (m_options.skipExisting ? "skip enabled" : "skip disabled");
    scheduleAdmission();
    return true;
}

void DownloadScheduler::scheduleAdmission()
{
    if (m_admissionScheduled) return;
    m_admissionScheduled = true;
    QTimer::singleShot(0, this, &DownloadScheduler::startQueued);
}

void DownloadScheduler::startQueued()
{
    m_admissionScheduled = false;
    if (!m_running) return;

    if (!m_canceled) {
        for (int i = 0; i < m_jobs.size(); ++i) {
            if (m_workers.size() + m_verifying.size() >= m_options.concurrency) break;
            const DownloadJob& job = m_jobs.at(i);
            if (job.status != JobStatus::Pending) continue;

            const QString path = utils::normalizeFilePath(job.descriptor.targetPath);
            if (m_activePaths.contains(path)) continue;

            if (m_options.skipExisting && m_ledger) {
                if (const LedgerEntry* stored = m_ledger->candidate(path, job.descriptor.id)) {
                    verify(i, path, stored->checksum);
                    continue;
                }
            }
            admit(i);
        }
    }

    if (!m_workers.isEmpty() || !m_verifying.isEmpty()) return;
    for (const DownloadJob& job : m_jobs) {
        if (job.status == JobStatus::Pending) return;
    }
    finishRun();
}

void DownloadScheduler::verify(int index, const QString& path, const QString& checksum)
{
    auto* watcher = new QFutureWatcher<QString>(this);
    m_verifying.insert(watcher, { index, path, checksum });
    m_activePaths.insert(path);
    connect(watcher, &QFutureWatcher<QString>::finished, this, [this, watcher]() {
        onVerified(watcher);
    });
    qDebug() << "[Scheduler] verifying" << path;
    watcher->setFuture(QtConcurrent::run([path]() -> QString {
        return utils::fileSha256(path);
    }));
}

void DownloadScheduler::onVerified(QFutureWatcher<QString>* watcher)
{
    if (!m_verifying.contains(watcher)) return;
    const Verification verification = m_verifying.take(watcher);
    const QString actual = watcher->result();
    watcher->disconnect(this);
    watcher->deleteLater();
    m_activePaths.remove(verification.path);

    if (m_running && !m_canceled && m_jobs.at(verification.index).status == JobStatus::Pending) {
        if (!actual.isEmpty() && actual == verification.checksum) {
            skip(verification.index);
        } else {
            qDebug() << "[Scheduler] checksum mismatch for" << verification.path << "- downloading again";
            admit(verification.index);
        }
    }
    scheduleAdmission();
}

void DownloadScheduler::dropVerifications()
{
    const QList<QFutureWatcher<QString>*> watchers = m_verifying.keys();
    for (QFutureWatcher<QString>* watcher : watchers) {
        m_activePaths.remove(m_verifying.value(watcher).path);
        watcher->disconnect(this);
        watcher->deleteLater();
    }
    m_verifying.clear();
}

void DownloadScheduler::skip(int index)
{
    setStatus(index, JobStatus::Skipped);
    ++m_summary.skipped;
    publish(m_jobs.at(index), ProgressEvent::Kind::Skipped);
}

void DownloadScheduler::admit(int index)
{
    DownloadJob& job = m_jobs[index];
    DownloadWorker* worker = m_factory(this);
    if (!worker) {
        job.lastError = PipelineError::fetch(ErrorKind::ProcessFailed, QStringLiteral("No worker available"))
                            .withTransient(false);
        setStatus(index, JobStatus::Failed);
        ++m_summary.failed;
        m_summary.errors.append({ job.descriptor, job.lastError });
        publish(job, ProgressEvent::Kind::Failed, 0, 0, job.lastError.toString());
        return;
    }
    worker->setParent(this);

    const QString path = utils::normalizeFilePath(job.descriptor.targetPath);
    m_activePaths.insert(path);
    m_workers.insert(worker, index);
    m_peakActive = qMax(m_peakActive, static_cast<int>(m_workers.size()));
    setStatus(index, JobStatus::Active);
    publish(job, ProgressEvent::Kind::Started, 0, 1);

    const quint64 jobId = job.id;
    connect(worker, &DownloadWorker::attemptStarted, this, [this, index](int attempt) {
        m_jobs[index].attempt = attempt;
    });
    connect(worker, &DownloadWorker::bytesWritten, this, [this, index](qint64 total) {
        publish(m_jobs.at(index), ProgressEvent::Kind::BytesWritten, total);
    });
    connect(worker, &DownloadWorker::retrying, this, [this, index](int nextAttempt, const PipelineError& error) {
        m_jobs[index].lastError = error;
        publish(m_jobs.at(index), ProgressEvent::Kind::Retrying, 0, nextAttempt, error.toString());
    });
    connect(worker, &DownloadWorker::finished, this, &DownloadScheduler::onWorkerFinished);

    qDebug() << "[Scheduler] admitted job" << jobId << "active" << m_workers.size();
    worker->execute(job);
}

void DownloadScheduler::onWorkerFinished()
{
    auto* worker = qobject_cast<DownloadWorker*>(sender());
    if (!worker || !m_workers.contains(worker)) return;
    const int index = m_workers.take(worker);
    worker->disconnect(this);
    worker->deleteLater();

    DownloadJob& job = m_jobs[index];
    const WorkerResult result = worker->result();
    job.attempt = result.attempts;
    m_activePaths.remove(utils::normalizeFilePath(job.descriptor.targetPath));

    if (result.succeeded()) {
        PipelineError ledgerError;
        if (m_ledger && !m_ledger->record(result.entry, &ledgerError)) {
            // Only recorded files may remain at a target path.
            job.lastError = ledgerError;
            if (!utils::removeIfExists(result.entry.targetPath)) {
                qWarning() << "[Scheduler] cannot remove unrecorded" << result.entry.targetPath;
            }
        } else {
            job.lastError = PipelineError();
            setStatus(index, JobStatus::Succeeded);
            ++m_summary.succeeded;
            publish(job, ProgressEvent::Kind::Succeeded);
        }
    } else if (result.error.isCanceled()) {
        job.lastError = result.error;
        setStatus(index, JobStatus::Canceled);
        ++m_summary.canceled;
        publish(job, ProgressEvent::Kind::Canceled);
    } else {
        job.lastError = result.error;
    }

    if (job.status == JobStatus::Active) {
        setStatus(index, JobStatus::Failed);
        ++m_summary.failed;
        m_summary.errors.append({ job.descriptor, job.lastError });
        publish(job, ProgressEvent::Kind::Failed, 0, job.attempt, job.lastError.toString());
    }

    scheduleAdmission();
}

void DownloadScheduler::cancel()
{
    if (!m_running || m_canceled) return;
    m_canceled = true;
    qInfo() << "[Scheduler] canceling run," << m_workers.size() << "active job(s)";

    for (int i = 0; i < m_jobs.size(); ++i) {
        if (m_jobs.at(i).status != JobStatus::Pending) continue;
        m_jobs[i].lastError = PipelineError::canceled();
        setStatus(i, JobStatus::Canceled);
        ++m_summary.canceled;
        publish(m_jobs.at(i), ProgressEvent::Kind::Canceled);
    }

    dropVerifications();

    // abort() may finish a worker synchronously and mutate m_workers.
    const QList<DownloadWorker*> workers = m_workers.keys();
    for (DownloadWorker* worker : workers) {
        if (m_workers.contains(worker)) worker->abort();
    }
    scheduleAdmission();
}

void DownloadScheduler::finishRun()
{
    if (!m_running) return;
    m_running = false;

    if (m_ledger) {
        PipelineError error;
        if (!m_ledger->persist(&error)) {
            qWarning().noquote() << "[Scheduler] cannot persist ledger:" << error.toString();
        }
    }
    qInfo() << "[Scheduler] run finished: succeeded" << m_summary.succeeded
            << "failed" << m_summary.failed
            << "skipped" << m_summary.skipped
            << "canceled" << m_summary.canceled;
    emit runFinished(m_summary);
}

void DownloadScheduler::setStatus(int index, JobStatus status)
{
    DownloadJob& job = m_jobs[index];
    if (job.status == status) return;
    job.status = status;
    emit jobStatusChanged(job.id, status);
}

void DownloadScheduler::publish(const DownloadJob& job, ProgressEvent::Kind kind,
                                qint64 bytes, int attempt, const QString& reason)
{
    ProgressEvent event;
    event.jobId = job.id;
    event.kind = kind;
    event.displayName = job.descriptor.displayName;
    event.targetPath = job.descriptor.targetPath;
    event.bytes = bytes;
    event.attempt = attempt;
    event.reason = reason;
    const QVector<ProgressReporter*> reporters = m_reporters;
    for (ProgressReporter* reporter : reporters) {
        reporter->onEvent(event);
    }
}
