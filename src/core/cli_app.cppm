/*!
 * @file        cli_app.cppm
 * @brief       Command-line driver of a download run.
 * @details     CliApplication sequences one invocation of the tool:
 *              authenticate, resolve the requested source (interactively for
 *              the playlist and search modes), run the scheduler and print
 *              the summary. It maps the outcome to the process exit code:
 *
 *              - 0   every job succeeded or was skipped
 *              - 1   at least one job failed
 *              - 2   authentication, resolution or configuration error
 *              - 130 the run was canceled
 *
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     See LICENSE.md in the project root.
 */

module;
#include <QObject>
#include <QPointer>
#include <QString>
#include <QTextStream>
#include <QTimer>
#include <QVector>

#include <memory>

#ifndef Q_MOC_RUN
export module nava.core.cli_app;
import nava.core.track;
import nava.core.job;
import nava.core.ledger;
import nava.core.pipeline_error;
import nava.core.progress_reporter;
import nava.core.scheduler;
import nava.core.app_config;
import nava.services.session;
import nava.services.catalog_client;
import nava.services.resolver;
import nava.services.audio_source;
import nava.services.transcoder;
#endif

#ifdef Q_MOC_RUN
#define NAVA_MODULE_EXPORT
#else
#define NAVA_MODULE_EXPORT export
#endif

/**
 * @brief Drives one invocation from authentication to summary.
 */
NAVA_MODULE_EXPORT class CliApplication : public QObject {

    Q_OBJECT

public:
    enum ExitCode {
        ExitSuccess = 0,
        ExitJobFailures = 1,
        ExitSetupError = 2,
        ExitCanceled = 130
    };

    /**
     * @brief Construct the driver.
     * @param config Effective configuration.
     * @param in Interactive input (credentials, playlist and search selection). Not owned.
     * @param out User-facing output. Not owned.
     * @param parent Parent QObject.
     */
    CliApplication(const AppConfig& config, QTextStream* in, QTextStream* out, QObject* parent = nullptr);
    ~CliApplication() override;

    //!< @brief Begin authentication; done() follows eventually.
    void start();

    //!< @brief Cancel whatever stage is running.
    void requestCancel();

    bool isCanceled() const { return m_canceled; }

    //!< @brief Exit code for a finished run.
    static int exitCodeFor(const RunSummary& summary, bool canceled);

signals:
    void done(int exitCode);

private:
    void onAuthenticated(const Session& session);
    void onAuthFailed(const PipelineError& error);
    void resolveSource(const ResolveSource& source);
    void onResolved(const TrackList& tracks);
    void onResolveFailed(const PipelineError& error);
    void onPlaylistsListed(const QVector<PlaylistInfo>& playlists);
    void onSearchFinished(const SearchResults& results);
    void startDownloads(const TrackList& tracks);
    void onRunFinished(const RunSummary& summary);
    void printSummary(const RunSummary& summary);
    int promptIndex(const QString& prompt, int max);
    bool promptCredentials(Credentials* credentials);
    QString readLine(bool echo);
    void finish(int exitCode);

    AppConfig m_config;
    QTextStream* m_in = nullptr;
    QTextStream* m_out = nullptr;

    CatalogClient m_client;
    Session m_session;
    QPointer<SessionAuthenticator> m_authenticator;
    QPointer<TrackResolver> m_resolver;
    QPointer<DownloadScheduler> m_scheduler;
    std::unique_ptr<CompletionLedger> m_ledger;
    std::unique_ptr<CommandAudioSource> m_source;
    std::unique_ptr<ConsoleProgressReporter> m_console;
    LogProgressReporter m_log;

    ResolveSource m_request;            //!< Source being resolved, kept for retries.
    int m_resolveAttempt = 0;
    QTimer m_resolveRetry;
    bool m_canceled = false;
    bool m_finished = false;
};

#include "cli_app.moc"
