module;
#include <QCoreApplication>
#include <QDebug>

#ifdef Q_OS_UNIX
#include <termios.h>
#include <unistd.h>
#endif

module nava.core.cli_app;

import nava.core.track;
import nava.core.job;
import nava.core.ledger;
import nava.core.pipeline_error;
import nava.core.progress_reporter;
import nava.core.scheduler;
import nava.core.worker;
import nava.core.app_config;
import nava.services.session;
import nava.services.catalog_client;
import nava.services.resolver;
import nava.services.audio_source;
import nava.services.transcoder;

CliApplication::CliApplication(const AppConfig& config, QTextStream* in, QTextStream* out, QObject* parent)
    : QObject(parent),
    m_config(config),
    m_in(in),
    m_out(out)
{
    if (!m_config.apiBase.isEmpty()) m_client.setApiBase(m_config.apiBase);
    m_resolveRetry.setSingleShot(true);
    connect(&m_resolveRetry, &QTimer::timeout, this, [this]() {
        resolveSource(m_request);
    });
}

CliApplication::~CliApplication() = default;

int CliApplication::exitCodeFor(const RunSummary& summary, bool canceled)
{
    if (canceled) return ExitCanceled;
    return summary.hasFailures() ? ExitJobFailures : ExitSuccess;
}

void CliApplication::start()
{
    auto* authenticator = new SessionAuthenticator(&m_client, this);
    m_authenticator = authenticator;
    connect(authenticator, &SessionAuthenticator::authenticated, this, &CliApplication::onAuthenticated);
    connect(authenticator, &SessionAuthenticator::failed, this, &CliApplication::onAuthFailed);
    authenticator->setCredentialsPrompt([this](Credentials* credentials) {
        return promptCredentials(credentials);
    });

    Credentials credentials;
    credentials.accessToken = m_config.accessToken;
    credentials.credentialsFile = m_config.credentialsFile;
    credentials.tokenCommand = m_config.tokenCommand;
    credentials.userName = m_config.userName;
    credentials.password = m_config.password;
    authenticator->authenticate(credentials);
}

bool CliApplication::promptCredentials(Credentials* credentials)
{
    if (!m_in || m_canceled) return false;
    if (credentials->userName.isEmpty()) {
        *m_out << "Username: " << Qt::flush;
        credentials->userName = readLine(true).trimmed();
    }
    if (credentials->password.isEmpty()) {
        *m_out << "Password: " << Qt::flush;
        credentials->password = readLine(false);
        *m_out << Qt::endl;
    }
    return !credentials->userName.isEmpty() && !credentials->password.isEmpty();
}

QString CliApplication::readLine(bool echo)
{
#ifdef Q_OS_UNIX
    termios saved {};
    const bool hide = !echo && ::isatty(STDIN_FILENO) && ::tcgetattr(STDIN_FILENO, &saved) == 0;
    if (hide) {
        termios silent = saved;
        silent.c_lflag &= ~static_cast<tcflag_t>(ECHO);
        ::tcsetattr(STDIN_FILENO, TCSAFLUSH, &silent);
    }
    const QString line = m_in->readLine();
    if (hide) ::tcsetattr(STDIN_FILENO, TCSAFLUSH, &saved);
    return line;
#else
    Q_UNUSED(echo);
    return m_in->readLine();
#endif
}

void CliApplication::onAuthFailed(const PipelineError& error)
{
    if (m_canceled) {
        finish(ExitCanceled);
        return;
    }
    qCritical().noquote() << "Failed to login:" << error.toString();
    finish(ExitSetupError);
}

void CliApplication::onAuthenticated(const Session& session)
{
    if (m_canceled) {
        finish(ExitCanceled);
        return;
    }
    m_session = session;
    *m_out << "Logged in as " << session.userName() << Qt::endl;

    ResolverSettings settings;
    settings.root = m_config.root;
    settings.rootPodcast = m_config.rootPodcast;
    settings.format = m_config.format;
    auto* resolver = new TrackResolver(&m_client, m_session, settings, this);
    m_resolver = resolver;
    connect(resolver, &TrackResolver::resolved, this, &CliApplication::onResolved);
    connect(resolver, &TrackResolver::failed, this, &CliApplication::onResolveFailed);
    connect(resolver, &TrackResolver::playlistsListed, this, &CliApplication::onPlaylistsListed);
    connect(resolver, &TrackResolver::searchFinished, this, &CliApplication::onSearchFinished);

    switch (m_config.mode()) {
    case RunMode::Url:
        resolveSource(ResolveSource::fromUrl(m_config.url));
        break;
    case RunMode::Liked:
        *m_out << ">>> Downloading your liked songs >>>" << Qt::endl;
        resolveSource(ResolveSource::liked());
        break;
    case RunMode::Playlist:
        resolver->listUserPlaylists();
        break;
    case RunMode::Search: {
        *m_out << "Enter search: " << Qt::flush;
        const QString query = m_in ? m_in->readLine().trimmed() : QString();
        if (query.isEmpty()) {
            qCritical() << "Empty search query";
            finish(ExitSetupError);
            return;
        }
        resolver->search(query, m_config.limit);
        break;
    }
    }
}

void CliApplication::resolveSource(const ResolveSource& source)
{
    if (!m_resolver) return;
    if (m_canceled) {
        finish(ExitCanceled);
        return;
    }
    if (source.kind != m_request.kind || source.value != m_request.value) m_resolveAttempt = 0;
    m_request = source;
    ++m_resolveAttempt;
    m_resolver->resolve(source);
}

void CliApplication::onResolveFailed(const PipelineError& error)
{
    if (m_canceled || error.isCanceled()) {
        finish(ExitCanceled);
        return;
    }
    if (error.kind() == ErrorKind::Transient && m_resolveAttempt > 0
        && m_resolveAttempt < m_config.resolveAttempts) {
        const int delay = DownloadWorker::backoffDelayMs(m_resolveAttempt, WorkerOptions());
        qWarning().noquote() << "Resolution failed:" << error.toString() << "- retrying in" << delay << "ms";
        m_resolveRetry.start(delay);
        return;
    }
    qCritical().noquote() << "Resolution failed:" << error.toString();
    finish(ExitSetupError);
}

int CliApplication::promptIndex(const QString& prompt, int max)
{
    *m_out << prompt << Qt::flush;
    const QString line = m_in ? m_in->readLine().trimmed() : QString();
    bool ok = false;
    const int value = line.toInt(&ok);
    if (!ok || value < 1 || value > max) return 0;
    return value;
}

void CliApplication::onPlaylistsListed(const QVector<PlaylistInfo>& playlists)
{
    if (playlists.isEmpty()) {
        *m_out << "No playlists found." << Qt::endl;
        finish(ExitSuccess);
        return;
    }
    for (int i = 0; i < playlists.size(); ++i) {
        *m_out << (i + 1) << ": " << playlists.at(i).name << Qt::endl;
    }
    *m_out << Qt::endl;
    const int index = promptIndex(QStringLiteral("Select playlist by ID: "), static_cast<int>(playlists.size()));
    if (index == 0) {
        qCritical() << "Invalid playlist selection";
        finish(ExitSetupError);
        return;
    }
    const PlaylistInfo& picked = playlists.at(index - 1);
    *m_out << ">>> Downloading playlist: " << picked.name << " >>>" << Qt::endl;
    resolveSource(ResolveSource::playlist(picked.id));
}

void CliApplication::onSearchFinished(const SearchResults& results)
{
    if (results.isEmpty()) {
        *m_out << "No results..." << Qt::endl;
        finish(ExitSuccess);
        return;
    }
    int position = 1;
    auto printGroup = [this, &position](const QString& title, const QVector<SearchItem>& items) {
        if (items.isEmpty()) return;
        *m_out << title << Qt::endl;
        for (const SearchItem& item : items) {
            *m_out << position++ << ", " << item.name << " | " << item.subtitle << Qt::endl;
        }
        *m_out << Qt::endl;
    };
    printGroup(QStringLiteral("Tracks"), results.tracks);
    printGroup(QStringLiteral("Albums"), results.albums);
    printGroup(QStringLiteral("Playlists"), results.playlists);

    const int index = promptIndex(QStringLiteral("Select by ID: "), results.size());
    const SearchItem* item = results.at(index);
    if (!item) {
        qCritical() << "Invalid selection";
        finish(ExitSetupError);
        return;
    }
    if (item->kind != SearchItem::Kind::Track) {
        *m_out << ">>> Downloading " << item->name << " >>>" << Qt::endl;
    }
    resolveSource(ResolveSource::fromUrl(item->uri()));
}

void CliApplication::onResolved(const TrackList& tracks)
{
    if (m_canceled) {
        finish(ExitCanceled);
        return;
    }
    if (tracks.isEmpty()) {
        *m_out << "Nothing to download." << Qt::endl;
        finish(ExitSuccess);
        return;
    }
    startDownloads(tracks);
}

void CliApplication::startDownloads(const TrackList& tracks)
{
    m_ledger = std::make_unique<CompletionLedger>(m_config.effectiveLedgerPath());
    m_source = std::make_unique<CommandAudioSource>(m_config.sourceCommand);

    TranscoderSettings transcoder;
    transcoder.program = m_config.transcoderProgram;
    if (!m_config.transcoderArguments.isEmpty()) {
        transcoder.arguments = m_config.transcoderArguments;
        transcoder.coverArguments.clear();
    }
    if (!m_config.embedCover) transcoder.coverArguments.clear();

    WorkerOptions options;
    options.maxAttempts = m_config.maxAttempts;
    options.retryBaseDelayMs = m_config.retryDelayMs;
    options.retryMaxDelayMs = qMax(m_config.retryDelayMs, 8 * m_config.retryDelayMs);

    const Session session = m_session;
    AudioSource* source = m_source.get();
    CatalogClient* covers = &m_client;
    auto* scheduler = new DownloadScheduler(m_ledger.get(), [session, source, covers, transcoder, options](QObject* parent) {
        auto* worker = new DownloadWorker(session, source, transcoder, options, parent);
        worker->setCoverClient(covers);
        return worker;
    }, this);
    m_scheduler = scheduler;

    m_console = std::make_unique<ConsoleProgressReporter>(m_out);
    m_console->setTotal(static_cast<int>(tracks.size()));
    scheduler->addReporter(m_console.get());
    scheduler->addReporter(&m_log);
    connect(scheduler, &DownloadScheduler::runFinished, this, &CliApplication::onRunFinished);

    SchedulerOptions schedulerOptions;
    schedulerOptions.concurrency = m_config.concurrency;
    schedulerOptions.skipExisting = !m_config.disableSkip;
    if (!scheduler->run(DownloadScheduler::makeJobs(tracks), schedulerOptions)) {
        qCritical() << "Cannot start the download run";
        finish(ExitSetupError);
    }
}

void CliApplication::printSummary(const RunSummary& summary)
{
    *m_out << Qt::endl
           << "Succeeded: " << summary.succeeded
           << "  Skipped: " << summary.skipped
           << "  Failed: " << summary.failed
           << "  Canceled: " << summary.canceled << Qt::endl;
    for (const JobFailure& failure : summary.errors) {
        *m_out << "  x " << failure.descriptor.displayName << ": " << failure.error.toString() << Qt::endl;
    }
}

void CliApplication::onRunFinished(const RunSummary& summary)
{
    printSummary(summary);
    finish(exitCodeFor(summary, m_canceled));
}

void CliApplication::requestCancel()
{
    if (m_canceled || m_finished) return;
    m_canceled = true;
    qInfo() << "Cancel requested";
    m_resolveRetry.stop();
    if (m_scheduler && m_scheduler->isRunning()) {
        m_scheduler->cancel();
        return;
    }
    if (m_resolver && m_resolver->isBusy()) {
        m_resolver->abort();
        return;
    }
    // Authentication in flight; its completion sees the flag.
    if (m_client.pendingRequests() > 0) {
        m_client.abortAll();
        return;
    }
    finish(ExitCanceled);
}

void CliApplication::finish(int exitCode)
{
    if (m_finished) return;
    m_finished = true;
    m_out->flush();
    emit done(exitCode);
}
