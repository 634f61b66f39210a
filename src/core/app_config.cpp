module;
#include <QDir>
#include <QProcess>
#include <QStandardPaths>

module nava.core.app_config;

import nava.core.track;

static bool parsePositive(const QString& text, int* value)
{
    bool ok = false;
    const int parsed = text.trimmed().toInt(&ok);
    if (!ok || parsed <= 0) return false;
    *value = parsed;
    return true;
}

RunMode AppConfig::mode() const
{
    if (playlist) return RunMode::Playlist;
    if (liked) return RunMode::Liked;
    if (!url.trimmed().isEmpty()) return RunMode::Url;
    return RunMode::Search;
}

QString AppConfig::effectiveLedgerPath() const
{
    if (!ledgerPath.trimmed().isEmpty()) return ledgerPath.trimmed();
    const QString dataDir = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    return QDir(dataDir).filePath(QStringLiteral("ledger.jsonl"));
}

void AppConfig::loadSettings(const QSettings& settings)
{
    root = settings.value(QStringLiteral("pipeline/root"), root).toString();
    rootPodcast = settings.value(QStringLiteral("pipeline/rootPodcast"), rootPodcast).toString();
    disableSkip = settings.value(QStringLiteral("pipeline/disableSkip"), disableSkip).toBool();
    AudioFormat storedFormat;
    if (parseAudioFormat(settings.value(QStringLiteral("pipeline/format")).toString(), &storedFormat)) {
        format = storedFormat;
    }
    limit = qMax(1, settings.value(QStringLiteral("pipeline/limit"), limit).toInt());
    concurrency = qMax(1, settings.value(QStringLiteral("pipeline/concurrency"), concurrency).toInt());
    ledgerPath = settings.value(QStringLiteral("pipeline/ledger"), ledgerPath).toString();
    maxAttempts = qMax(1, settings.value(QStringLiteral("pipeline/maxAttempts"), maxAttempts).toInt());
    retryDelayMs = qMax(0, settings.value(QStringLiteral("pipeline/retryDelayMs"), retryDelayMs).toInt());

    apiBase = settings.value(QStringLiteral("session/apiBase"), apiBase).toString();
    credentialsFile = settings.value(QStringLiteral("session/credentialsFile"), credentialsFile).toString();
    tokenCommand = settings.value(QStringLiteral("session/tokenCommand"), tokenCommand).toString();
    sourceCommand = settings.value(QStringLiteral("session/sourceCommand"), sourceCommand).toString();

    transcoderProgram = settings.value(QStringLiteral("transcoder/program"), transcoderProgram).toString();
    transcoderArguments = settings.value(QStringLiteral("transcoder/arguments"), transcoderArguments).toStringList();
    embedCover = settings.value(QStringLiteral("transcoder/embedCover"), embedCover).toBool();
}

void AppConfig::loadEnvironment(const QProcessEnvironment& env)
{
    if (env.contains(QStringLiteral("SPOTIFY_USERNAME"))) userName = env.value(QStringLiteral("SPOTIFY_USERNAME"));
    if (env.contains(QStringLiteral("SPOTIFY_PASSWORD"))) password = env.value(QStringLiteral("SPOTIFY_PASSWORD"));
    if (env.contains(QStringLiteral("NAVA_ACCESS_TOKEN"))) accessToken = env.value(QStringLiteral("NAVA_ACCESS_TOKEN"));
}

void AppConfig::addOptions(QCommandLineParser& parser)
{
    parser.addOptions({
        { QStringLiteral("root"), QStringLiteral("Songs root directory."), QStringLiteral("dir") },
        { QStringLiteral("root-podcast"), QStringLiteral("Podcast episodes root directory."), QStringLiteral("dir") },
        { QStringLiteral("url"), QStringLiteral("Track, album, playlist or episode URL or URI."), QStringLiteral("url") },
        { QStringLiteral("liked"), QStringLiteral("Download all liked songs.") },
        { QStringLiteral("playlist"), QStringLiteral("Pick one of your playlists to download.") },
        { QStringLiteral("disable-skip"), QStringLiteral("Download again even if a verified file exists.") },
        { QStringLiteral("format"), QStringLiteral("Output format: mp3 or wav."), QStringLiteral("format") },
        { QStringLiteral("limit"), QStringLiteral("Search results per category."), QStringLiteral("n") },
        { QStringLiteral("concurrency"), QStringLiteral("Parallel downloads."), QStringLiteral("n") },
        { QStringLiteral("ledger"), QStringLiteral("Completion ledger file."), QStringLiteral("file") },
        { QStringLiteral("api-base"), QStringLiteral("Catalog Web API base URL."), QStringLiteral("url") },
        { QStringLiteral("access-token"), QStringLiteral("Catalog access token."), QStringLiteral("token") },
        { QStringLiteral("credentials-file"), QStringLiteral("Cached credentials JSON file."), QStringLiteral("file") },
        { QStringLiteral("token-command"), QStringLiteral("Command printing an access token."), QStringLiteral("command") },
        { QStringLiteral("source-command"), QStringLiteral("Command streaming encoded audio to stdout."), QStringLiteral("command") },
        { QStringLiteral("transcoder"), QStringLiteral("Transcoder command line template."), QStringLiteral("command") },
        { QStringLiteral("no-cover"), QStringLiteral("Do not embed album art in MP3 files.") },
        { QStringLiteral("max-attempts"), QStringLiteral("Attempts per track."), QStringLiteral("n") },
        { QStringLiteral("retry-delay"), QStringLiteral("Initial retry delay in milliseconds."), QStringLiteral("ms") }
    });
}

bool AppConfig::applyCommandLine(const QCommandLineParser& parser, QString* error)
{
    auto fail = [error](const QString& message) {
        if (error) *error = message;
        return false;
    };

    if (parser.isSet(QStringLiteral("root"))) root = parser.value(QStringLiteral("root"));
    if (parser.isSet(QStringLiteral("root-podcast"))) rootPodcast = parser.value(QStringLiteral("root-podcast"));
    if (parser.isSet(QStringLiteral("url"))) url = parser.value(QStringLiteral("url")).trimmed();
    if (parser.isSet(QStringLiteral("liked"))) liked = true;
    if (parser.isSet(QStringLiteral("playlist"))) playlist = true;
    if (parser.isSet(QStringLiteral("disable-skip"))) disableSkip = true;
    if (parser.isSet(QStringLiteral("no-cover"))) embedCover = false;

    if (parser.isSet(QStringLiteral("format"))) {
        const QString value = parser.value(QStringLiteral("format"));
        if (!parseAudioFormat(value, &format)) {
            return fail(QStringLiteral("%1 is not supported. Select from wav or mp3").arg(value));
        }
    }
    if (parser.isSet(QStringLiteral("limit"))
        && !parsePositive(parser.value(QStringLiteral("limit")), &limit)) {
        return fail(QStringLiteral("--limit expects a positive integer"));
    }
    if (parser.isSet(QStringLiteral("concurrency"))
        && !parsePositive(parser.value(QStringLiteral("concurrency")), &concurrency)) {
        return fail(QStringLiteral("--concurrency expects a positive integer"));
    }
    if (parser.isSet(QStringLiteral("max-attempts"))
        && !parsePositive(parser.value(QStringLiteral("max-attempts")), &maxAttempts)) {
        return fail(QStringLiteral("--max-attempts expects a positive integer"));
    }
    if (parser.isSet(QStringLiteral("retry-delay"))) {
        bool ok = false;
        const int value = parser.value(QStringLiteral("retry-delay")).toInt(&ok);
        if (!ok || value < 0) return fail(QStringLiteral("--retry-delay expects a non-negative integer"));
        retryDelayMs = value;
    }

    if (parser.isSet(QStringLiteral("ledger"))) ledgerPath = parser.value(QStringLiteral("ledger"));
    if (parser.isSet(QStringLiteral("api-base"))) apiBase = parser.value(QStringLiteral("api-base"));
    if (parser.isSet(QStringLiteral("access-token"))) accessToken = parser.value(QStringLiteral("access-token"));
    if (parser.isSet(QStringLiteral("credentials-file"))) credentialsFile = parser.value(QStringLiteral("credentials-file"));
    if (parser.isSet(QStringLiteral("token-command"))) tokenCommand = parser.value(QStringLiteral("token-command"));
    if (parser.isSet(QStringLiteral("source-command"))) sourceCommand = parser.value(QStringLiteral("source-command"));

    if (parser.isSet(QStringLiteral("transcoder"))) {
        QStringList parts = QProcess::splitCommand(parser.value(QStringLiteral("transcoder")));
        if (parts.isEmpty()) return fail(QStringLiteral("--transcoder must not be empty"));
        transcoderProgram = parts.takeFirst();
        transcoderArguments = parts;
    }
    return true;
}

bool AppConfig::validate(QString* error) const
{
    auto fail = [error](const QString& message) {
        if (error) *error = message;
        return false;
    };
    const int sources = (liked ? 1 : 0) + (playlist ? 1 : 0) + (url.trimmed().isEmpty() ? 0 : 1);
    if (sources > 1) return fail(QStringLiteral("--url, --liked and --playlist are mutually exclusive"));
    if (root.trimmed().isEmpty()) return fail(QStringLiteral("--root must not be empty"));
    if (rootPodcast.trimmed().isEmpty()) return fail(QStringLiteral("--root-podcast must not be empty"));
    if (concurrency <= 0) return fail(QStringLiteral("concurrency must be positive"));
    if (limit <= 0) return fail(QStringLiteral("limit must be positive"));
    if (sourceCommand.trimmed().isEmpty()) return fail(QStringLiteral("no audio source command configured"));
    if (transcoderProgram.trimmed().isEmpty()) return fail(QStringLiteral("no transcoder configured"));
    return true;
}
