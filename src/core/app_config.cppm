/*!
 * @file        app_config.cppm
 * @brief       Command-line tool configuration.
 * @details     Persisted defaults come from QSettings (groups "pipeline",
 *              "session" and "transcoder"); command-line options override
 *              them for a single run. Account credentials for the token
 *              helper are read from SPOTIFY_USERNAME and SPOTIFY_PASSWORD.
 *
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     See LICENSE.md in the project root.
 */

module;
#include <QCommandLineParser>
#include <QProcessEnvironment>
#include <QSettings>
#include <QString>
#include <QStringList>

#ifndef Q_MOC_RUN
export module nava.core.app_config;
import nava.core.track;
#endif

#ifdef Q_MOC_RUN
#define NAVA_MODULE_EXPORT
#else
#define NAVA_MODULE_EXPORT export
#endif

/**
 * @brief Where the tracks of a run come from.
 */
NAVA_MODULE_EXPORT enum class RunMode {
    Search,     //!< Interactive catalog search (no source option given).
    Url,        //!< --url
    Liked,      //!< --liked
    Playlist    //!< --playlist, interactive pick among the user's playlists
};

/**
 * @brief Effective configuration of one invocation.
 */
NAVA_MODULE_EXPORT struct AppConfig {
    // pipeline
    QString root = QStringLiteral("~/nava/songs");
    QString rootPodcast = QStringLiteral("~/nava/podcasts");
    QString url;
    bool liked = false;
    bool playlist = false;
    bool disableSkip = false;
    AudioFormat format = AudioFormat::Mp3;
    int limit = 10;                 //!< Search results per category.
    int concurrency = 3;
    QString ledgerPath;             //!< Empty selects the default location.
    int maxAttempts = 3;
    int retryDelayMs = 1000;
    int resolveAttempts = 3;        //!< Attempts for Transient resolution errors.

    // session
    QString apiBase;
    QString accessToken;
    QString credentialsFile = QStringLiteral("credentials.json");
    QString tokenCommand;
    QString sourceCommand = QStringLiteral("nava-fetch --uri {uri} --quality {quality}");
    QString userName;
    QString password;

    // transcoder
    QString transcoderProgram = QStringLiteral("ffmpeg");
    QStringList transcoderArguments;    //!< Empty selects the default template.
    bool embedCover = true;             //!< Attach the album image to MP3 output.

    //!< @brief Source of tracks implied by the flags.
    RunMode mode() const;

    //!< @brief Ledger path, falling back to <AppDataLocation>/ledger.jsonl.
    QString effectiveLedgerPath() const;

    /**
     * @brief Overlay persisted defaults.
     *
     * Keys missing from @p settings keep their current value.
     */
    void loadSettings(const QSettings& settings);

    //!< @brief Overlay SPOTIFY_USERNAME, SPOTIFY_PASSWORD and NAVA_ACCESS_TOKEN.
    void loadEnvironment(const QProcessEnvironment& env);

    //!< @brief Register every option understood by applyCommandLine().
    static void addOptions(QCommandLineParser& parser);

    /**
     * @brief Overlay options parsed by @p parser.
     * @param parser Parser that already processed the arguments.
     * @param error Receives a description of an invalid value.
     * @return false on an invalid value.
     */
    bool applyCommandLine(const QCommandLineParser& parser, QString* error);

    //!< @brief Check cross-field constraints.
    bool validate(QString* error) const;
};
