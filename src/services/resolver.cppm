/*!
 * @file        resolver.cppm
 * @brief       Resolution of catalog sources into track descriptors.
 * @details     TrackResolver turns a track/album/playlist/episode URL or URI,
 *              the user's liked songs, or a playlist id into the ordered list
 *              of TrackDescriptor values to download. It also lists the
 *              user's playlists and runs catalog searches for the interactive
 *              modes of the command-line tool.
 *
 *              Track metadata is fetched in batches of at most 50 ids. A
 *              relinked id returned by the catalog replaces the requested id.
 *              Unplayable tracks and playlist entries without an id (local
 *              files) are dropped with a warning.
 *
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     See LICENSE.md in the project root.
 */

module;
#include <QObject>
#include <QJsonArray>
#include <QJsonObject>
#include <QPointer>
#include <QString>
#include <QStringList>
#include <QUrlQuery>
#include <QVector>

#include <functional>

#ifndef Q_MOC_RUN
export module nava.services.resolver;
import nava.core.track;
import nava.core.pipeline_error;
import nava.services.session;
import nava.services.catalog_client;
#endif

#ifdef Q_MOC_RUN
#define NAVA_MODULE_EXPORT
#else
#define NAVA_MODULE_EXPORT export
#endif

/**
 * @brief What to resolve.
 */
NAVA_MODULE_EXPORT struct ResolveSource {
    enum class Kind {
        Url,        //!< Track, album, playlist or episode URL/URI.
        Liked,      //!< The user's liked songs.
        Playlist    //!< Playlist by id.
    };

    Kind kind = Kind::Url;
    QString value;      //!< URL/URI or playlist id.

    static ResolveSource fromUrl(const QString& url) { return { Kind::Url, url }; }
    static ResolveSource liked() { return { Kind::Liked, QString() }; }
    static ResolveSource playlist(const QString& id) { return { Kind::Playlist, id }; }
};

/**
 * @brief Destination roots and output format.
 */
NAVA_MODULE_EXPORT struct ResolverSettings {
    QString root;                           //!< Songs root directory.
    QString rootPodcast;                    //!< Episodes root directory.
    AudioFormat format = AudioFormat::Mp3;
};

/**
 * @brief One of the user's playlists.
 */
NAVA_MODULE_EXPORT struct PlaylistInfo {
    QString id;
    QString name;
    QString owner;
    int trackCount = 0;
};

/**
 * @brief One search hit.
 */
NAVA_MODULE_EXPORT struct SearchItem {
    enum class Kind { Track, Album, Playlist };

    Kind kind = Kind::Track;
    QString id;
    QString name;
    QString subtitle;   //!< Artists, or the playlist owner.

    //!< @brief spotify:<kind>:<id> URI for resolving the hit.
    QString uri() const;
};

/**
 * @brief Search hits grouped by category, each capped at the search limit.
 */
NAVA_MODULE_EXPORT struct SearchResults {
    QVector<SearchItem> tracks;
    QVector<SearchItem> albums;
    QVector<SearchItem> playlists;

    int size() const { return static_cast<int>(tracks.size() + albums.size() + playlists.size()); }
    bool isEmpty() const { return size() == 0; }

    //!< @brief Hit by 1-based position across tracks, albums, playlists; nullptr if out of range.
    const SearchItem* at(int position) const;
};

/**
 * @brief Resolves catalog sources.
 *
 * One operation runs at a time. Each resolve(), listUserPlaylists() or
 * search() call ends with exactly one result signal or failed().
 */
NAVA_MODULE_EXPORT class TrackResolver : public QObject {

    Q_OBJECT

public:
    //!< @brief Ids per batched track lookup.
    static constexpr int kTrackBatchSize = 50;

    /**
     * @brief Construct a resolver.
     * @param client Catalog client. Not owned.
     * @param session Session whose token authorizes every request.
     * @param settings Destination roots and format.
     * @param parent Parent QObject.
     */
    TrackResolver(CatalogClient* client, const Session& session,
                  const ResolverSettings& settings, QObject* parent = nullptr);
    ~TrackResolver() override;

    void resolve(const ResolveSource& source);
    void listUserPlaylists();
    void search(const QString& query, int limit);

    //!< @brief Abandon the running operation; failed() reports Canceled.
    void abort();

    bool isBusy() const { return m_busy; }

    //!< @brief Warnings collected by the last operation (dropped tracks).
    QStringList warnings() const { return m_warnings; }

    /**
     * @brief Build a descriptor from a catalog track object.
     *
     * @param track Track JSON object (full track from /tracks).
     * @param extraDir Subdirectory under the songs root (may be empty).
     * @param settings Roots and format.
     * @param playable Receives the is_playable flag (true when absent).
     * @return Descriptor; invalid if the object carries no id.
     */
    static TrackDescriptor descriptorFromTrack(const QJsonObject& track, const QString& extraDir,
                                               const ResolverSettings& settings, bool* playable = nullptr);

    //!< @brief Build a descriptor from a catalog episode object.
    static TrackDescriptor descriptorFromEpisode(const QJsonObject& episode, const ResolverSettings& settings);

    //!< @brief Destination of a song: root/extra/<artist> - <title>.<ext>.
    static QString songPath(const ResolverSettings& settings, const QString& extraDir,
                            const QString& artist, const QString& title);

    //!< @brief Parse the search endpoint response.
    static SearchResults parseSearchResults(const QJsonObject& body);

signals:
    void resolved(const TrackList& tracks);
    void playlistsListed(const QVector<PlaylistInfo>& playlists);
    void searchFinished(const SearchResults& results);
    void failed(const PipelineError& error);

private:
    using ObjectHandler = std::function<void(const QJsonObject&)>;
    using ArrayHandler = std::function<void(const QJsonArray&)>;

    bool begin();
    void get(const QString& path, const QUrlQuery& query, ObjectHandler onOk);
    void getAll(const QString& path, int pageSize, ArrayHandler onOk);
    void fail(const PipelineError& error);
    void finishTracks(const TrackList& tracks);
    void warn(const QString& message);

    void resolveTrack(const QString& id);
    void resolveAlbum(const QString& id);
    void resolvePlaylist(const QString& id);
    void resolveLiked();
    void resolveEpisode(const QString& id);

    //!< @brief Collect ids of a track list (playlist/liked items or album tracks).
    QStringList collectIds(const QJsonArray& items, bool wrapped);
    void fetchTracks(const QStringList& ids, const QString& extraDir);
    void fetchTrackBatch(const QStringList& ids, int offset, const QString& extraDir, TrackList acc);

    QPointer<CatalogClient> m_client;
    Session m_session;
    ResolverSettings m_settings;
    QStringList m_warnings;
    quint64 m_generation = 0;   //!< Bumped per operation; stale callbacks are ignored.
    bool m_busy = false;
};

#include "resolver.moc"
