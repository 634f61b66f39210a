module;
#include <QDebug>
#include <QDir>
#include <QJsonValue>
#include <QTimer>
#include <QtMath>

module nava.services.resolver;

import nava.core.track;
import nava.core.pipeline_error;
import nava.services.session;
import nava.services.catalog_client;
import nava.utils.download_utils;
import nava.utils.resource_uri;

namespace utils = nava::utils;

static const QString kLikedSongsDir = QStringLiteral("Liked Songs");

static QString releaseYearOf(const QString& releaseDate)
{
    return releaseDate.section('-', 0, 0);
}

static QString firstImageUrl(const QJsonArray& images)
{
    if (images.isEmpty()) return QString();
    return images.first().toObject().value("url").toString();
}

static int durationSecondsOf(const QJsonObject& obj)
{
    const double ms = obj.value("duration_ms").toDouble(0);
    return ms > 0 ? qRound(ms / 1000.0) : 0;
}

static QString joinedArtistNames(const QJsonArray& artists)
{
    QStringList names;
    for (const QJsonValue& v : artists) {
        const QString name = v.toObject().value("name").toString();
        if (!name.isEmpty()) names.append(name);
    }
    return names.join(',');
}

QString SearchItem::uri() const
{
    QString kindName;
    switch (kind) {
    case Kind::Track: kindName = QStringLiteral("track"); break;
    case Kind::Album: kindName = QStringLiteral("album"); break;
    case Kind::Playlist: kindName = QStringLiteral("playlist"); break;
    }
    return QStringLiteral("spotify:%1:%2").arg(kindName, id);
}

const SearchItem* SearchResults::at(int position) const
{
    if (position < 1) return nullptr;
    int index = position - 1;
    if (index < tracks.size()) return &tracks.at(index);
    index -= static_cast<int>(tracks.size());
    if (index < albums.size()) return &albums.at(index);
    index -= static_cast<int>(albums.size());
    if (index < playlists.size()) return &playlists.at(index);
    return nullptr;
}

TrackResolver::TrackResolver(CatalogClient* client, const Session& session,
                             const ResolverSettings& settings, QObject* parent)
    : QObject(parent),
    m_client(client),
    m_session(session),
    m_settings(settings)
{
}

TrackResolver::~TrackResolver()
{
    ++m_generation;
}

QString TrackResolver::songPath(const ResolverSettings& settings, const QString& extraDir,
                                const QString& artist, const QString& title)
{
    QDir base(utils::normalizeFilePath(settings.root));
    const QString fileName = QStringLiteral("%1 - %2.%3")
                                 .arg(utils::sanitizeFileName(artist),
                                      utils::sanitizeFileName(title),
                                      formatExtension(settings.format));
    const QString dir = extraDir.isEmpty() ? base.absolutePath() : base.filePath(extraDir);
    return QDir::cleanPath(QDir(dir).filePath(fileName));
}

TrackDescriptor TrackResolver::descriptorFromTrack(const QJsonObject& track, const QString& extraDir,
                                                   const ResolverSettings& settings, bool* playable)
{
    TrackDescriptor d;
    if (playable) *playable = track.value("is_playable").toBool(true);
    d.id = track.value("id").toString();
    if (d.id.isEmpty()) return TrackDescriptor();

    for (const QJsonValue& v : track.value("artists").toArray()) {
        const QString name = utils::sanitizeFileName(v.toObject().value("name").toString());
        if (!name.isEmpty()) d.artists.append(name);
    }
    const QJsonObject album = track.value("album").toObject();
    d.title = utils::sanitizeFileName(track.value("name").toString());
    d.album = utils::sanitizeFileName(album.value("name").toString());
    d.releaseYear = releaseYearOf(album.value("release_date").toString());
    d.imageUrl = firstImageUrl(album.value("images").toArray());
    d.discNumber = track.value("disc_number").toInt(0);
    d.trackNumber = track.value("track_number").toInt(0);
    d.durationSeconds = durationSecondsOf(track);
    d.format = settings.format;
    d.kind = MediaKind::Track;
    d.displayName = QStringLiteral("%1 - %2").arg(d.primaryArtist(), d.title);
    d.targetPath = songPath(settings, extraDir, d.primaryArtist(), d.title);
    return d;
}

TrackDescriptor TrackResolver::descriptorFromEpisode(const QJsonObject& episode, const ResolverSettings& settings)
{
    TrackDescriptor d;
    d.id = episode.value("id").toString();
    if (d.id.isEmpty()) return TrackDescriptor();

    const QJsonObject show = episode.value("show").toObject();
    const QString showName = utils::sanitizeFileName(show.value("name").toString());
    d.title = utils::sanitizeFileName(episode.value("name").toString());
    if (!showName.isEmpty()) d.artists.append(showName);
    d.album = showName;
    d.releaseYear = releaseYearOf(episode.value("release_date").toString());
    QJsonArray images = episode.value("images").toArray();
    if (images.isEmpty()) images = show.value("images").toArray();
    d.imageUrl = firstImageUrl(images);
    d.durationSeconds = durationSecondsOf(episode);
    d.format = settings.format;
    d.kind = MediaKind::Episode;
    d.displayName = QStringLiteral("%1 - %2").arg(showName, d.title);

    const QDir base(utils::normalizeFilePath(settings.rootPodcast));
    d.targetPath = QDir::cleanPath(base.filePath(QStringLiteral("%1.%2")
                                                     .arg(d.displayName, formatExtension(settings.format))));
    return d;
}

SearchResults TrackResolver::parseSearchResults(const QJsonObject& body)
{
    SearchResults results;
    for (const QJsonValue& v : body.value("tracks").toObject().value("items").toArray()) {
        const QJsonObject obj = v.toObject();
        if (obj.value("id").toString().isEmpty()) continue;
        results.tracks.append({ SearchItem::Kind::Track, obj.value("id").toString(),
                                obj.value("name").toString(),
                                joinedArtistNames(obj.value("artists").toArray()) });
    }
    for (const QJsonValue& v : body.value("albums").toObject().value("items").toArray()) {
        const QJsonObject obj = v.toObject();
        if (obj.value("id").toString().isEmpty()) continue;
        results.albums.append({ SearchItem::Kind::Album, obj.value("id").toString(),
                                obj.value("name").toString(),
                                joinedArtistNames(obj.value("artists").toArray()) });
    }
    for (const QJsonValue& v : body.value("playlists").toObject().value("items").toArray()) {
        // The playlists category may contain null entries.
        const QJsonObject obj = v.toObject();
        if (obj.value("id").toString().isEmpty()) continue;
        results.playlists.append({ SearchItem::Kind::Playlist, obj.value("id").toString(),
                                   obj.value("name").toString(),
                                   obj.value("owner").toObject().value("display_name").toString() });
    }
    return results;
}

bool TrackResolver::begin()
{
    if (m_busy) {
        qWarning() << "[Resolver] operation already in progress";
        return false;
    }
    if (!m_client) {
        QTimer::singleShot(0, this, [this]() {
            emit failed(PipelineError::resolution(ErrorKind::Transient, QStringLiteral("No catalog client")));
        });
        return false;
    }
    m_busy = true;
    ++m_generation;
    m_warnings.clear();
    return true;
}

void TrackResolver::warn(const QString& message)
{
    m_warnings.append(message);
    qWarning().noquote() << "[Resolver]" << message;
}

void TrackResolver::fail(const PipelineError& error)
{
    if (!m_busy) return;
    m_busy = false;
    ++m_generation;
    emit failed(error);
}

void TrackResolver::finishTracks(const TrackList& tracks)
{
    m_busy = false;
    qInfo() << "[Resolver] resolved" << tracks.size() << "item(s)";
    emit resolved(tracks);
}

void TrackResolver::get(const QString& path, const QUrlQuery& query, ObjectHandler onOk)
{
    const quint64 generation = m_generation;
    m_client->getJson(path, query, [this, generation, onOk](const QJsonObject& body, const PipelineError& error) {
        if (generation != m_generation) return;
        if (error.isError()) {
            fail(error);
            return;
        }
        onOk(body);
    }, m_session.accessToken());
}

void TrackResolver::getAll(const QString& path, int pageSize, ArrayHandler onOk)
{
    const quint64 generation = m_generation;
    m_client->getPaged(path, QUrlQuery(), pageSize, [this, generation, onOk](const QJsonArray& items, const PipelineError& error) {
        if (generation != m_generation) return;
        if (error.isError()) {
            fail(error);
            return;
        }
        onOk(items);
    }, m_session.accessToken());
}

void TrackResolver::abort()
{
    if (!m_busy) return;
    fail(PipelineError::canceled(QStringLiteral("Resolution aborted")));
    if (m_client) m_client->abortAll();
}

void TrackResolver::resolve(const ResolveSource& source)
{
    if (!begin()) return;

    switch (source.kind) {
    case ResolveSource::Kind::Liked:
        resolveLiked();
        return;
    case ResolveSource::Kind::Playlist:
        resolvePlaylist(source.value.trimmed());
        return;
    case ResolveSource::Kind::Url:
        break;
    }

    const utils::ResourceRef ref = utils::parseResourceRef(source.value);
    switch (ref.kind) {
    case utils::ResourceKind::Track: resolveTrack(ref.id); return;
    case utils::ResourceKind::Album: resolveAlbum(ref.id); return;
    case utils::ResourceKind::Playlist: resolvePlaylist(ref.id); return;
    case utils::ResourceKind::Episode: resolveEpisode(ref.id); return;
    case utils::ResourceKind::Invalid: break;
    }
    const PipelineError error = PipelineError::resolution(
        ErrorKind::NotFound, QStringLiteral("URL (%1) does not match any pattern").arg(source.value));
    QTimer::singleShot(0, this, [this, error, generation = m_generation]() {
        if (generation == m_generation) fail(error);
    });
}

void TrackResolver::resolveTrack(const QString& id)
{
    fetchTracks({ id }, QString());
}

void TrackResolver::resolveAlbum(const QString& id)
{
    get(QStringLiteral("/albums/%1").arg(id), QUrlQuery(), [this, id](const QJsonObject& album) {
        const QJsonArray artists = album.value("artists").toArray();
        const QString artist = artists.isEmpty() ? QString() : artists.first().toObject().value("name").toString();
        const QString extra = utils::sanitizeFileName(
            QStringLiteral("%1 - %2").arg(artist, album.value("name").toString()));
        getAll(QStringLiteral("/albums/%1/tracks").arg(id), 50, [this, extra](const QJsonArray& items) {
            fetchTracks(collectIds(items, false), extra);
        });
    });
}

void TrackResolver::resolvePlaylist(const QString& id)
{
    if (id.isEmpty()) {
        const PipelineError error = PipelineError::resolution(ErrorKind::NotFound, QStringLiteral("Empty playlist id"));
        QTimer::singleShot(0, this, [this, error, generation = m_generation]() {
            if (generation == m_generation) fail(error);
        });
        return;
    }
    QUrlQuery query;
    query.addQueryItem(QStringLiteral("fields"), QStringLiteral("name,owner(display_name)"));
    query.addQueryItem(QStringLiteral("market"), QStringLiteral("from_token"));
    get(QStringLiteral("/playlists/%1").arg(id), query, [this, id](const QJsonObject& playlist) {
        const QString extra = utils::sanitizeFileName(playlist.value("name").toString().trimmed());
        getAll(QStringLiteral("/playlists/%1/tracks").arg(id), 100, [this, extra](const QJsonArray& items) {
            fetchTracks(collectIds(items, true), extra);
        });
    });
}

void TrackResolver::resolveLiked()
{
    getAll(QStringLiteral("/me/tracks"), 50, [this](const QJsonArray& items) {
        fetchTracks(collectIds(items, true), kLikedSongsDir);
    });
}

void TrackResolver::resolveEpisode(const QString& id)
{
    get(QStringLiteral("/episodes/%1").arg(id), QUrlQuery(), [this](const QJsonObject& episode) {
        const TrackDescriptor d = descriptorFromEpisode(episode, m_settings);
        if (!d.isValid()) {
            fail(PipelineError::resolution(ErrorKind::NotFound, QStringLiteral("Episode response carries no id")));
            return;
        }
        finishTracks({ d });
    });
}

QStringList TrackResolver::collectIds(const QJsonArray& items, bool wrapped)
{
    QStringList ids;
    ids.reserve(items.size());
    for (const QJsonValue& v : items) {
        const QJsonObject item = v.toObject();
        const QJsonObject track = wrapped ? item.value("track").toObject() : item;
        const QString id = track.value("id").toString();
        if (id.isEmpty()) {
            const QString name = track.value("name").toString();
            warn(name.isEmpty()
                     ? QStringLiteral("Skip: song does not exist on the catalog anymore")
                     : QStringLiteral("Skip: %1 has no catalog id (local file)").arg(name));
            continue;
        }
        ids.append(id);
    }
    return ids;
}

void TrackResolver::fetchTracks(const QStringList& ids, const QString& extraDir)
{
    fetchTrackBatch(ids, 0, extraDir, TrackList());
}

void TrackResolver::fetchTrackBatch(const QStringList& ids, int offset, const QString& extraDir, TrackList acc)
{
    if (offset >= ids.size()) {
        finishTracks(acc);
        return;
    }
    const QStringList batch = ids.mid(offset, kTrackBatchSize);
    QUrlQuery query;
    query.addQueryItem(QStringLiteral("ids"), batch.join(','));
    query.addQueryItem(QStringLiteral("market"), QStringLiteral("from_token"));
    get(QStringLiteral("/tracks"), query, [this, ids, offset, extraDir, acc, batch](const QJsonObject& body) mutable {
        const QJsonArray tracks = body.value("tracks").toArray();
        for (int i = 0; i < batch.size(); ++i) {
            const QJsonValue value = i < tracks.size() ? tracks.at(i) : QJsonValue();
            if (!value.isObject()) {
                warn(QStringLiteral("Skip: track %1 does not exist on the catalog anymore").arg(batch.at(i)));
                continue;
            }
            bool playable = true;
            const TrackDescriptor d = descriptorFromTrack(value.toObject(), extraDir, m_settings, &playable);
            if (!d.isValid()) {
                warn(QStringLiteral("Skip: track %1 returned without an id").arg(batch.at(i)));
                continue;
            }
            if (!playable) {
                warn(QStringLiteral("Skip: %1 is unavailable").arg(d.displayName));
                continue;
            }
            if (d.id != batch.at(i)) {
                qDebug() << "[Resolver] track" << batch.at(i) << "relinked to" << d.id;
            }
            acc.append(d);
        }
        fetchTrackBatch(ids, offset + static_cast<int>(batch.size()), extraDir, acc);
    });
}

void TrackResolver::listUserPlaylists()
{
    if (!begin()) return;
    getAll(QStringLiteral("/me/playlists"), 50, [this](const QJsonArray& items) {
        QVector<PlaylistInfo> playlists;
        for (const QJsonValue& v : items) {
            const QJsonObject obj = v.toObject();
            PlaylistInfo info;
            info.id = obj.value("id").toString();
            if (info.id.isEmpty()) continue;
            info.name = obj.value("name").toString().trimmed();
            info.owner = obj.value("owner").toObject().value("display_name").toString();
            info.trackCount = obj.value("tracks").toObject().value("total").toInt(0);
            playlists.append(info);
        }
        m_busy = false;
        emit playlistsListed(playlists);
    });
}

void TrackResolver::search(const QString& query, int limit)
{
    if (!begin()) return;
    QUrlQuery params;
    params.addQueryItem(QStringLiteral("q"), query);
    params.addQueryItem(QStringLiteral("type"), QStringLiteral("track,album,playlist"));
    params.addQueryItem(QStringLiteral("limit"), QString::number(qBound(1, limit, 50)));
    params.addQueryItem(QStringLiteral("offset"), QStringLiteral("0"));
    get(QStringLiteral("/search"), params, [this](const QJsonObject& body) {
        const SearchResults results = parseSearchResults(body);
        m_busy = false;
        emit searchFinished(results);
    });
}
