/*!
 * @file        track.cppm
 * @brief       Track descriptor value type.
 * @details     A TrackDescriptor identifies one downloadable unit (a song or
 *              a podcast episode) together with its destination on disk and
 *              the metadata the transcoder writes into the output tags.
 *
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     See LICENSE.md in the project root.
 */

module;
#include <QString>
#include <QStringList>
#include <QVector>

#ifndef Q_MOC_RUN
export module nava.core.track;
#endif

#ifdef Q_MOC_RUN
#define NAVA_MODULE_EXPORT
#else
#define NAVA_MODULE_EXPORT export
#endif

/**
 * @brief Output container written by the transcoder.
 */
NAVA_MODULE_EXPORT enum class AudioFormat {
    Wav,
    Mp3
};

/**
 * @brief Kind of catalog item a descriptor was resolved from.
 */
NAVA_MODULE_EXPORT enum class MediaKind {
    Track,
    Episode
};

//!< @brief File extension for @p format ("mp3", "wav").
NAVA_MODULE_EXPORT QString formatExtension(AudioFormat format);

/**
 * @brief Parses a user supplied format name.
 *
 * Accepts "mp3" and "wav" case-insensitively.
 *
 * @param value Format name.
 * @param format Receives the parsed format on success.
 * @return true if @p value names a supported format.
 */
NAVA_MODULE_EXPORT bool parseAudioFormat(const QString& value, AudioFormat* format);

//!< @brief Catalog name of a media kind ("track", "episode").
NAVA_MODULE_EXPORT QString mediaKindName(MediaKind kind);

/**
 * @brief Immutable metadata of one downloadable unit and its destination.
 *
 * Descriptors are produced by the resolver and never change afterwards;
 * the scheduler wraps them into jobs. The target path is absolute and is
 * the key for skip/resume decisions together with the id.
 */
NAVA_MODULE_EXPORT struct TrackDescriptor {
    QString id;                         //!< Catalog identifier (base62).
    QString displayName;                //!< "<artist> - <title>" for reporting.
    int durationSeconds = 0;            //!< Duration, never negative.
    QString targetPath;                 //!< Absolute destination path.
    AudioFormat format = AudioFormat::Mp3;
    MediaKind kind = MediaKind::Track;

    QStringList artists;                //!< Track artists, or the show name for episodes.
    QString title;
    QString album;                      //!< Album name, or the show name for episodes.
    QString releaseYear;
    int discNumber = 0;
    int trackNumber = 0;
    QString imageUrl;                   //!< Largest cover image, if any.

    //!< @brief First artist, or an empty string.
    QString primaryArtist() const { return artists.isEmpty() ? QString() : artists.first(); }

    //!< @brief True if the descriptor can be scheduled.
    bool isValid() const { return !id.isEmpty() && !targetPath.isEmpty() && durationSeconds >= 0; }
};

NAVA_MODULE_EXPORT using TrackList = QVector<TrackDescriptor>;
