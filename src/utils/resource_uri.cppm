/*!
 * @file        resource_uri.cppm
 * @brief       Catalog resource URL and URI parsing.
 * @details     Recognizes the share URL (`https://open.spotify.com/track/<id>`)
 *              and URI (`spotify:track:<id>`) forms of catalog resources and
 *              extracts the resource kind and its base62 identifier.
 *
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     See LICENSE.md in the project root.
 */

module;
#include <QString>

#ifndef Q_MOC_RUN
export module nava.utils.resource_uri;
#endif

#ifdef Q_MOC_RUN
#define NAVA_MODULE_EXPORT
#else
#define NAVA_MODULE_EXPORT export
#endif

NAVA_MODULE_EXPORT namespace nava::utils {

/**
 * @brief Kind of catalog resource addressed by a URL or URI.
 */
enum class ResourceKind {
    Invalid,    //!< Input did not match any known form.
    Track,      //!< A single track.
    Album,      //!< An album; resolves to its tracks.
    Playlist,   //!< A playlist; resolves to its tracks.
    Episode     //!< A podcast episode.
};

/**
 * @brief Parsed catalog resource reference.
 */
struct ResourceRef {
    ResourceKind kind = ResourceKind::Invalid;  //!< Resource kind.
    QString id;                                 //!< 22 character base62 identifier.

    //!< @brief True if the reference was recognized.
    bool isValid() const { return kind != ResourceKind::Invalid && !id.isEmpty(); }
};

/**
 * @brief Parses a share URL or URI.
 *
 * Accepted forms, for kinds track, album, playlist and episode:
 * - `spotify:<kind>:<id>`
 * - `[http[s]://]open.spotify.com/<kind>/<id>[?si=...]`
 *
 * @param text Raw user input.
 * @return Parsed reference; invalid if the input matches no form.
 */
ResourceRef parseResourceRef(const QString& text);

//!< @brief Lowercase name of a resource kind ("track", "album", ...).
QString resourceKindName(ResourceKind kind);

} // namespace nava::utils
