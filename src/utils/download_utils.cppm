/*!
 * @file        download_utils.cppm
 * @brief       Common utility helpers for download paths, names and checksums.
 * @details     Provides a collection of small, reusable helper functions shared
 *              across the pipeline components. These utilities handle common
 *              tasks such as path normalization, file name sanitizing,
 *              temporary artifact naming and checksum processing.
 *
 *              All helpers are side-effect free except where they read the
 *              filesystem (checksums, existence checks).
 *
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     See LICENSE.md in the project root.
 */

module;
#include <QFileDevice>
#include <QHash>
#include <QString>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module nava.utils.download_utils;
#endif

#ifdef Q_MOC_RUN
#define NAVA_MODULE_EXPORT
#else
#define NAVA_MODULE_EXPORT export
#endif

NAVA_MODULE_EXPORT namespace nava::utils {

/**
 * @brief Normalizes a local filesystem path or file URL.
 *
 * Converts file URLs to local paths, expands a leading `~` to the user's
 * home directory and returns a clean absolute path.
 *
 * @param path Local path, `~/...` path or file:// URL.
 * @return Normalized absolute filesystem path, or empty for empty input.
 */
QString normalizeFilePath(const QString& path);

/**
 * @brief Removes characters that are unsafe in file names.
 *
 * Drops `\ / : * ? ' < > "` and replaces `|` with `-`. Leading and
 * trailing whitespace is trimmed. The directory names `.` and `..` become `_`.
 *
 * @param value Raw name (track title, playlist name, ...).
 * @return Sanitized name.
 */
QString sanitizeFileName(const QString& value);

//!< @brief Path of the raw download artifact colocated with @p targetPath.
QString partPathFor(const QString& targetPath);

//!< @brief Path of the transcoder output artifact colocated with @p targetPath.
QString transcodePathFor(const QString& targetPath);

//!< @brief Path of the downloaded cover image colocated with @p targetPath.
QString coverPathFor(const QString& targetPath);

/**
 * @brief Substitutes `{name}` placeholders in a single pass.
 *
 * Substituted text is never scanned again, so values may themselves contain
 * braces. Placeholders without a value are kept verbatim.
 *
 * @param text Template text.
 * @param values Placeholder name (without braces) to replacement.
 * @return Expanded text.
 */
QString expandPlaceholders(const QString& text, const QHash<QString, QString>& values);

/**
 * @brief Computes the SHA-256 checksum of a file.
 *
 * Reads the file in 1 MiB blocks.
 *
 * @param path File path.
 * @return Lowercase hex digest, or an empty string if the file cannot be read.
 */
QString fileSha256(const QString& path);

/**
 * @brief Normalizes a checksum string.
 *
 * Converts the checksum to lowercase and removes whitespace to ensure
 * consistent comparison.
 *
 * @param value Raw checksum string.
 * @return Normalized checksum string.
 */
QString normalizeChecksum(const QString& value);

/**
 * @brief Checks whether a file error means the device ran out of space.
 *
 * QFileDevice reports short writes as ResourceError.
 *
 * @param error File device error.
 * @return true for out-of-space style errors.
 */
bool isDiskFullError(QFileDevice::FileError error);

//!< @brief Removes @p path if it exists; returns false only if removal failed.
bool removeIfExists(const QString& path);

/**
 * @brief Moves @p source onto @p target, replacing an existing target.
 *
 * An existing target is first moved aside to `<target>.old` and restored
 * when the final rename fails, so a failed replace never loses the
 * previous file.
 *
 * @param source File to move.
 * @param target Destination path.
 * @return true if @p source now lives at @p target.
 */
bool replaceFile(const QString& source, const QString& target);

} // namespace nava::utils
