/*!
 * @file        ledger.cppm
 * @brief       Skip/resume ledger of verified downloads.
 * @details     The ledger remembers which target paths already hold a
 *              complete file. Entries are stored as JSON Lines: each
 *              successful download appends one line, a torn or garbled line
 *              is skipped on load without invalidating earlier entries, and
 *              persist() rewrites the compacted store atomically.
 *
 *              A stored entry alone never proves a file is complete: has()
 *              re-checks existence, size and SHA-256 of the file on disk.
 *              candidate() performs the cheap part of that check so callers
 *              can hash the file off the event loop.
 *
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     See LICENSE.md in the project root.
 */

module;
#include <QDateTime>
#include <QHash>
#include <QJsonObject>
#include <QString>
#include <QStringList>
#include <QVector>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module nava.core.ledger;
import nava.core.pipeline_error;
#endif

#ifdef Q_MOC_RUN
#define NAVA_MODULE_EXPORT
#else
#define NAVA_MODULE_EXPORT export
#endif

/**
 * @brief Record of one verified, completed download.
 */
NAVA_MODULE_EXPORT struct LedgerEntry {
    QString trackId;
    QString targetPath;         //!< Normalized absolute path.
    QDateTime completedAt;
    qint64 size = 0;            //!< Bytes on disk.
    QString checksum;           //!< Lowercase SHA-256 hex digest.

    bool isValid() const { return !trackId.isEmpty() && !targetPath.isEmpty() && !checksum.isEmpty(); }

    //!< @brief Serialize to the on-disk JSON object.
    QJsonObject toJson() const;

    //!< @brief Parse an on-disk JSON object; returns an invalid entry on bad input.
    static LedgerEntry fromJson(const QJsonObject& obj);
};

/**
 * @brief Persisted set of completed downloads keyed by target path.
 *
 * The ledger is owned and written by the scheduler only. It is not
 * thread-safe; every call happens on the event loop thread.
 */
NAVA_MODULE_EXPORT class CompletionLedger {
public:
    /**
     * @brief Construct a ledger backed by @p storePath.
     * @param storePath JSON Lines file. Created on first record().
     */
    explicit CompletionLedger(const QString& storePath);

    QString storePath() const { return m_storePath; }

    /**
     * @brief Load entries from the store, replacing the in-memory set.
     *
     * A missing store yields an empty ledger. A ledger constructed without
     * a store path keeps its in-memory entries. Unreadable stores and lines
     * that do not parse are reported through warnings() and qWarning().
     *
     * @return false if the store exists but could not be opened.
     */
    bool load();

    /**
     * @brief Rewrite the store with exactly the in-memory entries.
     *
     * Uses QSaveFile so readers never observe a half-written store.
     *
     * @param error Receives a StorageError on failure. May be null.
     * @return true on success.
     */
    bool persist(PipelineError* error = nullptr);

    /**
     * @brief Check whether @p targetPath holds a verified complete file.
     *
     * True only if an entry exists, the file exists, and both its size and
     * SHA-256 match the entry. When @p trackId is not empty it must match
     * the recorded track as well.
     */
    bool has(const QString& targetPath, const QString& trackId = QString()) const;

    /**
     * @brief Every check of has() except the checksum.
     *
     * @return The stored entry if its file exists with the recorded size,
     *         otherwise nullptr. The pointer is invalidated by record(),
     *         forget() and load().
     */
    const LedgerEntry* candidate(const QString& targetPath, const QString& trackId = QString()) const;

    /**
     * @brief Add or replace the entry for a target path.
     *
     * Appends one line to the store and flushes it before returning.
     *
     * @param entry Verified entry.
     * @param error Receives a StorageError on failure. May be null.
     * @return true on success. On failure the in-memory set is unchanged.
     */
    bool record(const LedgerEntry& entry, PipelineError* error = nullptr);

    //!< @brief Drop the entry for @p targetPath, if any. Takes effect on disk at persist().
    bool forget(const QString& targetPath);

    //!< @brief Entry for @p targetPath, or nullptr.
    const LedgerEntry* entry(const QString& targetPath) const;

    QVector<LedgerEntry> entries() const;
    int size() const { return static_cast<int>(m_entries.size()); }
    bool isEmpty() const { return m_entries.isEmpty(); }

    //!< @brief Problems found by the last load().
    QStringList warnings() const { return m_warnings; }

private:
    void warn(const QString& message);

    QString m_storePath;                        //!< Backing file.
    QHash<QString, LedgerEntry> m_entries;      //!< Keyed by normalized target path.
    QStringList m_order;                        //!< Insertion order of keys.
    QStringList m_warnings;                     //!< Load diagnostics.
    bool m_needsNewline = false;                //!< Store ends without a line break.
};
