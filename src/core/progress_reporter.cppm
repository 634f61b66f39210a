/*!
 * @file        progress_reporter.cppm
 * @brief       Observer interface for pipeline progress.
 * @details     The scheduler and its workers publish ProgressEvent values to
 *              every registered ProgressReporter. Reporters never influence
 *              the pipeline; they only render or record what happened.
 *
 *              Two reporters ship with the tool: a console reporter printing
 *              one line per started/terminal event and a logging reporter that
 *              traces every event (byte progress included) through qDebug().
 *
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     See LICENSE.md in the project root.
 */

module;
#include <QHash>
#include <QString>
#include <QTextStream>
#include <QtGlobal>

#ifndef Q_MOC_RUN
export module nava.core.progress_reporter;
import nava.core.job;
#endif

#ifdef Q_MOC_RUN
#define NAVA_MODULE_EXPORT
#else
#define NAVA_MODULE_EXPORT export
#endif

/**
 * @brief Capability interface receiving progress events.
 *
 * Events are delivered on the thread running the scheduler, in the order
 * they happen for a given job.
 */
NAVA_MODULE_EXPORT class ProgressReporter {
public:
    virtual ~ProgressReporter() = default;

    /**
     * @brief Called once per event.
     * @param event Event payload.
     */
    virtual void onEvent(const ProgressEvent& event) = 0;
};

/**
 * @brief Writes one line per started and terminal event to a text stream.
 *
 * Byte progress is not printed. Each line is prefixed with a running
 * "[done/total]" counter once a total is known.
 */
NAVA_MODULE_EXPORT class ConsoleProgressReporter : public ProgressReporter {
public:
    /**
     * @brief Construct a reporter writing to @p stream.
     * @param stream Destination, typically wrapping stdout. Not owned.
     */
    explicit ConsoleProgressReporter(QTextStream* stream);

    //!< @brief Set the number of jobs in the run for the counter prefix.
    void setTotal(int total);

    void onEvent(const ProgressEvent& event) override;

private:
    QString counterPrefix() const;

    QTextStream* m_stream = nullptr;   //!< Output stream.
    int m_total = 0;                   //!< Jobs in the run (0 = unknown).
    int m_done = 0;                    //!< Terminal events seen.
};

/**
 * @brief Traces every event through the Qt logging framework.
 *
 * Byte progress is rate limited per job to one message per
 * @c bytesInterval bytes.
 */
NAVA_MODULE_EXPORT class LogProgressReporter : public ProgressReporter {
public:
    explicit LogProgressReporter(qint64 bytesInterval = 1024 * 1024);

    void onEvent(const ProgressEvent& event) override;

private:
    qint64 m_bytesInterval = 0;
    QHash<quint64, qint64> m_lastLogged;   //!< Last logged byte count per job.
};
