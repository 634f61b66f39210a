/*!
 * @file        audio_source.cppm
 * @brief       Encoded audio byte streams from the session collaborator.
 * @details     AudioSource opens one AudioStream per fetch. A stream pushes
 *              encoded bytes through dataAvailable() and reports its outcome
 *              once through finished(). The shipped implementation runs an
 *              external helper command whose stdout carries the audio and
 *              whose exit code classifies failures:
 *
 *              - 0  success
 *              - 66 (EX_NOINPUT) the track does not exist or is unavailable
 *              - 77 (EX_NOPERM) the session is not allowed to stream it
 *              - anything else is treated as transient
 *
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     See LICENSE.md in the project root.
 */

module;
#include <QObject>
#include <QByteArray>
#include <QPointer>
#include <QProcess>
#include <QString>
#include <QStringList>
#include <QTimer>

#ifndef Q_MOC_RUN
export module nava.services.audio_source;
import nava.core.track;
import nava.core.pipeline_error;
import nava.services.session;
#endif

#ifdef Q_MOC_RUN
#define NAVA_MODULE_EXPORT
#else
#define NAVA_MODULE_EXPORT export
#endif

/**
 * @brief One in-flight fetch of encoded audio.
 *
 * start() begins streaming. finished() is emitted exactly once, after the
 * last dataAvailable(). abort() ends the stream early; finished() then
 * reports Canceled.
 */
NAVA_MODULE_EXPORT class AudioStream : public QObject {

    Q_OBJECT

public:
    explicit AudioStream(QObject* parent = nullptr) : QObject(parent) {}
    ~AudioStream() override = default;

    virtual void start() = 0;

    /**
     * @brief Stop the stream.
     * @param graceMs Time allowed for a clean shutdown before forcing it.
     */
    virtual void abort(int graceMs) = 0;

signals:
    void dataAvailable(const QByteArray& chunk);
    void finished(const PipelineError& error);
};

/**
 * @brief Factory of audio streams.
 */
NAVA_MODULE_EXPORT class AudioSource {
public:
    virtual ~AudioSource() = default;

    /**
     * @brief Create a stream for @p track.
     * @param session Authenticated session.
     * @param track Track or episode to fetch.
     * @param parent Owner of the returned stream.
     * @return New stream, not yet started.
     */
    virtual AudioStream* open(const Session& session, const TrackDescriptor& track, QObject* parent) = 0;
};

/**
 * @brief Stream backed by an external helper process.
 */
NAVA_MODULE_EXPORT class CommandAudioStream : public AudioStream {

    Q_OBJECT

public:
    /**
     * @brief Construct a stream.
     * @param program Helper executable.
     * @param arguments Expanded arguments.
     * @param accessToken Exported to the helper as NAVA_ACCESS_TOKEN.
     * @param parent Parent QObject.
     */
    CommandAudioStream(const QString& program, const QStringList& arguments,
                       const QString& accessToken, QObject* parent = nullptr);
    ~CommandAudioStream() override;

    void start() override;
    void abort(int graceMs) override;

    //!< @brief Map a helper exit code onto a fetch error.
    static PipelineError classifyExit(int exitCode, const QString& detail);

private:
    void finish(const PipelineError& error);
    void appendStderr(const QByteArray& chunk);

    QString m_program;
    QStringList m_arguments;
    QString m_accessToken;
    QPointer<QProcess> m_process;   //!< Helper process.
    QTimer m_killTimer;             //!< Forces kill after the abort grace period.
    QByteArray m_stderrTail;        //!< Last bytes of helper stderr.
    bool m_aborted = false;
    bool m_finished = false;
};

/**
 * @brief AudioSource that launches a helper command per fetch.
 *
 * The command template is split like a shell command line; the
 * placeholders {id}, {kind}, {uri} and {quality} are substituted per
 * argument. {token} is also accepted, but the token is always exported
 * through the environment as well.
 */
NAVA_MODULE_EXPORT class CommandAudioSource : public AudioSource {
public:
    explicit CommandAudioSource(const QString& commandTemplate);

    AudioStream* open(const Session& session, const TrackDescriptor& track, QObject* parent) override;

    QString commandTemplate() const { return m_commandTemplate; }

    //!< @brief Expand the template for @p track; the program comes first.
    QStringList expandCommand(const Session& session, const TrackDescriptor& track) const;

private:
    QString m_commandTemplate;
};

#include "audio_source.moc"
