/*!
 * @file        transcoder.cppm
 * @brief       External encoder process wrapper.
 * @details     Runs the configured encoder (ffmpeg by default) to turn the
 *              raw fetched audio into the requested output format. Success
 *              requires exit status 0 and a non-empty output file.
 *
 *              Arguments come from a template with the placeholders
 *              {input} {output} {cover} {format} {bitrate} {title} {artist}
 *              {album} {year} {disc} {track}. Each placeholder is substituted
 *              inside its own argument in a single pass, so metadata never
 *              needs shell quoting and braces inside paths or titles are kept.
 *
 *              When a cover image is supplied and a cover template is set,
 *              the cover template is used instead, attaching the image as
 *              front cover art.
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
export module nava.services.transcoder;
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
 * @brief Encoder program and argument template.
 */
NAVA_MODULE_EXPORT struct TranscoderSettings {
    QString program = QStringLiteral("ffmpeg");
    QStringList arguments = defaultArguments();
    QStringList coverArguments = defaultCoverArguments();  //!< Empty disables cover art.

    //!< @brief ffmpeg arguments writing tagged output of the requested format.
    static QStringList defaultArguments();

    //!< @brief ffmpeg arguments that additionally attach {cover} as front cover (mp3).
    static QStringList defaultCoverArguments();

    bool embedsCover() const { return !coverArguments.isEmpty(); }
};

/**
 * @brief Runs one encode.
 *
 * finished() is emitted exactly once per start(). The output file is not
 * removed on failure; the caller owns temporary files.
 */
NAVA_MODULE_EXPORT class Transcoder : public QObject {

    Q_OBJECT

public:
    explicit Transcoder(const TranscoderSettings& settings, QObject* parent = nullptr);
    ~Transcoder() override;

    /**
     * @brief Start encoding.
     * @param inputPath Raw audio file.
     * @param outputPath Destination of the encoded file.
     * @param track Descriptor supplying format and metadata tags.
     * @param quality Session quality selecting the bitrate.
     * @param coverPath Cover image to attach; empty encodes without cover art.
     */
    void start(const QString& inputPath, const QString& outputPath,
               const TrackDescriptor& track, AudioQuality quality,
               const QString& coverPath = QString());

    /**
     * @brief Terminate the encoder, killing it after @p graceMs.
     *
     * finished() then reports Canceled.
     */
    void abort(int graceMs);

    bool isRunning() const;

    //!< @brief Substitute placeholders in @p arguments.
    static QStringList expandArguments(const QStringList& arguments,
                                       const QString& inputPath, const QString& outputPath,
                                       const TrackDescriptor& track, AudioQuality quality,
                                       const QString& coverPath = QString());

signals:
    void finished(const PipelineError& error);

private:
    void finish(const PipelineError& error);

    TranscoderSettings m_settings;
    QPointer<QProcess> m_process;
    QTimer m_killTimer;
    QString m_outputPath;
    QByteArray m_stderrTail;
    bool m_aborted = false;
    bool m_finished = true;
};

#include "transcoder.moc"
