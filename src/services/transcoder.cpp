module;
#include <QDebug>
#include <QFileInfo>
#include <QHash>

module nava.services.transcoder;

import nava.core.track;
import nava.core.pipeline_error;
import nava.services.session;
import nava.utils.download_utils;

namespace utils = nava::utils;

static constexpr int kStderrTailBytes = 4096;

QStringList TranscoderSettings::defaultArguments()
{
    return {
        QStringLiteral("-hide_banner"),
        QStringLiteral("-loglevel"), QStringLiteral("error"),
        QStringLiteral("-nostdin"),
        QStringLiteral("-y"),
        QStringLiteral("-i"), QStringLiteral("{input}"),
        QStringLiteral("-vn"),
        QStringLiteral("-map_metadata"), QStringLiteral("-1"),
        QStringLiteral("-metadata"), QStringLiteral("title={title}"),
        QStringLiteral("-metadata"), QStringLiteral("artist={artist}"),
        QStringLiteral("-metadata"), QStringLiteral("album={album}"),
        QStringLiteral("-metadata"), QStringLiteral("date={year}"),
        QStringLiteral("-metadata"), QStringLiteral("disc={disc}"),
        QStringLiteral("-metadata"), QStringLiteral("track={track}"),
        QStringLiteral("-b:a"), QStringLiteral("{bitrate}"),
        QStringLiteral("-f"), QStringLiteral("{format}"),
        QStringLiteral("{output}")
    };
}

QStringList TranscoderSettings::defaultCoverArguments()
{
    return {
        QStringLiteral("-hide_banner"),
        QStringLiteral("-loglevel"), QStringLiteral("error"),
        QStringLiteral("-nostdin"),
        QStringLiteral("-y"),
        QStringLiteral("-i"), QStringLiteral("{input}"),
        QStringLiteral("-i"), QStringLiteral("{cover}"),
        QStringLiteral("-map"), QStringLiteral("0:a"),
        QStringLiteral("-map"), QStringLiteral("1:v"),
        QStringLiteral("-c:v"), QStringLiteral("copy"),
        QStringLiteral("-disposition:v"), QStringLiteral("attached_pic"),
        QStringLiteral("-id3v2_version"), QStringLiteral("3"),
        QStringLiteral("-metadata:s:v"), QStringLiteral("title=Album cover"),
        QStringLiteral("-metadata:s:v"), QStringLiteral("comment=Cover (front)"),
        QStringLiteral("-map_metadata"), QStringLiteral("-1"),
        QStringLiteral("-metadata"), QStringLiteral("title={title}"),
        QStringLiteral("-metadata"), QStringLiteral("artist={artist}"),
        QStringLiteral("-metadata"), QStringLiteral("album={album}"),
        QStringLiteral("-metadata"), QStringLiteral("date={year}"),
        QStringLiteral("-metadata"), QStringLiteral("disc={disc}"),
        QStringLiteral("-metadata"), QStringLiteral("track={track}"),
        QStringLiteral("-b:a"), QStringLiteral("{bitrate}"),
        QStringLiteral("-f"), QStringLiteral("{format}"),
        QStringLiteral("{output}")
    };
}

Transcoder::Transcoder(const TranscoderSettings& settings, QObject* parent)
    : QObject(parent),
    m_settings(settings)
{
    m_killTimer.setSingleShot(true);
    connect(&m_killTimer, &QTimer::timeout, this, [this]() {
        if (m_process && m_process->state() != QProcess::NotRunning) {
            qWarning() << "[Transcoder] encoder ignored terminate, killing";
            m_process->kill();
        }
    });
}

Transcoder::~Transcoder()
{
    if (m_process) {
        m_process->disconnect(this);
        if (m_process->state() != QProcess::NotRunning) {
            m_process->kill();
            m_process->waitForFinished(1000);
        }
    }
}

QStringList Transcoder::expandArguments(const QStringList& arguments,
                                        const QString& inputPath, const QString& outputPath,
                                        const TrackDescriptor& track, AudioQuality quality,
                                        const QString& coverPath)
{
    const QHash<QString, QString> values{
        { QStringLiteral("input"), inputPath },
        { QStringLiteral("output"), outputPath },
        { QStringLiteral("cover"), coverPath },
        { QStringLiteral("format"), formatExtension(track.format) },
        { QStringLiteral("bitrate"), audioQualityBitrate(quality) },
        { QStringLiteral("title"), track.title },
        { QStringLiteral("artist"), track.artists.join(QStringLiteral(", ")) },
        { QStringLiteral("album"), track.album },
        { QStringLiteral("year"), track.releaseYear },
        { QStringLiteral("disc"), track.discNumber > 0 ? QString::number(track.discNumber) : QString() },
        { QStringLiteral("track"), track.trackNumber > 0 ? QString::number(track.trackNumber) : QString() }
    };
    QStringList out;
    out.reserve(arguments.size());
    for (const QString& arg : arguments) {
        out.append(utils::expandPlaceholders(arg, values));
    }
    return out;
}

bool Transcoder::isRunning() const
{
    return m_process && m_process->state() != QProcess::NotRunning;
}

void Transcoder::start(const QString& inputPath, const QString& outputPath,
                       const TrackDescriptor& track, AudioQuality quality,
                       const QString& coverPath)
{
    if (isRunning()) {
        qWarning() << "[Transcoder] start ignored, encoder already running";
        return;
    }
    if (m_process) {
        m_process->deleteLater();
        m_process = nullptr;
    }
    m_outputPath = outputPath;
    m_stderrTail.clear();
    m_aborted = false;
    m_finished = false;

    auto* process = new QProcess(this);
    m_process = process;
    process->setProcessChannelMode(QProcess::SeparateChannels);
    process->setStandardOutputFile(QProcess::nullDevice());

    connect(process, &QProcess::readyReadStandardError, this, [this, process]() {
        m_stderrTail.append(process->readAllStandardError());
        if (m_stderrTail.size() > kStderrTailBytes) m_stderrTail = m_stderrTail.right(kStderrTailBytes);
    });
    connect(process, &QProcess::errorOccurred, this, [this, process](QProcess::ProcessError error) {
        if (error != QProcess::FailedToStart) return;
        finish(PipelineError::transcode(ErrorKind::ProcessFailed,
                                        QStringLiteral("Transcoder %1 failed to start: %2")
                                            .arg(m_settings.program, process->errorString()))
                   .withTransient(false));
    });
    connect(process, &QProcess::finished, this, [this](int exitCode, QProcess::ExitStatus status) {
        m_killTimer.stop();
        if (m_aborted) {
            finish(PipelineError::canceled(QStringLiteral("Transcode aborted")));
            return;
        }
        const QString detail = QString::fromUtf8(m_stderrTail).trimmed().section('\n', -1);
        const QString suffix = detail.isEmpty() ? QString() : QStringLiteral(": ") + detail;
        if (status != QProcess::NormalExit) {
            finish(PipelineError::transcode(ErrorKind::ProcessFailed,
                                            QStringLiteral("Transcoder crashed") + suffix));
            return;
        }
        if (exitCode != 0) {
            finish(PipelineError::transcode(ErrorKind::ProcessFailed,
                                            QStringLiteral("Transcoder exited with %1%2").arg(exitCode).arg(suffix)));
            return;
        }
        const QFileInfo info(m_outputPath);
        if (!info.exists() || info.size() <= 0) {
            finish(PipelineError::transcode(ErrorKind::Truncated,
                                            QStringLiteral("Transcoder produced no output")));
            return;
        }
        finish(PipelineError());
    });

    const bool withCover = !coverPath.isEmpty() && m_settings.embedsCover();
    const QStringList args = expandArguments(withCover ? m_settings.coverArguments : m_settings.arguments,
                                             inputPath, outputPath, track, quality, coverPath);
    qDebug() << "[Transcoder] running" << m_settings.program << args;
    process->start(m_settings.program, args);
}

void Transcoder::abort(int graceMs)
{
    if (m_finished || m_aborted) return;
    m_aborted = true;
    if (!isRunning()) {
        finish(PipelineError::canceled(QStringLiteral("Transcode aborted")));
        return;
    }
    m_process->terminate();
    m_killTimer.start(qMax(0, graceMs));
}

void Transcoder::finish(const PipelineError& error)
{
    if (m_finished) return;
    m_finished = true;
    emit finished(error);
}
