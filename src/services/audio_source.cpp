module;
#include <QDebug>
#include <QHash>
#include <QProcessEnvironment>

module nava.services.audio_source;

import nava.core.track;
import nava.core.pipeline_error;
import nava.services.session;
import nava.utils.download_utils;

namespace utils = nava::utils;

static constexpr int kExitNoInput = 66;
static constexpr int kExitNoPermission = 77;
static constexpr int kStderrTailBytes = 4096;

CommandAudioStream::CommandAudioStream(const QString& program, const QStringList& arguments,
                                       const QString& accessToken, QObject* parent)
    : AudioStream(parent),
    m_program(program),
    m_arguments(arguments),
    m_accessToken(accessToken)
{
    m_killTimer.setSingleShot(true);
    connect(&m_killTimer, &QTimer::timeout, this, [this]() {
        if (m_process && m_process->state() != QProcess::NotRunning) {
            qWarning() << "[Audio] helper ignored terminate, killing";
            m_process->kill();
        }
    });
}

CommandAudioStream::~CommandAudioStream()
{
    if (m_process) {
        m_process->disconnect(this);
        if (m_process->state() != QProcess::NotRunning) {
            m_process->kill();
            m_process->waitForFinished(1000);
        }
    }
}

PipelineError CommandAudioStream::classifyExit(int exitCode, const QString& detail)
{
    const QString suffix = detail.isEmpty() ? QString() : QStringLiteral(": ") + detail;
    if (exitCode == 0) return PipelineError();
    if (exitCode == kExitNoInput) {
        return PipelineError::fetch(ErrorKind::NotFound, QStringLiteral("Track unavailable") + suffix);
    }
    if (exitCode == kExitNoPermission) {
        return PipelineError::fetch(ErrorKind::Unauthorized, QStringLiteral("Streaming not permitted") + suffix);
    }
    return PipelineError::fetch(ErrorKind::Transient,
                                QStringLiteral("Audio helper exited with %1%2").arg(exitCode).arg(suffix));
}

void CommandAudioStream::appendStderr(const QByteArray& chunk)
{
    m_stderrTail.append(chunk);
    if (m_stderrTail.size() > kStderrTailBytes) {
        m_stderrTail = m_stderrTail.right(kStderrTailBytes);
    }
}

void CommandAudioStream::start()
{
    if (m_process) return;
    auto* process = new QProcess(this);
    m_process = process;

    QProcessEnvironment env = QProcessEnvironment::systemEnvironment();
    if (!m_accessToken.isEmpty()) env.insert("NAVA_ACCESS_TOKEN", m_accessToken);
    process->setProcessEnvironment(env);

    connect(process, &QProcess::readyReadStandardOutput, this, [this, process]() {
        const QByteArray chunk = process->readAllStandardOutput();
        if (!chunk.isEmpty() && !m_aborted) emit dataAvailable(chunk);
    });
    connect(process, &QProcess::readyReadStandardError, this, [this, process]() {
        appendStderr(process->readAllStandardError());
    });
    connect(process, &QProcess::errorOccurred, this, [this, process](QProcess::ProcessError error) {
        if (error != QProcess::FailedToStart) return;
        finish(PipelineError::fetch(ErrorKind::ProcessFailed,
                                    QStringLiteral("Audio helper failed to start: %1").arg(process->errorString()))
                   .withTransient(false));
    });
    connect(process, &QProcess::finished, this, [this, process](int exitCode, QProcess::ExitStatus status) {
        m_killTimer.stop();
        const QByteArray rest = process->readAllStandardOutput();
        if (!rest.isEmpty() && !m_aborted) emit dataAvailable(rest);
        appendStderr(process->readAllStandardError());
        if (m_aborted) {
            finish(PipelineError::canceled(QStringLiteral("Fetch aborted")));
            return;
        }
        const QString detail = QString::fromUtf8(m_stderrTail).trimmed().section('\n', -1);
        if (status != QProcess::NormalExit) {
            finish(PipelineError::fetch(ErrorKind::Transient,
                                        QStringLiteral("Audio helper crashed%1")
                                            .arg(detail.isEmpty() ? QString() : QStringLiteral(": ") + detail)));
            return;
        }
        finish(classifyExit(exitCode, detail));
    });

    qDebug() << "[Audio] starting" << m_program << m_arguments;
    process->start(m_program, m_arguments);
}

void CommandAudioStream::abort(int graceMs)
{
    if (m_finished || m_aborted) return;
    m_aborted = true;
    if (!m_process || m_process->state() == QProcess::NotRunning) {
        finish(PipelineError::canceled(QStringLiteral("Fetch aborted")));
        return;
    }
    m_process->terminate();
    m_killTimer.start(qMax(0, graceMs));
}

void CommandAudioStream::finish(const PipelineError& error)
{
    if (m_finished) return;
    m_finished = true;
    emit finished(error);
}

CommandAudioSource::CommandAudioSource(const QString& commandTemplate)
    : m_commandTemplate(commandTemplate)
{
}

QStringList CommandAudioSource::expandCommand(const Session& session, const TrackDescriptor& track) const
{
    const QString kind = mediaKindName(track.kind);
    const QHash<QString, QString> values{
        { QStringLiteral("id"), track.id },
        { QStringLiteral("kind"), kind },
        { QStringLiteral("uri"), QStringLiteral("spotify:%1:%2").arg(kind, track.id) },
        { QStringLiteral("quality"), audioQualityName(session.quality()) },
        { QStringLiteral("token"), session.accessToken() }
    };
    QStringList parts = QProcess::splitCommand(m_commandTemplate);
    for (QString& part : parts) {
        part = utils::expandPlaceholders(part, values);
    }
    return parts;
}

AudioStream* CommandAudioSource::open(const Session& session, const TrackDescriptor& track, QObject* parent)
{
    QStringList parts = expandCommand(session, track);
    const QString program = parts.isEmpty() ? QString() : parts.takeFirst();
    return new CommandAudioStream(program, parts, session.accessToken(), parent);
}
