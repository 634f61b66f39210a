module;
#include <QByteArray>
#include <QDebug>
#include <QFile>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QProcessEnvironment>
#include <QTimer>
#include <QUrlQuery>

module nava.services.session;

import nava.core.pipeline_error;
import nava.services.catalog_client;
import nava.utils.download_utils;

namespace utils = nava::utils;

QString audioQualityBitrate(AudioQuality quality)
{
    return quality == AudioQuality::VeryHigh ? QStringLiteral("320k") : QStringLiteral("160k");
}

QString audioQualityName(AudioQuality quality)
{
    return quality == AudioQuality::VeryHigh ? QStringLiteral("very_high") : QStringLiteral("high");
}

Session::Session(const QString& accessToken, const QString& userName, const QString& product)
    : m_accessToken(accessToken),
    m_userName(userName),
    m_product(product)
{
}

bool Session::isPremium() const
{
    return m_product.compare(QStringLiteral("premium"), Qt::CaseInsensitive) == 0;
}

AudioQuality Session::quality() const
{
    return isPremium() ? AudioQuality::VeryHigh : AudioQuality::High;
}

Session Session::fromProfile(const QString& accessToken, const QJsonObject& profile)
{
    QString name = profile.value("id").toString();
    if (name.isEmpty()) name = profile.value("display_name").toString();
    return Session(accessToken, name, profile.value("product").toString());
}

SessionAuthenticator::SessionAuthenticator(CatalogClient* client, QObject* parent)
    : QObject(parent),
    m_client(client)
{
}

bool SessionAuthenticator::readCredentialsFile(const QString& path, QString* token, QString* userName)
{
    const QString local = utils::normalizeFilePath(path);
    if (local.isEmpty()) return false;
    QFile file(local);
    if (!file.exists()) return false;
    if (!file.open(QIODevice::ReadOnly)) {
        qWarning() << "[Session] cannot read credentials file" << local << file.errorString();
        return false;
    }
    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        qWarning() << "[Session] credentials file" << local << "is not valid JSON";
        return false;
    }
    const QJsonObject obj = doc.object();
    QString value = obj.value("access_token").toString();
    if (value.isEmpty()) value = obj.value("accessToken").toString();
    if (value.isEmpty()) value = obj.value("token").toString();
    if (value.trimmed().isEmpty()) return false;
    if (token) *token = value.trimmed();
    if (userName) *userName = obj.value("username").toString();
    return true;
}

QString SessionAuthenticator::parseTokenOutput(const QByteArray& output)
{
    const QByteArray trimmed = output.trimmed();
    if (trimmed.isEmpty()) return QString();
    if (trimmed.startsWith('{')) {
        const QJsonDocument doc = QJsonDocument::fromJson(trimmed);
        if (!doc.isObject()) return QString();
        QString value = doc.object().value("access_token").toString();
        if (value.isEmpty()) value = doc.object().value("accessToken").toString();
        return value.trimmed();
    }
    // First line only; helpers may print diagnostics after the token.
    return QString::fromUtf8(trimmed.split('\n').first()).trimmed();
}

void SessionAuthenticator::authenticate(const Credentials& credentials)
{
    if (m_busy) {
        qWarning() << "[Session] authentication already in progress";
        return;
    }
    m_busy = true;
    m_credentials = credentials;
    m_stage = Stage::Explicit;
    m_lastError = PipelineError::resolution(ErrorKind::Unauthorized,
                                            QStringLiteral("No credentials available"));
    QTimer::singleShot(0, this, &SessionAuthenticator::tryNext);
}

void SessionAuthenticator::tryNext()
{
    while (m_stage != Stage::Done) {
        const Stage stage = m_stage;
        switch (stage) {
        case Stage::Explicit:
            m_stage = Stage::File;
            if (!m_credentials.accessToken.trimmed().isEmpty()) {
                qDebug() << "[Session] trying explicit access token";
                validate(m_credentials.accessToken.trimmed());
                return;
            }
            break;
        case Stage::File: {
            m_stage = Stage::Command;
            QString token;
            if (readCredentialsFile(m_credentials.credentialsFile, &token, nullptr)) {
                qInfo() << "[Session] credentials loaded from" << m_credentials.credentialsFile;
                validate(token);
                return;
            }
            break;
        }
        case Stage::Command:
            m_stage = Stage::Done;
            if (!m_credentials.tokenCommand.trimmed().isEmpty()) {
                if (!completeCredentials()) {
                    fail(PipelineError::resolution(ErrorKind::Unauthorized,
                                                   QStringLiteral("No account name or password given")));
                    return;
                }
                runTokenCommand();
                return;
            }
            break;
        case Stage::Done:
            break;
        }
    }
    fail(m_lastError);
}

bool SessionAuthenticator::completeCredentials()
{
    if (!m_credentials.userName.isEmpty() && !m_credentials.password.isEmpty()) return true;
    if (!m_prompt) return true;
    if (!m_prompt(&m_credentials)) return false;
    return !m_credentials.userName.isEmpty() && !m_credentials.password.isEmpty();
}

void SessionAuthenticator::runTokenCommand()
{
    QStringList parts = QProcess::splitCommand(m_credentials.tokenCommand);
    if (parts.isEmpty()) {
        fail(PipelineError::resolution(ErrorKind::Unauthorized, QStringLiteral("Empty token command")));
        return;
    }
    const QString program = parts.takeFirst();

    auto* process = new QProcess(this);
    m_process = process;
    QProcessEnvironment env = QProcessEnvironment::systemEnvironment();
    if (!m_credentials.userName.isEmpty()) env.insert("SPOTIFY_USERNAME", m_credentials.userName);
    if (!m_credentials.password.isEmpty()) env.insert("SPOTIFY_PASSWORD", m_credentials.password);
    process->setProcessEnvironment(env);

    auto* timer = new QTimer(process);
    timer->setSingleShot(true);
    connect(timer, &QTimer::timeout, process, [process]() {
        qWarning() << "[Session] token command timed out";
        process->kill();
    });

    connect(process, &QProcess::errorOccurred, this, [this, process](QProcess::ProcessError error) {
        if (error != QProcess::FailedToStart) return;
        process->deleteLater();
        fail(PipelineError::resolution(ErrorKind::Unauthorized,
                                       QStringLiteral("Token command failed to start: %1").arg(process->errorString())));
    });
    connect(process, &QProcess::finished, this, [this, process](int exitCode, QProcess::ExitStatus status) {
        const QByteArray out = process->readAllStandardOutput();
        const QByteArray err = process->readAllStandardError();
        process->deleteLater();
        if (status != QProcess::NormalExit || exitCode != 0) {
            const QString detail = QString::fromUtf8(err).trimmed();
            fail(PipelineError::resolution(ErrorKind::Unauthorized,
                                           QStringLiteral("Token command exited with %1%2")
                                               .arg(exitCode)
                                               .arg(detail.isEmpty() ? QString() : QStringLiteral(": ") + detail)));
            return;
        }
        const QString token = parseTokenOutput(out);
        if (token.isEmpty()) {
            fail(PipelineError::resolution(ErrorKind::Unauthorized,
                                           QStringLiteral("Token command printed no token")));
            return;
        }
        validate(token);
    });

    qDebug() << "[Session] running token command" << program;
    process->start(program, parts);
    if (m_commandTimeoutMs > 0) timer->start(m_commandTimeoutMs);
}

void SessionAuthenticator::validate(const QString& token)
{
    if (!m_client) {
        fail(PipelineError::resolution(ErrorKind::Transient, QStringLiteral("No catalog client")));
        return;
    }
    m_client->getJson(QStringLiteral("/me"), QUrlQuery(),
                      [this, token](const QJsonObject& body, const PipelineError& error) {
        if (!error.isError()) {
            const Session session = Session::fromProfile(token, body);
            m_client->setAccessToken(token);
            m_busy = false;
            qInfo().noquote() << "[Session] logged in as" << session.userName()
                              << "product" << session.product()
                              << "quality" << audioQualityBitrate(session.quality());
            emit authenticated(session);
            return;
        }
        if (error.kind() == ErrorKind::Unauthorized) {
            m_lastError = error;
            tryNext();
            return;
        }
        fail(error);
    }, token);
}

void SessionAuthenticator::fail(const PipelineError& error)
{
    if (!m_busy) return;
    m_busy = false;
    m_stage = Stage::Done;
    qWarning().noquote() << "[Session] authentication failed:" << error.toString();
    emit failed(error);
}
