/*!
 * @file        session.cppm
 * @brief       Explicit session value and its authenticator.
 * @details     Authentication yields a Session value that is passed to the
 *              resolver and to every worker. There is no process-wide login
 *              state: two sessions can coexist in one process.
 *
 *              An access token is taken from, in order, an explicit token,
 *              a cached credentials file, or an external token helper
 *              command that receives the account name and password in
 *              SPOTIFY_USERNAME / SPOTIFY_PASSWORD. Missing account
 *              details are asked for through a CredentialsPrompt before the
 *              helper runs. Each candidate is
 *              validated against the /me endpoint; the account product picks
 *              the audio quality.
 *
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     See LICENSE.md in the project root.
 */

module;
#include <functional>
#include <utility>

#include <QObject>
#include <QJsonObject>
#include <QPointer>
#include <QProcess>
#include <QString>
#include <QStringList>

#ifndef Q_MOC_RUN
export module nava.services.session;
import nava.core.pipeline_error;
import nava.services.catalog_client;
#endif

#ifdef Q_MOC_RUN
#define NAVA_MODULE_EXPORT
#else
#define NAVA_MODULE_EXPORT export
#endif

/**
 * @brief Audio quality granted by the account tier.
 */
NAVA_MODULE_EXPORT enum class AudioQuality {
    High,       //!< 160 kbit/s, free accounts.
    VeryHigh    //!< 320 kbit/s, premium accounts.
};

//!< @brief Encoder bitrate for @p quality ("160k", "320k").
NAVA_MODULE_EXPORT QString audioQualityBitrate(AudioQuality quality);

//!< @brief Quality name passed to the audio helper ("high", "very_high").
NAVA_MODULE_EXPORT QString audioQualityName(AudioQuality quality);

/**
 * @brief Everything the authenticator may use to obtain a token.
 */
NAVA_MODULE_EXPORT struct Credentials {
    QString accessToken;        //!< Explicit token; tried first.
    QString credentialsFile;    //!< Cached credentials JSON; tried second.
    QString tokenCommand;       //!< Helper printing a token; tried last.
    QString userName;           //!< Passed to the helper.
    QString password;           //!< Passed to the helper.
};

/**
 * @brief Interactive source of the account name and password.
 *
 * Fills the empty fields of the given Credentials. Returns false when the
 * user gives up.
 */
NAVA_MODULE_EXPORT using CredentialsPrompt = std::function<bool(Credentials* credentials)>;

/**
 * @brief Authenticated session.
 *
 * A plain value: copying a Session shares nothing mutable.
 */
NAVA_MODULE_EXPORT class Session {
public:
    Session() = default;
    Session(const QString& accessToken, const QString& userName, const QString& product);

    QString accessToken() const { return m_accessToken; }
    QString userName() const { return m_userName; }
    QString product() const { return m_product; }

    bool isPremium() const;
    AudioQuality quality() const;
    bool isValid() const { return !m_accessToken.isEmpty(); }

    //!< @brief Build from a /me response and the token that fetched it.
    static Session fromProfile(const QString& accessToken, const QJsonObject& profile);

private:
    QString m_accessToken;
    QString m_userName;
    QString m_product;
};

/**
 * @brief Produces a Session from Credentials.
 *
 * Emits exactly one of authenticated() or failed() per authenticate() call.
 * A candidate token rejected with Unauthorized falls through to the next
 * source; any other error stops immediately.
 */
NAVA_MODULE_EXPORT class SessionAuthenticator : public QObject {

    Q_OBJECT

public:
    /**
     * @brief Construct an authenticator.
     * @param client Catalog client used to validate tokens. Not owned.
     * @param parent Parent QObject.
     */
    explicit SessionAuthenticator(CatalogClient* client, QObject* parent = nullptr);

    //!< @brief Start authentication.
    void authenticate(const Credentials& credentials);

    //!< @brief Timeout for the token helper command in milliseconds.
    void setCommandTimeoutMs(int ms) { m_commandTimeoutMs = ms; }

    //!< @brief Ask for missing account details before the token helper runs.
    void setCredentialsPrompt(CredentialsPrompt prompt) { m_prompt = std::move(prompt); }

    /**
     * @brief Read a cached credentials file.
     *
     * Accepts {"username": ..., "access_token": ...}; "accessToken" and
     * "token" are accepted as key aliases.
     *
     * @param path File path.
     * @param token Receives the token.
     * @param userName Receives the account name, if present.
     * @return false if the file is missing or holds no token.
     */
    static bool readCredentialsFile(const QString& path, QString* token, QString* userName);

    //!< @brief Extract a token from helper output (plain text or JSON).
    static QString parseTokenOutput(const QByteArray& output);

signals:
    void authenticated(const Session& session);
    void failed(const PipelineError& error);

private:
    enum class Stage { Explicit, File, Command, Done };

    void tryNext();
    bool completeCredentials();
    void runTokenCommand();
    void validate(const QString& token);
    void fail(const PipelineError& error);

    QPointer<CatalogClient> m_client;       //!< Token validation.
    Credentials m_credentials;              //!< Current request.
    Stage m_stage = Stage::Done;            //!< Next source to try.
    PipelineError m_lastError;              //!< Last rejection.
    QPointer<QProcess> m_process;           //!< Running token helper.
    CredentialsPrompt m_prompt;             //!< Optional.
    int m_commandTimeoutMs = 60000;
    bool m_busy = false;
};

#include "session.moc"
