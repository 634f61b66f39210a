/*!
 * @file        catalog_client.cppm
 * @brief       Authenticated JSON client for the catalog Web API.
 * @details     Wraps QNetworkAccessManager with bearer authentication,
 *              limit/offset pagination and the mapping of HTTP and network
 *              failures onto the pipeline error taxonomy.
 *
 *              Requests are asynchronous; results are delivered to a
 *              completion callback on the event loop thread. The client never
 *              retries on its own: Transient failures are reported so the
 *              caller can decide.
 *
 * @since       18 Oct 2026
 * @copyright   Copyright (c) 2026 Genyleap. All rights reserved.
 * @license     See LICENSE.md in the project root.
 */

module;
#include <QObject>
#include <QByteArray>
#include <QJsonArray>
#include <QJsonObject>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QSet>
#include <QString>
#include <QUrl>
#include <QUrlQuery>

#include <functional>
#include <memory>

#ifndef Q_MOC_RUN
export module nava.services.catalog_client;
import nava.core.pipeline_error;
#endif

#ifdef Q_MOC_RUN
#define NAVA_MODULE_EXPORT
#else
#define NAVA_MODULE_EXPORT export
#endif

/**
 * @brief Asynchronous catalog Web API client.
 *
 * One instance is shared by the authenticator and the resolver. The access
 * token is set once a session has been established.
 */
NAVA_MODULE_EXPORT class CatalogClient : public QObject {

    Q_OBJECT

public:
    //!< @brief Receives a decoded JSON object or an error.
    using JsonCallback = std::function<void(const QJsonObject& body, const PipelineError& error)>;

    //!< @brief Receives a raw response body or an error.
    using BytesCallback = std::function<void(const QByteArray& body, const PipelineError& error)>;

    //!< @brief Receives every item of a paged collection or an error.
    using PageCallback = std::function<void(const QJsonArray& items, const PipelineError& error)>;

    explicit CatalogClient(QObject* parent = nullptr);
    ~CatalogClient() override;

    //!< @brief Default Web API base URL.
    static QString defaultApiBase();

    QString apiBase() const { return m_apiBase; }
    void setApiBase(const QString& base);

    QString accessToken() const { return m_accessToken; }
    void setAccessToken(const QString& token) { m_accessToken = token; }

    //!< @brief Per-request transfer timeout in milliseconds (0 disables).
    int timeoutMs() const { return m_timeoutMs; }
    void setTimeoutMs(int ms) { m_timeoutMs = qMax(0, ms); }

    /**
     * @brief GET a JSON object.
     *
     * @param path Endpoint path relative to the API base ("/me"), or an
     *             absolute URL.
     * @param query Query parameters.
     * @param done Completion callback, invoked exactly once.
     * @param token Overrides the configured access token when not empty.
     */
    void getJson(const QString& path, const QUrlQuery& query, JsonCallback done,
                 const QString& token = QString());

    /**
     * @brief GET every item of a limit/offset paged collection.
     *
     * Requests pages of @p pageSize items starting at offset 0 and stops at
     * the first page holding fewer than @p pageSize items. Items of all
     * pages are concatenated in order.
     *
     * @param path Endpoint path relative to the API base.
     * @param query Extra query parameters (limit/offset are managed here).
     * @param pageSize Items per page.
     * @param done Completion callback, invoked exactly once.
     * @param token Overrides the configured access token when not empty.
     */
    void getPaged(const QString& path, const QUrlQuery& query, int pageSize, PageCallback done,
                  const QString& token = QString());

    /**
     * @brief GET a binary resource such as a cover image.
     *
     * No Authorization header is sent; image URLs point at a content host
     * rather than the Web API.
     *
     * @param url Absolute URL.
     * @param done Completion callback, invoked exactly once.
     * @return The reply, so the caller can abort this request alone.
     */
    QNetworkReply* getBytes(const QUrl& url, BytesCallback done);

    //!< @brief Abort every in-flight request; their callbacks report Canceled.
    void abortAll();

    //!< @brief Number of requests in flight.
    int pendingRequests() const { return static_cast<int>(m_pending.size()); }

    /**
     * @brief Map a finished reply onto the error taxonomy.
     *
     * 404 and 400 (malformed id) are NotFound and 401/403 are Unauthorized.
     * Everything else (5xx, 429, connection and timeout errors) is
     * Transient. Aborted requests map to Canceled.
     *
     * @param httpStatus HTTP status code (0 if none was received).
     * @param networkError Qt network error code.
     * @param detail Error text for the message.
     * @return Resolution error, or a default value for success.
     */
    static PipelineError classify(int httpStatus, QNetworkReply::NetworkError networkError,
                                  const QString& detail);

    //!< @brief Resolve @p path against the API base.
    QUrl endpointUrl(const QString& path, const QUrlQuery& query = QUrlQuery()) const;

private:
    struct PageState;
    void fetchPage(const std::shared_ptr<PageState>& state);

    QNetworkAccessManager m_net;            //!< Owned network manager.
    QSet<QNetworkReply*> m_pending;         //!< Requests in flight.
    QString m_apiBase;                      //!< Base URL without trailing slash.
    QString m_accessToken;                  //!< Bearer token.
    int m_timeoutMs = 30000;                //!< Transfer timeout.
};

#include "catalog_client.moc"
