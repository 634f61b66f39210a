module;
#include <QByteArray>
#include <QDebug>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QNetworkRequest>

module nava.services.catalog_client;

import nava.core.pipeline_error;

struct CatalogClient::PageState {
    QString path;
    QUrlQuery query;
    int pageSize = 50;
    int offset = 0;
    QString token;
    QJsonArray items;
    PageCallback done;
};

CatalogClient::CatalogClient(QObject* parent)
    : QObject(parent),
    m_apiBase(defaultApiBase())
{
}

CatalogClient::~CatalogClient()
{
    const QSet<QNetworkReply*> pending = m_pending;
    m_pending.clear();
    for (QNetworkReply* reply : pending) {
        reply->disconnect(this);
        reply->abort();
        reply->deleteLater();
    }
}

QString CatalogClient::defaultApiBase()
{
    return QStringLiteral("https://api.spotify.com/v1");
}

void CatalogClient::setApiBase(const QString& base)
{
    QString next = base.trimmed();
    while (next.endsWith('/')) next.chop(1);
    m_apiBase = next.isEmpty() ? defaultApiBase() : next;
}

QUrl CatalogClient::endpointUrl(const QString& path, const QUrlQuery& query) const
{
    QUrl url;
    if (path.startsWith(QStringLiteral("http://")) || path.startsWith(QStringLiteral("https://"))) {
        url = QUrl(path);
    } else {
        const QString sep = path.startsWith('/') ? QString() : QStringLiteral("/");
        url = QUrl(m_apiBase + sep + path);
    }
    if (!query.isEmpty()) url.setQuery(query);
    return url;
}

PipelineError CatalogClient::classify(int httpStatus, QNetworkReply::NetworkError networkError,
                                      const QString& detail)
{
    if (networkError == QNetworkReply::NoError && httpStatus >= 200 && httpStatus < 300) {
        return PipelineError();
    }
    if (networkError == QNetworkReply::OperationCanceledError && httpStatus == 0) {
        return PipelineError::canceled(QStringLiteral("Request aborted"));
    }
    const QString message = httpStatus > 0
        ? QStringLiteral("HTTP %1: %2").arg(httpStatus).arg(detail)
        : detail;
    if (httpStatus == 404 || httpStatus == 400) return PipelineError::resolution(ErrorKind::NotFound, message);
    if (httpStatus == 401 || httpStatus == 403) return PipelineError::resolution(ErrorKind::Unauthorized, message);
    if (httpStatus == 0) {
        switch (networkError) {
        case QNetworkReply::ContentNotFoundError:
        case QNetworkReply::ContentGoneError:
            return PipelineError::resolution(ErrorKind::NotFound, message);
        case QNetworkReply::AuthenticationRequiredError:
        case QNetworkReply::ContentAccessDenied:
            return PipelineError::resolution(ErrorKind::Unauthorized, message);
        default:
            break;
        }
    }
    return PipelineError::resolution(ErrorKind::Transient, message);
}

void CatalogClient::getJson(const QString& path, const QUrlQuery& query, JsonCallback done,
                            const QString& token)
{
    const QUrl url = endpointUrl(path, query);
    QNetworkRequest req{url};
    req.setRawHeader("User-Agent", "nava/1.0");
    req.setRawHeader("Accept", "application/json");
    const QString bearer = token.isEmpty() ? m_accessToken : token;
    if (!bearer.isEmpty()) {
        req.setRawHeader("Authorization", QByteArray("Bearer ") + bearer.toUtf8());
    }
    if (m_timeoutMs > 0) req.setTransferTimeout(m_timeoutMs);

    qDebug() << "[Catalog] GET" << url.toString(QUrl::RemoveQuery) << url.query();
    QNetworkReply* reply = m_net.get(req);
    m_pending.insert(reply);
    connect(reply, &QNetworkReply::finished, this, [this, reply, done]() {
        m_pending.remove(reply);
        const QByteArray data = reply->readAll();
        const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
        const PipelineError error = classify(status, reply->error(), reply->errorString());
        reply->deleteLater();
        if (error.isError()) {
            qWarning().noquote() << "[Catalog]" << error.toString();
            done(QJsonObject(), error);
            return;
        }
        QJsonParseError err;
        const QJsonDocument doc = QJsonDocument::fromJson(data, &err);
        if (err.error != QJsonParseError::NoError || !doc.isObject()) {
            done(QJsonObject(), PipelineError::resolution(ErrorKind::Transient,
                                   QStringLiteral("Malformed catalog response: %1").arg(err.errorString())));
            return;
        }
        done(doc.object(), PipelineError());
    });
}

QNetworkReply* CatalogClient::getBytes(const QUrl& url, BytesCallback done)
{
    QNetworkRequest req{url};
    req.setRawHeader("User-Agent", "nava/1.0");
    if (m_timeoutMs > 0) req.setTransferTimeout(m_timeoutMs);

    qDebug() << "[Catalog] GET" << url.toString(QUrl::RemoveQuery);
    QNetworkReply* reply = m_net.get(req);
    m_pending.insert(reply);
    connect(reply, &QNetworkReply::finished, this, [this, reply, done]() {
        m_pending.remove(reply);
        const QByteArray data = reply->readAll();
        const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
        const PipelineError error = classify(status, reply->error(), reply->errorString());
        reply->deleteLater();
        done(error.isError() ? QByteArray() : data, error);
    });
    return reply;
}

void CatalogClient::getPaged(const QString& path, const QUrlQuery& query, int pageSize, PageCallback done,
                             const QString& token)
{
    auto state = std::make_shared<PageState>();
    state->path = path;
    state->query = query;
    state->pageSize = qMax(1, pageSize);
    state->token = token;
    state->done = std::move(done);
    fetchPage(state);
}

void CatalogClient::fetchPage(const std::shared_ptr<PageState>& state)
{
    QUrlQuery query = state->query;
    query.removeAllQueryItems(QStringLiteral("limit"));
    query.removeAllQueryItems(QStringLiteral("offset"));
    query.addQueryItem(QStringLiteral("limit"), QString::number(state->pageSize));
    query.addQueryItem(QStringLiteral("offset"), QString::number(state->offset));

    getJson(state->path, query, [this, state](const QJsonObject& body, const PipelineError& error) {
        if (error.isError()) {
            state->done(QJsonArray(), error);
            return;
        }
        const QJsonArray page = body.value("items").toArray();
        for (const QJsonValue& item : page) state->items.append(item);
        if (page.size() < state->pageSize) {
            state->done(state->items, PipelineError());
            return;
        }
        state->offset += state->pageSize;
        fetchPage(state);
    }, state->token);
}

void CatalogClient::abortAll()
{
    const QSet<QNetworkReply*> pending = m_pending;
    for (QNetworkReply* reply : pending) {
        reply->abort();
    }
}
