#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QNetworkReply>
#include <QUrl>
#include <QUrlQuery>

#include <gtest/gtest.h>

#include "test_support.hpp"

import nava.core.pipeline_error;
import nava.services.catalog_client;

using nava::test::FakeCatalogServer;
using nava::test::waitFor;

namespace {

QByteArray pageOf(int first, int count)
{
    QJsonArray items;
    for (int i = 0; i < count; ++i) {
        items.append(QJsonObject{ { "n", first + i } });
    }
    return QJsonDocument(QJsonObject{ { "items", items } }).toJson(QJsonDocument::Compact);
}

} // namespace

TEST(CatalogClientClassify, MapsStatusCodes)
{
    EXPECT_FALSE(CatalogClient::classify(200, QNetworkReply::NoError, QString()).isError());
    EXPECT_EQ(CatalogClient::classify(404, QNetworkReply::ContentNotFoundError, "x").kind(), ErrorKind::NotFound);
    EXPECT_EQ(CatalogClient::classify(400, QNetworkReply::ProtocolInvalidOperationError, "x").kind(), ErrorKind::NotFound);
    EXPECT_EQ(CatalogClient::classify(401, QNetworkReply::AuthenticationRequiredError, "x").kind(), ErrorKind::Unauthorized);
    EXPECT_EQ(CatalogClient::classify(403, QNetworkReply::ContentAccessDenied, "x").kind(), ErrorKind::Unauthorized);

    const PipelineError server = CatalogClient::classify(503, QNetworkReply::ServiceUnavailableError, "x");
    EXPECT_EQ(server.kind(), ErrorKind::Transient);
    EXPECT_TRUE(server.isTransient());
    EXPECT_EQ(server.domain(), ErrorDomain::Resolution);

    EXPECT_TRUE(CatalogClient::classify(429, QNetworkReply::UnknownContentError, "x").isTransient());
    EXPECT_TRUE(CatalogClient::classify(0, QNetworkReply::TimeoutError, "x").isTransient());
    EXPECT_TRUE(CatalogClient::classify(0, QNetworkReply::OperationCanceledError, "x").isCanceled());
}

TEST(CatalogClientUrl, JoinsPathAndBase)
{
    CatalogClient client;
    client.setApiBase(QStringLiteral("http://example.test/v1//"));
    EXPECT_EQ(client.apiBase(), QStringLiteral("http://example.test/v1"));
    EXPECT_EQ(client.endpointUrl(QStringLiteral("/me")).toString(), QStringLiteral("http://example.test/v1/me"));
    EXPECT_EQ(client.endpointUrl(QStringLiteral("me")).toString(), QStringLiteral("http://example.test/v1/me"));
    EXPECT_EQ(client.endpointUrl(QStringLiteral("https://other.test/x")).toString(),
              QStringLiteral("https://other.test/x"));

    client.setApiBase(QString());
    EXPECT_EQ(client.apiBase(), CatalogClient::defaultApiBase());
}

class CatalogClientTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        ASSERT_TRUE(server.listen());
        client.setApiBase(server.baseUrl());
        client.setAccessToken(QStringLiteral("configured"));
    }

    FakeCatalogServer server;
    CatalogClient client;
};

TEST_F(CatalogClientTest, GetJsonSendsBearerToken)
{
    server.setHandler([](const QString& path, const QUrlQuery&) {
        if (path == QStringLiteral("/me")) return FakeCatalogServer::Response{ 200, R"({"id":"user"})" };
        return FakeCatalogServer::Response{ 404, "{}" };
    });

    bool called = false;
    QJsonObject body;
    PipelineError error;
    client.getJson(QStringLiteral("/me"), QUrlQuery(), [&](const QJsonObject& b, const PipelineError& e) {
        called = true;
        body = b;
        error = e;
    });
    ASSERT_TRUE(waitFor([&]() { return called; }));
    EXPECT_FALSE(error.isError()) << error.toString().toStdString();
    EXPECT_EQ(body.value("id").toString(), QStringLiteral("user"));
    ASSERT_EQ(server.authorizations.size(), 1);
    EXPECT_EQ(server.authorizations.first(), QStringLiteral("Bearer configured"));

    called = false;
    client.getJson(QStringLiteral("/me"), QUrlQuery(), [&](const QJsonObject&, const PipelineError&) {
        called = true;
    }, QStringLiteral("override"));
    ASSERT_TRUE(waitFor([&]() { return called; }));
    EXPECT_EQ(server.authorizations.last(), QStringLiteral("Bearer override"));
    EXPECT_EQ(client.pendingRequests(), 0);
}

TEST_F(CatalogClientTest, HttpErrorsAreClassified)
{
    server.setHandler([](const QString& path, const QUrlQuery&) {
        if (path == QStringLiteral("/missing")) return FakeCatalogServer::Response{ 404, R"({"error":"nope"})" };
        if (path == QStringLiteral("/denied")) return FakeCatalogServer::Response{ 401, "{}" };
        if (path == QStringLiteral("/broken")) return FakeCatalogServer::Response{ 200, "not json" };
        return FakeCatalogServer::Response{ 500, "{}" };
    });

    auto fetch = [this](const QString& path) {
        bool called = false;
        PipelineError result;
        client.getJson(path, QUrlQuery(), [&](const QJsonObject&, const PipelineError& e) {
            called = true;
            result = e;
        });
        EXPECT_TRUE(waitFor([&]() { return called; }));
        return result;
    };

    EXPECT_EQ(fetch(QStringLiteral("/missing")).kind(), ErrorKind::NotFound);
    EXPECT_EQ(fetch(QStringLiteral("/denied")).kind(), ErrorKind::Unauthorized);
    EXPECT_EQ(fetch(QStringLiteral("/oops")).kind(), ErrorKind::Transient);
    EXPECT_EQ(fetch(QStringLiteral("/broken")).kind(), ErrorKind::Transient);
}

TEST_F(CatalogClientTest, PagingStopsAtShortPage)
{
    server.setHandler([](const QString& path, const QUrlQuery& query) {
        if (path != QStringLiteral("/me/tracks")) return FakeCatalogServer::Response{ 404, "{}" };
        const int offset = query.queryItemValue(QStringLiteral("offset")).toInt();
        const int limit = query.queryItemValue(QStringLiteral("limit")).toInt();
        const int total = 12;
        return FakeCatalogServer::Response{ 200, pageOf(offset, qMin(limit, qMax(0, total - offset))) };
    });

    bool called = false;
    QJsonArray items;
    PipelineError error;
    client.getPaged(QStringLiteral("/me/tracks"), QUrlQuery(), 5, [&](const QJsonArray& all, const PipelineError& e) {
        called = true;
        items = all;
        error = e;
    });
    ASSERT_TRUE(waitFor([&]() { return called; }));
    EXPECT_FALSE(error.isError());
    ASSERT_EQ(items.size(), 12);
    for (int i = 0; i < items.size(); ++i) {
        EXPECT_EQ(items.at(i).toObject().value("n").toInt(), i);
    }
    ASSERT_EQ(server.requests.size(), 3);
    EXPECT_TRUE(server.requests.at(2).contains(QStringLiteral("offset=10")));
}

TEST_F(CatalogClientTest, PagingStopsOnError)
{
    server.setHandler([](const QString&, const QUrlQuery& query) {
        if (query.queryItemValue(QStringLiteral("offset")) == QStringLiteral("0")) {
            return FakeCatalogServer::Response{ 200, pageOf(0, 2) };
        }
        return FakeCatalogServer::Response{ 502, "{}" };
    });

    bool called = false;
    QJsonArray items;
    PipelineError error;
    client.getPaged(QStringLiteral("/playlists/x/tracks"), QUrlQuery(), 2, [&](const QJsonArray& all, const PipelineError& e) {
        called = true;
        items = all;
        error = e;
    });
    ASSERT_TRUE(waitFor([&]() { return called; }));
    EXPECT_TRUE(error.isTransient());
    EXPECT_TRUE(items.isEmpty());
}

TEST_F(CatalogClientTest, GetBytesFetchesImagesWithoutToken)
{
    server.setHandler([](const QString& path, const QUrlQuery&) {
        if (path == QStringLiteral("/image/cover")) return FakeCatalogServer::Response{ 200, "\xff\xd8JPEG" };
        return FakeCatalogServer::Response{ 404, "{}" };
    });

    bool called = false;
    QByteArray body;
    PipelineError error;
    client.getBytes(QUrl(server.baseUrl() + QStringLiteral("/image/cover")),
                    [&](const QByteArray& b, const PipelineError& e) {
        called = true;
        body = b;
        error = e;
    });
    ASSERT_TRUE(waitFor([&]() { return called; }));
    EXPECT_FALSE(error.isError()) << error.toString().toStdString();
    EXPECT_EQ(body, QByteArray("\xff\xd8JPEG"));
    ASSERT_EQ(server.authorizations.size(), 1);
    EXPECT_TRUE(server.authorizations.first().isEmpty());

    called = false;
    client.getBytes(QUrl(server.baseUrl() + QStringLiteral("/image/gone")),
                    [&](const QByteArray& b, const PipelineError& e) {
        called = true;
        body = b;
        error = e;
    });
    ASSERT_TRUE(waitFor([&]() { return called; }));
    EXPECT_EQ(error.kind(), ErrorKind::NotFound);
    EXPECT_TRUE(body.isEmpty());
}
