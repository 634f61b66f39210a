#include <QFile>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTemporaryDir>
#include <QUrlQuery>

#include <gtest/gtest.h>

#include "test_support.hpp"

import nava.core.pipeline_error;
import nava.services.catalog_client;
import nava.services.session;

using nava::test::FakeCatalogServer;
using nava::test::waitFor;

TEST(SessionTest, QualityFollowsProduct)
{
    const Session premium(QStringLiteral("t"), QStringLiteral("u"), QStringLiteral("Premium"));
    EXPECT_TRUE(premium.isPremium());
    EXPECT_EQ(premium.quality(), AudioQuality::VeryHigh);
    EXPECT_EQ(audioQualityBitrate(premium.quality()), QStringLiteral("320k"));
    EXPECT_EQ(audioQualityName(premium.quality()), QStringLiteral("very_high"));

    const Session basic(QStringLiteral("t"), QStringLiteral("u"), QStringLiteral("free"));
    EXPECT_FALSE(basic.isPremium());
    EXPECT_EQ(audioQualityBitrate(basic.quality()), QStringLiteral("160k"));

    EXPECT_FALSE(Session().isValid());
}

TEST(SessionTest, FromProfilePrefersId)
{
    const Session a = Session::fromProfile(QStringLiteral("t"),
        QJsonObject{ { "id", "user1" }, { "display_name", "User" }, { "product", "premium" } });
    EXPECT_EQ(a.userName(), QStringLiteral("user1"));
    const Session b = Session::fromProfile(QStringLiteral("t"), QJsonObject{ { "display_name", "User" } });
    EXPECT_EQ(b.userName(), QStringLiteral("User"));
    EXPECT_EQ(b.accessToken(), QStringLiteral("t"));
}

TEST(SessionTest, ParsesTokenOutput)
{
    EXPECT_EQ(SessionAuthenticator::parseTokenOutput("  abc123\nlogged in\n"), QStringLiteral("abc123"));
    EXPECT_EQ(SessionAuthenticator::parseTokenOutput(R"({"access_token":"xyz","expires_in":3600})"),
              QStringLiteral("xyz"));
    EXPECT_EQ(SessionAuthenticator::parseTokenOutput("{broken"), QString());
    EXPECT_EQ(SessionAuthenticator::parseTokenOutput("\n\n"), QString());
}

TEST(SessionTest, ReadsCredentialsFile)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = dir.filePath(QStringLiteral("credentials.json"));
    ASSERT_TRUE(nava::test::writeFile(path, R"({"username":"alice","accessToken":"tok"})"));

    QString token;
    QString user;
    ASSERT_TRUE(SessionAuthenticator::readCredentialsFile(path, &token, &user));
    EXPECT_EQ(token, QStringLiteral("tok"));
    EXPECT_EQ(user, QStringLiteral("alice"));

    ASSERT_TRUE(nava::test::writeFile(path, R"({"username":"alice"})"));
    EXPECT_FALSE(SessionAuthenticator::readCredentialsFile(path, &token, &user));
    EXPECT_FALSE(SessionAuthenticator::readCredentialsFile(dir.filePath(QStringLiteral("missing.json")), &token, &user));
}

class AuthenticatorTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        ASSERT_TRUE(dir.isValid());
        ASSERT_TRUE(server.listen());
        client.setApiBase(server.baseUrl());
        // Only "good" is accepted.
        server.setHandler([this](const QString& path, const QUrlQuery&) {
            if (path != QStringLiteral("/me")) return FakeCatalogServer::Response{ 404, "{}" };
            if (server.authorizations.last() != QStringLiteral("Bearer good")) {
                return FakeCatalogServer::Response{ 401, R"({"error":"invalid token"})" };
            }
            return FakeCatalogServer::Response{ 200, R"({"id":"alice","product":"premium"})" };
        });
    }

    struct Outcome {
        bool done = false;
        Session session;
        PipelineError error;
    };

    Outcome run(const Credentials& credentials, CredentialsPrompt prompt = CredentialsPrompt())
    {
        SessionAuthenticator auth(&client);
        auth.setCredentialsPrompt(std::move(prompt));
        Outcome outcome;
        QObject::connect(&auth, &SessionAuthenticator::authenticated, [&](const Session& s) {
            outcome.done = true;
            outcome.session = s;
        });
        QObject::connect(&auth, &SessionAuthenticator::failed, [&](const PipelineError& e) {
            outcome.done = true;
            outcome.error = e;
        });
        auth.authenticate(credentials);
        EXPECT_TRUE(waitFor([&]() { return outcome.done; }));
        return outcome;
    }

    QTemporaryDir dir;
    FakeCatalogServer server;
    CatalogClient client;
};

TEST_F(AuthenticatorTest, ExplicitTokenIsValidated)
{
    Credentials credentials;
    credentials.accessToken = QStringLiteral("good");
    const Outcome outcome = run(credentials);
    ASSERT_FALSE(outcome.error.isError()) << outcome.error.toString().toStdString();
    EXPECT_EQ(outcome.session.userName(), QStringLiteral("alice"));
    EXPECT_EQ(outcome.session.quality(), AudioQuality::VeryHigh);
    EXPECT_EQ(client.accessToken(), QStringLiteral("good"));
}

TEST_F(AuthenticatorTest, RejectedTokenFallsThroughToCredentialsFile)
{
    const QString path = dir.filePath(QStringLiteral("credentials.json"));
    ASSERT_TRUE(nava::test::writeFile(path, R"({"access_token":"good"})"));
    Credentials credentials;
    credentials.accessToken = QStringLiteral("stale");
    credentials.credentialsFile = path;
    const Outcome outcome = run(credentials);
    ASSERT_FALSE(outcome.error.isError()) << outcome.error.toString().toStdString();
    EXPECT_EQ(outcome.session.accessToken(), QStringLiteral("good"));
    EXPECT_EQ(server.requests.size(), 2);
}

TEST_F(AuthenticatorTest, TokenCommandReceivesCredentials)
{
    const QString script = dir.filePath(QStringLiteral("token.sh"));
    ASSERT_TRUE(nava::test::writeScript(script,
        "if [ \"$SPOTIFY_USERNAME\" = alice ] && [ \"$SPOTIFY_PASSWORD\" = secret ]; then\n"
        "  echo good\n"
        "else\n"
        "  echo bad\n"
        "fi"));
    Credentials credentials;
    credentials.credentialsFile = dir.filePath(QStringLiteral("missing.json"));
    credentials.tokenCommand = QStringLiteral("/bin/sh '%1'").arg(script);
    credentials.userName = QStringLiteral("alice");
    credentials.password = QStringLiteral("secret");
    const Outcome outcome = run(credentials);
    ASSERT_FALSE(outcome.error.isError()) << outcome.error.toString().toStdString();
    EXPECT_EQ(outcome.session.accessToken(), QStringLiteral("good"));
}

TEST_F(AuthenticatorTest, PromptFillsMissingAccountDetails)
{
    const QString script = dir.filePath(QStringLiteral("token.sh"));
    ASSERT_TRUE(nava::test::writeScript(script,
        "if [ \"$SPOTIFY_USERNAME\" = alice ] && [ \"$SPOTIFY_PASSWORD\" = secret ]; then\n"
        "  echo good\n"
        "else\n"
        "  echo bad\n"
        "fi"));
    Credentials credentials;
    credentials.tokenCommand = QStringLiteral("/bin/sh '%1'").arg(script);
    credentials.userName = QStringLiteral("alice");
    int prompts = 0;
    const Outcome outcome = run(credentials, [&prompts](Credentials* c) {
        ++prompts;
        EXPECT_EQ(c->userName, QStringLiteral("alice"));
        c->password = QStringLiteral("secret");
        return true;
    });
    ASSERT_FALSE(outcome.error.isError()) << outcome.error.toString().toStdString();
    EXPECT_EQ(outcome.session.accessToken(), QStringLiteral("good"));
    EXPECT_EQ(prompts, 1);
}

TEST_F(AuthenticatorTest, PromptIsSkippedWhenDetailsAreKnown)
{
    const QString script = dir.filePath(QStringLiteral("token.sh"));
    ASSERT_TRUE(nava::test::writeScript(script, "echo good"));
    Credentials credentials;
    credentials.tokenCommand = QStringLiteral("/bin/sh '%1'").arg(script);
    credentials.userName = QStringLiteral("alice");
    credentials.password = QStringLiteral("secret");
    bool prompted = false;
    const Outcome outcome = run(credentials, [&prompted](Credentials*) {
        prompted = true;
        return true;
    });
    ASSERT_FALSE(outcome.error.isError());
    EXPECT_FALSE(prompted);
}

TEST_F(AuthenticatorTest, DeclinedPromptIsUnauthorized)
{
    const QString script = dir.filePath(QStringLiteral("token.sh"));
    const QString ran = dir.filePath(QStringLiteral("ran"));
    ASSERT_TRUE(nava::test::writeScript(script, QByteArray("touch '") + ran.toUtf8() + "'\necho good"));
    Credentials credentials;
    credentials.tokenCommand = QStringLiteral("/bin/sh '%1'").arg(script);
    const Outcome outcome = run(credentials, [](Credentials*) { return false; });
    EXPECT_EQ(outcome.error.kind(), ErrorKind::Unauthorized);
    EXPECT_FALSE(QFile::exists(ran));
    EXPECT_TRUE(server.requests.isEmpty());
}

TEST_F(AuthenticatorTest, FailingTokenCommandIsUnauthorized)
{
    const QString script = dir.filePath(QStringLiteral("token.sh"));
    ASSERT_TRUE(nava::test::writeScript(script, "echo 'bad password' >&2\nexit 3"));
    Credentials credentials;
    credentials.tokenCommand = QStringLiteral("/bin/sh %1").arg(script);
    const Outcome outcome = run(credentials);
    EXPECT_EQ(outcome.error.kind(), ErrorKind::Unauthorized);
    EXPECT_TRUE(outcome.error.message().contains(QStringLiteral("bad password")));
}

TEST_F(AuthenticatorTest, NoCredentialsFails)
{
    const Outcome outcome = run(Credentials());
    EXPECT_EQ(outcome.error.kind(), ErrorKind::Unauthorized);
    EXPECT_TRUE(server.requests.isEmpty());
}

TEST_F(AuthenticatorTest, ServerErrorsStopTheChain)
{
    server.setHandler([](const QString&, const QUrlQuery&) { return FakeCatalogServer::Response{ 503, "{}" }; });
    const QString path = dir.filePath(QStringLiteral("credentials.json"));
    ASSERT_TRUE(nava::test::writeFile(path, R"({"access_token":"good"})"));
    Credentials credentials;
    credentials.accessToken = QStringLiteral("good");
    credentials.credentialsFile = path;
    const Outcome outcome = run(credentials);
    EXPECT_TRUE(outcome.error.isTransient());
    EXPECT_EQ(server.requests.size(), 1);
}
