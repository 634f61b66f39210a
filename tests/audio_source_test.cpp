#include <QTemporaryDir>

#include <gtest/gtest.h>

#include "test_support.hpp"

import nava.core.track;
import nava.core.pipeline_error;
import nava.services.session;
import nava.services.audio_source;

using nava::test::waitFor;

namespace {

struct StreamResult {
    bool done = false;
    QByteArray data;
    PipelineError error;
};

StreamResult runStream(AudioStream* stream)
{
    StreamResult result;
    QObject::connect(stream, &AudioStream::dataAvailable, [&result](const QByteArray& chunk) {
        result.data.append(chunk);
    });
    QObject::connect(stream, &AudioStream::finished, [&result](const PipelineError& error) {
        result.done = true;
        result.error = error;
    });
    stream->start();
    EXPECT_TRUE(waitFor([&]() { return result.done; }));
    return result;
}

} // namespace

TEST(CommandAudioSourceTest, ExpandsTemplate)
{
    CommandAudioSource source(QStringLiteral("fetch --uri {uri} --quality {quality} --id '{id}'"));
    TrackDescriptor track = nava::test::makeTrack(QStringLiteral("abc"), QStringLiteral("/x.mp3"));
    const QStringList premium = source.expandCommand(nava::test::testSession(), track);
    EXPECT_EQ(premium, QStringList({ QStringLiteral("fetch"), QStringLiteral("--uri"), QStringLiteral("spotify:track:abc"),
                                     QStringLiteral("--quality"), QStringLiteral("very_high"),
                                     QStringLiteral("--id"), QStringLiteral("abc") }));

    track.kind = MediaKind::Episode;
    const QStringList basic = source.expandCommand(nava::test::testSession(QStringLiteral("free")), track);
    EXPECT_EQ(basic.at(2), QStringLiteral("spotify:episode:abc"));
    EXPECT_EQ(basic.at(4), QStringLiteral("high"));
}

TEST(CommandAudioSourceTest, SubstitutedValuesAreNotExpandedAgain)
{
    CommandAudioSource source(QStringLiteral("fetch --token {token} --id {id}"));
    const TrackDescriptor track = nava::test::makeTrack(QStringLiteral("abc"), QStringLiteral("/x.mp3"));
    const Session session(QStringLiteral("tok{id}"), QStringLiteral("tester"), QStringLiteral("premium"));
    EXPECT_EQ(source.expandCommand(session, track),
              QStringList({ QStringLiteral("fetch"), QStringLiteral("--token"), QStringLiteral("tok{id}"),
                            QStringLiteral("--id"), QStringLiteral("abc") }));
}

TEST(CommandAudioSourceTest, ClassifiesExitCodes)
{
    EXPECT_FALSE(CommandAudioStream::classifyExit(0, QString()).isError());
    EXPECT_EQ(CommandAudioStream::classifyExit(66, QString()).kind(), ErrorKind::NotFound);
    EXPECT_EQ(CommandAudioStream::classifyExit(77, QString()).kind(), ErrorKind::Unauthorized);
    const PipelineError other = CommandAudioStream::classifyExit(1, QStringLiteral("reset by peer"));
    EXPECT_TRUE(other.isTransient());
    EXPECT_EQ(other.domain(), ErrorDomain::Fetch);
    EXPECT_TRUE(other.message().contains(QStringLiteral("reset by peer")));
}

class CommandAudioStreamTest : public ::testing::Test {
protected:
    void SetUp() override { ASSERT_TRUE(dir.isValid()); }

    CommandAudioSource sourceFor(const QByteArray& body)
    {
        const QString script = dir.filePath(QStringLiteral("helper.sh"));
        EXPECT_TRUE(nava::test::writeScript(script, body));
        return CommandAudioSource(QStringLiteral("/bin/sh %1 {id}").arg(script));
    }

    QTemporaryDir dir;
    QObject owner;
};

TEST_F(CommandAudioStreamTest, DeliversHelperOutput)
{
    CommandAudioSource source = sourceFor("printf 'id=%s token=%s' \"$1\" \"$NAVA_ACCESS_TOKEN\"");
    const TrackDescriptor track = nava::test::makeTrack(QStringLiteral("abc"), QStringLiteral("/x.mp3"));
    const StreamResult result = runStream(source.open(nava::test::testSession(), track, &owner));
    EXPECT_FALSE(result.error.isError()) << result.error.toString().toStdString();
    EXPECT_EQ(result.data, QByteArray("id=abc token=test-token"));
}

TEST_F(CommandAudioStreamTest, ExitCodesMapToErrors)
{
    const TrackDescriptor track = nava::test::makeTrack(QStringLiteral("abc"), QStringLiteral("/x.mp3"));

    CommandAudioSource missing = sourceFor("echo 'no such track' >&2\nexit 66");
    EXPECT_EQ(runStream(missing.open(nava::test::testSession(), track, &owner)).error.kind(), ErrorKind::NotFound);

    CommandAudioSource denied = sourceFor("exit 77");
    EXPECT_EQ(runStream(denied.open(nava::test::testSession(), track, &owner)).error.kind(), ErrorKind::Unauthorized);

    CommandAudioSource flaky = sourceFor("printf partial\nexit 1");
    const StreamResult result = runStream(flaky.open(nava::test::testSession(), track, &owner));
    EXPECT_TRUE(result.error.isTransient());
    EXPECT_EQ(result.data, QByteArray("partial"));
}

TEST_F(CommandAudioStreamTest, MissingHelperIsNotTransient)
{
    CommandAudioSource source(dir.filePath(QStringLiteral("no-such-helper")) + QStringLiteral(" {id}"));
    const TrackDescriptor track = nava::test::makeTrack(QStringLiteral("abc"), QStringLiteral("/x.mp3"));
    const StreamResult result = runStream(source.open(nava::test::testSession(), track, &owner));
    EXPECT_EQ(result.error.kind(), ErrorKind::ProcessFailed);
    EXPECT_FALSE(result.error.isTransient());
}

TEST_F(CommandAudioStreamTest, AbortEndsWithCanceled)
{
    CommandAudioSource source = sourceFor("printf start\nexec sleep 30");
    const TrackDescriptor track = nava::test::makeTrack(QStringLiteral("abc"), QStringLiteral("/x.mp3"));
    AudioStream* stream = source.open(nava::test::testSession(), track, &owner);
    StreamResult result;
    QObject::connect(stream, &AudioStream::dataAvailable, [&result](const QByteArray& chunk) {
        result.data.append(chunk);
    });
    QObject::connect(stream, &AudioStream::finished, [&result](const PipelineError& error) {
        result.done = true;
        result.error = error;
    });
    stream->start();
    ASSERT_TRUE(waitFor([&]() { return !result.data.isEmpty(); }));
    stream->abort(200);
    ASSERT_TRUE(waitFor([&]() { return result.done; }, 5000));
    EXPECT_TRUE(result.error.isCanceled());
}
