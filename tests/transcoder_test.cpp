#include <QFile>
#include <QTemporaryDir>

#include <gtest/gtest.h>

#include "test_support.hpp"

import nava.core.track;
import nava.core.pipeline_error;
import nava.services.session;
import nava.services.transcoder;

using nava::test::waitFor;

namespace {

struct Result {
    bool done = false;
    PipelineError error;
    int emissions = 0;
};

void watch(Transcoder& transcoder, Result& result)
{
    QObject::connect(&transcoder, &Transcoder::finished, [&result](const PipelineError& error) {
        result.done = true;
        result.error = error;
        ++result.emissions;
    });
}

} // namespace

TEST(TranscoderArguments, ExpandsPlaceholders)
{
    TrackDescriptor track = nava::test::makeTrack(QStringLiteral("id"), QStringLiteral("/music/a.mp3"));
    track.artists = { QStringLiteral("One"), QStringLiteral("Two") };
    track.title = QStringLiteral("Song");
    track.releaseYear = QStringLiteral("2001");
    track.discNumber = 2;
    track.trackNumber = 0;

    const QStringList out = Transcoder::expandArguments(TranscoderSettings::defaultArguments(),
                                                        QStringLiteral("/tmp/in.part"), QStringLiteral("/tmp/out"),
                                                        track, AudioQuality::VeryHigh);
    EXPECT_TRUE(out.contains(QStringLiteral("/tmp/in.part")));
    EXPECT_EQ(out.last(), QStringLiteral("/tmp/out"));
    EXPECT_TRUE(out.contains(QStringLiteral("artist=One, Two")));
    EXPECT_TRUE(out.contains(QStringLiteral("title=Song")));
    EXPECT_TRUE(out.contains(QStringLiteral("date=2001")));
    EXPECT_TRUE(out.contains(QStringLiteral("disc=2")));
    EXPECT_TRUE(out.contains(QStringLiteral("track=")));
    EXPECT_TRUE(out.contains(QStringLiteral("320k")));
    const int formatAt = static_cast<int>(out.indexOf(QStringLiteral("-f")));
    ASSERT_GE(formatAt, 0);
    EXPECT_EQ(out.at(formatAt + 1), QStringLiteral("mp3"));

    track.format = AudioFormat::Wav;
    const QStringList wav = Transcoder::expandArguments({ QStringLiteral("{format}:{bitrate}") },
                                                        QString(), QString(), track, AudioQuality::High);
    EXPECT_EQ(wav, QStringList({ QStringLiteral("wav:160k") }));
}

TEST(TranscoderArguments, KeepsBracesInsideValues)
{
    TrackDescriptor track = nava::test::makeTrack(QStringLiteral("id"), QStringLiteral("/music/a.mp3"));
    track.title = QStringLiteral("Intro {format}");
    track.album = QStringLiteral("{artist}");

    const QString input = QStringLiteral("/music/Artist - Intro {format}.mp3.part");
    const QStringList out = Transcoder::expandArguments(TranscoderSettings::defaultArguments(),
                                                        input, QStringLiteral("/music/Artist - Intro {format}.mp3.transcode"),
                                                        track, AudioQuality::High);
    EXPECT_TRUE(out.contains(input));
    EXPECT_EQ(out.last(), QStringLiteral("/music/Artist - Intro {format}.mp3.transcode"));
    EXPECT_TRUE(out.contains(QStringLiteral("title=Intro {format}")));
    EXPECT_TRUE(out.contains(QStringLiteral("album={artist}")));
    EXPECT_TRUE(out.contains(QStringLiteral("artist=Artist")));
}

TEST(TranscoderArguments, CoverTemplateAttachesImage)
{
    const TrackDescriptor track = nava::test::makeTrack(QStringLiteral("id"), QStringLiteral("/music/a.mp3"));
    const QStringList out = Transcoder::expandArguments(TranscoderSettings::defaultCoverArguments(),
                                                        QStringLiteral("/tmp/in.part"), QStringLiteral("/tmp/out"),
                                                        track, AudioQuality::High, QStringLiteral("/tmp/a.mp3.cover"));
    const int coverAt = static_cast<int>(out.indexOf(QStringLiteral("/tmp/a.mp3.cover")));
    ASSERT_GT(coverAt, 0);
    EXPECT_EQ(out.at(coverAt - 1), QStringLiteral("-i"));
    EXPECT_TRUE(out.contains(QStringLiteral("attached_pic")));
    EXPECT_TRUE(out.contains(QStringLiteral("1:v")));
    EXPECT_FALSE(out.contains(QStringLiteral("-vn")));
    EXPECT_TRUE(TranscoderSettings().embedsCover());
}

class TranscoderTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        ASSERT_TRUE(dir.isValid());
        input = dir.filePath(QStringLiteral("in.part"));
        output = dir.filePath(QStringLiteral("out.transcode"));
        ASSERT_TRUE(nava::test::writeFile(input, QByteArray(1024, 'x')));
        track = nava::test::makeTrack(QStringLiteral("id"), dir.filePath(QStringLiteral("out.mp3")));
    }

    QTemporaryDir dir;
    QString input;
    QString output;
    TrackDescriptor track;
};

TEST_F(TranscoderTest, SuccessfulEncode)
{
    const TranscoderSettings settings = nava::test::copyingTranscoder(
        dir.filePath(QStringLiteral("copy.sh")), dir.filePath(QStringLiteral("runs")));
    Transcoder transcoder(settings);
    Result result;
    watch(transcoder, result);
    transcoder.start(input, output, track, AudioQuality::High);
    ASSERT_TRUE(waitFor([&]() { return result.done; }));
    EXPECT_FALSE(result.error.isError()) << result.error.toString().toStdString();
    EXPECT_EQ(nava::test::readAll(output).size(), 1024);
    EXPECT_FALSE(transcoder.isRunning());
    nava::test::spin(50);
    EXPECT_EQ(result.emissions, 1);
}

TEST_F(TranscoderTest, NonZeroExitIsProcessFailed)
{
    Transcoder transcoder(nava::test::failingTranscoder(dir.filePath(QStringLiteral("fail.sh")), 1));
    Result result;
    watch(transcoder, result);
    transcoder.start(input, output, track, AudioQuality::High);
    ASSERT_TRUE(waitFor([&]() { return result.done; }));
    EXPECT_EQ(result.error.domain(), ErrorDomain::Transcode);
    EXPECT_EQ(result.error.kind(), ErrorKind::ProcessFailed);
    EXPECT_TRUE(result.error.message().contains(QStringLiteral("encoder exploded")));
}

TEST_F(TranscoderTest, MissingProgramIsNotRetried)
{
    TranscoderSettings settings;
    settings.program = dir.filePath(QStringLiteral("no-such-encoder"));
    Transcoder transcoder(settings);
    Result result;
    watch(transcoder, result);
    transcoder.start(input, output, track, AudioQuality::High);
    ASSERT_TRUE(waitFor([&]() { return result.done; }));
    EXPECT_EQ(result.error.kind(), ErrorKind::ProcessFailed);
    EXPECT_FALSE(result.error.isTransient());
}

TEST_F(TranscoderTest, EmptyOutputIsTruncated)
{
    const QString script = dir.filePath(QStringLiteral("empty.sh"));
    ASSERT_TRUE(nava::test::writeScript(script, ": > \"$2\""));
    TranscoderSettings settings;
    settings.program = QStringLiteral("/bin/sh");
    settings.arguments = { script, QStringLiteral("{input}"), QStringLiteral("{output}") };
    Transcoder transcoder(settings);
    Result result;
    watch(transcoder, result);
    transcoder.start(input, output, track, AudioQuality::High);
    ASSERT_TRUE(waitFor([&]() { return result.done; }));
    EXPECT_EQ(result.error.kind(), ErrorKind::Truncated);
    EXPECT_TRUE(result.error.isTransient());
}

TEST_F(TranscoderTest, AbortReportsCanceled)
{
    const QString script = dir.filePath(QStringLiteral("slow.sh"));
    ASSERT_TRUE(nava::test::writeScript(script, "exec sleep 30"));
    TranscoderSettings settings;
    settings.program = QStringLiteral("/bin/sh");
    settings.arguments = { script };
    Transcoder transcoder(settings);
    Result result;
    watch(transcoder, result);
    transcoder.start(input, output, track, AudioQuality::High);
    ASSERT_TRUE(waitFor([&]() { return transcoder.isRunning(); }));
    transcoder.abort(200);
    ASSERT_TRUE(waitFor([&]() { return result.done; }, 5000));
    EXPECT_TRUE(result.error.isCanceled());
}

TEST_F(TranscoderTest, BracedFileNamesReachEncoder)
{
    const QString bracedInput = dir.filePath(QStringLiteral("Artist - Intro {format}.mp3.part"));
    const QString bracedOutput = dir.filePath(QStringLiteral("Artist - Intro {format}.mp3.transcode"));
    ASSERT_TRUE(nava::test::writeFile(bracedInput, QByteArray(512, 'y')));
    track.title = QStringLiteral("Intro {format}");

    const TranscoderSettings settings = nava::test::copyingTranscoder(
        dir.filePath(QStringLiteral("copy.sh")), dir.filePath(QStringLiteral("runs")));
    Transcoder transcoder(settings);
    Result result;
    watch(transcoder, result);
    transcoder.start(bracedInput, bracedOutput, track, AudioQuality::High);
    ASSERT_TRUE(waitFor([&]() { return result.done; }));
    EXPECT_FALSE(result.error.isError()) << result.error.toString().toStdString();
    EXPECT_EQ(nava::test::readAll(bracedOutput).size(), 512);
}

TEST_F(TranscoderTest, CoverTemplateOnlyWithCoverImage)
{
    const QString plain = dir.filePath(QStringLiteral("plain.sh"));
    const QString withCover = dir.filePath(QStringLiteral("cover.sh"));
    ASSERT_TRUE(nava::test::writeScript(plain, "cp \"$1\" \"$2\""));
    ASSERT_TRUE(nava::test::writeScript(withCover, "cat \"$1\" \"$2\" > \"$3\""));
    const QString cover = dir.filePath(QStringLiteral("out.mp3.cover"));
    ASSERT_TRUE(nava::test::writeFile(cover, "JPEG"));

    TranscoderSettings settings;
    settings.program = QStringLiteral("/bin/sh");
    settings.arguments = { plain, QStringLiteral("{input}"), QStringLiteral("{output}") };
    settings.coverArguments = { withCover, QStringLiteral("{input}"), QStringLiteral("{cover}"), QStringLiteral("{output}") };

    {
        Transcoder transcoder(settings);
        Result result;
        watch(transcoder, result);
        transcoder.start(input, output, track, AudioQuality::High, cover);
        ASSERT_TRUE(waitFor([&]() { return result.done; }));
        ASSERT_FALSE(result.error.isError()) << result.error.toString().toStdString();
        EXPECT_EQ(nava::test::readAll(output), QByteArray(1024, 'x') + "JPEG");
    }
    {
        Transcoder transcoder(settings);
        Result result;
        watch(transcoder, result);
        transcoder.start(input, output, track, AudioQuality::High);
        ASSERT_TRUE(waitFor([&]() { return result.done; }));
        ASSERT_FALSE(result.error.isError());
        EXPECT_EQ(nava::test::readAll(output), QByteArray(1024, 'x'));
    }
}
