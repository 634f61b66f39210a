#include <QDateTime>
#include <QFile>
#include <QFileInfo>
#include <QTemporaryDir>

#include <gtest/gtest.h>

#include "test_support.hpp"

import nava.core.ledger;
import nava.core.pipeline_error;
import nava.utils.download_utils;

using nava::test::readAll;
using nava::test::writeFile;

namespace {

LedgerEntry entryFor(const QString& trackId, const QString& path)
{
    LedgerEntry entry;
    entry.trackId = trackId;
    entry.targetPath = path;
    entry.completedAt = QDateTime::currentDateTimeUtc();
    entry.size = QFileInfo(path).size();
    entry.checksum = nava::utils::fileSha256(path);
    return entry;
}

} // namespace

class LedgerTest : public ::testing::Test {
protected:
    void SetUp() override { ASSERT_TRUE(dir.isValid()); }

    QString path(const QString& name) const { return dir.filePath(name); }

    QTemporaryDir dir;
};

TEST_F(LedgerTest, MissingStoreLoadsEmpty)
{
    CompletionLedger ledger(path(QStringLiteral("ledger.jsonl")));
    EXPECT_TRUE(ledger.load());
    EXPECT_TRUE(ledger.isEmpty());
    EXPECT_TRUE(ledger.warnings().isEmpty());
}

TEST_F(LedgerTest, RecordAppendsAndSurvivesReload)
{
    const QString song = path(QStringLiteral("song.mp3"));
    ASSERT_TRUE(writeFile(song, "encoded audio"));

    CompletionLedger ledger(path(QStringLiteral("ledger.jsonl")));
    ASSERT_TRUE(ledger.load());
    PipelineError error;
    ASSERT_TRUE(ledger.record(entryFor(QStringLiteral("id1"), song), &error)) << error.toString().toStdString();
    EXPECT_EQ(nava::test::lineCount(ledger.storePath()), 1);
    EXPECT_TRUE(ledger.has(song));
    EXPECT_TRUE(ledger.has(song, QStringLiteral("id1")));
    EXPECT_FALSE(ledger.has(song, QStringLiteral("other")));

    CompletionLedger reloaded(path(QStringLiteral("ledger.jsonl")));
    ASSERT_TRUE(reloaded.load());
    ASSERT_EQ(reloaded.size(), 1);
    const LedgerEntry* stored = reloaded.entry(song);
    ASSERT_NE(stored, nullptr);
    EXPECT_EQ(stored->trackId, QStringLiteral("id1"));
    EXPECT_EQ(stored->size, 13);
    EXPECT_TRUE(reloaded.has(song));
}

TEST_F(LedgerTest, HasRejectsTruncatedOrModifiedFiles)
{
    const QString song = path(QStringLiteral("song.mp3"));
    ASSERT_TRUE(writeFile(song, "complete file contents"));
    CompletionLedger ledger(path(QStringLiteral("ledger.jsonl")));
    ASSERT_TRUE(ledger.record(entryFor(QStringLiteral("id1"), song)));
    ASSERT_TRUE(ledger.has(song));

    ASSERT_TRUE(writeFile(song, "complete"));
    EXPECT_FALSE(ledger.has(song));

    // Same size, different bytes.
    ASSERT_TRUE(writeFile(song, "COMPLETE FILE CONTENTS"));
    EXPECT_FALSE(ledger.has(song));

    QFile::remove(song);
    EXPECT_FALSE(ledger.has(song));
}

TEST_F(LedgerTest, TornFinalLineKeepsEarlierEntries)
{
    const QString a = path(QStringLiteral("a.mp3"));
    const QString b = path(QStringLiteral("b.mp3"));
    ASSERT_TRUE(writeFile(a, "aaaa"));
    ASSERT_TRUE(writeFile(b, "bbbb"));
    const QString store = path(QStringLiteral("ledger.jsonl"));
    {
        CompletionLedger ledger(store);
        ASSERT_TRUE(ledger.record(entryFor(QStringLiteral("a"), a)));
        ASSERT_TRUE(ledger.record(entryFor(QStringLiteral("b"), b)));
    }
    // Simulate a crash in the middle of writing a third line.
    QFile file(store);
    ASSERT_TRUE(file.open(QIODevice::Append));
    file.write("{\"trackId\":\"c\",\"targetPa");
    file.close();

    CompletionLedger ledger(store);
    ASSERT_TRUE(ledger.load());
    EXPECT_EQ(ledger.size(), 2);
    EXPECT_EQ(ledger.warnings().size(), 1);
    EXPECT_TRUE(ledger.has(a));
    EXPECT_TRUE(ledger.has(b));

    // The next record starts on a fresh line, so it parses after reload.
    const QString c = path(QStringLiteral("c.mp3"));
    ASSERT_TRUE(writeFile(c, "cccc"));
    ASSERT_TRUE(ledger.record(entryFor(QStringLiteral("c"), c)));
    CompletionLedger again(store);
    ASSERT_TRUE(again.load());
    EXPECT_EQ(again.size(), 3);
    EXPECT_TRUE(again.has(c));
}

TEST_F(LedgerTest, GarbageStoreDegradesToEmptyWithWarning)
{
    const QString store = path(QStringLiteral("ledger.jsonl"));
    ASSERT_TRUE(writeFile(store, "not json at all\n\x01\x02\x03\n"));
    CompletionLedger ledger(store);
    EXPECT_TRUE(ledger.load());
    EXPECT_TRUE(ledger.isEmpty());
    EXPECT_FALSE(ledger.warnings().isEmpty());
}

TEST_F(LedgerTest, PersistCompactsReplacedEntries)
{
    const QString song = path(QStringLiteral("song.mp3"));
    const QString store = path(QStringLiteral("ledger.jsonl"));
    ASSERT_TRUE(writeFile(song, "v1"));
    CompletionLedger ledger(store);
    ASSERT_TRUE(ledger.record(entryFor(QStringLiteral("id"), song)));
    ASSERT_TRUE(writeFile(song, "version 2"));
    ASSERT_TRUE(ledger.record(entryFor(QStringLiteral("id"), song)));
    EXPECT_EQ(nava::test::lineCount(store), 2);
    EXPECT_EQ(ledger.size(), 1);

    PipelineError error;
    ASSERT_TRUE(ledger.persist(&error)) << error.toString().toStdString();
    EXPECT_EQ(nava::test::lineCount(store), 1);

    CompletionLedger reloaded(store);
    ASSERT_TRUE(reloaded.load());
    EXPECT_TRUE(reloaded.has(song));
}

TEST_F(LedgerTest, ForgetDropsEntryOnPersist)
{
    const QString song = path(QStringLiteral("song.mp3"));
    const QString store = path(QStringLiteral("ledger.jsonl"));
    ASSERT_TRUE(writeFile(song, "data"));
    CompletionLedger ledger(store);
    ASSERT_TRUE(ledger.record(entryFor(QStringLiteral("id"), song)));
    EXPECT_TRUE(ledger.forget(song));
    EXPECT_FALSE(ledger.forget(song));
    ASSERT_TRUE(ledger.persist());
    EXPECT_TRUE(readAll(store).isEmpty());
}

TEST_F(LedgerTest, InMemoryLedgerKeepsEntriesAcrossLoad)
{
    const QString song = path(QStringLiteral("song.mp3"));
    ASSERT_TRUE(writeFile(song, "data"));
    CompletionLedger ledger{QString()};
    ASSERT_TRUE(ledger.record(entryFor(QStringLiteral("id"), song)));
    EXPECT_TRUE(ledger.load());
    EXPECT_TRUE(ledger.has(song));
}

TEST_F(LedgerTest, RejectsIncompleteEntries)
{
    CompletionLedger ledger(path(QStringLiteral("ledger.jsonl")));
    LedgerEntry entry;
    entry.trackId = QStringLiteral("id");
    PipelineError error;
    EXPECT_FALSE(ledger.record(entry, &error));
    EXPECT_EQ(error.kind(), ErrorKind::CorruptLedger);
    EXPECT_TRUE(ledger.isEmpty());
}
