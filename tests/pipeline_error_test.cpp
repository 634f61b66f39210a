#include <gtest/gtest.h>

#include <QString>

import nava.core.pipeline_error;
import nava.core.job;

TEST(PipelineError, DefaultIsSuccess)
{
    const PipelineError error;
    EXPECT_FALSE(error.isError());
    EXPECT_FALSE(error.isTransient());
    EXPECT_EQ(error.toString(), QStringLiteral("OK"));
}

TEST(PipelineError, TransientFlagFollowsKind)
{
    EXPECT_TRUE(PipelineError::fetch(ErrorKind::Transient, QString()).isTransient());
    EXPECT_TRUE(PipelineError::transcode(ErrorKind::ProcessFailed, QString()).isTransient());
    EXPECT_TRUE(PipelineError::transcode(ErrorKind::Truncated, QString()).isTransient());
    EXPECT_FALSE(PipelineError::fetch(ErrorKind::NotFound, QString()).isTransient());
    EXPECT_FALSE(PipelineError::fetch(ErrorKind::Unauthorized, QString()).isTransient());
    EXPECT_FALSE(PipelineError::storage(ErrorKind::DiskFull, QString()).isTransient());
    EXPECT_FALSE(PipelineError::storage(ErrorKind::PermissionDenied, QString()).isTransient());
    EXPECT_FALSE(PipelineError::transcode(ErrorKind::ProcessFailed, QString()).withTransient(false).isTransient());
}

TEST(PipelineError, RendersDomainKindAndMessage)
{
    EXPECT_EQ(PipelineError::fetch(ErrorKind::Transient, QStringLiteral("timeout")).toString(),
              QStringLiteral("FetchError.Transient: timeout"));
    EXPECT_EQ(PipelineError::transcode(ErrorKind::ProcessFailed, QString()).toString(),
              QStringLiteral("TranscodeError.ProcessFailed"));
    EXPECT_TRUE(PipelineError::canceled().isCanceled());
}

TEST(JobStatus, TerminalStates)
{
    EXPECT_FALSE(isTerminalStatus(JobStatus::Pending));
    EXPECT_FALSE(isTerminalStatus(JobStatus::Active));
    EXPECT_TRUE(isTerminalStatus(JobStatus::Succeeded));
    EXPECT_TRUE(isTerminalStatus(JobStatus::Canceled));
    EXPECT_EQ(jobStatusString(JobStatus::Skipped), QStringLiteral("skipped"));
}
