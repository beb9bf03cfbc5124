#include "exerun.h"

#include <gtest/gtest.h>

TEST(ProcessResult, Ok)
{
  ProcessResult r;
  EXPECT_FALSE(r.ok());

  r.started = true;
  r.exitCode = 0;
  EXPECT_TRUE(r.ok());

  r.exitStatus = QProcess::CrashExit;
  EXPECT_FALSE(r.ok());
}

TEST(ProcessToolRunner, MissingProgramIsNotStarted)
{
  ProcessToolRunner runner;
  const ProcessResult r = runner.execute("clipcut-no-such-program-9f2c", {"-version"});

  EXPECT_FALSE(r.started);
  EXPECT_FALSE(r.ok());
  EXPECT_FALSE(r.errorString.isEmpty());
}

TEST(ProcessToolRunner, ChildReadingStdinSeesEndOfFile)
{
  ProcessToolRunner runner;
  const ProcessResult r = runner.execute("sh", {"-c", "read x; exit 3"});

  EXPECT_TRUE(r.started);
  EXPECT_EQ(r.exitStatus, QProcess::NormalExit);
  EXPECT_EQ(r.exitCode, 3);
}
