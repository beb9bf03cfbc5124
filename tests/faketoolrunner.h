// Copyright (C) 2025 Vincent Chambrin
// This file is part of the 'clipcut' project.
// For conditions of distribution and use, see copyright notice in LICENSE.

#pragma once

#include "exerun.h"

#include <vector>

// Records every invocation instead of starting a process.
class FakeToolRunner : public ToolRunner
{
public:
  struct Call
  {
    QString program;
    QStringList args;
  };

  std::vector<Call> calls;
  ProcessResult nextResult = succeeded();

  // Results consumed in order before falling back to nextResult.
  std::vector<ProcessResult> queuedResults;

  ProcessResult execute(const QString& program, const QStringList& args) override
  {
    calls.push_back(Call{program, args});

    if (!queuedResults.empty())
    {
      ProcessResult r = queuedResults.front();
      queuedResults.erase(queuedResults.begin());
      return r;
    }

    return nextResult;
  }

  static ProcessResult succeeded()
  {
    ProcessResult r;
    r.started = true;
    r.exitCode = 0;
    return r;
  }

  static ProcessResult failed(int code, const QString& stderrText = QString())
  {
    ProcessResult r;
    r.started = true;
    r.exitCode = code;
    r.standardError = stderrText;
    return r;
  }

  static ProcessResult notStarted()
  {
    ProcessResult r;
    r.started = false;
    r.errorString = "No such file or directory";
    return r;
  }
};
