// Copyright (C) 2025 Vincent Chambrin
// This file is part of the 'clipcut' project.
// For conditions of distribution and use, see copyright notice in LICENSE.

#pragma once

#include <QProcess>

#include <QStringList>

#include <QDebug>

struct ProcessResult
{
  bool started = false;
  int exitCode = -1;
  QProcess::ExitStatus exitStatus = QProcess::NormalExit;
  QString standardError;
  QString errorString;

  bool ok() const;
};

inline bool ProcessResult::ok() const
{
  return started && exitStatus == QProcess::NormalExit && exitCode == 0;
}

QProcess* run(const QString& name, const QStringList& args);

// Blocks until the process exits. A negative timeout waits forever.
ProcessResult exec(const QString& name, const QStringList& args, int msecs = -1);

class ToolRunner
{
public:
  virtual ~ToolRunner() = default;

  virtual ProcessResult execute(const QString& program, const QStringList& args) = 0;
};

class ProcessToolRunner : public ToolRunner
{
public:
  ProcessResult execute(const QString& program, const QStringList& args) override;
};
