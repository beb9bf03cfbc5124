// Copyright (C) 2025 Vincent Chambrin
// This file is part of the 'clipcut' project.
// For conditions of distribution and use, see copyright notice in LICENSE.

#pragma once

#include <QObject>
#include <QString>
#include <QStringList>

#include <memory>
#include <vector>

class QDateTime;

class Session;
class ToolRunner;

constexpr const char* DEFAULT_OUTPUT_DIRECTORY = "./output";
constexpr const char* DEFAULT_EXTRACTOR_PROGRAM = "ffmpeg";

bool ensureOutputDirectory(const QString& dirPath = DEFAULT_OUTPUT_DIRECTORY);

struct ExtractionJob
{
  QString sourcePath;
  int startSeconds = 0;
  int endSeconds = 0;
  QString outputFilePath;
};

enum class ExtractionError {
  None,
  InvalidRange,
  ExternalTool,
};

struct ExtractionResult
{
  ExtractionError error = ExtractionError::None;
  ExtractionJob job;
  int exitCode = 0;
  QString message;

  bool success() const;
};

inline bool ExtractionResult::success() const
{
  return error == ExtractionError::None;
}

class ClipExtractor : public QObject
{
  Q_OBJECT
public:
  // If runner is null, ffmpeg is run as a child process.
  explicit ClipExtractor(ToolRunner* runner = nullptr, QObject* parent = nullptr);
  ~ClipExtractor();

  const QString& program() const;
  void setProgram(const QString& program);

  const QString& outputDirectory() const;
  void setOutputDirectory(const QString& dirPath);

  ExtractionResult extract(const QString& sourcePath, int inSeconds, int outSeconds);
  std::vector<ExtractionResult> extractAll(const Session& session);

  static QString outputFileName(const QString& sourcePath, const QDateTime& when);
  static QStringList toolArguments(const ExtractionJob& job);

Q_SIGNALS:
  void jobStarted(const QString& sourcePath);
  void jobFinished(const QString& sourcePath, bool success);
  // emitted by extractAll() after each entry, including the ones with an invalid range
  void entryProcessed(int done, int total);

private:
  std::unique_ptr<ToolRunner> m_defaultRunner;
  ToolRunner* m_runner;
  QString m_program = DEFAULT_EXTRACTOR_PROGRAM;
  QString m_outputDirectory = DEFAULT_OUTPUT_DIRECTORY;
};

inline const QString& ClipExtractor::program() const
{
  return m_program;
}

inline const QString& ClipExtractor::outputDirectory() const
{
  return m_outputDirectory;
}
