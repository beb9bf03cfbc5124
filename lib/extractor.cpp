#include "extractor.h"

#include "exerun.h"
#include "session.h"

#include <QDateTime>
#include <QDir>
#include <QFileInfo>

#include <algorithm>

bool ensureOutputDirectory(const QString& dirPath)
{
  if (QDir().mkpath(dirPath))
  {
    return true;
  }

  qWarning().noquote() << "Could not create output directory" << dirPath;
  return false;
}

// Keeps the last lines of the tool's output, ffmpeg prints its banner first.
static QString lastLines(const QString& text, int n)
{
  const QStringList lines = text.trimmed().split('\n', Qt::SkipEmptyParts);
  return lines.mid(std::max<qsizetype>(0, lines.size() - n)).join('\n').trimmed();
}

ClipExtractor::ClipExtractor(ToolRunner* runner, QObject* parent)
    : QObject(parent)
    , m_runner(runner)
{
  if (!m_runner)
  {
    m_defaultRunner = std::make_unique<ProcessToolRunner>();
    m_runner = m_defaultRunner.get();
  }
}

ClipExtractor::~ClipExtractor() {}

void ClipExtractor::setProgram(const QString& program)
{
  m_program = program.isEmpty() ? QString(DEFAULT_EXTRACTOR_PROGRAM) : program;
}

void ClipExtractor::setOutputDirectory(const QString& dirPath)
{
  m_outputDirectory = dirPath;
}

ExtractionResult ClipExtractor::extract(const QString& sourcePath, int inSeconds, int outSeconds)
{
  ExtractionResult result;
  result.job.sourcePath = sourcePath;
  result.job.startSeconds = inSeconds;
  result.job.endSeconds = outSeconds;

  if (inSeconds >= outSeconds)
  {
    result.error = ExtractionError::InvalidRange;
    result.message = "OUT time must be greater than IN time.";
    qDebug().noquote() << "Skipping" << sourcePath << ":" << result.message;
    return result;
  }

  Q_EMIT jobStarted(sourcePath);

  ensureOutputDirectory(outputDirectory());

  result.job.outputFilePath = QDir(outputDirectory())
                                  .filePath(outputFileName(sourcePath,
                                                           QDateTime::currentDateTime()));

  const ProcessResult proc = m_runner->execute(program(), toolArguments(result.job));

  if (!proc.started)
  {
    result.error = ExtractionError::ExternalTool;
    result.message = QString("Could not run %1: %2").arg(program(), proc.errorString);
  }
  else if (!proc.ok())
  {
    result.error = ExtractionError::ExternalTool;
    result.exitCode = proc.exitCode;

    if (proc.exitStatus == QProcess::CrashExit)
    {
      result.message = QString("%1 crashed.").arg(program());
    }
    else
    {
      result.message = QString("%1 exited with code %2.").arg(program()).arg(proc.exitCode);
    }

    const QString details = lastLines(proc.standardError, 3);
    if (!details.isEmpty())
    {
      result.message += "\n" + details;
    }
  }
  else
  {
    qDebug().noquote() << "Wrote" << result.job.outputFilePath;
  }

  Q_EMIT jobFinished(sourcePath, result.success());

  return result;
}

std::vector<ExtractionResult> ClipExtractor::extractAll(const Session& session)
{
  std::vector<ExtractionResult> results;
  results.reserve(session.entries().size());

  const int total = static_cast<int>(session.entries().size());

  for (const VideoEntry& e : session.entries())
  {
    results.push_back(extract(e.path, e.inTime, e.outTime));
    Q_EMIT entryProcessed(static_cast<int>(results.size()), total);
  }

  return results;
}

QString ClipExtractor::outputFileName(const QString& sourcePath, const QDateTime& when)
{
  return QString("%1_clip_%2.mp4")
      .arg(QFileInfo(sourcePath).fileName(), when.toString("yyyyMMdd_HHmmss"));
}

QStringList ClipExtractor::toolArguments(const ExtractionJob& job)
{
  QStringList args;
  args << "-i" << job.sourcePath;
  args << "-ss" << QString::number(job.startSeconds);
  args << "-to" << QString::number(job.endSeconds);
  args << "-c" << "copy";
  args << job.outputFilePath;
  return args;
}
