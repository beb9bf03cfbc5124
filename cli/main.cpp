// Copyright (C) 2025 Vincent Chambrin
// This file is part of the 'clipcut' project.
// For conditions of distribution and use, see copyright notice in LICENSE.

#include "extractor.h"
#include "session.h"
#include "timecode.h"

#include <QCoreApplication>

#include <QFileInfo>
#include <QTextStream>

#include <QVersionNumber>

#include <iostream>

static bool helpRequested(const QStringList& args)
{
  return args.contains("-h") || args.contains("--help") || args.contains("-?");
}

static bool likelyVideo(const QFileInfo& info)
{
  const QString suffix = info.suffix().toLower();
  return suffix == "mp4" || suffix == "avi" || suffix == "mkv";
}

int cmd_extract(QStringList args)
{
  QTextStream cout{stdout};
  QTextStream cerr{stderr};

  if (helpRequested(args) || args.isEmpty())
  {
    cout << "clipcut extract [--ffmpeg program] [--output-dir dir] --in 00:01:00 --out 00:02:30 "
            "-i video1.mp4 [--in ... --out ... -i video2.mkv]"
         << Qt::endl;
    return 0;
  }

  Session session;
  ClipExtractor extractor;

  int in_time = 0;
  int out_time = 0;

  auto read_time = [&cerr](const QString& opt, const QString& text, int& dest) -> bool {
    std::optional<TimeCode> tc = TimeCode::parse(text);
    if (!tc)
    {
      cerr << "Invalid time for " << opt << ": " << text << "." << Qt::endl;
      return false;
    }

    dest = tc->toSeconds();
    return true;
  };

  for (int i(0); i < args.size();)
  {
    const QString& a = args.at(i++);

    if (!a.startsWith("-"))
    {
      cerr << "Unexpected argument: " << a << "." << Qt::endl;
      return 1;
    }

    if (i >= args.size())
    {
      cerr << "Missing value for option " << a << "." << Qt::endl;
      return 1;
    }

    const QString& value = args.at(i++);

    if (a == "--in" || a == "-ss")
    {
      if (!read_time(a, value, in_time))
        return 1;
    }
    else if (a == "--out" || a == "-to")
    {
      if (!read_time(a, value, out_time))
        return 1;
    }
    else if (a == "--input" || a == "-i")
    {
      const QFileInfo info{value};

      if (!likelyVideo(info))
      {
        cerr << "Warning: " << value << " does not look like a video file." << Qt::endl;
      }

      const QString path = info.absoluteFilePath();

      if (session.addFile(path))
      {
        session.setInTime(path, in_time);
        session.setOutTime(path, out_time);
      }
    }
    else if (a == "--ffmpeg")
    {
      extractor.setProgram(value);
    }
    else if (a == "--output-dir" || a == "-o")
    {
      extractor.setOutputDirectory(value);
    }
    else
    {
      cerr << "Unknown option: " << a << "." << Qt::endl;
      return 1;
    }
  }

  if (session.count() == 0)
  {
    cerr << "At least one input file must be specified." << Qt::endl;
    return 1;
  }

  const std::vector<ExtractionResult> results = extractor.extractAll(session);

  int failures = 0;

  for (const ExtractionResult& r : results)
  {
    const QString range = TimeCode::fromSeconds(r.job.startSeconds).toString() + "-"
                          + TimeCode::fromSeconds(r.job.endSeconds).toString();

    if (r.success())
    {
      cout << r.job.sourcePath << " [" << range << "] -> " << r.job.outputFilePath << Qt::endl;
    }
    else
    {
      ++failures;
      cerr << r.job.sourcePath << " [" << range << "]: " << r.message << Qt::endl;
    }
  }

  return failures == 0 ? 0 : 2;
}

int main(int argc, char* argv[])
{
  QCoreApplication::setOrganizationName("Analogman Software");
  QCoreApplication::setApplicationName("ClipCut");
  QCoreApplication::setApplicationVersion(
      QVersionNumber(CLIPCUT_VERSION_MAJOR, CLIPCUT_VERSION_MINOR).toString());

  QCoreApplication app{argc, argv};

  const QStringList args = app.arguments();

  if (args.size() > 1)
  {
    if (args.at(1) == "extract")
    {
      return cmd_extract(args.mid(2));
    }
    else if (!args.at(1).startsWith("-"))
    {
      std::cerr << "Unknown command " << args.at(1).toStdString() << std::endl;
      return 1;
    }
  }

  if (helpRequested(args) || args.size() <= 1)
  {
    QTextStream cout{stdout};
    cout << "clipcut <command> [arguments..]" << Qt::endl;
    cout << Qt::endl;
    cout << "Available commands:" << Qt::endl;
    cout << "  extract   extract clips from video files" << Qt::endl;
    cout << Qt::endl;
    cout << "Get more information about a command using: clipcut <command> --help" << Qt::endl;
  }
  else if (args.contains("-v") || args.contains("--version"))
  {
    std::cout << app.applicationVersion().toStdString() << std::endl;
  }

  return 0;
}
