// Copyright (C) 2025 Vincent Chambrin
// This file is part of the 'clipcut' project.
// For conditions of distribution and use, see copyright notice in LICENSE.

#include "appsettings.h"
#include "window.h"

#include "extractor.h"

#include <QApplication>
#include <QVersionNumber>

#include <QFileInfo>

static bool likelyVideo(const QFileInfo& info)
{
  const QString suffix = info.suffix().toLower();
  return suffix == "mp4" || suffix == "avi" || suffix == "mkv";
}

int main(int argc, char *argv[])
{
  QApplication::setOrganizationName("Analogman Software");
  QApplication::setApplicationName("ClipCut");
  QCoreApplication::setApplicationVersion(
      QVersionNumber(CLIPCUT_VERSION_MAJOR, CLIPCUT_VERSION_MINOR).toString());

  QApplication::setStyle("fusion");

  QApplication app{argc, argv};

  auto* settings = new AppSettings(&app);
  Q_UNUSED(settings);

  ensureOutputDirectory();

  MainWindow window;
  window.show();

  if (app.arguments().size() > 1)
  {
    QStringList files;

    for (int i(1); i < app.arguments().size(); ++i)
    {
      const QFileInfo info{app.arguments().at(i)};
      if (info.exists() && likelyVideo(info))
      {
        files.push_back(info.absoluteFilePath());
      }
    }

    window.addVideos(files);
  }

  return app.exec();
}
