#include "playback.h"

#include <QDesktopServices>
#include <QString>
#include <QUrl>

#include <QDebug>

void playFile(const QString& filePath)
{
  if (!QDesktopServices::openUrl(QUrl::fromLocalFile(filePath)))
  {
    qDebug().noquote() << "No application could open" << filePath;
  }
}
