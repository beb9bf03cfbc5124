#include "session.h"

#include <QDebug>

#include <algorithm>
#include <utility>

Session::Session(QObject* parent)
    : QObject(parent)
{}

Session::~Session() {}

bool Session::addFile(const QString& path)
{
  if (path.isEmpty() || contains(path))
  {
    return false;
  }

  VideoEntry e;
  e.path = path;
  m_entries.push_back(e);

  qDebug().noquote() << "Added" << path;

  Q_EMIT entryAdded(path);
  return true;
}

int Session::addFiles(const QStringList& paths)
{
  int n = 0;

  for (const QString& p : paths)
  {
    if (addFile(p))
    {
      ++n;
    }
  }

  return n;
}

bool Session::contains(const QString& path) const
{
  return entry(path) != nullptr;
}

const VideoEntry* Session::entry(const QString& path) const
{
  auto it = std::find_if(m_entries.begin(), m_entries.end(), [&path](const VideoEntry& e) {
    return e.path == path;
  });

  return it != m_entries.end() ? &(*it) : nullptr;
}

VideoEntry* Session::find(const QString& path)
{
  return const_cast<VideoEntry*>(std::as_const(*this).entry(path));
}

bool Session::setInTime(const QString& path, int seconds)
{
  VideoEntry* e = find(path);

  if (!e)
  {
    return false;
  }

  seconds = std::max(seconds, 0);

  if (e->inTime != seconds)
  {
    e->inTime = seconds;
    Q_EMIT entryChanged(path);
  }

  return true;
}

bool Session::setOutTime(const QString& path, int seconds)
{
  VideoEntry* e = find(path);

  if (!e)
  {
    return false;
  }

  seconds = std::max(seconds, 0);

  if (e->outTime != seconds)
  {
    e->outTime = seconds;
    Q_EMIT entryChanged(path);
  }

  return true;
}
