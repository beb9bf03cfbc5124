// Copyright (C) 2025 Vincent Chambrin
// This file is part of the 'clipcut' project.
// For conditions of distribution and use, see copyright notice in LICENSE.

#ifndef SESSION_H
#define SESSION_H

#include <QObject>
#include <QString>
#include <QStringList>

#include <vector>

struct VideoEntry
{
  QString path;
  int inTime = 0;  // seconds
  int outTime = 0; // seconds
};

// The videos added during one run of the application, in insertion order.
// Nothing is persisted.
class Session : public QObject
{
  Q_OBJECT
public:
  explicit Session(QObject* parent = nullptr);
  ~Session();

  bool addFile(const QString& path);
  int addFiles(const QStringList& paths);

  bool contains(const QString& path) const;
  const VideoEntry* entry(const QString& path) const;
  const std::vector<VideoEntry>& entries() const;
  int count() const;

  bool setInTime(const QString& path, int seconds);
  bool setOutTime(const QString& path, int seconds);

Q_SIGNALS:
  void entryAdded(const QString& path);
  void entryChanged(const QString& path);

private:
  VideoEntry* find(const QString& path);

private:
  std::vector<VideoEntry> m_entries;
};

inline const std::vector<VideoEntry>& Session::entries() const
{
  return m_entries;
}

inline int Session::count() const
{
  return static_cast<int>(m_entries.size());
}

#endif // SESSION_H
