// Copyright (C) 2025 Vincent Chambrin
// This file is part of the 'clipcut' project.
// For conditions of distribution and use, see copyright notice in LICENSE.

#ifndef VIDEOROWWIDGET_H
#define VIDEOROWWIDGET_H

#include "timefield.h"

#include <QFrame>

class QPushButton;

class TimePicker;
class TimeWheel;

class VideoRowWidget : public QFrame
{
  Q_OBJECT
public:
  explicit VideoRowWidget(const QString& path, QWidget* parent = nullptr);
  ~VideoRowWidget();

  const QString& path() const;

  TimePicker* picker(TimeEndpoint endpoint) const;
  TimeWheel* wheel(TimeEndpoint endpoint, TimeUnit unit) const;

  int inTime() const;
  int outTime() const;

Q_SIGNALS:
  void inTimeChanged(const QString& path, int seconds);
  void outTimeChanged(const QString& path, int seconds);
  void fieldFocused(const TimeFieldId& field);
  void extractRequested(const QString& path);
  void playRequested(const QString& path);

private:
  QString m_path;
  TimePicker* m_inPicker = nullptr;
  TimePicker* m_outPicker = nullptr;
  QPushButton* m_extractButton = nullptr;
  QPushButton* m_playButton = nullptr;
};

inline const QString& VideoRowWidget::path() const
{
  return m_path;
}

#endif // VIDEOROWWIDGET_H
