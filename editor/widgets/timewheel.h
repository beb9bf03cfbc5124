// Copyright (C) 2025 Vincent Chambrin
// This file is part of the 'clipcut' project.
// For conditions of distribution and use, see copyright notice in LICENSE.

#ifndef TIMEWHEEL_H
#define TIMEWHEEL_H

#include "timefield.h"

#include "timecode.h"

#include <QComboBox>
#include <QWidget>

// Editable combo box holding one field of a HH:MM:SS time.
class TimeWheel : public QComboBox
{
  Q_OBJECT
public:
  explicit TimeWheel(TimeUnit unit, QWidget* parent = nullptr);
  ~TimeWheel();

  TimeUnit unit() const;
  int maximum() const;

  int value() const;
  void setValue(int val);

Q_SIGNALS:
  void focused();

protected:
  void focusInEvent(QFocusEvent* event) override;

private:
  TimeUnit m_unit;
};

inline TimeUnit TimeWheel::unit() const
{
  return m_unit;
}

class TimePicker : public QWidget
{
  Q_OBJECT
public:
  explicit TimePicker(QWidget* parent = nullptr);
  ~TimePicker();

  TimeWheel* wheel(TimeUnit unit) const;

  TimeCode timeCode() const;
  int seconds() const;
  void setSeconds(int secs);

Q_SIGNALS:
  void timeChanged(int seconds);
  void fieldFocused(TimeUnit unit);

private:
  TimeWheel* m_hours = nullptr;
  TimeWheel* m_minutes = nullptr;
  TimeWheel* m_seconds = nullptr;
};

#endif // TIMEWHEEL_H
