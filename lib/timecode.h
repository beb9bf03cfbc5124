// Copyright (C) 2025 Vincent Chambrin
// This file is part of the 'clipcut' project.
// For conditions of distribution and use, see copyright notice in LICENSE.

#pragma once

#include <optional>

class QString;

constexpr int MAX_HOURS = 23;
constexpr int MAX_MINUTES = 59;
constexpr int MAX_SECONDS = 59;

// Returns the integer value of a time field, or 0 when the text is empty,
// not a number or negative.
int parseTimeField(const QString& text);

class TimeCode
{
private:
  int m_hours = 0;
  int m_minutes = 0;
  int m_seconds = 0;

public:
  TimeCode() = default;

  TimeCode(int h, int m, int s)
      : m_hours(h)
      , m_minutes(m)
      , m_seconds(s)
  {}

  int hours() const;
  int minutes() const;
  int seconds() const;

  int toSeconds() const;

  // HH:MM:SS
  QString toString() const;

  static TimeCode fromSeconds(int secs);
  static TimeCode fromFields(const QString& hours, const QString& minutes, const QString& seconds);
  static std::optional<TimeCode> parse(const QString& text);
};

inline int TimeCode::hours() const
{
  return m_hours;
}

inline int TimeCode::minutes() const
{
  return m_minutes;
}

inline int TimeCode::seconds() const
{
  return m_seconds;
}

inline int TimeCode::toSeconds() const
{
  return m_hours * 3600 + m_minutes * 60 + m_seconds;
}

inline bool operator==(const TimeCode& lhs, const TimeCode& rhs)
{
  return lhs.toSeconds() == rhs.toSeconds();
}

inline bool operator!=(const TimeCode& lhs, const TimeCode& rhs)
{
  return !(lhs == rhs);
}
