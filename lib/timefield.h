// Copyright (C) 2025 Vincent Chambrin
// This file is part of the 'clipcut' project.
// For conditions of distribution and use, see copyright notice in LICENSE.

#pragma once

#include <QString>

enum class TimeEndpoint {
  In,
  Out,
};

enum class TimeUnit {
  Hours,
  Minutes,
  Seconds,
};

// Identifies one HH, MM or SS box of a video row.
struct TimeFieldId
{
  QString path;
  TimeEndpoint endpoint = TimeEndpoint::In;
  TimeUnit unit = TimeUnit::Hours;
};

inline bool operator==(const TimeFieldId& lhs, const TimeFieldId& rhs)
{
  return lhs.path == rhs.path && lhs.endpoint == rhs.endpoint && lhs.unit == rhs.unit;
}

inline bool operator!=(const TimeFieldId& lhs, const TimeFieldId& rhs)
{
  return !(lhs == rhs);
}

int maxTimeFieldValue(TimeUnit unit);

// Two-digit text shown in a field, value is clamped to [0, maxTimeFieldValue(unit)].
QString timeFieldText(TimeUnit unit, int value);
