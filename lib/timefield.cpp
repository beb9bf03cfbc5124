#include "timefield.h"

#include "timecode.h"

#include <algorithm>

int maxTimeFieldValue(TimeUnit unit)
{
  return unit == TimeUnit::Hours ? MAX_HOURS : MAX_MINUTES;
}

QString timeFieldText(TimeUnit unit, int value)
{
  return QString("%1").arg(std::clamp(value, 0, maxTimeFieldValue(unit)), 2, 10, QChar('0'));
}
