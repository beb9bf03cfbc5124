#include "timecode.h"

#include <QString>
#include <QStringList>

#include <algorithm>
#include <limits>

int parseTimeField(const QString& text)
{
  bool ok = false;
  const int value = text.trimmed().toInt(&ok);
  return ok ? std::max(value, 0) : 0;
}

QString TimeCode::toString() const
{
  return QString("%1:%2:%3")
      .arg(hours(), 2, 10, QChar('0'))
      .arg(minutes(), 2, 10, QChar('0'))
      .arg(seconds(), 2, 10, QChar('0'));
}

TimeCode TimeCode::fromSeconds(int secs)
{
  secs = std::max(secs, 0);
  const int h = secs / 3600;
  secs -= h * 3600;
  const int m = secs / 60;
  secs -= m * 60;
  return TimeCode(h, m, secs);
}

TimeCode TimeCode::fromFields(const QString& hours, const QString& minutes, const QString& seconds)
{
  return TimeCode(parseTimeField(hours), parseTimeField(minutes), parseTimeField(seconds));
}

std::optional<TimeCode> TimeCode::parse(const QString& text)
{
  const QStringList parts = text.trimmed().split(':', Qt::KeepEmptyParts);

  if (parts.size() < 1 || parts.size() > 3)
  {
    return std::nullopt;
  }

  qint64 values[3] = {0, 0, 0};

  for (int i(0); i < parts.size(); ++i)
  {
    bool ok = false;
    values[i] = parts.at(i).toInt(&ok);

    if (!ok || values[i] < 0)
    {
      return std::nullopt;
    }
  }

  // the leading field is unbounded, the following ones are not
  for (int i(1); i < parts.size(); ++i)
  {
    if (values[i] > MAX_SECONDS)
    {
      return std::nullopt;
    }
  }

  qint64 total = 0;
  for (int i(0); i < parts.size(); ++i)
  {
    total = total * 60 + values[i];
  }

  if (total > std::numeric_limits<int>::max())
  {
    return std::nullopt;
  }

  return TimeCode::fromSeconds(static_cast<int>(total));
}
