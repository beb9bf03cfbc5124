#include "timefield.h"

#include <gtest/gtest.h>

TEST(TimeField, MaximumPerUnit)
{
  EXPECT_EQ(maxTimeFieldValue(TimeUnit::Hours), 23);
  EXPECT_EQ(maxTimeFieldValue(TimeUnit::Minutes), 59);
  EXPECT_EQ(maxTimeFieldValue(TimeUnit::Seconds), 59);
}

TEST(TimeField, QuickInsertValueIsTwoDigits)
{
  EXPECT_EQ(timeFieldText(TimeUnit::Seconds, 7), QString("07"));
  EXPECT_EQ(timeFieldText(TimeUnit::Minutes, 0), QString("00"));
  EXPECT_EQ(timeFieldText(TimeUnit::Minutes, 59), QString("59"));
  EXPECT_EQ(timeFieldText(TimeUnit::Hours, 12), QString("12"));
}

TEST(TimeField, QuickInsertValueIsClampedToUnit)
{
  EXPECT_EQ(timeFieldText(TimeUnit::Hours, 59), QString("23"));
  EXPECT_EQ(timeFieldText(TimeUnit::Hours, 24), QString("23"));
  EXPECT_EQ(timeFieldText(TimeUnit::Seconds, 60), QString("59"));
  EXPECT_EQ(timeFieldText(TimeUnit::Seconds, -3), QString("00"));
}

TEST(TimeField, IdentifiesOneBoxOfOneRow)
{
  const TimeFieldId field{"a.mp4", TimeEndpoint::Out, TimeUnit::Minutes};

  EXPECT_EQ(field, (TimeFieldId{"a.mp4", TimeEndpoint::Out, TimeUnit::Minutes}));
  EXPECT_NE(field, (TimeFieldId{"b.mp4", TimeEndpoint::Out, TimeUnit::Minutes}));
  EXPECT_NE(field, (TimeFieldId{"a.mp4", TimeEndpoint::In, TimeUnit::Minutes}));
  EXPECT_NE(field, (TimeFieldId{"a.mp4", TimeEndpoint::Out, TimeUnit::Seconds}));

  const TimeFieldId defaults;
  EXPECT_EQ(defaults.endpoint, TimeEndpoint::In);
  EXPECT_EQ(defaults.unit, TimeUnit::Hours);
}
