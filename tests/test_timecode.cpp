#include "timecode.h"

#include <QString>

#include <gtest/gtest.h>

TEST(TimeCode, CombinesFieldsIntoSeconds)
{
  EXPECT_EQ(TimeCode(1, 2, 3).toSeconds(), 3723);
  EXPECT_EQ(TimeCode(0, 0, 0).toSeconds(), 0);
  EXPECT_EQ(TimeCode(23, 59, 59).toSeconds(), 86399);
}

TEST(TimeCode, FromFieldsAcceptsPickerText)
{
  EXPECT_EQ(TimeCode::fromFields("01", "02", "03").toSeconds(), 3723);
  EXPECT_EQ(TimeCode::fromFields("00", "10", "00").toSeconds(), 600);
}

TEST(TimeCode, NonNumericFieldIsZero)
{
  EXPECT_EQ(parseTimeField("abc"), 0);
  EXPECT_EQ(parseTimeField(""), 0);
  EXPECT_EQ(parseTimeField("-4"), 0);
  EXPECT_EQ(parseTimeField(" 7 "), 7);

  EXPECT_EQ(TimeCode::fromFields("x", "02", "03").toSeconds(), 123);
  EXPECT_EQ(TimeCode::fromFields("", "", "").toSeconds(), 0);
}

TEST(TimeCode, FromSeconds)
{
  const TimeCode tc = TimeCode::fromSeconds(3723);
  EXPECT_EQ(tc.hours(), 1);
  EXPECT_EQ(tc.minutes(), 2);
  EXPECT_EQ(tc.seconds(), 3);
  EXPECT_EQ(tc.toString(), QString("01:02:03"));

  EXPECT_EQ(TimeCode::fromSeconds(-5).toSeconds(), 0);
}

TEST(TimeCode, Parse)
{
  EXPECT_EQ(TimeCode::parse("01:02:03")->toSeconds(), 3723);
  EXPECT_EQ(TimeCode::parse("02:03")->toSeconds(), 123);
  EXPECT_EQ(TimeCode::parse("90")->toSeconds(), 90);
  EXPECT_EQ(TimeCode::parse("90")->toString(), QString("00:01:30"));

  EXPECT_FALSE(TimeCode::parse("").has_value());
  EXPECT_FALSE(TimeCode::parse("1:2:3:4").has_value());
  EXPECT_FALSE(TimeCode::parse("00:61").has_value());
  EXPECT_FALSE(TimeCode::parse("aa:bb").has_value());
  EXPECT_FALSE(TimeCode::parse("-1").has_value());
}

TEST(TimeCode, ParseRejectsTimesPastIntRange)
{
  EXPECT_FALSE(TimeCode::parse("40000000:00").has_value());
  EXPECT_FALSE(TimeCode::parse("999999:00:00").has_value());

  const std::optional<TimeCode> largest = TimeCode::parse("596523:14:07");
  ASSERT_TRUE(largest.has_value());
  EXPECT_EQ(largest->toSeconds(), 2147483647);
  EXPECT_EQ(largest->hours(), 596523);
}
