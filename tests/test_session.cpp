#include "session.h"

#include <gtest/gtest.h>

TEST(Session, AddFileIsIdempotent)
{
  Session session;

  EXPECT_TRUE(session.addFile("/videos/a.mp4"));
  EXPECT_FALSE(session.addFile("/videos/a.mp4"));

  ASSERT_EQ(session.count(), 1);
  EXPECT_EQ(session.entries().front().path, QString("/videos/a.mp4"));
}

TEST(Session, NewEntriesStartAtZero)
{
  Session session;
  session.addFile("a.mkv");

  const VideoEntry* e = session.entry("a.mkv");
  ASSERT_NE(e, nullptr);
  EXPECT_EQ(e->inTime, 0);
  EXPECT_EQ(e->outTime, 0);
}

TEST(Session, KeepsInsertionOrder)
{
  Session session;
  EXPECT_EQ(session.addFiles({"c.mp4", "a.mp4", "c.mp4", "b.avi"}), 3);

  ASSERT_EQ(session.count(), 3);
  EXPECT_EQ(session.entries().at(0).path, QString("c.mp4"));
  EXPECT_EQ(session.entries().at(1).path, QString("a.mp4"));
  EXPECT_EQ(session.entries().at(2).path, QString("b.avi"));
}

TEST(Session, SetTimes)
{
  Session session;
  session.addFile("a.mp4");

  EXPECT_TRUE(session.setInTime("a.mp4", 12));
  EXPECT_TRUE(session.setOutTime("a.mp4", 3723));
  EXPECT_EQ(session.entry("a.mp4")->inTime, 12);
  EXPECT_EQ(session.entry("a.mp4")->outTime, 3723);

  EXPECT_TRUE(session.setInTime("a.mp4", -3));
  EXPECT_EQ(session.entry("a.mp4")->inTime, 0);

  EXPECT_FALSE(session.setInTime("missing.mp4", 5));
  EXPECT_FALSE(session.contains("missing.mp4"));
}

TEST(Session, Signals)
{
  Session session;

  QStringList added;
  int changes = 0;

  QObject::connect(&session, &Session::entryAdded, [&added](const QString& p) { added << p; });
  QObject::connect(&session, &Session::entryChanged, [&changes]() { ++changes; });

  session.addFile("a.mp4");
  session.addFile("a.mp4");
  session.setOutTime("a.mp4", 10);
  session.setOutTime("a.mp4", 10);

  EXPECT_EQ(added, QStringList{"a.mp4"});
  EXPECT_EQ(changes, 1);
}
