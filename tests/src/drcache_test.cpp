/*
 * Quaver Music Library
 * Copyright 2024-2026, Quaver developers
 *
 * Quaver is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * Quaver is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with Quaver.  If not, see <http://www.gnu.org/licenses/>.
 *
 */

#include "gtest_include.h"

#include <chrono>
#include <utility>

#include <QList>
#include <QThread>
#include <QString>

#include "test_utils.h"
#include "dr/drcache.h"

using namespace Qt::Literals::StringLiterals;
using namespace std::chrono_literals;

namespace {

TEST(DrCacheTest, DefaultTtlIsOneHour) {

  DrCache cache;
  EXPECT_EQ(std::chrono::milliseconds(3600000), cache.ttl());

}

TEST(DrCacheTest, MissOnEmptyCache) {

  DrCache cache;
  EXPECT_FALSE(cache.Get(u"/music/Artist/Album"_s).has_value());
  EXPECT_EQ(0, cache.size());

}

TEST(DrCacheTest, InsertThenGet) {

  DrCache cache;
  cache.Insert(u"/music/Artist/Album"_s, u"DR12"_s);

  const std::optional<QString> value = cache.Get(u"/music/Artist/Album"_s);
  ASSERT_TRUE(value.has_value());
  EXPECT_EQ(u"DR12"_s, *value);
  EXPECT_EQ(1, cache.size());

  EXPECT_FALSE(cache.Get(u"/music/Artist/Other"_s).has_value());

}

TEST(DrCacheTest, InsertReplacesExistingEntry) {

  DrCache cache;
  cache.Insert(u"/music/Album"_s, u"DR8"_s);
  cache.Insert(u"/music/Album"_s, u"DR9"_s);

  EXPECT_EQ(1, cache.size());
  EXPECT_EQ(u"DR9"_s, cache.Get(u"/music/Album"_s).value_or(QString()));

}

TEST(DrCacheTest, RemoveAndClear) {

  DrCache cache;
  cache.Insert(u"/music/A"_s, u"DR5"_s);
  cache.Insert(u"/music/B"_s, u"DR6"_s);
  cache.Insert(u"/music/C"_s, u"DR7"_s);

  cache.Remove(u"/music/B"_s);
  EXPECT_FALSE(cache.Get(u"/music/B"_s).has_value());
  EXPECT_TRUE(cache.Get(u"/music/A"_s).has_value());
  EXPECT_EQ(2, cache.size());

  // Unknown paths are ignored
  cache.Remove(u"/music/Z"_s);
  EXPECT_EQ(2, cache.size());

  cache.Clear();
  EXPECT_EQ(0, cache.size());
  EXPECT_FALSE(cache.Get(u"/music/A"_s).has_value());

}

TEST(DrCacheTest, RemoveTreeDropsDirectoriesBelow) {

  DrCache cache;
  cache.Insert(u"/music/Artist/Album 1"_s, u"DR5"_s);
  cache.Insert(u"/music/Artist/Album 2"_s, u"DR6"_s);
  cache.Insert(u"/music/Artist/Album 2/CD1"_s, u"DR7"_s);
  cache.Insert(u"/music/Artist"_s, u"DR8"_s);
  cache.Insert(u"/music/Artist 2/Album"_s, u"DR9"_s);
  cache.Insert(u"/music/ArtistX"_s, u"DR10"_s);

  cache.RemoveTree(u"/music/Artist/"_s);

  EXPECT_FALSE(cache.Get(u"/music/Artist"_s).has_value());
  EXPECT_FALSE(cache.Get(u"/music/Artist/Album 1"_s).has_value());
  EXPECT_FALSE(cache.Get(u"/music/Artist/Album 2"_s).has_value());
  EXPECT_FALSE(cache.Get(u"/music/Artist/Album 2/CD1"_s).has_value());

  // Siblings that only share the name prefix stay
  EXPECT_EQ(u"DR9"_s, cache.Get(u"/music/Artist 2/Album"_s).value_or(QString()));
  EXPECT_EQ(u"DR10"_s, cache.Get(u"/music/ArtistX"_s).value_or(QString()));
  EXPECT_EQ(2, cache.size());

  cache.RemoveTree(u"/music/Artist 2/Album/01 Track.flac"_s);
  EXPECT_EQ(2, cache.size());

}

TEST(DrCacheTest, EntriesExpire) {

  DrCache cache(20ms);
  cache.Insert(u"/music/Album"_s, u"DR12"_s);
  EXPECT_TRUE(cache.Get(u"/music/Album"_s).has_value());

  QThread::msleep(60);

  EXPECT_FALSE(cache.Get(u"/music/Album"_s).has_value());
  EXPECT_EQ(0, cache.size());

  // A fresh insert after expiry is visible again
  cache.Insert(u"/music/Album"_s, u"DR13"_s);
  EXPECT_EQ(u"DR13"_s, cache.Get(u"/music/Album"_s).value_or(QString()));

}

TEST(DrCacheTest, ExpiredEntriesArePrunedOnWrite) {

  DrCache cache(20ms);
  cache.Insert(u"/music/Old"_s, u"DR10"_s);

  QThread::msleep(60);

  cache.Insert(u"/music/New"_s, u"DR11"_s);
  EXPECT_EQ(1, cache.size());
  EXPECT_FALSE(cache.Get(u"/music/Old"_s).has_value());
  EXPECT_TRUE(cache.Get(u"/music/New"_s).has_value());

}

TEST(DrCacheTest, ConcurrentAccess) {

  DrCache cache;
  QList<QThread*> threads;
  for (int t = 0; t < 4; ++t) {
    threads << QThread::create([&cache, t]() {
      for (int i = 0; i < 200; ++i) {
        const QString path = QStringLiteral("/music/%1/%2").arg(t).arg(i);
        cache.Insert(path, u"DR10"_s);
        if (!cache.Get(path).has_value()) return;
      }
    });
  }
  for (QThread *thread : std::as_const(threads)) thread->start();
  for (QThread *thread : std::as_const(threads)) {
    EXPECT_TRUE(thread->wait(10000));
    delete thread;
  }

  EXPECT_EQ(800, cache.size());

}

}  // namespace
