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

#include <QDeadlineTimer>
#include <QList>
#include <QString>
#include <QStringList>

#include "test_utils.h"
#include "mock_filesystemwatcher.h"
#include "includes/shared_ptr.h"
#include "core/filesystemwatcherinterface.h"
#include "library/changeevent.h"
#include "library/changewatcher.h"
#include "library/watcherresult.h"

using namespace Qt::Literals::StringLiterals;

// clazy:excludeall=non-pod-global-static,returning-void-expression

namespace {

class ChangeWatcherTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ASSERT_TRUE(tree_.is_valid());
    channel_ = make_shared<ChangeChannel>(64);
    fs_watcher_ = new FakeFileSystemWatcher;
    watcher_ = make_shared<ChangeWatcher>(channel_, fs_watcher_);
  }

  QList<ChangeEvent> Drain() {
    QList<ChangeEvent> events;
    ChangeEvent event;
    while (channel_->Receive(&event, QDeadlineTimer(0)) == ChangeChannel::ReceiveResult::Received) {
      events << event;
    }
    return events;
  }

  FileSystemEvent Event(const FileSystemEvent::Kind kind, const QString &relative_path, const bool is_dir = false, const quint32 cookie = 0) const {
    return FileSystemEvent(kind, tree_.FilePath(relative_path), is_dir, cookie);
  }

  TemporaryMusicTree tree_;  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
  SharedPtr<ChangeChannel> channel_;  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
  // Owned by the watcher
  FakeFileSystemWatcher *fs_watcher_;  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
  SharedPtr<ChangeWatcher> watcher_;  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
};

TEST_F(ChangeWatcherTest, SupportedExtensions) {

  EXPECT_TRUE(ChangeWatcher::IsSupportedAudioFile(u"/music/a.flac"_s));
  EXPECT_TRUE(ChangeWatcher::IsSupportedAudioFile(u"/music/a.FLAC"_s));
  EXPECT_TRUE(ChangeWatcher::IsSupportedAudioFile(u"/music/a.mp3"_s));
  EXPECT_TRUE(ChangeWatcher::IsSupportedAudioFile(u"/music/a.opus"_s));
  EXPECT_TRUE(ChangeWatcher::IsSupportedAudioFile(u"/music/a.aif"_s));
  EXPECT_FALSE(ChangeWatcher::IsSupportedAudioFile(u"/music/cover.jpg"_s));
  EXPECT_FALSE(ChangeWatcher::IsSupportedAudioFile(u"/music/dr.txt"_s));
  EXPECT_FALSE(ChangeWatcher::IsSupportedAudioFile(u"/music/flac"_s));

}

TEST_F(ChangeWatcherTest, AddDirectoryWatchesTree) {

  ASSERT_FALSE(tree_.MakeDirectory(u"Artist/Album/CD1"_s).isEmpty());
  ASSERT_FALSE(tree_.MakeDirectory(u"Artist/.hidden"_s).isEmpty());

  const WatcherResult result = watcher_->AddDirectory(tree_.path());
  ASSERT_TRUE(result.success()) << result.error_string();

  EXPECT_EQ(4, watcher_->watch_count());
  EXPECT_TRUE(fs_watcher_->IsWatched(tree_.path()));
  EXPECT_TRUE(fs_watcher_->IsWatched(tree_.FilePath(u"Artist"_s)));
  EXPECT_TRUE(fs_watcher_->IsWatched(tree_.FilePath(u"Artist/Album"_s)));
  EXPECT_TRUE(fs_watcher_->IsWatched(tree_.FilePath(u"Artist/Album/CD1"_s)));
  EXPECT_FALSE(fs_watcher_->IsWatched(tree_.FilePath(u"Artist/.hidden"_s)));
  EXPECT_EQ(QStringList() << tree_.path(), watcher_->directories());

  // Again is a no-op
  ASSERT_TRUE(watcher_->AddDirectory(tree_.path() + u'/').success());
  EXPECT_EQ(4, watcher_->watch_count());
  EXPECT_EQ(1, watcher_->directories().count());

}

TEST_F(ChangeWatcherTest, IncludeHidden) {

  ASSERT_FALSE(tree_.MakeDirectory(u".hidden"_s).isEmpty());
  watcher_->set_include_hidden(true);
  ASSERT_TRUE(watcher_->AddDirectory(tree_.path()).success());
  EXPECT_TRUE(fs_watcher_->IsWatched(tree_.FilePath(u".hidden"_s)));

}

TEST_F(ChangeWatcherTest, AddDirectoryErrors) {

  WatcherResult result = watcher_->AddDirectory(tree_.FilePath(u"missing"_s));
  EXPECT_EQ(WatcherResult::ErrorCode::WatchError, result.error_code);
  EXPECT_TRUE(result.error_string().contains(u"missing"_s));

  const QString file = tree_.WriteFile(u"file.flac"_s);
  ASSERT_FALSE(file.isEmpty());
  result = watcher_->AddDirectory(file);
  EXPECT_EQ(WatcherResult::ErrorCode::WatchError, result.error_code);

  fs_watcher_->set_fail_add(true);
  result = watcher_->AddDirectory(tree_.path());
  EXPECT_EQ(WatcherResult::ErrorCode::WatchError, result.error_code);
  EXPECT_TRUE(watcher_->directories().isEmpty());
  EXPECT_EQ(0, watcher_->watch_count());

}

TEST_F(ChangeWatcherTest, RemoveDirectory) {

  ASSERT_FALSE(tree_.MakeDirectory(u"Artist/Album"_s).isEmpty());
  ASSERT_TRUE(watcher_->AddDirectory(tree_.path()).success());
  ASSERT_EQ(3, fs_watcher_->count());

  ASSERT_TRUE(watcher_->RemoveDirectory(tree_.path()).success());
  EXPECT_EQ(0, fs_watcher_->count());
  EXPECT_EQ(0, watcher_->watch_count());
  EXPECT_TRUE(watcher_->directories().isEmpty());

  // Not watched any more, still fine
  EXPECT_TRUE(watcher_->RemoveDirectory(tree_.path()).success());

}

TEST_F(ChangeWatcherTest, RemovingOuterRootKeepsNestedRoot) {

  ASSERT_FALSE(tree_.MakeDirectory(u"Artist/Album"_s).isEmpty());
  ASSERT_TRUE(watcher_->AddDirectory(tree_.path()).success());
  ASSERT_TRUE(watcher_->AddDirectory(tree_.FilePath(u"Artist"_s)).success());

  ASSERT_TRUE(watcher_->RemoveDirectory(tree_.path()).success());
  EXPECT_FALSE(fs_watcher_->IsWatched(tree_.path()));
  EXPECT_TRUE(fs_watcher_->IsWatched(tree_.FilePath(u"Artist"_s)));
  EXPECT_TRUE(fs_watcher_->IsWatched(tree_.FilePath(u"Artist/Album"_s)));

}

TEST_F(ChangeWatcherTest, RemovingNestedRootKeepsOuterTree) {

  ASSERT_FALSE(tree_.MakeDirectory(u"Artist/Album"_s).isEmpty());
  ASSERT_TRUE(watcher_->AddDirectory(tree_.path()).success());
  ASSERT_TRUE(watcher_->AddDirectory(tree_.FilePath(u"Artist"_s)).success());

  ASSERT_TRUE(watcher_->RemoveDirectory(tree_.FilePath(u"Artist"_s)).success());
  EXPECT_EQ(QStringList() << tree_.path(), watcher_->directories());
  EXPECT_TRUE(fs_watcher_->IsWatched(tree_.path()));
  EXPECT_TRUE(fs_watcher_->IsWatched(tree_.FilePath(u"Artist"_s)));
  EXPECT_TRUE(fs_watcher_->IsWatched(tree_.FilePath(u"Artist/Album"_s)));

}

TEST_F(ChangeWatcherTest, ClassifiesFileEvents) {

  ASSERT_TRUE(watcher_->AddDirectory(tree_.path()).success());

  fs_watcher_->Emit(FileSystemEventList()
      << Event(FileSystemEvent::Kind::Created, u"new.flac"_s)
      << Event(FileSystemEvent::Kind::Modified, u"old.mp3"_s)
      << Event(FileSystemEvent::Kind::Removed, u"gone.ogg"_s)
      << Event(FileSystemEvent::Kind::Created, u"cover.jpg"_s)
      << Event(FileSystemEvent::Kind::Modified, u"dr.txt"_s)
      << Event(FileSystemEvent::Kind::Created, u".partial.flac"_s)
      << Event(FileSystemEvent::Kind::Other, u"new.flac"_s));

  const QList<ChangeEvent> events = Drain();
  ASSERT_EQ(3, events.count());

  EXPECT_EQ(ChangeEvent::Type::FileChanged, events[0].type);
  EXPECT_EQ(tree_.FilePath(u"new.flac"_s), events[0].path);
  EXPECT_TRUE(events[0].is_new);

  EXPECT_EQ(ChangeEvent::Type::FileChanged, events[1].type);
  EXPECT_EQ(tree_.FilePath(u"old.mp3"_s), events[1].path);
  EXPECT_FALSE(events[1].is_new);

  EXPECT_EQ(ChangeEvent::Type::FileRemoved, events[2].type);
  EXPECT_EQ(tree_.FilePath(u"gone.ogg"_s), events[2].path);

}

TEST_F(ChangeWatcherTest, PairsRenames) {

  ASSERT_TRUE(watcher_->AddDirectory(tree_.path()).success());

  fs_watcher_->Emit(FileSystemEventList()
      << Event(FileSystemEvent::Kind::MovedFrom, u"a.flac"_s, false, 7)
      << Event(FileSystemEvent::Kind::MovedTo, u"b.flac"_s, false, 7));

  QList<ChangeEvent> events = Drain();
  ASSERT_EQ(1, events.count());
  EXPECT_EQ(ChangeEvent::Type::FileRenamed, events[0].type);
  EXPECT_EQ(tree_.FilePath(u"a.flac"_s), events[0].path);
  EXPECT_EQ(tree_.FilePath(u"b.flac"_s), events[0].to);

  // Halves that arrive apart can't be paired
  fs_watcher_->Emit(Event(FileSystemEvent::Kind::MovedFrom, u"c.flac"_s, false, 8));
  fs_watcher_->Emit(Event(FileSystemEvent::Kind::MovedTo, u"d.flac"_s, false, 8));

  events = Drain();
  ASSERT_EQ(2, events.count());
  EXPECT_EQ(ChangeEvent::Type::FileRemoved, events[0].type);
  EXPECT_EQ(tree_.FilePath(u"c.flac"_s), events[0].path);
  EXPECT_EQ(ChangeEvent::Type::FileChanged, events[1].type);
  EXPECT_EQ(tree_.FilePath(u"d.flac"_s), events[1].path);
  EXPECT_TRUE(events[1].is_new);

}

TEST_F(ChangeWatcherTest, RenameAcrossAudioBoundary) {

  ASSERT_TRUE(watcher_->AddDirectory(tree_.path()).success());

  fs_watcher_->Emit(FileSystemEventList()
      << Event(FileSystemEvent::Kind::MovedFrom, u"download.part"_s, false, 1)
      << Event(FileSystemEvent::Kind::MovedTo, u"track.flac"_s, false, 1)
      << Event(FileSystemEvent::Kind::MovedFrom, u"track2.flac"_s, false, 2)
      << Event(FileSystemEvent::Kind::MovedTo, u"track2.bak"_s, false, 2));

  const QList<ChangeEvent> events = Drain();
  ASSERT_EQ(2, events.count());
  EXPECT_EQ(ChangeEvent::Type::FileChanged, events[0].type);
  EXPECT_EQ(tree_.FilePath(u"track.flac"_s), events[0].path);
  EXPECT_EQ(ChangeEvent::Type::FileRemoved, events[1].type);
  EXPECT_EQ(tree_.FilePath(u"track2.flac"_s), events[1].path);

}

TEST_F(ChangeWatcherTest, NewDirectoryIsWatchedAndScanned) {

  ASSERT_TRUE(watcher_->AddDirectory(tree_.path()).success());

  ASSERT_FALSE(tree_.WriteFile(u"Artist/Album/01 Track.flac"_s).isEmpty());
  ASSERT_FALSE(tree_.WriteFile(u"Artist/Album/cover.jpg"_s).isEmpty());

  fs_watcher_->Emit(Event(FileSystemEvent::Kind::Created, u"Artist"_s, true));

  EXPECT_TRUE(fs_watcher_->IsWatched(tree_.FilePath(u"Artist"_s)));
  EXPECT_TRUE(fs_watcher_->IsWatched(tree_.FilePath(u"Artist/Album"_s)));

  const QList<ChangeEvent> events = Drain();
  ASSERT_EQ(1, events.count());
  EXPECT_EQ(ChangeEvent::Type::FileChanged, events[0].type);
  EXPECT_EQ(tree_.FilePath(u"Artist/Album/01 Track.flac"_s), events[0].path);
  EXPECT_TRUE(events[0].is_new);

}

TEST_F(ChangeWatcherTest, RemovedDirectory) {

  ASSERT_FALSE(tree_.MakeDirectory(u"Artist/Album"_s).isEmpty());
  ASSERT_TRUE(watcher_->AddDirectory(tree_.path()).success());

  fs_watcher_->Emit(Event(FileSystemEvent::Kind::Removed, u"Artist"_s, true));

  EXPECT_FALSE(fs_watcher_->IsWatched(tree_.FilePath(u"Artist"_s)));
  EXPECT_FALSE(fs_watcher_->IsWatched(tree_.FilePath(u"Artist/Album"_s)));
  EXPECT_EQ(1, watcher_->watch_count());

  QList<ChangeEvent> events = Drain();
  ASSERT_EQ(1, events.count());
  EXPECT_EQ(ChangeEvent::Type::FileRemoved, events[0].type);
  EXPECT_EQ(tree_.FilePath(u"Artist"_s), events[0].path);

  // A directory nobody watched doesn't produce anything
  fs_watcher_->Emit(Event(FileSystemEvent::Kind::Removed, u"Other"_s, true));
  EXPECT_TRUE(Drain().isEmpty());

}

TEST_F(ChangeWatcherTest, FullChannelDropsEvents) {

  channel_ = make_shared<ChangeChannel>(2);
  fs_watcher_ = new FakeFileSystemWatcher;
  watcher_ = make_shared<ChangeWatcher>(channel_, fs_watcher_);
  ASSERT_TRUE(watcher_->AddDirectory(tree_.path()).success());

  fs_watcher_->Emit(FileSystemEventList()
      << Event(FileSystemEvent::Kind::Modified, u"1.flac"_s)
      << Event(FileSystemEvent::Kind::Modified, u"2.flac"_s)
      << Event(FileSystemEvent::Kind::Modified, u"3.flac"_s)
      << Event(FileSystemEvent::Kind::Modified, u"4.flac"_s));

  EXPECT_EQ(2U, watcher_->dropped_events());
  EXPECT_EQ(2, Drain().count());

}

TEST_F(ChangeWatcherTest, StopClosesChannel) {

  ASSERT_TRUE(watcher_->AddDirectory(tree_.path()).success());
  watcher_->Stop();

  EXPECT_TRUE(channel_->is_closed());
  EXPECT_EQ(0, fs_watcher_->count());
  EXPECT_TRUE(watcher_->directories().isEmpty());

  fs_watcher_->Emit(Event(FileSystemEvent::Kind::Created, u"late.flac"_s));
  EXPECT_TRUE(Drain().isEmpty());

}

}  // namespace
