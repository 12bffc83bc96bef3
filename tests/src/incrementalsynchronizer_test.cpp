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

#include <QByteArray>
#include <QSignalSpy>
#include <QString>
#include <QStringList>

#include "test_utils.h"
#include "mock_tagreader.h"
#include "includes/shared_ptr.h"
#include "core/taskmanager.h"
#include "core/memorydatabase.h"
#include "tagreader/trackmetadata.h"
#include "library/changeevent.h"
#include "library/librarymodels.h"
#include "library/librarybackend.h"
#include "library/incrementalsynchronizer.h"
#include "dr/drcache.h"
#include "dr/drcoordinator.h"
#include "dr/drextractor.h"

using namespace Qt::Literals::StringLiterals;

// clazy:excludeall=non-pod-global-static,returning-void-expression

namespace {

class IncrementalSynchronizerTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ASSERT_TRUE(tree_.is_valid());
    task_manager_ = make_shared<TaskManager>();
    database_ = make_shared<MemoryDatabase>(task_manager_);
    backend_ = make_shared<LibraryBackend>(database_);
    tagreader_ = make_shared<FakeTagReader>();
    cache_ = make_shared<DrCache>();
    dr_coordinator_ = make_shared<DrCoordinator>(backend_, make_shared<DrExtractor>(), cache_);
    synchronizer_ = make_shared<IncrementalSynchronizer>(task_manager_, backend_, tagreader_, dr_coordinator_);
  }

  QString AddFile(const QString &relative_path) {
    const QString path = tree_.WriteFile(relative_path, QByteArray("fLaC"));
    EXPECT_FALSE(path.isEmpty());
    return path;
  }

  TemporaryMusicTree tree_;  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
  SharedPtr<TaskManager> task_manager_;  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
  SharedPtr<Database> database_;  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
  SharedPtr<LibraryBackend> backend_;  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
  SharedPtr<FakeTagReader> tagreader_;  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
  SharedPtr<DrCache> cache_;  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
  SharedPtr<DrCoordinator> dr_coordinator_;  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
  SharedPtr<IncrementalSynchronizer> synchronizer_;  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
};

TEST_F(IncrementalSynchronizerTest, PathMetadata) {

  TrackMetadata metadata;
  IncrementalSynchronizer::ApplyPathMetadata(u"/music/Artist/Album (2020)/01 Track.flac"_s, &metadata);
  EXPECT_EQ(u"Artist"_s, metadata.artist);
  EXPECT_EQ(u"Album"_s, metadata.album);
  EXPECT_EQ(2020, metadata.year);
  EXPECT_EQ(1, metadata.track);
  EXPECT_EQ(u"Track"_s, metadata.title);

  metadata = TrackMetadata();
  IncrementalSynchronizer::ApplyPathMetadata(u"/music/Artist/Album/12 - Long Title.flac"_s, &metadata);
  EXPECT_EQ(u"Album"_s, metadata.album);
  EXPECT_EQ(-1, metadata.year);
  EXPECT_EQ(12, metadata.track);
  EXPECT_EQ(u"Long Title"_s, metadata.title);

  metadata = TrackMetadata();
  IncrementalSynchronizer::ApplyPathMetadata(u"/music/Artist/Album/Intro.flac"_s, &metadata);
  EXPECT_EQ(-1, metadata.track);
  EXPECT_EQ(u"Intro"_s, metadata.title);

}

TEST_F(IncrementalSynchronizerTest, TagsWinOverPath) {

  TrackMetadata metadata;
  metadata.title = u"Real Title"_s;
  metadata.artist = u"Real Artist"_s;
  metadata.album = u"Real Album"_s;
  metadata.year = 1999;
  metadata.track = 7;
  IncrementalSynchronizer::ApplyPathMetadata(u"/music/Artist/Album (2020)/01 Track.flac"_s, &metadata);

  EXPECT_EQ(u"Real Title"_s, metadata.title);
  EXPECT_EQ(u"Real Artist"_s, metadata.artist);
  EXPECT_EQ(u"Real Album"_s, metadata.album);
  EXPECT_EQ(1999, metadata.year);
  EXPECT_EQ(7, metadata.track);

}

TEST_F(IncrementalSynchronizerTest, ArtworkChoice) {

  const QString album = tree_.MakeDirectory(u"Album"_s);
  ASSERT_FALSE(album.isEmpty());
  EXPECT_TRUE(IncrementalSynchronizer::PickBestArtwork(album).isEmpty());

  AddFile(u"Album/back.jpg"_s);
  EXPECT_EQ(tree_.FilePath(u"Album/back.jpg"_s), IncrementalSynchronizer::PickBestArtwork(album));

  AddFile(u"Album/folder.png"_s);
  EXPECT_EQ(tree_.FilePath(u"Album/folder.png"_s), IncrementalSynchronizer::PickBestArtwork(album));

  AddFile(u"Album/Cover.JPG"_s);
  EXPECT_EQ(tree_.FilePath(u"Album/Cover.JPG"_s), IncrementalSynchronizer::PickBestArtwork(album));

  // Not an image
  AddFile(u"Album/front.txt"_s);
  EXPECT_EQ(tree_.FilePath(u"Album/Cover.JPG"_s), IncrementalSynchronizer::PickBestArtwork(album));

}

TEST_F(IncrementalSynchronizerTest, NewAlbumWithDrValue) {

  const QString track = AddFile(u"Artist/Album (2020)/01 Track.flac"_s);
  ASSERT_FALSE(tree_.WriteFile(u"Artist/Album (2020)/dr.txt"_s, QByteArray("Official DR value: DR12\n")).isEmpty());
  AddFile(u"Artist/Album (2020)/cover.jpg"_s);

  QSignalSpy started_spy(&*synchronizer_, &IncrementalSynchronizer::SyncStarted);
  QSignalSpy finished_spy(&*synchronizer_, &IncrementalSynchronizer::SyncFinished);
  QSignalSpy applied_spy(&*synchronizer_, &IncrementalSynchronizer::BatchApplied);

  const LibraryUpdateStats stats = synchronizer_->Process(DebouncedEvent(DebouncedEvent::Type::FilesChanged, QStringList() << track));
  ASSERT_TRUE(stats.success);
  EXPECT_EQ(1, stats.tracks_added);

  EXPECT_EQ(1, started_spy.count());
  EXPECT_EQ(1, finished_spy.count());
  ASSERT_EQ(1, applied_spy.count());
  EXPECT_EQ(1, applied_spy[0][0].toInt());
  EXPECT_EQ(0, applied_spy[0][1].toInt());
  EXPECT_EQ(0, applied_spy[0][2].toInt());
  EXPECT_FALSE(task_manager_->busy());

  const ArtistList artists = backend_->GetArtists();
  ASSERT_EQ(1, artists.count());
  EXPECT_EQ(u"Artist"_s, artists[0].name);

  const Album album = backend_->GetAlbumByPath(tree_.FilePath(u"Artist/Album (2020)"_s));
  ASSERT_TRUE(album.is_valid());
  EXPECT_EQ(u"Album"_s, album.title);
  EXPECT_EQ(2020, album.year.value_or(0));
  EXPECT_EQ(u"DR12"_s, album.dr_value);
  EXPECT_EQ(tree_.FilePath(u"Artist/Album (2020)/cover.jpg"_s), album.artwork_path);
  EXPECT_EQ(u"FLAC"_s, album.format);
  EXPECT_EQ(16, album.bits_per_sample.value_or(0));
  EXPECT_EQ(44100, album.sample_rate.value_or(0));

  const TrackList tracks = backend_->GetTracksByAlbum(album.id);
  ASSERT_EQ(1, tracks.count());
  EXPECT_EQ(u"Track"_s, tracks[0].title);
  EXPECT_EQ(1, tracks[0].track_number.value_or(0));
  EXPECT_EQ(track, tracks[0].path);
  EXPECT_EQ(180000, tracks[0].duration_ms);
  EXPECT_TRUE(tracks[0].is_lossless);
  EXPECT_FALSE(tracks[0].is_high_resolution);

}

TEST_F(IncrementalSynchronizerTest, SameBatchTwiceIsIdempotent) {

  const QStringList paths = QStringList() << AddFile(u"Artist/Album/01 One.flac"_s) << AddFile(u"Artist/Album/02 Two.flac"_s);

  LibraryUpdateStats stats = synchronizer_->HandleChanged(paths);
  ASSERT_TRUE(stats.success);
  EXPECT_EQ(2, stats.tracks_added);

  stats = synchronizer_->HandleChanged(paths);
  ASSERT_TRUE(stats.success);
  EXPECT_EQ(0, stats.tracks_added);
  EXPECT_EQ(2, stats.tracks_updated);

  EXPECT_EQ(1, backend_->ArtistCount());
  EXPECT_EQ(1, backend_->AlbumCount());
  EXPECT_EQ(2, backend_->TrackCount());

}

TEST_F(IncrementalSynchronizerTest, UnreadableFilesAreSkipped) {

  const QString good = AddFile(u"Artist/Album/01 Good.flac"_s);
  const QString bad = AddFile(u"Artist/Album/02 Bad.flac"_s);
  tagreader_->SetUnreadable(bad);

  const LibraryUpdateStats stats = synchronizer_->HandleChanged(QStringList() << good << bad);
  EXPECT_TRUE(stats.success);
  EXPECT_EQ(1, stats.tracks_added);
  EXPECT_EQ(1, stats.tracks_failed);
  EXPECT_TRUE(backend_->GetTrackByPath(good).is_valid());
  EXPECT_FALSE(backend_->GetTrackByPath(bad).is_valid());

}

TEST_F(IncrementalSynchronizerTest, TagsDecideAlbumAndArtist) {

  const QString one = AddFile(u"Various/Mix/01 One.flac"_s);
  const QString two = AddFile(u"Various/Mix/02 Two.flac"_s);
  const QString three = AddFile(u"Various/Mix/03 Three.flac"_s);

  TrackMetadata metadata;
  metadata.album = u"Summer Mix"_s;
  metadata.album_artist = u"Various Artists"_s;
  metadata.genre = u"Electronic"_s;
  metadata.artist = u"Someone"_s;
  tagreader_->SetTags(one, metadata);
  metadata.artist = u"Someone Else"_s;
  tagreader_->SetTags(two, metadata);
  metadata.artist = u"Third"_s;
  metadata.disc = 2;
  tagreader_->SetTags(three, metadata);

  ASSERT_TRUE(synchronizer_->HandleChanged(QStringList() << one << two << three).success);

  const AlbumList albums = backend_->GetAlbums();
  ASSERT_EQ(1, albums.count());
  EXPECT_EQ(u"Summer Mix"_s, albums[0].title);
  EXPECT_EQ(u"Electronic"_s, albums[0].genre);
  EXPECT_TRUE(albums[0].compilation);
  EXPECT_EQ(u"Various Artists"_s, backend_->GetArtistById(albums[0].artist_id).name);

  const TrackList tracks = backend_->GetTracksByAlbum(albums[0].id);
  ASSERT_EQ(3, tracks.count());
  EXPECT_EQ(u"Three"_s, tracks[2].title);
  EXPECT_EQ(2, tracks[2].disc_number);

}

TEST_F(IncrementalSynchronizerTest, BatchesAreSliced) {

  synchronizer_->set_max_batch_size(2);
  EXPECT_EQ(2, synchronizer_->max_batch_size());

  QSignalSpy added_spy(&*backend_, &LibraryBackend::TracksAdded);

  QStringList paths;
  for (int i = 1; i <= 5; ++i) {
    paths << AddFile(QStringLiteral("Artist/Album/%1 Track %1.flac").arg(i));
  }

  const LibraryUpdateStats stats = synchronizer_->HandleChanged(paths);
  ASSERT_TRUE(stats.success);
  EXPECT_EQ(5, stats.tracks_added);
  EXPECT_EQ(3, added_spy.count());
  EXPECT_EQ(1, backend_->AlbumCount());
  EXPECT_EQ(QStringList() << tree_.FilePath(u"Artist/Album"_s), stats.album_paths);

  synchronizer_->set_max_batch_size(0);
  EXPECT_EQ(1, synchronizer_->max_batch_size());

}

TEST_F(IncrementalSynchronizerTest, RemovedFilesArePruned) {

  const QString one = AddFile(u"Artist/Album/01 One.flac"_s);
  const QString two = AddFile(u"Artist/Album/02 Two.flac"_s);
  ASSERT_TRUE(synchronizer_->HandleChanged(QStringList() << one << two).success);

  LibraryUpdateStats stats = synchronizer_->Process(DebouncedEvent(DebouncedEvent::Type::FilesRemoved, QStringList() << one));
  ASSERT_TRUE(stats.success);
  EXPECT_EQ(1, stats.tracks_removed);
  EXPECT_EQ(1, backend_->AlbumCount());

  stats = synchronizer_->Process(DebouncedEvent(DebouncedEvent::Type::FilesRemoved, QStringList() << two));
  ASSERT_TRUE(stats.success);
  EXPECT_EQ(1, stats.tracks_removed);
  EXPECT_EQ(1, stats.albums_pruned);
  EXPECT_EQ(1, stats.artists_pruned);
  EXPECT_EQ(0, backend_->ArtistCount());

}

TEST_F(IncrementalSynchronizerTest, RemovedDirectory) {

  ASSERT_TRUE(synchronizer_->HandleChanged(QStringList()
      << AddFile(u"Artist/Album/01 One.flac"_s)
      << AddFile(u"Artist/Album/02 Two.flac"_s)
      << AddFile(u"Artist/Other/01 One.flac"_s)).success);

  const LibraryUpdateStats stats = synchronizer_->HandleRemoved(QStringList() << tree_.FilePath(u"Artist/Album"_s));
  ASSERT_TRUE(stats.success);
  EXPECT_EQ(2, stats.tracks_removed);
  EXPECT_EQ(1, backend_->AlbumCount());
  EXPECT_EQ(1, backend_->TrackCount());

}

TEST_F(IncrementalSynchronizerTest, ArtistDirectoryMovedOutAndBack) {

  const QString one = AddFile(u"Artist/Album 1/01 One.flac"_s);
  const QString two = AddFile(u"Artist/Album 2/01 Two.flac"_s);
  ASSERT_FALSE(tree_.WriteFile(u"Artist/Album 1/dr.txt"_s, QByteArray("Official DR value: DR10\n")).isEmpty());
  ASSERT_FALSE(tree_.WriteFile(u"Artist/Album 2/dr.log"_s, QByteArray("Official DR value: DR7\n")).isEmpty());

  const QString album1 = tree_.FilePath(u"Artist/Album 1"_s);
  const QString album2 = tree_.FilePath(u"Artist/Album 2"_s);

  ASSERT_TRUE(synchronizer_->HandleChanged(QStringList() << one << two).success);
  ASSERT_EQ(2, backend_->AlbumCount());
  ASSERT_EQ(u"DR10"_s, backend_->GetDrValue(album1));
  ASSERT_EQ(u"DR7"_s, backend_->GetDrValue(album2));
  ASSERT_EQ(2, cache_->size());

  ASSERT_TRUE(tree_.Rename(u"Artist"_s, u"Elsewhere"_s));
  const LibraryUpdateStats removed = synchronizer_->HandleRemoved(QStringList() << tree_.FilePath(u"Artist"_s));
  ASSERT_TRUE(removed.success);
  EXPECT_EQ(2, removed.tracks_removed);
  EXPECT_EQ(2, removed.albums_pruned);
  EXPECT_EQ(1, removed.artists_pruned);
  EXPECT_EQ(0, backend_->TrackCount());
  EXPECT_EQ(0, backend_->AlbumCount());
  EXPECT_EQ(0, backend_->ArtistCount());
  EXPECT_EQ(0, cache_->size());

  // Back in place within the cache lifetime
  ASSERT_TRUE(tree_.Rename(u"Elsewhere"_s, u"Artist"_s));
  ASSERT_TRUE(synchronizer_->HandleChanged(QStringList() << one << two).success);
  EXPECT_EQ(2, backend_->AlbumCount());
  EXPECT_EQ(u"DR10"_s, backend_->GetDrValue(album1));
  EXPECT_EQ(u"DR7"_s, backend_->GetDrValue(album2));

}

TEST_F(IncrementalSynchronizerTest, Rename) {

  const QString before = AddFile(u"Artist/Album/01 Old Name.flac"_s);
  ASSERT_FALSE(tree_.WriteFile(u"Artist/Album/dr.txt"_s, QByteArray("Official DR value: DR9\n")).isEmpty());
  ASSERT_TRUE(synchronizer_->HandleChanged(QStringList() << before).success);
  ASSERT_EQ(u"DR9"_s, backend_->GetDrValue(tree_.FilePath(u"Artist/Album"_s)));

  ASSERT_TRUE(tree_.Rename(u"Artist/Album/01 Old Name.flac"_s, u"Artist/Album/01 New Name.flac"_s));
  const QString after = tree_.FilePath(u"Artist/Album/01 New Name.flac"_s);

  const LibraryUpdateStats stats = synchronizer_->Process(DebouncedEvent(RenamedPathList() << qMakePair(before, after)));
  ASSERT_TRUE(stats.success);
  EXPECT_EQ(1, stats.tracks_removed);
  EXPECT_EQ(1, stats.tracks_added);

  EXPECT_FALSE(backend_->GetTrackByPath(before).is_valid());
  const Track track = backend_->GetTrackByPath(after);
  ASSERT_TRUE(track.is_valid());
  EXPECT_EQ(u"New Name"_s, track.title);
  EXPECT_EQ(1, backend_->TrackCount());

  // The album was pruned and created again, its DR value is found again
  EXPECT_EQ(u"DR9"_s, backend_->GetDrValue(tree_.FilePath(u"Artist/Album"_s)));

}

TEST_F(IncrementalSynchronizerTest, DrParsingCanBeDisabled) {

  synchronizer_->set_dr_parsing(false);
  EXPECT_FALSE(synchronizer_->dr_parsing());

  const QString track = AddFile(u"Artist/Album/01 Track.flac"_s);
  ASSERT_FALSE(tree_.WriteFile(u"Artist/Album/dr.txt"_s, QByteArray("Official DR value: DR12\n")).isEmpty());

  ASSERT_TRUE(synchronizer_->HandleChanged(QStringList() << track).success);
  EXPECT_TRUE(backend_->GetDrValue(tree_.FilePath(u"Artist/Album"_s)).isEmpty());
  EXPECT_EQ(0, cache_->size());

}

TEST_F(IncrementalSynchronizerTest, RunStopsWhenChannelCloses) {

  const QString track = AddFile(u"Artist/Album/01 Track.flac"_s);

  SharedPtr<BatchChannel> channel = make_shared<BatchChannel>(4);
  ASSERT_EQ(BatchChannel::SendResult::Sent, channel->TrySend(DebouncedEvent(DebouncedEvent::Type::FilesChanged, QStringList() << track)));
  channel->Close();

  QSignalSpy finished_spy(&*synchronizer_, &IncrementalSynchronizer::Finished);
  synchronizer_->Run(channel);

  EXPECT_EQ(1, finished_spy.count());
  EXPECT_EQ(1, backend_->TrackCount());

}

}  // namespace
