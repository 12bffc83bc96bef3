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

#include "gmock_include.h"

#include <QSignalSpy>
#include <QString>
#include <QStringList>

#include "test_utils.h"
#include "mock_drextractor.h"
#include "includes/shared_ptr.h"
#include "core/taskmanager.h"
#include "core/memorydatabase.h"
#include "library/librarybackend.h"
#include "dr/drcache.h"
#include "dr/drcoordinator.h"
#include "dr/drextractor.h"
#include "dr/drresult.h"

using namespace Qt::Literals::StringLiterals;
using ::testing::_;
using ::testing::Return;
using ::testing::InSequence;

// clazy:excludeall=non-pod-global-static,returning-void-expression

namespace {

class DrCoordinatorTest : public ::testing::Test {
 protected:
  void SetUp() override {
    task_manager_ = make_shared<TaskManager>();
    database_ = make_shared<MemoryDatabase>(task_manager_);
    backend_ = make_shared<LibraryBackend>(database_);
    extractor_ = make_shared<MockDrExtractor>();
    cache_ = make_shared<DrCache>();
    coordinator_ = make_shared<DrCoordinator>(backend_, extractor_, cache_);

    AlbumUpdate update;
    update.artist_name = u"Artist"_s;
    update.album.title = u"Album"_s;
    update.album.path = kAlbumPath;
    Track track;
    track.title = u"Track"_s;
    track.path = kAlbumPath + u"/01 Track.flac"_s;
    track.format = u"FLAC"_s;
    update.tracks << track;
    ASSERT_TRUE(backend_->AddOrUpdateAlbums(AlbumUpdateList() << update).success);
  }

  static const QString kAlbumPath;

  SharedPtr<TaskManager> task_manager_;  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
  SharedPtr<Database> database_;  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
  SharedPtr<LibraryBackend> backend_;  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
  SharedPtr<MockDrExtractor> extractor_;  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
  SharedPtr<DrCache> cache_;  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
  SharedPtr<DrCoordinator> coordinator_;  // NOLINT(cppcoreguidelines-non-private-member-variables-in-classes)
};

const QString DrCoordinatorTest::kAlbumPath = u"/music/Artist/Album"_s;

TEST_F(DrCoordinatorTest, SecondResolveIsServedFromCache) {

  EXPECT_CALL(*extractor_, FindCandidateFiles(kAlbumPath))
      .Times(1)
      .WillOnce(Return(QStringList() << kAlbumPath + u"/dr.txt"_s));
  EXPECT_CALL(*extractor_, ExtractFromFile(kAlbumPath + u"/dr.txt"_s))
      .Times(1)
      .WillOnce(Return(DrResult::Found(u"DR12"_s)));

  EXPECT_EQ(u"DR12"_s, coordinator_->Resolve(kAlbumPath).value_or(QString()));
  EXPECT_EQ(u"DR12"_s, coordinator_->Resolve(kAlbumPath).value_or(QString()));

}

TEST_F(DrCoordinatorTest, WritesThroughToCatalogAndCache) {

  EXPECT_CALL(*extractor_, FindCandidateFiles(kAlbumPath))
      .WillOnce(Return(QStringList() << kAlbumPath + u"/dr.txt"_s));
  EXPECT_CALL(*extractor_, ExtractFromFile(_))
      .WillOnce(Return(DrResult::Found(u"DR12"_s)));

  QSignalSpy spy(&*backend_, &LibraryBackend::DrValueChanged);

  ASSERT_TRUE(coordinator_->Resolve(kAlbumPath).has_value());

  EXPECT_EQ(u"DR12"_s, backend_->GetDrValue(kAlbumPath));
  EXPECT_EQ(u"DR12"_s, backend_->GetAlbumByPath(kAlbumPath).dr_value);
  EXPECT_EQ(u"DR12"_s, cache_->Get(kAlbumPath).value_or(QString()));
  ASSERT_EQ(1, spy.count());
  EXPECT_EQ(kAlbumPath, spy[0][0].toString());
  EXPECT_EQ(u"DR12"_s, spy[0][1].toString());

}

TEST_F(DrCoordinatorTest, TriesCandidatesInOrder) {

  const QString log_file = kAlbumPath + u"/a.log"_s;
  const QString md_file = kAlbumPath + u"/b.md"_s;
  const QString txt_file = kAlbumPath + u"/c.txt"_s;

  EXPECT_CALL(*extractor_, FindCandidateFiles(kAlbumPath))
      .WillOnce(Return(QStringList() << log_file << md_file << txt_file));

  {
    InSequence sequence;
    EXPECT_CALL(*extractor_, ExtractFromFile(log_file))
        .WillOnce(Return(DrResult(DrResult::ErrorCode::ReadError, u"Permission denied"_s)));
    EXPECT_CALL(*extractor_, ExtractFromFile(md_file))
        .WillOnce(Return(DrResult(DrResult::ErrorCode::InvalidDrFormat, u"DR42"_s)));
    EXPECT_CALL(*extractor_, ExtractFromFile(txt_file))
        .WillOnce(Return(DrResult::Found(u"DR6"_s)));
  }

  EXPECT_EQ(u"DR6"_s, coordinator_->Resolve(kAlbumPath).value_or(QString()));

}

TEST_F(DrCoordinatorTest, StopsAtFirstValidCandidate) {

  EXPECT_CALL(*extractor_, FindCandidateFiles(kAlbumPath))
      .WillOnce(Return(QStringList() << kAlbumPath + u"/a.txt"_s << kAlbumPath + u"/b.txt"_s));
  EXPECT_CALL(*extractor_, ExtractFromFile(kAlbumPath + u"/a.txt"_s))
      .WillOnce(Return(DrResult::Found(u"DR10"_s)));
  EXPECT_CALL(*extractor_, ExtractFromFile(kAlbumPath + u"/b.txt"_s))
      .Times(0);

  EXPECT_EQ(u"DR10"_s, coordinator_->Resolve(kAlbumPath).value_or(QString()));

}

TEST_F(DrCoordinatorTest, NegativeResultsAreNotCached) {

  EXPECT_CALL(*extractor_, FindCandidateFiles(kAlbumPath))
      .Times(2)
      .WillOnce(Return(QStringList()))
      .WillOnce(Return(QStringList() << kAlbumPath + u"/dr.txt"_s));
  EXPECT_CALL(*extractor_, ExtractFromFile(kAlbumPath + u"/dr.txt"_s))
      .WillOnce(Return(DrResult::Found(u"DR11"_s)));

  EXPECT_FALSE(coordinator_->Resolve(kAlbumPath).has_value());
  EXPECT_FALSE(cache_->Get(kAlbumPath).has_value());
  EXPECT_TRUE(backend_->GetDrValue(kAlbumPath).isEmpty());

  // The sidecar file showed up later
  EXPECT_EQ(u"DR11"_s, coordinator_->Resolve(kAlbumPath).value_or(QString()));

}

TEST_F(DrCoordinatorTest, AllCandidatesFail) {

  EXPECT_CALL(*extractor_, FindCandidateFiles(kAlbumPath))
      .WillOnce(Return(QStringList() << kAlbumPath + u"/notes.txt"_s));
  EXPECT_CALL(*extractor_, ExtractFromFile(_))
      .WillOnce(Return(DrResult(DrResult::ErrorCode::NoDrValueFound)));

  EXPECT_FALSE(coordinator_->Resolve(kAlbumPath).has_value());
  EXPECT_EQ(0, cache_->size());

}

TEST_F(DrCoordinatorTest, InvalidateForcesRescan) {

  EXPECT_CALL(*extractor_, FindCandidateFiles(kAlbumPath))
      .Times(2)
      .WillRepeatedly(Return(QStringList() << kAlbumPath + u"/dr.txt"_s));
  EXPECT_CALL(*extractor_, ExtractFromFile(_))
      .Times(2)
      .WillOnce(Return(DrResult::Found(u"DR12"_s)))
      .WillOnce(Return(DrResult::Found(u"DR13"_s)));

  EXPECT_EQ(u"DR12"_s, coordinator_->Resolve(kAlbumPath).value_or(QString()));
  coordinator_->Invalidate(kAlbumPath);
  EXPECT_EQ(u"DR13"_s, coordinator_->Resolve(kAlbumPath).value_or(QString()));
  EXPECT_EQ(u"DR13"_s, backend_->GetDrValue(kAlbumPath));

}

TEST_F(DrCoordinatorTest, UnknownAlbumIsNotCached) {

  const QString path = u"/music/Nobody/Nothing"_s;
  EXPECT_CALL(*extractor_, FindCandidateFiles(path))
      .Times(2)
      .WillRepeatedly(Return(QStringList() << path + u"/dr.txt"_s));
  EXPECT_CALL(*extractor_, ExtractFromFile(_))
      .Times(2)
      .WillRepeatedly(Return(DrResult::Found(u"DR9"_s)));

  EXPECT_EQ(u"DR9"_s, coordinator_->Resolve(path).value_or(QString()));
  EXPECT_TRUE(backend_->GetAlbumByPath(path).id == -1);
  EXPECT_FALSE(cache_->Get(path).has_value());

  // Nothing was memoized, so the files are read again
  EXPECT_EQ(u"DR9"_s, coordinator_->Resolve(path).value_or(QString()));

}

TEST_F(DrCoordinatorTest, CacheHitRestoresLostCatalogValue) {

  EXPECT_CALL(*extractor_, FindCandidateFiles(kAlbumPath))
      .WillOnce(Return(QStringList() << kAlbumPath + u"/dr.txt"_s));
  EXPECT_CALL(*extractor_, ExtractFromFile(_))
      .WillOnce(Return(DrResult::Found(u"DR12"_s)));

  ASSERT_EQ(u"DR12"_s, coordinator_->Resolve(kAlbumPath).value_or(QString()));

  // The album row is pruned and recreated while the cache entry is still alive
  ASSERT_TRUE(backend_->BatchRemoveTracks(QStringList() << kAlbumPath + u"/01 Track.flac"_s).success);
  ASSERT_EQ(0, backend_->AlbumCount());

  AlbumUpdate update;
  update.artist_name = u"Artist"_s;
  update.album.title = u"Album"_s;
  update.album.path = kAlbumPath;
  Track track;
  track.title = u"Track"_s;
  track.path = kAlbumPath + u"/01 Track.flac"_s;
  track.format = u"FLAC"_s;
  update.tracks << track;
  ASSERT_TRUE(backend_->AddOrUpdateAlbums(AlbumUpdateList() << update).success);
  ASSERT_TRUE(backend_->GetDrValue(kAlbumPath).isEmpty());
  ASSERT_TRUE(cache_->Get(kAlbumPath).has_value());

  EXPECT_EQ(u"DR12"_s, coordinator_->Resolve(kAlbumPath).value_or(QString()));
  EXPECT_EQ(u"DR12"_s, backend_->GetDrValue(kAlbumPath));

}

TEST_F(DrCoordinatorTest, InvalidateCoversDirectoriesBelow) {

  EXPECT_CALL(*extractor_, FindCandidateFiles(kAlbumPath))
      .Times(2)
      .WillRepeatedly(Return(QStringList() << kAlbumPath + u"/dr.txt"_s));
  EXPECT_CALL(*extractor_, ExtractFromFile(_))
      .Times(2)
      .WillRepeatedly(Return(DrResult::Found(u"DR12"_s)));

  ASSERT_TRUE(coordinator_->Resolve(kAlbumPath).has_value());
  coordinator_->Invalidate(u"/music/Artist"_s);
  EXPECT_FALSE(cache_->Get(kAlbumPath).has_value());
  EXPECT_TRUE(coordinator_->Resolve(kAlbumPath).has_value());

}

TEST(DrCoordinatorFileTest, ResolvesFromSidecarOnDisk) {

  TemporaryMusicTree tree;
  ASSERT_TRUE(tree.is_valid());
  tree.WriteFile(u"Album/01 Track.flac"_s);
  tree.WriteFile(u"Album/info.txt"_s, "Ripped with EAC\n");
  tree.WriteFile(u"Album/zz_dr.log"_s, "----\nOfficial DR value: DR8\n----\n");

  SharedPtr<TaskManager> task_manager = make_shared<TaskManager>();
  SharedPtr<Database> database = make_shared<MemoryDatabase>(task_manager);
  SharedPtr<LibraryBackend> backend = make_shared<LibraryBackend>(database);
  DrCoordinator coordinator(backend, make_shared<DrExtractor>(), make_shared<DrCache>());

  EXPECT_EQ(u"DR8"_s, coordinator.Resolve(tree.FilePath(u"Album"_s)).value_or(QString()));

}

}  // namespace
