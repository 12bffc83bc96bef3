/*
 * Quaver Music Library
 * This file was part of Strawberry.
 * Copyright 2010, David Sansome <me@davidsansome.com>
 * Copyright 2018-2024, Jonas Kvinge <jonas@jkvinge.net>
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

#ifndef INCREMENTALSYNCHRONIZER_H
#define INCREMENTALSYNCHRONIZER_H

#include "config.h"

#include <QtGlobal>
#include <QObject>
#include <QList>
#include <QString>
#include <QStringList>

#include "includes/shared_ptr.h"
#include "tagreader/trackmetadata.h"
#include "changeevent.h"
#include "debouncer.h"
#include "librarybackend.h"

class TaskManager;
class TagReaderBase;
class DrCoordinator;

// Applies debounced batches to the catalog. Changed files are read, grouped into albums
// by directory and written in one transaction per slice of max_batch_size paths.
class IncrementalSynchronizer : public QObject {
  Q_OBJECT

 public:
  explicit IncrementalSynchronizer(SharedPtr<TaskManager> task_manager,
                                   SharedPtr<LibraryBackend> backend,
                                   SharedPtr<TagReaderBase> tagreader,
                                   SharedPtr<DrCoordinator> dr_coordinator,
                                   QObject *parent = nullptr);

  static const int kDefaultMaxBatchSize;

  struct FileMetadata {
    QString path;
    TrackMetadata metadata;
  };
  using FileMetadataList = QList<FileMetadata>;

  int max_batch_size() const { return max_batch_size_; }
  void set_max_batch_size(const int max_batch_size) { max_batch_size_ = qMax(1, max_batch_size); }
  bool dr_parsing() const { return dr_parsing_; }
  void set_dr_parsing(const bool dr_parsing) { dr_parsing_ = dr_parsing; }

  LibraryUpdateStats HandleChanged(const QStringList &paths);
  LibraryUpdateStats HandleRemoved(const QStringList &paths);
  LibraryUpdateStats HandleRenamed(const RenamedPathList &renamed);

  // Handles one batch as a "Updating library" task.
  LibraryUpdateStats Process(const DebouncedEvent &event);

  // Fills empty tag fields from an Artist/Album (Year)/NN Title.ext layout.
  static void ApplyPathMetadata(const QString &path, TrackMetadata *metadata);

  // Derives the album, its artist and its tracks from the files of one directory.
  static AlbumUpdate BuildAlbumUpdate(const QString &directory, const FileMetadataList &files);

  // Prefers names with "front" or "cover", then "folder", then any image.
  static QString PickBestArtwork(const QString &directory);

 public Q_SLOTS:
  // Blocks until the channel is closed.
  void Run(SharedPtr<BatchChannel> channel);

 Q_SIGNALS:
  void SyncStarted();
  void SyncFinished();
  void BatchApplied(const int added, const int updated, const int removed);
  void Finished();

 private:
  LibraryUpdateStats ApplyChangedSlice(const QStringList &paths);
  void ResolveDrValues(const QStringList &album_paths);

  static void MergeStats(const LibraryUpdateStats &stats, LibraryUpdateStats *total);
  static QString MostFrequent(const QStringList &values);

 private:
  SharedPtr<TaskManager> task_manager_;
  SharedPtr<LibraryBackend> backend_;
  SharedPtr<TagReaderBase> tagreader_;
  SharedPtr<DrCoordinator> dr_coordinator_;

  int max_batch_size_;
  bool dr_parsing_;

  static const QStringList kArtworkExtensions;
  static const QList<QStringList> kArtworkFilters;

  Q_DISABLE_COPY(IncrementalSynchronizer)
};

#endif  // INCREMENTALSYNCHRONIZER_H
