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

#include "config.h"

#include <utility>
#include <optional>

#include <QtGlobal>
#include <QObject>
#include <QDir>
#include <QFileInfo>
#include <QList>
#include <QMap>
#include <QHash>
#include <QSet>
#include <QString>
#include <QStringList>
#include <QRegularExpression>
#include <QRegularExpressionMatch>
#include <QtConcurrentMap>

#include "core/logging.h"
#include "core/taskmanager.h"
#include "tagreader/tagreaderbase.h"
#include "tagreader/tagreaderresult.h"
#include "dr/drcoordinator.h"
#include "incrementalsynchronizer.h"
#include "librarymodels.h"

using namespace Qt::Literals::StringLiterals;

const int IncrementalSynchronizer::kDefaultMaxBatchSize = 50;

const QStringList IncrementalSynchronizer::kArtworkExtensions = QStringList() << u"jpg"_s << u"jpeg"_s << u"png"_s;
const QList<QStringList> IncrementalSynchronizer::kArtworkFilters = QList<QStringList>() << (QStringList() << u"front"_s << u"cover"_s) << (QStringList() << u"folder"_s);

namespace {

constexpr char kUnknownArtist[] = "Unknown Artist";
constexpr char kUnknownAlbum[] = "Unknown Album";

struct ReadFileResult {
  IncrementalSynchronizer::FileMetadata file;
  TagReaderResult result;
};

}  // namespace

IncrementalSynchronizer::IncrementalSynchronizer(SharedPtr<TaskManager> task_manager,
                                                 SharedPtr<LibraryBackend> backend,
                                                 SharedPtr<TagReaderBase> tagreader,
                                                 SharedPtr<DrCoordinator> dr_coordinator,
                                                 QObject *parent)
    : QObject(parent),
      task_manager_(std::move(task_manager)),
      backend_(std::move(backend)),
      tagreader_(std::move(tagreader)),
      dr_coordinator_(std::move(dr_coordinator)),
      max_batch_size_(kDefaultMaxBatchSize),
      dr_parsing_(true) {}

void IncrementalSynchronizer::Run(SharedPtr<BatchChannel> channel) {

  qLog(Debug) << "Synchronizer started";

  DebouncedEvent event;
  while (channel->Receive(&event) == BatchChannel::ReceiveResult::Received) {
    Process(event);
  }

  qLog(Debug) << "Batch channel closed, synchronizer finished";

  Q_EMIT Finished();

}

LibraryUpdateStats IncrementalSynchronizer::Process(const DebouncedEvent &event) {

  TaskManager::ScopedTask task(task_manager_->StartTask(tr("Updating library")), &*task_manager_);
  task_manager_->SetTaskProgress(task.id(), 0, static_cast<quint64>(event.count()));

  Q_EMIT SyncStarted();

  LibraryUpdateStats stats;
  switch (event.type) {
    case DebouncedEvent::Type::FilesChanged:
      stats = HandleChanged(event.paths);
      break;
    case DebouncedEvent::Type::FilesRemoved:
      stats = HandleRemoved(event.paths);
      break;
    case DebouncedEvent::Type::FilesRenamed:
      stats = HandleRenamed(event.renamed);
      break;
  }

  task_manager_->SetTaskProgress(task.id(), static_cast<quint64>(event.count()), static_cast<quint64>(event.count()));

  qLog(Info) << "Library updated:" << stats.tracks_added << "added," << stats.tracks_updated << "updated," << stats.tracks_removed << "removed," << stats.tracks_failed << "failed";

  Q_EMIT BatchApplied(stats.tracks_added, stats.tracks_updated, stats.tracks_removed);
  Q_EMIT SyncFinished();

  return stats;

}

LibraryUpdateStats IncrementalSynchronizer::HandleChanged(const QStringList &paths) {

  LibraryUpdateStats total;
  total.success = true;

  for (qint64 i = 0; i < paths.count(); i += max_batch_size_) {
    const LibraryUpdateStats stats = ApplyChangedSlice(paths.mid(i, max_batch_size_));
    MergeStats(stats, &total);
    if (stats.success) {
      ResolveDrValues(stats.album_paths);
    }
  }

  return total;

}

LibraryUpdateStats IncrementalSynchronizer::ApplyChangedSlice(const QStringList &paths) {

  LibraryUpdateStats stats;

  // Ordered by directory so albums are written in a stable order.
  QMap<QString, FileMetadataList> files_by_directory;
  int read_failures = 0;

  // Tags are read on the global thread pool, results keep the order of paths.
  SharedPtr<TagReaderBase> tagreader = tagreader_;
  const QList<ReadFileResult> read_results = QtConcurrent::blockingMapped<QList<ReadFileResult>>(paths, [tagreader](const QString &path) {
    ReadFileResult read_result;
    read_result.file.path = path;
    read_result.result = tagreader->ReadFile(path, &read_result.file.metadata);
    return read_result;
  });

  for (const ReadFileResult &read_result : read_results) {
    if (!read_result.result.success()) {
      qLog(Warning) << "Skipping" << read_result.file.path << read_result.result.error_string();
      ++read_failures;
      continue;
    }
    FileMetadata file = read_result.file;
    ApplyPathMetadata(file.path, &file.metadata);
    files_by_directory[QFileInfo(file.path).absolutePath()] << file;
  }

  AlbumUpdateList updates;
  for (auto it = files_by_directory.constBegin(); it != files_by_directory.constEnd(); ++it) {
    updates << BuildAlbumUpdate(it.key(), it.value());
  }

  if (updates.isEmpty()) {
    stats.success = true;
  }
  else {
    stats = backend_->AddOrUpdateAlbums(updates);
    if (!stats.success) {
      qLog(Error) << "Could not write" << paths.count() << "changed files to the library";
    }
  }

  stats.tracks_failed += read_failures;

  return stats;

}

LibraryUpdateStats IncrementalSynchronizer::HandleRemoved(const QStringList &paths) {

  LibraryUpdateStats total;
  total.success = true;

  for (qint64 i = 0; i < paths.count(); i += max_batch_size_) {
    const QStringList slice = paths.mid(i, max_batch_size_);
    const LibraryUpdateStats stats = backend_->BatchRemoveTracks(slice);
    if (!stats.success) {
      qLog(Error) << "Could not remove" << slice.count() << "paths from the library";
    }
    MergeStats(stats, &total);

    // A pruned album loses its stored DR value, the next change must rescan it.
    if (dr_coordinator_) {
      for (const QString &path : slice) {
        dr_coordinator_->Invalidate(path);
        dr_coordinator_->Invalidate(QFileInfo(path).absolutePath());
      }
    }
  }

  return total;

}

LibraryUpdateStats IncrementalSynchronizer::HandleRenamed(const RenamedPathList &renamed) {

  LibraryUpdateStats total;
  total.success = true;

  for (const RenamedPath &rename : renamed) {
    qLog(Debug) << "Renamed" << rename.first << "to" << rename.second;
    MergeStats(HandleRemoved(QStringList() << rename.first), &total);
    MergeStats(HandleChanged(QStringList() << rename.second), &total);
  }

  return total;

}

void IncrementalSynchronizer::ResolveDrValues(const QStringList &album_paths) {

  if (!dr_parsing_ || !dr_coordinator_) return;

  for (const QString &album_path : album_paths) {
    const std::optional<QString> dr_value = dr_coordinator_->Resolve(album_path);
    if (dr_value) {
      qLog(Debug) << album_path << "has" << *dr_value;
    }
  }

}

void IncrementalSynchronizer::MergeStats(const LibraryUpdateStats &stats, LibraryUpdateStats *total) {

  total->success = total->success && stats.success;
  total->tracks_added += stats.tracks_added;
  total->tracks_updated += stats.tracks_updated;
  total->tracks_failed += stats.tracks_failed;
  total->tracks_removed += stats.tracks_removed;
  total->albums_pruned += stats.albums_pruned;
  total->artists_pruned += stats.artists_pruned;
  for (const QString &album_path : stats.album_paths) {
    if (!total->album_paths.contains(album_path)) {
      total->album_paths << album_path;
    }
  }

}

void IncrementalSynchronizer::ApplyPathMetadata(const QString &path, TrackMetadata *metadata) {

  static const QRegularExpression regex_track_title(u"^(\\d{1,3})(?:\\s*[-._]\\s*|\\s+)(.+)$"_s);
  static const QRegularExpression regex_album_year(u"^(.+?)\\s*\\((\\d{4})\\)$"_s);

  const QFileInfo fileinfo(path);

  const QRegularExpressionMatch track_match = regex_track_title.match(fileinfo.completeBaseName());
  if (track_match.hasMatch()) {
    if (metadata->track <= 0) metadata->track = track_match.captured(1).toInt();
    if (metadata->title.isEmpty()) metadata->title = track_match.captured(2).trimmed();
  }
  else if (metadata->title.isEmpty()) {
    metadata->title = fileinfo.completeBaseName();
  }

  QDir album_dir = fileinfo.dir();
  const QString album_dirname = album_dir.dirName();
  if (album_dirname.isEmpty() || album_dir.isRoot()) return;

  const QRegularExpressionMatch album_match = regex_album_year.match(album_dirname);
  if (metadata->album.isEmpty()) {
    metadata->album = album_match.hasMatch() ? album_match.captured(1).trimmed() : album_dirname;
  }
  if (metadata->year <= 0 && album_match.hasMatch()) {
    metadata->year = album_match.captured(2).toInt();
  }

  if (!album_dir.cdUp() || album_dir.isRoot()) return;
  if (metadata->artist.isEmpty() && metadata->album_artist.isEmpty()) {
    metadata->artist = album_dir.dirName();
  }

}

QString IncrementalSynchronizer::MostFrequent(const QStringList &values) {

  QHash<QString, int> counts;
  QString best;
  int best_count = 0;
  for (const QString &value : values) {
    if (value.isEmpty()) continue;
    const int count = ++counts[value];
    // Ties go to the value seen first.
    if (count > best_count) {
      best_count = count;
      best = value;
    }
  }

  return best;

}

AlbumUpdate IncrementalSynchronizer::BuildAlbumUpdate(const QString &directory, const FileMetadataList &files) {

  AlbumUpdate update;

  QStringList album_titles;
  QStringList album_artists;
  QSet<QString> track_artists;

  for (const FileMetadata &file : files) {
    const TrackMetadata &metadata = file.metadata;
    album_titles << metadata.album;
    album_artists << (metadata.album_artist.isEmpty() ? metadata.artist : metadata.album_artist);
    if (!metadata.artist.isEmpty()) track_artists.insert(metadata.artist);

    if (!update.album.year && metadata.year > 0) update.album.year = metadata.year;
    if (update.album.genre.isEmpty() && !metadata.genre.isEmpty()) update.album.genre = metadata.genre;
    if (metadata.bits_per_sample > 0 && metadata.bits_per_sample > update.album.bits_per_sample.value_or(0)) {
      update.album.bits_per_sample = metadata.bits_per_sample;
    }
    if (metadata.sample_rate > 0 && metadata.sample_rate > update.album.sample_rate.value_or(0)) {
      update.album.sample_rate = metadata.sample_rate;
    }

    Track track;
    track.title = metadata.title.isEmpty() ? QFileInfo(file.path).completeBaseName() : metadata.title;
    if (metadata.track > 0) track.track_number = metadata.track;
    track.disc_number = metadata.disc > 0 ? metadata.disc : 1;
    track.duration_ms = metadata.duration_ms;
    track.path = file.path;
    track.file_size = metadata.file_size;
    track.format = metadata.format;
    track.codec = metadata.codec;
    track.sample_rate = metadata.sample_rate;
    track.bits_per_sample = metadata.bits_per_sample;
    track.channels = metadata.channels;
    track.is_lossless = metadata.is_lossless;
    track.is_high_resolution = metadata.is_high_resolution;
    update.tracks << track;
  }

  update.artist_name = MostFrequent(album_artists);
  if (update.artist_name.isEmpty()) update.artist_name = QLatin1String(kUnknownArtist);

  update.album.title = MostFrequent(album_titles);
  if (update.album.title.isEmpty()) update.album.title = QLatin1String(kUnknownAlbum);

  update.album.compilation = track_artists.count() > 1;
  update.album.path = directory;
  update.album.artwork_path = PickBestArtwork(directory);
  if (!files.isEmpty()) update.album.format = files.first().metadata.format;

  return update;

}

QString IncrementalSynchronizer::PickBestArtwork(const QString &directory) {

  QStringList images;
  const QFileInfoList entries = QDir(directory).entryInfoList(QDir::Files | QDir::NoDotAndDotDot, QDir::Name);
  for (const QFileInfo &fileinfo : entries) {
    if (kArtworkExtensions.contains(fileinfo.suffix(), Qt::CaseInsensitive)) {
      images << fileinfo.filePath();
    }
  }

  if (images.isEmpty()) return QString();

  // Filters go from best to worst, the first one that matches anything wins.
  for (const QStringList &filter : kArtworkFilters) {
    for (const QString &image : std::as_const(images)) {
      const QString filename = QFileInfo(image).fileName();
      for (const QString &filter_text : filter) {
        if (filename.contains(filter_text, Qt::CaseInsensitive)) {
          return image;
        }
      }
    }
  }

  return images.first();

}
