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

#ifndef LIBRARYBACKEND_H
#define LIBRARYBACKEND_H

#include "config.h"

#include <QtGlobal>
#include <QObject>
#include <QList>
#include <QString>
#include <QStringList>
#include <QSqlDatabase>

#include "includes/shared_ptr.h"
#include "librarymodels.h"

class Database;

// Everything the synchronizer derived for one album directory.
struct AlbumUpdate {
  QString artist_name;
  Album album;
  TrackList tracks;
};
using AlbumUpdateList = QList<AlbumUpdate>;

// Outcome of one batched catalog write.
struct LibraryUpdateStats {
  LibraryUpdateStats() : success(false), tracks_added(0), tracks_updated(0), tracks_failed(0), tracks_removed(0), albums_pruned(0), artists_pruned(0) {}
  bool success;
  int tracks_added;
  int tracks_updated;
  int tracks_failed;
  int tracks_removed;
  int albums_pruned;
  int artists_pruned;
  // Directories of the albums that were written to.
  QStringList album_paths;
};

class LibraryBackend : public QObject {
  Q_OBJECT

 public:
  explicit LibraryBackend(SharedPtr<Database> db, QObject *parent = nullptr);

  SharedPtr<Database> db() const { return db_; }

  // Filters are case-sensitive substring matches, an empty filter matches everything.
  AlbumList GetAlbums(const QString &filter = QString());
  ArtistList GetArtists(const QString &filter = QString());
  TrackList GetTracksByAlbum(const qint64 album_id, const QString &filter = QString());
  TrackList GetTracksByArtist(const qint64 artist_id, const QString &filter = QString());
  SearchResults Search(const QString &query);

  Artist GetArtistById(const qint64 id);
  Artist GetArtistByName(const QString &name);
  Album GetAlbumById(const qint64 id);
  Album GetAlbumByPath(const QString &path);
  Track GetTrackByPath(const QString &path);

  int ArtistCount();
  int AlbumCount();
  int TrackCount();

  // Resolves artists and albums, upserts tracks by path and prunes orphans in one transaction.
  // A track that fails to write is rolled back on its own and counted in tracks_failed.
  LibraryUpdateStats AddOrUpdateAlbums(const AlbumUpdateList &updates);

  // Each path is a track file, or a directory whose tracks are all removed. Prunes orphans.
  LibraryUpdateStats BatchRemoveTracks(const QStringList &paths);
  LibraryUpdateStats RemoveTracksInDirectory(const QString &directory);

  // Upserts keyed on the unique path column.
  bool BatchUpdateAlbums(const AlbumList &albums);
  bool BatchUpdateTracks(const TrackList &tracks);

  bool UpdateDrValue(const QString &album_path, const QString &dr_value);
  QString GetDrValue(const QString &album_path);

  LibraryUpdateStats PruneOrphans();

 Q_SIGNALS:
  void TracksAdded(const TrackList &tracks);
  void TracksChanged(const TrackList &tracks);
  void TracksDeleted(const QStringList &paths);
  void AlbumsChanged();
  void DrValueChanged(const QString &album_path, const QString &dr_value);

 private:
  enum class UpsertResult {
    Failed,
    Inserted,
    Updated
  };

  // These run inside the caller's transaction.
  qint64 GetOrCreateArtist(QSqlDatabase &db, const QString &name);
  qint64 AddOrUpdateAlbum(QSqlDatabase &db, const Album &album);
  UpsertResult AddOrUpdateTrack(QSqlDatabase &db, Track *track);
  QStringList DeleteTracks(QSqlDatabase &db, const QString &path, const bool directory_only, bool *ok);
  bool PruneOrphans(QSqlDatabase &db, LibraryUpdateStats *stats);

  LibraryUpdateStats RemoveTracks(const QStringList &paths, const bool directory_only);

  AlbumList QueryAlbums(const QString &where, const QStringList &filter_placeholders, const QString &filter);
  TrackList QueryTracks(const QString &join_where, const QString &order, const qint64 id, const QString &filter);

  static QString NormalizedName(const QString &name);

 private:
  SharedPtr<Database> db_;

  Q_DISABLE_COPY(LibraryBackend)
};

#endif  // LIBRARYBACKEND_H
