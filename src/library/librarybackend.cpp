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

#include <QObject>
#include <QMutexLocker>
#include <QVariant>
#include <QString>
#include <QStringList>
#include <QSqlDatabase>
#include <QSqlQuery>

#include "core/logging.h"
#include "core/database.h"
#include "core/sqlquery.h"
#include "core/scopedtransaction.h"
#include "librarybackend.h"

using namespace Qt::Literals::StringLiterals;

namespace {

constexpr char kArtistColumns[] = "artists.id, artists.name, artists.created_at, artists.updated_at";

constexpr char kAlbumColumns[] = "albums.id, albums.artist_id, albums.title, albums.year, albums.genre, albums.compilation, albums.path, albums.dr_value, albums.artwork_path, albums.format, albums.bits_per_sample, albums.sample_rate, albums.created_at, albums.updated_at";

constexpr char kTrackColumns[] = "tracks.id, tracks.album_id, tracks.title, tracks.track_number, tracks.disc_number, tracks.duration_ms, tracks.path, tracks.file_size, tracks.format, tracks.codec, tracks.sample_rate, tracks.bits_per_sample, tracks.channels, tracks.is_lossless, tracks.is_high_resolution, tracks.created_at, tracks.updated_at";

constexpr char kTrackOrder[] = "tracks.disc_number, tracks.track_number IS NULL, tracks.track_number, tracks.title";

Artist ArtistFromQuery(const SqlQuery &q) {

  Artist artist;
  artist.id = q.value(0).toLongLong();
  artist.name = q.value(1).toString();
  artist.created_at = q.value(2).toString();
  artist.updated_at = q.value(3).toString();
  return artist;

}

Album AlbumFromQuery(const SqlQuery &q) {

  Album album;
  album.id = q.value(0).toLongLong();
  album.artist_id = q.value(1).toLongLong();
  album.title = q.value(2).toString();
  album.year = q.OptionalIntValue(3);
  album.genre = q.StringOrNullValue(4);
  album.compilation = q.value(5).toBool();
  album.path = q.value(6).toString();
  album.dr_value = q.StringOrNullValue(7);
  album.artwork_path = q.StringOrNullValue(8);
  album.format = q.StringOrNullValue(9);
  album.bits_per_sample = q.OptionalIntValue(10);
  album.sample_rate = q.OptionalIntValue(11);
  album.created_at = q.value(12).toString();
  album.updated_at = q.value(13).toString();
  return album;

}

Track TrackFromQuery(const SqlQuery &q) {

  Track track;
  track.id = q.value(0).toLongLong();
  track.album_id = q.value(1).toLongLong();
  track.title = q.value(2).toString();
  track.track_number = q.OptionalIntValue(3);
  track.disc_number = q.OptionalIntValue(4).value_or(1);
  track.duration_ms = q.value(5).toLongLong();
  track.path = q.value(6).toString();
  track.file_size = q.value(7).toLongLong();
  track.format = q.value(8).toString();
  track.codec = q.StringOrNullValue(9);
  track.sample_rate = q.value(10).toInt();
  track.bits_per_sample = q.value(11).toInt();
  track.channels = q.value(12).toInt();
  track.is_lossless = q.value(13).toBool();
  track.is_high_resolution = q.value(14).toBool();
  track.created_at = q.value(15).toString();
  track.updated_at = q.value(16).toString();
  return track;

}

void BindAlbum(const Album &album, SqlQuery *q) {

  q->BindValue(u":artist_id"_s, album.artist_id);
  q->BindStringValue(u":title"_s, album.title);
  q->BindIntOrNullValue(u":year"_s, album.year);
  q->BindStringOrNullValue(u":genre"_s, album.genre);
  q->BindBoolValue(u":compilation"_s, album.compilation);
  q->BindStringOrNullValue(u":artwork_path"_s, album.artwork_path);
  q->BindStringOrNullValue(u":format"_s, album.format);
  q->BindIntOrNullValue(u":bits_per_sample"_s, album.bits_per_sample);
  q->BindIntOrNullValue(u":sample_rate"_s, album.sample_rate);

}

void BindTrack(const Track &track, SqlQuery *q) {

  q->BindValue(u":album_id"_s, track.album_id);
  q->BindStringValue(u":title"_s, track.title);
  q->BindIntOrNullValue(u":track_number"_s, track.track_number);
  q->BindValue(u":disc_number"_s, track.disc_number > 0 ? track.disc_number : 1);
  q->BindLongLongValueOrZero(u":duration_ms"_s, track.duration_ms);
  q->BindStringValue(u":path"_s, track.path);
  q->BindLongLongValueOrZero(u":file_size"_s, track.file_size);
  q->BindStringValue(u":format"_s, track.format);
  q->BindStringOrNullValue(u":codec"_s, track.codec);
  q->BindValue(u":sample_rate"_s, track.sample_rate);
  q->BindValue(u":bits_per_sample"_s, track.bits_per_sample);
  q->BindValue(u":channels"_s, track.channels);
  q->BindBoolValue(u":is_lossless"_s, track.is_lossless);
  q->BindBoolValue(u":is_high_resolution"_s, track.is_high_resolution);

}

}  // namespace

LibraryBackend::LibraryBackend(SharedPtr<Database> db, QObject *parent)
    : QObject(parent),
      db_(db) {

  setObjectName(QLatin1String(QObject::metaObject()->className()));

}

QString LibraryBackend::NormalizedName(const QString &name) {

  return name.simplified();

}

AlbumList LibraryBackend::QueryAlbums(const QString &where, const QStringList &filter_placeholders, const QString &filter) {

  QMutexLocker l(db_->Mutex());
  QSqlDatabase db(db_->Connect());

  SqlQuery q(db);
  q.prepare(QStringLiteral("SELECT %1 FROM albums %2 ORDER BY albums.title, albums.year").arg(QLatin1String(kAlbumColumns), where));
  for (const QString &placeholder : filter_placeholders) {
    q.BindValue(placeholder, filter);
  }
  if (!q.Exec()) {
    db_->ReportErrors(q);
    return AlbumList();
  }

  AlbumList albums;
  while (q.next()) {
    albums << AlbumFromQuery(q);
  }

  return albums;

}

AlbumList LibraryBackend::GetAlbums(const QString &filter) {

  if (filter.isEmpty()) {
    return QueryAlbums(QString(), QStringList(), QString());
  }

  return QueryAlbums(u"WHERE instr(albums.title, :filter) > 0"_s, QStringList() << u":filter"_s, filter);

}

ArtistList LibraryBackend::GetArtists(const QString &filter) {

  QMutexLocker l(db_->Mutex());
  QSqlDatabase db(db_->Connect());

  SqlQuery q(db);
  q.prepare(QStringLiteral("SELECT %1 FROM artists %2 ORDER BY artists.name").arg(QLatin1String(kArtistColumns), filter.isEmpty() ? QString() : u"WHERE instr(artists.name, :filter) > 0"_s));
  if (!filter.isEmpty()) {
    q.BindValue(u":filter"_s, filter);
  }
  if (!q.Exec()) {
    db_->ReportErrors(q);
    return ArtistList();
  }

  ArtistList artists;
  while (q.next()) {
    artists << ArtistFromQuery(q);
  }

  return artists;

}

TrackList LibraryBackend::QueryTracks(const QString &join_where, const QString &order, const qint64 id, const QString &filter) {

  QMutexLocker l(db_->Mutex());
  QSqlDatabase db(db_->Connect());

  QString sql = QStringLiteral("SELECT %1 FROM tracks %2").arg(QLatin1String(kTrackColumns), join_where);
  if (!filter.isEmpty()) {
    sql += u" AND instr(tracks.title, :filter) > 0"_s;
  }
  sql += u" ORDER BY "_s + order;

  SqlQuery q(db);
  q.prepare(sql);
  q.BindValue(u":id"_s, id);
  if (!filter.isEmpty()) {
    q.BindValue(u":filter"_s, filter);
  }
  if (!q.Exec()) {
    db_->ReportErrors(q);
    return TrackList();
  }

  TrackList tracks;
  while (q.next()) {
    tracks << TrackFromQuery(q);
  }

  return tracks;

}

TrackList LibraryBackend::GetTracksByAlbum(const qint64 album_id, const QString &filter) {

  return QueryTracks(u"WHERE tracks.album_id = :id"_s, QLatin1String(kTrackOrder), album_id, filter);

}

TrackList LibraryBackend::GetTracksByArtist(const qint64 artist_id, const QString &filter) {

  return QueryTracks(u"INNER JOIN albums ON albums.id = tracks.album_id WHERE albums.artist_id = :id"_s, u"albums.title, albums.year, "_s + QLatin1String(kTrackOrder), artist_id, filter);

}

SearchResults LibraryBackend::Search(const QString &query) {

  SearchResults results;
  if (query.isEmpty()) return results;

  results.albums = QueryAlbums(u"WHERE instr(albums.title, :title_filter) > 0 OR instr(albums.path, :path_filter) > 0"_s, QStringList() << u":title_filter"_s << u":path_filter"_s, query);
  results.artists = GetArtists(query);

  return results;

}

Artist LibraryBackend::GetArtistById(const qint64 id) {

  QMutexLocker l(db_->Mutex());
  QSqlDatabase db(db_->Connect());

  SqlQuery q(db);
  q.prepare(QStringLiteral("SELECT %1 FROM artists WHERE artists.id = :id").arg(QLatin1String(kArtistColumns)));
  q.BindValue(u":id"_s, id);
  if (!q.Exec()) {
    db_->ReportErrors(q);
    return Artist();
  }
  if (!q.next()) return Artist();

  return ArtistFromQuery(q);

}

Artist LibraryBackend::GetArtistByName(const QString &name) {

  QMutexLocker l(db_->Mutex());
  QSqlDatabase db(db_->Connect());

  SqlQuery q(db);
  q.prepare(QStringLiteral("SELECT %1 FROM artists WHERE artists.name = :name COLLATE NOCASE").arg(QLatin1String(kArtistColumns)));
  q.BindValue(u":name"_s, NormalizedName(name));
  if (!q.Exec()) {
    db_->ReportErrors(q);
    return Artist();
  }
  if (!q.next()) return Artist();

  return ArtistFromQuery(q);

}

Album LibraryBackend::GetAlbumById(const qint64 id) {

  QMutexLocker l(db_->Mutex());
  QSqlDatabase db(db_->Connect());

  SqlQuery q(db);
  q.prepare(QStringLiteral("SELECT %1 FROM albums WHERE albums.id = :id").arg(QLatin1String(kAlbumColumns)));
  q.BindValue(u":id"_s, id);
  if (!q.Exec()) {
    db_->ReportErrors(q);
    return Album();
  }
  if (!q.next()) return Album();

  return AlbumFromQuery(q);

}

Album LibraryBackend::GetAlbumByPath(const QString &path) {

  QMutexLocker l(db_->Mutex());
  QSqlDatabase db(db_->Connect());

  SqlQuery q(db);
  q.prepare(QStringLiteral("SELECT %1 FROM albums WHERE albums.path = :path").arg(QLatin1String(kAlbumColumns)));
  q.BindValue(u":path"_s, path);
  if (!q.Exec()) {
    db_->ReportErrors(q);
    return Album();
  }
  if (!q.next()) return Album();

  return AlbumFromQuery(q);

}

Track LibraryBackend::GetTrackByPath(const QString &path) {

  QMutexLocker l(db_->Mutex());
  QSqlDatabase db(db_->Connect());

  SqlQuery q(db);
  q.prepare(QStringLiteral("SELECT %1 FROM tracks WHERE tracks.path = :path").arg(QLatin1String(kTrackColumns)));
  q.BindValue(u":path"_s, path);
  if (!q.Exec()) {
    db_->ReportErrors(q);
    return Track();
  }
  if (!q.next()) return Track();

  return TrackFromQuery(q);

}

int LibraryBackend::ArtistCount() {

  QMutexLocker l(db_->Mutex());
  QSqlDatabase db(db_->Connect());

  SqlQuery q(db);
  q.prepare(u"SELECT COUNT(*) FROM artists"_s);
  if (!q.Exec()) {
    db_->ReportErrors(q);
    return -1;
  }
  if (!q.next()) return -1;

  return q.value(0).toInt();

}

int LibraryBackend::AlbumCount() {

  QMutexLocker l(db_->Mutex());
  QSqlDatabase db(db_->Connect());

  SqlQuery q(db);
  q.prepare(u"SELECT COUNT(*) FROM albums"_s);
  if (!q.Exec()) {
    db_->ReportErrors(q);
    return -1;
  }
  if (!q.next()) return -1;

  return q.value(0).toInt();

}

int LibraryBackend::TrackCount() {

  QMutexLocker l(db_->Mutex());
  QSqlDatabase db(db_->Connect());

  SqlQuery q(db);
  q.prepare(u"SELECT COUNT(*) FROM tracks"_s);
  if (!q.Exec()) {
    db_->ReportErrors(q);
    return -1;
  }
  if (!q.next()) return -1;

  return q.value(0).toInt();

}

qint64 LibraryBackend::GetOrCreateArtist(QSqlDatabase &db, const QString &name) {

  const QString artist_name = NormalizedName(name);
  if (artist_name.isEmpty()) return -1;

  {
    SqlQuery q(db);
    q.prepare(u"SELECT id FROM artists WHERE name = :name COLLATE NOCASE LIMIT 1"_s);
    q.BindValue(u":name"_s, artist_name);
    if (!q.Exec()) {
      db_->ReportErrors(q);
      return -1;
    }
    if (q.next()) {
      return q.value(0).toLongLong();
    }
  }

  SqlQuery q(db);
  q.prepare(u"INSERT INTO artists (name) VALUES (:name)"_s);
  q.BindValue(u":name"_s, artist_name);
  if (!q.Exec()) {
    db_->ReportErrors(q);
    return -1;
  }

  qLog(Debug) << "Created artist" << artist_name;

  return q.lastInsertId().toLongLong();

}

qint64 LibraryBackend::AddOrUpdateAlbum(QSqlDatabase &db, const Album &album) {

  qint64 id = -1;

  // Natural key first, then the directory so a retagged album keeps its row.
  {
    SqlQuery q(db);
    q.prepare(u"SELECT id FROM albums WHERE artist_id = :artist_id AND title = :title COLLATE NOCASE AND year IS :year LIMIT 1"_s);
    q.BindValue(u":artist_id"_s, album.artist_id);
    q.BindStringValue(u":title"_s, album.title);
    q.BindIntOrNullValue(u":year"_s, album.year);
    if (!q.Exec()) {
      db_->ReportErrors(q);
      return -1;
    }
    if (q.next()) id = q.value(0).toLongLong();
  }

  if (id == -1) {
    SqlQuery q(db);
    q.prepare(u"SELECT id FROM albums WHERE path = :path"_s);
    q.BindValue(u":path"_s, album.path);
    if (!q.Exec()) {
      db_->ReportErrors(q);
      return -1;
    }
    if (q.next()) id = q.value(0).toLongLong();
  }

  if (id == -1) {
    SqlQuery q(db);
    q.prepare(u"INSERT INTO albums (artist_id, title, year, genre, compilation, path, artwork_path, format, bits_per_sample, sample_rate) VALUES (:artist_id, :title, :year, :genre, :compilation, :path, :artwork_path, :format, :bits_per_sample, :sample_rate)"_s);
    BindAlbum(album, &q);
    q.BindValue(u":path"_s, album.path);
    if (!q.Exec()) {
      db_->ReportErrors(q);
      return -1;
    }
    qLog(Debug) << "Created album" << album.title << "in" << album.path;
    return q.lastInsertId().toLongLong();
  }

  // Only the tracks of this batch were read, so keep what earlier batches learned about the album.
  SqlQuery q(db);
  q.prepare(u"UPDATE albums SET "
             "artist_id = :artist_id, "
             "title = :title, "
             "year = COALESCE(:year, year), "
             "genre = COALESCE(:genre, genre), "
             "compilation = (compilation OR :compilation), "
             "artwork_path = COALESCE(:artwork_path, artwork_path), "
             "format = COALESCE(:format, format), "
             "bits_per_sample = NULLIF(MAX(COALESCE(bits_per_sample, 0), COALESCE(:bits_per_sample, 0)), 0), "
             "sample_rate = NULLIF(MAX(COALESCE(sample_rate, 0), COALESCE(:sample_rate, 0)), 0), "
             "updated_at = CURRENT_TIMESTAMP "
             "WHERE id = :id"_s);
  BindAlbum(album, &q);
  q.BindValue(u":id"_s, id);
  if (!q.Exec()) {
    db_->ReportErrors(q);
    return -1;
  }

  return id;

}

LibraryBackend::UpsertResult LibraryBackend::AddOrUpdateTrack(QSqlDatabase &db, Track *track) {

  qint64 id = -1;
  {
    SqlQuery q(db);
    q.prepare(u"SELECT id FROM tracks WHERE path = :path"_s);
    q.BindValue(u":path"_s, track->path);
    if (!q.Exec()) {
      db_->ReportErrors(q);
      return UpsertResult::Failed;
    }
    if (q.next()) id = q.value(0).toLongLong();
  }

  if (id != -1) {
    SqlQuery q(db);
    q.prepare(u"UPDATE tracks SET "
               "album_id = :album_id, title = :title, track_number = :track_number, disc_number = :disc_number, "
               "duration_ms = :duration_ms, file_size = :file_size, format = :format, codec = :codec, "
               "sample_rate = :sample_rate, bits_per_sample = :bits_per_sample, channels = :channels, "
               "is_lossless = :is_lossless, is_high_resolution = :is_high_resolution, updated_at = CURRENT_TIMESTAMP "
               "WHERE path = :path"_s);
    BindTrack(*track, &q);
    if (!q.Exec()) {
      db_->ReportErrors(q);
      return UpsertResult::Failed;
    }
    track->id = id;
    return UpsertResult::Updated;
  }

  SqlQuery q(db);
  q.prepare(u"INSERT INTO tracks (album_id, title, track_number, disc_number, duration_ms, path, file_size, format, codec, sample_rate, bits_per_sample, channels, is_lossless, is_high_resolution) "
             "VALUES (:album_id, :title, :track_number, :disc_number, :duration_ms, :path, :file_size, :format, :codec, :sample_rate, :bits_per_sample, :channels, :is_lossless, :is_high_resolution)"_s);
  BindTrack(*track, &q);
  if (!q.Exec()) {
    db_->ReportErrors(q);
    return UpsertResult::Failed;
  }
  track->id = q.lastInsertId().toLongLong();

  return UpsertResult::Inserted;

}

QStringList LibraryBackend::DeleteTracks(QSqlDatabase &db, const QString &path, const bool directory_only, bool *ok) {

  *ok = false;

  if (!directory_only) {
    SqlQuery q(db);
    q.prepare(u"DELETE FROM tracks WHERE path = :path"_s);
    q.BindValue(u":path"_s, path);
    if (!q.Exec()) {
      db_->ReportErrors(q);
      return QStringList();
    }
    if (q.numRowsAffected() > 0) {
      *ok = true;
      return QStringList() << path;
    }
  }

  // Everything below the directory: paths in ["dir/", "dir0"), '0' sorts right after '/'.
  QString lower = path;
  while (lower.endsWith(u'/') && lower.length() > 1) lower.chop(1);
  const QString upper = lower + u'0';
  lower += u'/';

  QStringList paths;
  {
    SqlQuery q(db);
    q.prepare(u"SELECT path FROM tracks WHERE path >= :lower AND path < :upper"_s);
    q.BindValue(u":lower"_s, lower);
    q.BindValue(u":upper"_s, upper);
    if (!q.Exec()) {
      db_->ReportErrors(q);
      return QStringList();
    }
    while (q.next()) {
      paths << q.value(0).toString();
    }
  }

  if (!paths.isEmpty()) {
    SqlQuery q(db);
    q.prepare(u"DELETE FROM tracks WHERE path >= :lower AND path < :upper"_s);
    q.BindValue(u":lower"_s, lower);
    q.BindValue(u":upper"_s, upper);
    if (!q.Exec()) {
      db_->ReportErrors(q);
      return QStringList();
    }
    qLog(Debug) << "Removed" << paths.count() << "tracks below" << path;
  }

  *ok = true;
  return paths;

}

bool LibraryBackend::PruneOrphans(QSqlDatabase &db, LibraryUpdateStats *stats) {

  // Track -> Album -> Artist is two hops, so two passes are enough.
  {
    SqlQuery q(db);
    q.prepare(u"DELETE FROM albums WHERE id NOT IN (SELECT DISTINCT album_id FROM tracks)"_s);
    if (!q.Exec()) {
      db_->ReportErrors(q);
      return false;
    }
    stats->albums_pruned += q.numRowsAffected();
  }

  {
    SqlQuery q(db);
    q.prepare(u"DELETE FROM artists WHERE id NOT IN (SELECT DISTINCT artist_id FROM albums)"_s);
    if (!q.Exec()) {
      db_->ReportErrors(q);
      return false;
    }
    stats->artists_pruned += q.numRowsAffected();
  }

  if (stats->albums_pruned > 0 || stats->artists_pruned > 0) {
    qLog(Debug) << "Pruned" << stats->albums_pruned << "albums and" << stats->artists_pruned << "artists";
  }

  return true;

}

LibraryUpdateStats LibraryBackend::AddOrUpdateAlbums(const AlbumUpdateList &updates) {

  LibraryUpdateStats stats;
  TrackList added_tracks;
  TrackList changed_tracks;

  {
    QMutexLocker l(db_->Mutex());
    QSqlDatabase db(db_->Connect());

    ScopedTransaction transaction(&db);
    if (!transaction.started()) return stats;

    for (const AlbumUpdate &update : updates) {

      ScopedSavepoint album_savepoint(&db, u"album_update"_s);

      const qint64 artist_id = GetOrCreateArtist(db, update.artist_name);
      if (artist_id == -1) {
        qLog(Error) << "Skipping album" << update.album.path << "because artist" << update.artist_name << "could not be written";
        stats.tracks_failed += static_cast<int>(update.tracks.count());
        continue;
      }

      Album album(update.album);
      album.artist_id = artist_id;
      const qint64 album_id = AddOrUpdateAlbum(db, album);
      if (album_id == -1) {
        qLog(Error) << "Skipping album" << update.album.path << "because it could not be written";
        stats.tracks_failed += static_cast<int>(update.tracks.count());
        continue;
      }

      for (Track track : update.tracks) {
        track.album_id = album_id;
        ScopedSavepoint track_savepoint(&db, u"track_update"_s);
        switch (AddOrUpdateTrack(db, &track)) {
          case UpsertResult::Inserted:
            if (track_savepoint.Release()) {
              ++stats.tracks_added;
              added_tracks << track;
            }
            break;
          case UpsertResult::Updated:
            if (track_savepoint.Release()) {
              ++stats.tracks_updated;
              changed_tracks << track;
            }
            break;
          case UpsertResult::Failed:
            qLog(Warning) << "Skipping track" << track.path;
            ++stats.tracks_failed;
            break;
        }
      }

      if (!album_savepoint.Release()) {
        qLog(Error) << "Could not release savepoint for album" << album.path;
        return stats;
      }

      if (!stats.album_paths.contains(album.path)) {
        stats.album_paths << album.path;
      }

    }

    if (!PruneOrphans(db, &stats)) return stats;

    if (!transaction.Commit()) return stats;
  }

  stats.success = true;

  if (!added_tracks.isEmpty()) Q_EMIT TracksAdded(added_tracks);
  if (!changed_tracks.isEmpty()) Q_EMIT TracksChanged(changed_tracks);
  Q_EMIT AlbumsChanged();

  return stats;

}

LibraryUpdateStats LibraryBackend::BatchRemoveTracks(const QStringList &paths) {

  return RemoveTracks(paths, false);

}

LibraryUpdateStats LibraryBackend::RemoveTracksInDirectory(const QString &directory) {

  return RemoveTracks(QStringList() << directory, true);

}

LibraryUpdateStats LibraryBackend::RemoveTracks(const QStringList &paths, const bool directory_only) {

  LibraryUpdateStats stats;
  QStringList deleted_paths;

  {
    QMutexLocker l(db_->Mutex());
    QSqlDatabase db(db_->Connect());

    ScopedTransaction transaction(&db);
    if (!transaction.started()) return stats;

    for (const QString &path : paths) {
      bool ok = false;
      const QStringList removed = DeleteTracks(db, path, directory_only, &ok);
      if (!ok) {
        qLog(Warning) << "Could not remove tracks for" << path;
        continue;
      }
      if (removed.isEmpty()) {
        qLog(Debug) << "No tracks found for removed path" << path;
      }
      deleted_paths << removed;
    }

    if (!PruneOrphans(db, &stats)) return stats;

    if (!transaction.Commit()) return stats;
  }

  stats.success = true;
  stats.tracks_removed = static_cast<int>(deleted_paths.count());

  if (!deleted_paths.isEmpty()) Q_EMIT TracksDeleted(deleted_paths);
  if (stats.albums_pruned > 0 || stats.artists_pruned > 0) Q_EMIT AlbumsChanged();

  return stats;

}

bool LibraryBackend::BatchUpdateAlbums(const AlbumList &albums) {

  {
    QMutexLocker l(db_->Mutex());
    QSqlDatabase db(db_->Connect());

    ScopedTransaction transaction(&db);
    if (!transaction.started()) return false;

    for (const Album &album : albums) {
      qint64 id = -1;
      {
        SqlQuery q(db);
        q.prepare(u"SELECT id FROM albums WHERE path = :path"_s);
        q.BindValue(u":path"_s, album.path);
        if (!q.Exec()) {
          db_->ReportErrors(q);
          return false;
        }
        if (q.next()) id = q.value(0).toLongLong();
      }

      SqlQuery q(db);
      if (id == -1) {
        q.prepare(u"INSERT INTO albums (artist_id, title, year, genre, compilation, path, dr_value, artwork_path, format, bits_per_sample, sample_rate) VALUES (:artist_id, :title, :year, :genre, :compilation, :path, :dr_value, :artwork_path, :format, :bits_per_sample, :sample_rate)"_s);
      }
      else {
        q.prepare(u"UPDATE albums SET artist_id = :artist_id, title = :title, year = :year, genre = :genre, compilation = :compilation, dr_value = :dr_value, artwork_path = :artwork_path, format = :format, bits_per_sample = :bits_per_sample, sample_rate = :sample_rate, updated_at = CURRENT_TIMESTAMP WHERE path = :path"_s);
      }
      BindAlbum(album, &q);
      q.BindValue(u":path"_s, album.path);
      q.BindStringOrNullValue(u":dr_value"_s, album.dr_value);
      if (!q.Exec()) {
        db_->ReportErrors(q);
        return false;
      }
    }

    if (!transaction.Commit()) return false;
  }

  Q_EMIT AlbumsChanged();

  return true;

}

bool LibraryBackend::BatchUpdateTracks(const TrackList &tracks) {

  TrackList added_tracks;
  TrackList changed_tracks;

  {
    QMutexLocker l(db_->Mutex());
    QSqlDatabase db(db_->Connect());

    ScopedTransaction transaction(&db);
    if (!transaction.started()) return false;

    for (Track track : tracks) {
      switch (AddOrUpdateTrack(db, &track)) {
        case UpsertResult::Inserted:
          added_tracks << track;
          break;
        case UpsertResult::Updated:
          changed_tracks << track;
          break;
        case UpsertResult::Failed:
          return false;
      }
    }

    if (!transaction.Commit()) return false;
  }

  if (!added_tracks.isEmpty()) Q_EMIT TracksAdded(added_tracks);
  if (!changed_tracks.isEmpty()) Q_EMIT TracksChanged(changed_tracks);

  return true;

}

bool LibraryBackend::UpdateDrValue(const QString &album_path, const QString &dr_value) {

  int rows = 0;
  {
    QMutexLocker l(db_->Mutex());
    QSqlDatabase db(db_->Connect());

    SqlQuery q(db);
    q.prepare(u"UPDATE albums SET dr_value = :dr_value, updated_at = CURRENT_TIMESTAMP WHERE path = :path"_s);
    q.BindStringOrNullValue(u":dr_value"_s, dr_value);
    q.BindValue(u":path"_s, album_path);
    if (!q.Exec()) {
      db_->ReportErrors(q);
      return false;
    }
    rows = q.numRowsAffected();
  }

  if (rows <= 0) {
    qLog(Debug) << "No album at" << album_path << "to store" << dr_value;
    return false;
  }

  Q_EMIT DrValueChanged(album_path, dr_value);

  return true;

}

QString LibraryBackend::GetDrValue(const QString &album_path) {

  QMutexLocker l(db_->Mutex());
  QSqlDatabase db(db_->Connect());

  SqlQuery q(db);
  q.prepare(u"SELECT dr_value FROM albums WHERE path = :path"_s);
  q.BindValue(u":path"_s, album_path);
  if (!q.Exec()) {
    db_->ReportErrors(q);
    return QString();
  }
  if (!q.next()) return QString();

  return q.StringOrNullValue(0);

}

LibraryUpdateStats LibraryBackend::PruneOrphans() {

  LibraryUpdateStats stats;

  {
    QMutexLocker l(db_->Mutex());
    QSqlDatabase db(db_->Connect());

    ScopedTransaction transaction(&db);
    if (!transaction.started()) return stats;
    if (!PruneOrphans(db, &stats)) return stats;
    if (!transaction.Commit()) return stats;
  }

  stats.success = true;
  if (stats.albums_pruned > 0 || stats.artists_pruned > 0) Q_EMIT AlbumsChanged();

  return stats;

}
