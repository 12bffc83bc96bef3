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

#ifndef LIBRARYMODELS_H
#define LIBRARYMODELS_H

#include "config.h"

#include <optional>

#include <QtGlobal>
#include <QMetaType>
#include <QList>
#include <QString>

struct Artist {
  Artist() : id(-1) {}
  qint64 id;
  QString name;
  QString created_at;
  QString updated_at;

  bool is_valid() const { return id != -1; }
};
using ArtistList = QList<Artist>;

struct Album {
  Album() : id(-1), artist_id(-1), compilation(false) {}
  qint64 id;
  qint64 artist_id;
  QString title;
  std::optional<int> year;
  QString genre;
  bool compilation;
  QString path;
  QString dr_value;
  QString artwork_path;
  QString format;
  std::optional<int> bits_per_sample;
  std::optional<int> sample_rate;
  QString created_at;
  QString updated_at;

  bool is_valid() const { return id != -1; }
};
using AlbumList = QList<Album>;

struct Track {
  Track() : id(-1), album_id(-1), disc_number(1), duration_ms(0), file_size(0), sample_rate(0), bits_per_sample(0), channels(0), is_lossless(false), is_high_resolution(false) {}
  qint64 id;
  qint64 album_id;
  QString title;
  std::optional<int> track_number;
  int disc_number;
  qint64 duration_ms;
  QString path;
  qint64 file_size;
  QString format;
  QString codec;
  int sample_rate;
  int bits_per_sample;
  int channels;
  bool is_lossless;
  bool is_high_resolution;
  QString created_at;
  QString updated_at;

  bool is_valid() const { return id != -1; }
};
using TrackList = QList<Track>;

struct SearchResults {
  AlbumList albums;
  ArtistList artists;
};

Q_DECLARE_METATYPE(Artist)
Q_DECLARE_METATYPE(ArtistList)
Q_DECLARE_METATYPE(Album)
Q_DECLARE_METATYPE(AlbumList)
Q_DECLARE_METATYPE(Track)
Q_DECLARE_METATYPE(TrackList)

#endif  // LIBRARYMODELS_H
