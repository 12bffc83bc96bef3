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

#ifndef TRACKMETADATA_H
#define TRACKMETADATA_H

#include "config.h"

#include <QtGlobal>
#include <QString>

// Tag and stream properties of one audio file. Unset numbers are -1, unset strings are empty.
struct TrackMetadata {
  TrackMetadata()
      : year(-1),
        track(-1),
        disc(-1),
        duration_ms(0),
        file_size(0),
        sample_rate(0),
        bits_per_sample(0),
        channels(0),
        is_lossless(false),
        is_high_resolution(false) {}

  QString title;
  QString artist;
  QString album_artist;
  QString album;
  QString genre;
  int year;
  int track;
  int disc;

  qint64 duration_ms;
  qint64 file_size;
  QString format;
  QString codec;
  int sample_rate;
  int bits_per_sample;
  int channels;
  bool is_lossless;
  bool is_high_resolution;
};

#endif  // TRACKMETADATA_H
