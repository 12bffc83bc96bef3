/*
 * Quaver Music Library
 * This file was part of Strawberry.
 * Copyright 2018-2025, Jonas Kvinge <jonas@jkvinge.net>
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

#ifndef TAGREADERBASE_H
#define TAGREADERBASE_H

#include "config.h"

#include <QtGlobal>
#include <QString>

#include "trackmetadata.h"
#include "tagreaderresult.h"

class TagReaderBase {
 public:
  explicit TagReaderBase();
  virtual ~TagReaderBase();

  virtual TagReaderResult IsMediaFile(const QString &filename) const = 0;

  // Fills metadata from the file's tags and audio properties, file_size included.
  virtual TagReaderResult ReadFile(const QString &filename, TrackMetadata *metadata) const = 0;

  static bool IsLosslessFormat(const QString &format);
  static bool IsHighResolution(const int sample_rate, const int bits_per_sample);

 protected:
  static int ParseNumberPair(const QString &value);

  Q_DISABLE_COPY(TagReaderBase)
};

#endif  // TAGREADERBASE_H
