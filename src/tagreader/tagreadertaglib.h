/*
 * Quaver Music Library
 * This file was part of Strawberry.
 * Copyright 2003-2009, John Maguire <john.maguire@gmail.com>
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

#ifndef TAGREADERTAGLIB_H
#define TAGREADERTAGLIB_H

#include "config.h"

#include <QString>

#include <taglib/tstring.h>
#include <taglib/fileref.h>

#include "includes/scoped_ptr.h"

#include "tagreaderbase.h"
#include "trackmetadata.h"

class FileRefFactory;

class TagReaderTagLib : public TagReaderBase {
 public:
  explicit TagReaderTagLib();
  ~TagReaderTagLib() override;

  static inline TagLib::String QStringToTagLibString(const QString &s) {
    return TagLib::String(s.toUtf8().constData(), TagLib::String::UTF8);
  }

  static inline QString TagLibStringToQString(const TagLib::String &s) {
    return QString::fromUtf8((s).toCString(true));
  }

  TagReaderResult IsMediaFile(const QString &filename) const override;
  TagReaderResult ReadFile(const QString &filename, TrackMetadata *metadata) const override;

 private:
  // Returns the format name, empty for files this library does not import.
  static QString GuessFormat(TagLib::FileRef *fileref);
  TagReaderResult Read(TagLib::FileRef *fileref, TrackMetadata *metadata) const;
  void ReadAudioProperties(TagLib::FileRef *fileref, TrackMetadata *metadata) const;
  void ReadPropertyMap(TagLib::FileRef *fileref, TrackMetadata *metadata) const;

  ScopedPtr<FileRefFactory> factory_;

  Q_DISABLE_COPY(TagReaderTagLib)
};

#endif  // TAGREADERTAGLIB_H
