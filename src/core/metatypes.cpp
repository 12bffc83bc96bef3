/*
 * Quaver Music Library
 * This file was part of Strawberry.
 * Copyright 2010, David Sansome <me@davidsansome.com>
 * Copyright 2018-2021, Jonas Kvinge <jonas@jkvinge.net>
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

#include <QMetaType>
#include <QList>
#include <QString>
#include <QStringList>

#include "metatypes.h"
#include "core/filesystemwatcherinterface.h"
#include "library/librarymodels.h"
#include "library/changeevent.h"

void RegisterMetaTypes() {

  qRegisterMetaType<const char*>("const char*");
  qRegisterMetaType<QList<int>>("QList<int>");
  qRegisterMetaType<QStringList>("QStringList");
  qRegisterMetaType<FileSystemEvent>("FileSystemEvent");
  qRegisterMetaType<FileSystemEventList>("FileSystemEventList");
  qRegisterMetaType<ChangeEvent>("ChangeEvent");
  qRegisterMetaType<DebouncedEvent>("DebouncedEvent");
  qRegisterMetaType<Artist>("Artist");
  qRegisterMetaType<ArtistList>("ArtistList");
  qRegisterMetaType<Album>("Album");
  qRegisterMetaType<AlbumList>("AlbumList");
  qRegisterMetaType<Track>("Track");
  qRegisterMetaType<TrackList>("TrackList");

}
