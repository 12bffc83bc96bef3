/*
 * Quaver Music Library
 * This file was part of Strawberry.
 * Copyright 2012, David Sansome <me@davidsansome.com>
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

#include "filesystemwatcherinterface.h"
#include "qtfslistener.h"

#ifdef HAVE_INOTIFY
#  include "inotifylistener.h"
#endif

FileSystemWatcherInterface::FileSystemWatcherInterface(QObject *parent) : QObject(parent) {}

FileSystemWatcherInterface *FileSystemWatcherInterface::Create(QObject *parent) {

  FileSystemWatcherInterface *ret = nullptr;
#ifdef HAVE_INOTIFY
  ret = new InotifyListener(parent);
#else
  ret = new QtFSListener(parent);
#endif

  ret->Init();

  return ret;

}
