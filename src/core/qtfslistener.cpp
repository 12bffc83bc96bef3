/*
 * Quaver Music Library
 * This file was part of Strawberry.
 * Copyright 2010, David Sansome <me@davidsansome.com>
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

#include <QDir>
#include <QFileInfo>
#include <QFileSystemWatcher>
#include <QDateTime>
#include <QString>

#include "core/logging.h"
#include "filesystemwatcherinterface.h"
#include "qtfslistener.h"

QtFSListener::QtFSListener(QObject *parent) : FileSystemWatcherInterface(parent), watcher_(this) {

  QObject::connect(&watcher_, &QFileSystemWatcher::directoryChanged, this, &QtFSListener::DirectoryChanged);

}

bool QtFSListener::AddPath(const QString &path) {

  if (!watcher_.directories().contains(path) && !watcher_.addPath(path)) {
    qLog(Error) << "Failed to add watch for path" << path;
    return false;
  }

  snapshots_.insert(path, TakeSnapshot(path));

  return true;

}

void QtFSListener::RemovePath(const QString &path) {

  snapshots_.remove(path);

  if (watcher_.directories().contains(path) && !watcher_.removePath(path)) {
    qLog(Error) << "Failed to remove watch for path" << path;
  }

}

void QtFSListener::Clear() {

  snapshots_.clear();
  watcher_.removePaths(watcher_.directories());
  watcher_.removePaths(watcher_.files());

}

QtFSListener::Snapshot QtFSListener::TakeSnapshot(const QString &path) {

  Snapshot snapshot;

  const QFileInfoList entries = QDir(path).entryInfoList(QDir::Dirs | QDir::Files | QDir::Hidden | QDir::NoDotAndDotDot);
  for (const QFileInfo &fileinfo : entries) {
    Entry entry;
    entry.is_dir = fileinfo.isDir();
    entry.size = fileinfo.size();
    entry.mtime = fileinfo.lastModified().toMSecsSinceEpoch();
    snapshot.insert(fileinfo.fileName(), entry);
  }

  return snapshot;

}

void QtFSListener::DirectoryChanged(const QString &path) {

  if (!snapshots_.contains(path)) return;

  FileSystemEventList events;

  if (!QFileInfo(path).isDir()) {
    events << FileSystemEvent(FileSystemEvent::Kind::Removed, path, true);
    RemovePath(path);
    Q_EMIT PathEvents(events);
    return;
  }

  const Snapshot old_snapshot = snapshots_.value(path);
  const Snapshot new_snapshot = TakeSnapshot(path);
  snapshots_[path] = new_snapshot;

  for (auto it = old_snapshot.constBegin(); it != old_snapshot.constEnd(); ++it) {
    if (!new_snapshot.contains(it.key())) {
      events << FileSystemEvent(FileSystemEvent::Kind::Removed, path + QLatin1Char('/') + it.key(), it.value().is_dir);
    }
  }

  for (auto it = new_snapshot.constBegin(); it != new_snapshot.constEnd(); ++it) {
    const QString filepath = path + QLatin1Char('/') + it.key();
    if (!old_snapshot.contains(it.key())) {
      events << FileSystemEvent(FileSystemEvent::Kind::Created, filepath, it.value().is_dir);
      continue;
    }
    const Entry &old_entry = old_snapshot[it.key()];
    if (!it.value().is_dir && (old_entry.size != it.value().size || old_entry.mtime != it.value().mtime)) {
      events << FileSystemEvent(FileSystemEvent::Kind::Modified, filepath, false);
    }
  }

  if (!events.isEmpty()) {
    Q_EMIT PathEvents(events);
  }

}
