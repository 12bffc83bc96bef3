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

#ifndef QTFSLISTENER_H
#define QTFSLISTENER_H

#include "config.h"

#include <QtGlobal>
#include <QObject>
#include <QFileSystemWatcher>
#include <QHash>
#include <QString>

#include "filesystemwatcherinterface.h"

// Synthesizes per-file events from QFileSystemWatcher's directory notifications by
// comparing a snapshot of each watched directory. Renames show up as remove plus create.
class QtFSListener : public FileSystemWatcherInterface {
  Q_OBJECT

 public:
  explicit QtFSListener(QObject *parent = nullptr);

  bool AddPath(const QString &path) override;
  void RemovePath(const QString &path) override;
  void Clear() override;

 public Q_SLOTS:
  void DirectoryChanged(const QString &path);

 private:
  struct Entry {
    Entry() : is_dir(false), size(0), mtime(0) {}
    bool is_dir;
    qint64 size;
    qint64 mtime;
  };
  using Snapshot = QHash<QString, Entry>;

  static Snapshot TakeSnapshot(const QString &path);

  QFileSystemWatcher watcher_;
  QHash<QString, Snapshot> snapshots_;
};

#endif  // QTFSLISTENER_H
