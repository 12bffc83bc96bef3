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

#ifndef MOCK_FILESYSTEMWATCHER_H
#define MOCK_FILESYSTEMWATCHER_H

#include <QObject>
#include <QSet>
#include <QString>
#include <QStringList>

#include "core/filesystemwatcherinterface.h"

// Records subscriptions and lets tests inject backend notifications.
class FakeFileSystemWatcher : public FileSystemWatcherInterface {
  Q_OBJECT

 public:
  explicit FakeFileSystemWatcher(QObject *parent = nullptr) : FileSystemWatcherInterface(parent), fail_add_(false) {}

  bool AddPath(const QString &path) override {
    if (fail_add_) return false;
    paths_.insert(path);
    return true;
  }
  void RemovePath(const QString &path) override { paths_.remove(path); }
  void Clear() override { paths_.clear(); }

  bool IsWatched(const QString &path) const { return paths_.contains(path); }
  int count() const { return static_cast<int>(paths_.count()); }
  void set_fail_add(const bool fail_add) { fail_add_ = fail_add; }

  void Emit(const FileSystemEventList &events) { Q_EMIT PathEvents(events); }
  void Emit(const FileSystemEvent &event) { Q_EMIT PathEvents(FileSystemEventList() << event); }
  void EmitOverflow() { Q_EMIT Overflow(); }

 private:
  QSet<QString> paths_;
  bool fail_add_;
};

#endif  // MOCK_FILESYSTEMWATCHER_H
