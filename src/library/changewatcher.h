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

#ifndef CHANGEWATCHER_H
#define CHANGEWATCHER_H

#include "config.h"

#include <atomic>

#include <QtGlobal>
#include <QObject>
#include <QSet>
#include <QString>
#include <QStringList>

#include "includes/shared_ptr.h"
#include "core/boundedchannel.h"
#include "core/filesystemwatcherinterface.h"
#include "changeevent.h"
#include "watcherresult.h"

using ChangeChannel = BoundedChannel<ChangeEvent>;

// Watches library directories recursively and turns filesystem notifications into
// ChangeEvents for audio files. Runs on its own thread, sends never block and events
// that do not fit into the channel are dropped and counted.
class ChangeWatcher : public QObject {
  Q_OBJECT

 public:
  // Takes ownership of fs_watcher, creates the platform backend when it is null.
  explicit ChangeWatcher(SharedPtr<ChangeChannel> channel, FileSystemWatcherInterface *fs_watcher = nullptr, QObject *parent = nullptr);
  ~ChangeWatcher() override;

  static const QStringList kSupportedExtensions;
  static bool IsSupportedAudioFile(const QString &path);

  // Both are idempotent. Removing a directory that is not watched succeeds.
  WatcherResult AddDirectory(const QString &path);
  WatcherResult RemoveDirectory(const QString &path);

  // Drops every subscription and closes the channel.
  void Stop();

  bool include_hidden() const { return include_hidden_; }
  void set_include_hidden(const bool include_hidden) { include_hidden_ = include_hidden; }

  QStringList directories() const { return roots_; }
  bool IsWatching(const QString &path) const { return watched_dirs_.contains(path); }
  int watch_count() const { return static_cast<int>(watched_dirs_.count()); }
  quint64 dropped_events() const { return dropped_events_; }

 private Q_SLOTS:
  void PathEvents(const FileSystemEventList &events);
  void Overflow();

 private:
  bool IsHidden(const QString &path) const;
  bool WatchTree(const QString &path);
  void UnwatchTree(const QString &path);
  QStringList AudioFilesInTree(const QString &path) const;

  void DirectoryAdded(const QString &path);
  void DirectoryRemoved(const QString &path);
  void Send(const ChangeEvent &event);

  static QString NormalizePath(const QString &path);

 private:
  SharedPtr<ChangeChannel> channel_;
  FileSystemWatcherInterface *fs_watcher_;
  bool include_hidden_;
  QStringList roots_;
  QSet<QString> watched_dirs_;
  std::atomic<quint64> dropped_events_;

  Q_DISABLE_COPY(ChangeWatcher)
};

#endif  // CHANGEWATCHER_H
