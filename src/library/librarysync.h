/*
 * Quaver Music Library
 * This file was part of Strawberry.
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

#ifndef LIBRARYSYNC_H
#define LIBRARYSYNC_H

#include "config.h"

#include <atomic>
#include <chrono>

#include <QtGlobal>
#include <QObject>
#include <QString>
#include <QStringList>

#include "includes/shared_ptr.h"
#include "changeevent.h"
#include "changewatcher.h"
#include "debouncer.h"
#include "watcherresult.h"

class QThread;
class Database;
class TaskManager;
class TagReaderBase;
class LibraryBackend;
class DrCache;
class DrCoordinator;
class IncrementalSynchronizer;

// Owns the sync pipeline: ChangeWatcher, Debouncer and IncrementalSynchronizer, each on
// its own thread and connected by bounded channels. Stopping closes the watcher's channel,
// the other stages drain and finish on their own.
class LibrarySync : public QObject {
  Q_OBJECT

 public:
  explicit LibrarySync(SharedPtr<Database> database,
                       SharedPtr<TaskManager> task_manager,
                       SharedPtr<TagReaderBase> tagreader,
                       QObject *parent = nullptr);
  ~LibrarySync() override;

  SharedPtr<LibraryBackend> backend() const { return backend_; }
  SharedPtr<DrCoordinator> dr_coordinator() const { return dr_coordinator_; }

  // Options take effect on the next Start().
  QStringList directories() const { return directories_; }
  void set_directories(const QStringList &directories) { directories_ = directories; }
  void set_debounce_delay(const std::chrono::milliseconds debounce_delay) { debounce_delay_ = debounce_delay; }
  void set_max_batch_size(const int max_batch_size) { max_batch_size_ = max_batch_size; }
  void set_dr_parsing(const bool dr_parsing) { dr_parsing_ = dr_parsing; }
  void set_dr_cache_ttl(const std::chrono::seconds dr_cache_ttl) { dr_cache_ttl_ = dr_cache_ttl; }
  void set_include_hidden(const bool include_hidden) { include_hidden_ = include_hidden; }

  bool is_running() const { return running_; }

  // Returns the number of directories that are being watched.
  int Start();
  void Stop();

  WatcherResult AddDirectory(const QString &path);
  WatcherResult RemoveDirectory(const QString &path);

 public Q_SLOTS:
  void ReloadSettings();

 Q_SIGNALS:
  void BatchReceived(const DebouncedEvent &event);
  void SyncStarted();
  void SyncFinished();
  void Fatal(const QString &error);
  void Stopped();

 private Q_SLOTS:
  void UpstreamClosed();

 private:
  void DeletePipeline();

 private:
  SharedPtr<Database> database_;
  SharedPtr<TaskManager> task_manager_;
  SharedPtr<TagReaderBase> tagreader_;
  SharedPtr<LibraryBackend> backend_;
  SharedPtr<DrCache> dr_cache_;
  SharedPtr<DrCoordinator> dr_coordinator_;

  SharedPtr<ChangeChannel> change_channel_;
  SharedPtr<BatchChannel> batch_channel_;

  ChangeWatcher *watcher_;
  Debouncer *debouncer_;
  IncrementalSynchronizer *synchronizer_;
  QThread *watcher_thread_;
  QThread *debouncer_thread_;
  QThread *synchronizer_thread_;

  QStringList directories_;
  std::chrono::milliseconds debounce_delay_;
  int max_batch_size_;
  bool dr_parsing_;
  std::chrono::seconds dr_cache_ttl_;
  bool include_hidden_;

  bool running_;
  std::atomic<bool> stopping_;

  Q_DISABLE_COPY(LibrarySync)
};

#endif  // LIBRARYSYNC_H
