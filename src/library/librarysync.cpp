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

#include "config.h"

#include <chrono>
#include <utility>

#include <QtGlobal>
#include <QObject>
#include <QThread>
#include <QMetaObject>
#include <QString>
#include <QStringList>
#include <QVariant>

#include "includes/shared_ptr.h"
#include "core/logging.h"
#include "core/database.h"
#include "core/taskmanager.h"
#include "core/settings.h"
#include "tagreader/tagreaderbase.h"
#include "dr/drcache.h"
#include "dr/drcoordinator.h"
#include "dr/drextractor.h"
#include "constants/librarysettings.h"
#include "librarysync.h"
#include "librarybackend.h"
#include "incrementalsynchronizer.h"

using std::make_shared;
using namespace std::chrono_literals;
using namespace Qt::Literals::StringLiterals;

LibrarySync::LibrarySync(SharedPtr<Database> database,
                         SharedPtr<TaskManager> task_manager,
                         SharedPtr<TagReaderBase> tagreader,
                         QObject *parent)
    : QObject(parent),
      database_(database),
      task_manager_(task_manager),
      tagreader_(tagreader),
      backend_(make_shared<LibraryBackend>(database)),
      watcher_(nullptr),
      debouncer_(nullptr),
      synchronizer_(nullptr),
      watcher_thread_(nullptr),
      debouncer_thread_(nullptr),
      synchronizer_thread_(nullptr),
      debounce_delay_(LibrarySettings::kDebounceDelayDefault),
      max_batch_size_(LibrarySettings::kMaxBatchSizeDefault),
      dr_parsing_(LibrarySettings::kDrParsingDefault),
      dr_cache_ttl_(LibrarySettings::kDrCacheTtlDefault),
      include_hidden_(LibrarySettings::kIncludeHiddenDefault),
      running_(false),
      stopping_(false) {

  setObjectName(QLatin1String(QObject::metaObject()->className()));

  QObject::connect(&*backend_, &LibraryBackend::DrValueChanged, this, [](const QString &album_path, const QString &dr_value) {
    qLog(Info) << album_path << "is" << dr_value;
  });

}

LibrarySync::~LibrarySync() {

  Stop();

}

void LibrarySync::ReloadSettings() {

  Settings s;
  s.beginGroup(LibrarySettings::kSettingsGroup);
  directories_ = s.value(LibrarySettings::kDirectories, QStringList()).toStringList();
  debounce_delay_ = std::chrono::milliseconds(s.value(LibrarySettings::kDebounceDelay, LibrarySettings::kDebounceDelayDefault).toInt());
  max_batch_size_ = s.value(LibrarySettings::kMaxBatchSize, LibrarySettings::kMaxBatchSizeDefault).toInt();
  dr_parsing_ = s.value(LibrarySettings::kDrParsing, LibrarySettings::kDrParsingDefault).toBool();
  dr_cache_ttl_ = std::chrono::seconds(s.value(LibrarySettings::kDrCacheTtl, LibrarySettings::kDrCacheTtlDefault).toInt());
  include_hidden_ = s.value(LibrarySettings::kIncludeHidden, LibrarySettings::kIncludeHiddenDefault).toBool();
  s.endGroup();

  if (debounce_delay_ < 0ms) debounce_delay_ = std::chrono::milliseconds(LibrarySettings::kDebounceDelayDefault);
  if (max_batch_size_ <= 0) max_batch_size_ = LibrarySettings::kMaxBatchSizeDefault;
  if (dr_cache_ttl_ <= 0s) dr_cache_ttl_ = std::chrono::seconds(LibrarySettings::kDrCacheTtlDefault);

}

int LibrarySync::Start() {

  if (running_) return static_cast<int>(watcher_->directories().count());

  qLog(Info) << "Starting library sync, debounce delay" << debounce_delay_ << "batch size" << max_batch_size_ << "DR parsing" << dr_parsing_;

  if (!dr_cache_ || dr_cache_->ttl() != dr_cache_ttl_) {
    dr_cache_ = make_shared<DrCache>(dr_cache_ttl_);
    dr_coordinator_ = make_shared<DrCoordinator>(backend_, make_shared<DrExtractor>(), dr_cache_);
  }

  change_channel_ = make_shared<ChangeChannel>(LibrarySettings::kChangeChannelCapacity);
  batch_channel_ = make_shared<BatchChannel>(LibrarySettings::kBatchChannelCapacity);

  watcher_ = new ChangeWatcher(change_channel_);
  watcher_->set_include_hidden(include_hidden_);
  debouncer_ = new Debouncer(change_channel_, batch_channel_, debounce_delay_);
  synchronizer_ = new IncrementalSynchronizer(task_manager_, backend_, tagreader_, dr_coordinator_);
  synchronizer_->set_max_batch_size(max_batch_size_);
  synchronizer_->set_dr_parsing(dr_parsing_);

  watcher_thread_ = new QThread(this);
  watcher_thread_->setObjectName(u"ChangeWatcher"_s);
  debouncer_thread_ = new QThread(this);
  debouncer_thread_->setObjectName(u"Debouncer"_s);
  synchronizer_thread_ = new QThread(this);
  synchronizer_thread_->setObjectName(u"IncrementalSynchronizer"_s);

  watcher_->moveToThread(watcher_thread_);
  debouncer_->moveToThread(debouncer_thread_);
  synchronizer_->moveToThread(synchronizer_thread_);

  QObject::connect(debouncer_thread_, &QThread::started, debouncer_, &Debouncer::Run);
  QObject::connect(debouncer_, &Debouncer::Finished, debouncer_thread_, &QThread::quit, Qt::DirectConnection);
  QObject::connect(debouncer_, &Debouncer::BatchFlushed, this, &LibrarySync::BatchReceived);
  // Runs on the debouncer thread so a close caused by Stop() is never seen after a restart.
  QObject::connect(debouncer_, &Debouncer::UpstreamClosed, this, &LibrarySync::UpstreamClosed, Qt::DirectConnection);

  SharedPtr<BatchChannel> batch_channel = batch_channel_;
  IncrementalSynchronizer *synchronizer = synchronizer_;
  QObject::connect(synchronizer_thread_, &QThread::started, synchronizer_, [synchronizer, batch_channel]() { synchronizer->Run(batch_channel); });
  // The synchronizer thread's database connection goes away with the thread.
  SharedPtr<Database> database = database_;
  QObject::connect(synchronizer_, &IncrementalSynchronizer::Finished, synchronizer_, [database]() { database->Close(); }, Qt::DirectConnection);
  QObject::connect(synchronizer_, &IncrementalSynchronizer::Finished, synchronizer_thread_, &QThread::quit, Qt::DirectConnection);
  QObject::connect(synchronizer_, &IncrementalSynchronizer::SyncStarted, this, &LibrarySync::SyncStarted);
  QObject::connect(synchronizer_, &IncrementalSynchronizer::SyncFinished, this, &LibrarySync::SyncFinished);

  watcher_thread_->start();
  debouncer_thread_->start();
  synchronizer_thread_->start(QThread::LowPriority);

  running_ = true;
  stopping_ = false;

  int watched = 0;
  for (const QString &directory : std::as_const(directories_)) {
    const WatcherResult result = AddDirectory(directory);
    if (result.success()) {
      ++watched;
    }
    else {
      qLog(Error) << result.error_string();
    }
  }

  if (watched == 0) {
    qLog(Warning) << "No library directories are being watched";
  }

  return watched;

}

void LibrarySync::Stop() {

  if (!running_) return;

  qLog(Info) << "Stopping library sync";

  stopping_ = true;

  ChangeWatcher *watcher = watcher_;
  QMetaObject::invokeMethod(watcher_, [watcher]() { watcher->Stop(); }, Qt::BlockingQueuedConnection);
  watcher_thread_->quit();
  watcher_thread_->wait();

  // The debouncer flushes what is left and closes the batch channel.
  debouncer_thread_->wait();
  synchronizer_thread_->wait();

  DeletePipeline();

  running_ = false;

  Q_EMIT Stopped();

}

void LibrarySync::DeletePipeline() {

  delete watcher_;
  watcher_ = nullptr;
  delete debouncer_;
  debouncer_ = nullptr;
  delete synchronizer_;
  synchronizer_ = nullptr;

  delete watcher_thread_;
  watcher_thread_ = nullptr;
  delete debouncer_thread_;
  debouncer_thread_ = nullptr;
  delete synchronizer_thread_;
  synchronizer_thread_ = nullptr;

  change_channel_.reset();
  batch_channel_.reset();

}

WatcherResult LibrarySync::AddDirectory(const QString &path) {

  if (!directories_.contains(path)) {
    directories_ << path;
  }

  if (!running_) return WatcherResult::ErrorCode::Success;

  WatcherResult result;
  ChangeWatcher *watcher = watcher_;
  QMetaObject::invokeMethod(watcher_, [watcher, path, &result]() { result = watcher->AddDirectory(path); }, Qt::BlockingQueuedConnection);

  return result;

}

WatcherResult LibrarySync::RemoveDirectory(const QString &path) {

  directories_.removeAll(path);

  if (!running_) return WatcherResult::ErrorCode::Success;

  WatcherResult result;
  ChangeWatcher *watcher = watcher_;
  QMetaObject::invokeMethod(watcher_, [watcher, path, &result]() { result = watcher->RemoveDirectory(path); }, Qt::BlockingQueuedConnection);

  return result;

}

void LibrarySync::UpstreamClosed() {

  if (stopping_) return;

  qLog(Error) << "Change watcher stopped unexpectedly, the library is no longer kept in sync";
  Q_EMIT Fatal(tr("The change watcher stopped unexpectedly"));

}
