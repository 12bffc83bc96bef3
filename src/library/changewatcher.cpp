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

#include "config.h"

#include <utility>

#include <QtGlobal>
#include <QObject>
#include <QDir>
#include <QFileInfo>
#include <QHash>
#include <QSet>
#include <QString>
#include <QStringList>

#include "core/logging.h"
#include "core/filesystemwatcherinterface.h"
#include "changewatcher.h"

using namespace Qt::Literals::StringLiterals;

const QStringList ChangeWatcher::kSupportedExtensions = QStringList() << u"flac"_s << u"mp3"_s << u"aac"_s << u"opus"_s << u"ogg"_s << u"wav"_s << u"aiff"_s << u"aif"_s << u"mpc"_s;

ChangeWatcher::ChangeWatcher(SharedPtr<ChangeChannel> channel, FileSystemWatcherInterface *fs_watcher, QObject *parent)
    : QObject(parent),
      channel_(std::move(channel)),
      fs_watcher_(fs_watcher),
      include_hidden_(false),
      dropped_events_(0) {

  if (fs_watcher_) {
    fs_watcher_->setParent(this);
  }
  else {
    fs_watcher_ = FileSystemWatcherInterface::Create(this);
  }

  QObject::connect(fs_watcher_, &FileSystemWatcherInterface::PathEvents, this, &ChangeWatcher::PathEvents);
  QObject::connect(fs_watcher_, &FileSystemWatcherInterface::Overflow, this, &ChangeWatcher::Overflow);

}

ChangeWatcher::~ChangeWatcher() = default;

bool ChangeWatcher::IsSupportedAudioFile(const QString &path) {

  return kSupportedExtensions.contains(QFileInfo(path).suffix(), Qt::CaseInsensitive);

}

QString ChangeWatcher::NormalizePath(const QString &path) {

  return QDir::cleanPath(QFileInfo(path).absoluteFilePath());

}

bool ChangeWatcher::IsHidden(const QString &path) const {

  return !include_hidden_ && QFileInfo(path).fileName().startsWith(u'.');

}

WatcherResult ChangeWatcher::AddDirectory(const QString &path) {

  const QString dir = NormalizePath(path);
  const QFileInfo fileinfo(dir);
  if (!fileinfo.exists()) {
    return WatcherResult(WatcherResult::ErrorCode::WatchError, QObject::tr("%1 does not exist").arg(dir));
  }
  if (!fileinfo.isDir()) {
    return WatcherResult(WatcherResult::ErrorCode::WatchError, QObject::tr("%1 is not a directory").arg(dir));
  }

  if (roots_.contains(dir)) {
    return WatcherResult::ErrorCode::Success;
  }

  if (!WatchTree(dir)) {
    return WatcherResult(WatcherResult::ErrorCode::WatchError, QObject::tr("Could not subscribe to %1").arg(dir));
  }

  roots_ << dir;

  qLog(Info) << "Watching" << dir << "with" << watch_count() << "subscriptions";

  return WatcherResult::ErrorCode::Success;

}

WatcherResult ChangeWatcher::RemoveDirectory(const QString &path) {

  const QString dir = NormalizePath(path);
  if (!roots_.contains(dir)) {
    return WatcherResult::ErrorCode::Success;
  }

  roots_.removeAll(dir);

  // The tree stays subscribed while a remaining root contains it.
  for (const QString &root : std::as_const(roots_)) {
    if (dir.startsWith(root.endsWith(u'/') ? root : root + u'/')) {
      qLog(Info) << "Stopped watching" << dir << "as a root, it stays watched inside" << root;
      return WatcherResult::ErrorCode::Success;
    }
  }

  UnwatchTree(dir);

  // Another root may live inside the one that was removed.
  for (const QString &root : std::as_const(roots_)) {
    if (root.startsWith(dir + u'/')) {
      WatchTree(root);
    }
  }

  qLog(Info) << "Stopped watching" << dir;

  return WatcherResult::ErrorCode::Success;

}

void ChangeWatcher::Stop() {

  fs_watcher_->Clear();
  watched_dirs_.clear();
  roots_.clear();
  channel_->Close();

  if (dropped_events_ > 0) {
    qLog(Warning) << dropped_events_.load() << "change events were dropped because the channel was full";
  }

}

bool ChangeWatcher::WatchTree(const QString &path) {

  if (!watched_dirs_.contains(path)) {
    if (!fs_watcher_->AddPath(path)) {
      return false;
    }
    watched_dirs_.insert(path);
  }

  QDir::Filters filters = QDir::Dirs | QDir::NoDotAndDotDot | QDir::NoSymLinks;
  if (include_hidden_) filters |= QDir::Hidden;

  const QFileInfoList subdirs = QDir(path).entryInfoList(filters, QDir::Name);
  for (const QFileInfo &subdir : subdirs) {
    if (IsHidden(subdir.filePath())) continue;
    if (!WatchTree(subdir.filePath())) {
      qLog(Warning) << "Could not watch subdirectory" << subdir.filePath();
    }
  }

  return true;

}

void ChangeWatcher::UnwatchTree(const QString &path) {

  const QString prefix = path + u'/';
  const QList<QString> watched_dirs = watched_dirs_.values();
  for (const QString &dir : watched_dirs) {
    if (dir == path || dir.startsWith(prefix)) {
      fs_watcher_->RemovePath(dir);
      watched_dirs_.remove(dir);
    }
  }

}

QStringList ChangeWatcher::AudioFilesInTree(const QString &path) const {

  QStringList files;

  QDir::Filters filters = QDir::Dirs | QDir::Files | QDir::NoDotAndDotDot | QDir::NoSymLinks;
  if (include_hidden_) filters |= QDir::Hidden;

  const QFileInfoList entries = QDir(path).entryInfoList(filters, QDir::Name);
  for (const QFileInfo &fileinfo : entries) {
    if (IsHidden(fileinfo.filePath())) continue;
    if (fileinfo.isDir()) {
      files << AudioFilesInTree(fileinfo.filePath());
    }
    else if (IsSupportedAudioFile(fileinfo.filePath())) {
      files << fileinfo.filePath();
    }
  }

  return files;

}

void ChangeWatcher::DirectoryAdded(const QString &path) {

  if (IsHidden(path)) return;

  if (!WatchTree(path)) {
    qLog(Warning) << "Could not watch new directory" << path;
  }

  // Files may have landed before the subscription was in place.
  const QStringList files = AudioFilesInTree(path);
  for (const QString &file : files) {
    Send(ChangeEvent::Changed(file, true));
  }

}

void ChangeWatcher::DirectoryRemoved(const QString &path) {

  if (!watched_dirs_.contains(path)) return;

  UnwatchTree(path);
  Send(ChangeEvent::Removed(path));

}

void ChangeWatcher::PathEvents(const FileSystemEventList &events) {

  // Pair rename halves that arrived together.
  QHash<quint32, qint64> moved_to;
  for (qint64 i = 0; i < events.count(); ++i) {
    const FileSystemEvent &event = events[i];
    if (event.kind == FileSystemEvent::Kind::MovedTo && event.cookie != 0 && !moved_to.contains(event.cookie)) {
      moved_to.insert(event.cookie, i);
    }
  }

  QSet<qint64> paired;

  for (qint64 i = 0; i < events.count(); ++i) {
    const FileSystemEvent &event = events[i];
    if (event.path.isEmpty()) continue;

    switch (event.kind) {
      case FileSystemEvent::Kind::Created:
        if (event.is_dir) {
          DirectoryAdded(event.path);
        }
        else if (IsSupportedAudioFile(event.path) && !IsHidden(event.path)) {
          Send(ChangeEvent::Changed(event.path, true));
        }
        break;

      case FileSystemEvent::Kind::Modified:
        if (!event.is_dir && IsSupportedAudioFile(event.path) && !IsHidden(event.path)) {
          Send(ChangeEvent::Changed(event.path, false));
        }
        break;

      case FileSystemEvent::Kind::Removed:
        if (event.is_dir) {
          DirectoryRemoved(event.path);
        }
        else if (IsSupportedAudioFile(event.path)) {
          Send(ChangeEvent::Removed(event.path));
        }
        break;

      case FileSystemEvent::Kind::MovedFrom:{
        const qint64 to_index = event.cookie != 0 ? moved_to.value(event.cookie, -1) : -1;
        if (to_index == -1) {
          if (event.is_dir) {
            DirectoryRemoved(event.path);
          }
          else if (IsSupportedAudioFile(event.path)) {
            Send(ChangeEvent::Removed(event.path));
          }
          break;
        }

        paired.insert(to_index);
        const QString &to = events[to_index].path;
        if (event.is_dir) {
          DirectoryRemoved(event.path);
          DirectoryAdded(to);
          break;
        }

        const bool from_audio = IsSupportedAudioFile(event.path);
        const bool to_audio = IsSupportedAudioFile(to) && !IsHidden(to);
        if (from_audio && to_audio) {
          Send(ChangeEvent::Renamed(event.path, to));
        }
        else if (from_audio) {
          Send(ChangeEvent::Removed(event.path));
        }
        else if (to_audio) {
          Send(ChangeEvent::Changed(to, true));
        }
        break;
      }

      case FileSystemEvent::Kind::MovedTo:
        if (paired.contains(i)) break;
        if (event.is_dir) {
          DirectoryAdded(event.path);
        }
        else if (IsSupportedAudioFile(event.path) && !IsHidden(event.path)) {
          Send(ChangeEvent::Changed(event.path, true));
        }
        break;

      case FileSystemEvent::Kind::Other:
        qLog(Debug) << "Ignoring filesystem event for" << event.path;
        break;
    }
  }

}

void ChangeWatcher::Overflow() {

  qLog(Warning) << "Filesystem events were lost, a full rescan is needed to catch up";

}

void ChangeWatcher::Send(const ChangeEvent &event) {

  switch (channel_->TrySend(event)) {
    case ChangeChannel::SendResult::Sent:
      break;
    case ChangeChannel::SendResult::Full:
      ++dropped_events_;
      qLog(Warning) << "Change channel is full, dropping event for" << event.path;
      break;
    case ChangeChannel::SendResult::Closed:
      qLog(Debug) << "Change channel is closed, dropping event for" << event.path;
      break;
  }

}
