/*
 * Quaver Music Library
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

#include <cerrno>
#include <climits>
#include <cstddef>
#include <cstring>

#include <sys/inotify.h>
#include <unistd.h>

#include <boost/multi_index/hashed_index.hpp>
#include <boost/multi_index/indexed_by.hpp>
#include <boost/multi_index/member.hpp>
#include <boost/multi_index/tag.hpp>
#include <boost/multi_index_container.hpp>

#include <QtGlobal>
#include <QFile>
#include <QHash>
#include <QString>
#include <QSocketNotifier>

#include "core/logging.h"
#include "inotifylistener.h"

using boost::multi_index::hashed_unique;
using boost::multi_index::indexed_by;
using boost::multi_index::member;
using boost::multi_index::multi_index_container;
using boost::multi_index::tag;

namespace {
constexpr quint32 kWatchMask = IN_CREATE | IN_DELETE | IN_MODIFY | IN_CLOSE_WRITE | IN_MOVED_FROM | IN_MOVED_TO | IN_DELETE_SELF | IN_ONLYDIR;
constexpr std::size_t kReadBufferSize = 64 * (sizeof(struct inotify_event) + NAME_MAX + 1);
}  // namespace

// Watch descriptors and the directories they were added for, looked up both ways.
class InotifyWatches {
 public:
  struct Watch {
    int wd;
    QString path;
  };

  struct tag_by_wd {};
  struct tag_by_path {};

  struct PathHash {
    std::size_t operator()(const QString &path) const { return qHash(path); }
  };

  using WatchContainer = multi_index_container<Watch, indexed_by<hashed_unique<tag<tag_by_wd>, member<Watch, int, &Watch::wd>>, hashed_unique<tag<tag_by_path>, member<Watch, QString, &Watch::path>, PathHash>>>;

  WatchContainer watches_;
};

InotifyListener::InotifyListener(QObject *parent)
    : FileSystemWatcherInterface(parent),
      fd_(-1),
      notifier_(nullptr),
      watches_(new InotifyWatches) {}

InotifyListener::~InotifyListener() {

  if (fd_ != -1) {
    close(fd_);
  }

}

void InotifyListener::Init() {

  fd_ = inotify_init1(IN_NONBLOCK | IN_CLOEXEC);
  if (fd_ == -1) {
    qLog(Error) << "Could not initialize inotify:" << strerror(errno);
    return;
  }

  notifier_ = new QSocketNotifier(fd_, QSocketNotifier::Read, this);
  QObject::connect(notifier_, &QSocketNotifier::activated, this, &InotifyListener::ReadEvents);

}

int InotifyListener::watch_count() const {
  return static_cast<int>(watches_->watches_.size());
}

bool InotifyListener::AddPath(const QString &path) {

  if (fd_ == -1) return false;

  const int wd = inotify_add_watch(fd_, QFile::encodeName(path).constData(), kWatchMask);
  if (wd == -1) {
    qLog(Error) << "Failed to add watch for path" << path << strerror(errno);
    return false;
  }

  auto &by_path = watches_->watches_.get<InotifyWatches::tag_by_path>();
  by_path.erase(path);

  // The kernel hands out the same descriptor for a directory that is already watched under another name.
  auto &by_wd = watches_->watches_.get<InotifyWatches::tag_by_wd>();
  const auto it = by_wd.find(wd);
  if (it == by_wd.end()) {
    by_wd.insert(InotifyWatches::Watch{wd, path});
  }
  else {
    by_wd.replace(it, InotifyWatches::Watch{wd, path});
  }

  return true;

}

void InotifyListener::RemovePath(const QString &path) {

  auto &by_path = watches_->watches_.get<InotifyWatches::tag_by_path>();
  const auto it = by_path.find(path);
  if (it == by_path.end()) return;

  if (inotify_rm_watch(fd_, it->wd) == -1) {
    qLog(Debug) << "Failed to remove watch for path" << path << strerror(errno);
  }
  by_path.erase(it);

}

void InotifyListener::Clear() {

  for (const InotifyWatches::Watch &watch : watches_->watches_) {
    inotify_rm_watch(fd_, watch.wd);
  }
  watches_->watches_.clear();

}

void InotifyListener::ReadEvents() {

  FileSystemEventList events;
  bool overflow = false;

  alignas(struct inotify_event) char buffer[kReadBufferSize];
  Q_FOREVER {
    const ssize_t len = read(fd_, buffer, sizeof(buffer));
    if (len == -1) {
      if (errno == EINTR) continue;
      if (errno != EAGAIN) {
        qLog(Error) << "Could not read inotify events:" << strerror(errno);
      }
      break;
    }
    if (len == 0) break;

    const auto &by_wd = watches_->watches_.get<InotifyWatches::tag_by_wd>();
    for (char *ptr = buffer; ptr < buffer + len;) {
      const struct inotify_event *event = reinterpret_cast<const struct inotify_event*>(ptr);
      ptr += sizeof(struct inotify_event) + event->len;

      if (event->mask & IN_Q_OVERFLOW) {
        overflow = true;
        continue;
      }

      const auto it = by_wd.find(event->wd);
      if (it == by_wd.end()) continue;

      if (event->mask & IN_IGNORED) {
        watches_->watches_.get<InotifyWatches::tag_by_wd>().erase(event->wd);
        continue;
      }

      const QString directory = it->path;
      const bool is_dir = (event->mask & IN_ISDIR) != 0;
      const QString path = event->len > 0 ? directory + QLatin1Char('/') + QFile::decodeName(event->name) : directory;

      if (event->mask & IN_CREATE) {
        events << FileSystemEvent(FileSystemEvent::Kind::Created, path, is_dir);
      }
      else if (event->mask & (IN_MODIFY | IN_CLOSE_WRITE)) {
        events << FileSystemEvent(FileSystemEvent::Kind::Modified, path, is_dir);
      }
      else if (event->mask & IN_DELETE) {
        events << FileSystemEvent(FileSystemEvent::Kind::Removed, path, is_dir);
      }
      else if (event->mask & IN_DELETE_SELF) {
        events << FileSystemEvent(FileSystemEvent::Kind::Removed, directory, true);
      }
      else if (event->mask & IN_MOVED_FROM) {
        events << FileSystemEvent(FileSystemEvent::Kind::MovedFrom, path, is_dir, event->cookie);
      }
      else if (event->mask & IN_MOVED_TO) {
        events << FileSystemEvent(FileSystemEvent::Kind::MovedTo, path, is_dir, event->cookie);
      }
      else {
        events << FileSystemEvent(FileSystemEvent::Kind::Other, path, is_dir);
      }
    }
  }

  if (overflow) {
    qLog(Warning) << "inotify queue overflowed, events were lost";
    Q_EMIT Overflow();
  }

  if (!events.isEmpty()) {
    Q_EMIT PathEvents(events);
  }

}
