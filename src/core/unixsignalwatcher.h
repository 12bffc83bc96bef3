/*
 * Quaver Music Library
 * This file was part of Strawberry.
 * Copyright 2026, Jonas Kvinge <jonas@jkvinge.net>
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

#ifndef UNIXSIGNALWATCHER_H
#define UNIXSIGNALWATCHER_H

#include "config.h"

#include <csignal>

#include <QObject>
#include <QList>
#include <QString>

class QSocketNotifier;

// Turns POSIX signals into Qt signals delivered on the thread that owns the watcher.
// The handler only writes the signal number to a non-blocking pipe; the read end is
// drained from the event loop. Only one instance may exist at a time.
class UnixSignalWatcher : public QObject {
  Q_OBJECT

 public:
  explicit UnixSignalWatcher(QObject *parent = nullptr);
  ~UnixSignalWatcher() override;

  bool is_valid() const { return pipe_fd_[0] != -1; }

  // Returns false if the pipe is unusable or sigaction() failed.
  bool WatchForSignal(const int signal);

  static QString SignalName(const int signal);

 Q_SIGNALS:
  void UnixSignal(const int signal);

 private Q_SLOTS:
  void ReadSignals();

 private:
  static void SignalHandler(const int signal);

  static UnixSignalWatcher *sInstance;

  int pipe_fd_[2];
  QSocketNotifier *notifier_;

  struct WatchedSignal {
    int signal;
    struct sigaction previous_action;
  };
  QList<WatchedSignal> watched_signals_;

  Q_DISABLE_COPY(UnixSignalWatcher)
};

#endif  // UNIXSIGNALWATCHER_H
