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

#include "config.h"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <unistd.h>

#include <utility>

#include <QObject>
#include <QSocketNotifier>
#include <QString>

#include "core/logging.h"
#include "unixsignalwatcher.h"

UnixSignalWatcher *UnixSignalWatcher::sInstance = nullptr;

UnixSignalWatcher::UnixSignalWatcher(QObject *parent)
    : QObject(parent),
      pipe_fd_{-1, -1},
      notifier_(nullptr) {

  if (sInstance) {
    qLog(Error) << "A signal watcher already exists, this one will not receive signals";
    return;
  }

  if (::pipe2(pipe_fd_, O_NONBLOCK | O_CLOEXEC) != 0) {
    qLog(Error) << "Could not create signal pipe:" << ::strerror(errno);
    pipe_fd_[0] = -1;
    pipe_fd_[1] = -1;
    return;
  }

  notifier_ = new QSocketNotifier(pipe_fd_[0], QSocketNotifier::Read, this);
  QObject::connect(notifier_, &QSocketNotifier::activated, this, &UnixSignalWatcher::ReadSignals);

  sInstance = this;

}

UnixSignalWatcher::~UnixSignalWatcher() {

  if (notifier_) {
    notifier_->setEnabled(false);
  }

  for (const WatchedSignal &watched_signal : std::as_const(watched_signals_)) {
    if (::sigaction(watched_signal.signal, &watched_signal.previous_action, nullptr) != 0) {
      qLog(Error) << "Could not restore handler for" << SignalName(watched_signal.signal) << ::strerror(errno);
    }
  }
  watched_signals_.clear();

  if (sInstance == this) {
    sInstance = nullptr;
  }

  for (int &fd : pipe_fd_) {
    if (fd != -1) {
      ::close(fd);
      fd = -1;
    }
  }

}

bool UnixSignalWatcher::WatchForSignal(const int signal) {

  if (!is_valid() || sInstance != this) {
    qLog(Error) << "Cannot watch" << SignalName(signal) << "without a signal pipe";
    return false;
  }

  for (const WatchedSignal &watched_signal : std::as_const(watched_signals_)) {
    if (watched_signal.signal == signal) return true;
  }

  struct sigaction action{};
  sigemptyset(&action.sa_mask);
  action.sa_handler = &UnixSignalWatcher::SignalHandler;
  action.sa_flags = SA_RESTART;

  WatchedSignal watched_signal{};
  watched_signal.signal = signal;
  if (::sigaction(signal, &action, &watched_signal.previous_action) != 0) {
    qLog(Error) << "Could not install handler for" << SignalName(signal) << ::strerror(errno);
    return false;
  }

  watched_signals_ << watched_signal;
  qLog(Debug) << "Watching for" << SignalName(signal);

  return true;

}

QString UnixSignalWatcher::SignalName(const int signal) {

  const char *description = ::strsignal(signal);
  if (!description) return QStringLiteral("signal %1").arg(signal);

  return QStringLiteral("%1 (%2)").arg(QString::fromLocal8Bit(description)).arg(signal);

}

void UnixSignalWatcher::SignalHandler(const int signal) {

  // Only async-signal-safe calls from here on.
  const int saved_errno = errno;
  UnixSignalWatcher *instance = sInstance;
  if (instance && instance->pipe_fd_[1] != -1) {
    const ssize_t written = ::write(instance->pipe_fd_[1], &signal, sizeof(signal));
    Q_UNUSED(written)
  }
  errno = saved_errno;

}

void UnixSignalWatcher::ReadSignals() {

  Q_FOREVER {
    int signal = 0;
    const ssize_t bytes_read = ::read(pipe_fd_[0], &signal, sizeof(signal));
    if (bytes_read != static_cast<ssize_t>(sizeof(signal))) {
      if (bytes_read == -1 && errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
        qLog(Error) << "Could not read from signal pipe:" << ::strerror(errno);
      }
      break;
    }
    qLog(Info) << "Received" << SignalName(signal);
    Q_EMIT UnixSignal(signal);
  }

}
