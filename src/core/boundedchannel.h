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

#ifndef BOUNDEDCHANNEL_H
#define BOUNDEDCHANNEL_H

#include "config.h"

#include <QtGlobal>
#include <QMutex>
#include <QMutexLocker>
#include <QWaitCondition>
#include <QDeadlineTimer>
#include <QQueue>

// Fixed capacity queue handing values from one thread to another.
// Senders never block, a full queue rejects the value. Receivers block until a value,
// the deadline or closure. Values queued before Close() are still delivered.
template<typename T>
class BoundedChannel {
 public:
  enum class SendResult {
    Sent,
    Full,
    Closed
  };

  enum class ReceiveResult {
    Received,
    Timeout,
    Closed
  };

  explicit BoundedChannel(const int capacity) : capacity_(qMax(1, capacity)), closed_(false) {}

  SendResult TrySend(const T &value) {
    {
      QMutexLocker l(&mutex_);
      if (closed_) return SendResult::Closed;
      if (queue_.count() >= capacity_) return SendResult::Full;
      queue_.enqueue(value);
    }
    wait_cond_.wakeOne();
    return SendResult::Sent;
  }

  ReceiveResult Receive(T *value, QDeadlineTimer deadline = QDeadlineTimer(QDeadlineTimer::Forever)) {
    QMutexLocker l(&mutex_);
    while (queue_.isEmpty()) {
      if (closed_) return ReceiveResult::Closed;
      if (!wait_cond_.wait(&mutex_, deadline)) {
        if (!queue_.isEmpty()) break;
        return closed_ ? ReceiveResult::Closed : ReceiveResult::Timeout;
      }
    }
    *value = queue_.dequeue();
    return ReceiveResult::Received;
  }

  void Close() {
    {
      QMutexLocker l(&mutex_);
      closed_ = true;
    }
    wait_cond_.wakeAll();
  }

  bool is_closed() const {
    QMutexLocker l(&mutex_);
    return closed_;
  }

  int size() const {
    QMutexLocker l(&mutex_);
    return static_cast<int>(queue_.count());
  }

  int capacity() const { return capacity_; }

 private:
  const int capacity_;
  mutable QMutex mutex_;
  QWaitCondition wait_cond_;
  QQueue<T> queue_;
  bool closed_;

  Q_DISABLE_COPY(BoundedChannel)
};

#endif  // BOUNDEDCHANNEL_H
