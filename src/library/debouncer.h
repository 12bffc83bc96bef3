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

#ifndef DEBOUNCER_H
#define DEBOUNCER_H

#include "config.h"

#include <atomic>
#include <chrono>

#include <QtGlobal>
#include <QObject>
#include <QSet>
#include <QString>
#include <QStringList>

#include "includes/shared_ptr.h"
#include "core/boundedchannel.h"
#include "changeevent.h"
#include "changewatcher.h"

using BatchChannel = BoundedChannel<DebouncedEvent>;

// Collects ChangeEvents until no new path arrived for the settle delay, then hands the
// window downstream as up to three batches: changed, removed, renamed.
// The first event for a path in a window wins, later ones for the same path are dropped.
class Debouncer : public QObject {
  Q_OBJECT

 public:
  enum class State {
    Idle,
    Accumulating,
    Quiescing,
    Flushed
  };

  explicit Debouncer(SharedPtr<ChangeChannel> input, SharedPtr<BatchChannel> output, const std::chrono::milliseconds delay = kDefaultDelay, QObject *parent = nullptr);

  static const std::chrono::milliseconds kDefaultDelay;

  State state() const { return state_; }
  std::chrono::milliseconds delay() const { return delay_; }
  quint64 dropped_batches() const { return dropped_batches_; }

 public Q_SLOTS:
  // Blocks until the input channel is closed.
  void Run();

 Q_SIGNALS:
  void BatchFlushed(const DebouncedEvent &event);
  void UpstreamClosed();
  void Finished();

 private:
  bool Accept(const ChangeEvent &event);
  void Flush();
  void Send(const DebouncedEvent &event);

 private:
  SharedPtr<ChangeChannel> input_;
  SharedPtr<BatchChannel> output_;
  const std::chrono::milliseconds delay_;
  std::atomic<State> state_;
  std::atomic<quint64> dropped_batches_;

  QSet<QString> pending_;
  QStringList changed_;
  QStringList removed_;
  RenamedPathList renamed_;

  Q_DISABLE_COPY(Debouncer)
};

#endif  // DEBOUNCER_H
