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

#include <chrono>
#include <utility>

#include <QtGlobal>
#include <QDeadlineTimer>
#include <QString>
#include <QStringList>

#include "core/logging.h"
#include "debouncer.h"

using namespace std::chrono_literals;

const std::chrono::milliseconds Debouncer::kDefaultDelay = 500ms;

Debouncer::Debouncer(SharedPtr<ChangeChannel> input, SharedPtr<BatchChannel> output, const std::chrono::milliseconds delay, QObject *parent)
    : QObject(parent),
      input_(std::move(input)),
      output_(std::move(output)),
      delay_(delay),
      state_(State::Idle),
      dropped_batches_(0) {}

void Debouncer::Run() {

  qLog(Debug) << "Debouncing changes with a delay of" << delay_;

  bool closed = false;
  while (!closed) {
    state_ = State::Idle;

    ChangeEvent event;
    if (input_->Receive(&event) == ChangeChannel::ReceiveResult::Closed) {
      break;
    }

    state_ = State::Accumulating;
    Accept(event);

    QDeadlineTimer deadline(delay_);
    Q_FOREVER {
      state_ = State::Quiescing;
      const ChangeChannel::ReceiveResult result = input_->Receive(&event, deadline);
      if (result == ChangeChannel::ReceiveResult::Timeout) break;
      if (result == ChangeChannel::ReceiveResult::Closed) {
        closed = true;
        break;
      }
      state_ = State::Accumulating;
      if (Accept(event)) {
        deadline.setRemainingTime(delay_);
      }
    }

    Flush();
    state_ = State::Flushed;
  }

  qLog(Warning) << "Change channel closed, no more events will be debounced";

  Q_EMIT UpstreamClosed();
  output_->Close();
  Q_EMIT Finished();

}

bool Debouncer::Accept(const ChangeEvent &event) {

  switch (event.type) {
    case ChangeEvent::Type::FileChanged:
      if (pending_.contains(event.path)) return false;
      pending_.insert(event.path);
      changed_ << event.path;
      return true;

    case ChangeEvent::Type::FileRemoved:
      if (pending_.contains(event.path)) return false;
      pending_.insert(event.path);
      removed_ << event.path;
      return true;

    case ChangeEvent::Type::FileRenamed:
      if (pending_.contains(event.path) || pending_.contains(event.to)) return false;
      pending_.insert(event.path);
      pending_.insert(event.to);
      renamed_ << qMakePair(event.path, event.to);
      return true;
  }

  return false;

}

void Debouncer::Flush() {

  qLog(Debug) << "Flushing" << changed_.count() << "changed," << removed_.count() << "removed and" << renamed_.count() << "renamed paths";

  if (!changed_.isEmpty()) {
    Send(DebouncedEvent(DebouncedEvent::Type::FilesChanged, changed_));
  }
  if (!removed_.isEmpty()) {
    Send(DebouncedEvent(DebouncedEvent::Type::FilesRemoved, removed_));
  }
  if (!renamed_.isEmpty()) {
    Send(DebouncedEvent(renamed_));
  }

  pending_.clear();
  changed_.clear();
  removed_.clear();
  renamed_.clear();

}

void Debouncer::Send(const DebouncedEvent &event) {

  switch (output_->TrySend(event)) {
    case BatchChannel::SendResult::Sent:
      Q_EMIT BatchFlushed(event);
      break;
    case BatchChannel::SendResult::Full:
      ++dropped_batches_;
      qLog(Warning) << "Batch channel is full, dropping a batch of" << event.count() << "paths";
      break;
    case BatchChannel::SendResult::Closed:
      qLog(Debug) << "Batch channel is closed, dropping a batch of" << event.count() << "paths";
      break;
  }

}
