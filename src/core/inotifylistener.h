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

#ifndef INOTIFYLISTENER_H
#define INOTIFYLISTENER_H

#include "config.h"

#include <QtGlobal>
#include <QObject>
#include <QString>

#include "includes/scoped_ptr.h"
#include "filesystemwatcherinterface.h"

class QSocketNotifier;
class InotifyWatches;

class InotifyListener : public FileSystemWatcherInterface {
  Q_OBJECT

 public:
  explicit InotifyListener(QObject *parent = nullptr);
  ~InotifyListener() override;

  void Init() override;
  bool AddPath(const QString &path) override;
  void RemovePath(const QString &path) override;
  void Clear() override;

  bool is_valid() const { return fd_ != -1; }
  int watch_count() const;

 private Q_SLOTS:
  void ReadEvents();

 private:
  int fd_;
  QSocketNotifier *notifier_;
  ScopedPtr<InotifyWatches> watches_;

  Q_DISABLE_COPY(InotifyListener)
};

#endif  // INOTIFYLISTENER_H
