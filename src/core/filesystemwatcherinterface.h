/*
 * Quaver Music Library
 * This file was part of Strawberry.
 * Copyright 2012, David Sansome <me@davidsansome.com>
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

#ifndef FILESYSTEMWATCHERINTERFACE_H
#define FILESYSTEMWATCHERINTERFACE_H

#include "config.h"

#include <QtGlobal>
#include <QObject>
#include <QMetaType>
#include <QList>
#include <QString>

// One change below a watched directory, as reported by the backend.
struct FileSystemEvent {
  enum class Kind {
    Created,
    Modified,
    Removed,
    MovedFrom,
    MovedTo,
    Other
  };

  FileSystemEvent() : kind(Kind::Other), is_dir(false), cookie(0) {}
  FileSystemEvent(const Kind _kind, const QString &_path, const bool _is_dir = false, const quint32 _cookie = 0) : kind(_kind), path(_path), is_dir(_is_dir), cookie(_cookie) {}

  Kind kind;
  QString path;
  bool is_dir;
  // Shared by the two halves of a rename, 0 when the backend cannot pair them.
  quint32 cookie;
};
using FileSystemEventList = QList<FileSystemEvent>;

Q_DECLARE_METATYPE(FileSystemEvent)
Q_DECLARE_METATYPE(FileSystemEventList)

class FileSystemWatcherInterface : public QObject {
  Q_OBJECT

 public:
  explicit FileSystemWatcherInterface(QObject *parent = nullptr);

  virtual void Init() {}
  // Watches the directory itself, not its subdirectories.
  virtual bool AddPath(const QString &path) = 0;
  virtual void RemovePath(const QString &path) = 0;
  virtual void Clear() = 0;

  static FileSystemWatcherInterface *Create(QObject *parent = nullptr);

 Q_SIGNALS:
  // Events that arrived together, rename halves are only paired within one list.
  void PathEvents(const FileSystemEventList &events);
  // The backend lost events.
  void Overflow();
};

#endif  // FILESYSTEMWATCHERINTERFACE_H
