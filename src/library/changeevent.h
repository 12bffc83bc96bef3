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

#ifndef CHANGEEVENT_H
#define CHANGEEVENT_H

#include "config.h"

#include <QMetaType>
#include <QList>
#include <QPair>
#include <QString>
#include <QStringList>

using RenamedPath = QPair<QString, QString>;
using RenamedPathList = QList<RenamedPath>;

// Classified filesystem change, produced by ChangeWatcher.
struct ChangeEvent {
  enum class Type {
    FileChanged,
    FileRemoved,
    FileRenamed
  };

  ChangeEvent() : type(Type::FileChanged), is_new(false) {}

  static ChangeEvent Changed(const QString &path, const bool is_new) {
    ChangeEvent event;
    event.type = Type::FileChanged;
    event.path = path;
    event.is_new = is_new;
    return event;
  }

  static ChangeEvent Removed(const QString &path) {
    ChangeEvent event;
    event.type = Type::FileRemoved;
    event.path = path;
    return event;
  }

  static ChangeEvent Renamed(const QString &from, const QString &to) {
    ChangeEvent event;
    event.type = Type::FileRenamed;
    event.path = from;
    event.to = to;
    return event;
  }

  Type type;
  // For renames this is the old path.
  QString path;
  QString to;
  bool is_new;
};

// Settled batch flushed by the Debouncer.
struct DebouncedEvent {
  enum class Type {
    FilesChanged,
    FilesRemoved,
    FilesRenamed
  };

  DebouncedEvent() : type(Type::FilesChanged) {}
  DebouncedEvent(const Type _type, const QStringList &_paths) : type(_type), paths(_paths) {}
  explicit DebouncedEvent(const RenamedPathList &_renamed) : type(Type::FilesRenamed), renamed(_renamed) {}

  int count() const { return type == Type::FilesRenamed ? static_cast<int>(renamed.count()) : static_cast<int>(paths.count()); }

  Type type;
  QStringList paths;
  RenamedPathList renamed;
};

Q_DECLARE_METATYPE(ChangeEvent)
Q_DECLARE_METATYPE(DebouncedEvent)

#endif  // CHANGEEVENT_H
