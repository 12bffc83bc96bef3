/*
 * Quaver Music Library
 * This file was part of Strawberry.
 * Copyright 2010, David Sansome <me@davidsansome.com>
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

#ifndef TEST_UTILS_H
#define TEST_UTILS_H

#include <chrono>
#include <functional>
#include <iostream>

#include <QtGlobal>
#include <QByteArray>
#include <QString>
#include <QStringList>
#include <QTemporaryDir>

class QVariant;

std::ostream &operator<<(std::ostream &stream, const QString &str);
std::ostream &operator<<(std::ostream &stream, const QStringList &list);
std::ostream &operator<<(std::ostream &stream, const QVariant &var);

void PrintTo(const ::QString &str, std::ostream &os);
void PrintTo(const ::QStringList &list, std::ostream &os);
void PrintTo(const ::QVariant &var, std::ostream &os);

// Spins the event loop until condition returns true or the timeout passes.
bool WaitFor(const std::function<bool()> &condition, const std::chrono::milliseconds timeout = std::chrono::milliseconds(5000));

// Scratch directory tree, removed with the object.
class TemporaryMusicTree {
 public:
  TemporaryMusicTree();

  bool is_valid() const { return dir_.isValid(); }
  QString path() const { return dir_.path(); }
  QString FilePath(const QString &relative_path) const;

  // Creates parent directories as needed and returns the absolute path, empty on failure.
  QString MakeDirectory(const QString &relative_path) const;
  QString WriteFile(const QString &relative_path, const QByteArray &data = QByteArray()) const;
  bool Remove(const QString &relative_path) const;
  bool Rename(const QString &from, const QString &to) const;

 private:
  QTemporaryDir dir_;

  Q_DISABLE_COPY(TemporaryMusicTree)
};

#endif  // TEST_UTILS_H
