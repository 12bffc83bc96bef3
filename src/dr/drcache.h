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

#ifndef DRCACHE_H
#define DRCACHE_H

#include "config.h"

#include <optional>
#include <chrono>

#include <QtGlobal>
#include <QString>
#include <QReadWriteLock>
#include <QElapsedTimer>

#include "includes/scoped_ptr.h"

class DrCachePrivate;

// Memo of resolved DR values keyed by album directory. Entries expire after the TTL.
// Safe to use from several threads, expired entries are pruned on every write.
class DrCache {
 public:
  explicit DrCache(const std::chrono::milliseconds ttl = kDefaultTtl);
  ~DrCache();

  static const std::chrono::milliseconds kDefaultTtl;

  std::optional<QString> Get(const QString &album_path) const;
  void Insert(const QString &album_path, const QString &dr_value);
  void Remove(const QString &album_path);
  // Removes the entry for path and the entries of every directory below it.
  void RemoveTree(const QString &path);
  void Clear();

  // Number of entries that have not expired yet.
  int size() const;

  std::chrono::milliseconds ttl() const { return ttl_; }

 private:
  void PruneExpired();
  qint64 now() const { return timer_.elapsed(); }

  const std::chrono::milliseconds ttl_;
  QElapsedTimer timer_;
  mutable QReadWriteLock lock_;
  ScopedPtr<DrCachePrivate> p_;

  Q_DISABLE_COPY(DrCache)
};

#endif  // DRCACHE_H
