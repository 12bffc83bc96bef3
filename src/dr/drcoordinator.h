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

#ifndef DRCOORDINATOR_H
#define DRCOORDINATOR_H

#include "config.h"

#include <optional>

#include <QtGlobal>
#include <QString>

#include "includes/shared_ptr.h"

class LibraryBackend;
class DrExtractorInterface;
class DrCache;

class DrCoordinator {
 public:
  explicit DrCoordinator(SharedPtr<LibraryBackend> backend, SharedPtr<DrExtractorInterface> extractor, SharedPtr<DrCache> cache);

  // Returns the album's DR value from the cache, or from the first sidecar file that has a valid one.
  // A found value is written to the catalog, and cached once the catalog holds it. A cache hit is
  // written back when the album row has lost its value. Nothing is cached when no file has one.
  std::optional<QString> Resolve(const QString &album_path);

  // Drops the cached values for the directory and every directory below it.
  void Invalidate(const QString &path);

  SharedPtr<DrCache> cache() const { return cache_; }

 private:
  SharedPtr<LibraryBackend> backend_;
  SharedPtr<DrExtractorInterface> extractor_;
  SharedPtr<DrCache> cache_;

  Q_DISABLE_COPY(DrCoordinator)
};

#endif  // DRCOORDINATOR_H
