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

#include <optional>
#include <utility>

#include <QtGlobal>
#include <QString>
#include <QStringList>

#include "core/logging.h"
#include "library/librarybackend.h"
#include "drcoordinator.h"
#include "drextractor.h"
#include "drcache.h"
#include "drresult.h"

DrCoordinator::DrCoordinator(SharedPtr<LibraryBackend> backend, SharedPtr<DrExtractorInterface> extractor, SharedPtr<DrCache> cache)
    : backend_(std::move(backend)),
      extractor_(std::move(extractor)),
      cache_(std::move(cache)) {}

std::optional<QString> DrCoordinator::Resolve(const QString &album_path) {

  const std::optional<QString> cached_value = cache_->Get(album_path);
  if (cached_value) {
    // A recreated album row starts without a DR value.
    if (backend_->GetDrValue(album_path).isEmpty() && !backend_->UpdateDrValue(album_path, *cached_value)) {
      qLog(Warning) << "Could not restore" << *cached_value << "for" << album_path;
    }
    return cached_value;
  }

  const QStringList filenames = extractor_->FindCandidateFiles(album_path);
  for (const QString &filename : filenames) {
    const DrResult result = extractor_->ExtractFromFile(filename);
    if (!result.success()) {
      if (result.error_code == DrResult::ErrorCode::ReadError) {
        qLog(Warning) << "Could not read" << filename << result.error_string();
      }
      else {
        qLog(Debug) << filename << result.error_string();
      }
      continue;
    }

    // Only values the catalog holds are memoized.
    if (backend_->UpdateDrValue(album_path, result.dr_value)) {
      cache_->Insert(album_path, result.dr_value);
    }
    else {
      qLog(Warning) << "No album at" << album_path << "to store" << result.dr_value;
    }
    return result.dr_value;
  }

  qLog(Debug) << "No DR value for" << album_path;

  return std::nullopt;

}

void DrCoordinator::Invalidate(const QString &path) {

  cache_->RemoveTree(path);

}
