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

#ifndef DREXTRACTOR_H
#define DREXTRACTOR_H

#include "config.h"

#include <QtGlobal>
#include <QList>
#include <QString>
#include <QStringList>
#include <QRegularExpression>

#include "drresult.h"

class DrExtractorInterface {
 public:
  DrExtractorInterface() = default;
  virtual ~DrExtractorInterface() = default;

  // Sidecar files directly inside album_path that may carry a DR log, sorted by name.
  virtual QStringList FindCandidateFiles(const QString &album_path) const = 0;
  virtual DrResult ExtractFromFile(const QString &filename) const = 0;

 private:
  Q_DISABLE_COPY(DrExtractorInterface)
};

class DrExtractor : public DrExtractorInterface {
 public:
  DrExtractor() = default;

  QStringList FindCandidateFiles(const QString &album_path) const override;
  DrResult ExtractFromFile(const QString &filename) const override;

  // Scans line by line, the first line that yields a valid value wins.
  static DrResult ExtractFromContent(const QString &content);
  static DrResult ExtractFromData(const QByteArray &data);

  // True for "DR1" up to "DR20".
  static bool ValidateDrValue(const QString &dr_value);

  static const QStringList kCandidateExtensions;
  static const int kMinDrValue;
  static const int kMaxDrValue;

 private:
  static const QList<QRegularExpression> &Patterns();
};

#endif  // DREXTRACTOR_H
