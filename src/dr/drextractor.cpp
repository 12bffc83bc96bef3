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

#include <QtGlobal>
#include <QByteArray>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QList>
#include <QString>
#include <QStringList>
#include <QRegularExpression>
#include <QRegularExpressionMatch>

#include "core/logging.h"
#include "drextractor.h"

using namespace Qt::Literals::StringLiterals;

const QStringList DrExtractor::kCandidateExtensions = QStringList() << u"txt"_s << u"log"_s << u"md"_s << u"csv"_s;
const int DrExtractor::kMinDrValue = 1;
const int DrExtractor::kMaxDrValue = 20;

const QList<QRegularExpression> &DrExtractor::Patterns() {

  static const QList<QRegularExpression> patterns = QList<QRegularExpression>()
    << QRegularExpression(u"Official DR value:\\s*(?:DR)?(\\d+)"_s, QRegularExpression::CaseInsensitiveOption)
    << QRegularExpression(u"Official EP/Album DR:\\s*(\\d+)"_s, QRegularExpression::CaseInsensitiveOption)
    << QRegularExpression(u"Реальные значения DR:\\s*(?:DR)?(\\d+)"_s, QRegularExpression::CaseInsensitiveOption);

  return patterns;

}

bool DrExtractor::ValidateDrValue(const QString &dr_value) {

  static const QRegularExpression regex_dr_value(u"^DR(\\d{1,2})$"_s);

  const QRegularExpressionMatch match = regex_dr_value.match(dr_value);
  if (!match.hasMatch()) return false;

  bool ok = false;
  const int value = match.captured(1).toInt(&ok);

  return ok && value >= kMinDrValue && value <= kMaxDrValue;

}

DrResult DrExtractor::ExtractFromContent(const QString &content) {

  bool found_invalid = false;
  QString invalid_value;

  const QStringList lines = content.split(u'\n');
  for (const QString &line : lines) {
    for (const QRegularExpression &pattern : Patterns()) {
      const QRegularExpressionMatch match = pattern.match(line);
      if (!match.hasMatch()) continue;
      const QString dr_value = u"DR"_s + match.captured(1);
      if (ValidateDrValue(dr_value)) {
        return DrResult::Found(dr_value);
      }
      if (!found_invalid) {
        found_invalid = true;
        invalid_value = dr_value;
      }
      break;
    }
  }

  if (found_invalid) {
    return DrResult(DrResult::ErrorCode::InvalidDrFormat, invalid_value);
  }

  return DrResult::ErrorCode::NoDrValueFound;

}

DrResult DrExtractor::ExtractFromData(const QByteArray &data) {

  if (data.contains('\0')) {
    return DrResult::ErrorCode::InvalidContent;
  }

  return ExtractFromContent(QString::fromUtf8(data));

}

DrResult DrExtractor::ExtractFromFile(const QString &filename) const {

  QFile file(filename);
  if (!file.open(QIODevice::ReadOnly)) {
    return DrResult(DrResult::ErrorCode::ReadError, file.errorString());
  }

  const QByteArray data = file.readAll();
  file.close();

  const DrResult result = ExtractFromData(data);
  if (result.success()) {
    qLog(Debug) << "Found" << result.dr_value << "in" << filename;
  }

  return result;

}

QStringList DrExtractor::FindCandidateFiles(const QString &album_path) const {

  QStringList filenames;

  const QDir dir(album_path);
  if (!dir.exists()) return filenames;

  const QFileInfoList entries = dir.entryInfoList(QDir::Files | QDir::Hidden | QDir::NoDotAndDotDot, QDir::Name);
  for (const QFileInfo &fileinfo : entries) {
    if (kCandidateExtensions.contains(fileinfo.suffix(), Qt::CaseInsensitive)) {
      filenames << fileinfo.filePath();
    }
  }

  return filenames;

}
