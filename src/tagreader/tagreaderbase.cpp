/*
 * Quaver Music Library
 * This file was part of Strawberry.
 * Copyright 2018-2025, Jonas Kvinge <jonas@jkvinge.net>
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

#include <QString>
#include <QStringList>

#include "tagreaderbase.h"

using namespace Qt::Literals::StringLiterals;

namespace {
constexpr int kCdSampleRateLimit = 48000;
constexpr int kCdBitDepth = 16;
}  // namespace

TagReaderBase::TagReaderBase() = default;
TagReaderBase::~TagReaderBase() = default;

bool TagReaderBase::IsLosslessFormat(const QString &format) {

  static const QStringList lossless_formats = QStringList() << u"FLAC"_s << u"WAV"_s << u"PCM"_s << u"AIFF"_s << u"ALAC"_s << u"WavPack"_s << u"APE"_s;
  return lossless_formats.contains(format, Qt::CaseInsensitive);

}

bool TagReaderBase::IsHighResolution(const int sample_rate, const int bits_per_sample) {

  return sample_rate > kCdSampleRateLimit || bits_per_sample > kCdBitDepth;

}

// Reads the leading number of values like "3/12", returns -1 when there is none.
int TagReaderBase::ParseNumberPair(const QString &value) {

  const QString number = value.section(u'/', 0, 0).trimmed();
  if (number.isEmpty()) return -1;

  bool ok = false;
  const int result = number.toInt(&ok);
  return ok && result > 0 ? result : -1;

}
