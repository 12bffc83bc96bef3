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

#ifndef MOCK_TAGREADER_H
#define MOCK_TAGREADER_H

#include "gmock_include.h"

#include <QHash>
#include <QString>
#include <QStringList>

#include "tagreader/tagreaderbase.h"
#include "tagreader/tagreaderresult.h"
#include "tagreader/trackmetadata.h"

// clazy:excludeall=function-args-by-value

class MockTagReader : public TagReaderBase {
 public:
  MOCK_CONST_METHOD1(IsMediaFile, TagReaderResult(const QString &filename));
  MOCK_CONST_METHOD2(ReadFile, TagReaderResult(const QString &filename, TrackMetadata *metadata));
};

// Answers every read with the same stream properties and no tags, like an untagged FLAC rip.
class FakeTagReader : public TagReaderBase {
 public:
  FakeTagReader() = default;

  TagReaderResult IsMediaFile(const QString &filename) const override {
    Q_UNUSED(filename)
    return TagReaderResult::ErrorCode::Success;
  }

  TagReaderResult ReadFile(const QString &filename, TrackMetadata *metadata) const override {
    if (filename.isEmpty()) return TagReaderResult::ErrorCode::FilenameMissing;
    if (unreadable_.contains(filename)) return TagReaderResult(TagReaderResult::ErrorCode::FileParseError, QStringLiteral("corrupt"));
    *metadata = TrackMetadata();
    if (tags_.contains(filename)) *metadata = tags_.value(filename);
    metadata->format = QStringLiteral("FLAC");
    metadata->codec = QStringLiteral("FLAC");
    metadata->duration_ms = 180000;
    metadata->file_size = 1024;
    metadata->sample_rate = 44100;
    metadata->bits_per_sample = 16;
    metadata->channels = 2;
    metadata->is_lossless = true;
    metadata->is_high_resolution = false;
    return TagReaderResult::ErrorCode::Success;
  }

  void SetTags(const QString &filename, const TrackMetadata &metadata) { tags_.insert(filename, metadata); }
  void SetUnreadable(const QString &filename) { unreadable_ << filename; }

 private:
  QHash<QString, TrackMetadata> tags_;
  QStringList unreadable_;
};

#endif  // MOCK_TAGREADER_H
