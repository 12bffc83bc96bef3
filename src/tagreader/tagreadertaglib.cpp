/*
 * Quaver Music Library
 * This file was part of Strawberry.
 * Copyright 2003-2009, John Maguire <john.maguire@gmail.com>
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

#include "tagreadertaglib.h"

#include <taglib/taglib.h>
#include <taglib/fileref.h>
#include <taglib/tfile.h>
#include <taglib/tstring.h>
#include <taglib/tstringlist.h>
#include <taglib/tpropertymap.h>
#include <taglib/audioproperties.h>
#include <taglib/tag.h>
#include <taglib/flacfile.h>
#include <taglib/flacproperties.h>
#include <taglib/vorbisfile.h>
#include <taglib/opusfile.h>
#include <taglib/wavfile.h>
#include <taglib/wavpackfile.h>
#include <taglib/wavpackproperties.h>
#include <taglib/aifffile.h>
#include <taglib/mp4file.h>
#include <taglib/mp4properties.h>
#include <taglib/mpcfile.h>
#include <taglib/mpegfile.h>
#include <taglib/apefile.h>
#include <taglib/apeproperties.h>

#include <QtGlobal>
#include <QFile>
#include <QFileInfo>
#include <QString>

#include "core/logging.h"

using namespace Qt::Literals::StringLiterals;

class FileRefFactory {
 public:
  FileRefFactory() = default;
  virtual ~FileRefFactory() = default;
  virtual TagLib::FileRef *GetFileRef(const QString &filename) = 0;

 private:
  Q_DISABLE_COPY(FileRefFactory)
};

class TagLibFileRefFactory : public FileRefFactory {
 public:
  TagLibFileRefFactory() = default;
  TagLib::FileRef *GetFileRef(const QString &filename) override {
    return new TagLib::FileRef(QFile::encodeName(filename).constData(), true, TagLib::AudioProperties::Average);
  }

 private:
  Q_DISABLE_COPY(TagLibFileRefFactory)
};

TagReaderTagLib::TagReaderTagLib() : factory_(new TagLibFileRefFactory) {}

TagReaderTagLib::~TagReaderTagLib() = default;

TagReaderResult TagReaderTagLib::IsMediaFile(const QString &filename) const {

  qLog(Debug) << "Checking for valid file" << filename;

  ScopedPtr<TagLib::FileRef> fileref(factory_->GetFileRef(filename));
  return fileref &&
         !fileref->isNull() &&
         fileref->file() &&
         !GuessFormat(&*fileref).isEmpty() ? TagReaderResult::ErrorCode::Success : TagReaderResult::ErrorCode::Unsupported;

}

QString TagReaderTagLib::GuessFormat(TagLib::FileRef *fileref) {

  if (dynamic_cast<TagLib::FLAC::File*>(fileref->file())) return u"FLAC"_s;
  if (dynamic_cast<TagLib::MPEG::File*>(fileref->file())) return u"MP3"_s;
  if (dynamic_cast<TagLib::MP4::File*>(fileref->file())) return u"AAC"_s;
  if (dynamic_cast<TagLib::Ogg::Opus::File*>(fileref->file())) return u"Opus"_s;
  if (dynamic_cast<TagLib::Ogg::Vorbis::File*>(fileref->file())) return u"Ogg Vorbis"_s;
  if (dynamic_cast<TagLib::RIFF::WAV::File*>(fileref->file())) return u"WAV"_s;
  if (dynamic_cast<TagLib::RIFF::AIFF::File*>(fileref->file())) return u"AIFF"_s;
  if (dynamic_cast<TagLib::MPC::File*>(fileref->file())) return u"MPC"_s;
  if (dynamic_cast<TagLib::WavPack::File*>(fileref->file())) return u"WavPack"_s;
  if (dynamic_cast<TagLib::APE::File*>(fileref->file())) return u"APE"_s;

  return QString();

}

TagReaderResult TagReaderTagLib::ReadFile(const QString &filename, TrackMetadata *metadata) const {

  if (filename.isEmpty()) {
    return TagReaderResult::ErrorCode::FilenameMissing;
  }

  qLog(Debug) << "Reading tags from file" << filename;

  const QFileInfo fileinfo(filename);
  if (!fileinfo.exists()) {
    qLog(Error) << "File" << filename << "does not exist";
    return TagReaderResult::ErrorCode::FileDoesNotExist;
  }

  metadata->file_size = fileinfo.size();

  ScopedPtr<TagLib::FileRef> fileref(factory_->GetFileRef(filename));
  if (!fileref || fileref->isNull()) {
    qLog(Error) << "TagLib could not open file" << filename;
    return TagReaderResult::ErrorCode::FileOpenError;
  }

  const TagReaderResult result = Read(&*fileref, metadata);
  if (result.error_code == TagReaderResult::ErrorCode::Unsupported) {
    qLog(Error) << "Unknown audio filetype reading file" << filename;
    return result;
  }

  qLog(Debug) << "Got tags for" << filename;

  return result;

}

TagReaderResult TagReaderTagLib::Read(TagLib::FileRef *fileref, TrackMetadata *metadata) const {

  metadata->format = GuessFormat(fileref);
  if (metadata->format.isEmpty()) {
    return TagReaderResult::ErrorCode::Unsupported;
  }
  metadata->codec = metadata->format;

  if (!fileref->audioProperties()) {
    return TagReaderResult(TagReaderResult::ErrorCode::FileParseError, u"No audio properties"_s);
  }

  ReadAudioProperties(fileref, metadata);

  TagLib::Tag *tag = fileref->tag();
  if (tag) {
    metadata->title = TagLibStringToQString(tag->title()).trimmed();
    metadata->artist = TagLibStringToQString(tag->artist()).trimmed();
    metadata->album = TagLibStringToQString(tag->album()).trimmed();
    metadata->genre = TagLibStringToQString(tag->genre()).trimmed();
    if (tag->year() > 0) metadata->year = static_cast<int>(tag->year());
    if (tag->track() > 0) metadata->track = static_cast<int>(tag->track());
  }

  ReadPropertyMap(fileref, metadata);

  return TagReaderResult::ErrorCode::Success;

}

void TagReaderTagLib::ReadAudioProperties(TagLib::FileRef *fileref, TrackMetadata *metadata) const {

  TagLib::AudioProperties *properties = fileref->audioProperties();
  metadata->sample_rate = properties->sampleRate();
  metadata->channels = properties->channels();
  metadata->duration_ms = properties->lengthInMilliseconds();

  if (TagLib::FLAC::File *file_flac = dynamic_cast<TagLib::FLAC::File*>(fileref->file())) {
    metadata->bits_per_sample = file_flac->audioProperties()->bitsPerSample();
  }
  else if (TagLib::RIFF::WAV::File *file_wav = dynamic_cast<TagLib::RIFF::WAV::File*>(fileref->file())) {
    metadata->bits_per_sample = file_wav->audioProperties()->bitsPerSample();
    metadata->codec = u"PCM"_s;
  }
  else if (TagLib::RIFF::AIFF::File *file_aiff = dynamic_cast<TagLib::RIFF::AIFF::File*>(fileref->file())) {
    metadata->bits_per_sample = file_aiff->audioProperties()->bitsPerSample();
    metadata->codec = u"PCM"_s;
  }
  else if (TagLib::WavPack::File *file_wavpack = dynamic_cast<TagLib::WavPack::File*>(fileref->file())) {
    metadata->bits_per_sample = file_wavpack->audioProperties()->bitsPerSample();
  }
  else if (TagLib::APE::File *file_ape = dynamic_cast<TagLib::APE::File*>(fileref->file())) {
    metadata->bits_per_sample = file_ape->audioProperties()->bitsPerSample();
  }
  else if (TagLib::MP4::File *file_mp4 = dynamic_cast<TagLib::MP4::File*>(fileref->file())) {
    metadata->bits_per_sample = file_mp4->audioProperties()->bitsPerSample();
    if (file_mp4->audioProperties()->codec() == TagLib::MP4::Properties::ALAC) {
      metadata->codec = u"ALAC"_s;
    }
  }
  else if (dynamic_cast<TagLib::MPEG::File*>(fileref->file())) {
    metadata->codec = u"MP3"_s;
  }

  metadata->is_lossless = IsLosslessFormat(metadata->codec);
  metadata->is_high_resolution = IsHighResolution(metadata->sample_rate, metadata->bits_per_sample);

}

void TagReaderTagLib::ReadPropertyMap(TagLib::FileRef *fileref, TrackMetadata *metadata) const {

  const TagLib::PropertyMap map = fileref->file()->properties();

  if (map.contains("ALBUMARTIST") && !map["ALBUMARTIST"].isEmpty()) {
    metadata->album_artist = TagLibStringToQString(map["ALBUMARTIST"].front()).trimmed();
  }
  else if (map.contains("ALBUM ARTIST") && !map["ALBUM ARTIST"].isEmpty()) {
    metadata->album_artist = TagLibStringToQString(map["ALBUM ARTIST"].front()).trimmed();
  }

  if (map.contains("DISCNUMBER") && !map["DISCNUMBER"].isEmpty()) {
    metadata->disc = ParseNumberPair(TagLibStringToQString(map["DISCNUMBER"].front()));
  }

  if (metadata->track == -1 && map.contains("TRACKNUMBER") && !map["TRACKNUMBER"].isEmpty()) {
    metadata->track = ParseNumberPair(TagLibStringToQString(map["TRACKNUMBER"].front()));
  }

  if (metadata->year == -1 && map.contains("DATE") && !map["DATE"].isEmpty()) {
    bool ok = false;
    const int year = TagLibStringToQString(map["DATE"].front()).left(4).toInt(&ok);
    if (ok && year > 0) metadata->year = year;
  }

}
