/*
 * CrossPlay
 * This file was part of Strawberry.
 * Copyright 2024, Jonas Kvinge <jonas@jkvinge.net>
 *
 * CrossPlay is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * CrossPlay is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with CrossPlay.  If not, see <http://www.gnu.org/licenses/>.
 *
 */

#ifndef TAGREADERTAGLIB_H
#define TAGREADERTAGLIB_H

#include <QString>

#include <taglib/tstring.h>
#include <taglib/mpegfile.h>
#include <taglib/id3v2tag.h>

#include "core/song.h"
#include "core/provenance.h"

#include "tagreaderbase.h"

#undef TStringToQString
#undef QStringToTString

// Tag reader for MPEG audio files with ID3v2 tags.
// Files are opened by content, so hidden files with their extra suffix are handled the same way.
class TagReaderTagLib : public TagReaderBase {
 public:
  explicit TagReaderTagLib();
  ~TagReaderTagLib() override;

  // Description of the comment frame holding the provenance map.
  static constexpr char kProvenanceDescription[] = "CrossPlay";

  static inline TagLib::String QStringToTagLibString(const QString &s) {
    return TagLib::String(s.toUtf8().constData(), TagLib::String::UTF8);
  }

  static inline QString TagLibStringToQString(const TagLib::String &s) {
    return QString::fromUtf8((s).toCString(true));
  }

  TagReaderResult ReadFile(const QString &filename, Song *song) const override;
  TagReaderResult WriteFile(const QString &filename, const Song &song) const override;
  TagReaderResult CopyTags(const QString &source_filename, const QString &destination_filename, const ProvenanceMap &provenance_update) const override;

 private:
  TagReaderResult Read(TagLib::MPEG::File *file, Song *song) const;
  TagReaderResult Save(TagLib::MPEG::File *file, const QString &filename) const;

  ProvenanceMap ReadProvenance(TagLib::ID3v2::Tag *tag, QString *foreign_text = nullptr) const;
  void ReadLegacyProvenance(TagLib::ID3v2::Tag *tag, ProvenanceMap *provenance) const;
  void RemoveLegacyFrames(TagLib::ID3v2::Tag *tag) const;

  void SetID3v2Tag(TagLib::ID3v2::Tag *tag, const Song &song, const ProvenanceMap &provenance) const;
  QString CommentsFrameText(const QString &description, TagLib::ID3v2::Tag *tag) const;
  void SetCommentsFrame(const QString &description, const QString &value, TagLib::ID3v2::Tag *tag) const;

  Q_DISABLE_COPY(TagReaderTagLib)
};

#endif  // TAGREADERTAGLIB_H
