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

#include "tagreadertaglib.h"

#include <taglib/taglib.h>
#include <taglib/tbytevector.h>
#include <taglib/tfile.h>
#include <taglib/tstring.h>
#include <taglib/tag.h>
#include <taglib/audioproperties.h>
#include <taglib/mpegfile.h>
#include <taglib/mpegproperties.h>
#include <taglib/id3v2tag.h>
#include <taglib/id3v2header.h>
#include <taglib/id3v2frame.h>
#include <taglib/id3v2framefactory.h>
#include <taglib/commentsframe.h>

#include <QtGlobal>
#include <QObject>
#include <QByteArray>
#include <QFile>
#include <QFileInfo>
#include <QString>
#include <QDateTime>

#include "core/logging.h"
#include "core/song.h"
#include "core/provenance.h"
#include "core/temporaryfile.h"
#include "constants/timeconstants.h"
#include "utilities/fileutils.h"

using namespace Qt::Literals::StringLiterals;

namespace {

constexpr char kID3v2_Length[] = "TLEN";
constexpr char kID3v2_Picture[] = "APIC";

constexpr char kLegacySourceId[] = "[CrossPlay] YouTube ID";
constexpr char kLegacyDownloadTime[] = "[CrossPlay] Download time";
constexpr char kLegacyCropped[] = "[CrossPlay] Cropped";
constexpr char kLegacyMetadataEdited[] = "[CrossPlay] Metadata edited";

constexpr char kLegacySourceUrlPrefix[] = "https://www.youtube.com/watch?v=";

}  // namespace

TagReaderTagLib::TagReaderTagLib() = default;

TagReaderTagLib::~TagReaderTagLib() = default;

TagReaderResult TagReaderTagLib::ReadFile(const QString &filename, Song *song) const {

  if (filename.isEmpty()) {
    return TagReaderResult::ErrorCode::FilenameMissing;
  }

  qLog(Debug) << "Reading tags from file" << filename;

  const QFileInfo fileinfo(filename);
  if (!fileinfo.exists()) {
    qLog(Error) << "File" << filename << "does not exist";
    return TagReaderResult::ErrorCode::FileDoesNotExist;
  }

  song->InitFromFilePartial(filename, fileinfo);

  const QByteArray encoded_filename = QFile::encodeName(filename);
  TagLib::MPEG::File file(encoded_filename.constData(), true, TagLib::AudioProperties::Accurate);
  if (!file.isOpen()) {
    qLog(Error) << "TagLib could not open file" << filename;
    return TagReaderResult::ErrorCode::FileOpenError;
  }

  const TagReaderResult result = Read(&file, song);
  if (result.corrupt_tag()) {
    qLog(Warning) << "Could not parse" << filename << result.error_text;
    return result;
  }

  qLog(Debug) << "Got tags for" << filename;

  return result;

}

TagReaderResult TagReaderTagLib::Read(TagLib::MPEG::File *file, Song *song) const {

  if (!file->isValid() || file->firstFrameOffset() < 0) {
    song->set_tag_error(true);
    return TagReaderResult(TagReaderResult::ErrorCode::FileParseError, QObject::tr("No MPEG audio frames found"));
  }

  if (file->audioProperties()) {
    song->set_length_nanosec(file->audioProperties()->lengthInMilliseconds() * kNsecPerMsec);
  }

  TagLib::Tag *tag = file->tag();
  if (tag) {
    song->set_title(TagLibStringToQString(tag->title()).trimmed());
    song->set_artist(TagLibStringToQString(tag->artist()).trimmed());
    song->set_album(TagLibStringToQString(tag->album()).trimmed());
    song->set_genre(TagLibStringToQString(tag->genre()).trimmed());
    song->set_year(tag->year() == 0 ? -1 : static_cast<int>(tag->year()));
    song->set_track(tag->track() == 0 ? -1 : static_cast<int>(tag->track()));
  }

  if (file->hasID3v2Tag()) {
    // The generic comment accessor would pick up our provenance frame, only the frame without description is the user comment.
    song->set_comment(CommentsFrameText(QString(), file->ID3v2Tag()));
    song->set_has_cover(!file->ID3v2Tag()->frameList(TagLib::ByteVector(kID3v2_Picture)).isEmpty());
    QString foreign_text;
    song->set_provenance(ReadProvenance(file->ID3v2Tag(), &foreign_text));
    // Text in our frame that is not ours is kept as the comment, so it survives the next write.
    if (!foreign_text.isEmpty() && song->comment().isEmpty()) {
      song->set_comment(foreign_text);
    }
  }
  else if (tag) {
    song->set_comment(TagLibStringToQString(tag->comment()));
  }

  return TagReaderResult::ErrorCode::Success;

}

ProvenanceMap TagReaderTagLib::ReadProvenance(TagLib::ID3v2::Tag *tag, QString *foreign_text) const {

  ProvenanceMap provenance;

  const QString text = CommentsFrameText(QLatin1String(kProvenanceDescription), tag);
  if (!text.isEmpty() && !Provenance::Parse(text, &provenance)) {
    qLog(Warning) << "Ignoring provenance comment in unknown format:" << text;
    if (foreign_text) *foreign_text = text;
  }

  ReadLegacyProvenance(tag, &provenance);

  return provenance;

}

void TagReaderTagLib::ReadLegacyProvenance(TagLib::ID3v2::Tag *tag, ProvenanceMap *provenance) const {

  const QString source_id_key = QLatin1String(Provenance::kSourceId);
  const QString source_url_key = QLatin1String(Provenance::kSourceUrl);
  const QString downloaded_at_key = QLatin1String(Provenance::kDownloadedAt);
  const QString trimmed_key = QLatin1String(Provenance::kTrimmed);
  const QString metadata_edited_key = QLatin1String(Provenance::kMetadataEdited);

  const QString source_id = CommentsFrameText(QLatin1String(kLegacySourceId), tag);
  if (!source_id.isEmpty()) {
    if (!provenance->contains(source_id_key)) provenance->insert(source_id_key, source_id);
    if (!provenance->contains(source_url_key)) provenance->insert(source_url_key, QLatin1String(kLegacySourceUrlPrefix) + source_id);
  }

  // Older files store the download time as seconds since epoch.
  const QString download_time = CommentsFrameText(QLatin1String(kLegacyDownloadTime), tag);
  if (!download_time.isEmpty() && !provenance->contains(downloaded_at_key)) {
    bool ok = false;
    const qint64 seconds = download_time.toLongLong(&ok);
    if (ok && seconds > 0) {
      provenance->insert(downloaded_at_key, QDateTime::fromSecsSinceEpoch(seconds).toUTC().toString(Qt::ISODate));
    }
  }

  // Flags were stored by the presence of the frame alone.
  if (TagLib::ID3v2::CommentsFrame::findByDescription(tag, QStringToTagLibString(QLatin1String(kLegacyCropped))) && !provenance->contains(trimmed_key)) {
    provenance->insert(trimmed_key, u"1"_s);
  }
  if (TagLib::ID3v2::CommentsFrame::findByDescription(tag, QStringToTagLibString(QLatin1String(kLegacyMetadataEdited))) && !provenance->contains(metadata_edited_key)) {
    provenance->insert(metadata_edited_key, u"1"_s);
  }

}

void TagReaderTagLib::RemoveLegacyFrames(TagLib::ID3v2::Tag *tag) const {

  const char *descriptions[] = { kLegacySourceId, kLegacyDownloadTime, kLegacyCropped, kLegacyMetadataEdited };
  for (const char *description : descriptions) {
    SetCommentsFrame(QLatin1String(description), QString(), tag);
  }

}

TagReaderResult TagReaderTagLib::WriteFile(const QString &filename, const Song &song) const {

  if (filename.isEmpty()) {
    return TagReaderResult::ErrorCode::FilenameMissing;
  }

  const QFileInfo fileinfo(filename);
  if (!fileinfo.exists()) {
    qLog(Error) << "File" << filename << "does not exist";
    return TagReaderResult::ErrorCode::FileDoesNotExist;
  }

  qLog(Debug) << "Saving tags to" << filename;

  // Tags are saved to a copy next to the file, which then replaces the file.
  TemporaryFile temporary_file(fileinfo.absolutePath());
  if (!temporary_file.is_valid()) {
    return TagReaderResult(TagReaderResult::ErrorCode::FileSaveError, QObject::tr("Could not create a temporary file in %1").arg(fileinfo.absolutePath()));
  }

  QString error;
  if (!Utilities::CopyFile(filename, temporary_file.filename(), &error)) {
    qLog(Error) << "Could not copy" << filename << "to" << temporary_file.filename() << error;
    return TagReaderResult(TagReaderResult::ErrorCode::FileSaveError, error);
  }
  QFile::setPermissions(temporary_file.filename(), QFile::permissions(filename));

  {
    const QByteArray encoded_filename = QFile::encodeName(temporary_file.filename());
    TagLib::MPEG::File file(encoded_filename.constData(), false);
    if (!file.isOpen()) {
      qLog(Error) << "TagLib could not open file" << temporary_file.filename();
      return TagReaderResult::ErrorCode::FileOpenError;
    }
    if (!file.isValid()) {
      return TagReaderResult::ErrorCode::FileParseError;
    }

    TagLib::ID3v2::Tag *tag = file.ID3v2Tag(true);
    const ProvenanceMap provenance = Provenance::Merge(ReadProvenance(tag), song.provenance());
    SetID3v2Tag(tag, song, provenance);

    const TagReaderResult result = Save(&file, filename);
    if (!result.success()) return result;
  }

  if (!Utilities::SyncFile(temporary_file.filename(), &error) || !Utilities::ReplaceFile(temporary_file.filename(), filename, &error)) {
    return TagReaderResult(TagReaderResult::ErrorCode::FileSaveError, error);
  }
  temporary_file.Release();

  return TagReaderResult::ErrorCode::Success;

}

TagReaderResult TagReaderTagLib::CopyTags(const QString &source_filename, const QString &destination_filename, const ProvenanceMap &provenance_update) const {

  if (source_filename.isEmpty() || destination_filename.isEmpty()) {
    return TagReaderResult::ErrorCode::FilenameMissing;
  }

  if (!QFile::exists(source_filename) || !QFile::exists(destination_filename)) {
    qLog(Error) << "File" << source_filename << "or" << destination_filename << "does not exist";
    return TagReaderResult::ErrorCode::FileDoesNotExist;
  }

  qLog(Debug) << "Copying tags from" << source_filename << "to" << destination_filename;

  const QByteArray encoded_source_filename = QFile::encodeName(source_filename);
  TagLib::MPEG::File source_file(encoded_source_filename.constData(), false);
  if (!source_file.isOpen()) {
    qLog(Error) << "TagLib could not open file" << source_filename;
    return TagReaderResult::ErrorCode::FileOpenError;
  }

  const QByteArray encoded_destination_filename = QFile::encodeName(destination_filename);
  TagLib::MPEG::File destination_file(encoded_destination_filename.constData(), false);
  if (!destination_file.isOpen()) {
    qLog(Error) << "TagLib could not open file" << destination_filename;
    return TagReaderResult::ErrorCode::FileOpenError;
  }
  if (!destination_file.isValid() || destination_file.firstFrameOffset() < 0) {
    return TagReaderResult(TagReaderResult::ErrorCode::FileParseError, QObject::tr("No MPEG audio frames found"));
  }

  TagLib::ID3v2::Tag *destination_tag = destination_file.ID3v2Tag(true);

  // Drop whatever the transcoder wrote.
  const TagLib::ID3v2::FrameList old_frames = destination_tag->frameList();
  for (TagLib::ID3v2::Frame *frame : old_frames) {
    destination_tag->removeFrame(frame, true);
  }

  if (source_file.hasID3v2Tag()) {
    TagLib::ID3v2::Tag *source_tag = source_file.ID3v2Tag();
    const TagLib::ID3v2::FrameList &frames = source_tag->frameList();
    for (TagLib::ID3v2::Frame *frame : frames) {
      // The length frame describes the old audio.
      if (frame->frameID() == TagLib::ByteVector(kID3v2_Length)) continue;
      TagLib::ID3v2::Frame *frame_copy = TagLib::ID3v2::FrameFactory::instance()->createFrame(frame->render(), source_tag->header());
      if (!frame_copy) {
        qLog(Warning) << "Could not copy frame" << QByteArray(frame->frameID().data(), static_cast<qsizetype>(frame->frameID().size())) << "from" << source_filename;
        continue;
      }
      // Add frame takes ownership and clears the memory
      destination_tag->addFrame(frame_copy);
    }
  }
  else if (source_file.tag()) {
    TagLib::Tag::duplicate(source_file.tag(), destination_tag, true);
  }

  QString foreign_text;
  const ProvenanceMap provenance = Provenance::Merge(ReadProvenance(destination_tag, &foreign_text), provenance_update);
  if (!foreign_text.isEmpty() && CommentsFrameText(QString(), destination_tag).isEmpty()) {
    SetCommentsFrame(QString(), foreign_text, destination_tag);
  }
  SetCommentsFrame(QLatin1String(kProvenanceDescription), Provenance::Serialize(provenance), destination_tag);
  RemoveLegacyFrames(destination_tag);

  return Save(&destination_file, destination_filename);

}

TagReaderResult TagReaderTagLib::Save(TagLib::MPEG::File *file, const QString &filename) const {

  if (!file->save(TagLib::MPEG::File::ID3v2, TagLib::File::StripOthers, TagLib::ID3v2::v4, TagLib::File::DoNotDuplicate)) {
    qLog(Error) << "TagLib could not save tags to" << filename;
    return TagReaderResult(TagReaderResult::ErrorCode::FileSaveError, QObject::tr("Could not write tags to %1").arg(filename));
  }

  return TagReaderResult::ErrorCode::Success;

}

void TagReaderTagLib::SetID3v2Tag(TagLib::ID3v2::Tag *tag, const Song &song, const ProvenanceMap &provenance) const {

  tag->setTitle(song.title().isEmpty() ? TagLib::String() : QStringToTagLibString(song.title()));
  tag->setArtist(song.artist().isEmpty() ? TagLib::String() : QStringToTagLibString(song.artist()));
  tag->setAlbum(song.album().isEmpty() ? TagLib::String() : QStringToTagLibString(song.album()));
  tag->setGenre(song.genre().isEmpty() ? TagLib::String() : QStringToTagLibString(song.genre()));
  tag->setYear(song.year() <= 0 ? 0 : static_cast<uint>(song.year()));
  tag->setTrack(song.track() <= 0 ? 0 : static_cast<uint>(song.track()));

  SetCommentsFrame(QString(), song.comment(), tag);
  SetCommentsFrame(QLatin1String(kProvenanceDescription), Provenance::Serialize(provenance), tag);
  RemoveLegacyFrames(tag);

}

QString TagReaderTagLib::CommentsFrameText(const QString &description, TagLib::ID3v2::Tag *tag) const {

  TagLib::ID3v2::CommentsFrame *frame = TagLib::ID3v2::CommentsFrame::findByDescription(tag, QStringToTagLibString(description));
  if (!frame) return QString();

  return TagLibStringToQString(frame->text());

}

void TagReaderTagLib::SetCommentsFrame(const QString &description, const QString &value, TagLib::ID3v2::Tag *tag) const {

  const TagLib::String t_description = QStringToTagLibString(description);

  // Clear existing frames
  while (TagLib::ID3v2::CommentsFrame *frame = TagLib::ID3v2::CommentsFrame::findByDescription(tag, t_description)) {
    tag->removeFrame(frame, true);
  }

  if (value.isEmpty()) return;

  // Create and add a new frame
  TagLib::ID3v2::CommentsFrame *frame = new TagLib::ID3v2::CommentsFrame(TagLib::String::UTF8);
  frame->setLanguage("eng");
  frame->setDescription(t_description);
  frame->setText(QStringToTagLibString(value));
  tag->addFrame(frame);

}
