/*
 * CrossPlay
 * Copyright 2026, The CrossPlay Authors
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

#include <utility>

#include <QObject>
#include <QFile>
#include <QFileInfo>
#include <QString>
#include <QStringList>

#include "includes/shared_ptr.h"
#include "core/logging.h"
#include "core/song.h"
#include "core/provenance.h"
#include "tagreader/tagreaderbase.h"
#include "tagreader/tagreaderresult.h"
#include "libraryscanner.h"
#include "visibilitytoggle.h"
#include "libraryresult.h"
#include "fileoperationjob.h"

using namespace Qt::Literals::StringLiterals;

FileOperationJob::FileOperationJob(const Type type, const QString &filename, SharedPtr<TagReaderBase> tagreader, QObject *parent)
    : LibraryJob(type, filename, parent),
      tagreader_(std::move(tagreader)) {}

QStringList FileOperationJob::LockPaths() const {

  QStringList paths = QStringList() << path_;

  switch (type_) {
    case Type::Hide:
      paths << Song::HiddenFilename(path_);
      break;
    case Type::Show:
      paths << Song::VisibleFilename(path_);
      break;
    case Type::ToggleVisibility:
      paths << (Song::IsHiddenFilename(path_) ? Song::VisibleFilename(path_) : Song::HiddenFilename(path_));
      break;
    default:
      break;
  }

  paths.removeDuplicates();

  return paths;

}

LibraryResult FileOperationJob::Run() {

  SetState(State::Running);

  switch (type_) {
    case Type::Hide:
    case Type::Show:
    case Type::ToggleVisibility:
      return ChangeVisibility();
    case Type::Delete:
      return Delete();
    case Type::UpdateTags:
      return UpdateTags();
    default:
      break;
  }

  return LibraryResult(LibraryResult::ErrorCode::IoError, tr("Unsupported operation"), path_);

}

LibraryResult FileOperationJob::ChangeVisibility() {

  QString new_filename;
  LibraryResult result;
  if (type_ == Type::Hide) {
    result = VisibilityToggle::Hide(path_, &new_filename);
  }
  else if (type_ == Type::Show) {
    result = VisibilityToggle::Show(path_, &new_filename);
  }
  else {
    result = VisibilityToggle::Toggle(path_, &new_filename);
  }
  if (!result.success()) return result;

  set_result_path(new_filename);
  set_song(LibraryScanner(tagreader_).ScanFile(new_filename));

  qLog(Info) << (Song::IsHiddenFilename(new_filename) ? "Hidden" : "Visible") << new_filename;

  return LibraryResult(LibraryResult::ErrorCode::Success, QString(), new_filename);

}

LibraryResult FileOperationJob::Delete() {

  if (!Song::IsAudioFilename(path_)) {
    return LibraryResult(LibraryResult::ErrorCode::NotFound, tr("Not a library file"), path_, tr("deleting"));
  }

  QFile file(path_);
  if (!file.exists()) {
    return LibraryResult(LibraryResult::ErrorCode::NotFound, QString(), path_, tr("deleting"));
  }

  if (!file.remove()) {
    return LibraryResult(LibraryResult::ErrorCode::IoError, file.errorString(), path_, tr("deleting"));
  }

  qLog(Info) << "Deleted" << path_;

  return LibraryResult(LibraryResult::ErrorCode::Success, QString(), path_);

}

LibraryResult FileOperationJob::UpdateTags() {

  Song song;
  const TagReaderResult read_result = tagreader_->ReadFile(path_, &song);
  if (read_result.error_code == TagReaderResult::ErrorCode::FileDoesNotExist) {
    return LibraryResult(LibraryResult::ErrorCode::NotFound, read_result.error_string(), path_, tr("reading"));
  }
  if (!read_result.success() && !read_result.corrupt_tag()) {
    return LibraryResult(LibraryResult::ErrorCode::IoError, read_result.error_string(), path_, tr("reading"));
  }

  SetState(State::Tagging);

  song.set_title(tags_.title());
  song.set_artist(tags_.artist());
  song.set_album(tags_.album());
  song.set_genre(tags_.genre());
  song.set_comment(tags_.comment());
  song.set_year(tags_.year());
  song.set_track(tags_.track());

  ProvenanceMap provenance = Provenance::Merge(song.provenance(), tags_.provenance());
  provenance.insert(QLatin1String(Provenance::kMetadataEdited), u"1"_s);
  song.set_provenance(provenance);

  const TagReaderResult write_result = tagreader_->WriteFile(path_, song);
  if (!write_result.success()) {
    return LibraryResult(LibraryResult::ErrorCode::IoError, write_result.error_string(), path_, tr("writing tags"));
  }

  set_result_path(path_);
  set_song(LibraryScanner(tagreader_).ScanFile(path_));

  qLog(Info) << "Updated tags of" << path_;

  return LibraryResult(LibraryResult::ErrorCode::Success, QString(), path_);

}
