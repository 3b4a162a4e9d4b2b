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

#include <QObject>
#include <QFile>
#include <QFileInfo>
#include <QString>

#include "core/logging.h"
#include "core/song.h"
#include "libraryresult.h"
#include "visibilitytoggle.h"

namespace {

QString RenameStage() { return QObject::tr("renaming"); }

}  // namespace

LibraryResult VisibilityToggle::Hide(const QString &filename, QString *new_filename) {
  return Rename(filename, Song::HiddenFilename(filename), new_filename);
}

LibraryResult VisibilityToggle::Show(const QString &filename, QString *new_filename) {
  return Rename(filename, Song::VisibleFilename(filename), new_filename);
}

LibraryResult VisibilityToggle::Toggle(const QString &filename, QString *new_filename) {

  if (Song::IsHiddenFilename(filename)) {
    return Show(filename, new_filename);
  }

  return Hide(filename, new_filename);

}

LibraryResult VisibilityToggle::Rename(const QString &filename, const QString &new_filename, QString *result_filename) {

  if (!Song::IsAudioFilename(filename)) {
    return LibraryResult(LibraryResult::ErrorCode::NotFound, QObject::tr("Not a library file"), filename, RenameStage());
  }

  if (!QFileInfo::exists(filename)) {
    return LibraryResult(LibraryResult::ErrorCode::NotFound, QString(), filename, RenameStage());
  }

  if (new_filename == filename) {
    if (result_filename) *result_filename = filename;
    return LibraryResult();
  }

  if (QFileInfo::exists(new_filename)) {
    qLog(Warning) << "Not renaming" << filename << "because" << new_filename << "exists";
    return LibraryResult(LibraryResult::ErrorCode::NameCollision, QString(), new_filename, RenameStage());
  }

  // QFile::rename() never replaces an existing file.
  QFile file(filename);
  if (!file.rename(new_filename)) {
    if (QFileInfo::exists(new_filename)) {
      return LibraryResult(LibraryResult::ErrorCode::NameCollision, QString(), new_filename, RenameStage());
    }
    qLog(Error) << "Could not rename" << filename << "to" << new_filename << file.errorString();
    return LibraryResult(LibraryResult::ErrorCode::IoError, file.errorString(), filename, RenameStage());
  }

  qLog(Debug) << "Renamed" << filename << "to" << new_filename;

  if (result_filename) *result_filename = new_filename;

  return LibraryResult();

}
