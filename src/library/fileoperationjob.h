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

#ifndef FILEOPERATIONJOB_H
#define FILEOPERATIONJOB_H

#include <QObject>
#include <QString>
#include <QStringList>

#include "includes/shared_ptr.h"
#include "core/song.h"
#include "libraryjob.h"

class TagReaderBase;

// Short operations on one song: hide, show, toggle visibility, delete and tag edits.
// They run as jobs so that they are serialized with downloads and trims on the same path.
class FileOperationJob : public LibraryJob {
  Q_OBJECT

 public:
  explicit FileOperationJob(const Type type, const QString &filename, SharedPtr<TagReaderBase> tagreader, QObject *parent = nullptr);

  // Tag fields to write for UpdateTags jobs, and provenance keys to merge.
  void set_tags(const Song &tags) { tags_ = tags; }
  const Song &tags() const { return tags_; }

  // The rename target is locked too, so a download cannot settle on it meanwhile.
  QStringList LockPaths() const override;

 protected:
  LibraryResult Run() override;

 private:
  LibraryResult ChangeVisibility();
  LibraryResult Delete();
  LibraryResult UpdateTags();

 private:
  SharedPtr<TagReaderBase> tagreader_;
  Song tags_;
};

#endif  // FILEOPERATIONJOB_H
