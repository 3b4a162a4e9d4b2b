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

#ifndef LIBRARYSCANNER_H
#define LIBRARYSCANNER_H

#include <QString>

#include "includes/shared_ptr.h"
#include "core/song.h"

class TagReaderBase;

// Builds Song records for the audio files of a library directory.
class LibraryScanner {
 public:
  explicit LibraryScanner(SharedPtr<TagReaderBase> tagreader);

  // One pass over directory, in directory order.
  // Files with tags that cannot be parsed are included with empty metadata.
  SongList Scan(const QString &directory) const;

  // Reads a single file. Returns an invalid song if the file is gone or is not a library file.
  Song ScanFile(const QString &filename) const;

  // Visible or hidden audio file, temporary files never are.
  static bool IsCandidate(const QString &filename);

  // Deletes temporary files left behind by an interrupted run.
  static int RemoveOrphanedTemporaryFiles(const QString &directory);

 private:
  SharedPtr<TagReaderBase> tagreader_;
};

#endif  // LIBRARYSCANNER_H
