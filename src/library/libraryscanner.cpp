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

#include <QDir>
#include <QDirIterator>
#include <QFile>
#include <QFileInfo>
#include <QString>

#include "includes/shared_ptr.h"
#include "core/logging.h"
#include "core/song.h"
#include "core/temporaryfile.h"
#include "tagreader/tagreaderbase.h"
#include "tagreader/tagreaderresult.h"
#include "libraryscanner.h"

LibraryScanner::LibraryScanner(SharedPtr<TagReaderBase> tagreader) : tagreader_(std::move(tagreader)) {}

bool LibraryScanner::IsCandidate(const QString &filename) {

  const QString basename = filename.section(u'/', -1, -1);
  if (TemporaryFile::IsTemporaryFilename(basename)) return false;

  return Song::IsAudioFilename(basename);

}

SongList LibraryScanner::Scan(const QString &directory) const {

  qLog(Debug) << "Scanning" << directory;

  SongList songs;
  int corrupt = 0;

  QDirIterator it(directory, QDir::Files | QDir::Hidden | QDir::NoDotAndDotDot);
  while (it.hasNext()) {
    const QString filepath = it.next();
    if (!IsCandidate(filepath)) continue;

    const Song song = ScanFile(filepath);
    if (!song.is_valid()) continue;
    if (song.tag_error()) ++corrupt;
    songs << song;
  }

  qLog(Info) << "Found" << songs.count() << "songs in" << directory << "of which" << corrupt << "have no readable tags";

  return songs;

}

Song LibraryScanner::ScanFile(const QString &filename) const {

  if (!IsCandidate(filename)) return Song();

  Song song;
  const TagReaderResult result = tagreader_->ReadFile(filename, &song);
  switch (result.error_code) {
    case TagReaderResult::ErrorCode::Success:
      break;
    case TagReaderResult::ErrorCode::FileParseError:
    case TagReaderResult::ErrorCode::FileOpenError:
    case TagReaderResult::ErrorCode::Unsupported: {
      // Still part of the library, without metadata.
      Song untagged;
      untagged.InitFromFilePartial(filename, QFileInfo(filename));
      untagged.set_tag_error(true);
      return untagged;
    }
    default:
      qLog(Warning) << "Skipping" << filename << result.error_string();
      return Song();
  }

  return song;

}

int LibraryScanner::RemoveOrphanedTemporaryFiles(const QString &directory) {

  int removed = 0;

  QDirIterator it(directory, QDir::Files | QDir::Hidden | QDir::System | QDir::NoDotAndDotDot);
  while (it.hasNext()) {
    const QString filepath = it.next();
    if (!TemporaryFile::IsTemporaryFilename(it.fileName())) continue;
    if (QFile::remove(filepath)) {
      qLog(Info) << "Removed leftover temporary file" << filepath;
      ++removed;
    }
    else {
      qLog(Error) << "Could not remove leftover temporary file" << filepath;
    }
  }

  return removed;

}
