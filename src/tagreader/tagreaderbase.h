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

#ifndef TAGREADERBASE_H
#define TAGREADERBASE_H

#include <QtGlobal>
#include <QString>

#include "core/song.h"
#include "core/provenance.h"

#include "tagreaderresult.h"

// Reads and writes the tags embedded in library files.
// Implementations must be safe to call from several worker threads at once.
class TagReaderBase {
 public:
  explicit TagReaderBase();
  virtual ~TagReaderBase();

  // Fills the file attributes of song, then its tags.
  // On FileParseError the file attributes are set and the tags are left empty.
  virtual TagReaderResult ReadFile(const QString &filename, Song *song) const = 0;

  // Writes the tag fields of song to the file.
  // Provenance is merged into the provenance already in the file, keys of song win.
  // The file at filename is replaced in one step, it is never seen half written.
  virtual TagReaderResult WriteFile(const QString &filename, const Song &song) const = 0;

  // Replaces the tags of destination with a copy of every tag frame of source, then merges provenance_update.
  // destination is written in place and is expected to be a staging file.
  virtual TagReaderResult CopyTags(const QString &source_filename, const QString &destination_filename, const ProvenanceMap &provenance_update) const = 0;

  Q_DISABLE_COPY(TagReaderBase)
};

#endif  // TAGREADERBASE_H
