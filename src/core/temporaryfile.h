/*
 * CrossPlay
 * This file was part of Strawberry.
 * Copyright 2018-2025, Jonas Kvinge <jonas@jkvinge.net>
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

#ifndef TEMPORARYFILE_H
#define TEMPORARYFILE_H

#include <QString>

// A uniquely named staging file inside a library directory.
// The file is created empty on construction and removed on destruction unless released.
class TemporaryFile {
 public:
  explicit TemporaryFile(const QString &directory);
  ~TemporaryFile();

  static constexpr char kFilenamePrefix[] = ".crossplay-";
  static constexpr char kFilenameSuffix[] = ".part";

  static bool IsTemporaryFilename(const QString &filename);

  QString filename() const { return filename_; }
  bool is_valid() const { return !filename_.isEmpty(); }

  // Deletes the file now, returns false if it existed and could not be removed.
  bool Remove();

  // Forget the file, it will not be removed on destruction.
  void Release() { filename_.clear(); }

 private:
  QString GenerateFilename(const QString &filename_pattern) const;

 private:
  QString filename_;

  Q_DISABLE_COPY(TemporaryFile)
};

#endif  // TEMPORARYFILE_H
