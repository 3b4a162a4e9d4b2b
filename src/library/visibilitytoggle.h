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

#ifndef VISIBILITYTOGGLE_H
#define VISIBILITYTOGGLE_H

#include <QString>

#include "libraryresult.h"

// Hides songs from the library and from other players by renaming "name.mp3" to "name.mp3.hidden", and back.
// Only the name changes, contents and tags stay as they are.
class VisibilityToggle {
 public:
  // Hiding a hidden file and showing a visible file do nothing and return the same path.
  static LibraryResult Hide(const QString &filename, QString *new_filename);
  static LibraryResult Show(const QString &filename, QString *new_filename);
  static LibraryResult Toggle(const QString &filename, QString *new_filename);

 private:
  static LibraryResult Rename(const QString &filename, const QString &new_filename, QString *result_filename);
};

#endif  // VISIBILITYTOGGLE_H
