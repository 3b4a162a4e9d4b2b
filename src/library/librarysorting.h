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

#ifndef LIBRARYSORTING_H
#define LIBRARYSORTING_H

#include <QString>

#include "constants/librarysettings.h"
#include "core/song.h"

// Presentation order of the song list. The library itself has no order.
namespace LibrarySorting {

QString SortByToString(const LibrarySettings::SortBy sort_by);
LibrarySettings::SortBy SortByFromString(const QString &text, bool *ok = nullptr);

bool LessThan(const Song &song1, const Song &song2, const LibrarySettings::SortBy sort_by);
void Sort(SongList *songs, const LibrarySettings::SortBy sort_by, const bool reverse = false);

}  // namespace LibrarySorting

#endif  // LIBRARYSORTING_H
