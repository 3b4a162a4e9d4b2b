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

#include <algorithm>

#include <QString>
#include <QDateTime>

#include "constants/librarysettings.h"
#include "core/song.h"
#include "librarysorting.h"

using namespace Qt::Literals::StringLiterals;

namespace LibrarySorting {

namespace {

int CompareText(const QString &text1, const QString &text2) {

  // Songs without the field go last.
  if (text1.isEmpty() != text2.isEmpty()) return text1.isEmpty() ? 1 : -1;
  return QString::localeAwareCompare(text1.toLower(), text2.toLower());

}

}  // namespace

QString SortByToString(const LibrarySettings::SortBy sort_by) {

  switch (sort_by) {
    case LibrarySettings::SortBy::Title:      return u"title"_s;
    case LibrarySettings::SortBy::Artist:     return u"artist"_s;
    case LibrarySettings::SortBy::Album:      return u"album"_s;
    case LibrarySettings::SortBy::Downloaded: return u"downloaded"_s;
  }

  return u"title"_s;

}

LibrarySettings::SortBy SortByFromString(const QString &text, bool *ok) {

  if (ok) *ok = true;

  const QString sort_by = text.trimmed().toLower();
  if (sort_by == "title"_L1) return LibrarySettings::SortBy::Title;
  if (sort_by == "artist"_L1) return LibrarySettings::SortBy::Artist;
  if (sort_by == "album"_L1) return LibrarySettings::SortBy::Album;
  if (sort_by == "downloaded"_L1) return LibrarySettings::SortBy::Downloaded;

  if (ok) *ok = false;
  return LibrarySettings::SortBy::Title;

}

bool LessThan(const Song &song1, const Song &song2, const LibrarySettings::SortBy sort_by) {

  int cmp = 0;
  switch (sort_by) {
    case LibrarySettings::SortBy::Title:
      break;
    case LibrarySettings::SortBy::Artist:
      cmp = CompareText(song1.artist(), song2.artist());
      break;
    case LibrarySettings::SortBy::Album:
      cmp = CompareText(song1.album(), song2.album());
      if (cmp == 0 && song1.track() != song2.track()) return song1.track() < song2.track();
      break;
    case LibrarySettings::SortBy::Downloaded: {
      // Newest first, songs that were not downloaded last.
      const QDateTime downloaded1 = song1.downloaded_at();
      const QDateTime downloaded2 = song2.downloaded_at();
      if (downloaded1.isValid() != downloaded2.isValid()) return downloaded1.isValid();
      if (downloaded1 != downloaded2) return downloaded1 > downloaded2;
      break;
    }
  }

  if (cmp == 0) cmp = CompareText(song1.PrettyTitle(), song2.PrettyTitle());
  if (cmp == 0) return song1.basefilename() < song2.basefilename();

  return cmp < 0;

}

void Sort(SongList *songs, const LibrarySettings::SortBy sort_by, const bool reverse) {

  std::stable_sort(songs->begin(), songs->end(), [sort_by](const Song &song1, const Song &song2) { return LessThan(song1, song2, sort_by); });
  if (reverse) std::reverse(songs->begin(), songs->end());

}

}  // namespace LibrarySorting
