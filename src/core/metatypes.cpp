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

#include "metatypes.h"

#include <QMetaType>
#include <QList>
#include <QUrl>

#include "core/song.h"
#include "library/libraryresult.h"
#include "library/libraryjob.h"

void RegisterMetaTypes() {

  qRegisterMetaType<QList<QUrl>>("QList<QUrl>");
  qRegisterMetaType<Song>("Song");
  qRegisterMetaType<SongList>("SongList");
  qRegisterMetaType<LibraryResult>("LibraryResult");
  qRegisterMetaType<LibraryJob::State>("LibraryJob::State");
  qRegisterMetaType<LibraryJobPtr>("LibraryJobPtr");

}
