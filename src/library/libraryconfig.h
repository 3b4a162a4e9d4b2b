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

#ifndef LIBRARYCONFIG_H
#define LIBRARYCONFIG_H

#include <QtGlobal>
#include <QString>

#include "constants/librarysettings.h"
#include "toolcommand.h"

class QSettings;

// Library directory and external tool setup, read from the "Library" settings group.
struct LibraryConfig {
  LibraryConfig();

  QString directory;
  QString fetch_program;
  QString fetch_arguments;
  QString transcode_program;
  QString transcode_arguments;
  QString trim_arguments;
  QString trim_reencode_arguments;
  bool trim_reencode;
  int worker_threads;
  int tool_timeout;
  LibrarySettings::SortBy sort_by;
  bool sort_reverse;

  static QString DefaultDirectory();

  void Load(QSettings *s);
  void Save(QSettings *s) const;

  ToolCommand FetchCommand() const;
  ToolCommand TranscodeCommand() const;
  ToolCommand TrimCommand() const;
  qint64 tool_timeout_msec() const;
};

#endif  // LIBRARYCONFIG_H
