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

#include <QtGlobal>
#include <QDir>
#include <QSettings>
#include <QStandardPaths>
#include <QString>

#include "constants/librarysettings.h"
#include "constants/timeconstants.h"
#include "librarysorting.h"
#include "libraryconfig.h"

using namespace Qt::Literals::StringLiterals;

LibraryConfig::LibraryConfig()
    : directory(DefaultDirectory()),
      fetch_program(QLatin1String(LibrarySettings::kDefaultFetchProgram)),
      fetch_arguments(QLatin1String(LibrarySettings::kDefaultFetchArguments)),
      transcode_program(QLatin1String(LibrarySettings::kDefaultTranscodeProgram)),
      transcode_arguments(QLatin1String(LibrarySettings::kDefaultTranscodeArguments)),
      trim_arguments(QLatin1String(LibrarySettings::kDefaultTrimArguments)),
      trim_reencode_arguments(QLatin1String(LibrarySettings::kDefaultTrimReencodeArguments)),
      trim_reencode(false),
      worker_threads(LibrarySettings::kDefaultWorkerThreads),
      tool_timeout(LibrarySettings::kDefaultToolTimeout),
      sort_by(LibrarySettings::SortBy::Title),
      sort_reverse(false) {}

QString LibraryConfig::DefaultDirectory() {

  QString music_location = QStandardPaths::writableLocation(QStandardPaths::MusicLocation);
  if (music_location.isEmpty()) {
    music_location = QDir::homePath();
  }

  return QDir(music_location).filePath(QLatin1String(LibrarySettings::kDefaultDirectoryName));

}

void LibraryConfig::Load(QSettings *s) {

  const LibraryConfig defaults;

  s->beginGroup(LibrarySettings::kSettingsGroup);
  directory = s->value(LibrarySettings::kPath, defaults.directory).toString();
  fetch_program = s->value(LibrarySettings::kFetchProgram, defaults.fetch_program).toString();
  fetch_arguments = s->value(LibrarySettings::kFetchArguments, defaults.fetch_arguments).toString();
  transcode_program = s->value(LibrarySettings::kTranscodeProgram, defaults.transcode_program).toString();
  transcode_arguments = s->value(LibrarySettings::kTranscodeArguments, defaults.transcode_arguments).toString();
  trim_arguments = s->value(LibrarySettings::kTrimArguments, defaults.trim_arguments).toString();
  trim_reencode_arguments = s->value(LibrarySettings::kTrimReencodeArguments, defaults.trim_reencode_arguments).toString();
  trim_reencode = s->value(LibrarySettings::kTrimReencode, defaults.trim_reencode).toBool();
  worker_threads = qBound(1, s->value(LibrarySettings::kWorkerThreads, defaults.worker_threads).toInt(), 16);
  tool_timeout = qMax(0, s->value(LibrarySettings::kToolTimeout, defaults.tool_timeout).toInt());
  sort_by = LibrarySorting::SortByFromString(s->value(LibrarySettings::kSortBy, LibrarySorting::SortByToString(defaults.sort_by)).toString());
  sort_reverse = s->value(LibrarySettings::kSortReverse, defaults.sort_reverse).toBool();
  s->endGroup();

}

void LibraryConfig::Save(QSettings *s) const {

  s->beginGroup(LibrarySettings::kSettingsGroup);
  s->setValue(LibrarySettings::kPath, directory);
  s->setValue(LibrarySettings::kFetchProgram, fetch_program);
  s->setValue(LibrarySettings::kFetchArguments, fetch_arguments);
  s->setValue(LibrarySettings::kTranscodeProgram, transcode_program);
  s->setValue(LibrarySettings::kTranscodeArguments, transcode_arguments);
  s->setValue(LibrarySettings::kTrimArguments, trim_arguments);
  s->setValue(LibrarySettings::kTrimReencodeArguments, trim_reencode_arguments);
  s->setValue(LibrarySettings::kTrimReencode, trim_reencode);
  s->setValue(LibrarySettings::kWorkerThreads, worker_threads);
  s->setValue(LibrarySettings::kToolTimeout, tool_timeout);
  s->setValue(LibrarySettings::kSortBy, LibrarySorting::SortByToString(sort_by));
  s->setValue(LibrarySettings::kSortReverse, sort_reverse);
  s->endGroup();

}

ToolCommand LibraryConfig::FetchCommand() const {
  return ToolCommand(fetch_program, fetch_arguments);
}

ToolCommand LibraryConfig::TranscodeCommand() const {
  return ToolCommand(transcode_program, transcode_arguments);
}

ToolCommand LibraryConfig::TrimCommand() const {
  return ToolCommand(transcode_program, trim_reencode ? trim_reencode_arguments : trim_arguments);
}

qint64 LibraryConfig::tool_timeout_msec() const {
  return static_cast<qint64>(tool_timeout) * kMsecPerSec;
}
