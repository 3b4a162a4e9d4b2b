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

#include "version.h"

#include <csignal>
#include <iostream>
#include <memory>

#include <QtGlobal>
#include <QObject>
#include <QCoreApplication>
#include <QEventLoop>
#include <QString>
#include <QStringList>

#include "includes/shared_ptr.h"
#include "includes/scoped_ptr.h"
#include "core/logging.h"
#include "core/metatypes.h"
#include "core/commandlineoptions.h"
#include "core/settings.h"
#include "core/song.h"
#include "core/unixsignalwatcher.h"
#include "constants/librarysettings.h"
#include "utilities/timeutils.h"
#include "tagreader/tagreaderbase.h"
#include "tagreader/tagreadertaglib.h"
#include "library/libraryconfig.h"
#include "library/librarysorting.h"
#include "library/libraryengine.h"
#include "library/libraryjob.h"
#include "library/libraryresult.h"

using namespace Qt::Literals::StringLiterals;
using std::make_shared;

namespace {

void PrintLine(const QString &line) {
  std::cout << line.toLocal8Bit().constData() << std::endl;
}

void PrintError(const QString &line) {
  std::cerr << "crossplay: " << line.toLocal8Bit().constData() << std::endl;
}

void PrintSong(const Song &song) {

  PrintLine(QStringLiteral("%1 %2  %3  %4").arg(song.is_visible() ? u" "_s : u"H"_s)
                                          .arg(Utilities::PrettyTimeMsec(song.length_msec()), 12)
                                          .arg(song.TitleWithArtist(), song.path()));

}

// Runs the event loop until the job reports that it finished.
int WaitForJob(LibraryJobPtr job) {

  QEventLoop loop;
  QObject::connect(&*job, &LibraryJob::Finished, &loop, &QEventLoop::quit);
  QObject::connect(&*job, &LibraryJob::StateChanged, &loop, [](const LibraryJob::State state) {
    qLog(Info) << LibraryJob::StateName(state);
  });
  QObject::connect(&*job, &LibraryJob::ProgressChanged, &loop, [](const int progress) {
    qLog(Debug) << progress << "%";
  });
  loop.exec();

  const LibraryResult result = job->result();
  if (!result.success()) {
    PrintError(result.message());
    return CommandlineOptions::kExitFailure;
  }

  if (!job->result_path().isEmpty()) {
    PrintSong(job->song());
  }

  return CommandlineOptions::kExitSuccess;

}

int UpdateTags(LibraryEngine *engine, const CommandlineOptions &options) {

  const Song song = engine->song(options.target());
  if (!song.is_valid()) {
    PrintError(QObject::tr("%1 is not in the library").arg(options.target()));
    return CommandlineOptions::kExitFailure;
  }

  // Fields that were not given keep their values.
  Song tags(song);
  if (!options.title().isNull()) tags.set_title(options.title());
  if (!options.artist().isNull()) tags.set_artist(options.artist());
  if (!options.album().isNull()) tags.set_album(options.album());
  if (!options.genre().isNull()) tags.set_genre(options.genre());
  if (!options.comment().isNull()) tags.set_comment(options.comment());
  if (options.year() >= 0) tags.set_year(options.year());
  if (options.track() >= 0) tags.set_track(options.track());
  tags.set_provenance(ProvenanceMap());

  return WaitForJob(engine->UpdateTags(options.target(), tags));

}

int RunCommand(LibraryEngine *engine, const CommandlineOptions &options, const LibraryConfig &config) {

  switch (options.command()) {
    case CommandlineOptions::Command::List:{
      const SongList songs = engine->ListSongs(config.sort_by, config.sort_reverse, options.include_hidden());
      for (const Song &song : songs) {
        PrintSong(song);
      }
      return CommandlineOptions::kExitSuccess;
    }
    case CommandlineOptions::Command::Rescan:{
      const SongList songs = engine->RescanBlocking();
      PrintLine(QObject::tr("%1 songs").arg(songs.count()));
      return CommandlineOptions::kExitSuccess;
    }
    case CommandlineOptions::Command::Download:
      return WaitForJob(engine->SubmitDownload(options.target()));
    case CommandlineOptions::Command::Trim:
      return WaitForJob(engine->SubmitTrim(options.target(), options.start_msec(), options.end_msec()));
    case CommandlineOptions::Command::Hide:
      return WaitForJob(engine->Hide(options.target()));
    case CommandlineOptions::Command::Show:
      return WaitForJob(engine->Show(options.target()));
    case CommandlineOptions::Command::Toggle:
      return WaitForJob(engine->ToggleVisibility(options.target()));
    case CommandlineOptions::Command::Delete:
      return WaitForJob(engine->Delete(options.target()));
    case CommandlineOptions::Command::Tag:
      return UpdateTags(engine, options);
    case CommandlineOptions::Command::None:
      break;
  }

  return CommandlineOptions::kExitUsage;

}

}  // namespace

int main(int argc, char *argv[]) {

  QCoreApplication::setApplicationName(u"CrossPlay"_s);
  QCoreApplication::setOrganizationName(u"CrossPlay"_s);
  QCoreApplication::setApplicationVersion(QStringLiteral(CROSSPLAY_VERSION_DISPLAY));

  RegisterMetaTypes();

  logging::Init();

  QCoreApplication core_app(argc, argv);

  CommandlineOptions options(argc, argv);
  if (!options.Parse()) return options.exit_code();

  if (!logging::SetLevels(options.log_levels())) {
    qLog(Warning) << "Ignoring invalid log levels in" << options.log_levels();
  }

  LibraryConfig config;
  {
    ScopedPtr<Settings> s(Settings::Open(options.settings_filename()));
    config.Load(&*s);
  }
  if (!options.library_directory().isEmpty()) {
    config.directory = options.library_directory();
  }
  if (!options.sort_by().isEmpty()) {
    bool ok = false;
    config.sort_by = LibrarySorting::SortByFromString(options.sort_by(), &ok);
    if (!ok) {
      PrintError(QObject::tr("Unknown sort field %1").arg(options.sort_by()));
      return CommandlineOptions::kExitUsage;
    }
  }
  if (options.sort_reverse()) config.sort_reverse = true;

  SharedPtr<TagReaderBase> tagreader = make_shared<TagReaderTagLib>();
  LibraryEngine engine(config, tagreader);

  const LibraryResult init_result = engine.Init();
  if (!init_result.success()) {
    PrintError(init_result.message());
    return CommandlineOptions::kExitFailure;
  }

  UnixSignalWatcher signal_watcher;
  signal_watcher.WatchForSignal(SIGINT);
  signal_watcher.WatchForSignal(SIGTERM);
  QObject::connect(&signal_watcher, &UnixSignalWatcher::UnixSignal, &engine, &LibraryEngine::CancelAll);

  return RunCommand(&engine, options, config);

}
