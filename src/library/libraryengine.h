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

#ifndef LIBRARYENGINE_H
#define LIBRARYENGINE_H

#include <QtGlobal>
#include <QObject>
#include <QMutex>
#include <QList>
#include <QMap>
#include <QPair>
#include <QString>
#include <QFuture>

#include "includes/shared_ptr.h"
#include "core/song.h"
#include "libraryconfig.h"
#include "libraryjob.h"
#include "libraryresult.h"
#include "libraryscanner.h"
#include "pathlocks.h"

class QThreadPool;
class TagReaderBase;
class TaskManager;

// The library: one directory of audio files, and the catalog of songs built from it.
// Changes to files run as jobs on a worker pool, at most one job per song at a time.
// After a job changed a file the catalog is patched from the new file instead of scanning again.
class LibraryEngine : public QObject {
  Q_OBJECT

 public:
  explicit LibraryEngine(const LibraryConfig &config, SharedPtr<TagReaderBase> tagreader, QObject *parent = nullptr);
  ~LibraryEngine() override;

  // Creates the directory if needed, removes leftover temporary files and runs the first scan.
  LibraryResult Init();

  const LibraryConfig &config() const { return config_; }
  QString directory() const { return config_.directory; }
  TaskManager *task_manager() const { return task_manager_; }
  PathLockManager *path_locks() { return &path_locks_; }

  // Songs of the last scan with all changes since applied, in directory order.
  // Songs that a running job is changing are left out, hidden songs unless include_hidden is set.
  SongList ListSongs(const bool include_hidden = false) const;
  SongList ListSongs(const LibrarySettings::SortBy sort_by, const bool reverse, const bool include_hidden = false) const;

  Song song(const QString &path) const;

  LibraryJobPtr SubmitDownload(const QString &url);
  LibraryJobPtr SubmitTrim(const QString &path, const qint64 start_msec, const qint64 end_msec);
  LibraryJobPtr Hide(const QString &path);
  LibraryJobPtr Show(const QString &path);
  LibraryJobPtr ToggleVisibility(const QString &path);
  LibraryJobPtr Delete(const QString &path);

  // Writes the tag fields of tags to the song, its provenance keys are merged into the song's provenance.
  LibraryJobPtr UpdateTags(const QString &path, const Song &tags);

  // Scans the directory again on a worker, after all running jobs are done.
  QFuture<SongList> Rescan();
  SongList RescanBlocking();

  // A proposed trim, kept with the song until it is trimmed or the proposal is cleared. Never written to the file.
  LibraryResult SetTrimBounds(const QString &filename, const qint64 start_msec, const qint64 end_msec);
  void ClearTrimBounds(const QString &path);

  QList<LibraryJobPtr> RunningJobs() const;
  void CancelAll();

 Q_SIGNALS:
  void SongsDiscovered(const SongList &songs);
  void SongsDeleted(const SongList &songs);
  void SongsChanged(const SongList &songs);
  void CatalogChanged();
  void JobFinished(LibraryJobPtr job);

 private:
  void StartJob(LibraryJobPtr job);
  void RunJob(LibraryJobPtr job);
  void PatchCatalog(const LibraryJob &job);
  void ReplaceCatalog(const SongList &songs);
  Song ApplyTrimBounds(const Song &song) const;
  qint64 IndexOf(const QString &path) const;
  // True for files directly in the library directory.
  bool IsInLibrary(const QString &path) const;
  static QString CleanPath(const QString &path);
  void RemoveJob(LibraryJob *job);

 private:
  LibraryConfig config_;
  SharedPtr<TagReaderBase> tagreader_;
  LibraryScanner scanner_;
  TaskManager *task_manager_;
  QThreadPool *thread_pool_;
  PathLockManager path_locks_;

  mutable QMutex mutex_;
  SongList catalog_;
  QMap<QString, QPair<qint64, qint64>> trim_bounds_;
  QList<LibraryJobPtr> jobs_;

  Q_DISABLE_COPY(LibraryEngine)
};

#endif  // LIBRARYENGINE_H
