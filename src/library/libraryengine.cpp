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

#include <utility>

#include <QtGlobal>
#include <QObject>
#include <QThreadPool>
#include <QtConcurrentRun>
#include <QFuture>
#include <QMutex>
#include <QMutexLocker>
#include <QDir>
#include <QFileInfo>
#include <QList>
#include <QSet>
#include <QString>
#include <QStringList>

#include "includes/shared_ptr.h"
#include "core/logging.h"
#include "core/song.h"
#include "core/taskmanager.h"
#include "tagreader/tagreaderbase.h"
#include "librarysorting.h"
#include "libraryresult.h"
#include "libraryjob.h"
#include "downloadjob.h"
#include "trimjob.h"
#include "fileoperationjob.h"
#include "libraryengine.h"

using namespace Qt::Literals::StringLiterals;

LibraryEngine::LibraryEngine(const LibraryConfig &config, SharedPtr<TagReaderBase> tagreader, QObject *parent)
    : QObject(parent),
      config_(config),
      tagreader_(tagreader),
      scanner_(tagreader),
      task_manager_(new TaskManager(this)),
      thread_pool_(new QThreadPool(this)) {

  config_.directory = QDir(config.directory).absolutePath();

  thread_pool_->setMaxThreadCount(qMax(1, config_.worker_threads));

  qLog(Debug) << "Library in" << config_.directory << "with" << thread_pool_->maxThreadCount() << "workers";

}

LibraryEngine::~LibraryEngine() {

  CancelAll();
  thread_pool_->waitForDone();

}

LibraryResult LibraryEngine::Init() {

  QDir dir(config_.directory);
  if (!dir.exists()) {
    if (!dir.mkpath(u"."_s)) {
      return LibraryResult(LibraryResult::ErrorCode::IoError, tr("Could not create directory"), config_.directory, tr("initializing"));
    }
    qLog(Info) << "Created library directory" << config_.directory;
  }

  const int removed = LibraryScanner::RemoveOrphanedTemporaryFiles(config_.directory);
  if (removed > 0) {
    qLog(Info) << "Removed" << removed << "leftover temporary files";
  }

  RescanBlocking();

  return LibraryResult();

}

SongList LibraryEngine::ListSongs(const bool include_hidden) const {

  const QSet<QString> locked_paths = path_locks_.LockedPaths();

  QMutexLocker l(&mutex_);
  SongList songs;
  songs.reserve(catalog_.count());
  for (const Song &song : catalog_) {
    if (locked_paths.contains(song.path())) continue;
    if (!include_hidden && !song.is_visible()) continue;
    songs << ApplyTrimBounds(song);
  }

  return songs;

}

SongList LibraryEngine::ListSongs(const LibrarySettings::SortBy sort_by, const bool reverse, const bool include_hidden) const {

  SongList songs = ListSongs(include_hidden);
  LibrarySorting::Sort(&songs, sort_by, reverse);
  return songs;

}

Song LibraryEngine::song(const QString &path) const {

  QMutexLocker l(&mutex_);
  const qint64 i = IndexOf(CleanPath(path));
  if (i == -1) return Song();

  return ApplyTrimBounds(catalog_.at(i));

}

LibraryJobPtr LibraryEngine::SubmitDownload(const QString &url) {

  LibraryJobPtr job = LibraryJob::Create<DownloadJob>(url, config_, tagreader_, &path_locks_);
  StartJob(job);
  return job;

}

LibraryJobPtr LibraryEngine::SubmitTrim(const QString &path, const qint64 start_msec, const qint64 end_msec) {

  LibraryJobPtr job = LibraryJob::Create<TrimJob>(CleanPath(path), start_msec, end_msec, config_, tagreader_);
  StartJob(job);
  return job;

}

LibraryJobPtr LibraryEngine::Hide(const QString &path) {

  LibraryJobPtr job = LibraryJob::Create<FileOperationJob>(LibraryJob::Type::Hide, CleanPath(path), tagreader_);
  StartJob(job);
  return job;

}

LibraryJobPtr LibraryEngine::Show(const QString &path) {

  LibraryJobPtr job = LibraryJob::Create<FileOperationJob>(LibraryJob::Type::Show, CleanPath(path), tagreader_);
  StartJob(job);
  return job;

}

LibraryJobPtr LibraryEngine::ToggleVisibility(const QString &path) {

  LibraryJobPtr job = LibraryJob::Create<FileOperationJob>(LibraryJob::Type::ToggleVisibility, CleanPath(path), tagreader_);
  StartJob(job);
  return job;

}

LibraryJobPtr LibraryEngine::Delete(const QString &path) {

  LibraryJobPtr job = LibraryJob::Create<FileOperationJob>(LibraryJob::Type::Delete, CleanPath(path), tagreader_);
  StartJob(job);
  return job;

}

LibraryJobPtr LibraryEngine::UpdateTags(const QString &path, const Song &tags) {

  QSharedPointer<FileOperationJob> job = LibraryJob::Create<FileOperationJob>(LibraryJob::Type::UpdateTags, CleanPath(path), tagreader_);
  job->set_tags(tags);
  StartJob(job);
  return job;

}

QFuture<SongList> LibraryEngine::Rescan() {

  return QtConcurrent::run(thread_pool_, &LibraryEngine::RescanBlocking, this);

}

SongList LibraryEngine::RescanBlocking() {

  SongList songs;
  SongList deleted_songs;
  SongList discovered_songs;

  {
    // Jobs that are running finish first, new ones wait until the catalog is replaced.
    ScopedLockBarrier barrier(&path_locks_);
    songs = scanner_.Scan(config_.directory);

    QMutexLocker l(&mutex_);
    QSet<QString> paths;
    for (const Song &song : std::as_const(songs)) {
      paths.insert(song.path());
      if (IndexOf(song.path()) == -1) discovered_songs << song;
    }
    for (const Song &song : std::as_const(catalog_)) {
      if (!paths.contains(song.path())) deleted_songs << song;
    }
    for (auto it = trim_bounds_.begin(); it != trim_bounds_.end();) {
      if (paths.contains(it.key())) ++it;
      else it = trim_bounds_.erase(it);
    }
    catalog_ = songs;
  }

  if (!deleted_songs.isEmpty()) Q_EMIT SongsDeleted(deleted_songs);
  if (!discovered_songs.isEmpty()) Q_EMIT SongsDiscovered(discovered_songs);
  Q_EMIT CatalogChanged();

  return songs;

}

LibraryResult LibraryEngine::SetTrimBounds(const QString &filename, const qint64 start_msec, const qint64 end_msec) {

  const QString path = CleanPath(filename);

  {
    QMutexLocker l(&mutex_);
    const qint64 i = IndexOf(path);
    if (i == -1) {
      return LibraryResult(LibraryResult::ErrorCode::NotFound, QString(), path);
    }
    if (!TrimJob::IsValidRange(start_msec, end_msec, catalog_.at(i).length_msec())) {
      return LibraryResult(LibraryResult::ErrorCode::InvalidRange, QString(), path);
    }
    trim_bounds_.insert(path, qMakePair(start_msec, end_msec));
  }

  Q_EMIT CatalogChanged();

  return LibraryResult();

}

void LibraryEngine::ClearTrimBounds(const QString &path) {

  {
    QMutexLocker l(&mutex_);
    if (trim_bounds_.remove(CleanPath(path)) == 0) return;
  }

  Q_EMIT CatalogChanged();

}

QList<LibraryJobPtr> LibraryEngine::RunningJobs() const {

  QMutexLocker l(&mutex_);
  return jobs_;

}

void LibraryEngine::CancelAll() {

  const QList<LibraryJobPtr> jobs = RunningJobs();
  for (LibraryJobPtr job : jobs) {
    job->Cancel();
  }

}

void LibraryEngine::StartJob(LibraryJobPtr job) {

  const int task_id = task_manager_->StartTask(LibraryJob::TypeName(job->type()), job->path());

  LibraryJob *job_ptr = job.data();
  QObject::connect(job_ptr, &LibraryJob::ProgressChanged, this, [this, task_id](const int progress) {
    task_manager_->SetTaskProgress(task_id, static_cast<quint64>(progress), 100);
  });
  QObject::connect(job_ptr, &LibraryJob::Finished, this, [this, task_id, job_ptr]() {
    task_manager_->SetTaskFinished(task_id);
    RemoveJob(job_ptr);
  });

  {
    QMutexLocker l(&mutex_);
    jobs_ << job;
  }

  (void)QtConcurrent::run(thread_pool_, &LibraryEngine::RunJob, this, job);

}

void LibraryEngine::RunJob(LibraryJobPtr job) {

  // Only the URL of a download is outside the library.
  if (job->type() != LibraryJob::Type::Download && !IsInLibrary(job->path())) {
    qLog(Error) << "Not starting" << LibraryJob::TypeName(job->type()) << "job," << job->path() << "is not in" << config_.directory;
    job->Finish(LibraryResult(LibraryResult::ErrorCode::NotFound, tr("Not in the library"), job->path(), tr("starting")));
    return;
  }

  ScopedPathLock lock(&path_locks_, job->LockPaths());
  if (!lock.is_locked()) {
    qLog(Warning) << "Not starting" << LibraryJob::TypeName(job->type()) << "job, another job is changing" << job->path();
    job->Finish(LibraryResult(LibraryResult::ErrorCode::ConcurrentMutation, tr("Another operation is changing this song"), job->path(), tr("starting")));
    return;
  }

  const LibraryResult result = job->Execute();
  if (result.success()) {
    PatchCatalog(*job);
  }

  // The catalog is up to date before anyone hears about the job finishing.
  job->Finish(result);

}

void LibraryEngine::PatchCatalog(const LibraryJob &job) {

  Song new_song;
  if (job.type() != LibraryJob::Type::Delete) {
    new_song = job.song();
    if (!new_song.is_valid()) new_song = scanner_.ScanFile(job.result_path());
  }

  SongList deleted_songs;
  SongList discovered_songs;
  SongList changed_songs;

  {
    QMutexLocker l(&mutex_);
    const qint64 i = IndexOf(job.path());

    switch (job.type()) {
      case LibraryJob::Type::Download:{
        if (!new_song.is_valid()) break;
        // A rescan while the job ran may have found the file already.
        const qint64 existing = IndexOf(new_song.path());
        if (existing != -1) {
          catalog_[existing] = new_song;
          changed_songs << new_song;
        }
        else {
          catalog_ << new_song;
          discovered_songs << new_song;
        }
        break;
      }

      case LibraryJob::Type::Delete:
        if (i != -1) {
          deleted_songs << catalog_.takeAt(i);
        }
        trim_bounds_.remove(job.path());
        break;

      case LibraryJob::Type::Hide:
      case LibraryJob::Type::Show:
      case LibraryJob::Type::ToggleVisibility:
        if (job.result_path() == job.path() || i == -1) break;
        // The song has a new identity, it keeps its place in the list.
        deleted_songs << catalog_.at(i);
        catalog_[i] = new_song;
        discovered_songs << new_song;
        if (trim_bounds_.contains(job.path())) {
          trim_bounds_.insert(job.result_path(), trim_bounds_.take(job.path()));
        }
        break;

      case LibraryJob::Type::Trim:
      case LibraryJob::Type::UpdateTags:
        if (job.type() == LibraryJob::Type::Trim) trim_bounds_.remove(job.path());
        if (!new_song.is_valid() || i == -1) break;
        catalog_[i] = new_song;
        changed_songs << new_song;
        break;
    }
  }

  if (!deleted_songs.isEmpty()) Q_EMIT SongsDeleted(deleted_songs);
  if (!discovered_songs.isEmpty()) Q_EMIT SongsDiscovered(discovered_songs);
  if (!changed_songs.isEmpty()) Q_EMIT SongsChanged(changed_songs);
  Q_EMIT CatalogChanged();

}

void LibraryEngine::RemoveJob(LibraryJob *job) {

  LibraryJobPtr finished_job;
  {
    QMutexLocker l(&mutex_);
    for (qint64 i = 0; i < jobs_.count(); ++i) {
      if (jobs_.at(i).data() == job) {
        finished_job = jobs_.takeAt(i);
        break;
      }
    }
  }

  if (finished_job) Q_EMIT JobFinished(finished_job);

}

Song LibraryEngine::ApplyTrimBounds(const Song &song) const {

  if (!trim_bounds_.contains(song.path())) return song;

  const QPair<qint64, qint64> bounds = trim_bounds_.value(song.path());
  Song copy(song);
  copy.set_trim_bounds(bounds.first, bounds.second);

  return copy;

}

bool LibraryEngine::IsInLibrary(const QString &path) const {

  if (path.isEmpty()) return false;

  return QDir::cleanPath(QFileInfo(path).absolutePath()) == QDir::cleanPath(config_.directory);

}

QString LibraryEngine::CleanPath(const QString &path) {

  if (path.isEmpty()) return path;
  return QDir::cleanPath(QFileInfo(path).absoluteFilePath());

}

qint64 LibraryEngine::IndexOf(const QString &path) const {

  for (qint64 i = 0; i < catalog_.count(); ++i) {
    if (catalog_.at(i).path() == path) return i;
  }

  return -1;

}
