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

#ifndef LIBRARYJOB_H
#define LIBRARYJOB_H

#include <utility>

#include <QtGlobal>
#include <QObject>
#include <QMetaType>
#include <QMutex>
#include <QString>
#include <QStringList>
#include <QSharedPointer>

#include "includes/mutex_protected.h"
#include "core/song.h"
#include "libraryresult.h"

// One asynchronous operation on one song, run by a worker of the library engine.
// The job is created and owned on the engine's thread, Execute() runs on a worker thread.
class LibraryJob : public QObject {
  Q_OBJECT

 public:
  enum class Type {
    Download,
    Trim,
    Hide,
    Show,
    ToggleVisibility,
    Delete,
    UpdateTags,
  };

  enum class State {
    Pending,
    Fetching,
    Transcoding,
    Tagging,
    Running,
    Complete,
    Failed,
    Canceled,
  };

  explicit LibraryJob(const Type type, const QString &path, QObject *parent = nullptr);
  ~LibraryJob() override;

  template<typename T, typename... Args>
  static QSharedPointer<T> Create(Args&&... args) {
    return QSharedPointer<T>(new T(std::forward<Args>(args)...));
  }

  static QString TypeName(const Type type);
  static QString StateName(const State state);

  Type type() const { return type_; }

  // The library path the job works on, the URL for downloads.
  QString path() const { return path_; }

  State state() const { return state_.value(); }
  int progress() const { return progress_.value(); }
  bool finished() const;

  LibraryResult result() const;
  bool success() const { return result().success(); }
  QString error() const { return result().message(); }

  // Where the song is after the job, empty for deletes and failed jobs.
  QString result_path() const;

  // The song as it was read back after the job.
  Song song() const;

  // Paths locked while the job runs.
  virtual QStringList LockPaths() const;

  // Safe to call from any thread, in any state.
  void Cancel();
  bool cancel_requested() const { return cancel_requested_.value(); }

  LibraryResult Execute();
  void Finish(const LibraryResult &result);

 Q_SIGNALS:
  void StateChanged(LibraryJob::State state);
  void ProgressChanged(const int progress);
  void Finished(const LibraryResult &result);

 protected:
  virtual LibraryResult Run() = 0;

  void SetState(const State state);
  void SetProgress(const int progress);
  void set_result_path(const QString &result_path);
  void set_song(const Song &song);

  LibraryResult CanceledResult(const QString &stage) const;

 private Q_SLOTS:
  void EmitFinished();

 protected:
  const Type type_;
  const QString path_;

 private:
  mutex_protected<State> state_;
  mutex_protected<int> progress_;
  mutex_protected<bool> cancel_requested_;

  mutable QMutex mutex_;
  LibraryResult result_;
  QString result_path_;
  Song song_;
};

using LibraryJobPtr = QSharedPointer<LibraryJob>;

Q_DECLARE_METATYPE(LibraryJob::State)

#endif  // LIBRARYJOB_H
