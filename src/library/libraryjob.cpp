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

#include <QtGlobal>
#include <QObject>
#include <QMutex>
#include <QMutexLocker>
#include <QString>
#include <QStringList>

#include "core/logging.h"
#include "core/song.h"
#include "libraryresult.h"
#include "libraryjob.h"

using namespace Qt::Literals::StringLiterals;

LibraryJob::LibraryJob(const Type type, const QString &path, QObject *parent)
    : QObject(parent),
      type_(type),
      path_(path),
      state_(State::Pending),
      progress_(0),
      cancel_requested_(false) {

  qLog(Debug) << "New" << TypeName(type_) << "job for" << path_;

}

LibraryJob::~LibraryJob() {

  qLog(Debug) << TypeName(type_) << "job for" << path_ << "deleted";

}

QString LibraryJob::TypeName(const Type type) {

  switch (type) {
    case Type::Download:         return u"download"_s;
    case Type::Trim:             return u"trim"_s;
    case Type::Hide:             return u"hide"_s;
    case Type::Show:             return u"show"_s;
    case Type::ToggleVisibility: return u"toggle"_s;
    case Type::Delete:           return u"delete"_s;
    case Type::UpdateTags:       return u"tag"_s;
  }

  return QString();

}

QString LibraryJob::StateName(const State state) {

  switch (state) {
    case State::Pending:     return tr("Pending");
    case State::Fetching:    return tr("Fetching");
    case State::Transcoding: return tr("Transcoding");
    case State::Tagging:     return tr("Tagging");
    case State::Running:     return tr("Running");
    case State::Complete:    return tr("Complete");
    case State::Failed:      return tr("Failed");
    case State::Canceled:    return tr("Canceled");
  }

  return QString();

}

bool LibraryJob::finished() const {

  const State state = state_.value();
  return state == State::Complete || state == State::Failed || state == State::Canceled;

}

LibraryResult LibraryJob::result() const {

  QMutexLocker l(&mutex_);
  return result_;

}

QString LibraryJob::result_path() const {

  QMutexLocker l(&mutex_);
  return result_path_;

}

Song LibraryJob::song() const {

  QMutexLocker l(&mutex_);
  return song_;

}

QStringList LibraryJob::LockPaths() const {
  return QStringList() << path_;
}

void LibraryJob::Cancel() {

  if (finished()) return;

  if (!cancel_requested_.exchange(true)) {
    qLog(Info) << "Canceling" << TypeName(type_) << "job for" << path_;
  }

}

LibraryResult LibraryJob::Execute() {

  if (cancel_requested()) {
    return CanceledResult(tr("starting"));
  }

  LibraryResult result = Run();

  // A job that completed its last step stays complete, even if it was canceled meanwhile.
  if (!result.success() && cancel_requested()) {
    result = CanceledResult(result.stage);
  }

  return result;

}

void LibraryJob::Finish(const LibraryResult &result) {

  {
    QMutexLocker l(&mutex_);
    result_ = result;
    if (!result.success()) {
      result_path_.clear();
    }
  }

  if (result.success()) {
    SetProgress(100);
    SetState(State::Complete);
  }
  else if (result.canceled()) {
    SetState(State::Canceled);
  }
  else {
    qLog(Error) << TypeName(type_) << "job failed:" << result.message();
    SetState(State::Failed);
  }

  QMetaObject::invokeMethod(this, &LibraryJob::EmitFinished, Qt::QueuedConnection);

}

void LibraryJob::EmitFinished() {

  Q_EMIT Finished(result());

}

void LibraryJob::SetState(const State state) {

  if (state_.exchange(state) == state) return;

  qLog(Debug) << TypeName(type_) << "job for" << path_ << "is" << StateName(state);

  Q_EMIT StateChanged(state);

}

void LibraryJob::SetProgress(const int progress) {

  const int value = qBound(0, progress, 100);
  if (progress_.exchange(value) == value) return;

  Q_EMIT ProgressChanged(value);

}

void LibraryJob::set_result_path(const QString &result_path) {

  QMutexLocker l(&mutex_);
  result_path_ = result_path;

}

void LibraryJob::set_song(const Song &song) {

  QMutexLocker l(&mutex_);
  song_ = song;

}

LibraryResult LibraryJob::CanceledResult(const QString &stage) const {
  return LibraryResult(LibraryResult::ErrorCode::Canceled, tr("Canceled"), path_, stage);
}
