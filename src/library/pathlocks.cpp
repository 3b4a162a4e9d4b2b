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

#include <QMutex>
#include <QMutexLocker>
#include <QWaitCondition>
#include <QSet>
#include <QString>
#include <QStringList>

#include "core/logging.h"
#include "pathlocks.h"

PathLockManager::PathLockManager() : barrier_active_(false) {}

bool PathLockManager::TryLock(const QStringList &paths) {

  QMutexLocker l(&mutex_);

  while (barrier_active_) {
    condition_.wait(&mutex_);
  }

  for (const QString &path : paths) {
    if (locked_paths_.contains(path)) {
      qLog(Debug) << path << "is locked";
      return false;
    }
  }

  for (const QString &path : paths) {
    locked_paths_.insert(path);
  }

  return true;

}

void PathLockManager::Unlock(const QStringList &paths) {

  {
    QMutexLocker l(&mutex_);
    for (const QString &path : paths) {
      locked_paths_.remove(path);
    }
  }

  condition_.wakeAll();

}

bool PathLockManager::IsLocked(const QString &path) const {

  QMutexLocker l(&mutex_);
  return locked_paths_.contains(path);

}

QSet<QString> PathLockManager::LockedPaths() const {

  QMutexLocker l(&mutex_);
  return locked_paths_;

}

void PathLockManager::BeginBarrier() {

  QMutexLocker l(&mutex_);

  // One barrier at a time.
  while (barrier_active_) {
    condition_.wait(&mutex_);
  }
  barrier_active_ = true;

  if (!locked_paths_.isEmpty()) {
    qLog(Debug) << "Waiting for" << locked_paths_.count() << "locked paths";
  }
  while (!locked_paths_.isEmpty()) {
    condition_.wait(&mutex_);
  }

}

void PathLockManager::EndBarrier() {

  {
    QMutexLocker l(&mutex_);
    barrier_active_ = false;
  }

  condition_.wakeAll();

}

bool PathLockManager::barrier_active() const {

  QMutexLocker l(&mutex_);
  return barrier_active_;

}

ScopedPathLock::ScopedPathLock(PathLockManager *manager, const QStringList &paths)
    : manager_(manager),
      paths_(paths),
      locked_(manager->TryLock(paths)) {}

ScopedPathLock::~ScopedPathLock() {

  if (locked_) manager_->Unlock(paths_);

}
