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

#ifndef PATHLOCKS_H
#define PATHLOCKS_H

#include <QtGlobal>
#include <QMutex>
#include <QWaitCondition>
#include <QSet>
#include <QString>
#include <QStringList>

// Exclusive locks on library paths, so that one file is never changed by two jobs at once.
// Jobs on different paths do not block each other.
// A barrier waits for all held locks to be released and holds new ones back until it ends,
// so a full scan sees the directory between mutations.
class PathLockManager {
 public:
  PathLockManager();

  // Takes all paths or none. Waits while a barrier is active, fails at once if a path is held.
  bool TryLock(const QStringList &paths);
  void Unlock(const QStringList &paths);

  bool IsLocked(const QString &path) const;
  QSet<QString> LockedPaths() const;

  void BeginBarrier();
  void EndBarrier();
  bool barrier_active() const;

 private:
  mutable QMutex mutex_;
  QWaitCondition condition_;
  QSet<QString> locked_paths_;
  bool barrier_active_;

  Q_DISABLE_COPY(PathLockManager)
};

class ScopedPathLock {
 public:
  explicit ScopedPathLock(PathLockManager *manager, const QStringList &paths);
  ~ScopedPathLock();

  bool is_locked() const { return locked_; }

 private:
  PathLockManager *manager_;
  const QStringList paths_;
  bool locked_;

  Q_DISABLE_COPY(ScopedPathLock)
};

class ScopedLockBarrier {
 public:
  explicit ScopedLockBarrier(PathLockManager *manager) : manager_(manager) { manager_->BeginBarrier(); }
  ~ScopedLockBarrier() { manager_->EndBarrier(); }

 private:
  PathLockManager *manager_;

  Q_DISABLE_COPY(ScopedLockBarrier)
};

#endif  // PATHLOCKS_H
