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

#ifndef TASKMANAGER_H
#define TASKMANAGER_H

#include <QtGlobal>
#include <QObject>
#include <QMutex>
#include <QList>
#include <QMap>
#include <QString>

// Registry of running library jobs, for front ends that render a progress list.
class TaskManager : public QObject {
  Q_OBJECT

 public:
  explicit TaskManager(QObject *parent = nullptr);

  struct Task {
    Task() : id(0), progress(0), progress_max(0) {}
    int id;
    QString name;
    QString path;
    quint64 progress;
    quint64 progress_max;
  };

  // Everything here is thread safe
  QList<Task> GetTasks();

  int StartTask(const QString &name, const QString &path = QString());
  void SetTaskProgress(const int id, const quint64 progress, const quint64 max = 0);
  void SetTaskFinished(const int id);
  bool HasTaskForPath(const QString &path);

 Q_SIGNALS:
  void TasksChanged();

 private:
  QMutex mutex_;
  QMap<int, Task> tasks_;
  int next_task_id_;

  Q_DISABLE_COPY(TaskManager)
};

#endif  // TASKMANAGER_H
