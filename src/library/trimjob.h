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

#ifndef TRIMJOB_H
#define TRIMJOB_H

#include <QtGlobal>
#include <QObject>
#include <QString>

#include "includes/shared_ptr.h"
#include "libraryjob.h"
#include "libraryconfig.h"
#include "toolcommand.h"

class TagReaderBase;

// Cuts a song down to [start, end] in place.
// The cut is written to a temporary file which gets a copy of all tags and then replaces the song.
// If anything fails the song is left exactly as it was.
class TrimJob : public LibraryJob {
  Q_OBJECT

 public:
  explicit TrimJob(const QString &filename, const qint64 start_msec, const qint64 end_msec, const LibraryConfig &config, SharedPtr<TagReaderBase> tagreader, QObject *parent = nullptr);

  qint64 start_msec() const { return start_msec_; }
  qint64 end_msec() const { return end_msec_; }

  static bool IsValidRange(const qint64 start_msec, const qint64 end_msec, const qint64 length_msec);

 protected:
  LibraryResult Run() override;

 private:
  const qint64 start_msec_;
  const qint64 end_msec_;
  const ToolCommand trim_command_;
  const qint64 timeout_msec_;
  SharedPtr<TagReaderBase> tagreader_;
};

#endif  // TRIMJOB_H
