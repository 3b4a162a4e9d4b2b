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
#include <QObject>
#include <QString>
#include <QFile>
#include <QFileInfo>

#include "includes/shared_ptr.h"
#include "core/logging.h"
#include "core/song.h"
#include "core/provenance.h"
#include "core/temporaryfile.h"
#include "utilities/fileutils.h"
#include "utilities/timeutils.h"
#include "tagreader/tagreaderbase.h"
#include "tagreader/tagreaderresult.h"
#include "externalprocess.h"
#include "libraryresult.h"
#include "trimjob.h"

using namespace Qt::Literals::StringLiterals;

namespace {
constexpr int kCutProgressEnd = 80;
}

TrimJob::TrimJob(const QString &filename, const qint64 start_msec, const qint64 end_msec, const LibraryConfig &config, SharedPtr<TagReaderBase> tagreader, QObject *parent)
    : LibraryJob(Type::Trim, filename, parent),
      start_msec_(start_msec),
      end_msec_(end_msec),
      trim_command_(config.TrimCommand()),
      timeout_msec_(config.tool_timeout_msec()),
      tagreader_(tagreader) {}

bool TrimJob::IsValidRange(const qint64 start_msec, const qint64 end_msec, const qint64 length_msec) {
  return start_msec >= 0 && start_msec < end_msec && end_msec <= length_msec;
}

LibraryResult TrimJob::Run() {

  SetState(State::Running);

  Song song;
  const TagReaderResult read_result = tagreader_->ReadFile(path_, &song);
  if (read_result.error_code == TagReaderResult::ErrorCode::FileDoesNotExist) {
    return LibraryResult(LibraryResult::ErrorCode::NotFound, read_result.error_string(), path_, tr("reading"));
  }
  if (!read_result.success() && !read_result.corrupt_tag()) {
    return LibraryResult(LibraryResult::ErrorCode::IoError, read_result.error_string(), path_, tr("reading"));
  }

  if (!IsValidRange(start_msec_, end_msec_, song.length_msec())) {
    return LibraryResult(LibraryResult::ErrorCode::InvalidRange, tr("%1 to %2 is not within 0:00.000 to %3").arg(Utilities::PrettyTimeMsec(start_msec_), Utilities::PrettyTimeMsec(end_msec_), Utilities::PrettyTimeMsec(song.length_msec())), path_, tr("validating"));
  }

  TemporaryFile temporary_file(QFileInfo(path_).path());
  if (!temporary_file.is_valid()) {
    return LibraryResult(LibraryResult::ErrorCode::IoError, tr("Could not create a temporary file"), path_, tr("transcoding"));
  }

  SetState(State::Transcoding);

  ToolCommand command = trim_command_;
  command.Set(QLatin1String(ToolCommand::kInput), path_)
         .Set(QLatin1String(ToolCommand::kOutput), temporary_file.filename())
         .Set(QLatin1String(ToolCommand::kStart), Utilities::SecondsArgument(start_msec_))
         .Set(QLatin1String(ToolCommand::kEnd), Utilities::SecondsArgument(end_msec_));

  ExternalProcess process(command);
  process.set_timeout_msec(timeout_msec_);
  process.set_cancel_check([this]() { return cancel_requested(); });

  const ExternalProcess::Result process_result = process.Run();
  if (process_result.canceled) return CanceledResult(tr("transcoding"));
  if (!process_result.success()) {
    return LibraryResult(LibraryResult::ErrorCode::TranscodeError, process_result.ErrorDescription(), path_, tr("transcoding"));
  }
  if (QFileInfo(temporary_file.filename()).size() == 0) {
    return LibraryResult(LibraryResult::ErrorCode::TranscodeError, tr("The transcode tool did not write any audio"), path_, tr("transcoding"));
  }

  SetProgress(kCutProgressEnd);

  if (cancel_requested()) return CanceledResult(tr("tagging"));

  SetState(State::Tagging);

  ProvenanceMap provenance_update;
  provenance_update.insert(QLatin1String(Provenance::kTrimmed), u"1"_s);
  const TagReaderResult copy_result = tagreader_->CopyTags(path_, temporary_file.filename(), provenance_update);
  if (!copy_result.success()) {
    return LibraryResult(LibraryResult::ErrorCode::IoError, copy_result.error_string(), path_, tr("copying tags"));
  }

  if (!QFile::setPermissions(temporary_file.filename(), QFile::permissions(path_))) {
    qLog(Warning) << "Could not copy permissions of" << path_;
  }

  QString error;
  if (!Utilities::SyncFile(temporary_file.filename(), &error)) {
    return LibraryResult(LibraryResult::ErrorCode::IoError, error, path_, tr("replacing"));
  }

  if (cancel_requested()) return CanceledResult(tr("replacing"));

  if (!Utilities::ReplaceFile(temporary_file.filename(), path_, &error)) {
    return LibraryResult(LibraryResult::ErrorCode::IoError, error, path_, tr("replacing"));
  }
  temporary_file.Release();

  set_result_path(path_);

  Song trimmed_song;
  const TagReaderResult reread_result = tagreader_->ReadFile(path_, &trimmed_song);
  if (!reread_result.success()) {
    qLog(Error) << "Could not read back" << path_ << reread_result.error_string();
  }
  set_song(trimmed_song);

  qLog(Info) << "Trimmed" << path_ << "to" << Utilities::PrettyTimeMsec(start_msec_) << "-" << Utilities::PrettyTimeMsec(end_msec_);

  return LibraryResult(LibraryResult::ErrorCode::Success, QString(), path_);

}
