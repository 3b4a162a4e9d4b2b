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
#include <QByteArray>
#include <QString>
#include <QStringList>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QUrl>
#include <QUrlQuery>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonParseError>
#include <QRegularExpression>
#include <QRegularExpressionMatch>

#include "includes/shared_ptr.h"
#include "core/logging.h"
#include "core/song.h"
#include "core/provenance.h"
#include "core/temporaryfile.h"
#include "utilities/strutils.h"
#include "utilities/timeutils.h"
#include "tagreader/tagreaderbase.h"
#include "tagreader/tagreaderresult.h"
#include "externalprocess.h"
#include "pathlocks.h"
#include "libraryresult.h"
#include "downloadjob.h"

using namespace Qt::Literals::StringLiterals;

namespace {
constexpr int kMaxCollisionNumber = 1000;
constexpr int kFetchProgressEnd = 80;
constexpr int kTranscodeProgressEnd = 95;
constexpr char kFallbackTitle[] = "download";
}

DownloadJob::DownloadJob(const QString &url, const LibraryConfig &config, SharedPtr<TagReaderBase> tagreader, PathLockManager *path_locks, QObject *parent)
    : LibraryJob(Type::Download, url, parent),
      directory_(config.directory),
      fetch_command_(config.FetchCommand()),
      transcode_command_(config.TranscodeCommand()),
      timeout_msec_(config.tool_timeout_msec()),
      tagreader_(tagreader),
      path_locks_(path_locks) {}

bool DownloadJob::ParseMetadataLine(const QString &line, FetchMetadata *metadata) {

  if (!line.startsWith(u'{')) return false;

  QJsonParseError error;
  const QJsonDocument json_document = QJsonDocument::fromJson(line.toUtf8(), &error);
  if (error.error != QJsonParseError::NoError || !json_document.isObject()) {
    qLog(Debug) << "Ignoring unparsable JSON line from fetch tool:" << error.errorString();
    return false;
  }

  const QJsonObject json_object = json_document.object();
  metadata->title = json_object["title"_L1].toString().trimmed();
  metadata->uploader = json_object["uploader"_L1].toString().trimmed();
  metadata->id = json_object["id"_L1].toString().trimmed();

  return true;

}

double DownloadJob::ParseProgressLine(const QString &line) {

  static const QRegularExpression regex_progress(u"(\\d+(?:\\.\\d+)?)%"_s);
  const QRegularExpressionMatch match = regex_progress.match(line);
  if (!match.hasMatch()) return -1;

  bool ok = false;
  const double percent = match.captured(1).toDouble(&ok);
  if (!ok || percent > 100) return -1;

  return percent;

}

QString DownloadJob::TitleFromUrl(const QString &url) {

  const QStringList segments = QUrl(url).path(QUrl::FullyDecoded).split(u'/', Qt::SkipEmptyParts);
  if (segments.isEmpty()) return QString();

  return QFileInfo(segments.last()).completeBaseName().trimmed();

}

QString DownloadJob::SourceIdFromUrl(const QString &url) {

  const QUrl qurl(url);
  const QUrlQuery url_query(qurl);
  if (url_query.hasQueryItem(u"v"_s)) {
    return url_query.queryItemValue(u"v"_s);
  }

  // Short links carry the id as the path.
  if (qurl.host() == "youtu.be"_L1) {
    return qurl.path().mid(1);
  }

  return QString();

}

bool DownloadJob::IsValidUrl(const QString &url) {

  const QUrl qurl(url, QUrl::StrictMode);
  if (!qurl.isValid() || qurl.host().isEmpty()) return false;

  return qurl.scheme() == "http"_L1 || qurl.scheme() == "https"_L1;

}

QString DownloadJob::CandidateFilename(const QString &directory, const QString &title, const int number) {

  QString basename = title;
  if (number > 1) {
    basename += QStringLiteral(" (%1)").arg(number);
  }

  return QDir(directory).filePath(basename + u'.' + Song::kAudibleExtension);

}

QString DownloadJob::MetadataTitle(const FetchMetadata &metadata) const {

  if (!metadata.title.isEmpty()) return metadata.title;

  const QString source_id = metadata.id.isEmpty() ? SourceIdFromUrl(path_) : metadata.id;
  if (!source_id.isEmpty()) return source_id;

  const QString url_title = TitleFromUrl(path_);
  if (!url_title.isEmpty()) return url_title;

  return QLatin1String(kFallbackTitle);

}

LibraryResult DownloadJob::Run() {

  // Anything else would reach the fetch tool as an option.
  if (!IsValidUrl(path_)) {
    qLog(Error) << "Refusing to fetch" << path_;
    return LibraryResult(LibraryResult::ErrorCode::FetchError, tr("Not a web address"), path_, tr("fetching"));
  }

  TemporaryFile fetch_file(directory_);
  TemporaryFile transcode_file(directory_);
  if (!fetch_file.is_valid() || !transcode_file.is_valid()) {
    return LibraryResult(LibraryResult::ErrorCode::IoError, tr("Could not create a temporary file"), directory_, tr("fetching"));
  }

  FetchMetadata metadata;

  SetState(State::Fetching);
  LibraryResult result = Fetch(fetch_file.filename(), &metadata);
  if (!result.success()) return result;

  SetState(State::Transcoding);
  result = Transcode(fetch_file.filename(), transcode_file.filename());
  if (!result.success()) return result;
  if (!fetch_file.Remove()) {
    qLog(Warning) << "Could not delete" << fetch_file.filename();
  }
  SetProgress(kTranscodeProgressEnd);

  if (cancel_requested()) return CanceledResult(tr("tagging"));

  SetState(State::Tagging);
  result = Tag(transcode_file.filename(), metadata);
  if (!result.success()) return result;

  if (cancel_requested()) return CanceledResult(tr("moving into place"));

  QString title = Utilities::SanitizeFilename(MetadataTitle(metadata));
  if (title.isEmpty()) title = QLatin1String(kFallbackTitle);

  QString final_filename;
  result = MoveIntoPlace(transcode_file.filename(), title, &final_filename);
  if (!result.success()) return result;
  transcode_file.Release();

  set_result_path(final_filename);

  Song song;
  const TagReaderResult read_result = tagreader_->ReadFile(final_filename, &song);
  if (!read_result.success()) {
    qLog(Error) << "Could not read back" << final_filename << read_result.error_string();
  }
  set_song(song);

  qLog(Info) << "Downloaded" << path_ << "to" << final_filename;

  return LibraryResult(LibraryResult::ErrorCode::Success, QString(), final_filename);

}

LibraryResult DownloadJob::Fetch(const QString &output_filename, FetchMetadata *metadata) {

  ToolCommand command = fetch_command_;
  command.Set(QLatin1String(ToolCommand::kUrl), path_).Set(QLatin1String(ToolCommand::kOutput), output_filename);

  ExternalProcess process(command);
  process.set_timeout_msec(timeout_msec_);
  process.set_cancel_check([this]() { return cancel_requested(); });
  process.set_line_handler([this, metadata](const QString &line) {
    if (ParseMetadataLine(line, metadata)) return;
    const double percent = ParseProgressLine(line);
    if (percent >= 0) {
      SetProgress(static_cast<int>(percent * kFetchProgressEnd / 100));
    }
  });

  const ExternalProcess::Result process_result = process.Run();
  if (process_result.canceled) return CanceledResult(tr("fetching"));
  if (!process_result.success()) {
    return LibraryResult(LibraryResult::ErrorCode::FetchError, process_result.ErrorDescription(), path_, tr("fetching"));
  }

  const QFileInfo fileinfo(output_filename);
  if (!fileinfo.exists() || fileinfo.size() == 0) {
    return LibraryResult(LibraryResult::ErrorCode::FetchError, tr("The fetch tool did not write any audio"), path_, tr("fetching"));
  }

  qLog(Debug) << "Fetched" << Utilities::PrettySize(static_cast<quint64>(fileinfo.size())) << "for" << path_;

  SetProgress(kFetchProgressEnd);

  return LibraryResult(LibraryResult::ErrorCode::Success);

}

LibraryResult DownloadJob::Transcode(const QString &input_filename, const QString &output_filename) {

  ToolCommand command = transcode_command_;
  command.Set(QLatin1String(ToolCommand::kInput), input_filename).Set(QLatin1String(ToolCommand::kOutput), output_filename);

  ExternalProcess process(command);
  process.set_timeout_msec(timeout_msec_);
  process.set_cancel_check([this]() { return cancel_requested(); });

  const ExternalProcess::Result process_result = process.Run();
  if (process_result.canceled) return CanceledResult(tr("transcoding"));
  if (!process_result.success()) {
    return LibraryResult(LibraryResult::ErrorCode::TranscodeError, process_result.ErrorDescription(), path_, tr("transcoding"));
  }

  if (QFileInfo(output_filename).size() == 0) {
    return LibraryResult(LibraryResult::ErrorCode::TranscodeError, tr("The transcode tool did not write any audio"), path_, tr("transcoding"));
  }

  return LibraryResult(LibraryResult::ErrorCode::Success);

}

LibraryResult DownloadJob::Tag(const QString &filename, const FetchMetadata &metadata) {

  Song song;
  song.set_title(MetadataTitle(metadata));
  song.set_artist(metadata.uploader);

  song.set_provenance_value(QLatin1String(Provenance::kSourceUrl), path_);
  song.set_provenance_value(QLatin1String(Provenance::kDownloadedAt), Utilities::CurrentUtcTimestamp());
  const QString source_id = metadata.id.isEmpty() ? SourceIdFromUrl(path_) : metadata.id;
  if (!source_id.isEmpty()) {
    song.set_provenance_value(QLatin1String(Provenance::kSourceId), source_id);
  }

  const TagReaderResult result = tagreader_->WriteFile(filename, song);
  if (!result.success()) {
    return LibraryResult(LibraryResult::ErrorCode::IoError, result.error_string(), path_, tr("tagging"));
  }

  return LibraryResult(LibraryResult::ErrorCode::Success);

}

LibraryResult DownloadJob::MoveIntoPlace(const QString &filename, const QString &title, QString *final_filename) {

  for (int number = 1; number <= kMaxCollisionNumber; ++number) {
    const QString candidate = CandidateFilename(directory_, title, number);

    // Holding the lock keeps two downloads from settling on the same name.
    if (path_locks_ && !path_locks_->TryLock(QStringList() << candidate)) continue;

    bool moved = false;
    if (!QFile::exists(candidate) && !QFile::exists(Song::HiddenFilename(candidate))) {
      // Never replaces an existing file.
      moved = QFile::rename(filename, candidate);
      if (!moved) {
        qLog(Warning) << "Could not move" << filename << "to" << candidate;
      }
    }

    if (path_locks_) path_locks_->Unlock(QStringList() << candidate);

    if (moved) {
      *final_filename = candidate;
      return LibraryResult(LibraryResult::ErrorCode::Success);
    }

    if (!QFile::exists(filename)) break;
  }

  return LibraryResult(LibraryResult::ErrorCode::NameCollision, tr("No free filename for \"%1\"").arg(title), directory_, tr("moving into place"));

}
