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

#ifndef DOWNLOADJOB_H
#define DOWNLOADJOB_H

#include <QtGlobal>
#include <QObject>
#include <QString>
#include <QStringList>

#include "includes/shared_ptr.h"
#include "libraryjob.h"
#include "libraryconfig.h"
#include "toolcommand.h"

class TagReaderBase;
class PathLockManager;

// Turns a URL into a tagged MP3 file in the library directory.
// The fetch tool downloads the audio, the transcode tool converts it, then the tags and provenance are written.
// All work happens on hidden temporary files, the song only appears under its final name when it is complete.
class DownloadJob : public LibraryJob {
  Q_OBJECT

 public:
  explicit DownloadJob(const QString &url, const LibraryConfig &config, SharedPtr<TagReaderBase> tagreader, PathLockManager *path_locks = nullptr, QObject *parent = nullptr);

  // The final name is locked when the file is moved into place, not for the whole job.
  QStringList LockPaths() const override { return QStringList(); }

  struct FetchMetadata {
    QString title;
    QString uploader;
    QString id;
  };

  // Reads the metadata line and progress lines the fetch tool writes to stdout.
  static bool ParseMetadataLine(const QString &line, FetchMetadata *metadata);
  static double ParseProgressLine(const QString &line);

  // Only http and https addresses with a host are fetched.
  static bool IsValidUrl(const QString &url);

  static QString TitleFromUrl(const QString &url);
  static QString SourceIdFromUrl(const QString &url);

  // "Title.mp3", "Title (2).mp3", ...
  static QString CandidateFilename(const QString &directory, const QString &title, const int number);

 protected:
  LibraryResult Run() override;

 private:
  // Title from the metadata, else the source id, else the last path segment of the URL.
  QString MetadataTitle(const FetchMetadata &metadata) const;

  LibraryResult Fetch(const QString &output_filename, FetchMetadata *metadata);
  LibraryResult Transcode(const QString &input_filename, const QString &output_filename);
  LibraryResult Tag(const QString &filename, const FetchMetadata &metadata);
  LibraryResult MoveIntoPlace(const QString &filename, const QString &title, QString *final_filename);

 private:
  const QString directory_;
  const ToolCommand fetch_command_;
  const ToolCommand transcode_command_;
  const qint64 timeout_msec_;
  SharedPtr<TagReaderBase> tagreader_;
  PathLockManager *path_locks_;
};

#endif  // DOWNLOADJOB_H
