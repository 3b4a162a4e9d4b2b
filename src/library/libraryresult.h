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

#ifndef LIBRARYRESULT_H
#define LIBRARYRESULT_H

#include <QMetaType>
#include <QString>

// Outcome of a library operation, reported per job with the path and stage it failed at.
class LibraryResult {
 public:
  enum class ErrorCode {
    Success,
    IoError,
    CorruptTag,
    FetchError,
    TranscodeError,
    NameCollision,
    InvalidRange,
    ConcurrentMutation,
    NotFound,
    Canceled,
  };

  LibraryResult(const ErrorCode _error_code = ErrorCode::Success, const QString &_error_text = QString(), const QString &_path = QString(), const QString &_stage = QString())
      : error_code(_error_code), error_text(_error_text), path(_path), stage(_stage) {}

  ErrorCode error_code;
  QString error_text;
  QString path;
  QString stage;

  bool success() const { return error_code == ErrorCode::Success; }
  bool canceled() const { return error_code == ErrorCode::Canceled; }

  QString error_string() const;

  // Error string with path and stage, for messages shown to the user.
  QString message() const;
};

Q_DECLARE_METATYPE(LibraryResult)

#endif  // LIBRARYRESULT_H
