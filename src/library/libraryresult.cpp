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

#include <QObject>
#include <QString>

#include "libraryresult.h"

QString LibraryResult::error_string() const {

  switch (error_code) {
    case ErrorCode::Success:
      return QObject::tr("Success");
    case ErrorCode::IoError:
      return QObject::tr("Could not read or write file");
    case ErrorCode::CorruptTag:
      return QObject::tr("Tags could not be parsed");
    case ErrorCode::FetchError:
      return QObject::tr("Download failed");
    case ErrorCode::TranscodeError:
      return QObject::tr("Conversion failed");
    case ErrorCode::NameCollision:
      return QObject::tr("A file with that name already exists");
    case ErrorCode::InvalidRange:
      return QObject::tr("Invalid time range");
    case ErrorCode::ConcurrentMutation:
      return QObject::tr("Song is busy");
    case ErrorCode::NotFound:
      return QObject::tr("File not found");
    case ErrorCode::Canceled:
      return QObject::tr("Canceled");
  }

  return QObject::tr("Unknown error");

}

QString LibraryResult::message() const {

  if (success()) return error_string();

  QString text = error_string();
  if (!stage.isEmpty()) text = QObject::tr("%1 while %2").arg(text, stage);
  if (!path.isEmpty()) text += QLatin1String(": ") + path;
  if (!error_text.isEmpty()) text += QLatin1String(" (") + error_text + QLatin1Char(')');

  return text;

}
