/*
 * CrossPlay
 * This file was part of Strawberry.
 * Copyright 2024, Jonas Kvinge <jonas@jkvinge.net>
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

#include "tagreaderresult.h"

QString TagReaderResult::error_string() const {

  QString text;
  switch (error_code) {
    case ErrorCode::Success:
      return QObject::tr("Success");
    case ErrorCode::Unsupported:
      text = QObject::tr("File is unsupported");
      break;
    case ErrorCode::FilenameMissing:
      text = QObject::tr("Filename is missing");
      break;
    case ErrorCode::FileDoesNotExist:
      text = QObject::tr("File does not exist");
      break;
    case ErrorCode::FileOpenError:
      text = QObject::tr("File could not be opened");
      break;
    case ErrorCode::FileParseError:
      text = QObject::tr("Could not parse tags");
      break;
    case ErrorCode::FileSaveError:
      text = QObject::tr("Could not save file");
      break;
    case ErrorCode::CustomError:
      return error_text;
  }

  if (text.isEmpty()) return QObject::tr("Unknown error");
  if (!error_text.isEmpty()) text += QLatin1String(": ") + error_text;

  return text;

}
