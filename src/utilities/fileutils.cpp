/*
 * CrossPlay
 * This file was part of Strawberry.
 * Copyright 2010, David Sansome <me@davidsansome.com>
 * Copyright 2018-2021, Jonas Kvinge <jonas@jkvinge.net>
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

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <unistd.h>

#include <QByteArray>
#include <QString>
#include <QIODevice>
#include <QFile>

#include "core/logging.h"

#include "fileutils.h"

using namespace Qt::Literals::StringLiterals;

namespace Utilities {

namespace {
constexpr qint64 kCopyBlockSize = 64 * 1024;
}

bool Copy(QIODevice *source, QIODevice *destination) {

  if (!source->isOpen() && !source->open(QIODevice::ReadOnly)) return false;

  if (!destination->isOpen() && !destination->open(QIODevice::WriteOnly | QIODevice::Truncate)) return false;

  QByteArray block;
  while (!source->atEnd()) {
    block = source->read(kCopyBlockSize);
    if (block.isEmpty()) return false;

    qint64 pos = 0;
    while (pos < block.size()) {
      const qint64 bytes_written = destination->write(block.constData() + pos, block.size() - pos);
      if (bytes_written <= 0) return false;
      pos += bytes_written;
    }
  }

  return true;

}

bool CopyFile(const QString &source, const QString &destination, QString *error) {

  QFile source_file(source);
  QFile destination_file(destination);
  if (!source_file.open(QIODevice::ReadOnly)) {
    if (error) *error = source_file.errorString();
    return false;
  }
  if (!destination_file.open(QIODevice::WriteOnly | QIODevice::Truncate)) {
    if (error) *error = destination_file.errorString();
    return false;
  }

  if (!Copy(&source_file, &destination_file) || !destination_file.flush()) {
    if (error) *error = destination_file.error() != QFileDevice::NoError ? destination_file.errorString() : source_file.errorString();
    return false;
  }

  return true;

}

bool SyncFile(const QString &filename, QString *error) {

  QFile file(filename);
  if (!file.open(QIODevice::ReadWrite)) {
    if (error) *error = file.errorString();
    return false;
  }

  if (::fsync(file.handle()) != 0) {
    if (error) *error = QString::fromLocal8Bit(strerror(errno));
    return false;
  }

  return true;

}

bool ReplaceFile(const QString &source, const QString &destination, QString *error) {

  // QFile::rename() refuses to overwrite, rename(2) replaces the destination in one step.
  if (::rename(QFile::encodeName(source).constData(), QFile::encodeName(destination).constData()) != 0) {
    const QString error_text = QString::fromLocal8Bit(strerror(errno));
    qLog(Error) << "Could not move" << source << "to" << destination << error_text;
    if (error) *error = error_text;
    return false;
  }

  return true;

}

}  // namespace Utilities
