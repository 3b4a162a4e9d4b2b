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

#include <QString>
#include <QDir>
#include <QFile>
#include <QIODevice>
#include <QRandomGenerator>

#include "core/logging.h"

#include "temporaryfile.h"

using namespace Qt::Literals::StringLiterals;

namespace {
constexpr int kMaxAttempts = 100;
}

TemporaryFile::TemporaryFile(const QString &directory) {

  const QString filename_pattern = QDir(directory).filePath(QLatin1String(kFilenamePrefix) + "XXXXXX"_L1 + QLatin1String(kFilenameSuffix));

  // Opening with NewOnly reserves the name even if another job picks the same one.
  for (int i = 0; i < kMaxAttempts; ++i) {
    const QString filename = GenerateFilename(filename_pattern);
    QFile file(filename);
    if (file.open(QIODevice::WriteOnly | QIODevice::NewOnly)) {
      file.close();
      filename_ = filename;
      qLog(Debug) << "Temporary file" << filename_ << "created";
      return;
    }
  }

  qLog(Error) << "Could not create a temporary file in" << directory;

}

TemporaryFile::~TemporaryFile() {

  if (!Remove()) {
    qLog(Error) << "Could not delete temporary file" << filename_;
  }

}

bool TemporaryFile::IsTemporaryFilename(const QString &filename) {

  return filename.startsWith(QLatin1String(kFilenamePrefix)) && filename.endsWith(QLatin1String(kFilenameSuffix));

}

bool TemporaryFile::Remove() {

  if (filename_.isEmpty() || !QFile::exists(filename_)) return true;

  qLog(Debug) << "Deleting temporary file" << filename_;
  return QFile::remove(filename_);

}

QString TemporaryFile::GenerateFilename(const QString &filename_pattern) const {

  static const QString random_chars = u"abcdefghijklmnopqrstuvwxyz0123456789"_s;

  QString filename = filename_pattern;
  const qint64 start = filename.lastIndexOf(u'/') + 1;

  Q_FOREVER {
    const qint64 i = filename.indexOf(u'X', start);
    if (i == -1) break;
    const qint64 index = QRandomGenerator::global()->bounded(0, static_cast<int>(random_chars.length()));
    filename[i] = random_chars.at(index);
  }

  return filename;

}
