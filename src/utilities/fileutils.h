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

#ifndef FILEUTILS_H
#define FILEUTILS_H

#include <QByteArray>
#include <QString>

class QIODevice;

namespace Utilities {

bool Copy(QIODevice *source, QIODevice *destination);
bool CopyFile(const QString &source, const QString &destination, QString *error = nullptr);

// Flushes the file contents to disk.
bool SyncFile(const QString &filename, QString *error = nullptr);

// Atomically renames source over destination, replacing an existing destination.
// Both paths must be on the same filesystem.
bool ReplaceFile(const QString &source, const QString &destination, QString *error = nullptr);

}  // namespace Utilities

#endif  // FILEUTILS_H
