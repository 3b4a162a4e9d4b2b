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

#ifndef TIMEUTILS_H
#define TIMEUTILS_H

#include <QString>
#include <QDateTime>

namespace Utilities {

QString PrettyTime(int seconds);

// Formats milliseconds as "m:ss.zzz", or "h:mm:ss.zzz" past an hour.
QString PrettyTimeMsec(const qint64 msec);

// Parses "h:mm:ss", "m:ss" or plain seconds, each optionally followed by a fraction.
// Returns -1 if text is not a time.
qint64 ParseTimeMsec(const QString &text);

// Seconds with a millisecond fraction, the form external tools expect for positions.
QString SecondsArgument(const qint64 msec);

QString CurrentUtcTimestamp();

}  // namespace Utilities

#endif  // TIMEUTILS_H
