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
#include <QString>
#include <QStringList>
#include <QDateTime>

#include "constants/timeconstants.h"
#include "timeutils.h"

using namespace Qt::Literals::StringLiterals;

namespace Utilities {

QString PrettyTime(int seconds) {

  seconds = qAbs(seconds);

  int hours = seconds / (60 * 60);
  int minutes = (seconds / 60) % 60;
  seconds %= 60;

  QString ret;
  if (hours > 0) ret = QString::asprintf("%d:%02d:%02d", hours, minutes, seconds);
  else ret = QString::asprintf("%d:%02d", minutes, seconds);

  return ret;

}

QString PrettyTimeMsec(const qint64 msec) {
  return PrettyTime(static_cast<int>(msec / kMsecPerSec)) + QString::asprintf(".%03d", static_cast<int>(qAbs(msec) % kMsecPerSec));
}

qint64 ParseTimeMsec(const QString &text) {

  const QString trimmed = text.trimmed();
  if (trimmed.isEmpty()) return -1;

  const QStringList parts = trimmed.split(u':');
  if (parts.count() > 3) return -1;

  qint64 msec = 0;
  for (qint64 i = 0; i < parts.count(); ++i) {
    const QString &part = parts[i];
    const bool last = i == parts.count() - 1;
    if (part.isEmpty()) return -1;
    if (last) {
      bool ok = false;
      const double seconds = part.toDouble(&ok);
      if (!ok || seconds < 0 || part.startsWith(u'+') || part.contains(u'e', Qt::CaseInsensitive)) return -1;
      if (parts.count() > 1 && seconds >= 60) return -1;
      msec = msec * kSecsPerMin * kMsecPerSec + qRound64(seconds * kMsecPerSec);
    }
    else {
      bool ok = false;
      const qint64 value = part.toLongLong(&ok);
      if (!ok || value < 0) return -1;
      if (i > 0 && value >= 60) return -1;
      msec = msec * kSecsPerMin + value;
    }
  }

  return msec;

}

QString SecondsArgument(const qint64 msec) {
  return QString::asprintf("%lld.%03lld", msec / kMsecPerSec, msec % kMsecPerSec);
}

QString CurrentUtcTimestamp() {
  return QDateTime::currentDateTimeUtc().toString(Qt::ISODate);
}

}  // namespace Utilities
