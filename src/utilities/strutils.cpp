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

#include <QString>
#include <QChar>

#include "strutils.h"

using namespace Qt::Literals::StringLiterals;

namespace Utilities {

namespace {
constexpr qint64 kMaxFilenameLength = 180;
}

QString PrettySize(const quint64 bytes) {

  QString ret;

  if (bytes > 0LL) {
    if (bytes <= 1000LL) {
      ret = QString::number(bytes) + " bytes"_L1;
    }
    else if (bytes <= 1000LL * 1000LL) {
      ret = QString::asprintf("%.1f KB", static_cast<float>(bytes) / 1000.0F);
    }
    else if (bytes <= 1000LL * 1000LL * 1000LL) {
      ret = QString::asprintf("%.1f MB", static_cast<float>(bytes) / (1000.0F * 1000.0F));
    }
    else {
      ret = QString::asprintf("%.1f GB", static_cast<float>(bytes) / (1000.0F * 1000.0F * 1000.0F));
    }
  }
  return ret;

}

QString SanitizeFilename(const QString &title) {

  QString filename;
  filename.reserve(title.length());
  for (const QChar c : title) {
    if (c == u'/' || c == u'\\' || c == u':' || c == u'*' || c == u'?' || c == u'"' || c == u'<' || c == u'>' || c == u'|') {
      filename.append(u'_');
    }
    else if (c.category() == QChar::Other_Control || c == QChar::Null) {
      continue;
    }
    else {
      filename.append(c);
    }
  }

  filename = filename.simplified();

  // A leading dot would hide the file and could collide with our temporary files.
  while (filename.startsWith(u'.')) {
    filename.remove(0, 1);
  }

  if (filename.length() > kMaxFilenameLength) {
    filename.truncate(kMaxFilenameLength);
    filename = filename.trimmed();
  }

  return filename;

}

}  // namespace Utilities
