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

#include <cmath>

#include <QtGlobal>
#include <QByteArray>
#include <QFile>
#include <QIODevice>
#include <QString>

#include "silentmp3.h"

namespace SilentMp3 {

bool Write(const QString &filename, const qint64 duration_msec) {

  QByteArray frame(kFrameSize, '\0');
  frame[0] = static_cast<char>(0xFF);
  frame[1] = static_cast<char>(0xFB);
  frame[2] = static_cast<char>(0x90);
  frame[3] = static_cast<char>(0x64);

  const qint64 frames = qMax(static_cast<qint64>(2), static_cast<qint64>(std::llround(static_cast<double>(duration_msec) / kFrameDurationMsec)));

  QFile file(filename);
  if (!file.open(QIODevice::WriteOnly | QIODevice::Truncate)) return false;

  QByteArray data;
  data.reserve(static_cast<qsizetype>(frames * kFrameSize));
  for (qint64 i = 0; i < frames; ++i) {
    data.append(frame);
  }

  const bool success = file.write(data) == data.size();
  file.close();

  return success;

}

}  // namespace SilentMp3
