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

#include <QtGlobal>
#include <QObject>
#include <QByteArray>
#include <QString>
#include <QStringList>
#include <QProcess>
#include <QElapsedTimer>

#include "core/logging.h"
#include "externalprocess.h"

using namespace Qt::Literals::StringLiterals;

namespace {
constexpr int kStartTimeoutMsec = 10000;
constexpr int kPollIntervalMsec = 100;
constexpr int kTerminateTimeoutMsec = 3000;
constexpr int kStandardErrorTailLines = 5;
}

ExternalProcess::ExternalProcess(const ToolCommand &command) : command_(command), timeout_msec_(0) {}

QString ExternalProcess::Result::ErrorDescription() const {

  QString description;
  if (failed_to_start) {
    description = QObject::tr("Could not start tool: %1").arg(error_text);
  }
  else if (canceled) {
    description = QObject::tr("Canceled");
  }
  else if (timed_out) {
    description = QObject::tr("Tool timed out");
  }
  else if (crashed) {
    description = QObject::tr("Tool crashed");
  }
  else if (exit_code != 0) {
    description = QObject::tr("Tool exited with code %1").arg(exit_code);
  }

  const QStringList lines = QString::fromUtf8(standard_error).trimmed().split(u'\n', Qt::SkipEmptyParts);
  if (!lines.isEmpty()) {
    description += QLatin1String(": ") + lines.mid(qMax(0, static_cast<int>(lines.count()) - kStandardErrorTailLines)).join(u' ').simplified();
  }

  return description;

}

ExternalProcess::Result ExternalProcess::Run() {

  Result result;

  if (!command_.is_valid()) {
    result.failed_to_start = true;
    result.error_text = QObject::tr("No program configured");
    return result;
  }

  qLog(Debug) << "Running" << command_.ToString();

  QProcess process;
  process.setProgram(command_.program());
  process.setArguments(command_.Arguments());
  process.setProcessChannelMode(QProcess::SeparateChannels);
  process.start(QIODevice::ReadOnly);
  if (!process.waitForStarted(kStartTimeoutMsec)) {
    result.failed_to_start = true;
    result.error_text = process.errorString();
    qLog(Error) << "Could not start" << command_.program() << result.error_text;
    return result;
  }

  QElapsedTimer timer;
  timer.start();
  QByteArray line_buffer;

  while (process.state() != QProcess::NotRunning) {
    process.waitForFinished(kPollIntervalMsec);
    const QByteArray output = process.readAllStandardOutput();
    result.standard_output += output;
    HandleOutput(output, &line_buffer, false);
    result.standard_error += process.readAllStandardError();

    if (process.state() == QProcess::NotRunning) break;

    if (cancel_check_ && cancel_check_()) {
      result.canceled = true;
    }
    else if (timeout_msec_ > 0 && timer.elapsed() > timeout_msec_) {
      result.timed_out = true;
    }

    if (result.canceled || result.timed_out) {
      qLog(Info) << "Stopping" << command_.program() << (result.canceled ? "on request" : "after timeout");
      process.terminate();
      if (!process.waitForFinished(kTerminateTimeoutMsec)) {
        process.kill();
        process.waitForFinished(kTerminateTimeoutMsec);
      }
      break;
    }
  }

  const QByteArray output = process.readAllStandardOutput();
  result.standard_output += output;
  HandleOutput(output, &line_buffer, true);
  result.standard_error += process.readAllStandardError();

  result.crashed = process.exitStatus() == QProcess::CrashExit && !result.canceled && !result.timed_out;
  result.exit_code = process.exitCode();

  qLog(Debug) << command_.program() << "finished with exit code" << result.exit_code << "after" << timer.elapsed() << "ms";

  return result;

}

void ExternalProcess::HandleOutput(const QByteArray &data, QByteArray *line_buffer, const bool flush) {

  line_buffer->append(data);

  // Progress output often ends lines with a carriage return only.
  qint64 start = 0;
  for (qint64 i = 0; i < line_buffer->size(); ++i) {
    const char c = line_buffer->at(i);
    if (c != '\n' && c != '\r') continue;
    const QString line = QString::fromUtf8(line_buffer->mid(start, i - start)).trimmed();
    if (!line.isEmpty() && line_handler_) line_handler_(line);
    start = i + 1;
  }
  line_buffer->remove(0, start);

  if (flush && !line_buffer->isEmpty()) {
    const QString line = QString::fromUtf8(*line_buffer).trimmed();
    if (!line.isEmpty() && line_handler_) line_handler_(line);
    line_buffer->clear();
  }

}
