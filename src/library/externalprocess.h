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

#ifndef EXTERNALPROCESS_H
#define EXTERNALPROCESS_H

#include <functional>

#include <QtGlobal>
#include <QByteArray>
#include <QString>

#include "toolcommand.h"

// Runs an external tool to completion on the calling thread.
// The tool is killed when the cancel check returns true or when the timeout expires.
class ExternalProcess {
 public:
  explicit ExternalProcess(const ToolCommand &command);

  struct Result {
    Result() : exit_code(-1), failed_to_start(false), crashed(false), timed_out(false), canceled(false) {}
    int exit_code;
    bool failed_to_start;
    bool crashed;
    bool timed_out;
    bool canceled;
    QString error_text;
    QByteArray standard_output;
    QByteArray standard_error;

    bool success() const { return !failed_to_start && !crashed && !timed_out && !canceled && exit_code == 0; }

    // What went wrong, with the last lines the tool wrote to stderr.
    QString ErrorDescription() const;
  };

  using CancelCheck = std::function<bool()>;
  using LineHandler = std::function<void(const QString &line)>;

  void set_timeout_msec(const qint64 timeout_msec) { timeout_msec_ = timeout_msec; }
  void set_cancel_check(const CancelCheck &cancel_check) { cancel_check_ = cancel_check; }

  // Called for every line the tool writes to stdout, while it runs.
  void set_line_handler(const LineHandler &line_handler) { line_handler_ = line_handler; }

  Result Run();

 private:
  void HandleOutput(const QByteArray &data, QByteArray *line_buffer, const bool flush);

 private:
  ToolCommand command_;
  qint64 timeout_msec_;
  CancelCheck cancel_check_;
  LineHandler line_handler_;
};

#endif  // EXTERNALPROCESS_H
