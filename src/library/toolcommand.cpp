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

#include <QMap>
#include <QString>
#include <QStringList>
#include <QProcess>
#include <QRegularExpression>
#include <QRegularExpressionMatch>
#include <QRegularExpressionMatchIterator>

#include "toolcommand.h"

using namespace Qt::Literals::StringLiterals;

namespace {

const QRegularExpression &PlaceholderRegex() {
  static const QRegularExpression regex(u"%([a-z_]+)%"_s);
  return regex;
}

}  // namespace

ToolCommand::ToolCommand() = default;

ToolCommand::ToolCommand(const QString &program, const QString &arguments_template)
    : program_(program.trimmed()),
      argument_templates_(QProcess::splitCommand(arguments_template)) {}

ToolCommand &ToolCommand::Set(const QString &name, const QString &value) {

  values_.insert(name, value);
  return *this;

}

QStringList ToolCommand::MissingValues() const {

  QStringList missing;
  for (const QString &argument : argument_templates_) {
    QRegularExpressionMatchIterator it = PlaceholderRegex().globalMatch(argument);
    while (it.hasNext()) {
      const QString name = it.next().captured(1);
      if (!values_.contains(name) && !missing.contains(name)) {
        missing << name;
      }
    }
  }

  return missing;

}

QStringList ToolCommand::Arguments() const {

  QStringList arguments;
  arguments.reserve(argument_templates_.count());

  for (const QString &argument : argument_templates_) {
    QString expanded;
    qint64 pos = 0;
    QRegularExpressionMatchIterator it = PlaceholderRegex().globalMatch(argument);
    while (it.hasNext()) {
      const QRegularExpressionMatch match = it.next();
      expanded += argument.mid(pos, match.capturedStart() - pos);
      const QString name = match.captured(1);
      expanded += values_.contains(name) ? values_.value(name) : match.captured(0);
      pos = match.capturedEnd();
    }
    expanded += argument.mid(pos);
    arguments << expanded;
  }

  return arguments;

}

QString ToolCommand::ToString() const {

  QStringList parts;
  parts << program_;
  const QStringList arguments = Arguments();
  for (const QString &argument : arguments) {
    if (argument.isEmpty() || argument.contains(u' ')) {
      parts << u'"' + argument + u'"';
    }
    else {
      parts << argument;
    }
  }

  return parts.join(u' ');

}
