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

#ifndef TOOLCOMMAND_H
#define TOOLCOMMAND_H

#include <QMap>
#include <QString>
#include <QStringList>

// Command line of an external tool, built from a configured argument template.
// Placeholders like %input% are replaced by values before the tool is started.
// An argument that only consists of a placeholder always stays one argument, even if the value has spaces.
class ToolCommand {
 public:
  ToolCommand();
  explicit ToolCommand(const QString &program, const QString &arguments_template);

  static constexpr char kUrl[] = "url";
  static constexpr char kInput[] = "input";
  static constexpr char kOutput[] = "output";
  static constexpr char kStart[] = "start";
  static constexpr char kEnd[] = "end";

  bool is_valid() const { return !program_.isEmpty(); }
  QString program() const { return program_; }

  ToolCommand &Set(const QString &name, const QString &value);

  // Placeholders of the template that have no value.
  QStringList MissingValues() const;

  QStringList Arguments() const;
  QString ToString() const;

 private:
  QString program_;
  QStringList argument_templates_;
  QMap<QString, QString> values_;
};

#endif  // TOOLCOMMAND_H
