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

#ifndef COMMANDLINEOPTIONS_H
#define COMMANDLINEOPTIONS_H

#include <QtGlobal>
#include <QString>
#include <QStringList>

class CommandlineOptions {
 public:
  explicit CommandlineOptions(int argc = 0, char **argv = nullptr);

  enum class Command {
    None,
    List,
    Download,
    Trim,
    Hide,
    Show,
    Toggle,
    Delete,
    Tag,
    Rescan
  };

  // Exit codes of the command line tool.
  static constexpr int kExitSuccess = 0;
  static constexpr int kExitFailure = 1;
  static constexpr int kExitUsage = 2;

  // Returns false if the program should exit right away with exit_code().
  bool Parse();

  int exit_code() const { return exit_code_; }

  Command command() const { return command_; }
  QString command_name() const { return command_name_; }
  QStringList arguments() const { return arguments_; }

  // The song or URL the command works on.
  QString target() const { return arguments_.value(0); }
  qint64 start_msec() const { return start_msec_; }
  qint64 end_msec() const { return end_msec_; }

  QString library_directory() const { return library_directory_; }
  QString settings_filename() const { return settings_filename_; }
  QString sort_by() const { return sort_by_; }
  bool sort_reverse() const { return sort_reverse_; }
  bool include_hidden() const { return include_hidden_; }
  QString log_levels() const { return log_levels_; }

  // Tag values given for the tag command, null if not given.
  QString title() const { return title_; }
  QString artist() const { return artist_; }
  QString album() const { return album_; }
  QString genre() const { return genre_; }
  QString comment() const { return comment_; }
  int year() const { return year_; }
  int track() const { return track_; }

  static Command CommandFromString(const QString &name);

 private:
  // These are "invalid" characters to pass to getopt_long for options that shouldn't have a short (single character) option.
  enum LongOptions {
    Library = 256,
    SettingsFile,
    Sort,
    Reverse,
    Quiet,
    Verbose,
    LogLevels,
    Version,
    Title,
    Artist,
    Album,
    Genre,
    Comment,
    Year,
    Track
  };

  bool ParseCommand();
  bool UsageError(const QString &message);

  static QString OptArgToString(const char *opt);
  static QString DecodeName(char *opt);

 private:
  int argc_;
  char **argv_;

  int exit_code_;
  Command command_;
  QString command_name_;
  QStringList arguments_;
  qint64 start_msec_;
  qint64 end_msec_;

  QString library_directory_;
  QString settings_filename_;
  QString sort_by_;
  bool sort_reverse_;
  bool include_hidden_;
  QString log_levels_;

  QString title_;
  QString artist_;
  QString album_;
  QString genre_;
  QString comment_;
  int year_;
  int track_;
};

#endif  // COMMANDLINEOPTIONS_H
