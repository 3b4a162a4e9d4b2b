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

#include "version.h"

#include <iostream>

#include <QtGlobal>
#include <QObject>
#include <QFile>
#include <QFileInfo>
#include <QString>
#include <QStringList>

#include "commandlineoptions.h"
#include "core/logging.h"
#include "utilities/timeutils.h"

#include <getopt.h>

using namespace Qt::Literals::StringLiterals;

namespace {

constexpr char kHelpText[] =
    "%1: crossplay [%2] <%3> [%4]\n"
    "\n"
    "%5:\n"
    "  list                         %6\n"
    "  download <url>               %7\n"
    "  trim <file> <start> <end>    %8\n"
    "  hide <file>                  %9\n"
    "  show <file>                  %10\n"
    "  toggle <file>                %11\n"
    "  delete <file>                %12\n"
    "  tag <file> [tag options]     %13\n"
    "  rescan                       %14\n"
    "\n"
    "%15:\n"
    "  -l, --library <directory>    %16\n"
    "      --settings <file>        %17\n"
    "  -s, --sort <field>           %18\n"
    "  -r, --reverse                %19\n"
    "  -a, --all                    %20\n"
    "\n"
    "%21:\n"
    "      --title <title>\n"
    "      --artist <artist>\n"
    "      --album <album>\n"
    "      --genre <genre>\n"
    "      --comment <comment>\n"
    "      --year <year>\n"
    "      --track <track>\n"
    "\n"
    "%22:\n"
    "  -h, --help                   %23\n"
    "      --quiet                  %24\n"
    "      --verbose                %25\n"
    "      --log-levels <levels>    %26\n"
    "      --version                %27\n";

constexpr char kVersionText[] = "CrossPlay %1";

}  // namespace

CommandlineOptions::CommandlineOptions(int argc, char **argv)
    : argc_(argc),
      argv_(argv),
      exit_code_(kExitSuccess),
      command_(Command::None),
      start_msec_(-1),
      end_msec_(-1),
      sort_reverse_(false),
      include_hidden_(false),
      log_levels_(QLatin1String(logging::kDefaultLogLevels)),
      year_(-1),
      track_(-1) {}

CommandlineOptions::Command CommandlineOptions::CommandFromString(const QString &name) {

  if (name == "list"_L1) return Command::List;
  if (name == "download"_L1) return Command::Download;
  if (name == "trim"_L1) return Command::Trim;
  if (name == "hide"_L1) return Command::Hide;
  if (name == "show"_L1) return Command::Show;
  if (name == "toggle"_L1) return Command::Toggle;
  if (name == "delete"_L1) return Command::Delete;
  if (name == "tag"_L1) return Command::Tag;
  if (name == "rescan"_L1) return Command::Rescan;

  return Command::None;

}

bool CommandlineOptions::Parse() {

  static const struct option kOptions[] = {
    { "help", no_argument, nullptr, 'h' },
    { "library", required_argument, nullptr, 'l' },
    { "settings", required_argument, nullptr, LongOptions::SettingsFile },
    { "sort", required_argument, nullptr, 's' },
    { "reverse", no_argument, nullptr, 'r' },
    { "all", no_argument, nullptr, 'a' },
    { "title", required_argument, nullptr, LongOptions::Title },
    { "artist", required_argument, nullptr, LongOptions::Artist },
    { "album", required_argument, nullptr, LongOptions::Album },
    { "genre", required_argument, nullptr, LongOptions::Genre },
    { "comment", required_argument, nullptr, LongOptions::Comment },
    { "year", required_argument, nullptr, LongOptions::Year },
    { "track", required_argument, nullptr, LongOptions::Track },
    { "quiet", no_argument, nullptr, LongOptions::Quiet },
    { "verbose", no_argument, nullptr, LongOptions::Verbose },
    { "log-levels", required_argument, nullptr, LongOptions::LogLevels },
    { "version", no_argument, nullptr, LongOptions::Version },
    { nullptr, 0, nullptr, 0 }
  };

  // Start over, so that more than one set of arguments can be parsed.
  optind = 0;

  // Parse the arguments
  bool ok = false;
  Q_FOREVER {
    int c = getopt_long(argc_, argv_, "hl:s:ra", kOptions, nullptr);

    // End of the options
    if (c == -1) break;

    switch (c) {
      case 'h':{
        QString translated_help_text =
            QString::fromUtf8(kHelpText)
                .arg(QObject::tr("Usage"), QObject::tr("options"), QObject::tr("command"), QObject::tr("arguments"),
                     QObject::tr("Commands"),
                     QObject::tr("List the songs in the library"),
                     QObject::tr("Download a URL into the library"),
                     QObject::tr("Cut a song to start and end, given as m:ss, m:ss.zzz or seconds"),
                     QObject::tr("Hide a song from the library"))
                .arg(QObject::tr("Make a hidden song visible again"),
                     QObject::tr("Hide a visible song, show a hidden song"),
                     QObject::tr("Delete a song permanently"),
                     QObject::tr("Change the tags of a song"),
                     QObject::tr("Scan the library directory again"),
                     QObject::tr("Library options"),
                     QObject::tr("Use <directory> as the library"),
                     QObject::tr("Read settings from an INI file"),
                     QObject::tr("Sort by title, artist, album or downloaded"))
                .arg(QObject::tr("Reverse the sort order"),
                     QObject::tr("List hidden songs too"),
                     QObject::tr("Tag options"),
                     QObject::tr("Other options"),
                     QObject::tr("Show this help"),
                     QObject::tr("Equivalent to --log-levels *:1"),
                     QObject::tr("Equivalent to --log-levels *:3"),
                     QObject::tr("Comma separated list of class:level, level is 0-3"),
                     QObject::tr("Print out version information"));

        std::cout << translated_help_text.toLocal8Bit().constData();
        exit_code_ = kExitSuccess;
        return false;
      }

      case 'l':
        library_directory_ = QFileInfo(DecodeName(optarg)).absoluteFilePath();
        break;
      case 's':
        sort_by_ = OptArgToString(optarg);
        break;
      case 'r':
        sort_reverse_ = true;
        break;
      case 'a':
        include_hidden_ = true;
        break;
      case LongOptions::SettingsFile:
        settings_filename_ = DecodeName(optarg);
        break;
      case LongOptions::Title:
        title_ = OptArgToString(optarg);
        break;
      case LongOptions::Artist:
        artist_ = OptArgToString(optarg);
        break;
      case LongOptions::Album:
        album_ = OptArgToString(optarg);
        break;
      case LongOptions::Genre:
        genre_ = OptArgToString(optarg);
        break;
      case LongOptions::Comment:
        comment_ = OptArgToString(optarg);
        break;
      case LongOptions::Year:
        year_ = OptArgToString(optarg).toInt(&ok);
        if (!ok || year_ < 0) return UsageError(QObject::tr("Invalid year"));
        break;
      case LongOptions::Track:
        track_ = OptArgToString(optarg).toInt(&ok);
        if (!ok || track_ < 0) return UsageError(QObject::tr("Invalid track number"));
        break;
      case LongOptions::Quiet:
        log_levels_ = u"1"_s;
        break;
      case LongOptions::Verbose:
        log_levels_ = u"3"_s;
        break;
      case LongOptions::LogLevels:
        log_levels_ = OptArgToString(optarg);
        break;
      case LongOptions::Version:{
        QString version_text = QString::fromUtf8(kVersionText).arg(QLatin1String(CROSSPLAY_VERSION_DISPLAY));
        std::cout << version_text.toLocal8Bit().constData() << std::endl;
        exit_code_ = kExitSuccess;
        return false;
      }

      case '?':
      default:
        exit_code_ = kExitUsage;
        return false;
    }
  }

  // The command and its arguments follow the options
  for (int i = optind; i < argc_; ++i) {
    const QString value = DecodeName(argv_[i]);
    if (command_name_.isEmpty()) {
      command_name_ = value;
    }
    else {
      arguments_ << value;
    }
  }

  return ParseCommand();

}

bool CommandlineOptions::ParseCommand() {

  if (command_name_.isEmpty()) {
    return UsageError(QObject::tr("No command given, see --help"));
  }

  command_ = CommandFromString(command_name_);

  qint64 expected_arguments = 1;
  switch (command_) {
    case Command::None:
      return UsageError(QObject::tr("Unknown command %1").arg(command_name_));
    case Command::List:
    case Command::Rescan:
      expected_arguments = 0;
      break;
    case Command::Trim:
      expected_arguments = 3;
      break;
    default:
      break;
  }

  if (arguments_.count() != expected_arguments) {
    return UsageError(QObject::tr("%1 takes %2 arguments").arg(command_name_).arg(expected_arguments));
  }

  if (command_ == Command::Trim) {
    start_msec_ = Utilities::ParseTimeMsec(arguments_.at(1));
    end_msec_ = Utilities::ParseTimeMsec(arguments_.at(2));
    if (start_msec_ < 0 || end_msec_ < 0) {
      return UsageError(QObject::tr("Invalid time, use m:ss, m:ss.zzz or seconds"));
    }
  }

  if (command_ != Command::Download && !arguments_.isEmpty()) {
    arguments_[0] = QFileInfo(arguments_.at(0)).absoluteFilePath();
  }

  return true;

}

bool CommandlineOptions::UsageError(const QString &message) {

  std::cerr << "crossplay: " << message.toLocal8Bit().constData() << std::endl;
  exit_code_ = kExitUsage;
  return false;

}

QString CommandlineOptions::OptArgToString(const char *opt) {

  return QString::fromUtf8(opt);
}

QString CommandlineOptions::DecodeName(char *opt) {

  return QFile::decodeName(opt);

}
