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

#ifndef LIBRARYSETTINGS_H
#define LIBRARYSETTINGS_H

namespace LibrarySettings {

constexpr char kSettingsGroup[] = "Library";

constexpr char kPath[] = "path";
constexpr char kFetchProgram[] = "fetch_program";
constexpr char kFetchArguments[] = "fetch_arguments";
constexpr char kTranscodeProgram[] = "transcode_program";
constexpr char kTranscodeArguments[] = "transcode_arguments";
constexpr char kTrimArguments[] = "trim_arguments";
constexpr char kTrimReencodeArguments[] = "trim_reencode_arguments";
constexpr char kTrimReencode[] = "trim_reencode";
constexpr char kWorkerThreads[] = "worker_threads";
constexpr char kToolTimeout[] = "tool_timeout";
constexpr char kSortBy[] = "sort_by";
constexpr char kSortReverse[] = "sort_reverse";

constexpr char kDefaultDirectoryName[] = "CrossPlay";
constexpr char kDefaultFetchProgram[] = "yt-dlp";
constexpr char kDefaultFetchArguments[] = "--no-playlist --no-part --force-overwrites --newline --progress --print-json -f bestaudio -o %output% -- %url%";
constexpr char kDefaultTranscodeProgram[] = "ffmpeg";
constexpr char kDefaultTranscodeArguments[] = "-nostdin -y -loglevel error -i %input% -vn -codec:a libmp3lame -q:a 2 -f mp3 %output%";
constexpr char kDefaultTrimArguments[] = "-nostdin -y -loglevel error -ss %start% -to %end% -i %input% -map 0:a -codec:a copy -f mp3 %output%";
constexpr char kDefaultTrimReencodeArguments[] = "-nostdin -y -loglevel error -ss %start% -to %end% -i %input% -map 0:a -codec:a libmp3lame -q:a 2 -f mp3 %output%";
constexpr int kDefaultWorkerThreads = 2;
constexpr int kDefaultToolTimeout = 600;

enum class SortBy {
  Title,
  Artist,
  Album,
  Downloaded
};

}  // namespace LibrarySettings

#endif  // LIBRARYSETTINGS_H
