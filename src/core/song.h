/*
 * CrossPlay
 * This file was part of Strawberry.
 * Copyright 2010, David Sansome <me@davidsansome.com>
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

#ifndef SONG_H
#define SONG_H

#include <QtGlobal>
#include <QMetaType>
#include <QSharedDataPointer>
#include <QList>
#include <QString>
#include <QUrl>
#include <QDateTime>

#include "provenance.h"

class QFileInfo;

// One audio file of the library, as last seen on disk.
// A Song is identified by its path, renaming the file makes it a different Song.
class Song {

 public:
  static const QString kAudibleExtension;
  static const QString kHiddenSuffix;

  Song();
  Song(const Song &other);
  ~Song();

  bool operator==(const Song &other) const;
  bool operator!=(const Song &other) const;
  Song &operator=(const Song &other);

  // Simple accessors
  bool is_valid() const;
  bool tag_error() const;

  const QString &title() const;
  const QString &artist() const;
  const QString &album() const;
  const QString &genre() const;
  const QString &comment() const;
  int track() const;
  int year() const;
  bool has_cover() const;

  qint64 length_nanosec() const;

  const QUrl &url() const;
  QString path() const;
  const QString &basefilename() const;
  qint64 filesize() const;
  qint64 mtime() const;

  const ProvenanceMap &provenance() const;
  QString provenance_value(const QString &key) const;

  bool has_trim_bounds() const;
  qint64 trim_beginning_msec() const;
  qint64 trim_end_msec() const;

  // Derived values
  bool is_visible() const;
  qint64 length_msec() const;
  QString source_url() const;
  QDateTime downloaded_at() const;
  QString PrettyTitle() const;
  QString TitleWithArtist() const;

  // Setters
  void set_valid(const bool v);
  void set_tag_error(const bool v);

  void set_title(const QString &v);
  void set_artist(const QString &v);
  void set_album(const QString &v);
  void set_genre(const QString &v);
  void set_comment(const QString &v);
  void set_track(const int v);
  void set_year(const int v);
  void set_has_cover(const bool v);

  void set_length_nanosec(const qint64 v);

  void set_url(const QUrl &v);
  void set_basefilename(const QString &v);
  void set_filesize(const qint64 v);
  void set_mtime(const qint64 v);

  void set_provenance(const ProvenanceMap &v);
  void set_provenance_value(const QString &key, const QString &value);

  void set_trim_bounds(const qint64 beginning_msec, const qint64 end_msec);
  void clear_trim_bounds();

  // Copies the embedded tag fields of other, leaves file attributes alone.
  bool IsTagsEqual(const Song &other) const;

  // Fills the file attributes from the filesystem.
  void InitFromFilePartial(const QString &filename, const QFileInfo &fileinfo);

  static bool IsVisibleFilename(const QString &filename);
  static bool IsHiddenFilename(const QString &filename);
  static bool IsAudioFilename(const QString &filename);
  static QString HiddenFilename(const QString &filename);
  static QString VisibleFilename(const QString &filename);

 private:
  struct Private;
  QSharedDataPointer<Private> d;
};

using SongList = QList<Song>;

Q_DECLARE_METATYPE(Song)
Q_DECLARE_METATYPE(SongList)

size_t qHash(const Song &song);

#endif  // SONG_H
