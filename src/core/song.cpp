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

#include <QtGlobal>
#include <QSharedData>
#include <QFileInfo>
#include <QString>
#include <QUrl>
#include <QDateTime>
#include <QHash>

#include "constants/timeconstants.h"
#include "provenance.h"
#include "song.h"

using namespace Qt::Literals::StringLiterals;

const QString Song::kAudibleExtension = u"mp3"_s;
const QString Song::kHiddenSuffix = u"hidden"_s;

struct Song::Private : public QSharedData {

  Private();

  bool valid_;
  bool tag_error_;  // The file has a tag block we could not parse

  QString title_;
  QString artist_;
  QString album_;
  QString genre_;
  QString comment_;
  int track_;
  int year_;
  bool has_cover_;  // An embedded picture, read only

  qint64 length_nanosec_;

  QUrl url_;
  QString basefilename_;
  qint64 filesize_;
  qint64 mtime_;

  ProvenanceMap provenance_;

  // Open trim proposal, never written to the file.
  qint64 trim_beginning_msec_;
  qint64 trim_end_msec_;

};

Song::Private::Private()
    : valid_(false),
      tag_error_(false),
      track_(-1),
      year_(-1),
      has_cover_(false),
      length_nanosec_(-1),
      filesize_(-1),
      mtime_(-1),
      trim_beginning_msec_(-1),
      trim_end_msec_(-1) {}

Song::Song() : d(new Private) {}
Song::Song(const Song &other) = default;
Song::~Song() = default;

bool Song::operator==(const Song &other) const {
  return url() == other.url();
}

bool Song::operator!=(const Song &other) const {
  return !operator==(other);
}

Song &Song::operator=(const Song &other) {
  d = other.d;
  return *this;
}

bool Song::is_valid() const { return d->valid_; }
bool Song::tag_error() const { return d->tag_error_; }

const QString &Song::title() const { return d->title_; }
const QString &Song::artist() const { return d->artist_; }
const QString &Song::album() const { return d->album_; }
const QString &Song::genre() const { return d->genre_; }
const QString &Song::comment() const { return d->comment_; }
int Song::track() const { return d->track_; }
int Song::year() const { return d->year_; }
bool Song::has_cover() const { return d->has_cover_; }

qint64 Song::length_nanosec() const { return d->length_nanosec_; }

const QUrl &Song::url() const { return d->url_; }
QString Song::path() const { return d->url_.toLocalFile(); }
const QString &Song::basefilename() const { return d->basefilename_; }
qint64 Song::filesize() const { return d->filesize_; }
qint64 Song::mtime() const { return d->mtime_; }

const ProvenanceMap &Song::provenance() const { return d->provenance_; }
QString Song::provenance_value(const QString &key) const { return d->provenance_.value(key); }

bool Song::has_trim_bounds() const { return d->trim_beginning_msec_ >= 0 && d->trim_end_msec_ > d->trim_beginning_msec_; }
qint64 Song::trim_beginning_msec() const { return d->trim_beginning_msec_; }
qint64 Song::trim_end_msec() const { return d->trim_end_msec_; }

void Song::set_valid(const bool v) { d->valid_ = v; }
void Song::set_tag_error(const bool v) { d->tag_error_ = v; }

void Song::set_title(const QString &v) { d->title_ = v; }
void Song::set_artist(const QString &v) { d->artist_ = v; }
void Song::set_album(const QString &v) { d->album_ = v; }
void Song::set_genre(const QString &v) { d->genre_ = v; }
void Song::set_comment(const QString &v) { d->comment_ = v; }
void Song::set_track(const int v) { d->track_ = v; }
void Song::set_year(const int v) { d->year_ = v; }
void Song::set_has_cover(const bool v) { d->has_cover_ = v; }

void Song::set_length_nanosec(const qint64 v) { d->length_nanosec_ = v; }

void Song::set_url(const QUrl &v) { d->url_ = v; }
void Song::set_basefilename(const QString &v) { d->basefilename_ = v; }
void Song::set_filesize(const qint64 v) { d->filesize_ = v; }
void Song::set_mtime(const qint64 v) { d->mtime_ = v; }

void Song::set_provenance(const ProvenanceMap &v) { d->provenance_ = v; }
void Song::set_provenance_value(const QString &key, const QString &value) { d->provenance_.insert(key, value); }

void Song::set_trim_bounds(const qint64 beginning_msec, const qint64 end_msec) {
  d->trim_beginning_msec_ = beginning_msec;
  d->trim_end_msec_ = end_msec;
}

void Song::clear_trim_bounds() {
  d->trim_beginning_msec_ = -1;
  d->trim_end_msec_ = -1;
}

bool Song::is_visible() const { return IsVisibleFilename(d->basefilename_); }

qint64 Song::length_msec() const {
  return d->length_nanosec_ < 0 ? -1 : d->length_nanosec_ / kNsecPerMsec;
}

QString Song::source_url() const {
  return d->provenance_.value(QLatin1String(Provenance::kSourceUrl));
}

QDateTime Song::downloaded_at() const {

  const QString value = d->provenance_.value(QLatin1String(Provenance::kDownloadedAt));
  if (value.isEmpty()) return QDateTime();

  return QDateTime::fromString(value, Qt::ISODate);

}

QString Song::PrettyTitle() const {

  QString title(d->title_);

  if (title.isEmpty()) title = d->basefilename_;
  if (title.isEmpty()) title = d->url_.toString();

  return title;

}

QString Song::TitleWithArtist() const {

  QString title(PrettyTitle());

  if (!d->artist_.isEmpty()) title = d->artist_ + u" - "_s + title;

  return title;

}

bool Song::IsTagsEqual(const Song &other) const {

  return d->title_ == other.d->title_ &&
         d->artist_ == other.d->artist_ &&
         d->album_ == other.d->album_ &&
         d->genre_ == other.d->genre_ &&
         d->comment_ == other.d->comment_ &&
         d->track_ == other.d->track_ &&
         d->year_ == other.d->year_ &&
         d->provenance_ == other.d->provenance_;

}

void Song::InitFromFilePartial(const QString &filename, const QFileInfo &fileinfo) {

  set_url(QUrl::fromLocalFile(filename));
  d->valid_ = fileinfo.exists();
  d->basefilename_ = fileinfo.fileName();
  d->filesize_ = fileinfo.size();
  d->mtime_ = fileinfo.lastModified().isValid() ? fileinfo.lastModified().toSecsSinceEpoch() : -1;

}

bool Song::IsVisibleFilename(const QString &filename) {

  const QString suffix = u'.' + kAudibleExtension;
  return filename.length() > suffix.length() && filename.endsWith(suffix, Qt::CaseInsensitive);

}

bool Song::IsHiddenFilename(const QString &filename) {

  const QString suffix = u'.' + kAudibleExtension + u'.' + kHiddenSuffix;
  return filename.length() > suffix.length() && filename.endsWith(suffix, Qt::CaseInsensitive);

}

bool Song::IsAudioFilename(const QString &filename) {
  return IsVisibleFilename(filename) || IsHiddenFilename(filename);
}

QString Song::HiddenFilename(const QString &filename) {

  if (!IsVisibleFilename(filename)) return filename;

  return filename + u'.' + kHiddenSuffix;

}

QString Song::VisibleFilename(const QString &filename) {

  if (!IsHiddenFilename(filename)) return filename;

  return filename.left(filename.length() - kHiddenSuffix.length() - 1);

}

size_t qHash(const Song &song) {
  return qHash(song.url().toString());
}
