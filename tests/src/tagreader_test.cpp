/*
 * CrossPlay
 * This file was part of Strawberry.
 * Copyright 2020-2025, Jonas Kvinge <jonas@jkvinge.net>
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

#include "gtest_include.h"

#include <taglib/tstring.h>
#include <taglib/mpegfile.h>
#include <taglib/id3v2tag.h>
#include <taglib/commentsframe.h>
#include <taglib/attachedpictureframe.h>

#include <QFile>
#include <QByteArray>
#include <QString>
#include <QTemporaryDir>

#include "core/song.h"
#include "core/provenance.h"
#include "tagreader/tagreaderresult.h"
#include "tagreader/tagreadertaglib.h"

#include "test_utils.h"

using namespace Qt::Literals::StringLiterals;

// clazy:excludeall=non-pod-global-static

namespace {

class TagReaderTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ASSERT_TRUE(temp_dir_.isValid());
  }

  QString CreateMp3(const QString &basename, const qint64 duration_msec = 180000) const {
    return TestUtils::CreateMp3(temp_dir_.path(), basename, duration_msec);
  }

  Song ReadSongFromFile(const QString &filename) const {
    Song song;
    const TagReaderResult result = tagreader_.ReadFile(filename, &song);
    EXPECT_TRUE(result.success()) << result.error_string();
    return song;
  }

  // Adds a comment frame the way other programs or older versions wrote them.
  static bool AddCommentsFrame(const QString &filename, const QString &description, const QString &text) {
    TagLib::MPEG::File file(QFile::encodeName(filename).constData(), false);
    if (!file.isValid()) return false;
    TagLib::ID3v2::CommentsFrame *frame = new TagLib::ID3v2::CommentsFrame(TagLib::String::UTF8);
    frame->setLanguage("eng");
    frame->setDescription(TagReaderTagLib::QStringToTagLibString(description));
    frame->setText(TagReaderTagLib::QStringToTagLibString(text));
    file.ID3v2Tag(true)->addFrame(frame);
    return file.save(TagLib::MPEG::File::ID3v2);
  }

  static bool AddCover(const QString &filename) {
    TagLib::MPEG::File file(QFile::encodeName(filename).constData(), false);
    if (!file.isValid()) return false;
    TagLib::ID3v2::AttachedPictureFrame *frame = new TagLib::ID3v2::AttachedPictureFrame;
    frame->setMimeType("image/png");
    frame->setType(TagLib::ID3v2::AttachedPictureFrame::FrontCover);
    frame->setPicture(TagLib::ByteVector("\x89PNG\r\n\x1a\n", 8));
    file.ID3v2Tag(true)->addFrame(frame);
    return file.save(TagLib::MPEG::File::ID3v2);
  }

  QTemporaryDir temp_dir_;
  TagReaderTagLib tagreader_;
};

TEST_F(TagReaderTest, ReadUntaggedFile) {

  const QString filename = CreateMp3(u"untagged.mp3"_s);
  ASSERT_FALSE(filename.isEmpty());

  const Song song = ReadSongFromFile(filename);
  EXPECT_TRUE(song.is_valid());
  EXPECT_FALSE(song.tag_error());
  EXPECT_NEAR(180000, song.length_msec(), 50);
  EXPECT_EQ(u"untagged.mp3"_s, song.basefilename());
  EXPECT_EQ(QFile(filename).size(), song.filesize());
  EXPECT_TRUE(song.title().isEmpty());
  EXPECT_TRUE(song.artist().isEmpty());
  EXPECT_TRUE(song.provenance().isEmpty());
  EXPECT_TRUE(song.is_visible());

}

TEST_F(TagReaderTest, WriteAndReadBackTags) {

  const QString filename = CreateMp3(u"song.mp3"_s);
  ASSERT_FALSE(filename.isEmpty());

  Song song = ReadSongFromFile(filename);
  song.set_title(u"Strange Title ÆØÅ"_s);
  song.set_artist(u"Some Artist"_s);
  song.set_album(u"An Album"_s);
  song.set_genre(u"Ambient"_s);
  song.set_comment(u"Just a comment"_s);
  song.set_year(2021);
  song.set_track(7);
  song.set_provenance_value(QLatin1String(Provenance::kSourceUrl), u"https://www.youtube.com/watch?v=abc;123"_s);
  song.set_provenance_value(QLatin1String(Provenance::kSourceId), u"abc;123"_s);

  const TagReaderResult result = tagreader_.WriteFile(filename, song);
  ASSERT_TRUE(result.success()) << result.error_string();

  const Song read_song = ReadSongFromFile(filename);
  EXPECT_EQ(u"Strange Title ÆØÅ"_s, read_song.title());
  EXPECT_EQ(u"Some Artist"_s, read_song.artist());
  EXPECT_EQ(u"An Album"_s, read_song.album());
  EXPECT_EQ(u"Ambient"_s, read_song.genre());
  EXPECT_EQ(u"Just a comment"_s, read_song.comment());
  EXPECT_EQ(2021, read_song.year());
  EXPECT_EQ(7, read_song.track());
  EXPECT_EQ(u"https://www.youtube.com/watch?v=abc;123"_s, read_song.source_url());
  EXPECT_EQ(u"abc;123"_s, read_song.provenance_value(QLatin1String(Provenance::kSourceId)));
  EXPECT_EQ(2, read_song.provenance().count());
  EXPECT_NEAR(180000, read_song.length_msec(), 50);

  // No staging files are left next to the song.
  EXPECT_EQ(QStringList() << u"song.mp3"_s, TestUtils::DirectoryEntries(temp_dir_.path()));

}

TEST_F(TagReaderTest, ClearTags) {

  const QString filename = CreateMp3(u"song.mp3"_s);
  ASSERT_FALSE(filename.isEmpty());

  Song song = ReadSongFromFile(filename);
  song.set_title(u"Title"_s);
  song.set_comment(u"Comment"_s);
  song.set_year(1999);
  ASSERT_TRUE(tagreader_.WriteFile(filename, song).success());

  song.set_title(QString());
  song.set_comment(QString());
  song.set_year(-1);
  ASSERT_TRUE(tagreader_.WriteFile(filename, song).success());

  const Song read_song = ReadSongFromFile(filename);
  EXPECT_TRUE(read_song.title().isEmpty());
  EXPECT_TRUE(read_song.comment().isEmpty());
  EXPECT_EQ(-1, read_song.year());

}

TEST_F(TagReaderTest, ProvenanceIsMergedAcrossWrites) {

  const QString filename = CreateMp3(u"song.mp3"_s);
  ASSERT_FALSE(filename.isEmpty());

  Song song;
  song.set_title(u"First"_s);
  song.set_provenance_value(QLatin1String(Provenance::kSourceUrl), u"https://example.com/a"_s);
  song.set_provenance_value(QLatin1String(Provenance::kDownloadedAt), u"2024-01-02T03:04:05Z"_s);
  ASSERT_TRUE(tagreader_.WriteFile(filename, song).success());

  // A write that only names some keys keeps the others.
  Song update;
  update.set_title(u"Second"_s);
  update.set_provenance_value(QLatin1String(Provenance::kMetadataEdited), u"1"_s);
  update.set_provenance_value(QLatin1String(Provenance::kSourceUrl), u"https://example.com/b"_s);
  ASSERT_TRUE(tagreader_.WriteFile(filename, update).success());

  const Song read_song = ReadSongFromFile(filename);
  EXPECT_EQ(u"Second"_s, read_song.title());
  ProvenanceMap expected;
  expected.insert(QLatin1String(Provenance::kSourceUrl), u"https://example.com/b"_s);
  expected.insert(QLatin1String(Provenance::kDownloadedAt), u"2024-01-02T03:04:05Z"_s);
  expected.insert(QLatin1String(Provenance::kMetadataEdited), u"1"_s);
  EXPECT_EQ(expected, read_song.provenance());

}

TEST_F(TagReaderTest, ReadHiddenFile) {

  const QString filename = CreateMp3(u"song.mp3"_s);
  ASSERT_FALSE(filename.isEmpty());

  Song song;
  song.set_title(u"Hidden Title"_s);
  song.set_artist(u"Hidden Artist"_s);
  ASSERT_TRUE(tagreader_.WriteFile(filename, song).success());

  const QString hidden_filename = Song::HiddenFilename(filename);
  ASSERT_TRUE(QFile::rename(filename, hidden_filename));

  const Song read_song = ReadSongFromFile(hidden_filename);
  EXPECT_FALSE(read_song.is_visible());
  EXPECT_EQ(u"Hidden Title"_s, read_song.title());
  EXPECT_EQ(u"Hidden Artist"_s, read_song.artist());
  EXPECT_NEAR(180000, read_song.length_msec(), 50);

}

TEST_F(TagReaderTest, CorruptFile) {

  const QString filename = temp_dir_.filePath(u"corrupt.mp3"_s);
  QFile file(filename);
  ASSERT_TRUE(file.open(QIODevice::WriteOnly));
  ASSERT_EQ(4096, file.write(QByteArray(4096, 'x')));
  file.close();

  Song song;
  const TagReaderResult result = tagreader_.ReadFile(filename, &song);
  EXPECT_EQ(TagReaderResult::ErrorCode::FileParseError, result.error_code);
  EXPECT_TRUE(result.corrupt_tag());

  // The file is still known, without tags.
  EXPECT_TRUE(song.is_valid());
  EXPECT_TRUE(song.tag_error());
  EXPECT_EQ(u"corrupt.mp3"_s, song.basefilename());
  EXPECT_TRUE(song.title().isEmpty());

}

TEST_F(TagReaderTest, MissingFile) {

  Song song;
  EXPECT_EQ(TagReaderResult::ErrorCode::FileDoesNotExist, tagreader_.ReadFile(temp_dir_.filePath(u"missing.mp3"_s), &song).error_code);
  EXPECT_EQ(TagReaderResult::ErrorCode::FileDoesNotExist, tagreader_.WriteFile(temp_dir_.filePath(u"missing.mp3"_s), song).error_code);
  EXPECT_EQ(TagReaderResult::ErrorCode::FilenameMissing, tagreader_.ReadFile(QString(), &song).error_code);

}

TEST_F(TagReaderTest, CopyTags) {

  const QString source = CreateMp3(u"source.mp3"_s, 180000);
  const QString destination = CreateMp3(u"destination.mp3"_s, 160000);
  ASSERT_FALSE(source.isEmpty());
  ASSERT_FALSE(destination.isEmpty());

  Song song;
  song.set_title(u"Title"_s);
  song.set_artist(u"Artist"_s);
  song.set_comment(u"Comment"_s);
  song.set_track(3);
  song.set_provenance_value(QLatin1String(Provenance::kSourceUrl), u"https://example.com/a"_s);
  ASSERT_TRUE(tagreader_.WriteFile(source, song).success());

  ProvenanceMap update;
  update.insert(QLatin1String(Provenance::kTrimmed), u"1"_s);
  const TagReaderResult result = tagreader_.CopyTags(source, destination, update);
  ASSERT_TRUE(result.success()) << result.error_string();

  const Song read_song = ReadSongFromFile(destination);
  EXPECT_EQ(u"Title"_s, read_song.title());
  EXPECT_EQ(u"Artist"_s, read_song.artist());
  EXPECT_EQ(u"Comment"_s, read_song.comment());
  EXPECT_EQ(3, read_song.track());
  EXPECT_EQ(u"https://example.com/a"_s, read_song.source_url());
  EXPECT_EQ(u"1"_s, read_song.provenance_value(QLatin1String(Provenance::kTrimmed)));
  EXPECT_NEAR(160000, read_song.length_msec(), 50);

  // The source is untouched.
  const Song source_song = ReadSongFromFile(source);
  EXPECT_TRUE(source_song.provenance_value(QLatin1String(Provenance::kTrimmed)).isEmpty());
  EXPECT_NEAR(180000, source_song.length_msec(), 50);

}

TEST_F(TagReaderTest, Cover) {

  const QString filename = CreateMp3(u"song.mp3"_s);
  const QString destination = CreateMp3(u"destination.mp3"_s, 160000);
  ASSERT_FALSE(filename.isEmpty());
  ASSERT_FALSE(destination.isEmpty());
  EXPECT_FALSE(ReadSongFromFile(filename).has_cover());

  ASSERT_TRUE(AddCover(filename));
  Song song = ReadSongFromFile(filename);
  EXPECT_TRUE(song.has_cover());

  // Writing tags and trimming keep the picture.
  song.set_title(u"Title"_s);
  ASSERT_TRUE(tagreader_.WriteFile(filename, song).success());
  EXPECT_TRUE(ReadSongFromFile(filename).has_cover());

  ASSERT_TRUE(tagreader_.CopyTags(filename, destination, ProvenanceMap()).success());
  EXPECT_TRUE(ReadSongFromFile(destination).has_cover());

}

TEST_F(TagReaderTest, CopyTagsToCorruptDestination) {

  const QString source = CreateMp3(u"source.mp3"_s);
  ASSERT_FALSE(source.isEmpty());

  const QString destination = temp_dir_.filePath(u"destination.mp3"_s);
  QFile file(destination);
  ASSERT_TRUE(file.open(QIODevice::WriteOnly));
  ASSERT_EQ(1024, file.write(QByteArray(1024, '\0')));
  file.close();

  EXPECT_FALSE(tagreader_.CopyTags(source, destination, ProvenanceMap()).success());

}

TEST_F(TagReaderTest, ReadLegacyFrames) {

  const QString filename = CreateMp3(u"legacy.mp3"_s);
  ASSERT_FALSE(filename.isEmpty());
  ASSERT_TRUE(AddCommentsFrame(filename, u"[CrossPlay] YouTube ID"_s, u"dQw4w9WgXcQ"_s));
  ASSERT_TRUE(AddCommentsFrame(filename, u"[CrossPlay] Download time"_s, u"1700000000"_s));
  ASSERT_TRUE(AddCommentsFrame(filename, u"[CrossPlay] Cropped"_s, u"yes"_s));

  const Song song = ReadSongFromFile(filename);
  EXPECT_EQ(u"dQw4w9WgXcQ"_s, song.provenance_value(QLatin1String(Provenance::kSourceId)));
  EXPECT_EQ(u"https://www.youtube.com/watch?v=dQw4w9WgXcQ"_s, song.source_url());
  EXPECT_EQ(u"2023-11-14T22:13:20Z"_s, song.provenance_value(QLatin1String(Provenance::kDownloadedAt)));
  EXPECT_EQ(u"1"_s, song.provenance_value(QLatin1String(Provenance::kTrimmed)));
  EXPECT_TRUE(song.provenance_value(QLatin1String(Provenance::kMetadataEdited)).isEmpty());

  // Writing converts the legacy frames.
  ASSERT_TRUE(tagreader_.WriteFile(filename, song).success());
  {
    TagLib::MPEG::File file(QFile::encodeName(filename).constData(), false);
    ASSERT_TRUE(file.hasID3v2Tag());
    EXPECT_EQ(nullptr, TagLib::ID3v2::CommentsFrame::findByDescription(file.ID3v2Tag(), "[CrossPlay] YouTube ID"));
    EXPECT_EQ(nullptr, TagLib::ID3v2::CommentsFrame::findByDescription(file.ID3v2Tag(), "[CrossPlay] Cropped"));
    EXPECT_NE(nullptr, TagLib::ID3v2::CommentsFrame::findByDescription(file.ID3v2Tag(), TagReaderTagLib::kProvenanceDescription));
  }
  EXPECT_EQ(song.provenance(), ReadSongFromFile(filename).provenance());

}

TEST_F(TagReaderTest, ForeignProvenanceTextBecomesComment) {

  const QString filename = CreateMp3(u"foreign.mp3"_s);
  ASSERT_FALSE(filename.isEmpty());
  ASSERT_TRUE(AddCommentsFrame(filename, QLatin1String(TagReaderTagLib::kProvenanceDescription), u"written by another program"_s));

  Song song = ReadSongFromFile(filename);
  EXPECT_TRUE(song.provenance().isEmpty());
  EXPECT_EQ(u"written by another program"_s, song.comment());

  song.set_provenance_value(QLatin1String(Provenance::kSourceId), u"xyz"_s);
  ASSERT_TRUE(tagreader_.WriteFile(filename, song).success());

  const Song read_song = ReadSongFromFile(filename);
  EXPECT_EQ(u"written by another program"_s, read_song.comment());
  EXPECT_EQ(u"xyz"_s, read_song.provenance_value(QLatin1String(Provenance::kSourceId)));
  EXPECT_EQ(1, read_song.provenance().count());

}

}  // namespace
