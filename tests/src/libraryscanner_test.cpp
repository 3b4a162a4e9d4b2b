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

#include "gtest_include.h"

#include <memory>

#include <QFile>
#include <QByteArray>
#include <QString>
#include <QStringList>
#include <QTemporaryDir>

#include "includes/shared_ptr.h"
#include "core/song.h"
#include "core/temporaryfile.h"
#include "tagreader/tagreadertaglib.h"
#include "library/libraryscanner.h"

#include "test_utils.h"

using std::make_shared;
using namespace Qt::Literals::StringLiterals;

// clazy:excludeall=non-pod-global-static

namespace {

class LibraryScannerTest : public ::testing::Test {
 protected:
  LibraryScannerTest() : tagreader_(make_shared<TagReaderTagLib>()), scanner_(tagreader_) {}

  void SetUp() override {
    ASSERT_TRUE(temp_dir_.isValid());
  }

  void WriteFile(const QString &basename, const QByteArray &data) const {
    QFile file(temp_dir_.filePath(basename));
    ASSERT_TRUE(file.open(QIODevice::WriteOnly));
    ASSERT_EQ(data.size(), file.write(data));
    file.close();
  }

  QTemporaryDir temp_dir_;
  SharedPtr<TagReaderTagLib> tagreader_;
  LibraryScanner scanner_;
};

TEST_F(LibraryScannerTest, IsCandidate) {

  EXPECT_TRUE(LibraryScanner::IsCandidate(u"/music/song.mp3"_s));
  EXPECT_TRUE(LibraryScanner::IsCandidate(u"/music/Song.MP3"_s));
  EXPECT_TRUE(LibraryScanner::IsCandidate(u"/music/song.mp3.hidden"_s));
  EXPECT_FALSE(LibraryScanner::IsCandidate(u"/music/song.ogg"_s));
  EXPECT_FALSE(LibraryScanner::IsCandidate(u"/music/song.mp3.part"_s));
  EXPECT_FALSE(LibraryScanner::IsCandidate(u"/music/.mp3"_s));
  EXPECT_FALSE(LibraryScanner::IsCandidate(u"/music/notes.txt"_s));
  EXPECT_FALSE(LibraryScanner::IsCandidate(u"/music/.crossplay-a1b2c3.part"_s));

}

TEST_F(LibraryScannerTest, ScanEmptyDirectory) {

  EXPECT_TRUE(scanner_.Scan(temp_dir_.path()).isEmpty());

}

TEST_F(LibraryScannerTest, ScanMixedDirectory) {

  ASSERT_FALSE(TestUtils::CreateMp3(temp_dir_.path(), u"first.mp3"_s, 5000).isEmpty());
  ASSERT_FALSE(TestUtils::CreateMp3(temp_dir_.path(), u"second.mp3"_s, 10000).isEmpty());
  ASSERT_FALSE(TestUtils::CreateMp3(temp_dir_.path(), u"third.mp3.hidden"_s, 15000).isEmpty());

  Song song;
  song.set_title(u"Second Song"_s);
  ASSERT_TRUE(tagreader_->WriteFile(temp_dir_.filePath(u"second.mp3"_s), song).success());

  // Unreadable audio files are still songs, other files are not.
  WriteFile(u"corrupt.mp3"_s, QByteArray(2048, 'x'));
  WriteFile(u"cover.jpg"_s, QByteArray(512, 'y'));
  WriteFile(u"notes.txt"_s, "some notes");
  WriteFile(u".crossplay-abcdef.part"_s, QByteArray(1024, 'z'));

  const SongList songs = scanner_.Scan(temp_dir_.path());
  ASSERT_EQ(4, songs.count());

  QStringList basenames;
  for (const Song &s : songs) {
    EXPECT_TRUE(s.is_valid());
    basenames << s.basefilename();
    if (s.basefilename() == "second.mp3"_L1) {
      EXPECT_EQ(u"Second Song"_s, s.title());
      EXPECT_NEAR(10000, s.length_msec(), 50);
    }
    else if (s.basefilename() == "third.mp3.hidden"_L1) {
      EXPECT_FALSE(s.is_visible());
    }
    else if (s.basefilename() == "corrupt.mp3"_L1) {
      EXPECT_TRUE(s.tag_error());
      EXPECT_TRUE(s.title().isEmpty());
    }
  }
  basenames.sort();
  EXPECT_EQ(QStringList() << u"corrupt.mp3"_s << u"first.mp3"_s << u"second.mp3"_s << u"third.mp3.hidden"_s, basenames);

}

TEST_F(LibraryScannerTest, ScanFile) {

  const QString filename = TestUtils::CreateMp3(temp_dir_.path(), u"song.mp3"_s, 5000);
  ASSERT_FALSE(filename.isEmpty());

  const Song song = scanner_.ScanFile(filename);
  EXPECT_TRUE(song.is_valid());
  EXPECT_EQ(filename, song.path());

  EXPECT_FALSE(scanner_.ScanFile(temp_dir_.filePath(u"missing.mp3"_s)).is_valid());

  WriteFile(u"notes.txt"_s, "some notes");
  EXPECT_FALSE(scanner_.ScanFile(temp_dir_.filePath(u"notes.txt"_s)).is_valid());

}

TEST_F(LibraryScannerTest, RemoveOrphanedTemporaryFiles) {

  ASSERT_FALSE(TestUtils::CreateMp3(temp_dir_.path(), u"song.mp3"_s, 5000).isEmpty());
  WriteFile(u".crossplay-aaaaaa.part"_s, QByteArray(16, 'a'));
  WriteFile(u".crossplay-bbbbbb.part"_s, QByteArray());
  WriteFile(u"other.part"_s, QByteArray(16, 'c'));

  EXPECT_EQ(2, LibraryScanner::RemoveOrphanedTemporaryFiles(temp_dir_.path()));
  EXPECT_EQ(QStringList() << u"other.part"_s << u"song.mp3"_s, TestUtils::DirectoryEntries(temp_dir_.path()));
  EXPECT_EQ(0, LibraryScanner::RemoveOrphanedTemporaryFiles(temp_dir_.path()));

}

TEST_F(LibraryScannerTest, TemporaryFile) {

  QString filename;
  {
    TemporaryFile temporary_file(temp_dir_.path());
    ASSERT_TRUE(temporary_file.is_valid());
    filename = temporary_file.filename();
    EXPECT_TRUE(QFile::exists(filename));
    EXPECT_TRUE(TemporaryFile::IsTemporaryFilename(filename.section(u'/', -1, -1)));
    EXPECT_FALSE(LibraryScanner::IsCandidate(filename));
  }
  EXPECT_FALSE(QFile::exists(filename));

}

}  // namespace
