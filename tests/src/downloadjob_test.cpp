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
#include <QString>
#include <QStringList>
#include <QDateTime>
#include <QThread>
#include <QTemporaryDir>

#include "includes/shared_ptr.h"
#include "core/song.h"
#include "core/provenance.h"
#include "tagreader/tagreadertaglib.h"
#include "library/libraryconfig.h"
#include "library/libraryresult.h"
#include "library/libraryjob.h"
#include "library/downloadjob.h"
#include "library/pathlocks.h"

#include "test_utils.h"

using std::make_shared;
using namespace Qt::Literals::StringLiterals;

// clazy:excludeall=non-pod-global-static

namespace {

class DownloadJobTest : public ::testing::Test {
 protected:
  DownloadJobTest() : tagreader_(make_shared<TagReaderTagLib>()) {}

  void SetUp() override {
    ASSERT_TRUE(temp_dir_.isValid());
    config_ = TestUtils::FakeToolConfig(temp_dir_.path());
  }

  QSharedPointer<DownloadJob> CreateJob(const QString &url) {
    return LibraryJob::Create<DownloadJob>(url, config_, tagreader_, &path_locks_);
  }

  static LibraryResult Run(QSharedPointer<DownloadJob> job) {
    const LibraryResult result = job->Execute();
    job->Finish(result);
    return result;
  }

  QTemporaryDir temp_dir_;
  LibraryConfig config_;
  SharedPtr<TagReaderTagLib> tagreader_;
  PathLockManager path_locks_;
};

TEST_F(DownloadJobTest, ParseProgressLine) {

  EXPECT_DOUBLE_EQ(42.5, DownloadJob::ParseProgressLine(u"[download]  42.5% of 3.10MiB at 1.20MiB/s ETA 00:02"_s));
  EXPECT_DOUBLE_EQ(100.0, DownloadJob::ParseProgressLine(u"[download] 100% of 3.10MiB in 00:03"_s));
  EXPECT_DOUBLE_EQ(-1.0, DownloadJob::ParseProgressLine(u"[youtube] abc: Downloading webpage"_s));
  EXPECT_DOUBLE_EQ(-1.0, DownloadJob::ParseProgressLine(u"[download] 250% of nothing"_s));

}

TEST_F(DownloadJobTest, ParseMetadataLine) {

  DownloadJob::FetchMetadata metadata;
  EXPECT_TRUE(DownloadJob::ParseMetadataLine(u"{\"title\":\" A Title \",\"uploader\":\"Someone\",\"id\":\"xyz\",\"duration\":12}"_s, &metadata));
  EXPECT_EQ(u"A Title"_s, metadata.title);
  EXPECT_EQ(u"Someone"_s, metadata.uploader);
  EXPECT_EQ(u"xyz"_s, metadata.id);

  DownloadJob::FetchMetadata other_metadata;
  EXPECT_FALSE(DownloadJob::ParseMetadataLine(u"[download] Destination: file"_s, &other_metadata));
  EXPECT_FALSE(DownloadJob::ParseMetadataLine(u"{not json"_s, &other_metadata));
  EXPECT_TRUE(other_metadata.title.isEmpty());

}

TEST_F(DownloadJobTest, UrlHelpers) {

  EXPECT_EQ(u"dQw4w9WgXcQ"_s, DownloadJob::SourceIdFromUrl(u"https://www.youtube.com/watch?v=dQw4w9WgXcQ&t=10"_s));
  EXPECT_EQ(u"dQw4w9WgXcQ"_s, DownloadJob::SourceIdFromUrl(u"https://youtu.be/dQw4w9WgXcQ"_s));
  EXPECT_TRUE(DownloadJob::SourceIdFromUrl(u"https://example.com/song.mp3"_s).isEmpty());

  EXPECT_EQ(u"song"_s, DownloadJob::TitleFromUrl(u"https://example.com/media/song.mp3"_s));
  EXPECT_EQ(u"watch"_s, DownloadJob::TitleFromUrl(u"https://www.youtube.com/watch?v=abc"_s));
  EXPECT_TRUE(DownloadJob::TitleFromUrl(u"https://example.com/"_s).isEmpty());

  EXPECT_TRUE(DownloadJob::IsValidUrl(u"https://www.youtube.com/watch?v=abc"_s));
  EXPECT_TRUE(DownloadJob::IsValidUrl(u"http://example.com/song.mp3"_s));
  EXPECT_FALSE(DownloadJob::IsValidUrl(u"--exec=touch /tmp/x"_s));
  EXPECT_FALSE(DownloadJob::IsValidUrl(u"-o/etc/passwd"_s));
  EXPECT_FALSE(DownloadJob::IsValidUrl(u"file:///etc/passwd"_s));
  EXPECT_FALSE(DownloadJob::IsValidUrl(u"https://"_s));
  EXPECT_FALSE(DownloadJob::IsValidUrl(QString()));

  EXPECT_EQ(u"/music/Song.mp3"_s, DownloadJob::CandidateFilename(u"/music"_s, u"Song"_s, 1));
  EXPECT_EQ(u"/music/Song (3).mp3"_s, DownloadJob::CandidateFilename(u"/music"_s, u"Song"_s, 3));

}

TEST_F(DownloadJobTest, Download) {

  const QDateTime started = QDateTime::currentDateTimeUtc().addSecs(-1);
  const QString url = u"https://www.youtube.com/watch?v=abc123&title=My%20Song&uploader=Some%20One&duration=5000"_s;

  QSharedPointer<DownloadJob> job = CreateJob(url);
  EXPECT_TRUE(job->LockPaths().isEmpty());

  const LibraryResult result = Run(job);
  ASSERT_TRUE(result.success()) << result.message();

  const QString expected_filename = temp_dir_.filePath(u"My Song.mp3"_s);
  EXPECT_EQ(expected_filename, job->result_path());
  EXPECT_EQ(LibraryJob::State::Complete, job->state());
  EXPECT_EQ(100, job->progress());
  EXPECT_EQ(QStringList() << u"My Song.mp3"_s, TestUtils::DirectoryEntries(temp_dir_.path()));

  const Song song = job->song();
  EXPECT_TRUE(song.is_valid());
  EXPECT_EQ(u"My Song"_s, song.title());
  EXPECT_EQ(u"Some One"_s, song.artist());
  EXPECT_NEAR(5000, song.length_msec(), 50);
  EXPECT_EQ(url, song.source_url());
  EXPECT_EQ(u"abc123"_s, song.provenance_value(QLatin1String(Provenance::kSourceId)));
  EXPECT_TRUE(song.downloaded_at().isValid());
  EXPECT_GE(song.downloaded_at(), started);
  EXPECT_TRUE(song.provenance_value(QLatin1String(Provenance::kTrimmed)).isEmpty());

  // What the job reports is what is in the file.
  Song read_song;
  ASSERT_TRUE(tagreader_->ReadFile(expected_filename, &read_song).success());
  EXPECT_EQ(song.provenance(), read_song.provenance());

}

TEST_F(DownloadJobTest, IdFromMetadataWins) {

  QSharedPointer<DownloadJob> job = CreateJob(u"https://www.youtube.com/watch?v=fromurl&id=frommetadata&duration=2000"_s);
  ASSERT_TRUE(Run(job).success());
  EXPECT_EQ(u"frommetadata"_s, job->song().provenance_value(QLatin1String(Provenance::kSourceId)));

}

TEST_F(DownloadJobTest, SameTitleTwice) {

  const QString url = u"https://www.youtube.com/watch?v=abc&title=Song&duration=2000"_s;

  QSharedPointer<DownloadJob> first_job = CreateJob(url);
  ASSERT_TRUE(Run(first_job).success());
  QSharedPointer<DownloadJob> second_job = CreateJob(url);
  ASSERT_TRUE(Run(second_job).success());

  EXPECT_EQ(temp_dir_.filePath(u"Song.mp3"_s), first_job->result_path());
  EXPECT_EQ(temp_dir_.filePath(u"Song (2).mp3"_s), second_job->result_path());
  EXPECT_EQ(QStringList() << u"Song (2).mp3"_s << u"Song.mp3"_s, TestUtils::DirectoryEntries(temp_dir_.path()));

}

TEST_F(DownloadJobTest, HiddenSongKeepsItsName) {

  ASSERT_FALSE(TestUtils::CreateMp3(temp_dir_.path(), u"Song.mp3.hidden"_s, 1000).isEmpty());

  QSharedPointer<DownloadJob> job = CreateJob(u"https://www.youtube.com/watch?v=abc&title=Song&duration=2000"_s);
  ASSERT_TRUE(Run(job).success());
  EXPECT_EQ(temp_dir_.filePath(u"Song (2).mp3"_s), job->result_path());

}

TEST_F(DownloadJobTest, TitleIsSanitized) {

  QSharedPointer<DownloadJob> job = CreateJob(u"https://www.youtube.com/watch?v=abc&title=AC%2FDC%3A%20Live&duration=2000"_s);
  ASSERT_TRUE(Run(job).success());
  EXPECT_EQ(temp_dir_.filePath(u"AC_DC_ Live.mp3"_s), job->result_path());
  EXPECT_EQ(u"AC/DC: Live"_s, job->song().title());

}

TEST_F(DownloadJobTest, TitleFromUrl) {

  QSharedPointer<DownloadJob> job = CreateJob(u"https://example.com/media/Great%20Tune.webm?notitle&duration=2000"_s);
  ASSERT_TRUE(Run(job).success());
  EXPECT_EQ(temp_dir_.filePath(u"Great Tune.mp3"_s), job->result_path());
  EXPECT_EQ(u"Great Tune"_s, job->song().title());

}

TEST_F(DownloadJobTest, TitleFromSourceId) {

  QSharedPointer<DownloadJob> job = CreateJob(u"https://www.youtube.com/watch?v=abc123&notitle&duration=2000"_s);
  ASSERT_TRUE(Run(job).success());
  EXPECT_EQ(temp_dir_.filePath(u"abc123.mp3"_s), job->result_path());
  EXPECT_EQ(u"abc123"_s, job->song().title());

  job = CreateJob(u"https://www.youtube.com/watch?v=fromurl&id=frommetadata&notitle&duration=2000"_s);
  ASSERT_TRUE(Run(job).success());
  EXPECT_EQ(temp_dir_.filePath(u"frommetadata.mp3"_s), job->result_path());

}

TEST_F(DownloadJobTest, RejectsOption) {

  const QString marker = temp_dir_.filePath(u"marker"_s);
  QSharedPointer<DownloadJob> job = CreateJob(u"--exec=touch "_s + marker);
  const LibraryResult result = Run(job);

  EXPECT_EQ(LibraryResult::ErrorCode::FetchError, result.error_code);
  EXPECT_EQ(LibraryJob::State::Failed, job->state());
  EXPECT_FALSE(QFile::exists(marker));
  EXPECT_TRUE(TestUtils::DirectoryEntries(temp_dir_.path()).isEmpty());

}

TEST_F(DownloadJobTest, FetchFails) {

  QSharedPointer<DownloadJob> job = CreateJob(u"https://www.youtube.com/watch?v=abc&fail"_s);
  const LibraryResult result = Run(job);

  EXPECT_EQ(LibraryResult::ErrorCode::FetchError, result.error_code);
  EXPECT_TRUE(result.error_text.contains("404"_L1)) << result.error_text;
  EXPECT_EQ(LibraryJob::State::Failed, job->state());
  EXPECT_TRUE(job->result_path().isEmpty());
  EXPECT_TRUE(TestUtils::DirectoryEntries(temp_dir_.path()).isEmpty());

}

TEST_F(DownloadJobTest, FetchWritesNothing) {

  QSharedPointer<DownloadJob> job = CreateJob(u"https://www.youtube.com/watch?v=abc&empty"_s);
  EXPECT_EQ(LibraryResult::ErrorCode::FetchError, Run(job).error_code);
  EXPECT_TRUE(TestUtils::DirectoryEntries(temp_dir_.path()).isEmpty());

}

TEST_F(DownloadJobTest, FetchToolMissing) {

  config_.fetch_program = temp_dir_.filePath(u"no-such-tool"_s);
  QSharedPointer<DownloadJob> job = CreateJob(u"https://www.youtube.com/watch?v=abc"_s);
  EXPECT_EQ(LibraryResult::ErrorCode::FetchError, Run(job).error_code);
  EXPECT_TRUE(TestUtils::DirectoryEntries(temp_dir_.path()).isEmpty());

}

TEST_F(DownloadJobTest, TranscodeFails) {

  config_.transcode_arguments = u"fail %input% %output%"_s;
  QSharedPointer<DownloadJob> job = CreateJob(u"https://www.youtube.com/watch?v=abc&duration=2000"_s);
  const LibraryResult result = Run(job);

  EXPECT_EQ(LibraryResult::ErrorCode::TranscodeError, result.error_code);
  EXPECT_TRUE(result.error_text.contains("Conversion failed!"_L1)) << result.error_text;
  EXPECT_TRUE(TestUtils::DirectoryEntries(temp_dir_.path()).isEmpty());

}

TEST_F(DownloadJobTest, CancelBeforeStart) {

  QSharedPointer<DownloadJob> job = CreateJob(u"https://www.youtube.com/watch?v=abc"_s);
  job->Cancel();
  EXPECT_TRUE(job->cancel_requested());

  const LibraryResult result = Run(job);
  EXPECT_TRUE(result.canceled());
  EXPECT_EQ(LibraryJob::State::Canceled, job->state());
  EXPECT_TRUE(TestUtils::DirectoryEntries(temp_dir_.path()).isEmpty());

}

TEST_F(DownloadJobTest, CancelWhileFetching) {

  QSharedPointer<DownloadJob> job = CreateJob(u"https://www.youtube.com/watch?v=abc&sleep=10000"_s);

  LibraryResult result;
  QThread *thread = QThread::create([job, &result]() { result = job->Execute(); });
  thread->start();

  ASSERT_TRUE(TestUtils::WaitFor([job]() { return job->state() == LibraryJob::State::Fetching; }));
  job->Cancel();
  ASSERT_TRUE(thread->wait(10000));
  delete thread;

  EXPECT_TRUE(result.canceled());
  job->Finish(result);
  EXPECT_EQ(LibraryJob::State::Canceled, job->state());
  EXPECT_TRUE(TestUtils::DirectoryEntries(temp_dir_.path()).isEmpty());

}

}  // namespace
