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

#include <QString>
#include <QStringList>
#include <QTemporaryDir>
#include <QElapsedTimer>

#include "library/toolcommand.h"
#include "library/externalprocess.h"

#include "test_utils.h"

using namespace Qt::Literals::StringLiterals;

// clazy:excludeall=non-pod-global-static

namespace {

TEST(ToolCommandTest, ExpandsPlaceholders) {

  ToolCommand command(u"ffmpeg"_s, u"-y -i %input% -ss %start% -to %end% %output%"_s);
  command.Set(QLatin1String(ToolCommand::kInput), u"/music/My Song.mp3"_s)
         .Set(QLatin1String(ToolCommand::kOutput), u"/music/.crossplay-abc.part"_s)
         .Set(QLatin1String(ToolCommand::kStart), u"10.000"_s)
         .Set(QLatin1String(ToolCommand::kEnd), u"170.000"_s);

  EXPECT_TRUE(command.is_valid());
  EXPECT_TRUE(command.MissingValues().isEmpty());
  EXPECT_EQ(QStringList() << u"-y"_s << u"-i"_s << u"/music/My Song.mp3"_s << u"-ss"_s << u"10.000"_s << u"-to"_s << u"170.000"_s << u"/music/.crossplay-abc.part"_s, command.Arguments());
  EXPECT_EQ(u"ffmpeg -y -i \"/music/My Song.mp3\" -ss 10.000 -to 170.000 /music/.crossplay-abc.part"_s, command.ToString());

}

TEST(ToolCommandTest, PlaceholderInsideArgument) {

  ToolCommand command(u"yt-dlp"_s, u"--output=%output% \"%url%\""_s);
  command.Set(QLatin1String(ToolCommand::kOutput), u"/tmp/out.part"_s);

  EXPECT_EQ(QStringList() << u"url"_s, command.MissingValues());
  EXPECT_EQ(QStringList() << u"--output=/tmp/out.part"_s << u"%url%"_s, command.Arguments());

  command.Set(QLatin1String(ToolCommand::kUrl), u"https://example.com/watch?v=a b"_s);
  EXPECT_TRUE(command.MissingValues().isEmpty());
  EXPECT_EQ(QStringList() << u"--output=/tmp/out.part"_s << u"https://example.com/watch?v=a b"_s, command.Arguments());

}

TEST(ToolCommandTest, EmptyProgramIsInvalid) {

  EXPECT_FALSE(ToolCommand().is_valid());
  EXPECT_FALSE(ToolCommand(u"  "_s, u"-i %input%"_s).is_valid());

}

class ExternalProcessTest : public ::testing::Test {
 protected:
  void SetUp() override {
    ASSERT_TRUE(temp_dir_.isValid());
  }

  QTemporaryDir temp_dir_;
};

TEST_F(ExternalProcessTest, RunsToolAndReportsLines) {

  ToolCommand command(TestUtils::FakeToolPath(), u"fetch %url% %output%"_s);
  command.Set(QLatin1String(ToolCommand::kUrl), u"https://example.com/watch?v=abc&title=Hello&duration=2000"_s);
  command.Set(QLatin1String(ToolCommand::kOutput), temp_dir_.filePath(u"out.mp3"_s));

  QStringList lines;
  ExternalProcess process(command);
  process.set_line_handler([&lines](const QString &line) { lines << line; });
  const ExternalProcess::Result result = process.Run();

  ASSERT_TRUE(result.success()) << result.ErrorDescription();
  EXPECT_EQ(0, result.exit_code);
  EXPECT_FALSE(result.standard_output.isEmpty());
  ASSERT_EQ(6, lines.count());
  EXPECT_TRUE(lines.first().startsWith("[download]"_L1));
  EXPECT_TRUE(lines.last().startsWith(u'{'));
  EXPECT_TRUE(lines.last().contains("\"title\":\"Hello\""_L1));

}

TEST_F(ExternalProcessTest, ToolFails) {

  ExternalProcess process(ToolCommand(TestUtils::FakeToolPath(), u"fail"_s));
  const ExternalProcess::Result result = process.Run();

  EXPECT_FALSE(result.success());
  EXPECT_FALSE(result.failed_to_start);
  EXPECT_EQ(2, result.exit_code);
  EXPECT_TRUE(result.ErrorDescription().contains("Conversion failed!"_L1)) << result.ErrorDescription();

}

TEST_F(ExternalProcessTest, MissingProgram) {

  ExternalProcess process(ToolCommand(temp_dir_.filePath(u"no-such-tool"_s), u"--help"_s));
  const ExternalProcess::Result result = process.Run();

  EXPECT_FALSE(result.success());
  EXPECT_TRUE(result.failed_to_start);

}

TEST_F(ExternalProcessTest, NoProgram) {

  ExternalProcess process((ToolCommand()));
  const ExternalProcess::Result result = process.Run();

  EXPECT_FALSE(result.success());
  EXPECT_TRUE(result.failed_to_start);

}

TEST_F(ExternalProcessTest, Timeout) {

  ToolCommand command(TestUtils::FakeToolPath(), u"fetch %url% %output%"_s);
  command.Set(QLatin1String(ToolCommand::kUrl), u"https://example.com/watch?v=abc&sleep=10000"_s);
  command.Set(QLatin1String(ToolCommand::kOutput), temp_dir_.filePath(u"out.mp3"_s));

  ExternalProcess process(command);
  process.set_timeout_msec(300);

  QElapsedTimer timer;
  timer.start();
  const ExternalProcess::Result result = process.Run();

  EXPECT_FALSE(result.success());
  EXPECT_TRUE(result.timed_out);
  EXPECT_LT(timer.elapsed(), 8000);

}

TEST_F(ExternalProcessTest, Cancel) {

  ToolCommand command(TestUtils::FakeToolPath(), u"fetch %url% %output%"_s);
  command.Set(QLatin1String(ToolCommand::kUrl), u"https://example.com/watch?v=abc&sleep=10000"_s);
  command.Set(QLatin1String(ToolCommand::kOutput), temp_dir_.filePath(u"out.mp3"_s));

  QElapsedTimer timer;
  timer.start();

  ExternalProcess process(command);
  process.set_cancel_check([&timer]() { return timer.elapsed() > 200; });
  const ExternalProcess::Result result = process.Run();

  EXPECT_FALSE(result.success());
  EXPECT_TRUE(result.canceled);
  EXPECT_FALSE(result.crashed);
  EXPECT_LT(timer.elapsed(), 8000);

}

}  // namespace
