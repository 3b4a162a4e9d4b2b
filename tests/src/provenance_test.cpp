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

#include <QMap>
#include <QString>

#include "core/provenance.h"

#include "test_utils.h"

using namespace Qt::Literals::StringLiterals;

namespace {

TEST(ProvenanceTest, EscapeOnlyTouchesReservedCharacters) {

  EXPECT_EQ(Provenance::Escape(u"a;b=c%d"_s), u"a%3Bb%3Dc%25d"_s);
  EXPECT_EQ(Provenance::Escape(u"https://example.com/watch?v=1&t=2"_s), u"https://example.com/watch?v%3D1&t%3D2"_s);
  EXPECT_EQ(Provenance::Escape(u"ÆØÅ ♫"_s), u"ÆØÅ ♫"_s);

}

TEST(ProvenanceTest, UnescapeRejectsUnknownCodes) {

  bool ok = false;
  EXPECT_EQ(Provenance::Unescape(u"a%3bb%3Dc%25d"_s, &ok), u"a;b=c%d"_s);
  EXPECT_TRUE(ok);

  Provenance::Unescape(u"100%"_s, &ok);
  EXPECT_FALSE(ok);

  Provenance::Unescape(u"%20"_s, &ok);
  EXPECT_FALSE(ok);

}

TEST(ProvenanceTest, SerializeSortsKeys) {

  ProvenanceMap provenance;
  provenance.insert(u"trimmed"_s, u"1"_s);
  provenance.insert(u"source_url"_s, u"https://example.com/a"_s);
  provenance.insert(u"downloaded_at"_s, u"2024-01-02T03:04:05Z"_s);

  EXPECT_EQ(Provenance::Serialize(provenance), u"downloaded_at=2024-01-02T03:04:05Z;source_url=https://example.com/a;trimmed=1"_s);

}

TEST(ProvenanceTest, RoundTripWithReservedCharactersAndEmptyValues) {

  ProvenanceMap provenance;
  provenance.insert(u"source_url"_s, u"https://example.com/watch?v=abc;def"_s);
  provenance.insert(u"empty"_s, QString());
  provenance.insert(u"k=e;y%"_s, u"=;%"_s);
  provenance.insert(u"unicode"_s, u"Sigur Rós"_s);

  const QString text = Provenance::Serialize(provenance);
  ProvenanceMap parsed;
  ASSERT_TRUE(Provenance::Parse(text, &parsed));
  EXPECT_EQ(parsed, provenance);
  EXPECT_EQ(Provenance::Deserialize(text), provenance);

}

TEST(ProvenanceTest, EmptyTextIsEmptyMap) {

  ProvenanceMap provenance;
  provenance.insert(u"stale"_s, u"1"_s);
  EXPECT_TRUE(Provenance::Parse(QString(), &provenance));
  EXPECT_TRUE(provenance.isEmpty());
  EXPECT_EQ(Provenance::Serialize(ProvenanceMap()), QString());

}

TEST(ProvenanceTest, ForeignTextIsRejected) {

  ProvenanceMap provenance;
  EXPECT_FALSE(Provenance::Parse(u"Downloaded from the internet"_s, &provenance));
  EXPECT_TRUE(provenance.isEmpty());
  EXPECT_FALSE(Provenance::Parse(u"=value"_s, &provenance));
  EXPECT_FALSE(Provenance::Parse(u"a=1;;b=2"_s, &provenance));
  EXPECT_FALSE(Provenance::Parse(u"a=1=2"_s, &provenance));
  EXPECT_FALSE(Provenance::Parse(u"a=%zz"_s, &provenance));
  EXPECT_TRUE(Provenance::Deserialize(u"not; provenance"_s).isEmpty());

}

TEST(ProvenanceTest, MergeKeepsUnknownKeys) {

  ProvenanceMap provenance;
  provenance.insert(u"source_url"_s, u"https://example.com/a"_s);
  provenance.insert(u"other_tool"_s, u"keep me"_s);

  ProvenanceMap update;
  update.insert(u"trimmed"_s, u"1"_s);
  update.insert(u"source_url"_s, u"https://example.com/b"_s);

  const ProvenanceMap merged = Provenance::Merge(provenance, update);
  EXPECT_EQ(merged.count(), 3);
  EXPECT_EQ(merged.value(u"source_url"_s), u"https://example.com/b"_s);
  EXPECT_EQ(merged.value(u"other_tool"_s), u"keep me"_s);
  EXPECT_EQ(merged.value(u"trimmed"_s), u"1"_s);

}

}  // namespace
