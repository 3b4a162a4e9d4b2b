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

#ifndef MOCK_TAGREADER_H
#define MOCK_TAGREADER_H

#include "gmock_include.h"

#include <QString>

#include "core/song.h"
#include "core/provenance.h"
#include "tagreader/tagreaderbase.h"
#include "tagreader/tagreaderresult.h"
#include "tagreader/tagreadertaglib.h"

class MockTagReader : public TagReaderBase {
 public:
  MOCK_CONST_METHOD2(ReadFile, TagReaderResult(const QString&, Song*));
  MOCK_CONST_METHOD2(WriteFile, TagReaderResult(const QString&, const Song&));
  MOCK_CONST_METHOD3(CopyTags, TagReaderResult(const QString&, const QString&, const ProvenanceMap&));

  // Calls go to the TagLib implementation unless a test says otherwise.
  void DelegateToTagLib() {
    ON_CALL(*this, ReadFile(testing::_, testing::_)).WillByDefault(testing::Invoke(&taglib_, &TagReaderTagLib::ReadFile));
    ON_CALL(*this, WriteFile(testing::_, testing::_)).WillByDefault(testing::Invoke(&taglib_, &TagReaderTagLib::WriteFile));
    ON_CALL(*this, CopyTags(testing::_, testing::_, testing::_)).WillByDefault(testing::Invoke(&taglib_, &TagReaderTagLib::CopyTags));
  }

 private:
  TagReaderTagLib taglib_;
};

#endif  // MOCK_TAGREADER_H
