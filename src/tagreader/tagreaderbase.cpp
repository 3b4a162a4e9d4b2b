/*
 * CrossPlay
 * This file was part of Strawberry.
 * Copyright 2024, Jonas Kvinge <jonas@jkvinge.net>
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

#include "tagreaderbase.h"

TagReaderBase::TagReaderBase() = default;
TagReaderBase::~TagReaderBase() = default;
