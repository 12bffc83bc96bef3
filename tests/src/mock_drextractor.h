/*
 * Quaver Music Library
 * This file was part of Strawberry.
 * Copyright 2010, David Sansome <me@davidsansome.com>
 * Copyright 2024-2026, Quaver developers
 *
 * Quaver is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * Quaver is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with Quaver.  If not, see <http://www.gnu.org/licenses/>.
 *
 */

#ifndef MOCK_DREXTRACTOR_H
#define MOCK_DREXTRACTOR_H

#include "gmock_include.h"

#include "dr/drextractor.h"
#include "dr/drresult.h"

class MockDrExtractor : public DrExtractorInterface {
 public:
  MOCK_CONST_METHOD1(FindCandidateFiles, QStringList(const QString &album_path));
  MOCK_CONST_METHOD1(ExtractFromFile, DrResult(const QString &filename));
};

#endif  // MOCK_DREXTRACTOR_H
