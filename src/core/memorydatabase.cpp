/*
 * Quaver Music Library
 * This file was part of Strawberry.
 * Copyright 2018-2021, Jonas Kvinge <jonas@jkvinge.net>
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

#include "config.h"

#include "logging.h"
#include "memorydatabase.h"

using namespace Qt::Literals::StringLiterals;

MemoryDatabase::MemoryDatabase(SharedPtr<TaskManager> task_manager, QObject *parent)
    : Database(task_manager, parent, u":memory:"_s),
      schema_result_(InitializeSchema()) {

  if (!schema_result_.success()) {
    qLog(Error) << "Could not create in-memory schema:" << schema_result_.error_string();
  }

}

MemoryDatabase::~MemoryDatabase() {
  // Make sure Qt doesn't reuse the same database
  Close();
}
