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

#ifndef MEMORYDATABASE_H
#define MEMORYDATABASE_H

#include "config.h"

#include <QObject>

#include "includes/shared_ptr.h"
#include "database.h"

class TaskManager;

// SQLite ":memory:" database with the current schema, every thread gets a separate empty database.
class MemoryDatabase : public Database {
  Q_OBJECT

 public:
  explicit MemoryDatabase(SharedPtr<TaskManager> task_manager, QObject *parent = nullptr);
  ~MemoryDatabase() override;

  const SchemaResult &schema_result() const { return schema_result_; }

 private:
  SchemaResult schema_result_;
};

#endif  // MEMORYDATABASE_H
