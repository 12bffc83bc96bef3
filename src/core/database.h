/*
 * Quaver Music Library
 * This file was part of Strawberry.
 * Copyright 2012, David Sansome <me@davidsansome.com>
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

#ifndef DATABASE_H
#define DATABASE_H

#include "config.h"

#include <optional>

#include <sqlite3.h>

#include <QtGlobal>
#include <QObject>
#include <QMutex>
#include <QSqlDatabase>
#include <QString>
#include <QStringList>
#include <QRecursiveMutex>

#include "includes/shared_ptr.h"
#include "sqlquery.h"
#include "schemaresult.h"

class TaskManager;

class Database : public QObject {
  Q_OBJECT

 public:
  explicit Database(SharedPtr<TaskManager> task_manager, QObject *parent = nullptr, const QString &database_name = QString());
  ~Database() override;

  static const int kSchemaVersion;
  static const int kMinSupportedSchemaVersion;

  // Opens, or reuses, the connection that belongs to the calling thread.
  QSqlDatabase Connect();
  void Close();
  void ReportErrors(const SqlQuery &query);

  QRecursiveMutex *Mutex() { return &mutex_; }

  // Creates the schema on an empty database or migrates an older one to kSchemaVersion.
  // Fails with MigrationError for any version that has no migration path.
  SchemaResult InitializeSchema();

  SchemaResult ExecSchemaCommands(QSqlDatabase &db, const QString &schema);

  // Returns no value when the version table is missing or empty.
  static std::optional<int> SchemaVersion(QSqlDatabase *db);

  int startup_schema_version() const { return startup_schema_version_; }
  int current_schema_version() const { return kSchemaVersion; }
  QString database_name() const { return database_name_; }
  bool is_in_memory() const;

  bool IntegrityCheck(const QSqlDatabase &db);

 Q_SIGNALS:
  void Error(const QString &error);

 public Q_SLOTS:
  bool DoBackup();

 private:
  SchemaResult UpdateDatabaseSchema(const int version, QSqlDatabase &db);
  SchemaResult ExecSchemaCommandsFromFile(QSqlDatabase &db, const QString &filename);
  QString ConnectionId() const;

  bool BackupFile(const QString &filename);
  static bool OpenDatabase(const QString &filename, sqlite3 **connection);

  SharedPtr<TaskManager> task_manager_;

  QString database_name_;
  QMutex connect_mutex_;
  QRecursiveMutex mutex_;

  // Makes the QSqlDatabase connection name unique to this object as well as the thread
  int connection_id_;

  static QMutex sNextConnectionIdMutex;
  static int sNextConnectionId;

  // Schema version found on disk before any migration ran, -1 before InitializeSchema().
  int startup_schema_version_;

  Q_DISABLE_COPY(Database)
};

#endif  // DATABASE_H
