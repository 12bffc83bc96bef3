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

#include "config.h"

#include <optional>

#include <sqlite3.h>

#include <QObject>
#include <QThread>
#include <QMutex>
#include <QIODevice>
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QByteArray>
#include <QString>
#include <QStringList>
#include <QRegularExpression>
#include <QStandardPaths>
#include <QSqlDriver>
#include <QSqlDatabase>
#include <QSqlError>
#include <QScopeGuard>

#include "logging.h"
#include "taskmanager.h"
#include "database.h"
#include "sqlquery.h"
#include "scopedtransaction.h"

using namespace Qt::Literals::StringLiterals;

const int Database::kSchemaVersion = 4;
const int Database::kMinSupportedSchemaVersion = 1;

namespace {
constexpr char kDatabaseFilename[] = "quaver.db";
constexpr char kInMemoryDatabase[] = ":memory:";
}  // namespace

int Database::sNextConnectionId = 1;
QMutex Database::sNextConnectionIdMutex;

Database::Database(SharedPtr<TaskManager> task_manager, QObject *parent, const QString &database_name)
    : QObject(parent),
      task_manager_(task_manager),
      database_name_(database_name),
      startup_schema_version_(-1) {

  setObjectName(QLatin1String(QObject::metaObject()->className()));

  {
    QMutexLocker l(&sNextConnectionIdMutex);
    connection_id_ = sNextConnectionId++;
  }

  if (database_name_.isEmpty()) {
    database_name_ = QStandardPaths::writableLocation(QStandardPaths::AppLocalDataLocation) + u'/' + QLatin1String(kDatabaseFilename);
  }

}

Database::~Database() {

  QMutexLocker l(&connect_mutex_);

  const QString prefix = QStringLiteral("%1_thread_").arg(connection_id_);
  const QStringList connection_names = QSqlDatabase::connectionNames();
  for (const QString &connection_name : connection_names) {
    if (connection_name.startsWith(prefix)) {
      qLog(Error) << "Connection" << connection_name << "is still open!";
    }
  }

}

bool Database::is_in_memory() const {

  return database_name_ == QLatin1String(kInMemoryDatabase);

}

QString Database::ConnectionId() const {

  return QStringLiteral("%1_thread_%2").arg(connection_id_).arg(reinterpret_cast<quint64>(QThread::currentThread()));

}

QSqlDatabase Database::Connect() {

  QMutexLocker l(&connect_mutex_);

  if (!is_in_memory()) {
    const QString directory = QFileInfo(database_name_).absolutePath();
    if (!QFile::exists(directory)) {
      QDir dir;
      if (!dir.mkpath(directory)) {
        qLog(Error) << "Could not create database directory" << directory;
      }
    }
  }

  const QString connection_id = ConnectionId();

  // Try to find an existing connection for this thread
  QSqlDatabase db;
  if (QSqlDatabase::connectionNames().contains(connection_id)) {
    db = QSqlDatabase::database(connection_id);
  }
  else {
    db = QSqlDatabase::addDatabase(u"QSQLITE"_s, connection_id);
  }
  if (db.isOpen()) {
    return db;
  }
  db.setConnectOptions(u"QSQLITE_BUSY_TIMEOUT=30000"_s);
  db.setDatabaseName(database_name_);

  if (!db.open()) {
    qLog(Error) << "Could not open database" << database_name_ << db.lastError().text();
    Q_EMIT Error(u"Database: "_s + db.lastError().text());
    return db;
  }

  // Cascading deletes from artists to albums to tracks depend on this, it is off by default in SQLite.
  {
    SqlQuery q(db);
    if (!q.exec(u"PRAGMA foreign_keys = ON"_s)) {
      ReportErrors(q);
    }
  }

  if (!is_in_memory()) {
    SqlQuery q(db);
    if (!q.exec(u"PRAGMA journal_mode = WAL"_s)) {
      ReportErrors(q);
    }
  }

  qLog(Debug) << "Opened database" << database_name_ << "with connection id" << connection_id;

  return db;

}

void Database::Close() {

  QMutexLocker l(&connect_mutex_);

  const QString connection_id = ConnectionId();

  if (QSqlDatabase::connectionNames().contains(connection_id)) {
    {
      QSqlDatabase db = QSqlDatabase::database(connection_id);
      if (db.isOpen()) {
        db.close();
        qLog(Debug) << "Closed database with connection id" << connection_id;
      }
    }
    QSqlDatabase::removeDatabase(connection_id);
  }

}

std::optional<int> Database::SchemaVersion(QSqlDatabase *db) {

  std::optional<int> schema_version;
  {
    SqlQuery q(*db);
    q.prepare(u"SELECT version FROM schema_version"_s);
    if (q.Exec() && q.next()) {
      schema_version = q.value(0).toInt();
    }
    // Leaving the scope finishes the query and releases its read lock.
  }
  return schema_version;

}

SchemaResult Database::InitializeSchema() {

  QMutexLocker l(&mutex_);
  QSqlDatabase db(Connect());
  if (!db.isOpen()) {
    return SchemaResult(SchemaResult::ErrorCode::ConnectionError, db.lastError().text());
  }

  const QStringList tables = db.tables();
  if (!tables.contains(u"schema_version"_s)) {
    static const QStringList catalog_tables = QStringList() << u"artists"_s << u"albums"_s << u"tracks"_s;
    for (const QString &table : catalog_tables) {
      if (tables.contains(table)) {
        return SchemaResult(SchemaResult::ErrorCode::MigrationError, QStringLiteral("Table %1 exists but the database has no schema version").arg(table));
      }
    }
    qLog(Info) << "Creating initial database schema in" << database_name_;
    startup_schema_version_ = 0;
    const SchemaResult result = UpdateDatabaseSchema(0, db);
    if (!result.success()) return result;
    const std::optional<int> created_version = SchemaVersion(&db);
    if (created_version != kSchemaVersion) {
      return SchemaResult(SchemaResult::ErrorCode::MigrationError, u"Initial schema did not stamp the current version"_s);
    }
    return SchemaResult(SchemaResult::ErrorCode::Success);
  }

  const std::optional<int> schema_version = SchemaVersion(&db);
  if (!schema_version.has_value()) {
    return SchemaResult(SchemaResult::ErrorCode::MigrationError, u"Schema version table is empty"_s);
  }

  startup_schema_version_ = *schema_version;

  if (*schema_version < kMinSupportedSchemaVersion || *schema_version > kSchemaVersion) {
    qLog(Error) << "Unrecognized database schema version" << *schema_version << "expected" << kMinSupportedSchemaVersion << "to" << kSchemaVersion;
    return SchemaResult(SchemaResult::ErrorCode::MigrationError, QStringLiteral("Unrecognized schema version %1").arg(*schema_version));
  }

  for (int v = *schema_version + 1; v <= kSchemaVersion; ++v) {
    const SchemaResult result = UpdateDatabaseSchema(v, db);
    if (!result.success()) return result;
    if (SchemaVersion(&db) != v) {
      return SchemaResult(SchemaResult::ErrorCode::MigrationError, QStringLiteral("Migration to version %1 did not update the schema version").arg(v));
    }
  }

  return SchemaResult(SchemaResult::ErrorCode::Success);

}

SchemaResult Database::UpdateDatabaseSchema(const int version, QSqlDatabase &db) {

  QString filename;
  if (version == 0) {
    filename = u":/schema/schema.sql"_s;
  }
  else {
    filename = QStringLiteral(":/schema/schema-%1.sql").arg(version);
    qLog(Info) << "Applying database schema update" << version << "from" << filename;
  }

  return ExecSchemaCommandsFromFile(db, filename);

}

SchemaResult Database::ExecSchemaCommandsFromFile(QSqlDatabase &db, const QString &filename) {

  QFile schema_file(filename);
  if (!schema_file.open(QIODevice::ReadOnly)) {
    return SchemaResult(SchemaResult::ErrorCode::MigrationError, QStringLiteral("Couldn't open schema file %1 for reading: %2").arg(filename, schema_file.errorString()));
  }
  const QByteArray data = schema_file.readAll();
  QString schema = QString::fromUtf8(data);
  if (schema.contains("\r\n"_L1)) {
    schema = schema.replace("\r\n"_L1, "\n"_L1);
  }
  schema_file.close();

  return ExecSchemaCommands(db, schema);

}

SchemaResult Database::ExecSchemaCommands(QSqlDatabase &db, const QString &schema) {

  // Commands are separated by a semicolon followed by a blank line
  static const QRegularExpression regex_split_commands(u"; *\n\n"_s);
  const QStringList commands = schema.split(regex_split_commands);

  // The DDL and the version stamp of one step commit together or not at all.
  ScopedTransaction transaction(&db);
  for (const QString &command : commands) {
    if (command.trimmed().isEmpty()) continue;
    SqlQuery query(db);
    query.prepare(command);
    if (!query.Exec()) {
      ReportErrors(query);
      return SchemaResult(SchemaResult::ErrorCode::SqlError, query.lastError().text());
    }
  }

  if (!transaction.Commit()) {
    return SchemaResult(SchemaResult::ErrorCode::SqlError, db.lastError().text());
  }

  return SchemaResult(SchemaResult::ErrorCode::Success);

}

void Database::ReportErrors(const SqlQuery &query) {

  const QSqlError sql_error = query.lastError();
  if (sql_error.isValid()) {
    qLog(Error) << "Unable to execute SQL query:" << sql_error;
    qLog(Error) << "Failed SQL query:" << query.LastQuery();
    Q_EMIT Error(tr("Unable to execute SQL query: %1").arg(sql_error.text()));
    Q_EMIT Error(tr("Failed SQL query: %1").arg(query.LastQuery()));
  }

}

bool Database::IntegrityCheck(const QSqlDatabase &db) {

  qLog(Debug) << "Starting database integrity check";
  TaskManager::ScopedTask task(task_manager_->StartTask(tr("Integrity check")), task_manager_.get());

  bool ok = false;
  // Ask for 10 error messages at most.
  SqlQuery q(db);
  q.prepare(u"PRAGMA integrity_check(10)"_s);
  if (q.Exec()) {
    bool error_reported = false;
    while (q.next()) {
      const QString message = q.value(0).toString();

      // A single row with the value "ok" means no errors were found
      if (message == "ok"_L1) {
        ok = true;
        break;
      }
      if (!error_reported) { Q_EMIT Error(tr("Database corruption detected.")); }
      Q_EMIT Error(u"Database: "_s + message);
      error_reported = true;
    }
  }
  else {
    ReportErrors(q);
  }

  return ok;

}

bool Database::DoBackup() {

  if (is_in_memory()) {
    qLog(Warning) << "Not backing up an in-memory database";
    return false;
  }

  QMutexLocker l(&mutex_);
  QSqlDatabase db(Connect());
  if (!db.isOpen()) return false;

  // Never overwrite a good backup with a corrupt database
  if (!IntegrityCheck(db)) {
    qLog(Error) << "Database integrity check failed, skipping backup";
    return false;
  }
  if (SchemaVersion(&db) != kSchemaVersion) {
    qLog(Warning) << "Database is not at schema version" << kSchemaVersion << "skipping backup";
    return false;
  }

  return BackupFile(db.databaseName());

}

bool Database::OpenDatabase(const QString &filename, sqlite3 **connection) {

  const QByteArray filename_data = filename.toUtf8();
  const int ret = sqlite3_open(filename_data.constData(), connection);
  if (ret != SQLITE_OK) {
    if (*connection) {
      const char *error_message = sqlite3_errmsg(*connection);
      qLog(Error) << "Failed to open database for backup:" << filename << error_message;
    }
    else {
      qLog(Error) << "Failed to open database for backup:" << filename;
    }
    return false;
  }
  return true;

}

bool Database::BackupFile(const QString &filename) {

  qLog(Debug) << "Starting database backup";
  const QString dest_filename = QStringLiteral("%1.bak").arg(filename);
  const int task_id = task_manager_->StartTask(tr("Backing up database"));

  sqlite3 *source_connection = nullptr;
  sqlite3 *dest_connection = nullptr;

  const QScopeGuard db_backup_finish = qScopeGuard([this, task_id, &source_connection, &dest_connection]() {
    if (source_connection) {
      sqlite3_close(source_connection);
    }
    if (dest_connection) {
      sqlite3_close(dest_connection);
    }
    task_manager_->SetTaskFinished(task_id);
  });

  if (!OpenDatabase(filename, &source_connection)) {
    return false;
  }

  if (!OpenDatabase(dest_filename, &dest_connection)) {
    return false;
  }

  sqlite3_backup *backup = sqlite3_backup_init(dest_connection, "main", source_connection, "main");
  if (!backup) {
    const char *error_message = sqlite3_errmsg(dest_connection);
    qLog(Error) << "Failed to start database backup:" << error_message;
    return false;
  }

  int ret = SQLITE_OK;
  do {
    ret = sqlite3_backup_step(backup, 16);
    if (ret == SQLITE_BUSY || ret == SQLITE_LOCKED) {
      sqlite3_sleep(50);
    }
    const int page_count = sqlite3_backup_pagecount(backup);
    task_manager_->SetTaskProgress(task_id, static_cast<quint64>(page_count - sqlite3_backup_remaining(backup)), static_cast<quint64>(page_count));
  }
  while (ret == SQLITE_OK || ret == SQLITE_BUSY || ret == SQLITE_LOCKED);

  sqlite3_backup_finish(backup);

  if (ret != SQLITE_DONE) {
    qLog(Error) << "Database backup failed:" << sqlite3_errstr(ret);
    return false;
  }

  qLog(Info) << "Database backed up to" << dest_filename;

  return true;

}
