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

#ifndef SCOPEDTRANSACTION_H
#define SCOPEDTRANSACTION_H

#include "config.h"

#include <QtGlobal>
#include <QString>

class QSqlDatabase;

// Opens a transaction on a database.
// Rolls back the transaction if the object goes out of scope before Commit() is called.
class ScopedTransaction {
 public:
  explicit ScopedTransaction(QSqlDatabase *db);
  ~ScopedTransaction();

  bool Commit();

  bool started() const { return pending_; }

 private:
  QSqlDatabase *db_;
  bool pending_;

  Q_DISABLE_COPY(ScopedTransaction)
};

// Nested savepoint inside an open transaction.
// Rolls back to the savepoint unless Release() is called, the outer transaction stays open either way.
class ScopedSavepoint {
 public:
  explicit ScopedSavepoint(QSqlDatabase *db, const QString &name);
  ~ScopedSavepoint();

  bool Release();

 private:
  bool Exec(const QString &statement);

  QSqlDatabase *db_;
  QString name_;
  bool pending_;

  Q_DISABLE_COPY(ScopedSavepoint)
};

#endif  // SCOPEDTRANSACTION_H
