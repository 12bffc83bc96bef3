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

#include "config.h"

#include <QSqlDatabase>
#include <QSqlError>
#include <QString>

#include "logging.h"
#include "sqlquery.h"
#include "scopedtransaction.h"

using namespace Qt::Literals::StringLiterals;

ScopedTransaction::ScopedTransaction(QSqlDatabase *db) : db_(db), pending_(true) {

  if (!db->transaction()) {
    qLog(Error) << "Could not start transaction:" << db->lastError().text();
    pending_ = false;
  }

}

ScopedTransaction::~ScopedTransaction() {

  if (pending_) {
    qLog(Warning) << "Rolling back transaction";
    if (!db_->rollback()) {
      qLog(Error) << "Rollback failed:" << db_->lastError().text();
    }
  }

}

bool ScopedTransaction::Commit() {

  if (!pending_) {
    qLog(Warning) << "Tried to commit a ScopedTransaction twice";
    return false;
  }

  pending_ = false;

  if (!db_->commit()) {
    qLog(Error) << "Commit failed:" << db_->lastError().text();
    if (!db_->rollback()) {
      qLog(Error) << "Rollback failed:" << db_->lastError().text();
    }
    return false;
  }

  return true;

}

ScopedSavepoint::ScopedSavepoint(QSqlDatabase *db, const QString &name) : db_(db), name_(name), pending_(false) {

  pending_ = Exec(u"SAVEPOINT %1"_s.arg(name_));

}

ScopedSavepoint::~ScopedSavepoint() {

  if (pending_) {
    qLog(Debug) << "Rolling back to savepoint" << name_;
    if (Exec(u"ROLLBACK TO SAVEPOINT %1"_s.arg(name_))) {
      Exec(u"RELEASE SAVEPOINT %1"_s.arg(name_));
    }
  }

}

bool ScopedSavepoint::Release() {

  if (!pending_) return false;
  pending_ = false;
  return Exec(u"RELEASE SAVEPOINT %1"_s.arg(name_));

}

bool ScopedSavepoint::Exec(const QString &statement) {

  SqlQuery q(*db_);
  if (!q.exec(statement)) {
    qLog(Error) << "Savepoint statement failed:" << statement << q.lastError().text();
    return false;
  }
  return true;

}
