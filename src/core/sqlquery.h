/*
 * Quaver Music Library
 * This file was part of Strawberry.
 * Copyright 2021-2024, Jonas Kvinge <jonas@jkvinge.net>
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

#ifndef SQLQUERY_H
#define SQLQUERY_H

#include "config.h"

#include <optional>

#include <QMap>
#include <QVariant>
#include <QString>
#include <QSqlDatabase>
#include <QSqlQuery>
#include <QSqlRecord>

class SqlQuery : public QSqlQuery {

 public:
  explicit SqlQuery(const QSqlDatabase &db) : QSqlQuery(db) {}

  int columns() const { return QSqlQuery::record().count(); }

  void BindValue(const QString &placeholder, const QVariant &value);
  void BindStringValue(const QString &placeholder, const QString &value);
  void BindStringOrNullValue(const QString &placeholder, const QString &value);
  void BindIntOrNullValue(const QString &placeholder, const std::optional<int> value);
  void BindLongLongValueOrZero(const QString &placeholder, const qint64 value);
  void BindBoolValue(const QString &placeholder, const bool value);

  bool Exec();
  QString LastQuery() const;

  // Column helpers for nullable INTEGER and TEXT columns.
  std::optional<int> OptionalIntValue(const int column) const;
  QString StringOrNullValue(const int column) const;

 private:
  QMap<QString, QVariant> bound_values_;
  QString last_query_;
};

#endif  // SQLQUERY_H
