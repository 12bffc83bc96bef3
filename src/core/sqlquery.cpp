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

#include "config.h"

#include <optional>

#include <QMap>
#include <QVariant>
#include <QString>

#include "sqlquery.h"

using namespace Qt::Literals::StringLiterals;

void SqlQuery::BindValue(const QString &placeholder, const QVariant &value) {

  bound_values_.insert(placeholder, value);

  bindValue(placeholder, value);

}

void SqlQuery::BindStringValue(const QString &placeholder, const QString &value) {

  BindValue(placeholder, value.isNull() ? ""_L1 : value);

}

void SqlQuery::BindStringOrNullValue(const QString &placeholder, const QString &value) {

  BindValue(placeholder, value.isEmpty() ? QVariant() : QVariant(value));

}

void SqlQuery::BindIntOrNullValue(const QString &placeholder, const std::optional<int> value) {

  BindValue(placeholder, value.has_value() ? QVariant(*value) : QVariant());

}

void SqlQuery::BindLongLongValueOrZero(const QString &placeholder, const qint64 value) {

  BindValue(placeholder, value <= 0 ? 0 : value);

}

void SqlQuery::BindBoolValue(const QString &placeholder, const bool value) {

  BindValue(placeholder, value ? 1 : 0);

}

bool SqlQuery::Exec() {

  bool success = exec();
  last_query_ = executedQuery();

  for (QMap<QString, QVariant>::const_iterator it = bound_values_.constBegin(); it != bound_values_.constEnd(); ++it) {
    last_query_.replace(it.key(), it.value().isNull() ? u"NULL"_s : it.value().toString());
  }
  bound_values_.clear();

  return success;

}

QString SqlQuery::LastQuery() const {

  return last_query_;

}

std::optional<int> SqlQuery::OptionalIntValue(const int column) const {

  const QVariant v = value(column);
  if (v.isNull()) return std::nullopt;
  return v.toInt();

}

QString SqlQuery::StringOrNullValue(const int column) const {

  const QVariant v = value(column);
  if (v.isNull()) return QString();
  return v.toString();

}
