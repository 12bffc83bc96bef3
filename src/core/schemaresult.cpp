/*
 * Quaver Music Library
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

#include <QObject>

#include "schemaresult.h"

QString SchemaResult::error_string() const {

  QString message;
  switch (error_code) {
    case ErrorCode::Success:
      return QObject::tr("Success");
    case ErrorCode::ConnectionError:
      message = QObject::tr("Could not open database");
      break;
    case ErrorCode::MigrationError:
      message = QObject::tr("Schema migration error");
      break;
    case ErrorCode::SqlError:
      message = QObject::tr("SQL error");
      break;
  }

  if (!error_text.isEmpty()) {
    message += QLatin1String(": ") + error_text;
  }

  return message;

}
