/*
 * Quaver Music Library
 * This file was part of Strawberry.
 * Copyright 2024, Jonas Kvinge <jonas@jkvinge.net>
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

#include "tagreaderresult.h"

using namespace Qt::Literals::StringLiterals;

QString TagReaderResult::error_string() const {

  QString message;
  switch (error_code) {
    case ErrorCode::Success:
      return QObject::tr("Success");
    case ErrorCode::Unsupported:
      message = QObject::tr("Not a supported audio file");
      break;
    case ErrorCode::FilenameMissing:
      message = QObject::tr("Filename is missing");
      break;
    case ErrorCode::FileDoesNotExist:
      message = QObject::tr("File does not exist");
      break;
    case ErrorCode::FileOpenError:
      message = QObject::tr("File could not be opened");
      break;
    case ErrorCode::FileParseError:
      message = QObject::tr("Could not read tags or audio properties");
      break;
    case ErrorCode::CustomError:
      return error_text;
  }

  if (!error_text.isEmpty()) {
    message += u": "_s + error_text;
  }

  return message;

}
