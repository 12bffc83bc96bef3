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

#ifndef DRRESULT_H
#define DRRESULT_H

#include <QString>

class DrResult {
 public:
  enum class ErrorCode {
    Success,
    NoDrValueFound,
    InvalidContent,
    InvalidDrFormat,
    ReadError,
  };
  DrResult(const ErrorCode _error_code = ErrorCode::NoDrValueFound, const QString &_error_text = QString()) : error_code(_error_code), error_text(_error_text) {}
  static DrResult Found(const QString &_dr_value) {
    DrResult result(ErrorCode::Success);
    result.dr_value = _dr_value;
    return result;
  }
  ErrorCode error_code;
  QString error_text;
  QString dr_value;
  bool success() const { return error_code == ErrorCode::Success; }
  QString error_string() const;
};

#endif  // DRRESULT_H
