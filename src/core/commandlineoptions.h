/*
 * Quaver Music Library
 * This file was part of Strawberry.
 * Copyright 2010, David Sansome <me@davidsansome.com>
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

#ifndef COMMANDLINEOPTIONS_H
#define COMMANDLINEOPTIONS_H

#include "config.h"

#include <optional>

#include <QtGlobal>
#include <QString>
#include <QStringList>

class CommandlineOptions {

 public:
  explicit CommandlineOptions(int argc = 0, char **argv = nullptr);

  // Don't change the values or order, getopt_long returns these for long-only options
  enum LongOptions {
    Database = 256,
    Config,
    Debounce,
    BatchSize,
    NoDr,
    IncludeHidden,
    Backup,
    Quiet,
    Verbose,
    LogLevels,
    LogFile,
    Version
  };

  enum class ParseResult {
    Ok,
    ShowHelp,
    ShowVersion,
    Error
  };

  ParseResult Parse();

  QStringList directories() const { return directories_; }
  QString database() const { return database_; }
  QString config_file() const { return config_file_; }
  std::optional<int> debounce_delay_ms() const { return debounce_delay_ms_; }
  std::optional<int> max_batch_size() const { return max_batch_size_; }
  bool no_dr() const { return no_dr_; }
  bool include_hidden() const { return include_hidden_; }
  bool backup() const { return backup_; }
  QString log_levels() const { return log_levels_; }
  QString log_file() const { return log_file_; }
  QString error() const { return error_; }

  static QString HelpText();
  static QString VersionText();

 private:
  static QString OptArgToString(const char *opt);
  static QString DecodeName(const char *opt);
  bool ParseNumber(const char *option, const char *value, const int minimum, std::optional<int> *result);

 private:
  int argc_;
  char **argv_;

  QStringList directories_;
  QString database_;
  QString config_file_;
  std::optional<int> debounce_delay_ms_;
  std::optional<int> max_batch_size_;
  bool no_dr_;
  bool include_hidden_;
  bool backup_;
  QString log_levels_;
  QString log_file_;
  QString error_;
};

#endif  // COMMANDLINEOPTIONS_H
