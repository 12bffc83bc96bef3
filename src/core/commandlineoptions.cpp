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

#include "config.h"

#include <getopt.h>

#include <QtGlobal>
#include <QObject>
#include <QFile>
#include <QString>
#include <QStringList>

#include "commandlineoptions.h"
#include "core/logging.h"

using namespace Qt::Literals::StringLiterals;

namespace {

constexpr char kHelpText[] =
    "%1: quaver [%2]\n"
    "\n"
    "%3:\n"
    "  -d, --directory <path>     %4\n"
    "      --database <file>      %5\n"
    "      --config <file>        %6\n"
    "      --debounce <ms>        %7\n"
    "      --batch-size <n>       %8\n"
    "      --no-dr                %9\n"
    "      --include-hidden       %10\n"
    "      --backup               %11\n"
    "\n"
    "%12:\n"
    "      --quiet                %13\n"
    "      --verbose              %14\n"
    "      --log-levels <levels>  %15\n"
    "      --log-file <file>      %16\n"
    "      --version              %17\n"
    "  -h, --help                 %18\n";

constexpr char kVersionText[] = "Quaver %1";

}  // namespace

CommandlineOptions::CommandlineOptions(int argc, char **argv)
    : argc_(argc),
      argv_(argv),
      no_dr_(false),
      include_hidden_(false),
      backup_(false),
      log_levels_(QLatin1String(logging::kDefaultLogLevels)) {}

QString CommandlineOptions::HelpText() {

  return QString::fromUtf8(kHelpText)
      .arg(QObject::tr("Usage"), QObject::tr("options"),
           QObject::tr("Library options"),
           QObject::tr("Watch <path> for music, may be given more than once"),
           QObject::tr("Use <file> as the library database"),
           QObject::tr("Read settings from <file>"),
           QObject::tr("Wait <ms> of quiet before applying changes"),
           QObject::tr("Apply at most <n> files per transaction"))
      .arg(QObject::tr("Don't look for dynamic range values"),
           QObject::tr("Also watch hidden files and directories"),
           QObject::tr("Back up the database before starting"),
           QObject::tr("Other options"),
           QObject::tr("Equivalent to --log-levels *:1"),
           QObject::tr("Equivalent to --log-levels *:4"),
           QObject::tr("Comma separated list of class:level, level is 0-4 or a name"),
           QObject::tr("Also write the log to <file>"),
           QObject::tr("Print out version information"))
      .arg(QObject::tr("Show this help"));

}

QString CommandlineOptions::VersionText() {
  return QString::fromUtf8(kVersionText).arg(QLatin1String(QUAVER_VERSION_DISPLAY));
}

CommandlineOptions::ParseResult CommandlineOptions::Parse() {

  static const struct option kOptions[] = {
    { "help", no_argument, nullptr, 'h' },
    { "directory", required_argument, nullptr, 'd' },
    { "database", required_argument, nullptr, LongOptions::Database },
    { "config", required_argument, nullptr, LongOptions::Config },
    { "debounce", required_argument, nullptr, LongOptions::Debounce },
    { "batch-size", required_argument, nullptr, LongOptions::BatchSize },
    { "no-dr", no_argument, nullptr, LongOptions::NoDr },
    { "include-hidden", no_argument, nullptr, LongOptions::IncludeHidden },
    { "backup", no_argument, nullptr, LongOptions::Backup },
    { "quiet", no_argument, nullptr, LongOptions::Quiet },
    { "verbose", no_argument, nullptr, LongOptions::Verbose },
    { "log-levels", required_argument, nullptr, LongOptions::LogLevels },
    { "log-file", required_argument, nullptr, LongOptions::LogFile },
    { "version", no_argument, nullptr, LongOptions::Version },
    { nullptr, 0, nullptr, 0 }
  };

  // Zero makes glibc reinitialize, so the same process can parse more than one argument vector.
  optind = 0;
  opterr = 0;

  Q_FOREVER {
    const int c = getopt_long(argc_, argv_, "hd:", kOptions, nullptr);

    // End of the options
    if (c == -1) break;

    switch (c) {
      case 'h':
        return ParseResult::ShowHelp;

      case 'd':
        directories_ << DecodeName(optarg);
        break;

      case LongOptions::Database:
        database_ = DecodeName(optarg);
        break;

      case LongOptions::Config:
        config_file_ = DecodeName(optarg);
        break;

      case LongOptions::Debounce:
        if (!ParseNumber("--debounce", optarg, 0, &debounce_delay_ms_)) return ParseResult::Error;
        break;

      case LongOptions::BatchSize:
        if (!ParseNumber("--batch-size", optarg, 1, &max_batch_size_)) return ParseResult::Error;
        break;

      case LongOptions::NoDr:
        no_dr_ = true;
        break;

      case LongOptions::IncludeHidden:
        include_hidden_ = true;
        break;

      case LongOptions::Backup:
        backup_ = true;
        break;

      case LongOptions::Quiet:
        log_levels_ = u"1"_s;
        break;

      case LongOptions::Verbose:
        log_levels_ = u"4"_s;
        break;

      case LongOptions::LogLevels:
        log_levels_ = OptArgToString(optarg);
        break;

      case LongOptions::LogFile:
        log_file_ = DecodeName(optarg);
        break;

      case LongOptions::Version:
        return ParseResult::ShowVersion;

      case '?':
      default:
        if (optopt != 0 && optopt < LongOptions::Database) {
          error_ = QObject::tr("Unknown option -%1").arg(QChar::fromLatin1(static_cast<char>(optopt)));
        }
        else {
          error_ = QObject::tr("Unknown or incomplete option %1").arg(OptArgToString(argv_[optind - 1]));
        }
        return ParseResult::Error;
    }
  }

  // Anything after the options is a directory to watch
  for (int i = optind; i < argc_; ++i) {
    directories_ << DecodeName(argv_[i]);
  }

  return ParseResult::Ok;

}

bool CommandlineOptions::ParseNumber(const char *option, const char *value, const int minimum, std::optional<int> *result) {

  bool ok = false;
  const int number = OptArgToString(value).toInt(&ok);
  if (!ok || number < minimum) {
    error_ = QObject::tr("Invalid value \"%1\" for %2, expected a number of at least %3").arg(OptArgToString(value), QLatin1String(option)).arg(minimum);
    return false;
  }

  *result = number;
  return true;

}

QString CommandlineOptions::OptArgToString(const char *opt) {

  return QString::fromUtf8(opt);

}

QString CommandlineOptions::DecodeName(const char *opt) {

  return QFile::decodeName(opt);

}
