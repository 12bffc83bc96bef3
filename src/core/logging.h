/* This file is part of Quaver.
   This file was part of Strawberry.
   Copyright 2011, David Sansome <me@davidsansome.com>
   Copyright 2018-2021, Jonas Kvinge <jonas@jkvinge.net>
   Copyright 2024-2026, Quaver developers

   Licensed under the Apache License, Version 2.0 (the "License");
   you may not use this file except in compliance with the License.
   You may obtain a copy of the License at

       http://www.apache.org/licenses/LICENSE-2.0

   Unless required by applicable law or agreed to in writing, software
   distributed under the License is distributed on an "AS IS" BASIS,
   WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
   See the License for the specific language governing permissions and
   limitations under the License.
*/

#ifndef LOGGING_H
#define LOGGING_H

#include <chrono>

#include <QtGlobal>
#include <QIODevice>
#include <QString>
#include <QDebug>

#ifdef QT_NO_DEBUG_STREAM
#  define qLog(level) while (false) QNoDebug()
#else
#  define qLog(level) logging::CreateLogger##level(__LINE__, __PRETTY_FUNCTION__)
#endif  // QT_NO_DEBUG_STREAM

namespace logging {

class NullDevice : public QIODevice {
  Q_OBJECT

 public:
  explicit NullDevice(QObject *parent = nullptr) : QIODevice(parent) {}

 protected:
  qint64 readData(char*, qint64) override { return -1; }
  qint64 writeData(const char*, qint64 len) override { return len; }
};

enum Level {
  Level_Error = 0,
  Level_Warning,
  Level_Info,
  Level_Debug,
};

void Init();

// Comma separated list of class:level pairs, "*" or an empty class sets the default.
// Levels are numbers (0-4) or names (error, warning, info, debug).
void SetLevels(const QString &levels);

// Mirrors every printed line to the given file, an empty filename closes it.
bool SetLogFile(const QString &filename);

QDebug CreateLoggerError(const int line, const char *pretty_function);

#ifdef QT_NO_INFO_OUTPUT
QNoDebug CreateLoggerInfo(const int line, const char *pretty_function);
#else
QDebug CreateLoggerInfo(const int line, const char *pretty_function);
#endif  // QT_NO_INFO_OUTPUT

#ifdef QT_NO_WARNING_OUTPUT
QNoDebug CreateLoggerWarning(const int line, const char *pretty_function);
#else
QDebug CreateLoggerWarning(const int line, const char *pretty_function);
#endif  // QT_NO_WARNING_OUTPUT

#ifdef QT_NO_DEBUG_OUTPUT
QNoDebug CreateLoggerDebug(const int line, const char *pretty_function);
#else
QDebug CreateLoggerDebug(const int line, const char *pretty_function);
#endif  // QT_NO_DEBUG_OUTPUT

extern const char *kDefaultLogLevels;

}  // namespace logging

QDebug operator<<(QDebug dbg, std::chrono::milliseconds msecs);

#endif  // LOGGING_H
