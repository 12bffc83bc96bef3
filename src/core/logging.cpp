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

#include <QtGlobal>

#include "config.h"

#include <cstdio>
#include <cstdlib>
#include <cstring>

#include <memory>
#include <chrono>

#include <QByteArray>
#include <QMap>
#include <QMutex>
#include <QMutexLocker>
#include <QString>
#include <QStringList>
#include <QDateTime>
#include <QFile>
#include <QIODevice>
#include <QBuffer>
#include <QtMessageHandler>
#include <QMessageLogContext>
#include <QDebug>

#include "logging.h"

using namespace Qt::Literals::StringLiterals;

namespace logging {

static Level sDefaultLevel = Level_Info;
static QMap<QString, Level> *sClassLevels = nullptr;
static QIODevice *sNullDevice = nullptr;
static QFile *sLogFile = nullptr;
static QMutex sOutputMutex;

const char *kDefaultLogLevels = "*:3";

static constexpr char kMessageHandlerMagic[] = "__logging_message__";
static const size_t kMessageHandlerMagicLen = strlen(kMessageHandlerMagic);
static QtMessageHandler sOriginalMessageHandler = nullptr;

template<class T>
static T CreateLogger(Level level, const QString &class_name, int line);

template<class T>
class DebugBase : public QDebug {
 public:
  DebugBase() : QDebug(sNullDevice) {}
  explicit DebugBase(QtMsgType t) : QDebug(t) {}
  T &space() { return static_cast<T&>(QDebug::space()); }
  T &nospace() { return static_cast<T&>(QDebug::nospace()); }
};

// Collects the message in a buffer, used when re-formatting messages from Qt itself.
class BufferedDebug : public DebugBase<BufferedDebug> {
 public:
  BufferedDebug() = default;
  explicit BufferedDebug(QtMsgType msg_type) : buf_(new QBuffer, later_deleter) {

    Q_UNUSED(msg_type)

    buf_->open(QIODevice::WriteOnly);

    // QDebug can't change its device, swap() moves ours in.
    QDebug other(buf_.get());
    swap(other);
  }

  // The base class still points at the buffer until this object is gone.
  static void later_deleter(QBuffer *b) { b->deleteLater(); }

  std::shared_ptr<QBuffer> buf_;
};

// Sent straight to the message handler when the stream is destroyed.
class LoggedDebug : public DebugBase<LoggedDebug> {
 public:
  LoggedDebug() = default;
  explicit LoggedDebug(QtMsgType t) : DebugBase(t) { nospace() << kMessageHandlerMagic; }
};

static void WriteLine(const QtMsgType type, const char *data) {

  QMutexLocker l(&sOutputMutex);

  FILE *stream = type == QtCriticalMsg || type == QtFatalMsg ? stderr : stdout;
  fprintf(stream, "%s\n", data);
  fflush(stream);

  if (sLogFile && sLogFile->isOpen()) {
    sLogFile->write(data);
    sLogFile->write("\n", 1);
    sLogFile->flush();
  }

}

static void MessageHandler(QtMsgType type, const QMessageLogContext &message_log_context, const QString &message) {

  Q_UNUSED(message_log_context)

  if (message.startsWith(QLatin1String(kMessageHandlerMagic))) {
    const QByteArray message_data = message.toUtf8();
    WriteLine(type, message_data.constData() + kMessageHandlerMagicLen);
    return;
  }

  Level level = Level_Debug;
  switch (type) {
    case QtFatalMsg:
    case QtCriticalMsg:
      level = Level_Error;
      break;
    case QtWarningMsg:
      level = Level_Warning;
      break;
    case QtInfoMsg:
      level = Level_Info;
      break;
    case QtDebugMsg:
    default:
      level = Level_Debug;
      break;
  }

  const QString category = message_log_context.category && strcmp(message_log_context.category, "default") != 0 ? QString::fromUtf8(message_log_context.category) : u"Qt"_s;
  const QStringList lines = message.split(u'\n');
  for (const QString &line : lines) {
    BufferedDebug d = CreateLogger<BufferedDebug>(level, category, -1);
    d << line.toLocal8Bit().constData();
    if (d.buf_) {
      d.buf_->close();
      WriteLine(type, d.buf_->buffer().constData());
    }
  }

  if (type == QtFatalMsg) {
    abort();
  }

}

void Init() {

  delete sClassLevels;
  delete sNullDevice;

  sClassLevels = new QMap<QString, Level>();
  sNullDevice = new NullDevice;
  sNullDevice->open(QIODevice::ReadWrite);

  // Catch other messages from Qt
  if (!sOriginalMessageHandler) {
    sOriginalMessageHandler = qInstallMessageHandler(MessageHandler);
  }

}

static bool ParseLevel(const QString &text, int *level) {

  static const QMap<QString, int> level_names = {
    { u"error"_s, Level_Error },
    { u"warning"_s, Level_Warning },
    { u"warn"_s, Level_Warning },
    { u"info"_s, Level_Info },
    { u"debug"_s, Level_Debug },
  };

  const QString name = text.trimmed().toLower();
  if (level_names.contains(name)) {
    *level = level_names.value(name);
    return true;
  }

  bool ok = false;
  *level = name.toInt(&ok);
  return ok;

}

void SetLevels(const QString &levels) {

  if (!sClassLevels) return;

  const QStringList items = levels.split(u',', Qt::SkipEmptyParts);
  for (const QString &item : items) {
    const QStringList class_level = item.split(u':');

    QString class_name;
    bool ok = false;
    int level = Level_Error;

    if (class_level.count() == 1) {
      ok = ParseLevel(class_level.last(), &level);
    }
    else if (class_level.count() == 2) {
      class_name = class_level.first().trimmed();
      ok = ParseLevel(class_level.last(), &level);
    }

    if (!ok || level < Level_Error || level > Level_Debug) {
      continue;
    }

    if (class_name.isEmpty() || class_name == u'*') {
      sDefaultLevel = static_cast<Level>(level);
    }
    else {
      sClassLevels->insert(class_name, static_cast<Level>(level));
    }
  }

}

bool SetLogFile(const QString &filename) {

  QMutexLocker l(&sOutputMutex);

  if (sLogFile) {
    sLogFile->close();
    delete sLogFile;
    sLogFile = nullptr;
  }

  if (filename.isEmpty()) return true;

  sLogFile = new QFile(filename);
  if (!sLogFile->open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
    fprintf(stderr, "Could not open log file %s: %s\n", filename.toLocal8Bit().constData(), sLogFile->errorString().toLocal8Bit().constData());
    delete sLogFile;
    sLogFile = nullptr;
    return false;
  }

  return true;

}

static QString ParsePrettyFunction(const char *pretty_function) {

  // Get the class name out of the function name.
  QString class_name = QLatin1String(pretty_function);
  const qint64 paren = class_name.indexOf(u'(');
  if (paren != -1) {
    const qint64 colons = class_name.lastIndexOf("::"_L1, paren);
    if (colons != -1) {
      class_name = class_name.left(colons);
    }
    else {
      class_name = class_name.left(paren);
    }
  }

  const qint64 space = class_name.lastIndexOf(u' ');
  if (space != -1) {
    class_name = class_name.mid(space + 1);
  }

  // Strip template arguments, BoundedChannel<ChangeEvent> filters as BoundedChannel.
  const qint64 angle = class_name.indexOf(u'<');
  if (angle > 0) {
    class_name = class_name.left(angle);
  }

  return class_name;

}

template <class T>
static T CreateLogger(Level level, const QString &class_name, int line) {

  const char *level_name = nullptr;
  switch (level) {
    case Level_Debug:   level_name = " DEBUG "; break;
    case Level_Info:    level_name = " INFO  "; break;
    case Level_Warning: level_name = " WARN  "; break;
    case Level_Error:   level_name = " ERROR "; break;
  }

  Level threshold_level = sDefaultLevel;
  if (sClassLevels && sClassLevels->contains(class_name)) {
    threshold_level = sClassLevels->value(class_name);
  }

  if (level > threshold_level) {
    return T();
  }

  QString function_line = class_name;
  if (line != -1) {
    function_line += QLatin1Char(':') + QString::number(line);
  }

  const QtMsgType type = level == Level_Error ? QtCriticalMsg : QtDebugMsg;

  T ret(type);
  ret.nospace() << QDateTime::currentDateTime().toString(u"yyyy-MM-dd hh:mm:ss.zzz"_s).toLatin1().constData() << level_name << function_line.leftJustified(36).toLatin1().constData();

  return ret.space();

}

// Logger factories used by the qLog macros.
#define qCreateLogger(line, pretty_function, level) logging::CreateLogger<LoggedDebug>(logging::Level_##level, logging::ParsePrettyFunction(pretty_function), line)

QDebug CreateLoggerError(const int line, const char *pretty_function) { return qCreateLogger(line, pretty_function, Error); }

#ifdef QT_NO_INFO_OUTPUT
QNoDebug CreateLoggerInfo(const int line, const char *pretty_function) {

  Q_UNUSED(line)
  Q_UNUSED(pretty_function)

  return QNoDebug();

}
#else
QDebug CreateLoggerInfo(const int line, const char *pretty_function) { return qCreateLogger(line, pretty_function, Info); }
#endif  // QT_NO_INFO_OUTPUT

#ifdef QT_NO_WARNING_OUTPUT
QNoDebug CreateLoggerWarning(const int line, const char *pretty_function) {

  Q_UNUSED(line)
  Q_UNUSED(pretty_function)

  return QNoDebug();

}
#else
QDebug CreateLoggerWarning(const int line, const char *pretty_function) { return qCreateLogger(line, pretty_function, Warning); }
#endif  // QT_NO_WARNING_OUTPUT

#ifdef QT_NO_DEBUG_OUTPUT
QNoDebug CreateLoggerDebug(const int line, const char *pretty_function) {

  Q_UNUSED(line)
  Q_UNUSED(pretty_function)

  return QNoDebug();

}
#else
QDebug CreateLoggerDebug(const int line, const char *pretty_function) { return qCreateLogger(line, pretty_function, Debug); }
#endif  // QT_NO_DEBUG_OUTPUT

}  // namespace logging

namespace {

template<typename T>
QString print_duration(T duration, const char *unit) {
  return QStringLiteral("%1%2").arg(duration.count()).arg(QLatin1String(unit));
}

}  // namespace

QDebug operator<<(QDebug dbg, std::chrono::milliseconds msecs) {
  dbg.nospace() << print_duration(msecs, "ms");
  return dbg.space();
}
