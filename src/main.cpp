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

#include <csignal>
#include <chrono>
#include <iostream>

#include <QtGlobal>
#include <QObject>
#include <QCoreApplication>
#include <QString>
#include <QStringList>

#include "includes/shared_ptr.h"
#include "core/logging.h"
#include "core/commandlineoptions.h"
#include "core/metatypes.h"
#include "core/settings.h"
#include "core/taskmanager.h"
#include "core/database.h"
#include "core/unixsignalwatcher.h"
#include "tagreader/tagreadertaglib.h"
#include "library/librarysync.h"
#include "constants/librarysettings.h"

using namespace Qt::Literals::StringLiterals;

int main(int argc, char *argv[]) {

  QCoreApplication::setApplicationName(u"quaver"_s);
  QCoreApplication::setOrganizationName(u"quaver"_s);
  QCoreApplication::setApplicationVersion(QLatin1String(QUAVER_VERSION_DISPLAY));

  QCoreApplication a(argc, argv);

  RegisterMetaTypes();

  // Initialise logging.  Log levels are set after the commandline options are parsed below.
  logging::Init();

  CommandlineOptions options(argc, argv);
  switch (options.Parse()) {
    case CommandlineOptions::ParseResult::Ok:
      break;
    case CommandlineOptions::ParseResult::ShowHelp:
      std::cout << CommandlineOptions::HelpText().toLocal8Bit().constData();
      return 0;
    case CommandlineOptions::ParseResult::ShowVersion:
      std::cout << CommandlineOptions::VersionText().toLocal8Bit().constData() << std::endl;
      return 0;
    case CommandlineOptions::ParseResult::Error:
      std::cerr << options.error().toLocal8Bit().constData() << std::endl << std::endl;
      std::cerr << CommandlineOptions::HelpText().toLocal8Bit().constData();
      return 2;
  }

  logging::SetLevels(options.log_levels());
  if (!options.log_file().isEmpty() && !logging::SetLogFile(options.log_file())) {
    return 1;
  }

  // Output the version, so log output attached to bug reports says which version it came from.
  qLog(Info) << "Quaver" << QUAVER_VERSION_DISPLAY;

  Q_INIT_RESOURCE(data);

  if (!options.config_file().isEmpty()) {
    Settings::SetFilename(options.config_file());
  }

  QString database_filename = options.database();
  if (database_filename.isEmpty()) {
    Settings s;
    s.beginGroup(LibrarySettings::kSettingsGroup);
    database_filename = s.value(LibrarySettings::kDatabase).toString();
    s.endGroup();
  }

  SharedPtr<TaskManager> task_manager = make_shared<TaskManager>();
  SharedPtr<Database> database = make_shared<Database>(task_manager, nullptr, database_filename);

  const SchemaResult schema_result = database->InitializeSchema();
  if (!schema_result.success()) {
    qLog(Error) << "Could not open the library database:" << schema_result.error_string();
    database->Close();
    return 1;
  }

  const bool backup_failed = options.backup() && !database->DoBackup();

  // The pipeline threads open their own connections.
  database->Close();

  if (backup_failed) {
    qLog(Error) << "Backup of" << database->database_name() << "failed";
    return 1;
  }

  SharedPtr<TagReaderBase> tagreader = make_shared<TagReaderTagLib>();

  LibrarySync library_sync(database, task_manager, tagreader);
  library_sync.ReloadSettings();

  if (!options.directories().isEmpty()) {
    library_sync.set_directories(options.directories());
  }
  if (options.debounce_delay_ms()) {
    library_sync.set_debounce_delay(std::chrono::milliseconds(options.debounce_delay_ms().value()));
  }
  if (options.max_batch_size()) {
    library_sync.set_max_batch_size(options.max_batch_size().value());
  }
  if (options.no_dr()) {
    library_sync.set_dr_parsing(false);
  }
  if (options.include_hidden()) {
    library_sync.set_include_hidden(true);
  }

  if (library_sync.directories().isEmpty()) {
    qLog(Error) << "No music directories configured, pass --directory or set" << LibrarySettings::kSettingsGroup << "/" << LibrarySettings::kDirectories;
    return 1;
  }

  int exit_code = 0;
  QObject::connect(&library_sync, &LibrarySync::Fatal, &a, [&exit_code](const QString &error) {
    qLog(Error) << error;
    exit_code = 1;
    QCoreApplication::exit(1);
  });

  UnixSignalWatcher signal_watcher;
  if (!signal_watcher.WatchForSignal(SIGINT) || !signal_watcher.WatchForSignal(SIGTERM)) {
    qLog(Warning) << "Termination signals are not handled, pending changes may be lost on exit";
  }
  QObject::connect(&signal_watcher, &UnixSignalWatcher::UnixSignal, &a, [](const int signal) {
    Q_UNUSED(signal)
    QCoreApplication::quit();
  });

  const int watched = library_sync.Start();
  if (watched == 0) {
    qLog(Error) << "None of the music directories could be watched";
    library_sync.Stop();
    return 1;
  }

  qLog(Info) << "Watching" << watched << "of" << library_sync.directories().count() << "music directories";

  const int ret = a.exec();

  library_sync.Stop();
  database->Close();

  qLog(Info) << "Quaver stopped";

  return exit_code != 0 ? exit_code : ret;

}
