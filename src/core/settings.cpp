/*
 * Quaver Music Library
 * This file was part of Strawberry.
 * Copyright 2019-2021, Jonas Kvinge <jonas@jkvinge.net>
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

#include <QSettings>
#include <QString>
#include <QStandardPaths>
#include <QCoreApplication>

#include "settings.h"

using namespace Qt::Literals::StringLiterals;

namespace {
QString sFilename;
}  // namespace

Settings::Settings(QObject *parent)
    : QSettings(Filename(), QSettings::IniFormat, parent) {}

Settings::Settings(const QString &filename, QObject *parent)
    : QSettings(filename, QSettings::IniFormat, parent) {}

void Settings::SetFilename(const QString &filename) {

  sFilename = filename;

}

QString Settings::Filename() {

  if (!sFilename.isEmpty()) return sFilename;

  const QString application_name = QCoreApplication::applicationName().isEmpty() ? u"quaver"_s : QCoreApplication::applicationName().toLower();
  return QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation) + u'/' + application_name + u'/' + application_name + u".conf"_s;

}
