/* -*- Mode: C++; indent-tabs-mode: t; c-basic-offset: 4; tab-width: 4 -*-  */
/*
 * Config.cc
 * Copyright (C) 2013-2026 Sandro Mani <manisandro@gmail.com>
 *
 * tessnest is free software: you can redistribute it and/or modify it
 * under the terms of the GNU General Public License as published by the
 * Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * tessnest is distributed in the hope that it will be useful, but
 * WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.
 * See the GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License along
 * with this program.  If not, see <http://www.gnu.org/licenses/>.
 */

#include "Config.hh"
#include "ConfigSettings.hh"

#include <clocale>
#include <QDir>
#define USE_STD_NAMESPACE
#include <tesseract/baseapi.h>
#undef USE_STD_NAMESPACE

Config::Config(QObject* parent)
	: QObject(parent) {
	ADD_SETTING(VarSetting<QString>("language", "eng"));
	ADD_SETTING(VarSetting<QString>("builder", "text"));
	ADD_SETTING(VarSetting<QString>("format", ""));
	ADD_SETTING(VarSetting<int>("psm", -1));
	ADD_SETTING(VarSetting<QString>("tessdata", ""));
	ADD_SETTING(MapSetting("variables"));
}

QString Config::language() const {
	return ConfigSettings::get<VarSetting<QString>>("language")->getValue();
}

QString Config::builderName() const {
	return ConfigSettings::get<VarSetting<QString>>("builder")->getValue();
}

QString Config::format() const {
	return ConfigSettings::get<VarSetting<QString>>("format")->getValue();
}

int Config::pageSegMode() const {
	return ConfigSettings::get<VarSetting<int>>("psm")->getValue();
}

QString Config::tessdataDir() const {
	return ConfigSettings::get<VarSetting<QString>>("tessdata")->getValue();
}

QMap<QString, QString> Config::variables() const {
	return ConfigSettings::get<MapSetting>("variables")->getValue();
}

void Config::setLanguage(const QString& language) {
	ConfigSettings::get<VarSetting<QString>>("language")->setValue(language);
}

void Config::setBuilderName(const QString& name) {
	ConfigSettings::get<VarSetting<QString>>("builder")->setValue(name);
}

void Config::setFormat(const QString& format) {
	ConfigSettings::get<VarSetting<QString>>("format")->setValue(format);
}

void Config::setPageSegMode(int psm) {
	ConfigSettings::get<VarSetting<int>>("psm")->setValue(psm);
}

void Config::setTessdataDir(const QString& dir) {
	ConfigSettings::get<VarSetting<QString>>("tessdata")->setValue(dir);
}

void Config::setVariables(const QMap<QString, QString>& variables) {
	ConfigSettings::get<MapSetting>("variables")->setValue(variables);
}

bool Config::applyTessdataLocation(const QString& dir) {
	if(dir.isEmpty()) {
		return true;
	}
	QDir tessdataDir(dir);
	if(!tessdataDir.exists()) {
		qWarning("Tessdata directory %s does not exist", qPrintable(dir));
		return false;
	}
	qputenv("TESSDATA_PREFIX", tessdataDir.absolutePath().toLocal8Bit());
	return true;
}

QString Config::tessdataLocation() {
	QByteArray current = setlocale(LC_ALL, NULL);
	setlocale(LC_ALL, "C");
	tesseract::TessBaseAPI tess;
	bool ok = tess.Init(nullptr, nullptr) != -1;
	setlocale(LC_ALL, current.constData());
	if(!ok) {
		qWarning("Failed to initialize tesseract with the default language");
		return QString();
	}
	return QString(tess.GetDatapath());
}
