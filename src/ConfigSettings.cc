/* -*- Mode: C++; indent-tabs-mode: t; c-basic-offset: 4; tab-width: 4 -*-  */
/*
 * ConfigSettings.cc
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

#include "ConfigSettings.hh"

#include <QStringList>

QMap<QString, AbstractSetting*> ConfigSettings::s_settings;

void ConfigSettings::add(AbstractSetting* setting) {
	s_settings.insert(setting->key(), setting);
}

void ConfigSettings::remove(const QString& key) {
	s_settings.remove(key);
}

QMap<QString, QString> MapSetting::getValue() const {
	return deserialize(QSettings().value(m_key).toString());
}

void MapSetting::setValue(const QMap<QString, QString>& value) {
	QSettings().setValue(m_key, QVariant::fromValue(serialize(value)));
	emit changed();
}

QMap<QString, QString> MapSetting::deserialize(const QString& string) {
	QMap<QString, QString> map;
	for(const QString& entry : string.split(';', Qt::SkipEmptyParts)) {
		int splitPos = entry.indexOf('=');
		if(splitPos <= 0) {
			continue;
		}
		map.insert(entry.left(splitPos).trimmed(), entry.mid(splitPos + 1));
	}
	return map;
}

QString MapSetting::serialize(const QMap<QString, QString>& map) {
	QStringList entries;
	for(auto it = map.begin(), itEnd = map.end(); it != itEnd; ++it) {
		entries.append(QString("%1=%2").arg(it.key(), it.value()));
	}
	return entries.join(";");
}
