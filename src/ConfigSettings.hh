/* -*- Mode: C++; indent-tabs-mode: t; c-basic-offset: 4; tab-width: 4 -*-  */
/*
 * ConfigSettings.hh
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

#ifndef CONFIGSETTINGS_HH
#define CONFIGSETTINGS_HH

#include <QMap>
#include <QObject>
#include <QSettings>
#include <QString>

class AbstractSetting;

#define ADD_SETTING(...) ((new __VA_ARGS__)->setParent(this))

class ConfigSettings {
public:
	template<class T>
	static T* get(const QString& key) {
		auto it = s_settings.find(key);
		return it == s_settings.end() ? nullptr : static_cast<T*>(it.value());
	}

private:
	friend class AbstractSetting;
	static QMap<QString, AbstractSetting*> s_settings;

	static void add(AbstractSetting* setting);
	static void remove(const QString& key);
};


class AbstractSetting : public QObject {
	Q_OBJECT
public:
	AbstractSetting(const QString& key)
		: m_key(key) {
		ConfigSettings::add(this);
	}
	virtual ~AbstractSetting() {
		ConfigSettings::remove(m_key);
	}
	const QString& key() const {
		return m_key;
	}

signals:
	void changed();

protected:
	QString m_key;
};

template <class T>
class VarSetting : public AbstractSetting {
public:
	VarSetting(const QString& key, const T& defaultValue = T())
		: AbstractSetting(key), m_defaultValue(QVariant::fromValue(defaultValue)) {}

	T getValue() const {
		return QSettings().value(m_key, m_defaultValue).template value<T>();
	}
	void setValue(const T& value) {
		QSettings().setValue(m_key, QVariant::fromValue(value));
		emit changed();
	}
	void reset() {
		QSettings().remove(m_key);
		emit changed();
	}

private:
	QVariant m_defaultValue;
};

// Name/value pairs, serialized as name1=value1;name2=value2
class MapSetting : public AbstractSetting {
	Q_OBJECT
public:
	MapSetting(const QString& key)
		: AbstractSetting(key) {}

	QMap<QString, QString> getValue() const;
	void setValue(const QMap<QString, QString>& value);

	static QMap<QString, QString> deserialize(const QString& string);
	static QString serialize(const QMap<QString, QString>& map);
};

#endif // CONFIGSETTINGS_HH
