/* -*- Mode: C++; indent-tabs-mode: t; c-basic-offset: 4; tab-width: 4 -*-  */
/*
 * Config.hh
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

#ifndef CONFIG_HH
#define CONFIG_HH

#include <QMap>
#include <QObject>

class Config : public QObject {
	Q_OBJECT
public:
	Config(QObject* parent = nullptr);

	QString language() const;
	QString builderName() const;
	// Empty: output format of the selected builder
	QString format() const;
	// -1: page segmentation mode of the selected builder
	int pageSegMode() const;
	QString tessdataDir() const;
	QMap<QString, QString> variables() const;

	void setLanguage(const QString& language);
	void setBuilderName(const QString& name);
	void setFormat(const QString& format);
	void setPageSegMode(int psm);
	void setTessdataDir(const QString& dir);
	void setVariables(const QMap<QString, QString>& variables);

	// Exports dir as TESSDATA_PREFIX. An empty dir leaves the environment untouched.
	// Returns false if dir does not exist.
	static bool applyTessdataLocation(const QString& dir);
	static QString tessdataLocation();
};

#endif // CONFIG_HH
