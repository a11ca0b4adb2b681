/* -*- Mode: C++; indent-tabs-mode: t; c-basic-offset: 4; tab-width: 4 -*-  */
/*
 * TesseractBackend.hh
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

#ifndef TESSERACTBACKEND_HH
#define TESSERACTBACKEND_HH

#include <QMap>
#include <QStringList>

#include "Builder.hh"

class QImage;

struct TesseractVersion {
	int majorVersion = 0;
	int minorVersion = 0;
	int patchVersion = 0;

	bool isValid() const {
		return majorVersion > 0;
	}
	bool atLeast(int maj, int min, int patch = 0) const {
		if(majorVersion != maj) {
			return majorVersion > maj;
		}
		if(minorVersion != min) {
			return minorVersion > min;
		}
		return patchVersion >= patch;
	}
	QString toString() const {
		return QString("%1.%2.%3").arg(majorVersion).arg(minorVersion).arg(patchVersion);
	}
};

struct OrientationInfo {
	int angle = 0;
	double confidence = 0.;
	QString script;
	double scriptConfidence = 0.;

	QString toString() const {
		return QString("angle %1\nconfidence %2\nscript %4\nscript confidence %3\n")
		       .arg(angle).arg(confidence, 0, 'f', 2).arg(scriptConfidence, 0, 'f', 2).arg(script);
	}
};

class TesseractBackend {
public:
	explicit TesseractBackend(const QString& language = QString());

	const QString& language() const {
		return m_language;
	}
	void setVariable(const QString& name, const QString& value) {
		m_variables.insert(name, value);
	}

	static QString name();
	static TesseractVersion version();
	static TesseractVersion parseVersion(const QString& versionString);
	static bool isAvailable();
	static bool canDetectOrientation() {
		return true;
	}
	static QStringList availableLanguages();

	// Angle is one of 0, 90, 180, 270. Throws TesseractError if no script is detected.
	OrientationInfo detectOrientation(const QImage& image) const;
	QVector<OcrBox> recognize(const QImage& image, const Builder& builder) const;
	QString imageToString(const QImage& image, const Builder& builder = Builder::text()) const;

private:
	QString m_language;
	QMap<QString, QString> m_variables;
};

#endif // TESSERACTBACKEND_HH
