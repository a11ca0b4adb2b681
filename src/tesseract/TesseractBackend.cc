/* -*- Mode: C++; indent-tabs-mode: t; c-basic-offset: 4; tab-width: 4 -*-  */
/*
 * TesseractBackend.cc
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

#include <algorithm>
#include <QImage>
#include <QRegularExpression>
#define USE_STD_NAMESPACE
#include <tesseract/baseapi.h>
#if TESSERACT_MAJOR_VERSION < 5
#include <tesseract/genericvector.h>
#endif
#undef USE_STD_NAMESPACE

#include "GroupingEngine.hh"
#include "TesseractBackend.hh"
#include "TesseractCursor.hh"
#include "TesseractError.hh"
#include "TesseractHandle.hh"
#include "TextOutputWriter.hh"

TesseractBackend::TesseractBackend(const QString& language)
	: m_language(language) {}

QString TesseractBackend::name() {
	return "Tesseract (C++ API)";
}

TesseractVersion TesseractBackend::version() {
	return parseVersion(QString::fromLatin1(tesseract::TessBaseAPI::Version()));
}

TesseractVersion TesseractBackend::parseVersion(const QString& versionString) {
	// Accepts "4.1.1", "3.05.02", "4.0.0-beta.1", "5.0.0-alpha-20201231", "4.00.00dev", "v5.3.0"
	TesseractVersion version;
	QRegularExpressionMatch match = QRegularExpression("^v?(\\d+)\\.(\\d+)(?:\\.(\\d+))?").match(versionString.trimmed());
	if(!match.hasMatch()) {
		return version;
	}
	version.majorVersion = match.captured(1).toInt();
	version.minorVersion = match.captured(2).toInt();
	version.patchVersion = match.captured(3).toInt();
	return version;
}

bool TesseractBackend::isAvailable() {
	// The API of tesseract before 3.04 crashes on some inputs
	return version().atLeast(3, 4);
}

QStringList TesseractBackend::availableLanguages() {
	TesseractHandle tess;
	if(!tess.get()) {
		return QStringList();
	}
#if TESSERACT_MAJOR_VERSION < 5
	GenericVector<STRING> availLanguages;
#else
	std::vector<std::string> availLanguages;
#endif
	try {
		tess.get()->GetAvailableLanguagesAsVector(&availLanguages);
	} catch(const std::exception& e) {
		qWarning("Failed to list tesseract languages: %s", e.what());
	}
	QStringList result;
	for(std::size_t i = 0; i < availLanguages.size(); ++i) {
		result.append(availLanguages[i].c_str());
	}
	std::sort(result.begin(), result.end(), [](const QString & s1, const QString & s2) {
		bool s1Script = s1.startsWith("script") || s1.left(1) == s1.left(1).toUpper();
		bool s2Script = s2.startsWith("script") || s2.left(1) == s2.left(1).toUpper();
		if(s1Script != s2Script) {
			return !s1Script;
		} else {
			return s1 < s2;
		}
	});
	return result;
}

OrientationInfo TesseractBackend::detectOrientation(const QImage& image) const {
	QByteArray lang = m_language.toLocal8Bit();
	TesseractHandle tess(lang.isEmpty() ? nullptr : lang.constData());
	if(!tess.get()) {
		throw TesseractError("init", QString("Failed to initialize tesseract for language '%1'").arg(m_language));
	}
	tess.get()->SetPageSegMode(tesseract::PSM_OSD_ONLY);
	QImage img = image.convertToFormat(QImage::Format_RGB32);
	tess.get()->SetImage(img.bits(), img.width(), img.height(), 4, img.bytesPerLine());

	int orientDeg = 0;
	float orientConf = 0.f;
	const char* scriptName = nullptr;
	float scriptConf = 0.f;
	if(!tess.get()->DetectOrientationScript(&orientDeg, &orientConf, &scriptName, &scriptConf) || orientConf <= 0.f) {
		throw TesseractError("no script", "No script detected");
	}
	OrientationInfo info;
	info.angle = ((orientDeg % 360) + 360) % 360;
	info.confidence = orientConf;
	info.script = scriptName ? QString::fromUtf8(scriptName) : QString();
	info.scriptConfidence = scriptConf;
	qDebug("Detected orientation %d (confidence %.2f), script %s", info.angle, info.confidence, qPrintable(info.script));
	return info;
}

QVector<OcrBox> TesseractBackend::recognize(const QImage& image, const Builder& builder) const {
	QByteArray lang = m_language.toLocal8Bit();
	TesseractHandle tess(lang.isEmpty() ? nullptr : lang.constData());
	if(!tess.get()) {
		throw TesseractError("init", QString("Failed to initialize tesseract for language '%1'").arg(m_language));
	}
	tess.get()->SetPageSegMode(static_cast<tesseract::PageSegMode>(builder.pageSegMode()));
	for(auto it = m_variables.begin(), itEnd = m_variables.end(); it != itEnd; ++it) {
		if(!tess.get()->SetVariable(it.key().toLocal8Bit().constData(), it.value().toLocal8Bit().constData())) {
			qWarning("Unknown tesseract variable %s", qPrintable(it.key()));
		}
	}
	QImage img = image.convertToFormat(QImage::Format_RGB32);
	tess.get()->SetImage(img.bits(), img.width(), img.height(), 4, img.bytesPerLine());
	if(tess.get()->Recognize(nullptr) != 0) {
		throw TesseractError("recognize", "Recognition failed");
	}

	// The cursor must release its iterator before the handle ends the api
	TesseractCursor cursor(tess.get()->GetIterator(), builder.levels());
	LevelSpec<PageLevel, OcrBox> spec = builder.levelSpec();
	return GroupingEngine<PageLevel, OcrBox>(cursor, spec).run();
}

QString TesseractBackend::imageToString(const QImage& image, const Builder& builder) const {
	return TextOutputWriter::toText(recognize(image, builder));
}
