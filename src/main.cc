/* -*- Mode: C++; indent-tabs-mode: t; c-basic-offset: 4; tab-width: 4 -*-  */
/*
 * main.cc
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

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QFile>
#include <QImage>
#include <QTextStream>
#include <cstdio>

#include "Builder.hh"
#include "Config.hh"
#include "OutputWriter.hh"
#include "PageLevel.hh"
#include "TesseractBackend.hh"
#include "TesseractError.hh"

enum ExitCode { ExitSuccess = 0, ExitUsage = 1, ExitFailure = 2 };

static bool parseVariables(const QStringList& assignments, QMap<QString, QString>& variables) {
	for(const QString& assignment : assignments) {
		int splitPos = assignment.indexOf('=');
		if(splitPos <= 0) {
			qCritical("Invalid variable assignment '%s', expected name=value", qPrintable(assignment));
			return false;
		}
		variables.insert(assignment.left(splitPos), assignment.mid(splitPos + 1));
	}
	return true;
}

static void setUtf8(QTextStream& stream) {
#if QT_VERSION < QT_VERSION_CHECK(6, 0, 0)
	stream.setCodec("UTF-8");
#else
	Q_UNUSED(stream);
#endif
}

int main(int argc, char* argv[]) {
	QCoreApplication app(argc, argv);
	QCoreApplication::setOrganizationName(PACKAGE_NAME);
	QCoreApplication::setApplicationName(PACKAGE_NAME);
	QCoreApplication::setApplicationVersion(PACKAGE_VERSION);

	QCommandLineParser parser;
	parser.setApplicationDescription(PACKAGE_DESCRIPTION);
	parser.addHelpOption();
	parser.addVersionOption();
	QCommandLineOption langOption({"l", "lang"}, "Recognition language, e.g. eng or deu+eng.", "lang");
	QCommandLineOption builderOption({"b", "builder"}, QString("Predefined hierarchy: %1.").arg(Builder::names().join(", ")), "builder");
	QCommandLineOption levelsOption("levels", "Comma separated levels, coarsest first (block,paragraph,line,word,symbol). Overrides --builder.", "levels");
	QCommandLineOption psmOption("psm", "Tesseract page segmentation mode (0-13).", "psm");
	QCommandLineOption formatOption({"f", "format"}, QString("Output format: %1.").arg(OutputWriter::formats().join(", ")), "format");
	QCommandLineOption outputOption({"o", "output"}, "Write output to file instead of stdout.", "file");
	QCommandLineOption variableOption({"c", "config"}, "Set a tesseract variable.", "name=value");
	QCommandLineOption tessdataOption("tessdata", "Tessdata directory.", "dir");
	QCommandLineOption orientationOption("detect-orientation", "Print page orientation and script instead of text.");
	QCommandLineOption listLangsOption("list-langs", "List available recognition languages.");
	QCommandLineOption engineVersionOption("tesseract-version", "Print the tesseract version.");
	QCommandLineOption saveOption("save", "Store the given options as defaults.");
	parser.addOptions({langOption, builderOption, levelsOption, psmOption, formatOption, outputOption, variableOption,
	                   tessdataOption, orientationOption, listLangsOption, engineVersionOption, saveOption});
	parser.addPositionalArgument("image", "Image file to recognize.", "<image>");
	parser.process(app);

	Config config;
	QString tessdata = parser.isSet(tessdataOption) ? parser.value(tessdataOption) : config.tessdataDir();
	if(!Config::applyTessdataLocation(tessdata)) {
		qCritical("Invalid tessdata directory '%s'", qPrintable(tessdata));
		return ExitUsage;
	}

	QTextStream out(stdout);
	setUtf8(out);

	if(parser.isSet(engineVersionOption)) {
		TesseractVersion version = TesseractBackend::version();
		out << TesseractBackend::name() << " " << version.toString() << "\n";
		out << "tessdata: " << Config::tessdataLocation() << "\n";
		if(!TesseractBackend::isAvailable()) {
			qWarning("tesseract %s is too old, at least 3.04 is required", qPrintable(version.toString()));
			return ExitFailure;
		}
		return ExitSuccess;
	}
	if(parser.isSet(listLangsOption)) {
		for(const QString& lang : TesseractBackend::availableLanguages()) {
			out << lang << "\n";
		}
		return ExitSuccess;
	}

	QString language = parser.isSet(langOption) ? parser.value(langOption) : config.language();
	QString builderName = parser.isSet(builderOption) ? parser.value(builderOption) : config.builderName();
	QString format = parser.isSet(formatOption) ? parser.value(formatOption) : config.format();
	int psm = config.pageSegMode();
	if(parser.isSet(psmOption)) {
		bool ok = false;
		psm = parser.value(psmOption).toInt(&ok);
		if(!ok) {
			qCritical("Invalid page segmentation mode '%s'", qPrintable(parser.value(psmOption)));
			return ExitUsage;
		}
	}
	if(psm != -1 && !Builder::isValidPageSegMode(psm)) {
		qCritical("Page segmentation mode must be -1 (builder default) to %d", tesseract::PSM_COUNT - 1);
		return ExitUsage;
	}
	QMap<QString, QString> variables = config.variables();
	if(!parseVariables(parser.values(variableOption), variables)) {
		return ExitUsage;
	}

	Builder builder = Builder::text();
	if(parser.isSet(levelsOption)) {
		try {
			builder = Builder::custom(parseLevelList(parser.value(levelsOption)));
		} catch(const GroupingError& e) {
			qCritical("%s", e.what());
			return ExitUsage;
		}
	} else if(!Builder::fromName(builderName, builder)) {
		qCritical("Unknown builder '%s'", qPrintable(builderName));
		return ExitUsage;
	}
	if(psm >= 0) {
		builder.setPageSegMode(psm);
	}
	if(format.isEmpty()) {
		format = builder.defaultFormat();
	}
	std::unique_ptr<OutputWriter> writer = OutputWriter::create(format);
	if(!writer) {
		qCritical("Unknown output format '%s'", qPrintable(format));
		return ExitUsage;
	}

	if(parser.isSet(saveOption)) {
		config.setLanguage(language);
		config.setBuilderName(builderName);
		config.setFormat(parser.isSet(formatOption) ? format : config.format());
		config.setPageSegMode(psm);
		config.setTessdataDir(tessdata);
		config.setVariables(variables);
		qInfo("Saved defaults");
	}

	const QStringList args = parser.positionalArguments();
	if(args.size() != 1) {
		if(parser.isSet(saveOption) && args.isEmpty()) {
			return ExitSuccess;
		}
		qCritical("Expected exactly one image file");
		parser.showHelp(ExitUsage);
	}
	QString filename = args.first();
	QImage image(filename);
	if(image.isNull()) {
		qCritical("Failed to load image %s", qPrintable(filename));
		return ExitUsage;
	}
	qDebug("Recognizing %s (%dx%d), language %s, builder %s, psm %d", qPrintable(filename), image.width(), image.height(),
	       qPrintable(language), qPrintable(builder.name()), builder.pageSegMode());

	TesseractBackend backend(language);
	for(auto it = variables.begin(), itEnd = variables.end(); it != itEnd; ++it) {
		backend.setVariable(it.key(), it.value());
	}

	if(parser.isSet(orientationOption)) {
		try {
			OrientationInfo info = backend.detectOrientation(image);
			out << info.toString();
		} catch(const TesseractError& e) {
			qCritical("Orientation detection failed: %s", e.what());
			return ExitFailure;
		}
		return ExitSuccess;
	}

	QVector<OcrBox> boxes;
	try {
		boxes = backend.recognize(image, builder);
	} catch(const GroupingError& e) {
		qCritical("Recognition failed: %s", e.what());
		return ExitFailure;
	}
	qInfo("Recognized %d top-level %s nodes in %s", int(boxes.size()), qPrintable(levelName(builder.levels().first())), qPrintable(filename));

	OutputWriter::PageInfo pageInfo;
	pageInfo.filename = filename;
	pageInfo.size = image.size();
	pageInfo.ocrSystem = QString("tesseract %1").arg(TesseractBackend::version().toString());

	if(parser.isSet(outputOption)) {
		QFile outputFile(parser.value(outputOption));
		if(!outputFile.open(QIODevice::WriteOnly)) {
			qCritical("Unable to write output file %s", qPrintable(outputFile.fileName()));
			return ExitFailure;
		}
		QTextStream fileStream(&outputFile);
		setUtf8(fileStream);
		writer->write(fileStream, boxes, pageInfo);
	} else {
		writer->write(out, boxes, pageInfo);
	}
	return ExitSuccess;
}
