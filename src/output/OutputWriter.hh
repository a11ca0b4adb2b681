/* -*- Mode: C++; indent-tabs-mode: t; c-basic-offset: 4; tab-width: 4 -*-  */
/*
 * OutputWriter.hh
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

#ifndef OUTPUTWRITER_HH
#define OUTPUTWRITER_HH

#include <memory>
#include <QSize>
#include <QStringList>

#include "OcrBox.hh"

class QTextStream;

class OutputWriter {
public:
	struct PageInfo {
		QString filename;
		QSize size;
		QString ocrSystem;
	};

	virtual ~OutputWriter() = default;
	virtual void write(QTextStream& stream, const QVector<OcrBox>& boxes, const PageInfo& pageInfo) const = 0;

	// Returns nullptr for unknown formats
	static std::unique_ptr<OutputWriter> create(const QString& format);
	static QStringList formats();
};

#endif // OUTPUTWRITER_HH
