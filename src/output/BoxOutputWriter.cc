/* -*- Mode: C++; indent-tabs-mode: t; c-basic-offset: 4; tab-width: 4 -*-  */
/*
 * BoxOutputWriter.cc
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

#include "BoxOutputWriter.hh"

#include <QTextStream>

void BoxOutputWriter::write(QTextStream& stream, const QVector<OcrBox>& boxes, const PageInfo& /*pageInfo*/) const {
	for(const OcrBox& box : boxes) {
		printItem(stream, box, 0);
	}
}

void BoxOutputWriter::printItem(QTextStream& stream, const OcrBox& box, int depth) {
	stream << QString("%1%2 %3 %4 %5 %6 %7 %8\n")
	       .arg(QString(2 * depth, ' '))
	       .arg(levelName(box.level))
	       .arg(box.bbox.topLeft.x())
	       .arg(box.bbox.topLeft.y())
	       .arg(box.bbox.bottomRight.x())
	       .arg(box.bbox.bottomRight.y())
	       .arg(box.confidence, 0, 'f', 2)
	       .arg(QString(box.text).replace('\n', ' '));
	for(const OcrBox& child : box.children) {
		printItem(stream, child, depth + 1);
	}
}
