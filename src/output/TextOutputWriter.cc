/* -*- Mode: C++; indent-tabs-mode: t; c-basic-offset: 4; tab-width: 4 -*-  */
/*
 * TextOutputWriter.cc
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

#include "TextOutputWriter.hh"

#include <QTextStream>

void TextOutputWriter::write(QTextStream& stream, const QVector<OcrBox>& boxes, const PageInfo& /*pageInfo*/) const {
	stream << toText(boxes);
}

QString TextOutputWriter::toText(const QVector<OcrBox>& boxes) {
	QString output;
	QTextStream outputStream(&output, QIODevice::WriteOnly);
	for(int i = 0, n = boxes.size(); i < n; ++i) {
		printItem(outputStream, boxes[i], i == n - 1);
	}
	outputStream.flush();
	if(!output.isEmpty() && !output.endsWith('\n')) {
		output += '\n';
	}
	return output;
}

void TextOutputWriter::printItem(QTextStream& outputStream, const OcrBox& box, bool lastChild) {
	if(box.isLeaf()) {
		outputStream << box.text;
	} else {
		for(int i = 0, n = box.children.size(); i < n; ++i) {
			printItem(outputStream, box.children[i], i == n - 1);
		}
	}
	if(box.level == PageLevel::Word && !lastChild) {
		outputStream << " ";
	}
	if(box.level != PageLevel::Word && box.level != PageLevel::Symbol) {
		outputStream << "\n";
	}
}
