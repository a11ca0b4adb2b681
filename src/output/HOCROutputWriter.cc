/* -*- Mode: C++; indent-tabs-mode: t; c-basic-offset: 4; tab-width: 4 -*-  */
/*
 * HOCROutputWriter.cc
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

#include "HOCROutputWriter.hh"

#include <QFileInfo>
#include <QTextStream>

void HOCROutputWriter::write(QTextStream& stream, const QVector<OcrBox>& boxes, const PageInfo& pageInfo) const {
	QString filename = QFileInfo(pageInfo.filename).fileName();
	stream << QString(
	           "<?xml version=\"1.0\" encoding=\"UTF-8\"?>\n"
	           "<!DOCTYPE html>\n"
	           "<html>\n"
	           "<head>\n"
	           " <title>%1</title>\n"
	           " <meta charset=\"utf-8\" /> \n"
	           " <meta name='ocr-system' content='%2' />\n"
	           " <meta name='ocr-capabilities' content='ocr_page ocr_carea ocr_par ocr_line ocrx_word ocrx_cinfo'/>\n"
	           "</head>\n"
	           "<body>\n").arg(filename.toHtmlEscaped(), pageInfo.ocrSystem.toHtmlEscaped());
	stream << QString(" <div class='ocr_page' id='page_1' title='image \"%1\"; bbox 0 0 %2 %3; ppageno 0'>\n")
	       .arg(filename.toHtmlEscaped(), QString::number(pageInfo.size.width()), QString::number(pageInfo.size.height()));
	for(int i = 0, n = boxes.size(); i < n; ++i) {
		stream << toHtml(boxes[i], QString("1_%1").arg(i + 1), 2);
	}
	stream << " </div>\n";
	stream << "</body>\n</html>\n";
}

QString HOCROutputWriter::itemClass(PageLevel level) {
	switch(level) {
	case PageLevel::Block:
		return "ocr_carea";
	case PageLevel::Paragraph:
		return "ocr_par";
	case PageLevel::Line:
		return "ocr_line";
	case PageLevel::Word:
		return "ocrx_word";
	case PageLevel::Symbol:
		return "ocrx_cinfo";
	}
	return QString();
}

QString HOCROutputWriter::toHtml(const OcrBox& box, const QString& id, int indent) {
	QString cls = itemClass(box.level);
	QString tag;
	if(box.level == PageLevel::Block) {
		tag = "div";
	} else if(box.level == PageLevel::Paragraph) {
		tag = "p";
	} else {
		tag = "span";
	}
	QString title = QString("bbox %1 %2 %3 %4")
	                .arg(box.bbox.topLeft.x()).arg(box.bbox.topLeft.y())
	                .arg(box.bbox.bottomRight.x()).arg(box.bbox.bottomRight.y());
	if(box.level == PageLevel::Word || box.level == PageLevel::Symbol) {
		title += QString("; x_wconf %1").arg(qRound(box.confidence));
	}
	QString html = QString(indent, ' ') + "<" + tag;
	html += QString(" class='%1' id='%2_%3' title='%4'>").arg(cls, levelName(box.level), id, title);
	if(box.isLeaf()) {
		html += box.text.toHtmlEscaped();
	} else {
		html += "\n";
		for(int i = 0, n = box.children.size(); i < n; ++i) {
			html += toHtml(box.children[i], QString("%1_%2").arg(id).arg(i + 1), indent + 1);
		}
		html += QString(indent, ' ');
	}
	html += "</" + tag + ">\n";
	return html;
}
