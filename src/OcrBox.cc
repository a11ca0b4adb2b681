/* -*- Mode: C++; indent-tabs-mode: t; c-basic-offset: 4; tab-width: 4 -*-  */
/*
 * OcrBox.cc
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

#include "OcrBox.hh"

Boxer<OcrBox> OcrBox::leafBoxer(PageLevel level) {
	return Boxer<OcrBox>::leaf([level](const QString& text, double confidence, const BoundingBox& bbox) {
		OcrBox box;
		box.level = level;
		box.text = text;
		box.confidence = confidence;
		box.bbox = bbox;
		return box;
	});
}

Boxer<OcrBox> OcrBox::groupBoxer(PageLevel level) {
	return Boxer<OcrBox>::group([level](const QVector<OcrBox>& children, const QString& text, const BoundingBox& bbox) {
		OcrBox box;
		box.level = level;
		box.text = text;
		box.bbox = bbox;
		box.children = children;
		if(!children.isEmpty()) {
			double sum = 0.;
			for(const OcrBox& child : children) {
				sum += child.confidence;
			}
			box.confidence = sum / children.size();
		}
		return box;
	});
}
