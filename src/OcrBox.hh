/* -*- Mode: C++; indent-tabs-mode: t; c-basic-offset: 4; tab-width: 4 -*-  */
/*
 * OcrBox.hh
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

#ifndef OCRBOX_HH
#define OCRBOX_HH

#include <QVector>

#include "Boxer.hh"
#include "PageLevel.hh"

struct OcrBox {
	PageLevel level = PageLevel::Word;
	QString text;
	double confidence = 0.;
	BoundingBox bbox;
	QVector<OcrBox> children;

	bool isLeaf() const {
		return children.isEmpty();
	}

	static Boxer<OcrBox> leafBoxer(PageLevel level);
	// Group confidence is the mean of the children's confidences
	static Boxer<OcrBox> groupBoxer(PageLevel level);
};

#endif // OCRBOX_HH
