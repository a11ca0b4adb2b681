/* -*- Mode: C++; indent-tabs-mode: t; c-basic-offset: 4; tab-width: 4 -*-  */
/*
 * Cursor.hh
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

#ifndef CURSOR_HH
#define CURSOR_HH

#include <QPoint>
#include <QString>

// Upper-left and lower-right corner, in the coordinate space of the cursor
struct BoundingBox {
	QPoint topLeft;
	QPoint bottomRight;

	BoundingBox() = default;
	BoundingBox(int x0, int y0, int x1, int y1)
		: topLeft(x0, y0), bottomRight(x1, y1) {}

	bool operator==(const BoundingBox& other) const {
		return topLeft == other.topLeft && bottomRight == other.bottomRight;
	}
	bool operator!=(const BoundingBox& other) const {
		return !(*this == other);
	}
};

struct CursorContent {
	QString text;
	double confidence = 0.;
	BoundingBox bbox;
};

/**
 * One-directional stepper over the leaves of a recognized page.
 *
 * A cursor starts positioned on the first leaf. Every query refers to the
 * leaf the cursor currently sits on, advance() moves to the next leaf and
 * returns false once the stream is exhausted, after which the position is
 * undefined. A cursor with no leaf at all reports isEmpty() and must not be
 * queried or advanced.
 */
template<class Level>
class Cursor {
public:
	virtual ~Cursor() = default;

	virtual bool isEmpty() const = 0;
	virtual CursorContent contentAt(const Level& level) const = 0;
	virtual bool isGroupStart(const Level& level) const = 0;
	virtual bool isGroupEnd(const Level& level, const Level& childLevel) const = 0;
	virtual bool advance() = 0;
};

#endif // CURSOR_HH
