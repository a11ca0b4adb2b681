/* -*- Mode: C++; indent-tabs-mode: t; c-basic-offset: 4; tab-width: 4 -*-  */
/*
 * TesseractCursor.hh
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

#ifndef TESSERACTCURSOR_HH
#define TESSERACTCURSOR_HH

#include <memory>
#include <QVector>
#include <tesseract/publictypes.h>

#include "Cursor.hh"
#include "PageLevel.hh"

namespace tesseract {
class ResultIterator;
}

/**
 * Cursor over the leaves of a tesseract result, stepping at the finest of
 * the declared levels. Takes ownership of the iterator, which must be
 * released before the TessBaseAPI that produced it.
 */
class TesseractCursor : public Cursor<PageLevel> {
public:
	// Throws EmptyLevelSpec if levels is empty, NoContentError if iterator is null
	TesseractCursor(tesseract::ResultIterator* iterator, const QVector<PageLevel>& levels);
	~TesseractCursor() override;

	bool isEmpty() const override;
	CursorContent contentAt(const PageLevel& level) const override;
	bool isGroupStart(const PageLevel& level) const override;
	bool isGroupEnd(const PageLevel& level, const PageLevel& childLevel) const override;
	bool advance() override;

	static tesseract::PageIteratorLevel iteratorLevel(PageLevel level);

private:
	std::unique_ptr<tesseract::ResultIterator> m_iterator;
	QVector<PageLevel> m_levels;
	tesseract::PageIteratorLevel m_baseLevel;

	tesseract::PageIteratorLevel checkedLevel(PageLevel level) const;
};

#endif // TESSERACTCURSOR_HH
