/* -*- Mode: C++; indent-tabs-mode: t; c-basic-offset: 4; tab-width: 4 -*-  */
/*
 * TesseractCursor.cc
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

#define USE_STD_NAMESPACE
#include <tesseract/resultiterator.h>
#undef USE_STD_NAMESPACE

#include "TesseractCursor.hh"
#include "TesseractError.hh"

TesseractCursor::TesseractCursor(tesseract::ResultIterator* iterator, const QVector<PageLevel>& levels)
	: m_iterator(iterator), m_levels(levels) {
	if(m_levels.isEmpty()) {
		throw EmptyLevelSpec();
	}
	if(!m_iterator) {
		throw NoContentError();
	}
	m_baseLevel = iteratorLevel(m_levels.last());
}

TesseractCursor::~TesseractCursor() = default;

bool TesseractCursor::isEmpty() const {
	return m_iterator->Empty(m_baseLevel);
}

CursorContent TesseractCursor::contentAt(const PageLevel& level) const {
	tesseract::PageIteratorLevel ril = checkedLevel(level);
	CursorContent content;
	char* text = m_iterator->GetUTF8Text(ril);
	if(text) {
		content.text = QString::fromUtf8(text);
		delete[] text;
		while(!content.text.isEmpty() && content.text.back().isSpace()) {
			content.text.chop(1);
		}
	}
	content.confidence = m_iterator->Confidence(ril);
	int x1, y1, x2, y2;
	if(m_iterator->BoundingBox(ril, &x1, &y1, &x2, &y2)) {
		content.bbox = BoundingBox(x1, y1, x2, y2);
	}
	return content;
}

bool TesseractCursor::isGroupStart(const PageLevel& level) const {
	return m_iterator->IsAtBeginningOf(checkedLevel(level));
}

bool TesseractCursor::isGroupEnd(const PageLevel& level, const PageLevel& childLevel) const {
	checkedLevel(childLevel);
	// IsAtFinalElement steps one element of its second level ahead, so step by
	// the leaf: only the very last leaf of the group may report the end.
	return m_iterator->IsAtFinalElement(checkedLevel(level), m_baseLevel);
}

bool TesseractCursor::advance() {
	return m_iterator->Next(m_baseLevel);
}

tesseract::PageIteratorLevel TesseractCursor::iteratorLevel(PageLevel level) {
	switch(level) {
	case PageLevel::Block:
		return tesseract::RIL_BLOCK;
	case PageLevel::Paragraph:
		return tesseract::RIL_PARA;
	case PageLevel::Line:
		return tesseract::RIL_TEXTLINE;
	case PageLevel::Word:
		return tesseract::RIL_WORD;
	case PageLevel::Symbol:
		return tesseract::RIL_SYMBOL;
	}
	return tesseract::RIL_SYMBOL;
}

tesseract::PageIteratorLevel TesseractCursor::checkedLevel(PageLevel level) const {
	if(!m_levels.contains(level)) {
		throw InvalidLevel(levelName(level));
	}
	return iteratorLevel(level);
}
