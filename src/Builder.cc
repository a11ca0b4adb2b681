/* -*- Mode: C++; indent-tabs-mode: t; c-basic-offset: 4; tab-width: 4 -*-  */
/*
 * Builder.cc
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

#include "Builder.hh"

#include <QStringList>

Builder Builder::text() {
	return Builder("text", {PageLevel::Block, PageLevel::Paragraph, PageLevel::Line, PageLevel::Word}, tesseract::PSM_AUTO, "text");
}

Builder Builder::lineBoxes() {
	return Builder("linebox", {PageLevel::Line, PageLevel::Word}, tesseract::PSM_AUTO_OSD, "box");
}

Builder Builder::wordBoxes() {
	return Builder("wordbox", {PageLevel::Word}, tesseract::PSM_AUTO_OSD, "box");
}

Builder Builder::custom(const QVector<PageLevel>& levels, int pageSegMode) {
	if(levels.isEmpty()) {
		throw EmptyLevelSpec();
	}
	if(!isCanonicalOrder(levels)) {
		QStringList names;
		for(PageLevel level : levels) {
			names.append(levelName(level));
		}
		throw InvalidLevel(names.join(","), "levels must be distinct and ordered from block to symbol");
	}
	return Builder("custom", levels, pageSegMode, "box");
}

bool Builder::fromName(const QString& name, Builder& builder) {
	if(name == "text") {
		builder = text();
	} else if(name == "linebox") {
		builder = lineBoxes();
	} else if(name == "wordbox") {
		builder = wordBoxes();
	} else {
		return false;
	}
	return true;
}

QStringList Builder::names() {
	return {"text", "linebox", "wordbox"};
}

LevelSpec<PageLevel, OcrBox> Builder::levelSpec() const {
	QVector<LevelSpec<PageLevel, OcrBox>::Entry> entries;
	for(int i = 0, n = m_levels.size(); i < n; ++i) {
		PageLevel level = m_levels[i];
		entries.append(qMakePair(level, i == n - 1 ? OcrBox::leafBoxer(level) : OcrBox::groupBoxer(level)));
	}
	return LevelSpec<PageLevel, OcrBox>(entries);
}
