/* -*- Mode: C++; indent-tabs-mode: t; c-basic-offset: 4; tab-width: 4 -*-  */
/*
 * PageLevel.cc
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

#include "PageLevel.hh"
#include "GroupingError.hh"

#include <QStringList>

QString levelName(PageLevel level) {
	switch(level) {
	case PageLevel::Block:
		return "block";
	case PageLevel::Paragraph:
		return "paragraph";
	case PageLevel::Line:
		return "line";
	case PageLevel::Word:
		return "word";
	case PageLevel::Symbol:
		return "symbol";
	}
	return QString();
}

PageLevel parseLevel(const QString& name) {
	QString key = name.trimmed().toLower();
	for(PageLevel level : allPageLevels()) {
		if(levelName(level) == key) {
			return level;
		}
	}
	if(key == "para") {
		return PageLevel::Paragraph;
	}
	throw InvalidLevel(name);
}

QVector<PageLevel> parseLevelList(const QString& list) {
	QVector<PageLevel> levels;
	for(const QString& name : list.split(',', Qt::SkipEmptyParts)) {
		PageLevel level = parseLevel(name);
		if(levels.contains(level)) {
			throw InvalidLevel(levelName(level), "declared more than once");
		}
		if(!levels.isEmpty() && static_cast<int>(level) < static_cast<int>(levels.last())) {
			throw InvalidLevel(levelName(level), QString("must not follow '%1'").arg(levelName(levels.last())));
		}
		levels.append(level);
	}
	if(levels.isEmpty()) {
		throw InvalidLevel(list, "no level given");
	}
	return levels;
}

QVector<PageLevel> allPageLevels() {
	return {PageLevel::Block, PageLevel::Paragraph, PageLevel::Line, PageLevel::Word, PageLevel::Symbol};
}

bool isCanonicalOrder(const QVector<PageLevel>& levels) {
	for(int i = 1; i < levels.size(); ++i) {
		if(static_cast<int>(levels[i - 1]) >= static_cast<int>(levels[i])) {
			return false;
		}
	}
	return true;
}
