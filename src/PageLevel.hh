/* -*- Mode: C++; indent-tabs-mode: t; c-basic-offset: 4; tab-width: 4 -*-  */
/*
 * PageLevel.hh
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

#ifndef PAGELEVEL_HH
#define PAGELEVEL_HH

#include <QString>
#include <QVector>

// Canonical OCR hierarchy, coarsest first
enum class PageLevel { Block, Paragraph, Line, Word, Symbol };

QString levelName(PageLevel level);
// Throws InvalidLevel for unknown names. "para" is accepted for paragraph.
PageLevel parseLevel(const QString& name);
// Comma separated list, e.g. "line,word". Throws InvalidLevel if a level is
// unknown, repeated or out of the coarse-to-fine order.
QVector<PageLevel> parseLevelList(const QString& list);
QVector<PageLevel> allPageLevels();
bool isCanonicalOrder(const QVector<PageLevel>& levels);

#endif // PAGELEVEL_HH
