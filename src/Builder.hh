/* -*- Mode: C++; indent-tabs-mode: t; c-basic-offset: 4; tab-width: 4 -*-  */
/*
 * Builder.hh
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

#ifndef BUILDER_HH
#define BUILDER_HH

#include <QStringList>
#define USE_STD_NAMESPACE
#include <tesseract/publictypes.h>
#undef USE_STD_NAMESPACE

#include "LevelSpec.hh"
#include "OcrBox.hh"

class Builder {
public:
	static Builder text();
	static Builder lineBoxes();
	static Builder wordBoxes();
	// Throws InvalidLevel if levels are not an ordered, non-empty subset of the vocabulary
	static Builder custom(const QVector<PageLevel>& levels, int pageSegMode = tesseract::PSM_AUTO);
	static bool fromName(const QString& name, Builder& builder);
	static QStringList names();
	static bool isValidPageSegMode(int pageSegMode) {
		return pageSegMode >= 0 && pageSegMode < tesseract::PSM_COUNT;
	}

	const QString& name() const {
		return m_name;
	}
	const QVector<PageLevel>& levels() const {
		return m_levels;
	}
	int pageSegMode() const {
		return m_pageSegMode;
	}
	void setPageSegMode(int pageSegMode) {
		m_pageSegMode = pageSegMode;
	}
	const QString& defaultFormat() const {
		return m_defaultFormat;
	}

	LevelSpec<PageLevel, OcrBox> levelSpec() const;

private:
	QString m_name;
	QVector<PageLevel> m_levels;
	int m_pageSegMode;
	QString m_defaultFormat;

	Builder(const QString& name, const QVector<PageLevel>& levels, int pageSegMode, const QString& defaultFormat)
		: m_name(name), m_levels(levels), m_pageSegMode(pageSegMode), m_defaultFormat(defaultFormat) {}
};

#endif // BUILDER_HH
