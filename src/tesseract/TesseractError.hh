/* -*- Mode: C++; indent-tabs-mode: t; c-basic-offset: 4; tab-width: 4 -*-  */
/*
 * TesseractError.hh
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

#ifndef TESSERACTERROR_HH
#define TESSERACTERROR_HH

#include "GroupingError.hh"

class TesseractError : public GroupingError {
public:
	TesseractError(const QString& status, const QString& message)
		: GroupingError(message), m_status(status) {}
	const QString& status() const {
		return m_status;
	}

private:
	QString m_status;
};

// Tesseract produced no result iterator at all, as opposed to an empty page
class NoContentError : public TesseractError {
public:
	NoContentError()
		: TesseractError("no script", "No script detected") {}
};

#endif // TESSERACTERROR_HH
