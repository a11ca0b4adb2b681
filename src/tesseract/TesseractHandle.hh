/* -*- Mode: C++; indent-tabs-mode: t; c-basic-offset: 4; tab-width: 4 -*-  */
/*
 * TesseractHandle.hh
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

#ifndef TESSERACTHANDLE_HH
#define TESSERACTHANDLE_HH

#include <memory>
#include <QByteArray>

namespace tesseract {
class TessBaseAPI;
}

// Owns an initialized TessBaseAPI, with the C numeric locale in effect for its lifetime
class TesseractHandle {
public:
	explicit TesseractHandle(const char* language = nullptr);
	~TesseractHandle();
	tesseract::TessBaseAPI* get() const {
		return m_tess.get();
	}

private:
	QByteArray m_curlocale;
	std::unique_ptr<tesseract::TessBaseAPI> m_tess;

	TesseractHandle(const TesseractHandle&) = delete;
	TesseractHandle& operator=(const TesseractHandle&) = delete;
};

#endif // TESSERACTHANDLE_HH
