/* -*- Mode: C++; indent-tabs-mode: t; c-basic-offset: 4; tab-width: 4 -*-  */
/*
 * TesseractHandle.cc
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

#include <clocale>
#include <QtGlobal>
#define USE_STD_NAMESPACE
#include <tesseract/baseapi.h>
#undef USE_STD_NAMESPACE

#include "TesseractHandle.hh"

TesseractHandle::TesseractHandle(const char* language) {
	m_curlocale = setlocale(LC_ALL, NULL);
	setlocale(LC_ALL, "C");
	m_tess.reset(new tesseract::TessBaseAPI());
	if(m_tess->Init(nullptr, language) == -1) {
		qWarning("Failed to initialize tesseract for language %s", language ? language : "(default)");
		m_tess.reset();
	}
}

TesseractHandle::~TesseractHandle() {
	if(m_tess) {
		m_tess->End();
		m_tess.reset();
	}
	setlocale(LC_ALL, m_curlocale.constData());
}
