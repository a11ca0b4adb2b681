/* -*- Mode: C++; indent-tabs-mode: t; c-basic-offset: 4; tab-width: 4 -*-  */
/*
 * OutputWriter.cc
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

#include "OutputWriter.hh"
#include "BoxOutputWriter.hh"
#include "HOCROutputWriter.hh"
#include "TextOutputWriter.hh"

std::unique_ptr<OutputWriter> OutputWriter::create(const QString& format) {
	if(format == "text") {
		return std::unique_ptr<OutputWriter>(new TextOutputWriter());
	} else if(format == "box") {
		return std::unique_ptr<OutputWriter>(new BoxOutputWriter());
	} else if(format == "hocr") {
		return std::unique_ptr<OutputWriter>(new HOCROutputWriter());
	}
	return nullptr;
}

QStringList OutputWriter::formats() {
	return {"text", "box", "hocr"};
}
