/* -*- Mode: C++; indent-tabs-mode: t; c-basic-offset: 4; tab-width: 4 -*-  */
/*
 * BoxOutputWriter.hh
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

#ifndef BOXOUTPUTWRITER_HH
#define BOXOUTPUTWRITER_HH

#include "OutputWriter.hh"

// One line per node, depth first: <indent><level> <x0> <y0> <x1> <y1> <confidence> <text>
class BoxOutputWriter : public OutputWriter {
public:
	void write(QTextStream& stream, const QVector<OcrBox>& boxes, const PageInfo& pageInfo) const override;

private:
	static void printItem(QTextStream& stream, const OcrBox& box, int depth);
};

#endif // BOXOUTPUTWRITER_HH
