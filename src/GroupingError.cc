/* -*- Mode: C++; indent-tabs-mode: t; c-basic-offset: 4; tab-width: 4 -*-  */
/*
 * GroupingError.cc
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

#include "GroupingError.hh"

InvalidLevel::InvalidLevel(const QString& level, const QString& reason)
	: GroupingError(reason.isEmpty() ? QString("Unknown level '%1'").arg(level) : QString("Invalid level '%1': %2").arg(level, reason))
	, m_level(level) {}

EmptyLevelSpec::EmptyLevelSpec()
	: GroupingError("Level specification must declare at least one level") {}

DuplicateLevel::DuplicateLevel(const QString& level, int position)
	: GroupingError(QString("Level '%1' declared more than once (position %2)").arg(level).arg(position))
	, m_level(level), m_position(position) {}

BoxerKindMismatch::BoxerKindMismatch(const QString& level, bool expectedLeaf)
	: GroupingError(expectedLeaf
	                ? QString("Base level '%1' requires a leaf boxer").arg(level)
	                : QString("Level '%1' requires a group boxer").arg(level)) {}

SessionConsumed::SessionConsumed()
	: GroupingError("Grouping session was already run") {}
