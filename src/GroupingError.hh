/* -*- Mode: C++; indent-tabs-mode: t; c-basic-offset: 4; tab-width: 4 -*-  */
/*
 * GroupingError.hh
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

#ifndef GROUPINGERROR_HH
#define GROUPINGERROR_HH

#include <stdexcept>
#include <QString>

inline QString levelName(const QString& level) {
	return level;
}

class GroupingError : public std::runtime_error {
public:
	explicit GroupingError(const QString& message)
		: std::runtime_error(message.toStdString()) {}
	QString message() const {
		return QString::fromStdString(what());
	}
};

// Requested level is not part of the declared hierarchy
class InvalidLevel : public GroupingError {
public:
	explicit InvalidLevel(const QString& level, const QString& reason = QString());
	const QString& level() const {
		return m_level;
	}

private:
	QString m_level;
};

class EmptyLevelSpec : public GroupingError {
public:
	EmptyLevelSpec();
};

class DuplicateLevel : public GroupingError {
public:
	DuplicateLevel(const QString& level, int position);
	const QString& level() const {
		return m_level;
	}
	int position() const {
		return m_position;
	}

private:
	QString m_level;
	int m_position;
};

class BoxerKindMismatch : public GroupingError {
public:
	BoxerKindMismatch(const QString& level, bool expectedLeaf);
};

class SessionConsumed : public GroupingError {
public:
	SessionConsumed();
};

#endif // GROUPINGERROR_HH
