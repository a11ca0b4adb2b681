/* -*- Mode: C++; indent-tabs-mode: t; c-basic-offset: 4; tab-width: 4 -*-  */
/*
 * Boxer.hh
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

#ifndef BOXER_HH
#define BOXER_HH

#include <functional>
#include <QVector>

#include "Cursor.hh"

template<class Node>
class Boxer {
public:
	typedef std::function<Node(const QString& text, double confidence, const BoundingBox& bbox)> LeafFunction;
	typedef std::function<Node(const QVector<Node>& children, const QString& text, const BoundingBox& bbox)> GroupFunction;

	Boxer() = default;

	static Boxer leaf(const LeafFunction& f) {
		Boxer boxer;
		boxer.m_leaf = f;
		return boxer;
	}
	static Boxer group(const GroupFunction& f) {
		Boxer boxer;
		boxer.m_group = f;
		return boxer;
	}

	bool isLeaf() const {
		return static_cast<bool>(m_leaf);
	}
	bool isGroup() const {
		return static_cast<bool>(m_group);
	}

	Node operator()(const CursorContent& content) const {
		return m_leaf(content.text, content.confidence, content.bbox);
	}
	Node operator()(const QVector<Node>& children, const CursorContent& content) const {
		return m_group(children, content.text, content.bbox);
	}

private:
	LeafFunction m_leaf;
	GroupFunction m_group;
};

#endif // BOXER_HH
