/* -*- Mode: C++; indent-tabs-mode: t; c-basic-offset: 4; tab-width: 4 -*-  */
/*
 * LevelSpec.hh
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

#ifndef LEVELSPEC_HH
#define LEVELSPEC_HH

#include <QPair>
#include <QVector>

#include "Boxer.hh"
#include "GroupingError.hh"

/**
 * Ordered (coarsest first) list of levels, each paired with the boxer that
 * materializes a node at that level. The finest level is the base level,
 * its boxer turns single leaves into nodes; all other boxers fold the
 * children collected at the next finer level into a group node.
 */
template<class Level, class Node>
class LevelSpec {
public:
	typedef QPair<Level, Boxer<Node>> Entry;

	LevelSpec(const QVector<Entry>& entries) {
		if(entries.isEmpty()) {
			throw EmptyLevelSpec();
		}
		for(int i = 0, n = entries.size(); i < n; ++i) {
			const Entry& entry = entries[i];
			if(m_levels.contains(entry.first)) {
				throw DuplicateLevel(levelName(entry.first), i);
			}
			bool base = i == n - 1;
			if(base ? !entry.second.isLeaf() : !entry.second.isGroup()) {
				throw BoxerKindMismatch(levelName(entry.first), base);
			}
			m_levels.append(entry.first);
			m_boxers.append(entry.second);
		}
	}

	const QVector<Level>& levels() const {
		return m_levels;
	}
	int size() const {
		return m_levels.size();
	}
	const Level& baseLevel() const {
		return m_levels.last();
	}
	const Level& coarsestLevel() const {
		return m_levels.first();
	}
	bool contains(const Level& level) const {
		return m_levels.contains(level);
	}
	int indexOf(const Level& level) const {
		return m_levels.indexOf(level);
	}
	const Boxer<Node>& boxer(const Level& level) const {
		return m_boxers[checkedIndex(level)];
	}
	const Boxer<Node>& boxerAt(int index) const {
		return m_boxers[index];
	}
	const Level& finerLevel(const Level& level) const {
		int idx = checkedIndex(level);
		if(idx == m_levels.size() - 1) {
			throw InvalidLevel(levelName(level), "the base level has no finer level");
		}
		return m_levels[idx + 1];
	}

private:
	QVector<Level> m_levels;
	QVector<Boxer<Node>> m_boxers;

	int checkedIndex(const Level& level) const {
		int idx = m_levels.indexOf(level);
		if(idx < 0) {
			throw InvalidLevel(levelName(level));
		}
		return idx;
	}
};

#endif // LEVELSPEC_HH
