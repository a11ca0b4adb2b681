/* -*- Mode: C++; indent-tabs-mode: t; c-basic-offset: 4; tab-width: 4 -*-  */
/*
 * GroupingEngine.hh
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

#ifndef GROUPINGENGINE_HH
#define GROUPINGENGINE_HH

#include <QDebug>

#include "Cursor.hh"
#include "LevelSpec.hh"

/**
 * Rebuilds the level hierarchy from the flat leaf stream of a cursor.
 *
 * The cursor is driven exactly once. For every leaf the engine
 *  1. resets, coarse to fine, the child accumulator of each level whose
 *     group starts at this leaf,
 *  2. boxes the leaf into the base level accumulator,
 *  3. folds, fine to coarse, the child accumulator of each level whose
 *     group ends at this leaf into a node of that level,
 * and then advances. A leaf that both starts and ends several nested groups
 * therefore yields one node per level, each holding the next finer one.
 */
template<class Level, class Node>
class GroupingEngine {
public:
	GroupingEngine(Cursor<Level>& cursor, const LevelSpec<Level, Node>& spec)
		: m_cursor(cursor), m_spec(spec) {}

	QVector<Node> run() {
		if(m_consumed) {
			throw SessionConsumed();
		}
		m_consumed = true;
		if(m_cursor.isEmpty()) {
			qDebug("Grouping: empty stream");
			return QVector<Node>();
		}

		const QVector<Level>& levels = m_spec.levels();
		const int base = levels.size() - 1;
		const Boxer<Node>& baseBoxer = m_spec.boxerAt(base);
		QVector<QVector<Node>> accumulators(levels.size());
		int leafCount = 0;

		do {
			++leafCount;
			for(int i = 0; i < base; ++i) {
				if(m_cursor.isGroupStart(levels[i])) {
					accumulators[i + 1].clear();
				}
			}
			accumulators[base].append(baseBoxer(m_cursor.contentAt(levels[base])));
			for(int i = base; i-- > 0;) {
				if(m_cursor.isGroupEnd(levels[i], levels[i + 1])) {
					CursorContent content = m_cursor.contentAt(levels[i]);
					accumulators[i].append(m_spec.boxerAt(i)(accumulators[i + 1], content));
				}
			}
		} while(m_cursor.advance());

		qDebug("Grouping: %d leaves into %d top-level nodes over %d levels", leafCount, int(accumulators.first().size()), int(levels.size()));
		return accumulators.first();
	}

private:
	Cursor<Level>& m_cursor;
	const LevelSpec<Level, Node>& m_spec;
	bool m_consumed = false;
};

template<class Level, class Node>
QVector<Node> groupLevels(Cursor<Level>& cursor, const LevelSpec<Level, Node>& spec) {
	return GroupingEngine<Level, Node>(cursor, spec).run();
}

#endif // GROUPINGENGINE_HH
