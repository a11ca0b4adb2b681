/* -*- Mode: C++; indent-tabs-mode: t; c-basic-offset: 4; tab-width: 4 -*-  */
/*
 * ScriptedCursor.hh
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

#ifndef SCRIPTEDCURSOR_HH
#define SCRIPTEDCURSOR_HH

#include <stdexcept>
#include <QMap>
#include <QSet>
#include <QStringList>
#include <QVector>

#include "Boxer.hh"
#include "Cursor.hh"
#include "GroupingError.hh"

struct ScriptedLeaf {
	CursorContent content;
	QMap<QString, CursorContent> groupContent;
	QSet<QString> starts;
	QSet<QString> ends;
};

struct TestNode {
	QString level;
	QString text;
	double confidence = 0.;
	BoundingBox bbox;
	QVector<TestNode> children;
};

// In-memory cursor over scripted leaves, recording every call as "<leaf>:<operation>:<level>"
class ScriptedCursor : public Cursor<QString> {
public:
	ScriptedCursor(const QVector<ScriptedLeaf>& leaves, const QStringList& levels)
		: m_leaves(leaves), m_levels(levels) {}

	bool isEmpty() const override {
		return m_leaves.isEmpty();
	}
	CursorContent contentAt(const QString& level) const override {
		const ScriptedLeaf& leaf = current("content", level);
		return level == m_levels.last() ? leaf.content : leaf.groupContent.value(level);
	}
	bool isGroupStart(const QString& level) const override {
		return current("start", level).starts.contains(level);
	}
	bool isGroupEnd(const QString& level, const QString& childLevel) const override {
		check(childLevel);
		return current("end", level).ends.contains(level);
	}
	bool advance() override {
		++m_advanceCalls;
		if(m_pos >= m_leaves.size()) {
			throw std::logic_error("advance() called on an exhausted cursor");
		}
		++m_pos;
		return m_pos < m_leaves.size();
	}

	int advanceCalls() const {
		return m_advanceCalls;
	}
	const QStringList& calls() const {
		return m_calls;
	}
	QVector<int> callPositions() const {
		QVector<int> positions;
		for(const QString& call : m_calls) {
			positions.append(call.section(':', 0, 0).toInt());
		}
		return positions;
	}

	// Leaves for levels {"line", "word"}, one line per entry
	static QVector<ScriptedLeaf> lines(const QVector<QStringList>& lines) {
		QVector<ScriptedLeaf> leaves;
		int y = 0;
		for(const QStringList& words : lines) {
			CursorContent lineContent;
			lineContent.text = words.join(' ');
			lineContent.confidence = 80.;
			lineContent.bbox = BoundingBox(0, y, 10 * words.size(), y + 8);
			for(int i = 0, n = words.size(); i < n; ++i) {
				ScriptedLeaf leaf;
				leaf.content.text = words[i];
				leaf.content.confidence = 90. + i;
				leaf.content.bbox = BoundingBox(10 * i, y, 10 * i + 9, y + 8);
				leaf.groupContent.insert("line", lineContent);
				if(i == 0) {
					leaf.starts.insert("line");
				}
				if(i == n - 1) {
					leaf.ends.insert("line");
				}
				leaves.append(leaf);
			}
			y += 10;
		}
		return leaves;
	}

private:
	QVector<ScriptedLeaf> m_leaves;
	QStringList m_levels;
	int m_pos = 0;
	int m_advanceCalls = 0;
	mutable QStringList m_calls;

	void check(const QString& level) const {
		if(!m_levels.contains(level)) {
			throw InvalidLevel(level);
		}
	}
	const ScriptedLeaf& current(const QString& operation, const QString& level) const {
		check(level);
		if(m_pos >= m_leaves.size()) {
			throw std::logic_error("cursor queried after exhaustion");
		}
		m_calls.append(QString("%1:%2:%3").arg(m_pos).arg(operation, level));
		return m_leaves[m_pos];
	}
};

inline Boxer<TestNode> testLeafBoxer(const QString& level, int* calls = nullptr) {
	return Boxer<TestNode>::leaf([level, calls](const QString& text, double confidence, const BoundingBox& bbox) {
		if(calls) {
			++*calls;
		}
		TestNode node;
		node.level = level;
		node.text = text;
		node.confidence = confidence;
		node.bbox = bbox;
		return node;
	});
}

inline Boxer<TestNode> testGroupBoxer(const QString& level, int* calls = nullptr) {
	return Boxer<TestNode>::group([level, calls](const QVector<TestNode>& children, const QString& text, const BoundingBox& bbox) {
		if(calls) {
			++*calls;
		}
		TestNode node;
		node.level = level;
		node.text = text;
		node.bbox = bbox;
		node.children = children;
		return node;
	});
}

inline void collectLeafTexts(const TestNode& node, QStringList& texts) {
	if(node.children.isEmpty()) {
		texts.append(node.text);
	}
	for(const TestNode& child : node.children) {
		collectLeafTexts(child, texts);
	}
}

#endif // SCRIPTEDCURSOR_HH
