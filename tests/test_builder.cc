/* -*- Mode: C++; indent-tabs-mode: t; c-basic-offset: 4; tab-width: 4 -*-  */
/*
 * test_builder.cc
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


#include <gtest/gtest.h>
#include "Builder.hh"
#include "GroupingEngine.hh"
#include "ScriptedCursor.hh"

// Cursor over PageLevel, driven by a ScriptedCursor keyed by level names
class PageCursor : public Cursor<PageLevel> {
public:
	PageCursor(const QVector<ScriptedLeaf>& leaves, const QVector<PageLevel>& levels)
		: m_cursor(leaves, names(levels)) {}

	bool isEmpty() const override {
		return m_cursor.isEmpty();
	}
	CursorContent contentAt(const PageLevel& level) const override {
		return m_cursor.contentAt(levelName(level));
	}
	bool isGroupStart(const PageLevel& level) const override {
		return m_cursor.isGroupStart(levelName(level));
	}
	bool isGroupEnd(const PageLevel& level, const PageLevel& childLevel) const override {
		return m_cursor.isGroupEnd(levelName(level), levelName(childLevel));
	}
	bool advance() override {
		return m_cursor.advance();
	}

private:
	ScriptedCursor m_cursor;

	static QStringList names(const QVector<PageLevel>& levels) {
		QStringList list;
		for(PageLevel level : levels) {
			list.append(levelName(level));
		}
		return list;
	}
};

TEST(BuilderTest, Presets) {
	Builder text = Builder::text();
	QVector<PageLevel> levels = {PageLevel::Block, PageLevel::Paragraph, PageLevel::Line, PageLevel::Word};
	EXPECT_EQ(text.name(), "text");
	EXPECT_EQ(text.levels(), levels);
	EXPECT_EQ(text.pageSegMode(), tesseract::PSM_AUTO);
	EXPECT_EQ(text.defaultFormat(), "text");

	Builder lineBoxes = Builder::lineBoxes();
	levels = {PageLevel::Line, PageLevel::Word};
	EXPECT_EQ(lineBoxes.levels(), levels);
	EXPECT_EQ(lineBoxes.pageSegMode(), tesseract::PSM_AUTO_OSD);
	EXPECT_EQ(lineBoxes.defaultFormat(), "box");

	Builder wordBoxes = Builder::wordBoxes();
	levels = {PageLevel::Word};
	EXPECT_EQ(wordBoxes.levels(), levels);
	EXPECT_EQ(wordBoxes.pageSegMode(), tesseract::PSM_AUTO_OSD);
}

TEST(BuilderTest, FromName) {
	Builder builder = Builder::text();
	for(const QString& name : Builder::names()) {
		EXPECT_TRUE(Builder::fromName(name, builder));
		EXPECT_EQ(builder.name(), name);
	}
	EXPECT_FALSE(Builder::fromName("symbolbox", builder));
	EXPECT_EQ(builder.name(), Builder::names().last());
}

TEST(BuilderTest, Custom) {
	Builder builder = Builder::custom({PageLevel::Paragraph, PageLevel::Symbol}, 6);
	EXPECT_EQ(builder.name(), "custom");
	EXPECT_EQ(builder.pageSegMode(), 6);
	EXPECT_EQ(builder.levelSpec().baseLevel(), PageLevel::Symbol);
	builder.setPageSegMode(tesseract::PSM_AUTO);
	EXPECT_EQ(builder.pageSegMode(), tesseract::PSM_AUTO);

	EXPECT_THROW(Builder::custom({}), EmptyLevelSpec);
	EXPECT_THROW(Builder::custom({PageLevel::Word, PageLevel::Line}), InvalidLevel);
	EXPECT_THROW(Builder::custom({PageLevel::Word, PageLevel::Word}), InvalidLevel);
}

// Valid modes are those tesseract defines, -1 is handled by the caller
TEST(BuilderTest, PageSegModeRange) {
	EXPECT_TRUE(Builder::isValidPageSegMode(tesseract::PSM_OSD_ONLY));
	EXPECT_TRUE(Builder::isValidPageSegMode(tesseract::PSM_AUTO));
	EXPECT_TRUE(Builder::isValidPageSegMode(tesseract::PSM_COUNT - 1));
	EXPECT_FALSE(Builder::isValidPageSegMode(tesseract::PSM_COUNT));
	EXPECT_FALSE(Builder::isValidPageSegMode(-1));
	EXPECT_FALSE(Builder::isValidPageSegMode(-7));
}

TEST(BuilderTest, LevelSpec) {
	LevelSpec<PageLevel, OcrBox> spec = Builder::text().levelSpec();
	EXPECT_EQ(spec.size(), 4);
	EXPECT_EQ(spec.coarsestLevel(), PageLevel::Block);
	EXPECT_EQ(spec.baseLevel(), PageLevel::Word);
	EXPECT_TRUE(spec.boxer(PageLevel::Word).isLeaf());
	EXPECT_TRUE(spec.boxer(PageLevel::Line).isGroup());
	EXPECT_THROW(spec.boxer(PageLevel::Symbol), InvalidLevel);
}

// Line boxes carry the mean confidence of their words
TEST(BuilderTest, GroupsIntoOcrBoxes) {
	Builder builder = Builder::lineBoxes();
	PageCursor cursor(ScriptedCursor::lines({{"Hello", "World"}, {"again"}}), builder.levels());
	QVector<OcrBox> boxes = groupLevels(cursor, builder.levelSpec());

	ASSERT_EQ(boxes.size(), 2);
	EXPECT_EQ(boxes[0].level, PageLevel::Line);
	EXPECT_EQ(boxes[0].text, "Hello World");
	EXPECT_FALSE(boxes[0].isLeaf());
	EXPECT_DOUBLE_EQ(boxes[0].confidence, 90.5);
	EXPECT_EQ(boxes[0].bbox, BoundingBox(0, 0, 20, 8));
	ASSERT_EQ(boxes[0].children.size(), 2);
	EXPECT_EQ(boxes[0].children[1].level, PageLevel::Word);
	EXPECT_EQ(boxes[0].children[1].text, "World");
	EXPECT_TRUE(boxes[0].children[1].isLeaf());
	EXPECT_DOUBLE_EQ(boxes[1].confidence, 90.);
	EXPECT_EQ(boxes[1].bbox, BoundingBox(0, 10, 10, 18));
}

TEST(BuilderTest, EmptyGroupHasZeroConfidence) {
	OcrBox box = OcrBox::groupBoxer(PageLevel::Block)(QVector<OcrBox>(), CursorContent{"", 50., BoundingBox(1, 2, 3, 4)});
	EXPECT_EQ(box.level, PageLevel::Block);
	EXPECT_DOUBLE_EQ(box.confidence, 0.);
	EXPECT_EQ(box.bbox, BoundingBox(1, 2, 3, 4));
	EXPECT_TRUE(box.isLeaf());
}
