/* -*- Mode: C++; indent-tabs-mode: t; c-basic-offset: 4; tab-width: 4 -*-  */
/*
 * test_page_level.cc
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
#include "GroupingError.hh"
#include "PageLevel.hh"

TEST(PageLevelTest, Names) {
	EXPECT_EQ(levelName(PageLevel::Block), "block");
	EXPECT_EQ(levelName(PageLevel::Paragraph), "paragraph");
	EXPECT_EQ(levelName(PageLevel::Line), "line");
	EXPECT_EQ(levelName(PageLevel::Word), "word");
	EXPECT_EQ(levelName(PageLevel::Symbol), "symbol");
}

TEST(PageLevelTest, ParseLevel) {
	for(PageLevel level : allPageLevels()) {
		EXPECT_EQ(parseLevel(levelName(level)), level);
	}
	EXPECT_EQ(parseLevel(" Word "), PageLevel::Word);
	EXPECT_EQ(parseLevel("para"), PageLevel::Paragraph);
	EXPECT_THROW(parseLevel("glyph"), InvalidLevel);
	EXPECT_THROW(parseLevel(""), InvalidLevel);
}

TEST(PageLevelTest, ParseLevelList) {
	QVector<PageLevel> expected = {PageLevel::Line, PageLevel::Word};
	EXPECT_EQ(parseLevelList("line,word"), expected);
	expected = {PageLevel::Block, PageLevel::Symbol};
	EXPECT_EQ(parseLevelList("block, symbol"), expected);
	expected = {PageLevel::Word};
	EXPECT_EQ(parseLevelList("word,"), expected);
}

TEST(PageLevelTest, ParseLevelListRejectsInvalid) {
	EXPECT_THROW(parseLevelList(""), InvalidLevel);
	EXPECT_THROW(parseLevelList(",,"), InvalidLevel);
	EXPECT_THROW(parseLevelList("word,line"), InvalidLevel);
	EXPECT_THROW(parseLevelList("line,para,word"), InvalidLevel);
	EXPECT_THROW(parseLevelList("line,word,word"), InvalidLevel);
	EXPECT_THROW(parseLevelList("line,glyph"), InvalidLevel);
}

TEST(PageLevelTest, CanonicalOrder) {
	EXPECT_TRUE(isCanonicalOrder(allPageLevels()));
	EXPECT_TRUE(isCanonicalOrder({}));
	EXPECT_TRUE(isCanonicalOrder({PageLevel::Paragraph, PageLevel::Symbol}));
	EXPECT_FALSE(isCanonicalOrder({PageLevel::Word, PageLevel::Line}));
	EXPECT_FALSE(isCanonicalOrder({PageLevel::Line, PageLevel::Line}));
}
