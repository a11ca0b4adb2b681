/* -*- Mode: C++; indent-tabs-mode: t; c-basic-offset: 4; tab-width: 4 -*-  */
/*
 * test_level_spec.cc
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
#include "LevelSpec.hh"
#include "ScriptedCursor.hh"

typedef LevelSpec<QString, TestNode> TestSpec;

TEST(LevelSpecTest, RejectsEmpty) {
	EXPECT_THROW(TestSpec{QVector<TestSpec::Entry>()}, EmptyLevelSpec);
}

TEST(LevelSpecTest, RejectsDuplicateLevel) {
	try {
		TestSpec spec({
			qMakePair(QString("line"), testGroupBoxer("line")),
			qMakePair(QString("word"), testGroupBoxer("word")),
			qMakePair(QString("line"), testLeafBoxer("line"))
		});
		FAIL() << "duplicate level accepted";
	} catch(const DuplicateLevel& e) {
		EXPECT_EQ(e.level(), "line");
		EXPECT_EQ(e.position(), 2);
	}
}

// Base level needs a leaf boxer, every other level a group boxer
TEST(LevelSpecTest, RejectsBoxerKindMismatch) {
	EXPECT_THROW(TestSpec({
		qMakePair(QString("line"), testGroupBoxer("line")),
		qMakePair(QString("word"), testGroupBoxer("word"))
	}), BoxerKindMismatch);
	EXPECT_THROW(TestSpec({
		qMakePair(QString("line"), testLeafBoxer("line")),
		qMakePair(QString("word"), testLeafBoxer("word"))
	}), BoxerKindMismatch);
	EXPECT_THROW(TestSpec({qMakePair(QString("word"), Boxer<TestNode>())}), BoxerKindMismatch);
}

TEST(LevelSpecTest, Accessors) {
	TestSpec spec({
		qMakePair(QString("block"), testGroupBoxer("block")),
		qMakePair(QString("line"), testGroupBoxer("line")),
		qMakePair(QString("word"), testLeafBoxer("word"))
	});
	EXPECT_EQ(spec.size(), 3);
	EXPECT_EQ(spec.coarsestLevel(), "block");
	EXPECT_EQ(spec.baseLevel(), "word");
	EXPECT_TRUE(spec.contains("line"));
	EXPECT_FALSE(spec.contains("symbol"));
	EXPECT_EQ(spec.indexOf("line"), 1);
	EXPECT_EQ(spec.indexOf("symbol"), -1);
	EXPECT_EQ(spec.finerLevel("block"), "line");
	EXPECT_EQ(spec.finerLevel("line"), "word");
	EXPECT_TRUE(spec.boxer("word").isLeaf());
	EXPECT_TRUE(spec.boxer("block").isGroup());
	EXPECT_TRUE(spec.boxerAt(1).isGroup());
}

TEST(LevelSpecTest, UnknownLevel) {
	TestSpec spec({
		qMakePair(QString("line"), testGroupBoxer("line")),
		qMakePair(QString("word"), testLeafBoxer("word"))
	});
	try {
		spec.boxer("paragraph");
		FAIL() << "unknown level accepted";
	} catch(const InvalidLevel& e) {
		EXPECT_EQ(e.level(), "paragraph");
		EXPECT_EQ(e.message(), "Unknown level 'paragraph'");
	}
	EXPECT_THROW(spec.finerLevel("word"), InvalidLevel);
	EXPECT_THROW(spec.finerLevel("symbol"), InvalidLevel);
}

// A single level is both coarsest and base
TEST(LevelSpecTest, SingleLevel) {
	TestSpec spec({qMakePair(QString("word"), testLeafBoxer("word"))});
	EXPECT_EQ(spec.size(), 1);
	EXPECT_EQ(spec.coarsestLevel(), spec.baseLevel());
}

// Errors share one base class and carry a readable message
TEST(LevelSpecTest, ErrorHierarchy) {
	EXPECT_THROW(throw EmptyLevelSpec(), GroupingError);
	EXPECT_THROW(throw SessionConsumed(), std::runtime_error);
	EXPECT_EQ(InvalidLevel("glyph", "not supported").message(), "Invalid level 'glyph': not supported");
	EXPECT_EQ(DuplicateLevel("word", 3).message(), "Level 'word' declared more than once (position 3)");
	EXPECT_EQ(BoxerKindMismatch("word", true).message(), "Base level 'word' requires a leaf boxer");
	EXPECT_EQ(BoxerKindMismatch("line", false).message(), "Level 'line' requires a group boxer");
}
