#include <gtest/gtest.h>

#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "grid.h"

using boggle::Grid;

TEST(GridTest, FromRowsUppercases) {
	Grid grid = Grid::from_rows({"srps", "EuIm", "eahw", "wdzr"}, 4, 4);
	EXPECT_EQ(grid.rows(), 4u);
	EXPECT_EQ(grid.cols(), 4u);
	EXPECT_EQ(grid.at(0, 0), 'S');
	EXPECT_EQ(grid.at(1, 1), 'U');
	EXPECT_EQ(grid.at(3, 3), 'R');
}

TEST(GridTest, FromRowsRejectsWrongRowCount) {
	EXPECT_THROW(Grid::from_rows({"abcd", "abcd", "abcd"}, 4, 4), std::runtime_error);
	EXPECT_THROW(Grid::from_rows({"abcd", "abcd", "abcd", "abcd", "abcd"}, 4, 4), std::runtime_error);
}

TEST(GridTest, FromRowsRejectsWrongRowLength) {
	try {
		Grid::from_rows({"abcd", "abc", "abcd", "abcd"}, 4, 4);
		FAIL() << "expected std::runtime_error";
	} catch (const std::runtime_error &e) {
		EXPECT_NE(std::string(e.what()).find("'abc'"), std::string::npos) << e.what();
	}
}

TEST(GridTest, FromRowsRejectsNonLetters) {
	EXPECT_THROW(Grid::from_rows({"ab1d", "abcd", "abcd", "abcd"}, 4, 4), std::runtime_error);
}

TEST(GridTest, FromRowsAcceptsOtherShapes) {
	Grid grid = Grid::from_rows({"abc", "def"}, 2, 3);
	EXPECT_EQ(grid.rows(), 2u);
	EXPECT_EQ(grid.cols(), 3u);
	EXPECT_EQ(grid.at(1, 2), 'F');
}

TEST(GridTest, ConstructorRejectsRaggedRows) {
	std::vector<std::vector<char>> ragged = {{'A', 'B'}, {'C'}};
	std::vector<std::vector<char>> lowercase = {{'A', 'b'}};
	EXPECT_THROW(Grid{ragged}, std::runtime_error);
	EXPECT_THROW(Grid{lowercase}, std::runtime_error);
}

TEST(GridTest, ContainsChecksBounds) {
	Grid grid = Grid::from_rows({"ab", "cd"}, 2, 2);
	EXPECT_TRUE(grid.contains(0, 0));
	EXPECT_TRUE(grid.contains(1, 1));
	EXPECT_FALSE(grid.contains(-1, 0));
	EXPECT_FALSE(grid.contains(0, -1));
	EXPECT_FALSE(grid.contains(2, 0));
	EXPECT_FALSE(grid.contains(0, 2));
}

TEST(GridTest, EmptyGrid) {
	Grid grid;
	EXPECT_EQ(grid.rows(), 0u);
	EXPECT_EQ(grid.cols(), 0u);
	EXPECT_FALSE(grid.contains(0, 0));
}

TEST(GridTest, ReadGridSkipsBlankLinesAndSeparators) {
	std::istringstream iss("s r p s\n\neuim\r\n e a h w \nW,D,Z,R\n");
	Grid grid = boggle::read_grid(iss);
	EXPECT_EQ(grid.rows(), 4u);
	EXPECT_EQ(grid.cols(), 4u);
	EXPECT_EQ(grid.at(0, 1), 'R');
	EXPECT_EQ(grid.at(2, 3), 'W');
	EXPECT_EQ(grid.at(3, 2), 'Z');
}

TEST(GridTest, ReadGridRejectsRaggedInput) {
	std::istringstream iss("abcd\nabc\n");
	EXPECT_THROW(boggle::read_grid(iss), std::runtime_error);
}

TEST(GridTest, PrintsOneRowPerLine) {
	std::ostringstream oss;
	oss << Grid::from_rows({"ab", "cd"}, 2, 2);
	EXPECT_EQ(oss.str(), "A B\nC D\n");
}
