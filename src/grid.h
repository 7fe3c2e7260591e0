#ifndef BOGGLE_GRID_H
#define BOGGLE_GRID_H

#include <cstddef>
#include <iosfwd>
#include <string>
#include <vector>

namespace boggle {

// Rectangular board of uppercase letters.
class Grid {
	std::vector<std::vector<char>> cells;

public:
	Grid() {}
	explicit Grid(std::vector<std::vector<char>> cells);

	// Build from one string per row, case-insensitive. Throws std::runtime_error
	// if the shape is not expected_rows x expected_cols or a cell is not a letter.
	static Grid from_rows(const std::vector<std::string> &rows, size_t expected_rows, size_t expected_cols);

	inline size_t rows() const {return cells.size();}
	inline size_t cols() const {return cells.empty() ? 0 : cells.front().size();}
	inline bool contains(int y, int x) const {return y >= 0 && x >= 0 && (size_t) y < rows() && (size_t) x < cols();}
	inline char at(size_t y, size_t x) const {return cells[y][x];}

	friend std::ostream& operator<<(std::ostream &os, const Grid &grid);
};

// One row per non-blank line. Whitespace and other non-letters are skipped.
Grid read_grid(std::istream &is);

} // namespace boggle

#endif
