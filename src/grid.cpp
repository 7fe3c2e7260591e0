#include "grid.h"

#include <algorithm>
#include <cctype>
#include <istream>
#include <iterator>
#include <ostream>
#include <stdexcept>
#include <utility>

#include "formatter.h"

namespace boggle {

Grid::Grid(std::vector<std::vector<char>> cells) : cells(std::move(cells)) {
	for (size_t y=0; y<rows(); ++y) {
		if (this->cells[y].size() != cols()) {
			throw std::runtime_error(Formatter() << "grid has " << cols() << " columns but row " << (y+1) << " has " << this->cells[y].size());
		}
		for (char c : this->cells[y]) {
			if (c < 'A' || c > 'Z') throw std::runtime_error(Formatter() << "row " << (y+1) << " contains '" << c << "' which is not an uppercase letter");
		}
	}
}

Grid Grid::from_rows(const std::vector<std::string> &rows, size_t expected_rows, size_t expected_cols) {
	if (rows.size() != expected_rows) {
		throw std::runtime_error(Formatter() << "expected " << expected_rows << " rows but got " << rows.size());
	}
	std::vector<std::vector<char>> cells;
	for (const std::string &row : rows) {
		if (row.size() != expected_cols) {
			throw std::runtime_error(Formatter() << "each row must be exactly " << expected_cols << " letters long, got '" << row << "'");
		}
		if (!std::all_of(row.begin(), row.end(), [](char c){return std::isalpha(static_cast<unsigned char>(c));})) {
			throw std::runtime_error(Formatter() << "row '" << row << "' contains a character that is not a letter");
		}
		cells.emplace_back();
		std::transform(row.begin(), row.end(), std::back_inserter(cells.back()), [](char c){return static_cast<char>(std::toupper(static_cast<unsigned char>(c)));});
	}
	return Grid(std::move(cells));
}

Grid read_grid(std::istream &is) {
	std::vector<std::vector<char>> cells;
	std::string line;
	while (std::getline(is, line)) {
		std::vector<char> row;
		for (char c : line) {
			if (std::isalpha(static_cast<unsigned char>(c))) row.push_back(static_cast<char>(std::toupper(static_cast<unsigned char>(c))));
		}
		if (!row.empty()) cells.push_back(std::move(row));
	}
	return Grid(std::move(cells));
}

std::ostream& operator<<(std::ostream &os, const Grid &grid) {
	for (size_t y=0; y<grid.rows(); ++y) {
		for (size_t x=0; x<grid.cols(); ++x) {
			if (x) os << ' ';
			os << grid.at(y, x);
		}
		os << '\n';
	}
	return os;
}

} // namespace boggle
