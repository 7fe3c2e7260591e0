#ifndef BOGGLE_SOLVER_H
#define BOGGLE_SOLVER_H

#include <cstddef>
#include <string>
#include <unordered_set>
#include <vector>

#include "grid.h"
#include "trie.h"

namespace boggle {

constexpr size_t DEFAULT_LIMIT = 6;

struct Result {
	size_t total = 0;
	std::vector<std::string> longest;  // at most limit words
	std::vector<std::string> words;    // every found word, ranked
};

struct SearchStats {
	size_t entered = 0;  // cells appended to a path
	size_t pruned = 0;   // in-bounds free cells with no trie continuation
	size_t emitted = 0;  // complete words reached, duplicates included
};

// Sorts by descending length, then alphabetically.
std::vector<std::string> rank_words(const std::unordered_set<std::string> &words);

// Finds every dictionary word traceable through 8-way adjacent cells, each
// cell used at most once per word.
class Solver {
	const Trie &dict;
	const Grid &grid;
	std::vector<std::vector<bool>> used;
	std::string partial;
	std::unordered_set<std::string> found;
	SearchStats counters;

	// Marks a cell used and extends the path for the lifetime of the object.
	class Step {
		Solver &solver;
		size_t y, x;
	public:
		Step(Solver &solver, size_t y, size_t x);
		~Step();
		Step(const Step&) = delete;
		Step& operator=(const Step&) = delete;
	};

	void go(int y, int x, const Trie *trie);

public:
	Solver(const Trie &dict, const Grid &grid) : dict(dict), grid(grid) {}
	~Solver() {}

	Result solve(size_t limit = DEFAULT_LIMIT);

	const SearchStats& stats() const {return counters;}
};

} // namespace boggle

#endif
