#include "solver.h"

#include <algorithm>

namespace boggle {

std::vector<std::string> rank_words(const std::unordered_set<std::string> &words) {
	std::vector<std::string> ranked(words.begin(), words.end());
	std::sort(ranked.begin(), ranked.end(), [](const std::string &a, const std::string &b){
		if (a.size() != b.size()) return a.size() > b.size();
		return a < b;
	});
	return ranked;
}

Solver::Step::Step(Solver &solver, size_t y, size_t x) : solver(solver), y(y), x(x) {
	solver.used[y][x] = true;
	solver.partial.push_back(solver.grid.at(y, x));
	++solver.counters.entered;
}

Solver::Step::~Step() {
	solver.partial.pop_back();
	solver.used[y][x] = false;
}

void Solver::go(int y, int x, const Trie *trie) {
	if (!grid.contains(y, x)) return;
	if (used[y][x]) return;
	const Trie *child = trie->child(grid.at(y, x));
	if (!child) {
		++counters.pruned;
		return;
	}
	Step step(*this, y, x);
	if (child->is_word()) {
		found.insert(partial);
		++counters.emitted;
	}
	for (int dy=-1; dy<=1; ++dy) for (int dx=-1; dx<=1; ++dx) {
		if (dy || dx) go(y + dy, x + dx, child);
	}
}

Result Solver::solve(size_t limit) {
	used = std::vector<std::vector<bool>>(grid.rows(), std::vector<bool>(grid.cols()));
	partial.clear();
	found.clear();
	counters = SearchStats();
	for (size_t y=0; y<grid.rows(); ++y) for (size_t x=0; x<grid.cols(); ++x) {
		go(y, x, &dict);
	}

	Result result;
	result.total = found.size();
	result.words = rank_words(found);
	result.longest.assign(result.words.begin(), result.words.begin() + std::min(limit, result.words.size()));
	found.clear();
	return result;
}

} // namespace boggle
