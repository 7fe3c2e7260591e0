#include "dictionary.h"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <istream>
#include <stdexcept>

#include "formatter.h"

namespace boggle {

static void trim(std::string &s) {
	auto not_space = [](char c){return !std::isspace(static_cast<unsigned char>(c));};
	s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
	s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
}

DictionaryStats read_dict(std::istream &is, Trie *trie, const DictionaryOptions &options) {
	DictionaryStats stats;
	std::string w;
	while (std::getline(is, w)) {
		++stats.lines;
		trim(w);
		if (w.empty()) continue;
		if (w.size() < options.min_length || w.size() > options.max_length) continue;
		if (!std::all_of(w.begin(), w.end(), [](char c){return std::isalpha(static_cast<unsigned char>(c));})) continue;
		std::transform(w.begin(), w.end(), w.begin(), [](char c){return static_cast<char>(std::toupper(static_cast<unsigned char>(c)));});
		trie->add(w);
		++stats.words;
	}
	return stats;
}

DictionaryStats load_dict(const std::string &path, Trie *trie, const DictionaryOptions &options) {
	std::ifstream fin(path);
	if (!fin) throw std::runtime_error(Formatter() << "could not open dictionary file " << path);
	return read_dict(fin, trie, options);
}

} // namespace boggle
