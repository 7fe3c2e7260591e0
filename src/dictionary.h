#ifndef BOGGLE_DICTIONARY_H
#define BOGGLE_DICTIONARY_H

#include <cstddef>
#include <iosfwd>
#include <string>

#include "trie.h"

namespace boggle {

// Words outside [min_length, max_length] letters are never inserted.
struct DictionaryOptions {
	size_t min_length = 3;
	size_t max_length = 16;
};

struct DictionaryStats {
	size_t lines = 0;
	size_t words = 0;
};

// Reads one word per line. Each line is trimmed and upper-cased; lines with
// non-letters or a length outside the configured bounds are skipped.
DictionaryStats read_dict(std::istream &is, Trie *trie, const DictionaryOptions &options = DictionaryOptions());

// Throws std::runtime_error if path cannot be opened.
DictionaryStats load_dict(const std::string &path, Trie *trie, const DictionaryOptions &options = DictionaryOptions());

} // namespace boggle

#endif
