#ifndef BOGGLE_TRIE_H
#define BOGGLE_TRIE_H

#include <array>
#include <cstddef>
#include <string>

namespace boggle {

constexpr size_t NUM_LETTERS = 26;

inline int letter_index(char c) {return c >= 'A' && c <= 'Z' ? c - 'A' : -1;}

// Prefix tree over the letters A-Z. Each node owns its children.
class Trie {
	bool end_of_word;
	std::array<Trie*, NUM_LETTERS> children;

public:
	Trie() : end_of_word{}, children{} {}
	~Trie() {
		for (Trie *c : children) delete c;
	}
	Trie(const Trie&) = delete;
	Trie& operator=(const Trie&) = delete;

	// Insert an uppercase word. Empty words are ignored.
	void add(const std::string &word);

	// Child node for letter c, or nullptr if no word continues with c.
	const Trie* child(char c) const {
		int idx = letter_index(c);
		return idx < 0 ? nullptr : children[idx];
	}

	bool is_word() const {return end_of_word;}

	bool contains(const std::string &word) const;
	bool has_prefix(const std::string &prefix) const;
	size_t num_nodes() const;

private:
	const Trie* find(const std::string &prefix) const;
};

} // namespace boggle

#endif
