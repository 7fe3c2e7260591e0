#include "trie.h"

#include <stdexcept>

#include "formatter.h"

namespace boggle {

void Trie::add(const std::string &word) {
	if (word.empty()) return;
	Trie *node = this;
	for (char c : word) {
		int idx = letter_index(c);
		if (idx < 0) throw std::domain_error(Formatter() << "invalid character '" << c << "' in word " << word);
		if (!node->children[idx]) node->children[idx] = new Trie();
		node = node->children[idx];
	}
	node->end_of_word = true;
}

const Trie* Trie::find(const std::string &prefix) const {
	const Trie *node = this;
	for (char c : prefix) {
		node = node->child(c);
		if (!node) return nullptr;
	}
	return node;
}

bool Trie::contains(const std::string &word) const {
	const Trie *node = find(word);
	return node && node->end_of_word;
}

bool Trie::has_prefix(const std::string &prefix) const {
	return find(prefix) != nullptr;
}

size_t Trie::num_nodes() const {
	size_t n = 1;
	for (const Trie *c : children) if (c) n += c->num_nodes();
	return n;
}

} // namespace boggle
