#include "cli.h"

#include <exception>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <vector>

#include <cxxopts.hpp>

#include "dictionary.h"
#include "formatter.h"
#include "grid.h"
#include "solver.h"
#include "trie.h"

using namespace std;

namespace boggle {

namespace {

class Options {
public:
	string dict_path = "words.txt";
	string grid_path;
	vector<string> rows;
	bool debug = false;
};

class SearchOptions {
public:
	size_t rows = 4;
	size_t cols = 4;
	size_t min_length = 3;
	size_t max_length = 16;
	size_t top = DEFAULT_LIMIT;
};

class DisplayOptions {
public:
	bool list = false;
	bool show_grid = false;
};

const string& default_text(const string &s) {return s;}
template <typename T> string default_text(const T &value) {return std::to_string(value);}
template <typename T> auto make_value(T &value, bool set_default=!is_same<bool,T>::value) {
	if (set_default) return cxxopts::value<T>(value)->default_value(default_text(value));
	return cxxopts::value<T>(value);
}

void print_words(ostream &os, const vector<string> &words) {
	os << "[";
	for (size_t i=0; i<words.size(); ++i) {
		if (i) os << ", ";
		os << '"' << words[i] << '"';
	}
	os << "]";
}

int usage(ostream &err, const string &program) {
	err << "Usage: " << program << " [OPTION...] <row1> <row2> <row3> <row4>" << endl;
	err << "Example: " << program << " srps euim eahw wdzr" << endl;
	return 1;
}

} // namespace

int run(int argc, char *argv[], istream &in, ostream &out, ostream &err) {
	Options options;
	SearchOptions search_options;
	DisplayOptions display_options;
	auto debug = [&err]() -> ostream& {return err << "[debug] ";};

	string program = argc > 0 ? argv[0] : "boggle";
	cxxopts::Options argparse(
			"boggle",
			"Find every dictionary word that can be traced through adjacent cells of a\n"
			"letter grid, diagonals included, using each cell at most once per word.\n"
			"Prints the number of words found and the longest ones."
			);
	argparse.add_options()
		("h,help", "help")
		("d,dict", "dictionary file, one word per line", make_value(options.dict_path), "DICT_FILE")
		("g,grid", "read the grid from a file instead of ROW arguments (- for stdin)", make_value(options.grid_path, false), "GRID_FILE")
		("debug", "log loading and search statistics", make_value(options.debug))
		("rows", "grid rows, one argument per row", cxxopts::value<vector<string>>(options.rows), "ROW")
		;
	argparse.parse_positional({"rows"});
	argparse.positional_help("ROW ROW ROW ROW");

	argparse.add_options("search")
		("num_rows", "number of rows in the grid", make_value(search_options.rows), "N")
		("num_cols", "number of letters in each row", make_value(search_options.cols), "N")
		("min_length", "min length of words to consider from dictionary", make_value(search_options.min_length), "LENGTH")
		("max_length", "max length of words to consider from dictionary", make_value(search_options.max_length), "LENGTH")
		("n,top", "number of longest words to report", make_value(search_options.top), "N")
		;
	argparse.add_options("display")
		("list", "also list every word found", make_value(display_options.list))
		("show_grid", "print the grid before the results", make_value(display_options.show_grid))
		;

	try {
		// older cxxopts takes both by reference and may rewrite them
		int parse_argc = argc;
		char **parse_argv = argv;
		auto args = argparse.parse(parse_argc, parse_argv);
		if (args.count("help")) {
			err << argparse.help({"", "search", "display"});
			return 0;
		}
	} catch (const exception &e) {
		err << "Error: " << e.what() << endl;
		return usage(err, program);
	}

	Grid grid;
	try {
		if (options.grid_path.empty()) {
			if (options.rows.size() != search_options.rows) return usage(err, program);
			grid = Grid::from_rows(options.rows, search_options.rows, search_options.cols);
		} else if (options.grid_path == "-") {
			grid = read_grid(in);
		} else {
			ifstream grid_fin(options.grid_path);
			if (!grid_fin) throw runtime_error(Formatter() << "could not open grid file " << options.grid_path);
			grid = read_grid(grid_fin);
		}
	} catch (const exception &e) {
		err << "Error: " << e.what() << endl;
		return 1;
	}
	if (options.debug) debug() << "grid is " << grid.rows() << "x" << grid.cols() << endl;

	Trie trie;
	DictionaryOptions dict_options;
	dict_options.min_length = search_options.min_length;
	dict_options.max_length = search_options.max_length;
	try {
		DictionaryStats dict_stats = load_dict(options.dict_path, &trie, dict_options);
		if (options.debug) {
			debug() << "read " << dict_stats.lines << " lines from " << options.dict_path
				<< ", kept " << dict_stats.words << " words" << endl;
			debug() << "trie has " << trie.num_nodes() << " nodes" << endl;
		}
	} catch (const exception &e) {
		err << "Error loading dictionary: " << e.what() << endl;
		return 1;
	}

	Solver solver(trie, grid);
	Result result = solver.solve(search_options.top);
	if (options.debug) {
		const SearchStats &stats = solver.stats();
		debug() << "entered " << stats.entered << " cells, pruned " << stats.pruned
			<< " branches, reached " << stats.emitted << " words" << endl;
	}

	if (display_options.show_grid) out << grid << endl;
	out << "Total words found: " << result.total << endl;
	out << "Longest " << search_options.top << " words: ";
	print_words(out, result.longest);
	out << endl;
	if (display_options.list) {
		out << endl;
		for (const string &w : result.words) out << w << endl;
	}
	return 0;
}

} // namespace boggle
