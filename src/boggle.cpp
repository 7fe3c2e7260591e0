#include <iostream>

#include "cli.h"

int main(int argc, char *argv[]) {
	return boggle::run(argc, argv, std::cin, std::cout, std::cerr);
}
