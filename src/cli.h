#ifndef BOGGLE_CLI_H
#define BOGGLE_CLI_H

#include <iosfwd>

namespace boggle {

// Parses the command line, solves, and prints the report to out. Usage and
// errors go to err. Returns the process exit status.
int run(int argc, char *argv[], std::istream &in, std::ostream &out, std::ostream &err);

} // namespace boggle

#endif
