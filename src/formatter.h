#ifndef BOGGLE_FORMATTER_H
#define BOGGLE_FORMATTER_H

#include <sstream>
#include <string>

namespace boggle {

// Builds a string with stream syntax, for exception and log messages:
//   throw std::runtime_error(Formatter() << "row " << i << " is too long");
class Formatter {
	std::ostringstream ss;
public:
	template<typename T>
	Formatter& operator<<(const T& value) {
		ss << value;
		return *this;
	}
	operator std::string() const { return ss.str(); }
	std::string str() const { return *this; }
};

} // namespace boggle

#endif
