/*****************************************************************************
  greptoy -E <pattern>

    Reads one line (UTF-8) from stdin, and exits with 0 if it matches
    <pattern>, or with 1 if it doesn't.

    Also exits with 1 on any error (with a message on stderr), so a
    failure can't be told apart from a non-match by the exit code alone.
 *****************************************************************************/

#include "greptoy.hpp"

#include <iostream>
	using std::cin, std::cerr;
#include <stdexcept>
#include <string_view>

namespace Matching {
	struct UsageError : std::runtime_error { using std::runtime_error::runtime_error; };
	struct InputReadError : std::runtime_error { using std::runtime_error::runtime_error; };
}

//===========================================================================
int main(int argc, char** argv)
//===========================================================================
{
	try {
		using namespace Matching;

		if (argc < 3) {
			throw UsageError(format("- ERROR: Usage: {} -E <pattern>", argc ? argv[0] : "greptoy"));
		}
		if (string_view(argv[1]) != "-E") {
			throw UsageError("- ERROR: Expected first argument to be '-E'");
		}

		Matcher matcher(argv[2]);
		matcher.pattern.DUMP();

		string line;
		if (!std::getline(cin, line) && cin.bad()) { // EOF without a line is just an empty line
			throw InputReadError("- ERROR: Failed to read input");
		}

		auto input = trim_line_end(line);
		if (u32string decoded; !utf8_decode(input, decoded)) {
			throw InputReadError("- ERROR: Input is not valid UTF-8");
		}

		size_t pos = 0, len = 0;
		auto res = matcher.match(string(input), pos, len);
		DBG("Result: {} (matched: {} at {})", res, len, pos);

		return res ? 0 : 1;
	}
	catch(std::runtime_error& x)
	{
		cerr << x.what() << "\n";
		return 1;
	}
	catch(std::exception& x)
	{
		cerr << "- C++ runtime error: " << x.what() << "\n";
		return 1;
	}
	catch(...)
	{
		cerr << "- UNKNOWN ERROR(S)!...\n";
		return 1;
	}
}
