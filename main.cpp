/*****************************************************************************
  Command-line driver for trying Matcha patterns

    matcha match   <pattern> [text]
    matcha find    <pattern> [text]
    matcha findall <pattern> [text]

  The text is read from stdin if omitted (or if it's "-"); one trailing
  line end is dropped from it.

  Exit codes: 0 = matched/found, 1 = no match, 2 = usage error,
              -1 = invalid pattern, -2 = other C++ runtime error
 *****************************************************************************/

#include "matcha/matcha.hpp"

#include <cstdlib>
#include <iostream>
	using std::cerr, std::cout, std::endl;
#include <iterator>

namespace {

	int usage(const char* self)
	{
		cerr << std::format("Usage: {} <match|find|findall> <pattern> [text | -]\n", self);
		return 2;
	}

	// The whole stream, minus one trailing line end ("\n" or "\r\n"), so
	// `echo 123 | matcha match ...` sees just "123"
	string read_all(std::istream& in)
	{
		string text(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>{});
		if (text.ends_with('\n')) {
			text.pop_back();
			if (text.ends_with('\r')) text.pop_back();
		}
		return text;
	}

} // namespace

//===========================================================================
int main(int argc, char** argv)
//===========================================================================
{
	using namespace Matcha;

	if (argc < 3 || argc > 4) return usage(argv[0]);

	string_view op = argv[1];
	string text = (argc < 4 || string_view(argv[3]) == "-") ? read_all(std::cin) : string(argv[3]);

	try {
		Pattern pattern(argv[2]);
		pattern.DUMP();

		if (op == "match") {
			auto res = pattern.match(text);
			cout << (res ? "true" : "false") << endl;
			return res ? 0 : 1;
		}
		else if (op == "find") {
			auto m = pattern.find(text);
			if (!m) return 1;
			cout << m->value << endl;
			return 0;
		}
		else if (op == "findall") {
			auto matches = pattern.find_all(text);
			for (auto& m : matches) cout << m.value << "\n";
			return matches.empty() ? 1 : 0;
		}
		else return usage(argv[0]);
	}
	catch(std::runtime_error& x)
	{
		cerr << x.what() << "\n";
		exit(-1);
	}
	catch(std::exception& x)
	{
		cerr << "- C++ runtime error: " << x.what() << "\n";
		exit(-2);
	}
}
