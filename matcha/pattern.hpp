#ifndef _MATCHA_PATTERN_HPP_
#define _MATCHA_PATTERN_HPP_

#include "matcher.hpp"

#include <optional>
#include <vector>

namespace Matcha {

//---------------------------------------------------------------------------
class Pattern
//---------------------------------------------------------------------------
// A compiled pattern. Compile once, then match against any number of texts,
// from any number of threads: matching never modifies it.
{
public:
	// Throws LexError for invalid patterns.
	explicit Pattern(string_view source):
		_source(source),
		_ast(Parser(source).parse())
	{
DBG("Pattern \"{}\" compiled to {} node(s).", DBG_TRIM(_source), _ast.size());
	}

	static Pattern compile(string_view source) { return Pattern(source); }

	const string& source() const { return _source; }
	const Ast& ast() const { return _ast; }
	size_t size() const { return _ast.size(); }
	bool empty() const { return _ast.empty(); }

	bool match(string_view text) const {
		return Matcher(_ast, text).match_full();
	}
	std::optional<Match> find(string_view text) const {
		Match m;
		if (Matcher(_ast, text).find_first(m)) return m;
		return std::nullopt;
	}
	std::vector<Match> find_all(string_view text) const {
		return Matcher(_ast, text).find_all();
	}

	// Same AST (the source strings may still differ, e.g. "a" vs. "\a")
	bool operator==(const Pattern& other) const { return _ast == other._ast; }

#ifndef NDEBUG
	void DUMP() const { std::cerr << std::format("Pattern \"{}\":\n", _source); dump(_ast); }
#else
	void DUMP() const {}
#endif

private:
	string _source;
	Ast _ast;
};


//---------------------------------------------------------------------------
// One-shot front-ends (compile + match)
//---------------------------------------------------------------------------
	bool match(string_view pattern, string_view text);
	std::optional<string> find(string_view pattern, string_view text);
	std::vector<string> find_all(string_view pattern, string_view text);

} // namespace Matcha

#endif // _MATCHA_PATTERN_HPP_
