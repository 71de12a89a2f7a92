#ifndef _MATCHA_TOKENS_HPP_
#define _MATCHA_TOKENS_HPP_
/*****************************************************************************
  Shared data model of the pattern compiler: char types, char sets, length
  constraints and lexer tokens

  A "character" is a Unicode code point here (see utf8.hpp): char sets are
  sorted lists of disjoint code point ranges, listed in ascending order.
 *****************************************************************************/

#include "base.hpp"
#include "utf8.hpp"

#include <optional>
#include <vector>

namespace Matcha {

	//-------------------------------------------------------------------
	// Character classes: [type:...]
	enum class CharType {
		STR,   // a-zA-Z
		ANUM,  // a-zA-Z0-9
		HEX,   // 0-9a-fA-F
		OCT,   // 0-7
		DEC,   // 0-9
		BIN,   // 01
		X,     // any char (wildcard; no set)
	};

	const char* char_type_name(CharType type);

	// Case-sensitive lookup; the lexer does the trimming & case-folding.
	bool char_type_from_name(string_view name, OUT CharType& type);


	//-------------------------------------------------------------------
	struct CharSet
	{
		struct Range
		{
			char32_t first;
			char32_t last; // inclusive

			bool operator==(const Range&) const = default;
		};

		// Sorted, disjoint and non-adjacent (touching ranges are merged)
		std::vector<Range> ranges;

		CharSet() = default;

		// Parse a char set spec: X-Y ranges and single chars, with optional
		// '|' separators (e.g. "a-zA-Z", "S|s", "0-9._+", "α-ω").
		static CharSet parse(TextView spec);

		void add(char32_t c) { add_range(c, c); }
		void add_range(char32_t first, char32_t last); // inclusive; nothing if last < first

		bool contains(char32_t c) const;
		size_t size() const;
		bool empty() const { return ranges.empty(); }

		string chars() const;     // all members, ascending, UTF-8 encoded
		string to_string() const; // compact form, e.g. "0-9A-Za-z"

		bool operator==(const CharSet&) const = default;
	};

	// The read-only default set of each type (built once, on first use).
	// X has none: asking for it is a bug.
	const CharSet& default_char_set(CharType type);


	//-------------------------------------------------------------------
	// Inclusive [min, max] bounds; no max means unbounded.
	struct LengthConstraint
	{
		size_t min = 1;
		std::optional<size_t> max;

		static LengthConstraint exactly(size_t n) { return {n, n}; }

		bool is_exact() const { return max && *max == min; }
		bool allows(size_t len) const { return len >= min && (!max || len <= *max); }

		string to_string() const;

		bool operator==(const LengthConstraint&) const = default;
	};


	//-------------------------------------------------------------------
	// Which one of the 3 matching modes a [type:range:length] token uses
	enum class PatternMode {
		CHARSET,
		ALTERNATIVES, // `literal`|`alternatives`
		WILDCARD,     // type x
	};


	//-------------------------------------------------------------------
	struct Token
	{
		enum {
			LITERAL,
			PATTERN,
		} type = LITERAL;

		size_t position = 0; // Code point offset in the pattern (of the '[' or '\' for non-plain tokens)

		// LITERAL:
		char32_t literal = 0;

		// PATTERN:
		string source;       // The raw "[type:range:length]" text, for diagnostics
		CharType char_type = CharType::X;
		PatternMode mode = PatternMode::WILDCARD;
		CharSet char_set;    // CHARSET only
		bool negated = false;
		std::vector<Text> alternatives; // ALTERNATIVES only
		LengthConstraint length;

		static Token make_literal(char32_t c, size_t pos) {
			Token t; t.type = LITERAL; t.literal = c; t.position = pos; return t;
		}

		bool is_literal() const { return type == LITERAL; }
		bool is_pattern() const { return type == PATTERN; }

		string to_string() const;

#ifndef NDEBUG
		void DUMP() const { std::cerr << "     " << to_string() << std::endl; }
#else
		void DUMP() const {}
#endif
	};

} // namespace Matcha

#endif // _MATCHA_TOKENS_HPP_
