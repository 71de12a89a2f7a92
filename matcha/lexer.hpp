#ifndef _MATCHA_LEXER_HPP_
#define _MATCHA_LEXER_HPP_

#include "tokens.hpp"
#include "errors.hpp"

#include <vector>

namespace Matcha {

//---------------------------------------------------------------------------
class Lexer
//---------------------------------------------------------------------------
// Scans a pattern string into LITERAL and PATTERN tokens, one at a time.
// Every char of the pattern is covered by exactly one token. Syntax errors
// are thrown as LexError when the offending token is reached.
// The pattern is decoded from UTF-8 first: positions are code point offsets.
{
public:
	CONST BRACKET_OPEN  = U'[';
	CONST BRACKET_CLOSE = U']';
	CONST ESCAPE        = U'\\';
	CONST FIELD_SEP     = U':';
	CONST NEGATION      = U'!';
	CONST BACKTICK      = U'`';

	explicit Lexer(string_view pattern): pattern(decode_utf8(pattern)) {}

	Lexer(const Lexer&) = delete;
	Lexer& operator=(const Lexer&) = delete;

	// Pulls the next token; returns false at the end of the pattern.
	bool next(OUT Token& token);

	// Convenience: all the (remaining) tokens at once
	std::vector<Token> tokenize();

	size_t position() const { return pos; }
	bool at_end() const { return pos >= pattern.length(); }

private:
	Text pattern; // Decoded copy, so the Lexer doesn't depend on the caller's buffer
	size_t pos = 0;

	Token _lex_literal();
	Token _lex_escape();
	Token _lex_pattern();

	static CharType _lex_char_type(TextView field, size_t token_pos);
	static void _lex_range(TextView field, OUT Token& token);
	static std::vector<Text> _lex_alternatives(TextView field);
	static LengthConstraint _lex_length(TextView field, size_t token_pos);
	static size_t _lex_number(TextView field, OUT size_t& i, size_t token_pos);
};

} // namespace Matcha

#endif // _MATCHA_LEXER_HPP_
