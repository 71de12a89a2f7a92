#include "lexer.hpp"

#include <charconv>
#include <cstdint>

namespace Matcha {

namespace {

	// ASCII whitespace only: no other code point is trimmed
	bool is_space(char32_t c) { return c == U' ' || (c >= U'\t' && c <= U'\r'); }
	bool is_digit(char32_t c) { return c >= U'0' && c <= U'9'; }

	TextView trim(TextView s)
	{
		while (!s.empty() && is_space(s.front())) s.remove_prefix(1);
		while (!s.empty() && is_space(s.back()))  s.remove_suffix(1);
		return s;
	}

	bool all_digits(TextView s)
	{
		if (s.empty()) return false;
		for (auto c : s) if (!is_digit(c)) return false;
		return true;
	}

} // namespace


//---------------------------------------------------------------------------
bool Lexer::next(OUT Token& token)
{
	if (at_end()) return false;

	switch (pattern[pos]) {
	case BRACKET_OPEN: token = _lex_pattern(); break;
	case ESCAPE:       token = _lex_escape(); break;
	default:           token = _lex_literal(); break;
	}
DBG("Lexer: {}", token.to_string());
	return true;
}

std::vector<Token> Lexer::tokenize()
{
	std::vector<Token> tokens;
	for (Token t; next(t); ) {
		tokens.push_back(std::move(t));
	}
	return tokens;
}


//---------------------------------------------------------------------------
Token Lexer::_lex_literal()
{
	auto t = Token::make_literal(pattern[pos], pos);
	++pos;
	return t;
}

Token Lexer::_lex_escape()
{
	assert(pattern[pos] == ESCAPE);
	if (pos + 1 >= pattern.length()) {
		LEX_ERROR(UNTERMINATED_ESCAPE, pos, "Escape sequence at end of pattern");
	}
	auto t = Token::make_literal(pattern[pos + 1], pos);
	pos += 2;
	return t;
}

Token Lexer::_lex_pattern()
// [type:range:length]
{
	assert(pattern[pos] == BRACKET_OPEN);
	size_t start = pos;

	auto end = pattern.find(BRACKET_CLOSE, start + 1);
	if (end == Text::npos) {
		LEX_ERROR(UNCLOSED_BRACKET, start, "Unclosed pattern bracket");
	}
	TextView content = TextView(pattern).substr(start + 1, end - start - 1);
	pos = end + 1;

	// Split the fields...
	std::vector<TextView> fields;
	for (size_t from = 0;;) {
		auto sep = content.find(FIELD_SEP, from);
		fields.push_back(content.substr(from, sep == TextView::npos ? TextView::npos : sep - from));
		if (sep == TextView::npos) break;
		from = sep + 1;
	}
	if (fields.size() != 3) {
		LEX_ERROR(BAD_FORMAT, start, "Pattern must have format [type:range:length], got [{}]", encode_utf8(content));
	}

	Token t;
	t.type = Token::PATTERN;
	t.position = start;
	t.source = encode_utf8(TextView(pattern).substr(start, pos - start));
	t.char_type = _lex_char_type(fields[0], start);
	if (t.char_type == CharType::X) {
		t.mode = PatternMode::WILDCARD; // The range is ignored for x.
	} else {
		_lex_range(fields[1], t);
	}
	t.length = _lex_length(fields[2], start);
	return t;
}


//---------------------------------------------------------------------------
CharType Lexer::_lex_char_type(TextView field, size_t token_pos)
{
	auto name = trim(field);

	// Only ASCII letters can make a valid name; anything else is kept
	// as-is, for the error message.
	Text folded(name);
	for (auto& c : folded) if (c >= U'A' && c <= U'Z') c += U'a' - U'A';

	CharType type;
	if (!char_type_from_name(encode_utf8(folded), type)) {
		LEX_ERROR(INVALID_TYPE, token_pos,
			"Invalid type '{}'. Valid types: str, anum, hex, oct, dec, bin, x", encode_utf8(folded));
	}
	return type;
}

void Lexer::_lex_range(TextView field, OUT Token& token)
{
	assert(token.char_type != CharType::X);

	auto range = trim(field);
	if (range.empty()) {
		token.mode = PatternMode::CHARSET;
		token.char_set = default_char_set(token.char_type);
		return;
	}

	if (range.front() == NEGATION) {
		token.negated = true;
		range.remove_prefix(1);
	}

	if (range.find(BACKTICK) != TextView::npos) {
		token.mode = PatternMode::ALTERNATIVES;
		token.alternatives = _lex_alternatives(range);
	} else {
		token.mode = PatternMode::CHARSET;
		token.char_set = CharSet::parse(range);
	}
}

std::vector<Text> Lexer::_lex_alternatives(TextView field)
// `black`|`WHITE` -> {"black", "WHITE"}
// Anything outside the backticks (normally just the '|'s) is skipped.
{
	std::vector<Text> alts;
	for (size_t i = 0; i < field.length(); ) {
		if (field[i] != BACKTICK) { ++i; continue; }

		auto close = field.find(BACKTICK, i + 1);
		if (close == TextView::npos) { // Unterminated: takes the rest
			alts.emplace_back(field.substr(i + 1));
			break;
		}
		alts.emplace_back(field.substr(i + 1, close - i - 1));
		i = close + 1;
	}
	assert(!alts.empty()); // There was at least one backtick
	return alts;
}


//---------------------------------------------------------------------------
LengthConstraint Lexer::_lex_length(TextView field, size_t token_pos)
// ""       -> 1 or more
// "5"      -> exactly 5
// ">=5"    -> 5 or more,   "<=5" -> 1..5
// ">5"     -> 6 or more,   "<5"  -> 1..4
// ">1<5"   -> 2..4,      ">=1<=5" -> 1..5
{
	auto spec = trim(field);
	if (spec.empty()) return {};

	if (all_digits(spec)) {
		size_t i = 0;
		return LengthConstraint::exactly(_lex_number(spec, i, token_pos));
	}

	LengthConstraint length;
	for (size_t i = 0; i < spec.length(); ) {
		auto rest = spec.substr(i);
		if (rest.starts_with(U">=")) {
			i += 2;
			length.min = _lex_number(spec, i, token_pos);
		} else if (rest.starts_with(U"<=")) {
			i += 2;
			length.max = _lex_number(spec, i, token_pos);
		} else if (rest.front() == U'>') {
			i += 1;
			auto n = _lex_number(spec, i, token_pos);
			if (n == SIZE_MAX) {
				LEX_ERROR(BAD_LENGTH_CONSTRAINT, token_pos, "Length bound too large in '{}'", encode_utf8(spec));
			}
			length.min = n + 1;
		} else if (rest.front() == U'<') {
			i += 1;
			auto n = _lex_number(spec, i, token_pos);
			if (n == 0) {
				LEX_ERROR(BAD_LENGTH_CONSTRAINT, token_pos, "No length can be less than 0 in '{}'", encode_utf8(spec));
			}
			length.max = n - 1;
		} else {
			LEX_ERROR(BAD_LENGTH_CONSTRAINT, token_pos, "Invalid length constraint: {}", encode_utf8(spec));
		}
	}

	// min <= max must hold for every compiled constraint
	if (length.max && length.min > *length.max) {
		LEX_ERROR(BAD_LENGTH_CONSTRAINT, token_pos,
			"Length constraint '{}' allows no length (min {} > max {})", encode_utf8(spec), length.min, *length.max);
	}
	return length;
}

size_t Lexer::_lex_number(TextView field, OUT size_t& i, size_t token_pos)
{
	size_t end = i;
	while (end < field.length() && is_digit(field[end])) ++end;
	if (end == i) {
		LEX_ERROR(BAD_LENGTH_CONSTRAINT, token_pos, "Expected number in length constraint '{}'", encode_utf8(field));
	}

	// All ASCII digits, so the UTF-8 form is just the same chars
	auto digits = encode_utf8(field.substr(i, end - i));
	size_t n = 0;
	auto res = std::from_chars(digits.data(), digits.data() + digits.length(), n);
	if (res.ec != std::errc()) {
		LEX_ERROR(BAD_LENGTH_CONSTRAINT, token_pos, "Number out of range in length constraint '{}'", encode_utf8(field));
	}
	i = end;
	return n;
}

} // namespace Matcha
