#include "tokens.hpp"

#include <algorithm>
#include <array>
#include <cstdint>
#include <iterator>

namespace Matcha {

namespace {

	struct CharTypeInfo {
		CharType    type;
		string_view name;
		TextView    defaults; // in the char set spec syntax of the patterns
	};

	// Indexed by CharType!
	constexpr CharTypeInfo CHAR_TYPES[] = {
		{ CharType::STR , "str" , U"a-zA-Z" },
		{ CharType::ANUM, "anum", U"a-zA-Z0-9" },
		{ CharType::HEX , "hex" , U"0-9a-fA-F" },
		{ CharType::OCT , "oct" , U"0-7" },
		{ CharType::DEC , "dec" , U"0-9" },
		{ CharType::BIN , "bin" , U"01" },
		{ CharType::X   , "x"   , U"" },
	};
	constexpr size_t CHAR_TYPE_COUNT = std::size(CHAR_TYPES);

	static_assert(CHAR_TYPES[size_t(CharType::X)].type == CharType::X);

} // namespace


const char* char_type_name(CharType type)
{
	assert(size_t(type) < CHAR_TYPE_COUNT);
	return CHAR_TYPES[size_t(type)].name.data();
}

bool char_type_from_name(string_view name, OUT CharType& type)
{
	for (auto& info : CHAR_TYPES) {
		if (info.name == name) {
			type = info.type;
			return true;
		}
	}
	return false;
}


//---------------------------------------------------------------------------
CharSet CharSet::parse(TextView spec)
{
	CharSet set;
	for (size_t i = 0; i < spec.length(); ) {
		char32_t c = spec[i];
		if (c == U'|') { // separator only
			++i;
		} else if (i + 2 < spec.length() && spec[i + 1] == U'-') {
			set.add_range(c, spec[i + 2]);
			i += 3;
		} else {
			set.add(c);
			++i;
		}
	}
	return set;
}

void CharSet::add_range(char32_t first, char32_t last)
{
	if (last < first) return;

	// Everything from the first range touching [first, last] (from the left)
	// up to the last one touching it gets merged into one.
	auto touches_left = [](const Range& r, char32_t c) { return uint64_t(r.last) + 1 < c; };
	auto from = std::lower_bound(ranges.begin(), ranges.end(), first, touches_left);
	auto to = from;
	while (to != ranges.end() && to->first <= uint64_t(last) + 1) {
		first = std::min(first, to->first);
		last  = std::max(last, to->last);
		++to;
	}
	from = ranges.erase(from, to);
	ranges.insert(from, Range{first, last});
}

bool CharSet::contains(char32_t c) const
{
	// The last range starting at or before c:
	auto it = std::upper_bound(ranges.begin(), ranges.end(), c,
		[](char32_t c, const Range& r) { return c < r.first; });
	return it != ranges.begin() && c <= std::prev(it)->last;
}

size_t CharSet::size() const
{
	size_t n = 0;
	for (auto& r : ranges) n += size_t(r.last - r.first) + 1;
	return n;
}

string CharSet::chars() const
{
	string result;
	for (auto& r : ranges) {
		for (uint64_t c = r.first; c <= r.last; ++c) append_utf8(result, char32_t(c));
	}
	return result;
}

string CharSet::to_string() const
{
	string result;
	for (auto& r : ranges) {
		append_utf8(result, r.first);
		if (r.last == r.first) continue;
		if (r.last > r.first + 1) result += '-';
		append_utf8(result, r.last);
	}
	return result;
}

const CharSet& default_char_set(CharType type)
{
	assert(type != CharType::X);
	assert(size_t(type) < CHAR_TYPE_COUNT);

	static const auto DEFAULT_SETS = [] {
		std::array<CharSet, CHAR_TYPE_COUNT> sets;
		for (auto& info : CHAR_TYPES) {
			sets[size_t(info.type)] = CharSet::parse(info.defaults);
		}
DBG("+++ Default char sets initialized. +++");
		return sets;
	}();

	return DEFAULT_SETS[size_t(type)];
}


//---------------------------------------------------------------------------
string LengthConstraint::to_string() const
{
	if (is_exact()) return std::format("{}", min);
	return max ? std::format("{}..{}", min, *max)
	           : std::format("{}..", min);
}


//---------------------------------------------------------------------------
string Token::to_string() const
{
	if (is_literal()) {
		return std::format("LITERAL '{}' @{}", to_utf8(literal), position);
	}

	string neg = negated ? "!" : "";
	switch (mode) {
	case PatternMode::WILDCARD:
		return std::format("PATTERN {} @{}: {}, any char, len {}",
			source, position, char_type_name(char_type), length.to_string());
	case PatternMode::ALTERNATIVES: {
		string alts;
		for (auto& a : alternatives) {
			if (!alts.empty()) alts += '|';
			alts += std::format("`{}`", encode_utf8(a));
		}
		return std::format("PATTERN {} @{}: {}, literals {}{}, len {}",
			source, position, char_type_name(char_type), neg, alts, length.to_string());
	}
	case PatternMode::CHARSET:
		return std::format("PATTERN {} @{}: {}, chars {}\"{}\", len {}",
			source, position, char_type_name(char_type), neg, char_set.to_string(), length.to_string());
	default:
		return "!!BUG: MISSING NAME FOR PatternMode!!";
	}
}

} // namespace Matcha
