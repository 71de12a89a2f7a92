#include "../matcha/matcha.hpp"

//---------------------------------------------------------------------------
// Verify infrastructural elements: the debug macros and the shared data model
//---------------------------------------------------------------------------
#include "./fw/doctest-setup.hpp"

using namespace Matcha;

CASE("DBG_TRIM") {
#ifndef NDEBUG
	string src = DBG_TRIM("short");
	DBG("full string: [{}]", src);
	CHECK(src == "short");
	src = DBG_TRIM("this is a long text that triggers trimming with the default length");
	DBG("trimmed: [{}]", src);
	CHECK(src.length() == DBG_DEFAULT_TRIM_LEN);
	CHECK(src.ends_with("..."));
#endif
}

CASE("DBG_, _DBG_, _DBG") {
	DBG_("Line starter...");
	_DBG_(", and a line fragment");
	_DBG_(" -- and then another line fragment --,");
	_DBG(" and a line end.");

	DBG("This should be a new line now.");
}

//---------------------------------------------------------------------------
CASE("char type names") {
	CharType t;
	CHECK((char_type_from_name("str", t) && t == CharType::STR));
	CHECK((char_type_from_name("anum", t) && t == CharType::ANUM));
	CHECK((char_type_from_name("hex", t) && t == CharType::HEX));
	CHECK((char_type_from_name("oct", t) && t == CharType::OCT));
	CHECK((char_type_from_name("dec", t) && t == CharType::DEC));
	CHECK((char_type_from_name("bin", t) && t == CharType::BIN));
	CHECK((char_type_from_name("x", t) && t == CharType::X));
	CHECK(!char_type_from_name("STR", t)); // Case-folding is the lexer's job
	CHECK(!char_type_from_name("num", t));
	CHECK(!char_type_from_name("", t));

	CHECK(string(char_type_name(CharType::ANUM)) == "anum");
	CHECK(string(char_type_name(CharType::X)) == "x");
}

CASE("default char sets") {
	CHECK(default_char_set(CharType::STR).chars()  == "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz");
	CHECK(default_char_set(CharType::ANUM).chars() == "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz");
	CHECK(default_char_set(CharType::HEX).chars()  == "0123456789ABCDEFabcdef");
	CHECK(default_char_set(CharType::OCT).chars()  == "01234567");
	CHECK(default_char_set(CharType::DEC).chars()  == "0123456789");
	CHECK(default_char_set(CharType::BIN).chars()  == "01");

	// Built once, then always the same object
	CHECK(&default_char_set(CharType::DEC) == &default_char_set(CharType::DEC));
}

CASE("CharSet: ranges, singles, separators") {
	auto s = CharSet::parse(U"a-c|x|0-1");
	CHECK(s.chars() == "01abcx");
	CHECK(s.size() == 6);
	CHECK(s.contains('b'));
	CHECK(!s.contains('d'));
	CHECK(!s.contains('|'));
}

CASE("CharSet: duplicates collapse, order is sorted") {
	CHECK(CharSet::parse(U"zyxa-cb").chars() == "abcxyz");
	CHECK(CharSet::parse(U"S|s") == CharSet::parse(U"sS"));
}

CASE("CharSet: '-' is literal where it can't make a range") {
	CHECK(CharSet::parse(U"-").chars() == "-");
	CHECK(CharSet::parse(U"a-").chars() == "-a");
	CHECK(CharSet::parse(U".-").chars() == "-.");
	CHECK(CharSet::parse(U"0-9.-").chars() == "-.0123456789");
}

CASE("CharSet: reversed range is empty") {
	CHECK(CharSet::parse(U"z-a").empty());
}

CASE("CharSet: code points beyond ASCII") {
	auto s = CharSet::parse(U"α-ωé");
	CHECK(s.size() == 26); // U+03B1..U+03C9 is 25, + é
	CHECK(s.contains(U'λ'));
	CHECK(s.contains(U'é'));
	CHECK(!s.contains(U'e'));
	CHECK(!s.contains(U'Ω'));
	CHECK(s.chars().starts_with("é")); // U+00E9 < U+03B1
	CHECK(s.to_string() == "éα-ω");
}

CASE("CharSet: huge ranges stay small") {
	CharSet s;
	s.add_range(U'\u0100', U'\U0010FFFF');
	CHECK(s.ranges.size() == 1);
	CHECK(s.size() == 0x10FFFF - 0x100 + 1);
	CHECK(s.contains(U'\U0001F600'));
	CHECK(!s.contains(U'\u00FF'));
}

CASE("CharSet: overlapping and touching ranges merge") {
	CharSet s;
	s.add_range(U'a', U'c');
	s.add_range(U'x', U'z');
	s.add_range(U'e', U'g');
	CHECK(s.ranges.size() == 3);
	s.add(U'd');              // touches both a-c and e-g
	CHECK(s.ranges.size() == 2);
	s.add_range(U'b', U'y');  // swallows everything
	CHECK(s.ranges.size() == 1);
	CHECK((s.ranges[0] == CharSet::Range{U'a', U'z'}));
	s.add_range(U'z', U'a');  // reversed: no-op
	CHECK(s.size() == 26);
	CHECK(s.to_string() == "a-z");
}

CASE("CharSet: compact form") {
	CHECK(default_char_set(CharType::ANUM).to_string() == "0-9A-Za-z");
	CHECK(default_char_set(CharType::BIN).to_string() == "01");
	CHECK(CharSet::parse(U"S|s|x-y").to_string() == "Ssxy");
	CHECK(CharSet().to_string() == "");
}

//---------------------------------------------------------------------------
CASE("UTF-8: decoding") {
	CHECK(decode_utf8("") == U"");
	CHECK(decode_utf8("abc") == U"abc");
	CHECK(decode_utf8("caf\xC3\xA9") == U"café");
	CHECK(decode_utf8("\xE2\x82\xAC") == U"€");
	CHECK(decode_utf8("\xF0\x9F\x98\x80") == U"\U0001F600");
	CHECK(decode_utf8("héllo").length() == 5);
}

CASE("UTF-8: encoding") {
	CHECK(encode_utf8(U"café") == "caf\xC3\xA9");
	CHECK(to_utf8(U'€') == "\xE2\x82\xAC");
	CHECK(to_utf8(U'\U0001F600') == "\xF0\x9F\x98\x80");
	CHECK(to_utf8(U'\u07FF').length() == 2);
	CHECK(to_utf8(U'\u0800').length() == 3);
}

CASE("UTF-8: invalid bytes are kept, one code point each") {
	for (string bad : {"\xFF", "a\xC3", "\xC0\xAF", "\xED\xA0\x80", "\xF4\x90\x80\x80", "\x80x"}) {
		auto text = decode_utf8(bad);
		CHECK(text.length() <= bad.length());
		CHECK(encode_utf8(text) == bad);
	}
	auto text = decode_utf8("a\xFF" "b");
	REQUIRE(text.length() == 3);
	CHECK(is_byte_escape(text[1]));
	CHECK(!is_byte_escape(text[0]));
}

CASE("LengthConstraint") {
	LengthConstraint dflt;
	CHECK(dflt.min == 1);
	CHECK(!dflt.max);
	CHECK(!dflt.allows(0));
	CHECK(dflt.allows(1000000));
	CHECK(dflt.to_string() == "1..");

	auto five = LengthConstraint::exactly(5);
	CHECK(five.is_exact());
	CHECK(five.allows(5));
	CHECK(!five.allows(4));
	CHECK(!five.allows(6));
	CHECK(five.to_string() == "5");

	LengthConstraint opt{0, 1};
	CHECK(opt.allows(0));
	CHECK(!opt.is_exact());
	CHECK(opt.to_string() == "0..1");
}
