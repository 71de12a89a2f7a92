#include "../matcha/matcha.hpp"

//---------------------------------------------------------------------------
// Token stream -> AST
//---------------------------------------------------------------------------
#include "./fw/doctest-setup.hpp"

using namespace Matcha;

namespace {
	Ast parse(string_view pattern) {
		auto ast = Parser(pattern).parse();
#ifndef NDEBUG
		dump(ast);
#endif
		return ast;
	}

	const PatternNode& pattern_node(const Ast& ast, size_t i) {
		return std::get<PatternNode>(ast[i]);
	}
}

CASE("empty pattern: empty AST") {
	CHECK(parse("").empty());
}

CASE("one node per token, in pattern order") {
	auto ast = parse("ab[dec::2]\\[c");
	REQUIRE(ast.size() == 5);
	CHECK(std::get<LiteralNode>(ast[0]).value == 'a');
	CHECK(std::get<LiteralNode>(ast[1]).value == 'b');
	CHECK(std::holds_alternative<PatternNode>(ast[2]));
	CHECK(std::get<LiteralNode>(ast[3]).value == '[');
	CHECK(std::get<LiteralNode>(ast[4]).value == 'c');
}

CASE("literal-only pattern: literal nodes only") {
	auto ast = parse("hello, world!");
	CHECK(ast.size() == 13);
	for (auto& node : ast) {
		CHECK(std::holds_alternative<LiteralNode>(node));
	}
}

CASE("char set node") {
	auto ast = parse("[anum:!a-z:>=2<=4]");
	REQUIRE(ast.size() == 1);
	auto& n = pattern_node(ast, 0);
	CHECK(n.mode == PatternMode::CHARSET);
	CHECK(n.negated);
	CHECK(n.char_set.chars() == "abcdefghijklmnopqrstuvwxyz");
	CHECK(n.min == 2);
	CHECK(n.max == 4u);
	CHECK(n.alternatives.empty());
}

CASE("char set node: default set of the type") {
	auto& n = pattern_node(parse("[hex::]"), 0);
	CHECK(n.mode == PatternMode::CHARSET);
	CHECK(!n.negated);
	CHECK(n.char_set == default_char_set(CharType::HEX));
	CHECK(n.min == 1);
	CHECK(!n.max);
}

CASE("alternatives node") {
	auto& n = pattern_node(parse("[str:`cat`|`dog`:]"), 0);
	CHECK(n.mode == PatternMode::ALTERNATIVES);
	CHECK((n.alternatives == std::vector<Text>{U"cat", U"dog"}));
	CHECK(n.char_set.empty());
}

CASE("wildcard node") {
	auto& n = pattern_node(parse("[x:abc:3]"), 0);
	CHECK(n.mode == PatternMode::WILDCARD);
	CHECK(n.char_set.empty());
	CHECK(n.min == 3);
	CHECK(n.max == 3u);
}

CASE("accepts()") {
	auto ast = parse("[dec::][dec:!0-4:][x::]");
	CHECK(pattern_node(ast, 0).accepts('5'));
	CHECK(!pattern_node(ast, 0).accepts('a'));
	CHECK(!pattern_node(ast, 1).accepts('3'));
	CHECK(pattern_node(ast, 1).accepts('7'));
	CHECK(pattern_node(ast, 1).accepts('z'));
	CHECK(pattern_node(ast, 2).accepts(' '));
	CHECK(pattern_node(ast, 2).accepts('\n'));
	CHECK(pattern_node(ast, 2).accepts(U'€'));
}

CASE("to_node() of a hand-made token") {
	Token t;
	t.type = Token::PATTERN;
	t.char_type = CharType::BIN;
	t.mode = PatternMode::CHARSET;
	t.char_set = default_char_set(CharType::BIN);
	t.length = LengthConstraint::exactly(8);

	auto node = Parser::to_node(t);
	REQUIRE(std::holds_alternative<PatternNode>(node));
	auto& n = std::get<PatternNode>(node);
	CHECK(n.char_set.chars() == "01");
	CHECK(n.min == 8);
	CHECK(n.max == 8u);

	CHECK(std::get<LiteralNode>(Parser::to_node(Token::make_literal('q', 0))).value == 'q');
}

CASE("node_to_string()") {
	auto ast = parse("a[bin::>=2][str:`x`|`y`:][x::]");
	CHECK(node_to_string(ast[0]) == "Literal 'a'");
	CHECK(node_to_string(ast[1]) == "Pattern(chars=\"01\", len=2-inf)");
	CHECK(node_to_string(ast[2]) == "Pattern(literals=`x`|`y`, len=1-inf)");
	CHECK(node_to_string(ast[3]) == "Pattern(any, len=1-inf)");
}

CASE("same pattern, same AST") {
	auto p = "[anum::]@[anum::].[str::>=2<=4]";
	CHECK(parse(p) == parse(p));
	CHECK(Pattern(p) == Pattern::compile(p));
}

CASE("escaped and plain literals compile to the same AST") {
	CHECK(parse("abc") == parse("\\a\\b\\c"));
	CHECK(Pattern("abc") == Pattern("\\a\\b\\c"));
	CHECK(Pattern("abc").source() != Pattern("\\a\\b\\c").source());
}

CASE("different patterns, different ASTs") {
	CHECK(parse("[dec::3]") != parse("[dec::4]"));
	CHECK(parse("[str:`a`|`b`:]") != parse("[str:`b`|`a`:]"));
}

CASE("same set, spelled differently: same AST") {
	CHECK(parse("[dec::]") == parse("[dec:0-9:]"));
	CHECK(parse("[str:S|s:]") == parse("[str:sS:]"));
}

CASE("lex errors pass through the parser unchanged") {
	try {
		Parser("ab[str::").parse();
		FAIL("should have thrown");
	}
	catch(LexError& e)
	{
		CHECK(e.kind == LexError::UNCLOSED_BRACKET);
		CHECK(e.position == 2);
	}
}

CASE("Pattern accessors") {
	Pattern p("x[dec::]");
	p.DUMP();
	CHECK(p.source() == "x[dec::]");
	CHECK(p.size() == 2);
	CHECK(!p.empty());
	CHECK(p.ast().size() == 2);
	CHECK(Pattern("").empty());
}
