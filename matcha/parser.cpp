#include "parser.hpp"

#include <iostream>

namespace Matcha {

//---------------------------------------------------------------------------
Ast Parser::parse()
{
	Ast ast;
	for (Token token; lexer.next(token); ) {
		ast.push_back(to_node(token));
	}
DBG("Parser: {} nodes", ast.size());
	return ast;
}

Node Parser::to_node(const Token& token)
{
	if (token.is_literal()) {
		return LiteralNode{token.literal};
	}

	assert(token.is_pattern());
	PatternNode node;
	node.mode = token.mode;
	node.negated = token.negated;
	node.min = token.length.min;
	node.max = token.length.max;
	switch (token.mode) {
	case PatternMode::CHARSET:      node.char_set = token.char_set; break;
	case PatternMode::ALTERNATIVES: node.alternatives = token.alternatives; break;
	case PatternMode::WILDCARD:     break;
	}
	return node;
}


//---------------------------------------------------------------------------
string node_to_string(const Node& node)
{
	if (auto lit = std::get_if<LiteralNode>(&node)) {
		return std::format("Literal '{}'", to_utf8(lit->value));
	}

	auto& p = std::get<PatternNode>(node);
	auto len = p.max ? std::format("{}-{}", p.min, *p.max)
	                 : std::format("{}-inf", p.min);
	switch (p.mode) {
	case PatternMode::WILDCARD:
		return std::format("Pattern(any, len={})", len);
	case PatternMode::ALTERNATIVES: {
		string alts;
		for (auto& a : p.alternatives) alts += std::format("{}`{}`", alts.empty() ? "" : "|", encode_utf8(a));
		return std::format("Pattern(literals={}, len={})", alts, len);
	}
	case PatternMode::CHARSET:
		return std::format("Pattern(chars={}\"{}\", len={})", p.negated ? "!" : "", p.char_set.to_string(), len);
	default:
		return "!!BUG: MISSING NAME FOR PatternMode!!";
	}
}

void dump(const Ast& ast)
{
	std::cerr << "/------------------------------------------------------------------\\\n";
	for (size_t i = 0; i < ast.size(); ++i) {
		std::cerr << std::format("     [{}] {}\n", i, node_to_string(ast[i]));
	}
	std::cerr << "\\------------------------------------------------------------------/\n";
}

} // namespace Matcha
