#ifndef _MATCHA_PARSER_HPP_
#define _MATCHA_PARSER_HPP_

#include "lexer.hpp"

#include <variant>
#include <vector>

namespace Matcha {

//---------------------------------------------------------------------------
// AST nodes...
//---------------------------------------------------------------------------
	struct LiteralNode
	{
		char32_t value;

		bool operator==(const LiteralNode&) const = default;
	};

	struct PatternNode
	{
		PatternMode mode = PatternMode::WILDCARD;
		CharSet char_set;                 // CHARSET only
		bool negated = false;             // CHARSET only (ignored for ALTERNATIVES)
		std::vector<Text> alternatives;   // ALTERNATIVES only, in declared order
		size_t min = 1;
		std::optional<size_t> max;        // unbounded if none

		// Single-char membership test for the CHARSET and WILDCARD modes
		bool accepts(char32_t c) const {
			assert(mode != PatternMode::ALTERNATIVES);
			if (mode == PatternMode::WILDCARD) return true;
			return char_set.contains(c) != negated;
		}

		bool operator==(const PatternNode&) const = default;
	};

	using Node = std::variant<LiteralNode, PatternNode>;

	// The compiled pattern: a flat sequence of nodes, matched in order.
	using Ast = std::vector<Node>;

	string node_to_string(const Node& node);
	void dump(const Ast& ast);


//---------------------------------------------------------------------------
class Parser
//---------------------------------------------------------------------------
// Pulls the tokens from a Lexer, and maps each of them to one AST node.
// LexErrors are propagated as-is.
{
public:
	explicit Parser(string_view pattern): lexer(pattern) {}

	Parser(const Parser&) = delete;
	Parser& operator=(const Parser&) = delete;

	Ast parse();

	static Node to_node(const Token& token);

private:
	Lexer lexer;
};

} // namespace Matcha

#endif // _MATCHA_PARSER_HPP_
