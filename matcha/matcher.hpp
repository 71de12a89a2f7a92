#ifndef _MATCHA_MATCHER_HPP_
#define _MATCHA_MATCHER_HPP_

#include "parser.hpp"

#include <vector>

namespace Matcha {

	// A successful search result: text[start, end), in code points, with the
	// matched part UTF-8 encoded in `value`
	struct Match
	{
		size_t start = 0;
		size_t end = 0;
		string value;

		size_t length() const { return end - start; }

		bool operator==(const Match&) const = default;
	};


//---------------------------------------------------------------------------
class Matcher
//---------------------------------------------------------------------------
// One matcher per call: it only refers to the (shared, immutable) AST, and
// has its own decoded copy of the text, so any number of them can run on
// the same AST concurrently.
// Positions are code point offsets in the decoded text.
// Matching never throws; failing to match is just a `false` result.
{
public:
	//-------------------------------------------------------------------
	// Matcher state...

	// Input:
	const Ast& ast;
	const Text text;
	const size_t text_length;

	// Mode: only an AST match that ends at the end of the text counts
	bool to_end;

	// Diagnostics (reset by each of the public match ops):
	size_t depth;         // current recursion level in match_at()
	size_t depth_reached;
	size_t nodes_tried;
	size_t runs_scanned;  // greedy char set/wildcard runs measured

	//-------------------------------------------------------------------
	Matcher(const Ast& ast, string_view utf8_text):
		// Sync with _reset_counters()!
		ast(ast),
		text(decode_utf8(utf8_text)),
		text_length(text.length()),
		to_end(false),
		depth(0),
		depth_reached(0),
		nodes_tried(0),
		runs_scanned(0)
	{}

	Matcher(const Matcher&) = delete;
	Matcher& operator=(const Matcher&) = delete;

	//-------------------------------------------------------------------
	// The whole text must be consumed by the whole AST.
	bool match_full();

	// First match at the lowest start offset (0 to text_length, inclusive).
	bool find_first(OUT Match& found);

	// All the non-overlapping matches, left to right.
	std::vector<Match> find_all();

	//-------------------------------------------------------------------
	bool match_at(size_t pos, size_t node_index, OUT size_t& end);
	// pos is the text position
	// node_index is the first AST node still to match
	// On success, `end` is where the match of the rest of the AST ended
	// (always text_length in `to_end` mode).
	//-------------------------------------------------------------------

private:
	void _reset_counters()
	{
		depth = 0;
		depth_reached = 0;
		nodes_tried = 0;
		runs_scanned = 0;
	}

	Match _make_match(size_t start, size_t end) const {
		return {start, end, encode_utf8(TextView(text).substr(start, end - start))};
	}

	bool _match_literal(size_t pos, size_t node_index, const LiteralNode& node, OUT size_t& end);
	bool _match_alternatives(size_t pos, size_t node_index, const PatternNode& node, OUT size_t& end);
	bool _match_run(size_t pos, size_t node_index, const PatternNode& node, OUT size_t& end);

	size_t _run_length(size_t pos, const PatternNode& node);
};

} // namespace Matcha

#endif // _MATCHA_MATCHER_HPP_
