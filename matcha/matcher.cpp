#include "matcher.hpp"

namespace Matcha {

//---------------------------------------------------------------------------
bool Matcher::match_full()
{
	_reset_counters();
	to_end = true;
	size_t end;
	auto res = match_at(0, 0, end);
	to_end = false;
	assert(!res || end == text_length);
DBG("match_full(\"{}\"): {}", DBG_TRIM(encode_utf8(text)), res);
	return res;
}

bool Matcher::find_first(OUT Match& found)
{
	_reset_counters();
	for (size_t start = 0; start <= text_length; ++start) {
		if (size_t end; match_at(start, 0, end)) {
			found = _make_match(start, end);
DBG("find_first: FOUND \"{}\" at [{}, {})", DBG_TRIM(found.value), start, end);
			return true;
		}
	}
DBG("find_first: ---NOT--- FOUND in \"{}\"", DBG_TRIM(encode_utf8(text)));
	return false;
}

std::vector<Match> Matcher::find_all()
{
	_reset_counters();
	std::vector<Match> results;
DBG_("find_all: in \"{}\":", DBG_TRIM(encode_utf8(text)));
	for (size_t cursor = 0; cursor <= text_length; ) {
		if (size_t end; match_at(cursor, 0, end)) {
			results.push_back(_make_match(cursor, end));
_DBG_(" [{}, {})", cursor, end);
			// Move past it; an empty match must still make progress!
			cursor = end > cursor ? end : cursor + 1;
		} else {
			++cursor;
		}
	}
_DBG(" -- {} match(es)", results.size());
	return results;
}


//---------------------------------------------------------------------------
bool Matcher::match_at(size_t pos, size_t node_index, OUT size_t& end)
{
	assert(pos <= text_length);

	if (node_index >= ast.size()) { // All nodes matched
		if (to_end && pos != text_length) return false; // ...but not all the text
		end = pos;
		return true;
	}

	++nodes_tried;
	++depth;
	if (depth_reached < depth)
	    depth_reached = depth;

	const Node& node = ast[node_index];
	bool res;
	if (auto lit = std::get_if<LiteralNode>(&node)) {
		res = _match_literal(pos, node_index, *lit, end);
	} else {
		auto& pattern = std::get<PatternNode>(node);
		res = pattern.mode == PatternMode::ALTERNATIVES
			? _match_alternatives(pos, node_index, pattern, end)
			: _match_run(pos, node_index, pattern, end);
	}

	--depth;
	return res;
}


//---------------------------------------------------------------------------
bool Matcher::_match_literal(size_t pos, size_t node_index, const LiteralNode& node, OUT size_t& end)
{
	if (pos >= text_length || text[pos] != node.value) return false;
	return match_at(pos + 1, node_index + 1, end);
}

bool Matcher::_match_alternatives(size_t pos, size_t node_index, const PatternNode& node, OUT size_t& end)
// The first alternative (in declared order) that lets the rest of the AST
// match wins -- not just the first one that fits the text here!
{
	auto rest = TextView(text).substr(pos);
	for (auto& alt : node.alternatives) {
		if (rest.starts_with(alt) && match_at(pos + alt.length(), node_index + 1, end)) {
			return true;
		}
	}
	return false;
}

bool Matcher::_match_run(size_t pos, size_t node_index, const PatternNode& node, OUT size_t& end)
// Greedy, with backtracking: try the longest acceptable run first, then
// shorter ones, down to node.min (so 0, too, if allowed).
{
	auto run = _run_length(pos, node);
	if (run < node.min) return false;

	for (size_t len = run + 1; len-- > node.min; ) {
		assert(!node.max || len <= *node.max);
		if (match_at(pos + len, node_index + 1, end)) {
			return true;
		}
	}
	return false;
}

size_t Matcher::_run_length(size_t pos, const PatternNode& node)
// Number of consecutive chars accepted by `node` from `pos`, capped at node.max
{
	++runs_scanned;

	size_t limit = text_length - pos;
	if (node.max && *node.max < limit) limit = *node.max;

	size_t len = 0;
	while (len < limit && node.accepts(text[pos + len])) ++len;
	return len;
}

} // namespace Matcha
