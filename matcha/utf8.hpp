#ifndef _MATCHA_UTF8_HPP_
#define _MATCHA_UTF8_HPP_
//---------------------------------------------------------------------------
// UTF-8 <-> code points
//
// Patterns and texts come in as UTF-8, but everything is matched on code
// points: char sets, lengths and Match offsets all count code points.
//
// Invalid input is never rejected: each byte that is not part of a valid
// UTF-8 sequence decodes to its own "escape" code point (U+DC80..U+DCFF,
// i.e. a lone low surrogate, which valid UTF-8 can't contain), and encodes
// back to the same raw byte. So decode + encode always gives back the input.
//---------------------------------------------------------------------------
#include "base.hpp"

#include <string>
#include <string_view>

namespace Matcha {

	using Text = std::u32string;          // Decoded: one element per code point
	using TextView = std::u32string_view;

	CONST BYTE_ESCAPE_BASE = char32_t(0xDC00);

	inline bool is_byte_escape(char32_t c) { return c >= BYTE_ESCAPE_BASE + 0x80 && c <= BYTE_ESCAPE_BASE + 0xFF; }

	Text decode_utf8(string_view bytes);

	void append_utf8(string& out, char32_t c);
	string encode_utf8(TextView text);
	inline string to_utf8(char32_t c) { string s; append_utf8(s, c); return s; }

} // namespace Matcha

#endif // _MATCHA_UTF8_HPP_
