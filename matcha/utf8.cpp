#include "utf8.hpp"

namespace Matcha {

namespace {

	bool is_cont(unsigned char b) { return (b & 0xC0) == 0x80; }

	// Length of the valid sequence starting at bytes[i], or 0 if invalid
	// (bad lead byte, truncated, overlong, surrogate or > U+10FFFF).
	size_t valid_sequence_length(string_view bytes, size_t i)
	{
		auto at = [&](size_t k) { return (unsigned char)bytes[i + k]; };
		auto avail = bytes.length() - i;
		auto b0 = at(0);

		if (b0 < 0x80) return 1;
		if (b0 >= 0xC2 && b0 <= 0xDF) {
			return avail >= 2 && is_cont(at(1)) ? 2 : 0;
		}
		if (b0 >= 0xE0 && b0 <= 0xEF) {
			if (avail < 3 || !is_cont(at(1)) || !is_cont(at(2))) return 0;
			if (b0 == 0xE0 && at(1) < 0xA0) return 0; // overlong
			if (b0 == 0xED && at(1) > 0x9F) return 0; // surrogate
			return 3;
		}
		if (b0 >= 0xF0 && b0 <= 0xF4) {
			if (avail < 4 || !is_cont(at(1)) || !is_cont(at(2)) || !is_cont(at(3))) return 0;
			if (b0 == 0xF0 && at(1) < 0x90) return 0; // overlong
			if (b0 == 0xF4 && at(1) > 0x8F) return 0; // > U+10FFFF
			return 4;
		}
		return 0;
	}

} // namespace


Text decode_utf8(string_view bytes)
{
	Text result;
	result.reserve(bytes.length());

	for (size_t i = 0; i < bytes.length(); ) {
		auto b0 = (unsigned char)bytes[i];
		switch (valid_sequence_length(bytes, i)) {
		case 1:
			result += char32_t(b0);
			i += 1;
			break;
		case 2:
			result += char32_t((b0 & 0x1F) << 6 | (bytes[i+1] & 0x3F));
			i += 2;
			break;
		case 3:
			result += char32_t((b0 & 0x0F) << 12 | (bytes[i+1] & 0x3F) << 6 | (bytes[i+2] & 0x3F));
			i += 3;
			break;
		case 4:
			result += char32_t((b0 & 0x07) << 18 | (bytes[i+1] & 0x3F) << 12
			                 | (bytes[i+2] & 0x3F) << 6 | (bytes[i+3] & 0x3F));
			i += 4;
			break;
		default: // Invalid: keep the byte itself
			result += char32_t(BYTE_ESCAPE_BASE + b0);
			i += 1;
			break;
		}
	}
	return result;
}

void append_utf8(string& out, char32_t c)
{
	if (c < 0x80) {
		out += char(c);
	} else if (c < 0x800) {
		out += char(0xC0 | (c >> 6));
		out += char(0x80 | (c & 0x3F));
	} else if (is_byte_escape(c)) {
		out += char(c - BYTE_ESCAPE_BASE);
	} else if (c < 0x10000) {
		out += char(0xE0 | (c >> 12));
		out += char(0x80 | ((c >> 6) & 0x3F));
		out += char(0x80 | (c & 0x3F));
	} else {
		assert(c <= 0x10FFFF);
		out += char(0xF0 | (c >> 18));
		out += char(0x80 | ((c >> 12) & 0x3F));
		out += char(0x80 | ((c >> 6) & 0x3F));
		out += char(0x80 | (c & 0x3F));
	}
}

string encode_utf8(TextView text)
{
	string result;
	result.reserve(text.length());
	for (auto c : text) append_utf8(result, c);
	return result;
}

} // namespace Matcha
