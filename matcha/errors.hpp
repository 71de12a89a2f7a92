#ifndef _MATCHA_ERRORS_HPP_
#define _MATCHA_ERRORS_HPP_

#include "base.hpp"

#include <stdexcept>

namespace Matcha {

	// Pattern compilation errors. Matching itself never throws.
	class LexError : public std::runtime_error
	{
	public:
		enum Kind {
			UNTERMINATED_ESCAPE,   // '\' as the last char of the pattern
			UNCLOSED_BRACKET,      // '[' without a ']'
			BAD_FORMAT,            // not exactly 3 fields in [type:range:length]
			INVALID_TYPE,
			BAD_LENGTH_CONSTRAINT, // bad operator, missing number, or no length possible
		};

		const Kind   kind;
		const size_t position; // Offset of the offending token in the pattern

		LexError(Kind kind, size_t position, const string& msg)
			: std::runtime_error(std::format("- ERROR: {} at position {}", msg, position)),
			  kind(kind),
			  position(position)
		{}

		const char* kind_name() const { return kind_to_cstr(kind); }

		static const char* kind_to_cstr(Kind k) {
			switch (k) {
			case UNTERMINATED_ESCAPE:   return "UnterminatedEscape";
			case UNCLOSED_BRACKET:      return "UnclosedBracket";
			case BAD_FORMAT:            return "BadFormat";
			case INVALID_TYPE:          return "InvalidType";
			case BAD_LENGTH_CONSTRAINT: return "BadLengthConstraint";
			default:
				return "!!BUG: MISSING NAME FOR LexError KIND!!";
			}
		}
	};

} // namespace Matcha

// Note: LEX_ERROR() below is _not_ a debug feature!
#if defined(MATCHA_CONFORMANT_PREPROCESSOR)
#  define LEX_ERROR(kind, pos, msg, ...) throw ::Matcha::LexError(::Matcha::LexError::kind, (pos), std::format(msg __VA_OPT__(,) __VA_ARGS__))
#elif defined(MATCHA_OLD_MSVC_PREPROCESSOR)
#  define LEX_ERROR(kind, pos, msg, ...) throw ::Matcha::LexError(::Matcha::LexError::kind, (pos), std::format(msg, __VA_ARGS__))
#else
#  error Unsupported compiler toolset (not MSVC or GCC/CLANG)!
#endif

#endif // _MATCHA_ERRORS_HPP_
