#ifndef _MATCHA_HPP_
#define _MATCHA_HPP_
/*****************************************************************************
  Matcha: human-readable patterns, as an alternative to regexes

    [type:range:length] tokens, mixed with literal chars, e.g.:

      match("[anum::]@[anum::].[str::>=2<=4]", "example@mail.com") // true
      find("[str:A-Z:>=3]", "Hello WORLD today")                  // "WORLD"
      find_all("[dec::]", "abc123def456")                          // {"123", "456"}

    type:   str, anum, hex, oct, dec, bin, or x (any char)
    range:  empty (type default), chars & ranges (A-Z|a-z), !negated,
            or `literal`|`alternatives`
    length: empty (1 or more), N (exactly), >=N, <=N, >N, <N, combined

  NOTE:

  - Texts and patterns are UTF-8, but matched as code points: lengths,
    ranges and Match offsets all count code points, not bytes.

  - Backtracking is naive: adjacent variable-length tokens can get
    exponentially slow on unlucky texts.
 *****************************************************************************/

#include "base.hpp"
#include "utf8.hpp"
#include "errors.hpp"
#include "tokens.hpp"
#include "lexer.hpp"
#include "parser.hpp"
#include "matcher.hpp"
#include "pattern.hpp"

#endif // _MATCHA_HPP_
