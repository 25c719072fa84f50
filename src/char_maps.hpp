#pragma once

#include <span>
#include <string_view>

#include "types.hpp"

#include "tsl/robin_map.h"

struct CharToken {
    std::string_view text; // lower-case, as it appears in a normalized line
    u8 value;
};

// Byte values the scanner and the checksums care about
constexpr u8 SPACE_CHAR = 32;
constexpr u8 QUOTE_CHAR = 34;
constexpr u8 REM_TOKEN = 143;

// Scanner tables. Tried in this order; first match wins, so longer keywords
// are listed before any shorter keyword they start with.

// Control codes in petcat notation: {wht}, {down}, {f1}, ...
std::span<const CharToken> petcat_tokens();

// Shifted and Commodore-key graphics: {s a}, {c g}, {s ep}, {pi}, ...
std::span<const CharToken> shift_commodore_tokens();

// Commodore BASIC V2 keywords, ROM order (END = 128 ... GO = 203)
std::span<const CharToken> basic_v2_tokens();

// Ahoy! magazine notation -> petcat notation. Keys are upper-case and include
// the braces ("{WH}", "{CLEAR}"); values are lower-case ("{wht}", "{clr}").
using CodeMap = tsl::robin_map<std::string_view, std::string_view>;
const CodeMap &ahoy_to_petcat();
