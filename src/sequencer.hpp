#pragma once

#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "types.hpp"
#include "errors.hpp"
#include "program.hpp"

namespace Sequencer {
    struct SplitLine {
        std::string_view digits; // the leading line number, as typed
        std::string_view text;   // rest of the line, whitespace trimmed
        std::size_t number_column; // where the number starts (or should have)
    };

    // "  20   goto10" -> { "20", "goto10" }. False if the line doesn't start with a digit.
    bool split_line_num(std::string_view line, SplitLine &out);

    // False if the number doesn't fit a line record (0-65535)
    bool parse_line_number(std::string_view digits, u16 &out);

    // One pass over the listing, stops at the first line that has no number
    // or whose number is not greater than the one before it.
    bool check_line_sequence(std::span<const std::string> listing, ListingError &err);

    // Same checks as check_line_sequence(); also splits every line into a SourceLine.
    // `out` is left untouched on failure.
    bool split_listing(std::span<const std::string> listing, std::vector<SourceLine> &out, ListingError &err);
}
