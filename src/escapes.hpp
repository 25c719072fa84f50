#pragma once

#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "types.hpp"
#include "errors.hpp"
#include "program.hpp"

// Magazine escape codes. Ahoy! printed special characters as {WH}, [CLEAR],
// and runs of them as {4"{CD}"} / [4" "]. These passes check that every
// brace has a partner and rewrite the codes to the petcat form the
// tokenizer knows.
namespace Escapes {
    struct Span {
        std::size_t start;
        std::size_t length;

        bool is_repeat;
        u32 count;                // repeat spans only
        std::string_view payload; // repeat spans only, text between the quotes
    };

    // Brackets and braces were used interchangeably over the years
    std::string brackets_to_braces(std::string_view text);

    // Expects brace form. Left to right, non-overlapping, shortest match:
    //   {<digits>[space]"<payload>"}   repeat span
    //   {<text>}                       simple span
    std::vector<Span> find_spans(std::string_view text);

    // Any '{' or '}' outside of `spans` has no partner. False if there is one,
    // with its offset in `column`.
    bool find_loose_brace(std::string_view text, std::span<const Span> spans, std::size_t &column);

    // Rewrites the codes in one line of text. Loose braces are left in place as
    // literal text. Throws std::invalid_argument for a repeat count that
    // check_escapes() rejects.
    std::string normalize(std::string_view text);

    // A tokenized line can't hold more than this many bytes
    constexpr u32 MAX_REPEAT_COUNT = 255;

    // Checks every raw listing line for loose braces and for repeat counts over
    // MAX_REPEAT_COUNT, stops at the first bad one.
    // Runs after the line sequence check, the error names the line's number.
    bool check_escapes(std::span<const std::string> listing, ListingError &err);

    // normalize() every line; check_escapes() is expected to have passed
    std::vector<CanonicalLine> normalize_listing(std::span<const SourceLine> lines);
}
