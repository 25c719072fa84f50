#pragma once

#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "types.hpp"
#include "errors.hpp"
#include "program.hpp"

namespace Tokenizer {
    struct ScanState {
        bool in_quotes = false; // keywords are not tokenized inside strings...
        bool in_remark = false; // ...nor anywhere after a REM
    };

    struct ScanResult {
        u8 byte;
        std::string_view rest;
        ScanState state;
    };

    // One step: encodes the start of `text` (must not be empty) as one byte.
    // Tries, in order: petcat control codes, shift/C= codes, BASIC keywords
    // (unless in quotes or after REM), then a single UTF-8 character whose
    // code point is the byte. Text that check_characters() rejects falls back
    // to one raw byte.
    ScanResult scan(std::string_view text, ScanState state);

    // Every character of every raw listing line must have a single-byte code
    // (U+0000..U+00FF). Stops at the first one that doesn't.
    bool check_characters(std::span<const std::string> listing, ListingError &err);

    // All of `text`, terminating 0 included
    std::vector<u8> tokenize_line(std::string_view text);

    EncodedLine encode(const CanonicalLine &line);

    std::vector<EncodedLine> encode_listing(std::span<const CanonicalLine> lines);
}
