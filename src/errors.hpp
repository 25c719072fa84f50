#pragma once

#include <string>

#include "types.hpp"

enum class ErrorKind : u8 {
    MISSING_LINE_NUMBER,
    SEQUENCE,
    LINE_NUMBER_RANGE, // does not fit the two-byte field of a line record
    BRACE,
    REPEAT_COUNT,      // {N "X"} with N past what a line can hold
    CHARACTER,         // not UTF-8, or no single-byte code
    PROGRAM_SIZE,      // image runs past $FFFF
    UNSUPPORTED_FORMAT,
};

// Every check that can abort a conversion fills one of these and returns false.
struct ListingError {
    static constexpr std::size_t NO_COLUMN = std::size_t(-1);
    static constexpr std::size_t NO_LINE = std::size_t(-1);

    ErrorKind kind;

    // The number shown to the user. For SEQUENCE this is the line *before*
    // the one that broke the order ("entry error after line N").
    u32 line_number = 0;
    u32 offending_number = 0;

    std::size_t listing_index = NO_LINE; // index into the raw listing
    std::size_t column = NO_COLUMN;      // offset into the raw line

    // The rejected text for LINE_NUMBER_RANGE, REPEAT_COUNT and UNSUPPORTED_FORMAT,
    // "U+xxxx" or "byte 0xNN" for CHARACTER
    std::string detail;
};

const char *error_kind_name(ErrorKind kind);

// First line of the user-facing message, wording kept from the magazine tools
std::string error_message(const ListingError &error);
