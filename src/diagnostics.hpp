#pragma once

#include <span>
#include <string>
#include <string_view>

#include "types.hpp"
#include "errors.hpp"

// Console error reporting. Prints the location, the message and, when the
// offending listing line is known, the line itself with an underline:
//
//   listing.txt:2:
//   Loose brace/bracket error in line: 20
//   ...
//        |
//      2 | 20 {goto10
//        |    ^ (No matching brace/bracket)
class Diagnostic {
public:
    static constexpr i32 NO_CARET = -1;

    Diagnostic(std::string_view file_name, std::span<const std::string> listing)
        : file_name(file_name), listing(listing) {}

    Diagnostic &at_line(std::size_t listing_index) { this->line_idx = listing_index; return *this; }

    Diagnostic &with_caret(i32 pos) { this->caret = pos; return *this; }

    Diagnostic &with_hint(std::string_view hint) { this->hint = hint; return *this; }

    Diagnostic &underline_start(std::size_t idx) { this->line_start = idx; return *this; }
    Diagnostic &underline_len(std::size_t len) { this->line_len = len; return *this; }

    Diagnostic &printf(const char *format...);
    Diagnostic &extra(const char *format...);

private:
    void print_excerpt() const;

    std::string_view file_name;
    std::span<const std::string> listing;

    std::size_t line_idx = ListingError::NO_LINE;
    std::string_view hint = "";
    i32 caret = NO_CARET;
    std::size_t line_start = 0;
    std::size_t line_len = 0;
};

// Prints `error` the way the command line tool shows it
void report_error(const ListingError &error, std::string_view file_name, std::span<const std::string> listing);
