#include "diagnostics.hpp"

#include <cstdio>
#include <cstdarg>

Diagnostic &Diagnostic::printf(const char *format...) {
    if (line_idx != ListingError::NO_LINE && !file_name.empty()) {
        std::printf("%.*s:%lu:\n", (int)file_name.length(), file_name.data(), (unsigned long)(line_idx + 1));
    }

    va_list args;
    va_start(args, format);
    std::vprintf(format, args);
    va_end(args);
    std::printf("\n");

    if (line_idx < listing.size()) print_excerpt();
    return *this;
}

Diagnostic &Diagnostic::extra(const char *format...) {
    va_list args;
    va_start(args, format);
    std::vprintf(format, args);
    va_end(args);
    std::putchar('\n');
    return *this;
}

void Diagnostic::print_excerpt() const {
    const std::string &line_str = listing[line_idx];

    auto underline = std::string{};
    if (line_len > 0) {
        underline.assign(line_start, ' ');
        underline.append(line_len, '~');

        i32 caret_pos = line_len == 1 ? i32(line_start) : caret;
        if (caret_pos != NO_CARET && std::size_t(caret_pos) < underline.size()) {
            underline[caret_pos] = '^';
        }
        underline += ' ';
    }

    std::printf(
        "     |     \n"
        "%4lu | %s\n"
        "     | %s",
        (unsigned long)(line_idx + 1), line_str.c_str(),
        underline.c_str()
    );
    if (!hint.empty()) {
        std::printf("(%.*s)", (int)hint.length(), hint.data());
    }
    std::printf("\n\n");
}

void report_error(const ListingError &error, std::string_view file_name, std::span<const std::string> listing) {
    auto msg = Diagnostic(file_name, listing).at_line(error.listing_index);

    if (error.column != ListingError::NO_COLUMN) {
        // A number is underlined in full, everything else by one character
        const bool is_number = error.kind == ErrorKind::LINE_NUMBER_RANGE || error.kind == ErrorKind::REPEAT_COUNT;
        const std::size_t len = is_number ? error.detail.length() : 1;
        msg.underline_start(error.column).underline_len(len).with_caret(i32(error.column));
    }

    switch (error.kind) {
        case ErrorKind::MISSING_LINE_NUMBER:
            msg.with_hint("Line number missing here");
            break;
        case ErrorKind::SEQUENCE:
            msg.with_hint("Should be greater than the line before");
            break;
        case ErrorKind::LINE_NUMBER_RANGE:
            msg.with_hint("Does not fit in two bytes");
            break;
        case ErrorKind::BRACE:
            msg.with_hint("No matching brace/bracket");
            break;
        case ErrorKind::REPEAT_COUNT:
            msg.with_hint("At most 255");
            break;
        case ErrorKind::CHARACTER:
            msg.with_hint("No single-byte code");
            break;
        default:
            break;
    }

    msg.printf("%s", error_message(error).c_str());

    if (error.kind == ErrorKind::SEQUENCE) {
        msg.extra("Line %u comes after line %u.\n", error.offending_number, error.line_number);
    }
}
