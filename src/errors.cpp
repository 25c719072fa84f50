#include "errors.hpp"


const char *error_kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::MISSING_LINE_NUMBER: return "MissingLineNumberError";
        case ErrorKind::SEQUENCE: return "SequenceError";
        case ErrorKind::LINE_NUMBER_RANGE: return "LineNumberRangeError";
        case ErrorKind::BRACE: return "BraceError";
        case ErrorKind::REPEAT_COUNT: return "RepeatCountError";
        case ErrorKind::CHARACTER: return "CharacterError";
        case ErrorKind::PROGRAM_SIZE: return "ProgramSizeError";
        case ErrorKind::UNSUPPORTED_FORMAT: return "UnsupportedFormatError";
        default: return "{unknown}";
    }
}

std::string error_message(const ListingError &error) {
    const auto line = std::to_string(error.line_number);

    switch (error.kind) {
        case ErrorKind::MISSING_LINE_NUMBER:
            return "Entry error after line " + line + " - each line should start with a line number.  Exiting.";

        case ErrorKind::SEQUENCE:
            return "Entry error after line " + line + " - lines should be in sequential order.  Exiting.";

        case ErrorKind::LINE_NUMBER_RANGE:
            return "Line number " + error.detail + " is out of range (0-65535).  Exiting.";

        case ErrorKind::BRACE:
            return "Loose brace/bracket error in line: " + line + "\n"
                "Special characters should be enclosed in braces/brackets.\n"
                "Please check for unmatched single brace/bracket in above line.";

        case ErrorKind::REPEAT_COUNT:
            return "Repeat count " + error.detail + " in line " + line + " is out of range (0-255).  Exiting.";

        case ErrorKind::CHARACTER:
            return "Unsupported character (" + error.detail + ") in line " + line
                + " - listings are UTF-8 text with characters up to U+00FF.  Exiting.";

        case ErrorKind::PROGRAM_SIZE:
            return "Program does not fit in memory, line " + line + " ends past $FFFF.  Exiting.";

        case ErrorKind::UNSUPPORTED_FORMAT:
            return "invalid choice: '" + error.detail + "'\n"
                "Magazine format not yet supported - choose from 'ahoy1', 'ahoy2', 'ahoy3'.";
    }
    return "Unknown error";
}
