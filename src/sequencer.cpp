#include "sequencer.hpp"

#include <charconv>

#include "strings.hpp"

bool Sequencer::split_line_num(std::string_view line, SplitLine &out) {
    const std::size_t line_length = line.length();
    skip_spaces(line);

    std::size_t length = 0;
    while (length < line.length() && is_digit(line[length])) length += 1;

    out.number_column = line_length - line.length();
    if (length == 0) return false;

    auto text = substring(line, length);
    skip_spaces(text);
    trim_end(text);

    out.digits = substring(line, 0, length);
    out.text = text;
    return true;
}

bool Sequencer::parse_line_number(std::string_view digits, u16 &out) {
    u32 value{};
    auto result = std::from_chars(digits.data(), digits.data() + digits.length(), value);

    if (result.ec == std::errc::invalid_argument || result.ec == std::errc::result_out_of_range) {
        return false;
    }
    if (value > 0xFFFF) return false;

    out = u16(value);
    return true;
}

// Single pass shared by both entry points; `out` may be null when only checking
static bool sequence_pass(std::span<const std::string> listing, std::vector<SourceLine> *out, ListingError &err) {
    using namespace Sequencer;

    // A listing may not start at line 0: the first number is compared against 0 as well
    u32 previous = 0;

    for (std::size_t i = 0; i < listing.size(); ++i) {
        auto split = SplitLine{};
        if (!split_line_num(listing[i], split)) {
            err = ListingError {
                .kind = ErrorKind::MISSING_LINE_NUMBER,
                .line_number = previous,
                .listing_index = i,
                .column = split.number_column,
            };
            return false;
        }

        u16 number{};
        if (!parse_line_number(split.digits, number)) {
            err = ListingError {
                .kind = ErrorKind::LINE_NUMBER_RANGE,
                .line_number = previous,
                .listing_index = i,
                .column = split.number_column,
                .detail = std::string{ split.digits },
            };
            return false;
        }

        if (!(previous < number)) {
            err = ListingError {
                .kind = ErrorKind::SEQUENCE,
                .line_number = previous,
                .offending_number = number,
                .listing_index = i,
                .column = split.number_column,
            };
            return false;
        }

        previous = number;

        if (out) {
            out->push_back(SourceLine {
                .number = number,
                .text = std::string{ split.text },
            });
        }
    }

    return true;
}

bool Sequencer::check_line_sequence(std::span<const std::string> listing, ListingError &err) {
    return sequence_pass(listing, nullptr, err);
}

bool Sequencer::split_listing(std::span<const std::string> listing, std::vector<SourceLine> &out, ListingError &err) {
    auto lines = std::vector<SourceLine>{};
    lines.reserve(listing.size());

    if (!sequence_pass(listing, &lines, err)) {
        return false;
    }

    out = std::move(lines);
    return true;
}
