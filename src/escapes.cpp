#include "escapes.hpp"

#include <charconv>
#include <stdexcept>
#include <utility>

#include "char_maps.hpp"
#include "sequencer.hpp"
#include "strings.hpp"

std::string Escapes::brackets_to_braces(std::string_view text) {
    auto out = std::string{ text };
    for (char &c : out) {
        if (c == '[') c = '{';
        else if (c == ']') c = '}';
    }
    return out;
}

// {4"{cd}"} or {12 " "}. The first payload character may be anything (even a
// brace, that's how a code gets repeated), the rest may not contain '{'.
static bool match_repeat(std::string_view line, std::size_t pos, Escapes::Span &out) {
    const std::size_t n = line.length();
    std::size_t i = pos + 1;

    const std::size_t digits_start = i;
    while (i < n && is_digit(line[i])) i += 1;
    if (i == digits_start) return false;

    // Too many digits for a u32 is still a repeat span, check_escapes() rejects the count
    u32 count{};
    auto result = std::from_chars(line.data() + digits_start, line.data() + i, count);
    if (result.ec == std::errc::result_out_of_range) count = u32(-1);
    else if (result.ec != std::errc{}) return false;

    if (i < n && is_space(line[i])) i += 1;
    if (i >= n || line[i] != '"') return false;

    const std::size_t quote = i;
    if (quote + 1 >= n) return false;

    for (i = quote + 2; i < n; ++i) {
        if (line[i] == '"' && i + 1 < n && line[i + 1] == '}') {
            // Payload ends at the first quote after its first character
            std::size_t payload_end = quote + 2;
            while (line[payload_end] != '"') payload_end += 1;

            out = Escapes::Span {
                .start = pos,
                .length = i + 2 - pos,
                .is_repeat = true,
                .count = count,
                .payload = substring(line, quote + 1, payload_end),
            };
            return true;
        }
        if (line[i] == '{') return false;
    }
    return false;
}

static bool match_simple(std::string_view line, std::size_t pos, Escapes::Span &out) {
    const std::size_t n = line.length();
    if (pos + 1 >= n) return false;

    for (std::size_t i = pos + 2; i < n; ++i) {
        if (line[i] == '}') {
            out = Escapes::Span {
                .start = pos,
                .length = i + 1 - pos,
                .is_repeat = false,
                .count = 1,
                .payload = {},
            };
            return true;
        }
        if (line[i] == '{') return false;
    }
    return false;
}

std::vector<Escapes::Span> Escapes::find_spans(std::string_view text) {
    auto spans = std::vector<Span>{};

    std::size_t pos = 0;
    while (pos < text.length()) {
        auto span = Span{};
        if (text[pos] == '{' && (match_repeat(text, pos, span) || match_simple(text, pos, span))) {
            spans.push_back(span);
            pos += span.length;
        } else {
            pos += 1;
        }
    }

    return spans;
}

bool Escapes::find_loose_brace(std::string_view text, std::span<const Span> spans, std::size_t &column) {
    std::size_t pos = 0;
    auto next_span = spans.begin();

    while (pos < text.length()) {
        if (next_span != spans.end() && pos == next_span->start) {
            pos += next_span->length;
            ++next_span;
            continue;
        }

        if (text[pos] == '{' || text[pos] == '}') {
            column = pos;
            return true;
        }
        pos += 1;
    }
    return false;
}

static void append_replacement(std::string &out, std::string_view span_text, const Escapes::Span &span) {
    const auto &codes = ahoy_to_petcat();

    const auto key = ascii_upper(span_text);
    if (auto it = codes.find(key); it != codes.end()) {
        out += it->second;
        return;
    }

    if (!span.is_repeat) {
        // Not an Ahoy code; either already petcat form or something the
        // tokenizer will spell out character by character
        out += span_text;
        return;
    }

    if (span.count > Escapes::MAX_REPEAT_COUNT) {
        throw std::invalid_argument("repeat count out of range, check_escapes() not run");
    }

    // {N "X"}: X is a code repeated N times, or otherwise plain text repeated N times.
    // Plain text is copied as is, braces included: {2 "{"} gives {{.
    std::string_view repeated = span.payload;
    const auto payload_key = ascii_upper(span.payload);
    if (auto it = codes.find(payload_key); it != codes.end()) {
        repeated = it->second;
    }

    for (u32 i = 0; i < span.count; ++i) out += repeated;
}

std::string Escapes::normalize(std::string_view text) {
    const auto line = brackets_to_braces(text);
    const auto spans = find_spans(line);

    if (spans.empty()) return line;

    auto out = std::string{};
    out.reserve(line.size());

    std::size_t pos = 0;
    for (const auto &span : spans) {
        out.append(line, pos, span.start - pos);
        append_replacement(out, substring(line, span.start, span.start + span.length), span);
        pos = span.start + span.length;
    }
    out.append(line, pos);

    return out;
}

bool Escapes::check_escapes(std::span<const std::string> listing, ListingError &err) {
    for (std::size_t i = 0; i < listing.size(); ++i) {
        const auto line = brackets_to_braces(listing[i]);
        const auto spans = find_spans(line);

        auto fail = [&](ErrorKind kind, std::size_t column, std::string detail) {
            u16 number = 0;
            auto split = Sequencer::SplitLine{};
            if (!Sequencer::split_line_num(line, split) || !Sequencer::parse_line_number(split.digits, number)) {
                number = 0; // only without a prior sequence check
            }

            err = ListingError {
                .kind = kind,
                .line_number = number,
                .offending_number = number,
                .listing_index = i,
                .column = column,
                .detail = std::move(detail),
            };
            return false;
        };

        std::size_t column{};
        if (find_loose_brace(line, spans, column)) {
            return fail(ErrorKind::BRACE, column, "");
        }

        for (const auto &span : spans) {
            if (!span.is_repeat || span.count <= MAX_REPEAT_COUNT) continue;

            // The digits right after the opening brace
            auto digits = substring(line, span.start + 1);
            std::size_t length = 0;
            while (length < digits.length() && is_digit(digits[length])) length += 1;

            return fail(ErrorKind::REPEAT_COUNT, span.start + 1, std::string{ substring(digits, 0, length) });
        }
    }

    return true;
}

std::vector<CanonicalLine> Escapes::normalize_listing(std::span<const SourceLine> lines) {
    auto out = std::vector<CanonicalLine>{};
    out.reserve(lines.size());

    for (const auto &line : lines) {
        out.push_back(CanonicalLine {
            .number = line.number,
            .text = normalize(line.text),
        });
    }

    return out;
}
