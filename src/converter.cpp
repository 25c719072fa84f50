#include "converter.hpp"

#include <utility>

#include "sequencer.hpp"
#include "escapes.hpp"
#include "tokenizer.hpp"
#include "assembler.hpp"

bool Converter::convert(std::span<const std::string> listing, const Settings &settings, Program &out, ListingError &err) {
    auto source_lines = std::vector<SourceLine>{};
    if (!Sequencer::split_listing(listing, source_lines, err)) {
        return false;
    }

    if (!Escapes::check_escapes(listing, err)) {
        return false;
    }

    if (!Tokenizer::check_characters(listing, err)) {
        return false;
    }

    const auto canonical = Escapes::normalize_listing(source_lines);
    auto lines = Tokenizer::encode_listing(canonical);

    if (!Assembler::check_size(lines, settings.load_address, err)) {
        return false;
    }

    // Checksums and the image both only read the encoded lines
    auto checksums = Checksum::listing_checksums(settings.variant, lines);
    auto image = Assembler::assemble(lines, settings.load_address);

    out.lines = std::move(lines);
    out.checksums = std::move(checksums);
    out.load_address = settings.load_address;
    out.image = std::move(image);

    return true;
}
