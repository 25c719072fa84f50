#pragma once

#include <span>
#include <string>

#include "types.hpp"
#include "errors.hpp"
#include "program.hpp"
#include "checksum.hpp"

namespace Converter {
    struct Settings {
        u16 load_address;
        SourceVariant variant;
    };

    // Listing (see to_listing()) -> tokenized lines, checksums and .prg image.
    // Every check runs over the whole listing before anything is encoded;
    // on the first failure `err` is filled in and `out` is left alone.
    bool convert(std::span<const std::string> listing, const Settings &settings, Program &out, ListingError &err);
}
