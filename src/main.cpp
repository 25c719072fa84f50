#include <string_view>
#include <iostream>
#include <string>
#include <cstring>
#include <vector>

#include "types.hpp"
#include "converter.hpp"
#include "diagnostics.hpp"
#include "listing.hpp"
#include "options.hpp"
#include "output.hpp"

// "dir/game.v2.txt" -> "dir/game"
static std::string output_stem(std::string_view path) {
    const auto name_start = path.find_last_of('/');
    const auto base = name_start == path.npos ? 0 : name_start + 1;

    const auto dot = path.find_first_of('.', base);
    return std::string(path.substr(0, dot == path.npos ? path.length() : dot));
}

int main(int argc, char **argv) {
    auto opts = Options{};
    if (!parse_options(argc, argv, opts)) {
        return 1;
    }

    auto listing = std::vector<std::string>{};
    if (!read_listing(opts.filename, listing)) {
        std::printf("File read failed - please check source file name and path.\n");
        return 1;
    }

    const auto settings = Converter::Settings{ .load_address = opts.load_address, .variant = opts.variant };

    auto prog = Program{};
    auto err = ListingError{};
    if (!Converter::convert(listing, settings, prog, err)) {
        report_error(err, std::string_view{ opts.filename, std::strlen(opts.filename) }, listing);
        return 1;
    }

    if (!opts.dry_run) {
        const auto stem = output_stem(opts.filename);
        if (!write_binary(stem + ".prg", prog.image, std::cin)) {
            return 1;
        }
        if (!write_checksums(stem + ".chk", prog.checksums)) {
            return 1;
        }
    }

    std::printf("Line Checksums:\n\n");
    std::printf("%s", checksum_grid(prog.checksums, terminal_width()).c_str());

    return 0;
}
