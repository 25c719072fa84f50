#include "options.hpp"

#include <cstdio>
#include <string>
#include <string_view>
#include <span>
#include <cstdlib>

#include "args.hpp"
#include "errors.hpp"
#include "diagnostics.hpp"

struct OptionHelp {
    const char *short_form;
    const char *long_form;
    const char *description;
};

static constexpr OptionHelp OPTION_HELP[] = {
    { "-l", "--loadaddr", "Load address in hex. (default: 0x0801)" },
    { "",   "",           "  0x0801 C64, 0x1001 VIC-20, 0x0401 VIC-20 +3K, 0x1201 VIC-20 +8K and up" },
    { "-s", "--source",   "Magazine format: ahoy1, ahoy2 or ahoy3. (default: ahoy2)" },
    { "-d", "--dry",      "Checks the listing and prints the checksums, writes no files." },
    { "",   "--help",     "Shows this page." },
    { "-v", "--version",  "Shows version information." },
};

static void print_version() {
    std::printf("retrotype version 0.0.3\n");
}

static void print_help() {
    std::printf("Converts an Ahoy! magazine type-in listing to a C64 .prg file and\n");
    std::printf("prints the Bug Repellent line codes to compare with the magazine.\n");

    std::printf("\nBasic usage:\n");
    std::printf("  retrotype <file> [option(s)]\n\n");

    std::printf("Options:\n");
    for (const auto &opt : OPTION_HELP) {
        std::printf("  %-4s  %-12s   %s\n", opt.short_form, opt.long_form, opt.description);
    }

    std::printf("\nSpecial characters:\n");
    std::printf("  Shifted and Commodore-key graphics are typed as {s A} and {c A}.\n");
    std::printf("  Other keys: {EP}, {UP_ARROW}, {LEFT_ARROW}, {PI}, {s RETURN}, {s SPACE},\n");
    std::printf("  {c EP} and {s UP_ARROW}.\n");
}

static void print_list(const char *prefix, std::span<const std::string_view> items, const char *suffix) {
    std::printf("%s", prefix);
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (i > 0) std::printf("%s", i + 1 == items.size() ? " and " : ", ");
        std::printf("\"%.*s\"", (int)items[i].length(), items[i].data());
    }
    std::printf("%s", suffix);
}

bool parse_options(int argc, char **argv, Options &out) {
    bool help = false, version = false;

    auto load_address = ArgParsers::Hex16{ out.load_address };
    auto source = Checksum::variant_name(out.variant);

    auto result = Args::parser()
        .add_arg("l", "loadaddr", load_address, "Error: Load address must be a hex number from 0 to FFFF.")
        .add_arg("s", "source", source)
        .add_arg("d", "dry", out.dry_run)
        .add_arg("help", help)
        .add_arg("v", "version", version)
        .parse(std::size_t(argc), argv);

    if (help) {
        print_help();
        std::exit(0);
    }

    if (version) {
        print_version();
        std::exit(0);
    }

    if (!result.unrecognized_options.empty()) {
        print_list("Warning: Ignoring unrecognized options ", result.unrecognized_options, "\n\n");
    }

    for (const auto &error : result.errors) std::printf("%s\n", error.c_str());
    if (!result.errors.empty()) return false;

    if (!Checksum::parse_variant(source, out.variant)) {
        report_error(ListingError{ .kind = ErrorKind::UNSUPPORTED_FORMAT, .detail = std::string{ source } }, "", {});
        return false;
    }
    out.load_address = load_address.value;

    if (result.remaining_args.empty()) {
        std::printf("No input file. Usage: retrotype <file> [option(s)]\n");
        return false;
    }
    if (result.remaining_args.size() > 1) {
        print_list("Error: Only one input file is allowed, got ", result.remaining_args, ".\n");
        return false;
    }
    out.filename = result.remaining_args[0].data();

    return true;
}
