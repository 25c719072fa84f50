#pragma once

#include <optional>
#include <vector>
#include <string>
#include <string_view>
#include <cctype> // std::tolower()
#include <cstring> // std::strlen()
#include <unordered_map>
#include <stdexcept> // std::invalid_argument
#include <charconv> // std::from_chars()
#include <type_traits> // std::is_same_v

#include "types.hpp"

// Command line parsing. Options are registered with a destination variable,
// whose type picks the value parser:
//
//   auto result = Args::parser()
//       .add_arg("l", "loadaddr", load_address)
//       .add_arg("help", help)
//       .parse(argc, argv);
//
// Flags (bool) take no value; everything else takes `--opt value`,
// `--opt=value` or `-o value`. Anything after `--` is positional.

namespace ArgParsers {
    // 16-bit value written in hex, with or without a 0x prefix ("0x0801", "1001")
    struct Hex16 {
        u16 value;
    };

    inline bool parse_to(std::string_view string, Hex16 *out) {
        if (string.starts_with("0x") || string.starts_with("0X")) string = string.substr(2);

        u16 value{};
        const char *end = string.data() + string.length();
        const auto result = std::from_chars(string.data(), end, value, 16);
        if (string.empty() || result.ec != std::errc{} || result.ptr != end) return false;

        out->value = value;
        return true;
    }

    inline bool parse_to(std::string_view string, bool *out) {
        auto lower = std::string{ string };
        for (char &c : lower) c = char(std::tolower((unsigned char)c));

        if (lower == "1" || lower == "true") *out = true;
        else if (lower == "0" || lower == "false") *out = false;
        else return false;

        return true;
    }

    inline bool parse_to(std::string_view string, std::string_view *out) {
        *out = string;
        return true;
    }
}

class Args {
    using ParseFn = bool(std::string_view, void*);

    struct Arg {
        std::string_view name; // long form if there is one, for messages
        void *out_ptr;
        bool is_flag;
        std::optional<std::string_view> error_msg;
        ParseFn *parse;
    };
public:
    struct ParseResult {
        std::vector<std::string_view> remaining_args;
        std::vector<std::string_view> unrecognized_options;
        std::vector<std::string> errors; // one line each, values that failed to parse
    };

    static Args parser() {
        return Args();
    }

    template<typename T>
    Args &add_arg(std::string_view short_form, std::string_view long_form, T &out, std::optional<std::string_view> error_msg) {
        if (short_form.empty() && long_form.empty()) {
            throw std::invalid_argument("an option needs a short or a long form");
        }

        const auto arg = Arg {
            .name = long_form.empty() ? short_form : long_form,
            .out_ptr = &out,
            .is_flag = std::is_same_v<T, bool>,
            .error_msg = error_msg,
            .parse = [](std::string_view value, void *raw_out) {
                return ArgParsers::parse_to(value, static_cast<T*>(raw_out));
            },
        };

        for (auto form : { short_form, long_form }) {
            if (form.empty()) continue;
            if (!arg_map.insert({ form, arg }).second) {
                throw std::invalid_argument("option registered twice");
            }
        }

        return *this;
    }

    template<typename T>
    Args &add_arg(std::string_view short_form, std::string_view long_form, T &out) {
        return add_arg(short_form, long_form, out, std::nullopt);
    }

    template<typename T>
    Args &add_arg(std::string_view long_form, T &out) {
        return add_arg("", long_form, out, std::nullopt);
    }

    ParseResult parse(std::size_t argc, char **argv) {
        auto result = ParseResult{};
        bool positional_only = false;

        // 0 is the application name
        for (std::size_t i = 1; i < argc; ++i) {
            const auto input = to_str_view(argv[i]);

            if (positional_only || !input.starts_with("-") || input == "-") {
                result.remaining_args.push_back(input);
                continue;
            }
            if (input == "--") {
                positional_only = true;
                continue;
            }

            // "--loadaddr" and "-l" look the same from here on
            auto option = input.substr(input.starts_with("--") ? 2 : 1);

            auto value = std::optional<std::string_view>{};
            if (const auto idx = option.find_first_of('='); idx != option.npos) {
                value = option.substr(idx + 1);
                option = option.substr(0, idx);
            }

            auto it = arg_map.find(option);
            if (it == arg_map.end()) {
                result.unrecognized_options.push_back(option);
                continue;
            }
            const Arg &arg = it->second;

            if (!value) {
                if (arg.is_flag) value = "1";
                else if (i + 1 < argc) value = to_str_view(argv[++i]);
                else value = "";
            }

            if (!arg.parse(*value, arg.out_ptr)) {
                result.errors.push_back(arg.error_msg
                    ? std::string{ *arg.error_msg }
                    : "Invalid value \"" + std::string{ *value } + "\" for option \"" + std::string{ arg.name } + "\"");
            }
        }

        return result;
    }

private:
    static std::string_view to_str_view(const char *c_str) {
        if (!c_str) return {};
        return std::string_view(c_str, std::strlen(c_str));
    }

    std::unordered_map<std::string_view, Arg> arg_map;
};
