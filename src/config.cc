#include "config.h"
#include "utf8.h"
#include <algorithm>
#include <argparse.hpp>
#include <cctype>
#include <charconv>
#include <sstream>
#include <stdexcept>
#include <string>

#ifndef GIT_HASH
#define GIT_HASH "unknown"
#endif

namespace {

constexpr const char* SEPARATOR_HELP =
    "IN format: input item separator, either\n"
    "  N:   fixed number of bytes per item, no explicit separator; N must be > 0\n"
    "       and every item must end on a UTF-8 code point boundary\n"
    "  SEP: string used to separate items; SEP cannot start with a digit";

void requireUtf8(std::string_view text, std::string_view option) {
    if (Utf8::validate(text)) {
        throw ConfigError(std::string(option) + " is not valid UTF-8");
    }
}

} // namespace

ItemSeparator parseItemSeparator(std::string_view text) {
    if (text.empty()) {
        throw ConfigError("input item separator cannot be empty");
    }

    if (!std::isdigit(static_cast<unsigned char>(text.front()))) {
        requireUtf8(text, "input item separator");
        return Literal{std::string(text)};
    }

    std::size_t bytes = 0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), bytes);
    if (ec != std::errc() || end != text.data() + text.size()) {
        throw ConfigError("input item separator '" + std::string(text) +
                          "' starts with a digit but is not a byte count");
    }
    if (bytes == 0) {
        throw ConfigError("number of bytes per item must be > 0");
    }
    return FixedWidth{bytes};
}

Anchor parseAnchor(std::string_view text) {
    std::string lower(text);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });

    if (lower == "left") {
        return Anchor::Left;
    } else if (lower == "right") {
        return Anchor::Right;
    }
    throw ConfigError("anchor must be 'left' or 'right', got '" + std::string(text) + "'");
}

std::string parsePad(std::string_view text) {
    if (!Utf8::isSingleScalar(text)) {
        throw ConfigError("pad must be exactly one character, got '" + std::string(text) + "'");
    }
    return std::string(text);
}

std::string unescape(std::string_view text) {
    std::string result;
    result.reserve(text.length());

    for (std::size_t i = 0; i < text.length(); ++i) {
        if (text[i] != '\\') {
            result.push_back(text[i]);
            continue;
        }

        if (i + 1 == text.length()) {
            throw ConfigError("trailing backslash in '" + std::string(text) + "'");
        }

        switch (text[++i]) {
        case 'n':
            result.push_back('\n');
            break;
        case 't':
            result.push_back('\t');
            break;
        case 'r':
            result.push_back('\r');
            break;
        case '0':
            result.push_back('\0');
            break;
        case '\\':
            result.push_back('\\');
            break;
        default:
            throw ConfigError("unknown escape '\\" + std::string(1, text[i]) + "' in '" +
                              std::string(text) + "'");
        }
    }

    return result;
}

Config buildConfig(const CommandLineArgs& args) {
    auto expand = [&args](const std::string& text) {
        return args.escapes ? unescape(text) : text;
    };

    Config config;

    config.input.item_separator = parseItemSeparator(expand(args.in_separator));
    config.input.lines.items_per_line = args.in_line_n;
    config.input.lines.line_separator = expand(args.in_line_separator);
    requireUtf8(config.input.lines.line_separator, "input line separator");

    if (args.out_span > MAX_OUT_SPAN) {
        throw ConfigError("span " + std::to_string(args.out_span) + " exceeds the maximum of " +
                          std::to_string(MAX_OUT_SPAN));
    }
    config.output.pad.span = args.out_span;
    config.output.pad.pad = parsePad(args.out_pad);
    config.output.pad.anchor = parseAnchor(args.out_anchor);
    config.output.item_separator = expand(args.out_separator);
    requireUtf8(config.output.item_separator, "output item separator");
    config.output.lines.items_per_line = args.out_line_n;
    config.output.lines.line_separator = expand(args.out_line_separator);
    requireUtf8(config.output.lines.line_separator, "output line separator");

    config.log_file = args.log_file;
    return config;
}

CommandLineArgs parseCommandLineOptions(const std::vector<std::string>& arguments) {
    argparse::ArgumentParser program("lineup", GIT_HASH);

    program.add_description("Split text read from stdin into items and line them up on stdout");
    program.add_epilog("Example: echo -n 'hey,hello,hi' | lineup --out-span 5 --out-pad . "
                       "--out-anchor right");

    CommandLineArgs defaults;

    program.add_argument("--in-separator")
        .help(SEPARATOR_HELP)
        .default_value(defaults.in_separator)
        .metavar("SEP|N");

    program.add_argument("--in-line-n")
        .help("IN format, line: number of items per line; 0 puts all items on a single line")
        .default_value(defaults.in_line_n)
        .scan<'u', std::size_t>()
        .metavar("N");

    program.add_argument("--in-line-separator")
        .help("IN format, line: separator string between lines")
        .default_value(defaults.in_line_separator)
        .metavar("STR");

    program.add_argument("--out-span")
        .help("OUT format, span: characters an item should occupy; shorter items are padded "
              "with 'pad' and anchored per 'anchor'; 0 disables padding")
        .default_value(defaults.out_span)
        .scan<'u', std::size_t>()
        .metavar("N");

    program.add_argument("--out-pad")
        .help("OUT format, span: pad character")
        .default_value(defaults.out_pad)
        .metavar("CHAR");

    program.add_argument("--out-anchor")
        .help("OUT format, span: anchor padded items to the left or right")
        .default_value(defaults.out_anchor)
        .metavar("left|right");

    program.add_argument("--out-separator")
        .help("OUT format: separator string for items within a line")
        .default_value(defaults.out_separator)
        .metavar("STR");

    program.add_argument("--out-line-n")
        .help("OUT format, line: number of items per line; 0 puts all items on a single line")
        .default_value(defaults.out_line_n)
        .scan<'u', std::size_t>()
        .metavar("N");

    program.add_argument("--out-line-separator")
        .help("OUT format, line: separator string between lines")
        .default_value(defaults.out_line_separator)
        .metavar("STR");

    program.add_argument("-e", "--escapes")
        .help("interpret \\n, \\t, \\r, \\0 and \\\\ in separator arguments")
        .default_value(false)
        .implicit_value(true);

    program.add_argument("-l", "--log-file")
        .help("append a record of each run to FILE")
        .default_value(defaults.log_file)
        .metavar("FILE");

    try {
        program.parse_args(arguments);
    } catch (const std::exception& err) {
        throw std::runtime_error(std::string(err.what()) + "\n" + program.help().str());
    }

    return {.in_separator = program.get<std::string>("--in-separator"),
            .in_line_n = program.get<std::size_t>("--in-line-n"),
            .in_line_separator = program.get<std::string>("--in-line-separator"),
            .out_span = program.get<std::size_t>("--out-span"),
            .out_pad = program.get<std::string>("--out-pad"),
            .out_anchor = program.get<std::string>("--out-anchor"),
            .out_separator = program.get<std::string>("--out-separator"),
            .out_line_n = program.get<std::size_t>("--out-line-n"),
            .out_line_separator = program.get<std::string>("--out-line-separator"),
            .log_file = program.get<std::string>("--log-file"),
            .escapes = program.get<bool>("--escapes")};
}
