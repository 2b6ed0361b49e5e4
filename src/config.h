#ifndef LINEUP_CONFIG_H
#define LINEUP_CONFIG_H 1

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "errors.h"
#include "global.h"
#include "layout.h"

// Widest --out-span accepted, in characters
constexpr std::size_t MAX_OUT_SPAN = 65536;

/**
 * Raw option values as read from the command line
 */
struct CommandLineArgs {
    std::string in_separator = ",";  // N (bytes per item) or a literal separator
    std::size_t in_line_n = 0;       // items per input line (0 = single line)
    std::string in_line_separator;   // separator between input lines
    std::size_t out_span = 0;        // pad items to this many characters (0 = no padding)
    std::string out_pad = " ";       // pad character
    std::string out_anchor = "left"; // left or right
    std::string out_separator = " "; // separator between output items
    std::size_t out_line_n = 0;      // items per output line (0 = single line)
    std::string out_line_separator;  // separator between output lines
    std::string log_file;            // optional run log
    bool escapes = false;            // interpret backslash escapes in separators
};

/**
 * Validated layouts handed to the tokenizer and formatter
 */
struct Config {
    InputLayout input;
    OutputLayout output;
    std::string log_file;
};

/**
 * Digit-led arguments are byte counts, anything else is a literal separator.
 * Throws ConfigError for 0, empty text, or digits followed by other text.
 */
ItemSeparator parseItemSeparator(std::string_view text);

Anchor parseAnchor(std::string_view text);

/**
 * The pad unit must be exactly one Unicode scalar value
 */
std::string parsePad(std::string_view text);

/**
 * Expand \n, \t, \r, \0 and \\ escapes. Unknown escapes and a trailing
 * backslash throw ConfigError.
 */
std::string unescape(std::string_view text);

/**
 * Validate raw options into layouts. Throws ConfigError for bad separators,
 * pad or anchor values and for an out_span above MAX_OUT_SPAN.
 */
Config buildConfig(const CommandLineArgs& args);

/**
 * Parse the argument vector (program name first). Unknown options and
 * malformed numbers throw std::runtime_error carrying the usage text.
 */
CommandLineArgs parseCommandLineOptions(const std::vector<std::string>& arguments);

#endif /* !LINEUP_CONFIG_H */
