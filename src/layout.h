#ifndef LINEUP_LAYOUT_H
#define LINEUP_LAYOUT_H 1

#include <cstddef>
#include <string>
#include <variant>

#include "global.h"

/**
 * Fixed number of bytes per item, no explicit separator.
 * Every cut must land on a UTF-8 scalar value boundary.
 */
struct FixedWidth {
    std::size_t bytes;

    bool operator==(const FixedWidth& other) const = default;
};

/**
 * Explicit separator string between items; never empty, never digit-led
 */
struct Literal {
    std::string text;

    bool operator==(const Literal& other) const = default;
};

using ItemSeparator = std::variant<FixedWidth, Literal>;

/**
 * Grouping of items into lines. items_per_line == 0 means a single line.
 */
struct LineLayout {
    std::size_t items_per_line = 0;
    std::string line_separator;

    bool enabled() const { return items_per_line > 0; }
};

enum class Anchor { Left, Right };

/**
 * Output padding. span is measured in Unicode scalar values; 0 disables
 * padding and leaves pad and anchor unused.
 */
struct PadSpec {
    std::size_t span = 0;
    std::string pad = " "; // exactly one scalar value
    Anchor anchor = Anchor::Left;

    bool enabled() const { return span > 0; }
};

struct InputLayout {
    ItemSeparator item_separator = Literal{","};
    LineLayout lines;
};

struct OutputLayout {
    PadSpec pad;
    std::string item_separator = " ";
    LineLayout lines;
};

#endif /* !LINEUP_LAYOUT_H */
