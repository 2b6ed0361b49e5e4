#ifndef LINEUP_FORMATTER_H
#define LINEUP_FORMATTER_H 1

#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "global.h"
#include "layout.h"

/**
 * Streams items one at a time, emitting the separator owed to the previous
 * item before each new one. Nothing trails the last item.
 */
class ItemWriter {
  public:
    explicit ItemWriter(OutputLayout layout);

    void write(std::string_view item, std::ostream& out);

    // Items written so far
    std::size_t count() const { return written_; }

  private:
    enum class Pending { None, Item, Line };

    OutputLayout layout_;
    Pending pending_ = Pending::None;
    std::size_t items_in_line_ = 0;
    std::size_t written_ = 0;
};

/**
 * Renders items into padded, separated, line-grouped text
 */
class Formatter {
  public:
    /**
     * Pad an item to the span in scalar values. Items already at or over
     * the span pass through unchanged.
     */
    static std::string pad(std::string_view item, const PadSpec& spec);

    std::string format(const std::vector<std::string>& items, const OutputLayout& layout);
    void write(const std::vector<std::string>& items, const OutputLayout& layout,
               std::ostream& out);
};

#endif /* !LINEUP_FORMATTER_H */
