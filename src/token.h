#ifndef LINEUP_TOKEN_H
#define LINEUP_TOKEN_H 1

#include "errors.h"
#include "global.h"
#include "layout.h"
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

/**
 * Pull-style reader that cuts items out of validated UTF-8 input.
 *
 * Within a line-group the first items_per_line - 1 items are cut with the
 * item separator and the last one ends at the line separator. An empty
 * line separator makes every item use the item separator.
 */
class ItemReader {
  public:
    ItemReader(std::string_view input, InputLayout layout);

    /**
     * Next item, or nullopt when the input is exhausted.
     * Throws TokenizeError for fixed-width cuts that are misaligned or short.
     */
    std::optional<std::string> next();

    // Bytes consumed so far
    std::size_t position() const { return pos_; }

  private:
    std::string next(const Literal& separator);
    std::string next(const FixedWidth& width);
    std::string untilLineSeparator();
    void skipLineSeparator();
    bool closesLine() const;

    std::string_view input_;
    InputLayout layout_;
    std::size_t pos_ = 0;
    std::size_t items_in_line_ = 0;
    bool item_pending_ = false; // a consumed item separator promises one more item
};

class Token {
  public:
    /**
     * Split input into items according to the layout. The whole input is
     * validated as UTF-8 before any splitting. On failure items is left
     * untouched and TokenizeError is thrown.
     */
    void tokenize(std::string_view input, const InputLayout& layout,
                  std::vector<std::string>& items);
};

#endif /* !LINEUP_TOKEN_H */
