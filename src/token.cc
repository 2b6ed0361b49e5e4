#include "token.h"
#include "utf8.h"
#include <iostream>
#include <iterator>
#include <utility>

ItemReader::ItemReader(std::string_view input, InputLayout layout)
    : input_(input), layout_(std::move(layout)) {}

/**
 * The last item of a line-group is delimited by the line separator.
 */
bool ItemReader::closesLine() const {
    const LineLayout& lines = layout_.lines;
    return lines.enabled() && !lines.line_separator.empty() &&
           items_in_line_ + 1 == lines.items_per_line;
}

std::optional<std::string> ItemReader::next() {
    if (pos_ >= input_.size() && !item_pending_) {
        return std::nullopt;
    }
    item_pending_ = false;

    std::string item;
    if (closesLine()) {
        if (const auto* width = std::get_if<FixedWidth>(&layout_.item_separator)) {
            item = next(*width);
            skipLineSeparator();
        } else {
            item = untilLineSeparator();
        }
        items_in_line_ = 0;
    } else {
        item = std::visit([this](const auto& separator) { return next(separator); },
                          layout_.item_separator);
        if (layout_.lines.enabled()) {
            items_in_line_ = (items_in_line_ + 1) % layout_.lines.items_per_line;
        }
    }

    if constexpr (DEBUG) {
        std::cerr << "item [" << item << "] ends at " << pos_ << "\n";
    }
    return item;
}

std::string ItemReader::next(const Literal& separator) {
    auto found = input_.find(separator.text, pos_);
    if (found == std::string_view::npos) {
        // Last item
        std::string item(input_.substr(pos_));
        pos_ = input_.size();
        return item;
    }

    std::string item(input_.substr(pos_, found - pos_));
    pos_ = found + separator.text.length();
    item_pending_ = true;
    return item;
}

std::string ItemReader::next(const FixedWidth& width) {
    std::size_t remaining = input_.size() - pos_;
    if (remaining < width.bytes) {
        throw TokenizeError(TokenizeError::Kind::TruncatedTail, pos_,
                            "last item has " + std::to_string(remaining) + " of " +
                                std::to_string(width.bytes) + " bytes");
    }

    std::size_t cut = pos_ + width.bytes;
    if (!Utf8::isBoundary(input_, cut)) {
        throw TokenizeError(TokenizeError::Kind::MisalignedBoundary, cut,
                            "item boundary at byte " + std::to_string(cut) +
                                " falls inside a UTF-8 sequence");
    }

    std::string item(input_.substr(pos_, width.bytes));
    pos_ = cut;
    return item;
}

std::string ItemReader::untilLineSeparator() {
    const std::string& separator = layout_.lines.line_separator;
    auto found = input_.find(separator, pos_);
    if (found == std::string_view::npos) {
        std::string item(input_.substr(pos_));
        pos_ = input_.size();
        return item;
    }

    std::string item(input_.substr(pos_, found - pos_));
    pos_ = found + separator.length();
    return item;
}

/**
 * Fixed-width groups are positional; the line separator after a full group
 * is consumed when present.
 */
void ItemReader::skipLineSeparator() {
    const std::string& separator = layout_.lines.line_separator;
    if (input_.substr(pos_, separator.length()) == separator) {
        pos_ += separator.length();
    }
}

void Token::tokenize(std::string_view input, const InputLayout& layout,
                     std::vector<std::string>& items) {
    if (auto bad = Utf8::validate(input)) {
        throw TokenizeError(TokenizeError::Kind::InvalidUtf8, *bad,
                            "invalid UTF-8 sequence at byte " + std::to_string(*bad));
    }

    std::vector<std::string> result;
    ItemReader reader(input, layout);
    while (auto item = reader.next()) {
        result.push_back(std::move(*item));
    }

    items.insert(items.end(), std::make_move_iterator(result.begin()),
                 std::make_move_iterator(result.end()));
}
