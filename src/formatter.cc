#include "formatter.h"
#include "utf8.h"
#include <sstream>
#include <utility>

ItemWriter::ItemWriter(OutputLayout layout) : layout_(std::move(layout)) {}

void ItemWriter::write(std::string_view item, std::ostream& out) {
    // Separator owed by the previous item
    switch (pending_) {
    case Pending::None:
        break;
    case Pending::Item:
        out << layout_.item_separator;
        break;
    case Pending::Line:
        out << layout_.lines.line_separator;
        break;
    }

    if (layout_.pad.enabled()) {
        out << Formatter::pad(item, layout_.pad);
    } else {
        out << item;
    }
    ++written_;

    // Decide what the next item owes
    if (layout_.lines.enabled() && items_in_line_ + 1 >= layout_.lines.items_per_line) {
        pending_ = Pending::Line;
        items_in_line_ = 0;
    } else {
        pending_ = Pending::Item;
        ++items_in_line_;
    }
}

std::string Formatter::pad(std::string_view item, const PadSpec& spec) {
    std::size_t length = Utf8::length(item);
    if (!spec.enabled() || length >= spec.span) {
        return std::string(item);
    }

    std::string fill;
    fill.reserve((spec.span - length) * spec.pad.length());
    for (std::size_t i = length; i < spec.span; ++i) {
        fill.append(spec.pad);
    }

    std::string padded;
    padded.reserve(fill.length() + item.length());
    if (spec.anchor == Anchor::Right) {
        padded.append(fill);
        padded.append(item);
    } else {
        padded.append(item);
        padded.append(fill);
    }
    return padded;
}

std::string Formatter::format(const std::vector<std::string>& items,
                              const OutputLayout& layout) {
    std::ostringstream out;
    write(items, layout, out);
    return out.str();
}

void Formatter::write(const std::vector<std::string>& items, const OutputLayout& layout,
                      std::ostream& out) {
    ItemWriter writer(layout);
    for (const auto& item : items) {
        writer.write(item, out);
    }
}
