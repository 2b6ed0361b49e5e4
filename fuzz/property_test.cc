/**
 * Property-based testing for the tokenizer and formatter
 * Tests invariants that should always hold
 */

#include "../src/formatter.h"
#include "../src/token.h"
#include "../src/utf8.h"
#include <algorithm>
#include <cassert>
#include <iostream>
#include <random>

namespace {

// Code points of every UTF-8 width, none of them separators used below
const std::vector<std::string> ALPHABET = {"a", "b", "z", "0", "é", "ß", "你", "好", "😊", "👶"};

// Random valid UTF-8 item, never containing ',' or '\n'
std::string generate_item(std::mt19937& gen, size_t max_scalars, bool allow_empty) {
    std::uniform_int_distribution<size_t> length_dist(allow_empty ? 0 : 1, max_scalars);
    std::uniform_int_distribution<size_t> char_dist(0, ALPHABET.size() - 1);

    size_t length = length_dist(gen);
    std::string result;
    for (size_t i = 0; i < length; i++) {
        result += ALPHABET[char_dist(gen)];
    }
    return result;
}

std::vector<std::string> generate_items(std::mt19937& gen, size_t max_items, bool allow_empty) {
    std::uniform_int_distribution<size_t> count_dist(0, max_items);
    std::vector<std::string> items(count_dist(gen));
    for (auto& item : items) {
        item = generate_item(gen, 8, allow_empty);
    }
    return items;
}

// Random bytes, mostly invalid UTF-8
std::string generate_random_bytes(std::mt19937& gen, size_t max_length) {
    std::uniform_int_distribution<size_t> length_dist(0, max_length);
    std::uniform_int_distribution<int> byte_dist(0, 255);

    size_t length = length_dist(gen);
    std::string result;
    result.reserve(length);
    for (size_t i = 0; i < length; i++) {
        result.push_back(static_cast<char>(byte_dist(gen)));
    }
    return result;
}

// Property: format then tokenize with the same separators restores the items
bool test_round_trip(const std::vector<std::string>& items, size_t per_line) {
    Formatter formatter;
    Token token;

    OutputLayout out{{}, ",", {per_line, "\n"}};
    InputLayout in{Literal{","}, {per_line, "\n"}};

    std::vector<std::string> parsed;
    token.tokenize(formatter.format(items, out), in, parsed);
    return parsed == items;
}

// Property: padding an already padded item changes nothing
bool test_pad_idempotent(const std::string& item, const PadSpec& spec) {
    std::string once = Formatter::pad(item, spec);
    return Formatter::pad(once, spec) == once;
}

// Property: padding never shortens an item
bool test_no_truncation(const std::string& item, const PadSpec& spec) {
    std::string padded = Formatter::pad(item, spec);
    return Utf8::length(padded) >= std::max(Utf8::length(item), spec.span) &&
           padded.find(item) != std::string::npos;
}

// Property: fixed-width splitting succeeds with exact chunks or fails with a declared error
bool test_fixed_width_safety(const std::string& input, size_t width) {
    Token token;
    std::vector<std::string> items;
    try {
        token.tokenize(input, {FixedWidth{width}, {}}, items);
    } catch (const TokenizeError& err) {
        return items.empty() && err.offset() <= input.size();
    }

    std::string joined;
    for (const auto& item : items) {
        if (item.size() != width || Utf8::validate(item)) {
            return false;
        }
        joined += item;
    }
    return joined == input;
}

} // namespace

int main() {
    std::mt19937 gen(std::random_device{}());
    const int NUM_TESTS = 10000;

    std::cout << "Running property-based tests...\n";

    // Test 1: Round trip
    std::cout << "Testing format/tokenize round trip: ";
    std::uniform_int_distribution<size_t> per_line_dist(0, 4);
    for (int i = 0; i < NUM_TESTS; i++) {
        auto items = generate_items(gen, 12, false);
        assert(test_round_trip(items, per_line_dist(gen)));
        if (i % 1000 == 0) std::cout << ".";
    }
    std::cout << " PASSED\n";

    // Test 2 and 3: Padding
    std::cout << "Testing padding invariants: ";
    std::uniform_int_distribution<size_t> span_dist(0, 12);
    std::uniform_int_distribution<size_t> pad_dist(0, ALPHABET.size() - 1);
    for (int i = 0; i < NUM_TESTS; i++) {
        std::string item = generate_item(gen, 10, true);
        PadSpec spec{span_dist(gen), ALPHABET[pad_dist(gen)],
                     i % 2 == 0 ? Anchor::Left : Anchor::Right};
        assert(test_pad_idempotent(item, spec));
        assert(test_no_truncation(item, spec));
        if (i % 1000 == 0) std::cout << ".";
    }
    std::cout << " PASSED\n";

    // Test 4: Fixed-width boundary safety, on valid and arbitrary input
    std::cout << "Testing fixed-width boundary safety: ";
    std::uniform_int_distribution<size_t> width_dist(1, 6);
    for (int i = 0; i < NUM_TESTS; i++) {
        std::string input = i % 2 == 0 ? generate_item(gen, 16, true)
                                       : generate_random_bytes(gen, 32);
        assert(test_fixed_width_safety(input, width_dist(gen)));
        if (i % 1000 == 0) std::cout << ".";
    }
    std::cout << " PASSED\n";

    // Test 5: Empty input and empty item sequences
    std::cout << "Testing empty input: ";
    {
        Token token;
        Formatter formatter;
        std::vector<std::string> items;
        token.tokenize("", {Literal{","}, {}}, items);
        assert(items.empty());
        token.tokenize("", {FixedWidth{3}, {2, "\n"}}, items);
        assert(items.empty());
        assert(formatter.format({}, {{4, "_", Anchor::Right}, ",", {2, "\n"}}).empty());
    }
    std::cout << " PASSED\n";

    std::cout << "\nAll property tests passed!\n";
    return 0;
}
