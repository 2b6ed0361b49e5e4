/**
 * LibFuzzer harness for the tokenizer and formatter
 * Build with: cmake -DLINEUP_BUILD_FUZZERS=ON -DCMAKE_CXX_COMPILER=clang++
 */

#include "../src/formatter.h"
#include "../src/token.h"
#include <cstddef>
#include <cstdint>
#include <string>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    if (size < 2) {
        return 0;
    }

    // First two bytes pick the layout, the rest is the input text
    const size_t width = data[0] % 8;
    const size_t per_line = data[1] % 4;
    std::string input(reinterpret_cast<const char*>(data + 2), size - 2);

    InputLayout layout;
    if (width == 0) {
        layout.item_separator = Literal{","};
    } else {
        layout.item_separator = FixedWidth{width};
    }
    layout.lines = {per_line, "\n"};

    Token token;
    std::vector<std::string> items;
    try {
        token.tokenize(input, layout, items);
    } catch (const TokenizeError&) {
        // Declared errors are expected for arbitrary bytes
        return 0;
    }

    Formatter formatter;
    formatter.format(items, {{6, ".", Anchor::Right}, "|", {per_line, "\n"}});
    return 0;
}
