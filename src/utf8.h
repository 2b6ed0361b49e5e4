#ifndef LINEUP_UTF8_H
#define LINEUP_UTF8_H 1

#include <cstddef>
#include <optional>
#include <string_view>

#include "global.h"

/**
 * UTF-8 helpers shared by the tokenizer, the formatter and option validation.
 *
 * Lengths are counted in Unicode scalar values, never in display columns.
 */
namespace Utf8 {

/**
 * Check that the bytes form well-formed UTF-8.
 * Returns the byte offset of the first bad sequence, or nullopt if valid.
 * Overlong forms, surrogates and code points above U+10FFFF are rejected.
 */
std::optional<std::size_t> validate(std::string_view bytes);

/**
 * True when offset lies on a scalar value boundary of the bytes.
 * Both ends of the sequence count as boundaries.
 */
bool isBoundary(std::string_view bytes, std::size_t offset);

/**
 * Number of Unicode scalar values in valid UTF-8 text
 */
std::size_t length(std::string_view text);

bool isSingleScalar(std::string_view text);

} // namespace Utf8

#endif /* !LINEUP_UTF8_H */
