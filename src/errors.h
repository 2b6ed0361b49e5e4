#ifndef LINEUP_ERRORS_H
#define LINEUP_ERRORS_H 1

#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>

#include "global.h"

/**
 * Failure while splitting input into items. No items are produced when one
 * of these is thrown.
 */
class TokenizeError : public std::runtime_error {
  public:
    enum class Kind {
        InvalidUtf8,        // input is not well-formed UTF-8
        MisalignedBoundary, // fixed-width cut inside a multi-byte sequence
        TruncatedTail,      // fixed-width tail shorter than the width
    };

    TokenizeError(Kind kind, std::size_t offset, const std::string& message);

    Kind kind() const { return kind_; }

    // Byte offset in the input where the failure was detected
    std::size_t offset() const { return offset_; }

    static std::string_view kindName(Kind kind);

  private:
    Kind kind_;
    std::size_t offset_;
};

/**
 * Malformed separator, pad or anchor value rejected before the core runs
 */
class ConfigError : public std::runtime_error {
  public:
    using std::runtime_error::runtime_error;
};

#endif /* !LINEUP_ERRORS_H */
