#include "errors.h"

TokenizeError::TokenizeError(Kind kind, std::size_t offset, const std::string& message)
    : std::runtime_error(message), kind_(kind), offset_(offset) {}

std::string_view TokenizeError::kindName(Kind kind) {
    switch (kind) {
    case Kind::InvalidUtf8:
        return "invalid-utf8";
    case Kind::MisalignedBoundary:
        return "misaligned-boundary";
    case Kind::TruncatedTail:
        return "truncated-tail";
    }
    return "unknown";
}
