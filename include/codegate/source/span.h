#pragma once

#include <cstddef>

/**
 * @file span.h
 * @brief Byte-range locations within a source unit.
 */

namespace codegate::source
{

/**
 * @brief A byte range [start, end) within source text.
 */
struct Span
{
    std::size_t start = 0; // inclusive byte offset
    std::size_t end = 0;   // exclusive byte offset

    /** @brief Returns the length (in bytes) of the span. */
    [[nodiscard]] constexpr std::size_t length() const { return end - start; }
};

/** @brief Smallest span covering both `a` and `b`. */
[[nodiscard]] constexpr Span span_cover(const Span& a, const Span& b)
{
    return Span{.start = a.start < b.start ? a.start : b.start,
                .end = a.end > b.end ? a.end : b.end};
}

} // namespace codegate::source
