#pragma once

#include <cstddef>
#include <string_view>
#include <vector>

/**
 * @file line_map.h
 * @brief Maps byte offsets to line/column positions within source text.
 */

namespace codegate::source
{

/**
 * @brief A 1-based line/column pair. Columns are counted in bytes.
 */
struct LineCol
{
    std::size_t line = 1;
    std::size_t col = 1;
};

/**
 * @brief Precomputes line start offsets for fast offset-to-line/col queries.
 */
class LineMap
{
  public:
    explicit LineMap(std::string_view text);

    /** @brief Convert a byte offset into a LineCol (1-based). Offsets past the end clamp. */
    [[nodiscard]] LineCol offset_to_line_col(std::size_t offset) const;
    /** @brief Return the start offset of the given 1-based line. */
    [[nodiscard]] std::size_t line_start_offset(std::size_t line) const;
    /** @brief Number of lines; a trailing newline does not open a new line. */
    [[nodiscard]] std::size_t line_count() const;

  private:
    std::size_t text_size_ = 0;
    bool trailing_newline_ = false;
    std::vector<std::size_t> line_starts_;
};

} // namespace codegate::source
