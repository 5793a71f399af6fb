#pragma once

#include <codegate/source/line_map.h>
#include <cstddef>
#include <istream>
#include <string>
#include <string_view>
#include <variant>

/**
 * @file source_unit.h
 * @brief The immutable unit of code that flows through the validation pipeline.
 */

namespace codegate::source
{

/**
 * @brief Source text under validation together with a display name.
 *
 * A SourceUnit never changes after construction. Spans produced by the lexer
 * and parser index into `text()`, so the unit must outlive any AST built from it.
 */
class SourceUnit
{
  public:
    explicit SourceUnit(std::string text, std::string name = "<generated>");

    [[nodiscard]] std::string_view text() const { return text_; }
    [[nodiscard]] const std::string& name() const { return name_; }
    /** @brief Length in bytes. */
    [[nodiscard]] std::size_t length() const { return text_.size(); }
    [[nodiscard]] std::size_t line_count() const { return lines_.line_count(); }
    [[nodiscard]] const LineMap& line_map() const { return lines_; }

  private:
    std::string text_;
    std::string name_;
    LineMap lines_;
};

/** @brief Error returned when a source cannot be loaded. */
struct LoadError
{
    std::string message;
};

using LoadResult = std::variant<SourceUnit, LoadError>;

/** @brief Load the file at `path`; the path becomes the unit's name. */
LoadResult load_source_file(const std::string& path);

/** @brief Load source from an input stream; `name` is used for diagnostics. */
LoadResult load_source_stream(std::istream& in, const std::string& name);

} // namespace codegate::source
