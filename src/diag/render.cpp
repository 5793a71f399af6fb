#include <algorithm>
#include <codegate/diag/render.h>
#include <cstddef>
#include <sstream>
#include <string_view>

namespace codegate::diag
{
namespace
{

struct LineSlice
{
    std::size_t start = 0;
    std::size_t end = 0; // exclusive
};

LineSlice slice_for_line(std::string_view text, std::size_t line_start)
{
    if (line_start > text.size())
    {
        line_start = text.size();
    }

    const std::size_t nl = text.find('\n', line_start);
    const std::size_t line_end = (nl == std::string_view::npos) ? text.size() : nl;
    return LineSlice{.start = line_start, .end = line_end};
}

std::size_t clamp(std::size_t value, std::size_t low, std::size_t high)
{
    return std::min(std::max(value, low), high);
}

void header(std::ostringstream& out, const Finding& finding)
{
    out << to_string(finding.severity);
    if (!finding.code.empty())
    {
        out << "[" << finding.code << "]";
    }
    out << ": " << finding.message;
    if (!finding.origin.empty())
    {
        out << " (" << finding.origin << ")";
    }
    out << "\n";
}

} // namespace

void locate(Finding& finding, const codegate::source::SourceUnit& unit)
{
    if (!finding.span.has_value())
    {
        return;
    }
    const auto lc = unit.line_map().offset_to_line_col(finding.span->start);
    finding.line = lc.line;
    finding.col = lc.col;
}

std::string render(const Finding& finding, const codegate::source::SourceUnit& unit)
{
    std::ostringstream out;
    const std::string_view text = unit.text();
    const auto& map = unit.line_map();

    std::size_t line = finding.line;
    std::size_t col = finding.col;
    std::size_t span_len = 1;
    if (finding.span.has_value())
    {
        const auto lc = map.offset_to_line_col(finding.span->start);
        line = lc.line;
        col = lc.col;
        span_len = finding.span->end > finding.span->start ? finding.span->length() : 1;
    }

    if (line == 0)
    {
        out << unit.name() << ": ";
        header(out, finding);
        for (const auto& note : finding.notes)
        {
            out << "note: " << note.message << "\n";
        }
        return out.str();
    }

    out << unit.name() << ":" << line << ":" << (col == 0 ? 1 : col) << ": ";
    header(out, finding);

    const auto line_slice = slice_for_line(text, map.line_start_offset(line));
    const std::string_view line_text =
        text.substr(line_slice.start, line_slice.end - line_slice.start);

    out << "  |\n";
    out << "  | " << line_text << "\n";

    const std::size_t line_len = line_text.size();
    const std::size_t caret_start = (col == 0) ? 0 : (col - 1);
    const std::size_t first_line_remaining =
        (caret_start <= line_len) ? (line_len - caret_start) : 0;

    // Multi-line spans only highlight the first line.
    const std::size_t safe_caret_start = clamp(caret_start, 0, line_len);
    const std::size_t safe_caret_len =
        clamp(span_len, 1, std::max<std::size_t>(1, first_line_remaining));

    out << "  | " << std::string(safe_caret_start, ' ') << std::string(safe_caret_len, '^') << "\n";

    for (const auto& note : finding.notes)
    {
        out << "note: " << note.message << "\n";
    }

    return out.str();
}

} // namespace codegate::diag
