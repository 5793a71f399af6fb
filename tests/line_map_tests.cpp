#include <codegate/source/line_map.h>
#include <codegate/source/source_unit.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <unistd.h>

static void expect_eq(std::size_t got, std::size_t expected, const char* what)
{
    if (got != expected)
    {
        std::cerr << "FAIL: " << what << ": got=" << got << " expected=" << expected << "\n";
        std::exit(1);
    }
}

static void fail(const std::string& msg)
{
    std::cerr << "FAIL: " << msg << "\n";
    std::exit(1);
}

int main()
{
    using namespace codegate::source;

    const std::string text = "a\n"  // line 1
                             "bc\n" // line 2
                             "def"; // line 3 (no trailing newline)

    LineMap map(text);

    {
        const auto lc = map.offset_to_line_col(0);
        expect_eq(lc.line, 1, "offset 0 line");
        expect_eq(lc.col, 1, "offset 0 col");
    }

    {
        const auto lc = map.offset_to_line_col(1); // '\n'
        expect_eq(lc.line, 1, "offset 1 line");
        expect_eq(lc.col, 2, "offset 1 col");
    }

    {
        const auto lc = map.offset_to_line_col(2); // 'b'
        expect_eq(lc.line, 2, "offset 2 line");
        expect_eq(lc.col, 1, "offset 2 col");
    }

    {
        const auto lc = map.offset_to_line_col(text.size() + 123); // clamp past end
        expect_eq(lc.line, 3, "clamped end line");
        expect_eq(lc.col, 4, "clamped end col");
    }

    expect_eq(map.line_start_offset(0), 0, "line 0 start");
    expect_eq(map.line_start_offset(2), 2, "line 2 start");
    expect_eq(map.line_start_offset(3), 5, "line 3 start");
    expect_eq(map.line_start_offset(99), text.size(), "line past end start");
    expect_eq(map.line_count(), 3, "line count without trailing newline");

    expect_eq(LineMap("").line_count(), 0, "empty text line count");
    expect_eq(LineMap("x\n").line_count(), 1, "trailing newline line count");
    expect_eq(LineMap("x\n\n").line_count(), 2, "blank last line counts");

    {
        const SourceUnit unit("def f():\n    return 1\n");
        if (unit.name() != "<generated>")
        {
            fail("expected default unit name");
        }
        expect_eq(unit.length(), 22, "unit length");
        expect_eq(unit.line_count(), 2, "unit line count");
    }

    {
        std::istringstream in("print(1)\n");
        auto res = load_source_stream(in, "<stdin>");
        const auto* unit = std::get_if<SourceUnit>(&res);
        if (unit == nullptr || unit->name() != "<stdin>" || unit->text() != "print(1)\n")
        {
            fail("expected stream load to keep text and name");
        }
    }

    {
        const auto path = std::filesystem::temp_directory_path() /
                          ("codegate_line_map_" + std::to_string(::getpid()) + ".py");
        {
            std::ofstream out(path);
            out << "x = 1\ny = 2\n";
        }
        auto res = load_source_file(path.string());
        std::filesystem::remove(path);
        const auto* unit = std::get_if<SourceUnit>(&res);
        if (unit == nullptr || unit->name() != path.string() || unit->line_count() != 2)
        {
            fail("expected file load to succeed");
        }
    }

    {
        auto res = load_source_file("/nonexistent/codegate/input.py");
        if (!std::holds_alternative<LoadError>(res))
        {
            fail("expected load error for missing file");
        }
    }

    std::cout << "OK\n";
    return 0;
}
