#include <codegate/source/source_unit.h>
#include <fstream>
#include <sstream>

namespace codegate::source
{

SourceUnit::SourceUnit(std::string text, std::string name)
    : text_(std::move(text)), name_(std::move(name)), lines_(text_)
{
}

LoadResult load_source_stream(std::istream& in, const std::string& name)
{
    std::ostringstream buffer;
    buffer << in.rdbuf();

    if (!in.good() && !in.eof())
    {
        return LoadError{.message = "failed while reading file"};
    }

    return SourceUnit(buffer.str(), name);
}

LoadResult load_source_file(const std::string& path)
{
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in)
    {
        return LoadError{.message = "failed to open file"};
    }

    return load_source_stream(in, path);
}

} // namespace codegate::source
