#include <codegate/analysis/analyzer.h>

namespace codegate::analysis
{

std::string_view to_string(AnalyzerOutcome outcome)
{
    switch (outcome)
    {
    case AnalyzerOutcome::Completed:
        return "completed";
    case AnalyzerOutcome::TimedOut:
        return "timed_out";
    case AnalyzerOutcome::Crashed:
        return "crashed";
    case AnalyzerOutcome::Unavailable:
        return "unavailable";
    }
    return "crashed";
}

} // namespace codegate::analysis
