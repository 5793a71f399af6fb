#include <chrono>
#include <codegate/analysis/static_analyzer.h>
#include <condition_variable>
#include <cstdlib>
#include <iostream>
#include <mutex>
#include <thread>

namespace codegate::analysis
{
namespace
{

using codegate::diag::Finding;
using codegate::diag::Severity;
using Clock = std::chrono::steady_clock;

struct Slot
{
    std::mutex mutex;
    std::condition_variable cv;
    bool done = false;
    AnalyzerReport report;
};

bool debug_enabled()
{
    return std::getenv("CODEGATE_DEBUG") != nullptr;
}

Finding status_finding(const AnalyzerReport& report)
{
    Finding f;
    f.severity = Severity::Warning;
    f.origin = report.analyzer;
    if (report.outcome == AnalyzerOutcome::TimedOut)
    {
        f.code = "SA001";
        f.message = "analyzer timed out: " + report.analyzer;
    }
    else
    {
        f.code = "SA002";
        f.message = "analyzer failed: " + report.analyzer;
    }
    if (!report.detail.empty())
    {
        f.message += " (" + report.detail + ")";
    }
    return f;
}

} // namespace

void StaticAnalyzer::add(std::unique_ptr<Analyzer> analyzer)
{
    if (analyzer != nullptr)
    {
        analyzers_.push_back(std::shared_ptr<Analyzer>(std::move(analyzer)));
    }
}

std::vector<std::string> StaticAnalyzer::names() const
{
    std::vector<std::string> out;
    out.reserve(analyzers_.size());
    for (const auto& a : analyzers_)
    {
        out.push_back(a->name());
    }
    return out;
}

AnalysisResult StaticAnalyzer::analyze(const codegate::source::SourceUnit& source,
                                       const StaticAnalyzerConfig& config) const
{
    const auto started = Clock::now();
    AnalysisResult result;

    // Abandoned threads may outlive the caller's unit.
    auto unit = std::make_shared<const codegate::source::SourceUnit>(std::string(source.text()),
                                                                     source.name());
    const double timeout = config.analyzer_timeout_seconds;

    std::vector<std::shared_ptr<Slot>> slots;
    std::vector<std::thread> threads;
    slots.reserve(analyzers_.size());
    threads.reserve(analyzers_.size());
    for (const auto& analyzer : analyzers_)
    {
        auto slot = std::make_shared<Slot>();
        slot->report.analyzer = analyzer->name();
        slots.push_back(slot);
        threads.emplace_back(
            [slot, analyzer, unit, timeout]()
            {
                AnalyzerReport report = analyzer->run(*unit, timeout);
                report.analyzer = analyzer->name();
                std::lock_guard<std::mutex> lock(slot->mutex);
                slot->report = std::move(report);
                slot->done = true;
                slot->cv.notify_all();
            });
    }

    const auto wait_limit =
        started + std::chrono::duration_cast<Clock::duration>(
                      std::chrono::duration<double>(timeout + config.grace_seconds));
    for (std::size_t i = 0; i < slots.size(); ++i)
    {
        auto& slot = *slots[i];
        bool done = false;
        {
            std::unique_lock<std::mutex> lock(slot.mutex);
            done = slot.cv.wait_until(lock, wait_limit, [&slot]() { return slot.done; });
            if (done)
            {
                result.reports.push_back(slot.report);
            }
        }
        if (done)
        {
            threads[i].join();
            continue;
        }
        if (debug_enabled())
        {
            std::cerr << "[static] abandoning " << slot.report.analyzer << " after "
                      << timeout + config.grace_seconds << " s\n";
        }
        threads[i].detach();
        AnalyzerReport abandoned;
        abandoned.analyzer = analyzers_[i]->name();
        abandoned.outcome = AnalyzerOutcome::TimedOut;
        abandoned.detail = "no result within " + std::to_string(timeout) + " s";
        abandoned.elapsed_ms =
            std::chrono::duration<double, std::milli>(Clock::now() - started).count();
        result.reports.push_back(std::move(abandoned));
    }

    for (const auto& report : result.reports)
    {
        if (debug_enabled())
        {
            std::cerr << "[static] " << report.analyzer << ": " << to_string(report.outcome)
                      << ", " << report.findings.size() << " finding(s)\n";
        }
        if (report.outcome != AnalyzerOutcome::Completed)
        {
            result.findings.push_back(status_finding(report));
        }
        for (const auto& f : report.findings)
        {
            // SA001/SA002 never fail the stage.
            if (codegate::diag::at_least(f.severity, config.fatal_threshold))
            {
                result.passed = false;
            }
            result.findings.push_back(f);
        }
    }
    result.elapsed_ms = std::chrono::duration<double, std::milli>(Clock::now() - started).count();
    return result;
}

} // namespace codegate::analysis
