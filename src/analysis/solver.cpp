#include <codegate/analysis/solver.h>

namespace codegate::analysis
{

Solver::Solver() : solver_(ctx_) {}

z3::context& Solver::context()
{
    return ctx_;
}

void Solver::add(const z3::expr& constraint)
{
    solver_.add(constraint);
}

void Solver::push()
{
    solver_.push();
    unknown_reason_.reset();
}

void Solver::pop()
{
    solver_.pop();
    unknown_reason_.reset();
}

void Solver::set_timeout(unsigned milliseconds)
{
    z3::params params(ctx_);
    params.set("timeout", milliseconds);
    solver_.set(params);
}

CheckResult Solver::check()
{
    const auto res = solver_.check();
    switch (res)
    {
    case z3::sat:
        unknown_reason_.reset();
        return CheckResult::Sat;
    case z3::unsat:
        unknown_reason_.reset();
        return CheckResult::Unsat;
    default:
        unknown_reason_ = solver_.reason_unknown();
        return CheckResult::Unknown;
    }
}

} // namespace codegate::analysis
