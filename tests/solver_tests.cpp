#include <codegate/analysis/solver.h>
#include <cstdlib>
#include <iostream>
#include <string>

static void fail(const std::string& msg)
{
    std::cerr << "FAIL: " << msg << "\n";
    std::exit(1);
}

int main()
{
    using codegate::analysis::CheckResult;
    using codegate::analysis::Solver;

    {
        Solver solver;
        auto& ctx = solver.context();
        const z3::expr x = ctx.int_const("x");
        solver.add(x > 2);
        if (solver.check() != CheckResult::Sat)
        {
            fail("expected x > 2 to be satisfiable");
        }

        solver.push();
        solver.add(x < 1);
        if (solver.check() != CheckResult::Unsat)
        {
            fail("expected x > 2 and x < 1 to be unsatisfiable");
        }
        solver.pop();

        if (solver.check() != CheckResult::Sat)
        {
            fail("expected pop to drop the contradiction");
        }
        if (solver.last_unknown_reason().has_value())
        {
            fail("no unknown reason after a decided query");
        }
    }

    {
        // Over the reals there is room between two integers.
        Solver solver;
        auto& ctx = solver.context();
        const z3::expr r = ctx.real_const("r");
        solver.add(r > ctx.real_val(0) && r < ctx.real_val(1));
        if (solver.check() != CheckResult::Sat)
        {
            fail("expected 0 < r < 1 to be satisfiable over reals");
        }
        const z3::expr i = ctx.int_const("i");
        solver.push();
        solver.add(i > 0 && i < 1);
        if (solver.check() != CheckResult::Unsat)
        {
            fail("expected 0 < i < 1 to be unsatisfiable over ints");
        }
        solver.pop();
    }

    {
        Solver solver;
        solver.set_timeout(1000);
        auto& ctx = solver.context();
        const z3::expr b = ctx.bool_const("b");
        solver.add(b && !b);
        if (solver.check() != CheckResult::Unsat)
        {
            fail("expected b and not b to be unsatisfiable");
        }
    }

    std::cout << "OK\n";
    return 0;
}
