#include <algorithm>
#include <cmath>
#include <codegate/interp/args.h>
#include <codegate/interp/interpreter.h>
#include <codegate/interp/library.h>
#include <cstdint>
#include <functional>
#include <limits>
#include <numbers>
#include <numeric>
#include <random>
#include <string>
#include <utility>
#include <vector>

namespace codegate::interp
{

namespace
{

using MathFn = double (*)(double);

std::shared_ptr<ModuleObject> new_module(std::string name)
{
    return std::make_shared<ModuleObject>(std::move(name));
}

void define(ModuleObject& module, const std::string& name, NativeFn fn)
{
    module.attrs.insert_or_assign(name, make_native(name, std::move(fn)));
}

std::nullopt_t domain_error(Interpreter& in)
{
    return in.raise("ValueError", "math domain error");
}

EvalResult to_integer(Interpreter& in, double d)
{
    if (std::isnan(d))
    {
        return in.raise("ValueError", "cannot convert float NaN to integer");
    }
    if (std::isinf(d))
    {
        return in.raise("OverflowError", "cannot convert float infinity to integer");
    }
    if (d >= 9223372036854775808.0 || d < -9223372036854775808.0)
    {
        return in.raise("OverflowError", "integer overflow");
    }
    return Value::integer(static_cast<std::int64_t>(d));
}

/**
 * @brief One-argument float function. `valid` rejects inputs outside the
 * domain; results that overflow to infinity from a finite input raise OverflowError.
 */
NativeFn unary(std::string name, MathFn fn, std::function<bool(double)> valid = {})
{
    return [name, fn, valid](Interpreter& in, Args& a, Kwargs& k) -> EvalResult
    {
        if (!no_kwargs(in, name, k) || !check_arity(in, name, a, 1, 1))
        {
            return std::nullopt;
        }
        const auto x = real_arg(in, name, a[0]);
        if (!x.has_value())
        {
            return std::nullopt;
        }
        if (valid && !std::isnan(*x) && !valid(*x))
        {
            return domain_error(in);
        }
        const double r = fn(*x);
        if (std::isinf(r) && std::isfinite(*x))
        {
            return in.raise("OverflowError", "math range error");
        }
        if (std::isnan(r) && !std::isnan(*x))
        {
            return domain_error(in);
        }
        return Value::floating(r);
    };
}

NativeFn rounding(std::string name, MathFn fn)
{
    return [name, fn](Interpreter& in, Args& a, Kwargs& k) -> EvalResult
    {
        if (!no_kwargs(in, name, k) || !check_arity(in, name, a, 1, 1))
        {
            return std::nullopt;
        }
        if (a[0].is_integral())
        {
            return Value::integer(a[0].as_int());
        }
        const auto x = real_arg(in, name, a[0]);
        if (!x.has_value())
        {
            return std::nullopt;
        }
        return to_integer(in, fn(*x));
    };
}

std::optional<std::int64_t> checked_mul(Interpreter& in, std::int64_t a, std::int64_t b)
{
    std::int64_t r = 0;
    if (__builtin_mul_overflow(a, b, &r))
    {
        in.raise("OverflowError", "integer overflow");
        return std::nullopt;
    }
    return r;
}

EvalResult math_gcd_lcm(Interpreter& in, Args& a, Kwargs& k, bool lcm)
{
    const char* name = lcm ? "lcm" : "gcd";
    if (!no_kwargs(in, name, k))
    {
        return std::nullopt;
    }
    std::int64_t acc = lcm ? 1 : 0;
    for (const auto& v : a)
    {
        const auto n = int_arg(in, name, v);
        if (!n.has_value())
        {
            return std::nullopt;
        }
        const std::int64_t m = *n < 0 ? -*n : *n;
        if (!lcm)
        {
            acc = std::gcd(acc, m);
            continue;
        }
        if (m == 0 || acc == 0)
        {
            acc = 0;
            continue;
        }
        const auto r = checked_mul(in, acc / std::gcd(acc, m), m);
        if (!r.has_value())
        {
            return std::nullopt;
        }
        acc = *r;
    }
    return Value::integer(acc);
}

EvalResult math_comb_perm(Interpreter& in, Args& a, Kwargs& k, bool comb)
{
    const char* name = comb ? "comb" : "perm";
    if (!no_kwargs(in, name, k) || !check_arity(in, name, a, comb ? 2 : 1, 2))
    {
        return std::nullopt;
    }
    const auto n = int_arg(in, name, a[0]);
    const auto r = a.size() > 1 && !a[1].is_none() ? int_arg(in, name, a[1]) : n;
    if (!n.has_value() || !r.has_value())
    {
        return std::nullopt;
    }
    if (*n < 0 || *r < 0)
    {
        return in.raise("ValueError", "n must be a non-negative integer");
    }
    if (*r > *n)
    {
        return Value::integer(0);
    }
    const std::int64_t steps = comb ? std::min(*r, *n - *r) : *r;
    std::int64_t acc = 1;
    for (std::int64_t i = 1; i <= steps; ++i)
    {
        if (comb)
        {
            // acc * (n - steps + i) / i stays exact at every step.
            const auto g = std::gcd(acc, i);
            const auto scaled = checked_mul(in, acc / g, (*n - steps + i) / (i / g));
            if (!scaled.has_value())
            {
                return std::nullopt;
            }
            acc = *scaled;
        }
        else
        {
            const auto next = checked_mul(in, acc, *n - i + 1);
            if (!next.has_value())
            {
                return std::nullopt;
            }
            acc = *next;
        }
    }
    return Value::integer(acc);
}

std::shared_ptr<ModuleObject> make_math()
{
    auto m = new_module("math");
    m->attrs.insert_or_assign("pi", Value::floating(std::numbers::pi));
    m->attrs.insert_or_assign("e", Value::floating(std::numbers::e));
    m->attrs.insert_or_assign("tau", Value::floating(2 * std::numbers::pi));
    m->attrs.insert_or_assign("inf", Value::floating(std::numeric_limits<double>::infinity()));
    m->attrs.insert_or_assign("nan", Value::floating(std::numeric_limits<double>::quiet_NaN()));

    auto non_negative = [](double x) { return x >= 0; };
    auto positive = [](double x) { return x > 0; };
    auto unit = [](double x) { return x >= -1 && x <= 1; };
    define(*m, "sqrt", unary("sqrt", [](double x) { return std::sqrt(x); }, non_negative));
    define(*m, "exp", unary("exp", [](double x) { return std::exp(x); }));
    define(*m, "log2", unary("log2", [](double x) { return std::log2(x); }, positive));
    define(*m, "log10", unary("log10", [](double x) { return std::log10(x); }, positive));
    define(*m, "fabs", unary("fabs", [](double x) { return std::fabs(x); }));
    define(*m, "sin", unary("sin", [](double x) { return std::sin(x); }));
    define(*m, "cos", unary("cos", [](double x) { return std::cos(x); }));
    define(*m, "tan", unary("tan", [](double x) { return std::tan(x); }));
    define(*m, "asin", unary("asin", [](double x) { return std::asin(x); }, unit));
    define(*m, "acos", unary("acos", [](double x) { return std::acos(x); }, unit));
    define(*m, "atan", unary("atan", [](double x) { return std::atan(x); }));
    define(*m, "sinh", unary("sinh", [](double x) { return std::sinh(x); }));
    define(*m, "cosh", unary("cosh", [](double x) { return std::cosh(x); }));
    define(*m, "tanh", unary("tanh", [](double x) { return std::tanh(x); }));
    define(*m, "degrees", unary("degrees", [](double x) { return x * 180.0 / std::numbers::pi; }));
    define(*m, "radians", unary("radians", [](double x) { return x * std::numbers::pi / 180.0; }));
    define(*m, "floor", rounding("floor", [](double x) { return std::floor(x); }));
    define(*m, "ceil", rounding("ceil", [](double x) { return std::ceil(x); }));
    define(*m, "trunc", rounding("trunc", [](double x) { return std::trunc(x); }));

    define(*m, "log",
           [](Interpreter& in, Args& a, Kwargs& k) -> EvalResult
           {
               if (!no_kwargs(in, "log", k) || !check_arity(in, "log", a, 1, 2))
               {
                   return std::nullopt;
               }
               const auto x = real_arg(in, "log", a[0]);
               if (!x.has_value())
               {
                   return std::nullopt;
               }
               if (*x <= 0)
               {
                   return domain_error(in);
               }
               if (a.size() == 1)
               {
                   return Value::floating(std::log(*x));
               }
               const auto base = real_arg(in, "log", a[1]);
               if (!base.has_value())
               {
                   return std::nullopt;
               }
               if (*base <= 0 || *base == 1)
               {
                   return *base == 1 ? in.raise("ZeroDivisionError", "float division by zero")
                                     : domain_error(in);
               }
               return Value::floating(std::log(*x) / std::log(*base));
           });
    define(*m, "pow",
           [](Interpreter& in, Args& a, Kwargs& k) -> EvalResult
           {
               if (!no_kwargs(in, "pow", k) || !check_arity(in, "pow", a, 2, 2))
               {
                   return std::nullopt;
               }
               const auto x = real_arg(in, "pow", a[0]);
               const auto y = x.has_value() ? real_arg(in, "pow", a[1]) : std::nullopt;
               if (!y.has_value())
               {
                   return std::nullopt;
               }
               if (*x == 0 && *y < 0)
               {
                   return domain_error(in);
               }
               const double r = std::pow(*x, *y);
               if (std::isnan(r) && !std::isnan(*x) && !std::isnan(*y))
               {
                   return domain_error(in);
               }
               if (std::isinf(r) && std::isfinite(*x) && std::isfinite(*y))
               {
                   return in.raise("OverflowError", "math range error");
               }
               return Value::floating(r);
           });
    auto binary = [](std::string name, double (*fn)(double, double)) -> NativeFn
    {
        return [name, fn](Interpreter& in, Args& a, Kwargs& k) -> EvalResult
        {
            if (!no_kwargs(in, name, k) || !check_arity(in, name, a, 2, 2))
            {
                return std::nullopt;
            }
            const auto x = real_arg(in, name, a[0]);
            const auto y = x.has_value() ? real_arg(in, name, a[1]) : std::nullopt;
            if (!y.has_value())
            {
                return std::nullopt;
            }
            return Value::floating(fn(*x, *y));
        };
    };
    define(*m, "atan2", binary("atan2", [](double y, double x) { return std::atan2(y, x); }));
    define(*m, "copysign", binary("copysign", [](double x, double y) { return std::copysign(x, y); }));
    define(*m, "fmod", binary("fmod", [](double x, double y) { return std::fmod(x, y); }));
    define(*m, "hypot",
           [](Interpreter& in, Args& a, Kwargs& k) -> EvalResult
           {
               if (!no_kwargs(in, "hypot", k))
               {
                   return std::nullopt;
               }
               double acc = 0;
               for (const auto& v : a)
               {
                   const auto x = real_arg(in, "hypot", v);
                   if (!x.has_value())
                   {
                       return std::nullopt;
                   }
                   acc = std::hypot(acc, *x);
               }
               return Value::floating(acc);
           });
    define(*m, "gcd", [](Interpreter& in, Args& a, Kwargs& k) { return math_gcd_lcm(in, a, k, false); });
    define(*m, "lcm", [](Interpreter& in, Args& a, Kwargs& k) { return math_gcd_lcm(in, a, k, true); });
    define(*m, "comb", [](Interpreter& in, Args& a, Kwargs& k) { return math_comb_perm(in, a, k, true); });
    define(*m, "perm", [](Interpreter& in, Args& a, Kwargs& k) { return math_comb_perm(in, a, k, false); });
    define(*m, "factorial",
           [](Interpreter& in, Args& a, Kwargs& k) -> EvalResult
           {
               if (!no_kwargs(in, "factorial", k) || !check_arity(in, "factorial", a, 1, 1))
               {
                   return std::nullopt;
               }
               const auto n = int_arg(in, "factorial", a[0]);
               if (!n.has_value())
               {
                   return std::nullopt;
               }
               if (*n < 0)
               {
                   return in.raise("ValueError", "factorial() not defined for negative values");
               }
               std::int64_t acc = 1;
               for (std::int64_t i = 2; i <= *n; ++i)
               {
                   const auto next = checked_mul(in, acc, i);
                   if (!next.has_value())
                   {
                       return std::nullopt;
                   }
                   acc = *next;
               }
               return Value::integer(acc);
           });
    define(*m, "isqrt",
           [](Interpreter& in, Args& a, Kwargs& k) -> EvalResult
           {
               if (!no_kwargs(in, "isqrt", k) || !check_arity(in, "isqrt", a, 1, 1))
               {
                   return std::nullopt;
               }
               const auto n = int_arg(in, "isqrt", a[0]);
               if (!n.has_value())
               {
                   return std::nullopt;
               }
               if (*n < 0)
               {
                   return in.raise("ValueError", "isqrt() argument must be nonnegative");
               }
               auto r = static_cast<std::int64_t>(std::sqrt(static_cast<double>(*n)));
               while (r > 0 && (r > *n / r))
               {
                   --r;
               }
               while ((r + 1) <= *n / (r + 1))
               {
                   ++r;
               }
               return Value::integer(r);
           });
    define(*m, "isclose",
           [](Interpreter& in, Args& a, Kwargs& k) -> EvalResult
           {
               if (!only_kwargs(in, "isclose", k, {"rel_tol", "abs_tol"}) ||
                   !check_arity(in, "isclose", a, 2, 2))
               {
                   return std::nullopt;
               }
               const auto x = real_arg(in, "isclose", a[0]);
               const auto y = x.has_value() ? real_arg(in, "isclose", a[1]) : std::nullopt;
               if (!y.has_value())
               {
                   return std::nullopt;
               }
               double rel = 1e-9;
               double abs_tol = 0.0;
               if (const Value* v = find_kwarg(k, "rel_tol"))
               {
                   const auto r = real_arg(in, "isclose", *v);
                   if (!r.has_value())
                   {
                       return std::nullopt;
                   }
                   rel = *r;
               }
               if (const Value* v = find_kwarg(k, "abs_tol"))
               {
                   const auto r = real_arg(in, "isclose", *v);
                   if (!r.has_value())
                   {
                       return std::nullopt;
                   }
                   abs_tol = *r;
               }
               if (rel < 0 || abs_tol < 0)
               {
                   return in.raise("ValueError", "tolerances must be non-negative");
               }
               if (*x == *y)
               {
                   return Value::boolean(true);
               }
               if (std::isinf(*x) || std::isinf(*y))
               {
                   return Value::boolean(false);
               }
               const double diff = std::fabs(*y - *x);
               return Value::boolean(diff <= std::fabs(rel * *y) || diff <= std::fabs(rel * *x) ||
                                     diff <= abs_tol);
           });
    auto predicate = [](std::string name, bool (*fn)(double)) -> NativeFn
    {
        return [name, fn](Interpreter& in, Args& a, Kwargs& k) -> EvalResult
        {
            if (!no_kwargs(in, name, k) || !check_arity(in, name, a, 1, 1))
            {
                return std::nullopt;
            }
            const auto x = real_arg(in, name, a[0]);
            if (!x.has_value())
            {
                return std::nullopt;
            }
            return Value::boolean(fn(*x));
        };
    };
    define(*m, "isfinite", predicate("isfinite", [](double x) { return std::isfinite(x); }));
    define(*m, "isinf", predicate("isinf", [](double x) { return std::isinf(x); }));
    define(*m, "isnan", predicate("isnan", [](double x) { return std::isnan(x); }));
    define(*m, "prod",
           [](Interpreter& in, Args& a, Kwargs& k) -> EvalResult
           {
               if (!only_kwargs(in, "prod", k, {"start"}) || !check_arity(in, "prod", a, 1, 1))
               {
                   return std::nullopt;
               }
               const auto items = in.iterate(a[0]);
               if (!items.has_value())
               {
                   return std::nullopt;
               }
               const Value* start = find_kwarg(k, "start");
               Value acc = start != nullptr ? *start : Value::integer(1);
               for (const auto& item : *items)
               {
                   auto next = in.binary_op(codegate::lexer::TokenKind::Star, acc, item);
                   if (!next.has_value())
                   {
                       return std::nullopt;
                   }
                   acc = std::move(*next);
               }
               return acc;
           });
    define(*m, "fsum",
           [](Interpreter& in, Args& a, Kwargs& k) -> EvalResult
           {
               if (!no_kwargs(in, "fsum", k) || !check_arity(in, "fsum", a, 1, 1))
               {
                   return std::nullopt;
               }
               const auto items = in.iterate(a[0]);
               if (!items.has_value())
               {
                   return std::nullopt;
               }
               // Neumaier compensated summation.
               double sum = 0;
               double carry = 0;
               for (const auto& item : *items)
               {
                   const auto x = real_arg(in, "fsum", item);
                   if (!x.has_value())
                   {
                       return std::nullopt;
                   }
                   const double t = sum + *x;
                   carry += std::fabs(sum) >= std::fabs(*x) ? (sum - t) + *x : (*x - t) + sum;
                   sum = t;
               }
               return Value::floating(sum + carry);
           });
    return m;
}

double unit_random(Interpreter& in)
{
    return std::uniform_real_distribution<double>(0.0, 1.0)(in.rng());
}

std::int64_t random_below(Interpreter& in, std::uint64_t n)
{
    return static_cast<std::int64_t>(std::uniform_int_distribution<std::uint64_t>(0, n - 1)(in.rng()));
}

EvalResult random_range(Interpreter& in, std::int64_t start, std::int64_t stop, std::int64_t step)
{
    if (step == 0)
    {
        return in.raise("ValueError", "zero step for randrange()");
    }
    std::int64_t count = 0;
    if (step > 0 && start < stop)
    {
        count = (stop - start - 1) / step + 1;
    }
    else if (step < 0 && start > stop)
    {
        count = (start - stop - 1) / -step + 1;
    }
    if (count <= 0)
    {
        return in.raise("ValueError", "empty range for randrange() (" + std::to_string(start) +
                                          ", " + std::to_string(stop) + ", " +
                                          std::to_string(stop - start) + ")");
    }
    return Value::integer(start + step * random_below(in, static_cast<std::uint64_t>(count)));
}

std::shared_ptr<ModuleObject> make_random()
{
    auto m = new_module("random");
    define(*m, "random",
           [](Interpreter& in, Args& a, Kwargs& k) -> EvalResult
           {
               if (!no_kwargs(in, "random", k) || !check_arity(in, "random", a, 0, 0))
               {
                   return std::nullopt;
               }
               return Value::floating(unit_random(in));
           });
    define(*m, "seed",
           [](Interpreter& in, Args& a, Kwargs& k) -> EvalResult
           {
               if (!no_kwargs(in, "seed", k) || !check_arity(in, "seed", a, 0, 1))
               {
                   return std::nullopt;
               }
               if (a.empty() || a[0].is_none())
               {
                   in.rng().seed(std::random_device{}());
                   return Value::none();
               }
               const auto h = in.hash_value(a[0]);
               if (!h.has_value())
               {
                   return std::nullopt;
               }
               in.rng().seed(static_cast<std::uint64_t>(*h));
               return Value::none();
           });
    define(*m, "randint",
           [](Interpreter& in, Args& a, Kwargs& k) -> EvalResult
           {
               if (!no_kwargs(in, "randint", k) || !check_arity(in, "randint", a, 2, 2))
               {
                   return std::nullopt;
               }
               const auto lo = int_arg(in, "randint", a[0]);
               const auto hi = lo.has_value() ? int_arg(in, "randint", a[1]) : std::nullopt;
               if (!hi.has_value())
               {
                   return std::nullopt;
               }
               if (*hi == std::numeric_limits<std::int64_t>::max())
               {
                   return in.raise("OverflowError", "integer overflow");
               }
               return random_range(in, *lo, *hi + 1, 1);
           });
    define(*m, "randrange",
           [](Interpreter& in, Args& a, Kwargs& k) -> EvalResult
           {
               if (!no_kwargs(in, "randrange", k) || !check_arity(in, "randrange", a, 1, 3))
               {
                   return std::nullopt;
               }
               std::vector<std::int64_t> n;
               for (const auto& v : a)
               {
                   const auto i = int_arg(in, "randrange", v);
                   if (!i.has_value())
                   {
                       return std::nullopt;
                   }
                   n.push_back(*i);
               }
               if (n.size() == 1)
               {
                   return random_range(in, 0, n[0], 1);
               }
               return random_range(in, n[0], n[1], n.size() > 2 ? n[2] : 1);
           });
    define(*m, "uniform",
           [](Interpreter& in, Args& a, Kwargs& k) -> EvalResult
           {
               if (!no_kwargs(in, "uniform", k) || !check_arity(in, "uniform", a, 2, 2))
               {
                   return std::nullopt;
               }
               const auto lo = real_arg(in, "uniform", a[0]);
               const auto hi = lo.has_value() ? real_arg(in, "uniform", a[1]) : std::nullopt;
               if (!hi.has_value())
               {
                   return std::nullopt;
               }
               return Value::floating(*lo + (*hi - *lo) * unit_random(in));
           });
    define(*m, "gauss",
           [](Interpreter& in, Args& a, Kwargs& k) -> EvalResult
           {
               if (!no_kwargs(in, "gauss", k) || !check_arity(in, "gauss", a, 0, 2))
               {
                   return std::nullopt;
               }
               double mu = 0.0;
               double sigma = 1.0;
               if (!a.empty())
               {
                   const auto v = real_arg(in, "gauss", a[0]);
                   if (!v.has_value())
                   {
                       return std::nullopt;
                   }
                   mu = *v;
               }
               if (a.size() > 1)
               {
                   const auto v = real_arg(in, "gauss", a[1]);
                   if (!v.has_value())
                   {
                       return std::nullopt;
                   }
                   sigma = *v;
               }
               return Value::floating(mu + sigma * std::normal_distribution<double>(0.0, 1.0)(in.rng()));
           });
    define(*m, "choice",
           [](Interpreter& in, Args& a, Kwargs& k) -> EvalResult
           {
               if (!no_kwargs(in, "choice", k) || !check_arity(in, "choice", a, 1, 1))
               {
                   return std::nullopt;
               }
               const auto items = in.iterate(a[0]);
               if (!items.has_value())
               {
                   return std::nullopt;
               }
               if (items->empty())
               {
                   return in.raise("IndexError", "Cannot choose from an empty sequence");
               }
               return (*items)[static_cast<std::size_t>(random_below(in, items->size()))];
           });
    define(*m, "shuffle",
           [](Interpreter& in, Args& a, Kwargs& k) -> EvalResult
           {
               if (!no_kwargs(in, "shuffle", k) || !check_arity(in, "shuffle", a, 1, 1))
               {
                   return std::nullopt;
               }
               if (!a[0].is_list())
               {
                   return in.raise("TypeError", "shuffle() argument must be a list");
               }
               auto& items = a[0].as_list()->items;
               for (std::size_t i = items.size(); i > 1; --i)
               {
                   std::swap(items[i - 1], items[static_cast<std::size_t>(random_below(in, i))]);
               }
               return Value::none();
           });
    define(*m, "sample",
           [](Interpreter& in, Args& a, Kwargs& k) -> EvalResult
           {
               if (!only_kwargs(in, "sample", k, {"k"}) || !check_arity(in, "sample", a, 1, 2))
               {
                   return std::nullopt;
               }
               const Value* count_v = a.size() > 1 ? &a[1] : find_kwarg(k, "k");
               if (count_v == nullptr)
               {
                   return in.raise("TypeError", "sample() missing 1 required argument: 'k'");
               }
               const auto count = int_arg(in, "sample", *count_v);
               auto items = count.has_value() ? in.iterate(a[0]) : std::nullopt;
               if (!items.has_value())
               {
                   return std::nullopt;
               }
               if (*count < 0 || static_cast<std::size_t>(*count) > items->size())
               {
                   return in.raise("ValueError", "Sample larger than population or is negative");
               }
               const auto n = static_cast<std::size_t>(*count);
               for (std::size_t i = 0; i < n; ++i)
               {
                   const auto j = i + static_cast<std::size_t>(random_below(in, items->size() - i));
                   std::swap((*items)[i], (*items)[j]);
               }
               items->resize(n);
               return Value::list(std::move(*items));
           });
    define(*m, "choices",
           [](Interpreter& in, Args& a, Kwargs& k) -> EvalResult
           {
               if (!only_kwargs(in, "choices", k, {"weights", "k"}) ||
                   !check_arity(in, "choices", a, 1, 2))
               {
                   return std::nullopt;
               }
               const auto items = in.iterate(a[0]);
               if (!items.has_value())
               {
                   return std::nullopt;
               }
               std::int64_t count = 1;
               if (const Value* v = find_kwarg(k, "k"))
               {
                   const auto c = int_arg(in, "choices", *v);
                   if (!c.has_value())
                   {
                       return std::nullopt;
                   }
                   count = std::max<std::int64_t>(0, *c);
               }
               if (!in.guard_allocation(static_cast<std::size_t>(count)))
               {
                   return std::nullopt;
               }
               std::vector<double> weights;
               const Value* weights_v = a.size() > 1 ? &a[1] : find_kwarg(k, "weights");
               if (weights_v != nullptr && !weights_v->is_none())
               {
                   const auto ws = in.iterate(*weights_v);
                   if (!ws.has_value())
                   {
                       return std::nullopt;
                   }
                   for (const auto& w : *ws)
                   {
                       const auto d = real_arg(in, "choices", w);
                       if (!d.has_value())
                       {
                           return std::nullopt;
                       }
                       weights.push_back(*d);
                   }
                   if (weights.size() != items->size())
                   {
                       return in.raise("ValueError",
                                       "The number of weights does not match the population");
                   }
               }
               if (items->empty())
               {
                   return in.raise("IndexError", "Cannot choose from an empty sequence");
               }
               std::vector<Value> out;
               out.reserve(static_cast<std::size_t>(count));
               if (weights.empty())
               {
                   for (std::int64_t i = 0; i < count; ++i)
                   {
                       out.push_back((*items)[static_cast<std::size_t>(random_below(in, items->size()))]);
                   }
                   return Value::list(std::move(out));
               }
               std::discrete_distribution<std::size_t> pick(weights.begin(), weights.end());
               for (std::int64_t i = 0; i < count; ++i)
               {
                   out.push_back((*items)[pick(in.rng())]);
               }
               return Value::list(std::move(out));
           });
    return m;
}

std::shared_ptr<ModuleObject> make_string()
{
    auto m = new_module("string");
    const std::pair<const char*, const char*> constants[] = {
        {"ascii_lowercase", "abcdefghijklmnopqrstuvwxyz"},
        {"ascii_uppercase", "ABCDEFGHIJKLMNOPQRSTUVWXYZ"},
        {"ascii_letters", "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ"},
        {"digits", "0123456789"},
        {"hexdigits", "0123456789abcdefABCDEF"},
        {"octdigits", "01234567"},
        {"punctuation", "!\"#$%&'()*+,-./:;<=>?@[\\]^_`{|}~"},
        {"whitespace", " \t\n\r\x0b\x0c"},
        {"printable", "0123456789abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ"
                      "!\"#$%&'()*+,-./:;<=>?@[\\]^_`{|}~ \t\n\r\x0b\x0c"},
    };
    for (const auto& [name, text] : constants)
    {
        m->attrs.insert_or_assign(name, Value::str(text));
    }
    return m;
}

EvalResult identity_decorator(Interpreter& in, Args& a, Kwargs& k)
{
    if (!no_kwargs(in, "decorator", k) || !check_arity(in, "decorator", a, 1, 1))
    {
        return std::nullopt;
    }
    return a[0];
}

bool is_function(const Value& v)
{
    return as<FunctionObject>(v) != nullptr || as<NativeFunction>(v) != nullptr;
}

std::shared_ptr<ModuleObject> make_functools()
{
    auto m = new_module("functools");
    define(*m, "reduce",
           [](Interpreter& in, Args& a, Kwargs& k) -> EvalResult
           {
               if (!no_kwargs(in, "reduce", k) || !check_arity(in, "reduce", a, 2, 3))
               {
                   return std::nullopt;
               }
               const auto items = in.iterate(a[1]);
               if (!items.has_value())
               {
                   return std::nullopt;
               }
               std::size_t i = 0;
               Value acc;
               if (a.size() > 2)
               {
                   acc = a[2];
               }
               else if (items->empty())
               {
                   return in.raise("TypeError", "reduce() of empty iterable with no initial value");
               }
               else
               {
                   acc = (*items)[i++];
               }
               for (; i < items->size(); ++i)
               {
                   auto next = in.call_value(a[0], {acc, (*items)[i]});
                   if (!next.has_value())
                   {
                       return std::nullopt;
                   }
                   acc = std::move(*next);
               }
               return acc;
           });
    define(*m, "partial",
           [](Interpreter& in, Args& a, Kwargs& k) -> EvalResult
           {
               if (a.empty())
               {
                   return in.raise("TypeError", "partial() missing required argument 'func'");
               }
               const Value fn = a[0];
               Args bound(a.begin() + 1, a.end());
               Kwargs bound_kw = k;
               return make_native("partial",
                                  [fn, bound, bound_kw](Interpreter& inner, Args& more,
                                                        Kwargs& more_kw) -> EvalResult
                                  {
                                      Args args = bound;
                                      args.insert(args.end(), more.begin(), more.end());
                                      Kwargs kwargs = bound_kw;
                                      for (auto& [key, value] : more_kw)
                                      {
                                          std::erase_if(kwargs, [&](const auto& kv)
                                                        { return kv.first == key; });
                                          kwargs.emplace_back(key, value);
                                      }
                                      return inner.call_value(fn, std::move(args), std::move(kwargs));
                                  });
           });
    // Cache decorators return the function unchanged.
    auto cache_decorator = [](Interpreter& in, Args& a, Kwargs& k) -> EvalResult
    {
        if (a.size() == 1 && k.empty() && is_function(a[0]))
        {
            return a[0];
        }
        if (!only_kwargs(in, "lru_cache", k, {"maxsize", "typed"}) ||
            !check_arity(in, "lru_cache", a, 0, 2))
        {
            return std::nullopt;
        }
        return make_native("decorator", identity_decorator);
    };
    define(*m, "lru_cache", cache_decorator);
    define(*m, "cache", identity_decorator);
    define(*m, "total_ordering", identity_decorator);
    define(*m, "wraps",
           [](Interpreter& in, Args& a, Kwargs&) -> EvalResult
           {
               if (!check_arity(in, "wraps", a, 1, 1))
               {
                   return std::nullopt;
               }
               return make_native("decorator", identity_decorator);
           });
    return m;
}

std::shared_ptr<ModuleObject> make_typing()
{
    auto m = new_module("typing");
    for (const char* name :
         {"Any", "List", "Dict", "Set", "FrozenSet", "Tuple", "Optional", "Union", "Callable",
          "Iterable", "Iterator", "Sequence", "Mapping", "MutableMapping", "Generator", "Type",
          "Literal", "Final", "ClassVar", "NoReturn", "Hashable", "Sized", "Collection",
          "Deque", "DefaultDict", "Counter"})
    {
        m->attrs.insert_or_assign(name, Value::object(std::make_shared<TypingObject>(name)));
    }
    define(*m, "TypeVar",
           [](Interpreter& in, Args& a, Kwargs&) -> EvalResult
           {
               if (a.empty())
               {
                   return in.raise("TypeError", "TypeVar() missing required argument 'name'");
               }
               const auto* name = str_arg(in, "TypeVar", a[0]);
               if (name == nullptr)
               {
                   return std::nullopt;
               }
               return Value::object(std::make_shared<TypingObject>(*name));
           });
    define(*m, "cast",
           [](Interpreter& in, Args& a, Kwargs& k) -> EvalResult
           {
               if (!no_kwargs(in, "cast", k) || !check_arity(in, "cast", a, 2, 2))
               {
                   return std::nullopt;
               }
               return a[1];
           });
    define(*m, "overload", identity_decorator);
    define(*m, "final", identity_decorator);
    m->attrs.insert_or_assign("TYPE_CHECKING", Value::boolean(false));
    return m;
}

std::shared_ptr<ModuleObject> make_future()
{
    auto m = new_module("__future__");
    for (const char* name : {"annotations", "division", "print_function", "absolute_import"})
    {
        m->attrs.insert_or_assign(name, Value::boolean(true));
    }
    return m;
}

} // namespace

ModuleTable make_standard_modules(Interpreter& /*interp*/)
{
    ModuleTable table;
    for (auto module : {make_math(), make_random(), make_string(), make_functools(), make_typing(),
                        make_future()})
    {
        table.emplace(module->name, module);
    }
    return table;
}

} // namespace codegate::interp
