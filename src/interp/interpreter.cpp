#include <algorithm>
#include <charconv>
#include <codegate/interp/interpreter.h>
#include <codegate/interp/library.h>
#include <cstdlib>
#include <fstream>
#include <string>
#include <system_error>
#include <type_traits>
#include <unistd.h>
#include <utility>
#include <variant>

namespace codegate::interp
{

using namespace codegate::parser;
using codegate::lexer::TokenKind;
namespace rt = codegate::runtime;

namespace
{

constexpr std::size_t kCancelCheckInterval = 1024;
constexpr std::size_t kMemoryCheckInterval = 16384;

std::uint64_t current_rss_bytes()
{
    std::ifstream in("/proc/self/statm");
    std::uint64_t size = 0;
    std::uint64_t resident = 0;
    if (!(in >> size >> resident))
    {
        return 0;
    }
    const long page = ::sysconf(_SC_PAGESIZE);
    return resident * static_cast<std::uint64_t>(page > 0 ? page : 4096);
}

} // namespace

Interpreter::Interpreter(std::shared_ptr<const codegate::policy::PatternRegistry> registry,
                         Limits limits, const std::atomic<bool>* cancel)
    : registry_(registry != nullptr ? std::move(registry) : codegate::policy::default_registry()),
      limits_(limits), cancel_(cancel), globals_(std::make_shared<Env>()),
      rng_(std::random_device{}())
{
    globals_->kind = EnvKind::Module;
    globals_->vars.insert_or_assign("__name__", Value::str("__codegate__"));

    install_builtins(*this, intrinsics_);
    for (const auto& [name, value] : intrinsics_)
    {
        if (!registry_->is_forbidden_callable(name))
        {
            builtins_.emplace(name, value);
        }
    }
    if (const auto it = intrinsics_.find("object"); it != intrinsics_.end())
    {
        object_class_ = as<ClassObject>(it->second);
    }
    modules_ = make_standard_modules(*this);
    ellipsis_ = Value::object(std::make_shared<EllipsisObject>());
    baseline_rss_ = current_rss_bytes();
}

Interpreter::~Interpreter()
{
    // Functions close over environments that hold them; clear both sides so
    // the reference cycles are released.
    for (const auto& weak : envs_)
    {
        if (const auto env = weak.lock())
        {
            env->vars.clear();
        }
    }
    for (const auto& weak : objects_)
    {
        const auto obj = weak.lock();
        if (obj == nullptr)
        {
            continue;
        }
        if (auto* fn = dynamic_cast<FunctionObject*>(obj.get()))
        {
            fn->closure.reset();
            fn->defaults.clear();
            fn->kw_defaults.clear();
        }
        else if (auto* cls = dynamic_cast<ClassObject*>(obj.get()))
        {
            cls->attrs.clear();
        }
        else if (auto* inst = dynamic_cast<InstanceObject*>(obj.get()))
        {
            inst->attrs.clear();
            inst->args.clear();
        }
    }
    globals_->vars.clear();
}

void Interpreter::track(const std::shared_ptr<runtime::Object>& obj)
{
    objects_.push_back(obj);
    if (objects_.size() >= prune_at_)
    {
        std::erase_if(objects_, [](const auto& w) { return w.expired(); });
        std::erase_if(envs_, [](const auto& w) { return w.expired(); });
        prune_at_ = std::max<std::size_t>(1024, objects_.size() * 2);
    }
}

Outcome Interpreter::run(const Module& module)
{
    const Completion c = exec_block(module.body, globals_);
    if (c.flow == Flow::Raise)
    {
        return take_outcome(std::nullopt);
    }
    return take_outcome(Value::none());
}

Outcome Interpreter::call(std::string_view name, std::vector<Value> args)
{
    const auto fn = global(name);
    if (!fn.has_value())
    {
        raise("NameError", "name '" + std::string(name) + "' is not defined");
        return take_outcome(std::nullopt);
    }
    return take_outcome(call_value(*fn, std::move(args)));
}

bool Interpreter::has_callable(std::string_view name) const
{
    const auto v = global(name);
    if (!v.has_value())
    {
        return false;
    }
    return as<FunctionObject>(*v) != nullptr || as<NativeFunction>(*v) != nullptr ||
           as<ClassObject>(*v) != nullptr || as<BoundMethod>(*v) != nullptr ||
           as<BuiltinType>(*v) != nullptr;
}

std::optional<Value> Interpreter::global(std::string_view name) const
{
    const auto it = globals_->vars.find(name);
    if (it == globals_->vars.end())
    {
        return std::nullopt;
    }
    return it->second;
}

Outcome Interpreter::take_outcome(EvalResult result)
{
    Outcome out;
    if (result.has_value())
    {
        out.kind = Outcome::Kind::Ok;
        out.value = std::move(*result);
        return out;
    }

    if (!pending_.has_value())
    {
        out.kind = Outcome::Kind::Raised;
        out.exception_type = "SystemError";
        out.message = "evaluation stopped without an exception";
    }
    else
    {
        switch (pending_->fatal)
        {
        case Fatal::Timeout:
            out.kind = Outcome::Kind::Timeout;
            out.message = pending_->message;
            break;
        case Fatal::MemoryExceeded:
            out.kind = Outcome::Kind::MemoryExceeded;
            out.exception_type = "MemoryError";
            out.message = pending_->message;
            break;
        case Fatal::Forbidden:
            out.kind = Outcome::Kind::Forbidden;
            out.message = pending_->message;
            break;
        case Fatal::GeneratorFull:
        case Fatal::None:
            out.kind = Outcome::Kind::Raised;
            out.exception_type = rt::type_name(pending_->exception);
            if (const auto inst = as<InstanceObject>(pending_->exception))
            {
                out.message = inst->exception_message();
            }
            break;
        }
    }

    pending_.reset();
    handling_.clear();
    frames_.clear();
    yield_sinks_.clear();
    return out;
}

// --- exceptions -------------------------------------------------------------

std::shared_ptr<ClassObject> Interpreter::exception_class(std::string_view name) const
{
    const auto it = intrinsics_.find(name);
    if (it != intrinsics_.end())
    {
        if (auto cls = as<ClassObject>(it->second); cls != nullptr && cls->is_exception)
        {
            return cls;
        }
    }
    const auto fallback = intrinsics_.find("Exception");
    return fallback != intrinsics_.end() ? as<ClassObject>(fallback->second) : nullptr;
}

Value Interpreter::make_exception(std::string_view type, std::vector<Value> args)
{
    auto inst = std::make_shared<InstanceObject>(exception_class(type));
    inst->args = std::move(args);
    return Value::object(std::move(inst));
}

void Interpreter::set_pending(Value exception)
{
    if (pending_is_fatal())
    {
        return;
    }
    pending_ = Pending{.exception = std::move(exception), .fatal = Fatal::None, .message = {}};
}

void Interpreter::set_fatal(Fatal kind, std::string message)
{
    if (pending_is_fatal())
    {
        return;
    }
    pending_ = Pending{.exception = Value::none(), .fatal = kind, .message = std::move(message)};
}

std::nullopt_t Interpreter::raise(std::string_view type, std::string message)
{
    set_pending(make_exception(type, {Value::str(std::move(message))}));
    return std::nullopt;
}

std::nullopt_t Interpreter::raise_bare(std::string_view type)
{
    set_pending(make_exception(type, {}));
    return std::nullopt;
}

std::nullopt_t Interpreter::raise_with(std::string_view type, Value arg)
{
    set_pending(make_exception(type, {std::move(arg)}));
    return std::nullopt;
}

std::nullopt_t Interpreter::forbid(std::string message)
{
    set_fatal(Fatal::Forbidden, std::move(message));
    return std::nullopt;
}

std::nullopt_t Interpreter::out_of_memory(std::string message)
{
    set_fatal(Fatal::MemoryExceeded, std::move(message));
    return std::nullopt;
}

// --- limits -----------------------------------------------------------------

bool Interpreter::tick()
{
    if (pending_is_fatal())
    {
        return false;
    }
    ++steps_;
    if (steps_ % kCancelCheckInterval == 0 && cancel_ != nullptr &&
        cancel_->load(std::memory_order_relaxed))
    {
        set_fatal(Fatal::Timeout, "execution timed out");
        return false;
    }
    if (steps_ % kMemoryCheckInterval == 0)
    {
        sample_memory();
        return !pending_is_fatal();
    }
    return true;
}

void Interpreter::sample_memory()
{
    const std::uint64_t rss = current_rss_bytes();
    const std::uint64_t growth = rss > baseline_rss_ ? rss - baseline_rss_ : 0;
    peak_growth_ = std::max(peak_growth_, growth);
    if (growth > limits_.max_memory_bytes)
    {
        set_fatal(Fatal::MemoryExceeded, "memory limit exceeded (" +
                                             std::to_string(limits_.max_memory_bytes) +
                                             " bytes)");
    }
}

bool Interpreter::guard_allocation(std::size_t items)
{
    if (rt::estimated_bytes(items) > limits_.max_memory_bytes)
    {
        out_of_memory("allocation of " + std::to_string(items) +
                      " items exceeds the memory limit");
        return false;
    }
    return true;
}

void Interpreter::write_output(std::string_view text)
{
    const std::size_t room =
        output_.size() < limits_.max_output_bytes ? limits_.max_output_bytes - output_.size() : 0;
    if (text.size() > room)
    {
        output_.append(text.substr(0, room));
        output_truncated_ = true;
        return;
    }
    output_.append(text);
}

// --- statements -------------------------------------------------------------

Interpreter::Completion Interpreter::exec_block(const std::vector<Stmt>& body, const EnvPtr& env)
{
    for (const auto& stmt : body)
    {
        Completion c = exec_stmt(stmt, env);
        if (c.flow != Flow::Normal)
        {
            return c;
        }
    }
    return {};
}

Interpreter::Completion Interpreter::exec_stmt(const Stmt& stmt, const EnvPtr& env)
{
    if (!tick())
    {
        return raised();
    }
    return std::visit(
        [&](const auto& node) -> Completion
        {
            using Node = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<Node, ExprStmt>)
            {
                if (!eval(node.value, env).has_value())
                {
                    return raised();
                }
                return {};
            }
            else if constexpr (std::is_same_v<Node, AssignStmt>)
            {
                const auto value = eval(node.value, env);
                if (!value.has_value())
                {
                    return raised();
                }
                for (const auto& target : node.targets)
                {
                    if (!assign(target, *value, env))
                    {
                        return raised();
                    }
                }
                return {};
            }
            else if constexpr (std::is_same_v<Node, AugAssignStmt>)
            {
                return exec_aug_assign(node, env);
            }
            else if constexpr (std::is_same_v<Node, AnnAssignStmt>)
            {
                if (node.value.has_value())
                {
                    const auto value = eval(*node.value, env);
                    if (!value.has_value() || !assign(node.target, *value, env))
                    {
                        return raised();
                    }
                }
                return {};
            }
            else if constexpr (std::is_same_v<Node, ReturnStmt>)
            {
                Value result = Value::none();
                if (node.value.has_value())
                {
                    auto v = eval(*node.value, env);
                    if (!v.has_value())
                    {
                        return raised();
                    }
                    result = std::move(*v);
                }
                return Completion{.flow = Flow::Return, .value = std::move(result)};
            }
            else if constexpr (std::is_same_v<Node, BreakStmt>)
            {
                return Completion{.flow = Flow::Break, .value = {}};
            }
            else if constexpr (std::is_same_v<Node, ContinueStmt>)
            {
                return Completion{.flow = Flow::Continue, .value = {}};
            }
            else if constexpr (std::is_same_v<Node, RaiseStmt>)
            {
                return exec_raise(node, env);
            }
            else if constexpr (std::is_same_v<Node, DelStmt>)
            {
                for (const auto& target : node.targets)
                {
                    Completion c = exec_del(target, env);
                    if (c.flow != Flow::Normal)
                    {
                        return c;
                    }
                }
                return {};
            }
            else if constexpr (std::is_same_v<Node, AssertStmt>)
            {
                const auto test = eval(node.test, env);
                if (!test.has_value())
                {
                    return raised();
                }
                if (rt::truthy(*test))
                {
                    return {};
                }
                std::vector<Value> args;
                if (node.msg.has_value())
                {
                    auto msg = eval(*node.msg, env);
                    if (!msg.has_value())
                    {
                        return raised();
                    }
                    args.push_back(std::move(*msg));
                }
                set_pending(make_exception("AssertionError", std::move(args)));
                return raised();
            }
            else if constexpr (std::is_same_v<Node, ImportStmt>)
            {
                return exec_import(node, env);
            }
            else if constexpr (std::is_same_v<Node, ImportFromStmt>)
            {
                return exec_import_from(node, env);
            }
            else if constexpr (std::is_same_v<Node, IfStmt>)
            {
                return exec_if(node, env);
            }
            else if constexpr (std::is_same_v<Node, WhileStmt>)
            {
                return exec_while(node, env);
            }
            else if constexpr (std::is_same_v<Node, ForStmt>)
            {
                return exec_for(node, env);
            }
            else if constexpr (std::is_same_v<Node, TryStmt>)
            {
                return exec_try(node, env);
            }
            else if constexpr (std::is_same_v<Node, WithStmt>)
            {
                if (node.is_async)
                {
                    raise("NotImplementedError", "async with is not supported");
                    return raised();
                }
                return exec_with(node, 0, env);
            }
            else if constexpr (std::is_same_v<Node, FunctionDef>)
            {
                return exec_def(node, env);
            }
            else if constexpr (std::is_same_v<Node, ClassDef>)
            {
                return exec_class(node, env);
            }
            else
            {
                // pass, global and nonlocal have no runtime effect.
                return {};
            }
        },
        stmt.node);
}

EvalResult Interpreter::augmented(TokenKind op, const Value& current, const Value& rhs)
{
    if (op == TokenKind::Plus && current.is_list())
    {
        auto items = iterate(rhs);
        if (!items.has_value())
        {
            return std::nullopt;
        }
        auto& target = current.as_list()->items;
        if (!guard_allocation(target.size() + items->size()))
        {
            return std::nullopt;
        }
        target.insert(target.end(), items->begin(), items->end());
        return current;
    }
    return binary_op(op, current, rhs);
}

Interpreter::Completion Interpreter::exec_aug_assign(const AugAssignStmt& s, const EnvPtr& env)
{
    if (const auto* name = std::get_if<NameExpr>(&s.target.node))
    {
        const auto current = lookup(name->name, env);
        if (!current.has_value())
        {
            return raised();
        }
        const auto rhs = eval(s.value, env);
        if (!rhs.has_value())
        {
            return raised();
        }
        auto result = augmented(s.op, *current, *rhs);
        if (!result.has_value())
        {
            return raised();
        }
        bind(name->name, std::move(*result), env);
        return {};
    }
    if (const auto* attr = std::get_if<AttributeExpr>(&s.target.node))
    {
        const auto obj = eval(*attr->value, env);
        if (!obj.has_value())
        {
            return raised();
        }
        const auto current = get_attribute(*obj, attr->attr);
        if (!current.has_value())
        {
            return raised();
        }
        const auto rhs = eval(s.value, env);
        if (!rhs.has_value())
        {
            return raised();
        }
        auto result = augmented(s.op, *current, *rhs);
        if (!result.has_value() || !set_attribute(*obj, attr->attr, std::move(*result)))
        {
            return raised();
        }
        return {};
    }
    if (const auto* sub = std::get_if<SubscriptExpr>(&s.target.node))
    {
        const auto obj = eval(*sub->value, env);
        if (!obj.has_value())
        {
            return raised();
        }
        const auto index = eval(*sub->index, env);
        if (!index.has_value())
        {
            return raised();
        }
        const auto current = get_item(*obj, *index);
        if (!current.has_value())
        {
            return raised();
        }
        const auto rhs = eval(s.value, env);
        if (!rhs.has_value())
        {
            return raised();
        }
        auto result = augmented(s.op, *current, *rhs);
        if (!result.has_value() || !set_item(*obj, *index, std::move(*result)))
        {
            return raised();
        }
        return {};
    }
    raise("SyntaxError", "illegal expression for augmented assignment");
    return raised();
}

Interpreter::Completion Interpreter::exec_if(const IfStmt& s, const EnvPtr& env)
{
    const auto test = eval(s.test, env);
    if (!test.has_value())
    {
        return raised();
    }
    return exec_block(rt::truthy(*test) ? s.body : s.orelse, env);
}

Interpreter::Completion Interpreter::exec_while(const WhileStmt& s, const EnvPtr& env)
{
    while (true)
    {
        if (!tick())
        {
            return raised();
        }
        const auto test = eval(s.test, env);
        if (!test.has_value())
        {
            return raised();
        }
        if (!rt::truthy(*test))
        {
            return exec_block(s.orelse, env);
        }
        Completion c = exec_block(s.body, env);
        if (c.flow == Flow::Break)
        {
            return {};
        }
        if (c.flow == Flow::Return || c.flow == Flow::Raise)
        {
            return c;
        }
    }
}

Interpreter::Completion Interpreter::exec_for(const ForStmt& s, const EnvPtr& env)
{
    if (s.is_async)
    {
        raise("NotImplementedError", "async for is not supported");
        return raised();
    }
    const auto iterable = eval(s.iter, env);
    if (!iterable.has_value())
    {
        return raised();
    }

    // Returns true when the loop must stop; `out` then holds the completion to propagate.
    bool broke = false;
    auto step = [&](const Value& item, Completion& out) -> bool
    {
        if (!tick() || !assign(s.target, item, env))
        {
            out = raised();
            return true;
        }
        Completion c = exec_block(s.body, env);
        if (c.flow == Flow::Break)
        {
            broke = true;
            out = {};
            return true;
        }
        if (c.flow == Flow::Return || c.flow == Flow::Raise)
        {
            out = std::move(c);
            return true;
        }
        return false;
    };

    Completion out;
    if (const auto range = as<RangeObject>(*iterable))
    {
        const std::size_t n = range->size();
        for (std::size_t i = 0; i < n; ++i)
        {
            if (step(Value::integer(range->at(i)), out))
            {
                return out;
            }
        }
    }
    else if (const auto it = as<IteratorObject>(*iterable))
    {
        while (it->pos < it->items.size())
        {
            const Value item = it->items[it->pos++];
            if (step(item, out))
            {
                return out;
            }
        }
    }
    else
    {
        const auto items = iterate(*iterable);
        if (!items.has_value())
        {
            return raised();
        }
        for (const auto& item : *items)
        {
            if (step(item, out))
            {
                return out;
            }
        }
    }
    if (broke)
    {
        return {};
    }
    return exec_block(s.orelse, env);
}

Interpreter::Completion Interpreter::exec_try(const TryStmt& s, const EnvPtr& env)
{
    Completion c = exec_block(s.body, env);

    if (c.flow == Flow::Raise && pending_.has_value() && !pending_is_fatal())
    {
        const Value exc = pending_->exception;
        for (const auto& handler : s.handlers)
        {
            bool matches = true;
            if (handler.type.has_value())
            {
                pending_.reset();
                const auto type = eval(*handler.type, env);
                if (!type.has_value())
                {
                    c = raised();
                    break;
                }
                const auto is = is_instance(exc, *type);
                if (!is.has_value())
                {
                    c = raised();
                    break;
                }
                matches = *is;
                if (!matches)
                {
                    set_pending(exc);
                }
            }
            if (!matches)
            {
                continue;
            }

            pending_.reset();
            if (handler.name.has_value())
            {
                bind(*handler.name, exc, env);
            }
            handling_.push_back(exc);
            c = exec_block(handler.body, env);
            handling_.pop_back();
            if (handler.name.has_value())
            {
                env->vars.erase(std::string(*handler.name));
            }
            break;
        }
    }
    else if (c.flow == Flow::Normal)
    {
        c = exec_block(s.orelse, env);
    }

    if (!s.finalbody.empty() && !pending_is_fatal())
    {
        std::optional<Pending> saved = std::move(pending_);
        pending_.reset();
        Completion f = exec_block(s.finalbody, env);
        if (f.flow == Flow::Normal)
        {
            pending_ = std::move(saved);
            return c;
        }
        return f;
    }
    return c;
}

Interpreter::Completion Interpreter::exec_with(const WithStmt& s, std::size_t item,
                                               const EnvPtr& env)
{
    if (item == s.items.size())
    {
        return exec_block(s.body, env);
    }
    const WithItem& w = s.items[item];
    const auto ctx = eval(w.context, env);
    if (!ctx.has_value())
    {
        return raised();
    }
    const auto enter = find_method(*ctx, "__enter__");
    const auto exit = find_method(*ctx, "__exit__");
    if (!enter.has_value() || !exit.has_value())
    {
        raise("TypeError", "'" + rt::type_name(*ctx) +
                               "' object does not support the context manager protocol");
        return raised();
    }
    const auto entered = call_value(*enter, {});
    if (!entered.has_value())
    {
        return raised();
    }
    if (w.target.has_value() && !assign(*w.target, *entered, env))
    {
        return raised();
    }

    Completion c = exec_with(s, item + 1, env);
    if (pending_is_fatal())
    {
        return c;
    }
    if (c.flow == Flow::Raise && pending_.has_value())
    {
        const Value exc = pending_->exception;
        pending_.reset();
        const auto suppress = call_value(*exit, {type_of(exc), exc, Value::none()});
        if (!suppress.has_value())
        {
            return raised();
        }
        if (rt::truthy(*suppress))
        {
            return {};
        }
        set_pending(exc);
        return c;
    }
    if (!call_value(*exit, {Value::none(), Value::none(), Value::none()}).has_value())
    {
        return raised();
    }
    return c;
}

Interpreter::Completion Interpreter::exec_import(const ImportStmt& s, const EnvPtr& env)
{
    for (const auto& alias : s.names)
    {
        if (registry_->is_forbidden_module(alias.name))
        {
            forbid("forbidden import: " + alias.name);
            return raised();
        }
        const auto module = load_module(alias.name);
        if (!module.has_value())
        {
            return raised();
        }
        if (alias.asname.has_value())
        {
            bind(*alias.asname, *module, env);
            continue;
        }
        const std::string root = alias.name.substr(0, alias.name.find('.'));
        const auto root_module = load_module(root);
        if (!root_module.has_value())
        {
            return raised();
        }
        bind(root, *root_module, env);
    }
    return {};
}

Interpreter::Completion Interpreter::exec_import_from(const ImportFromStmt& s, const EnvPtr& env)
{
    if (s.level > 0)
    {
        raise("ImportError", "attempted relative import with no known parent package");
        return raised();
    }
    if (registry_->is_forbidden_module(s.module))
    {
        forbid("forbidden import from module: " + s.module);
        return raised();
    }
    const auto module_value = load_module(s.module);
    if (!module_value.has_value())
    {
        return raised();
    }
    const auto module = as<ModuleObject>(*module_value);

    for (const auto& alias : s.names)
    {
        if (alias.name == "*")
        {
            for (const auto& [name, value] : module->attrs)
            {
                if (!name.empty() && name[0] != '_')
                {
                    bind(name, value, env);
                }
            }
            continue;
        }
        const std::string qualified = s.module + "." + alias.name;
        if (registry_->is_forbidden_module(qualified) ||
            registry_->is_forbidden_callable(qualified))
        {
            forbid("forbidden import: " + qualified);
            return raised();
        }
        const auto it = module->attrs.find(alias.name);
        if (it == module->attrs.end())
        {
            raise("ImportError",
                  "cannot import name '" + alias.name + "' from '" + s.module + "'");
            return raised();
        }
        if (alias.asname.has_value())
        {
            bind(*alias.asname, it->second, env);
        }
        else
        {
            bind(alias.name, it->second, env);
        }
    }
    return {};
}

EvalResult Interpreter::load_module(std::string_view name)
{
    const auto it = modules_.find(name);
    if (it == modules_.end())
    {
        return raise("ModuleNotFoundError", "No module named '" + std::string(name) + "'");
    }
    return Value::object(it->second);
}

Interpreter::Completion Interpreter::exec_def(const FunctionDef& s, const EnvPtr& env)
{
    std::vector<Value> decorators;
    for (const auto& d : s.decorators)
    {
        auto v = eval(d, env);
        if (!v.has_value())
        {
            return raised();
        }
        decorators.push_back(std::move(*v));
    }
    auto fn = make_function(&s, nullptr, env);
    if (!fn.has_value())
    {
        return raised();
    }
    for (auto it = decorators.rbegin(); it != decorators.rend(); ++it)
    {
        fn = call_value(*it, {std::move(*fn)});
        if (!fn.has_value())
        {
            return raised();
        }
    }
    bind(s.name, std::move(*fn), env);
    return {};
}

Interpreter::Completion Interpreter::exec_class(const ClassDef& s, const EnvPtr& env)
{
    std::vector<Value> decorators;
    for (const auto& d : s.decorators)
    {
        auto v = eval(d, env);
        if (!v.has_value())
        {
            return raised();
        }
        decorators.push_back(std::move(*v));
    }

    std::shared_ptr<ClassObject> base;
    for (const auto& arg : s.bases)
    {
        if (arg.kind != Argument::Kind::Positional)
        {
            raise("TypeError", "class keyword arguments are not supported");
            return raised();
        }
        const auto v = eval(*arg.value, env);
        if (!v.has_value())
        {
            return raised();
        }
        if (as<TypingObject>(*v) != nullptr)
        {
            continue;
        }
        if (const auto bt = as<BuiltinType>(*v))
        {
            raise("TypeError", "subclassing builtin type '" + bt->name + "' is not supported");
            return raised();
        }
        auto cls = as<ClassObject>(*v);
        if (cls == nullptr)
        {
            raise("TypeError", "bases must be classes");
            return raised();
        }
        if (base != nullptr && cls != object_class_)
        {
            raise("TypeError", "multiple inheritance is not supported");
            return raised();
        }
        if (base == nullptr || base == object_class_)
        {
            base = std::move(cls);
        }
    }
    if (base == nullptr)
    {
        base = object_class_;
    }

    auto body_env = std::make_shared<Env>();
    body_env->kind = EnvKind::Class;
    body_env->parent = env;
    Completion c = exec_block(s.body, body_env);
    if (c.flow == Flow::Raise)
    {
        return c;
    }

    auto cls = std::make_shared<ClassObject>();
    cls->name = std::string(s.name);
    cls->base = base;
    cls->is_exception = base != nullptr && base->is_exception;
    cls->attrs = std::move(body_env->vars);
    for (auto& [name, value] : cls->attrs)
    {
        if (const auto fn = as<FunctionObject>(value))
        {
            fn->owner = cls;
        }
    }
    track(cls);

    Value result = Value::object(cls);
    for (auto it = decorators.rbegin(); it != decorators.rend(); ++it)
    {
        auto decorated = call_value(*it, {std::move(result)});
        if (!decorated.has_value())
        {
            return raised();
        }
        result = std::move(*decorated);
    }
    bind(s.name, std::move(result), env);
    return {};
}

Interpreter::Completion Interpreter::exec_raise(const RaiseStmt& s, const EnvPtr& env)
{
    if (!s.exc.has_value())
    {
        if (handling_.empty())
        {
            raise("RuntimeError", "No active exception to reraise");
        }
        else
        {
            set_pending(handling_.back());
        }
        return raised();
    }
    auto v = eval(*s.exc, env);
    if (!v.has_value())
    {
        return raised();
    }
    if (s.cause.has_value() && !eval(*s.cause, env).has_value())
    {
        return raised();
    }
    if (const auto cls = as<ClassObject>(*v); cls != nullptr && cls->is_exception)
    {
        v = instantiate(cls, {}, {});
        if (!v.has_value())
        {
            return raised();
        }
    }
    const auto inst = as<InstanceObject>(*v);
    if (inst == nullptr || !inst->cls->is_exception)
    {
        raise("TypeError", "exceptions must derive from BaseException");
        return raised();
    }
    set_pending(std::move(*v));
    return raised();
}

Interpreter::Completion Interpreter::exec_del(const Expr& target, const EnvPtr& env)
{
    if (const auto* name = std::get_if<NameExpr>(&target.node))
    {
        Env* scope = env.get();
        if (scope->info != nullptr && scope->info->globals.contains(name->name))
        {
            scope = globals_.get();
        }
        const auto it = scope->vars.find(name->name);
        if (it == scope->vars.end())
        {
            raise("NameError", "name '" + std::string(name->name) + "' is not defined");
            return raised();
        }
        scope->vars.erase(it);
        return {};
    }
    if (const auto* sub = std::get_if<SubscriptExpr>(&target.node))
    {
        const auto obj = eval(*sub->value, env);
        if (!obj.has_value())
        {
            return raised();
        }
        const auto index = eval(*sub->index, env);
        if (!index.has_value() || !del_item(*obj, *index))
        {
            return raised();
        }
        return {};
    }
    if (const auto* attr = std::get_if<AttributeExpr>(&target.node))
    {
        if (registry_->is_forbidden_attribute(attr->attr))
        {
            forbid("forbidden attribute access: ." + std::string(attr->attr));
            return raised();
        }
        const auto obj = eval(*attr->value, env);
        if (!obj.has_value())
        {
            return raised();
        }
        if (const auto inst = as<InstanceObject>(*obj))
        {
            if (inst->attrs.erase(std::string(attr->attr)) > 0)
            {
                return {};
            }
        }
        raise("AttributeError", "'" + rt::type_name(*obj) + "' object has no attribute '" +
                                    std::string(attr->attr) + "'");
        return raised();
    }
    if (const auto* tuple = std::get_if<TupleExpr>(&target.node))
    {
        for (const auto& elt : tuple->elts)
        {
            Completion c = exec_del(elt, env);
            if (c.flow != Flow::Normal)
            {
                return c;
            }
        }
        return {};
    }
    if (const auto* list = std::get_if<ListExpr>(&target.node))
    {
        for (const auto& elt : list->elts)
        {
            Completion c = exec_del(elt, env);
            if (c.flow != Flow::Normal)
            {
                return c;
            }
        }
        return {};
    }
    raise("SyntaxError", "cannot delete expression");
    return raised();
}

// --- expressions ------------------------------------------------------------

EvalResult Interpreter::eval(const Expr& expr, const EnvPtr& env)
{
    return std::visit(
        [&](const auto& node) -> EvalResult
        {
            using Node = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<Node, NameExpr>)
            {
                return lookup(node.name, env);
            }
            else if constexpr (std::is_same_v<Node, ConstantExpr>)
            {
                switch (node.kind)
                {
                case ConstantExpr::Kind::None:
                    return Value::none();
                case ConstantExpr::Kind::True:
                    return Value::boolean(true);
                case ConstantExpr::Kind::False:
                    return Value::boolean(false);
                case ConstantExpr::Kind::Ellipsis:
                    return ellipsis_;
                }
                return Value::none();
            }
            else if constexpr (std::is_same_v<Node, NumberExpr>)
            {
                return eval_number(node.lexeme);
            }
            else if constexpr (std::is_same_v<Node, StringExpr>)
            {
                return node.is_bytes ? Value::bytes(node.value) : Value::str(node.value);
            }
            else if constexpr (std::is_same_v<Node, FStringExpr>)
            {
                return eval_fstring(node, env);
            }
            else if constexpr (std::is_same_v<Node, UnaryExpr>)
            {
                const auto operand = eval(*node.operand, env);
                if (!operand.has_value())
                {
                    return std::nullopt;
                }
                return unary_op(node.op, *operand);
            }
            else if constexpr (std::is_same_v<Node, BinaryExpr>)
            {
                const auto lhs = eval(*node.lhs, env);
                if (!lhs.has_value())
                {
                    return std::nullopt;
                }
                const auto rhs = eval(*node.rhs, env);
                if (!rhs.has_value())
                {
                    return std::nullopt;
                }
                return binary_op(node.op, *lhs, *rhs);
            }
            else if constexpr (std::is_same_v<Node, BoolOpExpr>)
            {
                EvalResult last;
                for (const auto& v : node.values)
                {
                    last = eval(v, env);
                    if (!last.has_value())
                    {
                        return std::nullopt;
                    }
                    const bool t = rt::truthy(*last);
                    if (node.op == TokenKind::KwAnd ? !t : t)
                    {
                        return last;
                    }
                }
                return last;
            }
            else if constexpr (std::is_same_v<Node, CompareExpr>)
            {
                return eval_compare(node, env);
            }
            else if constexpr (std::is_same_v<Node, CallExpr>)
            {
                return eval_call(node, env);
            }
            else if constexpr (std::is_same_v<Node, AttributeExpr>)
            {
                const auto obj = eval(*node.value, env);
                if (!obj.has_value())
                {
                    return std::nullopt;
                }
                return get_attribute(*obj, node.attr);
            }
            else if constexpr (std::is_same_v<Node, SubscriptExpr>)
            {
                const auto obj = eval(*node.value, env);
                if (!obj.has_value())
                {
                    return std::nullopt;
                }
                const auto index = eval(*node.index, env);
                if (!index.has_value())
                {
                    return std::nullopt;
                }
                return get_item(*obj, *index);
            }
            else if constexpr (std::is_same_v<Node, SliceExpr>)
            {
                return make_slice(node, env);
            }
            else if constexpr (std::is_same_v<Node, ListExpr>)
            {
                auto items = eval_elements(node.elts, env);
                if (!items.has_value())
                {
                    return std::nullopt;
                }
                return Value::list(std::move(*items));
            }
            else if constexpr (std::is_same_v<Node, TupleExpr>)
            {
                auto items = eval_elements(node.elts, env);
                if (!items.has_value())
                {
                    return std::nullopt;
                }
                return Value::tuple(std::move(*items));
            }
            else if constexpr (std::is_same_v<Node, SetExpr>)
            {
                auto items = eval_elements(node.elts, env);
                if (!items.has_value())
                {
                    return std::nullopt;
                }
                for (const auto& item : *items)
                {
                    if (!rt::hashable(item))
                    {
                        return raise("TypeError",
                                     "unhashable type: '" + rt::type_name(item) + "'");
                    }
                }
                return Value::set(std::move(*items));
            }
            else if constexpr (std::is_same_v<Node, DictExpr>)
            {
                return eval_dict(node, env);
            }
            else if constexpr (std::is_same_v<Node, ComprehensionExpr>)
            {
                return eval_comprehension(node, env);
            }
            else if constexpr (std::is_same_v<Node, LambdaExpr>)
            {
                return make_function(nullptr, &node, env);
            }
            else if constexpr (std::is_same_v<Node, IfExpr>)
            {
                const auto test = eval(*node.test, env);
                if (!test.has_value())
                {
                    return std::nullopt;
                }
                return eval(rt::truthy(*test) ? *node.body : *node.orelse, env);
            }
            else if constexpr (std::is_same_v<Node, StarredExpr>)
            {
                return raise("SyntaxError", "can't use starred expression here");
            }
            else if constexpr (std::is_same_v<Node, NamedExpr>)
            {
                auto value = eval(*node.value, env);
                if (!value.has_value())
                {
                    return std::nullopt;
                }
                EnvPtr target = env;
                while (target->kind == EnvKind::Comprehension && target->parent != nullptr)
                {
                    target = target->parent;
                }
                bind(node.target, *value, target);
                return value;
            }
            else if constexpr (std::is_same_v<Node, AwaitExpr>)
            {
                return raise("NotImplementedError", "await is not supported");
            }
            else
            {
                static_assert(std::is_same_v<Node, YieldExpr>);
                return eval_yield(node, env);
            }
        },
        expr.node);
}

EvalResult Interpreter::eval_yield(const YieldExpr& e, const EnvPtr& env)
{
    if (yield_sinks_.empty())
    {
        return raise("SyntaxError", "'yield' outside function");
    }
    Value value = Value::none();
    if (e.value != nullptr)
    {
        auto v = eval(*e.value, env);
        if (!v.has_value())
        {
            return std::nullopt;
        }
        value = std::move(*v);
    }
    std::vector<Value>& sink = *yield_sinks_.back();
    std::vector<Value> produced;
    if (e.is_from)
    {
        auto items = iterate(value);
        if (!items.has_value())
        {
            return std::nullopt;
        }
        produced = std::move(*items);
    }
    else
    {
        produced.push_back(std::move(value));
    }
    for (auto& item : produced)
    {
        if (sink.size() >= limits_.max_generator_items)
        {
            set_fatal(Fatal::GeneratorFull, "generator item limit reached");
            return std::nullopt;
        }
        sink.push_back(std::move(item));
    }
    return Value::none();
}

EvalResult Interpreter::eval_number(std::string_view lexeme)
{
    std::string text;
    for (const char c : lexeme)
    {
        if (c != '_')
        {
            text.push_back(c);
        }
    }
    if (!text.empty() && (text.back() == 'j' || text.back() == 'J'))
    {
        return raise("ValueError", "complex numbers are not supported");
    }

    int base = 10;
    std::size_t start = 0;
    if (text.size() > 2 && text[0] == '0')
    {
        const char p = static_cast<char>(text[1] | 0x20);
        if (p == 'x')
        {
            base = 16;
        }
        else if (p == 'o')
        {
            base = 8;
        }
        else if (p == 'b')
        {
            base = 2;
        }
        if (base != 10)
        {
            start = 2;
        }
    }
    if (base == 10 && text.find_first_of(".eE") != std::string::npos)
    {
        return Value::floating(std::strtod(text.c_str(), nullptr));
    }

    std::int64_t value = 0;
    const char* first = text.data() + start;
    const char* last = text.data() + text.size();
    const auto res = std::from_chars(first, last, value, base);
    if (res.ec == std::errc::result_out_of_range)
    {
        return raise("OverflowError", "integer literal is too large");
    }
    if (res.ec != std::errc() || res.ptr != last)
    {
        return raise("ValueError", "invalid numeric literal '" + std::string(lexeme) + "'");
    }
    return Value::integer(value);
}

EvalResult Interpreter::eval_fstring(const FStringExpr& e, const EnvPtr& env)
{
    std::string out;
    for (const auto& part : e.parts)
    {
        out += part.literal;
        if (part.value == nullptr)
        {
            continue;
        }
        auto value = eval(*part.value, env);
        if (!value.has_value())
        {
            return std::nullopt;
        }
        if (part.conversion == 'r' || part.conversion == 'a')
        {
            auto r = to_repr(*value);
            if (!r.has_value())
            {
                return std::nullopt;
            }
            value = Value::str(std::move(*r));
        }
        else if (part.conversion == 's')
        {
            auto s = to_str(*value);
            if (!s.has_value())
            {
                return std::nullopt;
            }
            value = Value::str(std::move(*s));
        }
        std::string spec;
        if (part.format_spec != nullptr)
        {
            const auto spec_value = eval(*part.format_spec, env);
            if (!spec_value.has_value())
            {
                return std::nullopt;
            }
            spec = rt::str(*spec_value);
        }
        auto formatted = format_value(*this, *value, spec);
        if (!formatted.has_value())
        {
            return std::nullopt;
        }
        out += *formatted;
        if (out.size() > limits_.max_memory_bytes)
        {
            return out_of_memory("string exceeds the memory limit");
        }
    }
    return Value::str(std::move(out));
}

EvalResult Interpreter::eval_compare(const CompareExpr& e, const EnvPtr& env)
{
    auto left = eval(*e.left, env);
    if (!left.has_value())
    {
        return std::nullopt;
    }
    for (std::size_t i = 0; i < e.ops.size(); ++i)
    {
        auto right = eval(e.comparators[i], env);
        if (!right.has_value())
        {
            return std::nullopt;
        }
        const auto r = compare_op(e.ops[i], *left, *right);
        if (!r.has_value())
        {
            return std::nullopt;
        }
        if (!rt::truthy(*r))
        {
            return Value::boolean(false);
        }
        left = std::move(right);
    }
    return Value::boolean(true);
}

EvalResult Interpreter::eval_call(const CallExpr& e, const EnvPtr& env)
{
    const auto callee = eval(*e.callee, env);
    if (!callee.has_value())
    {
        return std::nullopt;
    }
    Args args;
    Kwargs kwargs;
    for (const auto& arg : e.args)
    {
        auto v = eval(*arg.value, env);
        if (!v.has_value())
        {
            return std::nullopt;
        }
        switch (arg.kind)
        {
        case Argument::Kind::Positional:
            args.push_back(std::move(*v));
            break;
        case Argument::Kind::Keyword:
            kwargs.emplace_back(std::string(arg.keyword), std::move(*v));
            break;
        case Argument::Kind::Star:
        {
            auto items = iterate(*v);
            if (!items.has_value())
            {
                return std::nullopt;
            }
            args.insert(args.end(), items->begin(), items->end());
            break;
        }
        case Argument::Kind::DoubleStar:
        {
            if (!v->is_dict())
            {
                return raise("TypeError", "argument after ** must be a mapping, not " +
                                              rt::type_name(*v));
            }
            for (const auto& [key, value] : v->as_dict()->items)
            {
                if (!key.is_str())
                {
                    return raise("TypeError", "keywords must be strings");
                }
                kwargs.emplace_back(key.as_str(), value);
            }
            break;
        }
        }
    }
    return call_value(*callee, std::move(args), std::move(kwargs));
}

EvalResult Interpreter::make_slice(const SliceExpr& s, const EnvPtr& env)
{
    auto slice = std::make_shared<SliceObject>();
    auto part = [&](const ExprPtr& e, std::optional<std::int64_t>& out) -> bool
    {
        if (e == nullptr)
        {
            return true;
        }
        const auto v = eval(*e, env);
        if (!v.has_value())
        {
            return false;
        }
        if (v->is_none())
        {
            return true;
        }
        if (!v->is_integral())
        {
            raise("TypeError", "slice indices must be integers or None");
            return false;
        }
        out = v->as_int();
        return true;
    };
    if (!part(s.lower, slice->lower) || !part(s.upper, slice->upper) ||
        !part(s.step, slice->step))
    {
        return std::nullopt;
    }
    return Value::object(std::move(slice));
}

std::optional<std::vector<Value>> Interpreter::eval_elements(const std::vector<Expr>& elts,
                                                             const EnvPtr& env)
{
    std::vector<Value> out;
    out.reserve(elts.size());
    for (const auto& elt : elts)
    {
        if (const auto* starred = std::get_if<StarredExpr>(&elt.node))
        {
            const auto v = eval(*starred->value, env);
            if (!v.has_value())
            {
                return std::nullopt;
            }
            auto items = iterate(*v);
            if (!items.has_value())
            {
                return std::nullopt;
            }
            out.insert(out.end(), items->begin(), items->end());
            continue;
        }
        auto v = eval(elt, env);
        if (!v.has_value())
        {
            return std::nullopt;
        }
        out.push_back(std::move(*v));
    }
    return out;
}

EvalResult Interpreter::eval_dict(const DictExpr& e, const EnvPtr& env)
{
    auto dict = std::make_shared<rt::DictData>();
    for (const auto& item : e.items)
    {
        if (item.key == nullptr)
        {
            const auto other = eval(*item.value, env);
            if (!other.has_value())
            {
                return std::nullopt;
            }
            if (!other->is_dict())
            {
                return raise("TypeError",
                             "'" + rt::type_name(*other) + "' object is not a mapping");
            }
            for (const auto& [k, v] : other->as_dict()->items)
            {
                dict->set(k, v);
            }
            continue;
        }
        auto key = eval(*item.key, env);
        if (!key.has_value())
        {
            return std::nullopt;
        }
        if (!rt::hashable(*key))
        {
            return raise("TypeError", "unhashable type: '" + rt::type_name(*key) + "'");
        }
        auto value = eval(*item.value, env);
        if (!value.has_value())
        {
            return std::nullopt;
        }
        dict->set(std::move(*key), std::move(*value));
    }
    return Value{.data = rt::DictRef(std::move(dict))};
}

EvalResult Interpreter::eval_comprehension(const ComprehensionExpr& e, const EnvPtr& env)
{
    auto scope = std::make_shared<Env>();
    scope->kind = EnvKind::Comprehension;
    scope->parent = env;

    std::vector<Value> out;
    std::vector<std::pair<Value, Value>> dict_out;
    if (!run_generators(e, 0, scope, out, dict_out))
    {
        return std::nullopt;
    }
    switch (e.kind)
    {
    case ComprehensionExpr::Kind::List:
        return Value::list(std::move(out));
    case ComprehensionExpr::Kind::Set:
        for (const auto& item : out)
        {
            if (!rt::hashable(item))
            {
                return raise("TypeError", "unhashable type: '" + rt::type_name(item) + "'");
            }
        }
        return Value::set(std::move(out));
    case ComprehensionExpr::Kind::Dict:
        return Value::dict(std::move(dict_out));
    case ComprehensionExpr::Kind::Generator:
        return Value::object(std::make_shared<IteratorObject>("generator", std::move(out)));
    }
    return Value::none();
}

bool Interpreter::run_generators(const ComprehensionExpr& e, std::size_t level, const EnvPtr& env,
                                 std::vector<Value>& out,
                                 std::vector<std::pair<Value, Value>>& dict_out)
{
    if (level == e.generators.size())
    {
        if (e.kind == ComprehensionExpr::Kind::Dict)
        {
            auto key = eval(*e.elt, env);
            if (!key.has_value())
            {
                return false;
            }
            if (!rt::hashable(*key))
            {
                raise("TypeError", "unhashable type: '" + rt::type_name(*key) + "'");
                return false;
            }
            auto value = eval(*e.value, env);
            if (!value.has_value())
            {
                return false;
            }
            dict_out.emplace_back(std::move(*key), std::move(*value));
        }
        else
        {
            auto value = eval(*e.elt, env);
            if (!value.has_value())
            {
                return false;
            }
            out.push_back(std::move(*value));
        }
        const std::size_t produced = out.size() + dict_out.size();
        return produced % 4096 != 0 || guard_allocation(produced);
    }

    const Comprehension& gen = e.generators[level];
    if (gen.is_async)
    {
        raise("NotImplementedError", "async comprehensions are not supported");
        return false;
    }
    const auto iterable = eval(*gen.iter, env);
    if (!iterable.has_value())
    {
        return false;
    }
    const auto items = iterate(*iterable);
    if (!items.has_value())
    {
        return false;
    }
    for (const auto& item : *items)
    {
        if (!tick() || !assign(*gen.target, item, env))
        {
            return false;
        }
        bool keep = true;
        for (const auto& cond : gen.ifs)
        {
            const auto c = eval(cond, env);
            if (!c.has_value())
            {
                return false;
            }
            if (!rt::truthy(*c))
            {
                keep = false;
                break;
            }
        }
        if (keep && !run_generators(e, level + 1, env, out, dict_out))
        {
            return false;
        }
    }
    return true;
}

// --- names ------------------------------------------------------------------

EvalResult Interpreter::lookup(std::string_view name, const EnvPtr& env)
{
    bool global_only = false;
    if (env->info != nullptr)
    {
        if (env->info->globals.contains(name))
        {
            global_only = true;
        }
        else if (env->info->locals.contains(name))
        {
            const auto it = env->vars.find(name);
            if (it != env->vars.end())
            {
                return it->second;
            }
            return raise("UnboundLocalError", "cannot access local variable '" +
                                                  std::string(name) +
                                                  "' where it is not associated with a value");
        }
    }

    if (!global_only)
    {
        for (const Env* e = env.get(); e != nullptr; e = e->parent.get())
        {
            if (e != env.get() && e->kind == EnvKind::Class)
            {
                continue;
            }
            const auto it = e->vars.find(name);
            if (it != e->vars.end())
            {
                return it->second;
            }
        }
    }
    else if (const auto it = globals_->vars.find(name); it != globals_->vars.end())
    {
        return it->second;
    }

    if (const auto it = builtins_.find(name); it != builtins_.end())
    {
        return it->second;
    }
    return raise("NameError", "name '" + std::string(name) + "' is not defined");
}

void Interpreter::bind(std::string_view name, Value value, const EnvPtr& env)
{
    Env* target = env.get();
    if (target->info != nullptr)
    {
        if (target->info->globals.contains(name))
        {
            target = globals_.get();
        }
        else if (target->info->nonlocals.contains(name))
        {
            for (Env* e = env->parent.get(); e != nullptr; e = e->parent.get())
            {
                if (e->kind == EnvKind::Function && e->info != nullptr &&
                    e->info->locals.contains(name))
                {
                    target = e;
                    break;
                }
            }
        }
    }
    target->vars.insert_or_assign(std::string(name), std::move(value));
}

bool Interpreter::assign(const Expr& target, const Value& value, const EnvPtr& env)
{
    if (const auto* name = std::get_if<NameExpr>(&target.node))
    {
        bind(name->name, value, env);
        return true;
    }
    if (const auto* tuple = std::get_if<TupleExpr>(&target.node))
    {
        return unpack(tuple->elts, value, env);
    }
    if (const auto* list = std::get_if<ListExpr>(&target.node))
    {
        return unpack(list->elts, value, env);
    }
    if (const auto* attr = std::get_if<AttributeExpr>(&target.node))
    {
        const auto obj = eval(*attr->value, env);
        return obj.has_value() && set_attribute(*obj, attr->attr, value);
    }
    if (const auto* sub = std::get_if<SubscriptExpr>(&target.node))
    {
        const auto obj = eval(*sub->value, env);
        if (!obj.has_value())
        {
            return false;
        }
        const auto index = eval(*sub->index, env);
        return index.has_value() && set_item(*obj, *index, value);
    }
    raise("SyntaxError", "cannot assign to expression");
    return false;
}

bool Interpreter::unpack(const std::vector<Expr>& targets, const Value& value, const EnvPtr& env)
{
    const auto items = iterate(value);
    if (!items.has_value())
    {
        return false;
    }
    std::optional<std::size_t> star;
    for (std::size_t i = 0; i < targets.size(); ++i)
    {
        if (std::holds_alternative<StarredExpr>(targets[i].node))
        {
            star = i;
        }
    }

    if (!star.has_value())
    {
        if (items->size() > targets.size())
        {
            raise("ValueError",
                  "too many values to unpack (expected " + std::to_string(targets.size()) + ")");
            return false;
        }
        if (items->size() < targets.size())
        {
            raise("ValueError", "not enough values to unpack (expected " +
                                    std::to_string(targets.size()) + ", got " +
                                    std::to_string(items->size()) + ")");
            return false;
        }
        for (std::size_t i = 0; i < targets.size(); ++i)
        {
            if (!assign(targets[i], (*items)[i], env))
            {
                return false;
            }
        }
        return true;
    }

    const std::size_t after = targets.size() - *star - 1;
    if (items->size() < targets.size() - 1)
    {
        raise("ValueError", "not enough values to unpack (expected at least " +
                                std::to_string(targets.size() - 1) + ", got " +
                                std::to_string(items->size()) + ")");
        return false;
    }
    for (std::size_t i = 0; i < *star; ++i)
    {
        if (!assign(targets[i], (*items)[i], env))
        {
            return false;
        }
    }
    const std::size_t rest_end = items->size() - after;
    std::vector<Value> rest(items->begin() + static_cast<std::ptrdiff_t>(*star),
                            items->begin() + static_cast<std::ptrdiff_t>(rest_end));
    const auto& starred = std::get<StarredExpr>(targets[*star].node);
    if (!assign(*starred.value, Value::list(std::move(rest)), env))
    {
        return false;
    }
    for (std::size_t i = 0; i < after; ++i)
    {
        if (!assign(targets[*star + 1 + i], (*items)[rest_end + i], env))
        {
            return false;
        }
    }
    return true;
}

// --- calls ------------------------------------------------------------------

EvalResult Interpreter::make_function(const FunctionDef* def, const LambdaExpr* lambda,
                                      const EnvPtr& env)
{
    auto fn = std::make_shared<FunctionObject>();
    const Parameters& params = def != nullptr ? *def->params : *lambda->params;

    for (const auto& p : params.positional)
    {
        if (p.default_value == nullptr)
        {
            continue;
        }
        auto v = eval(*p.default_value, env);
        if (!v.has_value())
        {
            return std::nullopt;
        }
        fn->defaults.push_back(std::move(*v));
    }
    for (const auto& p : params.kwonly)
    {
        if (p.default_value == nullptr)
        {
            continue;
        }
        auto v = eval(*p.default_value, env);
        if (!v.has_value())
        {
            return std::nullopt;
        }
        fn->kw_defaults.insert_or_assign(std::string(p.name), std::move(*v));
    }

    fn->closure = env->kind == EnvKind::Class ? env->parent : env;
    const void* key = nullptr;
    if (def != nullptr)
    {
        fn->name = std::string(def->name);
        fn->params = def->params;
        fn->body = def->body;
        fn->is_async = def->is_async;
        key = def->body.get();
    }
    else
    {
        fn->name = "<lambda>";
        fn->params = lambda->params;
        fn->lambda_body = lambda->body;
        key = lambda->body.get();
    }

    auto& cached = scope_cache_[key];
    if (cached == nullptr)
    {
        cached = def != nullptr ? analyze_scope(params, *def->body)
                                : analyze_lambda_scope(params, *lambda->body);
    }
    fn->info = cached;

    envs_.push_back(fn->closure);
    track(fn);
    return Value::object(std::move(fn));
}

EvalResult Interpreter::call_value(const Value& callee, Args args, Kwargs kwargs)
{
    if (!tick())
    {
        return std::nullopt;
    }
    if (const auto fn = as<FunctionObject>(callee))
    {
        return call_function(fn, std::move(args), std::move(kwargs));
    }
    if (const auto native = as<NativeFunction>(callee))
    {
        return native->fn(*this, args, kwargs);
    }
    if (const auto bound = as<BoundMethod>(callee))
    {
        args.insert(args.begin(), bound->self);
        return call_value(bound->callable, std::move(args), std::move(kwargs));
    }
    if (const auto cls = as<ClassObject>(callee))
    {
        return instantiate(cls, std::move(args), std::move(kwargs));
    }
    if (const auto type = as<BuiltinType>(callee))
    {
        return type->ctor(*this, args, kwargs);
    }
    if (const auto method = find_method(callee, "__call__"))
    {
        return call_value(*method, std::move(args), std::move(kwargs));
    }
    return raise("TypeError", "'" + rt::type_name(callee) + "' object is not callable");
}

EvalResult Interpreter::call_function(const std::shared_ptr<FunctionObject>& fn, Args args,
                                      Kwargs kwargs)
{
    if (fn->is_async)
    {
        return raise("NotImplementedError", "coroutines are not supported");
    }
    if (frames_.size() >= limits_.max_recursion_depth)
    {
        return raise("RecursionError", "maximum recursion depth exceeded");
    }

    auto env = std::make_shared<Env>();
    env->kind = EnvKind::Function;
    env->parent = fn->closure;
    env->info = fn->info;
    if (!bind_arguments(*fn, args, kwargs, *env))
    {
        return std::nullopt;
    }

    frames_.push_back(Frame{.function = fn.get(), .self = args.empty() ? Value::none() : args[0]});
    struct PopFrame
    {
        std::vector<Frame>& frames;
        ~PopFrame() { frames.pop_back(); }
    } pop{frames_};

    if (fn->lambda_body != nullptr)
    {
        return eval(*fn->lambda_body, env);
    }

    if (fn->info->is_generator)
    {
        std::vector<Value> items;
        yield_sinks_.push_back(&items);
        const Completion c = exec_block(*fn->body, env);
        yield_sinks_.pop_back();
        if (c.flow == Flow::Raise)
        {
            if (pending_.has_value() && pending_->fatal == Fatal::GeneratorFull)
            {
                pending_.reset();
            }
            else
            {
                return std::nullopt;
            }
        }
        return Value::object(std::make_shared<IteratorObject>("generator", std::move(items)));
    }

    Completion c = exec_block(*fn->body, env);
    if (c.flow == Flow::Raise)
    {
        return std::nullopt;
    }
    if (c.flow == Flow::Return)
    {
        return std::move(c.value);
    }
    return Value::none();
}

bool Interpreter::bind_arguments(const FunctionObject& fn, Args& args, Kwargs& kwargs, Env& env)
{
    const Parameters& params = *fn.params;
    const std::size_t npos = params.positional.size();
    const std::string where = fn.name + "()";

    for (std::size_t i = 0; i < std::min(args.size(), npos); ++i)
    {
        env.vars.insert_or_assign(std::string(params.positional[i].name), args[i]);
    }
    if (args.size() > npos)
    {
        if (!params.vararg.has_value())
        {
            raise("TypeError", where + " takes " + std::to_string(npos) +
                                   " positional argument" + (npos == 1 ? "" : "s") + " but " +
                                   std::to_string(args.size()) + " were given");
            return false;
        }
        env.vars.insert_or_assign(
            std::string(params.vararg->name),
            Value::tuple(std::vector<Value>(args.begin() + static_cast<std::ptrdiff_t>(npos),
                                            args.end())));
    }
    else if (params.vararg.has_value())
    {
        env.vars.insert_or_assign(std::string(params.vararg->name), Value::tuple({}));
    }

    std::vector<std::pair<Value, Value>> extra;
    for (auto& [key, value] : kwargs)
    {
        bool placed = false;
        for (std::size_t i = 0; i < npos && !placed; ++i)
        {
            if (params.positional[i].name == key)
            {
                if (i < args.size())
                {
                    raise("TypeError", where + " got multiple values for argument '" + key + "'");
                    return false;
                }
                env.vars.insert_or_assign(key, value);
                placed = true;
            }
        }
        for (std::size_t i = 0; i < params.kwonly.size() && !placed; ++i)
        {
            if (params.kwonly[i].name == key)
            {
                env.vars.insert_or_assign(key, value);
                placed = true;
            }
        }
        if (placed)
        {
            continue;
        }
        if (!params.kwarg.has_value())
        {
            raise("TypeError", where + " got an unexpected keyword argument '" + key + "'");
            return false;
        }
        extra.emplace_back(Value::str(key), value);
    }
    if (params.kwarg.has_value())
    {
        env.vars.insert_or_assign(std::string(params.kwarg->name), Value::dict(std::move(extra)));
    }

    const std::size_t first_default = npos - fn.defaults.size();
    for (std::size_t i = 0; i < npos; ++i)
    {
        const std::string name(params.positional[i].name);
        if (env.vars.contains(name))
        {
            continue;
        }
        if (i >= first_default)
        {
            env.vars.insert_or_assign(name, fn.defaults[i - first_default]);
            continue;
        }
        raise("TypeError", where + " missing required positional argument: '" + name + "'");
        return false;
    }
    for (const auto& p : params.kwonly)
    {
        const std::string name(p.name);
        if (env.vars.contains(name))
        {
            continue;
        }
        const auto it = fn.kw_defaults.find(name);
        if (it == fn.kw_defaults.end())
        {
            raise("TypeError", where + " missing required keyword-only argument: '" + name + "'");
            return false;
        }
        env.vars.insert_or_assign(name, it->second);
    }
    return true;
}

EvalResult Interpreter::instantiate(const std::shared_ptr<ClassObject>& cls, Args args,
                                    Kwargs kwargs)
{
    auto inst = std::make_shared<InstanceObject>(cls);
    if (cls->is_exception)
    {
        inst->args = args;
    }
    track(inst);
    Value self = Value::object(inst);

    if (const Value* init = cls->lookup("__init__"))
    {
        args.insert(args.begin(), self);
        const auto r = call_value(*init, std::move(args), std::move(kwargs));
        if (!r.has_value())
        {
            return std::nullopt;
        }
        if (!r->is_none())
        {
            return raise("TypeError",
                         "__init__() should return None, not '" + rt::type_name(*r) + "'");
        }
    }
    else if (!cls->is_exception && (!args.empty() || !kwargs.empty()))
    {
        return raise("TypeError", cls->name + "() takes no arguments");
    }
    return self;
}

std::optional<Value> Interpreter::find_method(const Value& obj, std::string_view name)
{
    const auto inst = as<InstanceObject>(obj);
    if (inst == nullptr)
    {
        return std::nullopt;
    }
    const Value* method = inst->cls->lookup(name);
    if (method == nullptr)
    {
        return std::nullopt;
    }
    return Value::object(std::make_shared<BoundMethod>(obj, *method));
}

EvalResult Interpreter::current_super()
{
    if (frames_.empty() || frames_.back().function == nullptr)
    {
        return raise("RuntimeError", "super(): no arguments");
    }
    const Frame& frame = frames_.back();
    const auto owner = frame.function->owner.lock();
    if (owner == nullptr)
    {
        return raise("RuntimeError", "super(): __class__ cell not found");
    }
    return Value::object(std::make_shared<SuperObject>(owner->base, frame.self));
}

} // namespace codegate::interp
