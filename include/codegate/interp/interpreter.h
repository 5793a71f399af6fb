#pragma once

#include <atomic>
#include <codegate/interp/objects.h>
#include <codegate/parser/ast.h>
#include <codegate/policy/pattern_registry.h>
#include <codegate/runtime/value.h>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <vector>

/**
 * @file interpreter.h
 * @brief Tree-walking interpreter for the Python subset run by the restricted sandbox.
 *
 * The interpreter never throws. Python exceptions travel as a pending
 * exception: expression evaluation returns nullopt and statements return a
 * Raise completion until a `try` handles it or the run ends. Policy
 * violations, cancellation and memory exhaustion are fatal: `except` clauses
 * do not see them.
 */

namespace codegate::interp
{

struct Limits
{
    std::size_t max_output_bytes = 10000;
    /** Resident-set growth allowed over the level sampled at construction. */
    std::uint64_t max_memory_bytes = 128ull * 1024 * 1024;
    std::size_t max_recursion_depth = 1000;
    /** A generator stops after producing this many items. */
    std::size_t max_generator_items = 100000;
};

/** @brief How a run or call ended. */
struct Outcome
{
    enum class Kind
    {
        Ok,
        Raised,
        Timeout,
        MemoryExceeded,
        Forbidden,
    };
    Kind kind = Kind::Ok;
    Value value;
    std::string exception_type;
    std::string message;
};

class Interpreter
{
  public:
    /**
     * @param registry names that must not be reachable (builtins are filtered through it).
     * @param cancel polled during execution; when set, the run ends with Outcome::Kind::Timeout.
     */
    Interpreter(std::shared_ptr<const codegate::policy::PatternRegistry> registry, Limits limits,
                const std::atomic<bool>* cancel);
    ~Interpreter();

    Interpreter(const Interpreter&) = delete;
    Interpreter& operator=(const Interpreter&) = delete;

    /** @brief Execute a module's top-level statements in this interpreter's globals. */
    [[nodiscard]] Outcome run(const codegate::parser::Module& module);

    /** @brief Call the global `name` with positional arguments. */
    [[nodiscard]] Outcome call(std::string_view name, std::vector<Value> args);

    [[nodiscard]] bool has_callable(std::string_view name) const;
    [[nodiscard]] std::optional<Value> global(std::string_view name) const;

    [[nodiscard]] const std::string& output() const { return output_; }
    [[nodiscard]] bool output_truncated() const { return output_truncated_; }
    /** @brief Largest resident-set growth sampled so far, in bytes. */
    [[nodiscard]] std::uint64_t peak_memory_growth() const { return peak_growth_; }

    // Services used by builtins, methods and modules.

    [[nodiscard]] EvalResult call_value(const Value& callee, Args args, Kwargs kwargs = {});
    /** @brief Set a pending exception of builtin class `type`; returns nullopt for `return raise(...)`. */
    std::nullopt_t raise(std::string_view type, std::string message);
    /** @brief Set a pending exception of class `type` with no arguments. */
    std::nullopt_t raise_bare(std::string_view type);
    /** @brief Set a pending exception carrying `value` as its argument. */
    std::nullopt_t raise_with(std::string_view type, Value arg);
    /** @brief Set a fatal policy violation. */
    std::nullopt_t forbid(std::string message);
    /** @brief Set a fatal memory violation. */
    std::nullopt_t out_of_memory(std::string message);
    /** @brief True while any exception (fatal or not) is pending. */
    [[nodiscard]] bool has_pending() const { return pending_.has_value(); }

    /** @brief Materialize an iterable; single-pass iterators are consumed. */
    [[nodiscard]] std::optional<std::vector<Value>> iterate(const Value& v);
    [[nodiscard]] std::optional<std::string> to_str(const Value& v);
    [[nodiscard]] std::optional<std::string> to_repr(const Value& v);
    /** @brief `==` including user `__eq__`. */
    [[nodiscard]] std::optional<bool> eq(const Value& a, const Value& b);
    /** @brief Ordering for `<` and sorting; raises TypeError for unorderable pairs. */
    [[nodiscard]] std::optional<int> order(const Value& a, const Value& b, std::string_view op);
    [[nodiscard]] std::optional<std::size_t> length(const Value& v);
    [[nodiscard]] EvalResult get_attribute(const Value& obj, std::string_view name);
    [[nodiscard]] EvalResult get_item(const Value& obj, const Value& index);
    [[nodiscard]] EvalResult binary_op(codegate::lexer::TokenKind op, const Value& a,
                                       const Value& b);
    [[nodiscard]] std::optional<bool> contains(const Value& container, const Value& item);
    /** @brief Checks whether `items` more elements fit the memory ceiling; raises when not. */
    [[nodiscard]] bool guard_allocation(std::size_t items);
    /** @brief Append to captured stdout, respecting the output cap. */
    void write_output(std::string_view text);
    /** @brief Count one unit of work; false when the run must stop. */
    [[nodiscard]] bool tick();

    [[nodiscard]] std::shared_ptr<ClassObject> exception_class(std::string_view name) const;
    /** @brief isinstance(); nullopt with TypeError pending when `type` is not a type. */
    [[nodiscard]] std::optional<bool> is_instance(const Value& v, const Value& type);
    [[nodiscard]] Value type_of(const Value& v);
    /** @brief Builtin method `name` for the type of `receiver`, unbound. */
    [[nodiscard]] std::optional<Value> builtin_method(const Value& receiver, std::string_view name);
    [[nodiscard]] std::mt19937_64& rng() { return rng_; }
    [[nodiscard]] const codegate::policy::PatternRegistry& registry() const { return *registry_; }
    /** @brief Sort `items` by `key` (optional callable), stably; false when a comparison raised. */
    [[nodiscard]] bool sort_values(std::vector<Value>& items, const Value& key, bool reverse);
    /** @brief Python `hash()`; raises TypeError for unhashable values. */
    [[nodiscard]] std::optional<std::int64_t> hash_value(const Value& v);
    /** @brief Zero-argument super() for the innermost method call. */
    [[nodiscard]] EvalResult current_super();

  private:
    enum class Fatal
    {
        None,
        Timeout,
        MemoryExceeded,
        Forbidden,
        GeneratorFull,
    };

    struct Pending
    {
        Value exception;
        Fatal fatal = Fatal::None;
        std::string message;
    };

    enum class Flow
    {
        Normal,
        Return,
        Break,
        Continue,
        Raise,
    };

    struct Completion
    {
        Flow flow = Flow::Normal;
        Value value;
    };

    struct Frame
    {
        const FunctionObject* function = nullptr;
        Value self;
    };

    using EnvPtr = std::shared_ptr<Env>;

    // Statements.
    Completion exec_block(const std::vector<codegate::parser::Stmt>& body, const EnvPtr& env);
    Completion exec_stmt(const codegate::parser::Stmt& stmt, const EnvPtr& env);
    Completion exec_aug_assign(const codegate::parser::AugAssignStmt& s, const EnvPtr& env);
    Completion exec_if(const codegate::parser::IfStmt& s, const EnvPtr& env);
    Completion exec_while(const codegate::parser::WhileStmt& s, const EnvPtr& env);
    Completion exec_for(const codegate::parser::ForStmt& s, const EnvPtr& env);
    Completion exec_try(const codegate::parser::TryStmt& s, const EnvPtr& env);
    Completion exec_with(const codegate::parser::WithStmt& s, std::size_t item, const EnvPtr& env);
    Completion exec_import(const codegate::parser::ImportStmt& s, const EnvPtr& env);
    Completion exec_import_from(const codegate::parser::ImportFromStmt& s, const EnvPtr& env);
    Completion exec_def(const codegate::parser::FunctionDef& s, const EnvPtr& env);
    Completion exec_class(const codegate::parser::ClassDef& s, const EnvPtr& env);
    Completion exec_raise(const codegate::parser::RaiseStmt& s, const EnvPtr& env);
    Completion exec_del(const codegate::parser::Expr& target, const EnvPtr& env);
    Completion raised() { return Completion{.flow = Flow::Raise, .value = {}}; }

    // Expressions.
    EvalResult eval(const codegate::parser::Expr& expr, const EnvPtr& env);
    EvalResult eval_number(std::string_view lexeme);
    EvalResult eval_fstring(const codegate::parser::FStringExpr& e, const EnvPtr& env);
    EvalResult eval_yield(const codegate::parser::YieldExpr& e, const EnvPtr& env);
    EvalResult eval_dict(const codegate::parser::DictExpr& e, const EnvPtr& env);
    EvalResult eval_compare(const codegate::parser::CompareExpr& e, const EnvPtr& env);
    EvalResult eval_call(const codegate::parser::CallExpr& e, const EnvPtr& env);
    EvalResult eval_comprehension(const codegate::parser::ComprehensionExpr& e, const EnvPtr& env);
    bool run_generators(const codegate::parser::ComprehensionExpr& e, std::size_t level,
                        const EnvPtr& env, std::vector<Value>& out,
                        std::vector<std::pair<Value, Value>>& dict_out);
    std::optional<std::vector<Value>> eval_elements(const std::vector<codegate::parser::Expr>& elts,
                                                    const EnvPtr& env);
    EvalResult compare_op(codegate::parser::CmpOp op, const Value& a, const Value& b);
    EvalResult unary_op(codegate::lexer::TokenKind op, const Value& v);
    EvalResult augmented(codegate::lexer::TokenKind op, const Value& current, const Value& rhs);

    // Names and targets.
    EvalResult lookup(std::string_view name, const EnvPtr& env);
    void bind(std::string_view name, Value value, const EnvPtr& env);
    bool assign(const codegate::parser::Expr& target, const Value& value, const EnvPtr& env);
    bool unpack(const std::vector<codegate::parser::Expr>& targets, const Value& value,
                const EnvPtr& env);
    bool set_attribute(const Value& obj, std::string_view name, Value value);
    bool set_item(const Value& obj, const Value& index, Value value);
    bool del_item(const Value& obj, const Value& index);
    EvalResult make_slice(const codegate::parser::SliceExpr& s, const EnvPtr& env);

    // Calls.
    EvalResult call_function(const std::shared_ptr<FunctionObject>& fn, Args args, Kwargs kwargs);
    bool bind_arguments(const FunctionObject& fn, Args& args, Kwargs& kwargs, Env& env);
    EvalResult instantiate(const std::shared_ptr<ClassObject>& cls, Args args, Kwargs kwargs);
    EvalResult make_function(const codegate::parser::FunctionDef* def,
                             const codegate::parser::LambdaExpr* lambda, const EnvPtr& env);
    /** User-defined method `name` bound to an instance; nullopt (nothing raised) when absent. */
    std::optional<Value> find_method(const Value& obj, std::string_view name);
    EvalResult load_module(std::string_view name);

    // Exceptions.
    Value make_exception(std::string_view type, std::vector<Value> args);
    void set_pending(Value exception);
    void set_fatal(Fatal kind, std::string message);
    [[nodiscard]] bool pending_is_fatal() const
    {
        return pending_.has_value() && pending_->fatal != Fatal::None;
    }
    Outcome take_outcome(EvalResult result);
    void sample_memory();
    /** Remember an object that may sit in a reference cycle, for teardown. */
    void track(const std::shared_ptr<runtime::Object>& obj);

    std::shared_ptr<const codegate::policy::PatternRegistry> registry_;
    Limits limits_;
    const std::atomic<bool>* cancel_;

    EnvPtr globals_;
    /** Every builtin, including names the registry removes from builtins_. */
    AttrMap intrinsics_;
    AttrMap builtins_;
    std::map<std::string, std::shared_ptr<ModuleObject>, std::less<>> modules_;
    std::map<std::string, Value, std::less<>> method_cache_;
    std::shared_ptr<ClassObject> object_class_;
    Value ellipsis_;

    std::optional<Pending> pending_;
    std::vector<Value> handling_;
    std::vector<Frame> frames_;
    std::vector<std::vector<Value>*> yield_sinks_;
    std::vector<std::weak_ptr<Env>> envs_;
    std::vector<std::weak_ptr<runtime::Object>> objects_;
    std::size_t prune_at_ = 1024;
    std::map<const void*, std::shared_ptr<const ScopeInfo>> scope_cache_;

    std::string output_;
    bool output_truncated_ = false;
    std::size_t steps_ = 0;
    std::uint64_t baseline_rss_ = 0;
    std::uint64_t peak_growth_ = 0;
    std::mt19937_64 rng_;
};

} // namespace codegate::interp
