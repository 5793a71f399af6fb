#include <algorithm>
#include <codegate/diag/render.h>
#include <codegate/parser/parser.h>
#include <codegate/parser/walk.h>
#include <codegate/prevalidate/prevalidator.h>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace codegate::prevalidate
{
namespace
{

using codegate::diag::Finding;
using codegate::diag::Severity;
using codegate::source::Span;
using namespace codegate::parser;

constexpr std::size_t kMaxTextMatches = 3;
constexpr std::size_t kMaxExcerpt = 40;

bool is_compound(const Stmt& stmt)
{
    return std::holds_alternative<FunctionDef>(stmt.node) ||
           std::holds_alternative<ClassDef>(stmt.node) || std::holds_alternative<ForStmt>(stmt.node) ||
           std::holds_alternative<WhileStmt>(stmt.node) || std::holds_alternative<IfStmt>(stmt.node) ||
           std::holds_alternative<WithStmt>(stmt.node) || std::holds_alternative<TryStmt>(stmt.node);
}

bool always_true(const Expr& test)
{
    if (const auto* c = std::get_if<ConstantExpr>(&test.node))
    {
        return c->kind == ConstantExpr::Kind::True;
    }
    if (const auto* n = std::get_if<NumberExpr>(&test.node))
    {
        return n->lexeme == "1";
    }
    return false;
}

/** Innermost name of an attribute chain (`os` in `os.path.join`), or null. */
const NameExpr* root_name(const Expr& e)
{
    const Expr* cur = &e;
    while (const auto* attr = std::get_if<AttributeExpr>(&cur->node))
    {
        cur = attr->value.get();
    }
    return std::get_if<NameExpr>(&cur->node);
}

/**
 * Single pass over the tree. Alias bindings are recorded as they are met;
 * references through a name that is only bound further down are kept and
 * resolved once the walk has seen every binding.
 */
class Walker
{
  public:
    Walker(const codegate::policy::PatternRegistry& registry, std::vector<Finding>& out)
        : registry_(registry), out_(out)
    {
    }

    void check(const Module& module)
    {
        for (const auto& stmt : module.body)
        {
            visit_stmt(stmt);
        }
        for (const auto& ref : unresolved_)
        {
            check_reference(*ref.expr, ref.is_call, ref.span, false);
        }
    }

    /** Deepest nesting of compound statements seen by check(). */
    [[nodiscard]] std::size_t max_depth() const { return max_depth_; }

  private:
    struct FunctionFrame
    {
        const FunctionDef* def = nullptr;
        bool self_call = false;
        bool returns_value = false;
    };

    struct LoopFrame
    {
        // Only `while True` loops are checked for a break.
        bool infinite = false;
        Span span;
        bool has_break = false;
    };

    struct Reference
    {
        const Expr* expr = nullptr;
        bool is_call = false;
        Span span;
    };

    const codegate::policy::PatternRegistry& registry_;
    std::vector<Finding>& out_;
    // Local name -> qualified name it refers to (import aliases, `from` bindings, simple aliases).
    std::map<std::string, std::string, std::less<>> bindings_;
    std::vector<Reference> unresolved_;
    std::vector<FunctionFrame> functions_;
    std::vector<LoopFrame> loops_;
    std::size_t depth_ = 0;
    std::size_t max_depth_ = 0;

    void report(Severity severity, std::string code, std::string message, Span span)
    {
        Finding f;
        f.severity = severity;
        f.code = std::move(code);
        f.message = std::move(message);
        f.span = span;
        f.origin = "prevalidator";
        out_.push_back(std::move(f));
    }

    [[nodiscard]] std::optional<std::string> qualified_name(const Expr& e) const
    {
        if (const auto* name = std::get_if<NameExpr>(&e.node))
        {
            const auto it = bindings_.find(name->name);
            return it != bindings_.end() ? it->second : std::string(name->name);
        }
        if (const auto* attr = std::get_if<AttributeExpr>(&e.node))
        {
            auto base = qualified_name(*attr->value);
            if (!base.has_value())
            {
                return std::nullopt;
            }
            return *base + "." + std::string(attr->attr);
        }
        return std::nullopt;
    }

    /** Reports a call to or reference of a forbidden callable; defers names not bound yet. */
    void check_reference(const Expr& e, bool is_call, Span span, bool may_defer)
    {
        const auto target = qualified_name(e);
        if (target.has_value() && registry_.is_forbidden_callable(*target))
        {
            if (is_call)
            {
                report(Severity::Error, "PV002", "forbidden call: " + *target + "()", span);
            }
            else
            {
                report(Severity::Error, "PV002", "reference to forbidden callable: " + *target, span);
            }
            return;
        }
        const auto* root = root_name(e);
        if (may_defer && root != nullptr && bindings_.find(root->name) == bindings_.end())
        {
            unresolved_.push_back(Reference{.expr = &e, .is_call = is_call, .span = span});
        }
    }

    void collect_binding(const Stmt& stmt)
    {
        if (const auto* imp = std::get_if<ImportStmt>(&stmt.node))
        {
            for (const auto& alias : imp->names)
            {
                if (alias.asname.has_value())
                {
                    bindings_[std::string(*alias.asname)] = alias.name;
                }
                else
                {
                    const std::string root = alias.name.substr(0, alias.name.find('.'));
                    bindings_[root] = root;
                }
            }
            return;
        }
        if (const auto* from = std::get_if<ImportFromStmt>(&stmt.node))
        {
            if (from->level != 0)
            {
                return;
            }
            for (const auto& alias : from->names)
            {
                if (alias.name == "*")
                {
                    continue;
                }
                const std::string local =
                    alias.asname.has_value() ? std::string(*alias.asname) : alias.name;
                bindings_[local] = from->module + "." + alias.name;
            }
            return;
        }
        if (const auto* assign = std::get_if<AssignStmt>(&stmt.node))
        {
            // `f = eval`, `run = sp.run`: remember what the alias refers to.
            auto target = qualified_name(assign->value);
            if (!target.has_value())
            {
                return;
            }
            for (const auto& t : assign->targets)
            {
                if (const auto* name = std::get_if<NameExpr>(&t.node))
                {
                    if (*target != name->name)
                    {
                        bindings_[std::string(name->name)] = *target;
                    }
                }
            }
        }
    }

    // Dunder builtins such as `__import__` live in the callable set; reached as a
    // member they count as a forbidden attribute.
    [[nodiscard]] bool is_forbidden_member(std::string_view name) const
    {
        if (registry_.is_forbidden_attribute(name))
        {
            return true;
        }
        return name.size() > 4 && name.starts_with("__") && name.ends_with("__") &&
               registry_.is_forbidden_callable(name);
    }

    void check_string_argument(const Expr& e)
    {
        const auto* s = std::get_if<StringExpr>(&e.node);
        if (s != nullptr && is_forbidden_member(s->value))
        {
            report(Severity::Critical, "PV003",
                   "forbidden attribute name in string: '" + s->value + "'", e.span);
        }
    }

    void visit_stmt(const Stmt& stmt)
    {
        if (const auto* imp = std::get_if<ImportStmt>(&stmt.node))
        {
            for (const auto& alias : imp->names)
            {
                if (registry_.is_forbidden_module(alias.name))
                {
                    report(Severity::Error, "PV001", "forbidden import: " + alias.name, alias.span);
                }
            }
            collect_binding(stmt);
            return;
        }
        if (const auto* from = std::get_if<ImportFromStmt>(&stmt.node))
        {
            if (from->level == 0 && registry_.is_forbidden_module(from->module))
            {
                report(Severity::Error, "PV001", "forbidden import from module: " + from->module,
                       stmt.span);
            }
            else if (from->level == 0)
            {
                for (const auto& alias : from->names)
                {
                    const std::string full = from->module + "." + alias.name;
                    if (alias.name != "*" && registry_.is_forbidden_module(full))
                    {
                        report(Severity::Error, "PV001", "forbidden import: " + full, alias.span);
                    }
                }
            }
            collect_binding(stmt);
            return;
        }
        if (const auto* ret = std::get_if<ReturnStmt>(&stmt.node);
            ret != nullptr && ret->value.has_value() && !functions_.empty())
        {
            functions_.back().returns_value = true;
        }
        else if (std::holds_alternative<BreakStmt>(stmt.node) && !loops_.empty())
        {
            loops_.back().has_break = true;
        }

        const auto* def = std::get_if<FunctionDef>(&stmt.node);
        const auto* while_loop = std::get_if<WhileStmt>(&stmt.node);
        const bool is_loop = while_loop != nullptr || std::holds_alternative<ForStmt>(stmt.node);
        // A function body starts a fresh loop context; `break` cannot leave it.
        std::vector<LoopFrame> outer_loops;
        if (def != nullptr || std::holds_alternative<ClassDef>(stmt.node))
        {
            outer_loops.swap(loops_);
        }
        if (def != nullptr)
        {
            enter_function(*def);
        }
        if (is_loop)
        {
            LoopFrame frame;
            frame.infinite = while_loop != nullptr && always_true(while_loop->test);
            frame.span = stmt.span;
            loops_.push_back(frame);
        }
        const std::size_t saved_depth = depth_;
        if (is_compound(stmt))
        {
            ++depth_;
            max_depth_ = std::max(max_depth_, depth_);
        }

        for_each_child(
            stmt, [this](const Expr& e) { visit_expr(e, false); },
            [this](const Stmt& s) { visit_stmt(s); });

        depth_ = saved_depth;
        if (is_loop)
        {
            leave_loop();
        }
        if (def != nullptr)
        {
            leave_function();
        }
        if (def != nullptr || std::holds_alternative<ClassDef>(stmt.node))
        {
            loops_.swap(outer_loops);
        }
        collect_binding(stmt);
    }

    void visit_expr(const Expr& expr, bool is_callee)
    {
        if (const auto* call = std::get_if<CallExpr>(&expr.node))
        {
            check_reference(*call->callee, true, expr.span, true);
            note_call(*call);
            visit_expr(*call->callee, true);
            for (const auto& arg : call->args)
            {
                check_string_argument(*arg.value);
                visit_expr(*arg.value, false);
            }
            return;
        }

        if (const auto* name = std::get_if<NameExpr>(&expr.node))
        {
            if (registry_.is_forbidden_attribute(name->name))
            {
                report(Severity::Critical, "PV003", "forbidden name: " + std::string(name->name),
                       expr.span);
                return;
            }
        }
        else if (const auto* attr = std::get_if<AttributeExpr>(&expr.node))
        {
            if (is_forbidden_member(attr->attr))
            {
                report(Severity::Critical, "PV003",
                       "forbidden attribute access: ." + std::string(attr->attr), attr->attr_span);
            }
        }
        else if (const auto* sub = std::get_if<SubscriptExpr>(&expr.node))
        {
            check_string_argument(*sub->index);
        }

        if (!is_callee && (std::holds_alternative<NameExpr>(expr.node) ||
                           std::holds_alternative<AttributeExpr>(expr.node)))
        {
            check_reference(expr, false, expr.span, true);
        }

        for_each_child(expr, [this](const Expr& e) { visit_expr(e, false); });
    }

    void enter_function(const FunctionDef& def)
    {
        functions_.push_back(FunctionFrame{.def = &def});
    }

    void leave_function()
    {
        const auto frame = functions_.back();
        functions_.pop_back();
        if (frame.self_call && !frame.returns_value)
        {
            report(Severity::Warning, "PV004",
                   "function '" + std::string(frame.def->name) +
                       "' calls itself without an explicit return; possible infinite recursion",
                   frame.def->name_span);
        }
    }

    void note_call(const CallExpr& call)
    {
        const auto* callee = std::get_if<NameExpr>(&call.callee->node);
        if (callee == nullptr)
        {
            return;
        }
        for (auto& frame : functions_)
        {
            frame.self_call = frame.self_call || callee->name == frame.def->name;
        }
    }

    void leave_loop()
    {
        const auto frame = loops_.back();
        loops_.pop_back();
        if (frame.infinite && !frame.has_break)
        {
            report(Severity::Warning, "PV005", "'while True' loop without break; possible infinite loop",
                   frame.span);
        }
    }
};

bool is_word(char c)
{
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
}

bool is_digit(char c)
{
    return c >= '0' && c <= '9';
}

bool is_space(char c)
{
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

std::size_t skip_spaces(std::string_view text, std::size_t i)
{
    while (i < text.size() && is_space(text[i]))
    {
        ++i;
    }
    return i;
}

bool word_start(std::string_view text, std::size_t i)
{
    return i == 0 || !is_word(text[i - 1]);
}

// Each matcher returns the end of a match starting at `i`, or 0.

// `__name__`: the longest run of word characters that opens and closes with a double underscore.
std::size_t match_dunder(std::string_view text, std::size_t i)
{
    if (text.compare(i, 2, "__") != 0)
    {
        return 0;
    }
    std::size_t run_end = i;
    while (run_end < text.size() && is_word(text[run_end]))
    {
        ++run_end;
    }
    const std::size_t last = text.substr(i, run_end - i).rfind("__");
    return last != std::string_view::npos && last >= 3 ? i + last + 2 : 0;
}

// `os.system`, with optional whitespace around the dot.
std::size_t match_os_system(std::string_view text, std::size_t i)
{
    if (!word_start(text, i) || text.compare(i, 2, "os") != 0)
    {
        return 0;
    }
    std::size_t j = skip_spaces(text, i + 2);
    if (j >= text.size() || text[j] != '.')
    {
        return 0;
    }
    j = skip_spaces(text, j + 1);
    return text.compare(j, 6, "system") == 0 ? j + 6 : 0;
}

std::size_t match_subprocess(std::string_view text, std::size_t i)
{
    return word_start(text, i) && text.compare(i, 10, "subprocess") == 0 ? i + 10 : 0;
}

// `chr(<digits>)`.
std::size_t match_chr_literal(std::string_view text, std::size_t i)
{
    if (text.compare(i, 3, "chr") != 0)
    {
        return 0;
    }
    std::size_t j = skip_spaces(text, i + 3);
    if (j >= text.size() || text[j] != '(')
    {
        return 0;
    }
    j = skip_spaces(text, j + 1);
    const std::size_t digits = j;
    while (j < text.size() && is_digit(text[j]))
    {
        ++j;
    }
    if (j == digits)
    {
        return 0;
    }
    j = skip_spaces(text, j);
    return j < text.size() && text[j] == ')' ? j + 1 : 0;
}

std::string excerpt(std::string_view text)
{
    if (text.size() <= kMaxExcerpt)
    {
        return std::string(text);
    }
    return std::string(text.substr(0, kMaxExcerpt)) + "...";
}

void scan_text(std::string_view text, std::vector<Finding>& out)
{
    struct TextRule
    {
        std::size_t (*match)(std::string_view, std::size_t);
        const char* code;
        const char* message;
    };
    static const TextRule rules[] = {
        {match_dunder, "PV020", "dunder pattern in source"},
        {match_os_system, "PV021", "os.system in source"},
        {match_subprocess, "PV022", "subprocess in source"},
        {match_chr_literal, "PV023", "string built through chr()"},
    };

    for (const auto& rule : rules)
    {
        std::size_t count = 0;
        std::size_t i = 0;
        while (i < text.size() && count < kMaxTextMatches)
        {
            const std::size_t end = rule.match(text, i);
            if (end == 0)
            {
                ++i;
                continue;
            }
            Finding f;
            f.severity = Severity::Warning;
            f.code = rule.code;
            f.message = std::string(rule.message) + ": '" + excerpt(text.substr(i, end - i)) + "'";
            f.span = Span{.start = i, .end = end};
            f.origin = "prevalidator";
            out.push_back(std::move(f));
            ++count;
            i = end;
        }
    }
}

} // namespace

PrevalidationResult validate(const codegate::source::SourceUnit& source,
                             const PrevalidatorConfig& config)
{
    PrevalidationResult result;
    const auto& registry = config.registry != nullptr ? *config.registry
                                                       : *codegate::policy::default_registry();

    auto parsed = parse_source(source.text());
    if (auto* errors = std::get_if<std::vector<Finding>>(&parsed))
    {
        Finding f;
        f.severity = Severity::Critical;
        f.code = "PV000";
        f.message = "syntax error";
        if (!errors->empty())
        {
            f.message += ": " + errors->front().message;
            f.span = errors->front().span;
        }
        f.origin = "prevalidator";
        codegate::diag::locate(f, source);
        result.findings.push_back(std::move(f));
        result.passed = false;
        return result;
    }
    auto module = std::make_shared<Module>(std::get<Module>(std::move(parsed)));

    const Severity size_severity = config.size_limits_fatal ? Severity::Error : Severity::Warning;
    if (source.length() > config.max_code_length)
    {
        Finding f;
        f.severity = size_severity;
        f.code = "PV010";
        f.message = "code is too long: " + std::to_string(source.length()) +
                    " bytes (maximum " + std::to_string(config.max_code_length) + ")";
        f.origin = "prevalidator";
        result.findings.push_back(std::move(f));
    }
    if (source.line_count() > config.max_lines)
    {
        Finding f;
        f.severity = size_severity;
        f.code = "PV011";
        f.message = "too many lines: " + std::to_string(source.line_count()) + " (maximum " +
                    std::to_string(config.max_lines) + ")";
        f.origin = "prevalidator";
        result.findings.push_back(std::move(f));
    }

    if (config.scan_text_patterns)
    {
        scan_text(source.text(), result.findings);
    }

    Walker walker(registry, result.findings);
    walker.check(*module);

    if (walker.max_depth() > config.max_nesting_depth)
    {
        Finding f;
        f.severity = Severity::Error;
        f.code = "PV012";
        f.message = "nesting too deep: " + std::to_string(walker.max_depth()) + " levels (maximum " +
                    std::to_string(config.max_nesting_depth) + ")";
        f.origin = "prevalidator";
        result.findings.push_back(std::move(f));
    }

    for (auto& f : result.findings)
    {
        codegate::diag::locate(f, source);
    }
    result.passed = !codegate::diag::any_at_least(result.findings, config.fatal_threshold);
    result.module = std::move(module);
    return result;
}

} // namespace codegate::prevalidate
