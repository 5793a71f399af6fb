#include <codegate/interp/objects.h>

namespace codegate::interp
{

const Value* ClassObject::lookup(std::string_view attr) const
{
    for (const ClassObject* c = this; c != nullptr; c = c->base.get())
    {
        if (const auto it = c->attrs.find(attr); it != c->attrs.end())
        {
            return &it->second;
        }
    }
    return nullptr;
}

bool ClassObject::is_subclass_of(const ClassObject& other) const
{
    for (const ClassObject* c = this; c != nullptr; c = c->base.get())
    {
        if (c == &other)
        {
            return true;
        }
    }
    return false;
}

std::string InstanceObject::exception_message() const
{
    if (args.empty())
    {
        return "";
    }
    if (args.size() == 1)
    {
        if (cls->name == "KeyError")
        {
            return codegate::runtime::repr(args[0]);
        }
        return codegate::runtime::str(args[0]);
    }
    return codegate::runtime::repr(Value::tuple(args));
}

std::string InstanceObject::repr() const
{
    if (cls->is_exception)
    {
        std::string out = cls->name + "(";
        for (std::size_t i = 0; i < args.size(); ++i)
        {
            if (i != 0)
            {
                out += ", ";
            }
            out += codegate::runtime::repr(args[i]);
        }
        return out + ")";
    }
    return "<" + cls->name + " object>";
}

std::size_t RangeObject::size() const
{
    if (step > 0 && start < stop)
    {
        return static_cast<std::size_t>((stop - start - 1) / step + 1);
    }
    if (step < 0 && start > stop)
    {
        return static_cast<std::size_t>((start - stop - 1) / (-step) + 1);
    }
    return 0;
}

bool RangeObject::contains(std::int64_t v) const
{
    if (step > 0 ? (v < start || v >= stop) : (v > start || v <= stop))
    {
        return false;
    }
    return (v - start) % step == 0;
}

std::string RangeObject::repr() const
{
    std::string out = "range(" + std::to_string(start) + ", " + std::to_string(stop);
    if (step != 1)
    {
        out += ", " + std::to_string(step);
    }
    return out + ")";
}

bool RangeObject::equals(const Object& other) const
{
    const auto* o = dynamic_cast<const RangeObject*>(&other);
    if (o == nullptr)
    {
        return false;
    }
    const std::size_t n = size();
    if (n != o->size())
    {
        return false;
    }
    return n == 0 || (start == o->start && (n == 1 || step == o->step));
}

} // namespace codegate::interp
