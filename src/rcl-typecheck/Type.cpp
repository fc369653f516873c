#include "Type.hpp"
#include "Format.hpp"

using namespace rcl::typecheck;

static TypePtr make_atom(Type::Kind kind) { return std::make_shared<Type>(kind); }

TypePtr Type::make_null()
{
    static const TypePtr s_null_type = make_atom(Kind::Null);
    return s_null_type;
}
TypePtr Type::make_bool()
{
    static const TypePtr s_bool_type = make_atom(Kind::Bool);
    return s_bool_type;
}
TypePtr Type::make_int()
{
    static const TypePtr s_int_type = make_atom(Kind::Int);
    return s_int_type;
}
TypePtr Type::make_string()
{
    static const TypePtr s_string_type = make_atom(Kind::String);
    return s_string_type;
}
TypePtr Type::make_dynamic()
{
    static const TypePtr s_dynamic_type = make_atom(Kind::Dynamic);
    return s_dynamic_type;
}
TypePtr Type::make_list(TypePtr element_type)
{
    auto t = std::make_shared<Type>(Kind::List);
    t->element = std::move(element_type);
    return t;
}
TypePtr Type::make_set(TypePtr element_type)
{
    auto t = std::make_shared<Type>(Kind::Set);
    t->element = std::move(element_type);
    return t;
}
TypePtr Type::make_dict(TypePtr key_type, TypePtr value_type)
{
    auto t = std::make_shared<Type>(Kind::Dict);
    t->key = std::move(key_type);
    t->value = std::move(value_type);
    return t;
}
TypePtr Type::make_function(std::vector<TypePtr> args, TypePtr result)
{
    auto t = std::make_shared<Type>(Kind::Function);
    auto sig = std::make_shared<FunctionSignature>();
    sig->args = std::move(args);
    sig->result = std::move(result);
    t->function = std::move(sig);
    return t;
}

bool Type::equals(const Type &other) const
{
    if (this == &other) return true;
    if (kind != other.kind) return false;
    switch (kind) {
    case Kind::Null:
    case Kind::Bool:
    case Kind::Int:
    case Kind::String:
    case Kind::Dynamic:
        return true;
    case Kind::List:
    case Kind::Set:
        return element->equals(other.element);
    case Kind::Dict:
        return key->equals(other.key) and value->equals(other.value);
    case Kind::Function: {
        auto &f1 = function;
        auto &f2 = other.function;
        if (f1->args.size() != f2->args.size()) return false;
        for (size_t i = 0; i < f1->args.size(); ++i) {
            if (not f1->args[i]->equals(f2->args[i])) return false;
        }
        return f1->result->equals(f2->result);
    }
    }
    return false;
}

bool Type::is_atom() const
{
    switch (kind) {
    case Kind::Null:
    case Kind::Bool:
    case Kind::Int:
    case Kind::String:
        return true;
    default:
        return false;
    }
}

bool Type::contains_dynamic() const
{
    switch (kind) {
    case Kind::Dynamic:
        return true;
    case Kind::List:
    case Kind::Set:
        return element->contains_dynamic();
    case Kind::Dict:
        return key->contains_dynamic() or value->contains_dynamic();
    case Kind::Function:
        for (auto &arg : function->args) {
            if (arg->contains_dynamic()) return true;
        }
        return function->result->contains_dynamic();
    default:
        return false;
    }
}

std::string Type::to_string() const { return format_type(*this).to_string(); }
