#include "Format.hpp"
#include "TypeDiff.hpp"
#include "TypeReq.hpp"

using namespace rcl::typecheck;
using namespace rcl::typecheck::pprint;
using namespace rcl::typecheck::runtime;

static ReqTypePtr make_atom(ReqType::Kind kind) { return std::make_shared<ReqType>(kind); }

ReqTypePtr ReqType::make_bool()
{
    static const ReqTypePtr s_bool_req = make_atom(Kind::Bool);
    return s_bool_req;
}
ReqTypePtr ReqType::make_int()
{
    static const ReqTypePtr s_int_req = make_atom(Kind::Int);
    return s_int_req;
}
ReqTypePtr ReqType::make_null()
{
    static const ReqTypePtr s_null_req = make_atom(Kind::Null);
    return s_null_req;
}
ReqTypePtr ReqType::make_string()
{
    static const ReqTypePtr s_string_req = make_atom(Kind::String);
    return s_string_req;
}
ReqTypePtr ReqType::make_list(ReqTypePtr element)
{
    auto t = std::make_shared<ReqType>(Kind::List);
    t->element = std::move(element);
    return t;
}
ReqTypePtr ReqType::make_set(ReqTypePtr element)
{
    auto t = std::make_shared<ReqType>(Kind::Set);
    t->element = std::move(element);
    return t;
}
ReqTypePtr ReqType::make_dict(ReqTypePtr key, ReqTypePtr value)
{
    auto t = std::make_shared<ReqType>(Kind::Dict);
    t->dict = std::make_shared<DictReq>(DictReq { std::move(key), std::move(value) });
    return t;
}
ReqTypePtr ReqType::make_function(std::vector<ReqTypePtr> args, ReqTypePtr result)
{
    auto t = std::make_shared<ReqType>(Kind::Function);
    t->function = std::make_shared<FunctionReq>(FunctionReq { std::move(args), std::move(result) });
    return t;
}

ReqTypePtr ReqType::from_type(const Type &type)
{
    switch (type.kind) {
    case Type::Kind::Null: return make_null();
    case Type::Kind::Bool: return make_bool();
    case Type::Kind::Int: return make_int();
    case Type::Kind::String: return make_string();
    case Type::Kind::Dynamic: return nullptr;
    case Type::Kind::List:
    case Type::Kind::Set: {
        ReqTypePtr element = from_type(*type.element);
        if (not element) return nullptr;
        return type.kind == Type::Kind::List ? make_list(element) : make_set(element);
    }
    case Type::Kind::Dict: {
        ReqTypePtr key = from_type(*type.key);
        ReqTypePtr value = from_type(*type.value);
        if (not key or not value) return nullptr;
        return make_dict(key, value);
    }
    case Type::Kind::Function: {
        std::vector<ReqTypePtr> args;
        for (auto &arg : type.function->args) {
            ReqTypePtr arg_req = from_type(*arg);
            if (not arg_req) return nullptr;
            args.push_back(arg_req);
        }
        ReqTypePtr result = from_type(*type.function->result);
        if (not result) return nullptr;
        return make_function(std::move(args), result);
    }
    }
    return nullptr;
}

TypePtr ReqType::to_type() const
{
    switch (kind) {
    case Kind::Null: return Type::make_null();
    case Kind::Bool: return Type::make_bool();
    case Kind::Int: return Type::make_int();
    case Kind::String: return Type::make_string();
    case Kind::List: return Type::make_list(element->to_type());
    case Kind::Set: return Type::make_set(element->to_type());
    case Kind::Dict: return Type::make_dict(dict->key->to_type(), dict->value->to_type());
    case Kind::Function: {
        std::vector<TypePtr> args;
        args.reserve(function->args.size());
        for (auto &arg : function->args) args.push_back(arg->to_type());
        return Type::make_function(std::move(args), function->result->to_type());
    }
    }
    panic("Invalid requirement kind.");
}

bool ReqType::is_atom() const
{
    switch (kind) {
    case Kind::Bool:
    case Kind::Int:
    case Kind::Null:
    case Kind::String:
        return true;
    default:
        return false;
    }
}

std::string ReqType::to_string() const { return format_type(*to_type()).to_string(); }

std::strong_ordering DictReq::operator<=>(const DictReq &other) const
{
    if (auto c = *key <=> *other.key; c != 0) return c;
    return *value <=> *other.value;
}

std::strong_ordering FunctionReq::operator<=>(const FunctionReq &other) const
{
    for (size_t i = 0; i < args.size() and i < other.args.size(); ++i) {
        if (auto c = *args[i] <=> *other.args[i]; c != 0) return c;
    }
    if (auto c = args.size() <=> other.args.size(); c != 0) return c;
    return *result <=> *other.result;
}

std::strong_ordering ReqType::operator<=>(const ReqType &other) const
{
    if (kind != other.kind) return kind <=> other.kind;
    switch (kind) {
    case Kind::List:
    case Kind::Set:
        return *element <=> *other.element;
    case Kind::Dict:
        return *dict <=> *other.dict;
    case Kind::Function:
        return *function <=> *other.function;
    default:
        return std::strong_ordering::equal;
    }
}

bool rcl::typecheck::accepts_argument(const ReqType &required, const Type &actual) { return required.to_type()->equals(actual); }

// Shared by lists and sets, which differ only in how the type is rebuilt.
template <typename TDiff>
static TypeDiff check_element(const TypeReq &elem_req, const TypePtr &type, TypePtr (*rebuild)(TypePtr))
{
    TypeDiff elem_diff = elem_req.diff(type->element);
    if (elem_diff.is_ok()) return diff::Ok { type };
    if (elem_diff.is_defer()) return diff::Defer { rebuild(elem_diff.resolved_type()) };
    return TDiff { std::make_unique<TypeDiff>(std::move(elem_diff)) };
}

TypeDiff ReqType::check_type(const TypeReq &req, const TypePtr &type) const
{
    // If there is a requirement but we don't know the type, the check has to
    // happen at runtime.
    if (type->kind == Type::Kind::Dynamic) return diff::Defer { to_type() };

    switch (kind) {
    case Kind::Null:
        if (type->kind == Type::Kind::Null) return diff::Ok { type };
        break;
    case Kind::Bool:
        if (type->kind == Type::Kind::Bool) return diff::Ok { type };
        break;
    case Kind::Int:
        if (type->kind == Type::Kind::Int) return diff::Ok { type };
        break;
    case Kind::String:
        if (type->kind == Type::Kind::String) return diff::Ok { type };
        break;

    case Kind::List:
        if (type->kind != Type::Kind::List) break;
        return check_element<diff::List>(req.with_shape(element), type, Type::make_list);
    case Kind::Set:
        if (type->kind != Type::Kind::Set) break;
        return check_element<diff::Set>(req.with_shape(element), type, Type::make_set);

    case Kind::Dict: {
        if (type->kind != Type::Kind::Dict) break;
        TypeDiff k_diff = req.with_shape(dict->key).diff(type->key);
        TypeDiff v_diff = req.with_shape(dict->value).diff(type->value);
        if (k_diff.is_ok() and v_diff.is_ok()) return diff::Ok { type };
        TypePtr tk = k_diff.resolved_type();
        TypePtr tv = v_diff.resolved_type();
        if (tk and tv) return diff::Defer { Type::make_dict(tk, tv) };
        return diff::Dict { std::make_unique<TypeDiff>(std::move(k_diff)), std::make_unique<TypeDiff>(std::move(v_diff)) };
    }

    case Kind::Function: {
        if (type->kind != Type::Kind::Function) break;
        auto &fn_req = *function;
        auto &fn_type = *type->function;
        if (fn_req.args.size() != fn_type.args.size()) return diff::Error { req, type };

        std::vector<TypeDiff> arg_diffs;
        arg_diffs.reserve(fn_req.args.size());
        bool args_ok = true;
        for (size_t i = 0; i < fn_req.args.size(); ++i) {
            if (accepts_argument(*fn_req.args[i], *fn_type.args[i])) {
                arg_diffs.emplace_back(diff::Ok { fn_type.args[i] });
            } else {
                args_ok = false;
                arg_diffs.emplace_back(diff::Error { req.with_shape(fn_req.args[i]), fn_type.args[i] });
            }
        }

        TypeDiff result_diff = req.with_shape(fn_req.result).diff(fn_type.result);
        if (args_ok and result_diff.is_ok()) return diff::Ok { type };
        if (args_ok and result_diff.is_defer()) return diff::Defer { Type::make_function(fn_type.args, result_diff.resolved_type()) };
        return diff::Function { std::move(arg_diffs), std::make_unique<TypeDiff>(std::move(result_diff)) };
    }
    }

    return diff::Error { req, type };
}

static Doc report_value_mismatch(const ReqType &expected, const Value &value)
{
    return Doc::concat({
        "Expected a value that fits this type:",
        Doc::hard_break(),
        Doc::hard_break(),
        Doc::indent(format_type(*expected.to_type())),
        Doc::hard_break(),
        Doc::hard_break(),
        "But got this value:",
        Doc::hard_break(),
        Doc::hard_break(),
        Doc::indent(format_value(value)),
    });
}

Result<void> ReqType::check_value(Span at, const Value &value) const
{
    switch (kind) {
    case Kind::Null:
        if (value.is_null()) return {};
        break;
    case Kind::Bool:
        if (value.is_bool()) return {};
        break;
    case Kind::Int:
        if (value.is_int()) return {};
        break;
    case Kind::String:
        if (value.is_string()) return {};
        break;

    case Kind::List:
    case Kind::Set: {
        auto expected = kind == Kind::List ? Value::Kind::List : Value::Kind::Set;
        if (value.kind != expected) break;
        // Sets have no indices, but they do have an order, so the index still
        // tells which element is wrong.
        for (size_t i = 0; i < value.elements.size(); ++i) {
            if (auto checked = element->check_value(at, *value.elements[i]); not checked) {
                return std::move(checked.error()).with_path_element(PathElement::index(i)).err();
            }
        }
        return {};
    }

    case Kind::Dict:
        if (value.kind != Value::Kind::Dict) break;
        for (auto &[k, v] : value.entries) {
            if (auto checked = dict->key->check_value(at, *k); not checked) {
                return std::move(checked.error()).with_path_element(PathElement::key(k)).err();
            }
            if (auto checked = dict->value->check_value(at, *v); not checked) {
                return std::move(checked.error()).with_path_element(PathElement::key(k)).err();
            }
        }
        return {};

    case Kind::Function:
        if (value.kind != Value::Kind::Builtin) break;
        return at.error("Type mismatch.")
            .with_body(report_value_mismatch(*this, value))
            .with_help("Function values cannot be checked against a function type at runtime.")
            .err();
    }

    return at.error("Type mismatch.").with_body(report_value_mismatch(*this, value)).err();
}
